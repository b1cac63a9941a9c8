/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "itest/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(itest::log::GetLevel() == itest::log::Level::kInfo);
#else
  REQUIRE(itest::log::GetLevel() == itest::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = itest::log::GetLevel();
  itest::log::SetLevel(itest::log::Level::kError);
  REQUIRE(itest::log::GetLevel() == itest::log::Level::kError);
  itest::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!itest::log::IsInitialized());
  itest::log::Init();
  REQUIRE(itest::log::IsInitialized());
  itest::log::Shutdown();
  REQUIRE(!itest::log::IsInitialized());
}

TEST_CASE("Log ParseLevel", "[log]") {
  using itest::log::Level;
  REQUIRE(itest::log::ParseLevel("debug", Level::kInfo) == Level::kDebug);
  REQUIRE(itest::log::ParseLevel("WARN", Level::kInfo) == Level::kWarn);
  REQUIRE(itest::log::ParseLevel("Error", Level::kInfo) == Level::kError);
  REQUIRE(itest::log::ParseLevel("off", Level::kInfo) == Level::kOff);
  REQUIRE(itest::log::ParseLevel("chatty", Level::kInfo) == Level::kInfo);
  REQUIRE(itest::log::ParseLevel(nullptr, Level::kWarn) == Level::kWarn);
}

TEST_CASE("Log macros compile and run", "[log]") {
  itest::log::SetLevel(itest::log::Level::kDebug);
  ITEST_LOG_DEBUG("Test", "debug %d", 1);
  ITEST_LOG_INFO("Test", "info %s", "msg");
  ITEST_LOG_WARN("Test", "warn");
  ITEST_LOG_ERROR("Test", "error %d %d", 1, 2);
  // FATAL aborts
  REQUIRE(true);
}

TEST_CASE("Log runtime level filtering", "[log]") {
  itest::log::SetLevel(itest::log::Level::kOff);
  ITEST_LOG_DEBUG("Test", "should not appear");
  ITEST_LOG_ERROR("Test", "should not appear");
  itest::log::SetLevel(itest::log::Level::kDebug);
  REQUIRE(true);
}

TEST_CASE("Log with very long message", "[log]") {
  itest::log::SetLevel(itest::log::Level::kDebug);
  std::string long_msg(2000, 'x');
  ITEST_LOG_INFO("Test", "%s", long_msg.c_str());
  ITEST_LOG_DEBUG("Test", "Long: %s %s", long_msg.c_str(), long_msg.c_str());
  REQUIRE(true);
}
