/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp types
 */

#include "itest/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>

// ============================================================================
// expected<V, E> tests
// ============================================================================

TEST_CASE("expected success path", "[vocabulary][expected]") {
  auto r = itest::expected<int, itest::ConfigError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
}

TEST_CASE("expected error path", "[vocabulary][expected]") {
  auto r = itest::expected<int, itest::ConfigError>::error(
      itest::ConfigError::kFileNotFound);
  REQUIRE(!r.has_value());
  REQUIRE(!static_cast<bool>(r));
  REQUIRE(r.get_error() == itest::ConfigError::kFileNotFound);
}

TEST_CASE("expected void specialization", "[vocabulary][expected]") {
  auto ok = itest::expected<void, itest::ScriptError>::success();
  REQUIRE(ok.has_value());

  auto err = itest::expected<void, itest::ScriptError>::error(
      itest::ScriptError::kWriteFailed);
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == itest::ScriptError::kWriteFailed);
}

TEST_CASE("expected value_or", "[vocabulary][expected]") {
  auto ok = itest::expected<int, itest::ConfigError>::success(10);
  REQUIRE(ok.value_or(99) == 10);

  auto err = itest::expected<int, itest::ConfigError>::error(
      itest::ConfigError::kParseError);
  REQUIRE(err.value_or(99) == 99);
}

TEST_CASE("expected holds non-trivial value and error", "[vocabulary][expected]") {
  struct Failure {
    int code;
    std::string message;
  };
  auto ok = itest::expected<std::string, Failure>::success(std::string("run dir"));
  auto copy = ok;
  REQUIRE(copy.value() == "run dir");

  auto err = itest::expected<std::string, Failure>::error(Failure{3, "hanging"});
  auto moved = static_cast<itest::expected<std::string, Failure>&&>(err);
  REQUIRE(!moved.has_value());
  REQUIRE(moved.get_error().code == 3);
  REQUIRE(moved.get_error().message == "hanging");
}

TEST_CASE("expected copy/move", "[vocabulary][expected]") {
  auto r1 = itest::expected<int, itest::ConfigError>::success(7);
  auto r2 = r1;  // copy
  REQUIRE(r2.value() == 7);

  auto r3 = static_cast<itest::expected<int, itest::ConfigError>&&>(r1);  // move
  REQUIRE(r3.value() == 7);
}

// ============================================================================
// optional<T> tests
// ============================================================================

TEST_CASE("optional empty", "[vocabulary][optional]") {
  itest::optional<int> o;
  REQUIRE(!o.has_value());
  REQUIRE(!static_cast<bool>(o));
}

TEST_CASE("optional with value", "[vocabulary][optional]") {
  itest::optional<std::string> o(std::string("by distribution blacklist:suse121"));
  REQUIRE(o.has_value());
  REQUIRE(o.value() == "by distribution blacklist:suse121");
}

TEST_CASE("optional value_or", "[vocabulary][optional]") {
  itest::optional<int> empty;
  REQUIRE(empty.value_or(99) == 99);

  itest::optional<int> full(10);
  REQUIRE(full.value_or(99) == 10);
}

TEST_CASE("optional reset", "[vocabulary][optional]") {
  itest::optional<int> o(42);
  REQUIRE(o.has_value());
  o.reset();
  REQUIRE(!o.has_value());
}

TEST_CASE("optional copy/move", "[vocabulary][optional]") {
  itest::optional<int> o1(5);
  itest::optional<int> o2 = o1;  // copy
  REQUIRE(o2.value() == 5);

  itest::optional<int> o3 = static_cast<itest::optional<int>&&>(o1);  // move
  REQUIRE(o3.value() == 5);
}

// ============================================================================
// ScopeGuard tests
// ============================================================================

TEST_CASE("ScopeGuard executes on exit", "[vocabulary][scope_guard]") {
  int val = 0;
  {
    itest::ScopeGuard guard([&val]() { val = 42; });
    REQUIRE(val == 0);
  }
  REQUIRE(val == 42);
}

TEST_CASE("ScopeGuard release prevents execution", "[vocabulary][scope_guard]") {
  int val = 0;
  {
    itest::ScopeGuard guard([&val]() { val = 42; });
    guard.release();
  }
  REQUIRE(val == 0);
}

TEST_CASE("ScopeGuard move", "[vocabulary][scope_guard]") {
  int val = 0;
  {
    itest::ScopeGuard guard1([&val]() { val = 99; });
    itest::ScopeGuard guard2 = static_cast<itest::ScopeGuard&&>(guard1);
  }
  REQUIRE(val == 99);
}

TEST_CASE("ITEST_SCOPE_EXIT macro", "[vocabulary][scope_guard]") {
  int val = 0;
  {
    ITEST_SCOPE_EXIT(val = 77);
    REQUIRE(val == 0);
  }
  REQUIRE(val == 77);
}

// ============================================================================
// and_then / or_else tests
// ============================================================================

TEST_CASE("and_then on success", "[vocabulary][functional]") {
  auto r = itest::expected<int, itest::ConfigError>::success(10);
  auto r2 = itest::and_then(r, [](int v) {
    return itest::expected<int, itest::ConfigError>::success(v * 2);
  });
  REQUIRE(r2.value() == 20);
}

TEST_CASE("and_then on error propagates", "[vocabulary][functional]") {
  auto r = itest::expected<int, itest::ConfigError>::error(
      itest::ConfigError::kParseError);
  auto r2 = itest::and_then(r, [](int v) {
    return itest::expected<int, itest::ConfigError>::success(v * 2);
  });
  REQUIRE(!r2.has_value());
  REQUIRE(r2.get_error() == itest::ConfigError::kParseError);
}

TEST_CASE("or_else on error", "[vocabulary][functional]") {
  auto r = itest::expected<int, itest::ConfigError>::error(
      itest::ConfigError::kFileNotFound);
  itest::ConfigError captured{};
  itest::or_else(r, [&captured](itest::ConfigError e) { captured = e; });
  REQUIRE(captured == itest::ConfigError::kFileNotFound);
}

// ============================================================================
// Error names
// ============================================================================

TEST_CASE("ErrorName covers timeout kinds", "[vocabulary][error]") {
  REQUIRE(std::strcmp(itest::ErrorName(itest::ExpectError::kIdleTimeout),
                      "idle deadline exceeded") == 0);
  REQUIRE(std::strcmp(itest::ErrorName(itest::ExpectError::kAbsoluteTimeout),
                      "absolute deadline exceeded") == 0);
  REQUIRE(std::strcmp(itest::ErrorName(itest::WorkspaceError::kFixtureMissing),
                      "unknown") != 0);
}
