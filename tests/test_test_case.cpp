/**
 * @file test_test_case.cpp
 * @brief Tests for test_case.hpp - identity, component, conditions.
 */

#include "itest/test_case.hpp"

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <set>
#include <string>

TEST_CASE("TestCase identity is its path", "[test_case]") {
  itest::TestCase a;
  a.filename = "/cases/build/a.case";
  a.summary = "one";
  itest::TestCase b;
  b.filename = "/cases/build/a.case";
  b.summary = "two";
  itest::TestCase c;
  c.filename = "/cases/build/c.case";

  REQUIRE(a == b);
  REQUIRE(a != c);

  std::map<std::string, itest::TestCase> suite;
  suite[a.filename] = a;
  suite[b.filename] = b;
  REQUIRE(suite.size() == 1U);
}

TEST_CASE("TestCase Dirname", "[test_case]") {
  itest::TestCase tc;
  tc.filename = "/cases/build/a.case";
  REQUIRE(tc.Dirname() == "/cases/build");
  tc.filename = "/a.case";
  REQUIRE(tc.Dirname() == "/");
  tc.filename = "a.case";
  REQUIRE(tc.Dirname() == ".");
}

TEST_CASE("GuessComponent takes the first directory under the root", "[test_case]") {
  REQUIRE(itest::GuessComponent("/env/cases/build/x/y.case", "/env/cases") == "build");
  REQUIRE(itest::GuessComponent("/env/cases/export/y.case", "/env/cases") == "export");
}

TEST_CASE("GuessComponent falls back to unknown", "[test_case]") {
  REQUIRE(itest::GuessComponent("/env/cases/y.case", "/env/cases") == "unknown");
  REQUIRE(itest::GuessComponent("/other/build/y.case", "/env/cases") == "unknown");
  REQUIRE(itest::GuessComponent("/env/casesx/build/y.case", "/env/cases") == "unknown");
  REQUIRE(itest::GuessComponent("/env/cases/build/y.case", "") == "unknown");
}

// ============================================================================
// Conditions
// ============================================================================

TEST_CASE("No conditions never skip", "[test_case][conditions]") {
  itest::Conditions cond;
  REQUIRE(cond.Empty());
  REQUIRE_FALSE(itest::CheckConditions(cond, {"suse121"}).has_value());
  REQUIRE_FALSE(itest::CheckConditions(cond, {}).has_value());
}

TEST_CASE("Blacklist hit skips", "[test_case][conditions]") {
  itest::Conditions cond;
  cond.dist_blacklist = {"suse121"};
  auto skip = itest::CheckConditions(cond, {"SUSE121", "suse"});
  REQUIRE(skip.has_value());
  REQUIRE(skip.value() == "by distribution blacklist:suse121");

  REQUIRE_FALSE(itest::CheckConditions(cond, {"ubuntu"}).has_value());
}

TEST_CASE("Blacklist is checked before whitelist", "[test_case][conditions]") {
  itest::Conditions cond;
  cond.dist_blacklist = {"suse121"};
  cond.dist_whitelist = {"suse121", "ubuntu"};
  auto skip = itest::CheckConditions(cond, {"suse121"});
  REQUIRE(skip.has_value());
  REQUIRE(skip.value().find("blacklist") != std::string::npos);
}

TEST_CASE("Whitelist miss skips", "[test_case][conditions]") {
  itest::Conditions cond;
  cond.dist_whitelist = {"fedora", "ubuntu"};
  auto skip = itest::CheckConditions(cond, {"suse121"});
  REQUIRE(skip.has_value());
  REQUIRE(skip.value() == "not in distribution whitelist:fedora,ubuntu");

  REQUIRE_FALSE(itest::CheckConditions(cond, {"Ubuntu"}).has_value());
}
