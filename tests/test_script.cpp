/**
 * @file test_script.cpp
 * @brief Tests for script.hpp - phase script synthesis.
 */

#include "itest/script.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

static itest::TestCase MakeCase() {
  itest::TestCase tc;
  tc.filename = "/cases/build/simple.case";
  tc.summary = "simple";
  tc.setup = "export PKG=fake";
  tc.steps = "gbs build $PKG";
  tc.teardown = "rm -rf out";
  return tc;
}

// ============================================================================
// Templates
// ============================================================================

TEST_CASE("Setup script snapshots variables around the body", "[script]") {
  const std::string code = itest::MakeSetupScript(MakeCase(), "/ws/run-1");
  REQUIRE(code ==
          "cd /ws/run-1\n"
          "(set -o posix; set) > .meta/var.old\n"
          "set -x\n"
          "export PKG=fake\n"
          "set +x\n"
          "(set -o posix; set) > .meta/var.new\n"
          "diff --unchanged-line-format= --old-line-format= "
          "--new-line-format='%L' \\\n"
          "    .meta/var.old .meta/var.new > .meta/var.out\n");
}

TEST_CASE("Setup and teardown scripts are absent without a body", "[script]") {
  itest::TestCase tc = MakeCase();
  tc.setup.clear();
  tc.teardown = "  \n";
  REQUIRE(itest::MakeSetupScript(tc, "/ws").empty());
  REQUIRE(itest::MakeTeardownScript(tc, "/ws").empty());
}

TEST_CASE("Steps script sources setup variables and fails fast", "[script]") {
  const std::string code =
      itest::MakeStepsScript(MakeCase(), "/ws/run-1", itest::CoverageOptions());
  REQUIRE(code ==
          "cd /ws/run-1\n"
          "if [ -f .meta/var.out ]; then\n"
          "    . .meta/var.out\n"
          "fi\n"
          "\n"
          "set -o pipefail\n"
          "set -ex\n"
          "gbs build $PKG\n");
}

TEST_CASE("Teardown script traces without exit-on-error", "[script]") {
  const std::string code = itest::MakeTeardownScript(MakeCase(), "/ws/run-1");
  REQUIRE(code ==
          "cd /ws/run-1\n"
          "if [ -f .meta/var.out ]; then\n"
          "    . .meta/var.out\n"
          "fi\n"
          "set -x\n"
          "rm -rf out\n");
  REQUIRE(code.find("set -e") == std::string::npos);
}

// ============================================================================
// Coverage
// ============================================================================

TEST_CASE("Coverage glue wraps the target and sudo", "[script][coverage]") {
  itest::CoverageOptions cov;
  cov.enabled = true;
  cov.target = "gbs";
  cov.opts = "--rcfile /env/.coveragerc";
  cov.data_file = "/ws/run-1/.meta/.coverage";

  const std::string glue = itest::MakeCoverageCode(cov);
  REQUIRE(glue.find("__ITEST_ORIG_TARGET__=$(which gbs)\n") != std::string::npos);
  REQUIRE(glue.find("shopt -s expand_aliases\n") != std::string::npos);
  REQUIRE(glue.find("which python-coverage 2>/dev/null || which coverage") !=
          std::string::npos);
  REQUIRE(glue.find("if [ $1 == gbs ]; then\n") != std::string::npos);
  REQUIRE(glue.find("sudo COVERAGE_FILE=/ws/run-1/.meta/.coverage $coverage run -p "
                    "--rcfile /env/.coveragerc $(which gbs) \"$@\"") !=
          std::string::npos);
  REQUIRE(glue.find("alias sudo=runsudo\n") != std::string::npos);
  REQUIRE(glue.find("alias gbs='COVERAGE_FILE=/ws/run-1/.meta/.coverage $coverage "
                    "run -p --rcfile /env/.coveragerc '$__ITEST_ORIG_TARGET__\n") !=
          std::string::npos);

  const std::string steps = itest::MakeStepsScript(MakeCase(), "/ws/run-1", cov);
  REQUIRE(steps.find(glue) != std::string::npos);
  REQUIRE(steps.find(glue) < steps.find("set -o pipefail"));
}

TEST_CASE("Coverage is off without env root or target", "[script][coverage]") {
  itest::Settings s;
  s.enable_coverage = true;
  s.target_name = "gbs";
  REQUIRE_FALSE(itest::MakeCoverageOptions(s, "/ws/.meta").enabled);

  s.env_root = "/nonexistent-env";
  s.target_name.clear();
  REQUIRE_FALSE(itest::MakeCoverageOptions(s, "/ws/.meta").enabled);
  REQUIRE(itest::MakeCoverageCode(itest::CoverageOptions()).empty());
}

TEST_CASE("Coverage passes the rcfile only when it exists", "[script][coverage]") {
  char tmpl[] = "/tmp/itest-env-XXXXXX";
  REQUIRE(mkdtemp(tmpl) != nullptr);
  const std::string env = tmpl;

  itest::Settings s;
  s.enable_coverage = true;
  s.target_name = "gbs";
  s.env_root = env;

  auto cov = itest::MakeCoverageOptions(s, "/ws/.meta");
  REQUIRE(cov.enabled);
  REQUIRE(cov.opts.empty());
  REQUIRE(cov.data_file == "/ws/.meta/.coverage");

  const std::string rc = env + "/.coveragerc";
  FILE* f = std::fopen(rc.c_str(), "w");
  REQUIRE(f != nullptr);
  std::fclose(f);
  cov = itest::MakeCoverageOptions(s, "/ws/.meta");
  REQUIRE(cov.opts == "--rcfile " + rc);

  std::remove(rc.c_str());
  rmdir(env.c_str());
}

// ============================================================================
// Determinism and persistence
// ============================================================================

TEST_CASE("Synthesis is deterministic", "[script]") {
  itest::CoverageOptions cov;
  cov.enabled = true;
  cov.target = "gbs";
  cov.data_file = "/ws/.meta/.coverage";

  auto a = itest::SynthesizeScripts(MakeCase(), "/ws/run-1", cov);
  auto b = itest::SynthesizeScripts(MakeCase(), "/ws/run-1", cov);
  REQUIRE(a.setup == b.setup);
  REQUIRE(a.steps == b.steps);
  REQUIRE(a.teardown == b.teardown);
}

TEST_CASE("WriteScript persists the text", "[script]") {
  char tmpl[] = "/tmp/itest-meta-XXXXXX";
  REQUIRE(mkdtemp(tmpl) != nullptr);
  const std::string meta = tmpl;

  auto path = itest::WriteScript(meta, "steps", "echo hi\n");
  REQUIRE(path.has_value());
  REQUIRE(path.value() == meta + "/steps");

  FILE* f = std::fopen(path.value().c_str(), "r");
  REQUIRE(f != nullptr);
  char buf[32] = {};
  size_t n = std::fread(buf, 1, sizeof(buf) - 1, f);
  std::fclose(f);
  REQUIRE(std::string(buf, n) == "echo hi\n");

  std::remove(path.value().c_str());
  rmdir(meta.c_str());
}

TEST_CASE("WriteScript fails for a missing directory", "[script]") {
  auto path = itest::WriteScript("/nonexistent/itest/.meta", "steps", "true\n");
  REQUIRE_FALSE(path.has_value());
  REQUIRE(path.get_error() == itest::ScriptError::kWriteFailed);
}
