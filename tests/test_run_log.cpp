/**
 * @file test_run_log.cpp
 * @brief Tests for run_log.hpp - case log and escape stripping.
 */

#include "itest/run_log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <string>

#include <unistd.h>

static std::string Slurp(const std::string& path) {
  std::string data;
  FILE* f = std::fopen(path.c_str(), "rb");
  if (f == nullptr) return data;
  char buf[512];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) data.append(buf, n);
  std::fclose(f);
  return data;
}

static void Spit(const std::string& path, const std::string& data) {
  FILE* f = std::fopen(path.c_str(), "wb");
  REQUIRE(f != nullptr);
  std::fwrite(data.data(), 1, data.size(), f);
  std::fclose(f);
}

// ============================================================================
// StripEscapeSequences
// ============================================================================

TEST_CASE("Strip removes color and erase-line sequences", "[run_log]") {
  REQUIRE(itest::StripEscapeSequences("\x1b[31mred\x1b[0m") == "red");
  REQUIRE(itest::StripEscapeSequences("\x1b[mplain") == "plain");
  REQUIRE(itest::StripEscapeSequences("50%\x1b[K\r100%\x1b[2K") == "50%\r100%");
}

TEST_CASE("Strip keeps other escape sequences", "[run_log]") {
  const std::string cursor = "a\x1b[1;2Hb\x1b[?25lc\x1b[2J";
  REQUIRE(itest::StripEscapeSequences(cursor) == cursor);
  REQUIRE(itest::StripEscapeSequences("\x1b") == "\x1b");
  REQUIRE(itest::StripEscapeSequences("\x1b[12") == "\x1b[12");
}

TEST_CASE("Strip is idempotent", "[run_log]") {
  const std::string once = itest::StripEscapeSequences("\x1b[1m\x1b[32mok\x1b[0m\x1b[K");
  REQUIRE(once == "ok");
  REQUIRE(itest::StripEscapeSequences(once) == once);
}

TEST_CASE("StripEscapeSequencesInFile rewrites in place", "[run_log]") {
  const std::string path = "/tmp/__itest_run_log_strip__";
  Spit(path, "\x1b[33mwarn\x1b[0m line\n");
  REQUIRE(itest::StripEscapeSequencesInFile(path));
  REQUIRE(Slurp(path) == "warn line\n");
  REQUIRE(itest::StripEscapeSequencesInFile(path));
  REQUIRE(Slurp(path) == "warn line\n");
  std::remove(path.c_str());

  REQUIRE_FALSE(itest::StripEscapeSequencesInFile("/nonexistent/itest/log"));
}

// ============================================================================
// RunLog
// ============================================================================

TEST_CASE("RunLog appends timestamped markers", "[run_log]") {
  const std::string path = "/tmp/__itest_run_log_lines__";
  Spit(path, "earlier\n");

  itest::RunLog log;
  REQUIRE(log.Open(path));
  REQUIRE(log.IsOpen());
  REQUIRE(log.Path() == path);
  log.Line("INFO: steps start");
  const char raw[] = "child output\n";
  log.Write(raw, sizeof(raw) - 1);
  log.Close();
  REQUIRE_FALSE(log.IsOpen());

  const std::string data = Slurp(path);
  REQUIRE(data.compare(0, 8, "earlier\n") == 0);
  // "YYYY-MM-DD HH:MM:SS [itest] INFO: steps start\n"
  const std::string line = data.substr(8, data.find('\n', 8) - 8);
  REQUIRE(line.size() == 19U + std::string(" [itest] INFO: steps start").size());
  REQUIRE(line[4] == '-');
  REQUIRE(line[13] == ':');
  REQUIRE(line.substr(19) == " [itest] INFO: steps start");
  REQUIRE(data.find("child output\n") != std::string::npos);
  std::remove(path.c_str());
}

TEST_CASE("RunLog tees every write", "[run_log]") {
  const std::string path = "/tmp/__itest_run_log_tee__";
  const std::string tee_path = "/tmp/__itest_run_log_tee_copy__";
  std::remove(path.c_str());
  FILE* tee = std::fopen(tee_path.c_str(), "w");
  REQUIRE(tee != nullptr);

  itest::RunLog log;
  REQUIRE(log.Open(path, tee));
  itest::OutputSink sink = log.AsSink();
  sink.Write("abc", 3);
  log.Close();
  std::fclose(tee);

  REQUIRE(Slurp(path) == "abc");
  REQUIRE(Slurp(tee_path) == "abc");
  std::remove(path.c_str());
  std::remove(tee_path.c_str());
}

TEST_CASE("RunLog Open fails for a missing directory", "[run_log]") {
  itest::RunLog log;
  REQUIRE_FALSE(log.Open("/nonexistent/itest/.meta/log"));
  REQUIRE_FALSE(log.IsOpen());
  log.Write("x", 1);
}
