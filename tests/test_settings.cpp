/**
 * @file test_settings.cpp
 * @brief Tests for settings.hpp
 */

#include "itest/settings.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>

TEST_CASE("Settings defaults", "[settings]") {
  itest::Settings s;
  REQUIRE(s.run_case_timeout_s == 1800U);
  REQUIRE(s.hanging_timeout_s == 300U);
  REQUIRE(s.cases_dir == "cases");
  REQUIRE(s.coverage_rcfile == ".coveragerc");
  REQUIRE_FALSE(s.enable_coverage);
  REQUIRE(s.CasesRoot().empty());
}

TEST_CASE("Settings CasesRoot joins env root and cases dir", "[settings]") {
  itest::Settings s;
  s.env_root = "/srv/itest";
  REQUIRE(s.CasesRoot() == "/srv/itest/cases");
  s.cases_dir = "/abs/cases";
  REQUIRE(s.CasesRoot() == "/abs/cases");
}

#ifdef ITEST_CONFIG_INI_ENABLED

static itest::IniConfig LoadIniText(const char* text) {
  itest::IniConfig cfg;
  auto r = cfg.LoadBuffer(text, static_cast<uint32_t>(std::strlen(text)),
                          itest::ConfigFormat::kIni);
  REQUIRE(r.has_value());
  return cfg;
}

TEST_CASE("SettingsFromConfig reads every section", "[settings][ini]") {
  auto cfg = LoadIniText(
      "[itest]\n"
      "sudo_password = secret\n"
      "run_case_timeout = 60\n"
      "hanging_timeout = 0\n"
      "verbose = 2\n"
      "log_level = warn\n"
      "[env]\n"
      "root = /srv/itest\n"
      "cases_dir = tests\n"
      "workspace = /tmp/ws\n"
      "machine_labels = Ubuntu2204, ubuntu\n"
      "[coverage]\n"
      "enabled = yes\n"
      "target = gbs\n"
      "[suites]\n"
      "smoke = build export\n"
      "nightly = build, !chroot\n");

  auto r = itest::SettingsFromConfig(cfg);
  REQUIRE(r.has_value());
  const itest::Settings& s = r.value();
  REQUIRE(s.sudo_password == "secret");
  REQUIRE(s.run_case_timeout_s == 60U);
  REQUIRE(s.hanging_timeout_s == 0U);
  REQUIRE(s.verbose == 2);
  REQUIRE(s.log_level == itest::log::Level::kWarn);
  REQUIRE(s.CasesRoot() == "/srv/itest/tests");
  REQUIRE(s.workspace == "/tmp/ws");
  REQUIRE(s.machine_labels.size() == 2U);
  REQUIRE(s.machine_labels.count("ubuntu2204") == 1U);
  REQUIRE(s.enable_coverage);
  REQUIRE(s.target_name == "gbs");
  REQUIRE(s.suites.size() == 2U);
  REQUIRE(s.suites.at("smoke") == std::vector<std::string>{"build", "export"});
  REQUIRE(s.suites.at("nightly") == std::vector<std::string>{"build", "!chroot"});
}

TEST_CASE("SettingsFromConfig rejects negative timeouts", "[settings][ini]") {
  auto cfg = LoadIniText("[itest]\nhanging_timeout = -5\n");
  auto r = itest::SettingsFromConfig(cfg);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == itest::ConfigError::kInvalidValue);
}

TEST_CASE("LoadSettings from disk", "[settings][ini]") {
  const char* path = "/tmp/__itest_settings__.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "[itest]\nsudo_password = pw\n");
  std::fclose(f);

  auto r = itest::LoadSettings(path);
  REQUIRE(r.has_value());
  REQUIRE(r.value().sudo_password == "pw");
  REQUIRE(r.value().run_case_timeout_s == 1800U);
  std::remove(path);
}

TEST_CASE("LoadSettings missing file", "[settings][ini]") {
  auto r = itest::LoadSettings("/tmp/__itest_no_such_settings__.ini");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == itest::ConfigError::kFileNotFound);
}

#endif  // ITEST_CONFIG_INI_ENABLED
