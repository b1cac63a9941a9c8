/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file settings.hpp
 * @brief Immutable engine settings loaded from a config file.
 *
 * Settings is a plain value: it is built once (defaults, then an optional
 * file through config.hpp) and passed by const reference to everything that
 * needs it. Nothing in the engine reads process-wide state.
 *
 * File layout (INI shown; JSON/YAML use the same section/key names):
 * @code
 *   [itest]
 *   sudo_password = secret
 *   run_case_timeout = 1800   ; seconds, 0 disables
 *   hanging_timeout = 300     ; seconds, 0 disables
 *   verbose = 1
 *   log_level = info
 *
 *   [env]
 *   root = /home/me/gbs-itest
 *   cases_dir = cases
 *   workspace = /tmp/itest-workspace
 *   machine_labels = ubuntu2204, ubuntu
 *
 *   [coverage]
 *   enabled = false
 *   target = gbs
 *   rcfile = .coveragerc
 *
 *   [suites]
 *   smoke = build export
 * @endcode
 */

#ifndef ITEST_SETTINGS_HPP_
#define ITEST_SETTINGS_HPP_

#include "itest/config.hpp"
#include "itest/log.hpp"
#include "itest/text.hpp"
#include "itest/vocabulary.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace itest {

struct Settings {
  static constexpr uint32_t kDefaultRunCaseTimeoutS = 30U * 60U;
  static constexpr uint32_t kDefaultHangingTimeoutS = 5U * 60U;

  std::string sudo_password;
  uint32_t run_case_timeout_s = kDefaultRunCaseTimeoutS;  ///< 0 = no ceiling
  uint32_t hanging_timeout_s = kDefaultHangingTimeoutS;   ///< 0 = no idle check
  int32_t verbose = 1;
  log::Level log_level = log::Level::kInfo;

  std::string env_root;        ///< Test project root, empty if not configured
  std::string cases_dir = "cases";
  std::string workspace;       ///< Root of per-run directories
  std::set<std::string> machine_labels;

  bool enable_coverage = false;
  std::string target_name;     ///< Executable under test (coverage wrapping)
  std::string coverage_rcfile = ".coveragerc";

  /// Alias name -> list of selectors.
  std::map<std::string, std::vector<std::string>> suites;

  /// @brief Absolute cases root (env_root/cases_dir), empty without env_root.
  std::string CasesRoot() const {
    if (env_root.empty()) return std::string();
    if (!cases_dir.empty() && cases_dir[0] == '/') return cases_dir;
    return env_root + "/" + cases_dir;
  }
};

/**
 * @brief Build Settings from an already loaded config store.
 *
 * Missing keys keep their defaults. Negative timeouts are rejected.
 */
inline expected<Settings, ConfigError> SettingsFromConfig(
    const ConfigStore& cfg) {
  Settings s;
  s.sudo_password = cfg.GetString("itest", "sudo_password", "");

  int32_t run_timeout = cfg.GetInt(
      "itest", "run_case_timeout",
      static_cast<int32_t>(Settings::kDefaultRunCaseTimeoutS));
  int32_t hang_timeout = cfg.GetInt(
      "itest", "hanging_timeout",
      static_cast<int32_t>(Settings::kDefaultHangingTimeoutS));
  if (run_timeout < 0 || hang_timeout < 0) {
    ITEST_LOG_ERROR("settings", "timeouts must not be negative (%d, %d)",
                    run_timeout, hang_timeout);
    return expected<Settings, ConfigError>::error(ConfigError::kInvalidValue);
  }
  s.run_case_timeout_s = static_cast<uint32_t>(run_timeout);
  s.hanging_timeout_s = static_cast<uint32_t>(hang_timeout);
  s.verbose = cfg.GetInt("itest", "verbose", 1);
  s.log_level =
      log::ParseLevel(cfg.GetString("itest", "log_level", "info"),
                      log::Level::kInfo);

  s.env_root = cfg.GetString("env", "root", "");
  s.cases_dir = cfg.GetString("env", "cases_dir", "cases");
  s.workspace = cfg.GetString("env", "workspace", "");
  for (const std::string& label :
       detail::SplitList(cfg.GetString("env", "machine_labels", ""))) {
    s.machine_labels.insert(detail::ToLower(label));
  }

  s.enable_coverage = cfg.GetBool("coverage", "enabled", false);
  s.target_name = cfg.GetString("coverage", "target", "");
  s.coverage_rcfile = cfg.GetString("coverage", "rcfile", ".coveragerc");

  cfg.ForEachKey("suites", [&s](const char* key, const char* value) {
    s.suites[key] = detail::SplitList(value);
  });

  return expected<Settings, ConfigError>::success(std::move(s));
}

/**
 * @brief Load Settings from @p path (format detected from the extension).
 */
inline expected<Settings, ConfigError> LoadSettings(const char* path) {
  MultiConfig cfg;
  auto r = cfg.LoadFile(path);
  if (!r.has_value()) {
    ITEST_LOG_ERROR("settings", "cannot load %s: %s", path,
                    ErrorName(r.get_error()));
    return expected<Settings, ConfigError>::error(r.get_error());
  }
  ITEST_LOG_DEBUG("settings", "loaded %u entries from %s", cfg.EntryCount(),
                  path);
  return SettingsFromConfig(cfg);
}

}  // namespace itest

#endif  // ITEST_SETTINGS_HPP_
