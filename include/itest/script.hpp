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
 * @file script.hpp
 * @brief Phase script synthesis: case fields -> setup/steps/teardown shell.
 *
 * Every script starts with "cd <rundir>"; paths inside the scripts are
 * relative to the run directory. Setup snapshots the shell variables
 * before and after the setup body and keeps the lines that are new in the
 * "after" snapshot in .meta/var.out, which steps and teardown source. A
 * variable whose value changed therefore shows up as an added line too.
 *
 * Synthesis is a pure function of the case, the run directory and the
 * coverage options; anything that touches the filesystem (rcfile lookup,
 * writing the scripts) happens outside of it.
 */

#ifndef ITEST_SCRIPT_HPP_
#define ITEST_SCRIPT_HPP_

#include "itest/log.hpp"
#include "itest/settings.hpp"
#include "itest/test_case.hpp"
#include "itest/text.hpp"
#include "itest/vocabulary.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

namespace itest {

/// Metadata subdirectory of a run directory.
static constexpr const char* kMetaDir = ".meta";

/// @brief Coverage wrapping of the target executable in the steps script.
struct CoverageOptions {
  bool enabled = false;
  std::string target;     ///< executable name, e.g. "gbs"
  std::string opts;       ///< extra "coverage run" options ("--rcfile ...")
  std::string data_file;  ///< COVERAGE_FILE for the run
};

/// @brief Generated script texts; setup/teardown are empty when absent.
struct PhaseScripts {
  std::string setup;
  std::string steps;
  std::string teardown;
};

/**
 * @brief Resolve coverage options for a run whose log lives in @p log_dir.
 *
 * Coverage needs the switch, an env root and a target name. The rcfile is
 * passed only when it exists under the env root.
 */
inline CoverageOptions MakeCoverageOptions(const Settings& settings,
                                           const std::string& log_dir) {
  CoverageOptions cov;
  if (!settings.enable_coverage || settings.env_root.empty() ||
      settings.target_name.empty()) {
    return cov;
  }
  cov.enabled = true;
  cov.target = settings.target_name;
  const std::string rcfile =
      detail::JoinPath(settings.env_root, settings.coverage_rcfile);
  struct stat st;
  if (::stat(rcfile.c_str(), &st) == 0) cov.opts = "--rcfile " + rcfile;
  cov.data_file = detail::JoinPath(log_dir, ".coverage");
  return cov;
}

inline std::string MakeSetupScript(const TestCase& tc, const std::string& rundir) {
  if (detail::Strip(tc.setup).empty()) return std::string();
  std::string code;
  code += "cd " + rundir + "\n";
  code += "(set -o posix; set) > .meta/var.old\n";
  code += "set -x\n";
  code += tc.setup + "\n";
  code += "set +x\n";
  code += "(set -o posix; set) > .meta/var.new\n";
  code +=
      "diff --unchanged-line-format= --old-line-format= "
      "--new-line-format='%L' \\\n";
  code += "    .meta/var.old .meta/var.new > .meta/var.out\n";
  return code;
}

inline std::string MakeCoverageCode(const CoverageOptions& cov) {
  if (!cov.enabled) return std::string();
  const std::string& t = cov.target;
  std::string code;
  code += "\n";
  code += "__ITEST_ORIG_TARGET__=$(which " + t + ")\n";
  code += "shopt -s expand_aliases\n";
  code += "coverage=$(which python-coverage 2>/dev/null || which coverage)\n";
  code += "runsudo()\n";
  code += "{\n";
  code += "if [ $1 == " + t + " ]; then\n";
  code += "shift\n";
  code += "sudo COVERAGE_FILE=" + cov.data_file + " $coverage run -p " +
          cov.opts + " $(which " + t + ") \"$@\" && set -o pipefail\n";
  code += "else\n";
  code += "sudo \"$@\" && set -o pipefail\n";
  code += "fi\n";
  code += "}\n";
  code += "alias sudo=runsudo\n";
  code += "alias " + t + "='COVERAGE_FILE=" + cov.data_file +
          " $coverage run -p " + cov.opts + " '$__ITEST_ORIG_TARGET__\n";
  return code;
}

inline std::string MakeStepsScript(const TestCase& tc, const std::string& rundir,
                                   const CoverageOptions& cov) {
  std::string code;
  code += "cd " + rundir + "\n";
  code += "if [ -f .meta/var.out ]; then\n";
  code += "    . .meta/var.out\n";
  code += "fi\n";
  code += MakeCoverageCode(cov) + "\n";
  code += "set -o pipefail\n";
  code += "set -ex\n";
  code += tc.steps + "\n";
  return code;
}

inline std::string MakeTeardownScript(const TestCase& tc,
                                      const std::string& rundir) {
  if (detail::Strip(tc.teardown).empty()) return std::string();
  std::string code;
  code += "cd " + rundir + "\n";
  code += "if [ -f .meta/var.out ]; then\n";
  code += "    . .meta/var.out\n";
  code += "fi\n";
  code += "set -x\n";
  code += tc.teardown + "\n";
  return code;
}

inline PhaseScripts SynthesizeScripts(const TestCase& tc,
                                      const std::string& rundir,
                                      const CoverageOptions& cov) {
  PhaseScripts s;
  s.setup = MakeSetupScript(tc, rundir);
  s.steps = MakeStepsScript(tc, rundir, cov);
  s.teardown = MakeTeardownScript(tc, rundir);
  return s;
}

/**
 * @brief Persist @p code as <meta_dir>/<name>.
 * @return Path of the written script.
 */
inline expected<std::string, ScriptError> WriteScript(const std::string& meta_dir,
                                                      const char* name,
                                                      const std::string& code) {
  const std::string path = detail::JoinPath(meta_dir, name);
  FILE* f = std::fopen(path.c_str(), "w");
  if (f == nullptr) {
    ITEST_LOG_ERROR("script", "cannot create %s: %s", path.c_str(),
                    std::strerror(errno));
    return expected<std::string, ScriptError>::error(ScriptError::kWriteFailed);
  }
  bool ok = std::fwrite(code.data(), 1, code.size(), f) == code.size();
  ok = (std::fclose(f) == 0) && ok;
  if (!ok) {
    ITEST_LOG_ERROR("script", "cannot write %s", path.c_str());
    return expected<std::string, ScriptError>::error(ScriptError::kWriteFailed);
  }
  return expected<std::string, ScriptError>::success(path);
}

}  // namespace itest

#endif  // ITEST_SCRIPT_HPP_
