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
 * @file workspace.hpp
 * @brief Run directory provisioning.
 *
 * A provider hands out a fresh directory for every run; nothing else writes
 * into it while the run is active.
 */

#ifndef ITEST_WORKSPACE_HPP_
#define ITEST_WORKSPACE_HPP_

#include "itest/fs.hpp"
#include "itest/log.hpp"
#include "itest/text.hpp"
#include "itest/vocabulary.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace itest {

class WorkspaceProvider {
 public:
  virtual ~WorkspaceProvider() = default;

  /**
   * @brief Create an empty directory exclusive to one run.
   * @param version  Case version tag, may be empty.
   * @param case_dir Directory of the case file; fixtures are relative to it.
   * @param fixtures Files or directories copied into the new directory.
   */
  virtual expected<std::string, WorkspaceError> NewRunDirectory(
      const std::string& version, const std::string& case_dir,
      const std::vector<std::string>& fixtures) = 0;
};

/**
 * @brief Default provider: <root>/<version or "default">/<unique>.
 *
 * Directories are created with mkdtemp(3) and kept after the run so that
 * logs and scripts stay inspectable.
 */
class TempWorkspace final : public WorkspaceProvider {
 public:
  explicit TempWorkspace(std::string root) : root_(std::move(root)) {}

  expected<std::string, WorkspaceError> NewRunDirectory(
      const std::string& version, const std::string& case_dir,
      const std::vector<std::string>& fixtures) override {
    using Result = expected<std::string, WorkspaceError>;
    const std::string parent =
        detail::JoinPath(root_, version.empty() ? std::string("default") : version);
    if (!detail::MakeDirs(parent)) {
      ITEST_LOG_ERROR("workspace", "cannot create %s: %s", parent.c_str(),
                      std::strerror(errno));
      return Result::error(WorkspaceError::kCreateFailed);
    }

    std::string tmpl = detail::JoinPath(parent, "run-XXXXXX");
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
      ITEST_LOG_ERROR("workspace", "mkdtemp %s: %s", tmpl.c_str(),
                      std::strerror(errno));
      return Result::error(WorkspaceError::kCreateFailed);
    }
    std::string rundir(buf.data());

    for (const std::string& fixture : fixtures) {
      const std::string src = detail::JoinPath(case_dir, fixture);
      if (!detail::PathExists(src)) {
        ITEST_LOG_ERROR("workspace", "fixture not found: %s", src.c_str());
        return Result::error(WorkspaceError::kFixtureMissing);
      }
      const std::string dst = detail::JoinPath(rundir, detail::BaseName(src));
      if (!detail::CopyTree(src, dst)) {
        ITEST_LOG_ERROR("workspace", "cannot copy %s to %s: %s", src.c_str(),
                        dst.c_str(), std::strerror(errno));
        return Result::error(WorkspaceError::kCopyFailed);
      }
    }
    ITEST_LOG_DEBUG("workspace", "run directory %s", rundir.c_str());
    return Result::success(rundir);
  }

  const std::string& Root() const { return root_; }

 private:
  std::string root_;
};

}  // namespace itest

#endif  // ITEST_WORKSPACE_HPP_
