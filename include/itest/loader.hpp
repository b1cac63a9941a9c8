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
 * @file loader.hpp
 * @brief Resolves command line selectors into a suite of test cases.
 *
 * A selector is tried against these patterns, first hit wins:
 *
 *   alias         key of the [suites] settings section
 *   file          path of a case file
 *   directory     every "*.case" below it, recursively
 *   intersection  "a&&b": cases selected by every part
 *   component     directory name directly under the cases root
 *   inverse       "!comp": every component except comp
 *
 * Aliases, directories and inverses expand to further selectors.
 */

#ifndef ITEST_LOADER_HPP_
#define ITEST_LOADER_HPP_

#include "itest/case_parser.hpp"
#include "itest/fs.hpp"
#include "itest/log.hpp"
#include "itest/settings.hpp"
#include "itest/test_case.hpp"
#include "itest/text.hpp"
#include "itest/vocabulary.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace itest {

/// @brief Cases keyed by absolute path; iteration order is path order.
using TestSuite = std::map<std::string, TestCase>;

class TestLoader final {
 public:
  explicit TestLoader(const Settings& settings) : settings_(settings) {
    const std::string root = settings_.CasesRoot();
    cases_root_ = detail::RealPath(root);
    if (cases_root_.empty()) cases_root_ = root;
  }

  /// @brief Union of all selectors; no selector loads the whole cases root.
  expected<TestSuite, LoadError> LoadArgs(const std::vector<std::string>& args) {
    if (args.empty()) {
      if (cases_root_.empty()) {
        ITEST_LOG_ERROR("loader", "no selector and no cases root configured");
        return expected<TestSuite, LoadError>::error(LoadError::kNotFound);
      }
      return Load(cases_root_);
    }
    TestSuite suite;
    for (const std::string& arg : args) {
      auto part = Load(arg);
      if (!part.has_value()) return part;
      for (auto& kv : part.value()) suite.insert(kv);
    }
    return expected<TestSuite, LoadError>::success(std::move(suite));
  }

  /// @brief Resolve one selector.
  expected<TestSuite, LoadError> Load(const std::string& selector) {
    using Result = expected<TestSuite, LoadError>;
    TestSuite suite;
    std::set<std::string> expanded_aliases;
    std::vector<std::string> stack{selector};

    while (!stack.empty()) {
      const std::string sel = stack.back();
      stack.pop_back();

      // alias
      auto alias = settings_.suites.find(sel);
      if (alias != settings_.suites.end()) {
        if (expanded_aliases.insert(sel).second) {
          stack.insert(stack.end(), alias->second.begin(), alias->second.end());
        } else {
          ITEST_LOG_WARN("loader", "alias '%s' refers to itself", sel.c_str());
        }
        continue;
      }

      // file
      if (detail::IsRegularFile(sel)) {
        const std::string path = detail::RealPath(sel);
        auto tc = ParseCaseFile(path, cases_root_);
        if (!tc.has_value()) {
          ITEST_LOG_ERROR("loader", "%s", tc.get_error().message.c_str());
          return Result::error(LoadError::kParseFailed);
        }
        suite[path] = std::move(tc.value());
        continue;
      }

      // directory
      if (detail::IsDirectory(sel)) {
        CollectCaseFiles(sel, stack);
        continue;
      }

      // intersection
      size_t amp = sel.find("&&");
      if (amp != std::string::npos && amp > 0U) {
        auto inter = LoadIntersection(sel);
        if (!inter.has_value()) return inter;
        for (auto& kv : inter.value()) suite.insert(kv);
        continue;
      }

      // component
      if (IsComponent(sel)) {
        stack.push_back(detail::JoinPath(cases_root_, sel));
        continue;
      }

      // inverse
      if (sel.size() > 1U && sel[0] == '!' && IsComponent(sel.substr(1))) {
        const std::string excluded = sel.substr(1);
        for (const std::string& comp : Components()) {
          if (comp != excluded) stack.push_back(comp);
        }
        continue;
      }

      ITEST_LOG_ERROR("loader", "cannot find tests matching '%s'", sel.c_str());
      return Result::error(LoadError::kNotFound);
    }
    return Result::success(std::move(suite));
  }

  /// @brief Directories directly under the cases root.
  std::set<std::string> Components() const {
    std::set<std::string> comps;
    if (cases_root_.empty()) return comps;
    for (const std::string& name : detail::ListDir(cases_root_)) {
      if (detail::IsDirectory(detail::JoinPath(cases_root_, name))) comps.insert(name);
    }
    return comps;
  }

  const std::string& CasesRoot() const { return cases_root_; }

 private:
  bool IsComponent(const std::string& name) const {
    if (cases_root_.empty() || name.empty() || name.find('/') != std::string::npos) {
      return false;
    }
    return Components().count(name) != 0U;
  }

  /// Linked directories below @p dir are not descended into.
  static void CollectCaseFiles(const std::string& dir, std::vector<std::string>& out) {
    for (const std::string& name : detail::ListDir(dir)) {
      const std::string full = detail::JoinPath(dir, name);
      if (detail::IsDirectory(full)) {
        if (!detail::IsSymlink(full)) CollectCaseFiles(full, out);
      } else if (detail::EndsWith(name, ".case") && detail::IsRegularFile(full)) {
        out.push_back(full);
      }
    }
  }

  expected<TestSuite, LoadError> LoadIntersection(const std::string& sel) {
    TestSuite result;
    bool first = true;
    size_t begin = 0;
    for (;;) {
      size_t amp = sel.find("&&", begin);
      const std::string part =
          detail::Strip(sel.substr(begin, amp == std::string::npos ? std::string::npos
                                                                   : amp - begin));
      auto loaded = Load(part);
      if (!loaded.has_value()) return loaded;
      if (first) {
        result = std::move(loaded.value());
        first = false;
      } else {
        for (auto it = result.begin(); it != result.end();) {
          if (loaded.value().count(it->first) == 0U) {
            it = result.erase(it);
          } else {
            ++it;
          }
        }
      }
      if (amp == std::string::npos) break;
      begin = amp + 2U;
    }
    return expected<TestSuite, LoadError>::success(std::move(result));
  }

  const Settings& settings_;
  std::string cases_root_;
};

}  // namespace itest

#endif  // ITEST_LOADER_HPP_
