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
 * @file case_parser.hpp
 * @brief Parser of the ".case" section format.
 *
 * A case file is a sequence of sections. A section header starts a line
 * with "__<name>__", optionally followed by ':'. Names are alphanumeric and
 * case-insensitive. The content runs up to the next header:
 *
 * @code
 *   __summary__: build a package
 *   __setup__:
 *   export PKG=fake
 *   __steps__:
 *   gbs build -A i586 $PKG
 *   __qa__:
 *   Q: Continue? (y/n)
 *   A: y
 *   __issue__: #123, C-45
 *   __conditions__:
 *   distblacklist: suse121
 * @endcode
 *
 * Known sections are converted by the handler table below; "summary" and
 * "steps" are required. Unknown sections are ignored.
 */

#ifndef ITEST_CASE_PARSER_HPP_
#define ITEST_CASE_PARSER_HPP_

#include "itest/config.hpp"
#include "itest/log.hpp"
#include "itest/test_case.hpp"
#include "itest/text.hpp"
#include "itest/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace itest {

struct ParseFailure {
  ParseError code;
  std::string message;
};

/// @brief (lower-cased name, raw content) in file order.
using SectionList = std::vector<std::pair<std::string, std::string>>;

namespace detail {

inline bool IsAlnum(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

/**
 * @brief Try to read a section header at @p pos (a line start).
 * @param[out] name Lower-cased section name.
 * @param[out] end  First byte after the header.
 */
inline bool MatchHeader(const std::string& text, size_t pos, std::string& name,
                        size_t& end) {
  if (text.compare(pos, 2, "__") != 0) return false;
  size_t i = pos + 2U;
  size_t name_begin = i;
  while (i < text.size() && IsAlnum(text[i])) ++i;
  if (i == name_begin || text.compare(i, 2, "__") != 0) return false;
  name = ToLower(text.substr(name_begin, i - name_begin));
  i += 2U;

  size_t j = i;
  while (j < text.size() && IsSpace(text[j])) ++j;
  end = (j < text.size() && text[j] == ':') ? j + 1U : i;
  return true;
}

}  // namespace detail

/// @brief Split @p text into its sections.
inline SectionList SplitSections(const std::string& text) {
  SectionList sections;
  bool have_prev = false;
  std::string prev_name;
  size_t prev_start = 0;

  size_t line = 0;
  while (line < text.size()) {
    std::string name;
    size_t end = 0;
    if (detail::MatchHeader(text, line, name, end)) {
      if (have_prev) {
        sections.emplace_back(prev_name, text.substr(prev_start, line - prev_start));
      }
      have_prev = true;
      prev_name = name;
      prev_start = end;
    }
    size_t nl = text.find('\n', line);
    if (nl == std::string::npos) break;
    line = nl + 1U;
  }
  if (have_prev) sections.emplace_back(prev_name, text.substr(prev_start));
  return sections;
}

// ============================================================================
// Section handlers
// ============================================================================

namespace detail {

using SectionHandler = bool (*)(const std::string& content, TestCase& tc,
                                std::string& error);

inline bool ParseSummary(const std::string& content, TestCase& tc, std::string&) {
  tc.summary = Strip(content);
  return true;
}

inline bool ParseSteps(const std::string& content, TestCase& tc, std::string&) {
  tc.steps = content;
  return true;
}

inline bool ParseSetup(const std::string& content, TestCase& tc, std::string&) {
  tc.setup = content;
  return true;
}

inline bool ParseTeardown(const std::string& content, TestCase& tc, std::string&) {
  tc.teardown = content;
  return true;
}

inline bool ParseVersion(const std::string& content, TestCase& tc, std::string&) {
  tc.version = Strip(content);
  return true;
}

inline bool ParseTag(const std::string& content, TestCase& tc, std::string&) {
  tc.tag = Strip(content);
  return true;
}

inline bool ParseFixtures(const std::string& content, TestCase& tc, std::string&) {
  tc.fixtures = SplitList(content);
  return true;
}

/// "Q:" / "A:" line pairs; blank lines are ignored. A trailing question
/// without an answer is dropped.
inline bool ParseQa(const std::string& content, TestCase& tc, std::string& error) {
  tc.qa.clear();
  int state = 0;
  ExpectRule rule;
  for (const std::string& line : SplitLines(Strip(content))) {
    if (line.empty()) continue;
    if (state != 1 && StartsWith(line, "Q:")) {
      if (state == 2) tc.qa.push_back(rule);
      rule.pattern = LStrip(line.substr(2));
      state = 1;
    } else if (state == 1 && StartsWith(line, "A:")) {
      rule.response = LStrip(line.substr(2));
      state = 2;
    } else {
      error = "Invalid format of QA:" + line;
      return false;
    }
  }
  if (state == 2) tc.qa.push_back(rule);
  return true;
}

/// Tokens like "#123", "issue-12", "bug7", "C-45", "change9", "feature3".
inline bool ParseIssue(const std::string& content, TestCase& tc, std::string& error) {
  tc.issue.clear();
  const std::string text = Strip(content);
  if (text.empty()) return true;
  static const std::regex kIssue(R"((#|issue|feature|bug|(c(hange)?))?-?(\d+))",
                                 std::regex::ECMAScript | std::regex::icase);
  for (const std::string& token : SplitList(text)) {
    std::smatch m;
    if (std::regex_search(token, m, kIssue, std::regex_constants::match_continuous)) {
      tc.issue[m.str(0)] =
          static_cast<uint32_t>(std::strtoul(m.str(4).c_str(), nullptr, 10));
    }
  }
  if (tc.issue.empty()) {
    error = "Unrecognized issue number:" + text;
    return false;
  }
  return true;
}

/// "distwhitelist:" / "distblacklist:" lines with label lists.
inline bool ParseConditions(const std::string& content, TestCase& tc,
                            std::string& error) {
  tc.conditions = Conditions();
  for (const std::string& raw : SplitLines(content)) {
    const std::string line = Strip(raw);
    if (line.empty() || line[0] == '#') continue;

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
      error = "Invalid condition:" + line;
      return false;
    }
    const std::string key = ToLower(Strip(line.substr(0, colon)));
    std::set<std::string>* target = nullptr;
    if (key == "distwhitelist") {
      target = &tc.conditions.dist_whitelist;
    } else if (key == "distblacklist") {
      target = &tc.conditions.dist_blacklist;
    } else {
      error = "Unknown condition:" + key;
      return false;
    }
    for (const std::string& label : SplitList(line.substr(colon + 1U))) {
      target->insert(ToLower(label));
    }
  }
  return true;
}

struct SectionEntry {
  const char* name;
  SectionHandler handler;
  ParseError error;
};

static const SectionEntry kSectionTable[] = {
    {"summary", &ParseSummary, ParseError::kMissingSection},
    {"steps", &ParseSteps, ParseError::kMissingSection},
    {"setup", &ParseSetup, ParseError::kMissingSection},
    {"teardown", &ParseTeardown, ParseError::kMissingSection},
    {"qa", &ParseQa, ParseError::kInvalidQa},
    {"issue", &ParseIssue, ParseError::kInvalidIssue},
    {"conditions", &ParseConditions, ParseError::kInvalidConditions},
    {"fixtures", &ParseFixtures, ParseError::kMissingSection},
    {"version", &ParseVersion, ParseError::kMissingSection},
    {"tag", &ParseTag, ParseError::kMissingSection},
};

inline const SectionEntry* FindSection(const std::string& name) {
  for (const SectionEntry& e : kSectionTable) {
    if (name == e.name) return &e;
  }
  return nullptr;
}

}  // namespace detail

// ============================================================================
// Entry points
// ============================================================================

/**
 * @brief Build a TestCase from case text.
 * @param filename   Absolute path, becomes the case identity.
 * @param cases_root Used to guess the component; may be empty.
 */
inline expected<TestCase, ParseFailure> ParseCase(const std::string& text,
                                                  const std::string& filename,
                                                  const std::string& cases_root) {
  using Result = expected<TestCase, ParseFailure>;
  TestCase tc;
  tc.filename = filename;
  tc.component = GuessComponent(filename, cases_root);

  bool has_summary = false;
  bool has_steps = false;
  for (const auto& section : SplitSections(text)) {
    const detail::SectionEntry* entry = detail::FindSection(section.first);
    if (entry == nullptr) {
      ITEST_LOG_DEBUG("parser", "%s: ignoring section '%s'", filename.c_str(),
                      section.first.c_str());
      continue;
    }
    std::string error;
    if (!entry->handler(section.second, tc, error)) {
      return Result::error(ParseFailure{entry->error, filename + ": " + error});
    }
    if (section.first == "summary") has_summary = true;
    if (section.first == "steps") has_steps = true;
  }

  if (!has_summary || !has_steps) {
    return Result::error(ParseFailure{
        ParseError::kMissingSection,
        filename + ": \"" + (has_summary ? "steps" : "summary") +
            "\" section is required"});
  }
  return Result::success(std::move(tc));
}

/// @brief Read and parse the case file at @p path (already absolute).
inline expected<TestCase, ParseFailure> ParseCaseFile(const std::string& path,
                                                      const std::string& cases_root) {
  auto text = ConfigStore::ReadFile(path.c_str());
  if (!text.has_value()) {
    return expected<TestCase, ParseFailure>::error(
        ParseFailure{ParseError::kFileNotFound, "cannot read " + path});
  }
  return ParseCase(text.value(), path, cases_root);
}

}  // namespace itest

#endif  // ITEST_CASE_PARSER_HPP_
