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
 * @file result.hpp
 * @brief Run outcomes, the result sink interface and a text reporter.
 */

#ifndef ITEST_RESULT_HPP_
#define ITEST_RESULT_HPP_

#include "itest/platform.hpp"
#include "itest/test_case.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace itest {

enum class OutcomeKind : uint8_t { kSuccess = 0, kFailure, kSkipped, kException };

inline const char* OutcomeName(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::kSuccess:   return "success";
    case OutcomeKind::kFailure:   return "failure";
    case OutcomeKind::kSkipped:   return "skipped";
    case OutcomeKind::kException: return "exception";
  }
  return "unknown";
}

/// @brief Terminal classification of one run. @p reason is the skip reason
///        or the exception text, empty otherwise. Unclassified runs count
///        as exceptions.
struct RunOutcome {
  OutcomeKind kind = OutcomeKind::kException;
  std::string reason;
};

/**
 * @brief Receives the lifecycle of every run.
 *
 * Each run calls TestStart() once, then exactly one Add*() method, then
 * TestStop() once.
 */
class ResultSink {
 public:
  virtual ~ResultSink() = default;

  virtual void TestStart(const TestCase& tc) = 0;
  virtual void TestStop(const TestCase& tc) = 0;
  virtual void AddSuccess(const TestCase& tc) = 0;
  virtual void AddFailure(const TestCase& tc) = 0;
  virtual void AddSkipped(const TestCase& tc, const std::string& reason) = 0;
  virtual void AddException(const TestCase& tc, const std::string& error) = 0;
};

// ============================================================================
// TextResult
// ============================================================================

/**
 * @brief Prints one line per case and a closing summary.
 *
 * verbosity 0 prints nothing per case, 1 a single status character, 2 and
 * above a full line with the case path.
 */
class TextResult final : public ResultSink {
 public:
  explicit TextResult(FILE* stream = stdout, int verbosity = 1)
      : stream_(stream), verbosity_(verbosity) {}

  void TestStart(const TestCase& tc) override {
    ++tests_run_;
    start_ms_ = SteadyNowMs();
    if (verbosity_ > 1) std::fprintf(stream_, "%s ... ", tc.filename.c_str());
  }

  void TestStop(const TestCase& /*tc*/) override {
    total_ms_ += SteadyNowMs() - start_ms_;
    (void)std::fflush(stream_);
  }

  void AddSuccess(const TestCase& /*tc*/) override {
    ++successes_;
    Report('.', "ok");
  }

  void AddFailure(const TestCase& tc) override {
    failures_.push_back(Entry{tc.filename, tc.run.logname, std::string()});
    Report('F', "FAIL");
  }

  void AddSkipped(const TestCase& tc, const std::string& reason) override {
    skipped_.push_back(Entry{tc.filename, std::string(), reason});
    if (verbosity_ > 1) {
      std::fprintf(stream_, "skipped '%s'\n", reason.c_str());
    } else if (verbosity_ == 1) {
      std::fputc('s', stream_);
    }
  }

  void AddException(const TestCase& tc, const std::string& error) override {
    errors_.push_back(Entry{tc.filename, tc.run.logname, error});
    Report('E', "ERROR");
  }

  /// @brief Print the failed/errored cases and the totals.
  void PrintSummary() const {
    if (verbosity_ == 1) std::fputc('\n', stream_);
    for (const Entry& e : errors_) {
      std::fprintf(stream_, "ERROR: %s\n  %s\n", e.filename.c_str(),
                   e.detail.c_str());
      if (!e.logname.empty()) std::fprintf(stream_, "  log: %s\n", e.logname.c_str());
    }
    for (const Entry& e : failures_) {
      std::fprintf(stream_, "FAIL: %s\n", e.filename.c_str());
      if (!e.logname.empty()) std::fprintf(stream_, "  log: %s\n", e.logname.c_str());
    }
    std::fprintf(stream_, "Ran %u tests in %.3fs\n", tests_run_,
                 static_cast<double>(total_ms_) / 1000.0);
    if (WasSuccessful()) {
      std::fprintf(stream_, "OK");
    } else {
      std::fprintf(stream_, "FAILED (failures=%zu, errors=%zu",
                   failures_.size(), errors_.size());
    }
    if (!skipped_.empty()) {
      std::fprintf(stream_, "%sskipped=%zu", WasSuccessful() ? " (" : ", ",
                   skipped_.size());
    }
    if (!WasSuccessful() || !skipped_.empty()) std::fputc(')', stream_);
    std::fputc('\n', stream_);
    (void)std::fflush(stream_);
  }

  bool WasSuccessful() const { return failures_.empty() && errors_.empty(); }

  uint32_t TestsRun() const { return tests_run_; }
  uint32_t Successes() const { return successes_; }
  size_t Failures() const { return failures_.size(); }
  size_t Errors() const { return errors_.size(); }
  size_t Skipped() const { return skipped_.size(); }

 private:
  struct Entry {
    std::string filename;
    std::string logname;
    std::string detail;
  };

  void Report(char brief, const char* word) {
    if (verbosity_ > 1) {
      std::fprintf(stream_, "%s\n", word);
    } else if (verbosity_ == 1) {
      std::fputc(brief, stream_);
    }
  }

  FILE* stream_;
  int verbosity_;
  uint32_t tests_run_ = 0;
  uint32_t successes_ = 0;
  uint64_t start_ms_ = 0;
  uint64_t total_ms_ = 0;
  std::vector<Entry> failures_;
  std::vector<Entry> errors_;
  std::vector<Entry> skipped_;
};

}  // namespace itest

#endif  // ITEST_RESULT_HPP_
