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
 * @file expect.hpp
 * @brief Interactive process automaton: spawn on a pty, match prompts,
 *        answer them, enforce an absolute and an idle deadline.
 *
 * Pcall() runs one command to completion:
 *
 *   1. read child output until end-of-stream, a read timeout, or a rule
 *      match (earliest match in the buffer wins, ties go to the earlier
 *      rule);
 *   2. end-of-stream ends the loop and the exit status is returned;
 *   3. a read timeout becomes kAbsoluteTimeout if the absolute deadline has
 *      elapsed, kIdleTimeout ("hanging") otherwise;
 *   4. a rule match writes the rule's response plus "\n" to the child;
 *   5. with an idle deadline a catch-all newline token is matched last, so
 *      every output line restarts the idle clock without answering.
 *
 * Per-read timeout: the idle value when idle detection is on, otherwise the
 * absolute value. It is always clamped to what is left of the absolute
 * deadline, which is re-checked on every iteration.
 *
 * On every exit path the pty is closed and a live child is killed.
 */

#ifndef ITEST_EXPECT_HPP_
#define ITEST_EXPECT_HPP_

#include "itest/interrupt.hpp"
#include "itest/log.hpp"
#include "itest/platform.hpp"
#include "itest/process.hpp"
#include "itest/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <regex>
#include <string>
#include <vector>

#include <poll.h>

namespace itest {

// ============================================================================
// Types
// ============================================================================

/// @brief One prompt/answer pair. @p pattern is an ECMAScript regex.
struct ExpectRule {
  std::string pattern;
  std::string response;
};

/// @brief Why Pcall() did not return an exit status.
struct ExpectFailure {
  ExpectError code;
  std::string message;
};

/// @brief Receives every byte read from the child.
using OutputFn = void (*)(const char* data, size_t len, void* ctx);

struct OutputSink {
  OutputFn fn = nullptr;
  void* ctx = nullptr;

  void Write(const char* data, size_t len) const {
    if (fn != nullptr) fn(data, len, ctx);
  }
};

/// @brief OutputSink writing to a stdio stream (ctx is the FILE*).
inline void StreamOutput(const char* data, size_t len, void* ctx) {
  FILE* f = static_cast<FILE*>(ctx);
  (void)std::fwrite(data, 1, len, f);
  (void)std::fflush(f);
}

struct PcallOptions {
  uint32_t absolute_timeout_ms = 0;   ///< whole run ceiling, 0 = none
  uint32_t idle_timeout_ms = 0;       ///< max silence, 0 = disabled
  const char* working_dir = nullptr;  ///< nullptr = inherit
  const InterruptMonitor* interrupt = nullptr;
};

namespace detail {

/// Bytes of unmatched output kept for pattern search.
static constexpr size_t kExpectSearchWindow = 8192U;

/// Grace period for the child to be reaped after end-of-stream.
static constexpr uint32_t kExitGraceMs = 1000U;

enum class ExpectEvent : uint8_t { kEof, kTimeout, kMatch, kCancelled, kIoError };

class ExpectSession {
 public:
  ExpectSession(PtyProcess& proc, const std::vector<std::regex>& patterns,
                const OutputSink& output, const InterruptMonitor* interrupt)
      : proc_(proc), patterns_(patterns), output_(output),
        interrupt_(interrupt) {}

  /**
   * @brief Wait until a pattern matches, end-of-stream, or @p deadline_ms
   *        (monotonic, 0 = none).
   * @param[out] index Matched pattern index on kMatch.
   */
  ExpectEvent Expect(uint64_t deadline_ms, size_t& index) {
    if (Search(index)) return ExpectEvent::kMatch;

    char chunk[4096];
    for (;;) {
      int wait_ms = -1;
      if (deadline_ms != 0) {
        uint64_t now = SteadyNowMs();
        if (now >= deadline_ms) return ExpectEvent::kTimeout;
        wait_ms = static_cast<int>(deadline_ms - now);
      }

      struct pollfd fds[2];
      fds[0].fd = proc_.MasterFd();
      fds[0].events = POLLIN;
      fds[0].revents = 0;
      nfds_t nfds = 1;
      if (interrupt_ != nullptr && interrupt_->WaitFd() >= 0) {
        fds[1].fd = interrupt_->WaitFd();
        fds[1].events = POLLIN;
        fds[1].revents = 0;
        nfds = 2;
      }

      int rc = poll(fds, nfds, wait_ms);
      if (rc < 0) {
        if (errno == EINTR) {
          if (interrupt_ != nullptr && interrupt_->IsInterrupted())
            return ExpectEvent::kCancelled;
          continue;
        }
        return ExpectEvent::kIoError;
      }
      if (rc == 0) return ExpectEvent::kTimeout;
      if (nfds == 2 && (fds[1].revents & POLLIN) != 0) {
        return ExpectEvent::kCancelled;
      }
      if (fds[0].revents == 0) continue;

      ssize_t n = proc_.Read(chunk, sizeof(chunk));
      if (n == PtyProcess::kReadWouldBlock) continue;
      if (n == PtyProcess::kReadEof) return ExpectEvent::kEof;
      if (n == PtyProcess::kReadError) return ExpectEvent::kIoError;

      output_.Write(chunk, static_cast<size_t>(n));
      buffer_.append(chunk, static_cast<size_t>(n));
      if (Search(index)) return ExpectEvent::kMatch;
      if (buffer_.size() > kExpectSearchWindow) {
        buffer_.erase(0, buffer_.size() - kExpectSearchWindow);
      }
    }
  }

 private:
  // Earliest match in the buffer; consumes the buffer through its end.
  bool Search(size_t& index) {
    if (buffer_.empty()) return false;
    bool found = false;
    size_t best_pos = 0;
    size_t best_end = 0;
    std::smatch m;
    for (size_t i = 0; i < patterns_.size(); ++i) {
      if (!std::regex_search(buffer_, m, patterns_[i])) continue;
      size_t pos = static_cast<size_t>(m.position(0));
      if (!found || pos < best_pos) {
        found = true;
        best_pos = pos;
        best_end = pos + static_cast<size_t>(m.length(0));
        index = i;
      }
    }
    if (found) buffer_.erase(0, best_end);
    return found;
  }

  PtyProcess& proc_;
  const std::vector<std::regex>& patterns_;
  const OutputSink& output_;
  const InterruptMonitor* interrupt_;
  std::string buffer_;
};

inline std::string CommandLine(const std::string& cmd,
                               const std::vector<std::string>& args) {
  std::string line = cmd;
  line += ' ';
  for (size_t i = 0; i < args.size(); ++i) {
    if (i != 0) line += ' ';
    line += args[i];
  }
  return line;
}

inline std::string FormatSeconds(uint32_t ms) {
  char buf[32];
  (void)std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(ms) / 1000.0);
  return buf;
}

}  // namespace detail

// ============================================================================
// Pcall
// ============================================================================

/**
 * @brief Run @p cmd with @p args on a pty, answering prompts from @p rules.
 *
 * @return The child's exit status (128 + signal if it was killed by one),
 *         or an ExpectFailure for spawn/io errors, bad patterns, timeouts
 *         and operator interrupts. Timeouts never yield a status.
 */
inline expected<int, ExpectFailure> Pcall(const std::string& cmd,
                                          const std::vector<std::string>& args,
                                          const std::vector<ExpectRule>& rules,
                                          const OutputSink& output,
                                          const PcallOptions& opts) {
  using Result = expected<int, ExpectFailure>;
  const std::string cmdline = detail::CommandLine(cmd, args);
  const bool idle_active = opts.idle_timeout_ms != 0U;

  std::vector<std::regex> patterns;
  patterns.reserve(rules.size() + 1U);
  for (const ExpectRule& rule : rules) {
    try {
      patterns.emplace_back(rule.pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      return Result::error(ExpectFailure{
          ExpectError::kBadPattern,
          "Invalid pattern '" + rule.pattern + "': " + e.what()});
    }
  }
  // Any line of output: only restarts the idle clock.
  const size_t any_line_index = patterns.size();
  if (idle_active) patterns.emplace_back("\r|\n", std::regex::ECMAScript);

  std::vector<const char*> argv;
  argv.reserve(args.size() + 2U);
  argv.push_back(cmd.c_str());
  for (const std::string& a : args) argv.push_back(a.c_str());
  argv.push_back(nullptr);

  PtyConfig cfg;
  cfg.argv = argv.data();
  cfg.working_dir = opts.working_dir;

  PtyProcess proc;
  if (proc.Start(cfg) != ProcessResult::kSuccess) {
    return Result::error(ExpectFailure{
        ExpectError::kSpawnFailed,
        "Cannot spawn " + cmdline + ": " + std::strerror(proc.SpawnErrno())});
  }
  ITEST_LOG_DEBUG("expect", "spawned pid %d: %s", static_cast<int>(proc.GetPid()),
                  cmdline.c_str());

  // Close the pty and kill the child on every path but the normal one.
  ScopeGuard cleanup([&proc]() {
    proc.CloseMaster();
    (void)proc.Kill();
  });

  const uint64_t start_ms = SteadyNowMs();
  const uint64_t absolute_deadline_ms =
      (opts.absolute_timeout_ms != 0U) ? start_ms + opts.absolute_timeout_ms : 0U;
  const uint32_t read_timeout_ms =
      idle_active ? opts.idle_timeout_ms : opts.absolute_timeout_ms;

  auto absolute_failure = [&]() {
    return Result::error(ExpectFailure{
        ExpectError::kAbsoluteTimeout,
        "Run out of time in " + detail::FormatSeconds(opts.absolute_timeout_ms) +
            " seconds!:" + cmdline});
  };

  detail::ExpectSession session(proc, patterns, output, opts.interrupt);
  for (;;) {
    const uint64_t now_ms = SteadyNowMs();
    if (absolute_deadline_ms != 0U && now_ms >= absolute_deadline_ms) {
      return absolute_failure();
    }

    uint64_t deadline_ms = (read_timeout_ms != 0U) ? now_ms + read_timeout_ms : 0U;
    if (absolute_deadline_ms != 0U &&
        (deadline_ms == 0U || absolute_deadline_ms < deadline_ms)) {
      deadline_ms = absolute_deadline_ms;
    }

    size_t index = 0;
    detail::ExpectEvent ev = session.Expect(deadline_ms, index);
    if (ev == detail::ExpectEvent::kEof) break;

    switch (ev) {
      case detail::ExpectEvent::kTimeout:
        if (absolute_deadline_ms != 0U && SteadyNowMs() >= absolute_deadline_ms) {
          return absolute_failure();
        }
        return Result::error(ExpectFailure{
            ExpectError::kIdleTimeout,
            "Hanging for " + detail::FormatSeconds(opts.idle_timeout_ms) +
                " seconds!:" + cmdline});
      case detail::ExpectEvent::kCancelled:
        return Result::error(
            ExpectFailure{ExpectError::kCancelled, "Interrupted:" + cmdline});
      case detail::ExpectEvent::kIoError:
        return Result::error(ExpectFailure{
            ExpectError::kIoError,
            std::string("Read error on pty: ") + std::strerror(errno)});
      default:
        break;
    }

    if (idle_active && index == any_line_index) continue;

    const std::string line = rules[index].response + "\n";
    if (!proc.WriteAll(line.data(), line.size())) {
      return Result::error(ExpectFailure{
          ExpectError::kIoError,
          std::string("Write error on pty: ") + std::strerror(errno)});
    }
  }

  cleanup.release();
  WaitResult wr = proc.Wait(detail::kExitGraceMs);
  if (wr.timed_out) {
    ITEST_LOG_WARN("expect", "pid %d still running after end of output, killing",
                   static_cast<int>(proc.GetPid()));
    wr = proc.Kill();
  }
  proc.CloseMaster();
  return Result::success(wr.ExitStatus());
}

}  // namespace itest

#endif  // ITEST_EXPECT_HPP_
