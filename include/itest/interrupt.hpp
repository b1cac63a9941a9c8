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
 * @file interrupt.hpp
 * @brief Operator-cancellation monitor (SIGINT / SIGTERM).
 *
 * The signal handler sets an atomic flag and writes one byte into a
 * self-pipe. The pipe is never drained, so once an interrupt arrived the
 * read end stays readable and every later poll(2) in the automaton wakes
 * immediately: cancellation is session wide, not per phase.
 *
 * Only one InterruptMonitor may exist per process. Previous signal
 * dispositions are restored on destruction.
 *
 * Usage:
 * @code
 *   itest::InterruptMonitor monitor;
 *   monitor.InstallSignalHandlers();
 *   // pass &monitor to CaseRunner / Pcall
 * @endcode
 */

#ifndef ITEST_INTERRUPT_HPP_
#define ITEST_INTERRUPT_HPP_

#include "itest/platform.hpp"
#include "itest/vocabulary.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <unistd.h>

namespace itest {

class InterruptMonitor;

namespace detail {

inline InterruptMonitor*& GetInterruptInstance() {
  static InterruptMonitor* ptr = nullptr;
  return ptr;
}

}  // namespace detail

class InterruptMonitor final {
 public:
  InterruptMonitor() noexcept : interrupted_(false), installed_(false), valid_(false) {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;

    if (detail::GetInterruptInstance() != nullptr) {
      return;
    }
    detail::GetInterruptInstance() = this;

    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    for (int fd : pipe_fd_) {
      int flags = ::fcntl(fd, F_GETFL, 0);
      if (flags >= 0) (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
      (void)::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
    valid_ = true;
  }

  ~InterruptMonitor() {
    if (installed_) {
      (void)::sigaction(SIGINT, &old_int_, nullptr);
      (void)::sigaction(SIGTERM, &old_term_, nullptr);
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
    if (detail::GetInterruptInstance() == this) {
      detail::GetInterruptInstance() = nullptr;
    }
  }

  InterruptMonitor(const InterruptMonitor&) = delete;
  InterruptMonitor& operator=(const InterruptMonitor&) = delete;
  InterruptMonitor(InterruptMonitor&&) = delete;
  InterruptMonitor& operator=(InterruptMonitor&&) = delete;

  /// @brief False for a second instance or when the pipe could not be made.
  bool IsValid() const noexcept { return valid_; }

  /**
   * @brief Route SIGINT and SIGTERM to this monitor via sigaction(2).
   * @return success, or kAlreadyInstantiated / kSignalInstallFailed.
   */
  expected<void, InterruptError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, InterruptError>::error(
          InterruptError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &InterruptMonitor::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (::sigaction(SIGINT, &sa, &old_int_) != 0) {
      return expected<void, InterruptError>::error(
          InterruptError::kSignalInstallFailed);
    }
    if (::sigaction(SIGTERM, &sa, &old_term_) != 0) {
      (void)::sigaction(SIGINT, &old_int_, nullptr);
      return expected<void, InterruptError>::error(
          InterruptError::kSignalInstallFailed);
    }
    installed_ = true;
    return expected<void, InterruptError>::success();
  }

  /// @brief Raise the interrupt by hand (tests, embedding drivers).
  void Trigger(int signo = 0) noexcept { Mark(signo); }

  bool IsInterrupted() const noexcept {
    return interrupted_.load(std::memory_order_acquire);
  }

  /// @brief Signal number of the interrupt, 0 for Trigger() or none.
  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

  /// @brief Read end of the self-pipe, readable once interrupted (-1 if invalid).
  int WaitFd() const noexcept { return pipe_fd_[0]; }

 private:
  static void SignalHandler(int signo) {
    InterruptMonitor* self = detail::GetInterruptInstance();
    if (self != nullptr) self->Mark(signo);
  }

  // Async-signal-safe: atomic stores and write(2) only.
  void Mark(int signo) noexcept {
    bool expected_val = false;
    if (interrupted_.compare_exchange_strong(expected_val, true,
                                             std::memory_order_acq_rel)) {
      signo_.store(signo, std::memory_order_relaxed);
      if (pipe_fd_[1] >= 0) {
        const uint8_t byte = 1;
        (void)::write(pipe_fd_[1], &byte, 1);
      }
    }
  }

  std::atomic<bool> interrupted_;
  std::atomic<int> signo_{0};
  int pipe_fd_[2];
  struct sigaction old_int_ {};
  struct sigaction old_term_ {};
  bool installed_;
  bool valid_;
};

}  // namespace itest

#endif  // ITEST_INTERRUPT_HPP_
