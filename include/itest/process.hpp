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
 * @file process.hpp
 * @brief Child process attached to a pseudo-terminal.
 *
 * Header-only, Linux. forkpty(3) gives the child a new session whose
 * controlling terminal is the pty slave, so programs that insist on a tty
 * for password prompts (sudo, su, ssh) talk to us. The parent keeps the
 * non-blocking master end.
 *
 * Features:
 *   - PtyProcess::Start: forkpty + execvp, exec failure reported to parent
 *     through a close-on-exec pipe
 *   - Read / WriteAll on the master end
 *   - Wait with optional timeout, Kill of the whole process group
 *   - RAII: destructor closes the master and kills a live child
 */

#ifndef ITEST_PROCESS_HPP_
#define ITEST_PROCESS_HPP_

#include "itest/platform.hpp"

#if defined(ITEST_PLATFORM_LINUX)

#include <cerrno>
#include <cstdint>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

namespace itest {

// ============================================================================
// ProcessResult
// ============================================================================

enum class ProcessResult : int8_t {
  kSuccess = 0,
  kFailed = -1,     ///< fork/pty/exec failed
  kWaitError = -2,  ///< waitpid(2) error
};

/// @brief Check if a process exists and can receive signals.
inline bool IsProcessAlive(pid_t pid) { return kill(pid, 0) == 0; }

// ============================================================================
// WaitResult
// ============================================================================

struct WaitResult {
  bool exited;      ///< true if child exited normally
  int exit_code;    ///< valid if exited
  bool signaled;    ///< true if child was killed by a signal
  int term_signal;  ///< valid if signaled
  bool timed_out;   ///< true if Wait() gave up

  WaitResult()
      : exited(false), exit_code(-1), signaled(false), term_signal(0),
        timed_out(false) {}

  /// @brief Shell-style status: exit code, or 128 + signal number.
  int ExitStatus() const noexcept {
    if (exited) return exit_code;
    if (signaled) return 128 + term_signal;
    return -1;
  }
};

namespace detail {

inline void FillWaitResult(int status, WaitResult& wr) {
  if (WIFEXITED(status)) {
    wr.exited = true;
    wr.exit_code = WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    wr.signaled = true;
    wr.term_signal = WTERMSIG(status);
  }
}

inline bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

}  // namespace detail

// ============================================================================
// PtyProcess
// ============================================================================

struct PtyConfig {
  const char* const* argv;  ///< NULL-terminated, argv[0] looked up in PATH
  const char* working_dir;  ///< chdir before exec (nullptr = inherit)
  uint16_t rows;
  uint16_t cols;

  PtyConfig() : argv(nullptr), working_dir(nullptr), rows(24), cols(80) {}
};

/**
 * @brief Child process running on the slave side of a pseudo-terminal.
 *
 * Usage:
 * @code
 *   const char* argv[] = {"/bin/sh", "-c", "echo hi", nullptr};
 *   itest::PtyConfig cfg;
 *   cfg.argv = argv;
 *   itest::PtyProcess proc;
 *   if (proc.Start(cfg) == itest::ProcessResult::kSuccess) {
 *     char buf[256];
 *     ssize_t n = proc.Read(buf, sizeof(buf));
 *     int status = proc.Wait().ExitStatus();
 *   }
 * @endcode
 */
class PtyProcess {
 public:
  static constexpr ssize_t kReadEof = 0;
  static constexpr ssize_t kReadWouldBlock = -1;
  static constexpr ssize_t kReadError = -2;

  PtyProcess() : pid_(-1), master_fd_(-1), spawn_errno_(0) {}

  ~PtyProcess() {
    CloseMaster();
    if (pid_ > 0) (void)Kill();
  }

  PtyProcess(const PtyProcess&) = delete;
  PtyProcess& operator=(const PtyProcess&) = delete;

  PtyProcess(PtyProcess&& other) noexcept
      : pid_(other.pid_), master_fd_(other.master_fd_),
        spawn_errno_(other.spawn_errno_) {
    other.pid_ = -1;
    other.master_fd_ = -1;
  }

  /**
   * @brief Fork a child on a new pty and exec @p cfg.argv.
   * @return kSuccess, or kFailed (see SpawnErrno()).
   */
  ProcessResult Start(const PtyConfig& cfg) {
    if (cfg.argv == nullptr || cfg.argv[0] == nullptr || pid_ > 0) {
      spawn_errno_ = EINVAL;
      return ProcessResult::kFailed;
    }

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
      spawn_errno_ = errno;
      return ProcessResult::kFailed;
    }

    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_row = cfg.rows;
    ws.ws_col = cfg.cols;

    int master = -1;
    pid_t child = forkpty(&master, nullptr, nullptr, &ws);
    if (child < 0) {
      spawn_errno_ = errno;
      close(err_pipe[0]);
      close(err_pipe[1]);
      return ProcessResult::kFailed;
    }

    if (child == 0) {
      // -- Child: session leader with the pty slave as stdin/out/err --
      close(err_pipe[0]);
      struct sigaction sa_dfl;
      std::memset(&sa_dfl, 0, sizeof(sa_dfl));
      sa_dfl.sa_handler = SIG_DFL;
      for (int sig = 1; sig < 32; ++sig) {
        sigaction(sig, &sa_dfl, nullptr);
      }
      sigset_t none;
      sigemptyset(&none);
      sigprocmask(SIG_SETMASK, &none, nullptr);

      if (cfg.working_dir != nullptr && chdir(cfg.working_dir) != 0) {
        int e = errno;
        (void)!write(err_pipe[1], &e, sizeof(e));
        _exit(127);
      }
      execvp(cfg.argv[0], const_cast<char* const*>(cfg.argv));
      int e = errno;
      (void)!write(err_pipe[1], &e, sizeof(e));
      _exit(127);
    }

    // -- Parent --
    close(err_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
      n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    pid_ = child;
    master_fd_ = master;
    if (n > 0) {
      // exec never happened; reap the child and report the reason
      spawn_errno_ = child_errno;
      (void)Wait();
      CloseMaster();
      return ProcessResult::kFailed;
    }

    (void)fcntl(master_fd_, F_SETFD, FD_CLOEXEC);
    detail::SetNonBlocking(master_fd_);
    return ProcessResult::kSuccess;
  }

  /**
   * @brief Non-blocking read from the master end.
   * @return Bytes read, kReadEof once the slave side is gone (EIO on Linux),
   *         kReadWouldBlock if nothing is pending, kReadError otherwise.
   */
  ssize_t Read(char* buf, size_t size) {
    if (master_fd_ < 0) return kReadEof;
    for (;;) {
      ssize_t n = read(master_fd_, buf, size);
      if (n > 0) return n;
      if (n == 0) return kReadEof;
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return kReadWouldBlock;
      if (errno == EIO) return kReadEof;
      return kReadError;
    }
  }

  /**
   * @brief Write all of @p data to the child's terminal input.
   * @return false on error or if the terminal stays full for 5 seconds.
   */
  bool WriteAll(const char* data, size_t len) {
    constexpr int kWritableWaitMs = 5000;
    size_t off = 0;
    while (off < len) {
      if (master_fd_ < 0) return false;
      ssize_t n = write(master_fd_, data + off, len - off);
      if (n > 0) {
        off += static_cast<size_t>(n);
        continue;
      }
      if (n < 0 && errno == EINTR) continue;
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        struct pollfd pfd;
        pfd.fd = master_fd_;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        if (poll(&pfd, 1, kWritableWaitMs) <= 0) return false;
        continue;
      }
      return false;
    }
    return true;
  }

  /**
   * @brief Wait for the child to exit.
   * @param timeout_ms 0 waits forever.
   */
  WaitResult Wait(uint32_t timeout_ms = 0) {
    WaitResult wr;
    if (pid_ <= 0) {
      wr.exited = true;
      wr.exit_code = -1;
      return wr;
    }

    if (timeout_ms == 0) {
      int status;
      pid_t w;
      do {
        w = waitpid(pid_, &status, 0);
      } while (w < 0 && errno == EINTR);
      if (w > 0) {
        detail::FillWaitResult(status, wr);
        pid_ = -1;
      }
      return wr;
    }

    uint32_t elapsed = 0;
    constexpr uint32_t kPollIntervalMs = 5;
    while (elapsed < timeout_ms) {
      int status;
      pid_t w = waitpid(pid_, &status, WNOHANG);
      if (w > 0) {
        detail::FillWaitResult(status, wr);
        pid_ = -1;
        return wr;
      }
      if (w < 0 && errno != EINTR) break;
      SleepMs(kPollIntervalMs);
      elapsed += kPollIntervalMs;
    }

    wr.timed_out = true;
    return wr;
  }

  /**
   * @brief SIGKILL the child's process group (it is a session leader) and
   *        reap the child.
   */
  WaitResult Kill() {
    if (pid_ <= 0) return WaitResult();
    if (kill(-pid_, SIGKILL) != 0) {
      (void)kill(pid_, SIGKILL);
    }
    return Wait();
  }

  /// @brief Close the master end; the child sees a hangup.
  void CloseMaster() {
    if (master_fd_ >= 0) {
      close(master_fd_);
      master_fd_ = -1;
    }
  }

  pid_t GetPid() const { return pid_; }
  int MasterFd() const { return master_fd_; }
  bool IsRunning() const { return pid_ > 0 && IsProcessAlive(pid_); }

  /// @brief errno of the last failed Start().
  int SpawnErrno() const { return spawn_errno_; }

 private:
  pid_t pid_;
  int master_fd_;
  int spawn_errno_;
};

}  // namespace itest

#endif  // defined(ITEST_PLATFORM_LINUX)

#endif  // ITEST_PROCESS_HPP_
