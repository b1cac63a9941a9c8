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
 * @file run_log.hpp
 * @brief Per-case run log and its escape-sequence post-processor.
 *
 * The run log lives at <rundir>/.meta/log. It receives the raw pty output
 * of every phase plus lifecycle markers of the form
 * "<YYYY-MM-DD HH:MM:SS> [itest] <message>". With a tee stream (verbose
 * runs) every write is duplicated there as well.
 *
 * After the run the log is cleaned in place: color (ESC [ digits m) and
 * erase-in-line (ESC [ digits K) sequences are removed.
 */

#ifndef ITEST_RUN_LOG_HPP_
#define ITEST_RUN_LOG_HPP_

#include "itest/expect.hpp"
#include "itest/log.hpp"
#include "itest/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

namespace itest {

class RunLog final {
 public:
  RunLog() : file_(nullptr), tee_(nullptr) {}
  ~RunLog() { Close(); }

  RunLog(const RunLog&) = delete;
  RunLog& operator=(const RunLog&) = delete;

  /**
   * @brief Open @p path for appending.
   * @param tee Optional second stream receiving a copy of every write.
   */
  bool Open(const std::string& path, FILE* tee = nullptr) {
    Close();
    file_ = std::fopen(path.c_str(), "a");
    if (file_ == nullptr) {
      ITEST_LOG_ERROR("runlog", "cannot open %s: %s", path.c_str(),
                      std::strerror(errno));
      return false;
    }
    path_ = path;
    tee_ = tee;
    return true;
  }

  void Close() {
    if (file_ != nullptr) {
      (void)std::fclose(file_);
      file_ = nullptr;
    }
    tee_ = nullptr;
  }

  bool IsOpen() const { return file_ != nullptr; }
  const std::string& Path() const { return path_; }

  void Write(const char* data, size_t len) {
    if (file_ == nullptr) return;
    if (tee_ != nullptr) {
      (void)std::fwrite(data, 1, len, tee_);
      (void)std::fflush(tee_);
    }
    (void)std::fwrite(data, 1, len, file_);
    (void)std::fflush(file_);
  }

  /// @brief Append a timestamped "[itest]" marker line.
  void Line(const std::string& msg) {
    char ts[32];
    FormatNow(ts, sizeof(ts));
    std::string line = ts;
    line += " [itest] ";
    line += msg;
    line += '\n';
    Write(line.data(), line.size());
  }

  /// @brief Sink that appends child output to this log.
  OutputSink AsSink() {
    OutputSink sink;
    sink.fn = &RunLog::SinkThunk;
    sink.ctx = this;
    return sink;
  }

 private:
  static void SinkThunk(const char* data, size_t len, void* ctx) {
    static_cast<RunLog*>(ctx)->Write(data, len);
  }

  FILE* file_;
  FILE* tee_;
  std::string path_;
};

// ============================================================================
// Log post-processing
// ============================================================================

/**
 * @brief Remove "ESC [ <digits> m" and "ESC [ <digits> K" sequences.
 *
 * Other escape sequences are left untouched.
 */
inline std::string StripEscapeSequences(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '\x1b' && i + 1U < text.size() && text[i + 1U] == '[') {
      size_t j = i + 2U;
      while (j < text.size() && text[j] >= '0' && text[j] <= '9') ++j;
      if (j < text.size() && (text[j] == 'm' || text[j] == 'K')) {
        i = j + 1U;
        continue;
      }
    }
    out += text[i];
    ++i;
  }
  return out;
}

/**
 * @brief Rewrite @p path with escape sequences stripped.
 * @return false if the file cannot be read or written.
 */
inline bool StripEscapeSequencesInFile(const std::string& path) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (f == nullptr) return false;
  std::string data;
  char buf[8192];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) data.append(buf, n);
  (void)std::fclose(f);

  std::string cleaned = StripEscapeSequences(data);
  if (cleaned.size() == data.size()) return true;

  f = std::fopen(path.c_str(), "wb");
  if (f == nullptr) return false;
  bool ok = std::fwrite(cleaned.data(), 1, cleaned.size(), f) == cleaned.size();
  ok = (std::fclose(f) == 0) && ok;
  if (!ok) {
    ITEST_LOG_WARN("runlog", "cannot rewrite %s: %s", path.c_str(),
                   std::strerror(errno));
  }
  return ok;
}

}  // namespace itest

#endif  // ITEST_RUN_LOG_HPP_
