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
 * @file log.hpp
 * @brief Synchronous printf-style diagnostic logging.
 *
 * Writes "[YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [category] message" lines to
 * stderr. The runtime level gate is SetLevel(); ITEST_LOG_MIN_LEVEL removes
 * lower-severity calls at compile time.
 *
 * This is the tool's own log. The per-case run log written next to the
 * generated scripts lives in run_log.hpp.
 */

#ifndef ITEST_LOG_HPP_
#define ITEST_LOG_HPP_

#include "itest/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

#include <strings.h>
#include <time.h>

/// Compile-time floor: 0=debug 1=info 2=warn 3=error 4=fatal.
#ifndef ITEST_LOG_MIN_LEVEL
#define ITEST_LOG_MIN_LEVEL 0
#endif

namespace itest {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo: return "INFO";
    case Level::kWarn: return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default: return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, ts.tv_nsec / 1000000L);
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

inline void Init() noexcept { detail::InitializedRef().store(true); }

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false);
}

inline bool IsInitialized() noexcept { return detail::InitializedRef().load(); }

/**
 * @brief Map a level name ("debug", "INFO", "off", ...) to a Level.
 * @return @p fallback when the name is not recognized.
 */
inline Level ParseLevel(const char* name, Level fallback) noexcept {
  if (name == nullptr) return fallback;
  static const char* const kNames[] = {"debug", "info", "warn",
                                       "error", "fatal", "off"};
  for (uint8_t i = 0; i < 6U; ++i) {
    if (strcasecmp(name, kNames[i]) == 0) return static_cast<Level>(i);
  }
  return fallback;
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace itest

// ============================================================================
// Macros
// ============================================================================

#define ITEST_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                   \
    if (ITEST_LOG_MIN_LEVEL <= 0) {                                      \
      ::itest::log::LogWrite(::itest::log::Level::kDebug, cat, __FILE__, \
                             __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                    \
  } while (0)

#define ITEST_LOG_INFO(cat, fmt, ...)                                   \
  do {                                                                  \
    if (ITEST_LOG_MIN_LEVEL <= 1) {                                     \
      ::itest::log::LogWrite(::itest::log::Level::kInfo, cat, __FILE__, \
                             __LINE__, fmt, ##__VA_ARGS__);             \
    }                                                                   \
  } while (0)

#define ITEST_LOG_WARN(cat, fmt, ...)                                   \
  do {                                                                  \
    if (ITEST_LOG_MIN_LEVEL <= 2) {                                     \
      ::itest::log::LogWrite(::itest::log::Level::kWarn, cat, __FILE__, \
                             __LINE__, fmt, ##__VA_ARGS__);             \
    }                                                                   \
  } while (0)

#define ITEST_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                   \
    if (ITEST_LOG_MIN_LEVEL <= 3) {                                      \
      ::itest::log::LogWrite(::itest::log::Level::kError, cat, __FILE__, \
                             __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                    \
  } while (0)

#endif  // ITEST_LOG_HPP_
