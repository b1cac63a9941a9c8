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
 * @file platform.hpp
 * @brief Platform detection, compiler hints, clock helpers and assertion
 *        macros.
 */

#ifndef ITEST_PLATFORM_HPP_
#define ITEST_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <time.h>

namespace itest {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define ITEST_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define ITEST_PLATFORM_MACOS 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define ITEST_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define ITEST_UNLIKELY(x) (x)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "ITEST_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define ITEST_ASSERT(cond) ((void)0)
#else
#define ITEST_ASSERT(cond) \
  (ITEST_UNLIKELY(!(cond)) ? ::itest::detail::AssertFail(#cond, __FILE__, __LINE__) \
                           : ((void)0))
#endif

// ============================================================================
// Clock Helpers
// ============================================================================

/// @brief Monotonic time in microseconds (CLOCK_MONOTONIC).
inline uint64_t SteadyNowUs() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1000000ULL +
         static_cast<uint64_t>(ts.tv_nsec) / 1000ULL;
}

/// @brief Monotonic time in milliseconds.
inline uint64_t SteadyNowMs() noexcept { return SteadyNowUs() / 1000ULL; }

/// @brief Sleep for @p ms milliseconds (nanosleep, not deprecated usleep).
inline void SleepMs(uint32_t ms) noexcept {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  nanosleep(&ts, nullptr);
}

/**
 * @brief Format local wall-clock time as "YYYY-MM-DD HH:MM:SS".
 * @param buf Destination buffer (at least 20 bytes).
 * @param bufsz Size of @p buf.
 */
inline void FormatNow(char* buf, size_t bufsz) noexcept {
  time_t t = time(nullptr);
  struct tm tm_local;
  localtime_r(&t, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec);
}

// ============================================================================
// Macro Helpers
// ============================================================================

#define ITEST_CONCAT_IMPL(a, b) a##b
#define ITEST_CONCAT(a, b) ITEST_CONCAT_IMPL(a, b)

}  // namespace itest

#endif  // ITEST_PLATFORM_HPP_
