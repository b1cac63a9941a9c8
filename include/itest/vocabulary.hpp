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
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all itest modules.
 *
 * - expected<V, E>: value-or-error return type (no exceptions)
 * - optional<T>: nullable value
 * - ScopeGuard / ITEST_SCOPE_EXIT: run cleanup on every exit path
 * - Project-wide error enums
 */

#ifndef ITEST_VOCABULARY_HPP_
#define ITEST_VOCABULARY_HPP_

#include "itest/platform.hpp"

#include <cstdint>
#include <functional>
#include <new>
#include <type_traits>
#include <utility>

namespace itest {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

enum class InterruptError : uint8_t {
  kPipeCreationFailed = 0,
  kSignalInstallFailed,
  kAlreadyInstantiated,
};

enum class ExpectError : uint8_t {
  kSpawnFailed = 0,     ///< fork/pty/exec failure
  kIoError,             ///< read/write/poll failure on the pty
  kBadPattern,          ///< rule pattern is not a valid regular expression
  kAbsoluteTimeout,     ///< whole command ran longer than the absolute deadline
  kIdleTimeout,         ///< no output for longer than the idle deadline
  kCancelled,           ///< operator interrupt while waiting
};

enum class WorkspaceError : uint8_t {
  kCreateFailed = 0,
  kFixtureMissing,
  kCopyFailed,
};

enum class ScriptError : uint8_t {
  kWriteFailed = 0,
};

enum class ParseError : uint8_t {
  kFileNotFound = 0,
  kMissingSection,
  kInvalidQa,
  kInvalidIssue,
  kInvalidConditions,
};

enum class LoadError : uint8_t {
  kNotFound = 0,
  kParseFailed,
};

enum class RunError : uint8_t {
  kCancelled = 0,  ///< operator interrupt, the driver must stop scheduling
};

inline const char* ErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound: return "file not found";
    case ConfigError::kParseError: return "parse error";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kBufferFull: return "too many entries";
    case ConfigError::kInvalidValue: return "invalid value";
  }
  return "unknown";
}

inline const char* ErrorName(ExpectError e) noexcept {
  switch (e) {
    case ExpectError::kSpawnFailed: return "spawn failed";
    case ExpectError::kIoError: return "i/o error";
    case ExpectError::kBadPattern: return "bad pattern";
    case ExpectError::kAbsoluteTimeout: return "absolute deadline exceeded";
    case ExpectError::kIdleTimeout: return "idle deadline exceeded";
    case ExpectError::kCancelled: return "cancelled";
  }
  return "unknown";
}

inline const char* ErrorName(WorkspaceError e) noexcept {
  switch (e) {
    case WorkspaceError::kCreateFailed: return "cannot create run directory";
    case WorkspaceError::kFixtureMissing: return "fixture not found";
    case WorkspaceError::kCopyFailed: return "cannot copy fixture";
  }
  return "unknown";
}

inline const char* ErrorName(ParseError e) noexcept {
  switch (e) {
    case ParseError::kFileNotFound: return "file not found";
    case ParseError::kMissingSection: return "required section missing";
    case ParseError::kInvalidQa: return "invalid format of QA";
    case ParseError::kInvalidIssue: return "unrecognized issue number";
    case ParseError::kInvalidConditions: return "invalid conditions";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the success() / error() factories. Accessing the
 * wrong alternative is a programming error checked by ITEST_ASSERT.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(kValueTag, v); }
  static expected success(V&& v) {
    return expected(kValueTag, static_cast<V&&>(v));
  }
  static expected error(const E& e) { return expected(kErrorTag, e); }
  static expected error(E&& e) {
    return expected(kErrorTag, static_cast<E&&>(e));
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(other.storage_.value);
    } else {
      new (&storage_.err) E(other.storage_.err);
    }
  }

  expected(expected&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(static_cast<V&&>(other.storage_.value));
    } else {
      new (&storage_.err) E(static_cast<E&&>(other.storage_.err));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) V(other.storage_.value);
      } else {
        new (&storage_.err) E(other.storage_.err);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) V(static_cast<V&&>(other.storage_.value));
      } else {
        new (&storage_.err) E(static_cast<E&&>(other.storage_.err));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    ITEST_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    ITEST_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    ITEST_ASSERT(has_value_);
    return static_cast<V&&>(storage_.value);
  }

  const E& get_error() const {
    ITEST_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};
  static constexpr ValueTag kValueTag{};
  static constexpr ErrorTag kErrorTag{};

  template <typename U>
  expected(ValueTag, U&& v) : has_value_(true) {
    new (&storage_.value) V(static_cast<U&&>(v));
  }
  template <typename U>
  expected(ErrorTag, U&& e) : has_value_(false) {
    new (&storage_.err) E(static_cast<U&&>(e));
  }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    } else {
      storage_.err.~E();
    }
  }

  union Storage {
    Storage() {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/// @brief expected<void, E> specialization: success carries no value.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() { return expected(true, E{}); }
  static expected error(const E& e) { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const {
    ITEST_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, const E& e) : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

/// @brief Chain a fallible step onto a successful result.
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using R = decltype(fn(r.value()));
  if (!r.has_value()) return R::error(r.get_error());
  return fn(r.value());
}

/// @brief Invoke @p fn with the error, if any.
template <typename V, typename E, typename F>
void or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) fn(r.get_error());
}

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}
  optional(const T& v) : has_value_(true) { new (&storage_.value) T(v); }  // NOLINT
  optional(T&& v) : has_value_(true) {  // NOLINT
    new (&storage_.value) T(static_cast<T&&>(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) new (&storage_.value) T(other.storage_.value);
  }
  optional(optional&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) T(static_cast<T&&>(other.storage_.value));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) new (&storage_.value) T(other.storage_.value);
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) T(static_cast<T&&>(other.storage_.value));
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() {
    ITEST_ASSERT(has_value_);
    return storage_.value;
  }
  const T& value() const {
    ITEST_ASSERT(has_value_);
    return storage_.value;
  }

  T value_or(const T& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      storage_.value.~T();
      has_value_ = false;
    }
  }

 private:
  union Storage {
    Storage() {}
    ~Storage() {}
    T value;
  } storage_;
  bool has_value_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a cleanup callable when it goes out of scope.
 *
 * Movable (the source is released), non-copyable. Call release() to cancel.
 */
class ScopeGuard final {
 public:
  explicit ScopeGuard(std::function<void()> fn)
      : fn_(static_cast<std::function<void()>&&>(fn)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept
      : fn_(static_cast<std::function<void()>&&>(other.fn_)),
        active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_ && fn_) fn_();
  }

  void release() noexcept { active_ = false; }

 private:
  std::function<void()> fn_;
  bool active_;
};

#define ITEST_SCOPE_EXIT(code)                                  \
  ::itest::ScopeGuard ITEST_CONCAT(itest_scope_exit_, __LINE__)( \
      [&]() { code; })

}  // namespace itest

#endif  // ITEST_VOCABULARY_HPP_
