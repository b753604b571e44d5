/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
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
 * @brief Vocabulary types for ctload: ErrorCode, expected, optional.
 *
 * Errors travel as values. Nothing in the harness throws across a component
 * boundary; every failure of a connection ends up as an ErrorCode that the
 * worker folds into the metrics.
 */

#ifndef CTLOAD_VOCABULARY_HPP_
#define CTLOAD_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>

#include <new>
#include <type_traits>
#include <utility>

#ifndef CTLOAD_ASSERT
#define CTLOAD_ASSERT(cond) ((void)(cond))
#endif

namespace ctload {

static constexpr size_t kCacheLine = 64;

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kInvalidEndpoint = 1,
  kInvalidConfig = 2,
  kInvalidState = 3,
  kResolveFailed = 4,
  kConnectFailed = 5,
  kHandshakeFailed = 6,
  kFrameParseError = 7,
  kConnectionClosed = 8,
  kSocketError = 9,
  kTimeout = 10,
  kBufferFull = 11,
  kTlsError = 12,
  kTlsUnavailable = 13,
  kInternalError = 255
};

inline const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kInvalidEndpoint: return "invalid endpoint";
    case ErrorCode::kInvalidConfig: return "invalid configuration";
    case ErrorCode::kInvalidState: return "invalid state";
    case ErrorCode::kResolveFailed: return "address resolution failed";
    case ErrorCode::kConnectFailed: return "connect failed";
    case ErrorCode::kHandshakeFailed: return "handshake failed";
    case ErrorCode::kFrameParseError: return "frame parse error";
    case ErrorCode::kConnectionClosed: return "connection closed abnormally";
    case ErrorCode::kSocketError: return "socket error";
    case ErrorCode::kTimeout: return "timeout";
    case ErrorCode::kBufferFull: return "message exceeds buffer";
    case ErrorCode::kTlsError: return "tls error";
    case ErrorCode::kTlsUnavailable: return "tls support not built";
    case ErrorCode::kInternalError: return "internal error";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E> - error-or-value
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Construct through success() and error(). V may be move-only
 * (e.g. std::unique_ptr); the copy operations are only instantiated when used.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(V val) noexcept(std::is_nothrow_move_constructible<V>::value) {
    expected e;
    e.emplace(std::move(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) : err_(other.err_) {
    if (other.has_value_) emplace(other.val_);
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : err_(other.err_) {
    if (other.has_value_) emplace(std::move(other.val_));
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      destroy();
      err_ = other.err_;
      if (other.has_value_) emplace(other.val_);
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      destroy();
      err_ = other.err_;
      if (other.has_value_) emplace(std::move(other.val_));
    }
    return *this;
  }

  ~expected() { destroy(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    CTLOAD_ASSERT(has_value_);
    return val_;
  }

  const V& value() const& noexcept {
    CTLOAD_ASSERT(has_value_);
    return val_;
  }

  E get_error() const noexcept {
    CTLOAD_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const { return has_value_ ? val_ : fallback; }

 private:
  expected() noexcept {}

  template <typename U>
  void emplace(U&& val) {
    ::new (static_cast<void*>(&val_)) V(std::forward<U>(val));
    has_value_ = true;
  }

  void destroy() noexcept {
    if (has_value_) {
      val_.~V();
      has_value_ = false;
    }
  }

  union {
    V val_;
  };
  E err_{};
  bool has_value_{false};
};

/**
 * @brief Void specialization - success or an error, no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(E{}, true); }
  static expected error(E err) noexcept { return expected(err, false); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    CTLOAD_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(E err, bool ok) noexcept : err_(err), has_value_(ok) {}

  E err_{};
  bool has_value_{false};
};

// ============================================================================
// optional<T> - nullable value
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept {}

  optional(const T& val) { emplace(val); }  // NOLINT
  optional(T&& val) { emplace(std::move(val)); }  // NOLINT

  optional(const optional& other) {
    if (other.has_value_) emplace(other.val_);
  }

  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
    if (other.has_value_) emplace(std::move(other.val_));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) emplace(other.val_);
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) emplace(std::move(other.val_));
    }
    return *this;
  }

  ~optional() { reset(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    CTLOAD_ASSERT(has_value_);
    return val_;
  }

  const T& value() const noexcept {
    CTLOAD_ASSERT(has_value_);
    return val_;
  }

  T value_or(const T& fallback) const { return has_value_ ? val_ : fallback; }

  void reset() noexcept {
    if (has_value_) {
      val_.~T();
      has_value_ = false;
    }
  }

 private:
  template <typename U>
  void emplace(U&& val) {
    ::new (static_cast<void*>(&val_)) T(std::forward<U>(val));
    has_value_ = true;
  }

  union {
    T val_;
  };
  bool has_value_{false};
};

}  // namespace ctload

#endif  // CTLOAD_VOCABULARY_HPP_
