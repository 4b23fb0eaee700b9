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
 * @brief Error-as-value vocabulary types: expected<V, E> and optional<T>.
 *
 * Every fallible rudics operation returns expected<V, E> with a small
 * per-module error enum. Values are built through the named factories
 * success() / error() so call sites read the same for void and non-void.
 */

#ifndef RUDICS_VOCABULARY_HPP_
#define RUDICS_VOCABULARY_HPP_

#include "rudics/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace rudics {

// ============================================================================
// Shared Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

// ============================================================================
// expected<V, E>
// ============================================================================

template <typename V, typename E>
class expected final {
  static_assert(std::is_enum<E>::value, "expected: E must be an enum");

 public:
  static expected success(const V& v) {
    expected r;
    ::new (&r.storage_) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (&r.storage_) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.err_ = e;
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : err_(other.err_), has_value_(false) {
    if (other.has_value_) {
      ::new (&storage_) V(other.value());
      has_value_ = true;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : err_(other.err_), has_value_(false) {
    if (other.has_value_) {
      ::new (&storage_) V(std::move(other.value()));
      has_value_ = true;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        ::new (&storage_) V(other.value());
        has_value_ = true;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        ::new (&storage_) V(std::move(other.value()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    RUDICS_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    RUDICS_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  V&& value() && noexcept {
    RUDICS_ASSERT(has_value_);
    return std::move(*reinterpret_cast<V*>(&storage_));
  }

  E get_error() const noexcept {
    RUDICS_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? value() : fallback;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  E err_;
  bool has_value_;
};

/** void specialization: success carries no value. */
template <typename E>
class expected<void, E> final {
  static_assert(std::is_enum<E>::value, "expected: E must be an enum");

 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    RUDICS_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (&storage_) T(v);
  }

  optional(T&& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (&storage_) T(std::move(v));
  }

  optional(const optional& other) : has_value_(false) {
    if (other.has_value_) {
      ::new (&storage_) T(other.value());
      has_value_ = true;
    }
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(false) {
    if (other.has_value_) {
      ::new (&storage_) T(std::move(other.value()));
      has_value_ = true;
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(other.value());
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(std::move(other.value()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    RUDICS_ASSERT(has_value_);
    return *reinterpret_cast<T*>(&storage_);
  }

  const T& value() const noexcept {
    RUDICS_ASSERT(has_value_);
    return *reinterpret_cast<const T*>(&storage_);
  }

  T value_or(const T& fallback) const {
    return has_value_ ? value() : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      reinterpret_cast<T*>(&storage_)->~T();
      has_value_ = false;
    }
  }

 private:
  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// IoResult - outcome of one endpoint transfer
// ============================================================================

enum class IoStatus : uint8_t {
  kOk = 0U,     ///< bytes transferred (may be 0 when nothing was due)
  kWouldBlock,  ///< transient, nothing transferred
  kClosed,      ///< endpoint is (now) closed
};

struct IoResult {
  size_t bytes;
  IoStatus status;
};

}  // namespace rudics

#endif  // RUDICS_VOCABULARY_HPP_
