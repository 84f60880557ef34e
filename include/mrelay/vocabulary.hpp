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
 * @brief Vocabulary types for mrelay: ErrorCode, expected, FixedVector.
 *
 * Stack-allocated helpers shared by the codec, the store and the reactor.
 * Recoverable failures travel as expected<V, ErrorCode>; exceptions are kept
 * for construction failures only.
 */

#ifndef MRELAY_VOCABULARY_HPP_
#define MRELAY_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

// Assertion hook (no-op unless overridden by the build)
#ifndef MRELAY_ASSERT
#define MRELAY_ASSERT(cond) ((void)(cond))
#endif

namespace mrelay {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kFrameParseError = 1,
  kConnectionClosed = 2,
  kSocketError = 3,
  kTimeout = 4,
  kMaxConnectionsExceeded = 5,
  kPayloadTooLarge = 6,
  kUnknownOpcode = 7,
  kInvalidArgument = 8,
  kNotFound = 9,
  kDuplicate = 10,
  kStoreError = 11,
  kInternalError = 255
};

inline const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kFrameParseError: return "frame parse error";
    case ErrorCode::kConnectionClosed: return "connection closed";
    case ErrorCode::kSocketError: return "socket error";
    case ErrorCode::kTimeout: return "timeout";
    case ErrorCode::kMaxConnectionsExceeded: return "max connections exceeded";
    case ErrorCode::kPayloadTooLarge: return "payload too large";
    case ErrorCode::kUnknownOpcode: return "unknown opcode";
    case ErrorCode::kInvalidArgument: return "invalid argument";
    case ErrorCode::kNotFound: return "not found";
    case ErrorCode::kDuplicate: return "duplicate";
    case ErrorCode::kStoreError: return "store error";
    case ErrorCode::kInternalError: return "internal error";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(val);
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) noexcept : storage_{}, err_(other.err_),
                                             has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected& operator=(const expected& other) noexcept {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      }
    }
    return *this;
  }

  expected(expected&& other) noexcept : storage_{}, err_(other.err_),
                                        has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(static_cast<V&&>(other.value()));
      }
    }
    return *this;
  }

  ~expected() {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
    }
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    MRELAY_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    MRELAY_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  E get_error() const noexcept {
    MRELAY_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const noexcept {
    return has_value_ ? value() : default_val;
  }

 private:
  expected() noexcept : storage_{}, err_{}, has_value_(false) {}

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_{};
  E err_{};
  bool has_value_{false};
};

/**
 * @brief Void specialization - represents success or error with no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    MRELAY_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  E err_{};
  bool has_value_{false};
};

// ============================================================================
// FixedVector<T, Capacity> - Stack-allocated fixed-capacity vector
// ============================================================================

/**
 * @brief Fixed-capacity, stack-allocated vector with no heap allocation.
 *
 * Holds the reactor's active connection set. Move-only.
 *
 * @tparam T Element type
 * @tparam Capacity Maximum number of elements
 */
template <typename T, uint32_t Capacity>
class FixedVector final {
  static_assert(Capacity > 0U, "FixedVector capacity must be > 0");

 public:
  using value_type = T;
  using size_type = uint32_t;
  using reference = T&;
  using const_reference = const T&;
  using pointer = T*;
  using const_pointer = const T*;
  using iterator = T*;
  using const_iterator = const T*;

  FixedVector() noexcept {}  // NOLINT

  ~FixedVector() noexcept { clear(); }

  FixedVector(const FixedVector&) = delete;
  FixedVector& operator=(const FixedVector&) = delete;

  reference operator[](uint32_t index) noexcept {
    return *reinterpret_cast<T*>(storage_ + index * sizeof(T));
  }

  const_reference operator[](uint32_t index) const noexcept {
    return *reinterpret_cast<const T*>(storage_ + index * sizeof(T));
  }

  reference front() noexcept { return (*this)[0U]; }
  const_reference front() const noexcept { return (*this)[0U]; }
  reference back() noexcept { return (*this)[size_ - 1U]; }
  const_reference back() const noexcept { return (*this)[size_ - 1U]; }

  pointer data() noexcept { return reinterpret_cast<T*>(storage_); }
  const_pointer data() const noexcept {
    return reinterpret_cast<const T*>(storage_);
  }

  iterator begin() noexcept { return data(); }
  const_iterator begin() const noexcept { return data(); }
  iterator end() noexcept { return data() + size_; }
  const_iterator end() const noexcept { return data() + size_; }

  [[nodiscard]] bool empty() const noexcept { return size_ == 0U; }
  [[nodiscard]] uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  [[nodiscard]] bool full() const noexcept { return size_ >= Capacity; }

  bool push_back(const T& value) noexcept { return emplace_back(value); }
  bool push_back(T&& value) noexcept { return emplace_back(static_cast<T&&>(value)); }

  template <typename... CtorArgs>
  bool emplace_back(CtorArgs&&... args) noexcept {
    if (size_ >= Capacity) {
      return false;
    }
    ::new (storage_ + size_ * sizeof(T))
        T{static_cast<CtorArgs&&>(args)...};
    ++size_;
    return true;
  }

  bool pop_back() noexcept {
    if (size_ == 0U) {
      return false;
    }
    --size_;
    (*this)[size_].~T();
    return true;
  }

  // Swap-and-pop removal; element order is not preserved.
  bool erase_unordered(uint32_t index) noexcept {
    if (index >= size_) {
      return false;
    }
    if (index + 1U < size_) {
      (*this)[index] = static_cast<T&&>(back());
    }
    return pop_back();
  }

  void clear() noexcept {
    while (size_ > 0U) {
      --size_;
      (*this)[size_].~T();
    }
  }

 private:
  alignas(T) uint8_t storage_[sizeof(T) * Capacity];
  uint32_t size_{0U};
};

}  // namespace mrelay

#endif  // MRELAY_VOCABULARY_HPP_
