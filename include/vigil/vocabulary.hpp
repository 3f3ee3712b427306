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
 * @brief Error vocabulary: expected<V, E>, error enums and ScopeGuard.
 *
 * Fallible library operations return expected<V, E> instead of throwing.
 * Error codes are small enums so they can be compared and switched on
 * cheaply; batch-fatal errors additionally carry a human readable detail.
 *
 * Usage:
 * @code
 *   vigil::expected<int, vigil::ConfigError> r = ParsePort(text);
 *   if (!r.has_value()) {
 *     HandleError(r.get_error());
 *   }
 *   int port = r.value_or(8080);
 * @endcode
 */

#ifndef VIGIL_VOCABULARY_HPP_
#define VIGIL_VOCABULARY_HPP_

#include "vigil/platform.hpp"

#include <cstdint>

#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace vigil {

// ============================================================================
// Error Enums
// ============================================================================

/// Configuration loading errors.
enum class ConfigError : uint8_t {
  kFileNotFound = 0,    ///< File missing or unreadable
  kParseError,          ///< Syntax error in the source document
  kFormatNotSupported,  ///< Backend not compiled in
  kBufferFull           ///< Document larger than the read buffer
};

/// Resource pool errors.
enum class PoolError : uint8_t {
  kResourceExhausted = 0,  ///< Wait ceiling elapsed with every slot in use
  kPoolClosed              ///< Pool closed, no further loans
};

/// Result model construction errors.
enum class ResultError : uint8_t {
  kInvalidStatus = 0,  ///< Status name outside the closed set
  kScoreOutOfRange,    ///< Score not within [0, 100]
  kMalformed           ///< Serialized form is not a valid result object
};

/// Probe registry errors.
enum class RegistryError : uint8_t {
  kDuplicateProbe = 0,  ///< Name already registered
  kUnknownProbe,        ///< No factory for this name
  kProbeDisabled        ///< Registered but disabled
};

/// Errors that abort a whole batch before any job executes.
enum class BatchErrorCode : uint8_t {
  kCyclicDependency = 0,  ///< Dependency graph contains a cycle
  kUnknownInversionRule,  ///< Inversion mode not in the rule table
  kDuplicateJobId,        ///< Two jobs share an id
  kEmptyJobId             ///< A job has no id
};

inline const char* BatchErrorCodeName(BatchErrorCode code) noexcept {
  switch (code) {
    case BatchErrorCode::kCyclicDependency:
      return "cyclic_dependency";
    case BatchErrorCode::kUnknownInversionRule:
      return "unknown_inversion_rule";
    case BatchErrorCode::kDuplicateJobId:
      return "duplicate_job_id";
    case BatchErrorCode::kEmptyJobId:
      return "empty_job_id";
  }
  return "unknown";
}

/// Batch-fatal error with the offending detail (edge, rule name, job id).
struct BatchError {
  BatchErrorCode code{BatchErrorCode::kCyclicDependency};
  std::string detail;
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the named factories success() and error(). Accessing
 * value() on an error (or get_error() on a value) is a programming error
 * caught by VIGIL_ASSERT in debug builds.
 */
template <typename V, typename E>
class expected {
 public:
  static expected success(const V& v) {
    return expected(std::in_place_index<0>, v);
  }
  static expected success(V&& v) {
    return expected(std::in_place_index<0>, std::move(v));
  }
  static expected error(const E& e) {
    return expected(std::in_place_index<1>, e);
  }
  static expected error(E&& e) {
    return expected(std::in_place_index<1>, std::move(e));
  }

  bool has_value() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  V& value() & {
    VIGIL_ASSERT(has_value());
    return std::get<0>(storage_);
  }
  const V& value() const& {
    VIGIL_ASSERT(has_value());
    return std::get<0>(storage_);
  }
  V&& value() && {
    VIGIL_ASSERT(has_value());
    return std::get<0>(std::move(storage_));
  }

  const E& get_error() const& {
    VIGIL_ASSERT(!has_value());
    return std::get<1>(storage_);
  }

  V value_or(const V& fallback) const& {
    return has_value() ? std::get<0>(storage_) : fallback;
  }

 private:
  template <size_t I, typename T>
  expected(std::in_place_index_t<I> tag, T&& v)
      : storage_(tag, std::forward<T>(v)) {}

  std::variant<V, E> storage_;
};

/// Specialization for operations that produce no value.
template <typename E>
class expected<void, E> {
 public:
  static expected success() { return expected(); }
  static expected error(const E& e) { return expected(e); }

  bool has_value() const noexcept { return ok_; }
  explicit operator bool() const noexcept { return ok_; }

  const E& get_error() const& {
    VIGIL_ASSERT(!ok_);
    return error_;
  }

 private:
  expected() : ok_(true), error_() {}
  explicit expected(const E& e) : ok_(false), error_(e) {}

  bool ok_;
  E error_;
};

/// Chains an operation onto a successful expected; errors propagate.
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using Ret = decltype(fn(r.value()));
  if (!r.has_value()) {
    return Ret::error(r.get_error());
  }
  return fn(r.value());
}

/// Invokes the handler with the error if the expected holds one.
template <typename V, typename E, typename F>
void or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) {
    fn(r.get_error());
  }
}

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a cleanup callable when leaving scope unless released.
 *
 * Move-only. The moved-from guard is released.
 */
class ScopeGuard {
 public:
  explicit ScopeGuard(std::function<void()> cleanup)
      : cleanup_(std::move(cleanup)), active_(true) {}

  ~ScopeGuard() {
    if (active_ && cleanup_) {
      cleanup_();
    }
  }

  ScopeGuard(ScopeGuard&& other) noexcept
      : cleanup_(std::move(other.cleanup_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  void release() noexcept { active_ = false; }

 private:
  std::function<void()> cleanup_;
  bool active_;
};

#define VIGIL_SCOPE_EXIT(...)                                  \
  ::vigil::ScopeGuard VIGIL_CONCAT(vigil_scope_exit_, __LINE__)( \
      [&]() { __VA_ARGS__; })

}  // namespace vigil

#endif  // VIGIL_VOCABULARY_HPP_
