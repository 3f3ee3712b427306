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
 * @brief Cache-line size, clocks, assertion and macro helpers.
 */

#ifndef VIGIL_PLATFORM_HPP_
#define VIGIL_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <chrono>

namespace vigil {

static constexpr size_t kCacheLineSize = 64;

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
  (void)std::fprintf(stderr, "VIGIL_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define VIGIL_ASSERT(cond) ((void)0)
#else
#define VIGIL_ASSERT(cond) \
  ((cond) ? ((void)0) : ::vigil::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Clocks
// ============================================================================

using SteadyTime = std::chrono::steady_clock::time_point;

/// Monotonic time in microseconds.
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/// Monotonic time in seconds, for durations measured in fractional seconds.
inline double SteadyNowSec() noexcept {
  return static_cast<double>(SteadyNowUs()) / 1e6;
}

/// Converts fractional seconds into a steady_clock duration.
inline std::chrono::steady_clock::duration SecondsToDuration(
    double seconds) noexcept {
  return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(seconds > 0.0 ? seconds : 0.0));
}

// ============================================================================
// Macro Helpers
// ============================================================================

#define VIGIL_CONCAT_IMPL(a, b) a##b
#define VIGIL_CONCAT(a, b) VIGIL_CONCAT_IMPL(a, b)

}  // namespace vigil

#endif  // VIGIL_PLATFORM_HPP_
