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
 * @brief Lightweight synchronous logging with category tags.
 *
 * printf-style macros writing one line per call to stderr:
 *
 *   [2024-05-01 12:00:00.123] [INFO] [Engine] batch 'scan' started (engine.hpp:42)
 *
 * Two filters apply: VIGIL_LOG_MIN_LEVEL removes statements at compile time
 * (0=DEBUG .. 4=FATAL), and SetLevel() filters at run time. FATAL aborts after
 * writing and is reserved for unrecoverable programming errors.
 *
 * Thread-safe: each line is formatted into a stack buffer and written with a
 * single fprintf under a mutex, so lines from concurrent workers never
 * interleave.
 */

#ifndef VIGIL_LOG_HPP_
#define VIGIL_LOG_HPP_

#include "vigil/platform.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include <atomic>
#include <chrono>
#include <mutex>

#ifndef VIGIL_LOG_MIN_LEVEL
#define VIGIL_LOG_MIN_LEVEL 0
#endif

namespace vigil {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

namespace detail {

inline std::atomic<uint8_t>& LevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') base = p + 1;
  }
  return base;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;
  std::tm tm_buf{};
#if defined(_WIN32)
  localtime_s(&tm_buf, &secs);
#else
  localtime_r(&secs, &tm_buf);
#endif
  char date[32];
  (void)std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf, size, "%s.%03d", date, static_cast<int>(ms));
}

}  // namespace detail

// ============================================================================
// Level Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LevelRef().store(static_cast<uint8_t>(level),
                           std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LevelRef().load(std::memory_order_relaxed));
}

/**
 * @brief Parses a level name (case-sensitive lowercase, as used in configs).
 * @return true and sets @p out if the name is known.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  if (std::strcmp(name, "debug") == 0) {
    out = Level::kDebug;
  } else if (std::strcmp(name, "info") == 0) {
    out = Level::kInfo;
  } else if (std::strcmp(name, "warn") == 0 ||
             std::strcmp(name, "warning") == 0) {
    out = Level::kWarn;
  } else if (std::strcmp(name, "error") == 0) {
    out = Level::kError;
  } else if (std::strcmp(name, "off") == 0) {
    out = Level::kOff;
  } else {
    return false;
  }
  return true;
}

// ============================================================================
// Lifecycle
// ============================================================================

/// Marks the logger initialized and applies VIGIL_LOG_LEVEL if set.
inline void Init() noexcept {
  Level env_level;
  if (ParseLevel(std::getenv("VIGIL_LOG_LEVEL"), env_level)) {
    SetLevel(env_level);
  }
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

// ============================================================================
// Core Write
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }
  char msg[1024];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  char ts[40];
  detail::FormatTimestamp(ts, sizeof(ts));

  std::lock_guard<std::mutex> lock(detail::WriteMutex());
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
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
  if (level == Level::kFatal) {
    (void)std::fflush(stderr);
    std::abort();
  }
}

}  // namespace log
}  // namespace vigil

// ============================================================================
// Macros
// ============================================================================

#define VIGIL_LOG_DEBUG(cat, fmt, ...)                                     \
  do {                                                                     \
    if (VIGIL_LOG_MIN_LEVEL <= 0) {                                        \
      ::vigil::log::LogWrite(::vigil::log::Level::kDebug, cat, __FILE__,   \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define VIGIL_LOG_INFO(cat, fmt, ...)                                      \
  do {                                                                     \
    if (VIGIL_LOG_MIN_LEVEL <= 1) {                                        \
      ::vigil::log::LogWrite(::vigil::log::Level::kInfo, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define VIGIL_LOG_WARN(cat, fmt, ...)                                      \
  do {                                                                     \
    if (VIGIL_LOG_MIN_LEVEL <= 2) {                                        \
      ::vigil::log::LogWrite(::vigil::log::Level::kWarn, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define VIGIL_LOG_ERROR(cat, fmt, ...)                                     \
  do {                                                                     \
    if (VIGIL_LOG_MIN_LEVEL <= 3) {                                        \
      ::vigil::log::LogWrite(::vigil::log::Level::kError, cat, __FILE__,   \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define VIGIL_LOG_FATAL(cat, fmt, ...)                                     \
  do {                                                                     \
    ::vigil::log::LogWrite(::vigil::log::Level::kFatal, cat, __FILE__,     \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
  } while (0)

#endif  // VIGIL_LOG_HPP_
