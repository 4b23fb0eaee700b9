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
 * @brief Printf-style leveled logger with stderr or rotating-file sink.
 *
 * A Logger is constructed once by the application and passed by reference
 * into every component that logs; there is no process-wide logger state.
 *
 * Line format:
 *   [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [Category] message
 * Debug builds append " (file:line)".
 *
 * Usage:
 * @code
 *   rudics::log::Logger logger;
 *   RUDICS_LOG_INFO(logger, "Main", "listening on %s:%u", host, port);
 * @endcode
 */

#ifndef RUDICS_LOG_HPP_
#define RUDICS_LOG_HPP_

#include "rudics/platform.hpp"
#include "rudics/vocabulary.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>

#include <sys/time.h>
#include <unistd.h>

namespace rudics {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
  kFatal,
  kOff,
};

enum class LogError : uint8_t {
  kOpenFailed = 0,
};

namespace detail {

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
      return "OFF";
  }
}

/// @brief Extract basename from a full file path.
inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

/// @brief Format the wall clock into "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
  struct timespec ts;
  ::clock_gettime(CLOCK_REALTIME, &ts);
  time_t t = ts.tv_sec;
  struct tm tm_local;
  localtime_r(&t, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03u",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec,
                      static_cast<unsigned>(ts.tv_nsec / 1000000L));
}

}  // namespace detail

/**
 * @brief Parse a level name ("debug", "info", "warn"/"warning", "error",
 *        "fatal", "off"), case-insensitive.
 */
inline optional<Level> ParseLevel(const char* name) noexcept {
  if (name == nullptr) return {};
  if (detail::CaseEqual(name, "debug")) return Level::kDebug;
  if (detail::CaseEqual(name, "info")) return Level::kInfo;
  if (detail::CaseEqual(name, "warn") || detail::CaseEqual(name, "warning"))
    return Level::kWarn;
  if (detail::CaseEqual(name, "error")) return Level::kError;
  if (detail::CaseEqual(name, "fatal")) return Level::kFatal;
  if (detail::CaseEqual(name, "off")) return Level::kOff;
  return {};
}

// ============================================================================
// Logger
// ============================================================================

class Logger final {
 public:
#ifdef NDEBUG
  static constexpr Level kDefaultLevel = Level::kInfo;
#else
  static constexpr Level kDefaultLevel = Level::kDebug;
#endif

  /// @brief Log to stderr.
  explicit Logger(Level level = kDefaultLevel) noexcept
      : out_(stderr), owns_out_(false), level_(level) {}

  /// @brief Log to a caller-owned stream (not closed by the Logger).
  Logger(FILE* stream, Level level) noexcept
      : out_(stream), owns_out_(false), level_(level) {}

  ~Logger() { CloseOwned(); }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  /**
   * @brief Redirect output to a file, appending.
   * @param path         Log file path.
   * @param max_bytes    Rotate once the file would exceed this size (0 = never).
   * @param backup_count Number of rotated files kept as path.1 .. path.N.
   */
  expected<void, LogError> OpenFile(const char* path, uint64_t max_bytes,
                                    uint32_t backup_count) noexcept {
    FILE* f = std::fopen(path, "a");
    if (f == nullptr) {
      return expected<void, LogError>::error(LogError::kOpenFailed);
    }
    CloseOwned();
    out_ = f;
    owns_out_ = true;
    path_ = path;
    max_bytes_ = max_bytes;
    backup_count_ = backup_count;
    long pos = std::ftell(f);
    bytes_written_ = (pos > 0) ? static_cast<uint64_t>(pos) : 0U;
    return expected<void, LogError>::success();
  }

  void SetLevel(Level level) noexcept { level_ = level; }
  Level GetLevel() const noexcept { return level_; }

  bool Enabled(Level level) const noexcept {
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(level_) &&
           level != Level::kOff;
  }

  RUDICS_PRINTF_FMT(6, 7)
  void Write(Level level, const char* category, const char* file, int line,
             const char* fmt, ...) noexcept {
    va_list args;
    va_start(args, fmt);
    WriteVa(level, category, file, line, fmt, args);
    va_end(args);
  }

  void WriteVa(Level level, const char* category, const char* file, int line,
               const char* fmt, va_list args) noexcept {
    if (!Enabled(level) || out_ == nullptr) return;

    char msg[512];
    (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
    char ts_buf[32];
    detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

#ifdef NDEBUG
    (void)file;
    (void)line;
    int n = std::fprintf(out_, "[%s] [%s] [%s] %s\n", ts_buf,
                         detail::LevelTag(level), category, msg);
#else
    int n = std::fprintf(out_, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                         detail::LevelTag(level), category, msg,
                         detail::Basename(file), line);
#endif
    (void)std::fflush(out_);

    if (n > 0) {
      bytes_written_ += static_cast<uint64_t>(n);
      if (owns_out_ && max_bytes_ > 0U && bytes_written_ >= max_bytes_) {
        Rotate();
      }
    }
  }

 private:
  void CloseOwned() noexcept {
    if (owns_out_ && out_ != nullptr) {
      (void)std::fclose(out_);
    }
    out_ = stderr;
    owns_out_ = false;
  }

  /// Shift path.N-1 -> path.N ... path -> path.1 and reopen path empty.
  void Rotate() noexcept {
    (void)std::fclose(out_);
    out_ = nullptr;

    if (backup_count_ > 0U) {
      for (uint32_t i = backup_count_; i > 0U; --i) {
        std::string src =
            (i == 1U) ? path_ : path_ + "." + std::to_string(i - 1U);
        std::string dst = path_ + "." + std::to_string(i);
        if (::access(src.c_str(), F_OK) == 0 &&
            std::rename(src.c_str(), dst.c_str()) != 0) {
          (void)std::fprintf(stderr, "[log] rotate %s -> %s failed\n",
                             src.c_str(), dst.c_str());
        }
      }
    }

    out_ = std::fopen(path_.c_str(), "w");
    if (out_ == nullptr) {
      (void)std::fprintf(stderr, "[log] reopen %s failed, using stderr\n",
                         path_.c_str());
      out_ = stderr;
      owns_out_ = false;
    }
    bytes_written_ = 0U;
  }

  FILE* out_;
  bool owns_out_;
  Level level_;
  std::string path_;
  uint64_t max_bytes_ = 0U;
  uint32_t backup_count_ = 0U;
  uint64_t bytes_written_ = 0U;
};

}  // namespace log
}  // namespace rudics

// ============================================================================
// Macros
// ============================================================================

#define RUDICS_LOG_AT(logger, lvl, cat, fmt, ...)                            \
  do {                                                                       \
    if ((logger).Enabled(lvl)) {                                             \
      (logger).Write(lvl, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__);      \
    }                                                                        \
  } while (0)

#define RUDICS_LOG_DEBUG(logger, cat, fmt, ...) \
  RUDICS_LOG_AT(logger, ::rudics::log::Level::kDebug, cat, fmt, ##__VA_ARGS__)
#define RUDICS_LOG_INFO(logger, cat, fmt, ...) \
  RUDICS_LOG_AT(logger, ::rudics::log::Level::kInfo, cat, fmt, ##__VA_ARGS__)
#define RUDICS_LOG_WARN(logger, cat, fmt, ...) \
  RUDICS_LOG_AT(logger, ::rudics::log::Level::kWarn, cat, fmt, ##__VA_ARGS__)
#define RUDICS_LOG_ERROR(logger, cat, fmt, ...) \
  RUDICS_LOG_AT(logger, ::rudics::log::Level::kError, cat, fmt, ##__VA_ARGS__)

#endif  // RUDICS_LOG_HPP_
