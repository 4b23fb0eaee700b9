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
 * @brief Monotonic microsecond clock and the assertion macro.
 *
 * Every timestamp in rudics is a uint64_t count of microseconds on
 * CLOCK_MONOTONIC, so wall-clock steps never disturb idle or backoff
 * timing.
 */

#ifndef RUDICS_PLATFORM_HPP_
#define RUDICS_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace rudics {

#if !defined(__linux__)
#error "rudics needs Linux (epoll, termios, openpty)"
#endif

#if defined(__GNUC__) || defined(__clang__)
#define RUDICS_PRINTF_FMT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define RUDICS_PRINTF_FMT(fmt_idx, arg_idx)
#endif

// ============================================================================
// Time
// ============================================================================

static constexpr uint64_t kUsPerMs = 1000U;
static constexpr uint64_t kUsPerSec = 1000000U;

/// @brief Monotonic time in microseconds (CLOCK_MONOTONIC).
inline uint64_t SteadyNowUs() noexcept {
  struct timespec ts;
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * kUsPerSec +
         static_cast<uint64_t>(ts.tv_nsec) / 1000U;
}

/// Longest duration SecondsToUs converts exactly (about 31 years).
static constexpr double kMaxDurationSec = 1e9;

/// @brief Convert whole or fractional seconds to microseconds.
/// Saturates at kMaxDurationSec; NaN and negatives give 0.
inline constexpr uint64_t SecondsToUs(double seconds) noexcept {
  return !(seconds > 0.0) ? 0U
         : (seconds >= kMaxDurationSec)
             ? static_cast<uint64_t>(kMaxDurationSec) * kUsPerSec
             : static_cast<uint64_t>(seconds * 1000000.0 + 0.5);
}

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/// Debug builds only: report the broken invariant and stop.
[[noreturn]] inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "rudics: assertion `%s' failed (%s:%d)\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define RUDICS_ASSERT(cond) ((void)0)
#else
#define RUDICS_ASSERT(cond) \
  ((cond) ? ((void)0) : ::rudics::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace rudics

#endif  // RUDICS_PLATFORM_HPP_
