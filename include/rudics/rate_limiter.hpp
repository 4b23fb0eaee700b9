/**
 * @file rate_limiter.hpp
 * @brief Baud-rate emulation for the network leg.
 *
 * A byte on an async line costs nine bit times, so the limiter releases
 * at most baud/9 bytes per second. Releases are chunked: each call hands
 * out every byte that has "accrued" since the last successful send.
 */

#ifndef RUDICS_RATE_LIMITER_HPP_
#define RUDICS_RATE_LIMITER_HPP_

#include "rudics/platform.hpp"

#include <cstddef>
#include <cstdint>

namespace rudics {

class RateLimiter final {
 public:
  static constexpr uint32_t kBitsPerByte = 9U;

  /// @param baud Emulated line rate; 0 disables throttling.
  explicit RateLimiter(uint32_t baud = 0U) noexcept
      : us_per_byte_((baud == 0U) ? 0U
                                  : (static_cast<uint64_t>(kBitsPerByte) * kUsPerSec +
                                     baud - 1U) / baud) {}

  bool IsThrottled() const noexcept { return us_per_byte_ != 0U; }
  uint64_t UsPerByte() const noexcept { return us_per_byte_; }

  uint64_t LastSendUs() const noexcept { return last_send_us_; }
  uint64_t NextSendUs() const noexcept { return next_send_us_; }

  /// @brief Restart the clock, e.g. when a connection opens.
  void Reset(uint64_t now_us) noexcept {
    last_send_us_ = now_us;
    next_send_us_ = now_us;
  }

  /**
   * @brief Number of queued bytes that may be written now.
   *
   * Unthrottled: all of them. Throttled: nothing before NextSendUs(),
   * otherwise floor(elapsed / us_per_byte) capped at queued. Every
   * throttled call pushes NextSendUs() one byte time past now.
   */
  size_t Release(uint64_t now_us, size_t queued) noexcept {
    if (queued == 0U) return 0U;
    if (!IsThrottled()) return queued;
    if (now_us < next_send_us_) return 0U;

    next_send_us_ = now_us + us_per_byte_;
    const uint64_t elapsed = (now_us > last_send_us_) ? (now_us - last_send_us_) : 0U;
    const uint64_t n = elapsed / us_per_byte_;
    return (n < queued) ? static_cast<size_t>(n) : queued;
  }

  /// @brief Record that sent bytes actually left.
  void Commit(uint64_t now_us, size_t sent) noexcept {
    if (sent > 0U) {
      last_send_us_ = now_us;
    }
  }

 private:
  uint64_t us_per_byte_;
  uint64_t last_send_us_ = 0U;
  uint64_t next_send_us_ = 0U;
};

}  // namespace rudics

#endif  // RUDICS_RATE_LIMITER_HPP_
