/**
 * @file rudics_client.hpp
 * @brief Dockserver (RUDICS) TCP client with reconnection backoff.
 *
 * The client keeps two pieces of state apart:
 *  - desired_open: whether the session wants a connection;
 *  - the socket itself, present only while physically connected.
 *
 * Readiness queries (WantsRead/WantsWrite) try to connect whenever a
 * connection is wanted but missing, so reconnection needs no timer of its
 * own. Every close pushes the earliest next open out by the backoff gap.
 */

#ifndef RUDICS_RUDICS_CLIENT_HPP_
#define RUDICS_RUDICS_CLIENT_HPP_

#include "rudics/byte_queue.hpp"
#include "rudics/log.hpp"
#include "rudics/net.hpp"
#include "rudics/platform.hpp"
#include "rudics/rate_limiter.hpp"
#include "rudics/vocabulary.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace rudics {

enum class ClientState : uint8_t {
  kClosed = 0U,      ///< not connected, not wanted
  kOpeningBlocked,   ///< wanted, waiting for the backoff to expire
  kOpen,
};

inline const char* ClientStateName(ClientState s) noexcept {
  switch (s) {
    case ClientState::kOpeningBlocked:
      return "opening-blocked";
    case ClientState::kOpen:
      return "open";
    default:
      return "closed";
  }
}

struct RudicsClientConfig {
  std::string host = "localhost";
  uint16_t port = 6565U;
  uint64_t reconnect_delay_us = 120U * kUsPerSec;
  uint64_t reconnect_spacing_us = 10U * kUsPerSec;
  uint32_t baud_rate_limit = 0U;  ///< 0 = unthrottled
  int32_t connect_timeout_ms = 5000;
};

class RudicsClient {
 public:
  RudicsClient(const RudicsClientConfig& cfg, log::Logger& logger)
      : cfg_(cfg), logger_(logger), limiter_(cfg.baud_rate_limit) {}

  ~RudicsClient() { Release(); }

  RudicsClient(const RudicsClient&) = delete;
  RudicsClient& operator=(const RudicsClient&) = delete;

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  /**
   * @brief Ask for a connection.
   *
   * Marks the connection as wanted. Connects immediately unless the
   * backoff has not expired yet, in which case a later readiness query
   * retries. A failed connect applies the same backoff as a close.
   *
   * @return true when connected afterwards.
   */
  bool Open(uint64_t now_us) {
    desired_open_ = true;
    if (sock_.IsOpen()) return true;
    if (now_us < next_open_us_) {
      RUDICS_LOG_DEBUG(logger_, "Rudics", "open deferred %.3fs until backoff expires",
                       static_cast<double>(next_open_us_ - now_us) / kUsPerSec);
      return false;
    }

    auto res = net::TcpClient::Connect(cfg_.host.c_str(), cfg_.port,
                                       cfg_.connect_timeout_ms);
    if (!res) {
      ApplyBackoff(now_us);
      ++connect_failures_;
      RUDICS_LOG_WARN(logger_, "Rudics", "connect %s:%u failed (%s), retry in %.3fs",
                      cfg_.host.c_str(), static_cast<unsigned>(cfg_.port),
                      net::NetErrorName(res.get_error()),
                      static_cast<double>(next_open_us_ - now_us) / kUsPerSec);
      return false;
    }

    sock_ = std::move(res.value());
    last_open_us_ = now_us;
    limiter_.Reset(now_us);
    ++opens_;
    RUDICS_LOG_INFO(logger_, "Rudics", "connected to %s:%u", cfg_.host.c_str(),
                    static_cast<unsigned>(cfg_.port));
    return true;
  }

  /**
   * @brief Deliberate close: the connection is no longer wanted.
   *
   * A client that is already disconnected only forgets the wish to
   * connect; its timestamps and backoff stay untouched.
   */
  void Close(uint64_t now_us) {
    desired_open_ = false;
    Disconnect(now_us, "closed");
  }

  /// @brief Close after a transport failure; a reconnect stays wanted.
  void Fail(uint64_t now_us, const char* why) {
    Disconnect(now_us, why);
    desired_open_ = true;
  }

  // --------------------------------------------------------------------------
  // Readiness
  // --------------------------------------------------------------------------

  bool WantsRead(uint64_t now_us) {
    Reconnect(now_us);
    return sock_.IsOpen();
  }

  /// Connected, bytes queued, and the rate limiter allows a send.
  bool WantsWrite(uint64_t now_us) {
    Reconnect(now_us);
    return sock_.IsOpen() && !out_.Empty() && now_us >= limiter_.NextSendUs();
  }

  // --------------------------------------------------------------------------
  // Data transfer
  // --------------------------------------------------------------------------

  void Push(uint8_t byte) { out_.Push(byte); }
  void Enqueue(const uint8_t* data, size_t len) { out_.Append(data, len); }
  void DiscardQueued() noexcept { out_.Clear(); }
  size_t Queued() const noexcept { return out_.Size(); }

  /**
   * @brief Write whatever the rate limiter releases.
   *
   * A write of zero bytes or a transport error counts as a dropped
   * connection.
   */
  IoResult Send(uint64_t now_us) {
    if (!sock_.IsOpen()) return IoResult{0U, IoStatus::kClosed};
    const size_t n = limiter_.Release(now_us, out_.Size());
    if (n == 0U) return IoResult{0U, IoStatus::kWouldBlock};

    auto res = sock_.Send(out_.Data(), n);
    if (!res || res.value() == 0U) {
      Fail(now_us, res ? "zero-length send" : net::NetErrorName(res.get_error()));
      return IoResult{0U, IoStatus::kClosed};
    }
    const size_t sent = res.value();
    out_.Consume(sent);
    limiter_.Commit(now_us, sent);
    RUDICS_LOG_DEBUG(logger_, "Rudics", "sent %zu of %zu released, %zu queued", sent,
                     n, out_.Size());
    return IoResult{sent, IoStatus::kOk};
  }

  /// @brief Read up to max bytes; end of stream or an error drops the connection.
  IoResult Recv(uint8_t* buf, size_t max, uint64_t now_us) {
    if (!sock_.IsOpen()) return IoResult{0U, IoStatus::kClosed};
    auto res = sock_.Recv(buf, max);
    if (!res || res.value() == 0U) {
      Fail(now_us, res ? "peer closed" : net::NetErrorName(res.get_error()));
      return IoResult{0U, IoStatus::kClosed};
    }
    return IoResult{res.value(), IoStatus::kOk};
  }

  // --------------------------------------------------------------------------
  // Accessors
  // --------------------------------------------------------------------------

  ClientState State() const noexcept {
    if (sock_.IsOpen()) return ClientState::kOpen;
    return desired_open_ ? ClientState::kOpeningBlocked : ClientState::kClosed;
  }

  bool IsOpen() const noexcept { return sock_.IsOpen(); }
  bool DesiredOpen() const noexcept { return desired_open_; }
  void SetDesiredOpen(bool want) noexcept { desired_open_ = want; }
  int Fd() const noexcept { return sock_.Fd(); }

  uint64_t LastOpenUs() const noexcept { return last_open_us_; }
  uint64_t LastCloseUs() const noexcept { return last_close_us_; }
  uint64_t NextOpenUs() const noexcept { return next_open_us_; }
  uint64_t NextSendUs() const noexcept { return limiter_.NextSendUs(); }
  uint32_t OpenCount() const noexcept { return opens_; }
  uint32_t ConnectFailures() const noexcept { return connect_failures_; }

  /// max(reconnect_delay, reconnect_spacing).
  uint64_t BackoffGapUs() const noexcept {
    return (cfg_.reconnect_delay_us > cfg_.reconnect_spacing_us)
               ? cfg_.reconnect_delay_us
               : cfg_.reconnect_spacing_us;
  }

  const RudicsClientConfig& Config() const noexcept { return cfg_; }

 private:
  void Reconnect(uint64_t now_us) {
    if (desired_open_ && !sock_.IsOpen()) {
      (void)Open(now_us);
    }
  }

  void Disconnect(uint64_t now_us, const char* why) {
    if (!sock_.IsOpen()) return;
    sock_.Close();
    last_close_us_ = now_us;
    ApplyBackoff(now_us);
    RUDICS_LOG_INFO(logger_, "Rudics", "disconnected from %s:%u (%s), next open in %.3fs",
                    cfg_.host.c_str(), static_cast<unsigned>(cfg_.port), why,
                    static_cast<double>(next_open_us_ - now_us) / kUsPerSec);
  }

  void ApplyBackoff(uint64_t now_us) noexcept {
    const uint64_t candidate = now_us + BackoffGapUs();
    if (candidate > next_open_us_) next_open_us_ = candidate;
  }

  void Release() noexcept {
    if (sock_.IsOpen()) {
      sock_.Close();
      RUDICS_LOG_INFO(logger_, "Rudics", "released connection to %s:%u",
                      cfg_.host.c_str(), static_cast<unsigned>(cfg_.port));
    }
  }

  RudicsClientConfig cfg_;
  log::Logger& logger_;
  net::TcpClient sock_;
  ByteQueue out_;
  RateLimiter limiter_;
  bool desired_open_ = false;
  uint64_t last_open_us_ = 0U;
  uint64_t last_close_us_ = 0U;
  uint64_t next_open_us_ = 0U;
  uint32_t opens_ = 0U;
  uint32_t connect_failures_ = 0U;
};

}  // namespace rudics

#endif  // RUDICS_RUDICS_CLIENT_HPP_
