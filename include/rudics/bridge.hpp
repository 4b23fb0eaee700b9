/**
 * @file bridge.hpp
 * @brief Single-threaded loop moving bytes between serial and dockserver.
 *
 * Each pass:
 *   1. collect readiness interest of both endpoints and the wait bound;
 *   2. wait on the poller;
 *   3. nothing ready -> session idle check, next pass;
 *   4. error/hangup on an endpoint -> close it, skip transfers this pass;
 *   5. writes (one rate-limited send per endpoint);
 *   6. reads (serial bytes go through the session, network bytes are
 *      queued for the serial line).
 *
 * The loop ends when the serial line is closed and nothing is left to
 * deliver to an open network connection, or when the stop fd fires.
 */

#ifndef RUDICS_BRIDGE_HPP_
#define RUDICS_BRIDGE_HPP_

#include "rudics/io_poller.hpp"
#include "rudics/log.hpp"
#include "rudics/platform.hpp"
#include "rudics/serial_endpoint.hpp"
#include "rudics/session.hpp"
#include "rudics/transcript.hpp"
#include "rudics/vocabulary.hpp"

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstring>

namespace rudics {

enum class BridgeError : uint8_t {
  kPollFailed = 0U,
};

enum class LoopExit : uint8_t {
  kDrained = 0U,  ///< serial closed, network drained
  kStopped,       ///< stop fd became readable
};

enum class PassOutcome : uint8_t {
  kContinue = 0U,
  kDrained,
  kStopped,
};

struct BridgeStats {
  uint64_t passes = 0U;
  uint64_t idle_wakeups = 0U;
  uint64_t serial_in = 0U;    ///< bytes read from the device
  uint64_t serial_out = 0U;   ///< bytes written to the device
  uint64_t network_in = 0U;
  uint64_t network_out = 0U;
};

class BridgeLoop {
 public:
  static constexpr size_t kSerialReadChunk = 256U;
  static constexpr size_t kNetworkReadChunk = 8192U;

  BridgeLoop(SerialEndpoint& serial, SessionController& session, log::Logger& logger,
             Transcript* transcript = nullptr) noexcept
      : serial_(serial), session_(session), logger_(logger), transcript_(transcript) {}

  BridgeLoop(const BridgeLoop&) = delete;
  BridgeLoop& operator=(const BridgeLoop&) = delete;

  /// @brief Watch fd for readability; the loop stops once it is readable.
  expected<void, BridgeError> SetStopFd(int fd) {
    if (fd < 0) return expected<void, BridgeError>::success();
    if (!poller_.Watch(fd, static_cast<uint8_t>(IoEvent::kReadable))) {
      RUDICS_LOG_ERROR(logger_, "Bridge", "cannot watch stop fd %d", fd);
      return expected<void, BridgeError>::error(BridgeError::kPollFailed);
    }
    stop_fd_ = fd;
    return expected<void, BridgeError>::success();
  }

  /// Serial still open, or an open connection with bytes left to send.
  bool ShouldContinue() const noexcept {
    const RudicsClient& client = session_.Client();
    return serial_.IsOpen() || (client.IsOpen() && client.Queued() != 0U);
  }

  /**
   * @brief Run one pass.
   * @param wait_cap_ms Upper bound for the wait on top of the session's
   *                    own timeout; negative means none.
   */
  expected<PassOutcome, BridgeError> RunOnce(int32_t wait_cap_ms = -1) {
    if (!ShouldContinue()) {
      return expected<PassOutcome, BridgeError>::success(PassOutcome::kDrained);
    }
    if (!poller_.IsValid()) {
      RUDICS_LOG_ERROR(logger_, "Bridge", "poller unavailable");
      return expected<PassOutcome, BridgeError>::error(BridgeError::kPollFailed);
    }
    ++stats_.passes;

    RudicsClient& client = session_.Client();
    uint64_t now = SteadyNowUs();

    // Readiness queries may reconnect the network leg, so fds are read after.
    uint8_t serial_mask = 0U;
    if (serial_.Readable()) serial_mask |= static_cast<uint8_t>(IoEvent::kReadable);
    if (serial_.Writable()) serial_mask |= static_cast<uint8_t>(IoEvent::kWritable);
    uint8_t net_mask = 0U;
    if (client.WantsRead(now)) net_mask |= static_cast<uint8_t>(IoEvent::kReadable);
    if (client.WantsWrite(now)) net_mask |= static_cast<uint8_t>(IoEvent::kWritable);

    // A reconnect above may have blocked for the connect timeout.
    now = SteadyNowUs();

    const int serial_fd = serial_.Fd();
    const int net_fd = client.Fd();
    if (!SyncInterest(serial_fd, serial_mask, net_fd, net_mask)) {
      return expected<PassOutcome, BridgeError>::error(BridgeError::kPollFailed);
    }

    const int32_t wait_ms = WaitMs(session_.Timeout(now), wait_cap_ms);
    auto ready = poller_.Wait(wait_ms);
    if (!ready) {
      RUDICS_LOG_ERROR(logger_, "Bridge", "wait failed: %s", std::strerror(errno));
      return expected<PassOutcome, BridgeError>::error(BridgeError::kPollFailed);
    }

    now = SteadyNowUs();
    if (ready.value() == 0U) {
      ++stats_.idle_wakeups;
      (void)session_.TimedOut(now);
      return Continue();
    }

    if (stop_fd_ >= 0 && HasEvent(poller_.EventsFor(stop_fd_), IoEvent::kReadable)) {
      RUDICS_LOG_INFO(logger_, "Bridge", "stop requested");
      return expected<PassOutcome, BridgeError>::success(PassOutcome::kStopped);
    }

    const uint8_t serial_ev = (serial_mask != 0U) ? poller_.EventsFor(serial_fd) : 0U;
    const uint8_t net_ev = (net_mask != 0U) ? poller_.EventsFor(net_fd) : 0U;

    bool exceptional = false;
    if (IsExceptional(serial_ev)) {
      RUDICS_LOG_WARN(logger_, "Bridge", "exception on serial line %s",
                      serial_.Device().c_str());
      serial_.Close();
      exceptional = true;
    }
    if (IsExceptional(net_ev)) {
      RUDICS_LOG_WARN(logger_, "Bridge", "exception on dockserver connection");
      client.Fail(now, "poll error");
      exceptional = true;
    }
    if (exceptional) {
      return Continue();
    }

    // Writes
    if (HasEvent(serial_ev, IoEvent::kWritable)) {
      const IoResult r = serial_.SendOne();
      stats_.serial_out += r.bytes;
    }
    if (HasEvent(net_ev, IoEvent::kWritable)) {
      const IoResult r = client.Send(now);
      stats_.network_out += r.bytes;
    }

    // Reads
    if (HasEvent(serial_ev, IoEvent::kReadable)) {
      uint8_t buf[kSerialReadChunk];
      const IoResult r = serial_.DrainRead(buf, sizeof(buf));
      if (r.status == IoStatus::kOk) {
        stats_.serial_in += r.bytes;
        for (size_t i = 0; i < r.bytes; ++i) {
          session_.Put(buf[i], now);
        }
        Record(Direction::kFromSerial, buf, r.bytes);
      }
    }
    if (HasEvent(net_ev, IoEvent::kReadable)) {
      uint8_t buf[kNetworkReadChunk];
      const IoResult r = client.Recv(buf, sizeof(buf), now);
      if (r.status == IoStatus::kOk) {
        stats_.network_in += r.bytes;
        session_.NoteActivity(now);
        serial_.EnqueueOut(buf, r.bytes);
        Record(Direction::kFromNetwork, buf, r.bytes);
      }
    }

    return Continue();
  }

  /// @brief Run passes until the bridge drains or is stopped.
  expected<LoopExit, BridgeError> Run() {
    RUDICS_LOG_INFO(logger_, "Bridge", "bridging %s <-> %s:%u", serial_.Device().c_str(),
                    session_.Client().Config().host.c_str(),
                    static_cast<unsigned>(session_.Client().Config().port));
    for (;;) {
      auto r = RunOnce();
      if (!r) {
        return expected<LoopExit, BridgeError>::error(r.get_error());
      }
      if (r.value() == PassOutcome::kContinue) continue;

      const LoopExit exit_reason = (r.value() == PassOutcome::kStopped)
                                       ? LoopExit::kStopped
                                       : LoopExit::kDrained;
      RUDICS_LOG_INFO(logger_, "Bridge",
                      "loop %s after %llu passes: serial in=%llu out=%llu, "
                      "network in=%llu out=%llu",
                      (exit_reason == LoopExit::kStopped) ? "stopped" : "drained",
                      static_cast<unsigned long long>(stats_.passes),
                      static_cast<unsigned long long>(stats_.serial_in),
                      static_cast<unsigned long long>(stats_.serial_out),
                      static_cast<unsigned long long>(stats_.network_in),
                      static_cast<unsigned long long>(stats_.network_out));
      return expected<LoopExit, BridgeError>::success(exit_reason);
    }
  }

  const BridgeStats& Stats() const noexcept { return stats_; }

 private:
  static bool IsExceptional(uint8_t ev) noexcept {
    return HasEvent(ev, IoEvent::kError) ||
           (HasEvent(ev, IoEvent::kHangup) && !HasEvent(ev, IoEvent::kReadable));
  }

  /// Round up so a wait never expires just short of its deadline.
  static int32_t WaitMs(uint64_t timeout_us, int32_t cap_ms) noexcept {
    uint64_t ms = (timeout_us + kUsPerMs - 1U) / kUsPerMs;
    if (ms > static_cast<uint64_t>(INT32_MAX)) ms = static_cast<uint64_t>(INT32_MAX);
    int32_t wait = static_cast<int32_t>(ms);
    if (cap_ms >= 0 && cap_ms < wait) wait = cap_ms;
    return wait;
  }

  expected<PassOutcome, BridgeError> Continue() const {
    return expected<PassOutcome, BridgeError>::success(
        ShouldContinue() ? PassOutcome::kContinue : PassOutcome::kDrained);
  }

  bool SyncInterest(int serial_fd, uint8_t serial_mask, int net_fd, uint8_t net_mask) {
    // Drop stale registrations before adding, since a closed fd number
    // may already be reused by the other endpoint.
    if (watched_serial_fd_ >= 0 && watched_serial_fd_ != serial_fd) {
      (void)poller_.Forget(watched_serial_fd_);
    }
    if (watched_net_fd_ >= 0 && watched_net_fd_ != net_fd) {
      (void)poller_.Forget(watched_net_fd_);
    }
    watched_serial_fd_ = serial_fd;
    watched_net_fd_ = net_fd;

    if (serial_fd >= 0 && !poller_.Watch(serial_fd, serial_mask)) {
      RUDICS_LOG_ERROR(logger_, "Bridge", "cannot watch serial fd %d: %s", serial_fd,
                       std::strerror(errno));
      return false;
    }
    if (net_fd >= 0 && !poller_.Watch(net_fd, net_mask)) {
      RUDICS_LOG_ERROR(logger_, "Bridge", "cannot watch network fd %d: %s", net_fd,
                       std::strerror(errno));
      return false;
    }
    return true;
  }

  void Record(Direction dir, const uint8_t* data, size_t len) noexcept {
    if (transcript_ != nullptr) {
      transcript_->Record(dir, data, len);
    }
  }

  SerialEndpoint& serial_;
  SessionController& session_;
  log::Logger& logger_;
  Transcript* transcript_;
  IoPoller poller_;
  int stop_fd_ = -1;
  int watched_serial_fd_ = -1;
  int watched_net_fd_ = -1;
  BridgeStats stats_;
};

}  // namespace rudics

#endif  // RUDICS_BRIDGE_HPP_
