/**
 * @file session.hpp
 * @brief Trigger-driven open/close control of the network leg.
 *
 * The session watches the device's output one byte at a time. While the
 * network is wanted (WANT-OPEN) every byte is queued for the dockserver
 * and each finished line is searched for the "off" phrase; while it is
 * not wanted (WANT-CLOSED) bytes are dropped from the network leg and
 * lines are searched for the "on" phrase. Want-state flips act on the
 * client synchronously.
 *
 * Idle handling: the idle reference is the later of the last activity in
 * either direction and the last successful open.
 */

#ifndef RUDICS_SESSION_HPP_
#define RUDICS_SESSION_HPP_

#include "rudics/log.hpp"
#include "rudics/platform.hpp"
#include "rudics/rudics_client.hpp"
#include "rudics/trigger.hpp"

#include <cstdint>
#include <utility>

namespace rudics {

struct SessionConfig {
  uint64_t idle_timeout_us = 3600U * kUsPerSec;
  uint8_t terminator = '\n';
  bool start_open = true;  ///< initial want-state
};

class SessionController {
 public:
  /// Floor of the loop wait derived from the idle budget.
  static constexpr uint64_t kMinIdleWaitUs = kUsPerSec;

  SessionController(const SessionConfig& cfg, const RudicsClientConfig& client_cfg,
                    TriggerSet triggers, log::Logger& logger)
      : cfg_(cfg),
        logger_(logger),
        triggers_(std::move(triggers)),
        line_(cfg.terminator),
        client_(client_cfg, logger) {
    client_.SetDesiredOpen(cfg.start_open);
  }

  SessionController(const SessionController&) = delete;
  SessionController& operator=(const SessionController&) = delete;

  /**
   * @brief Feed one byte of device output.
   */
  void Put(uint8_t byte, uint64_t now_us) {
    NoteActivity(now_us);
    if (client_.DesiredOpen()) {
      client_.Push(byte);
    }

    switch (line_.Push(byte)) {
      case LineEvent::kLine:
        EvaluateLine(now_us);
        line_.Clear();
        break;
      case LineEvent::kOverflow:
        RUDICS_LOG_WARN(logger_, "Session", "discarded %u-byte line without terminator",
                        static_cast<unsigned>(RUDICS_MAX_LINE_BYTES));
        break;
      default:
        break;
    }
  }

  void NoteActivity(uint64_t now_us) noexcept {
    last_activity_us_ = now_us;
    has_activity_ = true;
  }

  /**
   * @brief Longest the loop may wait before something is due.
   *
   * The minimum of the idle budget (never below one second), the time
   * until the next throttled send, and the time until a wanted but
   * blocked connection may be retried.
   */
  uint64_t Timeout(uint64_t now_us) const noexcept {
    uint64_t wait = cfg_.idle_timeout_us;
    const uint64_t ref = IdleReferenceUs();
    if (has_activity_ || client_.LastOpenUs() != 0U) {
      const uint64_t since = (now_us > ref) ? (now_us - ref) : 0U;
      wait = (since < cfg_.idle_timeout_us) ? (cfg_.idle_timeout_us - since) : 0U;
    }
    if (wait < kMinIdleWaitUs) wait = kMinIdleWaitUs;

    if (client_.IsOpen() && client_.Queued() != 0U && client_.NextSendUs() > now_us) {
      const uint64_t until_send = client_.NextSendUs() - now_us;
      if (until_send < wait) wait = until_send;
    }
    if (!client_.IsOpen() && client_.DesiredOpen() && client_.NextOpenUs() > now_us) {
      const uint64_t until_open = client_.NextOpenUs() - now_us;
      if (until_open < wait) wait = until_open;
    }
    return wait;
  }

  /**
   * @brief Called when a wait expired with nothing ready.
   * @return true when the idle limit closed the connection.
   */
  bool TimedOut(uint64_t now_us) {
    if (!client_.IsOpen()) return false;
    const uint64_t ref = IdleReferenceUs();
    if (now_us < ref || now_us - ref < cfg_.idle_timeout_us) return false;

    RUDICS_LOG_INFO(logger_, "Session", "idle for %.0fs, closing connection",
                    static_cast<double>(now_us - ref) / kUsPerSec);
    client_.Close(now_us);
    client_.DiscardQueued();
    NoteActivity(now_us);
    return true;
  }

  bool WantOpen() const noexcept { return client_.DesiredOpen(); }
  uint64_t LastActivityUs() const noexcept { return last_activity_us_; }
  const LineAccumulator& PartialLine() const noexcept { return line_; }

  RudicsClient& Client() noexcept { return client_; }
  const RudicsClient& Client() const noexcept { return client_; }

 private:
  uint64_t IdleReferenceUs() const noexcept {
    const uint64_t opened = client_.LastOpenUs();
    return (last_activity_us_ > opened) ? last_activity_us_ : opened;
  }

  void EvaluateLine(uint64_t now_us) {
    if (client_.DesiredOpen()) {
      if (triggers_.off.Search(line_.Line())) {
        RUDICS_LOG_INFO(logger_, "Session", "off trigger seen, closing connection");
        client_.Close(now_us);
        client_.DiscardQueued();
      }
    } else if (triggers_.on.Search(line_.Line())) {
      RUDICS_LOG_INFO(logger_, "Session", "on trigger seen, opening connection");
      (void)client_.Open(now_us);
    }
  }

  SessionConfig cfg_;
  log::Logger& logger_;
  TriggerSet triggers_;
  LineAccumulator line_;
  RudicsClient client_;
  uint64_t last_activity_us_ = 0U;
  bool has_activity_ = false;
};

}  // namespace rudics

#endif  // RUDICS_SESSION_HPP_
