/**
 * @file io_poller.hpp
 * @brief Level-triggered readiness poller over epoll.
 *
 * The bridge loop recomputes its interest set every iteration, so the
 * poller offers Watch(fd, events) which adds, modifies or removes a
 * registration in one call. Registrations of a closed fd vanish with the
 * fd; Forget() on such an fd is not an error.
 */

#ifndef RUDICS_IO_POLLER_HPP_
#define RUDICS_IO_POLLER_HPP_

#include "rudics/platform.hpp"
#include "rudics/vocabulary.hpp"

#include <cerrno>
#include <cstdint>

#include <sys/epoll.h>
#include <unistd.h>

namespace rudics {

enum class PollerError : uint8_t {
  kWatchFailed = 0,
  kWaitFailed,
};

enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kWritable = 0x02,
  kError = 0x04,
  kHangup = 0x08,
};

inline constexpr bool HasEvent(uint8_t mask, IoEvent ev) noexcept {
  return (mask & static_cast<uint8_t>(ev)) != 0U;
}

/// Ready slots per Wait(); the bridge never watches more than three fds.
#ifndef RUDICS_IO_POLLER_MAX_EVENTS
#define RUDICS_IO_POLLER_MAX_EVENTS 8U
#endif

class IoPoller {
 public:
  IoPoller() noexcept : epfd_(::epoll_create1(EPOLL_CLOEXEC)) {}

  ~IoPoller() {
    if (epfd_ >= 0) ::close(epfd_);
  }

  IoPoller(const IoPoller&) = delete;
  IoPoller& operator=(const IoPoller&) = delete;

  bool IsValid() const noexcept { return epfd_ >= 0; }

  /**
   * @brief Make fd's interest exactly events (kReadable | kWritable).
   *
   * An empty mask forgets the fd. The fd is added if it is not yet known.
   */
  expected<void, PollerError> Watch(int fd, uint8_t events) {
    if (events == 0U) return Forget(fd);
    struct epoll_event ev {};
    ev.events = 0U;
    if (HasEvent(events, IoEvent::kReadable)) ev.events |= EPOLLIN;
    if (HasEvent(events, IoEvent::kWritable)) ev.events |= EPOLLOUT;
    ev.data.fd = fd;

    if (::epoll_ctl(epfd_, EPOLL_CTL_MOD, fd, &ev) != 0 &&
        (errno != ENOENT || ::epoll_ctl(epfd_, EPOLL_CTL_ADD, fd, &ev) != 0)) {
      return expected<void, PollerError>::error(PollerError::kWatchFailed);
    }
    return expected<void, PollerError>::success();
  }

  /// Unknown, negative or already closed fds are fine.
  expected<void, PollerError> Forget(int fd) {
    if (fd < 0) return expected<void, PollerError>::success();
    if (::epoll_ctl(epfd_, EPOLL_CTL_DEL, fd, nullptr) != 0 && errno != ENOENT &&
        errno != EBADF) {
      return expected<void, PollerError>::error(PollerError::kWatchFailed);
    }
    return expected<void, PollerError>::success();
  }

  /**
   * @brief Block up to timeout_ms (-1 forever) for readiness.
   * @return number of ready fds; an interrupted wait counts as zero.
   */
  expected<uint32_t, PollerError> Wait(int32_t timeout_ms) {
    const int n = ::epoll_wait(epfd_, ready_,
                               static_cast<int>(RUDICS_IO_POLLER_MAX_EVENTS), timeout_ms);
    if (n < 0) {
      ready_count_ = 0U;
      if (errno == EINTR) return expected<uint32_t, PollerError>::success(0U);
      return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
    }
    ready_count_ = static_cast<uint32_t>(n);
    return expected<uint32_t, PollerError>::success(ready_count_);
  }

  /// IoEvent mask the last Wait() reported for fd, 0 when it was not ready.
  uint8_t EventsFor(int fd) const noexcept {
    if (fd < 0) return 0U;
    for (uint32_t i = 0; i < ready_count_; ++i) {
      if (ready_[i].data.fd != fd) continue;
      const uint32_t e = ready_[i].events;
      uint8_t mask = 0U;
      if ((e & EPOLLIN) != 0U) mask |= static_cast<uint8_t>(IoEvent::kReadable);
      if ((e & EPOLLOUT) != 0U) mask |= static_cast<uint8_t>(IoEvent::kWritable);
      if ((e & EPOLLERR) != 0U) mask |= static_cast<uint8_t>(IoEvent::kError);
      if ((e & EPOLLHUP) != 0U) mask |= static_cast<uint8_t>(IoEvent::kHangup);
      return mask;
    }
    return 0U;
  }

 private:
  int epfd_;
  struct epoll_event ready_[RUDICS_IO_POLLER_MAX_EVENTS] = {};
  uint32_t ready_count_ = 0U;
};

}  // namespace rudics

#endif  // RUDICS_IO_POLLER_HPP_
