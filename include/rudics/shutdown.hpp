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
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM stop request delivered through a self-pipe.
 *
 * The read end of the pipe is handed to the bridge loop as its stop fd;
 * a signal makes it readable and the loop returns on its next wakeup.
 * Only one instance may be live per process because the signal handler
 * has to find it through a static pointer.
 */

#ifndef RUDICS_SHUTDOWN_HPP_
#define RUDICS_SHUTDOWN_HPP_

#include "rudics/platform.hpp"
#include "rudics/vocabulary.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <unistd.h>

namespace rudics {

enum class ShutdownError : uint8_t {
  kPipeCreationFailed = 0,
  kSignalInstallFailed,
  kAlreadyInstantiated,
};

class StopSignal final {
 public:
  /// An instance created while another is live stays invalid.
  StopSignal() noexcept {
    if (Current() != nullptr) return;
    if (::pipe2(fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
      fds_[0] = fds_[1] = -1;
      return;
    }
    Current() = this;
  }

  ~StopSignal() {
    if (Current() == this) Current() = nullptr;
    for (int fd : fds_) {
      if (fd >= 0) ::close(fd);
    }
  }

  StopSignal(const StopSignal&) = delete;
  StopSignal& operator=(const StopSignal&) = delete;

  bool IsValid() const noexcept { return Current() == this; }

  /**
   * @brief Route SIGINT and SIGTERM here and ignore SIGPIPE.
   *
   * A dockserver that drops the connection mid-write then shows up as a
   * failed send.
   */
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    using Result = expected<void, ShutdownError>;
    if (!IsValid()) return Result::error(ShutdownError::kAlreadyInstantiated);

    struct sigaction stop {};
    stop.sa_handler = &StopSignal::OnSignal;
    ::sigemptyset(&stop.sa_mask);
    stop.sa_flags = SA_RESTART;

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    ::sigemptyset(&ignore.sa_mask);

    if (::sigaction(SIGINT, &stop, nullptr) != 0 ||
        ::sigaction(SIGTERM, &stop, nullptr) != 0 ||
        ::sigaction(SIGPIPE, &ignore, nullptr) != 0) {
      return Result::error(ShutdownError::kSignalInstallFailed);
    }
    return Result::success();
  }

  /// Ask for a stop without a signal; only the first request is kept.
  void Quit(int signo = 0) noexcept { Request(signo); }

  bool IsStopRequested() const noexcept { return requested_.load(); }

  /// Signal that caused the stop, 0 for Quit().
  int Signal() const noexcept { return signo_.load(); }

  /// Readable once a stop was requested; -1 on an invalid instance.
  int ReadFd() const noexcept { return fds_[0]; }

 private:
  static StopSignal*& Current() noexcept {
    static StopSignal* current = nullptr;
    return current;
  }

  // Runs in signal context: lock-free atomics and write(2) only.
  static void OnSignal(int signo) {
    StopSignal* self = Current();
    if (self != nullptr) self->Request(signo);
  }

  void Request(int signo) noexcept {
    bool expected_flag = false;
    if (!requested_.compare_exchange_strong(expected_flag, true)) return;
    signo_.store(signo);
    if (fds_[1] >= 0) {
      const uint8_t byte = 1U;
      (void)::write(fds_[1], &byte, 1U);
    }
  }

  std::atomic<bool> requested_{false};
  std::atomic<int> signo_{0};
  int fds_[2] = {-1, -1};
};

}  // namespace rudics

#endif  // RUDICS_SHUTDOWN_HPP_
