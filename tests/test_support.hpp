/**
 * @file test_support.hpp
 * @brief Shared fixtures: quiet logger, PTY pairs, loopback dockserver.
 */

#ifndef RUDICS_TESTS_TEST_SUPPORT_HPP_
#define RUDICS_TESTS_TEST_SUPPORT_HPP_

#include "rudics/log.hpp"
#include "rudics/net.hpp"

#include <cerrno>
#include <cstdint>
#include <string>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <termios.h>
#include <unistd.h>

namespace test_support {

/// Logger that drops everything.
inline rudics::log::Logger& QuietLogger() {
  static rudics::log::Logger logger(rudics::log::Level::kOff);
  return logger;
}

// ============================================================================
// PTY pair
// ============================================================================

struct PtyPair {
  int master = -1;
  int slave = -1;
  char slave_name[64] = {};
  bool valid = false;
};

/// Raw-mode PTY; the master end is non-blocking for reading back.
inline PtyPair CreatePtyPair() {
  PtyPair p;
  if (::openpty(&p.master, &p.slave, p.slave_name, nullptr, nullptr) == 0) {
    struct termios tio;
    if (::tcgetattr(p.slave, &tio) == 0) {
      ::cfmakeraw(&tio);
      (void)::tcsetattr(p.slave, TCSANOW, &tio);
    }
    int flags = ::fcntl(p.master, F_GETFL, 0);
    ::fcntl(p.master, F_SETFL, flags | O_NONBLOCK);
    p.valid = true;
  }
  return p;
}

inline void ClosePty(PtyPair& p) {
  if (p.master >= 0) ::close(p.master);
  if (p.slave >= 0) ::close(p.slave);
  p.master = p.slave = -1;
  p.valid = false;
}

// ============================================================================
// fd helpers
// ============================================================================

inline bool WaitReadable(int fd, int timeout_ms) {
  struct pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  return ::poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN) != 0;
}

/// Read from a non-blocking fd until want bytes arrived or the time is up.
inline std::string ReadFd(int fd, size_t want, int timeout_ms = 1000) {
  std::string out;
  char buf[256];
  int waited = 0;
  while (out.size() < want && waited < timeout_ms) {
    if (!WaitReadable(fd, 10)) {
      waited += 10;
      continue;
    }
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<size_t>(n));
    } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
      break;
    }
  }
  return out;
}

/// Receive from an accepted connection until want bytes arrived or the time is up.
inline std::string ReadSocket(rudics::net::TcpClient& sock, size_t want,
                              int timeout_ms = 1000) {
  std::string out;
  char buf[256];
  int waited = 0;
  while (out.size() < want && waited < timeout_ms) {
    if (!WaitReadable(sock.Fd(), 10)) {
      waited += 10;
      continue;
    }
    auto r = sock.Recv(buf, sizeof(buf));
    if (!r || r.value() == 0U) break;
    out.append(buf, r.value());
  }
  return out;
}

// ============================================================================
// Loopback dockserver
// ============================================================================

inline rudics::net::TcpServer ListenLoopback() {
  auto r = rudics::net::TcpServer::Listen("127.0.0.1", 0);
  if (!r) return rudics::net::TcpServer();
  return std::move(r.value());
}

}  // namespace test_support

#endif  // RUDICS_TESTS_TEST_SUPPORT_HPP_
