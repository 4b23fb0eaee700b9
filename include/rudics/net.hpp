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
 * @file net.hpp
 * @brief sockpp-backed TCP sockets for the dockserver leg.
 *
 * TcpClient is the bridge's outgoing RUDICS connection. TcpServer only
 * exists so tests and local stand-ins can play the dockserver. Both own
 * their socket and are move-only; failures come back as NetError.
 */

#ifndef RUDICS_NET_HPP_
#define RUDICS_NET_HPP_

#include "rudics/platform.hpp"
#include "rudics/vocabulary.hpp"

#include <sockpp/inet_address.h>
#include <sockpp/socket.h>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/tcp_connector.h>
#include <sockpp/tcp_socket.h>

#include <chrono>
#include <cstdint>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace rudics {
namespace net {

enum class NetError : uint8_t {
  kConnectFailed = 0,
  kListenFailed,
  kAcceptFailed,
  kSendFailed,
  kRecvFailed,
  kClosed,
  kInvalidAddress,
};

inline const char* NetErrorName(NetError e) noexcept {
  static constexpr const char* kNames[] = {
      "connect failed", "listen failed", "accept failed", "send failed",
      "recv failed",    "socket closed", "invalid address",
  };
  const auto i = static_cast<size_t>(e);
  return (i < sizeof(kNames) / sizeof(kNames[0])) ? kNames[i] : "unknown";
}

/// @brief Process-wide sockpp setup, run once; it also ignores SIGPIPE.
inline void EnsureInitialized() {
  static const bool kInitialized = [] {
    sockpp::initialize();
    return true;
  }();
  (void)kInitialized;
}

// ============================================================================
// TcpClient
// ============================================================================

class TcpClient {
 public:
  TcpClient() noexcept = default;
  TcpClient(TcpClient&&) noexcept = default;
  TcpClient& operator=(TcpClient&&) noexcept = default;
  TcpClient(const TcpClient&) = delete;
  TcpClient& operator=(const TcpClient&) = delete;

  /**
   * @brief Dial host:port.
   * @param timeout_ms Bound on the connect; 0 waits for the kernel's own timeout.
   */
  static expected<TcpClient, NetError> Connect(const char* host, uint16_t port,
                                               int32_t timeout_ms = 5000) noexcept {
    using Result = expected<TcpClient, NetError>;
    EnsureInitialized();
    auto addr = sockpp::inet_address::create(host, port);
    if (!addr) return Result::error(NetError::kInvalidAddress);

    sockpp::tcp_connector conn;
    const auto res = (timeout_ms > 0)
                         ? conn.connect(addr.value(), std::chrono::milliseconds(timeout_ms))
                         : conn.connect(addr.value());
    if (!res) return Result::error(NetError::kConnectFailed);
    return Result::success(TcpClient(std::move(conn)));
  }

  /// @return bytes the kernel took, possibly fewer than len.
  expected<size_t, NetError> Send(const void* data, size_t len) noexcept {
    if (!sock_.is_open()) return expected<size_t, NetError>::error(NetError::kClosed);
    auto res = sock_.write(data, len);
    if (!res) return expected<size_t, NetError>::error(NetError::kSendFailed);
    return expected<size_t, NetError>::success(res.value());
  }

  /// @return bytes read; 0 once the peer has shut the connection down.
  expected<size_t, NetError> Recv(void* buf, size_t len) noexcept {
    if (!sock_.is_open()) return expected<size_t, NetError>::error(NetError::kClosed);
    auto res = sock_.read(buf, len);
    if (!res) return expected<size_t, NetError>::error(NetError::kRecvFailed);
    return expected<size_t, NetError>::success(res.value());
  }

  bool IsOpen() const noexcept { return sock_.is_open(); }
  int Fd() const noexcept { return sock_.is_open() ? sock_.handle() : -1; }

  void Close() noexcept {
    if (sock_.is_open()) (void)sock_.close();
  }

 private:
  friend class TcpServer;

  explicit TcpClient(sockpp::tcp_socket&& sock) noexcept : sock_(std::move(sock)) {}

  sockpp::tcp_socket sock_;
};

// ============================================================================
// TcpServer
// ============================================================================

class TcpServer {
 public:
  TcpServer() noexcept = default;
  TcpServer(TcpServer&&) noexcept = default;
  TcpServer& operator=(TcpServer&&) noexcept = default;
  TcpServer(const TcpServer&) = delete;
  TcpServer& operator=(const TcpServer&) = delete;

  /// @brief Bind and listen; port 0 lets the kernel choose, see Port().
  static expected<TcpServer, NetError> Listen(const char* host, uint16_t port,
                                              int32_t backlog = 4) noexcept {
    using Result = expected<TcpServer, NetError>;
    EnsureInitialized();
    auto addr = sockpp::inet_address::create(host, port);
    if (!addr) return Result::error(NetError::kInvalidAddress);

    TcpServer server;
    if (!server.acc_.open(addr.value(), backlog)) {
      return Result::error(NetError::kListenFailed);
    }
    return Result::success(std::move(server));
  }

  /// Blocks until a peer connects.
  expected<TcpClient, NetError> Accept() noexcept {
    using Result = expected<TcpClient, NetError>;
    if (!acc_.is_open()) return Result::error(NetError::kClosed);
    auto res = acc_.accept();
    if (!res) return Result::error(NetError::kAcceptFailed);
    return Result::success(TcpClient(res.release()));
  }

  /// Port actually bound, host order; 0 when not listening.
  uint16_t Port() const noexcept {
    if (!acc_.is_open()) return 0U;
    sockaddr_in sin{};
    socklen_t len = sizeof(sin);
    if (::getsockname(acc_.handle(), reinterpret_cast<sockaddr*>(&sin), &len) != 0) {
      return 0U;
    }
    return ntohs(sin.sin_port);
  }

  bool IsOpen() const noexcept { return acc_.is_open(); }
  int Fd() const noexcept { return acc_.is_open() ? acc_.handle() : -1; }

  void Close() noexcept {
    if (acc_.is_open()) (void)acc_.close();
  }

 private:
  sockpp::tcp_acceptor acc_;
};

}  // namespace net
}  // namespace rudics

#endif  // RUDICS_NET_HPP_
