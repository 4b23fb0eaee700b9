/**
 * @file test_rudics_client.cpp
 * @brief Tests for rudics_client.hpp against a loopback listener.
 */

#include "rudics/rudics_client.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>
#include <vector>

using rudics::ClientState;
using rudics::kUsPerSec;

namespace {

rudics::RudicsClientConfig LoopbackConfig(uint16_t port) {
  rudics::RudicsClientConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = port;
  cfg.reconnect_delay_us = 120U * kUsPerSec;
  cfg.reconnect_spacing_us = 10U * kUsPerSec;
  cfg.connect_timeout_ms = 1000;
  return cfg;
}

/// A port nothing listens on.
uint16_t DeadPort() {
  auto server = test_support::ListenLoopback();
  const uint16_t port = server.Port();
  server.Close();
  return port;
}

constexpr uint64_t kT0 = 1000U * kUsPerSec;

}  // namespace

TEST_CASE("rudics_client - starts closed and unwanted", "[rudics_client]") {
  rudics::RudicsClient client(LoopbackConfig(6565U), test_support::QuietLogger());
  REQUIRE(client.State() == ClientState::kClosed);
  REQUIRE(!client.IsOpen());
  REQUIRE(client.Fd() < 0);
  REQUIRE(client.BackoffGapUs() == 120U * kUsPerSec);
}

TEST_CASE("rudics_client - Open connects and records the open", "[rudics_client]") {
  auto server = test_support::ListenLoopback();
  REQUIRE(server.IsOpen());
  rudics::RudicsClient client(LoopbackConfig(server.Port()), test_support::QuietLogger());

  REQUIRE(client.Open(kT0));
  REQUIRE(client.State() == ClientState::kOpen);
  REQUIRE(client.DesiredOpen());
  REQUIRE(client.LastOpenUs() == kT0);
  REQUIRE(client.OpenCount() == 1U);
  REQUIRE(client.Fd() >= 0);

  auto peer = server.Accept();
  REQUIRE(peer.has_value());

  // Already open: no second connection
  REQUIRE(client.Open(kT0 + 1U));
  REQUIRE(client.OpenCount() == 1U);
}

TEST_CASE("rudics_client - Close is idempotent", "[rudics_client]") {
  auto server = test_support::ListenLoopback();
  rudics::RudicsClient client(LoopbackConfig(server.Port()), test_support::QuietLogger());
  REQUIRE(client.Open(kT0));

  client.Close(kT0 + 5U * kUsPerSec);
  REQUIRE(client.State() == ClientState::kClosed);
  const uint64_t closed_at = client.LastCloseUs();
  const uint64_t next_open = client.NextOpenUs();
  REQUIRE(closed_at == kT0 + 5U * kUsPerSec);
  REQUIRE(next_open == closed_at + client.BackoffGapUs());

  client.Close(kT0 + 50U * kUsPerSec);
  REQUIRE(client.State() == ClientState::kClosed);
  REQUIRE(client.LastCloseUs() == closed_at);
  REQUIRE(client.NextOpenUs() == next_open);
}

TEST_CASE("rudics_client - Open before backoff expiry stays wanted", "[rudics_client]") {
  auto server = test_support::ListenLoopback();
  rudics::RudicsClient client(LoopbackConfig(server.Port()), test_support::QuietLogger());
  REQUIRE(client.Open(kT0));
  client.Close(kT0);

  REQUIRE(!client.Open(kT0 + kUsPerSec));
  REQUIRE(client.State() == ClientState::kOpeningBlocked);
  REQUIRE(client.DesiredOpen());
  REQUIRE(client.OpenCount() == 1U);

  // Readiness drives the retry once the gap has passed
  REQUIRE(!client.WantsRead(client.NextOpenUs() - 1U));
  REQUIRE(client.WantsRead(client.NextOpenUs()));
  REQUIRE(client.State() == ClientState::kOpen);
  REQUIRE(client.OpenCount() == 2U);
}

TEST_CASE("rudics_client - gap is the larger of delay and spacing", "[rudics_client]") {
  auto cfg = LoopbackConfig(1U);
  cfg.reconnect_delay_us = 3U * kUsPerSec;
  cfg.reconnect_spacing_us = 7U * kUsPerSec;
  rudics::RudicsClient client(cfg, test_support::QuietLogger());
  REQUIRE(client.BackoffGapUs() == 7U * kUsPerSec);
}

TEST_CASE("rudics_client - connect failure applies backoff", "[rudics_client]") {
  rudics::RudicsClient client(LoopbackConfig(DeadPort()), test_support::QuietLogger());

  REQUIRE(!client.Open(kT0));
  REQUIRE(client.ConnectFailures() == 1U);
  REQUIRE(client.State() == ClientState::kOpeningBlocked);
  REQUIRE(client.NextOpenUs() == kT0 + client.BackoffGapUs());

  // No new attempt inside the gap
  REQUIRE(!client.WantsRead(kT0 + kUsPerSec));
  REQUIRE(client.ConnectFailures() == 1U);
}

TEST_CASE("rudics_client - backoff is monotonic across closes", "[rudics_client]") {
  auto server = test_support::ListenLoopback();
  auto cfg = LoopbackConfig(server.Port());
  cfg.reconnect_delay_us = 2U * kUsPerSec;
  cfg.reconnect_spacing_us = kUsPerSec;
  rudics::RudicsClient client(cfg, test_support::QuietLogger());

  // Close times deliberately not increasing
  const uint64_t close_times[] = {kT0, kT0 + 10U * kUsPerSec, kT0 + 3U * kUsPerSec,
                                  kT0 + 30U * kUsPerSec, kT0 + 31U * kUsPerSec};
  uint64_t prev_next = 0U;
  for (uint64_t t : close_times) {
    const uint64_t open_at = (client.NextOpenUs() > t) ? client.NextOpenUs() : t;
    REQUIRE(client.Open(open_at));
    auto peer = server.Accept();
    REQUIRE(peer.has_value());
    client.Fail(t, "test");
    REQUIRE(client.NextOpenUs() >= prev_next);
    REQUIRE(client.NextOpenUs() >= t + client.BackoffGapUs());
    prev_next = client.NextOpenUs();
  }
}

TEST_CASE("rudics_client - unthrottled send delivers the whole queue", "[rudics_client]") {
  auto server = test_support::ListenLoopback();
  rudics::RudicsClient client(LoopbackConfig(server.Port()), test_support::QuietLogger());
  REQUIRE(client.Open(kT0));
  auto peer_r = server.Accept();
  REQUIRE(peer_r.has_value());
  auto peer = std::move(peer_r.value());

  const uint8_t msg[] = {'h', 'e', 'l', 'l', 'o'};
  client.Enqueue(msg, sizeof(msg));
  REQUIRE(client.WantsWrite(kT0));

  auto r = client.Send(kT0);
  REQUIRE(r.status == rudics::IoStatus::kOk);
  REQUIRE(r.bytes == 5U);
  REQUIRE(client.Queued() == 0U);
  REQUIRE(!client.WantsWrite(kT0));
  REQUIRE(test_support::ReadSocket(peer, 5U) == "hello");
}

TEST_CASE("rudics_client - throttled send honours the limiter", "[rudics_client]") {
  auto server = test_support::ListenLoopback();
  auto cfg = LoopbackConfig(server.Port());
  cfg.baud_rate_limit = 9000U;  // one byte per millisecond
  rudics::RudicsClient client(cfg, test_support::QuietLogger());
  REQUIRE(client.Open(kT0));
  auto peer_r = server.Accept();
  REQUIRE(peer_r.has_value());
  auto peer = std::move(peer_r.value());

  const uint8_t msg[] = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};
  client.Enqueue(msg, sizeof(msg));

  // Just opened: nothing has accrued yet
  auto r0 = client.Send(kT0);
  REQUIRE(r0.status == rudics::IoStatus::kWouldBlock);
  REQUIRE(!client.WantsWrite(kT0 + 500U));

  auto r1 = client.Send(kT0 + 3000U);
  REQUIRE(r1.bytes == 3U);
  REQUIRE(client.Queued() == 7U);
  REQUIRE(test_support::ReadSocket(peer, 3U) == "012");
}

TEST_CASE("rudics_client - peer close drops and re-arms", "[rudics_client]") {
  auto server = test_support::ListenLoopback();
  rudics::RudicsClient client(LoopbackConfig(server.Port()), test_support::QuietLogger());
  REQUIRE(client.Open(kT0));
  {
    auto peer = server.Accept();
    REQUIRE(peer.has_value());
    peer.value().Close();
  }

  REQUIRE(test_support::WaitReadable(client.Fd(), 1000));
  uint8_t buf[64];
  auto r = client.Recv(buf, sizeof(buf), kT0 + kUsPerSec);
  REQUIRE(r.status == rudics::IoStatus::kClosed);
  REQUIRE(!client.IsOpen());
  REQUIRE(client.DesiredOpen());
  REQUIRE(client.State() == ClientState::kOpeningBlocked);
  REQUIRE(client.LastCloseUs() == kT0 + kUsPerSec);

  // Further I/O on the closed client reports closed without side effects
  auto r2 = client.Recv(buf, sizeof(buf), kT0 + 2U * kUsPerSec);
  REQUIRE(r2.status == rudics::IoStatus::kClosed);
  REQUIRE(client.LastCloseUs() == kT0 + kUsPerSec);
}

TEST_CASE("rudics_client - receive delivers peer bytes", "[rudics_client]") {
  auto server = test_support::ListenLoopback();
  rudics::RudicsClient client(LoopbackConfig(server.Port()), test_support::QuietLogger());
  REQUIRE(client.Open(kT0));
  auto peer_r = server.Accept();
  REQUIRE(peer_r.has_value());
  auto peer = std::move(peer_r.value());

  const char* reply = "login:";
  REQUIRE(peer.Send(reply, std::strlen(reply)).has_value());
  REQUIRE(test_support::WaitReadable(client.Fd(), 1000));

  uint8_t buf[64];
  auto r = client.Recv(buf, sizeof(buf), kT0);
  REQUIRE(r.status == rudics::IoStatus::kOk);
  REQUIRE(std::string(reinterpret_cast<char*>(buf), r.bytes) == "login:");
}
