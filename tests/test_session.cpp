/**
 * @file test_session.cpp
 * @brief Tests for session.hpp: trigger state machine, timeouts, idle close.
 */

#include "rudics/session.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>

using rudics::kUsPerSec;

namespace {

constexpr uint64_t kT0 = 5000U * kUsPerSec;

const char* const kSurfaceLine =
    "behavior surface_3: SUBSTATE 1 ->2 : Picking iridium or freewave\n";
const char* const kDiveLine = "surface_3: Waiting for final GPS fix\n";

rudics::TriggerSet DefaultTriggers() {
  auto r = rudics::TriggerSet::Compile({rudics::kDefaultOnPattern},
                                       {rudics::kDefaultOffPattern});
  REQUIRE(r.has_value());
  return std::move(r.value());
}

rudics::RudicsClientConfig ClientConfig(uint16_t port) {
  rudics::RudicsClientConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = port;
  cfg.reconnect_delay_us = 20U * kUsPerSec;
  cfg.reconnect_spacing_us = 10U * kUsPerSec;
  cfg.connect_timeout_ms = 1000;
  return cfg;
}

rudics::SessionConfig SessionConfig(bool start_open, uint64_t idle_s = 60U) {
  rudics::SessionConfig cfg;
  cfg.idle_timeout_us = idle_s * kUsPerSec;
  cfg.start_open = start_open;
  return cfg;
}

void Feed(rudics::SessionController& s, const std::string& text, uint64_t now) {
  for (char c : text) {
    s.Put(static_cast<uint8_t>(c), now);
  }
}

/// Open the client, push the queue out, and return what the peer saw.
std::string Flush(rudics::SessionController& s, rudics::net::TcpServer& server,
                  uint64_t now) {
  REQUIRE(s.Client().WantsRead(now));
  auto peer = server.Accept();
  REQUIRE(peer.has_value());
  const size_t queued = s.Client().Queued();
  while (s.Client().Queued() != 0U) {
    auto r = s.Client().Send(now);
    REQUIRE(r.status == rudics::IoStatus::kOk);
  }
  return test_support::ReadSocket(peer.value(), queued);
}

}  // namespace

// ============================================================================
// Byte routing
// ============================================================================

TEST_CASE("session - bytes while wanted are queued in order", "[session]") {
  auto server = test_support::ListenLoopback();
  rudics::SessionController s(SessionConfig(true), ClientConfig(server.Port()),
                              DefaultTriggers(), test_support::QuietLogger());
  REQUIRE(s.WantOpen());

  const std::string text = "GliderDos N -1 >\nhello dockserver";
  Feed(s, text, kT0);
  REQUIRE(s.Client().Queued() == text.size());
  REQUIRE(Flush(s, server, kT0) == text);
}

TEST_CASE("session - bytes while unwanted are dropped", "[session]") {
  rudics::SessionController s(SessionConfig(false), ClientConfig(1U),
                              DefaultTriggers(), test_support::QuietLogger());
  REQUIRE(!s.WantOpen());
  Feed(s, "diving, nobody listens\n", kT0);
  REQUIRE(s.Client().Queued() == 0U);
  REQUIRE(s.LastActivityUs() == kT0);
}

TEST_CASE("session - accumulator clears after every terminator", "[session]") {
  rudics::SessionController s(SessionConfig(false), ClientConfig(1U),
                              DefaultTriggers(), test_support::QuietLogger());
  Feed(s, "partial", kT0);
  REQUIRE(s.PartialLine().Size() == 7U);
  Feed(s, " line\n", kT0);
  REQUIRE(s.PartialLine().Size() == 0U);
  Feed(s, "\n\n", kT0);
  REQUIRE(s.PartialLine().Size() == 0U);
}

// ============================================================================
// Trigger transitions
// ============================================================================

TEST_CASE("session - on trigger opens the connection", "[session]") {
  auto server = test_support::ListenLoopback();
  rudics::SessionController s(SessionConfig(false), ClientConfig(server.Port()),
                              DefaultTriggers(), test_support::QuietLogger());

  Feed(s, kSurfaceLine, kT0);
  REQUIRE(s.WantOpen());
  REQUIRE(s.Client().IsOpen());
  REQUIRE(s.Client().LastOpenUs() == kT0);
  // The trigger line itself arrived while unwanted
  REQUIRE(s.Client().Queued() == 0U);

  auto peer = server.Accept();
  REQUIRE(peer.has_value());

  Feed(s, "after\n", kT0 + 1U);
  REQUIRE(s.Client().Queued() == 6U);
}

TEST_CASE("session - off trigger closes the connection", "[session]") {
  auto server = test_support::ListenLoopback();
  rudics::SessionController s(SessionConfig(true), ClientConfig(server.Port()),
                              DefaultTriggers(), test_support::QuietLogger());
  REQUIRE(s.Client().Open(kT0));
  auto peer = server.Accept();
  REQUIRE(peer.has_value());

  Feed(s, kDiveLine, kT0 + kUsPerSec);
  REQUIRE(!s.WantOpen());
  REQUIRE(!s.Client().IsOpen());
  REQUIRE(s.Client().State() == rudics::ClientState::kClosed);
  REQUIRE(s.Client().Queued() == 0U);
  REQUIRE(s.Client().LastCloseUs() == kT0 + kUsPerSec);

  // Readiness must not reconnect an unwanted client
  REQUIRE(!s.Client().WantsRead(kT0 + 100U * kUsPerSec));
}

TEST_CASE("session - off trigger while never connected just disarms", "[session]") {
  rudics::SessionController s(SessionConfig(true), ClientConfig(1U),
                              DefaultTriggers(), test_support::QuietLogger());
  Feed(s, kDiveLine, kT0);
  REQUIRE(!s.WantOpen());
  REQUIRE(s.Client().State() == rudics::ClientState::kClosed);
}

TEST_CASE("session - ambiguous lines keep the current state", "[session]") {
  rudics::SessionController closed(SessionConfig(false), ClientConfig(1U),
                                   DefaultTriggers(), test_support::QuietLogger());
  Feed(closed, kDiveLine, kT0);  // off phrase while already unwanted
  Feed(closed, "GliderDos I -3 >\n", kT0);
  REQUIRE(!closed.WantOpen());

  rudics::SessionController open(SessionConfig(true), ClientConfig(1U),
                                 DefaultTriggers(), test_support::QuietLogger());
  // on phrase while already wanted: no second open attempt
  Feed(open, kSurfaceLine, kT0);
  REQUIRE(open.WantOpen());
  REQUIRE(open.Client().ConnectFailures() == 0U);
}

TEST_CASE("session - surfacing cycle with reconnect spacing", "[session]") {
  auto server = test_support::ListenLoopback();
  rudics::SessionController s(SessionConfig(false), ClientConfig(server.Port()),
                              DefaultTriggers(), test_support::QuietLogger());

  Feed(s, kSurfaceLine, kT0);
  REQUIRE(s.Client().IsOpen());
  { auto peer = server.Accept(); REQUIRE(peer.has_value()); }

  Feed(s, kDiveLine, kT0 + kUsPerSec);
  REQUIRE(!s.Client().IsOpen());

  // Surfacing again too soon: wanted, but blocked by the gap
  Feed(s, kSurfaceLine, kT0 + 2U * kUsPerSec);
  REQUIRE(s.WantOpen());
  REQUIRE(s.Client().State() == rudics::ClientState::kOpeningBlocked);

  const uint64_t retry_at = s.Client().NextOpenUs();
  REQUIRE(retry_at == kT0 + kUsPerSec + s.Client().BackoffGapUs());
  REQUIRE(s.Client().WantsRead(retry_at));
  REQUIRE(s.Client().IsOpen());
}

// ============================================================================
// Timeout / idle
// ============================================================================

TEST_CASE("session - timeout before any activity is the idle limit", "[session]") {
  rudics::SessionController s(SessionConfig(false, 60U), ClientConfig(1U),
                              DefaultTriggers(), test_support::QuietLogger());
  REQUIRE(s.Timeout(kT0) == 60U * kUsPerSec);
}

TEST_CASE("session - idle budget shrinks and is floored at one second", "[session]") {
  rudics::SessionController s(SessionConfig(false, 60U), ClientConfig(1U),
                              DefaultTriggers(), test_support::QuietLogger());
  s.NoteActivity(kT0);
  REQUIRE(s.Timeout(kT0 + 20U * kUsPerSec) == 40U * kUsPerSec);
  REQUIRE(s.Timeout(kT0 + 59U * kUsPerSec + 500000U) == kUsPerSec);
  REQUIRE(s.Timeout(kT0 + 3600U * kUsPerSec) == kUsPerSec);
}

TEST_CASE("session - timeout includes the reconnect wait", "[session]") {
  auto dead = test_support::ListenLoopback();
  const uint16_t port = dead.Port();
  dead.Close();

  rudics::SessionController s(SessionConfig(true, 600U), ClientConfig(port),
                              DefaultTriggers(), test_support::QuietLogger());
  s.NoteActivity(kT0);
  REQUIRE(!s.Client().WantsRead(kT0));  // connect refused, gap starts
  REQUIRE(s.Client().State() == rudics::ClientState::kOpeningBlocked);
  REQUIRE(s.Timeout(kT0 + 5U * kUsPerSec) == s.Client().BackoffGapUs() - 5U * kUsPerSec);
}

TEST_CASE("session - timeout includes the next throttled send", "[session]") {
  auto server = test_support::ListenLoopback();
  auto cfg = ClientConfig(server.Port());
  cfg.baud_rate_limit = 9000U;
  rudics::SessionController s(SessionConfig(true, 600U), cfg, DefaultTriggers(),
                              test_support::QuietLogger());
  REQUIRE(s.Client().Open(kT0));
  auto peer = server.Accept();
  REQUIRE(peer.has_value());

  Feed(s, "abc", kT0);
  auto r = s.Client().Send(kT0);  // refused, pushes next send 1 ms out
  REQUIRE(r.bytes == 0U);
  REQUIRE(s.Timeout(kT0) == 1000U);
}

TEST_CASE("session - TimedOut closes only after the idle limit", "[session]") {
  auto server = test_support::ListenLoopback();
  rudics::SessionController s(SessionConfig(true, 60U), ClientConfig(server.Port()),
                              DefaultTriggers(), test_support::QuietLogger());
  REQUIRE(s.Client().Open(kT0));
  auto peer = server.Accept();
  REQUIRE(peer.has_value());

  REQUIRE(!s.TimedOut(kT0 + 30U * kUsPerSec));
  REQUIRE(s.Client().IsOpen());

  // Activity from the dockserver side also counts
  s.NoteActivity(kT0 + 30U * kUsPerSec);
  REQUIRE(!s.TimedOut(kT0 + 80U * kUsPerSec));
  REQUIRE(s.Client().IsOpen());

  REQUIRE(s.TimedOut(kT0 + 90U * kUsPerSec));
  REQUIRE(!s.Client().IsOpen());
  REQUIRE(!s.WantOpen());

  // Closed already: nothing more to do
  REQUIRE(!s.TimedOut(kT0 + 500U * kUsPerSec));
}

TEST_CASE("session - open time resets the idle reference", "[session]") {
  auto server = test_support::ListenLoopback();
  rudics::SessionController s(SessionConfig(true, 60U), ClientConfig(server.Port()),
                              DefaultTriggers(), test_support::QuietLogger());
  s.NoteActivity(kT0);
  REQUIRE(s.Client().Open(kT0 + 100U * kUsPerSec));
  auto peer = server.Accept();
  REQUIRE(peer.has_value());

  REQUIRE(!s.TimedOut(kT0 + 120U * kUsPerSec));
  REQUIRE(s.TimedOut(kT0 + 160U * kUsPerSec));
}
