/**
 * @file test_io_poller.cpp
 * @brief Tests for io_poller.hpp
 */

#include <catch2/catch_test_macros.hpp>
#include "rudics/io_poller.hpp"

#include <cstring>
#include <unistd.h>

namespace {

struct Pipe {
  int fds[2] = {-1, -1};
  Pipe() { (void)::pipe(fds); }
  ~Pipe() {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
  }
  int rd() const { return fds[0]; }
  int wr() const { return fds[1]; }
};

constexpr uint8_t kRead = static_cast<uint8_t>(rudics::IoEvent::kReadable);
constexpr uint8_t kWrite = static_cast<uint8_t>(rudics::IoEvent::kWritable);

}  // namespace

TEST_CASE("io_poller - construction and Forget", "[io_poller]") {
  rudics::IoPoller poller;
  REQUIRE(poller.IsValid());

  Pipe p;
  // Unknown and negative fds are not errors
  REQUIRE(poller.Forget(p.rd()).has_value());
  REQUIRE(poller.Forget(-1).has_value());

  REQUIRE(poller.Watch(p.rd(), kRead).has_value());
  REQUIRE(poller.Forget(p.rd()).has_value());
  REQUIRE(poller.Forget(p.rd()).has_value());
}

TEST_CASE("io_poller - Watch on a bad fd fails", "[io_poller]") {
  rudics::IoPoller poller;
  auto r = poller.Watch(-1, kRead);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == rudics::PollerError::kWatchFailed);
}

// ============================================================================
// Wait
// ============================================================================

TEST_CASE("io_poller - Wait non-blocking returns 0 when no events", "[io_poller]") {
  rudics::IoPoller poller;
  Pipe p;
  REQUIRE(poller.Watch(p.rd(), kRead).has_value());

  auto r = poller.Wait(0);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 0U);
  REQUIRE(poller.EventsFor(p.rd()) == 0U);
}

TEST_CASE("io_poller - readable event on pipe", "[io_poller]") {
  rudics::IoPoller poller;
  Pipe p;
  REQUIRE(poller.Watch(p.rd(), kRead).has_value());

  const char msg = 'x';
  REQUIRE(::write(p.wr(), &msg, 1) == 1);

  auto r = poller.Wait(100);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 1U);
  REQUIRE(rudics::HasEvent(poller.EventsFor(p.rd()), rudics::IoEvent::kReadable));
}

TEST_CASE("io_poller - level triggered reports again until drained", "[io_poller]") {
  rudics::IoPoller poller;
  Pipe p;
  REQUIRE(poller.Watch(p.rd(), kRead).has_value());
  const char msg = 'x';
  REQUIRE(::write(p.wr(), &msg, 1) == 1);

  REQUIRE(poller.Wait(100).value() == 1U);
  REQUIRE(poller.Wait(0).value() == 1U);

  char buf = 0;
  REQUIRE(::read(p.rd(), &buf, 1) == 1);
  REQUIRE(poller.Wait(0).value() == 0U);
}

// ============================================================================
// Watch
// ============================================================================

TEST_CASE("io_poller - Watch adds, modifies and removes", "[io_poller]") {
  rudics::IoPoller poller;
  Pipe p;

  // Add: write end is immediately writable
  REQUIRE(poller.Watch(p.wr(), kWrite).has_value());
  REQUIRE(poller.Wait(0).value() == 1U);
  REQUIRE(rudics::HasEvent(poller.EventsFor(p.wr()), rudics::IoEvent::kWritable));

  // Modify to readable-only: a write end is never readable
  REQUIRE(poller.Watch(p.wr(), kRead).has_value());
  REQUIRE(poller.Wait(0).value() == 0U);

  // Remove
  REQUIRE(poller.Watch(p.wr(), 0U).has_value());
  REQUIRE(poller.Watch(p.wr(), kWrite).has_value());
  REQUIRE(poller.Wait(0).value() == 1U);
}

TEST_CASE("io_poller - closed fd drops its registration", "[io_poller]") {
  rudics::IoPoller poller;
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  REQUIRE(poller.Watch(fds[1], kWrite).has_value());
  ::close(fds[1]);
  ::close(fds[0]);

  // A new pipe may reuse the numbers; Watch must re-add it.
  Pipe p;
  REQUIRE(poller.Watch(p.wr(), kWrite).has_value());
  REQUIRE(poller.Wait(0).value() == 1U);
}

TEST_CASE("io_poller - hangup when the write end closes", "[io_poller]") {
  rudics::IoPoller poller;
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  REQUIRE(poller.Watch(fds[0], kRead).has_value());
  ::close(fds[1]);

  REQUIRE(poller.Wait(100).value() == 1U);
  REQUIRE(rudics::HasEvent(poller.EventsFor(fds[0]), rudics::IoEvent::kHangup));
  ::close(fds[0]);
}
