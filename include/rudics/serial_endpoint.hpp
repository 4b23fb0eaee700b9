/**
 * @file serial_endpoint.hpp
 * @brief Raw byte-stream serial endpoint (termios + open/read/write).
 *
 * The glider side of the bridge. Bytes written toward the device are
 * queued and released one at a time so a real line is never overrun.
 * Transport errors close the endpoint and are logged; they never escape
 * as return values the caller has to unwind.
 */

#ifndef RUDICS_SERIAL_ENDPOINT_HPP_
#define RUDICS_SERIAL_ENDPOINT_HPP_

#include "rudics/byte_queue.hpp"
#include "rudics/log.hpp"
#include "rudics/platform.hpp"
#include "rudics/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

namespace rudics {

// ============================================================================
// Serial Error / Line Settings
// ============================================================================

enum class SerialError : uint8_t {
  kOpenFailed,
  kConfigFailed,
  kInvalidConfig,
};

enum class Parity : uint8_t {
  kNone = 0U,
  kOdd,
  kEven,
  kMark,
  kSpace,
};

enum class StopBits : uint8_t {
  kOne = 0U,
  kOnePointFive,
  kTwo,
};

struct SerialConfig {
  std::string device = "/dev/ttyS0";
  uint32_t baud_rate = 115200U;
  uint8_t byte_size = 8U;   ///< 5..8
  Parity parity = Parity::kNone;
  StopBits stop_bits = StopBits::kOne;
};

/** @brief Parse "N"/"O"/"E"/"M"/"S" (or the full words), case-insensitive. */
inline optional<Parity> ParseParity(const char* s) noexcept {
  if (s == nullptr || s[0] == '\0') return {};
  switch (s[0]) {
    case 'n': case 'N': return Parity::kNone;
    case 'o': case 'O': return Parity::kOdd;
    case 'e': case 'E': return Parity::kEven;
    case 'm': case 'M': return Parity::kMark;
    case 's': case 'S': return Parity::kSpace;
    default: return {};
  }
}

/** @brief Parse "1", "1.5" or "2". */
inline optional<StopBits> ParseStopBits(double v) noexcept {
  if (v == 1.0) return StopBits::kOne;
  if (v == 1.5) return StopBits::kOnePointFive;
  if (v == 2.0) return StopBits::kTwo;
  return {};
}

// ============================================================================
// SerialEndpoint
// ============================================================================

class SerialEndpoint {
 public:
  SerialEndpoint(const SerialConfig& cfg, log::Logger& logger)
      : cfg_(cfg), logger_(logger), fd_(-1) {}

  ~SerialEndpoint() { Close(); }

  SerialEndpoint(const SerialEndpoint&) = delete;
  SerialEndpoint& operator=(const SerialEndpoint&) = delete;

  /// @brief Open the device and put it in raw mode with the configured line settings.
  expected<void, SerialError> Open() noexcept {
    if (fd_ >= 0) {
      return expected<void, SerialError>::success();
    }
    if (cfg_.byte_size < 5U || cfg_.byte_size > 8U ||
        !BaudToSpeed(cfg_.baud_rate).has_value()) {
      RUDICS_LOG_ERROR(logger_, "Serial", "invalid line settings for %s: baud=%u bytesize=%u",
                       cfg_.device.c_str(), cfg_.baud_rate,
                       static_cast<unsigned>(cfg_.byte_size));
      return expected<void, SerialError>::error(SerialError::kInvalidConfig);
    }

    fd_ = ::open(cfg_.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0) {
      RUDICS_LOG_ERROR(logger_, "Serial", "open %s failed: %s",
                       cfg_.device.c_str(), std::strerror(errno));
      return expected<void, SerialError>::error(SerialError::kOpenFailed);
    }

    auto r = ConfigurePort();
    if (!r) {
      RUDICS_LOG_ERROR(logger_, "Serial", "configure %s failed: %s",
                       cfg_.device.c_str(), std::strerror(errno));
      ::close(fd_);
      fd_ = -1;
      return r;
    }

    RUDICS_LOG_INFO(logger_, "Serial",
                    "opened %s baud=%u parity=%c bytesize=%u stopbits=%s",
                    cfg_.device.c_str(), cfg_.baud_rate, ParityChar(cfg_.parity),
                    static_cast<unsigned>(cfg_.byte_size),
                    StopBitsName(cfg_.stop_bits));
    return expected<void, SerialError>::success();
  }

  /// @brief Release the device. Safe to call any number of times.
  void Close() noexcept {
    if (fd_ < 0) return;
    if (::close(fd_) != 0) {
      RUDICS_LOG_WARN(logger_, "Serial", "close %s: %s", cfg_.device.c_str(),
                      std::strerror(errno));
    }
    fd_ = -1;
    RUDICS_LOG_INFO(logger_, "Serial", "closed %s", cfg_.device.c_str());
  }

  bool IsOpen() const noexcept { return fd_ >= 0; }
  int Fd() const noexcept { return fd_; }
  const std::string& Device() const noexcept { return cfg_.device; }

  /// Open and willing to take more input from the device.
  bool Readable() const noexcept { return fd_ >= 0; }

  /// Open with bytes waiting to go to the device.
  bool Writable() const noexcept { return fd_ >= 0 && !out_.Empty(); }

  void EnqueueOut(const uint8_t* data, size_t len) { out_.Append(data, len); }
  size_t PendingOut() const noexcept { return out_.Size(); }

  /**
   * @brief Read up to max bytes from the device into buf.
   *
   * End of file and read errors close the endpoint.
   */
  IoResult DrainRead(uint8_t* buf, size_t max) noexcept {
    if (fd_ < 0) return IoResult{0U, IoStatus::kClosed};
    const ssize_t n = ::read(fd_, buf, max);
    if (n > 0) return IoResult{static_cast<size_t>(n), IoStatus::kOk};
    if (n == 0) {
      RUDICS_LOG_INFO(logger_, "Serial", "EOF on %s", cfg_.device.c_str());
      Close();
      return IoResult{0U, IoStatus::kClosed};
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return IoResult{0U, IoStatus::kWouldBlock};
    }
    RUDICS_LOG_ERROR(logger_, "Serial", "read %s failed: %s",
                     cfg_.device.c_str(), std::strerror(errno));
    Close();
    return IoResult{0U, IoStatus::kClosed};
  }

  /// @brief Write the front byte of the outbound queue.
  IoResult SendOne() noexcept {
    if (fd_ < 0) return IoResult{0U, IoStatus::kClosed};
    if (out_.Empty()) return IoResult{0U, IoStatus::kOk};
    const uint8_t byte = out_.Front();
    const ssize_t n = ::write(fd_, &byte, 1U);
    if (n == 1) {
      out_.Consume(1U);
      return IoResult{1U, IoStatus::kOk};
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
      return IoResult{0U, IoStatus::kWouldBlock};
    }
    RUDICS_LOG_ERROR(logger_, "Serial", "write %s failed: %s",
                     cfg_.device.c_str(),
                     (n < 0) ? std::strerror(errno) : "zero-length write");
    Close();
    return IoResult{0U, IoStatus::kClosed};
  }

  /// @brief Convert baud rate to termios speed_t; empty for unsupported rates.
  static optional<speed_t> BaudToSpeed(uint32_t baud) noexcept {
    switch (baud) {
      case 1200U: return static_cast<speed_t>(B1200);
      case 2400U: return static_cast<speed_t>(B2400);
      case 4800U: return static_cast<speed_t>(B4800);
      case 9600U: return static_cast<speed_t>(B9600);
      case 19200U: return static_cast<speed_t>(B19200);
      case 38400U: return static_cast<speed_t>(B38400);
      case 57600U: return static_cast<speed_t>(B57600);
      case 115200U: return static_cast<speed_t>(B115200);
      case 230400U: return static_cast<speed_t>(B230400);
#ifdef B460800
      case 460800U: return static_cast<speed_t>(B460800);
#endif
#ifdef B921600
      case 921600U: return static_cast<speed_t>(B921600);
#endif
      default: return {};
    }
  }

 private:
  expected<void, SerialError> ConfigurePort() noexcept {
    struct termios tio;
    std::memset(&tio, 0, sizeof(tio));

    if (::tcgetattr(fd_, &tio) != 0) {
      return expected<void, SerialError>::error(SerialError::kConfigFailed);
    }

    // Raw mode
    tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR |
                      IGNCR | ICRNL | IXON | IXOFF | IXANY));
    tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
    tio.c_lflag &= static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
    tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB | CMSPAR));
    tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD);

    switch (cfg_.byte_size) {
      case 5U: tio.c_cflag |= CS5; break;
      case 6U: tio.c_cflag |= CS6; break;
      case 7U: tio.c_cflag |= CS7; break;
      default: tio.c_cflag |= CS8; break;
    }

    switch (cfg_.parity) {
      case Parity::kOdd:
        tio.c_cflag |= static_cast<tcflag_t>(PARENB | PARODD);
        break;
      case Parity::kEven:
        tio.c_cflag |= PARENB;
        break;
      case Parity::kMark:
        tio.c_cflag |= static_cast<tcflag_t>(PARENB | CMSPAR | PARODD);
        break;
      case Parity::kSpace:
        tio.c_cflag |= static_cast<tcflag_t>(PARENB | CMSPAR);
        break;
      default:
        break;
    }

    // termios has no 1.5 stop bits; the UART uses 1.5 for 5-bit bytes when CSTOPB is set.
    if (cfg_.stop_bits != StopBits::kOne) {
      tio.c_cflag |= CSTOPB;
    }

    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    const speed_t speed = BaudToSpeed(cfg_.baud_rate).value();
    if (::cfsetispeed(&tio, speed) != 0 || ::cfsetospeed(&tio, speed) != 0) {
      return expected<void, SerialError>::error(SerialError::kConfigFailed);
    }

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
      return expected<void, SerialError>::error(SerialError::kConfigFailed);
    }
    if (::tcflush(fd_, TCIOFLUSH) != 0) {
      return expected<void, SerialError>::error(SerialError::kConfigFailed);
    }
    return expected<void, SerialError>::success();
  }

  static char ParityChar(Parity p) noexcept {
    static constexpr char kChars[] = {'N', 'O', 'E', 'M', 'S'};
    return kChars[static_cast<uint8_t>(p)];
  }

  static const char* StopBitsName(StopBits s) noexcept {
    switch (s) {
      case StopBits::kOnePointFive: return "1.5";
      case StopBits::kTwo: return "2";
      default: return "1";
    }
  }

  SerialConfig cfg_;
  log::Logger& logger_;
  int fd_;
  ByteQueue out_;
};

}  // namespace rudics

#endif  // RUDICS_SERIAL_ENDPOINT_HPP_
