/**
 * @file bridge_config.hpp
 * @brief Typed daemon configuration loaded from a ConfigStore.
 *
 * Sections and keys (defaults in parentheses):
 *
 *   [serial]     device, baud_rate (115200), parity (N), byte_size (8),
 *                stop_bits (1)
 *   [rudics]     host (localhost), port (6565), idle_timeout (3600 s),
 *                reconnect_delay (120 s), reconnect_spacing (10 s),
 *                on_trigger / off_trigger (lists), baud_rate_limit (0),
 *                initial_state (connected), terminator (\n),
 *                connect_timeout_ms (5000)
 *   [log]        level (info), file, max_bytes (10000000), backup_count (3)
 *   [transcript] file
 */

#ifndef RUDICS_BRIDGE_CONFIG_HPP_
#define RUDICS_BRIDGE_CONFIG_HPP_

#include "rudics/config.hpp"
#include "rudics/log.hpp"
#include "rudics/platform.hpp"
#include "rudics/rudics_client.hpp"
#include "rudics/serial_endpoint.hpp"
#include "rudics/session.hpp"
#include "rudics/trigger.hpp"
#include "rudics/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace rudics {

struct LogConfig {
  log::Level level = log::Level::kInfo;
  std::string file;  ///< empty = stderr
  uint64_t max_bytes = 10000000U;
  uint32_t backup_count = 3U;
};

struct BridgeConfig {
  SerialConfig serial;
  RudicsClientConfig client;
  SessionConfig session;
  std::vector<std::string> on_patterns{kDefaultOnPattern};
  std::vector<std::string> off_patterns{kDefaultOffPattern};
  LogConfig log;
  std::string transcript_file;  ///< empty = no transcript
};

namespace detail {

/// Accepts a single character, "\n", "\r", "\t", "\0" or "0xHH".
inline optional<uint8_t> ParseTerminator(const char* s) noexcept {
  if (s == nullptr || s[0] == '\0') return {};
  if (s[1] == '\0') return static_cast<uint8_t>(s[0]);
  if (s[0] == '\\' && s[2] == '\0') {
    switch (s[1]) {
      case 'n': return static_cast<uint8_t>('\n');
      case 'r': return static_cast<uint8_t>('\r');
      case 't': return static_cast<uint8_t>('\t');
      case '0': return static_cast<uint8_t>('\0');
      case '\\': return static_cast<uint8_t>('\\');
      default: return {};
    }
  }
  if (s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    char* end = nullptr;
    const unsigned long v = std::strtoul(s + 2, &end, 16);
    if (end != s + 2 && *end == '\0' && v <= 0xFFU) return static_cast<uint8_t>(v);
  }
  return {};
}

inline optional<bool> ParseInitialState(const char* s) noexcept {
  if (s == nullptr) return {};
  if (log::detail::CaseEqual(s, "connected") || log::detail::CaseEqual(s, "open") ||
      log::detail::CaseEqual(s, "on")) {
    return true;
  }
  if (log::detail::CaseEqual(s, "disconnected") || log::detail::CaseEqual(s, "closed") ||
      log::detail::CaseEqual(s, "off")) {
    return false;
  }
  return {};
}

/// Seconds in [0, kMaxDurationSec] (fractions allowed) to microseconds.
inline bool ReadSeconds(const ConfigStore& cfg, const char* section, const char* key,
                        uint64_t& out_us) {
  if (!cfg.HasKey(section, key)) return true;
  auto v = cfg.FindDouble(section, key);
  // Written so NaN fails too.
  if (!v.has_value() || !(v.value() >= 0.0 && v.value() <= kMaxDurationSec)) {
    return false;
  }
  out_us = SecondsToUs(v.value());
  return true;
}

inline bool ReadNonNegative(const ConfigStore& cfg, const char* section, const char* key,
                            int32_t& out) {
  if (!cfg.HasKey(section, key)) return true;
  auto v = cfg.FindInt(section, key);
  if (!v.has_value() || v.value() < 0) return false;
  out = v.value();
  return true;
}

}  // namespace detail

/**
 * @brief Build a BridgeConfig from a loaded store.
 *
 * Missing keys keep their defaults; present but malformed or out of
 * range values fail with ConfigError::kInvalidValue. [serial] device
 * is mandatory.
 */
inline expected<BridgeConfig, ConfigError> LoadBridgeConfig(const ConfigStore& cfg,
                                                            log::Logger* logger = nullptr) {
  using Result = expected<BridgeConfig, ConfigError>;
  BridgeConfig out;

  auto invalid = [logger](const char* section, const char* key) {
    if (logger != nullptr) {
      RUDICS_LOG_ERROR(*logger, "Config", "invalid value for [%s] %s", section, key);
    }
    return Result::error(ConfigError::kInvalidValue);
  };

  // --- [serial] ---
  out.serial.device = cfg.GetString("serial", "device", "");
  if (out.serial.device.empty()) return invalid("serial", "device");

  int32_t iv = static_cast<int32_t>(out.serial.baud_rate);
  if (!detail::ReadNonNegative(cfg, "serial", "baud_rate", iv) ||
      !SerialEndpoint::BaudToSpeed(static_cast<uint32_t>(iv)).has_value()) {
    return invalid("serial", "baud_rate");
  }
  out.serial.baud_rate = static_cast<uint32_t>(iv);

  if (cfg.HasKey("serial", "parity")) {
    auto p = ParseParity(cfg.GetString("serial", "parity"));
    if (!p.has_value()) return invalid("serial", "parity");
    out.serial.parity = p.value();
  }

  iv = out.serial.byte_size;
  if (!detail::ReadNonNegative(cfg, "serial", "byte_size", iv) || iv < 5 || iv > 8) {
    return invalid("serial", "byte_size");
  }
  out.serial.byte_size = static_cast<uint8_t>(iv);

  if (cfg.HasKey("serial", "stop_bits")) {
    auto d = cfg.FindDouble("serial", "stop_bits");
    optional<StopBits> sb;
    if (d.has_value()) sb = ParseStopBits(d.value());
    if (!sb.has_value()) return invalid("serial", "stop_bits");
    out.serial.stop_bits = sb.value();
  }

  // --- [rudics] ---
  out.client.host = cfg.GetString("rudics", "host", out.client.host.c_str());
  if (out.client.host.empty()) return invalid("rudics", "host");

  if (cfg.HasKey("rudics", "port")) {
    auto p = cfg.FindInt("rudics", "port");
    if (!p.has_value() || p.value() < 1 || p.value() > 65535) {
      return invalid("rudics", "port");
    }
    out.client.port = static_cast<uint16_t>(p.value());
  }

  if (!detail::ReadSeconds(cfg, "rudics", "idle_timeout", out.session.idle_timeout_us) ||
      out.session.idle_timeout_us == 0U) {
    return invalid("rudics", "idle_timeout");
  }
  if (!detail::ReadSeconds(cfg, "rudics", "reconnect_delay",
                           out.client.reconnect_delay_us)) {
    return invalid("rudics", "reconnect_delay");
  }
  if (!detail::ReadSeconds(cfg, "rudics", "reconnect_spacing",
                           out.client.reconnect_spacing_us)) {
    return invalid("rudics", "reconnect_spacing");
  }

  iv = static_cast<int32_t>(out.client.baud_rate_limit);
  if (!detail::ReadNonNegative(cfg, "rudics", "baud_rate_limit", iv)) {
    return invalid("rudics", "baud_rate_limit");
  }
  out.client.baud_rate_limit = static_cast<uint32_t>(iv);

  iv = out.client.connect_timeout_ms;
  if (!detail::ReadNonNegative(cfg, "rudics", "connect_timeout_ms", iv)) {
    return invalid("rudics", "connect_timeout_ms");
  }
  out.client.connect_timeout_ms = iv;

  if (cfg.HasKey("rudics", "initial_state")) {
    auto s = detail::ParseInitialState(cfg.GetString("rudics", "initial_state"));
    if (!s.has_value()) return invalid("rudics", "initial_state");
    out.session.start_open = s.value();
  }

  if (cfg.HasKey("rudics", "terminator")) {
    auto t = detail::ParseTerminator(cfg.GetString("rudics", "terminator"));
    if (!t.has_value()) return invalid("rudics", "terminator");
    out.session.terminator = t.value();
  }

  auto on = cfg.GetList("rudics", "on_trigger");
  if (!on.empty()) out.on_patterns = std::move(on);
  auto off = cfg.GetList("rudics", "off_trigger");
  if (!off.empty()) out.off_patterns = std::move(off);

  // --- [log] ---
  if (cfg.HasKey("log", "level")) {
    auto lvl = log::ParseLevel(cfg.GetString("log", "level"));
    if (!lvl.has_value()) return invalid("log", "level");
    out.log.level = lvl.value();
  }
  out.log.file = cfg.GetString("log", "file", "");
  iv = static_cast<int32_t>(out.log.max_bytes);
  if (!detail::ReadNonNegative(cfg, "log", "max_bytes", iv)) {
    return invalid("log", "max_bytes");
  }
  out.log.max_bytes = static_cast<uint64_t>(iv);
  iv = static_cast<int32_t>(out.log.backup_count);
  if (!detail::ReadNonNegative(cfg, "log", "backup_count", iv)) {
    return invalid("log", "backup_count");
  }
  out.log.backup_count = static_cast<uint32_t>(iv);

  // --- [transcript] ---
  out.transcript_file = cfg.GetString("transcript", "file", "");

  return Result::success(std::move(out));
}

/// @brief Log the effective configuration at INFO.
inline void LogBridgeConfig(const BridgeConfig& c, log::Logger& logger) {
  static constexpr char kParity[] = {'N', 'O', 'E', 'M', 'S'};
  RUDICS_LOG_INFO(logger, "Config", "serial %s baud=%u parity=%c bytesize=%u stopbits=%s",
                  c.serial.device.c_str(), c.serial.baud_rate,
                  kParity[static_cast<uint8_t>(c.serial.parity)],
                  static_cast<unsigned>(c.serial.byte_size),
                  (c.serial.stop_bits == StopBits::kOne)
                      ? "1"
                      : ((c.serial.stop_bits == StopBits::kTwo) ? "2" : "1.5"));
  RUDICS_LOG_INFO(logger, "Config",
                  "dockserver %s:%u idle=%.0fs delay=%.0fs spacing=%.0fs baud_limit=%u "
                  "connect_timeout=%dms initial=%s",
                  c.client.host.c_str(), static_cast<unsigned>(c.client.port),
                  static_cast<double>(c.session.idle_timeout_us) / kUsPerSec,
                  static_cast<double>(c.client.reconnect_delay_us) / kUsPerSec,
                  static_cast<double>(c.client.reconnect_spacing_us) / kUsPerSec,
                  c.client.baud_rate_limit, c.client.connect_timeout_ms,
                  c.session.start_open ? "connected" : "disconnected");
  for (const auto& p : c.on_patterns) {
    RUDICS_LOG_INFO(logger, "Config", "on trigger: %s", p.c_str());
  }
  for (const auto& p : c.off_patterns) {
    RUDICS_LOG_INFO(logger, "Config", "off trigger: %s", p.c_str());
  }
  if (!c.transcript_file.empty()) {
    RUDICS_LOG_INFO(logger, "Config", "transcript: %s", c.transcript_file.c_str());
  }
}

}  // namespace rudics

#endif  // RUDICS_BRIDGE_CONFIG_HPP_
