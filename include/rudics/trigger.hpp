/**
 * @file trigger.hpp
 * @brief On/off line triggers for the network leg.
 *
 * Device output is cut into lines by LineAccumulator. Each finished line
 * is searched (not fully matched) against the "on" or the "off" matcher.
 * Matching is case-insensitive; several phrases for one matcher are
 * combined into a single alternation.
 */

#ifndef RUDICS_TRIGGER_HPP_
#define RUDICS_TRIGGER_HPP_

#include "rudics/platform.hpp"
#include "rudics/vocabulary.hpp"

#include <cstdint>
#include <regex>
#include <string>
#include <vector>

namespace rudics {

enum class TriggerError : uint8_t {
  kBadPattern = 0U,
};

/// Surfacing phrases of a Slocum glider that wants the dockserver.
constexpr const char* kDefaultOnPattern =
    R"((behavior\s+surface_[0-9]+:\s+SUBSTATE\s+[0-9]+\s+->[0-9]+\s+:\s+Picking\s+iridium\s+or\s+freewave|:\s+abort_the_mission))";

/// Printed just before the glider dives again.
constexpr const char* kDefaultOffPattern =
    R"(surface_[0-9]+:\s+.*Waiting\s+for\s+final\s+GPS\s+fix)";

// ============================================================================
// Matcher
// ============================================================================

/**
 * @brief One compiled, case-insensitive search expression.
 *
 * An empty phrase list compiles to a matcher that never fires.
 */
class Matcher final {
 public:
  Matcher() = default;

  static expected<Matcher, TriggerError> Compile(
      const std::vector<std::string>& phrases) {
    Matcher m;
    if (phrases.empty()) {
      return expected<Matcher, TriggerError>::success(std::move(m));
    }

    std::string joined;
    for (size_t i = 0; i < phrases.size(); ++i) {
      if (i != 0U) joined += '|';
      joined += "(?:";
      joined += phrases[i];
      joined += ')';
    }

    try {
      m.re_ = std::regex(joined, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error&) {
      return expected<Matcher, TriggerError>::error(TriggerError::kBadPattern);
    }
    m.source_ = std::move(joined);
    m.armed_ = true;
    return expected<Matcher, TriggerError>::success(std::move(m));
  }

  bool Search(const std::string& line) const {
    return armed_ && std::regex_search(line, re_);
  }

  bool Armed() const noexcept { return armed_; }
  const std::string& Source() const noexcept { return source_; }

 private:
  std::regex re_;
  std::string source_;
  bool armed_ = false;
};

// ============================================================================
// TriggerSet
// ============================================================================

struct TriggerSet {
  Matcher on;
  Matcher off;

  static expected<TriggerSet, TriggerError> Compile(
      const std::vector<std::string>& on_phrases,
      const std::vector<std::string>& off_phrases) {
    auto on_res = Matcher::Compile(on_phrases);
    if (!on_res) {
      return expected<TriggerSet, TriggerError>::error(on_res.get_error());
    }
    auto off_res = Matcher::Compile(off_phrases);
    if (!off_res) {
      return expected<TriggerSet, TriggerError>::error(off_res.get_error());
    }
    TriggerSet set;
    set.on = std::move(on_res.value());
    set.off = std::move(off_res.value());
    return expected<TriggerSet, TriggerError>::success(std::move(set));
  }
};

// ============================================================================
// LineAccumulator
// ============================================================================

#ifndef RUDICS_MAX_LINE_BYTES
#define RUDICS_MAX_LINE_BYTES 8192U
#endif

enum class LineEvent : uint8_t {
  kPending = 0U,  ///< byte stored, no line yet
  kLine,          ///< terminator seen, Line() holds the finished line
  kOverflow,      ///< line exceeded the cap and was discarded
};

class LineAccumulator final {
 public:
  explicit LineAccumulator(uint8_t terminator = '\n') noexcept
      : terminator_(terminator) {}

  /**
   * @brief Append one byte.
   *
   * After kLine the caller inspects Line() and then calls Clear().
   */
  LineEvent Push(uint8_t byte) {
    line_.push_back(static_cast<char>(byte));
    if (byte == terminator_) return LineEvent::kLine;
    if (line_.size() >= RUDICS_MAX_LINE_BYTES) {
      line_.clear();
      return LineEvent::kOverflow;
    }
    return LineEvent::kPending;
  }

  const std::string& Line() const noexcept { return line_; }
  size_t Size() const noexcept { return line_.size(); }
  uint8_t Terminator() const noexcept { return terminator_; }
  void Clear() noexcept { line_.clear(); }

 private:
  std::string line_;
  uint8_t terminator_;
};

}  // namespace rudics

#endif  // RUDICS_TRIGGER_HPP_
