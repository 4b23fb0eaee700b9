/**
 * @file transcript.hpp
 * @brief Optional binary record of every chunk the bridge moves.
 *
 * Record format, one per chunk:
 *   "SERIAL <n> : " <n raw bytes> "\n"   device -> network
 *   "RUDICS <n> : " <n raw bytes> "\n"   network -> device
 */

#ifndef RUDICS_TRANSCRIPT_HPP_
#define RUDICS_TRANSCRIPT_HPP_

#include "rudics/vocabulary.hpp"

#include <cstdint>
#include <cstdio>

namespace rudics {

enum class TranscriptError : uint8_t {
  kOpenFailed = 0U,
};

enum class Direction : uint8_t {
  kFromSerial = 0U,
  kFromNetwork,
};

class Transcript final {
 public:
  Transcript() noexcept = default;
  ~Transcript() { Close(); }

  Transcript(const Transcript&) = delete;
  Transcript& operator=(const Transcript&) = delete;

  /// @brief Start recording to path, truncating it.
  expected<void, TranscriptError> Open(const char* path) noexcept {
    Close();
    fp_ = std::fopen(path, "wb");
    if (fp_ == nullptr) {
      return expected<void, TranscriptError>::error(TranscriptError::kOpenFailed);
    }
    return expected<void, TranscriptError>::success();
  }

  void Record(Direction dir, const uint8_t* data, size_t len) noexcept {
    if (fp_ == nullptr || len == 0U) return;
    (void)std::fprintf(fp_, "%s %zu : ",
                       (dir == Direction::kFromSerial) ? "SERIAL" : "RUDICS", len);
    (void)std::fwrite(data, 1U, len, fp_);
    (void)std::fputc('\n', fp_);
    (void)std::fflush(fp_);
  }

  bool IsOpen() const noexcept { return fp_ != nullptr; }

  void Close() noexcept {
    if (fp_ != nullptr) {
      (void)std::fclose(fp_);
      fp_ = nullptr;
    }
  }

 private:
  FILE* fp_ = nullptr;
};

}  // namespace rudics

#endif  // RUDICS_TRANSCRIPT_HPP_
