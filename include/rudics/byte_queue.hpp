/**
 * @file byte_queue.hpp
 * @brief Growable FIFO of bytes with contiguous front access.
 *
 * Endpoints keep their outbound streams here. Consumers look at the
 * contiguous readable region via Data()/Size(), hand it to write(2), and
 * Consume() what the transport accepted. Storage is compacted lazily once
 * the consumed prefix dominates the buffer.
 */

#ifndef RUDICS_BYTE_QUEUE_HPP_
#define RUDICS_BYTE_QUEUE_HPP_

#include "rudics/platform.hpp"

#include <cstdint>
#include <cstring>
#include <vector>

namespace rudics {

class ByteQueue final {
 public:
  ByteQueue() = default;

  void Append(const uint8_t* data, size_t len) {
    if (len == 0U) return;
    RUDICS_ASSERT(data != nullptr);
    buf_.insert(buf_.end(), data, data + len);
  }

  void Push(uint8_t byte) { buf_.push_back(byte); }

  /** @brief Pointer to the oldest unconsumed byte (valid until next mutation). */
  const uint8_t* Data() const noexcept { return buf_.data() + head_; }

  size_t Size() const noexcept { return buf_.size() - head_; }
  bool Empty() const noexcept { return head_ == buf_.size(); }

  uint8_t Front() const noexcept {
    RUDICS_ASSERT(!Empty());
    return buf_[head_];
  }

  /** @brief Drop up to n bytes from the front. */
  void Consume(size_t n) noexcept {
    const size_t avail = Size();
    head_ += (n < avail) ? n : avail;
    if (head_ == buf_.size()) {
      buf_.clear();
      head_ = 0U;
    } else if (head_ >= kCompactThreshold && head_ * 2U >= buf_.size()) {
      Compact();
    }
  }

  void Clear() noexcept {
    buf_.clear();
    head_ = 0U;
  }

 private:
  static constexpr size_t kCompactThreshold = 4096U;

  void Compact() noexcept {
    const size_t remaining = Size();
    std::memmove(buf_.data(), buf_.data() + head_, remaining);
    buf_.resize(remaining);
    head_ = 0U;
  }

  std::vector<uint8_t> buf_;
  size_t head_ = 0U;
};

}  // namespace rudics

#endif  // RUDICS_BYTE_QUEUE_HPP_
