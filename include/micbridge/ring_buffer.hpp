#ifndef MICBRIDGE_RING_BUFFER_HPP_
#define MICBRIDGE_RING_BUFFER_HPP_

#include "vocabulary.hpp"

#include <cstdint>
#include <cstring>

#include <algorithm>
#include <array>
#include <string_view>
#include <sys/uio.h>  // writev / sendmsg

namespace micbridge {

// ============================================================================
// ByteRing (fixed-capacity circular byte buffer for the transmit path)
// ============================================================================

/**
 * @brief Circular byte buffer with iovec export for scatter/gather sends.
 *
 * Whole encoded lines are pushed or rejected, so a partially written line
 * never sits next to a line that did not fit.
 */
template <size_t Size>
class alignas(kCacheLine) ByteRing {
 public:
  static constexpr size_t kCapacity = Size;

  ByteRing() = default;

  // Append len bytes; all or nothing
  bool push(const uint8_t* data, size_t len) {
    if (available() < len) {
      return false;
    }
    size_t first = std::min(len, kCapacity - write_idx_);
    std::memcpy(buffer_.data() + write_idx_, data, first);
    std::memcpy(buffer_.data(), data + first, len - first);
    write_idx_ = (write_idx_ + len) % kCapacity;
    count_ += len;
    return true;
  }

  bool push(std::string_view bytes) { return push(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()); }

  // Copy up to max_len bytes without consuming them
  size_t peek(uint8_t* data, size_t max_len) const {
    size_t len = std::min(max_len, count_);
    size_t first = std::min(len, kCapacity - read_idx_);
    std::memcpy(data, buffer_.data() + read_idx_, first);
    std::memcpy(data + first, buffer_.data(), len - first);
    return len;
  }

  // Drop len bytes from the front (after a successful send)
  void advance(size_t len) {
    if (len > count_) {
      len = count_;
    }
    read_idx_ = (read_idx_ + len) % kCapacity;
    count_ -= len;
  }

  size_t size() const { return count_; }
  size_t available() const { return kCapacity - count_; }
  bool empty() const { return count_ == 0; }

  void clear() {
    read_idx_ = 0;
    write_idx_ = 0;
    count_ = 0;
  }

  // Fill iovec for sendmsg/writev. Returns number of entries filled (0..2).
  size_t fill_iovec(struct iovec* iov, size_t max_iov) const {
    if (empty() || max_iov == 0) {
      return 0;
    }

    size_t contiguous = kCapacity - read_idx_;
    iov[0].iov_base = const_cast<uint8_t*>(buffer_.data() + read_idx_);
    if (contiguous >= count_) {
      iov[0].iov_len = count_;
      return 1;
    }

    iov[0].iov_len = contiguous;
    if (max_iov < 2) {
      return 1;
    }
    iov[1].iov_base = const_cast<uint8_t*>(buffer_.data());
    iov[1].iov_len = count_ - contiguous;
    return 2;
  }

 private:
  alignas(kCacheLine) std::array<uint8_t, kCapacity> buffer_{};
  size_t read_idx_ = 0;
  size_t write_idx_ = 0;
  size_t count_ = 0;
};

}  // namespace micbridge

#endif  // MICBRIDGE_RING_BUFFER_HPP_
