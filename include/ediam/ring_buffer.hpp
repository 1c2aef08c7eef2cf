#ifndef EDIAM_RING_BUFFER_HPP_
#define EDIAM_RING_BUFFER_HPP_

#include <cstddef>
#include <cstdint>

#include <algorithm>
#include <array>
#include <sys/uio.h>  // iovec

namespace ediam {

static constexpr size_t kCacheLine = 64;

// ============================================================================
// RingBuffer (Circular buffer for fixed memory allocation)
// ============================================================================

template <typename T, size_t Size>
class alignas(kCacheLine) RingBuffer {
 public:
  static constexpr size_t kCapacity = Size;

  RingBuffer() = default;

  // Write data to buffer
  bool push(const T* data, size_t len) {
    if (available() < len)
      return false;
    for (size_t i = 0; i < len; ++i) {
      buffer_[write_idx_] = data[i];
      write_idx_ = (write_idx_ + 1) % kCapacity;
    }
    count_ += len;
    return true;
  }

  // Read data from buffer without removing
  size_t peek(T* data, size_t max_len) const {
    size_t len = std::min(max_len, count_);
    size_t idx = read_idx_;
    for (size_t i = 0; i < len; ++i) {
      data[i] = buffer_[idx];
      idx = (idx + 1) % kCapacity;
    }
    return len;
  }

  // Read and remove
  size_t pop(T* data, size_t max_len) {
    size_t len = peek(data, max_len);
    advance(len);
    return len;
  }

  // Remove data from buffer
  void advance(size_t len) {
    if (len > count_)
      len = count_;
    read_idx_ = (read_idx_ + len) % kCapacity;
    count_ -= len;
  }

  // Get size of readable data
  size_t size() const { return count_; }

  // Get available space
  size_t available() const { return kCapacity - count_; }

  bool empty() const { return count_ == 0; }

  bool full() const { return count_ == kCapacity; }

  void clear() {
    read_idx_ = 0;
    write_idx_ = 0;
    count_ = 0;
  }

  // Fill iovec with the readable regions (scatter/gather)
  // Returns number of iovec entries filled (1 or 2)
  size_t fill_iovec(struct iovec* iov, size_t max_iov) const {
    if (empty() || max_iov == 0) return 0;

    size_t contiguous = kCapacity - read_idx_;
    if (contiguous >= count_) {
      iov[0].iov_base = const_cast<T*>(buffer_.data() + read_idx_);
      iov[0].iov_len = count_ * sizeof(T);
      return 1;
    }

    if (max_iov < 2) {
      iov[0].iov_base = const_cast<T*>(buffer_.data() + read_idx_);
      iov[0].iov_len = contiguous * sizeof(T);
      return 1;
    }

    // Data wraps around: two chunks
    iov[0].iov_base = const_cast<T*>(buffer_.data() + read_idx_);
    iov[0].iov_len = contiguous * sizeof(T);
    iov[1].iov_base = const_cast<T*>(buffer_.data());
    iov[1].iov_len = (count_ - contiguous) * sizeof(T);
    return 2;
  }

 private:
  alignas(kCacheLine) std::array<T, kCapacity> buffer_{};
  size_t read_idx_ = 0;
  size_t write_idx_ = 0;
  size_t count_ = 0;
};

}  // namespace ediam

#endif  // EDIAM_RING_BUFFER_HPP_
