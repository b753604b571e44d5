#ifndef CTLOAD_RX_BUFFER_HPP_
#define CTLOAD_RX_BUFFER_HPP_

#include <cstdint>
#include <cstring>

#include <algorithm>
#include <string_view>
#include <vector>

namespace ctload {

// ============================================================================
// RxBuffer (bounded receive buffer with contiguous readable region)
// ============================================================================
//
// Stream decoders need to scan for delimiters ("\r\n\r\n", "\n") and whole
// frames, so readable bytes are always kept contiguous: consumed space at the
// front is reclaimed by compaction instead of wrapping. Storage grows on demand
// up to the fixed capacity, which bounds per-connection memory.

class RxBuffer {
 public:
  static constexpr size_t kInitialSize = 16 * 1024;

  explicit RxBuffer(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {
    storage_.resize(std::min(kInitialSize, capacity_));
  }

  // Make room for at least `want` bytes if possible and return the writable
  // region size (0 when the buffer is full).
  size_t prepare(size_t want) {
    if (storage_.size() - write_idx_ >= want) return storage_.size() - write_idx_;
    compact();
    if (storage_.size() - write_idx_ < want && storage_.size() < capacity_) {
      size_t grown = std::min(capacity_, std::max(storage_.size() * 2, write_idx_ + want));
      storage_.resize(grown);
    }
    return storage_.size() - write_idx_;
  }

  uint8_t* write_ptr() { return storage_.data() + write_idx_; }

  // Mark `len` bytes written at write_ptr() as readable.
  void commit(size_t len) { write_idx_ = std::min(write_idx_ + len, storage_.size()); }

  // Copy data in. Returns false (and writes nothing) if it does not fit.
  bool push(const uint8_t* data, size_t len) {
    if (prepare(len) < len) return false;
    std::memcpy(write_ptr(), data, len);
    commit(len);
    return true;
  }

  std::string_view view() const {
    return std::string_view(reinterpret_cast<const char*>(storage_.data() + read_idx_), size());
  }

  void advance(size_t len) {
    read_idx_ += std::min(len, size());
    if (read_idx_ == write_idx_) {
      read_idx_ = 0;
      write_idx_ = 0;
    }
  }

  size_t size() const { return write_idx_ - read_idx_; }
  bool empty() const { return read_idx_ == write_idx_; }
  bool full() const { return size() >= capacity_; }
  size_t capacity() const { return capacity_; }

  void clear() {
    read_idx_ = 0;
    write_idx_ = 0;
  }

 private:
  std::vector<uint8_t> storage_;
  size_t capacity_;
  size_t read_idx_ = 0;
  size_t write_idx_ = 0;

  void compact() {
    if (read_idx_ == 0) return;
    size_t len = size();
    if (len > 0) std::memmove(storage_.data(), storage_.data() + read_idx_, len);
    read_idx_ = 0;
    write_idx_ = len;
  }
};

}  // namespace ctload

#endif  // CTLOAD_RX_BUFFER_HPP_
