#ifndef SKIRMISH_RING_BUFFER_H
#define SKIRMISH_RING_BUFFER_H

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace skirmish {

// ═══════════════════════════════════════════════════════════════
// FIXED-CAPACITY RING BUFFER
//
// Storage is allocated once; push() at capacity overwrites the
// oldest entry (FIFO eviction). Index 0 is the OLDEST entry,
// size()-1 the newest. Not thread-safe: owners lock around it.
// ═══════════════════════════════════════════════════════════════
template <typename T> class RingBuffer {
public:
  explicit RingBuffer(size_t capacity) : slots_(capacity) {
    if (capacity == 0)
      throw std::invalid_argument("RingBuffer capacity must be > 0");
  }

  // Returns true when an old entry was evicted to make room.
  bool push(T value) {
    size_t tail = (head_ + count_) % slots_.size();
    slots_[tail] = std::move(value);
    if (count_ < slots_.size()) {
      count_++;
      return false;
    }
    head_ = (head_ + 1) % slots_.size(); // Overwrote the oldest
    return true;
  }

  const T &at(size_t i) const {
    if (i >= count_)
      throw std::out_of_range("RingBuffer index out of range");
    return slots_[(head_ + i) % slots_.size()];
  }

  const T &newest() const { return at(count_ - 1); }

  size_t size() const { return count_; }
  size_t capacity() const { return slots_.size(); }
  bool empty() const { return count_ == 0; }
  bool full() const { return count_ == slots_.size(); }

  void clear() {
    for (auto &slot : slots_)
      slot = T{};
    head_ = 0;
    count_ = 0;
  }

private:
  std::vector<T> slots_;
  size_t head_ = 0; // Oldest entry
  size_t count_ = 0;
};

} // namespace skirmish

#endif // SKIRMISH_RING_BUFFER_H
