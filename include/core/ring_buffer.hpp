#pragma once

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace edge_twin::core {

// Fixed-capacity circular buffer; pushing into a full buffer evicts the oldest
// entry. Not synchronized: the owner guards it with its own mutex.
template <typename T>
class RingBuffer {
 public:
  explicit RingBuffer(const std::size_t capacity) : slots_(capacity) {}

  void push(T value) {
    if (slots_.empty()) {
      return;
    }

    slots_[(head_ + size_) % slots_.size()] = std::move(value);
    if (size_ < slots_.size()) {
      ++size_;
    } else {
      head_ = (head_ + 1) % slots_.size();
    }
  }

  // Most recent `limit` entries, oldest first.
  [[nodiscard]] std::vector<T> tail(const std::size_t limit) const {
    const std::size_t count = std::min(limit, size_);
    std::vector<T> out;
    out.reserve(count);
    for (std::size_t i = size_ - count; i < size_; ++i) {
      out.push_back(slots_[(head_ + i) % slots_.size()]);
    }
    return out;
  }

  [[nodiscard]] std::vector<T> to_vector() const { return tail(size_); }

  [[nodiscard]] std::size_t size() const noexcept { return size_; }
  [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }
  [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

 private:
  std::vector<T> slots_;
  std::size_t head_{0};
  std::size_t size_{0};
};

}  // namespace edge_twin::core
