#include "core/reading_buffer.hpp"

#include <algorithm>
#include <stdexcept>

namespace kth_logger::core {

ReadingBuffer::ReadingBuffer(const std::size_t max_length) : max_length_(max_length) {
  if (max_length_ == 0) {
    throw std::invalid_argument("buffer max_length must be greater than 0");
  }
}

void ReadingBuffer::ingest(const model::ReadingBatch& batch) {
  if (batch.empty()) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  rows_.insert(rows_.end(), batch.begin(), batch.end());

  if (rows_.size() > max_length_) {
    const std::size_t evict = std::min(batch.size(), rows_.size());
    rows_.erase(rows_.begin(), rows_.begin() + static_cast<std::ptrdiff_t>(evict));
  }
  ++generation_;
}

std::vector<model::Reading> ReadingBuffer::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {rows_.begin(), rows_.end()};
}

std::size_t ReadingBuffer::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rows_.size();
}

std::size_t ReadingBuffer::max_length() const noexcept { return max_length_; }

std::uint64_t ReadingBuffer::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

}  // namespace kth_logger::core
