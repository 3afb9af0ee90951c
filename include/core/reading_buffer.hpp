#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "model/reading.hpp"

namespace kth_logger::core {

// Bounded working set shared by the acquisition thread and the renderer.
class ReadingBuffer {
 public:
  explicit ReadingBuffer(std::size_t max_length);

  // Appends the batch; once the buffer is over max_length, drops as many of
  // the oldest rows as the batch carried.
  void ingest(const model::ReadingBatch& batch);

  [[nodiscard]] std::vector<model::Reading> snapshot() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t max_length() const noexcept;

  // Bumped on every non-empty ingest.
  [[nodiscard]] std::uint64_t generation() const;

 private:
  const std::size_t max_length_;
  mutable std::mutex mutex_;
  std::deque<model::Reading> rows_;
  std::uint64_t generation_{0};
};

}  // namespace kth_logger::core
