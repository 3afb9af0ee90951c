#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "device/transport.hpp"
#include "model/reading.hpp"

namespace kth_logger::device {

enum class ShortReadPolicy : std::uint8_t {
  Decode,
  Error,
};

class Collector {
 public:
  using Clock = std::function<std::int64_t()>;

  explicit Collector(Transport& transport, ShortReadPolicy policy = ShortReadPolicy::Decode, Clock clock = {});

  // One reading per register, in register table order. Each register read
  // opens and closes its own connection.
  model::ReadingBatch collect();

  [[nodiscard]] std::size_t short_reads() const noexcept;

 private:
  Transport& transport_;
  ShortReadPolicy policy_;
  Clock clock_;
  std::size_t short_reads_{0};
};

}  // namespace kth_logger::device
