#include "device/collector.hpp"

#include <iostream>
#include <string>
#include <utility>

#include "core/timestamp.hpp"
#include "device/errors.hpp"
#include "device/registers.hpp"

namespace kth_logger::device {

Collector::Collector(Transport& transport, const ShortReadPolicy policy, Clock clock)
    : transport_(transport), policy_(policy), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = core::unix_timestamp_now_us;
  }
}

model::ReadingBatch Collector::collect() {
  model::ReadingBatch batch;
  batch.reserve(kSensorSpecs.size());

  for (const auto& spec : kSensorSpecs) {
    const std::string name{sensor_name(spec.id)};
    const std::int64_t timestamp_us = clock_();

    std::vector<std::uint8_t> response;
    {
      const auto connection = transport_.open();
      response = connection->send_and_receive(spec.command, spec.width);
    }

    if (response.size() < spec.width) {
      ++short_reads_;
      if (policy_ == ShortReadPolicy::Error) {
        throw ShortReadError("short read on " + name + ": got " + std::to_string(response.size()) + " of " +
                             std::to_string(spec.width) + " bytes");
      }
      std::cerr << "[serial] short read on " << name << ": got " << response.size() << " of " << spec.width
                << " bytes\n";
    }

    batch.push_back(model::Reading{timestamp_us, name, std::string{spec.unit}, decode_value(spec, response)});
  }

  return batch;
}

std::size_t Collector::short_reads() const noexcept { return short_reads_; }

}  // namespace kth_logger::device
