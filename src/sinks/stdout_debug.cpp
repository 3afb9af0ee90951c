#include "sinks/stdout_debug.hpp"

#include <cstdio>

#include "core/timestamp.hpp"

namespace kth_logger::sinks {

void StdoutDebugSink::publish(const model::ReadingBatch& batch) const {
  if (batch.empty()) {
    return;
  }

  std::printf("[raw] %s", core::format_clock_time(batch.front().timestamp_us).c_str());
  for (const auto& reading : batch) {
    std::printf(" %s=%.2f%s", reading.sensor_id.c_str(), reading.value,
                model::is_temperature(reading) ? "C" : "");
  }
  std::printf("\n");
  std::fflush(stdout);
}

}  // namespace kth_logger::sinks
