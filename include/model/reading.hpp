#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kth_logger::model {

inline constexpr const char* kTemperatureUnit = "T";

// One scaled register value. Timestamps are UTC microseconds since the epoch.
struct Reading {
  std::int64_t timestamp_us{0};
  std::string sensor_id{};
  std::string unit{};
  double value{0.0};

  bool operator==(const Reading& other) const = default;
};

using ReadingBatch = std::vector<Reading>;

inline bool is_temperature(const Reading& reading) { return reading.unit == kTemperatureUnit; }

}  // namespace kth_logger::model
