#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kth_logger::core {

inline std::int64_t unix_timestamp_now_us() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

// 2026-10-19T12:34:56.123456Z
std::string format_timestamp_us(std::int64_t timestamp_us);
std::optional<std::int64_t> parse_timestamp_us(std::string_view text);

// HH:MM:SS in local time, for chart ticks.
std::string format_clock_time(std::int64_t timestamp_us);

}  // namespace kth_logger::core
