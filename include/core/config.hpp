#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "device/collector.hpp"

namespace kth_logger::core {

struct SerialConfig {
  std::string port{"/dev/ttyUSB0"};
  std::uint32_t baud_rate{9600};
  std::uint8_t byte_size{8};
  std::uint8_t stop_bits{1};
  std::chrono::milliseconds timeout{1000};
  device::ShortReadPolicy short_read{device::ShortReadPolicy::Decode};
};

struct CsvConfig {
  bool enabled{true};
  std::string path{"temperature_measurements.csv"};
};

struct RenderConfig {
  bool enabled{true};
  std::uint32_t width{800};
  std::uint32_t height{700};
  std::chrono::milliseconds refresh_interval{50};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"kth:usb"};
  bool enabled{false};
};

struct LoggerConfig {
  SerialConfig serial{};
  bool list_ports{true};
  std::chrono::milliseconds poll_interval{0};
  std::size_t max_length{500};
  bool stdout_debug{false};
  CsvConfig csv{};
  RenderConfig render{};
  RedisConfig redis{};
};

LoggerConfig load_logger_config(const std::string& path);

}  // namespace kth_logger::core
