#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace kth::mcp {

struct ToolSettings {
  std::string csv_path{"temperature_measurements.csv"};
  std::string redis_host{"127.0.0.1"};
  std::uint16_t redis_port{6379};
  std::string redis_unix_socket{};
  std::string redis_password{};
  std::string redis_key_prefix{"kth:usb"};
  std::uint32_t redis_connect_timeout_ms{1000};
};

struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  std::function<nlohmann::json(const nlohmann::json&)> handler;
};

using ToolRegistry = std::unordered_map<std::string, Tool>;

// Reads KTH_LOGGER_CSV_PATH and KTH_LOGGER_REDIS_* from the environment.
ToolSettings load_tool_settings();

ToolRegistry build_tool_registry(const ToolSettings& settings);

// "250ms", "30s", "5m", "2h"; a bare number is milliseconds.
std::int64_t parse_window_ms(const std::string& window);

}  // namespace kth::mcp
