#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "device/registers.hpp"
#include "device/serial_transport.hpp"

namespace kth_logger::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

long long parse_integer(const std::string& key, const std::string& value, const long long min, const long long max) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (parsed < min || parsed > max) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min) + ".." + std::to_string(max));
  }
  return parsed;
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  redis.port = static_cast<std::uint16_t>(parse_integer("redis.address port", value.substr(split + 1), 1, 65535));
}

void apply_key_value(LoggerConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "serial.port") {
    if (value.empty()) {
      throw std::runtime_error("serial.port must not be empty");
    }
    config.serial.port = value;
    return;
  }

  if (key == "serial.baud_rate") {
    const auto baud = parse_integer(key, value, 1, 4'000'000);
    if (!device::is_supported_baud_rate(static_cast<std::uint32_t>(baud))) {
      throw std::runtime_error("serial.baud_rate " + value + " is not a supported rate");
    }
    config.serial.baud_rate = static_cast<std::uint32_t>(baud);
    return;
  }

  if (key == "serial.byte_size") {
    config.serial.byte_size = static_cast<std::uint8_t>(parse_integer(key, value, 5, 8));
    return;
  }

  if (key == "serial.stop_bits") {
    config.serial.stop_bits = static_cast<std::uint8_t>(parse_integer(key, value, 1, 2));
    return;
  }

  if (key == "serial.timeout_ms") {
    config.serial.timeout = std::chrono::milliseconds(parse_integer(key, value, 1, 60'000));
    return;
  }

  if (key == "serial.short_read") {
    const std::string lower = to_lower(value);
    if (lower == "decode") {
      config.serial.short_read = device::ShortReadPolicy::Decode;
    } else if (lower == "error") {
      config.serial.short_read = device::ShortReadPolicy::Error;
    } else {
      throw std::runtime_error("serial.short_read must be 'decode' or 'error'");
    }
    return;
  }

  if (key == "list_ports") {
    config.list_ports = parse_bool(value);
    return;
  }

  if (key == "poll_interval_ms") {
    config.poll_interval = std::chrono::milliseconds(parse_integer(key, value, 0, 3'600'000));
    return;
  }

  if (key == "stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "buffer.max_length") {
    // One full batch must fit, or every ingest would evict everything.
    config.max_length = static_cast<std::size_t>(
        parse_integer(key, value, static_cast<long long>(device::kSensorSpecs.size()), 10'000'000));
    return;
  }

  if (key == "csv.enabled") {
    config.csv.enabled = parse_bool(value);
    return;
  }

  if (key == "csv.path") {
    if (value.empty()) {
      throw std::runtime_error("csv.path must not be empty");
    }
    config.csv.path = value;
    return;
  }

  if (key == "render.enabled") {
    config.render.enabled = parse_bool(value);
    return;
  }

  if (key == "render.width") {
    config.render.width = static_cast<std::uint32_t>(parse_integer(key, value, 200, 8192));
    return;
  }

  if (key == "render.height") {
    config.render.height = static_cast<std::uint32_t>(parse_integer(key, value, 150, 8192));
    return;
  }

  if (key == "render.refresh_ms") {
    config.render.refresh_interval = std::chrono::milliseconds(parse_integer(key, value, 1, 10'000));
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

}  // namespace

LoggerConfig load_logger_config(const std::string& path) {
  LoggerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

}  // namespace kth_logger::core
