#include "mcp/tools.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

#include "core/timestamp.hpp"
#include "device/registers.hpp"
#include "sinks/csv_log.hpp"
#include "sinks/redis_ts.hpp"

namespace kth::mcp {

namespace {

// Summaries work in microseconds, so a window must survive a further * 1000.
constexpr std::int64_t kMaxWindowMs = std::numeric_limits<std::int64_t>::max() / 1000;

struct RedisReplyDeleter {
  void operator()(redisReply* reply) const {
    if (reply != nullptr) {
      freeReplyObject(reply);
    }
  }
};

using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

class RedisConnection {
 public:
  explicit RedisConnection(const ToolSettings& settings) : settings_(settings) {}

  void connect() {
    timeval timeout{};
    timeout.tv_sec = static_cast<time_t>(settings_.redis_connect_timeout_ms / 1000U);
    timeout.tv_usec = static_cast<suseconds_t>((settings_.redis_connect_timeout_ms % 1000U) * 1000U);

    redisContext* raw = nullptr;
    if (!settings_.redis_unix_socket.empty()) {
      raw = redisConnectUnixWithTimeout(settings_.redis_unix_socket.c_str(), timeout);
    } else {
      raw = redisConnectWithTimeout(settings_.redis_host.c_str(), static_cast<int>(settings_.redis_port), timeout);
    }

    if (raw == nullptr) {
      throw std::runtime_error("redis connection failed: out of memory");
    }
    context_.reset(raw);

    if (context_->err != REDIS_OK) {
      throw std::runtime_error(std::string("redis connection failed: ") + context_->errstr);
    }

    if (!settings_.redis_password.empty()) {
      auto auth_reply = command("AUTH %s", settings_.redis_password.c_str());
      if (auth_reply->type == REDIS_REPLY_ERROR) {
        throw std::runtime_error("redis AUTH failed");
      }
    }
  }

  RedisReplyPtr command(const char* format, ...) {
    va_list ap;
    va_start(ap, format);
    auto* raw = static_cast<redisReply*>(redisvCommand(context_.get(), format, ap));
    va_end(ap);

    if (raw == nullptr) {
      throw std::runtime_error("redis command failed");
    }
    return RedisReplyPtr(raw);
  }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const {
      if (context != nullptr) {
        redisFree(context);
      }
    }
  };

  const ToolSettings& settings_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
};

std::string getenv_or(const char* name, const std::string& fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return std::string(value);
  }
  return fallback;
}

int getenv_or_int(const char* name, const int fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return std::stoi(value);
  }
  return fallback;
}

std::int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string require_window(const nlohmann::json& params) {
  const auto window_it = params.find("window");
  if (window_it == params.end() || !window_it->is_string()) {
    throw std::invalid_argument("window must be a string");
  }
  return window_it->get<std::string>();
}

// Absent means every register; ids are validated against the register table.
std::vector<std::string> parse_sensors(const nlohmann::json& params) {
  std::vector<std::string> sensors;
  const auto sensors_it = params.find("sensors");
  if (sensors_it == params.end()) {
    for (const auto& spec : kth_logger::device::kSensorSpecs) {
      sensors.emplace_back(kth_logger::device::sensor_name(spec.id));
    }
    return sensors;
  }

  if (!sensors_it->is_array() || sensors_it->empty()) {
    throw std::invalid_argument("sensors must be a non-empty array of strings");
  }

  for (const auto& sensor : *sensors_it) {
    if (!sensor.is_string()) {
      throw std::invalid_argument("sensors must be a non-empty array of strings");
    }
    const auto name = sensor.get<std::string>();
    if (!kth_logger::device::parse_sensor_name(name).has_value()) {
      throw std::invalid_argument("unknown sensor id: " + name);
    }
    if (std::find(sensors.begin(), sensors.end(), name) == sensors.end()) {
      sensors.push_back(name);
    }
  }
  return sensors;
}

bool selected(const std::vector<std::string>& sensors, const std::string& id) {
  return std::find(sensors.begin(), sensors.end(), id) != sensors.end();
}

nlohmann::json reading_to_json(const kth_logger::model::Reading& reading) {
  return nlohmann::json{{"timestamp", kth_logger::core::format_timestamp_us(reading.timestamp_us)},
                        {"id", reading.sensor_id},
                        {"unit", reading.unit},
                        {"value", reading.value}};
}

nlohmann::json handle_readings_latest(const ToolSettings& settings, const nlohmann::json& params) {
  const auto sensors = parse_sensors(params);
  const auto readings = kth_logger::sinks::read_csv_log(settings.csv_path);

  std::map<std::string, const kth_logger::model::Reading*> latest;
  for (const auto& reading : readings) {
    if (!selected(sensors, reading.sensor_id)) {
      continue;
    }
    auto& slot = latest[reading.sensor_id];
    if (slot == nullptr || reading.timestamp_us >= slot->timestamp_us) {
      slot = &reading;
    }
  }

  nlohmann::json items = nlohmann::json::array();
  for (const auto& [_, reading] : latest) {
    items.push_back(reading_to_json(*reading));
  }

  return nlohmann::json{{"tool", "readings.latest"}, {"source", settings.csv_path}, {"readings", items}};
}

nlohmann::json handle_readings_summary(const ToolSettings& settings, const nlohmann::json& params) {
  const auto sensors = parse_sensors(params);
  const auto window = require_window(params);
  const auto window_us = parse_window_ms(window) * 1000;
  const auto readings = kth_logger::sinks::read_csv_log(settings.csv_path);

  struct Accumulator {
    std::string unit;
    std::size_t count{0};
    double min{std::numeric_limits<double>::max()};
    double max{std::numeric_limits<double>::lowest()};
    double sum{0.0};
  };

  std::int64_t newest_us = std::numeric_limits<std::int64_t>::min();
  for (const auto& reading : readings) {
    if (selected(sensors, reading.sensor_id)) {
      newest_us = std::max(newest_us, reading.timestamp_us);
    }
  }

  std::map<std::string, Accumulator> totals;
  std::size_t total_samples = 0;
  if (newest_us != std::numeric_limits<std::int64_t>::min()) {
    const auto from_us = newest_us - window_us;
    for (const auto& reading : readings) {
      if (!selected(sensors, reading.sensor_id) || reading.timestamp_us < from_us) {
        continue;
      }
      auto& acc = totals[reading.sensor_id];
      acc.unit = reading.unit;
      ++acc.count;
      acc.min = std::min(acc.min, reading.value);
      acc.max = std::max(acc.max, reading.value);
      acc.sum += reading.value;
      ++total_samples;
    }
  }

  nlohmann::json series = nlohmann::json::array();
  for (const auto& [id, acc] : totals) {
    series.push_back({{"id", id},
                      {"unit", acc.unit},
                      {"count", acc.count},
                      {"min", acc.min},
                      {"max", acc.max},
                      {"avg", acc.sum / static_cast<double>(acc.count)}});
  }

  nlohmann::json result{{"tool", "readings.summary"},
                        {"window", window},
                        {"sensors", sensors},
                        {"summary", {{"series_count", series.size()}, {"sample_count", total_samples}}},
                        {"series", series}};
  if (newest_us != std::numeric_limits<std::int64_t>::min()) {
    result["from"] = kth_logger::core::format_timestamp_us(newest_us - window_us);
    result["to"] = kth_logger::core::format_timestamp_us(newest_us);
  }
  return result;
}

nlohmann::json query_timeseries(RedisConnection& redis, const std::string& key, const std::int64_t from_ms,
                                const std::int64_t to_ms) {
  auto reply = redis.command("TS.RANGE %s %lld %lld", key.c_str(), static_cast<long long>(from_ms),
                             static_cast<long long>(to_ms));

  if (reply->type == REDIS_REPLY_ERROR) {
    throw std::runtime_error(std::string("TS.RANGE failed for key ") + key);
  }
  if (reply->type != REDIS_REPLY_ARRAY) {
    throw std::runtime_error(std::string("unexpected TS.RANGE response for key ") + key);
  }

  double sum = 0.0;
  std::size_t sample_count = 0;
  nlohmann::json points = nlohmann::json::array();

  for (std::size_t i = 0; i < reply->elements; ++i) {
    const auto* point = reply->element[i];
    if (point == nullptr || point->type != REDIS_REPLY_ARRAY || point->elements != 2) {
      continue;
    }

    const auto* ts = point->element[0];
    const auto* value = point->element[1];
    if (ts == nullptr || value == nullptr) {
      continue;
    }

    // Timestamps come back as integers, values as simple strings.
    const auto timestamp = ts->type == REDIS_REPLY_INTEGER ? static_cast<std::int64_t>(ts->integer)
                                                           : (ts->str != nullptr ? std::stoll(ts->str) : 0);
    if (value->str == nullptr) {
      continue;
    }
    const auto numeric_value = std::stod(value->str);

    points.push_back({{"timestamp", timestamp}, {"value", numeric_value}});
    sum += numeric_value;
    ++sample_count;
  }

  return nlohmann::json{{"key", key},
                        {"sample_count", sample_count},
                        {"avg", sample_count > 0 ? (sum / static_cast<double>(sample_count)) : 0.0},
                        {"points", points}};
}

nlohmann::json handle_readings_timeseries_query(const ToolSettings& settings, const nlohmann::json& params) {
  const auto sensors = parse_sensors(params);
  const auto window = require_window(params);
  const auto window_ms = parse_window_ms(window);
  const auto to_ms = now_ms();
  const auto from_ms = to_ms - window_ms;

  RedisConnection redis(settings);
  redis.connect();

  nlohmann::json series = nlohmann::json::array();
  for (const auto& sensor : sensors) {
    auto item = query_timeseries(redis, kth_logger::sinks::series_key(settings.redis_key_prefix, sensor), from_ms,
                                 to_ms);
    item["id"] = sensor;
    series.push_back(std::move(item));
  }

  return nlohmann::json{{"tool", "readings.timeseries.query"},
                        {"window", window},
                        {"from", from_ms},
                        {"to", to_ms},
                        {"series", series}};
}

nlohmann::json sensors_property() {
  nlohmann::json ids = nlohmann::json::array();
  for (const auto& spec : kth_logger::device::kSensorSpecs) {
    ids.push_back(std::string(kth_logger::device::sensor_name(spec.id)));
  }
  return nlohmann::json{{"type", "array"}, {"items", {{"type", "string"}, {"enum", ids}}}};
}

}  // namespace

ToolSettings load_tool_settings() {
  ToolSettings settings;
  settings.csv_path = getenv_or("KTH_LOGGER_CSV_PATH", settings.csv_path);
  settings.redis_host = getenv_or("KTH_LOGGER_REDIS_HOST", settings.redis_host);
  settings.redis_port =
      static_cast<std::uint16_t>(getenv_or_int("KTH_LOGGER_REDIS_PORT", static_cast<int>(settings.redis_port)));
  settings.redis_unix_socket = getenv_or("KTH_LOGGER_REDIS_UNIX_SOCKET", settings.redis_unix_socket);
  settings.redis_password = getenv_or("KTH_LOGGER_REDIS_PASSWORD", settings.redis_password);
  settings.redis_key_prefix = getenv_or("KTH_LOGGER_REDIS_PREFIX", settings.redis_key_prefix);
  settings.redis_connect_timeout_ms = static_cast<std::uint32_t>(
      getenv_or_int("KTH_LOGGER_REDIS_CONNECT_TIMEOUT_MS", static_cast<int>(settings.redis_connect_timeout_ms)));
  return settings;
}

std::int64_t parse_window_ms(const std::string& window) {
  if (window.empty()) {
    throw std::invalid_argument("window must not be empty");
  }

  std::size_t suffix_pos = window.size();
  while (suffix_pos > 0 && std::isalpha(static_cast<unsigned char>(window[suffix_pos - 1])) != 0) {
    --suffix_pos;
  }

  if (suffix_pos == 0) {
    throw std::invalid_argument("window must start with a numeric value");
  }

  const auto digits = window.substr(0, suffix_pos);
  if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw std::invalid_argument("window must be a non-negative integer with an optional suffix");
  }

  std::int64_t unit_ms = 0;
  const auto suffix = window.substr(suffix_pos);
  if (suffix == "ms" || suffix.empty()) {
    unit_ms = 1;
  } else if (suffix == "s") {
    unit_ms = 1000;
  } else if (suffix == "m") {
    unit_ms = 60 * 1000;
  } else if (suffix == "h") {
    unit_ms = 60 * 60 * 1000;
  } else {
    throw std::invalid_argument("unsupported window suffix; use ms, s, m, or h");
  }

  // 18 digits always fit in an int64.
  if (digits.size() > 18 || std::stoll(digits) > kMaxWindowMs / unit_ms) {
    throw std::invalid_argument("window is too large");
  }
  return std::stoll(digits) * unit_ms;
}

ToolRegistry build_tool_registry(const ToolSettings& settings) {
  ToolRegistry registry;

  Tool readings_latest{.name = "readings.latest",
                       .description = "Most recent logged reading per sensor id.",
                       .input_schema = nlohmann::json{{"type", "object"},
                                                      {"properties", {{"sensors", sensors_property()}}},
                                                      {"additionalProperties", false}},
                       .handler = [settings](const nlohmann::json& params) {
                         return handle_readings_latest(settings, params);
                       }};

  Tool readings_summary{.name = "readings.summary",
                        .description = "Count, min, max and mean per sensor over a window ending at the newest "
                                       "logged reading.",
                        .input_schema = nlohmann::json{{"type", "object"},
                                                       {"properties",
                                                        {{"sensors", sensors_property()},
                                                         {"window", {{"type", "string"}}}}},
                                                       {"required", {"window"}},
                                                       {"additionalProperties", false}},
                        .handler = [settings](const nlohmann::json& params) {
                          return handle_readings_summary(settings, params);
                        }};

  Tool readings_timeseries_query{.name = "readings.timeseries.query",
                                 .description = "Query the RedisTimeSeries mirror of the given sensors for recent "
                                                "points.",
                                 .input_schema = nlohmann::json{{"type", "object"},
                                                                {"properties",
                                                                 {{"sensors", sensors_property()},
                                                                  {"window", {{"type", "string"}}}}},
                                                                {"required", {"window"}},
                                                                {"additionalProperties", false}},
                                 .handler = [settings](const nlohmann::json& params) {
                                   return handle_readings_timeseries_query(settings, params);
                                 }};

  registry.emplace(readings_latest.name, std::move(readings_latest));
  registry.emplace(readings_summary.name, std::move(readings_summary));
  registry.emplace(readings_timeseries_query.name, std::move(readings_timeseries_query));
  return registry;
}

}  // namespace kth::mcp
