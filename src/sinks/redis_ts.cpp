#include "sinks/redis_ts.hpp"

#include <charconv>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <hiredis/hiredis.h>

#include "device/registers.hpp"

namespace kth_logger::sinks {
namespace {

// TS.MADD plus (key, timestamp, value) for every register.
constexpr std::size_t kBatchArgCount = 1 + (device::kSensorSpecs.size() * 3);

struct ReplyDeleter {
  void operator()(redisReply* reply) const {
    if (reply != nullptr) {
      freeReplyObject(reply);
    }
  }
};

using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

std::string format_sample(const double value) {
  if (!std::isfinite(value)) {
    return "0";
  }
  char buffer[64]{};
  const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
  return std::string(buffer, result.ptr);
}

bool error_mentions(const redisReply& reply, const std::string_view needle) {
  return reply.type == REDIS_REPLY_ERROR && reply.str != nullptr &&
         std::string_view(reply.str, reply.len).find(needle) != std::string_view::npos;
}

}  // namespace

std::string series_key(const std::string& key_prefix, const std::string& sensor_id) {
  return key_prefix + ":" + sensor_id;
}

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  args_.reserve(kBatchArgCount);
  argv_.reserve(kBatchArgCount);
  argv_len_.reserve(kBatchArgCount);
}

RedisTsSink::~RedisTsSink() = default;

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

std::string RedisTsSink::address() const {
  if (!options_.unix_socket.empty()) {
    return "unix://" + options_.unix_socket;
  }
  return options_.host + ':' + std::to_string(options_.port);
}

bool RedisTsSink::check_connectivity() { return ensure_connected(); }

bool RedisTsSink::ensure_connected() {
  if (module_missing_) {
    return false;
  }
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  std::unique_ptr<redisContext, ContextDeleter> fresh(
      options_.unix_socket.empty()
          ? redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout)
          : redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout));
  if (fresh == nullptr) {
    std::cerr << "[redis] connect to " << address() << " failed: out of memory\n";
    return false;
  }
  if (fresh->err != REDIS_OK) {
    std::cerr << "[redis] connect to " << address() << " failed: " << fresh->errstr << '\n';
    return false;
  }

  context_ = std::move(fresh);
  if (!create_series()) {
    context_.reset();
    return false;
  }
  return true;
}

// One labelled series per register.
bool RedisTsSink::create_series() {
  if (series_created_) {
    return true;
  }

  for (const auto& spec : device::kSensorSpecs) {
    const std::string sensor{device::sensor_name(spec.id)};
    const std::string unit{spec.unit};
    const std::string key = series_key(options_.key_prefix, sensor);

    ReplyPtr reply(static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST LABELS sensor %s unit %s", key.c_str(),
                     sensor.c_str(), unit.c_str())));
    if (reply == nullptr) {
      return false;
    }

    if (error_mentions(*reply, "unknown command")) {
      std::cerr << "[redis] RedisTimeSeries module not loaded on " << address() << "; mirroring disabled\n";
      module_missing_ = true;
      return false;
    }
    if (reply->type == REDIS_REPLY_ERROR && !error_mentions(*reply, "already exists")) {
      std::cerr << "[redis] TS.CREATE " << key << " failed: " << (reply->str != nullptr ? reply->str : "unknown")
                << '\n';
      return false;
    }
  }

  series_created_ = true;
  return true;
}

bool RedisTsSink::publish(const model::ReadingBatch& batch) {
  if (batch.empty()) {
    return true;
  }
  if (!ensure_connected()) {
    return false;
  }
  if (send_batch(batch)) {
    return true;
  }

  // Retry once on a fresh connection.
  return reconnect() && send_batch(batch);
}

bool RedisTsSink::send_batch(const model::ReadingBatch& batch) {
  args_.clear();
  argv_.clear();
  argv_len_.clear();

  args_.emplace_back("TS.MADD");
  for (const auto& reading : batch) {
    args_.push_back(series_key(options_.key_prefix, reading.sensor_id));
    args_.push_back(std::to_string(reading.timestamp_us / 1000));
    args_.push_back(format_sample(reading.value));
  }
  for (const auto& arg : args_) {
    argv_.push_back(arg.c_str());
    argv_len_.push_back(arg.size());
  }

  ReplyPtr reply(static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(argv_.size()), argv_.data(), argv_len_.data())));
  return reply != nullptr && reply->type != REDIS_REPLY_ERROR;
}

}  // namespace kth_logger::sinks
