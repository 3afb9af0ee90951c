#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "model/reading.hpp"

struct redisContext;

namespace kth_logger::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"kth:usb"};
  std::uint32_t connect_timeout_ms{1000};
};

// Mirrors every reading into RedisTimeSeries, one key per sensor id. Every
// failure is reported through the return value; nothing here throws.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;

  bool check_connectivity();
  bool publish(const model::ReadingBatch& batch);

  [[nodiscard]] std::string address() const;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool create_series();
  bool send_batch(const model::ReadingBatch& batch);

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> args_;
  std::vector<const char*> argv_;
  std::vector<std::size_t> argv_len_;
  bool module_missing_{false};
  bool series_created_{false};
};

std::string series_key(const std::string& key_prefix, const std::string& sensor_id);

}  // namespace kth_logger::sinks
