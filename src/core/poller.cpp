#include "core/poller.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace kth_logger::core {

Poller::Poller(const LoggerConfig& config, device::Transport& transport, ReadingBuffer& buffer)
    : poll_interval_(config.poll_interval),
      publish_stdout_(config.stdout_debug),
      collector_(transport, config.serial.short_read),
      buffer_(buffer) {
  if (config.csv.enabled) {
    csv_sink_ = std::make_unique<sinks::CsvLogSink>(config.csv.path);
    std::cerr << "[csv] appending readings to " << config.csv.path << '\n';
  }

  if (config.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.key_prefix = config.redis.key_prefix;
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

    if (redis_sink_->check_connectivity()) {
      std::cerr << "[poller] redis connectivity confirmed at " << redis_sink_->address() << '\n';
    } else {
      std::cerr << "[poller] redis connectivity check failed at " << redis_sink_->address() << '\n';
    }
  }
}

Poller::~Poller() { stop(); }

model::ReadingBatch Poller::prime() { return run_cycle(); }

PollerStats Poller::run_for_cycles(const std::size_t total_cycles) {
  if (first_cycle_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_cycle_ = false;
  }

  for (std::size_t i = 0; (total_cycles == 0 || i < total_cycles) && !stop_requested_.load(); ++i) {
    run_cycle();
    wait_for_next_cycle();
  }

  return stats();
}

model::ReadingBatch Poller::run_cycle() {
  model::ReadingBatch batch = collector_.collect();

  // The log always holds whatever the buffer holds.
  if (csv_sink_ != nullptr) {
    csv_sink_->append(batch);
  }
  buffer_.ingest(batch);
  publish_sinks(batch);

  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.cycles_executed;
  stats_.readings_collected += batch.size();
  stats_.short_reads = collector_.short_reads();
  return batch;
}

void Poller::publish_sinks(const model::ReadingBatch& batch) {
  if (publish_stdout_) {
    stdout_sink_.publish(batch);
  }

  if (redis_sink_ == nullptr) {
    return;
  }

  const bool ok = redis_sink_->publish(batch);
  if (!ok) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.redis_errors;
    }
    if (redis_was_ok_) {
      std::cerr << "[redis] publish failed\n";
      redis_was_ok_ = false;
    }
  } else if (!redis_was_ok_) {
    std::cerr << "[redis] publish recovered\n";
    redis_was_ok_ = true;
  }
}

void Poller::wait_for_next_cycle() {
  if (poll_interval_.count() == 0) {
    next_wakeup_ = std::chrono::steady_clock::now();
    return;
  }

  next_wakeup_ += poll_interval_;
  const auto now = std::chrono::steady_clock::now();
  if (next_wakeup_ < now) {
    // Fell behind by more than a full interval; do not burst to catch up.
    next_wakeup_ = now;
    return;
  }

  std::unique_lock<std::mutex> lock(mutex_);
  wake_.wait_until(lock, next_wakeup_, [this] { return stop_requested_.load(); });
}

void Poller::start() {
  if (running_.load()) {
    return;
  }
  if (worker_.joinable()) {
    worker_.join();
  }
  stop_requested_ = false;
  failed_ = false;
  failure_ = nullptr;
  running_ = true;
  worker_ = std::thread([this] { worker_main(); });
}

void Poller::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void Poller::run_until(const std::function<bool()>& shutdown_requested,
                       const std::chrono::milliseconds check_interval) {
  start();
  while (!shutdown_requested() && !failed()) {
    std::this_thread::sleep_for(check_interval);
  }
  stop();
  rethrow_if_failed();
}

void Poller::worker_main() {
  try {
    run_for_cycles(0);
  } catch (...) {
    // Handed to the main thread through rethrow_if_failed().
    failure_ = std::current_exception();
    failed_ = true;
  }
  running_ = false;
}

bool Poller::running() const noexcept { return running_.load(); }

bool Poller::failed() const noexcept { return failed_.load(); }

void Poller::rethrow_if_failed() {
  if (!failed_.load()) {
    return;
  }
  if (worker_.joinable()) {
    worker_.join();
  }
  if (failure_ != nullptr) {
    std::rethrow_exception(std::exchange(failure_, nullptr));
  }
}

PollerStats Poller::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace kth_logger::core
