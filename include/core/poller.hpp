#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "core/config.hpp"
#include "core/reading_buffer.hpp"
#include "device/collector.hpp"
#include "device/transport.hpp"
#include "model/reading.hpp"
#include "sinks/csv_log.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace kth_logger::core {

struct PollerStats {
  std::size_t cycles_executed{0};
  std::size_t readings_collected{0};
  std::size_t short_reads{0};
  std::size_t redis_errors{0};
};

// Drives collect -> persist -> ingest -> publish, either on the calling
// thread or on a worker thread that the render loop runs beside.
class Poller {
 public:
  Poller(const LoggerConfig& config, device::Transport& transport, ReadingBuffer& buffer);
  ~Poller();

  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  // One cycle without waiting, used for the startup batch.
  model::ReadingBatch prime();

  // total_cycles == 0 runs until stop() is requested.
  PollerStats run_for_cycles(std::size_t total_cycles);

  void start();
  void stop();

  // Polls on the worker thread until shutdown_requested() returns true or a
  // cycle fails, checking every check_interval. The worker is stopped and
  // any failure rethrown before returning.
  void run_until(const std::function<bool()>& shutdown_requested, std::chrono::milliseconds check_interval);

  [[nodiscard]] bool running() const noexcept;
  [[nodiscard]] bool failed() const noexcept;
  // Rethrows the error that ended the worker thread, if any.
  void rethrow_if_failed();

  [[nodiscard]] PollerStats stats() const;

 private:
  model::ReadingBatch run_cycle();
  void publish_sinks(const model::ReadingBatch& batch);
  void wait_for_next_cycle();
  void worker_main();

  std::chrono::milliseconds poll_interval_{};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_cycle_{true};
  bool publish_stdout_{false};

  device::Collector collector_;
  ReadingBuffer& buffer_;
  std::unique_ptr<sinks::CsvLogSink> csv_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  sinks::StdoutDebugSink stdout_sink_{};
  bool redis_was_ok_{true};

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  PollerStats stats_{};
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> failed_{false};
  std::exception_ptr failure_{};
  std::thread worker_{};
};

}  // namespace kth_logger::core
