#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/poller.hpp"
#include "core/reading_buffer.hpp"
#include "device/errors.hpp"
#include "device/handshake.hpp"
#include "device/serial_transport.hpp"
#include "render/x11_chart.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

constexpr int kExitConfigError = 1;
constexpr int kExitDeviceError = 2;
constexpr std::chrono::milliseconds kShutdownCheckInterval{50};

}  // namespace

std::string format_config_settings(const kth_logger::core::LoggerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[kth] loaded config from " << config_path
         << " | port=" << config.serial.port
         << " | baud_rate=" << config.serial.baud_rate
         << " | byte_size=" << static_cast<int>(config.serial.byte_size)
         << " | stop_bits=" << static_cast<int>(config.serial.stop_bits)
         << " | timeout_ms=" << config.serial.timeout.count()
         << " | short_read="
         << (config.serial.short_read == kth_logger::device::ShortReadPolicy::Error ? "error" : "decode")
         << " | poll_interval_ms=" << config.poll_interval.count()
         << " | max_length=" << config.max_length
         << " | csv=" << (config.csv.enabled ? config.csv.path : "disabled")
         << " | render=" << (config.render.enabled ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");
  return output.str();
}

kth_logger::device::SerialOptions to_serial_options(const kth_logger::core::SerialConfig& serial) {
  kth_logger::device::SerialOptions options{};
  options.port = serial.port;
  options.baud_rate = serial.baud_rate;
  options.byte_size = serial.byte_size;
  options.stop_bits = serial.stop_bits;
  options.timeout = serial.timeout;
  return options;
}

void print_serial_ports() {
  const auto ports = kth_logger::device::list_serial_ports();
  std::cout << "\nUSB PORTS:\n";
  for (const auto& port : ports) {
    std::cout << port << '\n';
  }
  if (ports.empty()) {
    std::cout << "(none found)\n";
  }
  std::cout << std::endl;
}

void run_render_loop(const kth_logger::core::LoggerConfig& config, kth_logger::core::Poller& poller,
                     const kth_logger::core::ReadingBuffer& buffer) {
  kth_logger::render::X11ChartRenderer renderer{config.render};
  renderer.draw(buffer.snapshot());

  poller.start();
  std::uint64_t drawn_generation = buffer.generation();
  while (g_shutdown_requested == 0 && renderer.process_events()) {
    if (poller.failed()) {
      break;
    }

    const std::uint64_t generation = buffer.generation();
    if (generation != drawn_generation) {
      renderer.draw(buffer.snapshot());
      drawn_generation = generation;
    }
    std::this_thread::sleep_for(config.render.refresh_interval);
  }
  poller.stop();
  poller.rethrow_if_failed();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/kth_logger.yaml";

  kth_logger::core::LoggerConfig config{};
  try {
    config = kth_logger::core::load_logger_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return kExitConfigError;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  if (config.list_ports) {
    print_serial_ports();
  }

  try {
    kth_logger::device::SerialTransport transport{to_serial_options(config.serial)};
    kth_logger::device::identify(transport);

    kth_logger::core::ReadingBuffer buffer{config.max_length};
    kth_logger::core::Poller poller{config, transport, buffer};
    const auto first_batch = poller.prime();
    std::cerr << "[kth] initial batch of " << first_batch.size() << " readings collected\n";

    if (config.render.enabled) {
      run_render_loop(config, poller, buffer);
    } else {
      poller.run_until([] { return g_shutdown_requested != 0; }, kShutdownCheckInterval);
    }

    const auto stats = poller.stats();
    std::cerr << "[kth] " << stats.cycles_executed << " cycles, " << stats.readings_collected << " readings, "
              << stats.short_reads << " short reads, " << stats.redis_errors << " redis errors\n";
  } catch (const kth_logger::device::DeviceError& ex) {
    std::cerr << "[kth] device error: " << ex.what() << '\n';
    return kExitDeviceError;
  } catch (const std::exception& ex) {
    std::cerr << "[kth] fatal: " << ex.what() << '\n';
    return kExitDeviceError;
  }

  std::cerr << "[kth] shutdown requested; exiting cleanly\n";

  return 0;
}
