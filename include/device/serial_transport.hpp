#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "device/transport.hpp"

namespace kth_logger::device {

struct SerialOptions {
  std::string port{"/dev/ttyUSB0"};
  std::uint32_t baud_rate{9600};
  std::uint8_t byte_size{8};
  std::uint8_t stop_bits{1};
  std::chrono::milliseconds timeout{1000};
};

class SerialConnection final : public Connection {
 public:
  explicit SerialConnection(const SerialOptions& options);
  ~SerialConnection() override;

  SerialConnection(const SerialConnection&) = delete;
  SerialConnection& operator=(const SerialConnection&) = delete;
  SerialConnection(SerialConnection&&) = delete;
  SerialConnection& operator=(SerialConnection&&) = delete;

  std::vector<std::uint8_t> send_and_receive(std::uint8_t command, std::size_t expected_length) override;

 private:
  void configure(const SerialOptions& options);

  std::string port_;
  std::chrono::milliseconds timeout_;
  int fd_{-1};
};

class SerialTransport final : public Transport {
 public:
  explicit SerialTransport(SerialOptions options);

  std::unique_ptr<Connection> open() override;
  const SerialOptions& options() const noexcept;

 private:
  SerialOptions options_;
};

bool is_supported_baud_rate(std::uint32_t baud_rate) noexcept;

// Candidate device nodes: /dev/serial/by-id/*, /dev/ttyUSB*, /dev/ttyACM*.
std::vector<std::string> list_serial_ports();

}  // namespace kth_logger::device
