#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace kth_logger::device {

// One open link to the device. Closed when destroyed.
class Connection {
 public:
  // Writes one command byte, drains output, then reads until expected_length
  // bytes arrived or the read timeout elapsed. The result may be short.
  virtual std::vector<std::uint8_t> send_and_receive(std::uint8_t command, std::size_t expected_length) = 0;
  virtual ~Connection() = default;
};

class Transport {
 public:
  virtual std::unique_ptr<Connection> open() = 0;
  virtual ~Transport() = default;
};

}  // namespace kth_logger::device
