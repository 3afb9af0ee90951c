#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "device/transport.hpp"

namespace kth_logger::device {

struct DeviceIdentity {
  std::vector<std::uint8_t> welcome{};
  std::vector<std::uint8_t> device_id{};
  std::vector<std::uint8_t> unique_id{};
  std::vector<std::uint8_t> firmware{};
};

// Probes the four identification registers, each over its own connection.
// Throws IdentificationError when the device ID is not the KTH-USB one; the
// remaining probes are skipped in that case.
DeviceIdentity identify(Transport& transport);

std::string format_hex(const std::vector<std::uint8_t>& bytes);
std::string format_printable(const std::vector<std::uint8_t>& bytes);

}  // namespace kth_logger::device
