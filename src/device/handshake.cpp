#include "device/handshake.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>

#include "device/errors.hpp"
#include "device/registers.hpp"

namespace kth_logger::device {
namespace {

std::vector<std::uint8_t> probe(Transport& transport, const std::uint8_t command) {
  const auto connection = transport.open();
  return connection->send_and_receive(command, kIdentResponseMaxBytes);
}

}  // namespace

DeviceIdentity identify(Transport& transport) {
  DeviceIdentity identity{};

  identity.welcome = probe(transport, kCmdWelcome);
  std::cerr << "[serial] welcome: " << format_printable(identity.welcome) << '\n';

  identity.device_id = probe(transport, kCmdDeviceId);
  std::cerr << "[serial] device id: " << format_hex(identity.device_id) << '\n';
  if (!std::equal(identity.device_id.begin(), identity.device_id.end(), kExpectedDeviceId.begin(),
                  kExpectedDeviceId.end())) {
    throw IdentificationError("unexpected device id " + format_hex(identity.device_id) + ", expected " +
                              format_hex({kExpectedDeviceId.begin(), kExpectedDeviceId.end()}));
  }

  identity.unique_id = probe(transport, kCmdUniqueId);
  std::cerr << "[serial] unique id: " << format_hex(identity.unique_id) << '\n';

  identity.firmware = probe(transport, kCmdFirmware);
  std::cerr << "[serial] firmware version: " << format_hex(identity.firmware) << '\n';

  return identity;
}

std::string format_hex(const std::vector<std::uint8_t>& bytes) {
  std::string out;
  out.reserve(bytes.size() * 3);
  char digits[4]{};
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    std::snprintf(digits, sizeof(digits), i == 0 ? "%02x" : " %02x", bytes[i]);
    out += digits;
  }
  return out.empty() ? "<empty>" : out;
}

std::string format_printable(const std::vector<std::uint8_t>& bytes) {
  std::string out;
  out.reserve(bytes.size());
  for (const auto byte : bytes) {
    out.push_back(std::isprint(byte) != 0 ? static_cast<char>(byte) : '.');
  }
  return out;
}

}  // namespace kth_logger::device
