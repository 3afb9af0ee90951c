#include "device/registers.hpp"

#include <algorithm>

namespace kth_logger::device {

std::string_view sensor_name(const SensorId id) noexcept {
  switch (id) {
    case SensorId::TC1:
      return "TC1";
    case SensorId::TC2:
      return "TC2";
    case SensorId::VDD:
      return "VDD";
    case SensorId::TH1:
      return "TH1";
    case SensorId::TH2:
      return "TH2";
  }
  return "unknown";
}

std::optional<SensorId> parse_sensor_name(const std::string_view name) noexcept {
  for (const auto& spec : kSensorSpecs) {
    if (sensor_name(spec.id) == name) {
      return spec.id;
    }
  }
  return std::nullopt;
}

const SensorSpec& sensor_spec(const SensorId id) noexcept {
  return kSensorSpecs[static_cast<std::size_t>(id)];
}

std::int64_t decode_raw(const std::vector<std::uint8_t>& bytes, const std::size_t width, const bool is_signed) noexcept {
  const std::size_t count = std::min({width, bytes.size(), sizeof(std::uint64_t)});
  if (count == 0) {
    return 0;
  }

  std::uint64_t raw = 0;
  for (std::size_t i = 0; i < count; ++i) {
    raw |= static_cast<std::uint64_t>(bytes[i]) << (8U * i);
  }

  if (!is_signed || count == sizeof(std::uint64_t)) {
    return static_cast<std::int64_t>(raw);
  }

  const std::uint64_t sign_bit = std::uint64_t{1} << ((8U * count) - 1U);
  if ((raw & sign_bit) != 0) {
    raw |= ~((sign_bit << 1U) - 1U);
  }
  return static_cast<std::int64_t>(raw);
}

double decode_value(const SensorSpec& spec, const std::vector<std::uint8_t>& bytes) noexcept {
  return static_cast<double>(decode_raw(bytes, spec.width, spec.is_signed)) * spec.scale;
}

}  // namespace kth_logger::device
