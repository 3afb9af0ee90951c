#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace kth_logger::device {

// Identification probes, answered once at startup.
inline constexpr std::uint8_t kCmdWelcome = 0x00;
inline constexpr std::uint8_t kCmdDeviceId = 0x01;
inline constexpr std::uint8_t kCmdUniqueId = 0x02;
inline constexpr std::uint8_t kCmdFirmware = 0x03;

inline constexpr std::size_t kIdentResponseMaxBytes = 100;
inline constexpr std::array<std::uint8_t, 2> kExpectedDeviceId = {0x0D, 0xEE};

enum class SensorId : std::uint8_t {
  TC1,
  TC2,
  VDD,
  TH1,
  TH2,
};

struct SensorSpec {
  SensorId id;
  std::uint8_t command;
  std::size_t width;
  double scale;
  std::string_view unit;
  bool is_signed;
};

// Declaration order is the collection order.
inline constexpr std::array<SensorSpec, 5> kSensorSpecs = {{
    {SensorId::TC1, 0x10, 2, 0.1, "T", true},
    {SensorId::TC2, 0x11, 2, 0.1, "T", true},
    {SensorId::VDD, 0x12, 4, 1.0, "uV", true},
    {SensorId::TH1, 0x14, 2, 1.0, "ADC value", false},
    {SensorId::TH2, 0x15, 2, 1.0, "ADC value", false},
}};

std::string_view sensor_name(SensorId id) noexcept;
std::optional<SensorId> parse_sensor_name(std::string_view name) noexcept;
const SensorSpec& sensor_spec(SensorId id) noexcept;

// Little-endian decode of the first min(width, bytes.size()) bytes. A signed
// value takes its sign from the highest byte present.
std::int64_t decode_raw(const std::vector<std::uint8_t>& bytes, std::size_t width, bool is_signed) noexcept;

[[nodiscard]] double decode_value(const SensorSpec& spec, const std::vector<std::uint8_t>& bytes) noexcept;

}  // namespace kth_logger::device
