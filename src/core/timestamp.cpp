#include "core/timestamp.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <ctime>

namespace kth_logger::core {
namespace {

constexpr std::int64_t kMicrosPerSecond = 1'000'000;

struct SplitTime {
  std::time_t seconds;
  std::int64_t micros;
};

SplitTime split(const std::int64_t timestamp_us) noexcept {
  std::int64_t seconds = timestamp_us / kMicrosPerSecond;
  std::int64_t micros = timestamp_us % kMicrosPerSecond;
  if (micros < 0) {
    micros += kMicrosPerSecond;
    --seconds;
  }
  return {static_cast<std::time_t>(seconds), micros};
}

// Digits only; from_chars alone would accept a leading '-'.
bool parse_field(const std::string_view text, const std::size_t pos, const std::size_t len, int& out) noexcept {
  if (pos + len > text.size()) {
    return false;
  }
  const char* begin = text.data() + pos;
  const char* end = begin + len;
  if (!std::all_of(begin, end, [](const char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  const auto result = std::from_chars(begin, end, out);
  return result.ec == std::errc{} && result.ptr == end;
}

}  // namespace

std::string format_timestamp_us(const std::int64_t timestamp_us) {
  const auto [seconds, micros] = split(timestamp_us);
  std::tm utc{};
  ::gmtime_r(&seconds, &utc);

  char out[40]{};
  std::snprintf(out, sizeof(out), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ", utc.tm_year + 1900, utc.tm_mon + 1,
                utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<long long>(micros));
  return out;
}

std::optional<std::int64_t> parse_timestamp_us(std::string_view text) {
  if (!text.empty() && text.back() == 'Z') {
    text.remove_suffix(1);
  }

  // YYYY-MM-DD?HH:MM:SS
  if (text.size() < 19 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
      text[13] != ':' || text[16] != ':') {
    return std::nullopt;
  }

  std::tm utc{};
  int year = 0;
  int month = 0;
  if (!parse_field(text, 0, 4, year) || !parse_field(text, 5, 2, month) || !parse_field(text, 8, 2, utc.tm_mday) ||
      !parse_field(text, 11, 2, utc.tm_hour) || !parse_field(text, 14, 2, utc.tm_min) ||
      !parse_field(text, 17, 2, utc.tm_sec)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || utc.tm_mday < 1 || utc.tm_mday > 31 || utc.tm_hour > 23 || utc.tm_min > 59 ||
      utc.tm_sec > 60) {
    return std::nullopt;
  }
  utc.tm_year = year - 1900;
  utc.tm_mon = month - 1;

  std::int64_t micros = 0;
  if (text.size() > 19) {
    const std::size_t digits = text.size() - 20;
    if (text[19] != '.' || digits == 0 || digits > 6) {
      return std::nullopt;
    }
    int fraction = 0;
    if (!parse_field(text, 20, digits, fraction)) {
      return std::nullopt;
    }
    micros = fraction;
    for (std::size_t i = digits; i < 6; ++i) {
      micros *= 10;
    }
  }

  const std::time_t seconds = ::timegm(&utc);
  return (static_cast<std::int64_t>(seconds) * kMicrosPerSecond) + micros;
}

std::string format_clock_time(const std::int64_t timestamp_us) {
  const std::time_t seconds = split(timestamp_us).seconds;
  std::tm local{};
  ::localtime_r(&seconds, &local);

  char out[16]{};
  std::strftime(out, sizeof(out), "%H:%M:%S", &local);
  return out;
}

}  // namespace kth_logger::core
