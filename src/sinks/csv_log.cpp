#include "sinks/csv_log.hpp"

#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "core/timestamp.hpp"

namespace kth_logger::sinks {
namespace {

std::string escape_field(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (const char c : field) {
    if (c == '"') {
      out.push_back('"');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string format_value(const double value) {
  if (!std::isfinite(value)) {
    return std::isnan(value) ? "nan" : (value > 0 ? "inf" : "-inf");
  }
  char buffer[64]{};
  const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (result.ec != std::errc{}) {
    throw std::runtime_error("failed to format reading value");
  }
  return std::string(buffer, result.ptr);
}

bool parse_value(const std::string& text, double& value) {
  if (text == "nan") {
    value = std::nan("");
    return true;
  }
  if (text == "inf" || text == "-inf") {
    value = text.front() == '-' ? -HUGE_VAL : HUGE_VAL;
    return true;
  }
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto result = std::from_chars(begin, end, value);
  return result.ec == std::errc{} && result.ptr == end;
}

bool split_row(const std::string& line, std::vector<std::string>& fields) {
  fields.clear();
  std::string current;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          quoted = false;
        }
      } else {
        current.push_back(c);
      }
      continue;
    }
    if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  fields.push_back(std::move(current));
  return !quoted;
}

bool needs_header(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return true;
  }
  return std::filesystem::file_size(path, ec) == 0 && !ec;
}

}  // namespace

CsvLogSink::CsvLogSink(std::string path) : path_(std::move(path)) {}

void CsvLogSink::append(const model::ReadingBatch& batch) {
  if (batch.empty()) {
    return;
  }

  const bool write_header = needs_header(path_);
  std::ofstream out(path_, std::ios::out | std::ios::app);
  if (!out.is_open()) {
    throw std::runtime_error("unable to open csv log: " + path_);
  }

  if (write_header) {
    out << kCsvHeader << '\n';
  }
  for (const auto& reading : batch) {
    out << format_csv_row(reading) << '\n';
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("failed writing csv log: " + path_);
  }
}

const std::string& CsvLogSink::path() const noexcept { return path_; }

std::string format_csv_row(const model::Reading& reading) {
  std::string row = core::format_timestamp_us(reading.timestamp_us);
  row.push_back(',');
  row += escape_field(reading.sensor_id);
  row.push_back(',');
  row += escape_field(reading.unit);
  row.push_back(',');
  row += format_value(reading.value);
  return row;
}

std::vector<model::Reading> read_csv_log(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open csv log: " + path);
  }

  std::vector<model::Reading> readings;
  std::vector<std::string> fields;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    if (line == kCsvHeader) {
      continue;
    }

    const auto bad_line = [&](const char* reason) {
      return std::runtime_error(path + ":" + std::to_string(line_number) + ": " + reason);
    };

    if (!split_row(line, fields) || fields.size() != 4) {
      throw bad_line("expected 4 fields");
    }

    const auto timestamp_us = core::parse_timestamp_us(fields[0]);
    if (!timestamp_us.has_value()) {
      throw bad_line("invalid timestamp");
    }

    model::Reading reading{};
    reading.timestamp_us = *timestamp_us;
    reading.sensor_id = fields[1];
    reading.unit = fields[2];
    if (!parse_value(fields[3], reading.value)) {
      throw bad_line("invalid value");
    }
    readings.push_back(std::move(reading));
  }

  return readings;
}

}  // namespace kth_logger::sinks
