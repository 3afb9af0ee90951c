#pragma once

#include <string>
#include <vector>

#include "model/reading.hpp"

namespace kth_logger::sinks {

inline constexpr const char* kCsvHeader = "timestamp,id,unit,value";

// Append-only reading log. The file is reopened in append mode per batch and
// the header goes in only when the file is new or empty.
class CsvLogSink {
 public:
  explicit CsvLogSink(std::string path);

  // Throws std::runtime_error when the file cannot be written.
  void append(const model::ReadingBatch& batch);

  const std::string& path() const noexcept;

 private:
  std::string path_;
};

std::string format_csv_row(const model::Reading& reading);

// Parses a log written by CsvLogSink. The header line is optional; blank
// lines are skipped. Throws std::runtime_error naming the first bad line.
std::vector<model::Reading> read_csv_log(const std::string& path);

}  // namespace kth_logger::sinks
