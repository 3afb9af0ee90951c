#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "model/reading.hpp"

namespace kth_logger::render {

struct SeriesPoint {
  std::int64_t timestamp_us;
  double value;
};

struct Series {
  std::string sensor_id{};
  std::vector<SeriesPoint> points{};
};

struct Tick {
  double position;
  std::string label;
};

struct ChartLayout {
  std::int64_t t_min_us{0};
  std::int64_t t_max_us{0};
  double y_min{0.0};
  double y_max{1.0};
  std::vector<Tick> x_ticks{};
  std::vector<Tick> y_ticks{};
};

struct Viewport {
  int left;
  int top;
  int width;
  int height;
};

struct PixelPoint {
  int x;
  int y;
};

// Temperature rows only, one series per sensor id sorted by id, each series
// ordered by timestamp.
std::vector<Series> pivot_temperature_series(const std::vector<model::Reading>& rows);

ChartLayout compute_layout(const std::vector<Series>& series, std::size_t max_ticks = 6);

// Step from the 1-2-5 ladder so that span / step <= max_ticks.
double nice_step(double span, std::size_t max_ticks);

PixelPoint project(const ChartLayout& layout, const Viewport& viewport, std::int64_t timestamp_us, double value);

}  // namespace kth_logger::render
