#include "render/chart_model.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <limits>
#include <map>
#include <utility>

#include "core/timestamp.hpp"

namespace kth_logger::render {
namespace {

constexpr std::int64_t kMicrosPerSecond = 1'000'000;
constexpr double kValueMargin = 0.05;

constexpr std::array<std::int64_t, 14> kTimeSteps = {
    1, 2, 5, 10, 15, 30, 60, 120, 300, 600, 900, 1800, 3600, 7200,
};

std::string format_value_label(const double value, const double step) {
  const int decimals = step >= 1.0 ? 0 : static_cast<int>(std::ceil(-std::log10(step)));
  char out[32]{};
  // Avoid "-0.0" on the zero tick.
  const double shown = std::fabs(value) < step * 1e-6 ? 0.0 : value;
  std::snprintf(out, sizeof(out), "%.*f", decimals, shown);
  return out;
}

std::int64_t floor_div(const std::int64_t value, const std::int64_t divisor) {
  std::int64_t quotient = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    --quotient;
  }
  return quotient;
}

}  // namespace

std::vector<Series> pivot_temperature_series(const std::vector<model::Reading>& rows) {
  std::map<std::string, Series> by_id;
  for (const auto& row : rows) {
    if (!model::is_temperature(row)) {
      continue;
    }
    auto& series = by_id[row.sensor_id];
    series.sensor_id = row.sensor_id;
    series.points.push_back({row.timestamp_us, row.value});
  }

  std::vector<Series> out;
  out.reserve(by_id.size());
  for (auto& [_, series] : by_id) {
    std::stable_sort(series.points.begin(), series.points.end(),
                     [](const SeriesPoint& a, const SeriesPoint& b) { return a.timestamp_us < b.timestamp_us; });
    out.push_back(std::move(series));
  }
  return out;
}

double nice_step(const double span, const std::size_t max_ticks) {
  if (!(span > 0.0) || max_ticks == 0) {
    return 1.0;
  }
  const double raw = span / static_cast<double>(max_ticks);
  const double magnitude = std::pow(10.0, std::floor(std::log10(raw)));
  for (const double multiplier : {1.0, 2.0, 5.0, 10.0}) {
    if (multiplier * magnitude >= raw) {
      return multiplier * magnitude;
    }
  }
  return 10.0 * magnitude;
}

ChartLayout compute_layout(const std::vector<Series>& series, const std::size_t max_ticks) {
  ChartLayout layout{};

  std::int64_t t_min = std::numeric_limits<std::int64_t>::max();
  std::int64_t t_max = std::numeric_limits<std::int64_t>::min();
  double y_min = std::numeric_limits<double>::infinity();
  double y_max = -std::numeric_limits<double>::infinity();
  for (const auto& item : series) {
    for (const auto& point : item.points) {
      t_min = std::min(t_min, point.timestamp_us);
      t_max = std::max(t_max, point.timestamp_us);
      if (std::isfinite(point.value)) {
        y_min = std::min(y_min, point.value);
        y_max = std::max(y_max, point.value);
      }
    }
  }

  if (t_min > t_max) {
    t_min = 0;
    t_max = 0;
  }
  if (t_min == t_max) {
    t_min -= kMicrosPerSecond;
    t_max += kMicrosPerSecond;
  }
  if (!std::isfinite(y_min) || !std::isfinite(y_max)) {
    y_min = 0.0;
    y_max = 1.0;
  }

  const double y_span = y_max - y_min;
  const double pad = y_span > 0.0 ? y_span * kValueMargin : std::max(std::fabs(y_max) * kValueMargin, 0.5);
  layout.t_min_us = t_min;
  layout.t_max_us = t_max;
  layout.y_min = y_min - pad;
  layout.y_max = y_max + pad;

  const double y_step = nice_step(layout.y_max - layout.y_min, max_ticks);
  for (double value = std::ceil(layout.y_min / y_step) * y_step; value <= layout.y_max + (y_step * 1e-9);
       value += y_step) {
    layout.y_ticks.push_back({value, format_value_label(value, y_step)});
  }

  const double span_s = static_cast<double>(t_max - t_min) / static_cast<double>(kMicrosPerSecond);
  std::int64_t step_s = kTimeSteps.back();
  for (const auto candidate : kTimeSteps) {
    if (span_s / static_cast<double>(candidate) <= static_cast<double>(max_ticks)) {
      step_s = candidate;
      break;
    }
  }
  const std::int64_t step_us = step_s * kMicrosPerSecond;
  std::int64_t tick = floor_div(t_min, step_us) * step_us;
  if (tick < t_min) {
    tick += step_us;
  }
  for (; tick <= t_max; tick += step_us) {
    layout.x_ticks.push_back({static_cast<double>(tick), core::format_clock_time(tick)});
  }

  return layout;
}

PixelPoint project(const ChartLayout& layout, const Viewport& viewport, const std::int64_t timestamp_us,
                   const double value) {
  const double t_span = static_cast<double>(layout.t_max_us - layout.t_min_us);
  const double y_span = layout.y_max - layout.y_min;
  const double fx = t_span > 0.0 ? static_cast<double>(timestamp_us - layout.t_min_us) / t_span : 0.5;
  const double fy = y_span > 0.0 ? (value - layout.y_min) / y_span : 0.5;

  PixelPoint pixel{};
  pixel.x = viewport.left + static_cast<int>(std::lround(fx * viewport.width));
  pixel.y = viewport.top + viewport.height - static_cast<int>(std::lround(fy * viewport.height));
  return pixel;
}

}  // namespace kth_logger::render
