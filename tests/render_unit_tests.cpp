#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "model/reading.hpp"
#include "render/chart_model.hpp"

using kth_logger::model::Reading;
using kth_logger::render::ChartLayout;
using kth_logger::render::PixelPoint;
using kth_logger::render::Series;
using kth_logger::render::Viewport;
using kth_logger::render::compute_layout;
using kth_logger::render::nice_step;
using kth_logger::render::pivot_temperature_series;
using kth_logger::render::project;

namespace {

constexpr std::int64_t kBase = 1'700'000'000'000'000;
constexpr std::int64_t kSecond = 1'000'000;

bool almost_equal(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

int test_pivot_keeps_temperatures_only() {
  const std::vector<Reading> rows = {
      {kBase + (2 * kSecond), "TC2", "T", 21.0},
      {kBase + (2 * kSecond), "VDD", "uV", 3300000.0},
      {kBase, "TC1", "T", 20.0},
      {kBase + kSecond, "TH1", "ADC value", 2048.0},
      {kBase + kSecond, "TC2", "T", 20.5},
      {kBase + (3 * kSecond), "TC1", "T", 20.2},
  };

  const auto series = pivot_temperature_series(rows);
  if (series.size() != 2) {
    return fail("test_pivot_keeps_temperatures_only", "only unit T rows should become series");
  }
  if (series[0].sensor_id != "TC1" || series[1].sensor_id != "TC2") {
    return fail("test_pivot_keeps_temperatures_only", "series should be ordered by sensor id");
  }
  if (series[1].points.size() != 2 || series[1].points[0].timestamp_us != kBase + kSecond ||
      !almost_equal(series[1].points[0].value, 20.5)) {
    return fail("test_pivot_keeps_temperatures_only", "points should be ordered by timestamp");
  }

  if (!pivot_temperature_series({}).empty()) {
    return fail("test_pivot_keeps_temperatures_only", "no rows should give no series");
  }

  return 0;
}

int test_layout_bounds_and_ticks() {
  Series tc1{"TC1", {{kBase, 20.0}, {kBase + (10 * kSecond), 30.0}}};
  const ChartLayout layout = compute_layout({tc1}, 6);

  if (layout.t_min_us != kBase || layout.t_max_us != kBase + (10 * kSecond)) {
    return fail("test_layout_bounds_and_ticks", "time range should span the data");
  }
  if (!almost_equal(layout.y_min, 19.5) || !almost_equal(layout.y_max, 30.5)) {
    return fail("test_layout_bounds_and_ticks", "value range should be padded by 5%");
  }

  if (layout.y_ticks.size() != 6 || layout.y_ticks.front().label != "20" || layout.y_ticks.back().label != "30") {
    return fail("test_layout_bounds_and_ticks", "expected y ticks 20..30 in steps of 2");
  }

  if (layout.x_ticks.size() != 6) {
    return fail("test_layout_bounds_and_ticks", "expected a tick every 2 seconds");
  }
  for (const auto& tick : layout.x_ticks) {
    if (tick.label.size() != 8 || tick.label[2] != ':' || tick.label[5] != ':') {
      return fail("test_layout_bounds_and_ticks", "time ticks should read HH:MM:SS");
    }
  }

  return 0;
}

int test_layout_degenerate_data() {
  Series flat{"TC1", {{kBase, 25.0}}};
  const auto single = compute_layout({flat});
  if (single.t_min_us != kBase - kSecond || single.t_max_us != kBase + kSecond) {
    return fail("test_layout_degenerate_data", "a single instant should widen by one second each side");
  }
  if (!almost_equal(single.y_min, 23.75) || !almost_equal(single.y_max, 26.25)) {
    return fail("test_layout_degenerate_data", "flat values should pad by 5% of their magnitude");
  }

  Series zero{"TC1", {{kBase, 0.0}, {kBase + kSecond, 0.0}}};
  const auto zeros = compute_layout({zero});
  if (!almost_equal(zeros.y_min, -0.5) || !almost_equal(zeros.y_max, 0.5)) {
    return fail("test_layout_degenerate_data", "flat zero values should pad by 0.5");
  }

  const auto empty = compute_layout({});
  if (!(empty.y_min < 0.0) || !(empty.y_max > 1.0) || empty.t_max_us <= empty.t_min_us) {
    return fail("test_layout_degenerate_data", "no data should still give a drawable frame");
  }

  Series gap{"TC1", {{kBase, std::nan("")}, {kBase + kSecond, 10.0}, {kBase + (2 * kSecond), 20.0}}};
  const auto with_gap = compute_layout({gap});
  if (!std::isfinite(with_gap.y_min) || !almost_equal(with_gap.y_min, 9.5)) {
    return fail("test_layout_degenerate_data", "non-finite values should not move the bounds");
  }

  return 0;
}

int test_nice_step_ladder() {
  if (!almost_equal(nice_step(11.0, 6), 2.0)) {
    return fail("test_nice_step_ladder", "11 over 6 ticks should step by 2");
  }
  if (!almost_equal(nice_step(100.0, 5), 20.0)) {
    return fail("test_nice_step_ladder", "100 over 5 ticks should step by 20");
  }
  if (!almost_equal(nice_step(30.0, 6), 5.0)) {
    return fail("test_nice_step_ladder", "30 over 6 ticks should step by 5");
  }
  if (!almost_equal(nice_step(0.0, 6), 1.0) || !almost_equal(nice_step(10.0, 0), 1.0)) {
    return fail("test_nice_step_ladder", "degenerate input should fall back to 1");
  }
  return 0;
}

int test_project_into_viewport() {
  ChartLayout layout{};
  layout.t_min_us = 0;
  layout.t_max_us = 100;
  layout.y_min = 0.0;
  layout.y_max = 10.0;
  const Viewport viewport{10, 20, 100, 50};

  const PixelPoint origin = project(layout, viewport, 0, 0.0);
  const PixelPoint corner = project(layout, viewport, 100, 10.0);
  const PixelPoint middle = project(layout, viewport, 50, 5.0);

  if (origin.x != 10 || origin.y != 70) {
    return fail("test_project_into_viewport", "minimum should land bottom left");
  }
  if (corner.x != 110 || corner.y != 20) {
    return fail("test_project_into_viewport", "maximum should land top right");
  }
  if (middle.x != 60 || middle.y != 45) {
    return fail("test_project_into_viewport", "midpoint mismatch");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_pivot_keeps_temperatures_only(); rc != 0) return rc;
  if (int rc = test_layout_bounds_and_ticks(); rc != 0) return rc;
  if (int rc = test_layout_degenerate_data(); rc != 0) return rc;
  if (int rc = test_nice_step_ladder(); rc != 0) return rc;
  if (int rc = test_project_into_viewport(); rc != 0) return rc;

  std::cout << "[PASS] render unit tests\n";
  return 0;
}
