#pragma once
#include <vector>
#include <f1ta/dataset.hpp>
#include <f1ta/outcome.hpp>

namespace f1ta {

// Five-number summary plus mean of quick-lap times (seconds).
struct LapTimeDistribution {
  int count = 0;
  double min = 0.0;
  double q1 = 0.0;
  double median = 0.0;
  double q3 = 0.0;
  double max = 0.0;
  double mean = 0.0;
};

// Linear-interpolation quantile of an ascending range, p in [0, 1].
// Requires a non-empty input.
double quantile_sorted(const std::vector<double>& sorted, double p);

// MissingData when no quick lap has a lap time.
Outcome<LapTimeDistribution> lap_time_distribution(const DriverDataset& ds);

struct PositionPoint {
  int lap = 0;
  int position = 0;
};

// Running position per lap, ascending lap number.
Outcome<std::vector<PositionPoint>> position_series(const DriverDataset& ds);

} // namespace f1ta
