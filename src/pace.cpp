#include <f1ta/pace.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace f1ta {

double quantile_sorted(const std::vector<double>& sorted, double p) {
  if (sorted.size() == 1) return sorted.front();
  const double pos = std::clamp(p, 0.0, 1.0) * static_cast<double>(sorted.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(pos));
  const auto hi = std::min(lo + 1, sorted.size() - 1);
  const double frac = pos - static_cast<double>(lo);
  return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

Outcome<LapTimeDistribution> lap_time_distribution(const DriverDataset& ds) {
  std::vector<double> times;
  times.reserve(ds.quick_laps.size());
  for (const auto& lap : ds.quick_laps) {
    if (lap.lap_time) times.push_back(*lap.lap_time);
  }
  if (times.empty()) return Unavailable::MissingData;
  std::sort(times.begin(), times.end());

  LapTimeDistribution d;
  d.count  = static_cast<int>(times.size());
  d.min    = times.front();
  d.q1     = quantile_sorted(times, 0.25);
  d.median = quantile_sorted(times, 0.50);
  d.q3     = quantile_sorted(times, 0.75);
  d.max    = times.back();
  d.mean   = std::accumulate(times.begin(), times.end(), 0.0) / static_cast<double>(times.size());
  return d;
}

Outcome<std::vector<PositionPoint>> position_series(const DriverDataset& ds) {
  std::vector<PositionPoint> out;
  for (const auto& lap : ds.laps) {
    if (lap.position) out.push_back(PositionPoint{lap.lap_number, *lap.position});
  }
  if (out.empty()) return Unavailable::MissingData;
  std::stable_sort(out.begin(), out.end(), [](const PositionPoint& a, const PositionPoint& b){
    return a.lap < b.lap;
  });
  return out;
}

} // namespace f1ta
