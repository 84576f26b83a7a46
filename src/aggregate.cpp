#include <f1ta/aggregate.hpp>
#include <algorithm>
#include <array>
#include <f1ta/events.hpp>

namespace f1ta {

static std::vector<LapRecord> by_lap_number(std::vector<LapRecord> laps) {
  std::stable_sort(laps.begin(), laps.end(), [](const LapRecord& a, const LapRecord& b){
    return a.lap_number < b.lap_number;
  });
  return laps;
}

Outcome<double> efficiency_score(const DriverDataset& ds, const AnalyticsConfig& cfg) {
  if (!ds.fastest_telemetry || ds.fastest_telemetry->empty()) return Unavailable::MissingData;
  const auto& t = *ds.fastest_telemetry;
  if (!has_channel(t, Channel::Throttle)) return Unavailable::MissingData;
  const auto full = std::count_if(t.begin(), t.end(), [&](const TelemetrySample& s){
    return *s.throttle >= cfg.full_throttle_threshold;
  });
  const double pct = 100.0 * static_cast<double>(full) / static_cast<double>(t.size());
  return std::clamp(round1(pct), 0.0, 100.0);
}

Outcome<std::vector<SectorRow>> sector_times(const DriverDataset& ds) {
  std::vector<SectorRow> rows;
  for (const auto& lap : ds.quick_laps) {
    if (!lap.sector1 || !lap.sector2 || !lap.sector3) continue;
    rows.push_back(SectorRow{lap.lap_number, *lap.sector1, *lap.sector2, *lap.sector3});
  }
  if (rows.empty()) return Unavailable::MissingData;
  return rows;
}

Outcome<LapTimeEvolution> lap_time_evolution(const DriverDataset& ds) {
  LapTimeEvolution ev;
  double sum = 0.0;
  for (const auto& lap : by_lap_number(ds.laps)) {
    if (!lap.lap_time) continue;
    ev.points.push_back(LapTimePoint{lap.lap_number, *lap.lap_time, false});
    sum += *lap.lap_time;
  }
  if (ev.points.empty()) return Unavailable::MissingData;

  // min_element returns the first of equal minima
  auto best = std::min_element(ev.points.begin(), ev.points.end(),
                               [](const LapTimePoint& a, const LapTimePoint& b){ return a.time < b.time; });
  best->fastest = true;
  ev.mean = sum / static_cast<double>(ev.points.size());
  return ev;
}

Outcome<std::vector<CompoundPace>> stint_comparison(const DriverDataset& ds) {
  std::array<double, kCompoundCount> sum{};
  std::array<int, kCompoundCount> count{};
  for (const auto& lap : ds.laps) {
    if (!lap.lap_time || !compound_known(lap.compound)) continue;
    const auto k = static_cast<std::size_t>(lap.compound);
    sum[k] += *lap.lap_time;
    ++count[k];
  }

  std::vector<CompoundPace> rows;
  for (int k = 0; k < kCompoundCount; ++k) {
    if (count[k] == 0) continue;
    rows.push_back(CompoundPace{static_cast<Compound>(k), sum[k] / count[k], count[k]});
  }
  if (rows.empty()) return Unavailable::MissingData;

  std::stable_sort(rows.begin(), rows.end(), [](const CompoundPace& a, const CompoundPace& b){
    return a.mean < b.mean;
  });
  return rows;
}

Outcome<std::vector<TyreAgeGroup>> tyre_age_series(const DriverDataset& ds) {
  std::array<std::vector<TyreAgePoint>, kCompoundCount> buckets;
  for (const auto& lap : by_lap_number(ds.laps)) {
    if (!lap.tyre_life || !compound_known(lap.compound)) continue;
    buckets[static_cast<std::size_t>(lap.compound)].push_back(TyreAgePoint{lap.lap_number, *lap.tyre_life});
  }

  std::vector<TyreAgeGroup> groups;
  for (int k = 0; k < kCompoundCount; ++k) {
    if (buckets[k].empty()) continue;
    groups.push_back(TyreAgeGroup{static_cast<Compound>(k), std::move(buckets[k])});
  }
  if (groups.empty()) return Unavailable::MissingData;
  return groups;
}

} // namespace f1ta
