#pragma once
#include <vector>
#include <f1ta/config.hpp>
#include <f1ta/dataset.hpp>
#include <f1ta/outcome.hpp>
#include <f1ta/types.hpp>

namespace f1ta {

// Share of fastest-lap samples at or above cfg.full_throttle_threshold, in
// percent, one decimal. MissingData when the lap has no telemetry, no samples
// or no throttle channel. Other channels are not read.
Outcome<double> efficiency_score(const DriverDataset& ds, const AnalyticsConfig& cfg = {});

struct SectorRow {
  int lap = 0;
  double s1 = 0.0;
  double s2 = 0.0;
  double s3 = 0.0;
};

// Quick laps with all three sectors present; others are dropped, never filled.
Outcome<std::vector<SectorRow>> sector_times(const DriverDataset& ds);

struct LapTimePoint {
  int lap = 0;
  double time = 0.0;     // seconds
  bool fastest = false;  // exactly one point carries the flag
};

struct LapTimeEvolution {
  std::vector<LapTimePoint> points;  // ascending lap number
  double mean = 0.0;
};

// Every timed lap. The first minimum in lap order is tagged fastest.
Outcome<LapTimeEvolution> lap_time_evolution(const DriverDataset& ds);

struct CompoundPace {
  Compound compound = Compound::Unknown;
  double mean = 0.0;  // seconds
  int laps = 0;
};

// Timed laps with a known compound, one row per compound, fastest mean first.
// Equal means keep compound declaration order.
Outcome<std::vector<CompoundPace>> stint_comparison(const DriverDataset& ds);

struct TyreAgePoint {
  int lap = 0;
  int tyre_life = 0;
};

struct TyreAgeGroup {
  Compound compound = Compound::Unknown;
  std::vector<TyreAgePoint> points;  // ascending lap number
};

// Laps with tyre life and a known compound, grouped by compound in
// declaration order (SOFT, MEDIUM, HARD, INTERMEDIATE, WET).
Outcome<std::vector<TyreAgeGroup>> tyre_age_series(const DriverDataset& ds);

} // namespace f1ta
