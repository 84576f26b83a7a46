#pragma once
#include <vector>
#include <f1ta/aggregate.hpp>
#include <f1ta/config.hpp>
#include <f1ta/dataset.hpp>
#include <f1ta/events.hpp>
#include <f1ta/outcome.hpp>
#include <f1ta/pace.hpp>
#include <f1ta/stint.hpp>

namespace f1ta {

// Every result value handed to the rendering layer for one driver. A
// default-constructed analysis reports ProviderError everywhere.
struct DriverAnalysis {
  DriverInfo driver;
  Rgb color;

  Outcome<EventMask> coast;
  Outcome<EventMask> traction;
  Outcome<double> coast_pct;
  Outcome<double> traction_pct;
  Outcome<std::vector<EventSegment>> coast_segments;
  Outcome<std::vector<EventSegment>> traction_segments;

  Outcome<double> efficiency;
  Outcome<std::vector<SectorRow>> sectors;
  Outcome<LapTimeEvolution> evolution;
  Outcome<std::vector<CompoundPace>> compounds;
  Outcome<std::vector<TyreAgeGroup>> tyre_age;

  Outcome<std::vector<StintSegment>> stints;
  Outcome<LapTimeDistribution> distribution;
  Outcome<std::vector<PositionPoint>> positions;
};

// Every result value carries `why`; used when no dataset could be built.
DriverAnalysis unavailable_analysis(Unavailable why);

// Runs each computation independently over one dataset. Pure: the same
// dataset and config always give the same analysis.
DriverAnalysis analyze_dataset(const DriverDataset& ds, const AnalyticsConfig& cfg = {});

} // namespace f1ta
