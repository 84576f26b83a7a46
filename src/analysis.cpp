#include <f1ta/analysis.hpp>

namespace f1ta {

DriverAnalysis unavailable_analysis(Unavailable why) {
  DriverAnalysis a;
  a.coast = why;
  a.traction = why;
  a.coast_pct = why;
  a.traction_pct = why;
  a.coast_segments = why;
  a.traction_segments = why;
  a.efficiency = why;
  a.sectors = why;
  a.evolution = why;
  a.compounds = why;
  a.tyre_age = why;
  a.stints = why;
  a.distribution = why;
  a.positions = why;
  return a;
}

static Outcome<std::vector<EventSegment>> segments_of(const Outcome<EventMask>& m, const Telemetry& t) {
  if (!m) return m.reason();
  return event_segments(*m, t);
}

DriverAnalysis analyze_dataset(const DriverDataset& ds, const AnalyticsConfig& cfg) {
  DriverAnalysis a = unavailable_analysis(Unavailable::MissingData);
  a.driver = ds.driver;
  a.color = ds.color;

  if (ds.fastest_telemetry && !ds.fastest_telemetry->empty()) {
    const auto& t = *ds.fastest_telemetry;
    EventMasks masks = detect_events(t, cfg.detector);
    a.coast_pct = coast_percentage(masks);
    a.traction_pct = traction_percentage(masks);
    a.coast_segments = segments_of(masks.coast, t);
    a.traction_segments = segments_of(masks.traction, t);
    a.coast = std::move(masks.coast);
    a.traction = std::move(masks.traction);
  }

  a.efficiency   = efficiency_score(ds, cfg);
  a.sectors      = sector_times(ds);
  a.evolution    = lap_time_evolution(ds);
  a.compounds    = stint_comparison(ds);
  a.tyre_age     = tyre_age_series(ds);
  a.stints       = stint_segments(ds);
  a.distribution = lap_time_distribution(ds);
  a.positions    = position_series(ds);
  return a;
}

} // namespace f1ta
