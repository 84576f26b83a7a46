#include <f1ta/dataset.hpp>

namespace f1ta {

using logging::Level;

std::optional<std::size_t> fastest_lap_index(const std::vector<LapRecord>& laps) {
  std::optional<std::size_t> best;
  for (std::size_t i = 0; i < laps.size(); ++i) {
    if (!laps[i].lap_time) continue;
    // strict '<' keeps the first of equal times
    if (!best || *laps[i].lap_time < *laps[*best].lap_time) best = i;
  }
  return best;
}

std::optional<DriverDataset> assemble_driver_dataset(const SessionProvider& session,
                                                     const DriverId& driver,
                                                     const SessionContextPtr& context,
                                                     std::size_t selection_index,
                                                     const AnalyticsConfig& cfg,
                                                     const logging::LogSinkPtr& log) {
  if (!context) return std::nullopt;
  auto table = session.laps();
  if (!table) {
    logging::log(log, Level::Error, "lap table unavailable while assembling driver " + driver);
    return std::nullopt;
  }

  DriverDataset ds;
  for (const auto& lap : *table) {
    if (lap.driver != driver) continue;
    ds.laps.push_back(lap);
    if (lap.quick) ds.quick_laps.push_back(lap);
  }
  if (ds.laps.empty()) {
    logging::log(log, Level::Warning, "driver " + driver + " has no laps");
    return std::nullopt;
  }

  ds.driver = find_driver(*context, driver).value_or(DriverInfo{driver, driver, "Driver " + driver});
  ds.color = driver_color(*context, driver, selection_index, cfg.fallback_palette);
  ds.context = context;

  if (auto idx = fastest_lap_index(ds.laps); idx.has_value()) {
    ds.fastest = ds.laps[*idx];
    ds.fastest_telemetry = session.telemetry(driver, ds.fastest->lap_number);
    if (!ds.fastest_telemetry) {
      logging::log(log, Level::Warning, "no telemetry for " + ds.driver.abbreviation +
                                        " lap " + std::to_string(ds.fastest->lap_number));
    }
  } else {
    logging::log(log, Level::Warning, "driver " + ds.driver.abbreviation + " has no timed lap");
  }

  logging::log(log, Level::Debug, "assembled " + ds.driver.abbreviation + ": " +
                                  std::to_string(ds.laps.size()) + " laps, " +
                                  std::to_string(ds.quick_laps.size()) + " quick");
  return ds;
}

} // namespace f1ta
