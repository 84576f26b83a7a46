#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>
#include <f1ta/config.hpp>
#include <f1ta/logging.hpp>
#include <f1ta/session.hpp>
#include <f1ta/session_context.hpp>
#include <f1ta/types.hpp>

namespace f1ta {

// Everything the charts need for one driver, assembled once per selection.
// Holds a share of the SessionContext so it can never outlive it.
struct DriverDataset {
  DriverInfo driver;
  Rgb color;
  std::vector<LapRecord> laps;                // lap-table order
  std::optional<LapRecord> fastest;           // min lap_time; none if no timed lap
  std::optional<Telemetry> fastest_telemetry; // absent if not fetched/available
  std::vector<LapRecord> quick_laps;          // provider flag, not re-derived
  SessionContextPtr context;
};

using DriverDatasetPtr = std::shared_ptr<const DriverDataset>;

// Index of the lap with the smallest present lap_time. Ties keep the first
// occurrence in the given order. nullopt when no lap is timed.
std::optional<std::size_t> fastest_lap_index(const std::vector<LapRecord>& laps);

// nullopt when the lap table is unavailable or the driver has no laps.
// Telemetry is fetched for the fastest lap only.
std::optional<DriverDataset> assemble_driver_dataset(const SessionProvider& session,
                                                     const DriverId& driver,
                                                     const SessionContextPtr& context,
                                                     std::size_t selection_index,
                                                     const AnalyticsConfig& cfg,
                                                     const logging::LogSinkPtr& log = {});

} // namespace f1ta
