#pragma once
#include <optional>
#include <unordered_map>
#include <vector>
#include <f1ta/types.hpp>

namespace f1ta {

using ColorMap = std::unordered_map<DriverId, Rgb>;

// Loaded session as seen by the analytics core. Implementations own the data
// source; every accessor reports failure as nullopt and never throws.
class SessionProvider {
public:
  virtual ~SessionProvider() = default;

  virtual std::optional<SessionKey> key() const = 0;

  // Whole lap table, all drivers, in the provider's natural row order.
  virtual std::optional<std::vector<LapRecord>> laps() const = 0;

  // Samples for one lap, sorted by distance.
  virtual std::optional<Telemetry> telemetry(const DriverId& driver, int lap_number) const = 0;

  virtual std::optional<std::vector<Corner>> corners() const = 0;
  virtual std::optional<ColorMap> driver_colors() const = 0;
  virtual std::optional<std::vector<DriverInfo>> drivers() const = 0;
};

} // namespace f1ta
