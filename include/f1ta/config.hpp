#pragma once
#include <vector>
#include <f1ta/types.hpp>

namespace f1ta {

// Thresholds for the per-sample behavioral rules.
struct DetectorConfig {
  double coast_throttle_max = 95.0;       // coast only below this throttle (%)
  double traction_rpm_rise = 200.0;       // rpm step that counts as a flare
  double traction_speed_rise_max = 1.0;   // km/h step below which speed "stagnates"
  double traction_throttle_min = 50.0;    // throttle needed for a traction event (%)
};

// Colours used when the provider has no assignment for a driver.
const std::vector<Rgb>& default_fallback_palette();

struct AnalyticsConfig {
  DetectorConfig detector;
  double full_throttle_threshold = 95.0;  // efficiency counts samples at/above this
  std::vector<Rgb> fallback_palette = default_fallback_palette();
  int report_decimals = 3;                // lap-time digits in text output
};

} // namespace f1ta
