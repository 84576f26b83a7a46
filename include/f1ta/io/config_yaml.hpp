#pragma once
#include <string>
#include <string_view>
#include <f1ta/config.hpp>

namespace f1ta::io {

// Every key is optional; absent keys keep the defaults of AnalyticsConfig.
//
//   detector:
//     coast_throttle_max: 95
//     traction_rpm_rise: 200
//     traction_speed_rise_max: 1
//     traction_throttle_min: 50
//   efficiency:
//     full_throttle: 95
//   fallback_palette: ["#0600EF", "#FF8700"]
//   report:
//     decimals: 3
//
// Throws errors::ConfigError naming the key and origin on bad input.
AnalyticsConfig analytics_config_from_string(std::string_view yaml,
                                             const std::string& origin = "<string>");

// Throws errors::ConfigError if the file cannot be read or parsed.
AnalyticsConfig load_analytics_config(const std::string& path);

} // namespace f1ta::io
