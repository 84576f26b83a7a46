#pragma once
#include <cstddef>
#include <vector>
#include <f1ta/config.hpp>
#include <f1ta/outcome.hpp>
#include <f1ta/types.hpp>

namespace f1ta {

// One flag per telemetry sample, same length and order as its source.
using EventMask = std::vector<bool>;

// Each mask is computed on its own; a missing channel only blanks the masks
// that read it.
struct EventMasks {
  Outcome<EventMask> coast;     // lift/coast: throttle falling, not braking
  Outcome<EventMask> traction;  // wheelspin proxy: rpm flaring while speed stalls
};

// Rules (first-sample derivatives are 0, so index 0 never flags):
//   coast[i]    = d_throttle < 0 && throttle < coast_throttle_max && !brake
//   traction[i] = d_rpm > traction_rpm_rise && d_speed < traction_speed_rise_max
//                 && throttle > traction_throttle_min
// Coast needs throttle and brake; traction needs rpm, speed and throttle.
// MissingData when a needed channel is absent. Empty input yields empty masks.
Outcome<EventMask> detect_coast(const Telemetry& t, const DetectorConfig& cfg = {});
Outcome<EventMask> detect_traction_loss(const Telemetry& t, const DetectorConfig& cfg = {});
EventMasks detect_events(const Telemetry& t, const DetectorConfig& cfg = {});

// Round half away from zero to one decimal place.
double round1(double v);

// round(100 * flagged / n, 1); 0.0 for an empty mask.
double mask_percentage(const EventMask& m);

// Percentage of a mask, or the reason the mask is unavailable.
Outcome<double> coast_percentage(const EventMasks& m);
Outcome<double> traction_percentage(const EventMasks& m);

// Contiguous run of flagged samples, for shaded spans on a distance axis.
struct EventSegment {
  std::size_t first = 0;   // sample index
  std::size_t last = 0;    // inclusive
  double start_m = 0.0;
  double end_m = 0.0;
};

// Mask and telemetry must be aligned; extra entries on either side are ignored.
std::vector<EventSegment> event_segments(const EventMask& m, const Telemetry& t);

} // namespace f1ta
