#include <f1ta/events.hpp>
#include <algorithm>
#include <cmath>

namespace f1ta {

Outcome<EventMask> detect_coast(const Telemetry& t, const DetectorConfig& cfg) {
  if (!has_channel(t, Channel::Throttle) || !has_channel(t, Channel::Brake)) {
    return Unavailable::MissingData;
  }
  EventMask out(t.size(), false);
  for (std::size_t i = 1; i < t.size(); ++i) {
    const double throttle = *t[i].throttle;
    const double d_throttle = throttle - *t[i - 1].throttle;
    out[i] = d_throttle < 0.0 && throttle < cfg.coast_throttle_max && !*t[i].brake;
  }
  return out;
}

Outcome<EventMask> detect_traction_loss(const Telemetry& t, const DetectorConfig& cfg) {
  if (!has_channel(t, Channel::Rpm) || !has_channel(t, Channel::Speed) ||
      !has_channel(t, Channel::Throttle)) {
    return Unavailable::MissingData;
  }
  EventMask out(t.size(), false);
  for (std::size_t i = 1; i < t.size(); ++i) {
    // rpm is unsigned; take the step in double so a drop stays negative
    const double d_rpm = static_cast<double>(*t[i].rpm) - static_cast<double>(*t[i - 1].rpm);
    const double d_speed = *t[i].speed - *t[i - 1].speed;
    out[i] = d_rpm > cfg.traction_rpm_rise &&
             d_speed < cfg.traction_speed_rise_max &&
             *t[i].throttle > cfg.traction_throttle_min;
  }
  return out;
}

EventMasks detect_events(const Telemetry& t, const DetectorConfig& cfg) {
  return EventMasks{detect_coast(t, cfg), detect_traction_loss(t, cfg)};
}

double round1(double v) {
  return std::round(v * 10.0) / 10.0;
}

double mask_percentage(const EventMask& m) {
  if (m.empty()) return 0.0;
  const auto flagged = std::count(m.begin(), m.end(), true);
  const double pct = 100.0 * static_cast<double>(flagged) / static_cast<double>(m.size());
  return std::clamp(round1(pct), 0.0, 100.0);
}

static Outcome<double> outcome_percentage(const Outcome<EventMask>& m) {
  if (!m) return m.reason();
  return mask_percentage(*m);
}

Outcome<double> coast_percentage(const EventMasks& m) { return outcome_percentage(m.coast); }
Outcome<double> traction_percentage(const EventMasks& m) { return outcome_percentage(m.traction); }

std::vector<EventSegment> event_segments(const EventMask& m, const Telemetry& t) {
  std::vector<EventSegment> out;
  const std::size_t n = std::min(m.size(), t.size());
  std::size_t i = 0;
  while (i < n) {
    if (!m[i]) { ++i; continue; }
    std::size_t j = i;
    while (j + 1 < n && m[j + 1]) ++j;
    out.push_back(EventSegment{i, j, t[i].distance, t[j].distance});
    i = j + 1;
  }
  return out;
}

} // namespace f1ta
