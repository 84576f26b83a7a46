#include <f1ta/types.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace f1ta {

static inline std::string upper(std::string_view in) {
  std::string s(in);
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

Compound compound_from_string(std::string_view s) {
  const auto E = upper(s);
  if (E == "SOFT")         return Compound::Soft;
  if (E == "MEDIUM")       return Compound::Medium;
  if (E == "HARD")         return Compound::Hard;
  if (E == "INTERMEDIATE") return Compound::Intermediate;
  if (E == "WET")          return Compound::Wet;
  return Compound::Unknown;
}

const char* compound_name(Compound c) {
  switch (c) {
    case Compound::Soft:         return "SOFT";
    case Compound::Medium:       return "MEDIUM";
    case Compound::Hard:         return "HARD";
    case Compound::Intermediate: return "INTERMEDIATE";
    case Compound::Wet:          return "WET";
    default: return "UNKNOWN";
  }
}

std::string session_label(const SessionKey& k) {
  return std::to_string(k.year) + " " + k.circuit + " " + k.session_type;
}

bool telemetry_sorted(const Telemetry& t) {
  return std::is_sorted(t.begin(), t.end(), [](const TelemetrySample& a, const TelemetrySample& b) {
    return a.distance < b.distance;
  });
}

static bool sample_has(const TelemetrySample& s, Channel c) {
  switch (c) {
    case Channel::Speed:    return s.speed.has_value();
    case Channel::Throttle: return s.throttle.has_value();
    case Channel::Brake:    return s.brake.has_value();
    case Channel::Rpm:      return s.rpm.has_value();
    case Channel::Gear:     return s.gear.has_value();
    case Channel::Position: return s.pos.has_value();
  }
  return false;
}

bool has_channel(const Telemetry& t, Channel c) {
  return std::all_of(t.begin(), t.end(), [c](const TelemetrySample& s){ return sample_has(s, c); });
}

std::string driver_label(const DriverInfo& d) {
  return d.abbreviation + " - " + d.full_name;
}

static int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::optional<Rgb> rgb_from_hex(std::string_view s) {
  if (!s.empty() && s.front() == '#') s.remove_prefix(1);
  if (s.size() != 6) return std::nullopt;
  std::uint8_t v[3]{};
  for (int i = 0; i < 3; ++i) {
    const int hi = hex_digit(s[2 * i]);
    const int lo = hex_digit(s[2 * i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    v[i] = static_cast<std::uint8_t>(hi * 16 + lo);
  }
  return Rgb{v[0], v[1], v[2]};
}

std::string rgb_to_hex(const Rgb& c) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
  return std::string(buf);
}

Rgb compound_color(Compound c) {
  switch (c) {
    case Compound::Soft:         return {0xda, 0x02, 0x0e};
    case Compound::Medium:       return {0xff, 0xd1, 0x2e};
    case Compound::Hard:         return {0xf0, 0xf0, 0xec};
    case Compound::Intermediate: return {0x43, 0xb0, 0x2a};
    case Compound::Wet:          return {0x00, 0x67, 0xad};
    default: return {0x80, 0x80, 0x80};
  }
}

} // namespace f1ta
