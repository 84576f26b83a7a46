#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace f1ta {

using DriverId = std::string;  // provider racing number, e.g. "44"

enum class Compound : int {
  Soft = 0,
  Medium,
  Hard,
  Intermediate,
  Wet,
  Unknown
};

inline constexpr int kCompoundCount = 6;

// Case-insensitive; anything unrecognised maps to Unknown.
Compound compound_from_string(std::string_view s);
const char* compound_name(Compound c);  // "SOFT", "MEDIUM", ...

inline bool compound_known(Compound c) { return c != Compound::Unknown; }

// Identity of one timed session, e.g. {2024, "Monaco", "Qualifying"}.
struct SessionKey {
  int year = 0;
  std::string circuit;
  std::string session_type;

  bool operator==(const SessionKey&) const = default;
};

std::string session_label(const SessionKey& k);  // "2024 Monaco Qualifying"

struct LapRecord {
  DriverId driver;
  int lap_number = 0;                     // 1-based
  std::optional<double> lap_time;         // seconds
  std::optional<double> sector1;          // seconds
  std::optional<double> sector2;
  std::optional<double> sector3;
  Compound compound = Compound::Unknown;
  std::optional<int> tyre_life;           // laps on the fitted set
  bool quick = false;                     // provider's representative-lap flag
  std::optional<int> stint;
  std::optional<int> position;
};

struct Position2 {
  double x{};
  double y{};
};

// One point along a lap. Sequences are sorted by non-decreasing distance.
// Every channel except distance may be missing from the source.
struct TelemetrySample {
  double distance = 0.0;                 // m
  std::optional<double> speed;           // km/h
  std::optional<double> throttle;        // 0..100
  std::optional<bool> brake;
  std::optional<std::uint32_t> rpm;
  std::optional<std::uint8_t> gear;
  std::optional<Position2> pos;
};

using Telemetry = std::vector<TelemetrySample>;

enum class Channel : int {
  Speed,
  Throttle,
  Brake,
  Rpm,
  Gear,
  Position
};

// True when distances never decrease.
bool telemetry_sorted(const Telemetry& t);

// A channel counts as present only when every sample carries it.
bool has_channel(const Telemetry& t, Channel c);

struct Corner {
  int number = 0;
  double distance = 0.0;   // m along the lap
};

struct DriverInfo {
  DriverId id;
  std::string abbreviation;
  std::string full_name;
};

// "VER - Max Verstappen"
std::string driver_label(const DriverInfo& d);

// 0xRRGGBB packed colour.
struct Rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;

  bool operator==(const Rgb&) const = default;
};

// Accepts "#RRGGBB" or "RRGGBB"; nullopt otherwise.
std::optional<Rgb> rgb_from_hex(std::string_view s);
std::string rgb_to_hex(const Rgb& c);

// Default compound palette used by the dashboard.
Rgb compound_color(Compound c);

} // namespace f1ta
