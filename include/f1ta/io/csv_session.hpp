#pragma once
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <f1ta/logging.hpp>
#include <f1ta/session.hpp>
#include <f1ta/types.hpp>

namespace f1ta::io {

// Stream parsers (test-friendly; no filesystem required). All accept an
// optional header row, ignore '#' comment lines and blank lines, trim
// whitespace around fields and skip rows that do not parse. Empty cells are
// absent values.

// session.csv: year,circuit,session_type (first valid row wins)
std::optional<SessionKey> session_key_from_csv_stream(std::istream& in);

// laps.csv: driver,lap,lap_time,sector1,sector2,sector3,compound,tyre_life,quick,stint,position
std::vector<LapRecord> laps_from_csv_stream(std::istream& in);

struct TelemetryRow {
  DriverId driver;
  int lap = 0;
  TelemetrySample sample;
};

// telemetry.csv: driver,lap,distance,speed,throttle,brake,rpm,gear,x,y
// Blank speed/throttle/brake/rpm/gear cells leave that channel absent.
std::vector<TelemetryRow> telemetry_from_csv_stream(std::istream& in);

// corners.csv: number,distance
std::vector<Corner> corners_from_csv_stream(std::istream& in);

struct DriverRow {
  DriverInfo info;
  std::optional<Rgb> color;
};

// drivers.csv: id,abbreviation,full_name,color
std::vector<DriverRow> drivers_from_csv_stream(std::istream& in);

// In-memory session built from the CSV tables of one session directory.
class CsvSession : public SessionProvider {
public:
  struct Tables {
    std::optional<SessionKey> key;
    std::optional<std::vector<LapRecord>> laps;
    std::vector<TelemetryRow> telemetry;
    std::optional<std::vector<Corner>> corners;
    std::optional<std::vector<DriverRow>> drivers;
  };

  explicit CsvSession(Tables t, logging::LogSinkPtr log = {});

  // Reads session.csv, laps.csv and the optional telemetry.csv, corners.csv
  // and drivers.csv from dir. Throws errors::InputError when dir, session.csv
  // or laps.csv is missing.
  static CsvSession load_directory(const std::string& dir, logging::LogSinkPtr log = {});

  std::optional<SessionKey> key() const override { return key_; }
  std::optional<std::vector<LapRecord>> laps() const override { return laps_; }
  std::optional<Telemetry> telemetry(const DriverId& driver, int lap_number) const override;
  std::optional<std::vector<Corner>> corners() const override { return corners_; }
  std::optional<ColorMap> driver_colors() const override;
  std::optional<std::vector<DriverInfo>> drivers() const override;

private:
  std::optional<SessionKey> key_;
  std::optional<std::vector<LapRecord>> laps_;
  std::map<std::pair<DriverId, int>, Telemetry> telemetry_;
  std::optional<std::vector<Corner>> corners_;
  std::optional<std::vector<DriverRow>> drivers_;
  logging::LogSinkPtr log_;
};

} // namespace f1ta::io
