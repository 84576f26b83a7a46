#include <f1ta/io/csv_session.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <f1ta/errors.hpp>

namespace f1ta::io {

using logging::Level;

namespace {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// No quoted fields; keep the parser small.
std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

// Calls fn(cols) for each data row; a header whose first cell is
// `header_first` is consumed once.
template <class Fn>
void for_each_row(std::istream& in, const char* header_first, Fn&& fn) {
  std::string line;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;
    auto cols = split_csv_line(raw);
    if (!header_consumed && lower(cols[0]) == header_first) {
      header_consumed = true;
      continue;
    }
    fn(cols);
  }
}

const std::string& cell(const std::vector<std::string>& cols, std::size_t i) {
  static const std::string empty;
  return i < cols.size() ? cols[i] : empty;
}

bool to_double(const std::string& s, double& out) {
  if (s.empty()) return false;
  try {
    std::size_t idx = 0;
    out = std::stod(s, &idx);
    return idx == s.size();
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

bool to_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  try {
    std::size_t idx = 0;
    out = std::stoi(s, &idx);
    return idx == s.size();
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

// Empty cell -> nullopt (ok); garbage -> ok=false.
std::optional<double> opt_double(const std::string& s, bool& ok) {
  if (s.empty()) return std::nullopt;
  double v = 0.0;
  if (!to_double(s, v)) { ok = false; return std::nullopt; }
  return v;
}

std::optional<int> opt_int(const std::string& s, bool& ok) {
  if (s.empty()) return std::nullopt;
  int v = 0;
  if (!to_int(s, v)) { ok = false; return std::nullopt; }
  return v;
}

bool to_bool(const std::string& s, bool& out) {
  const auto v = lower(s);
  if (v == "1" || v == "true" || v == "yes")              { out = true;  return true; }
  if (v.empty() || v == "0" || v == "false" || v == "no") { out = false; return true; }
  return false;
}

std::optional<bool> opt_bool(const std::string& s, bool& ok) {
  if (s.empty()) return std::nullopt;
  bool v = false;
  if (!to_bool(s, v)) { ok = false; return std::nullopt; }
  return v;
}

std::optional<LapRecord> parse_lap_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2) return std::nullopt;
  LapRecord r;
  r.driver = cell(cols, 0);
  if (r.driver.empty()) return std::nullopt;
  if (!to_int(cell(cols, 1), r.lap_number) || r.lap_number <= 0) return std::nullopt;

  bool ok = true;
  r.lap_time  = opt_double(cell(cols, 2), ok);
  r.sector1   = opt_double(cell(cols, 3), ok);
  r.sector2   = opt_double(cell(cols, 4), ok);
  r.sector3   = opt_double(cell(cols, 5), ok);
  r.compound  = compound_from_string(cell(cols, 6));
  r.tyre_life = opt_int(cell(cols, 7), ok);
  if (!to_bool(cell(cols, 8), r.quick)) ok = false;
  r.stint     = opt_int(cell(cols, 9), ok);
  r.position  = opt_int(cell(cols, 10), ok);
  if (!ok) return std::nullopt;
  return r;
}

// Driver, lap and distance are required; a blank channel cell is a missing
// channel, not a bad row.
std::optional<TelemetryRow> parse_telemetry_row(const std::vector<std::string>& cols) {
  if (cols.size() < 3) return std::nullopt;
  TelemetryRow r;
  r.driver = cell(cols, 0);
  if (r.driver.empty()) return std::nullopt;
  auto& s = r.sample;
  if (!to_int(cell(cols, 1), r.lap) || r.lap <= 0) return std::nullopt;
  if (!to_double(cell(cols, 2), s.distance)) return std::nullopt;

  bool ok = true;
  s.speed    = opt_double(cell(cols, 3), ok);
  s.throttle = opt_double(cell(cols, 4), ok);
  s.brake    = opt_bool(cell(cols, 5), ok);
  const auto rpm  = opt_int(cell(cols, 6), ok);
  const auto gear = opt_int(cell(cols, 7), ok);
  if (!ok) return std::nullopt;
  if (rpm) {
    if (*rpm < 0) return std::nullopt;
    s.rpm = static_cast<std::uint32_t>(*rpm);
  }
  if (gear) {
    if (*gear < 0 || *gear > 255) return std::nullopt;
    s.gear = static_cast<std::uint8_t>(*gear);
  }

  const auto& xs = cell(cols, 8);
  const auto& ys = cell(cols, 9);
  if (!xs.empty() || !ys.empty()) {
    Position2 p;
    if (!to_double(xs, p.x) || !to_double(ys, p.y)) return std::nullopt;
    s.pos = p;
  }
  return r;
}

std::ifstream open_in(const std::filesystem::path& p) {
  return std::ifstream(p);
}

} // namespace

std::optional<SessionKey> session_key_from_csv_stream(std::istream& in) {
  std::optional<SessionKey> out;
  for_each_row(in, "year", [&](const std::vector<std::string>& cols) {
    if (out || cols.size() < 3) return;
    SessionKey k;
    if (!to_int(cols[0], k.year) || cols[1].empty() || cols[2].empty()) return;
    k.circuit = cols[1];
    k.session_type = cols[2];
    out = k;
  });
  return out;
}

std::vector<LapRecord> laps_from_csv_stream(std::istream& in) {
  std::vector<LapRecord> out;
  for_each_row(in, "driver", [&](const std::vector<std::string>& cols) {
    if (auto row = parse_lap_row(cols); row.has_value()) out.push_back(std::move(*row));
  });
  return out;
}

std::vector<TelemetryRow> telemetry_from_csv_stream(std::istream& in) {
  std::vector<TelemetryRow> out;
  for_each_row(in, "driver", [&](const std::vector<std::string>& cols) {
    if (auto row = parse_telemetry_row(cols); row.has_value()) out.push_back(std::move(*row));
  });
  return out;
}

std::vector<Corner> corners_from_csv_stream(std::istream& in) {
  std::vector<Corner> out;
  for_each_row(in, "number", [&](const std::vector<std::string>& cols) {
    Corner c;
    if (cols.size() < 2 || !to_int(cols[0], c.number) || !to_double(cols[1], c.distance)) return;
    if (c.distance < 0.0) return;
    out.push_back(c);
  });
  return out;
}

std::vector<DriverRow> drivers_from_csv_stream(std::istream& in) {
  std::vector<DriverRow> out;
  for_each_row(in, "id", [&](const std::vector<std::string>& cols) {
    DriverRow d;
    d.info.id = cell(cols, 0);
    if (d.info.id.empty()) return;
    d.info.abbreviation = cell(cols, 1);
    d.info.full_name = cell(cols, 2);
    const auto& hex = cell(cols, 3);
    if (!hex.empty()) {
      d.color = rgb_from_hex(hex);
      if (!d.color) return;
    }
    out.push_back(std::move(d));
  });
  return out;
}

CsvSession::CsvSession(Tables t, logging::LogSinkPtr log)
  : key_(std::move(t.key)),
    laps_(std::move(t.laps)),
    corners_(std::move(t.corners)),
    drivers_(std::move(t.drivers)),
    log_(std::move(log)) {
  for (auto& row : t.telemetry) {
    telemetry_[{row.driver, row.lap}].push_back(row.sample);
  }
}

CsvSession CsvSession::load_directory(const std::string& dir, logging::LogSinkPtr log) {
  namespace fs = std::filesystem;
  const fs::path root(dir);
  if (!fs::is_directory(root)) throw errors::InputError("not a session directory", dir);

  Tables t;
  {
    auto f = open_in(root / "session.csv");
    if (!f) throw errors::InputError("missing session.csv", dir);
    t.key = session_key_from_csv_stream(f);
    if (!t.key) throw errors::InputError("session.csv has no valid row", dir);
  }
  {
    auto f = open_in(root / "laps.csv");
    if (!f) throw errors::InputError("missing laps.csv", dir);
    t.laps = laps_from_csv_stream(f);
  }
  if (auto f = open_in(root / "telemetry.csv"); f) {
    t.telemetry = telemetry_from_csv_stream(f);
  } else {
    logging::log(log, Level::Warning, "no telemetry.csv in " + dir);
  }
  if (auto f = open_in(root / "corners.csv"); f) {
    t.corners = corners_from_csv_stream(f);
  }
  if (auto f = open_in(root / "drivers.csv"); f) {
    t.drivers = drivers_from_csv_stream(f);
  }

  logging::log(log, Level::Info, "loaded " + session_label(*t.key) + " from " + dir + ": " +
                                 std::to_string(t.laps->size()) + " laps, " +
                                 std::to_string(t.telemetry.size()) + " telemetry samples");
  return CsvSession(std::move(t), std::move(log));
}

std::optional<Telemetry> CsvSession::telemetry(const DriverId& driver, int lap_number) const {
  auto it = telemetry_.find({driver, lap_number});
  if (it == telemetry_.end()) return std::nullopt;
  if (!telemetry_sorted(it->second)) {
    logging::log(log_, Level::Warning, "telemetry for driver " + driver + " lap " +
                                       std::to_string(lap_number) + " is not sorted by distance");
    return std::nullopt;
  }
  return it->second;
}

std::optional<ColorMap> CsvSession::driver_colors() const {
  if (!drivers_) return std::nullopt;
  ColorMap out;
  for (const auto& d : *drivers_) {
    if (d.color) out[d.info.id] = *d.color;
  }
  return out;
}

std::optional<std::vector<DriverInfo>> CsvSession::drivers() const {
  if (!drivers_) return std::nullopt;
  std::vector<DriverInfo> out;
  out.reserve(drivers_->size());
  for (const auto& d : *drivers_) out.push_back(d.info);
  return out;
}

} // namespace f1ta::io
