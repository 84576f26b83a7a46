#include <f1ta/report.hpp>
#include <cmath>
#include <cstdio>

namespace f1ta {

std::string fmt_lap_time(double s, int decimals) {
  if (s < 0.0 || !std::isfinite(s)) return "--";
  if (decimals < 0) decimals = 0;
  // Round once so 59.9996 becomes 1:00.000 rather than 0:60.000.
  const double scale = std::pow(10.0, decimals);
  const double r = std::round(s * scale) / scale;
  const int minutes = static_cast<int>(r / 60.0);
  const double rem = r - minutes * 60.0;
  char buf[32];
  if (minutes > 0) {
    const int width = decimals > 0 ? decimals + 3 : 2;
    std::snprintf(buf, sizeof(buf), "%d:%0*.*f", minutes, width, decimals, rem);
  } else {
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, rem);
  }
  return std::string(buf);
}

std::string fmt_percent(const Outcome<double>& v) {
  if (!v) return std::string("n/a (") + unavailable_name(v.reason()) + ")";
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%.1f%%", *v);
  return std::string(buf);
}

template <class T>
static bool section_unavailable(std::ostream& os, const Outcome<T>& v) {
  if (v) return false;
  os << "  n/a (" << unavailable_name(v.reason()) << ")\n";
  return true;
}

void write_roster(std::ostream& os, const SessionContext& ctx) {
  for (const auto& d : ctx.roster) {
    os << "  " << d.id << "  " << driver_label(d) << "\n";
  }
}

void write_report(std::ostream& os,
                  const SessionContext& ctx,
                  const DriverAnalysis& a,
                  int decimals) {
  os << session_label(ctx.key) << " - " << driver_label(a.driver)
     << " [" << rgb_to_hex(a.color) << "]\n";

  os << "\nDriving style (fastest lap)\n";
  os << "  full throttle  " << fmt_percent(a.efficiency) << "\n";
  os << "  coast/lift     " << fmt_percent(a.coast_pct) << "\n";
  os << "  traction loss  " << fmt_percent(a.traction_pct) << "\n";
  if (a.coast_segments && !a.coast_segments->empty()) {
    os << "  coast zones   ";
    for (const auto& seg : *a.coast_segments) {
      os << " " << static_cast<long>(seg.start_m) << "-" << static_cast<long>(seg.end_m) << "m";
    }
    os << "\n";
  }

  os << "\nLap times\n";
  if (!section_unavailable(os, a.evolution)) {
    for (const auto& p : a.evolution->points) {
      os << "  lap " << p.lap << "  " << fmt_lap_time(p.time, decimals)
         << (p.fastest ? "  fastest" : "") << "\n";
    }
    os << "  mean   " << fmt_lap_time(a.evolution->mean, decimals) << "\n";
  }

  os << "\nQuick-lap distribution\n";
  if (!section_unavailable(os, a.distribution)) {
    const auto& d = *a.distribution;
    os << "  n=" << d.count
       << "  min " << fmt_lap_time(d.min, decimals)
       << "  q1 " << fmt_lap_time(d.q1, decimals)
       << "  median " << fmt_lap_time(d.median, decimals)
       << "  q3 " << fmt_lap_time(d.q3, decimals)
       << "  max " << fmt_lap_time(d.max, decimals) << "\n";
  }

  os << "\nSectors (quick laps)\n";
  if (!section_unavailable(os, a.sectors)) {
    for (const auto& r : *a.sectors) {
      os << "  lap " << r.lap << "  " << fmt_lap_time(r.s1, decimals)
         << "  " << fmt_lap_time(r.s2, decimals)
         << "  " << fmt_lap_time(r.s3, decimals) << "\n";
    }
  }

  os << "\nCompound pace\n";
  if (!section_unavailable(os, a.compounds)) {
    for (const auto& c : *a.compounds) {
      os << "  " << compound_name(c.compound) << "  " << fmt_lap_time(c.mean, decimals)
         << "  (" << c.laps << " laps)\n";
    }
  }

  os << "\nStints\n";
  if (!section_unavailable(os, a.stints)) {
    for (const auto& s : *a.stints) {
      os << "  ";
      if (s.stint) os << "#" << *s.stint << " ";
      os << compound_name(s.compound) << "  laps " << s.first_lap << "-" << s.last_lap
         << " (" << s.laps << ")\n";
    }
  }

  os << "\nTyre age\n";
  if (!section_unavailable(os, a.tyre_age)) {
    for (const auto& g : *a.tyre_age) {
      os << "  " << compound_name(g.compound) << ":";
      for (const auto& p : g.points) os << " " << p.lap << "/" << p.tyre_life;
      os << "\n";
    }
  }

  os << "\nPositions\n";
  if (!section_unavailable(os, a.positions)) {
    os << " ";
    for (const auto& p : *a.positions) os << " L" << p.lap << ":P" << p.position;
    os << "\n";
  }
}

} // namespace f1ta
