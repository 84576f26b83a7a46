#pragma once
#include <ostream>
#include <string>
#include <f1ta/analysis.hpp>
#include <f1ta/session_context.hpp>

namespace f1ta {

// "1:28.523" (or "58.123" under a minute); "--" for negative/non-finite.
std::string fmt_lap_time(double s, int decimals = 3);

// "88.2%" or "n/a (missing data)".
std::string fmt_percent(const Outcome<double>& v);

// Plain-text rendering of every result value, one section per computation.
void write_report(std::ostream& os,
                  const SessionContext& ctx,
                  const DriverAnalysis& a,
                  int decimals = 3);

// One line per roster entry: "  44  HAM - Lewis Hamilton".
void write_roster(std::ostream& os, const SessionContext& ctx);

} // namespace f1ta
