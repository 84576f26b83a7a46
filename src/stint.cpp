#include <f1ta/stint.hpp>
#include <algorithm>

namespace f1ta {

Outcome<std::vector<StintSegment>> stint_segments(const DriverDataset& ds) {
  std::vector<LapRecord> laps = ds.laps;
  std::stable_sort(laps.begin(), laps.end(), [](const LapRecord& a, const LapRecord& b){
    return a.lap_number < b.lap_number;
  });

  std::vector<StintSegment> out;
  for (const auto& lap : laps) {
    if (!compound_known(lap.compound)) continue;
    const bool extends = !out.empty() &&
                         out.back().compound == lap.compound &&
                         out.back().stint == lap.stint;
    if (extends) {
      out.back().last_lap = lap.lap_number;
      ++out.back().laps;
    } else {
      out.push_back(StintSegment{lap.stint, lap.compound, lap.lap_number, lap.lap_number, 1});
    }
  }
  if (out.empty()) return Unavailable::MissingData;
  return out;
}

} // namespace f1ta
