#pragma once
#include <optional>
#include <vector>
#include <f1ta/dataset.hpp>
#include <f1ta/outcome.hpp>
#include <f1ta/types.hpp>

namespace f1ta {

// One bar of a tyre-strategy chart.
struct StintSegment {
  std::optional<int> stint;   // provider stint number, if reported
  Compound compound = Compound::Unknown;
  int first_lap = 0;
  int last_lap = 0;
  int laps = 0;               // number of laps in the run
};

// Walks laps in lap-number order and starts a new segment whenever the stint
// number or the compound changes. Laps with an unknown compound are skipped.
// MissingData when no lap has a known compound.
Outcome<std::vector<StintSegment>> stint_segments(const DriverDataset& ds);

} // namespace f1ta
