#include <f1ta/session_context.hpp>
#include <algorithm>
#include <unordered_set>

namespace f1ta {

using logging::Level;

static DriverInfo fallback_info(const DriverId& id) {
  return DriverInfo{id, id, "Driver " + id};
}

static std::vector<DriverInfo> build_roster(const std::vector<LapRecord>& laps,
                                            const std::optional<std::vector<DriverInfo>>& known) {
  std::vector<DriverInfo> roster;
  std::unordered_set<DriverId> seen;
  for (const auto& lap : laps) {
    if (lap.driver.empty() || !seen.insert(lap.driver).second) continue;
    std::optional<DriverInfo> info;
    if (known) {
      auto it = std::find_if(known->begin(), known->end(),
                             [&](const DriverInfo& d){ return d.id == lap.driver; });
      if (it != known->end()) info = *it;
    }
    DriverInfo d = info.value_or(fallback_info(lap.driver));
    if (d.abbreviation.empty()) d.abbreviation = d.id;
    if (d.full_name.empty()) d.full_name = "Driver " + d.id;
    roster.push_back(std::move(d));
  }
  return roster;
}

Outcome<SessionContextPtr> build_session_context(const SessionProvider& session,
                                                 const logging::LogSinkPtr& log) {
  auto key = session.key();
  if (!key) {
    logging::log(log, Level::Error, "session key unavailable");
    return Unavailable::ProviderError;
  }
  auto laps = session.laps();
  if (!laps) {
    logging::log(log, Level::Error, "lap table unavailable for " + session_label(*key));
    return Unavailable::ProviderError;
  }

  auto ctx = std::make_shared<SessionContext>();
  ctx->key = *key;

  if (auto colors = session.driver_colors(); colors.has_value()) {
    ctx->colors = std::move(*colors);
  } else {
    logging::log(log, Level::Warning, "no driver colour mapping; using fallback palette");
  }

  if (auto corners = session.corners(); corners.has_value()) {
    ctx->corners = std::move(*corners);
    std::stable_sort(ctx->corners.begin(), ctx->corners.end(),
                     [](const Corner& a, const Corner& b){ return a.distance < b.distance; });
  } else {
    logging::log(log, Level::Warning, "no circuit corners for " + session_label(*key));
  }

  auto known = session.drivers();
  if (!known) {
    logging::log(log, Level::Warning, "no driver details; using racing numbers");
  }
  ctx->roster = build_roster(*laps, known);

  logging::log(log, Level::Info, "session context ready: " + session_label(ctx->key) + ", " +
                                 std::to_string(ctx->roster.size()) + " drivers, " +
                                 std::to_string(ctx->corners.size()) + " corners");
  return SessionContextPtr(std::move(ctx));
}

std::optional<DriverInfo> find_driver(const SessionContext& ctx, const DriverId& id) {
  auto it = std::find_if(ctx.roster.begin(), ctx.roster.end(),
                         [&](const DriverInfo& d){ return d.id == id; });
  if (it == ctx.roster.end()) return std::nullopt;
  return *it;
}

Rgb driver_color(const SessionContext& ctx,
                 const DriverId& id,
                 std::size_t selection_index,
                 const std::vector<Rgb>& fallback_palette) {
  if (auto it = ctx.colors.find(id); it != ctx.colors.end()) return it->second;
  // Some providers key colours by abbreviation.
  if (auto info = find_driver(ctx, id); info.has_value()) {
    if (auto it = ctx.colors.find(info->abbreviation); it != ctx.colors.end()) return it->second;
  }
  if (fallback_palette.empty()) return Rgb{0x80, 0x80, 0x80};
  return fallback_palette[selection_index % fallback_palette.size()];
}

} // namespace f1ta
