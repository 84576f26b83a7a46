#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>
#include <f1ta/logging.hpp>
#include <f1ta/outcome.hpp>
#include <f1ta/session.hpp>
#include <f1ta/types.hpp>

namespace f1ta {

// Session-scoped constants. Built once per load and read-only afterwards;
// a reload produces a new object rather than updating this one.
struct SessionContext {
  SessionKey key;
  ColorMap colors;               // may be empty
  std::vector<Corner> corners;   // sorted by distance, may be empty
  std::vector<DriverInfo> roster;  // lap-table order of first appearance
};

using SessionContextPtr = std::shared_ptr<const SessionContext>;

// ProviderError when the session key or lap table cannot be read. Missing
// colours, corners or driver details only degrade that part of the context.
Outcome<SessionContextPtr> build_session_context(const SessionProvider& session,
                                                 const logging::LogSinkPtr& log = {});

std::optional<DriverInfo> find_driver(const SessionContext& ctx, const DriverId& id);

// Provider colour if assigned, else palette[selection_index % size].
// An empty palette yields mid grey.
Rgb driver_color(const SessionContext& ctx,
                 const DriverId& id,
                 std::size_t selection_index,
                 const std::vector<Rgb>& fallback_palette);

} // namespace f1ta
