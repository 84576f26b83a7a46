#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <f1ta/analysis.hpp>
#include <f1ta/config.hpp>
#include <f1ta/dataset.hpp>
#include <f1ta/logging.hpp>
#include <f1ta/outcome.hpp>
#include <f1ta/session.hpp>
#include <f1ta/session_context.hpp>

namespace f1ta {

// Owns the live session state: the SessionContext of the loaded session and
// a single cached DriverDataset keyed by (session, driver). Runs on the
// thread that handles user actions; nothing here blocks or spawns work.
class AnalysisController {
public:
  explicit AnalysisController(AnalyticsConfig cfg = {}, logging::LogSinkPtr log = {});

  // Replaces any previous session outright and drops the cached dataset.
  // On failure the controller ends up with no session (ProviderError).
  bool load_session(std::shared_ptr<const SessionProvider> session);
  void unload();

  bool session_loaded() const { return context_ != nullptr; }
  const SessionContextPtr& context() const { return context_; }
  const AnalyticsConfig& config() const { return cfg_; }

  // Assembles the dataset on first use; repeated selection of the same driver
  // in the same session is served from the cache. ProviderError without a
  // session, MissingData when the driver has no laps.
  Outcome<DriverDatasetPtr> select_driver(const DriverId& driver, std::size_t selection_index = 0);

  // Dataset of the current selection; null when nothing is selected.
  DriverDatasetPtr dataset() const { return dataset_; }

  // True when the dataset was built against the loaded SessionContext.
  bool is_current(const DriverDataset& ds) const;

  // Analysis of the current selection. ProviderError everywhere without one.
  DriverAnalysis analyze() const;

  // Analysis of an explicit dataset; a dataset from a previous session is
  // refused with ProviderError instead of being mixed with the new one.
  DriverAnalysis analyze(const DriverDataset& ds) const;

  // Number of assemblies performed, for cache accounting.
  std::size_t assemblies() const { return assemblies_; }

private:
  struct CacheKey {
    SessionKey session;
    DriverId driver;
    bool operator==(const CacheKey&) const = default;
  };

  AnalyticsConfig cfg_;
  logging::LogSinkPtr log_;
  std::shared_ptr<const SessionProvider> session_;
  SessionContextPtr context_;
  std::optional<CacheKey> cached_key_;
  DriverDatasetPtr dataset_;
  std::size_t assemblies_{0};
};

} // namespace f1ta
