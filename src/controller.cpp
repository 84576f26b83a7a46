#include <f1ta/controller.hpp>
#include <utility>

namespace f1ta {

using logging::Level;

AnalysisController::AnalysisController(AnalyticsConfig cfg, logging::LogSinkPtr log)
  : cfg_(std::move(cfg)), log_(std::move(log)) {}

bool AnalysisController::load_session(std::shared_ptr<const SessionProvider> session) {
  unload();
  if (!session) {
    logging::log(log_, Level::Error, "no session provider");
    return false;
  }
  auto ctx = build_session_context(*session, log_);
  if (!ctx) {
    logging::log(log_, Level::Error, "session load failed; no session loaded");
    return false;
  }
  session_ = std::move(session);
  context_ = *ctx;
  return true;
}

void AnalysisController::unload() {
  session_.reset();
  context_.reset();
  cached_key_.reset();
  dataset_.reset();
}

Outcome<DriverDatasetPtr> AnalysisController::select_driver(const DriverId& driver,
                                                            std::size_t selection_index) {
  if (!session_loaded()) return Unavailable::ProviderError;

  CacheKey key{context_->key, driver};
  if (cached_key_ && *cached_key_ == key && dataset_) {
    logging::log(log_, Level::Debug, "dataset cache hit for driver " + driver);
    return dataset_;
  }

  // Driver change: the previous dataset is discarded before assembling.
  cached_key_.reset();
  dataset_.reset();

  auto ds = assemble_driver_dataset(*session_, driver, context_, selection_index, cfg_, log_);
  ++assemblies_;
  if (!ds) return Unavailable::MissingData;

  dataset_ = std::make_shared<const DriverDataset>(std::move(*ds));
  cached_key_ = std::move(key);
  return dataset_;
}

bool AnalysisController::is_current(const DriverDataset& ds) const {
  return context_ != nullptr && ds.context == context_;
}

DriverAnalysis AnalysisController::analyze() const {
  if (!dataset_) return unavailable_analysis(Unavailable::ProviderError);
  return analyze(*dataset_);
}

DriverAnalysis AnalysisController::analyze(const DriverDataset& ds) const {
  if (!is_current(ds)) {
    logging::log(log_, Level::Warning, "refusing dataset for " + ds.driver.abbreviation +
                                       " built against another session");
    return unavailable_analysis(Unavailable::ProviderError);
  }
  return analyze_dataset(ds, cfg_);
}

} // namespace f1ta
