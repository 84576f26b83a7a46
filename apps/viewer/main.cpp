#include <iostream>
#include <memory>
#include <string>

#include <f1ta/controller.hpp>
#include <f1ta/errors.hpp>
#include <f1ta/io/config_yaml.hpp>
#include <f1ta/io/csv_session.hpp>
#include <f1ta/logging.hpp>
#include <f1ta/viewer/app.hpp>

using namespace f1ta;

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <session_dir> [config.yaml]\n";
    return 2;
  }
  auto log = logging::make_console_log_sink();

  AnalyticsConfig cfg;
  std::shared_ptr<const SessionProvider> session;
  try {
    if (argc > 2) cfg = io::load_analytics_config(argv[2]);
    session = std::make_shared<io::CsvSession>(io::CsvSession::load_directory(argv[1], log));
  } catch (const errors::F1taError& e) {
    logging::log(log, logging::Level::Error, e.what());
    return 1;
  }

  AnalysisController ctl(cfg, log);
  if (!ctl.load_session(session)) {
    logging::log(log, logging::Level::Error, "no session loaded");
    return 1;
  }

  DashboardApp app(ctl);
  return app.run();
}
