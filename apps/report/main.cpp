#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include <f1ta/controller.hpp>
#include <f1ta/errors.hpp>
#include <f1ta/io/config_yaml.hpp>
#include <f1ta/io/csv_session.hpp>
#include <f1ta/logging.hpp>
#include <f1ta/report.hpp>

using namespace f1ta;

static void usage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " <session_dir> [driver] [--config <file>] [--verbose]\n"
            << "  Without a driver, lists the drivers of the session.\n";
}

int main(int argc, char** argv) {
  std::string dir, driver, config_path;
  bool verbose = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) config_path = argv[++i];
    else if (std::strcmp(argv[i], "--verbose") == 0) verbose = true;
    else if (std::strcmp(argv[i], "--help") == 0) { usage(argv[0]); return 0; }
    else if (dir.empty()) dir = argv[i];
    else if (driver.empty()) driver = argv[i];
    else { usage(argv[0]); return 2; }
  }
  if (dir.empty()) { usage(argv[0]); return 2; }

  auto log = logging::make_console_log_sink(verbose ? logging::Level::Debug : logging::Level::Info);

  AnalyticsConfig cfg;
  std::shared_ptr<const SessionProvider> session;
  try {
    if (!config_path.empty()) cfg = io::load_analytics_config(config_path);
    session = std::make_shared<io::CsvSession>(io::CsvSession::load_directory(dir, log));
  } catch (const errors::F1taError& e) {
    logging::log(log, logging::Level::Error, e.what());
    return 1;
  }

  AnalysisController ctl(cfg, log);
  if (!ctl.load_session(session)) {
    logging::log(log, logging::Level::Error, "no session loaded");
    return 1;
  }

  if (driver.empty()) {
    std::cout << session_label(ctl.context()->key) << "\n";
    write_roster(std::cout, *ctl.context());
    return 0;
  }

  auto ds = ctl.select_driver(driver);
  if (!ds) {
    logging::log(log, logging::Level::Error, "driver " + driver + ": " + unavailable_name(ds.reason()));
    return 1;
  }

  write_report(std::cout, *ctl.context(), ctl.analyze(), cfg.report_decimals);
  return 0;
}
