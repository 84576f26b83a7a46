#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace f1ta::logging {

enum class Level {
  Debug,
  Info,
  Warning,
  Error,
};

class LogSink {
public:
  virtual ~LogSink() = default;
  virtual void log(Level level, std::string_view message) = 0;
};

using LogSinkPtr = std::shared_ptr<LogSink>;

// No-op when sink is null so components can run without logging.
inline void log(LogSink* sink, Level level, std::string_view message) {
  if (sink) sink->log(level, message);
}

inline void log(const LogSinkPtr& sink, Level level, std::string_view message) {
  log(sink.get(), level, message);
}

constexpr const char* level_prefix(Level level) {
  switch (level) {
    case Level::Debug:   return "[debug] ";
    case Level::Info:    return "[info ] ";
    case Level::Warning: return "[warn ] ";
    case Level::Error:   return "[error] ";
  }
  return "";
}

class OstreamLogSink : public LogSink {
public:
  explicit OstreamLogSink(std::ostream& os, Level min_level = Level::Info)
    : os_(os), min_level_(min_level) {}

  void log(Level level, std::string_view message) override {
    if (level < min_level_) return;
    os_ << level_prefix(level) << message << std::endl;
  }

private:
  std::ostream& os_;
  Level min_level_;
};

// Keeps every record; tests inspect what components reported.
class MemoryLogSink : public LogSink {
public:
  struct Record {
    Level level;
    std::string message;
  };

  void log(Level level, std::string_view message) override {
    records_.push_back(Record{level, std::string(message)});
  }

  const std::vector<Record>& records() const { return records_; }

  std::size_t count(Level level) const {
    std::size_t n = 0;
    for (const auto& r : records_) if (r.level == level) ++n;
    return n;
  }

  bool contains(std::string_view needle) const {
    for (const auto& r : records_) {
      if (r.message.find(needle) != std::string::npos) return true;
    }
    return false;
  }

private:
  std::vector<Record> records_;
};

inline LogSinkPtr make_console_log_sink(Level min_level = Level::Info) {
  return std::make_shared<OstreamLogSink>(std::clog, min_level);
}

} // namespace f1ta::logging
