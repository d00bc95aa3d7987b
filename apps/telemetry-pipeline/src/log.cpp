#include "log.hpp"

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>

namespace telemetry {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_output_mutex;

const char* levelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "INFO";
}

} // namespace

void setLogLevel(LogLevel level) {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel logLevel() {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool parseLogLevel(const std::string& text, LogLevel& out) {
  if (text == "debug") {
    out = LogLevel::kDebug;
  } else if (text == "info") {
    out = LogLevel::kInfo;
  } else if (text == "warn" || text == "warning") {
    out = LogLevel::kWarn;
  } else if (text == "error") {
    out = LogLevel::kError;
  } else {
    return false;
  }
  return true;
}

LogLine::LogLine(LogLevel level, const char* component)
    : level_(level),
      component_(component),
      enabled_(static_cast<int>(level) >= g_level.load(std::memory_order_relaxed)) {}

LogLine::~LogLine() {
  if (!enabled_) {
    return;
  }
  std::ostringstream line;
  line << rfc3339Now() << " " << levelName(level_) << " [" << component_ << "] " << stream_.str() << "\n";

  std::lock_guard<std::mutex> lock(g_output_mutex);
  std::ostream& out = level_ >= LogLevel::kWarn ? std::cerr : std::cout;
  out << line.str();
  out.flush();
}

std::string rfc3339Now() {
  const std::time_t now = std::time(nullptr);
  std::tm tm = {};
  gmtime_r(&now, &tm);
  char buffer[32];
  const std::size_t size = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buffer, size);
}

} // namespace telemetry
