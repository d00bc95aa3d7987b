#ifndef TELEMETRY_PIPELINE_LOG_HPP
#define TELEMETRY_PIPELINE_LOG_HPP

#include <sstream>
#include <string>

namespace telemetry {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

void setLogLevel(LogLevel level);
LogLevel logLevel();
bool parseLogLevel(const std::string& text, LogLevel& out);

// One log line. The text is buffered and written as a single line when the
// object goes out of scope; info/debug go to stdout, warn/error to stderr.
class LogLine {
 public:
  LogLine(LogLevel level, const char* component);
  ~LogLine();

  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;

  template <typename T>
  LogLine& operator<<(const T& value) {
    if (enabled_) {
      stream_ << value;
    }
    return *this;
  }

 private:
  LogLevel level_;
  const char* component_;
  bool enabled_;
  std::ostringstream stream_;
};

inline LogLine logDebug(const char* component) { return LogLine(LogLevel::kDebug, component); }
inline LogLine logInfo(const char* component) { return LogLine(LogLevel::kInfo, component); }
inline LogLine logWarn(const char* component) { return LogLine(LogLevel::kWarn, component); }
inline LogLine logError(const char* component) { return LogLine(LogLevel::kError, component); }

// Current UTC time as RFC3339, e.g. 2024-05-01T12:00:00Z.
std::string rfc3339Now();

} // namespace telemetry

#endif
