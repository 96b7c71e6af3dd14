#pragma once

#include <iosfwd>
#include <string>

namespace flight_search::core {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarning = 2,
  kError = 3,
  kOff = 4,
};

// Throws std::runtime_error on an unrecognized level name.
LogLevel parse_log_level(const std::string& value);
const char* log_level_name(LogLevel level);

// Diagnostics sink for everything that is not a protocol frame. stdout belongs
// to the transport, so production wires this to stderr.
class Logger {
 public:
  Logger(std::ostream& out, LogLevel threshold);

  void set_threshold(LogLevel threshold) { threshold_ = threshold; }
  LogLevel threshold() const { return threshold_; }
  bool enabled(LogLevel level) const;

  void debug(const std::string& message) const;
  void info(const std::string& message) const;
  void warning(const std::string& message) const;
  void error(const std::string& message) const;

 private:
  void write(LogLevel level, const std::string& message) const;

  std::ostream& out_;
  LogLevel threshold_;
};

}  // namespace flight_search::core
