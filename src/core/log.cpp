#include "core/log.hpp"

#include <cctype>
#include <ostream>
#include <stdexcept>

namespace flight_search::core {

LogLevel parse_log_level(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (const char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower == "debug") {
    return LogLevel::kDebug;
  }
  if (lower == "info") {
    return LogLevel::kInfo;
  }
  if (lower == "warning" || lower == "warn") {
    return LogLevel::kWarning;
  }
  if (lower == "error") {
    return LogLevel::kError;
  }
  if (lower == "off" || lower == "none") {
    return LogLevel::kOff;
  }
  throw std::runtime_error("unknown log level: " + value);
}

const char* log_level_name(const LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarning:
      return "WARNING";
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kOff:
      return "OFF";
  }
  return "UNKNOWN";
}

Logger::Logger(std::ostream& out, const LogLevel threshold) : out_(out), threshold_(threshold) {}

bool Logger::enabled(const LogLevel level) const {
  return level != LogLevel::kOff && static_cast<int>(level) >= static_cast<int>(threshold_);
}

void Logger::debug(const std::string& message) const { write(LogLevel::kDebug, message); }

void Logger::info(const std::string& message) const { write(LogLevel::kInfo, message); }

void Logger::warning(const std::string& message) const { write(LogLevel::kWarning, message); }

void Logger::error(const std::string& message) const { write(LogLevel::kError, message); }

void Logger::write(const LogLevel level, const std::string& message) const {
  if (!enabled(level)) {
    return;
  }
  out_ << "[flight-search-mcp] " << log_level_name(level) << ' ' << message << '\n';
  out_.flush();
}

}  // namespace flight_search::core
