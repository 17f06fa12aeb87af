#ifndef LOG_TYPES_HPP
#define LOG_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace LogLib {

/**
 * @brief Log severity, ordered from most to least verbose
 */
enum class LogLevel : uint8_t {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  LOG_ERROR = 4,
  LOG_FATAL = 5,
  OFF = 255
};

/**
 * @brief Per-level counters kept by the engine
 */
struct LogStatistics {
  uint64_t total_logs = 0;
  uint64_t trace_count = 0;
  uint64_t debug_count = 0;
  uint64_t info_count = 0;
  uint64_t warn_count = 0;
  uint64_t error_count = 0;
  uint64_t fatal_count = 0;
  std::chrono::system_clock::time_point last_log_time;
};

inline std::string LogLevelToString(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::LOG_ERROR:
    return "ERROR";
  case LogLevel::LOG_FATAL:
    return "FATAL";
  case LogLevel::OFF:
    return "OFF";
  default:
    return "UNKNOWN";
  }
}

/**
 * @brief Parses a level name (case-insensitive). Unknown names map to INFO.
 */
LogLevel LogLevelFromString(const std::string &level);

} // namespace LogLib

#endif // LOG_TYPES_HPP
