#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

/**
 * @file LogManager.h
 * @brief NemoBridge log manager - delegation wrapper over LogLib
 * @details
 * File handling, rotation and statistics live in LogLib::LoggerEngine.
 * This class adds leveled helpers with "{}" placeholders, categorized and
 * structured event records, and applies the LOG_* settings from
 * ConfigManager.
 */

#include "LoggerEngine.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

using LogLevel = LogLib::LogLevel;

class LogManager {
public:
  using Fields = std::map<std::string, std::string>;

  static LogManager &getInstance() {
    static LogManager instance;
    instance.ensureInitialized();
    return instance;
  }

  // =============================================================================
  // Leveled helpers (uncategorized)
  // =============================================================================
  void Info(const std::string &message);
  void Warn(const std::string &message);
  void Error(const std::string &message);
  void Debug(const std::string &message);

  template <typename... Args>
  void Info(const std::string &pattern, const Args &...args) {
    Info(format(pattern, args...));
  }
  template <typename... Args>
  void Warn(const std::string &pattern, const Args &...args) {
    Warn(format(pattern, args...));
  }
  template <typename... Args>
  void Error(const std::string &pattern, const Args &...args) {
    Error(format(pattern, args...));
  }
  template <typename... Args>
  void Debug(const std::string &pattern, const Args &...args) {
    Debug(format(pattern, args...));
  }

  /**
   * @brief Replaces each "{}" in order with the streamed argument.
   * @details Surplus placeholders are kept verbatim, surplus arguments are
   * dropped.
   */
  template <typename... Args>
  static std::string format(const std::string &pattern, const Args &...args) {
    std::ostringstream out;
    size_t pos = 0;
    appendArgs(out, pattern, pos, args...);
    if (pos < pattern.size()) {
      out << pattern.substr(pos);
    }
    return out.str();
  }

  // =============================================================================
  // Categorized and structured records
  // =============================================================================
  void log(const std::string &category, LogLevel level,
           const std::string &message);

  /**
   * @brief Writes "event=<event> key=value ..." to the given category.
   * @details Keys come out sorted. Values that are empty or contain
   * spaces, '=', quotes or control characters are double-quoted. Inside
   * quotes '"' and '\' are backslash-escaped, newline, carriage return and
   * tab become \n, \r and \t, other control bytes become \xHH.
   */
  void logEvent(const std::string &category, LogLevel level,
                const std::string &event, const Fields &fields = {});

  static std::string formatEvent(const std::string &event,
                                 const Fields &fields);

  // =============================================================================
  // Settings
  // =============================================================================
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  /// Re-applies LOG_LEVEL, LOG_TO_CONSOLE, LOG_TO_FILE, LOG_FILE_PATH,
  /// LOG_MAX_SIZE_MB and LOG_MAX_FILES from ConfigManager.
  void reloadSettings();
  void flushAll();

private:
  LogManager();
  ~LogManager() = default;

  void ensureInitialized();
  void applySettings();

  static void appendArgs(std::ostringstream &, const std::string &, size_t &) {}

  template <typename T, typename... Rest>
  static void appendArgs(std::ostringstream &out, const std::string &pattern,
                         size_t &pos, const T &value, const Rest &...rest) {
    size_t placeholder = pattern.find("{}", pos);
    if (placeholder == std::string::npos) {
      return;
    }
    out << pattern.substr(pos, placeholder - pos) << value;
    pos = placeholder + 2;
    appendArgs(out, pattern, pos, rest...);
  }

  std::atomic<bool> initialized_;
  mutable std::recursive_mutex init_mutex_;
};

#endif // LOG_MANAGER_H
