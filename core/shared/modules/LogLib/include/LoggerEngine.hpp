#ifndef LOGGER_ENGINE_HPP
#define LOGGER_ENGINE_HPP

#include "LogExport.hpp"
#include "LogTypes.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace LogLib {

/**
 * @brief Core logging engine responsible for file management and rotation.
 * @details Files are written to <base>/<yyyymmdd>/<category>.log and
 * uncategorized records go to bridge.log. A file that reaches the size
 * limit is renamed to <category>.log.1 and older backups shift up, keeping
 * at most max_log_files of them.
 */
class LOGLIB_API LoggerEngine {
public:
  static LoggerEngine &getInstance();

  // Configuration
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  void setLogBasePath(const std::string &path);
  std::string getLogBasePath() const;

  void setConsoleOutput(bool enabled);
  void setFileOutput(bool enabled);

  void setMaxLogSizeMB(size_t size_mb);
  void setMaxLogFiles(int count);

  // Logging
  void log(const std::string &category, LogLevel level,
           const std::string &message);

  // Maintenance & Stats
  void flushAll();
  LogStatistics getStatistics() const;
  void resetStatistics();

private:
  LoggerEngine();
  ~LoggerEngine();

  LoggerEngine(const LoggerEngine &) = delete;
  LoggerEngine &operator=(const LoggerEngine &) = delete;

  std::string buildLogPath(const std::string &category);
  std::filesystem::path buildLogFilePath(const std::string &category);

  void writeToFile(const std::string &filePath, const std::string &message);
  void rotateIfNeeded(const std::string &filePath, std::ofstream &stream);
  void shiftBackups(const std::string &filePath);

  std::string getCurrentDate();
  std::string getCurrentTimestamp();
  void updateStatistics(LogLevel level);

  mutable std::recursive_mutex mutex_;
  std::map<std::string, std::ofstream> logFiles_;

  LogLevel minLevel_;
  std::string log_base_path_;
  bool console_output_enabled_;
  bool file_output_enabled_;

  size_t max_log_size_mb_;
  int max_log_files_;

  LogStatistics statistics_;
};

} // namespace LogLib

#endif // LOGGER_ENGINE_HPP
