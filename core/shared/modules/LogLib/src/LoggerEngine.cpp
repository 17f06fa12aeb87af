#include "LoggerEngine.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace LogLib {

namespace {
const char *const DEFAULT_CATEGORY = "bridge";
}

LogLevel LogLevelFromString(const std::string &level) {
  std::string s = level;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });

  if (s == "TRACE")
    return LogLevel::TRACE;
  if (s == "DEBUG")
    return LogLevel::DEBUG;
  if (s == "INFO")
    return LogLevel::INFO;
  if (s == "WARN" || s == "WARNING")
    return LogLevel::WARN;
  if (s == "ERROR")
    return LogLevel::LOG_ERROR;
  if (s == "FATAL" || s == "CRITICAL")
    return LogLevel::LOG_FATAL;
  if (s == "OFF")
    return LogLevel::OFF;
  return LogLevel::INFO;
}

LoggerEngine::LoggerEngine()
    : minLevel_(LogLevel::INFO), log_base_path_("./logs/"),
      console_output_enabled_(true), file_output_enabled_(true),
      max_log_size_mb_(100), max_log_files_(30) {}

LoggerEngine::~LoggerEngine() { flushAll(); }

LoggerEngine &LoggerEngine::getInstance() {
  static LoggerEngine instance;
  return instance;
}

void LoggerEngine::setLogLevel(LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  minLevel_ = level;
}

LogLevel LoggerEngine::getLogLevel() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return minLevel_;
}

void LoggerEngine::setLogBasePath(const std::string &path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (path != log_base_path_) {
    flushAll();
  }
  log_base_path_ = path;
  if (!log_base_path_.empty() && log_base_path_.back() != '/') {
    log_base_path_ += '/';
  }
}

std::string LoggerEngine::getLogBasePath() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return log_base_path_;
}

void LoggerEngine::setConsoleOutput(bool enabled) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  console_output_enabled_ = enabled;
}

void LoggerEngine::setFileOutput(bool enabled) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  file_output_enabled_ = enabled;
}

void LoggerEngine::setMaxLogSizeMB(size_t size_mb) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  max_log_size_mb_ = size_mb;
}

void LoggerEngine::setMaxLogFiles(int count) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  max_log_files_ = count;
}

void LoggerEngine::log(const std::string &category, LogLevel level,
                       const std::string &message) {
  if (level == LogLevel::OFF ||
      static_cast<int>(level) < static_cast<int>(getLogLevel()))
    return;

  updateStatistics(level);

  std::ostringstream oss;
  oss << "[" << getCurrentTimestamp() << "]"
      << "[" << LogLevelToString(level) << "]";

  if (!category.empty()) {
    oss << "[" << category << "]";
  }

  oss << " " << message;
  std::string formatted = oss.str();

  std::lock_guard<std::recursive_mutex> lock(mutex_);
  std::string path = file_output_enabled_ ? buildLogPath(category) : "";
  writeToFile(path, formatted);
}

void LoggerEngine::flushAll() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  for (auto &kv : logFiles_) {
    if (kv.second.is_open()) {
      kv.second.flush();
      kv.second.close();
    }
  }
  logFiles_.clear();
}

LogStatistics LoggerEngine::getStatistics() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return statistics_;
}

void LoggerEngine::resetStatistics() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  statistics_ = LogStatistics{};
}

std::string LoggerEngine::buildLogPath(const std::string &category) {
  try {
    std::filesystem::path log_file_path = buildLogFilePath(category);
    std::filesystem::create_directories(log_file_path.parent_path());
    return log_file_path.string();
  } catch (const std::filesystem::filesystem_error &) {
    return log_base_path_ + "fallback.log";
  }
}

std::filesystem::path
LoggerEngine::buildLogFilePath(const std::string &category) {
  std::filesystem::path dir_path =
      std::filesystem::path(log_base_path_) / getCurrentDate();

  std::string name = category.empty() ? DEFAULT_CATEGORY : category;
  std::replace(name.begin(), name.end(), '/', '_');
  return dir_path / (name + ".log");
}

void LoggerEngine::writeToFile(const std::string &filePath,
                               const std::string &message) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (console_output_enabled_) {
    std::cout << message << std::endl;
  }

  if (file_output_enabled_ && !filePath.empty()) {
    std::ofstream &stream = logFiles_[filePath];
    if (!stream.is_open()) {
      stream.open(filePath, std::ios::app);
    }
    if (stream.is_open()) {
      stream << message << std::endl;
      stream.flush();
      rotateIfNeeded(filePath, stream);
    }
  }
}

void LoggerEngine::rotateIfNeeded(const std::string &filePath,
                                  std::ofstream &stream) {
  const auto written = stream.tellp();
  if (written <= 0 ||
      static_cast<size_t>(written) < max_log_size_mb_ * 1024 * 1024)
    return;

  stream.close();
  shiftBackups(filePath);
  stream.open(filePath, std::ios::app);
}

void LoggerEngine::shiftBackups(const std::string &filePath) {
  namespace fs = std::filesystem;
  const int keep = std::max(1, max_log_files_);
  auto backup = [&filePath](int index) {
    return fs::path(filePath + "." + std::to_string(index));
  };

  // <name>.log.1 is the newest backup, <name>.log.<keep> the oldest
  std::error_code ec;
  fs::remove(backup(keep), ec);
  for (int i = keep - 1; i >= 1; --i) {
    if (fs::exists(backup(i), ec)) {
      fs::rename(backup(i), backup(i + 1), ec);
    }
  }
  fs::rename(filePath, backup(1), ec);
  if (ec) {
    std::cerr << "[LoggerEngine] rotate failed for " << filePath << ": "
              << ec.message() << std::endl;
  }
}

std::string LoggerEngine::getCurrentDate() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf;
  localtime_r(&t, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y%m%d");
  return oss.str();
}

std::string LoggerEngine::getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm_buf;
  localtime_r(&t, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

void LoggerEngine::updateStatistics(LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  switch (level) {
  case LogLevel::TRACE:
    statistics_.trace_count++;
    break;
  case LogLevel::DEBUG:
    statistics_.debug_count++;
    break;
  case LogLevel::INFO:
    statistics_.info_count++;
    break;
  case LogLevel::WARN:
    statistics_.warn_count++;
    break;
  case LogLevel::LOG_ERROR:
    statistics_.error_count++;
    break;
  case LogLevel::LOG_FATAL:
    statistics_.fatal_count++;
    break;
  default:
    break;
  }

  statistics_.total_logs++;
  statistics_.last_log_time = std::chrono::system_clock::now();
}

} // namespace LogLib
