/**
 * @file LogManager.cpp
 * @brief LogManager implementation
 */

#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <algorithm>
#include <iostream>

LogManager::LogManager() : initialized_(false) {}

void LogManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire))
    return;

  static thread_local bool in_log_init = false;
  if (in_log_init)
    return; // ConfigManager logs while it initializes

  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  if (initialized_.load(std::memory_order_relaxed))
    return;

  in_log_init = true;
  applySettings();
  in_log_init = false;

  initialized_.store(true, std::memory_order_release);
}

void LogManager::applySettings() {
  auto &engine = LogLib::LoggerEngine::getInstance();
  auto &config = ConfigManager::getInstance();

  engine.setLogLevel(
      LogLib::LogLevelFromString(config.getOrDefault("LOG_LEVEL", "INFO")));
  engine.setConsoleOutput(config.getBool("LOG_TO_CONSOLE", true));
  engine.setFileOutput(config.getBool("LOG_TO_FILE", true));
  engine.setLogBasePath(config.getOrDefault("LOG_FILE_PATH", "./logs/"));

  int max_size_mb = config.getInt("LOG_MAX_SIZE_MB", 100);
  if (max_size_mb <= 0) {
    std::cerr << "[LogManager] LOG_MAX_SIZE_MB must be positive, using 100"
              << std::endl;
    max_size_mb = 100;
  }
  engine.setMaxLogSizeMB(static_cast<size_t>(max_size_mb));
  engine.setMaxLogFiles(config.getInt("LOG_MAX_FILES", 30));
}

void LogManager::Info(const std::string &message) {
  log("", LogLevel::INFO, message);
}
void LogManager::Warn(const std::string &message) {
  log("", LogLevel::WARN, message);
}
void LogManager::Error(const std::string &message) {
  log("", LogLevel::LOG_ERROR, message);
}
void LogManager::Debug(const std::string &message) {
  log("", LogLevel::DEBUG, message);
}

void LogManager::log(const std::string &category, LogLevel level,
                     const std::string &message) {
  LogLib::LoggerEngine::getInstance().log(category, level, message);
}

void LogManager::logEvent(const std::string &category, LogLevel level,
                          const std::string &event, const Fields &fields) {
  log(category, level, formatEvent(event, fields));
}

namespace {

bool isControl(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  return u < 0x20 || u == 0x7f;
}

bool needsQuoting(const std::string &value) {
  if (value.empty() || value.find_first_of(" =\"") != std::string::npos)
    return true;
  return std::any_of(value.begin(), value.end(), isControl);
}

} // namespace

std::string LogManager::formatEvent(const std::string &event,
                                    const Fields &fields) {
  std::ostringstream oss;
  oss << "event=" << event;
  for (const auto &kv : fields) {
    const std::string &value = kv.second;
    oss << ' ' << kv.first << '=';
    if (!needsQuoting(value)) {
      oss << value;
      continue;
    }
    oss << '"';
    for (char c : value) {
      switch (c) {
      case '"':
      case '\\':
        oss << '\\' << c;
        break;
      case '\n':
        oss << "\\n";
        break;
      case '\r':
        oss << "\\r";
        break;
      case '\t':
        oss << "\\t";
        break;
      default:
        if (isControl(c)) {
          static const char HEX[] = "0123456789abcdef";
          unsigned char u = static_cast<unsigned char>(c);
          oss << "\\x" << HEX[u >> 4] << HEX[u & 0x0f];
        } else {
          oss << c;
        }
      }
    }
    oss << '"';
  }
  return oss.str();
}

void LogManager::setLogLevel(LogLevel level) {
  LogLib::LoggerEngine::getInstance().setLogLevel(level);
}

LogLevel LogManager::getLogLevel() const {
  return LogLib::LoggerEngine::getInstance().getLogLevel();
}

void LogManager::reloadSettings() {
  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  applySettings();
}

void LogManager::flushAll() { LogLib::LoggerEngine::getInstance().flushAll(); }
