/**
 * @file ConfigManager.cpp
 * @brief KEY=VALUE settings store implementation
 * @author NemoBridge Development Team
 */

#include "Utils/ConfigManager.h"
#include "Logging/LogManager.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits.h>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

// =============================================================================
// Construction / initialization
// =============================================================================

ConfigManager::ConfigManager() : initialized_(false) {}

bool ConfigManager::doInitialize() {
  configDir_ = findConfigDirectory();
  if (!configDir_.empty()) {
    loadMainConfig();
    loadAdditionalConfigs();
  } else {
    LogManager::getInstance().log(
        "config", LogLevel::DEBUG,
        "No config directory found, using explicit files and environment");
  }

  std::vector<std::string> explicit_files;
  std::map<std::string, std::string> overrides;
  {
    std::lock_guard<std::mutex> lock(configMutex);
    explicit_files = explicitFiles_;
    overrides = overrides_;
  }
  for (const auto &path : explicit_files) {
    loadConfigFile(path);
  }
  {
    std::lock_guard<std::mutex> lock(configMutex);
    for (const auto &kv : overrides) {
      configMap[kv.first] = kv.second;
    }
  }

  initialized_.store(true);
  return !configDir_.empty() || !explicit_files.empty();
}

void ConfigManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire)) {
    return;
  }

  static thread_local bool in_config_init = false;
  if (in_config_init) {
    return; // re-entered through LogManager during initialization
  }

  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  if (initialized_.load(std::memory_order_relaxed)) {
    return;
  }

  in_config_init = true;
  doInitialize();
  in_config_init = false;

  initialized_.store(true, std::memory_order_release);
}

void ConfigManager::reload() {
  std::lock_guard<std::recursive_mutex> init_lock(init_mutex_);
  {
    std::lock_guard<std::mutex> lock(configMutex);
    configMap.clear();
    loadedFiles_.clear();
  }

  initialized_.store(false);
  doInitialize();

  LogManager::getInstance().log("config", LogLevel::DEBUG,
                                "Settings reloaded (" +
                                    std::to_string(listAll().size()) +
                                    " keys)");
}

bool ConfigManager::load(const std::string &filepath) {
  {
    std::lock_guard<std::mutex> lock(configMutex);
    if (std::find(explicitFiles_.begin(), explicitFiles_.end(), filepath) ==
        explicitFiles_.end()) {
      explicitFiles_.push_back(filepath);
    }
  }
  bool loaded = loadConfigFile(filepath);

  // set() values win over file values
  std::lock_guard<std::mutex> lock(configMutex);
  for (const auto &kv : overrides_) {
    configMap[kv.first] = kv.second;
  }
  return loaded;
}

// =============================================================================
// Directory discovery
// =============================================================================

std::string ConfigManager::getExecutableDirectory() const {
  char buffer[PATH_MAX];
  ssize_t len = ::readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (len <= 0) {
    return ".";
  }
  buffer[len] = '\0';
  return fs::path(buffer).parent_path().string();
}

std::string ConfigManager::findConfigDirectory() {
  std::error_code ec;

  const char *env_config = std::getenv("NEMOBRIDGE_CONFIG_DIR");
  if (env_config && fs::is_directory(env_config, ec)) {
    return std::string(env_config);
  }

  const fs::path exe_dir = getExecutableDirectory();
  const std::vector<fs::path> candidates = {"./config", "../config",
                                            exe_dir / "config",
                                            exe_dir / ".." / "config"};

  for (const auto &candidate : candidates) {
    fs::path normalized = candidate.lexically_normal();
    if (!fs::is_directory(normalized, ec)) {
      continue;
    }
    fs::path absolute = fs::absolute(normalized, ec);
    return ec ? normalized.string() : absolute.string();
  }
  return "";
}

// =============================================================================
// File loading
// =============================================================================

void ConfigManager::loadMainConfig() {
  fs::path main_env_path = fs::path(configDir_) / ".env";
  std::error_code ec;

  if (fs::exists(main_env_path, ec)) {
    loadConfigFile(main_env_path.string());
  } else {
    LogManager::getInstance().log("config", LogLevel::DEBUG,
                                  "Main settings file missing: " +
                                      main_env_path.string());
  }
}

void ConfigManager::loadAdditionalConfigs() {
  std::string config_files;
  {
    std::lock_guard<std::mutex> lock(configMutex);
    auto it = configMap.find("CONFIG_FILES");
    config_files = (it != configMap.end()) ? it->second : "";
  }

  if (config_files.empty()) {
    return;
  }

  std::stringstream ss(config_files);
  std::string filename;

  while (std::getline(ss, filename, ',')) {
    filename.erase(0, filename.find_first_not_of(" \t"));
    filename.erase(filename.find_last_not_of(" \t") + 1);

    if (!filename.empty()) {
      fs::path full_path = fs::path(configDir_) / filename;
      std::error_code ec;
      if (fs::exists(full_path, ec)) {
        loadConfigFile(full_path.string());
      } else {
        LogManager::getInstance().log("config", LogLevel::WARN,
                                      "Additional settings file missing: " +
                                          filename);
      }
    }
  }
}

bool ConfigManager::loadConfigFile(const std::string &filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    LogManager::getInstance().log("config", LogLevel::LOG_ERROR,
                                  "Failed to open settings file: " + filepath);
    return false;
  }

  std::string line;
  int line_count = 0;

  {
    std::lock_guard<std::mutex> lock(configMutex);
    while (std::getline(file, line)) {
      line_count++;
      parseLine(line);
    }
    loadedFiles_.push_back(filepath);
  }

  LogManager::getInstance().log("config", LogLevel::DEBUG,
                                fs::path(filepath).filename().string() +
                                    " - " + std::to_string(line_count) +
                                    " lines read");
  return true;
}

void ConfigManager::parseLine(const std::string &line) {
  std::string trimmed = line;
  trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
  if (trimmed.empty() || trimmed[0] == '#') {
    return;
  }
  if (trimmed.rfind("export ", 0) == 0) {
    trimmed = trimmed.substr(7);
  }

  size_t pos = trimmed.find('=');
  if (pos == std::string::npos) {
    return;
  }

  std::string key = trimmed.substr(0, pos);
  std::string value = trimmed.substr(pos + 1);

  key.erase(0, key.find_first_not_of(" \t\r\n"));
  key.erase(key.find_last_not_of(" \t\r\n") + 1);
  value.erase(0, value.find_first_not_of(" \t\r\n"));
  value.erase(value.find_last_not_of(" \t\r\n") + 1);

  if (value.length() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    value = value.substr(1, value.length() - 2);
  }

  if (!key.empty()) {
    configMap[key] = value;
  }
}

// =============================================================================
// Read interface
// =============================================================================

std::string ConfigManager::get(const std::string &key) const {
  {
    std::lock_guard<std::mutex> lock(configMutex);
    auto it = configMap.find(key);
    if (it != configMap.end() && !it->second.empty()) {
      return it->second;
    }
  }

  const char *env_val = std::getenv(key.c_str());
  if (env_val) {
    return std::string(env_val);
  }

  return "";
}

std::string ConfigManager::getOrDefault(const std::string &key,
                                        const std::string &defaultValue) const {
  std::string value = get(key);
  if (!value.empty()) {
    return value;
  }
  return defaultValue;
}

void ConfigManager::set(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(configMutex);
  configMap[key] = value;
  overrides_[key] = value;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::lock_guard<std::mutex> lock(configMutex);
  return configMap.find(key) != configMap.end();
}

std::map<std::string, std::string> ConfigManager::listAll() const {
  std::lock_guard<std::mutex> lock(configMutex);
  return configMap;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      return defaultValue;
    }
    return parsed;
  } catch (const std::logic_error &) {
    return defaultValue;
  }
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;

  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (value == "true" || value == "yes" || value == "1" || value == "on")
    return true;
  if (value == "false" || value == "no" || value == "0" || value == "off")
    return false;
  return defaultValue;
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;
  try {
    return std::stod(value);
  } catch (const std::logic_error &) {
    return defaultValue;
  }
}

std::string ConfigManager::getConfigDirectory() const {
  std::lock_guard<std::mutex> lock(configMutex);
  return configDir_;
}

std::vector<std::string> ConfigManager::getLoadedFiles() const {
  std::lock_guard<std::mutex> lock(configMutex);
  return loadedFiles_;
}
