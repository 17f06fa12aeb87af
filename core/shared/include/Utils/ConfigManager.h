#pragma once

/**
 * @file ConfigManager.h
 * @brief Settings store backed by KEY=VALUE (.env style) files
 * @author NemoBridge Development Team
 *
 * Lookup order for a key:
 * - values loaded from files or set() in memory
 * - process environment (fallback for keys absent from every file)
 *
 * Files:
 * - <config dir>/.env, where the config dir is NEMOBRIDGE_CONFIG_DIR or the
 *   first existing ./config, ../config, <exe>/config, <exe>/../config
 * - any file listed in CONFIG_FILES (comma separated, relative to config dir)
 * - any file passed to load(); these are re-read on every reload()
 *
 * Values given to set() override file values and survive reload().
 */

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * @class ConfigManager
 * @brief Process-wide settings store (singleton)
 */
class ConfigManager {
public:
  // ==========================================================================
  // Singleton
  // ==========================================================================

  static ConfigManager &getInstance() {
    static ConfigManager instance;
    instance.ensureInitialized();
    return instance;
  }

  // ==========================================================================
  // Read interface
  // ==========================================================================

  /**
   * @brief Clears every loaded value and reads all files again.
   */
  void reload();

  /**
   * @brief Loads an explicit settings file and remembers it for reload().
   * @return false when the file cannot be opened
   */
  bool load(const std::string &filepath);

  std::string get(const std::string &key) const;
  std::string getOrDefault(const std::string &key,
                           const std::string &defaultValue) const;
  void set(const std::string &key, const std::string &value);
  bool hasKey(const std::string &key) const;
  std::map<std::string, std::string> listAll() const;

  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;

  std::string getConfigDirectory() const;
  std::vector<std::string> getLoadedFiles() const;

private:
  ConfigManager();
  ~ConfigManager() = default;
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;
  ConfigManager(ConfigManager &&) = delete;
  ConfigManager &operator=(ConfigManager &&) = delete;

  void ensureInitialized();
  bool doInitialize();

  void parseLine(const std::string &line);
  void loadMainConfig();
  void loadAdditionalConfigs();
  bool loadConfigFile(const std::string &filepath);

  std::string findConfigDirectory();
  std::string getExecutableDirectory() const;

  std::atomic<bool> initialized_;
  mutable std::recursive_mutex init_mutex_;
  std::map<std::string, std::string> configMap;
  mutable std::mutex configMutex;
  std::string configDir_;
  std::vector<std::string> loadedFiles_;
  std::vector<std::string> explicitFiles_;
  std::map<std::string, std::string> overrides_;
};
