/**
 * @file BridgeConfig.cpp
 * @brief Bridge settings and ConfigManager source
 */

#include "Bridge/Service/BridgeConfig.h"
#include "Bridge/BridgeErrors.h"
#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace NemoBridge {
namespace Bridge {
namespace Service {

namespace Keys = NemoBridge::Constants::Bridge::Config;

std::string BridgeConfig::brokerUri() const {
  return "tcp://" + broker_host + ":" + std::to_string(broker_port);
}

void BridgeConfig::validate() const {
  std::string mode = service_mode;
  std::transform(mode.begin(), mode.end(), mode.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (mode == "self_managed") {
    throw ConfigError("service mode 'self_managed' is not supported, "
                      "start Redis and the broker externally");
  }
  if (mode != Defaults::SERVICE_MODE) {
    throw ConfigError("unknown service mode '" + service_mode + "'");
  }

  if (broker_host.empty()) {
    throw ConfigError(Keys::MQTT_HOST + " must not be empty");
  }
  if (broker_port <= 0 || broker_port > 65535) {
    throw ConfigError(Keys::MQTT_PORT + " out of range: " +
                      std::to_string(broker_port));
  }
  if (redis_host.empty()) {
    throw ConfigError(Keys::REDIS_HOST + " must not be empty");
  }
  if (redis_port <= 0 || redis_port > 65535) {
    throw ConfigError(Keys::REDIS_PORT + " out of range: " +
                      std::to_string(redis_port));
  }
  if (redis_db < 0) {
    throw ConfigError(Keys::REDIS_DB + " must be >= 0");
  }
  if (queue_key.empty()) {
    throw ConfigError(Keys::QUEUE_KEY + " must not be empty");
  }
  if (keepalive_seconds <= 0) {
    throw ConfigError(Keys::MQTT_KEEPALIVE + " must be > 0");
  }
  if (reconnect_delay_seconds <= 0) {
    throw ConfigError(Keys::MQTT_RECONNECT_DELAY + " must be > 0");
  }
  if (reconnect_max_delay_seconds < reconnect_delay_seconds) {
    throw ConfigError(Keys::MQTT_RECONNECT_MAX_DELAY + " must be >= " +
                      Keys::MQTT_RECONNECT_DELAY);
  }
  if (max_reconnect_attempts < 0) {
    throw ConfigError(Keys::MQTT_MAX_RECONNECT_ATTEMPTS +
                      " must be >= 0 (0 = unlimited)");
  }
  if (connect_timeout_seconds <= 0 || publish_timeout_seconds <= 0) {
    throw ConfigError("connect and publish timeouts must be > 0");
  }
  if (publish_retry_limit < 1) {
    throw ConfigError(Keys::PUBLISH_RETRIES + " must be >= 1");
  }
  if (queue_pop_timeout_seconds < 1) {
    throw ConfigError(Keys::QUEUE_POP_TIMEOUT + " must be >= 1");
  }
  if (health_interval_seconds < 1) {
    throw ConfigError(Keys::HEALTH_INTERVAL + " must be >= 1");
  }
  if (lock_file.empty()) {
    throw ConfigError(Keys::LOCK_FILE + " must not be empty");
  }
}

std::string BridgeConfig::describe() const {
  std::ostringstream oss;
  oss << "broker=" << brokerUri()
      << " user=" << (username.empty() ? "-" : username)
      << " password=" << (password.empty() ? "none" : "****")
      << " hmac=" << (signingActive() ? "on" : (hmac_enabled ? "no-key" : "off"))
      << " keepalive=" << keepalive_seconds
      << " auto_reconnect=" << (auto_reconnect ? "true" : "false")
      << " reconnect_delay=" << reconnect_delay_seconds << ".."
      << reconnect_max_delay_seconds
      << " max_attempts=" << max_reconnect_attempts
      << " prefix=" << (topic_prefix.empty() ? "-" : topic_prefix)
      << " redis=" << redis_host << ":" << redis_port << "/" << redis_db
      << " queue=" << queue_key;
  return oss.str();
}

BridgeConfig ConfigManagerSource::load() {
  auto &config = ConfigManager::getInstance();
  config.reload();
  LogManager::getInstance().reloadSettings();

  BridgeConfig cfg;

  cfg.broker_host = config.getOrDefault(Keys::MQTT_HOST, Defaults::MQTT_HOST);
  cfg.broker_port = config.getInt(Keys::MQTT_PORT, Defaults::MQTT_PORT);
  cfg.username = config.getOrDefault(Keys::MQTT_USERNAME, "");
  cfg.password = config.getOrDefault(Keys::MQTT_PASSWORD, "");
  cfg.hmac_enabled = config.getBool(Keys::MQTT_HMAC_ENABLED, false);
  cfg.hmac_secret_key = config.getOrDefault(Keys::MQTT_HMAC_SECRET, "");
  cfg.keepalive_seconds =
      config.getInt(Keys::MQTT_KEEPALIVE, Defaults::KEEPALIVE_SECONDS);
  cfg.auto_reconnect = config.getBool(Keys::MQTT_AUTO_RECONNECT, true);
  cfg.reconnect_delay_seconds = config.getInt(
      Keys::MQTT_RECONNECT_DELAY, Defaults::RECONNECT_DELAY_SECONDS);
  cfg.reconnect_max_delay_seconds = config.getInt(
      Keys::MQTT_RECONNECT_MAX_DELAY, Defaults::RECONNECT_MAX_DELAY_SECONDS);
  cfg.max_reconnect_attempts = config.getInt(
      Keys::MQTT_MAX_RECONNECT_ATTEMPTS, Defaults::MAX_RECONNECT_ATTEMPTS);
  // an explicitly empty prefix disables prefixing
  cfg.topic_prefix = config.hasKey(Keys::MQTT_TOPIC_PREFIX)
                         ? config.listAll()[Keys::MQTT_TOPIC_PREFIX]
                         : config.getOrDefault(Keys::MQTT_TOPIC_PREFIX,
                                               Defaults::TOPIC_PREFIX);
  cfg.connect_timeout_seconds = config.getInt(
      Keys::MQTT_CONNECT_TIMEOUT, Defaults::CONNECT_TIMEOUT_SECONDS);
  cfg.publish_timeout_seconds = config.getInt(
      Keys::MQTT_PUBLISH_TIMEOUT, Defaults::PUBLISH_TIMEOUT_SECONDS);
  cfg.publish_retry_limit =
      config.getInt(Keys::PUBLISH_RETRIES, Defaults::PUBLISH_RETRIES);

  cfg.redis_host = config.getOrDefault(Keys::REDIS_HOST, Defaults::REDIS_HOST);
  cfg.redis_port = config.getInt(Keys::REDIS_PORT, Defaults::REDIS_PORT);
  cfg.redis_password = config.getOrDefault(Keys::REDIS_PASSWORD, "");
  cfg.redis_db = config.getInt(Keys::REDIS_DB, RedisDefaults::DB_DEFAULT);
  cfg.queue_key =
      config.getOrDefault(Keys::QUEUE_KEY, RedisDefaults::KEY_QUEUE_DEFAULT);
  cfg.control_key = config.getOrDefault(Keys::CONTROL_KEY,
                                        RedisDefaults::KEY_CONTROL_DEFAULT);
  cfg.status_key =
      config.getOrDefault(Keys::STATUS_KEY, RedisDefaults::KEY_STATUS_DEFAULT);
  cfg.queue_pop_timeout_seconds = config.getInt(
      Keys::QUEUE_POP_TIMEOUT, Defaults::QUEUE_POP_TIMEOUT_SECONDS);
  cfg.health_interval_seconds =
      config.getInt(Keys::HEALTH_INTERVAL, Defaults::HEALTH_INTERVAL_SECONDS);

  cfg.lock_file = config.getOrDefault(Keys::LOCK_FILE, Defaults::LOCK_FILE);
  cfg.service_mode =
      config.getOrDefault(Keys::SERVICE_MODE, Defaults::SERVICE_MODE);
  cfg.log_level = config.getOrDefault(Keys::LOG_LEVEL, "INFO");

  cfg.validate();
  return cfg;
}

} // namespace Service
} // namespace Bridge
} // namespace NemoBridge
