/**
 * @file BridgeConfig.h
 * @brief Bridge settings and their sources - NemoBridge::Bridge::Service
 */

#ifndef BRIDGE_SERVICE_BRIDGE_CONFIG_H
#define BRIDGE_SERVICE_BRIDGE_CONFIG_H

#include "Constants/BridgeConstants.h"

#include <string>

namespace NemoBridge {
namespace Bridge {
namespace Service {

namespace Defaults = NemoBridge::Constants::Bridge::Defaults;
namespace RedisDefaults = NemoBridge::Constants::Bridge::Redis;

/**
 * @brief Snapshot of every setting the bridge reads
 */
struct BridgeConfig {
  // Broker
  std::string broker_host = Defaults::MQTT_HOST;
  int broker_port = Defaults::MQTT_PORT;
  std::string username;
  std::string password;
  bool hmac_enabled = false;
  std::string hmac_secret_key;
  int keepalive_seconds = Defaults::KEEPALIVE_SECONDS;
  bool auto_reconnect = true;
  int reconnect_delay_seconds = Defaults::RECONNECT_DELAY_SECONDS;
  int reconnect_max_delay_seconds = Defaults::RECONNECT_MAX_DELAY_SECONDS;
  int max_reconnect_attempts = Defaults::MAX_RECONNECT_ATTEMPTS; // 0 = unlimited
  std::string topic_prefix = Defaults::TOPIC_PREFIX;
  int connect_timeout_seconds = Defaults::CONNECT_TIMEOUT_SECONDS;
  int publish_timeout_seconds = Defaults::PUBLISH_TIMEOUT_SECONDS;
  int publish_retry_limit = Defaults::PUBLISH_RETRIES;

  // Queue
  std::string redis_host = Defaults::REDIS_HOST;
  int redis_port = Defaults::REDIS_PORT;
  std::string redis_password;
  int redis_db = RedisDefaults::DB_DEFAULT;
  std::string queue_key = RedisDefaults::KEY_QUEUE_DEFAULT;
  std::string control_key = RedisDefaults::KEY_CONTROL_DEFAULT;
  std::string status_key = RedisDefaults::KEY_STATUS_DEFAULT;
  int queue_pop_timeout_seconds = Defaults::QUEUE_POP_TIMEOUT_SECONDS;
  int health_interval_seconds = Defaults::HEALTH_INTERVAL_SECONDS;

  // Process
  std::string lock_file = Defaults::LOCK_FILE;
  std::string service_mode = Defaults::SERVICE_MODE;
  std::string log_level = "INFO";

  std::string brokerUri() const;

  /**
   * @brief HMAC envelopes are produced only with a non-empty secret
   */
  bool signingActive() const {
    return hmac_enabled && !hmac_secret_key.empty();
  }

  /**
   * @throws ConfigError
   */
  void validate() const;

  /**
   * @brief One-line summary for logs, secrets masked
   */
  std::string describe() const;
};

/**
 * @brief Settings provider, asked for a fresh snapshot on every connect
 */
class IConfigSource {
public:
  virtual ~IConfigSource() = default;

  /**
   * @throws ConfigError
   */
  virtual BridgeConfig load() = 0;
};

/**
 * @brief IConfigSource over the process-wide ConfigManager.
 * @details Every load() re-reads the settings files so rotated
 * credentials and HMAC keys are picked up on the next connection.
 */
class ConfigManagerSource : public IConfigSource {
public:
  BridgeConfig load() override;
};

} // namespace Service
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_SERVICE_BRIDGE_CONFIG_H
