/**
 * @file BridgeConstants.h
 * @brief Redis keys, settings keys and defaults of the MQTT bridge
 * @author NemoBridge Development Team
 */

#ifndef BRIDGE_CONSTANTS_H
#define BRIDGE_CONSTANTS_H

#include <string>

namespace NemoBridge {
namespace Constants {
namespace Bridge {

const std::string VERSION = "1.0.0";
const std::string SERVICE_NAME = "nemo-mqtt-bridge";

// =============================================================================
// Redis Keys & Commands
// =============================================================================
namespace Redis {
const std::string KEY_QUEUE_DEFAULT = "NEMO_mqtt_events";
const std::string KEY_CONTROL_DEFAULT = "NEMO_mqtt_control";
const std::string KEY_STATUS_DEFAULT = "NEMO_mqtt_bridge_status";
const std::string CMD_RELOAD_CONFIG = "reload_config";
const int DB_DEFAULT = 1;
} // namespace Redis

// =============================================================================
// Settings keys (ConfigManager)
// =============================================================================
namespace Config {
// Queue side
const std::string REDIS_HOST = "REDIS_HOST";
const std::string REDIS_PORT = "REDIS_PORT";
const std::string REDIS_PASSWORD = "REDIS_PASSWORD";
const std::string REDIS_DB = "REDIS_DB";
const std::string QUEUE_KEY = "BRIDGE_QUEUE_KEY";
const std::string CONTROL_KEY = "BRIDGE_CONTROL_KEY";
const std::string STATUS_KEY = "BRIDGE_STATUS_KEY";
const std::string QUEUE_POP_TIMEOUT = "QUEUE_POP_TIMEOUT_SECONDS";
const std::string HEALTH_INTERVAL = "HEALTH_INTERVAL_SECONDS";

// Broker side
const std::string MQTT_HOST = "MQTT_BROKER_HOST";
const std::string MQTT_PORT = "MQTT_BROKER_PORT";
const std::string MQTT_USERNAME = "MQTT_USERNAME";
const std::string MQTT_PASSWORD = "MQTT_PASSWORD";
const std::string MQTT_HMAC_ENABLED = "MQTT_HMAC_ENABLED";
const std::string MQTT_HMAC_SECRET = "MQTT_HMAC_SECRET_KEY";
const std::string MQTT_KEEPALIVE = "MQTT_KEEPALIVE_SECONDS";
const std::string MQTT_AUTO_RECONNECT = "MQTT_AUTO_RECONNECT";
const std::string MQTT_RECONNECT_DELAY = "MQTT_RECONNECT_DELAY_SECONDS";
const std::string MQTT_RECONNECT_MAX_DELAY = "MQTT_RECONNECT_MAX_DELAY_SECONDS";
const std::string MQTT_MAX_RECONNECT_ATTEMPTS = "MQTT_MAX_RECONNECT_ATTEMPTS";
const std::string MQTT_TOPIC_PREFIX = "MQTT_TOPIC_PREFIX";
const std::string MQTT_CONNECT_TIMEOUT = "MQTT_CONNECT_TIMEOUT_SECONDS";
const std::string MQTT_PUBLISH_TIMEOUT = "MQTT_PUBLISH_TIMEOUT_SECONDS";

// Process
const std::string PUBLISH_RETRIES = "BRIDGE_PUBLISH_RETRIES";
const std::string LOCK_FILE = "BRIDGE_LOCK_FILE";
const std::string SERVICE_MODE = "BRIDGE_SERVICE_MODE";
const std::string LOG_LEVEL = "LOG_LEVEL";
} // namespace Config

// =============================================================================
// Defaults
// =============================================================================
namespace Defaults {
const std::string REDIS_HOST = "localhost";
const int REDIS_PORT = 6379;
const int QUEUE_POP_TIMEOUT_SECONDS = 1;
const int HEALTH_INTERVAL_SECONDS = 30;

const std::string MQTT_HOST = "localhost";
const int MQTT_PORT = 1883;
const int KEEPALIVE_SECONDS = 60;
const int RECONNECT_DELAY_SECONDS = 5;
const int RECONNECT_MAX_DELAY_SECONDS = 60;
const int MAX_RECONNECT_ATTEMPTS = 10;
const std::string TOPIC_PREFIX = "nemo";
const int CONNECT_TIMEOUT_SECONDS = 15;
const int PUBLISH_TIMEOUT_SECONDS = 10;

const int PUBLISH_RETRIES = 3;
const std::string LOCK_FILE = "/tmp/nemo_mqtt_bridge.lock";
const std::string SERVICE_MODE = "external";

// Queue-side reconnection
const int QUEUE_RECONNECT_BASE_SECONDS = 1;
const int QUEUE_RECONNECT_MAX_SECONDS = 30;
} // namespace Defaults

// =============================================================================
// Envelope
// =============================================================================
namespace Envelope {
const std::string KEY_PAYLOAD = "payload";
const std::string KEY_HMAC = "hmac";
const std::string KEY_ALGO = "algo";
const std::string ALGO_SHA256 = "sha256";
} // namespace Envelope

// =============================================================================
// Exit codes
// =============================================================================
namespace ExitCode {
const int CLEAN = 0;
const int STARTUP_FAILURE = 1;
const int ALREADY_RUNNING = 3;
const int BROKER_FATAL = 4;
} // namespace ExitCode

const int MQTT_QOS = 1;
const std::string CLIENT_ID_PREFIX = "nemo_bridge_";

} // namespace Bridge
} // namespace Constants
} // namespace NemoBridge

#endif // BRIDGE_CONSTANTS_H
