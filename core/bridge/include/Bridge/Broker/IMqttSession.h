/**
 * @file IMqttSession.h
 * @brief MQTT transport seam - NemoBridge::Bridge::Broker
 */

#ifndef BRIDGE_BROKER_IMQTT_SESSION_H
#define BRIDGE_BROKER_IMQTT_SESSION_H

#include "Bridge/BridgeErrors.h"

#include <chrono>
#include <functional>
#include <string>

namespace NemoBridge {
namespace Bridge {
namespace Broker {

/**
 * @brief Connect, publish or disconnect failed at transport level
 */
class MqttSessionError : public BridgeError {
public:
  explicit MqttSessionError(const std::string &message)
      : BridgeError(message) {}
};

struct SessionOptions {
  std::string server_uri;
  std::string client_id;
  std::string username;
  std::string password;
  int keepalive_seconds = 60;
  int connect_timeout_seconds = 15;
};

/**
 * @brief One MQTT client session
 * @details Implementations must not reconnect on their own; the
 * connection manager owns the retry policy.
 */
class IMqttSession {
public:
  using ConnectionLostHandler = std::function<void(const std::string &cause)>;

  virtual ~IMqttSession() = default;

  /**
   * @throws MqttSessionError when the broker refuses or cannot be reached
   */
  virtual void connect(const SessionOptions &options) = 0;

  /**
   * @brief Publishes and waits for the broker acknowledgement
   * @throws MqttSessionError on failure or timeout
   */
  virtual void publish(const std::string &topic, const std::string &payload,
                       int qos, bool retain,
                       std::chrono::seconds timeout) = 0;

  /**
   * @brief Sends DISCONNECT when connected; never throws
   */
  virtual void disconnect() = 0;

  virtual bool isConnected() const = 0;

  /**
   * @brief Called from the transport thread when an established session
   * drops
   */
  virtual void setConnectionLostHandler(ConnectionLostHandler handler) = 0;
};

} // namespace Broker
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_BROKER_IMQTT_SESSION_H
