/**
 * @file BrokerConnectionManager.h
 * @brief MQTT connection lifecycle with exponential backoff -
 * NemoBridge::Bridge::Broker
 */

#ifndef BRIDGE_BROKER_BROKER_CONNECTION_MANAGER_H
#define BRIDGE_BROKER_BROKER_CONNECTION_MANAGER_H

#include "Bridge/Broker/IMqttSession.h"
#include "Bridge/Broker/PublishResult.h"
#include "Bridge/Model/ConnectionState.h"
#include "Bridge/Security/HmacSigner.h"
#include "Bridge/Service/BridgeConfig.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

namespace NemoBridge {
namespace Bridge {
namespace Broker {

/**
 * @brief Owns the MQTT session and its retry policy.
 *
 * States: DISCONNECTED -> connect() -> CONNECTED | BACKOFF.
 * A failed attempt waits min(base * 2^n, max_delay) where n is the number
 * of failures before it. Once max_reconnect_attempts (> 0) failures have
 * accumulated the manager is FATAL and stays there. Settings are reloaded
 * from the config source at the top of every attempt.
 */
class BrokerConnectionManager {
public:
  /**
   * @brief Waits for the given delay.
   * @return false when the wait was interrupted by requestStop()
   */
  using Sleeper = std::function<bool(std::chrono::milliseconds)>;

  BrokerConnectionManager(Service::IConfigSource &config_source,
                          std::unique_ptr<IMqttSession> session,
                          Model::ConnectionState &state);
  ~BrokerConnectionManager();

  BrokerConnectionManager(const BrokerConnectionManager &) = delete;
  BrokerConnectionManager &operator=(const BrokerConnectionManager &) = delete;

  void setSleeper(Sleeper sleeper);

  /**
   * @brief Runs attempts until connected, fatal or stopped.
   * @return true when connected
   */
  bool connect();

  /**
   * @brief Re-establishes a dropped session according to auto_reconnect.
   * @return true when connected afterwards
   */
  bool ensureConnected();

  /**
   * @brief Clean disconnect followed by a fresh connect cycle
   */
  bool forceReconnect();

  /**
   * @brief QoS 1 publish, waits for the acknowledgement
   */
  PublishResult publish(const std::string &topic, const std::string &payload,
                        bool retain);

  /**
   * @brief Explicit MQTT DISCONNECT
   */
  void disconnect();

  /**
   * @brief Interrupts backoff waits; connect() returns false afterwards
   */
  void requestStop();

  bool isConnected() const;
  bool isFatal() const { return fatal_.load(); }

  /**
   * @brief Settings loaded by the most recent connect attempt
   */
  Service::BridgeConfig currentConfig() const;

  /**
   * @brief Signer built from the secret read at the last connection, or
   * nullptr when signing is off
   */
  std::shared_ptr<const Security::HmacSigner> signer() const;

  static std::chrono::milliseconds backoffDelay(int failures_before,
                                                int base_seconds,
                                                int max_seconds);

private:
  bool defaultSleep(std::chrono::milliseconds delay);
  void onConnectionLost(const std::string &cause);
  void applyConfig(const Service::BridgeConfig &config);
  void logInfo(const std::string &message) const;
  void logWarn(const std::string &message) const;
  void logError(const std::string &message) const;

  Service::IConfigSource &config_source_;
  std::unique_ptr<IMqttSession> session_;
  Model::ConnectionState &state_;

  Sleeper sleeper_;

  mutable std::mutex config_mutex_;
  Service::BridgeConfig config_;
  std::shared_ptr<const Security::HmacSigner> signer_;

  std::mutex connect_mutex_;
  int failures_{0};
  std::atomic<bool> ever_connected_{false};
  std::atomic<bool> fatal_{false};

  std::atomic<bool> stop_requested_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
};

} // namespace Broker
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_BROKER_BROKER_CONNECTION_MANAGER_H
