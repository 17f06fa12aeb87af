/**
 * @file ConnectionState.h
 * @brief Process-wide broker/queue connection state -
 * NemoBridge::Bridge::Model
 */

#ifndef BRIDGE_MODEL_CONNECTION_STATE_H
#define BRIDGE_MODEL_CONNECTION_STATE_H

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>

namespace NemoBridge {
namespace Bridge {
namespace Model {

using json = nlohmann::json;

enum class BrokerState { DISCONNECTED, CONNECTED, BACKOFF, FATAL };

std::string brokerStateToString(BrokerState state);

struct ConnectionSnapshot {
  bool broker_connected = false;
  bool queue_connected = false;
  BrokerState broker_state = BrokerState::DISCONNECTED;
  std::string client_session_id;
  int reconnect_attempt_count = 0;
  std::string last_error;

  json toJson() const;
};

/**
 * @brief Mutated by the broker connection manager and the queue consumer,
 * read by the health monitor. Every transition happens under one mutex
 * and readers only ever see copies.
 */
class ConnectionState {
public:
  explicit ConnectionState(std::string client_session_id);

  /**
   * @brief "nemo_bridge_<hostname>_<pid>"
   */
  static std::string makeSessionId();

  ConnectionSnapshot snapshot() const;

  const std::string &clientSessionId() const { return client_session_id_; }
  BrokerState brokerState() const;
  int reconnectAttemptCount() const;

  void markBrokerConnected();
  void markBrokerDisconnected(const std::string &error);
  void markBrokerBackoff(int attempt_count, const std::string &error);
  void markBrokerFatal(const std::string &error);

  void setQueueConnected(bool connected, const std::string &error = "");

private:
  const std::string client_session_id_;
  mutable std::mutex mutex_;
  ConnectionSnapshot state_;
};

} // namespace Model
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_MODEL_CONNECTION_STATE_H
