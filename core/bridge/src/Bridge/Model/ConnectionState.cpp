/**
 * @file ConnectionState.cpp
 * @brief Process-wide broker/queue connection state
 */

#include "Bridge/Model/ConnectionState.h"
#include "Constants/BridgeConstants.h"
#include "Platform/ProcessUtils.h"

namespace NemoBridge {
namespace Bridge {
namespace Model {

std::string brokerStateToString(BrokerState state) {
  switch (state) {
  case BrokerState::DISCONNECTED:
    return "disconnected";
  case BrokerState::CONNECTED:
    return "connected";
  case BrokerState::BACKOFF:
    return "backoff";
  case BrokerState::FATAL:
    return "fatal";
  }
  return "unknown";
}

json ConnectionSnapshot::toJson() const {
  return json{{"broker_connected", broker_connected},
              {"queue_connected", queue_connected},
              {"broker_state", brokerStateToString(broker_state)},
              {"client_session_id", client_session_id},
              {"reconnect_attempt_count", reconnect_attempt_count},
              {"last_error", last_error}};
}

ConnectionState::ConnectionState(std::string client_session_id)
    : client_session_id_(std::move(client_session_id)) {
  state_.client_session_id = client_session_id_;
}

std::string ConnectionState::makeSessionId() {
  return NemoBridge::Constants::Bridge::CLIENT_ID_PREFIX +
         Platform::Process::GetHostName() + "_" +
         std::to_string(Platform::Process::GetCurrentProcessId());
}

ConnectionSnapshot ConnectionState::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

BrokerState ConnectionState::brokerState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.broker_state;
}

int ConnectionState::reconnectAttemptCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.reconnect_attempt_count;
}

void ConnectionState::markBrokerConnected() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.broker_connected = true;
  state_.broker_state = BrokerState::CONNECTED;
  state_.reconnect_attempt_count = 0;
  state_.last_error.clear();
}

void ConnectionState::markBrokerDisconnected(const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.broker_connected = false;
  if (state_.broker_state != BrokerState::FATAL) {
    state_.broker_state = BrokerState::DISCONNECTED;
  }
  if (!error.empty()) {
    state_.last_error = error;
  }
}

void ConnectionState::markBrokerBackoff(int attempt_count,
                                        const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.broker_connected = false;
  state_.broker_state = BrokerState::BACKOFF;
  state_.reconnect_attempt_count = attempt_count;
  state_.last_error = error;
}

void ConnectionState::markBrokerFatal(const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.broker_connected = false;
  state_.broker_state = BrokerState::FATAL;
  state_.last_error = error;
}

void ConnectionState::setQueueConnected(bool connected,
                                        const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.queue_connected = connected;
  if (!connected && !error.empty()) {
    state_.last_error = error;
  }
}

} // namespace Model
} // namespace Bridge
} // namespace NemoBridge
