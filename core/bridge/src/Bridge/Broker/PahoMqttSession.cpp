/**
 * @file PahoMqttSession.cpp
 * @brief IMqttSession over Eclipse Paho MQTT C++
 */

#include "Bridge/Broker/PahoMqttSession.h"
#include "Logging/LogManager.h"

namespace NemoBridge {
namespace Bridge {
namespace Broker {

namespace {
const auto DISCONNECT_TIMEOUT = std::chrono::seconds(5);
}

void PahoMqttSession::Callback::connection_lost(const std::string &cause) {
  ConnectionLostHandler handler;
  {
    std::lock_guard<std::mutex> lock(owner_.handler_mutex_);
    handler = owner_.connection_lost_handler_;
  }
  if (handler) {
    handler(cause.empty() ? "connection lost" : cause);
  }
}

PahoMqttSession::PahoMqttSession() : callback_(*this) {}

PahoMqttSession::~PahoMqttSession() { disconnect(); }

void PahoMqttSession::setConnectionLostHandler(ConnectionLostHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  connection_lost_handler_ = std::move(handler);
}

void PahoMqttSession::connect(const SessionOptions &options) {
  std::lock_guard<std::mutex> lock(client_mutex_);
  releaseClient();

  try {
    mqtt_client_ = std::make_unique<mqtt::async_client>(options.server_uri,
                                                        options.client_id);
    mqtt_client_->set_callback(callback_);

    mqtt::connect_options connOpts;
    connOpts.set_keep_alive_interval(options.keepalive_seconds);
    connOpts.set_clean_session(true);
    connOpts.set_automatic_reconnect(false);
    connOpts.set_connect_timeout(
        std::chrono::seconds(options.connect_timeout_seconds));

    if (!options.username.empty()) {
      connOpts.set_user_name(options.username);
      if (!options.password.empty()) {
        connOpts.set_password(options.password);
      }
    }

    mqtt_client_->connect(connOpts)->wait();
  } catch (const mqtt::exception &exc) {
    mqtt_client_.reset();
    throw MqttSessionError("connect to " + options.server_uri +
                           " failed: " + std::string(exc.what()));
  }
}

void PahoMqttSession::publish(const std::string &topic,
                              const std::string &payload, int qos, bool retain,
                              std::chrono::seconds timeout) {
  std::lock_guard<std::mutex> lock(client_mutex_);
  if (!mqtt_client_ || !mqtt_client_->is_connected()) {
    throw MqttSessionError("MQTT client not connected");
  }

  try {
    auto msg = mqtt::make_message(topic, payload, qos, retain);
    auto token = mqtt_client_->publish(msg);
    if (!token->wait_for(timeout)) {
      throw MqttSessionError("publish to " + topic + " not acknowledged within " +
                             std::to_string(timeout.count()) + "s");
    }
  } catch (const mqtt::exception &exc) {
    throw MqttSessionError("publish to " + topic +
                           " failed: " + std::string(exc.what()));
  }
}

void PahoMqttSession::disconnect() {
  std::lock_guard<std::mutex> lock(client_mutex_);
  releaseClient();
}

bool PahoMqttSession::isConnected() const {
  std::lock_guard<std::mutex> lock(client_mutex_);
  return mqtt_client_ && mqtt_client_->is_connected();
}

void PahoMqttSession::releaseClient() {
  if (!mqtt_client_)
    return;

  if (mqtt_client_->is_connected()) {
    try {
      mqtt_client_->disconnect()->wait_for(DISCONNECT_TIMEOUT);
    } catch (const mqtt::exception &exc) {
      LogManager::getInstance().log(
          "mqtt", LogLevel::WARN,
          "MQTT disconnect error: " + std::string(exc.what()));
    }
  }
  mqtt_client_->disable_callbacks();
  mqtt_client_.reset();
}

} // namespace Broker
} // namespace Bridge
} // namespace NemoBridge
