/**
 * @file PahoMqttSession.h
 * @brief IMqttSession over Eclipse Paho MQTT C++ - NemoBridge::Bridge::Broker
 */

#ifndef BRIDGE_BROKER_PAHO_MQTT_SESSION_H
#define BRIDGE_BROKER_PAHO_MQTT_SESSION_H

#include "Bridge/Broker/IMqttSession.h"

#include <mqtt/async_client.h>

#include <memory>
#include <mutex>

namespace NemoBridge {
namespace Bridge {
namespace Broker {

class PahoMqttSession : public IMqttSession {
public:
  PahoMqttSession();
  ~PahoMqttSession() override;

  PahoMqttSession(const PahoMqttSession &) = delete;
  PahoMqttSession &operator=(const PahoMqttSession &) = delete;

  void connect(const SessionOptions &options) override;
  void publish(const std::string &topic, const std::string &payload, int qos,
               bool retain, std::chrono::seconds timeout) override;
  void disconnect() override;
  bool isConnected() const override;
  void setConnectionLostHandler(ConnectionLostHandler handler) override;

private:
  class Callback : public virtual mqtt::callback {
  public:
    explicit Callback(PahoMqttSession &owner) : owner_(owner) {}
    void connection_lost(const std::string &cause) override;

  private:
    PahoMqttSession &owner_;
  };

  void releaseClient();

  mutable std::mutex client_mutex_;
  std::unique_ptr<mqtt::async_client> mqtt_client_;
  Callback callback_;

  std::mutex handler_mutex_;
  ConnectionLostHandler connection_lost_handler_;
};

} // namespace Broker
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_BROKER_PAHO_MQTT_SESSION_H
