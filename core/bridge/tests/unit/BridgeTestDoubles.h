/**
 * @file BridgeTestDoubles.h
 * @brief In-memory Redis, MQTT session and config source for unit tests
 */

#ifndef BRIDGE_TESTS_BRIDGE_TEST_DOUBLES_H
#define BRIDGE_TESTS_BRIDGE_TEST_DOUBLES_H

#include "Bridge/Broker/IMqttSession.h"
#include "Bridge/Service/BridgeConfig.h"
#include "Client/RedisClient.h"

#include <gmock/gmock.h>

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unistd.h>
#include <vector>

namespace NemoBridge {
namespace Testing {

using Bridge::Broker::IMqttSession;
using Bridge::Broker::MqttSessionError;
using Bridge::Broker::SessionOptions;
using Bridge::Service::BridgeConfig;

// =============================================================================
// Redis
// =============================================================================

/**
 * @brief Server side shared by every FakeRedisClient pointing at it
 */
struct FakeRedisServer {
  std::mutex mutex;
  bool available = true;
  std::map<std::string, std::deque<std::string>> lists;
  std::map<std::string, std::string> strings;
  std::map<std::string, int> ttls;
  int connect_calls = 0;
  int selected_db = -1;

  void push(const std::string &key, const std::string &value) {
    std::lock_guard<std::mutex> lock(mutex);
    lists[key].push_back(value);
  }

  size_t length(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = lists.find(key);
    return it == lists.end() ? 0 : it->second.size();
  }

  std::string value(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = strings.find(key);
    return it == strings.end() ? "" : it->second;
  }
};

class FakeRedisClient : public RedisClient {
public:
  explicit FakeRedisClient(std::shared_ptr<FakeRedisServer> server)
      : server_(std::move(server)) {}

  bool connect(const std::string &, int, const std::string & = "") override {
    std::lock_guard<std::mutex> lock(server_->mutex);
    server_->connect_calls++;
    connected_ = server_->available;
    return connected_;
  }

  void disconnect() override { connected_ = false; }

  bool isConnected() const override {
    std::lock_guard<std::mutex> lock(server_->mutex);
    return connected_ && server_->available;
  }

  bool select(int db_index) override {
    if (!isConnected())
      return false;
    std::lock_guard<std::mutex> lock(server_->mutex);
    server_->selected_db = db_index;
    return true;
  }

  bool setex(const std::string &key, const std::string &value,
             int expire_seconds) override {
    if (!isConnected())
      return false;
    std::lock_guard<std::mutex> lock(server_->mutex);
    server_->strings[key] = value;
    server_->ttls[key] = expire_seconds;
    return true;
  }

  std::string get(const std::string &key) override {
    if (!isConnected())
      return "";
    return server_->value(key);
  }

  std::string lpop(const std::string &key) override {
    if (!isConnected())
      return "";
    std::lock_guard<std::mutex> lock(server_->mutex);
    auto &list = server_->lists[key];
    if (list.empty())
      return "";
    std::string value = list.front();
    list.pop_front();
    return value;
  }

  // never blocks: an empty list behaves like an expired wait
  std::optional<std::string> blpop(const std::string &key, int) override {
    if (!isConnected())
      return std::nullopt;
    std::lock_guard<std::mutex> lock(server_->mutex);
    auto &list = server_->lists[key];
    if (list.empty())
      return std::nullopt;
    std::string value = list.front();
    list.pop_front();
    return value;
  }

  int llen(const std::string &key) override {
    if (!isConnected())
      return -1;
    std::lock_guard<std::mutex> lock(server_->mutex);
    return static_cast<int>(server_->lists[key].size());
  }

private:
  std::shared_ptr<FakeRedisServer> server_;
  bool connected_ = false;
};

// =============================================================================
// MQTT
// =============================================================================

struct PublishedMessage {
  std::string topic;
  std::string payload;
  int qos = 0;
  bool retain = false;
};

/**
 * @brief Broker side shared with the FakeMqttSession under test
 */
struct FakeBroker {
  std::mutex mutex;
  int refuse_next_connects = 0; // refusals before accepting
  bool refuse_all = false;
  int fail_next_publishes = 0;
  bool drop_on_publish_failure = false;

  int connect_calls = 0;
  int disconnect_calls = 0;
  std::vector<SessionOptions> connect_options;
  std::vector<PublishedMessage> published;

  std::vector<PublishedMessage> messages() {
    std::lock_guard<std::mutex> lock(mutex);
    return published;
  }
};

class FakeMqttSession : public IMqttSession {
public:
  explicit FakeMqttSession(std::shared_ptr<FakeBroker> broker)
      : broker_(std::move(broker)) {}

  void connect(const SessionOptions &options) override {
    std::lock_guard<std::mutex> lock(broker_->mutex);
    broker_->connect_calls++;
    broker_->connect_options.push_back(options);
    if (broker_->refuse_all || broker_->refuse_next_connects > 0) {
      if (broker_->refuse_next_connects > 0)
        broker_->refuse_next_connects--;
      connected_ = false;
      throw MqttSessionError("connection refused by " + options.server_uri);
    }
    connected_ = true;
  }

  void publish(const std::string &topic, const std::string &payload, int qos,
               bool retain, std::chrono::seconds) override {
    std::lock_guard<std::mutex> lock(broker_->mutex);
    if (!connected_) {
      throw MqttSessionError("not connected");
    }
    if (broker_->fail_next_publishes > 0) {
      broker_->fail_next_publishes--;
      if (broker_->drop_on_publish_failure)
        connected_ = false;
      throw MqttSessionError("publish timed out");
    }
    broker_->published.push_back({topic, payload, qos, retain});
  }

  void disconnect() override {
    std::lock_guard<std::mutex> lock(broker_->mutex);
    if (connected_)
      broker_->disconnect_calls++;
    connected_ = false;
  }

  bool isConnected() const override {
    std::lock_guard<std::mutex> lock(broker_->mutex);
    return connected_;
  }

  void setConnectionLostHandler(ConnectionLostHandler handler) override {
    handler_ = std::move(handler);
  }

  /**
   * @brief Simulates a transport drop of an established session
   */
  void dropConnection(const std::string &cause) {
    {
      std::lock_guard<std::mutex> lock(broker_->mutex);
      connected_ = false;
    }
    if (handler_)
      handler_(cause);
  }

private:
  std::shared_ptr<FakeBroker> broker_;
  bool connected_ = false;
  ConnectionLostHandler handler_;
};

// =============================================================================
// Settings
// =============================================================================

class FakeConfigSource : public Bridge::Service::IConfigSource {
public:
  explicit FakeConfigSource(std::shared_ptr<BridgeConfig> config)
      : config_(std::move(config)) {}

  BridgeConfig load() override {
    load_calls++;
    config_->validate();
    return *config_;
  }

  int load_calls = 0;

private:
  std::shared_ptr<BridgeConfig> config_;
};

class MockConfigSource : public Bridge::Service::IConfigSource {
public:
  MOCK_METHOD(BridgeConfig, load, (), (override));
};

/**
 * @brief Settings for tests: no prefix, fast timeouts, no signing
 */
inline BridgeConfig makeTestConfig() {
  BridgeConfig config;
  config.broker_host = "broker.test";
  config.broker_port = 1883;
  config.topic_prefix = "";
  config.reconnect_delay_seconds = 1;
  config.reconnect_max_delay_seconds = 8;
  config.max_reconnect_attempts = 0;
  config.publish_retry_limit = 3;
  config.health_interval_seconds = 1;
  return config;
}

/**
 * @brief Records requested waits instead of sleeping
 */
struct RecordingSleeper {
  std::shared_ptr<std::vector<std::chrono::milliseconds>> delays =
      std::make_shared<std::vector<std::chrono::milliseconds>>();

  std::function<bool(std::chrono::milliseconds)> fn() const {
    auto recorded = delays;
    return [recorded](std::chrono::milliseconds delay) {
      recorded->push_back(delay);
      return true;
    };
  }
};

/**
 * @brief Unique lock file path under the gtest temp dir
 */
inline std::string tempLockPath(const std::string &name) {
  return ::testing::TempDir() + "nemobridge_" + name + "_" +
         std::to_string(::getpid()) + ".lock";
}

} // namespace Testing
} // namespace NemoBridge

#endif // BRIDGE_TESTS_BRIDGE_TEST_DOUBLES_H
