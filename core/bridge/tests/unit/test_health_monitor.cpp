/**
 * @file test_health_monitor.cpp
 * @brief Unit test for HealthMonitor
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "Bridge/Service/HealthMonitor.h"
#include "BridgeTestDoubles.h"
#include "Logging/LogManager.h"

#include <thread>

using namespace NemoBridge::Bridge;
using namespace NemoBridge::Testing;
using Service::HealthMonitor;
using Service::HealthSnapshot;

class HealthMonitorTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogManager::getInstance().setLogLevel(LogLevel::DEBUG);

    server_ = std::make_shared<FakeRedisServer>();
    redis_ = std::make_unique<FakeRedisClient>(server_);
    config_ = makeTestConfig();
    config_.health_interval_seconds = 20;
    monitor_ = std::make_unique<HealthMonitor>(state_, statistics_, redis_.get());
    monitor_->configure(config_);
  }

  void TearDown() override { monitor_.reset(); }

  std::shared_ptr<FakeRedisServer> server_;
  std::unique_ptr<FakeRedisClient> redis_;
  BridgeConfig config_;
  Model::ConnectionState state_{"nemo_bridge_host_42"};
  Model::BridgeStatistics statistics_;
  std::unique_ptr<HealthMonitor> monitor_;
};

TEST_F(HealthMonitorTest, SnapshotCombinesStateDepthAndCounters) {
  state_.markBrokerBackoff(2, "connection refused");
  state_.setQueueConnected(true);
  statistics_.recordPublished(1700000000);
  statistics_.recordMalformed();
  server_->push(config_.queue_key, "a");
  server_->push(config_.queue_key, "b");

  HealthSnapshot snap = monitor_->snapshot();
  EXPECT_FALSE(snap.connection.broker_connected);
  EXPECT_TRUE(snap.connection.queue_connected);
  EXPECT_EQ(snap.connection.broker_state, Model::BrokerState::BACKOFF);
  EXPECT_EQ(snap.connection.reconnect_attempt_count, 2);
  EXPECT_EQ(snap.connection.last_error, "connection refused");
  EXPECT_EQ(snap.connection.client_session_id, "nemo_bridge_host_42");
  EXPECT_EQ(snap.queue_depth, 2);
  EXPECT_EQ(snap.statistics.published, 1u);
  EXPECT_EQ(snap.statistics.malformed, 1u);
  EXPECT_GE(snap.uptime_seconds, 0);
  EXPECT_GT(snap.timestamp, 0);
}

TEST_F(HealthMonitorTest, UpdateWritesStatusKeyWithTripleIntervalTtl) {
  state_.markBrokerConnected();
  monitor_->updateOnce();

  std::string stored = server_->value(config_.status_key);
  ASSERT_FALSE(stored.empty());
  EXPECT_EQ(server_->ttls[config_.status_key], 60);

  auto j = nlohmann::json::parse(stored);
  for (const char *key :
       {"broker_connected", "queue_connected", "queue_depth",
        "reconnect_attempt_count", "last_error", "broker_state",
        "client_session_id", "published", "malformed", "dropped",
        "uptime_seconds", "timestamp"}) {
    EXPECT_TRUE(j.contains(key)) << key;
  }
  EXPECT_EQ(j["broker_state"], "connected");
  EXPECT_EQ(j["queue_depth"], 0);
}

TEST_F(HealthMonitorTest, UnreachableRedisReportsUnknownDepth) {
  server_->available = false;

  HealthSnapshot snap = monitor_->snapshot();
  EXPECT_EQ(snap.queue_depth, -1);

  monitor_->updateOnce();
  EXPECT_TRUE(server_->value(config_.status_key).empty());
}

TEST_F(HealthMonitorTest, DoesNotChangeConnectionState) {
  state_.markBrokerFatal("budget exhausted");
  monitor_->updateOnce();
  EXPECT_EQ(state_.brokerState(), Model::BrokerState::FATAL);
  EXPECT_EQ(state_.snapshot().last_error, "budget exhausted");
}

TEST_F(HealthMonitorTest, BackgroundThreadReportsAndStopsPromptly) {
  EXPECT_TRUE(monitor_->start());
  EXPECT_FALSE(monitor_->start());

  for (int i = 0; i < 200 && server_->value(config_.status_key).empty(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_FALSE(server_->value(config_.status_key).empty());

  auto start = std::chrono::steady_clock::now();
  monitor_->stop();
  EXPECT_FALSE(monitor_->isRunning());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}
