/**
 * @file test_queue_consumer.cpp
 * @brief Unit test for QueueConsumer
 */

#include <gtest/gtest.h>

#include "Bridge/BridgeErrors.h"
#include "Bridge/Queue/QueueConsumer.h"
#include "BridgeTestDoubles.h"
#include "Logging/LogManager.h"

using namespace NemoBridge::Bridge;
using namespace NemoBridge::Testing;
using Queue::QueueConsumer;
using std::chrono::milliseconds;

class QueueConsumerTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogManager::getInstance().setLogLevel(LogLevel::DEBUG);

    server_ = std::make_shared<FakeRedisServer>();
    config_ = makeTestConfig();
    consumer_ = std::make_unique<QueueConsumer>(
        std::make_unique<FakeRedisClient>(server_), state_);
    consumer_->configure(config_);
    consumer_->setSleeper(sleeper_.fn());
  }

  void enqueue(const std::string &topic, const std::string &payload) {
    server_->push(config_.queue_key,
                  R"({"topic":")" + topic + R"(","payload":")" + payload +
                      R"(","qos":1,"retain":false})");
  }

  std::shared_ptr<FakeRedisServer> server_;
  BridgeConfig config_;
  Model::ConnectionState state_{"nemo_bridge_test_1"};
  RecordingSleeper sleeper_;
  std::unique_ptr<QueueConsumer> consumer_;
};

TEST_F(QueueConsumerTest, ConnectSelectsBridgeDatabase) {
  ASSERT_TRUE(consumer_->connect());
  EXPECT_EQ(server_->selected_db, 1);
  EXPECT_TRUE(state_.snapshot().queue_connected);
}

TEST_F(QueueConsumerTest, PopsInQueueOrder) {
  ASSERT_TRUE(consumer_->connect());
  enqueue("nemo/a", "1");
  enqueue("nemo/b", "2");
  enqueue("nemo/c", "3");

  std::vector<std::string> topics;
  while (auto entry = consumer_->next()) {
    topics.push_back(entry->topic);
  }
  EXPECT_EQ(topics, (std::vector<std::string>{"nemo/a", "nemo/b", "nemo/c"}));
  EXPECT_EQ(server_->length(config_.queue_key), 0u);
}

TEST_F(QueueConsumerTest, MalformedEntryIsConsumedAndReported) {
  ASSERT_TRUE(consumer_->connect());
  server_->push(config_.queue_key, "{not json");
  enqueue("nemo/ok", "x");

  EXPECT_THROW(consumer_->next(), MalformedEntry);
  auto entry = consumer_->next();
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->topic, "nemo/ok");
}

TEST_F(QueueConsumerTest, EmptyQueueReturnsNothing) {
  ASSERT_TRUE(consumer_->connect());
  EXPECT_FALSE(consumer_->next().has_value());
  EXPECT_TRUE(sleeper_.delays->empty());
}

TEST_F(QueueConsumerTest, UnreachableQueueBacksOff) {
  server_->available = false;

  for (int i = 0; i < 7; ++i) {
    EXPECT_FALSE(consumer_->next().has_value());
  }
  std::vector<milliseconds> expected = {
      milliseconds(1000),  milliseconds(2000),  milliseconds(4000),
      milliseconds(8000),  milliseconds(16000), milliseconds(30000),
      milliseconds(30000)};
  EXPECT_EQ(*sleeper_.delays, expected);
  EXPECT_FALSE(state_.snapshot().queue_connected);
  EXPECT_FALSE(state_.snapshot().last_error.empty());

  server_->available = true;
  enqueue("nemo/late", "x");
  auto entry = consumer_->next();
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->topic, "nemo/late");
  EXPECT_TRUE(state_.snapshot().queue_connected);

  // backoff starts over after a successful connection
  server_->available = false;
  sleeper_.delays->clear();
  EXPECT_FALSE(consumer_->next().has_value());
  EXPECT_EQ(*sleeper_.delays, std::vector<milliseconds>{milliseconds(1000)});
}

TEST_F(QueueConsumerTest, ControlCommandsArePoppedOneAtATime) {
  ASSERT_TRUE(consumer_->connect());
  EXPECT_FALSE(consumer_->pollControl().has_value());

  server_->push(config_.control_key, "reload_config");
  server_->push(config_.control_key, "other");
  EXPECT_EQ(consumer_->pollControl().value_or(""), "reload_config");
  EXPECT_EQ(consumer_->pollControl().value_or(""), "other");
  EXPECT_FALSE(consumer_->pollControl().has_value());
}

TEST_F(QueueConsumerTest, DepthReportsListLength) {
  EXPECT_EQ(consumer_->depth(), -1);

  ASSERT_TRUE(consumer_->connect());
  enqueue("a", "1");
  enqueue("b", "2");
  EXPECT_EQ(consumer_->depth(), 2);
}

TEST_F(QueueConsumerTest, StoppedConsumerReturnsNothing) {
  ASSERT_TRUE(consumer_->connect());
  enqueue("a", "1");
  consumer_->requestStop();
  EXPECT_FALSE(consumer_->next().has_value());
  EXPECT_EQ(server_->length(config_.queue_key), 1u);
}
