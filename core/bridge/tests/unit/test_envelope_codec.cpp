/**
 * @file test_envelope_codec.cpp
 * @brief Unit test for EnvelopeCodec
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "Bridge/BridgeErrors.h"
#include "Bridge/Codec/EnvelopeCodec.h"
#include "Logging/LogManager.h"

using namespace NemoBridge::Bridge;
using NemoBridge::Bridge::Codec::EnvelopeCodec;

class EnvelopeCodecTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogManager::getInstance().setLogLevel(LogLevel::DEBUG);
  }
};

TEST_F(EnvelopeCodecTest, DecodesProducerEntry) {
  Model::QueueEntry entry = EnvelopeCodec::decode(
      R"({"topic":"nemo/tools/7","payload":"{\"state\":\"on\"}","qos":1,"retain":true,"enqueued_at":1718000000.25})");

  EXPECT_EQ(entry.topic, "nemo/tools/7");
  EXPECT_EQ(entry.payload, R"({"state":"on"})");
  EXPECT_EQ(entry.qos, 1);
  EXPECT_TRUE(entry.retain);
  ASSERT_TRUE(entry.enqueued_at.has_value());
  EXPECT_DOUBLE_EQ(*entry.enqueued_at, 1718000000.25);
}

TEST_F(EnvelopeCodecTest, AppliesDefaults) {
  Model::QueueEntry entry =
      EnvelopeCodec::decode(R"({"topic":"a/b","payload":"x"})");
  EXPECT_EQ(entry.qos, 1);
  EXPECT_FALSE(entry.retain);
  EXPECT_FALSE(entry.enqueued_at.has_value());
}

TEST_F(EnvelopeCodecTest, ReadsTimestampWhenEnqueuedAtIsAbsent) {
  Model::QueueEntry entry = EnvelopeCodec::decode(
      R"({"topic":"a","payload":"x","timestamp":1700000000})");
  ASSERT_TRUE(entry.enqueued_at.has_value());
  EXPECT_DOUBLE_EQ(*entry.enqueued_at, 1700000000.0);
}

TEST_F(EnvelopeCodecTest, CarriesNonStringPayloadAsCompactJson) {
  Model::QueueEntry entry = EnvelopeCodec::decode(
      R"({"topic":"a","payload":{ "tool_id" : 7, "enabled" : true }})");
  EXPECT_EQ(entry.payload, R"({"enabled":true,"tool_id":7})");

  entry = EnvelopeCodec::decode(R"({"topic":"a","payload":42})");
  EXPECT_EQ(entry.payload, "42");
}

TEST_F(EnvelopeCodecTest, RejectsMalformedEntries) {
  const char *cases[] = {
      "",
      "not json",
      R"(["topic","payload"])",
      R"("just a string")",
      R"({"payload":"x"})",
      R"({"topic":null,"payload":"x"})",
      R"({"topic":"","payload":"x"})",
      R"({"topic":5,"payload":"x"})",
      R"({"topic":"a"})",
      R"({"topic":"a","payload":null})",
  };
  for (const char *raw : cases) {
    EXPECT_THROW(EnvelopeCodec::decode(raw), MalformedEntry) << raw;
  }
}

TEST_F(EnvelopeCodecTest, MalformedEntryIsBridgeError) {
  try {
    EnvelopeCodec::decode("{");
    FAIL() << "expected MalformedEntry";
  } catch (const BridgeError &e) {
    EXPECT_NE(std::string(e.what()).find("malformed entry"), std::string::npos);
  }
}

TEST_F(EnvelopeCodecTest, UnsignedEncodingIsThePayloadBytes) {
  Model::QueueEntry entry;
  entry.topic = "a";
  entry.payload = "{\"k\": \"v\" }\n\t";
  EXPECT_EQ(EnvelopeCodec::encode(entry, nullptr), entry.payload);
}

TEST_F(EnvelopeCodecTest, SignedEncodingHasExactlyThreeKeys) {
  Security::HmacSigner signer("s3cret");
  Model::QueueEntry entry;
  entry.topic = "a";
  entry.payload = R"({"event":"tool_enabled","tool_id":7})";

  std::string wire = EnvelopeCodec::encode(entry, &signer);
  EXPECT_EQ(wire,
            R"({"payload":"{\"event\":\"tool_enabled\",\"tool_id\":7}",)"
            R"("hmac":"39cdc401e40fae3845822568728b59ccab1c31630a89a2682923186b1d502a85",)"
            R"("algo":"sha256"})");

  auto parsed = nlohmann::json::parse(wire);
  EXPECT_EQ(parsed.size(), 3u);
  EXPECT_TRUE(signer.verify(wire).valid);
}

TEST_F(EnvelopeCodecTest, QueueFormatDecodesBack) {
  Model::QueueEntry entry;
  entry.topic = "nemo/area/3";
  entry.payload = "payload";
  entry.retain = true;
  EXPECT_EQ(EnvelopeCodec::decode(EnvelopeCodec::encodeQueueEntry(entry)),
            entry);
}

TEST_F(EnvelopeCodecTest, TopicPrefix) {
  EXPECT_EQ(EnvelopeCodec::applyTopicPrefix("tools/7", ""), "tools/7");
  EXPECT_EQ(EnvelopeCodec::applyTopicPrefix("tools/7", "nemo"), "nemo/tools/7");
  EXPECT_EQ(EnvelopeCodec::applyTopicPrefix("nemo/tools/7", "nemo"),
            "nemo/tools/7");
  EXPECT_EQ(EnvelopeCodec::applyTopicPrefix("nemo", "nemo"), "nemo");
  EXPECT_EQ(EnvelopeCodec::applyTopicPrefix("nemotools", "nemo"),
            "nemo/nemotools");
  EXPECT_EQ(EnvelopeCodec::applyTopicPrefix("/tools", "nemo"), "nemo/tools");
}
