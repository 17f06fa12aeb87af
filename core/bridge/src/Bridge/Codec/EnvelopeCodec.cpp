/**
 * @file EnvelopeCodec.cpp
 * @brief Queue entry decoding and outbound payload encoding
 */

#include "Bridge/Codec/EnvelopeCodec.h"
#include "Bridge/BridgeErrors.h"
#include "Constants/BridgeConstants.h"

#include <nlohmann/json.hpp>

namespace NemoBridge {
namespace Bridge {
namespace Codec {

using json = nlohmann::json;
namespace Envelope = NemoBridge::Constants::Bridge::Envelope;

Model::QueueEntry EnvelopeCodec::decode(const std::string &raw) {
  json parsed = json::parse(raw, nullptr, false);
  if (parsed.is_discarded()) {
    throw MalformedEntry("not valid JSON");
  }
  if (!parsed.is_object()) {
    throw MalformedEntry("not a JSON object");
  }

  Model::QueueEntry entry;

  auto topic_it = parsed.find("topic");
  if (topic_it == parsed.end() || topic_it->is_null()) {
    throw MalformedEntry("missing topic");
  }
  if (!topic_it->is_string() || topic_it->get<std::string>().empty()) {
    throw MalformedEntry("topic must be a non-empty string");
  }
  entry.topic = topic_it->get<std::string>();

  auto payload_it = parsed.find("payload");
  if (payload_it == parsed.end() || payload_it->is_null()) {
    throw MalformedEntry("missing payload (topic " + entry.topic + ")");
  }
  entry.payload = payload_it->is_string() ? payload_it->get<std::string>()
                                          : payload_it->dump();

  auto qos_it = parsed.find("qos");
  if (qos_it != parsed.end() && qos_it->is_number_integer()) {
    entry.qos = qos_it->get<int>();
  }

  auto retain_it = parsed.find("retain");
  if (retain_it != parsed.end() && retain_it->is_boolean()) {
    entry.retain = retain_it->get<bool>();
  }

  for (const char *key : {"enqueued_at", "timestamp"}) {
    auto it = parsed.find(key);
    if (it != parsed.end() && it->is_number()) {
      entry.enqueued_at = it->get<double>();
      break;
    }
  }

  return entry;
}

std::string EnvelopeCodec::encode(const Model::QueueEntry &entry,
                                  const Security::HmacSigner *signer) {
  if (signer == nullptr) {
    return entry.payload;
  }

  nlohmann::ordered_json envelope;
  envelope[Envelope::KEY_PAYLOAD] = entry.payload;
  envelope[Envelope::KEY_HMAC] = signer->sign(entry.payload);
  envelope[Envelope::KEY_ALGO] = Envelope::ALGO_SHA256;
  try {
    return envelope.dump();
  } catch (const json::exception &e) {
    throw BridgeError("cannot serialize envelope: " + std::string(e.what()));
  }
}

std::string EnvelopeCodec::encodeQueueEntry(const Model::QueueEntry &entry) {
  nlohmann::ordered_json j;
  j["topic"] = entry.topic;
  j["payload"] = entry.payload;
  j["qos"] = entry.qos;
  j["retain"] = entry.retain;
  if (entry.enqueued_at) {
    j["enqueued_at"] = *entry.enqueued_at;
  }
  return j.dump();
}

std::string EnvelopeCodec::applyTopicPrefix(const std::string &topic,
                                            const std::string &prefix) {
  if (prefix.empty()) {
    return topic;
  }
  if (topic == prefix || topic.rfind(prefix + "/", 0) == 0) {
    return topic;
  }
  if (!topic.empty() && topic.front() == '/') {
    return prefix + topic;
  }
  return prefix + "/" + topic;
}

} // namespace Codec
} // namespace Bridge
} // namespace NemoBridge
