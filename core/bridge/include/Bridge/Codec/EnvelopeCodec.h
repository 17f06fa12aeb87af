/**
 * @file EnvelopeCodec.h
 * @brief Queue entry decoding and outbound payload encoding -
 * NemoBridge::Bridge::Codec
 */

#ifndef BRIDGE_CODEC_ENVELOPE_CODEC_H
#define BRIDGE_CODEC_ENVELOPE_CODEC_H

#include "Bridge/Model/QueueEntry.h"
#include "Bridge/Security/HmacSigner.h"

#include <string>

namespace NemoBridge {
namespace Bridge {
namespace Codec {

class EnvelopeCodec {
public:
  /**
   * @brief Parses one queue entry.
   * @details Required: "topic" (non-empty string) and "payload" (non-null).
   * A payload that is not a JSON string is carried as its compact
   * serialization. "qos" is read but publishing always uses QoS 1,
   * "retain" defaults to false, "enqueued_at" (or "timestamp") is advisory.
   * @throws MalformedEntry
   */
  static Model::QueueEntry decode(const std::string &raw);

  /**
   * @brief Wire bytes for an entry.
   * @param signer nullptr publishes the payload unchanged, otherwise the
   * payload is wrapped in {"payload","hmac","algo":"sha256"}.
   * @throws BridgeError when signing fails
   */
  static std::string encode(const Model::QueueEntry &entry,
                            const Security::HmacSigner *signer);

  /**
   * @brief Serializes an entry in queue format (producer side).
   */
  static std::string encodeQueueEntry(const Model::QueueEntry &entry);

  /**
   * @brief "prefix/topic", unless prefix is empty or topic is already
   * under the prefix.
   */
  static std::string applyTopicPrefix(const std::string &topic,
                                      const std::string &prefix);
};

} // namespace Codec
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_CODEC_ENVELOPE_CODEC_H
