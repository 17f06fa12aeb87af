/**
 * @file QueueEntry.h
 * @brief Unit dequeued from the Redis event queue - NemoBridge::Bridge::Model
 */

#ifndef BRIDGE_MODEL_QUEUE_ENTRY_H
#define BRIDGE_MODEL_QUEUE_ENTRY_H

#include <optional>
#include <string>

namespace NemoBridge {
namespace Bridge {
namespace Model {

struct QueueEntry {
  std::string topic;
  std::string payload;
  int qos = 1;         // publish QoS is always 1, kept for logging
  bool retain = false;
  std::optional<double> enqueued_at; // epoch seconds, advisory

  bool operator==(const QueueEntry &other) const {
    return topic == other.topic && payload == other.payload &&
           retain == other.retain;
  }
};

} // namespace Model
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_MODEL_QUEUE_ENTRY_H
