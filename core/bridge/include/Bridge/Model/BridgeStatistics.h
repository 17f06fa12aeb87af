/**
 * @file BridgeStatistics.h
 * @brief Delivery counters - NemoBridge::Bridge::Model
 */

#ifndef BRIDGE_MODEL_BRIDGE_STATISTICS_H
#define BRIDGE_MODEL_BRIDGE_STATISTICS_H

#include <atomic>
#include <cstdint>

namespace NemoBridge {
namespace Bridge {
namespace Model {

struct StatisticsSnapshot {
  uint64_t published = 0;
  uint64_t malformed = 0;
  uint64_t dropped = 0;
  uint64_t publish_failures = 0;
  int64_t last_publish_time = 0; // epoch seconds, 0 = never
};

/**
 * @brief Written by the coordinator loop, read by the health monitor
 */
class BridgeStatistics {
public:
  void recordPublished(int64_t epoch_seconds) {
    published_++;
    last_publish_time_ = epoch_seconds;
  }
  void recordMalformed() { malformed_++; }
  void recordDropped() { dropped_++; }
  void recordPublishFailure() { publish_failures_++; }

  StatisticsSnapshot snapshot() const {
    StatisticsSnapshot s;
    s.published = published_.load();
    s.malformed = malformed_.load();
    s.dropped = dropped_.load();
    s.publish_failures = publish_failures_.load();
    s.last_publish_time = last_publish_time_.load();
    return s;
  }

private:
  std::atomic<uint64_t> published_{0};
  std::atomic<uint64_t> malformed_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> publish_failures_{0};
  std::atomic<int64_t> last_publish_time_{0};
};

} // namespace Model
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_MODEL_BRIDGE_STATISTICS_H
