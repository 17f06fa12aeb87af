/**
 * @file HealthMonitor.h
 * @brief Periodic bridge self-check - NemoBridge::Bridge::Service
 */

#ifndef BRIDGE_SERVICE_HEALTH_MONITOR_H
#define BRIDGE_SERVICE_HEALTH_MONITOR_H

#include "Bridge/Model/BridgeStatistics.h"
#include "Bridge/Model/ConnectionState.h"
#include "Bridge/Service/BridgeConfig.h"
#include "Client/RedisClient.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace NemoBridge {
namespace Bridge {
namespace Service {

using json = nlohmann::json;

struct HealthSnapshot {
  Model::ConnectionSnapshot connection;
  long queue_depth = -1; // -1 when the queue is unreachable
  Model::StatisticsSnapshot statistics;
  int64_t uptime_seconds = 0;
  int64_t timestamp = 0;

  json toJson() const;
};

/**
 * @brief Samples connection state, queue depth and counters on a fixed
 * tick, logs the sample and stores it under the status key with a TTL of
 * three intervals.
 * @details Uses its own Redis connection so it never waits behind the
 * consumer's blocking pop. Read-only with respect to the bridge.
 */
class HealthMonitor {
public:
  HealthMonitor(const Model::ConnectionState &state,
                const Model::BridgeStatistics &statistics,
                RedisClient *redis_client);
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor &) = delete;
  HealthMonitor &operator=(const HealthMonitor &) = delete;

  void configure(const BridgeConfig &config);

  bool start();
  void stop();
  bool isRunning() const { return is_running_.load(); }

  HealthSnapshot snapshot();

  /**
   * @brief One tick: sample, log, publish to the status key
   */
  void updateOnce();

private:
  void run();
  bool ensureRedis();

  const Model::ConnectionState &state_;
  const Model::BridgeStatistics &statistics_;
  RedisClient *redis_client_{nullptr};

  std::mutex config_mutex_;
  BridgeConfig config_;

  const std::chrono::steady_clock::time_point started_at_;

  std::thread thread_;
  std::atomic<bool> is_running_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
};

} // namespace Service
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_SERVICE_HEALTH_MONITOR_H
