/**
 * @file BridgeCoordinator.h
 * @brief Queue to broker pipeline and process lifecycle -
 * NemoBridge::Bridge::Service
 */

#ifndef BRIDGE_SERVICE_BRIDGE_COORDINATOR_H
#define BRIDGE_SERVICE_BRIDGE_COORDINATOR_H

#include "Bridge/Broker/BrokerConnectionManager.h"
#include "Bridge/Model/BridgeStatistics.h"
#include "Bridge/Model/ConnectionState.h"
#include "Bridge/Queue/QueueConsumer.h"
#include "Bridge/Service/BridgeContext.h"
#include "Bridge/Service/HealthMonitor.h"
#include "Bridge/Service/InstanceLock.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace NemoBridge {
namespace Bridge {
namespace Service {

/**
 * @brief Owns the bridge for the lifetime of the process.
 *
 * Startup: instance lock, settings, provisioner, queue connection, health
 * monitor, broker connection. The loop then moves one entry at a time from
 * the queue to the broker. A failed publish is retried after the broker
 * manager reports the session usable again, up to publish_retry_limit
 * attempts, and is dropped afterwards.
 */
class BridgeCoordinator {
public:
  using Sleeper = std::function<bool(std::chrono::milliseconds)>;

  explicit BridgeCoordinator(BridgeContext context);
  ~BridgeCoordinator();

  BridgeCoordinator(const BridgeCoordinator &) = delete;
  BridgeCoordinator &operator=(const BridgeCoordinator &) = delete;

  /**
   * @brief start(), loop until stopped or fatal, shutdown()
   * @return process exit code
   */
  int run();

  /**
   * @return ExitCode::CLEAN when the loop may begin, otherwise the exit code
   */
  int start();

  /**
   * @brief One loop iteration: control command, pop, deliver
   * @return false once the loop has to end
   */
  bool step();

  /**
   * @brief Explicit MQTT disconnect, health stop, lock release. Idempotent.
   */
  void shutdown();

  /**
   * @brief Stops popping and interrupts backoff waits; callable from any
   * thread
   */
  void requestStop();

  bool isFatal() const { return broker_->isFatal(); }

  /**
   * @brief Replaces backoff waits of the broker manager and queue consumer
   */
  void setSleeper(Sleeper sleeper);

  const Model::ConnectionState &state() const { return state_; }
  const Model::BridgeStatistics &statistics() const { return statistics_; }
  HealthSnapshot healthSnapshot() { return health_->snapshot(); }

private:
  void handleControlCommand(const std::string &command);
  void deliver(const Model::QueueEntry &entry);

  std::unique_ptr<LockHandle> lock_;
  std::string lock_path_;

  std::unique_ptr<IConfigSource> config_source_;
  Model::ConnectionState state_;
  Model::BridgeStatistics statistics_;

  std::unique_ptr<Queue::QueueConsumer> consumer_;
  std::unique_ptr<Broker::BrokerConnectionManager> broker_;
  std::unique_ptr<RedisClient> health_redis_;
  std::unique_ptr<HealthMonitor> health_;
  std::unique_ptr<ServiceProvisioner> provisioner_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> started_{false};
  std::atomic<bool> shut_down_{false};
};

} // namespace Service
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_SERVICE_BRIDGE_COORDINATOR_H
