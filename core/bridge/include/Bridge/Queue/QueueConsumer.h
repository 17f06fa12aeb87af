/**
 * @file QueueConsumer.h
 * @brief FIFO consumer of the Redis event list - NemoBridge::Bridge::Queue
 */

#ifndef BRIDGE_QUEUE_QUEUE_CONSUMER_H
#define BRIDGE_QUEUE_QUEUE_CONSUMER_H

#include "Bridge/Model/ConnectionState.h"
#include "Bridge/Model/QueueEntry.h"
#include "Bridge/Service/BridgeConfig.h"
#include "Client/RedisClient.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace NemoBridge {
namespace Bridge {
namespace Queue {

/**
 * @brief Pops entries from the head of the queue list (producers push to
 * the tail), so delivery order is queue order.
 * @details Owns its Redis connection. A lost connection is re-established
 * on the next call with exponential backoff (1s doubling up to 30s,
 * unlimited attempts).
 */
class QueueConsumer {
public:
  using Sleeper = std::function<bool(std::chrono::milliseconds)>;

  QueueConsumer(std::unique_ptr<RedisClient> redis,
                Model::ConnectionState &state);
  ~QueueConsumer();

  QueueConsumer(const QueueConsumer &) = delete;
  QueueConsumer &operator=(const QueueConsumer &) = delete;

  void configure(const Service::BridgeConfig &config);
  void setSleeper(Sleeper sleeper);

  /**
   * @brief Single connection attempt (AUTH + SELECT db)
   */
  bool connect();
  void disconnect();
  bool isConnected() const;

  /**
   * @brief Next entry, waiting at most the pop timeout.
   * @return std::nullopt on timeout, while disconnected, or once stopped
   * @throws MalformedEntry when the popped text does not decode; the
   * entry has already left the queue
   */
  std::optional<Model::QueueEntry> next();

  /**
   * @brief Non-blocking pop of the control list
   */
  std::optional<std::string> pollControl();

  /**
   * @brief LLEN of the queue, -1 when unavailable
   */
  long depth();

  void requestStop();

private:
  bool reconnectWithBackoff();
  bool defaultSleep(std::chrono::milliseconds delay);

  std::unique_ptr<RedisClient> redis_;
  Model::ConnectionState &state_;
  Service::BridgeConfig config_;
  Sleeper sleeper_;

  int reconnect_failures_{0};

  std::atomic<bool> stop_requested_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
};

} // namespace Queue
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_QUEUE_QUEUE_CONSUMER_H
