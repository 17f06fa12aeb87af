/**
 * @file QueueConsumer.cpp
 * @brief FIFO consumer of the Redis event list
 */

#include "Bridge/Queue/QueueConsumer.h"
#include "Bridge/Codec/EnvelopeCodec.h"
#include "Constants/BridgeConstants.h"
#include "Logging/LogManager.h"
#include "Utils/Backoff.h"

namespace NemoBridge {
namespace Bridge {
namespace Queue {

namespace {
const std::string LOG_CATEGORY = "queue";
namespace Defaults = NemoBridge::Constants::Bridge::Defaults;
} // namespace

QueueConsumer::QueueConsumer(std::unique_ptr<RedisClient> redis,
                             Model::ConnectionState &state)
    : redis_(std::move(redis)), state_(state) {
  sleeper_ = [this](std::chrono::milliseconds delay) {
    return defaultSleep(delay);
  };
}

QueueConsumer::~QueueConsumer() { disconnect(); }

void QueueConsumer::configure(const Service::BridgeConfig &config) {
  config_ = config;
}

void QueueConsumer::setSleeper(Sleeper sleeper) {
  sleeper_ = std::move(sleeper);
}

bool QueueConsumer::connect() {
  bool ok = redis_->connect(config_.redis_host, config_.redis_port,
                            config_.redis_password) &&
            redis_->select(config_.redis_db);

  if (ok) {
    reconnect_failures_ = 0;
    state_.setQueueConnected(true);
    LogManager::getInstance().logEvent(
        LOG_CATEGORY, LogLevel::INFO, "queue_connected",
        {{"redis", config_.redis_host + ":" + std::to_string(config_.redis_port)},
         {"db", std::to_string(config_.redis_db)},
         {"queue", config_.queue_key}});
  } else {
    redis_->disconnect();
    state_.setQueueConnected(false, "queue connection to " +
                                        config_.redis_host + ":" +
                                        std::to_string(config_.redis_port) +
                                        " failed");
  }
  return ok;
}

void QueueConsumer::disconnect() {
  redis_->disconnect();
  state_.setQueueConnected(false);
}

bool QueueConsumer::isConnected() const { return redis_->isConnected(); }

bool QueueConsumer::reconnectWithBackoff() {
  if (connect()) {
    LogManager::getInstance().log(LOG_CATEGORY, LogLevel::INFO,
                                  "Queue connection re-established");
    return true;
  }

  Utils::BackoffConfig backoff;
  backoff.base_delay =
      std::chrono::seconds(Defaults::QUEUE_RECONNECT_BASE_SECONDS);
  backoff.max_delay = std::chrono::seconds(Defaults::QUEUE_RECONNECT_MAX_SECONDS);
  auto delay = Utils::computeBackoffDelay(backoff, reconnect_failures_);
  reconnect_failures_++;

  LogManager::getInstance().logEvent(
      LOG_CATEGORY, LogLevel::WARN, "queue_connect_failed",
      {{"attempt", std::to_string(reconnect_failures_)},
       {"retry_in_ms", std::to_string(delay.count())}});
  sleeper_(delay);
  return false;
}

std::optional<Model::QueueEntry> QueueConsumer::next() {
  if (stop_requested_.load()) {
    return std::nullopt;
  }

  if (!redis_->isConnected()) {
    state_.setQueueConnected(false, "queue connection lost");
    if (!reconnectWithBackoff()) {
      return std::nullopt;
    }
  }

  std::optional<std::string> raw =
      redis_->blpop(config_.queue_key, config_.queue_pop_timeout_seconds);

  if (!raw) {
    if (!redis_->isConnected()) {
      state_.setQueueConnected(false, "queue connection lost during pop");
      LogManager::getInstance().log(LOG_CATEGORY, LogLevel::WARN,
                                    "Queue connection lost during pop");
    }
    return std::nullopt;
  }

  return Codec::EnvelopeCodec::decode(*raw);
}

std::optional<std::string> QueueConsumer::pollControl() {
  if (config_.control_key.empty() || !redis_->isConnected()) {
    return std::nullopt;
  }
  std::string command = redis_->lpop(config_.control_key);
  if (command.empty()) {
    return std::nullopt;
  }
  return command;
}

long QueueConsumer::depth() {
  if (!redis_->isConnected()) {
    return -1;
  }
  return redis_->llen(config_.queue_key);
}

void QueueConsumer::requestStop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
}

bool QueueConsumer::defaultSleep(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, delay,
                            [this] { return stop_requested_.load(); });
}

} // namespace Queue
} // namespace Bridge
} // namespace NemoBridge
