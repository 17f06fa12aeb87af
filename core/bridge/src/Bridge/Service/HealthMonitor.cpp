/**
 * @file HealthMonitor.cpp
 * @brief Periodic bridge self-check
 */

#include "Bridge/Service/HealthMonitor.h"
#include "Logging/LogManager.h"

namespace NemoBridge {
namespace Bridge {
namespace Service {

namespace {
const std::string LOG_CATEGORY = "health";
}

json HealthSnapshot::toJson() const {
  json j = connection.toJson();
  j["queue_depth"] = queue_depth;
  j["published"] = statistics.published;
  j["malformed"] = statistics.malformed;
  j["dropped"] = statistics.dropped;
  j["publish_failures"] = statistics.publish_failures;
  j["last_publish_time"] = statistics.last_publish_time;
  j["uptime_seconds"] = uptime_seconds;
  j["timestamp"] = timestamp;
  return j;
}

HealthMonitor::HealthMonitor(const Model::ConnectionState &state,
                             const Model::BridgeStatistics &statistics,
                             RedisClient *redis_client)
    : state_(state), statistics_(statistics), redis_client_(redis_client),
      started_at_(std::chrono::steady_clock::now()) {}

HealthMonitor::~HealthMonitor() {
  stop();
  if (redis_client_) {
    redis_client_->disconnect();
  }
}

void HealthMonitor::configure(const BridgeConfig &config) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_ = config;
}

bool HealthMonitor::start() {
  if (is_running_.load())
    return false;

  is_running_ = true;
  thread_ = std::thread(&HealthMonitor::run, this);
  return true;
}

void HealthMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (!is_running_.load())
      return;
    is_running_ = false;
  }
  wait_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool HealthMonitor::ensureRedis() {
  if (!redis_client_)
    return false;
  if (redis_client_->isConnected())
    return true;

  BridgeConfig cfg;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    cfg = config_;
  }
  if (redis_client_->connect(cfg.redis_host, cfg.redis_port,
                             cfg.redis_password) &&
      redis_client_->select(cfg.redis_db)) {
    return true;
  }
  redis_client_->disconnect();
  LogManager::getInstance().log(LOG_CATEGORY, LogLevel::DEBUG,
                                "Status connection to " + cfg.redis_host +
                                    ":" + std::to_string(cfg.redis_port) +
                                    " unavailable");
  return false;
}

HealthSnapshot HealthMonitor::snapshot() {
  HealthSnapshot snap;
  snap.connection = state_.snapshot();
  snap.statistics = statistics_.snapshot();
  snap.uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::steady_clock::now() - started_at_)
                            .count();
  snap.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();

  std::string queue_key;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    queue_key = config_.queue_key;
  }
  if (ensureRedis()) {
    snap.queue_depth = redis_client_->llen(queue_key);
  }
  return snap;
}

void HealthMonitor::updateOnce() {
  HealthSnapshot snap = snapshot();

  LogManager::getInstance().logEvent(
      LOG_CATEGORY, LogLevel::INFO, "health",
      {{"broker_state",
        Model::brokerStateToString(snap.connection.broker_state)},
       {"broker_connected", snap.connection.broker_connected ? "true" : "false"},
       {"queue_connected", snap.connection.queue_connected ? "true" : "false"},
       {"queue_depth", std::to_string(snap.queue_depth)},
       {"reconnect_attempts",
        std::to_string(snap.connection.reconnect_attempt_count)},
       {"published", std::to_string(snap.statistics.published)},
       {"dropped", std::to_string(snap.statistics.dropped)},
       {"malformed", std::to_string(snap.statistics.malformed)},
       {"last_error", snap.connection.last_error}});

  std::string status_key;
  int interval_seconds;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    status_key = config_.status_key;
    interval_seconds = config_.health_interval_seconds;
  }
  if (status_key.empty() || !redis_client_ || !redis_client_->isConnected())
    return;

  if (!redis_client_->setex(status_key, snap.toJson().dump(),
                            interval_seconds * 3)) {
    LogManager::getInstance().log(LOG_CATEGORY, LogLevel::WARN,
                                  "Failed to write status key " + status_key);
  }
}

void HealthMonitor::run() {
  LogManager::getInstance().log(LOG_CATEGORY, LogLevel::INFO,
                                "Health monitor started");

  while (is_running_.load()) {
    updateOnce();

    int interval_seconds;
    {
      std::lock_guard<std::mutex> lock(config_mutex_);
      interval_seconds = config_.health_interval_seconds;
    }
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::seconds(interval_seconds),
                      [this] { return !is_running_.load(); });
  }

  LogManager::getInstance().log(LOG_CATEGORY, LogLevel::INFO,
                                "Health monitor stopped");
}

} // namespace Service
} // namespace Bridge
} // namespace NemoBridge
