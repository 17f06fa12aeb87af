/**
 * @file BridgeCoordinator.cpp
 * @brief Queue to broker pipeline and process lifecycle
 */

#include "Bridge/Service/BridgeCoordinator.h"
#include "Bridge/BridgeErrors.h"
#include "Bridge/Codec/EnvelopeCodec.h"
#include "Constants/BridgeConstants.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <chrono>

namespace NemoBridge {
namespace Bridge {
namespace Service {

namespace {

const std::string LOG_CATEGORY = "bridge";
namespace ExitCode = NemoBridge::Constants::Bridge::ExitCode;
namespace Redis = NemoBridge::Constants::Bridge::Redis;

int64_t nowEpochSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

BridgeCoordinator::BridgeCoordinator(BridgeContext context)
    : lock_path_(std::move(context.lock_path)),
      config_source_(std::move(context.config_source)),
      state_(context.client_session_id.empty()
                 ? Model::ConnectionState::makeSessionId()
                 : context.client_session_id),
      health_redis_(std::move(context.health_redis)),
      provisioner_(std::move(context.provisioner)) {
  if (!config_source_ || !context.mqtt_session || !context.queue_redis) {
    throw BridgeError("bridge context needs a config source, an MQTT "
                      "session and a queue connection");
  }

  consumer_ = std::make_unique<Queue::QueueConsumer>(
      std::move(context.queue_redis), state_);
  broker_ = std::make_unique<Broker::BrokerConnectionManager>(
      *config_source_, std::move(context.mqtt_session), state_);
  health_ =
      std::make_unique<HealthMonitor>(state_, statistics_, health_redis_.get());
}

BridgeCoordinator::~BridgeCoordinator() { shutdown(); }

void BridgeCoordinator::setSleeper(Sleeper sleeper) {
  broker_->setSleeper(sleeper);
  consumer_->setSleeper(std::move(sleeper));
}

int BridgeCoordinator::run() {
  int exit_code = start();
  if (exit_code == ExitCode::CLEAN) {
    while (step()) {
    }
    if (broker_->isFatal()) {
      exit_code = ExitCode::BROKER_FATAL;
    }
  }
  shutdown();
  return exit_code;
}

int BridgeCoordinator::start() {
  LogManager::getInstance().log(
      LOG_CATEGORY, LogLevel::INFO,
      "Bridge starting, session " + state_.clientSessionId());

  // 1. Instance lock
  try {
    lock_ = InstanceLock(lock_path_).acquire();
  } catch (const AlreadyRunningError &e) {
    LogManager::getInstance().logEvent(
        LOG_CATEGORY, LogLevel::LOG_ERROR, "already_running",
        {{"lock", lock_path_}, {"holder_pid", std::to_string(e.holderPid())}});
    return ExitCode::ALREADY_RUNNING;
  } catch (const LockError &e) {
    LogManager::getInstance().log(LOG_CATEGORY, LogLevel::LOG_ERROR, e.what());
    return ExitCode::STARTUP_FAILURE;
  }

  // 2. Settings and provisioner
  BridgeConfig config;
  try {
    config = config_source_->load();
    if (!provisioner_) {
      provisioner_ = createProvisioner(config);
    }
  } catch (const BridgeError &e) {
    LogManager::getInstance().log(LOG_CATEGORY, LogLevel::LOG_ERROR, e.what());
    return ExitCode::STARTUP_FAILURE;
  }
  LogManager::getInstance().log(LOG_CATEGORY, LogLevel::INFO,
                                "Settings: " + config.describe());

  if (!provisioner_->prepare(config)) {
    LogManager::getInstance().log(LOG_CATEGORY, LogLevel::LOG_ERROR,
                                  "Provisioner '" + provisioner_->name() +
                                      "' failed to prepare services");
    return ExitCode::STARTUP_FAILURE;
  }

  // 3. Queue and health monitor
  consumer_->configure(config);
  if (!consumer_->connect()) {
    LogManager::getInstance().log(
        LOG_CATEGORY, LogLevel::WARN,
        "Queue unavailable at startup, retrying in the background");
  }
  health_->configure(config);
  health_->start();
  started_ = true;

  // 4. Broker
  if (!broker_->connect()) {
    return broker_->isFatal() ? ExitCode::BROKER_FATAL : ExitCode::CLEAN;
  }

  LogManager::getInstance().log(LOG_CATEGORY, LogLevel::INFO,
                                "Bridge running, consuming " +
                                    config.queue_key);
  return ExitCode::CLEAN;
}

bool BridgeCoordinator::step() {
  if (stop_requested_.load() || broker_->isFatal()) {
    return false;
  }

  if (auto command = consumer_->pollControl()) {
    handleControlCommand(*command);
  }

  // no pop while nothing can be published
  if (!broker_->isConnected() && !broker_->ensureConnected()) {
    return false;
  }

  std::optional<Model::QueueEntry> entry;
  try {
    entry = consumer_->next();
  } catch (const MalformedEntry &e) {
    statistics_.recordMalformed();
    LogManager::getInstance().logEvent(LOG_CATEGORY, LogLevel::WARN,
                                       "malformed_entry", {{"error", e.what()}});
    return true;
  }

  if (entry) {
    deliver(*entry);
  }
  return !stop_requested_.load() && !broker_->isFatal();
}

void BridgeCoordinator::handleControlCommand(const std::string &command) {
  LogManager::getInstance().logEvent(LOG_CATEGORY, LogLevel::INFO,
                                     "control_command", {{"command", command}});

  if (command != Redis::CMD_RELOAD_CONFIG) {
    LogManager::getInstance().log(LOG_CATEGORY, LogLevel::WARN,
                                  "Unknown control command ignored: " +
                                      command);
    return;
  }

  try {
    BridgeConfig config = config_source_->load();
    consumer_->configure(config);
    health_->configure(config);
  } catch (const BridgeError &e) {
    LogManager::getInstance().log(LOG_CATEGORY, LogLevel::WARN,
                                  "Reload failed, keeping previous settings: " +
                                      std::string(e.what()));
  }
  broker_->forceReconnect();
}

void BridgeCoordinator::deliver(const Model::QueueEntry &entry) {
  const BridgeConfig config = broker_->currentConfig();
  const std::string topic =
      Codec::EnvelopeCodec::applyTopicPrefix(entry.topic, config.topic_prefix);

  std::string wire;
  auto signer = broker_->signer();
  try {
    wire = Codec::EnvelopeCodec::encode(entry, signer.get());
  } catch (const BridgeError &e) {
    LogManager::getInstance().log(LOG_CATEGORY, LogLevel::WARN,
                                  "Signing failed, publishing unsigned: " +
                                      std::string(e.what()));
    wire = Codec::EnvelopeCodec::encode(entry, nullptr);
  }

  const int attempts_allowed = std::max(1, config.publish_retry_limit);
  int attempt = 0;
  while (attempt < attempts_allowed) {
    attempt++;
    Broker::PublishResult result = broker_->publish(topic, wire, entry.retain);
    if (result.success) {
      statistics_.recordPublished(nowEpochSeconds());
      LogManager::getInstance().log(
          LOG_CATEGORY, LogLevel::DEBUG,
          "Published " + std::to_string(result.payload_size) + " bytes to " +
              topic + " (" + std::to_string(result.response_time.count()) +
              "ms)");
      return;
    }

    statistics_.recordPublishFailure();
    LogManager::getInstance().logEvent(
        LOG_CATEGORY, LogLevel::WARN, "publish_failed",
        {{"topic", topic},
         {"attempt", std::to_string(attempt)},
         {"max_attempts", std::to_string(attempts_allowed)},
         {"error", result.error_message}});

    if (attempt >= attempts_allowed || !broker_->ensureConnected()) {
      break;
    }
  }

  statistics_.recordDropped();
  LogManager::getInstance().logEvent(
      LOG_CATEGORY, LogLevel::LOG_ERROR, "entry_dropped",
      {{"topic", topic},
       {"attempts", std::to_string(attempt)},
       {"bytes", std::to_string(wire.size())}});
}

void BridgeCoordinator::requestStop() {
  stop_requested_ = true;
  consumer_->requestStop();
  broker_->requestStop();
}

void BridgeCoordinator::shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }

  requestStop();
  if (started_.load()) {
    broker_->disconnect();
  }
  health_->stop();
  consumer_->disconnect();
  if (provisioner_) {
    provisioner_->shutdown();
  }
  if (lock_) {
    lock_->release();
    lock_.reset();
  }

  Model::StatisticsSnapshot stats = statistics_.snapshot();
  LogManager::getInstance().logEvent(
      LOG_CATEGORY, LogLevel::INFO, "bridge_stopped",
      {{"published", std::to_string(stats.published)},
       {"dropped", std::to_string(stats.dropped)},
       {"malformed", std::to_string(stats.malformed)}});
}

} // namespace Service
} // namespace Bridge
} // namespace NemoBridge
