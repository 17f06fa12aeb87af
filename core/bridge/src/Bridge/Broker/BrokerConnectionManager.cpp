/**
 * @file BrokerConnectionManager.cpp
 * @brief MQTT connection lifecycle with exponential backoff
 */

#include "Bridge/Broker/BrokerConnectionManager.h"
#include "Constants/BridgeConstants.h"
#include "Logging/LogManager.h"
#include "Utils/Backoff.h"

namespace NemoBridge {
namespace Bridge {
namespace Broker {

namespace {
const std::string LOG_CATEGORY = "mqtt";
}

BrokerConnectionManager::BrokerConnectionManager(
    Service::IConfigSource &config_source,
    std::unique_ptr<IMqttSession> session, Model::ConnectionState &state)
    : config_source_(config_source), session_(std::move(session)),
      state_(state) {
  sleeper_ = [this](std::chrono::milliseconds delay) {
    return defaultSleep(delay);
  };
  session_->setConnectionLostHandler(
      [this](const std::string &cause) { onConnectionLost(cause); });
}

BrokerConnectionManager::~BrokerConnectionManager() {
  requestStop();
  session_->setConnectionLostHandler(nullptr);
}

void BrokerConnectionManager::setSleeper(Sleeper sleeper) {
  sleeper_ = std::move(sleeper);
}

std::chrono::milliseconds
BrokerConnectionManager::backoffDelay(int failures_before, int base_seconds,
                                      int max_seconds) {
  Utils::BackoffConfig backoff;
  backoff.base_delay = std::chrono::seconds(base_seconds);
  backoff.max_delay = std::chrono::seconds(max_seconds);
  return Utils::computeBackoffDelay(backoff, failures_before);
}

bool BrokerConnectionManager::connect() {
  std::lock_guard<std::mutex> lock(connect_mutex_);

  while (!stop_requested_.load() && !fatal_.load()) {
    // fresh settings for every attempt
    try {
      applyConfig(config_source_.load());
    } catch (const BridgeError &e) {
      logWarn("Settings reload failed, keeping previous settings: " +
              std::string(e.what()));
    }
    Service::BridgeConfig cfg = currentConfig();

    if (session_->isConnected()) {
      session_->disconnect();
    }

    SessionOptions options;
    options.server_uri = cfg.brokerUri();
    options.client_id = state_.clientSessionId();
    options.username = cfg.username;
    options.password = cfg.password;
    options.keepalive_seconds = cfg.keepalive_seconds;
    options.connect_timeout_seconds = cfg.connect_timeout_seconds;

    LogManager::getInstance().logEvent(
        LOG_CATEGORY, LogLevel::INFO, "broker_connect_attempt",
        {{"broker", options.server_uri},
         {"client_id", options.client_id},
         {"attempt", std::to_string(failures_ + 1)}});

    try {
      session_->connect(options);

      failures_ = 0;
      ever_connected_ = true;
      state_.markBrokerConnected();
      LogManager::getInstance().logEvent(LOG_CATEGORY, LogLevel::INFO,
                                         "broker_connected",
                                         {{"broker", options.server_uri},
                                          {"client_id", options.client_id}});
      return true;
    } catch (const MqttSessionError &e) {
      const int failures_before = failures_;
      failures_++;

      if (cfg.max_reconnect_attempts > 0 &&
          failures_ >= cfg.max_reconnect_attempts) {
        fatal_ = true;
        state_.markBrokerBackoff(failures_, e.what());
        state_.markBrokerFatal(e.what());
        LogManager::getInstance().logEvent(
            LOG_CATEGORY, LogLevel::LOG_FATAL, "broker_connect_fatal",
            {{"attempts", std::to_string(failures_)},
             {"error", e.what()}});
        return false;
      }

      auto delay = backoffDelay(failures_before, cfg.reconnect_delay_seconds,
                                cfg.reconnect_max_delay_seconds);
      state_.markBrokerBackoff(failures_, e.what());
      LogManager::getInstance().logEvent(
          LOG_CATEGORY, LogLevel::WARN, "broker_connect_failed",
          {{"attempt", std::to_string(failures_)},
           {"max_attempts", std::to_string(cfg.max_reconnect_attempts)},
           {"retry_in_ms", std::to_string(delay.count())},
           {"error", e.what()}});

      if (!sleeper_(delay)) {
        break;
      }
    }
  }

  if (!fatal_.load()) {
    state_.markBrokerDisconnected("");
  }
  return false;
}

bool BrokerConnectionManager::ensureConnected() {
  if (fatal_.load()) {
    return false;
  }
  if (session_->isConnected()) {
    return true;
  }

  if (ever_connected_.load() && !currentConfig().auto_reconnect) {
    fatal_ = true;
    state_.markBrokerFatal("connection lost and auto reconnect is disabled");
    logError("Broker connection lost and auto reconnect is disabled");
    return false;
  }

  logInfo("Broker session down, reconnecting");
  return connect();
}

bool BrokerConnectionManager::forceReconnect() {
  if (fatal_.load()) {
    return false;
  }
  logInfo("Forced reconnect requested");
  session_->disconnect();
  state_.markBrokerDisconnected("");
  return connect();
}

PublishResult BrokerConnectionManager::publish(const std::string &topic,
                                               const std::string &payload,
                                               bool retain) {
  PublishResult result;
  result.topic = topic;
  result.payload_size = payload.size();
  result.retain = retain;

  if (fatal_.load()) {
    result.error_message = "broker connection is fatal";
    return result;
  }
  if (!session_->isConnected()) {
    result.error_message = "MQTT client not connected";
    return result;
  }

  int timeout_seconds = currentConfig().publish_timeout_seconds;
  auto start = std::chrono::steady_clock::now();
  try {
    session_->publish(topic, payload, NemoBridge::Constants::Bridge::MQTT_QOS,
                      retain, std::chrono::seconds(timeout_seconds));
    result.success = true;
  } catch (const MqttSessionError &e) {
    result.error_message = e.what();
    if (!session_->isConnected()) {
      state_.markBrokerDisconnected(e.what());
    }
  }
  result.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  return result;
}

void BrokerConnectionManager::disconnect() {
  session_->disconnect();
  state_.markBrokerDisconnected("");
  logInfo("Broker session closed");
}

void BrokerConnectionManager::requestStop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
}

bool BrokerConnectionManager::isConnected() const {
  return !fatal_.load() && session_->isConnected();
}

Service::BridgeConfig BrokerConnectionManager::currentConfig() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return config_;
}

std::shared_ptr<const Security::HmacSigner>
BrokerConnectionManager::signer() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return signer_;
}

bool BrokerConnectionManager::defaultSleep(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, delay,
                            [this] { return stop_requested_.load(); });
}

void BrokerConnectionManager::onConnectionLost(const std::string &cause) {
  state_.markBrokerDisconnected(cause);
  LogManager::getInstance().logEvent(LOG_CATEGORY, LogLevel::WARN,
                                     "broker_connection_lost",
                                     {{"cause", cause}});
}

void BrokerConnectionManager::applyConfig(const Service::BridgeConfig &config) {
  std::shared_ptr<const Security::HmacSigner> signer;
  if (config.signingActive()) {
    signer = std::make_shared<Security::HmacSigner>(config.hmac_secret_key);
  } else if (config.hmac_enabled) {
    logWarn("HMAC signing enabled but no secret key configured, publishing "
            "unsigned");
  }

  std::lock_guard<std::mutex> lock(config_mutex_);
  config_ = config;
  signer_ = std::move(signer);
}

void BrokerConnectionManager::logInfo(const std::string &message) const {
  LogManager::getInstance().log(LOG_CATEGORY, LogLevel::INFO, message);
}

void BrokerConnectionManager::logWarn(const std::string &message) const {
  LogManager::getInstance().log(LOG_CATEGORY, LogLevel::WARN, message);
}

void BrokerConnectionManager::logError(const std::string &message) const {
  LogManager::getInstance().log(LOG_CATEGORY, LogLevel::LOG_ERROR, message);
}

} // namespace Broker
} // namespace Bridge
} // namespace NemoBridge
