/**
 * @file main.cpp
 * @brief NemoBridge entry point: Redis queue to MQTT broker
 * @author NemoBridge Development Team
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "Bridge/BridgeErrors.h"
#include "Bridge/Broker/PahoMqttSession.h"
#include "Bridge/Service/BridgeConfig.h"
#include "Bridge/Service/BridgeContext.h"
#include "Bridge/Service/BridgeCoordinator.h"
#include "Bridge/Service/InstanceLock.h"
#include "Client/RedisClientImpl.h"
#include "Constants/BridgeConstants.h"
#include "Logging/LogManager.h"
#include "Platform/ProcessUtils.h"
#include "Utils/ConfigManager.h"

using namespace NemoBridge;
using namespace NemoBridge::Bridge;

namespace BridgeConst = NemoBridge::Constants::Bridge;

// set from the signal handler, polled by main
std::atomic<bool> g_shutdown_requested{false};
std::atomic<int> g_shutdown_signal{0};

void signal_handler(int signal) {
  g_shutdown_signal.store(signal);
  g_shutdown_requested.store(true);
}

void print_usage(const char *program_name) {
  std::cout << "Usage: " << program_name << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --config=PATH       additional settings file\n";
  std::cout << "  --status            report whether a bridge holds the lock\n";
  std::cout << "  --stop              send SIGTERM to the running bridge\n";
  std::cout << "  --takeover          remove a stale lock file\n";
  std::cout << "  --health            print the last published health "
               "snapshot\n";
  std::cout << "  --help              show this help\n";
  std::cout << "  --version           show version\n\n";
  std::cout << "Exit codes: 0 clean, 1 startup failure, 3 already running, "
               "4 broker unreachable\n";
}

std::string resolveLockPath() {
  return ConfigManager::getInstance().getOrDefault(
      BridgeConst::Config::LOCK_FILE, BridgeConst::Defaults::LOCK_FILE);
}

int commandStatus() {
  Service::InstanceLock lock(resolveLockPath());
  Service::LockStatus status = lock.inspect();

  if (!status.present) {
    std::cout << "not running (no lock at " << lock.path() << ")\n";
    return 1;
  }
  if (!status.readable) {
    std::cout << "not running (unreadable lock at " << lock.path() << ")\n";
    return 1;
  }
  if (!status.alive) {
    std::cout << "not running (stale lock, pid " << status.pid << ")\n";
    return 1;
  }
  std::cout << "running (pid " << status.pid << ", since "
            << status.acquired_at << ")\n";
  return 0;
}

int commandStop() {
  Service::InstanceLock lock(resolveLockPath());
  Service::LockStatus status = lock.inspect();

  if (!status.alive) {
    std::cout << "bridge is not running\n";
    return 1;
  }
  if (!Platform::Process::Terminate(status.pid)) {
    std::cerr << "failed to signal pid " << status.pid << "\n";
    return 1;
  }

  for (int i = 0; i < 100; ++i) {
    if (!Platform::Process::IsAlive(status.pid)) {
      std::cout << "bridge (pid " << status.pid << ") stopped\n";
      return 0;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  std::cerr << "bridge (pid " << status.pid
            << ") did not exit within 10 seconds\n";
  return 1;
}

int commandTakeover() {
  Service::InstanceLock lock(resolveLockPath());
  try {
    if (lock.reclaimStale()) {
      std::cout << "stale lock removed: " << lock.path() << "\n";
    } else {
      std::cout << "no lock present: " << lock.path() << "\n";
    }
    return 0;
  } catch (const AlreadyRunningError &e) {
    std::cerr << e.what() << "\n";
    return BridgeConst::ExitCode::ALREADY_RUNNING;
  } catch (const LockError &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
}

int commandHealth() {
  Service::BridgeConfig config;
  try {
    config = Service::ConfigManagerSource().load();
  } catch (const ConfigError &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  RedisClientImpl redis;
  if (!redis.connect(config.redis_host, config.redis_port,
                     config.redis_password) ||
      !redis.select(config.redis_db)) {
    std::cerr << "cannot reach Redis at " << config.redis_host << ":"
              << config.redis_port << "\n";
    return 1;
  }

  std::string status = redis.get(config.status_key);
  redis.disconnect();
  if (status.empty()) {
    std::cout << "no health snapshot under " << config.status_key
              << " (bridge down or not yet reported)\n";
    return 1;
  }

  try {
    std::cout << nlohmann::json::parse(status).dump(2) << "\n";
  } catch (const nlohmann::json::exception &) {
    std::cout << status << "\n";
  }
  return 0;
}

int runBridge() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  Service::BridgeContext context;
  context.lock_path = resolveLockPath();
  context.config_source = std::make_unique<Service::ConfigManagerSource>();
  context.mqtt_session = std::make_unique<Broker::PahoMqttSession>();
  context.queue_redis = std::make_unique<RedisClientImpl>();
  context.health_redis = std::make_unique<RedisClientImpl>();

  Service::BridgeCoordinator coordinator(std::move(context));

  std::atomic<bool> finished{false};
  int exit_code = BridgeConst::ExitCode::CLEAN;
  std::thread loop([&]() {
    exit_code = coordinator.run();
    finished = true;
  });

  while (!finished.load()) {
    if (g_shutdown_requested.load()) {
      LogManager::getInstance().Info("Shutdown signal {} received",
                                     g_shutdown_signal.load());
      coordinator.requestStop();
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  loop.join();
  LogManager::getInstance().Info("NemoBridge exiting with code {}", exit_code);
  LogManager::getInstance().flushAll();
  return exit_code;
}

int main(int argc, char *argv[]) {
  enum class Command { RUN, STATUS, STOP, TAKEOVER, HEALTH };
  Command command = Command::RUN;
  std::string config_path;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--version" || arg == "-v") {
      std::cout << BridgeConst::SERVICE_NAME << " " << BridgeConst::VERSION
                << "\n";
      return 0;
    } else if (arg.rfind("--config=", 0) == 0) {
      config_path = arg.substr(9);
    } else if (arg == "--status") {
      command = Command::STATUS;
    } else if (arg == "--stop") {
      command = Command::STOP;
    } else if (arg == "--takeover") {
      command = Command::TAKEOVER;
    } else if (arg == "--health") {
      command = Command::HEALTH;
    } else {
      std::cerr << "unknown option: " << arg << "\n\n";
      print_usage(argv[0]);
      return 1;
    }
  }

  try {
    if (!config_path.empty() &&
        !ConfigManager::getInstance().load(config_path)) {
      std::cerr << "cannot read settings file " << config_path << "\n";
      return 1;
    }
    LogManager::getInstance().reloadSettings();

    switch (command) {
    case Command::STATUS:
      return commandStatus();
    case Command::STOP:
      return commandStop();
    case Command::TAKEOVER:
      return commandTakeover();
    case Command::HEALTH:
      return commandHealth();
    case Command::RUN:
      break;
    }

    auto &logger = LogManager::getInstance();
    logger.Info("{} {} starting", BridgeConst::SERVICE_NAME,
                BridgeConst::VERSION);
    const std::string config_dir =
        ConfigManager::getInstance().getConfigDirectory();
    logger.Info("Settings directory: {}",
                config_dir.empty() ? std::string("(none)") : config_dir);
    for (const auto &file : ConfigManager::getInstance().getLoadedFiles()) {
      logger.Debug("Settings file loaded: {}", file);
    }
    return runBridge();
  } catch (const std::exception &e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return 1;
  }
}
