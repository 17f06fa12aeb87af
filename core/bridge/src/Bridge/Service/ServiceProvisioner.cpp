/**
 * @file ServiceProvisioner.cpp
 * @brief Startup strategy for the bridge's backing services
 */

#include "Bridge/Service/ServiceProvisioner.h"
#include "Bridge/BridgeErrors.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <cctype>

namespace NemoBridge {
namespace Bridge {
namespace Service {

bool ExternalProvisioner::prepare(const BridgeConfig &config) {
  LogManager::getInstance().logEvent(
      "bridge", LogLevel::INFO, "services_external",
      {{"redis", config.redis_host + ":" + std::to_string(config.redis_port)},
       {"broker", config.brokerUri()}});
  return true;
}

void ExternalProvisioner::shutdown() {}

std::unique_ptr<ServiceProvisioner>
createProvisioner(const BridgeConfig &config) {
  std::string mode = config.service_mode;
  std::transform(mode.begin(), mode.end(), mode.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (mode == Defaults::SERVICE_MODE) {
    return std::make_unique<ExternalProvisioner>();
  }
  throw ConfigError("no provisioner for service mode '" + config.service_mode +
                    "'");
}

} // namespace Service
} // namespace Bridge
} // namespace NemoBridge
