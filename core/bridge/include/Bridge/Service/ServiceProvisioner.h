/**
 * @file ServiceProvisioner.h
 * @brief Startup strategy for the bridge's backing services -
 * NemoBridge::Bridge::Service
 */

#ifndef BRIDGE_SERVICE_SERVICE_PROVISIONER_H
#define BRIDGE_SERVICE_SERVICE_PROVISIONER_H

#include "Bridge/Service/BridgeConfig.h"

#include <memory>
#include <string>

namespace NemoBridge {
namespace Bridge {
namespace Service {

/**
 * @brief Makes Redis and the broker available before the bridge connects
 */
class ServiceProvisioner {
public:
  virtual ~ServiceProvisioner() = default;

  virtual bool prepare(const BridgeConfig &config) = 0;
  virtual void shutdown() = 0;
  virtual std::string name() const = 0;
};

/**
 * @brief Services are run by someone else; nothing is started or stopped
 */
class ExternalProvisioner : public ServiceProvisioner {
public:
  bool prepare(const BridgeConfig &config) override;
  void shutdown() override;
  std::string name() const override { return "external"; }
};

/**
 * @brief Provisioner for config.service_mode
 * @throws ConfigError for unsupported modes
 */
std::unique_ptr<ServiceProvisioner>
createProvisioner(const BridgeConfig &config);

} // namespace Service
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_SERVICE_SERVICE_PROVISIONER_H
