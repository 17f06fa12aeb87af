/**
 * @file BridgeContext.h
 * @brief Collaborators handed to the coordinator - NemoBridge::Bridge::Service
 */

#ifndef BRIDGE_SERVICE_BRIDGE_CONTEXT_H
#define BRIDGE_SERVICE_BRIDGE_CONTEXT_H

#include "Bridge/Broker/IMqttSession.h"
#include "Bridge/Service/BridgeConfig.h"
#include "Bridge/Service/ServiceProvisioner.h"
#include "Client/RedisClient.h"

#include <memory>
#include <string>

namespace NemoBridge {
namespace Bridge {
namespace Service {

/**
 * @brief Everything the coordinator talks to. Production code fills it with
 * hiredis and Paho implementations, tests with fakes.
 */
struct BridgeContext {
  std::string lock_path;
  std::string client_session_id; // empty = nemo_bridge_<host>_<pid>

  std::unique_ptr<IConfigSource> config_source;
  std::unique_ptr<Broker::IMqttSession> mqtt_session;
  std::unique_ptr<RedisClient> queue_redis;
  std::unique_ptr<RedisClient> health_redis; // separate from the blocking pop
  std::unique_ptr<ServiceProvisioner> provisioner; // nullptr = by service_mode
};

} // namespace Service
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_SERVICE_BRIDGE_CONTEXT_H
