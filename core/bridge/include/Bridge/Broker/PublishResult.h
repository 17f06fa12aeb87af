/**
 * @file PublishResult.h
 * @brief Outcome of one MQTT publish - NemoBridge::Bridge::Broker
 */

#ifndef BRIDGE_BROKER_PUBLISH_RESULT_H
#define BRIDGE_BROKER_PUBLISH_RESULT_H

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace NemoBridge {
namespace Bridge {
namespace Broker {

using json = nlohmann::json;

struct PublishResult {
public:
  bool success = false;
  std::string error_message = "";
  std::string topic = "";
  size_t payload_size = 0;
  bool retain = false;
  std::chrono::milliseconds response_time{0};

  std::chrono::system_clock::time_point timestamp =
      std::chrono::system_clock::now();

  PublishResult() = default;

  json toJson() const {
    return json{{"success", success},
                {"error_message", error_message},
                {"topic", topic},
                {"payload_size", payload_size},
                {"retain", retain},
                {"response_time_ms", response_time.count()}};
  }
};

} // namespace Broker
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_BROKER_PUBLISH_RESULT_H
