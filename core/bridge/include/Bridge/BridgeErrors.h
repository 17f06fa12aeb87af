/**
 * @file BridgeErrors.h
 * @brief Exception types of the bridge - NemoBridge::Bridge
 */

#ifndef BRIDGE_BRIDGE_ERRORS_H
#define BRIDGE_BRIDGE_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace NemoBridge {
namespace Bridge {

class BridgeError : public std::runtime_error {
public:
  explicit BridgeError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Queue entry that cannot be turned into a QueueEntry
 */
class MalformedEntry : public BridgeError {
public:
  explicit MalformedEntry(const std::string &message)
      : BridgeError("malformed entry: " + message) {}
};

/**
 * @brief Another live process holds the instance lock
 */
class AlreadyRunningError : public BridgeError {
public:
  AlreadyRunningError(const std::string &lock_path, int64_t holder_pid)
      : BridgeError("bridge already running (pid " +
                    std::to_string(holder_pid) + ", lock " + lock_path + ")"),
        holder_pid_(holder_pid) {}

  int64_t holderPid() const { return holder_pid_; }

private:
  int64_t holder_pid_;
};

/**
 * @brief Lock file could not be created, read or replaced
 */
class LockError : public BridgeError {
public:
  explicit LockError(const std::string &message)
      : BridgeError("instance lock: " + message) {}
};

/**
 * @brief Invalid or unsupported configuration
 */
class ConfigError : public BridgeError {
public:
  explicit ConfigError(const std::string &message)
      : BridgeError("configuration: " + message) {}
};

} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_BRIDGE_ERRORS_H
