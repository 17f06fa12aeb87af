/**
 * @file ProcessUtils.h
 * @brief Process identity and liveness helpers (POSIX)
 */

#ifndef PLATFORM_PROCESS_UTILS_H
#define PLATFORM_PROCESS_UTILS_H

#include <cstdint>
#include <string>

namespace NemoBridge {
namespace Platform {

class Process {
public:
  static uint32_t GetCurrentProcessId();

  /**
   * @brief Host name, or "unknown-host" when it cannot be read
   */
  static std::string GetHostName();

  /**
   * @brief True if a process with this pid exists.
   * @details Uses kill(pid, 0); EPERM means the process exists but belongs
   * to another user, which still counts as alive.
   */
  static bool IsAlive(int64_t pid);

  /**
   * @brief Sends SIGTERM
   * @return true when the signal was delivered
   */
  static bool Terminate(int64_t pid);
};

} // namespace Platform
} // namespace NemoBridge

#endif // PLATFORM_PROCESS_UTILS_H
