/**
 * @file ProcessUtils.cpp
 * @brief Process identity and liveness helpers (POSIX)
 */

#include "Platform/ProcessUtils.h"

#include <cerrno>
#include <csignal>
#include <limits>
#include <sys/types.h>
#include <unistd.h>

namespace NemoBridge {
namespace Platform {

uint32_t Process::GetCurrentProcessId() {
  return static_cast<uint32_t>(getpid());
}

std::string Process::GetHostName() {
  char hostname[256];
  hostname[sizeof(hostname) - 1] = '\0';
  if (gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0') {
    return "unknown-host";
  }
  return std::string(hostname);
}

bool Process::IsAlive(int64_t pid) {
  if (pid <= 0 || pid > std::numeric_limits<pid_t>::max())
    return false;

  if (kill(static_cast<pid_t>(pid), 0) == 0)
    return true;
  return errno == EPERM;
}

bool Process::Terminate(int64_t pid) {
  if (pid <= 0 || pid > std::numeric_limits<pid_t>::max())
    return false;
  return kill(static_cast<pid_t>(pid), SIGTERM) == 0;
}

} // namespace Platform
} // namespace NemoBridge
