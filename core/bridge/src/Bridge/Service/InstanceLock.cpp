/**
 * @file InstanceLock.cpp
 * @brief Lock file enforcing one bridge per host
 */

#include "Bridge/Service/InstanceLock.h"
#include "Bridge/BridgeErrors.h"
#include "Logging/LogManager.h"
#include "Platform/ProcessUtils.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace NemoBridge {
namespace Bridge {
namespace Service {

namespace {

const std::string LOG_CATEGORY = "lock";
const int MAX_ACQUIRE_ROUNDS = 3;

int64_t nowEpochSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void writeAll(int fd, const std::string &data, const std::string &path) {
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw LockError("write " + path + ": " + std::strerror(errno));
    }
    written += static_cast<size_t>(n);
  }
}

} // namespace

// =============================================================================
// LockStatus
// =============================================================================

json LockStatus::toJson() const {
  return json{{"present", present},
              {"readable", readable},
              {"pid", pid},
              {"acquired_at", acquired_at},
              {"alive", alive}};
}

// =============================================================================
// LockHandle
// =============================================================================

LockHandle::LockHandle(std::string path, int64_t owner_pid, int fd)
    : path_(std::move(path)), owner_pid_(owner_pid), fd_(fd) {}

LockHandle::~LockHandle() { release(); }

void LockHandle::release() {
  if (!held_)
    return;
  held_ = false;

  // the record is removed while the flock is still held
  LockStatus status = InstanceLock::readRecord(path_);
  if (status.present && status.readable && status.pid != owner_pid_) {
    LogManager::getInstance().log(LOG_CATEGORY, LogLevel::WARN,
                                  "Lock " + path_ + " now held by pid " +
                                      std::to_string(status.pid) +
                                      ", leaving it in place");
  } else if (status.present && ::unlink(path_.c_str()) != 0 &&
             errno != ENOENT) {
    LogManager::getInstance().log(LOG_CATEGORY, LogLevel::WARN,
                                  "Failed to remove lock " + path_ + ": " +
                                      std::strerror(errno));
  } else {
    LogManager::getInstance().log(LOG_CATEGORY, LogLevel::INFO,
                                  "Instance lock released: " + path_);
  }

  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

// =============================================================================
// InstanceLock
// =============================================================================

InstanceLock::InstanceLock(std::string path) : path_(std::move(path)) {}

LockStatus InstanceLock::readRecord(const std::string &path) {
  LockStatus status;

  std::ifstream file(path);
  if (!file.is_open()) {
    struct stat st;
    status.present = (::stat(path.c_str(), &st) == 0);
    return status;
  }
  status.present = true;

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  std::istringstream iss(content);
  int64_t pid = 0;
  if (!(iss >> pid) || pid <= 0) {
    return status;
  }

  status.readable = true;
  status.pid = pid;
  int64_t acquired_at = 0;
  if (iss >> acquired_at) {
    status.acquired_at = acquired_at;
  }
  status.alive = Platform::Process::IsAlive(pid);
  return status;
}

LockStatus InstanceLock::inspect() const { return readRecord(path_); }

std::string InstanceLock::formatRecord(int64_t pid) const {
  return std::to_string(pid) + " " + std::to_string(nowEpochSeconds()) + "\n";
}

int InstanceLock::openLocked(int flags) const {
  for (int round = 0; round < MAX_ACQUIRE_ROUNDS; ++round) {
    int fd = ::open(path_.c_str(), flags | O_CLOEXEC, 0644);
    if (fd < 0) {
      if (errno == ENOENT && !(flags & O_CREAT)) {
        return -1;
      }
      throw LockError("open " + path_ + ": " + std::strerror(errno));
    }

    while (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
      if (errno == EINTR)
        continue;
      int err = errno;
      ::close(fd);
      if (err == EWOULDBLOCK) {
        throw AlreadyRunningError(path_, readRecord(path_).pid);
      }
      throw LockError("flock " + path_ + ": " + std::strerror(err));
    }

    // the previous holder may have unlinked the file before we locked it
    struct stat held;
    struct stat current;
    if (::fstat(fd, &held) == 0 && ::stat(path_.c_str(), &current) == 0 &&
        held.st_dev == current.st_dev && held.st_ino == current.st_ino) {
      return fd;
    }
    ::close(fd);
    if (!(flags & O_CREAT) && !readRecord(path_).present) {
      return -1;
    }
  }

  throw LockError("could not acquire " + path_ + " after " +
                  std::to_string(MAX_ACQUIRE_ROUNDS) + " attempts");
}

std::unique_ptr<LockHandle> InstanceLock::acquire() {
  const int64_t my_pid = Platform::Process::GetCurrentProcessId();

  int fd = openLocked(O_RDWR | O_CREAT);

  // a record naming another live process counts as held even without flock
  LockStatus status = inspect();
  if (status.alive && status.pid != my_pid) {
    ::close(fd);
    throw AlreadyRunningError(path_, status.pid);
  }

  struct stat st;
  if (::fstat(fd, &st) == 0 && st.st_size > 0) {
    LogManager::getInstance().logEvent(
        LOG_CATEGORY, LogLevel::WARN, "lock_reclaimed",
        {{"path", path_},
         {"stale_pid", status.readable ? std::to_string(status.pid)
                                       : std::string("unreadable")},
         {"pid", std::to_string(my_pid)}});
  }

  try {
    if (::ftruncate(fd, 0) != 0) {
      throw LockError("truncate " + path_ + ": " + std::strerror(errno));
    }
    writeAll(fd, formatRecord(my_pid), path_);
  } catch (const LockError &) {
    ::unlink(path_.c_str());
    ::close(fd);
    throw;
  }
  ::fsync(fd);

  LogManager::getInstance().logEvent(LOG_CATEGORY, LogLevel::INFO,
                                     "lock_acquired",
                                     {{"path", path_},
                                      {"pid", std::to_string(my_pid)}});
  return std::make_unique<LockHandle>(path_, my_pid, fd);
}

bool InstanceLock::reclaimStale() {
  int fd = openLocked(O_RDWR);
  if (fd < 0) {
    return false;
  }

  LockStatus status = inspect();
  if (status.alive) {
    ::close(fd);
    throw AlreadyRunningError(path_, status.pid);
  }
  if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
    int err = errno;
    ::close(fd);
    throw LockError("remove " + path_ + ": " + std::strerror(err));
  }
  ::close(fd);
  LogManager::getInstance().log(LOG_CATEGORY, LogLevel::INFO,
                                "Stale lock removed: " + path_);
  return true;
}

} // namespace Service
} // namespace Bridge
} // namespace NemoBridge
