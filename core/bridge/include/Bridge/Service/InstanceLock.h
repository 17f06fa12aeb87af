/**
 * @file InstanceLock.h
 * @brief Lock file enforcing one bridge per host - NemoBridge::Bridge::Service
 */

#ifndef BRIDGE_SERVICE_INSTANCE_LOCK_H
#define BRIDGE_SERVICE_INSTANCE_LOCK_H

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace NemoBridge {
namespace Bridge {
namespace Service {

using json = nlohmann::json;

/**
 * @brief Parsed lock record
 */
struct LockStatus {
  bool present = false;  // file exists
  bool readable = false; // record parsed
  int64_t pid = 0;
  int64_t acquired_at = 0; // epoch seconds, 0 when not recorded
  bool alive = false;      // pid names a running process

  bool isStale() const { return present && !alive; }
  json toJson() const;
};

/**
 * @brief Ownership of an acquired lock.
 * @details Keeps the lock file descriptor open with its exclusive flock for
 * as long as the handle lives. Releasing removes the record only if it
 * still names the owning process, then closes the descriptor.
 */
class LockHandle {
public:
  LockHandle(std::string path, int64_t owner_pid, int fd);
  ~LockHandle();

  LockHandle(const LockHandle &) = delete;
  LockHandle &operator=(const LockHandle &) = delete;

  void release();
  bool isHeld() const { return held_; }
  const std::string &path() const { return path_; }
  int64_t ownerPid() const { return owner_pid_; }

private:
  std::string path_;
  int64_t owner_pid_;
  int fd_;
  bool held_ = true;
};

/**
 * @brief "<pid> <epoch-seconds>" lock file guarded by flock(2).
 *
 * acquire() opens or creates the file and takes a non-blocking exclusive
 * flock. A held flock, or a record naming another live process, raises
 * AlreadyRunningError. The kernel drops the flock of a crashed holder, so a
 * stale, empty or unreadable record is reclaimed by rewriting it in place
 * through the locked descriptor.
 */
class InstanceLock {
public:
  explicit InstanceLock(std::string path);

  /**
   * @throws AlreadyRunningError when a live process holds the lock
   * @throws LockError on filesystem errors
   */
  std::unique_ptr<LockHandle> acquire();

  LockStatus inspect() const;

  /**
   * @brief Removes a stale record.
   * @return true when a record was removed, false when there was none
   * @throws AlreadyRunningError when the holder is alive
   */
  bool reclaimStale();

  const std::string &path() const { return path_; }

  static LockStatus readRecord(const std::string &path);

private:
  // Opens the lock file and takes the flock. -1 when the file vanished.
  int openLocked(int flags) const;
  std::string formatRecord(int64_t pid) const;

  std::string path_;
};

} // namespace Service
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_SERVICE_INSTANCE_LOCK_H
