/**
 * @file test_instance_lock.cpp
 * @brief Unit test for InstanceLock
 */

#include <gtest/gtest.h>

#include "Bridge/BridgeErrors.h"
#include "Bridge/Service/InstanceLock.h"
#include "BridgeTestDoubles.h"
#include "Logging/LogManager.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <new>
#include <sys/mman.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace NemoBridge::Bridge;
using namespace NemoBridge::Bridge::Service;

namespace {

// Counters shared between forked contenders
struct ContentionBoard {
  std::atomic<int> ready{0};
  std::atomic<int> holders{0};
  std::atomic<int> max_holders{0};
  std::atomic<int> acquired{0};
  std::atomic<int> refused{0};
  std::atomic<int> failed{0};
};

void contend(ContentionBoard *board, const std::string &path, int contenders) {
  board->ready.fetch_add(1);
  while (board->ready.load() < contenders) {
  }

  try {
    auto handle = InstanceLock(path).acquire();
    int now = board->holders.fetch_add(1) + 1;
    int seen = board->max_holders.load();
    while (now > seen && !board->max_holders.compare_exchange_weak(seen, now)) {
    }
    board->acquired.fetch_add(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    board->holders.fetch_sub(1);
    handle->release();
  } catch (const AlreadyRunningError &) {
    board->refused.fetch_add(1);
  } catch (const LockError &) {
    board->failed.fetch_add(1);
  }
}

struct ContentionResult {
  int acquired = 0;
  int refused = 0;
  int failed = 0;
  int max_holders = 0;
};

} // namespace

class InstanceLockTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogManager::getInstance().setLogLevel(LogLevel::DEBUG);
    path_ = NemoBridge::Testing::tempLockPath(
        ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::remove(path_.c_str());
  }

  void TearDown() override { std::remove(path_.c_str()); }

  void writeLock(const std::string &content) {
    std::ofstream out(path_, std::ios::trunc);
    out << content;
  }

  std::string readLock() {
    std::ifstream in(path_);
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
  }

  // Forks contenders that race acquire() on path_ and collects their
  // outcomes once all have exited
  ContentionResult runContention(int contenders) {
    void *mem = ::mmap(nullptr, sizeof(ContentionBoard),
                       PROT_READ | PROT_WRITE, MAP_SHARED | MAP_ANONYMOUS, -1,
                       0);
    if (mem == MAP_FAILED) {
      ADD_FAILURE() << "mmap failed";
      return ContentionResult();
    }
    auto *board = new (mem) ContentionBoard();

    std::vector<pid_t> children;
    for (int i = 0; i < contenders; ++i) {
      pid_t child = ::fork();
      if (child == 0) {
        contend(board, path_, contenders);
        ::_exit(0);
      }
      EXPECT_GT(child, 0);
      children.push_back(child);
    }
    for (pid_t child : children) {
      int wstatus = 0;
      ::waitpid(child, &wstatus, 0);
      EXPECT_TRUE(WIFEXITED(wstatus));
    }

    ContentionResult result;
    result.acquired = board->acquired.load();
    result.refused = board->refused.load();
    result.failed = board->failed.load();
    result.max_holders = board->max_holders.load();
    board->~ContentionBoard();
    ::munmap(mem, sizeof(ContentionBoard));
    return result;
  }

  std::string path_;
};

TEST_F(InstanceLockTest, InspectWithoutLockFile) {
  LockStatus status = InstanceLock(path_).inspect();
  EXPECT_FALSE(status.present);
  EXPECT_FALSE(status.alive);
}

TEST_F(InstanceLockTest, AcquireWritesPidAndTimestamp) {
  InstanceLock lock(path_);
  auto handle = lock.acquire();
  ASSERT_TRUE(handle);
  EXPECT_TRUE(handle->isHeld());

  LockStatus status = lock.inspect();
  EXPECT_TRUE(status.present);
  EXPECT_TRUE(status.readable);
  EXPECT_TRUE(status.alive);
  EXPECT_EQ(status.pid, static_cast<int64_t>(::getpid()));
  EXPECT_GT(status.acquired_at, 0);
}

TEST_F(InstanceLockTest, LiveHolderFailsFast) {
  // the test runner's parent is alive for the duration of the test
  const int64_t holder = ::getppid();
  writeLock(std::to_string(holder) + " 1700000000\n");

  InstanceLock lock(path_);
  try {
    lock.acquire();
    FAIL() << "expected AlreadyRunningError";
  } catch (const AlreadyRunningError &e) {
    EXPECT_EQ(e.holderPid(), holder);
  }
  EXPECT_EQ(readLock(), std::to_string(holder) + " 1700000000\n");
}

TEST_F(InstanceLockTest, StaleLockIsReclaimed) {
  writeLock("999999 1700000000\n");

  InstanceLock lock(path_);
  EXPECT_TRUE(lock.inspect().isStale());

  auto handle = lock.acquire();
  ASSERT_TRUE(handle);
  LockStatus status = lock.inspect();
  EXPECT_EQ(status.pid, static_cast<int64_t>(::getpid()));
  EXPECT_TRUE(status.alive);
}

TEST_F(InstanceLockTest, EmptyOrGarbageLockIsReclaimed) {
  for (const std::string content : {"", "not-a-pid", "-5 12"}) {
    writeLock(content);
    InstanceLock lock(path_);
    LockStatus before = lock.inspect();
    EXPECT_TRUE(before.present);
    EXPECT_FALSE(before.readable) << content;

    auto handle = lock.acquire();
    EXPECT_EQ(lock.inspect().pid, static_cast<int64_t>(::getpid()));
    handle->release();
  }
}

TEST_F(InstanceLockTest, ReleaseRemovesOwnRecord) {
  InstanceLock lock(path_);
  {
    auto handle = lock.acquire();
    EXPECT_TRUE(lock.inspect().present);
  }
  EXPECT_FALSE(lock.inspect().present);
}

TEST_F(InstanceLockTest, ReleaseLeavesForeignRecord) {
  InstanceLock lock(path_);
  auto handle = lock.acquire();
  writeLock("999999 1700000000\n");

  handle->release();
  EXPECT_FALSE(handle->isHeld());
  EXPECT_EQ(readLock(), "999999 1700000000\n");
}

TEST_F(InstanceLockTest, ReclaimStale) {
  InstanceLock lock(path_);
  EXPECT_FALSE(lock.reclaimStale());

  writeLock("999999 1700000000\n");
  EXPECT_TRUE(lock.reclaimStale());
  EXPECT_FALSE(lock.inspect().present);

  writeLock(std::to_string(::getppid()) + "\n");
  EXPECT_THROW(lock.reclaimStale(), AlreadyRunningError);
  EXPECT_TRUE(lock.inspect().present);
}

TEST_F(InstanceLockTest, PidOnlyRecordIsReadable) {
  writeLock(std::to_string(::getppid()));
  LockStatus status = InstanceLock(path_).inspect();
  EXPECT_TRUE(status.readable);
  EXPECT_TRUE(status.alive);
  EXPECT_EQ(status.acquired_at, 0);
}

TEST_F(InstanceLockTest, ConcurrentReclaimOfStaleLockHasOneHolder) {
  const int contenders = 4;
  for (int trial = 0; trial < 20; ++trial) {
    writeLock("999999 1\n");
    ContentionResult result = runContention(contenders);

    EXPECT_EQ(result.max_holders, 1) << "trial " << trial;
    EXPECT_GE(result.acquired, 1) << "trial " << trial;
    EXPECT_EQ(result.failed, 0) << "trial " << trial;
    EXPECT_EQ(result.acquired + result.refused, contenders);
    EXPECT_FALSE(InstanceLock(path_).inspect().present);
  }
}

TEST_F(InstanceLockTest, ConcurrentCreateHasOneHolder) {
  const int contenders = 4;
  for (int trial = 0; trial < 20; ++trial) {
    std::remove(path_.c_str());
    ContentionResult result = runContention(contenders);

    EXPECT_EQ(result.max_holders, 1) << "trial " << trial;
    EXPECT_GE(result.acquired, 1) << "trial " << trial;
    EXPECT_EQ(result.failed, 0) << "trial " << trial;
    EXPECT_EQ(result.acquired + result.refused, contenders);
  }
}

TEST_F(InstanceLockTest, HeldFlockRefusesSecondAcquire) {
  InstanceLock lock(path_);
  auto handle = lock.acquire();

  pid_t child = ::fork();
  if (child == 0) {
    int code = 1;
    try {
      InstanceLock(path_).acquire();
    } catch (const AlreadyRunningError &e) {
      code = (e.holderPid() == static_cast<int64_t>(::getppid())) ? 0 : 2;
    } catch (const LockError &) {
      code = 3;
    }
    ::_exit(code);
  }
  ASSERT_GT(child, 0);
  int wstatus = 0;
  ::waitpid(child, &wstatus, 0);
  ASSERT_TRUE(WIFEXITED(wstatus));
  EXPECT_EQ(WEXITSTATUS(wstatus), 0);
  EXPECT_EQ(lock.inspect().pid, static_cast<int64_t>(::getpid()));
}

TEST_F(InstanceLockTest, ReclaimStaleRefusesHeldFlock) {
  InstanceLock lock(path_);
  auto handle = lock.acquire();

  pid_t child = ::fork();
  if (child == 0) {
    int code = 1;
    try {
      InstanceLock(path_).reclaimStale();
    } catch (const AlreadyRunningError &) {
      code = 0;
    } catch (const LockError &) {
      code = 3;
    }
    ::_exit(code);
  }
  ASSERT_GT(child, 0);
  int wstatus = 0;
  ::waitpid(child, &wstatus, 0);
  ASSERT_TRUE(WIFEXITED(wstatus));
  EXPECT_EQ(WEXITSTATUS(wstatus), 0);
  EXPECT_TRUE(lock.inspect().present);
}
