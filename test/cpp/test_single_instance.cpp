#include <frogworks/error_types.h>
#include <frogworks/single_instance.h>
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

using namespace frogworks;
using frogworks_test::unique_lock_name;

TEST(InstanceLockTest, FirstAcquireHoldsTheLock) {
    std::string name = unique_lock_name("first");
    auto lock = InstanceLock::acquire(name);
    ASSERT_NE(lock, nullptr);
    EXPECT_TRUE(lock->is_held());
    EXPECT_EQ(lock->name(), name);
    EXPECT_NE(lock->path().find(name), std::string::npos);
}

TEST(InstanceLockTest, SecondAcquireReportsAlreadyHeld) {
    std::string name = unique_lock_name("second");
    auto first = InstanceLock::acquire(name);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(InstanceLock::acquire(name), nullptr);
}

TEST(InstanceLockTest, DestroyingTheHandleReleasesTheLock) {
    std::string name = unique_lock_name("release");
    auto first = InstanceLock::acquire(name);
    ASSERT_NE(first, nullptr);
    first.reset();
    EXPECT_NE(InstanceLock::acquire(name), nullptr);
}

TEST(InstanceLockTest, DifferentNamesDoNotConflict) {
    auto a = InstanceLock::acquire(unique_lock_name("a"));
    auto b = InstanceLock::acquire(unique_lock_name("b"));
    EXPECT_NE(a, nullptr);
    EXPECT_NE(b, nullptr);
}

TEST(InstanceLockTest, ConcurrentAcquireHasExactlyOneWinner) {
    std::string name = unique_lock_name("race");
    const int contenders = 16;
    std::vector<std::unique_ptr<InstanceLock>> results(contenders);
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < contenders; ++i) {
        threads.emplace_back([&, i]() {
            while (!go) std::this_thread::yield();
            results[i] = InstanceLock::acquire(name);
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    int winners = 0;
    for (const auto& r : results) {
        if (r) ++winners;
    }
    EXPECT_EQ(winners, 1);
}

TEST(InstanceLockTest, ExclusiveAcrossProcesses) {
    std::string name = unique_lock_name("process");
    auto held = InstanceLock::acquire(name);
    ASSERT_NE(held, nullptr);

    pid_t child = fork();
    ASSERT_NE(child, -1);
    if (child == 0) {
        auto attempt = InstanceLock::acquire(name);
        _exit(attempt ? 1 : 0);
    }

    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0) << "child process acquired a lock held by the parent";
}

TEST(InstanceLockTest, UnusableLockDirectoryIsFatal) {
    EXPECT_THROW(InstanceLock::acquire(unique_lock_name("nodir"), "/nonexistent/frogworks-lock-dir"),
                 InstanceLockException);
}
