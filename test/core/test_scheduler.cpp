#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include "core/CommandRunner.hpp"
#include "core/Scheduler.hpp"

using namespace linetrack;

TEST(SchedulerTest, SpawnYieldsTaskResult) {
    Scheduler scheduler;
    auto fut = scheduler.spawn([] { return 42; });
    EXPECT_EQ(fut.get(), 42);
}

TEST(SchedulerTest, InTaskOnlyInsideSpawnedTasks) {
    Scheduler scheduler;
    EXPECT_FALSE(Scheduler::inTask());
    EXPECT_TRUE(scheduler.spawn([] { return Scheduler::inTask(); }).get());
}

TEST(SchedulerTest, OnlyOneTaskRunsAtATime) {
    Scheduler scheduler;
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};

    std::vector<std::future<void>> tasks;
    for (int i = 0; i < 6; ++i) {
        tasks.push_back(scheduler.spawn([&] {
            int now = ++active;
            int seen = maxActive.load();
            while (now > seen && !maxActive.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --active;
        }));
    }
    for (auto& t : tasks) t.get();
    EXPECT_EQ(maxActive.load(), 1);
}

TEST(SchedulerTest, SuspendLetsOtherTasksRun) {
    Scheduler scheduler;
    std::promise<void> released;
    auto releasedFuture = released.get_future();

    // The waiter holds the run token until it suspends; the releaser can only
    // run once it has.
    auto waiter = scheduler.spawn([&] {
        Scheduler::suspend([&] { releasedFuture.wait(); });
        return true;
    });
    auto releaser = scheduler.spawn([&] { released.set_value(); });

    releaser.get();
    EXPECT_TRUE(waiter.get());
}

TEST(SchedulerTest, SuspendOutsideTaskJustRuns) {
    EXPECT_EQ(Scheduler::suspend([] { return 7; }), 7);
}

TEST(SchedulerTest, ProcessWaitsSuspendTheTask) {
    Scheduler scheduler;
    ProcessRunner runner;

    auto run = [&runner] {
        JobSpec spec;
        spec.command = "sh";
        spec.args = {"-c", "sleep 0.2; echo done"};
        return runner.run(spec);
    };
    auto a = scheduler.spawn(run);
    auto b = scheduler.spawn(run);
    auto ra = a.get();
    auto rb = b.get();
    ASSERT_TRUE(ra.has_value());
    ASSERT_TRUE(rb.has_value());
    EXPECT_EQ(ra.value().lines, (std::vector<std::string>{"done"}));
    EXPECT_EQ(rb.value().lines, (std::vector<std::string>{"done"}));
}
