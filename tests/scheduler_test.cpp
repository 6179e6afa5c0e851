#include <gtest/gtest.h>
#include "gatesense/pipeline/CycleScheduler.h"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace gatesense;

TEST(DiscoveryMilestones, FirstRunThenEveryHundred) {
    EXPECT_FALSE(discoveryDue(49, 0, 50, 100));
    EXPECT_TRUE(discoveryDue(50, 0, 50, 100));
    EXPECT_FALSE(discoveryDue(149, 50, 50, 100));
    EXPECT_TRUE(discoveryDue(150, 50, 50, 100));
    EXPECT_TRUE(discoveryDue(400, 50, 50, 100));
}

TEST(CycleScheduler, IdenticalQueuedJobsCollapse) {
    CycleScheduler scheduler([](const std::string&, CycleKind) {}, 1);
    EXPECT_TRUE(scheduler.enqueue("S1", CycleKind::Discovery));
    EXPECT_FALSE(scheduler.enqueue("S1", CycleKind::Discovery));
    EXPECT_TRUE(scheduler.enqueue("S1", CycleKind::Enforcement));
    EXPECT_TRUE(scheduler.enqueue("S2", CycleKind::Discovery));
}

TEST(CycleScheduler, RunsQueuedJobs) {
    std::atomic<int> runs{0};
    CycleScheduler scheduler([&](const std::string&, CycleKind) { ++runs; }, 2);
    scheduler.start();
    scheduler.enqueue("S1", CycleKind::Discovery);
    scheduler.enqueue("S2", CycleKind::Discovery);
    scheduler.enqueue("S3", CycleKind::Duplicates);
    scheduler.waitIdle();
    EXPECT_EQ(runs.load(), 3);
    EXPECT_EQ(scheduler.stats().completed, 3u);
    scheduler.stop();
}

TEST(CycleScheduler, DeactivatedSessionIsNotRescheduled) {
    std::atomic<int> s1_runs{0};
    std::atomic<int> s2_runs{0};
    CycleScheduler scheduler([&](const std::string& session, CycleKind) {
        if (session == "S1") ++s1_runs; else ++s2_runs;
    }, 1);

    scheduler.enqueue("S1", CycleKind::Discovery);
    scheduler.enqueue("S2", CycleKind::Discovery);
    scheduler.deactivate("S1");
    EXPECT_TRUE(scheduler.isCancelled("S1"));
    EXPECT_FALSE(scheduler.enqueue("S1", CycleKind::Enforcement));

    scheduler.start();
    scheduler.waitIdle();
    EXPECT_EQ(s1_runs.load(), 0);
    EXPECT_EQ(s2_runs.load(), 1);
    EXPECT_EQ(scheduler.stats().dropped_inactive, 1u);

    scheduler.reactivate("S1");
    EXPECT_TRUE(scheduler.enqueue("S1", CycleKind::Enforcement));
    scheduler.waitIdle();
    EXPECT_EQ(s1_runs.load(), 1);
    scheduler.stop();
}

TEST(CycleScheduler, BusySessionSkipsSecondCycle) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> discovery_started{false};
    std::atomic<int> enforcement_runs{0};

    CycleScheduler scheduler([&](const std::string&, CycleKind kind) {
        if (kind == CycleKind::Discovery) {
            discovery_started = true;
            gate.wait();
        } else {
            ++enforcement_runs;
        }
    }, 2);
    scheduler.start();
    scheduler.enqueue("S1", CycleKind::Discovery);
    while (!discovery_started) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    scheduler.enqueue("S1", CycleKind::Enforcement);
    for (int i = 0; i < 2000 && scheduler.stats().skipped_busy == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    release.set_value();
    scheduler.waitIdle();

    EXPECT_EQ(scheduler.stats().skipped_busy, 1u);
    EXPECT_EQ(enforcement_runs.load(), 0);
    scheduler.stop();
}

TEST(CycleScheduler, FailureIsIsolatedPerSession) {
    std::atomic<int> good_runs{0};
    std::string failed_session;
    std::string failure;
    std::mutex failure_mutex;

    CycleScheduler scheduler(
        [&](const std::string& session, CycleKind) {
            if (session == "bad") throw std::runtime_error("store unavailable");
            ++good_runs;
        },
        2,
        [&](const std::string& session, CycleKind, const std::string& what) {
            std::lock_guard<std::mutex> lock(failure_mutex);
            failed_session = session;
            failure = what;
        });
    scheduler.start();
    scheduler.enqueue("bad", CycleKind::Enforcement);
    scheduler.enqueue("good", CycleKind::Enforcement);
    scheduler.waitIdle();

    EXPECT_EQ(good_runs.load(), 1);
    EXPECT_EQ(scheduler.stats().failed, 1u);
    std::lock_guard<std::mutex> lock(failure_mutex);
    EXPECT_EQ(failed_session, "bad");
    EXPECT_EQ(failure, "store unavailable");
    scheduler.stop();
}
