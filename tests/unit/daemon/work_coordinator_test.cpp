#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

#include <boost/asio/post.hpp>
#include <engram/daemon/components/WorkCoordinator.h>

using namespace engram::daemon;
using namespace std::chrono_literals;

TEST(WorkCoordinatorTest, ConstructWithoutStarting) {
    WorkCoordinator coordinator("idle");
    EXPECT_FALSE(coordinator.isRunning());
    EXPECT_EQ(coordinator.getWorkerCount(), 0u);
    EXPECT_EQ(coordinator.name(), "idle");

    // Stop and join without start are no-ops
    coordinator.stop();
    coordinator.join();
    EXPECT_FALSE(coordinator.isRunning());
}

TEST(WorkCoordinatorTest, StartStopLifecycle) {
    WorkCoordinator coordinator;
    coordinator.start(2);
    EXPECT_TRUE(coordinator.isRunning());
    EXPECT_EQ(coordinator.getWorkerCount(), 2u);

    EXPECT_THROW(coordinator.start(2), std::runtime_error);

    coordinator.stop();
    coordinator.join();
    EXPECT_FALSE(coordinator.isRunning());
    EXPECT_EQ(coordinator.getWorkerCount(), 0u);

    // Idempotent
    coordinator.stop();
    coordinator.join();
}

TEST(WorkCoordinatorTest, DefaultThreadCountUsesHardwareConcurrency) {
    WorkCoordinator coordinator;
    coordinator.start();
    EXPECT_EQ(coordinator.getWorkerCount(),
              std::max<std::size_t>(1, std::thread::hardware_concurrency()));
    coordinator.stop();
    coordinator.join();
}

TEST(WorkCoordinatorTest, RunsPostedWorkOnWorkerThreads) {
    WorkCoordinator coordinator;
    coordinator.start(4);

    constexpr int kTasks = 100;
    std::atomic<int> done{0};
    std::promise<void> all;
    auto allDone = all.get_future();
    const auto caller = std::this_thread::get_id();
    std::atomic<bool> ranOnCaller{false};
    for (int i = 0; i < kTasks; ++i) {
        coordinator.post([&]() {
            if (std::this_thread::get_id() == caller)
                ranOnCaller = true;
            if (done.fetch_add(1) + 1 == kTasks)
                all.set_value();
        });
    }
    ASSERT_EQ(allDone.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(ranOnCaller.load());

    coordinator.stop();
    coordinator.join();
}

TEST(WorkCoordinatorTest, ExecutorAcceptsWorkDirectly) {
    WorkCoordinator coordinator;
    coordinator.start(1);
    std::promise<int> value;
    auto result = value.get_future();
    boost::asio::post(coordinator.getExecutor(), [&]() { value.set_value(42); });
    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(result.get(), 42);
    coordinator.stop();
    coordinator.join();
}

TEST(WorkCoordinatorTest, DestructorStopsRunningWorkers) {
    auto coordinator = std::make_unique<WorkCoordinator>("scoped");
    coordinator->start(2);
    coordinator.reset();
    SUCCEED();
}
