// RangeCast - Seekable media delivery engine
// Tests for WorkerPool

#include <gtest/gtest.h>
#include "rangecast/core/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace rangecast {
namespace core {
namespace test {

class WorkerPoolTest : public ::testing::Test {
protected:
    WorkerPoolOptions options(size_t threads, size_t maxQueued) {
        WorkerPoolOptions opts;
        opts.name = "test";
        opts.threads = threads;
        opts.maxQueued = maxQueued;
        return opts;
    }
};

TEST_F(WorkerPoolTest, RunsEverySubmittedItem) {
    std::atomic<int> counter{0};
    {
        WorkerPool pool(options(4, 100));
        EXPECT_EQ(pool.threadCount(), 4u);
        for (int i = 0; i < 50; ++i) {
            ASSERT_TRUE(pool.submit([&counter]() { counter++; }).isSuccess());
        }
        pool.shutdown();
    }
    EXPECT_EQ(counter.load(), 50);
}

TEST_F(WorkerPoolTest, SingleWorkerPreservesFifoOrder) {
    std::vector<int> order;
    std::mutex orderMutex;
    WorkerPool pool(options(1, 16));

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(pool.submit([&, i]() {
            std::lock_guard<std::mutex> lock(orderMutex);
            order.push_back(i);
        }).isSuccess());
    }
    pool.shutdown();

    ASSERT_EQ(order.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(order[static_cast<size_t>(i)], i);
    }
}

TEST_F(WorkerPoolTest, RejectsWhenQueueIsFull) {
    WorkerPool pool(options(1, 1));

    std::mutex gateMutex;
    std::condition_variable gate;
    bool open = false;
    std::atomic<bool> started{false};

    ASSERT_TRUE(pool.submit([&]() {
        started = true;
        std::unique_lock<std::mutex> lock(gateMutex);
        gate.wait(lock, [&]() { return open; });
    }).isSuccess());

    while (!started.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    ASSERT_TRUE(pool.submit([]() {}).isSuccess());
    auto rejected = pool.submit([]() {});
    ASSERT_TRUE(rejected.isError());
    EXPECT_EQ(rejected.error().code, ErrorCode::ResourceExhausted);
    EXPECT_EQ(pool.queuedCount(), 1u);

    {
        std::lock_guard<std::mutex> lock(gateMutex);
        open = true;
    }
    gate.notify_all();
    pool.shutdown();
    EXPECT_EQ(pool.queuedCount(), 0u);
}

TEST_F(WorkerPoolTest, RejectsNullAndPostShutdownWork) {
    WorkerPool pool(options(1, 4));

    auto nullWork = pool.submit(WorkItem());
    ASSERT_TRUE(nullWork.isError());
    EXPECT_EQ(nullWork.error().code, ErrorCode::InvalidArgument);

    pool.shutdown();
    pool.shutdown();

    auto late = pool.submit([]() {});
    ASSERT_TRUE(late.isError());
    EXPECT_EQ(late.error().code, ErrorCode::InvalidState);
}

TEST_F(WorkerPoolTest, LowPriorityWorkersStillRun) {
    auto opts = options(2, 8);
    opts.lowPriority = true;
    std::atomic<int> counter{0};

    WorkerPool pool(opts);
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(pool.submit([&counter]() { counter++; }).isSuccess());
    }
    pool.shutdown();

    EXPECT_EQ(counter.load(), 4);
}

} // namespace test
} // namespace core
} // namespace rangecast
