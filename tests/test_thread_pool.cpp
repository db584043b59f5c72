/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for the FIFO worker pool
 */

#include <gtest/gtest.h>

#include "core/ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

namespace lockerfetch::test {

using core::ThreadPool;

TEST(ThreadPoolTest, ReturnsResultsThroughFutures) {
    ThreadPool pool(2);
    EXPECT_EQ(pool.size(), 2u);

    auto sum = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(sum.get(), 5);
}

TEST(ThreadPoolTest, WaitAllDrainsTheQueue) {
    ThreadPool pool(3);
    std::atomic<int> done{0};
    for (int i = 0; i < 20; ++i) {
        pool.submit([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            ++done;
        });
    }

    pool.waitAll();

    EXPECT_EQ(done.load(), 20);
    EXPECT_EQ(pool.pendingJobs(), 0u);
    EXPECT_EQ(pool.activeJobs(), 0u);
}

TEST(ThreadPoolTest, SingleWorkerRunsJobsInOrder) {
    ThreadPool pool(1);
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        pool.submit([&order, i] { order.push_back(i); });
    }
    pool.waitAll();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(ThreadPoolTest, ExceptionsAreStoredInTheFuture) {
    ThreadPool pool(1);
    auto failing = pool.submit([]() -> int { throw std::runtime_error("job failed"); });
    EXPECT_THROW(failing.get(), std::runtime_error);

    auto next = pool.submit([] { return 7; });
    EXPECT_EQ(next.get(), 7);
}

TEST(ThreadPoolTest, ShutdownFinishesQueuedJobsAndRejectsNewOnes) {
    ThreadPool pool(1);
    std::atomic<int> done{0};
    for (int i = 0; i < 5; ++i) {
        pool.submit([&done] { ++done; });
    }

    pool.shutdown();
    pool.shutdown();

    EXPECT_EQ(done.load(), 5);
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);
}

} // namespace lockerfetch::test
