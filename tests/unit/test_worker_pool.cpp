/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for the fixed-size WorkerPool
 */

#include <gtest/gtest.h>
#include <storjcloud/core/worker_pool.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace storjcloud::core;
using namespace std::chrono_literals;

TEST(WorkerPoolTest, RejectsZeroThreads) {
    EXPECT_THROW(WorkerPool(0), std::invalid_argument);
}

TEST(WorkerPoolTest, ReturnsResults) {
    WorkerPool pool(4);
    EXPECT_EQ(pool.threadCount(), 4u);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(WorkerPoolTest, ExceptionsReachTheFuture) {
    WorkerPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}

TEST(WorkerPoolTest, ConcurrencyIsBounded) {
    WorkerPool pool(3);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 12; ++i) {
        futures.push_back(pool.submit([&]() {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(20ms);
            --running;
        }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 2);
}

TEST(WorkerPoolTest, ShutdownDrainsQueuedTasks) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 5; ++i) {
            pool.submit([&]() {
                std::this_thread::sleep_for(5ms);
                ++done;
            });
        }
        pool.shutdown();
        pool.shutdown();
    }
    EXPECT_EQ(done.load(), 5);
}

TEST(WorkerPoolTest, SubmitAfterShutdownThrows) {
    WorkerPool pool(2, "TestPool");
    pool.shutdown();
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);
}
