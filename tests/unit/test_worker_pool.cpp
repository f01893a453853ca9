/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for WorkerPool.
 */

#include "executor/worker_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace thermal_guard;

TEST(WorkerPoolTest, BasicSubmit) {
    WorkerPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(WorkerPoolTest, ConcurrentExecution) {
    WorkerPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(WorkerPoolTest, ExceptionSurfacesThroughFuture) {
    WorkerPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("sensor exploded"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives the exception.
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST(WorkerPoolTest, CallerCanWaitWithDeadline) {
    WorkerPool pool(2);
    auto slow = pool.submit([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return 1;
    });
    auto fast = pool.submit([] { return 2; });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(50);
    EXPECT_EQ(fast.wait_until(deadline), std::future_status::ready);
    EXPECT_EQ(slow.wait_until(deadline), std::future_status::timeout);
    EXPECT_EQ(slow.get(), 1);
}

TEST(WorkerPoolTest, ThreadCount) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
    EXPECT_EQ(pool.queued_count(), 0u);
}

TEST(WorkerPoolTest, BusyCountTracksRunningJob) {
    WorkerPool pool(2);
    std::promise<void> started;
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();

    auto job = pool.submit([&started, gate_future] {
        started.set_value();
        gate_future.wait();
        return 5;
    });
    started.get_future().wait();
    EXPECT_EQ(pool.busy_count(), 1u);

    gate.set_value();
    EXPECT_EQ(job.get(), 5);
}

TEST(WorkerPoolTest, DestroyWithQueuedWorkJoinsCleanly) {
    for (int round = 0; round < 50; ++round) {
        std::vector<std::future<int>> results;
        {
            WorkerPool pool(2);
            for (int i = 0; i < 8; ++i) {
                results.push_back(pool.submit([i] {
                    std::this_thread::sleep_for(std::chrono::microseconds(50));
                    return i;
                }));
            }
        }
        // Each job either ran or was dropped with its promise.
        for (size_t i = 0; i < results.size(); ++i) {
            ASSERT_EQ(results[i].wait_for(std::chrono::seconds(0)), std::future_status::ready)
                << "round " << round << " job " << i;
            try {
                EXPECT_EQ(results[i].get(), static_cast<int>(i));
            } catch (const std::future_error& e) {
                EXPECT_EQ(e.code(), std::future_errc::broken_promise);
            }
        }
    }
}
