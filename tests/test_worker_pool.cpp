#include <gtest/gtest.h>
#include "txlog_worker_pool.hpp"
#include <atomic>
#include <stdexcept>
#include <vector>

using namespace txlog;

TEST(WorkerThreadPoolTest, RunsAllTasks) {
    WorkerThreadPool pool(4);
    EXPECT_EQ(pool.size(), 4u);

    std::atomic<int> counter{0};
    std::vector<std::future<int>> results;
    for (int i = 0; i < 100; ++i) {
        results.push_back(pool.submit([&counter, i]() {
            counter.fetch_add(1);
            return i * 2;
        }));
    }
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(results[i].get(), i * 2);
    }
    EXPECT_EQ(counter.load(), 100);
}

TEST(WorkerThreadPoolTest, ZeroThreadsMeansOne) {
    WorkerThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}

TEST(WorkerThreadPoolTest, ExceptionTravelsThroughFuture) {
    WorkerThreadPool pool(1);
    auto result = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(result.get(), std::runtime_error);

    // 线程仍然可用
    EXPECT_EQ(pool.submit([]() { return 1; }).get(), 1);
}

TEST(WorkerThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    WorkerThreadPool pool(1);
    pool.enqueue([]() { throw std::runtime_error("ignored"); });
    EXPECT_EQ(pool.submit([]() { return 2; }).get(), 2);
}

TEST(WorkerThreadPoolTest, StopDrainsQueueAndRejectsNewTasks) {
    WorkerThreadPool pool(2);
    std::atomic<int> counter{0};
    for (int i = 0; i < 50; ++i) {
        pool.enqueue([&counter]() { counter.fetch_add(1); });
    }
    pool.stop();
    EXPECT_EQ(counter.load(), 50);
    EXPECT_THROW(pool.enqueue([]() {}), std::runtime_error);

    // 重复stop没有影响
    pool.stop();
}
