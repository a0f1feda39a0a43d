#include <gtest/gtest.h>
#include "core/worker_pool.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

TEST(WorkerPoolTest, DefaultSizeIsAtMostFour)
{
    WorkerPool pool;
    EXPECT_GE(pool.getThreadCount(), 1u);
    EXPECT_LE(pool.getThreadCount(), 4u);
}

TEST(WorkerPoolTest, InvalidSizeFallsBackToFour)
{
    WorkerPool pool(1000);
    EXPECT_EQ(pool.getThreadCount(), 4u);
}

TEST(WorkerPoolTest, RunsEveryIndexOnce)
{
    WorkerPool pool(3);
    std::vector<std::atomic<int>> hits(500);
    pool.parallelFor(hits.size(), [&hits](size_t i)
                     { hits[i]++; });

    for (const auto &hit : hits)
        EXPECT_EQ(hit.load(), 1);
}

TEST(WorkerPoolTest, ConcurrencyIsBounded)
{
    WorkerPool pool(2);
    std::mutex mutex;
    std::set<std::thread::id> threads;
    pool.parallelFor(200, [&](size_t)
                     {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        std::lock_guard<std::mutex> lock(mutex);
        threads.insert(std::this_thread::get_id()); });

    EXPECT_LE(threads.size(), 2u);
}

TEST(WorkerPoolTest, ZeroItemsIsNoOp)
{
    WorkerPool pool(2);
    bool called = false;
    pool.parallelFor(0, [&called](size_t)
                     { called = true; });
    EXPECT_FALSE(called);
}
