#include "core/worker_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <thread>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

WorkerPool::WorkerPool(size_t max_workers)
    : thread_count_(effectiveThreadCount(max_workers)),
      arena_(static_cast<int>(thread_count_))
{
    Logger::info("Worker pool initialized with " + std::to_string(thread_count_) + " threads");
}

size_t WorkerPool::defaultThreadCount()
{
    size_t hardware = std::thread::hardware_concurrency();
    return std::max<size_t>(1, std::min<size_t>(4, hardware));
}

void WorkerPool::parallelFor(size_t count, const std::function<void(size_t)> &task)
{
    if (count == 0)
        return;

    arena_.execute([&]()
                   { tbb::parallel_for(tbb::blocked_range<size_t>(0, count),
                                       [&](const tbb::blocked_range<size_t> &range)
                                       {
                                           for (size_t i = range.begin(); i != range.end(); ++i)
                                           {
                                               task(i);
                                           }
                                       }); });
}

size_t WorkerPool::effectiveThreadCount(size_t max_workers)
{
    size_t thread_count = max_workers == 0 ? defaultThreadCount() : max_workers;
    if (!validateThreadCount(thread_count))
    {
        Logger::error("Invalid thread count: " + std::to_string(thread_count) + ". Using default: 4");
        return 4;
    }
    return thread_count;
}

bool WorkerPool::validateThreadCount(size_t thread_count)
{
    // Minimum: 1 thread, maximum: 64 threads
    if (thread_count < 1 || thread_count > 64)
    {
        Logger::warn("Thread count " + std::to_string(thread_count) + " is outside valid range [1-64]");
        return false;
    }
    return true;
}
