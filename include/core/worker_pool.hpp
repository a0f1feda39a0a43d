#pragma once

#include <tbb/task_arena.h>
#include <cstddef>
#include <functional>

/**
 * @brief Bounded TBB pool on which per-file extraction runs
 *
 * Work submitted through parallelFor runs inside a task_arena limited to the configured
 * number of threads, so one scan never saturates the whole machine.
 */
class WorkerPool
{
public:
    /**
     * @brief Create the pool
     * @param max_workers Thread limit; 0 selects min(4, hardware threads)
     */
    explicit WorkerPool(size_t max_workers = 0);

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    /**
     * @brief Run task(i) for every i in [0, count) and wait for all of them
     *
     * Exceptions escaping a task are propagated to the caller after the loop is cancelled;
     * callers that need per-item isolation catch inside the task.
     */
    void parallelFor(size_t count, const std::function<void(size_t)> &task);

    size_t getThreadCount() const { return thread_count_; }

    static size_t defaultThreadCount();

private:
    static size_t effectiveThreadCount(size_t max_workers);
    static bool validateThreadCount(size_t thread_count);

    size_t thread_count_;
    tbb::task_arena arena_;
};
