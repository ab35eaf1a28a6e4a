/**
 * @file thread_pool_executor.hpp
 * @brief ThreadPoolExecutor: parallel execution on a bounded worker pool.
 */
#pragma once
#include "rwdagt/execution/executor.hpp"
#include <condition_variable>
#include <thread>

namespace rwdagt
{

/**
 * @brief Multi-threaded executor running every ready task as soon as a
 *        worker is free.
 *
 * @details
 * Each execute() starts `thread_count` workers (0 meaning the hardware
 * concurrency, capped at the number of tasks) which take task indices from a
 * shared ReadyQueue. A finishing task decrements its successors' atomic
 * predecessor counters and enqueues those that reach zero before it is
 * retired, so the pending count (queued plus executing) only reaches zero
 * when the run is over. Workers sleep on a condition variable while the queue
 * is empty and work is still pending.
 *
 * @par Ordering guarantee
 * If the graph has a path from A to B, A's execution completes before B's
 * starts. Tasks without a path between them may run in any order or
 * concurrently.
 *
 * @par Thread Safety
 * - execute() blocks the caller until all workers have joined.
 * - Do not call execute() concurrently on the same executor.
 */
class ThreadPoolExecutor : public Executor
{
public:
    explicit ThreadPoolExecutor(ExecutorConfig config = {});

    ExecutionResult execute(std::shared_ptr<const ExecutableGraph> graph,
                            SharedState& state) override;

    void enqueue(TaskWrapperPtr task) override;

    void notify_completion(TaskWrapper* task) override;

    /**
     * @brief Number of workers the last execute() used.
     */
    size_t last_worker_count() const noexcept
    {
        return m_worker_count;
    }

    /**
     * @brief Resolve a requested worker count for a graph of `task_count` tasks.
     * @return At least 1, at most max(task_count, 1).
     */
    static size_t resolve_worker_count(size_t requested, size_t task_count) noexcept;

private:
    void worker_loop(size_t worker_idx);

    std::mutex m_mutex;
    std::condition_variable m_cv;
    ReadyQueue m_ready_queue;
    size_t m_pending{0};
    std::vector<TaskWrapperPtr> m_all_tasks;
    size_t m_worker_count{0};
};

/**
 * @brief Factory function to create a ThreadPoolExecutor.
 */
inline std::shared_ptr<ThreadPoolExecutor> make_thread_pool_executor(
    ExecutorConfig config = {})
{
    return std::make_shared<ThreadPoolExecutor>(std::move(config));
}

} // namespace rwdagt
