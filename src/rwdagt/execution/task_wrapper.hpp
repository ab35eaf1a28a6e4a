/**
 * @file task_wrapper.hpp
 * @brief Per-run bookkeeping for one task: state, readiness and timing.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/graph_core_enums.hpp"
#include "rwdagt/common/shared_state.hpp"
#include "rwdagt/common/task_spec.hpp"

namespace rwdagt
{

class Executor;
class TaskWrapper;

using TaskWrapperPtr = std::shared_ptr<TaskWrapper>;
using TaskWrapperWeakPtr = std::weak_ptr<TaskWrapper>;

/**
 * @brief One task of an executing graph.
 *
 * @details
 * A wrapper counts down the predecessors it still waits on. The last
 * predecessor to succeed moves it to Ready, queues it and hands it to the
 * executor, so no central scheduler has to scan the graph. A failed or
 * cancelled task never counts down its successors; they stay NotReady and
 * are reported as cancelled when the run ends.
 *
 * @par Ownership
 * - The executor owns the wrappers of a run; wrappers see each other and the
 *   executor through weak_ptr only.
 * - The SharedState belongs to the caller and must outlive the run.
 *
 * @par Thread safety
 * - State and the countdown are atomic; any thread may count down.
 * - The successor list is fixed before the first task runs.
 * - The exception and duration are written by the running thread and read
 *   only after the executor has retired the task.
 */
class TaskWrapper : public std::enable_shared_from_this<TaskWrapper>
{
public:
    TaskWrapper(
        TaskSpecPtr task,
        TaskIdx task_idx,
        SharedState& state,
        bool validate_access,
        size_t predecessor_count,
        std::weak_ptr<Executor> executor
    );

    TaskWrapper(const TaskWrapper&) = delete;
    TaskWrapper(TaskWrapper&&) = delete;
    TaskWrapper& operator=(const TaskWrapper&) = delete;
    TaskWrapper& operator=(TaskWrapper&&) = delete;

    /// Setup only; must precede the first run() of the graph.
    void add_successor(TaskWrapperWeakPtr successor);

    /**
     * @brief Run the task body on the calling thread.
     *
     * @details
     * Skips the body when the executor has aborted or the task is no longer
     * Queued. Exceptions from the body mark the task Failed. The executor
     * records the outcome before any successor is released, and successors
     * made ready by a success are enqueued before the executor is told that
     * this task has finished.
     *
     * @throws std::logic_error if the executor is gone.
     */
    void run();

    TaskState state() const noexcept
    {
        return m_state.load(std::memory_order_acquire);
    }

    bool is_ready() const noexcept
    {
        return m_waiting_on.load(std::memory_order_acquire) == 0;
    }

    /**
     * @brief Count down one finished predecessor.
     * @return True for the call that released the last one.
     */
    bool decrement_predecessor_count();

    /// Ready -> Queued. False from any other state.
    bool mark_queued();

    /**
     * @brief Move a task that has not started to Cancelled.
     * @return False if the task was already executing or finished.
     */
    bool cancel();

    std::exception_ptr exception() const noexcept { return m_exception; }

    /// True when the body failed with an UndeclaredAccessError.
    bool failed_on_undeclared_access() const noexcept { return m_undeclared_access; }

    /// Zero unless the body ran.
    std::chrono::nanoseconds duration() const noexcept { return m_duration; }

    const TaskSpecPtr& task() const noexcept { return m_task; }
    TaskIdx task_idx() const noexcept { return m_task_idx; }

private:
    bool begin_execution(const Executor& executor);
    void execute_body();
    std::vector<TaskWrapperPtr> release_successors();

    const TaskSpecPtr m_task;
    const TaskIdx m_task_idx;
    SharedState& m_shared_state;
    const bool m_validate_access;
    const std::weak_ptr<Executor> m_executor;
    std::vector<TaskWrapperWeakPtr> m_successors;

    std::atomic<TaskState> m_state;
    std::atomic<size_t> m_waiting_on;

    std::exception_ptr m_exception{};
    bool m_undeclared_access{false};
    std::chrono::nanoseconds m_duration{0};
};

} // namespace rwdagt
