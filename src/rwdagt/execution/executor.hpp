/**
 * @file executor.hpp
 * @brief IExecutor interface and ExecutorConfig.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/shared_state.hpp"
#include "rwdagt/execution/executable_graph.hpp"
#include "rwdagt/execution/execution_result.hpp"
#include "rwdagt/execution/ready_queue.hpp"
#include <mutex>

namespace rwdagt
{

// Forward declaration
class TaskWrapper;
using TaskWrapperPtr = std::shared_ptr<TaskWrapper>;

/**
 * @brief Options shared by every executor.
 */
struct ExecutorConfig
{
    /// Worker threads; 0 selects hardware_concurrency(). SequentialExecutor ignores it.
    size_t thread_count{1};

    /// Fill ExecutionResult::task_durations.
    bool collect_timing{false};

    /// On the first failed task, skip every task that has not started yet.
    /// When false, branches that do not depend on the failure still run.
    bool abort_on_failure{true};

    /// Make each TaskContext reject reads and writes that were not declared.
    bool validate_access{true};

    /// Dispatch order among ready tasks. SequentialExecutor always uses DeclarationOrder.
    ReadyPolicy ready_policy{ReadyPolicy::Fifo};

    /// Seeds ReadyPolicy::Random, so a shuffled run can be replayed.
    uint64_t seed{0};
};

/**
 * @brief Runs an ExecutableGraph against a caller-owned SharedState.
 *
 * @details
 * A failing task does not make execute() throw; the failure is reported in
 * the returned ExecutionResult. One executor runs one graph at a time.
 */
class IExecutor
{
public:
    virtual ~IExecutor() = default;

    virtual ExecutionResult execute(std::shared_ptr<const ExecutableGraph> graph,
                                    SharedState& state) = 0;
};

/**
 * @brief Bookkeeping common to the sequential and thread-pool executors.
 *
 * @details
 * Builds and links the TaskWrappers of a run, records completions in the
 * order they happen, raises the abort flag on failure and turns the final
 * wrapper states into an ExecutionResult. Subclasses own dispatching.
 *
 * Must be held by a shared_ptr while executing: wrappers keep a weak_ptr
 * back to their executor.
 */
class Executor : public IExecutor, public std::enable_shared_from_this<Executor>
{
public:
    explicit Executor(ExecutorConfig config);
    virtual ~Executor() = default;

    const ExecutorConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Check whether a failure has aborted the current run.
     */
    bool abort_requested() const noexcept;

    /**
     * @brief Enqueue a task for execution.
     * @note Called by TaskWrapper when a successor becomes ready.
     */
    virtual void enqueue(TaskWrapperPtr task) = 0;

    /**
     * @brief Record a task whose body has run; abort the run on failure if configured.
     * @details Thread-safe. Called by TaskWrapper before it releases any
     *          successor, so completion order always respects the graph.
     */
    void record_completion(TaskWrapper* task);

    /**
     * @brief Retire a task that finished, was cancelled, or was skipped.
     * @note Called by TaskWrapper at the end of run(), after its successors
     *       have been enqueued.
     */
    virtual void notify_completion(TaskWrapper* task) = 0;

protected:
    /**
     * @brief Create TaskWrappers for all tasks in the graph.
     * @return Vector of TaskWrappers indexed by TaskIdx.
     */
    std::vector<TaskWrapperPtr> create_task_wrappers(
        const ExecutableGraph& graph,
        SharedState& state);

    /**
     * @brief Wire up successor relationships between TaskWrappers.
     */
    void wire_successors(
        std::vector<TaskWrapperPtr>& wrappers,
        const ExecutableGraph& graph);

    /**
     * @brief Clear the abort flag and completion records before a run.
     */
    void reset_run_state();

    /**
     * @brief Build the ExecutionResult from the final task states.
     */
    ExecutionResult build_result(
        const ExecutableGraph& graph,
        const std::vector<TaskWrapperPtr>& wrappers,
        std::chrono::steady_clock::time_point start_time);

    ExecutorConfig m_config;
    std::atomic<bool> m_abort_requested{false};

private:
    std::mutex m_record_mutex;
    std::vector<TaskIdx> m_completion_order;
    TaskIdx m_first_failure{npos_idx};
};

} // namespace rwdagt
