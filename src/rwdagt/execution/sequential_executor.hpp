/**
 * @file sequential_executor.hpp
 * @brief SequentialExecutor for reference, single-threaded execution.
 */
#pragma once
#include "rwdagt/execution/executor.hpp"

namespace rwdagt
{

/**
 * @brief Single-threaded executor defining the reference semantics.
 *
 * @details
 * Executes tasks one at a time on the calling thread, in the stable
 * topological order of the graph: among ready tasks, the one declared first
 * runs next. The schedule is identical on every run, which makes this executor
 * the ground truth for determinism checks and the baseline for performance
 * measurement.
 *
 * @par Thread Safety
 * - execute() is not thread-safe; call from one thread only.
 */
class SequentialExecutor : public Executor
{
public:
    /**
     * @brief Construct a sequential executor.
     * @param config Configuration (thread_count and ready_policy ignored).
     */
    explicit SequentialExecutor(ExecutorConfig config = {});

    ExecutionResult execute(std::shared_ptr<const ExecutableGraph> graph,
                            SharedState& state) override;

    void enqueue(TaskWrapperPtr task) override;

    void notify_completion(TaskWrapper* task) override;

private:
    ReadyQueue m_ready_queue{ReadyPolicy::DeclarationOrder};
    std::vector<TaskWrapperPtr> m_all_tasks;
};

/**
 * @brief Factory function to create a SequentialExecutor.
 */
inline std::shared_ptr<SequentialExecutor> make_sequential_executor(
    ExecutorConfig config = {})
{
    return std::make_shared<SequentialExecutor>(std::move(config));
}

} // namespace rwdagt
