/**
 * @file task_system.hpp
 * @brief TaskSystem: one-stop facade over building, running and checking a task graph.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/graph_builder.hpp"
#include "rwdagt/common/shared_state.inline.hpp"
#include "rwdagt/common/task_context.hpp"
#include "rwdagt/common/task_spec.hpp"
#include "rwdagt/execution/executable_graph.hpp"
#include "rwdagt/execution/execution_result.hpp"
#include "rwdagt/execution/executor.hpp"
#include "rwdagt/verification/determinism_verifier.hpp"
#include "rwdagt/verification/performance_measurer.hpp"

namespace rwdagt
{

/**
 * @brief Options for TaskSystem.
 */
struct TaskSystemOptions
{
    /**
     * @brief Reject cycle-closing hints as they are added rather than at build.
     */
    bool eager_validation{true};

    /**
     * @brief Check every TaskContext access against the declared sets.
     */
    bool validate_access{true};

    /**
     * @brief If set, runs attach a snapshot of the state to their result, and
     *        test_determinism() uses it when not given one.
     */
    SnapshotFn snapshot{};
};

/**
 * @brief A validated task graph with both executors and the verifiers.
 *
 * @details
 * The constructor builds the graph eagerly: tasks are added in the given
 * order (which is their declaration order), then every hint. Construction
 * errors are the GraphBuilder's (`DuplicateTaskName`, `UnknownTaskReference`,
 * `CycleDetected`) and leave no system behind.
 *
 * A TaskSystem is reusable: runs never modify the graph, and a failed run
 * affects only its own result.
 *
 * @par Example
 * @code
 * SharedState state;
 * state.declare("x", 1);
 * state.declare("y", 2);
 * state.declare("z", 0);
 * TaskSystem system({
 *     TaskSpec("sum", {"x", "y"}, {"z"}, [](TaskContext& ctx) {
 *         ctx.set("z", ctx.get<int>("x") + ctx.get<int>("y"));
 *     }),
 * });
 * system.run_parallel(state).throw_if_failed();
 * @endcode
 */
class TaskSystem
{
public:
    TaskSystem(std::vector<TaskSpec> tasks,
               const PrecedenceHints& hints = {},
               TaskSystemOptions options = {});

    /**
     * @brief Run every task on the calling thread in stable topological order.
     */
    ExecutionResult run_sequential(SharedState& state) const;

    /**
     * @brief Run the tasks on a worker pool.
     * @param worker_count 0 means the hardware concurrency.
     */
    ExecutionResult run_parallel(SharedState& state, size_t worker_count = 0) const;

    /**
     * @brief Run the tasks with an explicit executor configuration.
     * @param parallel Use the ThreadPoolExecutor rather than the SequentialExecutor.
     */
    ExecutionResult run(SharedState& state, const ExecutorConfig& config, bool parallel) const;

    /**
     * @brief Check for nondeterminism over randomized parallel trials.
     * @param snapshot Compared image of the state; defaults to the options' snapshot.
     * @throws std::invalid_argument if no snapshot function is available.
     * @throws TaskExecutionError if the sequential reference run fails for a
     *         reason other than an undeclared access, which is reported instead.
     */
    VerificationResult test_determinism(SharedState& state,
                                        size_t trials = 100,
                                        SnapshotFn snapshot = {}) const;

    /**
     * @brief Check for nondeterminism with a full verifier configuration.
     */
    VerificationResult test_determinism(SharedState& state,
                                        const VerifierConfig& config,
                                        SnapshotFn snapshot = {}) const;

    /**
     * @brief Compare sequential and parallel wall-clock time.
     * @throws TaskExecutionError if any run fails.
     */
    PerformanceReport measure_performance(SharedState& state,
                                          size_t worker_count = 0,
                                          size_t trials = 5) const;

    /**
     * @brief Read-only view of the built graph.
     */
    const ExecutableGraph& graph() const noexcept
    {
        return *m_graph;
    }

    std::shared_ptr<const ExecutableGraph> graph_ptr() const noexcept
    {
        return m_graph;
    }

    /**
     * @brief Warnings found while building, rendered with task names.
     */
    const std::vector<std::string>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    const TaskSystemOptions& options() const noexcept
    {
        return m_options;
    }

private:
    TaskSystemOptions m_options;
    std::shared_ptr<const ExecutableGraph> m_graph;
    std::vector<std::string> m_diagnostics;
};

} // namespace rwdagt
