/**
 * @file graph_builder.hpp
 * @brief GraphBuilder bridges named task definitions to index-based GraphCore.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/graph_core.hpp"
#include "rwdagt/common/task_spec.hpp"
#include "rwdagt/common/unique_name_list.hpp"
#include "rwdagt/execution/executable_graph.hpp"

namespace rwdagt
{

/**
 * @brief Caller-declared precedence hints.
 *
 * @details
 * Maps a task name to the names of the tasks that must complete before it
 * starts. Tasks absent from the map have no explicit prerequisites.
 */
using PrecedenceHints = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Exception thrown when graph validation fails at build().
 *
 * @details
 * Carries the error code of the first blocking diagnostic (in practice
 * `CycleDetected`), the names of the tasks at the ends of the first blamed
 * hint, and the full diagnostics.
 */
class GraphValidationError : public GraphCoreError
{
public:
    GraphValidationError(GraphCoreErrorCode code,
                         const std::string& msg,
                         std::vector<std::string> task_names,
                         std::shared_ptr<GraphCoreDiagnostics> diagnostics)
        : GraphCoreError(code, msg, std::move(task_names))
        , m_diagnostics(std::move(diagnostics))
    {}

    /**
     * @brief Get the diagnostics that caused the validation failure.
     */
    const std::shared_ptr<GraphCoreDiagnostics>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    std::shared_ptr<GraphCoreDiagnostics> m_diagnostics;
};

/**
 * @brief Builder class that bridges named tasks to index-based GraphCore.
 *
 * @details
 * GraphBuilder manages the mapping between task and variable names and the
 * index-based GraphCore. It provides a convenient API for constructing task
 * graphs and produces an ExecutableGraph for execution.
 *
 * @par Usage
 * 1. Create a GraphBuilder with eager or deferred validation.
 * 2. Add tasks via add_task(), in declaration order.
 * 3. Add precedence hints via add_precedence() or add_precedences().
 * 4. Call build() to validate and produce an ExecutableGraph.
 *
 * @par Errors
 * - add_task() throws `DuplicateTaskName` for a name already added.
 * - add_precedence() throws `UnknownTaskReference` for a name not added, and
 *   `CycleDetected` for a self-hint, or (eager validation) for a hint that
 *   closes a cycle.
 * - build() throws GraphValidationError with `CycleDetected` when deferred
 *   validation finds a cycle.
 *
 * @par Thread Safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization.
 */
class GraphBuilder
{
public:
    /**
     * @brief Construct a GraphBuilder.
     * @param eager_validation If true, reject cycle-closing hints immediately.
     */
    explicit GraphBuilder(bool eager_validation);

    /**
     * @brief Add a task to the graph.
     * @param task The task to add.
     * @return The task's index (its declaration position).
     * @throws std::invalid_argument if task is null.
     * @throws GraphCoreError with `DuplicateTaskName` if the name is taken.
     */
    TaskIdx add_task(const TaskSpecPtr& task);

    /**
     * @brief Require task `before` to complete before task `after` starts.
     * @throws GraphCoreError with `UnknownTaskReference` or `CycleDetected`.
     */
    void add_precedence(const std::string& before, const std::string& after);

    /**
     * @brief Add every hint of a PrecedenceHints map.
     * @details Hints are added in key order, prerequisites in list order.
     */
    void add_precedences(const PrecedenceHints& hints);

    /**
     * @brief Validate the graph and produce an ExecutableGraph.
     *
     * @return Shared pointer to the executable graph.
     * @throws GraphValidationError if the graph has validation errors.
     *
     * @post After successful build(), this GraphBuilder should not be reused.
     */
    std::shared_ptr<ExecutableGraph> build();

    /**
     * @brief Get diagnostics without building.
     * @return Diagnostics from the underlying GraphCore.
     */
    std::shared_ptr<GraphCoreDiagnostics> get_diagnostics() const;

    /**
     * @brief Render a diagnostic item with task names instead of indices.
     */
    std::string describe(const DiagnosticItem& item) const;

    /**
     * @brief Get the current task count.
     */
    size_t task_count() const noexcept { return m_core->task_count(); }

    /**
     * @brief Get the number of distinct shared variables seen so far.
     */
    size_t variable_count() const noexcept { return m_variable_names.size(); }

private:
    TaskIdx resolve_task(const std::string& name) const;

    std::unique_ptr<GraphCore> m_core{};
    std::vector<TaskSpecPtr> m_tasks{};
    UniqueNameList m_task_names{};
    UniqueNameList m_variable_names{};
};

} // namespace rwdagt
