/**
 * @file graph_core.hpp
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/conflict_analyzer.hpp"
#include "rwdagt/common/graph_core_enums.hpp"
#include "rwdagt/common/graph_core_exceptions.hpp"
#include "rwdagt/common/graph_core_diagnostics.hpp"
#include "rwdagt/common/exported_graph.hpp"

namespace rwdagt
{

/**
 * @brief A mutable builder for task graphs ordered by read/write conflicts.
 *
 * @details
 * `GraphCore` is the index-based heart of graph construction. It tracks tasks
 * (units of execution) with their read and write sets, and the precedence hints
 * between them. On export it derives the minimal set of additional links that
 * makes every pair of conflicting tasks ordered.
 *
 * @par Construction workflow
 * 1. Create a `GraphCore` instance.
 * 2. Add tasks via `add_task()`, each with its index-based access sets.
 * 3. Add precedence hints via `link_tasks()`.
 * 4. Call `export_graph()` to produce the final computed graph structure.
 *
 * @par Index requirements
 * Tasks are identified by indices. The caller is expected to manage the actual
 * task objects and variable names externally (e.g., in a `UniqueNameList`) and
 * pass the corresponding indices to `GraphCore` methods. Task indices must be
 * added sequentially starting from 0, and double as declaration order.
 *
 * @par Validation
 * Hint cycles can be detected eagerly (on each `link_tasks()`) or lazily
 * (deferred until `get_diagnostics()` or `export_graph()` is called),
 * controlled by the constructor parameter. Inferred links never need
 * validation: they all point forward in one total order consistent with the
 * hints.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization.
 * - Concurrent reads (const methods) are safe if no concurrent writes occur.
 */
class GraphCore
{
public:
    /**
     * @brief Constructor for GraphCore.
     * @param eager_validation If true, a hint that would close a cycle is
     *        rejected by `link_tasks()`. If false, cycles are reported by
     *        `get_diagnostics()` and rejected by `export_graph()`.
     */
    explicit GraphCore(bool eager_validation = true);

    /**
     * @brief Get the current number of tasks in the graph.
     */
    size_t task_count() const noexcept;

    /**
     * @brief Get the number of hint links added, duplicates included.
     */
    size_t hint_link_count() const noexcept;

    /**
     * @brief Get a hint link by its insertion index, as referenced by
     *        `DiagnosticItem::blamed_hint_links`.
     * @throw std::out_of_range if the index is invalid.
     */
    const TaskLinkPair& hint_link(size_t link_idx) const;

    /**
     * @brief Add a task to the graph.
     * @param task_idx Index of the task to add. Must equal the current `task_count()`.
     * @param access The task's read and write sets; normalized on insertion.
     * @throw GraphCoreError with `InvalidTaskIndex` if task_idx > task_count(), or
     *        `DuplicateTaskIndex` if the task already exists.
     */
    void add_task(size_t task_idx, AccessSets access);

    /**
     * @brief Get the normalized access sets of a task.
     * @throw GraphCoreError with `InvalidTaskIndex` if the index is invalid.
     */
    const AccessSets& access_sets(size_t task_idx) const;

    /**
     * @brief Add a precedence hint between two tasks.
     * @param task_before_idx Index of the task that must complete first.
     * @param task_after_idx Index of the task that must start after.
     * @throw GraphCoreError with `InvalidTaskIndex` if either index is invalid,
     *        or `CycleDetected` if the hint links a task to itself, or would
     *        create a cycle (when eager validation is enabled).
     * @note The order of arguments matters: this creates a directed edge from
     *       `task_before_idx` to `task_after_idx`.
     */
    void link_tasks(size_t task_before_idx, size_t task_after_idx);

    /**
     * @brief Check whether the hints order `from` before `target`.
     * @return True if a path of hint links leads from `from` to `target`,
     *         or if `from == target`.
     */
    bool hints_reach(size_t from, size_t target) const;

    /**
     * @brief Get diagnostics information about the graph.
     * @return Shared pointer to the diagnostics object containing any errors
     *         or warnings detected in the graph structure.
     */
    std::shared_ptr<GraphCoreDiagnostics> get_diagnostics() const;

    /**
     * @brief Export the graph structure.
     * @return Shared pointer to the exported graph, including inferred links.
     * @throw GraphCoreError with `InvalidState` if the diagnostics contain
     *        errors.
     */
    std::shared_ptr<ExportedGraph> export_graph() const;

private:
    // -------------------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------------------

    /// Whether to check hint cycles eagerly on each link_tasks().
    bool m_eager_validation;

    // -------------------------------------------------------------------------
    // Task tracking
    // -------------------------------------------------------------------------

    /// Number of tasks added via add_task().
    size_t m_task_count = 0;

    /// Access sets of each task. Indexed by task index.
    std::vector<AccessSets> m_task_access;

    // -------------------------------------------------------------------------
    // Hint links
    // -------------------------------------------------------------------------

    /// Hint links in insertion order: (before_task_idx, after_task_idx).
    std::vector<TaskLinkPair> m_hint_links;

    /// Adjacency list of hint links. Indexed by task index.
    std::vector<std::vector<TaskIdx>> m_task_successors;

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    /// Hint links with duplicates removed, first occurrence kept.
    std::vector<TaskLinkPair> unique_hint_links() const;

    /// Kahn's algorithm over the given links, lowest ready index first.
    /// Returns fewer than task_count() indices if the links contain a cycle.
    std::vector<TaskIdx> stable_order(const std::vector<TaskLinkPair>& links) const;

    /// Depth-first reachability over the hint adjacency, optionally ignoring
    /// one (before, after) pair.
    bool is_reachable_from(TaskIdx from, TaskIdx target,
                           std::optional<TaskLinkPair> ignored = std::nullopt) const;

    /// Add blamed hint links to diagnostic item, in insertion order.
    void add_hint_link_blame(DiagnosticItem& item,
                             const std::vector<TaskIdx>& involved_tasks) const;
};

} // namespace rwdagt
