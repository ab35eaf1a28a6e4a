/**
 * @file exported_graph.hpp
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/conflict_analyzer.hpp"
#include "rwdagt/common/graph_core_enums.hpp"

namespace rwdagt
{

/**
 * @brief Execution order dependency between two tasks, as (before, after).
 */
using TaskLinkPair = std::pair<TaskIdx, TaskIdx>;

// ============================================================================
// ExportedGraph
// ============================================================================

/**
 * @brief A snapshot of a computed graph structure.
 *
 * @details
 * `ExportedGraph` represents the result of finalizing a `GraphCore` instance:
 * the caller's precedence hints, the links inferred to order conflicting
 * tasks, and their union.
 *
 * This structure is produced by `GraphCore::export_graph()` and is consumed by
 * `GraphBuilder::build()` to produce an `ExecutableGraph`.
 *
 * @par Maximal parallelism
 * A link is inferred between two tasks only if their access sets conflict and
 * the hints do not already order them, directly or transitively. Two tasks
 * with no path between them in `combined_links` are therefore safe to run
 * concurrently, and no ordering beyond that is imposed.
 *
 * @par Ownership and movement
 * - Fields are non-const to allow upstream code to move (take ownership of)
 *   the vectors rather than copying them.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is conceptually immutable.
 */
struct ExportedGraph
{
    /**
     * @brief Explicit links from precedence hints.
     *
     * @details
     * Each `TaskLinkPair` is `(prerequisite_idx, dependent_idx)`, in the order
     * the hints were added, with duplicates removed.
     */
    std::vector<TaskLinkPair> hint_links;

    /**
     * @brief Links inferred to order conflicting task pairs.
     *
     * @details
     * Each `TaskLinkPair` is `(before_task_idx, after_task_idx)`. The earlier
     * task in `hint_order` always comes first.
     */
    std::vector<TaskLinkPair> inferred_links;

    /**
     * @brief Why each inferred link was added, parallel to `inferred_links`.
     */
    std::vector<ConflictReport> inferred_link_reasons;

    /**
     * @brief Combined execution order on tasks.
     *
     * @details
     * The union of `hint_links` and `inferred_links`, hint links first.
     */
    std::vector<TaskLinkPair> combined_links;

    /**
     * @brief Stable topological order of the hint graph.
     *
     * @details
     * Kahn's algorithm over `hint_links`, always taking the lowest ready task
     * index. Without hints this is simply `0, 1, ..., n-1`. Every link in
     * `combined_links` points forward in this order.
     */
    std::vector<TaskIdx> hint_order;
};

} // namespace rwdagt
