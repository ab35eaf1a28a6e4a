/**
 * @file graph_core_enums.hpp
 */
#pragma once
#include "rwdagt/common/common.hpp"

namespace rwdagt
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for task indices.
 *
 * @details
 * `TaskIdx` is a type alias for `size_t` used to identify tasks in the graph.
 * A task's index is its declaration position: the first task added to a
 * builder has index 0. This alias exists for clarity in API signatures and
 * documentation, not for compile-time type safety.
 */
using TaskIdx = size_t;

/**
 * @brief Type alias for shared variable indices.
 *
 * @details
 * `VarIdx` identifies a shared variable named in some task's read or write set.
 * Variable names are interned by `GraphBuilder` in order of first appearance.
 */
using VarIdx = size_t;

/**
 * @brief Sentinel index meaning "no such task" or "no such variable".
 */
inline constexpr size_t npos_idx = ~static_cast<size_t>(0);

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Kind of access a task declares on a shared variable.
 *
 * @details
 * Two accesses to the same variable from different tasks conflict unless both
 * are Read. Conflicting tasks must be ordered; the graph decides which one
 * goes first.
 */
enum class Access
{
    Read,
    Write
};

/**
 * @brief Execution state of a task during a run.
 *
 * @details
 * State transitions:
 * - NotReady -> Ready (all predecessors completed)
 * - Ready -> Queued (submitted to the ready queue)
 * - Queued -> Executing (dequeued by a worker)
 * - Executing -> Succeeded | Failed
 * - NotReady | Ready | Queued -> Cancelled (run aborted)
 *
 * A failed task never releases its successors, so they stay NotReady and are
 * reported as cancelled.
 */
enum class TaskState
{
    NotReady,   ///< Waiting for predecessors.
    Ready,      ///< All predecessors completed; eligible for queueing.
    Queued,     ///< In the ready queue, awaiting a worker.
    Executing,  ///< Currently running on a worker.
    Succeeded,  ///< Completed successfully.
    Failed,     ///< Threw an exception.
    Cancelled   ///< Not run because the run was aborted.
};

/**
 * @brief Get a printable name for an Access value.
 */
inline const char* to_string(Access access) noexcept
{
    return access == Access::Read ? "read" : "write";
}

} // namespace rwdagt
