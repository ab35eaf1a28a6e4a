/**
 * @file executable_graph.hpp
 * @brief Definition of ExecutableGraph structure for task execution.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/exported_graph.hpp"
#include "rwdagt/common/graph_core_enums.hpp"
#include "rwdagt/common/task_spec.hpp"

namespace rwdagt
{

/**
 * @brief Immutable execution plan produced by GraphBuilder::build().
 *
 * @details
 * ExecutableGraph contains all information needed to execute a validated task graph:
 * - Task objects in declaration order
 * - Predecessor counts for ready-queue tracking
 * - Successor lists for completion notification
 * - The hint and inferred links, for inspection and rendering
 *
 * @par Thread Safety
 * - Once constructed, the structure is immutable.
 * - Concurrent reads are safe.
 * - Execution state is tracked externally (in TaskWrapper).
 *
 * @par Ownership
 * - ExecutableGraph owns shared_ptrs to the task definitions.
 */
struct ExecutableGraph
{
    /**
     * @brief Task objects indexed by TaskIdx (declaration order).
     */
    std::vector<TaskSpecPtr> tasks;

    /**
     * @brief Number of predecessors for each task.
     *
     * @details
     * predecessor_counts[tidx] is the number of distinct tasks that must
     * complete before task tidx can be queued for execution. Tasks with
     * count 0 are immediately ready.
     */
    std::vector<size_t> predecessor_counts;

    /**
     * @brief Successor lists for each task.
     *
     * @details
     * successors[tidx] contains the indices of tasks that depend on tidx.
     * When tidx completes, each successor's predecessor count is decremented.
     */
    std::vector<std::vector<TaskIdx>> successors;

    /**
     * @brief Links declared by precedence hints, as (before, after).
     */
    std::vector<TaskLinkPair> hint_links;

    /**
     * @brief Links inferred from read/write conflicts, as (before, after).
     */
    std::vector<TaskLinkPair> inferred_links;

    /**
     * @brief Why each inferred link was added, parallel to inferred_links.
     */
    std::vector<ConflictReport> inferred_link_reasons;

    /**
     * @brief Shared variable names indexed by VarIdx.
     */
    std::vector<std::string> variable_names;

    /**
     * @brief Stable topological order of the hints (see ExportedGraph).
     */
    std::vector<TaskIdx> hint_order;

    /**
     * @brief Task index by task name.
     */
    std::unordered_map<std::string, TaskIdx> task_index;

    /**
     * @brief Get indices of tasks with no predecessors.
     * @return Vector of task indices that are immediately ready.
     */
    std::vector<TaskIdx> get_initial_ready_tasks() const
    {
        std::vector<TaskIdx> result;
        for (size_t i = 0; i < predecessor_counts.size(); ++i)
        {
            if (predecessor_counts[i] == 0)
            {
                result.push_back(i);
            }
        }
        return result;
    }

    /**
     * @brief Get the total number of tasks.
     */
    size_t task_count() const noexcept
    {
        return tasks.size();
    }

    /**
     * @brief Get the name of a task.
     */
    const std::string& task_name(TaskIdx tidx) const
    {
        return tasks.at(tidx)->name();
    }

    /**
     * @brief Find a task by name.
     * @return The task index, or `npos_idx` if no task has that name.
     */
    TaskIdx find_task(const std::string& name) const
    {
        auto it = task_index.find(name);
        return it == task_index.end() ? npos_idx : it->second;
    }

    /**
     * @brief All links of the graph, hint links first.
     *
     * @details
     * This is the read-only node/edge view for external consumers such as
     * renderers: nodes are `tasks`, edges are the returned pairs.
     */
    std::vector<TaskLinkPair> links() const
    {
        std::vector<TaskLinkPair> result = hint_links;
        result.insert(result.end(), inferred_links.begin(), inferred_links.end());
        return result;
    }

    /**
     * @brief Check whether `from` must complete before `to` starts.
     * @return True if a non-empty path of links leads from `from` to `to`.
     */
    bool has_path(TaskIdx from, TaskIdx to) const
    {
        std::vector<bool> visited(task_count(), false);
        std::vector<TaskIdx> stack(successors.at(from).begin(), successors.at(from).end());
        while (!stack.empty())
        {
            TaskIdx current = stack.back();
            stack.pop_back();
            if (current == to)
            {
                return true;
            }
            if (visited[current])
            {
                continue;
            }
            visited[current] = true;
            stack.insert(stack.end(), successors[current].begin(), successors[current].end());
        }
        return false;
    }

    /**
     * @brief Name-based overload of has_path().
     * @throws std::out_of_range if either name is unknown.
     */
    bool has_path(const std::string& from, const std::string& to) const
    {
        return has_path(task_index.at(from), task_index.at(to));
    }
};

} // namespace rwdagt
