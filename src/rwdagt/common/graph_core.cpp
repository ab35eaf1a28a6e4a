/**
 * @file graph_core.cpp
 */
#include "rwdagt/common/graph_core.hpp"

#include <functional>
#include <queue>
#include <set>
#include <unordered_set>

namespace rwdagt
{

// ============================================================================
// Constructor
// ============================================================================

GraphCore::GraphCore(bool eager_validation)
    : m_eager_validation(eager_validation)
{
}

// ============================================================================
// Query methods
// ============================================================================

size_t GraphCore::task_count() const noexcept
{
    return m_task_count;
}

size_t GraphCore::hint_link_count() const noexcept
{
    return m_hint_links.size();
}

const TaskLinkPair& GraphCore::hint_link(size_t link_idx) const
{
    return m_hint_links.at(link_idx);
}

const AccessSets& GraphCore::access_sets(size_t task_idx) const
{
    if (task_idx >= m_task_count)
    {
        throw GraphCoreError(
            GraphCoreErrorCode::InvalidTaskIndex,
            "Task index " + std::to_string(task_idx) + " does not exist");
    }
    return m_task_access[task_idx];
}

bool GraphCore::hints_reach(size_t from, size_t target) const
{
    if (from >= m_task_count || target >= m_task_count)
    {
        throw GraphCoreError(
            GraphCoreErrorCode::InvalidTaskIndex,
            "Task index " + std::to_string(std::max(from, target)) + " does not exist");
    }
    return is_reachable_from(from, target);
}

// ============================================================================
// Task management
// ============================================================================

void GraphCore::add_task(size_t task_idx, AccessSets access)
{
    if (task_idx != m_task_count)
    {
        if (task_idx < m_task_count)
        {
            throw GraphCoreError(
                GraphCoreErrorCode::DuplicateTaskIndex,
                "Task index " + std::to_string(task_idx) + " already exists");
        }
        throw GraphCoreError(
            GraphCoreErrorCode::InvalidTaskIndex,
            "Task index " + std::to_string(task_idx) + " is out of sequence; expected " +
                std::to_string(m_task_count));
    }

    access.normalize();
    m_task_access.push_back(std::move(access));
    m_task_successors.emplace_back();
    ++m_task_count;
}

// ============================================================================
// Hint linking
// ============================================================================

void GraphCore::link_tasks(size_t task_before_idx, size_t task_after_idx)
{
    // Validate indices
    if (task_before_idx >= m_task_count)
    {
        throw GraphCoreError(
            GraphCoreErrorCode::InvalidTaskIndex,
            "Before task index " + std::to_string(task_before_idx) + " does not exist");
    }
    if (task_after_idx >= m_task_count)
    {
        throw GraphCoreError(
            GraphCoreErrorCode::InvalidTaskIndex,
            "After task index " + std::to_string(task_after_idx) + " does not exist");
    }

    // Self-loop check
    if (task_before_idx == task_after_idx)
    {
        throw GraphCoreError(
            GraphCoreErrorCode::CycleDetected,
            "Cannot link task " + std::to_string(task_before_idx) + " to itself");
    }

    // Eager cycle detection: a cycle would exist if task_before_idx is already
    // reachable from task_after_idx
    if (m_eager_validation)
    {
        if (is_reachable_from(task_after_idx, task_before_idx))
        {
            throw GraphCoreError(
                GraphCoreErrorCode::CycleDetected,
                "Adding edge " + std::to_string(task_before_idx) + " -> " +
                    std::to_string(task_after_idx) +
                    " would create a cycle (task " + std::to_string(task_before_idx) +
                    " is reachable from task " + std::to_string(task_after_idx) + ")");
        }
    }

    m_hint_links.emplace_back(task_before_idx, task_after_idx);
    m_task_successors[task_before_idx].push_back(task_after_idx);
}

// ============================================================================
// Graph helpers
// ============================================================================

std::vector<TaskLinkPair> GraphCore::unique_hint_links() const
{
    std::vector<TaskLinkPair> result;
    std::set<TaskLinkPair> seen;
    for (const auto& link : m_hint_links)
    {
        if (seen.insert(link).second)
        {
            result.push_back(link);
        }
    }
    return result;
}

std::vector<TaskIdx> GraphCore::stable_order(const std::vector<TaskLinkPair>& links) const
{
    std::vector<size_t> in_degree(m_task_count, 0);
    std::vector<std::vector<TaskIdx>> successors(m_task_count);
    for (const auto& [before, after] : links)
    {
        successors[before].push_back(after);
        ++in_degree[after];
    }

    // Min-heap: among ready tasks, the earliest declared goes first
    std::priority_queue<TaskIdx, std::vector<TaskIdx>, std::greater<TaskIdx>> ready;
    for (TaskIdx t = 0; t < m_task_count; ++t)
    {
        if (in_degree[t] == 0)
        {
            ready.push(t);
        }
    }

    std::vector<TaskIdx> order;
    order.reserve(m_task_count);
    while (!ready.empty())
    {
        TaskIdx t = ready.top();
        ready.pop();
        order.push_back(t);
        for (TaskIdx succ : successors[t])
        {
            if (--in_degree[succ] == 0)
            {
                ready.push(succ);
            }
        }
    }
    return order;
}

bool GraphCore::is_reachable_from(TaskIdx from, TaskIdx target,
                                  std::optional<TaskLinkPair> ignored) const
{
    if (from == target)
    {
        return true;
    }

    // Iterative DFS
    std::vector<bool> visited(m_task_count, false);
    std::vector<TaskIdx> stack;
    stack.push_back(from);

    while (!stack.empty())
    {
        TaskIdx current = stack.back();
        stack.pop_back();

        if (visited[current])
        {
            continue;
        }
        visited[current] = true;

        for (TaskIdx successor : m_task_successors[current])
        {
            if (ignored && ignored->first == current && ignored->second == successor)
            {
                continue;
            }
            if (successor == target)
            {
                return true;
            }
            if (!visited[successor])
            {
                stack.push_back(successor);
            }
        }
    }

    return false;
}

// ============================================================================
// Diagnostics and export
// ============================================================================

std::shared_ptr<GraphCoreDiagnostics> GraphCore::get_diagnostics() const
{
    auto diagnostics = std::make_shared<GraphCoreDiagnostics>();

    // =========================================================================
    // Phase 1: Cycle detection using Kahn's algorithm over the hints
    // =========================================================================

    auto order = stable_order(m_hint_links);
    const bool has_cycle = order.size() < m_task_count;
    if (has_cycle)
    {
        std::vector<bool> processed(m_task_count, false);
        for (TaskIdx t : order)
        {
            processed[t] = true;
        }

        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Error;
        item.category = DiagnosticCategory::Cycle;
        item.message = "Cycle detected in precedence hints";

        // Tasks never released by Kahn's algorithm lie on or behind a cycle
        for (TaskIdx t = 0; t < m_task_count; ++t)
        {
            if (!processed[t])
            {
                item.involved_tasks.push_back(t);
            }
        }

        add_hint_link_blame(item, item.involved_tasks);
        diagnostics->add(std::move(item));
    }

    // =========================================================================
    // Phase 2: Orphan detection
    // =========================================================================

    // Orphan tasks: tasks with no accesses AND no hints
    std::vector<bool> task_has_link(m_task_count, false);
    for (const auto& [before, after] : m_hint_links)
    {
        task_has_link[before] = true;
        task_has_link[after] = true;
    }

    for (TaskIdx tidx = 0; tidx < m_task_count; ++tidx)
    {
        if (m_task_access[tidx].empty() && !task_has_link[tidx])
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Warning;
            item.category = DiagnosticCategory::OrphanTask;
            item.message = "Task " + std::to_string(tidx) + " has no accesses and no hints";
            item.involved_tasks.push_back(tidx);
            diagnostics->add(std::move(item));
        }
    }

    // =========================================================================
    // Phase 3: Redundant hints
    // =========================================================================

    std::set<TaskLinkPair> seen;
    for (size_t i = 0; i < m_hint_links.size(); ++i)
    {
        const auto& link = m_hint_links[i];
        const auto& [before, after] = link;
        bool duplicate = !seen.insert(link).second;

        // Transitive implication is only meaningful in an acyclic hint graph
        bool implied = !duplicate && !has_cycle && is_reachable_from(before, after, link);

        if (duplicate || implied)
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Warning;
            item.category = DiagnosticCategory::RedundantHint;
            item.message = "Hint " + std::to_string(before) + " -> " + std::to_string(after) +
                           (duplicate ? " is a duplicate" : " is implied by other hints");
            item.involved_tasks = {before, after};
            item.blamed_hint_links.push_back(i);
            diagnostics->add(std::move(item));
        }
    }

    return diagnostics;
}

void GraphCore::add_hint_link_blame(DiagnosticItem& item,
                                    const std::vector<TaskIdx>& involved_tasks) const
{
    std::unordered_set<TaskIdx> task_set(involved_tasks.begin(), involved_tasks.end());

    for (size_t i = 0; i < m_hint_links.size(); ++i)
    {
        const auto& [before, after] = m_hint_links[i];
        // Link is involved if both endpoints are unresolved
        if (task_set.count(before) > 0 && task_set.count(after) > 0)
        {
            item.blamed_hint_links.push_back(i);
        }
    }
}

std::shared_ptr<ExportedGraph> GraphCore::export_graph() const
{
    auto diagnostics = get_diagnostics();
    if (!diagnostics->is_valid())
    {
        throw GraphCoreError(
            GraphCoreErrorCode::InvalidState,
            "Cannot export graph with unresolved errors");
    }

    auto exported = std::make_shared<ExportedGraph>();
    exported->hint_links = unique_hint_links();
    exported->hint_order = stable_order(exported->hint_links);

    if (exported->hint_order.size() != m_task_count)
    {
        throw GraphCoreError(
            GraphCoreErrorCode::InvariantViolation,
            "Hint order does not cover every task despite clean diagnostics");
    }

    // Transitive closure of the hints, filled in reverse topological order so
    // that every successor's row is complete before it is merged
    std::vector<std::vector<TaskIdx>> successors(m_task_count);
    for (const auto& [before, after] : exported->hint_links)
    {
        successors[before].push_back(after);
    }

    std::vector<std::vector<bool>> reach(m_task_count, std::vector<bool>(m_task_count, false));
    for (auto it = exported->hint_order.rbegin(); it != exported->hint_order.rend(); ++it)
    {
        TaskIdx t = *it;
        for (TaskIdx succ : successors[t])
        {
            reach[t][succ] = true;
            for (TaskIdx k = 0; k < m_task_count; ++k)
            {
                if (reach[succ][k])
                {
                    reach[t][k] = true;
                }
            }
        }
    }

    // Order every conflicting pair the hints leave unordered. The earlier task
    // in hint_order goes first, so all links point forward and stay acyclic.
    for (size_t i = 0; i < m_task_count; ++i)
    {
        TaskIdx first = exported->hint_order[i];
        for (size_t j = i + 1; j < m_task_count; ++j)
        {
            TaskIdx second = exported->hint_order[j];
            if (reach[first][second])
            {
                continue;
            }

            ConflictReport report = ConflictAnalyzer::analyze(
                m_task_access[first], m_task_access[second]);
            if (report.conflicting())
            {
                exported->inferred_links.emplace_back(first, second);
                exported->inferred_link_reasons.push_back(std::move(report));
            }
        }
    }

    exported->combined_links = exported->hint_links;
    exported->combined_links.insert(
        exported->combined_links.end(),
        exported->inferred_links.begin(),
        exported->inferred_links.end());

    return exported;
}

} // namespace rwdagt
