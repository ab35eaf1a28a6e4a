#include "rwdagt/common/graph_builder.hpp"
#include "rwdagt/common/logging.hpp"
#include <sstream>
#include <unordered_set>

namespace rwdagt
{

GraphBuilder::GraphBuilder(bool eager_validation)
    : m_core{std::make_unique<GraphCore>(eager_validation)}
    , m_tasks{}
    , m_task_names{}
    , m_variable_names{}
{}

TaskIdx GraphBuilder::add_task(const TaskSpecPtr& task)
{
    if (!task)
    {
        throw std::invalid_argument("GraphBuilder::add_task: null task");
    }

    if (m_task_names.find(task->name()) != UniqueNameList::npos)
    {
        throw GraphCoreError(
            GraphCoreErrorCode::DuplicateTaskName,
            "Duplicate task name '" + task->name() + "'",
            {task->name()});
    }

    AccessSets access;
    for (const auto& var : task->reads())
    {
        access.reads.push_back(m_variable_names.insert(var));
    }
    for (const auto& var : task->writes())
    {
        access.writes.push_back(m_variable_names.insert(var));
    }

    TaskIdx tidx = m_core->task_count();
    m_core->add_task(tidx, std::move(access));
    m_task_names.insert(task->name());
    m_tasks.push_back(task);
    return tidx;
}

TaskIdx GraphBuilder::resolve_task(const std::string& name) const
{
    size_t tidx = m_task_names.find(name);
    if (tidx == UniqueNameList::npos)
    {
        throw GraphCoreError(
            GraphCoreErrorCode::UnknownTaskReference,
            "Precedence hint references unknown task '" + name + "'",
            {name});
    }
    return tidx;
}

void GraphBuilder::add_precedence(const std::string& before, const std::string& after)
{
    TaskIdx before_idx = resolve_task(before);
    TaskIdx after_idx = resolve_task(after);
    try
    {
        m_core->link_tasks(before_idx, after_idx);
    }
    catch (const GraphCoreError& e)
    {
        if (e.code() != GraphCoreErrorCode::CycleDetected)
        {
            throw;
        }
        throw GraphCoreError(
            GraphCoreErrorCode::CycleDetected,
            "Precedence hint '" + before + "' -> '" + after + "' creates a cycle",
            {before, after});
    }
}

void GraphBuilder::add_precedences(const PrecedenceHints& hints)
{
    for (const auto& [task, prerequisites] : hints)
    {
        // Resolve the key even when it has no prerequisites
        resolve_task(task);
        for (const auto& prerequisite : prerequisites)
        {
            add_precedence(prerequisite, task);
        }
    }
}

std::shared_ptr<GraphCoreDiagnostics> GraphBuilder::get_diagnostics() const
{
    return m_core->get_diagnostics();
}

std::string GraphBuilder::describe(const DiagnosticItem& item) const
{
    std::ostringstream oss;
    switch (item.category)
    {
    case DiagnosticCategory::Cycle:
        oss << "Cycle in precedence hints among tasks:";
        break;
    case DiagnosticCategory::OrphanTask:
        oss << "Task has no accesses and no hints:";
        break;
    case DiagnosticCategory::RedundantHint:
        oss << "Redundant precedence hint:";
        break;
    case DiagnosticCategory::InternalError:
        oss << "Internal error:";
        break;
    }
    for (TaskIdx tidx : item.involved_tasks)
    {
        oss << " '" << m_task_names.at(tidx) << "'";
    }
    return oss.str();
}

std::shared_ptr<ExecutableGraph> GraphBuilder::build()
{
    auto log = logger();

    // Step 1: Validate
    auto diagnostics = m_core->get_diagnostics();
    if (diagnostics->has_errors())
    {
        std::ostringstream oss;
        oss << "Graph validation failed with " << diagnostics->errors().size() << " error(s):\n";
        std::vector<std::string> blamed;
        for (const auto& err : diagnostics->errors())
        {
            oss << "  - " << describe(err) << "\n";
            if (blamed.empty() && !err.blamed_hint_links.empty())
            {
                auto [before, after] = m_core->hint_link(err.blamed_hint_links.front());
                blamed = {m_task_names.at(before), m_task_names.at(after)};
            }
        }
        throw GraphValidationError(
            GraphCoreErrorCode::CycleDetected, oss.str(), std::move(blamed), diagnostics);
    }
    for (const auto& warning : diagnostics->warnings())
    {
        log->warn("{}", describe(warning));
    }

    // Step 2: Export the graph structure
    auto exported = m_core->export_graph();

    // Step 3: Create the ExecutableGraph
    auto exec_graph = std::make_shared<ExecutableGraph>();
    const size_t num_tasks = m_core->task_count();

    exec_graph->tasks = m_tasks;
    for (TaskIdx tidx = 0; tidx < num_tasks; ++tidx)
    {
        exec_graph->task_index.emplace(m_tasks[tidx]->name(), tidx);
    }

    // Compute predecessor counts and successor lists from combined links
    exec_graph->predecessor_counts.resize(num_tasks, 0);
    exec_graph->successors.resize(num_tasks);

    // Use a set to avoid counting duplicate edges multiple times
    std::vector<std::unordered_set<TaskIdx>> predecessor_sets(num_tasks);

    for (const auto& [before, after] : exported->combined_links)
    {
        if (predecessor_sets[after].insert(before).second)
        {
            exec_graph->predecessor_counts[after]++;
            exec_graph->successors[before].push_back(after);
        }
    }

    exec_graph->hint_links = std::move(exported->hint_links);
    exec_graph->inferred_links = std::move(exported->inferred_links);
    exec_graph->inferred_link_reasons = std::move(exported->inferred_link_reasons);
    exec_graph->hint_order = std::move(exported->hint_order);
    exec_graph->variable_names = m_variable_names.names();

    if (log->should_log(spdlog::level::debug))
    {
        for (size_t i = 0; i < exec_graph->inferred_links.size(); ++i)
        {
            const auto& [before, after] = exec_graph->inferred_links[i];
            const auto& reason = exec_graph->inferred_link_reasons[i];
            std::string vars;
            for (VarIdx v : reason.variables)
            {
                vars += (vars.empty() ? "" : ",") + exec_graph->variable_names[v];
            }
            log->debug("Inferred '{}' -> '{}' ({} on {})",
                       m_task_names.at(before), m_task_names.at(after),
                       ConflictAnalyzer::describe(reason.kinds), vars);
        }
    }
    log->info("Built graph: {} tasks, {} hint links, {} inferred links ({} orphan, {} redundant hints)",
              num_tasks, exec_graph->hint_links.size(), exec_graph->inferred_links.size(),
              diagnostics->count(DiagnosticCategory::OrphanTask),
              diagnostics->count(DiagnosticCategory::RedundantHint));

    return exec_graph;
}

} // namespace rwdagt
