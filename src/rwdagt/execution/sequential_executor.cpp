#include "rwdagt/execution/sequential_executor.hpp"
#include "rwdagt/common/logging.hpp"
#include "rwdagt/execution/task_wrapper.hpp"

namespace rwdagt
{

SequentialExecutor::SequentialExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{}

ExecutionResult SequentialExecutor::execute(std::shared_ptr<const ExecutableGraph> graph,
                                            SharedState& state)
{
    auto start_time = std::chrono::steady_clock::now();
    auto log = logger();

    reset_run_state();
    m_ready_queue.clear();

    m_all_tasks = create_task_wrappers(*graph, state);
    wire_successors(m_all_tasks, *graph);

    for (auto& task : m_all_tasks)
    {
        if (task->is_ready())
        {
            task->mark_queued();
            m_ready_queue.push(task->task_idx());
        }
    }

    while (!m_ready_queue.empty() && !abort_requested())
    {
        auto& task = m_all_tasks[m_ready_queue.pop()];
        log->debug("Running '{}'", task->task()->name());
        task->run();
    }

    ExecutionResult result = build_result(*graph, m_all_tasks, start_time);
    log->debug("Sequential run: {}", result.summary());

    // Clear task references
    m_all_tasks.clear();
    m_ready_queue.clear();

    return result;
}

void SequentialExecutor::enqueue(TaskWrapperPtr task)
{
    m_ready_queue.push(task->task_idx());
}

void SequentialExecutor::notify_completion(TaskWrapper* /*task*/)
{
    // The dispatch loop itself knows when each task is done
}

} // namespace rwdagt
