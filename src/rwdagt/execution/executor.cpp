#include "rwdagt/execution/executor.hpp"
#include "rwdagt/common/logging.hpp"
#include "rwdagt/execution/task_wrapper.hpp"

namespace rwdagt
{

Executor::Executor(ExecutorConfig config)
    : m_config{std::move(config)}
{}

bool Executor::abort_requested() const noexcept
{
    return m_abort_requested.load(std::memory_order_acquire);
}

std::vector<TaskWrapperPtr> Executor::create_task_wrappers(
    const ExecutableGraph& graph,
    SharedState& state)
{
    std::vector<TaskWrapperPtr> wrappers;
    wrappers.reserve(graph.task_count());

    auto self = shared_from_this();

    for (size_t tidx = 0; tidx < graph.task_count(); ++tidx)
    {
        auto wrapper = std::make_shared<TaskWrapper>(
            graph.tasks[tidx],
            tidx,
            state,
            m_config.validate_access,
            graph.predecessor_counts[tidx],
            self
        );
        wrappers.push_back(wrapper);
    }

    return wrappers;
}

void Executor::wire_successors(
    std::vector<TaskWrapperPtr>& wrappers,
    const ExecutableGraph& graph)
{
    for (size_t tidx = 0; tidx < graph.task_count(); ++tidx)
    {
        for (TaskIdx succ_idx : graph.successors[tidx])
        {
            wrappers[tidx]->add_successor(wrappers[succ_idx]);
        }
    }
}

void Executor::reset_run_state()
{
    m_abort_requested.store(false, std::memory_order_release);
    std::lock_guard<std::mutex> lock(m_record_mutex);
    m_completion_order.clear();
    m_first_failure = npos_idx;
}

void Executor::record_completion(TaskWrapper* task)
{
    TaskState state = task->state();
    if (state == TaskState::Succeeded)
    {
        std::lock_guard<std::mutex> lock(m_record_mutex);
        m_completion_order.push_back(task->task_idx());
        return;
    }
    if (state != TaskState::Failed)
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_record_mutex);
        if (m_first_failure == npos_idx)
        {
            m_first_failure = task->task_idx();
        }
    }
    logger()->error("Task '{}' failed: {}",
                    task->task()->name(), describe_exception(task->exception()));

    if (m_config.abort_on_failure)
    {
        m_abort_requested.store(true, std::memory_order_release);
    }
}

ExecutionResult Executor::build_result(
    const ExecutableGraph& graph,
    const std::vector<TaskWrapperPtr>& wrappers,
    std::chrono::steady_clock::time_point start_time)
{
    ExecutionResult result;
    auto end_time = std::chrono::steady_clock::now();
    result.total_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        end_time - start_time);

    result.aborted = abort_requested();
    if (m_config.collect_timing)
    {
        result.task_durations.resize(graph.task_count(), std::chrono::nanoseconds{0});
    }

    {
        std::lock_guard<std::mutex> lock(m_record_mutex);
        result.completed_tasks = m_completion_order;
        if (m_first_failure != npos_idx)
        {
            const auto& failed = wrappers[m_first_failure];
            result.first_failure = TaskFailure{
                m_first_failure,
                failed->task()->name(),
                describe_exception(failed->exception()),
                failed->exception(),
                failed->failed_on_undeclared_access()};
        }
    }

    for (const auto& task : wrappers)
    {
        TaskIdx tidx = task->task_idx();

        switch (task->state())
        {
            case TaskState::Succeeded:
                if (m_config.collect_timing)
                {
                    result.task_durations[tidx] = task->duration();
                }
                break;

            case TaskState::Failed:
                result.failed_tasks.push_back(tidx);
                result.error_messages.push_back(describe_exception(task->exception()));
                if (m_config.collect_timing)
                {
                    result.task_durations[tidx] = task->duration();
                }
                break;

            case TaskState::Cancelled:
            case TaskState::NotReady:
            case TaskState::Ready:
            case TaskState::Queued:
                result.cancelled_tasks.push_back(tidx);
                break;

            case TaskState::Executing:
                // Every worker has returned; nothing can still be running
                result.failed_tasks.push_back(tidx);
                result.error_messages.push_back("Task stuck in Executing state");
                break;
        }
    }

    result.success = result.failed_tasks.empty() && result.cancelled_tasks.empty();
    return result;
}

} // namespace rwdagt
