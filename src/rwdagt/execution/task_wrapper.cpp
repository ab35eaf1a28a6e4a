#include "rwdagt/execution/task_wrapper.hpp"
#include "rwdagt/common/task_context.hpp"
#include "rwdagt/execution/executor.hpp"
#include <fmt/format.h>

namespace rwdagt
{

TaskWrapper::TaskWrapper(
    TaskSpecPtr task,
    TaskIdx task_idx,
    SharedState& state,
    bool validate_access,
    size_t predecessor_count,
    std::weak_ptr<Executor> executor)
    : m_task{std::move(task)}
    , m_task_idx{task_idx}
    , m_shared_state{state}
    , m_validate_access{validate_access}
    , m_executor{std::move(executor)}
    , m_successors{}
    , m_state{predecessor_count == 0 ? TaskState::Ready : TaskState::NotReady}
    , m_waiting_on{predecessor_count}
{
}

void TaskWrapper::add_successor(TaskWrapperWeakPtr successor)
{
    m_successors.push_back(std::move(successor));
}

void TaskWrapper::run()
{
    auto executor = m_executor.lock();
    if (!executor)
    {
        throw std::logic_error(
            fmt::format("Task '{}' was run after its executor was destroyed", m_task->name()));
    }

    if (begin_execution(*executor))
    {
        execute_body();
        // A successor can only be recorded after this task
        executor->record_completion(this);
        if (state() == TaskState::Succeeded)
        {
            for (auto& ready : release_successors())
            {
                executor->enqueue(std::move(ready));
            }
        }
    }
    executor->notify_completion(this);
}

bool TaskWrapper::begin_execution(const Executor& executor)
{
    if (executor.abort_requested())
    {
        cancel();
        return false;
    }
    TaskState expected = TaskState::Queued;
    return m_state.compare_exchange_strong(expected, TaskState::Executing,
                                           std::memory_order_acq_rel);
}

void TaskWrapper::execute_body()
{
    const auto started = std::chrono::steady_clock::now();
    TaskState outcome = TaskState::Succeeded;
    try
    {
        TaskContext context(*m_task, m_task_idx, m_shared_state, m_validate_access);
        m_task->run(context);
    }
    catch (const UndeclaredAccessError&)
    {
        m_exception = std::current_exception();
        m_undeclared_access = true;
        outcome = TaskState::Failed;
    }
    catch (...)
    {
        // Reported through ExecutionResult once the run ends
        m_exception = std::current_exception();
        outcome = TaskState::Failed;
    }
    m_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started);
    m_state.store(outcome, std::memory_order_release);
}

std::vector<TaskWrapperPtr> TaskWrapper::release_successors()
{
    std::vector<TaskWrapperPtr> ready;
    for (const auto& weak_succ : m_successors)
    {
        auto succ = weak_succ.lock();
        if (succ && succ->decrement_predecessor_count() && succ->mark_queued())
        {
            ready.push_back(std::move(succ));
        }
    }
    return ready;
}

bool TaskWrapper::decrement_predecessor_count()
{
    if (m_waiting_on.fetch_sub(1, std::memory_order_acq_rel) != 1)
    {
        return false;
    }
    TaskState expected = TaskState::NotReady;
    m_state.compare_exchange_strong(expected, TaskState::Ready, std::memory_order_acq_rel);
    return true;
}

bool TaskWrapper::mark_queued()
{
    TaskState expected = TaskState::Ready;
    return m_state.compare_exchange_strong(expected, TaskState::Queued,
                                           std::memory_order_acq_rel);
}

bool TaskWrapper::cancel()
{
    TaskState current = m_state.load(std::memory_order_acquire);
    while (current == TaskState::NotReady ||
           current == TaskState::Ready ||
           current == TaskState::Queued)
    {
        if (m_state.compare_exchange_weak(current, TaskState::Cancelled,
                                          std::memory_order_acq_rel))
        {
            return true;
        }
    }
    return false;
}

} // namespace rwdagt
