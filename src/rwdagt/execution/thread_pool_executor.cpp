#include "rwdagt/execution/thread_pool_executor.hpp"
#include "rwdagt/common/logging.hpp"
#include "rwdagt/execution/task_wrapper.hpp"
#include <system_error>

namespace rwdagt
{

ThreadPoolExecutor::ThreadPoolExecutor(ExecutorConfig config)
    : Executor(std::move(config))
    , m_ready_queue{m_config.ready_policy, m_config.seed}
{}

size_t ThreadPoolExecutor::resolve_worker_count(size_t requested, size_t task_count) noexcept
{
    size_t count = requested;
    if (count == 0)
    {
        count = std::thread::hardware_concurrency();
    }
    count = std::min(count, std::max<size_t>(task_count, 1));
    return std::max<size_t>(count, 1);
}

ExecutionResult ThreadPoolExecutor::execute(std::shared_ptr<const ExecutableGraph> graph,
                                            SharedState& state)
{
    auto start_time = std::chrono::steady_clock::now();
    auto log = logger();

    reset_run_state();
    m_worker_count = resolve_worker_count(m_config.thread_count, graph->task_count());

    m_all_tasks = create_task_wrappers(*graph, state);
    wire_successors(m_all_tasks, *graph);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_ready_queue = ReadyQueue(m_config.ready_policy, m_config.seed);
        m_pending = 0;
        for (auto& task : m_all_tasks)
        {
            if (task->is_ready())
            {
                task->mark_queued();
                m_ready_queue.push(task->task_idx());
                ++m_pending;
            }
        }
    }

    std::vector<std::thread> workers;
    workers.reserve(m_worker_count);
    try
    {
        for (size_t i = 0; i < m_worker_count; ++i)
        {
            workers.emplace_back(&ThreadPoolExecutor::worker_loop, this, i);
        }
    }
    catch (const std::system_error& e)
    {
        log->error("Failed to start worker thread: {}", e.what());
        m_abort_requested.store(true, std::memory_order_release);
        m_cv.notify_all();
        for (auto& worker : workers)
        {
            worker.join();
        }
        m_all_tasks.clear();
        throw;
    }

    for (auto& worker : workers)
    {
        worker.join();
    }

    ExecutionResult result = build_result(*graph, m_all_tasks, start_time);
    log->debug("Parallel run on {} worker(s): {}", m_worker_count, result.summary());

    m_all_tasks.clear();
    return result;
}

void ThreadPoolExecutor::worker_loop(size_t worker_idx)
{
    auto log = logger();
    for (;;)
    {
        TaskWrapperPtr task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_ready_queue.empty() || m_pending == 0; });
            if (m_ready_queue.empty())
            {
                return;
            }
            task = m_all_tasks[m_ready_queue.pop()];
        }

        log->debug("Worker {} running '{}'", worker_idx, task->task()->name());
        task->run();
    }
}

void ThreadPoolExecutor::enqueue(TaskWrapperPtr task)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_ready_queue.push(task->task_idx());
        ++m_pending;
    }
    m_cv.notify_one();
}

void ThreadPoolExecutor::notify_completion(TaskWrapper* /*task*/)
{
    bool finished = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_pending;
        finished = (m_pending == 0);
    }
    if (finished)
    {
        m_cv.notify_all();
    }
}

} // namespace rwdagt
