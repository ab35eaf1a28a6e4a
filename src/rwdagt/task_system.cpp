#include "rwdagt/task_system.hpp"
#include "rwdagt/execution/sequential_executor.hpp"
#include "rwdagt/execution/thread_pool_executor.hpp"

namespace rwdagt
{

TaskSystem::TaskSystem(std::vector<TaskSpec> tasks,
                       const PrecedenceHints& hints,
                       TaskSystemOptions options)
    : m_options{std::move(options)}
{
    GraphBuilder builder(m_options.eager_validation);
    for (auto& task : tasks)
    {
        builder.add_task(std::make_shared<const TaskSpec>(std::move(task)));
    }
    builder.add_precedences(hints);

    auto diagnostics = builder.get_diagnostics();
    for (const auto& warning : diagnostics->warnings())
    {
        m_diagnostics.push_back(builder.describe(warning));
    }
    m_graph = builder.build();
}

ExecutionResult TaskSystem::run(SharedState& state, const ExecutorConfig& config,
                                bool parallel) const
{
    std::shared_ptr<Executor> executor;
    if (parallel)
    {
        executor = make_thread_pool_executor(config);
    }
    else
    {
        executor = make_sequential_executor(config);
    }

    ExecutionResult result = executor->execute(m_graph, state);
    if (m_options.snapshot)
    {
        result.snapshot = m_options.snapshot(state);
    }
    return result;
}

ExecutionResult TaskSystem::run_sequential(SharedState& state) const
{
    ExecutorConfig config;
    config.validate_access = m_options.validate_access;
    return run(state, config, false);
}

ExecutionResult TaskSystem::run_parallel(SharedState& state, size_t worker_count) const
{
    ExecutorConfig config;
    config.thread_count = worker_count;
    config.validate_access = m_options.validate_access;
    return run(state, config, true);
}

VerificationResult TaskSystem::test_determinism(SharedState& state,
                                                size_t trials,
                                                SnapshotFn snapshot) const
{
    VerifierConfig config;
    config.trials = trials;
    config.validate_access = m_options.validate_access;
    return test_determinism(state, config, std::move(snapshot));
}

VerificationResult TaskSystem::test_determinism(SharedState& state,
                                                const VerifierConfig& config,
                                                SnapshotFn snapshot) const
{
    if (!snapshot)
    {
        snapshot = m_options.snapshot;
    }
    return DeterminismVerifier(config).verify(m_graph, state, snapshot);
}

PerformanceReport TaskSystem::measure_performance(SharedState& state,
                                                  size_t worker_count,
                                                  size_t trials) const
{
    MeasurerConfig config;
    config.trials = trials;
    config.validate_access = m_options.validate_access;
    return PerformanceMeasurer(config).measure(m_graph, state, worker_count);
}

} // namespace rwdagt
