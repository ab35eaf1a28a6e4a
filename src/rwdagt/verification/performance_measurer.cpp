#include "rwdagt/verification/performance_measurer.hpp"
#include "rwdagt/common/logging.hpp"
#include "rwdagt/execution/sequential_executor.hpp"
#include "rwdagt/execution/thread_pool_executor.hpp"
#include <fmt/format.h>

namespace rwdagt
{

namespace
{

double to_ms(std::chrono::nanoseconds duration)
{
    return std::chrono::duration<double, std::milli>(duration).count();
}

std::chrono::nanoseconds mean(const std::vector<std::chrono::nanoseconds>& samples)
{
    if (samples.empty())
    {
        return std::chrono::nanoseconds{0};
    }
    std::chrono::nanoseconds total{0};
    for (auto sample : samples)
    {
        total += sample;
    }
    return total / static_cast<std::chrono::nanoseconds::rep>(samples.size());
}

} // namespace

std::string PerformanceReport::summary() const
{
    return fmt::format("sequential {:.3f} ms, parallel {:.3f} ms on {} worker(s), speedup {:.2f}x",
                       to_ms(sequential_duration), to_ms(parallel_duration),
                       worker_count, speedup);
}

PerformanceMeasurer::PerformanceMeasurer(MeasurerConfig config)
    : m_config{std::move(config)}
{}

PerformanceReport PerformanceMeasurer::measure(std::shared_ptr<const ExecutableGraph> graph,
                                               SharedState& state,
                                               size_t worker_count) const
{
    auto log = logger();
    const StateCheckpoint checkpoint = state.checkpoint();

    ExecutorConfig seq_config;
    seq_config.validate_access = m_config.validate_access;
    auto sequential = make_sequential_executor(seq_config);

    ExecutorConfig par_config;
    par_config.thread_count = worker_count;
    par_config.validate_access = m_config.validate_access;
    auto parallel = make_thread_pool_executor(par_config);

    PerformanceReport report;
    report.worker_count = ThreadPoolExecutor::resolve_worker_count(worker_count, graph->task_count());

    try
    {
        for (size_t trial = 0; trial < m_config.trials; ++trial)
        {
            state.restore(checkpoint);
            auto seq_result = sequential->execute(graph, state);
            seq_result.throw_if_failed();

            state.restore(checkpoint);
            auto par_result = parallel->execute(graph, state);
            par_result.throw_if_failed();

            report.sequential_samples.push_back(seq_result.total_duration);
            report.parallel_samples.push_back(par_result.total_duration);
            log->info("Trial {}: sequential {:.3f} ms, parallel {:.3f} ms",
                      trial + 1, to_ms(seq_result.total_duration), to_ms(par_result.total_duration));
        }
    }
    catch (...)
    {
        state.restore(checkpoint);
        throw;
    }
    state.restore(checkpoint);

    report.sequential_duration = mean(report.sequential_samples);
    report.parallel_duration = mean(report.parallel_samples);
    if (report.parallel_duration.count() > 0)
    {
        report.speedup = static_cast<double>(report.sequential_duration.count()) /
                         static_cast<double>(report.parallel_duration.count());
    }

    log->info("Performance: {}", report.summary());
    return report;
}

} // namespace rwdagt
