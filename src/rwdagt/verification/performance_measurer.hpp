/**
 * @file performance_measurer.hpp
 * @brief PerformanceMeasurer: sequential versus parallel wall-clock timing.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/shared_state.hpp"
#include "rwdagt/execution/executable_graph.hpp"
#include "rwdagt/execution/execution_result.hpp"

namespace rwdagt
{

/**
 * @brief Configuration for PerformanceMeasurer.
 */
struct MeasurerConfig
{
    /**
     * @brief Number of rounds; each round times one sequential and one parallel run.
     */
    size_t trials{5};

    bool validate_access{true};
};

/**
 * @brief Timing comparison of the two executors.
 */
struct PerformanceReport
{
    /// Mean sequential wall-clock duration.
    std::chrono::nanoseconds sequential_duration{0};

    /// Mean parallel wall-clock duration.
    std::chrono::nanoseconds parallel_duration{0};

    /// Mean sequential over mean parallel; 0 if the parallel mean is 0.
    double speedup{0.0};

    size_t worker_count{0};

    std::vector<std::chrono::nanoseconds> sequential_samples;
    std::vector<std::chrono::nanoseconds> parallel_samples;

    std::string summary() const;
};

/**
 * @brief Times sequential and parallel runs of a graph.
 *
 * @details
 * Every run starts from a checkpoint of the state taken on entry, and the
 * state is restored to it before measure() returns. A failing run aborts the
 * measurement with TaskExecutionError.
 */
class PerformanceMeasurer
{
public:
    explicit PerformanceMeasurer(MeasurerConfig config = {});

    /**
     * @brief Measure the graph.
     * @param worker_count Parallel workers; 0 means the hardware concurrency.
     * @throws TaskExecutionError if any run fails.
     */
    PerformanceReport measure(std::shared_ptr<const ExecutableGraph> graph,
                              SharedState& state,
                              size_t worker_count) const;

private:
    MeasurerConfig m_config;
};

} // namespace rwdagt
