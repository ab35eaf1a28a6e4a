/**
 * @file performance_measurer_tests.cpp
 * @brief Tests for PerformanceMeasurer
 */
#include <gtest/gtest.h>
#include "rwdagt/common/graph_builder.hpp"
#include "rwdagt/common/task_context.hpp"
#include "rwdagt/execution/execution_result.hpp"
#include "rwdagt/verification/performance_measurer.hpp"

#include <chrono>
#include <thread>

using namespace rwdagt;

namespace
{

std::shared_ptr<const ExecutableGraph> build_graph(const std::vector<TaskSpecPtr>& tasks)
{
    GraphBuilder builder(true);
    for (const auto& task : tasks)
    {
        builder.add_task(task);
    }
    return builder.build();
}

TaskSpecPtr sleeping_task(const std::string& name, const std::string& output, int value)
{
    return make_task(name, {}, {output}, [output, value](TaskContext& ctx) {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        ctx.set(output, value);
    });
}

} // namespace

TEST(PerformanceMeasurerTests, IndependentSleepers_ShowSpeedup)
{
    auto graph = build_graph({
        sleeping_task("A", "a", 1),
        sleeping_task("B", "b", 2),
        sleeping_task("C", "c", 3),
        sleeping_task("D", "d", 4),
    });
    SharedState state;
    for (const char* name : {"a", "b", "c", "d"})
    {
        state.declare(name, 0);
    }

    MeasurerConfig config;
    config.trials = 2;
    auto report = PerformanceMeasurer(config).measure(graph, state, 4);

    EXPECT_EQ(report.worker_count, 4u);
    EXPECT_EQ(report.sequential_samples.size(), 2u);
    EXPECT_EQ(report.parallel_samples.size(), 2u);
    EXPECT_GE(report.sequential_duration, std::chrono::milliseconds(120));
    EXPECT_LT(report.parallel_duration, report.sequential_duration);
    EXPECT_GT(report.speedup, 1.5);
    EXPECT_NE(report.summary().find("speedup"), std::string::npos);

    // Measurement leaves the state as it found it
    EXPECT_EQ(state.get<int>("a"), 0);
    EXPECT_EQ(state.get<int>("d"), 0);
}

TEST(PerformanceMeasurerTests, WorkerCount_CappedByTaskCount)
{
    auto graph = build_graph({sleeping_task("A", "a", 1)});
    SharedState state;
    state.declare("a", 0);

    MeasurerConfig config;
    config.trials = 1;
    auto report = PerformanceMeasurer(config).measure(graph, state, 8);
    EXPECT_EQ(report.worker_count, 1u);
}

TEST(PerformanceMeasurerTests, FailingTask_ThrowsAndRestoresState)
{
    auto graph = build_graph({
        make_task("Set", {}, {"a"}, [](TaskContext& ctx) { ctx.set("a", 9); }),
        make_task("Broken", {"a"}, {}, [](TaskContext&) {
            throw std::runtime_error("broken");
        }),
    });
    SharedState state;
    state.declare("a", 0);

    try
    {
        PerformanceMeasurer().measure(graph, state, 2);
        FAIL() << "Expected TaskExecutionError";
    }
    catch (const TaskExecutionError& e)
    {
        EXPECT_EQ(e.task_name(), "Broken");
    }
    EXPECT_EQ(state.get<int>("a"), 0);
}

TEST(PerformanceMeasurerTests, ZeroTrials_ReportsZero)
{
    auto graph = build_graph({sleeping_task("A", "a", 1)});
    SharedState state;
    state.declare("a", 0);

    MeasurerConfig config;
    config.trials = 0;
    auto report = PerformanceMeasurer(config).measure(graph, state, 1);
    EXPECT_TRUE(report.sequential_samples.empty());
    EXPECT_EQ(report.parallel_duration.count(), 0);
    EXPECT_EQ(report.speedup, 0.0);
}
