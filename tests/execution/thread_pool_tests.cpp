/**
 * @file thread_pool_tests.cpp
 * @brief Tests for ThreadPoolExecutor scheduling and ordering guarantees
 */
#include <gtest/gtest.h>
#include "rwdagt/common/graph_builder.hpp"
#include "rwdagt/common/task_context.hpp"
#include "rwdagt/execution/sequential_executor.hpp"
#include "rwdagt/execution/thread_pool_executor.hpp"

#include <atomic>
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

/**
 * @brief Wait until @p arrived reaches @p expected or the timeout expires.
 * @return true if every participant arrived in time.
 */
bool rendezvous(std::atomic<int>& arrived, int expected)
{
    ++arrived;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (arrived.load() < expected)
    {
        if (std::chrono::steady_clock::now() > deadline)
        {
            return false;
        }
        std::this_thread::yield();
    }
    return true;
}

} // namespace

// =============================================================================
// Worker count resolution
// =============================================================================

TEST(ThreadPoolTests, ResolveWorkerCount_CapsAtTaskCount)
{
    EXPECT_EQ(ThreadPoolExecutor::resolve_worker_count(4, 2), 2u);
    EXPECT_EQ(ThreadPoolExecutor::resolve_worker_count(3, 100), 3u);
}

TEST(ThreadPoolTests, ResolveWorkerCount_AtLeastOne)
{
    EXPECT_EQ(ThreadPoolExecutor::resolve_worker_count(5, 0), 1u);
    EXPECT_GE(ThreadPoolExecutor::resolve_worker_count(0, 10), 1u);
    EXPECT_LE(ThreadPoolExecutor::resolve_worker_count(0, 10), 10u);
}

// =============================================================================
// Parallelism
// =============================================================================

TEST(ThreadPoolTests, Diamond_MiddleTasksOverlap)
{
    // A -> {B, C} -> D; B and C only meet if they run at the same time
    std::atomic<int> arrived{0};
    std::atomic<int> met{0};
    auto meet = [&](TaskContext&) {
        if (rendezvous(arrived, 2))
        {
            ++met;
        }
    };

    auto graph = build_graph({
        make_task("A", {}, {"x"}, [](TaskContext& ctx) { ctx.set("x", 10); }),
        make_task("B", {"x"}, {"b"}, [&](TaskContext& ctx) {
            meet(ctx);
            ctx.set("b", ctx.get<int>("x") + 1);
        }),
        make_task("C", {"x"}, {"c"}, [&](TaskContext& ctx) {
            meet(ctx);
            ctx.set("c", ctx.get<int>("x") + 2);
        }),
        make_task("D", {"b", "c"}, {"d"}, [](TaskContext& ctx) {
            ctx.set("d", ctx.get<int>("b") + ctx.get<int>("c"));
        }),
    });

    SharedState state;
    for (const char* name : {"x", "b", "c", "d"})
    {
        state.declare(name, 0);
    }

    ExecutorConfig config;
    config.thread_count = 2;
    auto executor = make_thread_pool_executor(config);
    auto result = executor->execute(graph, state);

    ASSERT_TRUE(result.success) << result.summary();
    EXPECT_EQ(executor->last_worker_count(), 2u);
    EXPECT_EQ(met.load(), 2);
    EXPECT_EQ(state.get<int>("d"), 23);
    EXPECT_EQ(result.completed_tasks.front(), 0u);
    EXPECT_EQ(result.completed_tasks.back(), 3u);
}

TEST(ThreadPoolTests, SingleWorker_MatchesSequential)
{
    std::vector<TaskSpecPtr> tasks{
        make_task("Init", {}, {"v"}, [](TaskContext& ctx) { ctx.set("v", 1); }),
        make_task("Double", {"v"}, {"v"}, [](TaskContext& ctx) { ctx.modify<int>("v") *= 2; }),
        make_task("AddThree", {"v"}, {"v"}, [](TaskContext& ctx) { ctx.modify<int>("v") += 3; }),
        make_task("Copy", {"v"}, {"w"}, [](TaskContext& ctx) { ctx.set("w", ctx.get<int>("v")); }),
    };
    auto graph = build_graph(tasks);

    SharedState seq_state;
    seq_state.declare("v", 0);
    seq_state.declare("w", 0);
    SharedState par_state;
    par_state.restore(seq_state.checkpoint());

    auto seq = make_sequential_executor()->execute(graph, seq_state);
    ExecutorConfig config;
    config.thread_count = 1;
    auto par = make_thread_pool_executor(config)->execute(graph, par_state);

    ASSERT_TRUE(seq.success);
    ASSERT_TRUE(par.success);
    EXPECT_EQ(seq.completed_tasks, par.completed_tasks);
    EXPECT_EQ(seq_state.get<int>("w"), 5);
    EXPECT_EQ(par_state.get<int>("w"), 5);
}

// =============================================================================
// Stress
// =============================================================================

TEST(ThreadPoolTests, LongChain_ManyWorkers_PreservesOrder)
{
    constexpr size_t chain_length = 200;
    std::vector<TaskSpecPtr> tasks;
    for (size_t i = 0; i < chain_length; ++i)
    {
        tasks.push_back(make_task("Step" + std::to_string(i), {"log"}, {"log"},
                                  [i](TaskContext& ctx) {
                                      ctx.modify<std::vector<size_t>>("log").push_back(i);
                                  }));
    }
    auto graph = build_graph(tasks);

    SharedState state;
    state.declare("log", std::vector<size_t>{});

    ExecutorConfig config;
    config.thread_count = 8;
    auto result = make_thread_pool_executor(config)->execute(graph, state);

    ASSERT_TRUE(result.success) << result.summary();
    const auto& log = state.get<std::vector<size_t>>("log");
    ASSERT_EQ(log.size(), chain_length);
    for (size_t i = 0; i < chain_length; ++i)
    {
        EXPECT_EQ(log[i], i);
    }
}

TEST(ThreadPoolTests, WideFanIn_AllPolicies)
{
    constexpr int width = 64;
    std::vector<TaskSpecPtr> tasks;
    std::vector<std::string> partials;
    for (int i = 0; i < width; ++i)
    {
        std::string var = "p" + std::to_string(i);
        partials.push_back(var);
        tasks.push_back(make_task("Part" + std::to_string(i), {}, {var},
                                  [var, i](TaskContext& ctx) { ctx.set(var, i); }));
    }
    tasks.push_back(make_task("Total", partials, {"total"},
                              [partials](TaskContext& ctx) {
                                  int sum = 0;
                                  for (const auto& var : partials)
                                  {
                                      sum += ctx.get<int>(var);
                                  }
                                  ctx.set("total", sum);
                              }));
    auto graph = build_graph(tasks);
    EXPECT_EQ(graph->predecessor_counts.back(), static_cast<size_t>(width));

    for (ReadyPolicy policy : {ReadyPolicy::Fifo, ReadyPolicy::DeclarationOrder, ReadyPolicy::Random})
    {
        SharedState state;
        for (const auto& var : partials)
        {
            state.declare(var, -1);
        }
        state.declare("total", 0);

        ExecutorConfig config;
        config.thread_count = 6;
        config.ready_policy = policy;
        config.seed = 99;
        auto result = make_thread_pool_executor(config)->execute(graph, state);

        ASSERT_TRUE(result.success) << to_string(policy) << ": " << result.summary();
        EXPECT_EQ(result.completed_tasks.size(), static_cast<size_t>(width + 1));
        EXPECT_EQ(result.completed_tasks.back(), static_cast<TaskIdx>(width));
        EXPECT_EQ(state.get<int>("total"), width * (width - 1) / 2);
    }
}

TEST(ThreadPoolTests, RepeatedRuns_SameExecutor)
{
    auto graph = build_graph({
        make_task("Inc1", {"n"}, {"n"}, [](TaskContext& ctx) { ctx.modify<int>("n") += 1; }),
        make_task("Inc2", {"n"}, {"n"}, [](TaskContext& ctx) { ctx.modify<int>("n") += 1; }),
        make_task("Side", {}, {"m"}, [](TaskContext& ctx) { ctx.set("m", 1); }),
    });

    ExecutorConfig config;
    config.thread_count = 3;
    auto executor = make_thread_pool_executor(config);
    for (int round = 0; round < 50; ++round)
    {
        SharedState state;
        state.declare("n", 0);
        state.declare("m", 0);
        auto result = executor->execute(graph, state);
        ASSERT_TRUE(result.success) << "round " << round;
        EXPECT_EQ(state.get<int>("n"), 2);
    }
}

TEST(ThreadPoolTests, CompletionOrder_RespectsEveryLink)
{
    // Two diamonds in a row; the second one starts as soon as the first joins
    auto graph = build_graph({
        make_task("A", {}, {"x"}, [](TaskContext& ctx) { ctx.set("x", 1); }),
        make_task("B", {"x"}, {"b"}, [](TaskContext& ctx) { ctx.set("b", ctx.get<int>("x")); }),
        make_task("C", {"x"}, {"c"}, [](TaskContext& ctx) { ctx.set("c", ctx.get<int>("x")); }),
        make_task("D", {"b", "c"}, {"y"}, [](TaskContext& ctx) {
            ctx.set("y", ctx.get<int>("b") + ctx.get<int>("c"));
        }),
        make_task("E", {"y"}, {"e"}, [](TaskContext& ctx) { ctx.set("e", ctx.get<int>("y")); }),
        make_task("F", {"y"}, {"f"}, [](TaskContext& ctx) { ctx.set("f", ctx.get<int>("y")); }),
        make_task("G", {"e", "f"}, {"z"}, [](TaskContext& ctx) {
            ctx.set("z", ctx.get<int>("e") + ctx.get<int>("f"));
        }),
    });
    const auto links = graph->links();

    for (int round = 0; round < 200; ++round)
    {
        SharedState state;
        for (const char* name : {"x", "b", "c", "y", "e", "f", "z"})
        {
            state.declare(name, 0);
        }

        ExecutorConfig config;
        config.thread_count = 4;
        config.ready_policy = ReadyPolicy::Random;
        config.seed = static_cast<uint64_t>(round);
        auto result = make_thread_pool_executor(config)->execute(graph, state);
        ASSERT_TRUE(result.success) << "round " << round;
        ASSERT_EQ(result.completed_tasks.size(), graph->task_count());

        std::vector<size_t> position(graph->task_count());
        for (size_t i = 0; i < result.completed_tasks.size(); ++i)
        {
            position[result.completed_tasks[i]] = i;
        }
        for (const auto& [before, after] : links)
        {
            ASSERT_LT(position[before], position[after])
                << "round " << round << ": " << graph->task_name(before)
                << " recorded after " << graph->task_name(after);
        }
        EXPECT_EQ(result.completed_tasks.back(), graph->find_task("G"));
        EXPECT_EQ(state.get<int>("z"), 4);
    }
}
