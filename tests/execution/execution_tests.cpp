#include <gtest/gtest.h>
#include "rwdagt/common/graph_builder.hpp"
#include "rwdagt/common/task_context.hpp"
#include "rwdagt/execution/executable_graph.hpp"
#include "rwdagt/execution/sequential_executor.hpp"
#include "rwdagt/execution/task_wrapper.hpp"
#include "rwdagt/execution/thread_pool_executor.hpp"
#include <atomic>

using namespace rwdagt;

// =============================================================================
// Test Helpers
// =============================================================================

namespace
{

using Trace = std::vector<std::string>;

/**
 * @brief Task that appends its name to the shared "trace" variable.
 */
TaskSpecPtr tracing_task(const std::string& name,
                         std::vector<std::string> reads,
                         std::vector<std::string> writes)
{
    reads.push_back("trace");
    writes.push_back("trace");
    return make_task(name, std::move(reads), std::move(writes),
                     [name](TaskContext& ctx) {
                         ctx.modify<Trace>("trace").push_back(name);
                     });
}

TaskSpecPtr failing_task(const std::string& name,
                         std::vector<std::string> reads,
                         std::vector<std::string> writes)
{
    return make_task(name, std::move(reads), std::move(writes),
                     [name](TaskContext&) {
                         throw std::runtime_error("boom in " + name);
                     });
}

/**
 * @brief Task that sets @p variable to 1 and touches nothing else.
 */
TaskSpecPtr independent_task(const std::string& name, const std::string& variable)
{
    return make_task(name, {}, {variable},
                     [variable](TaskContext& ctx) { ctx.set(variable, 1); });
}

std::shared_ptr<const ExecutableGraph> build_graph(const std::vector<TaskSpecPtr>& tasks)
{
    GraphBuilder builder(true);
    for (const auto& task : tasks)
    {
        builder.add_task(task);
    }
    return builder.build();
}

} // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class ExecutionTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        state.declare("trace", Trace{});
        state.declare("x", 0);
        state.declare("y", 0);
    }

    ExecutionResult run_sequential(const std::shared_ptr<const ExecutableGraph>& graph,
                                   ExecutorConfig config = {})
    {
        return make_sequential_executor(config)->execute(graph, state);
    }

    ExecutionResult run_single_worker_pool(const std::shared_ptr<const ExecutableGraph>& graph,
                                           ExecutorConfig config = {})
    {
        config.thread_count = 1;
        return make_thread_pool_executor(config)->execute(graph, state);
    }

    const Trace& trace() const
    {
        return state.get<Trace>("trace");
    }

    SharedState state;
};

// =============================================================================
// ExecutableGraph Tests
// =============================================================================

TEST_F(ExecutionTests, ExecutableGraph_GetInitialReadyTasks_NoTasks)
{
    ExecutableGraph graph;
    EXPECT_TRUE(graph.get_initial_ready_tasks().empty());
}

TEST_F(ExecutionTests, ExecutableGraph_GetInitialReadyTasks_SomeReady)
{
    ExecutableGraph graph;
    graph.predecessor_counts = {0, 1, 0, 2};
    auto ready = graph.get_initial_ready_tasks();
    EXPECT_EQ(ready, (std::vector<TaskIdx>{0, 2}));
}

TEST_F(ExecutionTests, Build_LinearChain_CorrectPredecessorCounts)
{
    // A writes x, B reads x and writes y, C reads y
    auto graph = build_graph({
        make_task("A", {}, {"x"}),
        make_task("B", {"x"}, {"y"}),
        make_task("C", {"y"}, {}),
    });
    EXPECT_EQ(graph->predecessor_counts, (std::vector<size_t>{0, 1, 1}));
    EXPECT_TRUE(graph->has_path("A", "C"));
}

// =============================================================================
// SequentialExecutor Tests
// =============================================================================

TEST_F(ExecutionTests, Sequential_EmptyGraph_Succeeds)
{
    auto graph = build_graph({});
    auto result = run_sequential(graph);

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.completed_tasks.empty());
    EXPECT_TRUE(result.failed_tasks.empty());
    EXPECT_FALSE(result.first_failure.has_value());
}

TEST_F(ExecutionTests, Sequential_LinearChain_ExecutesInOrder)
{
    auto graph = build_graph({
        tracing_task("A", {}, {"x"}),
        tracing_task("B", {"x"}, {"y"}),
        tracing_task("C", {"y"}, {}),
    });
    auto result = run_sequential(graph);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.completed_tasks, (std::vector<TaskIdx>{0, 1, 2}));
    EXPECT_EQ(trace(), (Trace{"A", "B", "C"}));
}

TEST_F(ExecutionTests, Sequential_IndependentTasks_RunInDeclarationOrder)
{
    std::atomic<int> counter{0};
    std::vector<int> seen(3, -1);
    std::vector<TaskSpecPtr> tasks;
    for (int i = 0; i < 3; ++i)
    {
        tasks.push_back(make_task("T" + std::to_string(i), {}, {},
                                  [i, &counter, &seen](TaskContext&) { seen[i] = counter++; }));
    }
    auto result = run_sequential(build_graph(tasks));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.completed_tasks, (std::vector<TaskIdx>{0, 1, 2}));
    EXPECT_EQ(seen, (std::vector<int>{0, 1, 2}));
}

TEST_F(ExecutionTests, Sequential_TaskFailure_AbortsExecution)
{
    auto graph = build_graph({
        failing_task("A", {}, {"x"}),
        tracing_task("B", {"x"}, {}),
        independent_task("C", "y"),
    });
    auto result = run_sequential(graph);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.aborted);
    EXPECT_EQ(result.failed_tasks, (std::vector<TaskIdx>{0}));
    EXPECT_EQ(result.cancelled_tasks, (std::vector<TaskIdx>{1, 2}));
    EXPECT_TRUE(result.completed_tasks.empty());
    EXPECT_TRUE(trace().empty());

    ASSERT_TRUE(result.first_failure.has_value());
    EXPECT_EQ(result.first_failure->task_idx, 0u);
    EXPECT_EQ(result.first_failure->task_name, "A");
    EXPECT_EQ(result.first_failure->message, "boom in A");
    ASSERT_EQ(result.error_messages.size(), 1u);
    EXPECT_EQ(result.error_messages[0], "boom in A");
}

TEST_F(ExecutionTests, Sequential_ThrowIfFailed_CarriesTaskNameAndCause)
{
    auto graph = build_graph({failing_task("A", {}, {"x"})});
    auto result = run_sequential(graph);

    try
    {
        result.throw_if_failed();
        FAIL() << "Expected TaskExecutionError";
    }
    catch (const TaskExecutionError& e)
    {
        EXPECT_EQ(e.task_name(), "A");
        EXPECT_EQ(std::string(e.what()), "Task 'A' failed: boom in A");
        EXPECT_THROW(std::rethrow_exception(e.cause()), std::runtime_error);
    }
}

TEST_F(ExecutionTests, Sequential_AbortDisabled_ContinuesIndependentTasks)
{
    auto graph = build_graph({
        failing_task("A", {}, {"x"}),
        tracing_task("B", {"x"}, {}),
        independent_task("C", "y"),
    });
    ExecutorConfig config;
    config.abort_on_failure = false;
    auto result = run_sequential(graph, config);

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.aborted);
    EXPECT_EQ(result.failed_tasks, (std::vector<TaskIdx>{0}));
    // B depends on the failed task and never becomes ready
    EXPECT_EQ(result.cancelled_tasks, (std::vector<TaskIdx>{1}));
    EXPECT_EQ(result.completed_tasks, (std::vector<TaskIdx>{2}));
    EXPECT_EQ(state.get<int>("y"), 1);
    EXPECT_TRUE(trace().empty());
}

TEST_F(ExecutionTests, Sequential_UndeclaredWrite_FailsTask)
{
    auto graph = build_graph({
        make_task("Sneaky", {}, {"x"},
                  [](TaskContext& ctx) { ctx.set("y", 5); }),
    });
    auto result = run_sequential(graph);

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.first_failure.has_value());
    EXPECT_THROW(std::rethrow_exception(result.first_failure->cause), UndeclaredAccessError);
    EXPECT_EQ(state.get<int>("y"), 0);
}

TEST_F(ExecutionTests, Sequential_ValidationDisabled_AllowsUndeclaredWrite)
{
    auto graph = build_graph({
        make_task("Sneaky", {}, {"x"},
                  [](TaskContext& ctx) { ctx.set("y", 5); }),
    });
    ExecutorConfig config;
    config.validate_access = false;
    auto result = run_sequential(graph, config);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(state.get<int>("y"), 5);
}

TEST_F(ExecutionTests, Sequential_WithTiming_CollectsDurations)
{
    auto graph = build_graph({tracing_task("A", {}, {}), tracing_task("B", {}, {})});
    ExecutorConfig config;
    config.collect_timing = true;
    auto result = run_sequential(graph, config);

    EXPECT_TRUE(result.success);
    ASSERT_EQ(result.task_durations.size(), 2u);
    EXPECT_GE(result.task_durations[0].count(), 0);
    EXPECT_GE(result.total_duration.count(), 0);
}

TEST_F(ExecutionTests, Sequential_WithoutTiming_NoDurations)
{
    auto result = run_sequential(build_graph({tracing_task("A", {}, {})}));
    EXPECT_TRUE(result.task_durations.empty());
}

TEST_F(ExecutionTests, Sequential_ExecutorReusable)
{
    auto graph = build_graph({failing_task("A", {}, {"x"})});
    auto executor = make_sequential_executor();

    auto first = executor->execute(graph, state);
    EXPECT_FALSE(first.success);

    auto good = build_graph({tracing_task("B", {}, {})});
    auto second = executor->execute(good, state);
    EXPECT_TRUE(second.success);
    EXPECT_FALSE(second.aborted);
    EXPECT_FALSE(second.first_failure.has_value());
}

// =============================================================================
// ThreadPoolExecutor Failure Handling
// =============================================================================

TEST_F(ExecutionTests, ThreadPool_TaskFailure_AbortsExecution)
{
    auto graph = build_graph({
        failing_task("A", {}, {"x"}),
        tracing_task("B", {"x"}, {}),
        independent_task("C", "y"),
    });
    auto result = run_single_worker_pool(graph);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.aborted);
    EXPECT_EQ(result.failed_tasks, (std::vector<TaskIdx>{0}));
    EXPECT_EQ(result.cancelled_tasks, (std::vector<TaskIdx>{1, 2}));
    ASSERT_TRUE(result.first_failure.has_value());
    EXPECT_EQ(result.first_failure->task_name, "A");
    EXPECT_THROW(result.throw_if_failed(), TaskExecutionError);
}

TEST_F(ExecutionTests, ThreadPool_AbortDisabled_ContinuesIndependentTasks)
{
    auto graph = build_graph({
        failing_task("A", {}, {"x"}),
        tracing_task("B", {"x"}, {}),
        independent_task("C", "y"),
    });
    ExecutorConfig config;
    config.abort_on_failure = false;
    config.thread_count = 2;
    auto result = make_thread_pool_executor(config)->execute(graph, state);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failed_tasks, (std::vector<TaskIdx>{0}));
    EXPECT_EQ(result.cancelled_tasks, (std::vector<TaskIdx>{1}));
    EXPECT_EQ(result.completed_tasks, (std::vector<TaskIdx>{2}));
}

TEST_F(ExecutionTests, ThreadPool_EmptyGraph_Succeeds)
{
    ExecutorConfig config;
    config.thread_count = 4;
    auto executor = make_thread_pool_executor(config);
    auto result = executor->execute(build_graph({}), state);

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.completed_tasks.empty());
    EXPECT_EQ(executor->last_worker_count(), 1u);
}

// =============================================================================
// TaskWrapper State Tests
// =============================================================================

TEST_F(ExecutionTests, TaskWrapper_InitialState_NotReadyOrReady)
{
    auto task = make_task("A", {}, {});
    auto executor = make_sequential_executor();

    // Task with predecessors starts NotReady
    TaskWrapper wrapper1(task, 0, state, true, 2, executor);
    EXPECT_EQ(wrapper1.state(), TaskState::NotReady);
    EXPECT_FALSE(wrapper1.is_ready());

    // Task without predecessors starts Ready
    TaskWrapper wrapper2(task, 0, state, true, 0, executor);
    EXPECT_EQ(wrapper2.state(), TaskState::Ready);
    EXPECT_TRUE(wrapper2.is_ready());
}

TEST_F(ExecutionTests, TaskWrapper_DecrementPredecessorCount_BecomesReady)
{
    auto task = make_task("A", {}, {});
    auto executor = make_sequential_executor();
    auto wrapper = std::make_shared<TaskWrapper>(task, 0, state, true, 2, executor);

    EXPECT_FALSE(wrapper->decrement_predecessor_count());  // 2 -> 1
    EXPECT_FALSE(wrapper->is_ready());

    EXPECT_TRUE(wrapper->decrement_predecessor_count());   // 1 -> 0
    EXPECT_TRUE(wrapper->is_ready());
    EXPECT_EQ(wrapper->state(), TaskState::Ready);
}

TEST_F(ExecutionTests, TaskWrapper_MarkQueued_OnlyFromReady)
{
    auto task = make_task("A", {}, {});
    auto executor = make_sequential_executor();

    TaskWrapper waiting(task, 0, state, true, 1, executor);
    EXPECT_FALSE(waiting.mark_queued());

    TaskWrapper ready(task, 0, state, true, 0, executor);
    EXPECT_TRUE(ready.mark_queued());
    EXPECT_EQ(ready.state(), TaskState::Queued);
}

TEST_F(ExecutionTests, TaskWrapper_Cancel_SetsState)
{
    auto task = make_task("A", {}, {});
    auto executor = make_sequential_executor();

    TaskWrapper wrapper(task, 0, state, true, 1, executor);
    EXPECT_EQ(wrapper.state(), TaskState::NotReady);

    EXPECT_TRUE(wrapper.cancel());
    EXPECT_EQ(wrapper.state(), TaskState::Cancelled);
    EXPECT_FALSE(wrapper.cancel());
    EXPECT_FALSE(wrapper.decrement_predecessor_count() && wrapper.mark_queued());
    EXPECT_EQ(wrapper.state(), TaskState::Cancelled);
}

TEST_F(ExecutionTests, TaskWrapper_RunWithoutExecutor_Throws)
{
    auto task = make_task("A", {}, {});
    std::weak_ptr<Executor> gone;
    {
        auto executor = make_sequential_executor();
        gone = executor;
    }
    TaskWrapper wrapper(task, 0, state, true, 0, gone);
    EXPECT_THROW(wrapper.run(), std::logic_error);
}
