#include "rwdagt/common/logging.hpp"
#include "rwdagt/task_system.hpp"
#include <iostream>
#include <stdexcept>
#include <thread>
#include <spdlog/cfg/env.h>

using namespace rwdagt;

namespace
{

void sleep_ms(int ms)
{
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void run_sum_scenario()
{
    auto log = logger();

    SharedState state;
    state.declare("X", 0);
    state.declare("Y", 0);
    state.declare("Z", 0);

    TaskSystem system({
        TaskSpec("T1", {}, {"X"}, [](TaskContext& ctx) { ctx.set("X", 1); }),
        TaskSpec("T2", {}, {"Y"}, [](TaskContext& ctx) { ctx.set("Y", 2); }),
        TaskSpec("Tsum", {"X", "Y"}, {"Z"}, [](TaskContext& ctx) {
            ctx.set("Z", ctx.get<int>("X") + ctx.get<int>("Y"));
        }),
    }, {}, TaskSystemOptions{true, true, make_snapshot_fn<int>({"X", "Y", "Z"})});

    for (const auto& [before, after] : system.graph().links())
    {
        log->info("Edge {} -> {}", system.graph().task_name(before), system.graph().task_name(after));
    }

    auto checkpoint = state.checkpoint();
    system.run_sequential(state).throw_if_failed();
    log->info("Sequential: Z = {}", state.get<int>("Z"));

    state.restore(checkpoint);
    system.run_parallel(state).throw_if_failed();
    log->info("Parallel: Z = {}", state.get<int>("Z"));

    state.restore(checkpoint);
    log->info("{}", system.test_determinism(state, 100).summary());
}

void run_workflow_scenario()
{
    auto log = logger();

    auto work = [](int ms, std::vector<std::string> inputs, std::string output) {
        return [ms, inputs = std::move(inputs), output = std::move(output)](TaskContext& ctx) {
            sleep_ms(ms);
            int value = 1;
            for (const auto& input : inputs)
            {
                value += ctx.get<int>(input);
            }
            ctx.set(output, value);
        };
    };

    std::vector<std::string> variables{
        "data", "resultA", "resultB", "resultC", "mergedAB", "processedC", "final"};

    SharedState state;
    for (const auto& name : variables)
    {
        state.declare(name, 0);
    }

    TaskSystem system(
        {
            TaskSpec("LoadData", {}, {"data"}, work(30, {}, "data")),
            TaskSpec("ProcessA", {"data"}, {"resultA"}, work(20, {"data"}, "resultA")),
            TaskSpec("ProcessB", {"data"}, {"resultB"}, work(40, {"data"}, "resultB")),
            TaskSpec("ProcessC", {"data"}, {"resultC"}, work(30, {"data"}, "resultC")),
            TaskSpec("MergeAB", {"resultA", "resultB"}, {"mergedAB"},
                     work(20, {"resultA", "resultB"}, "mergedAB")),
            TaskSpec("MergeC", {"resultC"}, {"processedC"}, work(10, {"resultC"}, "processedC")),
            TaskSpec("FinalMerge", {"mergedAB", "processedC"}, {"final"},
                     work(20, {"mergedAB", "processedC"}, "final")),
        },
        {
            {"ProcessA", {"LoadData"}},
            {"ProcessB", {"LoadData"}},
            {"ProcessC", {"LoadData"}},
            {"MergeAB", {"ProcessA", "ProcessB"}},
            {"MergeC", {"ProcessC"}},
            {"FinalMerge", {"MergeAB", "MergeC"}},
        });

    for (const auto& warning : system.diagnostics())
    {
        log->info("Diagnostic: {}", warning);
    }

    auto report = system.measure_performance(state, 0, 3);
    log->info("Workflow: {}", report.summary());

    system.run_parallel(state).throw_if_failed();
    log->info("Workflow final = {}", state.get<int>("final"));
}

} // namespace

int main(int argc, char** argv)
{
    (void)argc;
    (void)argv;
    try
    {
        spdlog::cfg::load_env_levels();
        std::cout << "\n\n====== rwdagt ======\n" << std::flush;

        run_sum_scenario();
        run_workflow_scenario();

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
