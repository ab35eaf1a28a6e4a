/**
 * @file determinism_verifier.hpp
 * @brief DeterminismVerifier: randomized parallel trials against a reference run.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/shared_state.hpp"
#include "rwdagt/execution/executable_graph.hpp"
#include "rwdagt/execution/execution_result.hpp"

namespace rwdagt
{

/**
 * @brief Configuration for DeterminismVerifier.
 */
struct VerifierConfig
{
    /**
     * @brief Number of parallel trials.
     */
    size_t trials{100};

    /**
     * @brief Workers per trial; 0 means the hardware concurrency.
     */
    size_t worker_count{0};

    /**
     * @brief Base seed; trial `t` uses `seed + t` for its Random ready policy.
     */
    uint64_t seed{0};

    /**
     * @brief Whether tasks' accesses are checked against their declared sets.
     * @details Disable to observe what an under-declared graph actually does.
     */
    bool validate_access{true};

    /**
     * @brief Compare against a sequential reference run.
     * @details If false, trials are compared with the first trial instead.
     */
    bool compare_with_sequential{true};
};

/**
 * @brief Outcome of a determinism check.
 *
 * @details
 * `deterministic == false` is the "nondeterminism detected" outcome: the
 * trial index and either the diverging snapshot or the trial's failure are
 * recorded. It is a value, not an exception. When the sequential reference
 * run already hits an undeclared access, `diverging_trial` is empty and
 * `failure` names the offending task.
 */
struct VerificationResult
{
    bool deterministic{true};
    std::optional<size_t> diverging_trial;
    size_t trials_run{0};
    StateSnapshot reference_snapshot;
    std::optional<StateSnapshot> diverging_snapshot;
    std::optional<TaskFailure> failure;

    std::string summary() const;
};

/**
 * @brief Checks that parallel runs of a graph always end in the same state.
 *
 * @details
 * The verifier checkpoints the state, runs the graph sequentially to obtain a
 * reference snapshot, then runs it `trials` times on a ThreadPoolExecutor with
 * a differently seeded Random ready policy each time, restoring the
 * checkpoint before every run. The state is restored to the checkpoint before
 * verify() returns.
 *
 * A graph whose tasks declare their accesses honestly always passes. A task
 * that touches a variable it did not declare can race with another task;
 * randomized schedules make that visible as a diverging snapshot.
 */
class DeterminismVerifier
{
public:
    explicit DeterminismVerifier(VerifierConfig config = {});

    const VerifierConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Run the trials and compare their snapshots.
     * @param graph The graph to check.
     * @param state The state the graph runs against; restored before return.
     * @param snapshot Produces the compared image of the state.
     * @throws std::invalid_argument if snapshot is empty.
     * @throws TaskExecutionError if the reference run fails for any reason
     *         other than an undeclared access.
     */
    VerificationResult verify(std::shared_ptr<const ExecutableGraph> graph,
                              SharedState& state,
                              const SnapshotFn& snapshot) const;

private:
    VerificationResult run_trials(const std::shared_ptr<const ExecutableGraph>& graph,
                                  SharedState& state,
                                  const StateCheckpoint& checkpoint,
                                  const SnapshotFn& snapshot) const;

    VerifierConfig m_config;
};

} // namespace rwdagt
