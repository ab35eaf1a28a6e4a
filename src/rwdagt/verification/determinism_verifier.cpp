#include "rwdagt/verification/determinism_verifier.hpp"
#include "rwdagt/common/logging.hpp"
#include "rwdagt/execution/sequential_executor.hpp"
#include "rwdagt/execution/thread_pool_executor.hpp"
#include <fmt/format.h>

namespace rwdagt
{

namespace
{

std::string render_snapshot(const StateSnapshot& snapshot)
{
    std::string out = "{";
    for (const auto& [name, value] : snapshot)
    {
        if (out.size() > 1)
        {
            out += ", ";
        }
        out += fmt::format("{}={}", name, value);
    }
    return out + "}";
}

} // namespace

std::string VerificationResult::summary() const
{
    if (deterministic)
    {
        return fmt::format("Deterministic across {} trial(s): {}",
                           trials_run, render_snapshot(reference_snapshot));
    }
    std::string out = diverging_trial
        ? fmt::format("Nondeterminism detected in trial {}", *diverging_trial)
        : std::string{"Nondeterminism detected in the sequential reference run"};
    if (failure)
    {
        out += fmt::format(": task '{}' failed: {}", failure->task_name, failure->message);
    }
    else if (diverging_snapshot)
    {
        out += fmt::format(": expected {}, got {}",
                           render_snapshot(reference_snapshot),
                           render_snapshot(*diverging_snapshot));
    }
    return out;
}

DeterminismVerifier::DeterminismVerifier(VerifierConfig config)
    : m_config{std::move(config)}
{}

VerificationResult DeterminismVerifier::verify(std::shared_ptr<const ExecutableGraph> graph,
                                               SharedState& state,
                                               const SnapshotFn& snapshot) const
{
    if (!snapshot)
    {
        throw std::invalid_argument("DeterminismVerifier::verify: empty snapshot function");
    }

    const StateCheckpoint checkpoint = state.checkpoint();
    VerificationResult result;
    try
    {
        result = run_trials(graph, state, checkpoint, snapshot);
    }
    catch (...)
    {
        state.restore(checkpoint);
        throw;
    }
    state.restore(checkpoint);

    if (result.deterministic)
    {
        logger()->info("{}", result.summary());
    }
    else
    {
        logger()->warn("{}", result.summary());
    }
    return result;
}

VerificationResult DeterminismVerifier::run_trials(
    const std::shared_ptr<const ExecutableGraph>& graph,
    SharedState& state,
    const StateCheckpoint& checkpoint,
    const SnapshotFn& snapshot) const
{
    VerificationResult result;
    bool have_reference = false;

    if (m_config.compare_with_sequential)
    {
        ExecutorConfig seq_config;
        seq_config.validate_access = m_config.validate_access;
        auto reference = make_sequential_executor(seq_config)->execute(graph, state);
        if (reference.first_failure && reference.first_failure->undeclared_access)
        {
            // An access outside the declared sets is a race waiting to happen
            result.deterministic = false;
            result.failure = reference.first_failure;
            return result;
        }
        reference.throw_if_failed();
        result.reference_snapshot = snapshot(state);
        have_reference = true;
    }

    for (size_t trial = 0; trial < m_config.trials; ++trial)
    {
        state.restore(checkpoint);

        ExecutorConfig config;
        config.thread_count = m_config.worker_count;
        config.validate_access = m_config.validate_access;
        config.ready_policy = ReadyPolicy::Random;
        config.seed = m_config.seed + trial;

        auto run = make_thread_pool_executor(config)->execute(graph, state);
        result.trials_run = trial + 1;

        if (!run.success)
        {
            result.deterministic = false;
            result.diverging_trial = trial;
            result.failure = run.first_failure;
            return result;
        }

        StateSnapshot current = snapshot(state);
        if (!have_reference)
        {
            result.reference_snapshot = std::move(current);
            have_reference = true;
            continue;
        }
        if (current != result.reference_snapshot)
        {
            result.deterministic = false;
            result.diverging_trial = trial;
            result.diverging_snapshot = std::move(current);
            return result;
        }
    }

    return result;
}

} // namespace rwdagt
