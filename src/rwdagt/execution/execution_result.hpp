/**
 * @file execution_result.hpp
 * @brief Definition of ExecutionResult returned by IExecutor::execute().
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/graph_core_enums.hpp"
#include "rwdagt/common/shared_state.hpp"

namespace rwdagt
{

/**
 * @brief Render the message of a captured exception.
 * @return `what()` for std::exception, a fixed text otherwise.
 */
inline std::string describe_exception(const std::exception_ptr& ep)
{
    if (!ep)
    {
        return "Unknown error";
    }
    try
    {
        std::rethrow_exception(ep);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "Unknown exception";
    }
}

/**
 * @brief Exception raised when a task of a run failed.
 *
 * @details
 * Names the failing task and keeps the exception the task threw as `cause()`,
 * so callers can rethrow or inspect the original error.
 */
class TaskExecutionError : public std::runtime_error
{
public:
    TaskExecutionError(std::string task_name, const std::string& message,
                       std::exception_ptr cause)
        : std::runtime_error(message)
        , m_task_name(std::move(task_name))
        , m_cause(std::move(cause))
    {}

    const std::string& task_name() const noexcept
    {
        return m_task_name;
    }

    const std::exception_ptr& cause() const noexcept
    {
        return m_cause;
    }

private:
    std::string m_task_name;
    std::exception_ptr m_cause;
};

/**
 * @brief The failure that aborted (or first disturbed) a run.
 */
struct TaskFailure
{
    TaskIdx task_idx{npos_idx};
    std::string task_name;
    std::string message;
    std::exception_ptr cause;

    /// The task touched a variable outside its declared read and write sets.
    bool undeclared_access{false};
};

/**
 * @brief Result of executing a task graph.
 *
 * @details
 * ExecutionResult captures the outcome of running an ExecutableGraph:
 * - Success/failure status
 * - Which tasks completed, in completion order
 * - Which tasks failed and their errors
 * - Which tasks were cancelled (never dispatched)
 * - Timing information (per-task only if collected)
 */
struct ExecutionResult
{
    /**
     * @brief Overall success status.
     * @details True if all tasks completed successfully.
     */
    bool success{true};

    /**
     * @brief Indices of tasks that completed successfully, in completion order.
     */
    std::vector<TaskIdx> completed_tasks;

    /**
     * @brief Indices of tasks that failed.
     */
    std::vector<TaskIdx> failed_tasks;

    /**
     * @brief Error messages for failed tasks, parallel to failed_tasks.
     */
    std::vector<std::string> error_messages;

    /**
     * @brief Indices of tasks that never ran.
     */
    std::vector<TaskIdx> cancelled_tasks;

    /**
     * @brief The earliest failure observed, if any.
     */
    std::optional<TaskFailure> first_failure;

    /**
     * @brief Total execution duration (wall-clock time).
     */
    std::chrono::nanoseconds total_duration{0};

    /**
     * @brief Per-task durations, indexed by TaskIdx.
     * @details Only populated if timing collection is enabled.
     */
    std::vector<std::chrono::nanoseconds> task_durations;

    /**
     * @brief True if a failure aborted the run.
     */
    bool aborted{false};

    /**
     * @brief Snapshot of the state after the run, if one was requested.
     */
    std::optional<StateSnapshot> snapshot;

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result;
        if (success)
        {
            result = "Execution succeeded";
        }
        else if (aborted)
        {
            result = "Execution aborted";
        }
        else
        {
            result = "Execution failed";
        }
        result += " (completed=" + std::to_string(completed_tasks.size());
        result += ", failed=" + std::to_string(failed_tasks.size());
        result += ", cancelled=" + std::to_string(cancelled_tasks.size()) + ")";
        if (first_failure)
        {
            result += ": task '" + first_failure->task_name + "': " + first_failure->message;
        }
        return result;
    }

    /**
     * @brief Raise the first failure as a TaskExecutionError.
     * @throws TaskExecutionError if the run did not succeed.
     */
    void throw_if_failed() const
    {
        if (success)
        {
            return;
        }
        if (first_failure)
        {
            throw TaskExecutionError(
                first_failure->task_name,
                "Task '" + first_failure->task_name + "' failed: " + first_failure->message,
                first_failure->cause);
        }
        throw TaskExecutionError({}, summary(), nullptr);
    }
};

} // namespace rwdagt
