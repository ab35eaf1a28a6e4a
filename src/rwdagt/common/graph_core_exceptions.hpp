/**
 * @file graph_core_exceptions.hpp
 */
#pragma once
#include "rwdagt/common/common.hpp"

namespace rwdagt
{

/**
 * @brief Error codes for graph construction.
 *
 * @details
 * `DuplicateTaskName`, `UnknownTaskReference` and `CycleDetected` are the
 * structural errors a caller can trigger through task declarations and
 * precedence hints. The index-related codes indicate misuse of the
 * index-based `GraphCore` API.
 */
enum class GraphCoreErrorCode
{
    InvalidTaskIndex,
    DuplicateTaskIndex,
    DuplicateTaskName,
    UnknownTaskReference,
    CycleDetected,
    InvalidState,
    InvariantViolation
};

/**
 * @brief Get a printable name for an error code.
 */
inline const char* to_string(GraphCoreErrorCode code) noexcept
{
    switch (code)
    {
    case GraphCoreErrorCode::InvalidTaskIndex:
        return "InvalidTaskIndex";
    case GraphCoreErrorCode::DuplicateTaskIndex:
        return "DuplicateTaskIndex";
    case GraphCoreErrorCode::DuplicateTaskName:
        return "DuplicateTaskName";
    case GraphCoreErrorCode::UnknownTaskReference:
        return "UnknownTaskReference";
    case GraphCoreErrorCode::CycleDetected:
        return "CycleDetected";
    case GraphCoreErrorCode::InvalidState:
        return "InvalidState";
    case GraphCoreErrorCode::InvariantViolation:
        return "InvariantViolation";
    }
    return "Unknown";
}

/**
 * @brief Exception class for graph construction errors.
 *
 * @details
 * `GraphCoreError` is thrown by `GraphCore` and `GraphBuilder` when
 * preconditions are violated, a name is duplicated or unknown, or the
 * precedence hints would form a cycle. Each exception carries an error code,
 * a descriptive message, and the names of the tasks involved (when known).
 *
 * For `DuplicateTaskName` and `UnknownTaskReference`, `task_names()` holds the
 * offending name. For `CycleDetected`, it holds the two endpoints of the hint
 * that closes the cycle, as (before, after).
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class GraphCoreError : public std::exception
{
public:
    /**
     * @brief Construct a GraphCoreError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     * @param task_names Names of the tasks involved, if any.
     */
    GraphCoreError(GraphCoreErrorCode code, std::string message,
                   std::vector<std::string> task_names = {})
        : m_code(code)
        , m_message(std::move(message))
        , m_task_names(std::move(task_names))
    {
    }

    /**
     * @brief Get the error code.
     * @return The error code for this exception.
     */
    GraphCoreErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the names of the tasks involved in the error.
     */
    const std::vector<std::string>& task_names() const noexcept
    {
        return m_task_names;
    }

    /**
     * @brief Get the error message.
     * @return A C-string describing the error.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    GraphCoreErrorCode m_code;
    std::string m_message;
    std::vector<std::string> m_task_names;
};

} // namespace rwdagt
