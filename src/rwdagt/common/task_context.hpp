/**
 * @file task_context.hpp
 * @brief TaskContext: a task's view of the shared state.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/graph_core_enums.hpp"
#include "rwdagt/common/shared_state.inline.hpp"
#include "rwdagt/common/task_spec.hpp"

namespace rwdagt
{

/**
 * @brief Exception thrown when a task touches a variable it did not declare.
 *
 * @details
 * Raised by `TaskContext` when access validation is enabled. The task fails
 * with this exception as its cause, which points at the read or write set
 * that needs fixing.
 */
class UndeclaredAccessError : public std::logic_error
{
public:
    UndeclaredAccessError(std::string task, std::string variable, Access access)
        : std::logic_error("Task '" + task + "' performed an undeclared " +
                           to_string(access) + " of variable '" + variable + "'")
        , m_task(std::move(task))
        , m_variable(std::move(variable))
        , m_access(access)
    {}

    const std::string& task() const noexcept { return m_task; }
    const std::string& variable() const noexcept { return m_variable; }
    Access access() const noexcept { return m_access; }

private:
    std::string m_task;
    std::string m_variable;
    Access m_access;
};

/**
 * @brief Access to the shared state on behalf of one running task.
 *
 * @details
 * Executors create one TaskContext per task run and pass it to the task's
 * callable. When validation is enabled, every access is checked against the
 * task's declared read and write sets:
 * - `get()` requires the variable in `reads`.
 * - `set()` requires the variable in `writes`.
 * - `modify()` requires the variable in both.
 *
 * @par Thread Safety
 * - A TaskContext is used by one task on one thread.
 */
class TaskContext
{
public:
    TaskContext(const TaskSpec& task, TaskIdx task_idx, SharedState& state,
                bool validate_access)
        : m_task{task}
        , m_task_idx{task_idx}
        , m_state{state}
        , m_validate_access{validate_access}
    {}

    TaskContext(const TaskContext&) = delete;
    TaskContext& operator=(const TaskContext&) = delete;

    /**
     * @brief Read a shared variable.
     * @throws UndeclaredAccessError if validating and the read is undeclared.
     */
    template <typename T>
    const T& get(std::string_view name) const
    {
        check_access(name, Access::Read);
        return m_state.get<T>(name);
    }

    /**
     * @brief Overwrite a shared variable.
     * @throws UndeclaredAccessError if validating and the write is undeclared.
     */
    template <typename T>
    void set(std::string_view name, T&& value)
    {
        check_access(name, Access::Write);
        m_state.set(name, std::forward<T>(value));
    }

    /**
     * @brief Update a shared variable in place (read-modify-write).
     * @throws UndeclaredAccessError if validating and either access is undeclared.
     */
    template <typename T>
    T& modify(std::string_view name)
    {
        check_access(name, Access::Read);
        check_access(name, Access::Write);
        return m_state.get_mutable<T>(name);
    }

    const TaskSpec& task() const noexcept { return m_task; }
    const std::string& task_name() const noexcept { return m_task.name(); }
    TaskIdx task_idx() const noexcept { return m_task_idx; }
    bool validates_access() const noexcept { return m_validate_access; }

private:
    void check_access(std::string_view name, Access access) const;

    const TaskSpec& m_task;
    TaskIdx m_task_idx;
    SharedState& m_state;
    bool m_validate_access;
};

} // namespace rwdagt
