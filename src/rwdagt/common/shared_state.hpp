/**
 * @file shared_state.hpp
 * @brief SharedState: the caller-owned store of shared variables.
 * @see shared_state.inline.hpp for implementations of type-parameterized methods.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/vardata.hpp"

namespace rwdagt
{

/**
 * @brief Exception thrown when a shared variable name is not declared.
 */
class UnknownVariableError : public std::runtime_error
{
public:
    explicit UnknownVariableError(std::string variable)
        : std::runtime_error("Unknown shared variable '" + variable + "'")
        , m_variable(std::move(variable))
    {}

    const std::string& variable() const noexcept
    {
        return m_variable;
    }

private:
    std::string m_variable;
};

class SharedState;

/**
 * @brief Deep copy of every variable in a SharedState.
 */
using StateCheckpoint = std::map<std::string, VarData, std::less<>>;

/**
 * @brief Printable image of the relevant part of a SharedState.
 *
 * @details
 * Maps variable names to rendered values. Two snapshots compare equal iff the
 * same variables rendered to the same strings.
 */
using StateSnapshot = std::map<std::string, std::string>;

/**
 * @brief Caller-supplied accessor producing a snapshot of the state.
 */
using SnapshotFn = std::function<StateSnapshot(const SharedState&)>;

/**
 * @brief Named shared variables accessed by tasks.
 *
 * @details
 * SharedState replaces global variables: every task receives the same
 * SharedState (through its `TaskContext`) and the names in a task's read and
 * write sets are keys into it. The core never reads or writes the state
 * itself; it only hands it to tasks in a safe order.
 *
 * @par Usage
 * 1. Declare every variable with `declare()` before running a graph.
 * 2. Tasks read with `get()` and overwrite with `set()`.
 * 3. Between runs, `checkpoint()` and `restore()` reset the state.
 *
 * @par Thread Safety
 * - `declare()`, `restore()` and `clear()` change the set of variables and
 *   must not run concurrently with anything else.
 * - `get()`, `set()` and `get_mutable()` never change the set of variables.
 *   Concurrent calls are safe when no two of them touch the same variable with
 *   at least one writing, which is exactly what a race-free task graph
 *   guarantees.
 */
class SharedState
{
public:
    /**
     * @brief Declare a variable, or overwrite it if already declared.
     * @tparam T The value type (will be decayed).
     */
    template <typename T>
    void declare(const std::string& name, T&& value);

    /**
     * @brief Overwrite the value of a declared variable.
     * @throws UnknownVariableError if the variable is not declared.
     */
    template <typename T>
    void set(std::string_view name, T&& value);

    /**
     * @brief Read the value of a declared variable.
     * @throws UnknownVariableError if the variable is not declared.
     * @throws VarDataTypeError if the stored type is not T.
     */
    template <typename T>
    const T& get(std::string_view name) const;

    /**
     * @brief Access the value of a declared variable for in-place update.
     * @throws UnknownVariableError if the variable is not declared.
     * @throws VarDataTypeError if the stored type is not T.
     */
    template <typename T>
    T& get_mutable(std::string_view name);

    /**
     * @brief Check whether a variable is declared.
     */
    bool contains(std::string_view name) const noexcept;

    /**
     * @brief Access the raw storage of a declared variable.
     * @throws UnknownVariableError if the variable is not declared.
     */
    const VarData& at(std::string_view name) const;
    VarData& at(std::string_view name);

    /**
     * @brief Names of all declared variables, sorted.
     */
    std::vector<std::string> variable_names() const;

    /**
     * @brief Number of declared variables.
     */
    size_t size() const noexcept
    {
        return m_vars.size();
    }

    /**
     * @brief Take a deep copy of every variable.
     */
    StateCheckpoint checkpoint() const;

    /**
     * @brief Replace the whole state with a deep copy of a checkpoint.
     * @details Variables declared after the checkpoint was taken are removed.
     *          The checkpoint itself is left untouched and may be reused.
     */
    void restore(const StateCheckpoint& checkpoint);

    /**
     * @brief Remove every variable.
     */
    void clear() noexcept
    {
        m_vars.clear();
    }

private:
    std::map<std::string, VarData, std::less<>> m_vars;
};

/**
 * @brief Build a SnapshotFn rendering the named variables of type T with fmt.
 *
 * @details
 * Variables that are not declared render as `<undeclared>`, and empty ones as
 * `<empty>`, so that a missing write shows up as a difference rather than an
 * exception.
 */
template <typename T>
SnapshotFn make_snapshot_fn(std::vector<std::string> names);

} // namespace rwdagt
