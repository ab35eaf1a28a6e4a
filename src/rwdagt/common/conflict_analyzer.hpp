/**
 * @file conflict_analyzer.hpp
 * @brief Bernstein conflict test between two tasks' access sets.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/graph_core_enums.hpp"

namespace rwdagt
{

class TaskSpec;

/**
 * @brief Index-based read and write sets of one task.
 *
 * @details
 * Both vectors must be sorted ascending and free of duplicates. A variable may
 * appear in both sets (read-modify-write).
 */
struct AccessSets
{
    std::vector<VarIdx> reads;
    std::vector<VarIdx> writes;

    /**
     * @brief Sort and deduplicate both sets in place.
     */
    void normalize();

    /**
     * @brief True if the task declares no access at all.
     */
    bool empty() const noexcept
    {
        return reads.empty() && writes.empty();
    }
};

/**
 * @brief Bit flags describing how two tasks conflict.
 *
 * @details
 * Named from the point of view of the first task passed to
 * `ConflictAnalyzer::analyze(a, b)`: `WriteRead` means a writes what b reads.
 */
enum ConflictKind : unsigned
{
    NoConflict = 0u,
    WriteRead  = 1u << 0,
    ReadWrite  = 1u << 1,
    WriteWrite = 1u << 2
};

/**
 * @brief Detailed conflict information for one pair of tasks.
 */
struct ConflictReport
{
    /// Bitwise OR of ConflictKind flags.
    unsigned kinds{NoConflict};

    /// Variables involved in any conflict, sorted ascending.
    std::vector<VarIdx> variables;

    bool conflicting() const noexcept
    {
        return kinds != NoConflict;
    }
};

/**
 * @brief Decides whether two tasks may run concurrently (Bernstein's conditions).
 *
 * @details
 * Two tasks A and B conflict iff
 * `(writes(A) ∩ reads(B)) ∪ (reads(A) ∩ writes(B)) ∪ (writes(A) ∩ writes(B))`
 * is non-empty. Conflicting tasks must be ordered by the graph; non-conflicting
 * tasks may interleave freely.
 *
 * All functions are pure and operate on sorted sets, so each test costs time
 * linear in the sizes of the sets involved.
 */
class ConflictAnalyzer
{
public:
    /**
     * @brief Test two index-based access sets for a conflict.
     */
    static bool conflicts(const AccessSets& a, const AccessSets& b) noexcept;

    /**
     * @brief Test two task definitions for a conflict.
     */
    static bool conflicts(const TaskSpec& a, const TaskSpec& b) noexcept;

    /**
     * @brief Classify the conflict between two access sets.
     */
    static ConflictReport analyze(const AccessSets& a, const AccessSets& b);

    /**
     * @brief Render a ConflictKind bitmask such as "write-read|write-write".
     */
    static std::string describe(unsigned kinds);
};

} // namespace rwdagt
