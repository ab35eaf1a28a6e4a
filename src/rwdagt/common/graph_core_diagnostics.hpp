/**
 * @file graph_core_diagnostics.hpp
 * @brief Errors and warnings found while validating precedence hints.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/graph_core_enums.hpp"

namespace rwdagt
{

enum class DiagnosticSeverity
{
    Warning,  ///< Reported, but the graph can still be built.
    Error     ///< The graph cannot be built.
};

enum class DiagnosticCategory
{
    Cycle,          ///< The precedence hints contain a cycle.
    OrphanTask,     ///< A task has no reads, no writes and no hints.
    RedundantHint,  ///< A hint is a duplicate or is implied by other hints.
    InternalError   ///< An internal consistency error.
};

/**
 * @brief One finding about the hint graph.
 *
 * @details
 * Tasks are named by declaration index and hints by their position in the
 * order they were added; `GraphBuilder::describe()` renders both with task
 * names.
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Tasks the finding is about, in ascending index order.
    std::vector<TaskIdx> involved_tasks;

    /// Hints responsible for the finding, in the order they were added.
    std::vector<size_t> blamed_hint_links;
};

/**
 * @brief Result of `GraphCore::get_diagnostics()`.
 *
 * @details
 * A Cycle is the only error: every hint between two tasks that Kahn's
 * algorithm could not release is blamed for it. Inferred links are never
 * blamed, because they always follow the hint-consistent order.
 * OrphanTask and RedundantHint are warnings and do not block export.
 *
 * @par Thread safety
 * - Filled once by GraphCore, then only read. Concurrent reads are safe.
 */
class GraphCoreDiagnostics
{
public:
    /**
     * @brief File an item under errors or warnings according to its severity.
     */
    void add(DiagnosticItem item)
    {
        if (item.severity == DiagnosticSeverity::Error)
        {
            m_errors.push_back(std::move(item));
        }
        else
        {
            m_warnings.push_back(std::move(item));
        }
    }

    bool has_errors() const noexcept { return !m_errors.empty(); }
    bool has_warnings() const noexcept { return !m_warnings.empty(); }

    /// True when nothing blocks export; warnings are allowed.
    bool is_valid() const noexcept { return m_errors.empty(); }

    const std::vector<DiagnosticItem>& errors() const noexcept { return m_errors; }
    const std::vector<DiagnosticItem>& warnings() const noexcept { return m_warnings; }

    /**
     * @brief Number of items of one category, errors and warnings together.
     */
    size_t count(DiagnosticCategory category) const noexcept
    {
        auto matches = [category](const DiagnosticItem& item) { return item.category == category; };
        return static_cast<size_t>(std::count_if(m_errors.begin(), m_errors.end(), matches) +
                                   std::count_if(m_warnings.begin(), m_warnings.end(), matches));
    }

    /**
     * @brief Errors first, then warnings.
     */
    std::vector<DiagnosticItem> all_items() const
    {
        std::vector<DiagnosticItem> result(m_errors);
        result.insert(result.end(), m_warnings.begin(), m_warnings.end());
        return result;
    }

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace rwdagt
