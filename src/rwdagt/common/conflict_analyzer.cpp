#include "rwdagt/common/conflict_analyzer.hpp"
#include "rwdagt/common/task_spec.hpp"

namespace rwdagt
{

namespace
{

/// True if two sorted ranges share an element.
template <typename T>
bool sorted_intersects(const std::vector<T>& lhs, const std::vector<T>& rhs) noexcept
{
    auto li = lhs.begin();
    auto ri = rhs.begin();
    while (li != lhs.end() && ri != rhs.end())
    {
        if (*li < *ri)
        {
            ++li;
        }
        else if (*ri < *li)
        {
            ++ri;
        }
        else
        {
            return true;
        }
    }
    return false;
}

template <typename T>
bool bernstein_conflict(const std::vector<T>& reads_a, const std::vector<T>& writes_a,
                        const std::vector<T>& reads_b, const std::vector<T>& writes_b) noexcept
{
    return sorted_intersects(writes_a, reads_b) ||
           sorted_intersects(reads_a, writes_b) ||
           sorted_intersects(writes_a, writes_b);
}

} // namespace

void AccessSets::normalize()
{
    std::sort(reads.begin(), reads.end());
    reads.erase(std::unique(reads.begin(), reads.end()), reads.end());
    std::sort(writes.begin(), writes.end());
    writes.erase(std::unique(writes.begin(), writes.end()), writes.end());
}

bool ConflictAnalyzer::conflicts(const AccessSets& a, const AccessSets& b) noexcept
{
    return bernstein_conflict(a.reads, a.writes, b.reads, b.writes);
}

bool ConflictAnalyzer::conflicts(const TaskSpec& a, const TaskSpec& b) noexcept
{
    return bernstein_conflict(a.reads(), a.writes(), b.reads(), b.writes());
}

ConflictReport ConflictAnalyzer::analyze(const AccessSets& a, const AccessSets& b)
{
    ConflictReport report;
    std::vector<VarIdx> overlap;

    auto collect = [&](const std::vector<VarIdx>& lhs, const std::vector<VarIdx>& rhs,
                       ConflictKind kind) {
        overlap.clear();
        std::set_intersection(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                              std::back_inserter(overlap));
        if (!overlap.empty())
        {
            report.kinds |= kind;
            report.variables.insert(report.variables.end(), overlap.begin(), overlap.end());
        }
    };

    collect(a.writes, b.reads, WriteRead);
    collect(a.reads, b.writes, ReadWrite);
    collect(a.writes, b.writes, WriteWrite);

    std::sort(report.variables.begin(), report.variables.end());
    report.variables.erase(
        std::unique(report.variables.begin(), report.variables.end()),
        report.variables.end());
    return report;
}

std::string ConflictAnalyzer::describe(unsigned kinds)
{
    if (kinds == NoConflict)
    {
        return "none";
    }
    std::string result;
    auto append = [&result](const char* text) {
        if (!result.empty())
        {
            result += '|';
        }
        result += text;
    };
    if (kinds & WriteRead)
    {
        append("write-read");
    }
    if (kinds & ReadWrite)
    {
        append("read-write");
    }
    if (kinds & WriteWrite)
    {
        append("write-write");
    }
    return result;
}

} // namespace rwdagt
