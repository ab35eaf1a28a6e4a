/**
 * @file unique_name_list.hpp
 */
#pragma once
#include "rwdagt/common/common.hpp"

namespace rwdagt
{

/**
 * @brief A list of unique names with insertion-order preservation.
 *
 * @details
 * `UniqueNameList` interns strings into dense indices: the first distinct name
 * gets index 0, the next index 1, and so on. It provides O(1) average-case
 * lookup by name and O(1) access by index. Internally, it combines a
 * `std::vector` (for ordered storage) with a `std::unordered_map` (for
 * name-to-index mapping).
 *
 * `GraphBuilder` uses one list for task names, whose indices become `TaskIdx`
 * values, and one for variable names, whose indices become `VarIdx` values.
 *
 * @par Empty name rejection
 * - `insert()` throws `std::invalid_argument` if given an empty name.
 *
 * @par Duplicate handling
 * - `insert()` returns the existing index if the name is already present.
 * - `try_insert()` reports whether the name was new, for callers that treat
 *   duplicates as errors.
 *
 * @par Invariants
 * - For all `i` in `[0, size())`: `find(at(i)) == i`.
 * - Elements are enumerated in insertion order.
 *
 * @par Exception safety
 * - `insert()` provides the strong exception guarantee.
 * - `find()` and `size()` are `noexcept`.
 * - `at()` throws `std::out_of_range` for invalid indices.
 *
 * @par Thread safety
 * - No internal synchronization; concurrent reads are safe.
 */
class UniqueNameList
{
public:
    /**
     * @brief Sentinel value indicating "not found" (equal to `SIZE_MAX`).
     */
    static constexpr std::size_t npos = ~static_cast<std::size_t>(0);

public:
    /**
     * @brief Insert a name if not already present.
     * @return The index of the name: new index if inserted, existing index if duplicate.
     * @throw std::invalid_argument if `name` is empty.
     */
    std::size_t insert(const std::string& name)
    {
        return try_insert(name).first;
    }

    /**
     * @brief Insert a name if not already present, reporting whether it was new.
     * @return (index, inserted) where `inserted` is false for a duplicate.
     * @throw std::invalid_argument if `name` is empty.
     */
    std::pair<std::size_t, bool> try_insert(const std::string& name)
    {
        if (name.empty())
        {
            throw std::invalid_argument("UniqueNameList::insert: empty name");
        }
        auto it = m_map.find(name);
        if (it != m_map.end())
        {
            return {it->second, false};
        }
        std::size_t index = m_list.size();
        m_list.push_back(name);
        try
        {
            m_map.emplace(name, index);
        }
        catch (...)
        {
            m_list.pop_back();
            throw;
        }
        return {index, true};
    }

    /**
     * @brief Find the index of a name.
     * @return The index if found; otherwise, `npos`.
     */
    std::size_t find(const std::string& name) const noexcept
    {
        auto it = m_map.find(name);
        if (it != m_map.end())
        {
            return it->second;
        }
        return npos;
    }

    /**
     * @brief Access the name at the given index.
     * @throw std::out_of_range if `index >= size()`.
     */
    const std::string& at(std::size_t index) const
    {
        if (index >= m_list.size())
        {
            throw std::out_of_range("UniqueNameList::at: index out of range");
        }
        return m_list[index];
    }

    /**
     * @brief Return the number of names in the list.
     */
    std::size_t size() const noexcept
    {
        return m_list.size();
    }

    /**
     * @brief All names in insertion order.
     */
    const std::vector<std::string>& names() const noexcept
    {
        return m_list;
    }

private:
    std::vector<std::string> m_list;
    std::unordered_map<std::string, std::size_t> m_map;
};

} // namespace rwdagt
