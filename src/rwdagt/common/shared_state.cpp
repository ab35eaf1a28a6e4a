#include "rwdagt/common/shared_state.hpp"
#include "rwdagt/common/vardata.inline.hpp"

namespace rwdagt
{

bool SharedState::contains(std::string_view name) const noexcept
{
    return m_vars.find(name) != m_vars.end();
}

const VarData& SharedState::at(std::string_view name) const
{
    auto it = m_vars.find(name);
    if (it == m_vars.end())
    {
        throw UnknownVariableError(std::string{name});
    }
    return it->second;
}

VarData& SharedState::at(std::string_view name)
{
    auto it = m_vars.find(name);
    if (it == m_vars.end())
    {
        throw UnknownVariableError(std::string{name});
    }
    return it->second;
}

std::vector<std::string> SharedState::variable_names() const
{
    std::vector<std::string> names;
    names.reserve(m_vars.size());
    for (const auto& [name, data] : m_vars)
    {
        names.push_back(name);
    }
    return names;
}

StateCheckpoint SharedState::checkpoint() const
{
    StateCheckpoint result;
    for (const auto& [name, data] : m_vars)
    {
        result.emplace(name, data.clone());
    }
    return result;
}

void SharedState::restore(const StateCheckpoint& checkpoint)
{
    std::map<std::string, VarData, std::less<>> restored;
    for (const auto& [name, data] : checkpoint)
    {
        restored.emplace(name, data.clone());
    }
    m_vars = std::move(restored);
}

} // namespace rwdagt
