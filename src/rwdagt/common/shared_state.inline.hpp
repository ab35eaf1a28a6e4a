/**
 * @file shared_state.inline.hpp
 * @brief Implementations for type-parameterized member methods in SharedState.
 */
#pragma once
#include "rwdagt/common/shared_state.hpp"
#include "rwdagt/common/vardata.inline.hpp"
#include <fmt/format.h>

namespace rwdagt
{

template <typename T>
void SharedState::declare(const std::string& name, T&& value)
{
    m_vars[name].set(std::forward<T>(value));
}

template <typename T>
void SharedState::set(std::string_view name, T&& value)
{
    at(name).set(std::forward<T>(value));
}

template <typename T>
const T& SharedState::get(std::string_view name) const
{
    return at(name).template as<T>();
}

template <typename T>
T& SharedState::get_mutable(std::string_view name)
{
    return at(name).template as<T>();
}

template <typename T>
SnapshotFn make_snapshot_fn(std::vector<std::string> names)
{
    return [names = std::move(names)](const SharedState& state) {
        StateSnapshot snapshot;
        for (const auto& name : names)
        {
            if (!state.contains(name))
            {
                snapshot[name] = "<undeclared>";
                continue;
            }
            const VarData& data = state.at(name);
            if (!data.has_value())
            {
                snapshot[name] = "<empty>";
                continue;
            }
            snapshot[name] = fmt::format("{}", data.as<T>());
        }
        return snapshot;
    };
}

} // namespace rwdagt
