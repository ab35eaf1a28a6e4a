/**
 * @file vardata.inline.hpp
 * @brief Implementations for type-parameterized member methods in the VarData class.
 */
#pragma once
#include "rwdagt/common/vardata.hpp"

namespace rwdagt
{

namespace detail
{

template <typename T>
using storage_type_t = std::decay_t<T>;

template <typename StorageT>
constexpr void check_storage_type() noexcept
{
    static_assert(!std::is_void_v<StorageT>, "VarData: T cannot be void");
    static_assert(!std::is_array_v<StorageT>, "VarData: T cannot be an array type");
    static_assert(std::is_copy_constructible_v<StorageT>,
                  "VarData: T must be copy constructible so that checkpoints can copy it");
}

} // namespace detail

template <typename StorageT>
class VarData::Holder final : public VarData::IHolder
{
public:
    template <typename... Args>
    explicit Holder(std::in_place_t, Args&&... args)
        : value(std::forward<Args>(args)...)
    {}

    std::unique_ptr<IHolder> copy() const override
    {
        return std::make_unique<Holder>(std::in_place, value);
    }

    std::type_index type() const noexcept override
    {
        return typeid(StorageT);
    }

    StorageT value;
};

template <typename StorageT>
StorageT* VarData::typed() const noexcept
{
    if (!m_holder || m_holder->type() != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return &static_cast<Holder<StorageT>*>(m_holder.get())->value;
}

template <typename T>
bool VarData::has_type() const noexcept
{
    using StorageT = detail::storage_type_t<T>;
    detail::check_storage_type<StorageT>();
    return type() == std::type_index{typeid(StorageT)};
}

template <typename T, typename... Args>
void VarData::emplace(Args&&... args)
{
    using StorageT = detail::storage_type_t<T>;
    detail::check_storage_type<StorageT>();
    m_holder = std::make_unique<Holder<StorageT>>(std::in_place, std::forward<Args>(args)...);
}

template <typename T>
void VarData::set(T&& value)
{
    emplace<detail::storage_type_t<T>>(std::forward<T>(value));
}

template <typename T>
T& VarData::as()
{
    return const_cast<T&>(std::as_const(*this).template as<T>());
}

template <typename T>
const T& VarData::as() const
{
    using StorageT = detail::storage_type_t<T>;
    detail::check_storage_type<StorageT>();

    if (!m_holder)
    {
        throw VarDataEmptyError{};
    }
    StorageT* value = typed<StorageT>();
    if (!value)
    {
        throw VarDataTypeError{m_holder->type(), std::type_index{typeid(StorageT)}};
    }
    return *value;
}

template <typename T>
T* VarData::try_as() noexcept
{
    using StorageT = detail::storage_type_t<T>;
    detail::check_storage_type<StorageT>();
    return typed<StorageT>();
}

template <typename T>
const T* VarData::try_as() const noexcept
{
    using StorageT = detail::storage_type_t<T>;
    detail::check_storage_type<StorageT>();
    return typed<StorageT>();
}

} // namespace rwdagt
