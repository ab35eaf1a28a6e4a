/**
 * @file vardata.hpp
 * @brief VarData, the type-erased value of one shared variable.
 * @see vardata.inline.hpp for implementations of type-parameterized methods.
 */

#pragma once
#include "rwdagt/common/common.hpp"

namespace rwdagt
{

/**
 * @brief Exception thrown when a shared variable is read as the wrong type.
 */
class VarDataTypeError : public std::runtime_error
{
public:
    VarDataTypeError(std::type_index stored, std::type_index requested)
        : std::runtime_error(std::string{"Shared variable holds "} + stored.name() +
                             ", requested as " + requested.name())
        , m_stored{stored}
        , m_requested{requested}
    {}

    std::type_index stored() const noexcept { return m_stored; }
    std::type_index requested() const noexcept { return m_requested; }

private:
    std::type_index m_stored;
    std::type_index m_requested;
};

/**
 * @brief Exception thrown when a shared variable without a value is read.
 */
class VarDataEmptyError : public std::runtime_error
{
public:
    VarDataEmptyError()
        : std::runtime_error("Shared variable has no value")
    {}
};

/**
 * @brief Type-erased holder for the value of one shared variable.
 *
 * @details
 * The value lives in a heap-allocated holder behind the `IHolder` interface.
 * Each holder knows its stored type and how to copy itself, so VarData is a
 * regular value type: copying a VarData copies the stored value, whatever its
 * type. `SharedState` relies on this to checkpoint and restore variables of
 * arbitrary types between runs.
 *
 * @par Invariants
 * - `type() == typeid(void)` if and only if `has_value() == false`.
 * - The stored type is always decayed: never void, an array or a reference.
 * - Stored types are copy constructible.
 *
 * @par Thread Safety
 * - Concurrent reads are safe.
 * - No internal mutex. Writes must not race with any other access; during
 *   graph execution the task ordering provides this.
 */
class VarData
{
public:
    VarData() = default;

    VarData(const VarData& other)
        : m_holder{other.m_holder ? other.m_holder->copy() : nullptr}
    {}

    VarData(VarData&&) noexcept = default;

    VarData& operator=(const VarData& other)
    {
        if (this != &other)
        {
            m_holder = other.m_holder ? other.m_holder->copy() : nullptr;
        }
        return *this;
    }

    VarData& operator=(VarData&&) noexcept = default;

    ~VarData() = default;

    [[nodiscard]] bool has_value() const noexcept
    {
        return m_holder != nullptr;
    }

    /**
     * @brief Check if the stored type is (the decayed) T.
     */
    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    /**
     * @brief Stored type, or `typeid(void)` if empty.
     */
    [[nodiscard]] std::type_index type() const noexcept
    {
        return m_holder ? m_holder->type() : std::type_index{typeid(void)};
    }

    /**
     * @brief Drop the stored value.
     * @post has_value() == false
     */
    void reset() noexcept
    {
        m_holder.reset();
    }

    /**
     * @brief Construct a value of type T in place, replacing any stored value.
     * @post has_type<T>() == true
     */
    template <typename T, typename... Args>
    void emplace(Args&&... args);

    /**
     * @brief Store a value by copy or move, replacing any stored value.
     */
    template <typename T>
    void set(T&& value);

    /**
     * @brief Copy of this VarData with independent storage.
     */
    [[nodiscard]] VarData clone() const
    {
        return VarData{*this};
    }

    /**
     * @brief Access the stored value.
     * @throws VarDataEmptyError if empty.
     * @throws VarDataTypeError if the stored type is not T.
     */
    template <typename T>
    [[nodiscard]] T& as();

    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @brief Access the stored value, or nullptr if empty or of another type.
     */
    template <typename T>
    [[nodiscard]] T* try_as() noexcept;

    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

private:
    class IHolder
    {
    public:
        virtual ~IHolder() = default;
        virtual std::unique_ptr<IHolder> copy() const = 0;
        virtual std::type_index type() const noexcept = 0;
    };

    template <typename StorageT>
    class Holder;

    template <typename StorageT>
    StorageT* typed() const noexcept;

    std::unique_ptr<IHolder> m_holder{};
};

} // namespace rwdagt
