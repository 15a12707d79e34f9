#ifndef TITLECASE_RESULT_HPP
#define TITLECASE_RESULT_HPP

#include <concepts>
#include <expected>
#include <type_traits>
#include <utility>

#include "titlecase/util/assert.hpp"

#include "titlecase/fwd.hpp"

namespace titlecase {

/// @brief Holds either a value of type `T` or an error of type `E`.
/// Unlike `std::expected`, both the value and the error convert implicitly,
/// so that functions can simply `return IO_Error_Code::read_error;`.
template <typename T, typename E>
struct [[nodiscard]] Result {
    using value_type = T;
    using error_type = E;

private:
    std::expected<T, E> m_data;

public:
    template <typename U = T>
        requires std::constructible_from<T, U&&>
        && (!std::same_as<std::remove_cvref_t<U>, Result>)
        && (!std::same_as<std::remove_cvref_t<U>, E>)
    constexpr Result(U&& value)
        : m_data { std::in_place, std::forward<U>(value) }
    {
    }

    constexpr Result(E error)
        : m_data { std::unexpect, std::move(error) }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr T& operator*() & noexcept
    {
        TITLECASE_DEBUG_ASSERT(has_value());
        return *m_data;
    }

    [[nodiscard]]
    constexpr const T& operator*() const& noexcept
    {
        TITLECASE_DEBUG_ASSERT(has_value());
        return *m_data;
    }

    [[nodiscard]]
    constexpr T&& operator*() && noexcept
    {
        TITLECASE_DEBUG_ASSERT(has_value());
        return std::move(*m_data);
    }

    [[nodiscard]]
    constexpr T* operator->() noexcept
    {
        TITLECASE_DEBUG_ASSERT(has_value());
        return m_data.operator->();
    }

    [[nodiscard]]
    constexpr const T* operator->() const noexcept
    {
        TITLECASE_DEBUG_ASSERT(has_value());
        return m_data.operator->();
    }

    [[nodiscard]]
    constexpr const E& error() const noexcept
    {
        TITLECASE_DEBUG_ASSERT(!has_value());
        return m_data.error();
    }
};

template <typename E>
struct [[nodiscard]] Result<void, E> {
    using value_type = void;
    using error_type = E;

private:
    std::expected<void, E> m_data;

public:
    constexpr Result() = default;

    constexpr Result(E error)
        : m_data { std::unexpect, std::move(error) }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr const E& error() const noexcept
    {
        TITLECASE_DEBUG_ASSERT(!has_value());
        return m_data.error();
    }
};

} // namespace titlecase

#endif
