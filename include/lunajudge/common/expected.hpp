#pragma once

#include <lunajudge/common/formatters.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace lunajudge {

/// Tag to force construction of the error alternative
struct UnexpectedT
{
};

inline constexpr UnexpectedT unexpected{};

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * A value that is convertible to both T and E constructs the T alternative; use
 * ``Expected(unexpected, err)`` to force the error alternative.
 */
class [[nodiscard]] Expected
{
    static_assert(!std::same_as<T, E>, "Expected value and error types must be distinct");

    using StorageT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{std::in_place_index<0>} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && !std::same_as<std::remove_cvref_t<Tu>, Expected> &&
                 std::convertible_to<Tu, StorageT>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(!std::same_as<std::remove_cvref_t<Eu>, Expected> && std::convertible_to<Eu, E> &&
                 (std::is_void_v<T> || !std::convertible_to<Eu, StorageT>))
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    template <typename Eu>
    constexpr Expected(UnexpectedT /*unused*/, Eu&& error)
        requires(std::convertible_to<Eu, E>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value() &
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "Attempt to access the value of an erroneous Expected");
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr const U& value() const&
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "Attempt to access the value of an erroneous Expected");
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr U&& value() &&
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "Attempt to access the value of an erroneous Expected");
        return std::get<0>(std::move(data_));
    }

    template <typename U = T>
    constexpr void value() const&
        requires(std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "Attempt to access the value of an erroneous Expected");
    }

    template <typename U = T>
    constexpr U& operator*() &
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr const U& operator*() const&
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr U* operator->()
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename U = T>
    constexpr const U* operator->() const
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename Tu>
    constexpr T value_or(Tu&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        DEBUG_ASSERT(has_error(), "Attempt to access the error of a valued Expected");
        return std::get<1>(data_);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<1>(data_);
    }

    template <typename Func>
    constexpr auto transform(const Func& func) const -> Expected<std::invoke_result_t<Func, const T&>, E>
        requires(!std::is_void_v<T>)
    {
        if (!has_value()) {
            return {unexpected, error()};
        }

        return std::invoke(func, value());
    }

    template <typename Tu>
    constexpr bool operator==(const Tu& rhs) const
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T>)
    {
        return has_value() && value() == rhs;
    }

    template <typename Eu>
    constexpr bool operator==(const Eu& rhs) const
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E> &&
                 (std::is_void_v<T> || !std::equality_comparable_with<Eu, T>))
    {
        return has_error() && error() == rhs;
    }

private:
    std::variant<StorageT, E> data_;
};

} // namespace lunajudge

template <typename T, typename E>
struct fmt::formatter<::lunajudge::Expected<T, E>> : ::lunajudge::DebugFormatter
{
    template <typename FormatContext>
    auto format(const ::lunajudge::Expected<T, E>& from, FormatContext& ctx) const {
        if (!from) {
            return fmt::format_to(ctx.out(), "Error({})", from.error());
        }

        if constexpr (std::same_as<T, void>) {
            return fmt::format_to(ctx.out(), "Expected(void)");
        } else {
            return fmt::format_to(ctx.out(), "Expected({})", from.value());
        }
    }
};
