#ifndef QUANTA_TYPE_EXPECTED_HPP
#define QUANTA_TYPE_EXPECTED_HPP

#include <concepts>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace quanta::type {

/**
 * @brief An `unexpected` class template similar to `std::unexpected`.
 *
 * Wraps an error value so it can be used to construct an expected object in
 * an error state.
 *
 * @tparam E The type of the error value
 */
template <typename E>
class unexpected {
public:
    template <typename U = E>
        requires std::constructible_from<E, U>
    constexpr explicit unexpected(U&& error) noexcept(
        std::is_nothrow_constructible_v<E, U>)
        : error_(std::forward<U>(error)) {}

    [[nodiscard]] constexpr const E& error() const& noexcept { return error_; }

    [[nodiscard]] constexpr E&& error() && noexcept {
        return std::move(error_);
    }

    constexpr bool operator==(const unexpected& other) const {
        return error_ == other.error_;
    }

private:
    E error_;
};

/// Deduction guide for unexpected
template <typename E>
unexpected(E) -> unexpected<E>;

/**
 * @brief Holds either a value or an error describing why there is none.
 *
 * Mirrors the subset of C++23 `std::expected` used across the project, plus
 * the `and_then` / `map` chaining used by the conversion pipeline.
 *
 * @tparam T The type of the expected value
 * @tparam E The type of the error
 */
template <typename T, typename E>
class expected {
private:
    std::variant<T, unexpected<E>> value_;

public:
    using value_type = T;
    using error_type = E;
    using unexpected_type = unexpected<E>;

    /**
     * @brief Constructs an expected holding a value.
     */
    template <typename U = T>
        requires std::constructible_from<T, U> &&
                 (!std::same_as<std::remove_cvref_t<U>, expected>) &&
                 (!std::same_as<std::remove_cvref_t<U>, unexpected<E>>)
    constexpr expected(U&& value) noexcept(
        std::is_nothrow_constructible_v<T, U>)
        : value_(std::in_place_index<0>, std::forward<U>(value)) {}

    /**
     * @brief Constructs an expected holding an error.
     */
    template <typename U>
        requires std::constructible_from<E, const U&>
    constexpr expected(const unexpected<U>& unex)
        : value_(std::in_place_index<1>, unexpected<E>(unex.error())) {}

    template <typename U>
        requires std::constructible_from<E, U>
    constexpr expected(unexpected<U>&& unex)
        : value_(std::in_place_index<1>,
                 unexpected<E>(std::move(unex).error())) {}

    expected(const expected&) = default;
    expected(expected&&) = default;
    expected& operator=(const expected&) = default;
    expected& operator=(expected&&) = default;

    [[nodiscard]] constexpr bool has_value() const noexcept {
        return value_.index() == 0;
    }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    /**
     * @brief Gets the stored value.
     * @throws std::logic_error if the expected contains an error
     */
    [[nodiscard]] constexpr T& value() & {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
        return std::get<0>(value_);
    }

    [[nodiscard]] constexpr const T& value() const& {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
        return std::get<0>(value_);
    }

    [[nodiscard]] constexpr T&& value() && {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
        return std::get<0>(std::move(value_));
    }

    template <typename U>
    [[nodiscard]] constexpr T value_or(U&& default_value) const& {
        return has_value() ? std::get<0>(value_)
                           : static_cast<T>(std::forward<U>(default_value));
    }

    /**
     * @note No checking is performed. Use only when has_value() is true.
     */
    [[nodiscard]] constexpr const T& operator*() const& noexcept {
        return *std::get_if<0>(&value_);
    }

    [[nodiscard]] constexpr T& operator*() & noexcept {
        return *std::get_if<0>(&value_);
    }

    [[nodiscard]] constexpr const T* operator->() const noexcept {
        return std::get_if<0>(&value_);
    }

    /**
     * @brief Gets the stored error.
     * @throws std::logic_error if the expected contains a value
     */
    [[nodiscard]] constexpr const E& error() const& {
        if (has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access error, but it contains a value.");
        }
        return std::get<1>(value_).error();
    }

    /**
     * @brief Chains a computation that may itself fail.
     *
     * @param func Invoked with the value; must return an expected with the
     * same error type.
     * @return The result of func, or the propagated error.
     */
    template <typename Func>
    constexpr auto and_then(
        Func&& func) const& -> std::invoke_result_t<Func, const T&> {
        using Result = std::invoke_result_t<Func, const T&>;
        if (has_value()) {
            return std::forward<Func>(func)(std::get<0>(value_));
        }
        return Result(std::get<1>(value_));
    }

    /**
     * @brief Transforms the value if present.
     *
     * @param func Invoked with the value.
     * @return A new expected with the transformed value or the original error.
     */
    template <typename Func>
    constexpr auto map(Func&& func) const& -> expected<
        std::remove_cvref_t<std::invoke_result_t<Func, const T&>>, E> {
        using Result =
            expected<std::remove_cvref_t<std::invoke_result_t<Func, const T&>>,
                     E>;
        if (has_value()) {
            return Result(std::forward<Func>(func)(std::get<0>(value_)));
        }
        return Result(std::get<1>(value_));
    }
};

template <typename E>
constexpr auto make_unexpected(E&& error) -> unexpected<std::decay_t<E>> {
    return unexpected<std::decay_t<E>>(std::forward<E>(error));
}

}  // namespace quanta::type

#endif  // QUANTA_TYPE_EXPECTED_HPP
