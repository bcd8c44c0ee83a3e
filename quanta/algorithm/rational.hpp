/*
 * rational.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-28

Description: Exact rational numbers over arbitrary-precision integers

**************************************************/

#ifndef QUANTA_ALGORITHM_RATIONAL_HPP
#define QUANTA_ALGORITHM_RATIONAL_HPP

#include <compare>
#include <concepts>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include "quanta/algorithm/bigint.hpp"
#include "quanta/error/exception.hpp"

namespace quanta::algorithm {

/**
 * @brief Thrown when a rational would be built with a zero denominator.
 */
class InvalidValueError : public quanta::error::Exception {
public:
    using quanta::error::Exception::Exception;
};

#define THROW_INVALID_VALUE(...)                                            \
    throw quanta::algorithm::InvalidValueError(                             \
        QUANTA_FILE_NAME, QUANTA_FILE_LINE, QUANTA_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Immutable exact fraction in lowest terms.
 *
 * Invariants: the denominator is strictly positive, the sign lives in the
 * numerator, gcd(|numerator|, denominator) == 1, and zero is always 0/1.
 * Every operation returns a new normalized value.
 */
class Rational {
public:
    /**
     * @brief Exact zero, 0/1.
     */
    Rational() : numerator_(0), denominator_(1) {}

    /**
     * @brief Constructs the integer value n/1.
     */
    template <std::integral T>
    explicit Rational(T value) : numerator_(value), denominator_(1) {}

    /**
     * @brief Constructs and normalizes numerator/denominator.
     * @throws InvalidValueError if the denominator is zero.
     */
    Rational(BigInteger numerator, BigInteger denominator);

    template <std::integral N, std::integral D>
    Rational(N numerator, D denominator)
        : Rational(BigInteger(numerator), BigInteger(denominator)) {}

    Rational(const Rational&) = default;
    Rational(Rational&&) noexcept = default;
    Rational& operator=(const Rational&) = default;
    Rational& operator=(Rational&&) noexcept = default;
    ~Rational() = default;

    [[nodiscard]] auto getNumerator() const noexcept -> const BigInteger& {
        return numerator_;
    }

    [[nodiscard]] auto getDenominator() const noexcept -> const BigInteger& {
        return denominator_;
    }

    [[nodiscard]] auto isZero() const noexcept -> bool {
        return numerator_.isZero();
    }

    [[nodiscard]] auto isNegative() const noexcept -> bool {
        return numerator_.isNegative();
    }

    [[nodiscard]] auto isPositive() const noexcept -> bool {
        return numerator_.isPositive();
    }

    [[nodiscard]] auto isInteger() const -> bool {
        return denominator_ == BigInteger(1);
    }

    /**
     * @brief Compares the value to zero.
     * @return -1, 0 or 1.
     */
    [[nodiscard]] auto sign() const noexcept -> int { return numerator_.sign(); }

    [[nodiscard]] auto abs() const -> Rational;

    [[nodiscard]] auto operator-() const -> Rational;

    /**
     * @brief The reduced fraction as "n/d", or "n" for integers.
     */
    [[nodiscard]] auto toString() const -> std::string;

    friend auto operator==(const Rational& a, const Rational& b) -> bool {
        return a.numerator_ == b.numerator_ &&
               a.denominator_ == b.denominator_;
    }

    friend auto operator<=>(const Rational& a, const Rational& b)
        -> std::strong_ordering;

    friend auto operator<<(std::ostream& os, const Rational& r)
        -> std::ostream&;

private:
    struct Normalized {};

    Rational(Normalized, BigInteger numerator, BigInteger denominator) noexcept
        : numerator_(std::move(numerator)),
          denominator_(std::move(denominator)) {}

    BigInteger numerator_;
    BigInteger denominator_;

    friend auto normalize(BigInteger numerator, BigInteger denominator)
        -> Rational;
};

/**
 * @brief Brings a numerator/denominator pair to canonical form.
 *
 * Moves a negative sign from the denominator to the numerator and divides both
 * by their gcd.
 * @throws InvalidValueError if the denominator is zero.
 */
[[nodiscard]] auto normalize(BigInteger numerator, BigInteger denominator)
    -> Rational;

/**
 * @brief Re-normalizes an existing value; idempotent.
 */
[[nodiscard]] auto normalize(const Rational& value) -> Rational;

[[nodiscard]] auto add(const Rational& a, const Rational& b) -> Rational;
[[nodiscard]] auto subtract(const Rational& a, const Rational& b) -> Rational;

/**
 * @brief Product; exact zero without touching the integers if either side
 * is zero.
 */
[[nodiscard]] auto multiply(const Rational& a, const Rational& b) -> Rational;

/**
 * @brief Quotient (a.num * b.den) / (a.den * b.num).
 * @throws DivisionByZeroError if b is zero.
 */
[[nodiscard]] auto divide(const Rational& a, const Rational& b) -> Rational;

/**
 * @brief Sum where an absent operand is the identity.
 *
 * add(a, nullopt) == a, add(nullopt, b) == b, add(nullopt, nullopt) is
 * absent.
 */
[[nodiscard]] auto add(const std::optional<Rational>& a,
                       const std::optional<Rational>& b)
    -> std::optional<Rational>;

/**
 * @brief Difference where an absent operand counts as zero.
 */
[[nodiscard]] auto subtract(const std::optional<Rational>& a,
                            const std::optional<Rational>& b)
    -> std::optional<Rational>;

/**
 * @brief Product; absent if either operand is absent.
 */
[[nodiscard]] auto multiply(const std::optional<Rational>& a,
                            const std::optional<Rational>& b)
    -> std::optional<Rational>;

/**
 * @brief Quotient; absent if either operand is absent.
 * @throws DivisionByZeroError if b is present and zero.
 */
[[nodiscard]] auto divide(const std::optional<Rational>& a,
                          const std::optional<Rational>& b)
    -> std::optional<Rational>;

inline auto operator+(const Rational& a, const Rational& b) -> Rational {
    return add(a, b);
}
inline auto operator-(const Rational& a, const Rational& b) -> Rational {
    return subtract(a, b);
}
inline auto operator*(const Rational& a, const Rational& b) -> Rational {
    return multiply(a, b);
}
inline auto operator/(const Rational& a, const Rational& b) -> Rational {
    return divide(a, b);
}

/**
 * @brief Nearest double, for non-authoritative display only.
 *
 * This is lossy. Values whose magnitude exceeds the double range become
 * +/-infinity and tiny values become zero.
 */
[[nodiscard]] auto toApproximateFloat(const Rational& value) -> double;

}  // namespace quanta::algorithm

#endif  // QUANTA_ALGORITHM_RATIONAL_HPP
