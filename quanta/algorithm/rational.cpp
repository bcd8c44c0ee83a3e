/*
 * rational.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-28

Description: Exact rational numbers over arbitrary-precision integers

**************************************************/

#include "rational.hpp"

#include <boost/multiprecision/cpp_bin_float.hpp>
#include <spdlog/spdlog.h>

namespace quanta::algorithm {

Rational::Rational(BigInteger numerator, BigInteger denominator)
    : Rational(normalize(std::move(numerator), std::move(denominator))) {}

auto normalize(BigInteger numerator, BigInteger denominator) -> Rational {
    if (denominator.isZero()) {
        spdlog::error("Cannot normalize {}/0", numerator.toString());
        THROW_INVALID_VALUE("Denominator cannot be zero.");
    }
    if (numerator.isZero()) {
        return Rational();
    }
    if (denominator.isNegative()) {
        numerator = numerator.negate();
        denominator = denominator.negate();
    }

    auto divisor = BigInteger::gcd(numerator, denominator);
    if (divisor > BigInteger(1)) {
        numerator = numerator / divisor;
        denominator = denominator / divisor;
    }
    return Rational(Rational::Normalized{}, std::move(numerator),
                    std::move(denominator));
}

auto normalize(const Rational& value) -> Rational {
    return normalize(value.getNumerator(), value.getDenominator());
}

/* ------------------------ Arithmetic ------------------------ */

auto add(const Rational& a, const Rational& b) -> Rational {
    if (b.isZero()) {
        return a;
    }
    if (a.isZero()) {
        return b;
    }
    return normalize(a.getNumerator() * b.getDenominator() +
                         b.getNumerator() * a.getDenominator(),
                     a.getDenominator() * b.getDenominator());
}

auto subtract(const Rational& a, const Rational& b) -> Rational {
    if (b.isZero()) {
        return a;
    }
    return normalize(a.getNumerator() * b.getDenominator() -
                         b.getNumerator() * a.getDenominator(),
                     a.getDenominator() * b.getDenominator());
}

auto multiply(const Rational& a, const Rational& b) -> Rational {
    if (a.isZero() || b.isZero()) {
        return Rational();
    }
    return normalize(a.getNumerator() * b.getNumerator(),
                     a.getDenominator() * b.getDenominator());
}

auto divide(const Rational& a, const Rational& b) -> Rational {
    if (b.isZero()) {
        spdlog::error("Division by zero: {} / 0", a.toString());
        THROW_DIVISION_BY_ZERO("Division by zero.");
    }
    if (a.isZero()) {
        return Rational();
    }
    return normalize(a.getNumerator() * b.getDenominator(),
                     a.getDenominator() * b.getNumerator());
}

auto add(const std::optional<Rational>& a, const std::optional<Rational>& b)
    -> std::optional<Rational> {
    if (!a && !b) {
        return std::nullopt;
    }
    if (!b) {
        return normalize(*a);
    }
    if (!a) {
        return normalize(*b);
    }
    return add(*a, *b);
}

auto subtract(const std::optional<Rational>& a,
              const std::optional<Rational>& b) -> std::optional<Rational> {
    if (!a && !b) {
        return std::nullopt;
    }
    if (!b) {
        return normalize(*a);
    }
    if (!a) {
        return -*b;
    }
    return subtract(*a, *b);
}

auto multiply(const std::optional<Rational>& a,
              const std::optional<Rational>& b) -> std::optional<Rational> {
    if (!a || !b) {
        return std::nullopt;
    }
    return multiply(*a, *b);
}

auto divide(const std::optional<Rational>& a, const std::optional<Rational>& b)
    -> std::optional<Rational> {
    if (b && b->isZero()) {
        spdlog::error("Division by zero");
        THROW_DIVISION_BY_ZERO("Division by zero.");
    }
    if (!a || !b) {
        return std::nullopt;
    }
    return divide(*a, *b);
}

/* ------------------------ Members ------------------------ */

auto Rational::abs() const -> Rational {
    return Rational(Normalized{}, numerator_.abs(), denominator_);
}

auto Rational::operator-() const -> Rational {
    return Rational(Normalized{}, numerator_.negate(), denominator_);
}

auto Rational::toString() const -> std::string {
    if (isInteger()) {
        return numerator_.toString();
    }
    return numerator_.toString() + "/" + denominator_.toString();
}

auto operator<=>(const Rational& a, const Rational& b)
    -> std::strong_ordering {
    // Denominators are positive, so cross-multiplication keeps the order.
    return a.numerator_ * b.denominator_ <=> b.numerator_ * a.denominator_;
}

auto operator<<(std::ostream& os, const Rational& r) -> std::ostream& {
    os << r.toString();
    return os;
}

auto toApproximateFloat(const Rational& value) -> double {
    using boost::multiprecision::cpp_bin_float_50;
    if (value.isZero()) {
        return 0.0;
    }
    const cpp_bin_float_50 numerator(value.getNumerator().backend());
    const cpp_bin_float_50 denominator(value.getDenominator().backend());
    const cpp_bin_float_50 quotient = numerator / denominator;
    return quotient.convert_to<double>();
}

}  // namespace quanta::algorithm
