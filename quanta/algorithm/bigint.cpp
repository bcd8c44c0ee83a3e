#include "bigint.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace quanta::algorithm {

BigInteger::BigInteger(std::string_view number) {
    try {
        validateString(number);
        const bool negative = number[0] == '-';
        // cpp_int reads a leading zero as an octal prefix.
        auto nonZero = number.find_first_not_of('0', negative ? 1 : 0);
        if (nonZero == std::string_view::npos) {
            value_ = 0;
            return;
        }
        value_ = backend_type(std::string(number.substr(nonZero)));
        if (negative) {
            value_ = -value_;
        }
    } catch (const std::exception& e) {
        spdlog::error("Exception in BigInteger constructor: {}", e.what());
        throw;
    }
}

void BigInteger::validateString(std::string_view str) {
    if (str.empty()) {
        THROW_INVALID_ARGUMENT("Empty string is not a valid integer");
    }

    size_t start = 0;
    if (str[0] == '-') {
        if (str.size() == 1) {
            THROW_INVALID_ARGUMENT(
                "Invalid integer format: just a negative sign");
        }
        start = 1;
    }

    if (!std::ranges::all_of(str.begin() + start, str.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        })) {
        THROW_INVALID_ARGUMENT("Invalid character in integer string: ", str);
    }
}

auto BigInteger::toString() const -> std::string { return value_.str(); }

auto BigInteger::digits() const -> std::size_t {
    auto text = value_.str();
    return isNegative() ? text.size() - 1 : text.size();
}

auto BigInteger::negate() const -> BigInteger {
    return fromBackend(-value_);
}

auto BigInteger::abs() const -> BigInteger {
    return fromBackend(boost::multiprecision::abs(value_));
}

auto BigInteger::add(const BigInteger& other) const -> BigInteger {
    return fromBackend(value_ + other.value_);
}

auto BigInteger::subtract(const BigInteger& other) const -> BigInteger {
    return fromBackend(value_ - other.value_);
}

auto BigInteger::multiply(const BigInteger& other) const -> BigInteger {
    if (isZero() || other.isZero()) {
        return BigInteger();
    }
    return fromBackend(value_ * other.value_);
}

auto BigInteger::divide(const BigInteger& other) const -> BigInteger {
    if (other.isZero()) {
        spdlog::error("Division by zero: {} / 0", toString());
        THROW_DIVISION_BY_ZERO("Division by zero");
    }
    return fromBackend(value_ / other.value_);
}

auto BigInteger::mod(const BigInteger& other) const -> BigInteger {
    if (other.isZero()) {
        spdlog::error("Modulo by zero: {} % 0", toString());
        THROW_DIVISION_BY_ZERO("Modulo by zero");
    }
    return fromBackend(value_ % other.value_);
}

auto BigInteger::pow(std::int64_t exponent) const -> BigInteger {
    if (exponent < 0) {
        spdlog::error("Negative exponents are not supported");
        THROW_INVALID_ARGUMENT("Negative exponents are not supported");
    }

    backend_type result = 1;
    backend_type base = value_;
    auto remaining = static_cast<std::uint64_t>(exponent);

    while (remaining > 0) {
        if ((remaining & 1U) != 0) {
            result *= base;
        }
        remaining >>= 1U;
        if (remaining > 0) {
            base *= base;
        }
    }
    return fromBackend(std::move(result));
}

auto BigInteger::pow10(std::uint64_t exponent) -> BigInteger {
    spdlog::debug("Computing 10^{}", exponent);
    return BigInteger(10).pow(static_cast<std::int64_t>(exponent));
}

auto BigInteger::gcd(const BigInteger& a, const BigInteger& b) -> BigInteger {
    if (a.isZero()) {
        return b.abs();
    }
    if (b.isZero()) {
        return a.abs();
    }
    const backend_type lhs = boost::multiprecision::abs(a.value_);
    const backend_type rhs = boost::multiprecision::abs(b.value_);
    return fromBackend(boost::multiprecision::gcd(lhs, rhs));
}

auto operator<<(std::ostream& os, const BigInteger& num) -> std::ostream& {
    os << num.toString();
    return os;
}

auto BigInteger::operator+=(const BigInteger& other) -> BigInteger& {
    value_ += other.value_;
    return *this;
}

auto BigInteger::operator-=(const BigInteger& other) -> BigInteger& {
    value_ -= other.value_;
    return *this;
}

auto BigInteger::operator*=(const BigInteger& other) -> BigInteger& {
    value_ *= other.value_;
    return *this;
}

auto BigInteger::operator/=(const BigInteger& other) -> BigInteger& {
    *this = divide(other);
    return *this;
}

}  // namespace quanta::algorithm
