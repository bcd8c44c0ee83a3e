#ifndef QUANTA_ALGORITHM_BIGINT_HPP
#define QUANTA_ALGORITHM_BIGINT_HPP

#include <compare>
#include <concepts>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "quanta/error/exception.hpp"

namespace quanta::algorithm {

/**
 * @brief Thrown when an exact division or reduction has a zero divisor.
 */
class DivisionByZeroError : public quanta::error::Exception {
public:
    using quanta::error::Exception::Exception;
};

#define THROW_DIVISION_BY_ZERO(...)                    \
    throw quanta::algorithm::DivisionByZeroError(      \
        QUANTA_FILE_NAME, QUANTA_FILE_LINE, QUANTA_FUNC_NAME, __VA_ARGS__)

/**
 * @class BigInteger
 * @brief Arbitrary-precision signed integer backed by Boost.Multiprecision.
 *
 * Every operation is exact; nothing in this class ever goes through a
 * floating-point type.
 */
class BigInteger {
public:
    using backend_type = boost::multiprecision::cpp_int;

    BigInteger() = default;

    /**
     * @brief Constructs a BigInteger from a decimal digit string.
     * @param number Optional leading '-' followed by at least one digit.
     * @throws quanta::error::InvalidArgument If the string is not a valid
     * integer.
     */
    explicit BigInteger(std::string_view number);

    /**
     * @brief Constructs a BigInteger from a built-in integer.
     * @tparam T Integer type that satisfies std::integral concept
     */
    template <std::integral T>
    explicit BigInteger(T number) : value_(number) {}

    [[nodiscard]] static auto fromBackend(backend_type value) -> BigInteger {
        BigInteger result;
        result.value_ = std::move(value);
        return result;
    }

    BigInteger(BigInteger&& other) noexcept = default;
    BigInteger& operator=(BigInteger&& other) noexcept = default;
    BigInteger(const BigInteger&) = default;
    BigInteger& operator=(const BigInteger&) = default;
    ~BigInteger() = default;

    [[nodiscard]] auto add(const BigInteger& other) const -> BigInteger;
    [[nodiscard]] auto subtract(const BigInteger& other) const -> BigInteger;
    [[nodiscard]] auto multiply(const BigInteger& other) const -> BigInteger;

    /**
     * @brief Truncating division (rounds toward zero).
     * @throws DivisionByZeroError If the divisor is zero.
     */
    [[nodiscard]] auto divide(const BigInteger& other) const -> BigInteger;

    /**
     * @brief Remainder of the truncating division; takes the dividend's sign.
     * @throws DivisionByZeroError If the divisor is zero.
     */
    [[nodiscard]] auto mod(const BigInteger& other) const -> BigInteger;

    /**
     * @brief Raises to a power by repeated squaring.
     * @param exponent Non-negative exponent.
     * @throws quanta::error::InvalidArgument If the exponent is negative.
     */
    [[nodiscard]] auto pow(std::int64_t exponent) const -> BigInteger;

    /**
     * @brief 10^exponent, computed exactly by repeated squaring.
     */
    [[nodiscard]] static auto pow10(std::uint64_t exponent) -> BigInteger;

    /**
     * @brief Greatest common divisor of |a| and |b|; gcd(0, 0) is 0.
     */
    [[nodiscard]] static auto gcd(const BigInteger& a, const BigInteger& b)
        -> BigInteger;

    [[nodiscard]] auto negate() const -> BigInteger;
    [[nodiscard]] auto abs() const -> BigInteger;

    [[nodiscard]] auto toString() const -> std::string;

    /**
     * @brief Number of decimal digits of the magnitude (1 for zero).
     */
    [[nodiscard]] auto digits() const -> std::size_t;

    [[nodiscard]] auto isZero() const noexcept -> bool {
        return value_.is_zero();
    }

    [[nodiscard]] auto isNegative() const noexcept -> bool {
        return value_.sign() < 0;
    }

    [[nodiscard]] auto isPositive() const noexcept -> bool {
        return value_.sign() > 0;
    }

    /**
     * @return -1, 0 or 1.
     */
    [[nodiscard]] auto sign() const noexcept -> int { return value_.sign(); }

    [[nodiscard]] auto isEven() const -> bool {
        return !boost::multiprecision::bit_test(value_, 0);
    }

    [[nodiscard]] auto backend() const noexcept -> const backend_type& {
        return value_;
    }

    /**
     * @brief Converts to a built-in integer if it fits.
     * @throws quanta::error::OutOfRange If the value does not fit in T.
     */
    template <std::integral T>
    [[nodiscard]] auto toInteger() const -> T {
        if (value_ > backend_type(std::numeric_limits<T>::max()) ||
            value_ < backend_type(std::numeric_limits<T>::min())) {
            THROW_OUT_OF_RANGE("BigInteger ", toString(),
                               " does not fit in the requested integer type");
        }
        return value_.convert_to<T>();
    }

    friend auto operator<<(std::ostream& os, const BigInteger& num)
        -> std::ostream&;

    friend auto operator+(const BigInteger& a, const BigInteger& b)
        -> BigInteger {
        return a.add(b);
    }
    friend auto operator-(const BigInteger& a, const BigInteger& b)
        -> BigInteger {
        return a.subtract(b);
    }
    friend auto operator*(const BigInteger& a, const BigInteger& b)
        -> BigInteger {
        return a.multiply(b);
    }
    friend auto operator/(const BigInteger& a, const BigInteger& b)
        -> BigInteger {
        return a.divide(b);
    }
    friend auto operator%(const BigInteger& a, const BigInteger& b)
        -> BigInteger {
        return a.mod(b);
    }
    auto operator-() const -> BigInteger { return negate(); }

    friend auto operator==(const BigInteger& a, const BigInteger& b) noexcept
        -> bool {
        return a.value_ == b.value_;
    }
    friend auto operator<=>(const BigInteger& a, const BigInteger& b) noexcept
        -> std::strong_ordering {
        const int c = a.value_.compare(b.value_);
        return c < 0 ? std::strong_ordering::less
                     : (c > 0 ? std::strong_ordering::greater
                              : std::strong_ordering::equal);
    }

    auto operator+=(const BigInteger& other) -> BigInteger&;
    auto operator-=(const BigInteger& other) -> BigInteger&;
    auto operator*=(const BigInteger& other) -> BigInteger&;
    auto operator/=(const BigInteger& other) -> BigInteger&;

private:
    backend_type value_;

    static void validateString(std::string_view str);
};

}  // namespace quanta::algorithm

#endif  // QUANTA_ALGORITHM_BIGINT_HPP
