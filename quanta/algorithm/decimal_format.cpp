#include "decimal_format.hpp"

#include <vector>

#include <spdlog/spdlog.h>

namespace quanta::algorithm {

auto toDecimalString(const Rational& value, std::size_t maxDigits)
    -> std::string {
    if (value.isZero()) {
        return "0";
    }

    const bool negative = value.isNegative();
    const BigInteger numerator = value.getNumerator().abs();
    const BigInteger& denominator = value.getDenominator();
    const BigInteger ten(10);

    BigInteger integerPart = numerator / denominator;
    BigInteger remainder = numerator % denominator;

    std::vector<int> fraction;
    fraction.reserve(maxDigits);
    while (!remainder.isZero() && fraction.size() < maxDigits) {
        remainder = remainder * ten;
        fraction.push_back((remainder / denominator).toInteger<int>());
        remainder = remainder % denominator;
    }

    if (!remainder.isZero()) {
        const int next = ((remainder * ten) / denominator).toInteger<int>();
        if (next >= 5) {
            bool carry = true;
            for (auto it = fraction.rbegin(); it != fraction.rend() && carry;
                 ++it) {
                if (*it == 9) {
                    *it = 0;
                } else {
                    ++*it;
                    carry = false;
                }
            }
            if (carry) {
                integerPart += BigInteger(1);
            }
        }
    }

    while (!fraction.empty() && fraction.back() == 0) {
        fraction.pop_back();
    }

    std::string result = integerPart.toString();
    if (!fraction.empty()) {
        result.push_back('.');
        for (int digit : fraction) {
            result.push_back(static_cast<char>('0' + digit));
        }
    }

    if (negative && result != "0") {
        result.insert(result.begin(), '-');
    }
    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("Formatted {} as {}", value.toString(), result);
    }
    return result;
}

}  // namespace quanta::algorithm
