#ifndef QUANTA_ALGORITHM_DECIMAL_FORMAT_HPP
#define QUANTA_ALGORITHM_DECIMAL_FORMAT_HPP

#include <cstddef>
#include <string>

#include "quanta/algorithm/rational.hpp"
#include "quanta/config.hpp"

namespace quanta::algorithm {

inline constexpr std::size_t K_DECIMAL_MAX_DIGITS = QUANTA_DECIMAL_MAX_DIGITS;

/**
 * @brief Renders a Rational as its canonical decimal text.
 *
 * Long division generates at most @p maxDigits fractional digits. If a
 * remainder is left over, one more digit is computed and a value of 5 or more
 * rounds the generated digits up, carrying into the integer part when every
 * digit overflows. Trailing zeros are trimmed, the decimal point is omitted
 * when no fractional digits remain, and a value that rounds to zero is "0"
 * without a sign.
 *
 * This is the only text form shown to users or stored as display state.
 */
[[nodiscard]] auto toDecimalString(const Rational& value,
                                   std::size_t maxDigits = K_DECIMAL_MAX_DIGITS)
    -> std::string;

}  // namespace quanta::algorithm

#endif  // QUANTA_ALGORITHM_DECIMAL_FORMAT_HPP
