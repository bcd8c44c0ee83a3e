#ifndef QUANTA_ALGORITHM_RATIONAL_PARSER_HPP
#define QUANTA_ALGORITHM_RATIONAL_PARSER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "quanta/algorithm/rational.hpp"

namespace quanta::algorithm {

/**
 * @brief Any value that can be turned into a Rational.
 *
 * std::monostate is the absent value, std::string is raw user or catalog
 * text, double is a native float whose existing rounding is accepted as is.
 */
using Numeric = std::variant<std::monostate, Rational, std::string, double>;

/**
 * @brief Parses a numeric literal into an exact Rational.
 *
 * Accepted forms, after trimming surrounding whitespace:
 * - `[+-]digits[.digits][(e|E)[+-]digits]`, with digits on at least one side
 *   of the decimal point;
 * - `literal/literal` where both sides use the form above.
 *
 * @return The normalized value, or std::nullopt for empty text, malformed
 * text, a zero denominator, an exponent of 10^12 or more, or a power-of-ten
 * scale beyond a nonzero QUANTA_MAX_DECIMAL_EXPONENT.
 */
[[nodiscard]] auto parseRational(std::string_view input)
    -> std::optional<Rational>;

/**
 * @brief Parses a native float through its shortest decimal text.
 *
 * Non-finite input is std::nullopt and zero of either sign is exact 0/1.
 */
[[nodiscard]] auto parseRational(double input) -> std::optional<Rational>;

/**
 * @brief Single entry point for every Numeric alternative.
 *
 * A Rational passes through normalized; std::monostate is std::nullopt.
 */
[[nodiscard]] auto parseNumeric(const Numeric& input)
    -> std::optional<Rational>;

}  // namespace quanta::algorithm

#endif  // QUANTA_ALGORITHM_RATIONAL_PARSER_HPP
