#ifndef QUANTA_UNITS_CONVERSION_HPP
#define QUANTA_UNITS_CONVERSION_HPP

#include <string>

#include "quanta/algorithm/rational.hpp"
#include "quanta/algorithm/rational_parser.hpp"
#include "quanta/units/unit.hpp"
#include "quanta/units/unit_error.hpp"

namespace quanta::units {

using algorithm::Numeric;
using algorithm::Rational;

using ConversionResult = UnitResult<Rational>;

/**
 * @brief Display value to reference value: `value * multiplier + offset`.
 *
 * @return UnsupportedUnitKind for a logarithmic unit, InvalidNumber if the
 * value does not parse, the exact reference value otherwise.
 */
[[nodiscard]] auto toReference(const Numeric& displayValue, const Unit& unit)
    -> ConversionResult;

/**
 * @brief Reference value to display value: `(value - offset) / multiplier`.
 *
 * @return UnsupportedUnitKind for a logarithmic unit, InvalidNumber if the
 * value does not parse, DivisionByZero if the unit's multiplier is zero.
 */
[[nodiscard]] auto fromReference(const Numeric& referenceValue,
                                 const Unit& unit) -> ConversionResult;

/**
 * @brief `fromReference(toReference(value, from), to)`.
 *
 * Refuses logarithmic units and units that do not share reference unit and
 * quantity kind, even though callers are expected to check beforehand.
 */
[[nodiscard]] auto convert(const Numeric& value, const Unit& from,
                           const Unit& to) -> ConversionResult;

/**
 * @brief Canonical decimal text of a successful result; errors pass through.
 */
[[nodiscard]] auto formatResult(const ConversionResult& result)
    -> UnitResult<std::string>;

[[nodiscard]] auto toReferenceText(const Numeric& displayValue,
                                   const Unit& unit) -> UnitResult<std::string>;

[[nodiscard]] auto fromReferenceText(const Numeric& referenceValue,
                                     const Unit& unit)
    -> UnitResult<std::string>;

[[nodiscard]] auto convertText(const Numeric& value, const Unit& from,
                               const Unit& to) -> UnitResult<std::string>;

}  // namespace quanta::units

#endif  // QUANTA_UNITS_CONVERSION_HPP
