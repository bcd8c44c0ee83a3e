#include "conversion.hpp"

#include <spdlog/spdlog.h>

#include "quanta/algorithm/decimal_format.hpp"

namespace quanta::units {

namespace {

auto rejectLogarithmic(const Unit& unit) -> std::optional<UnitError> {
    if (!unit.isLogarithmic) {
        return std::nullopt;
    }
    spdlog::error("Unit '{}' is logarithmic and cannot be converted",
                  unit.id);
    return UnitError{UnitErrorCode::UnsupportedUnitKind,
                     "Logarithmic unit '" + unit.id +
                         "' is not supported by affine conversion"};
}

auto invalidNumber(const Unit& unit) -> type::unexpected<UnitError> {
    return makeUnitError(UnitErrorCode::InvalidNumber,
                         "Value for unit '" + unit.id + "' is not a number");
}

}  // namespace

auto toReference(const Numeric& displayValue, const Unit& unit)
    -> ConversionResult {
    if (auto error = rejectLogarithmic(unit)) {
        return type::unexpected<UnitError>(std::move(*error));
    }
    auto value = algorithm::parseNumeric(displayValue);
    if (!value) {
        return invalidNumber(unit);
    }
    return algorithm::add(algorithm::multiply(*value, unit.multiplier),
                          unit.offset);
}

auto fromReference(const Numeric& referenceValue, const Unit& unit)
    -> ConversionResult {
    if (auto error = rejectLogarithmic(unit)) {
        return type::unexpected<UnitError>(std::move(*error));
    }
    auto value = algorithm::parseNumeric(referenceValue);
    if (!value) {
        return invalidNumber(unit);
    }
    try {
        return algorithm::divide(algorithm::subtract(*value, unit.offset),
                                 unit.multiplier);
    } catch (const algorithm::DivisionByZeroError& e) {
        spdlog::error("Unit '{}' has a zero multiplier: {}", unit.id,
                      e.getMessage());
        return makeUnitError(UnitErrorCode::DivisionByZero,
                             "Unit '" + unit.id + "' has a zero multiplier");
    }
}

auto convert(const Numeric& value, const Unit& from, const Unit& to)
    -> ConversionResult {
    if (auto error = rejectLogarithmic(from)) {
        return type::unexpected<UnitError>(std::move(*error));
    }
    if (auto error = rejectLogarithmic(to)) {
        return type::unexpected<UnitError>(std::move(*error));
    }
    if (!areCompatible(from, to)) {
        spdlog::error("Refusing to convert '{}' to '{}'", from.id, to.id);
        return makeUnitError(UnitErrorCode::IncompatibleUnits,
                             "Cannot convert between incompatible units '" +
                                 from.id + "' and '" + to.id + "'");
    }
    return toReference(value, from).and_then([&to](const Rational& reference) {
        return fromReference(reference, to);
    });
}

auto formatResult(const ConversionResult& result) -> UnitResult<std::string> {
    return result.map([](const Rational& value) {
        return algorithm::toDecimalString(value);
    });
}

auto toReferenceText(const Numeric& displayValue, const Unit& unit)
    -> UnitResult<std::string> {
    return formatResult(toReference(displayValue, unit));
}

auto fromReferenceText(const Numeric& referenceValue, const Unit& unit)
    -> UnitResult<std::string> {
    return formatResult(fromReference(referenceValue, unit));
}

auto convertText(const Numeric& value, const Unit& from, const Unit& to)
    -> UnitResult<std::string> {
    return formatResult(convert(value, from, to));
}

}  // namespace quanta::units
