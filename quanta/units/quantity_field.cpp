#include "quantity_field.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "quanta/algorithm/decimal_format.hpp"
#include "quanta/utils/string.hpp"

namespace quanta::units {

QuantityField::QuantityField(std::shared_ptr<const UnitCatalog> catalog,
                             std::vector<Unit> available, size_t base)
    : catalog_(std::move(catalog)),
      available_(std::move(available)),
      base_(base),
      current_(base) {
    for (const auto& unit : available_) {
        availableCodes_.try_emplace(unit.displayCode, unit.id);
    }
}

auto QuantityField::create(std::shared_ptr<const UnitCatalog> catalog,
                           const QuantityFieldOptions& options)
    -> UnitResult<QuantityField> {
    if (!catalog) {
        return makeUnitError(UnitErrorCode::DataIntegrityError,
                             "No units map available");
    }

    std::optional<std::string> token;
    if (!utils::trim(options.unitToken).empty()) {
        token = options.unitToken;
    } else {
        token = parseUnitTokenFromLabel(options.label);
    }
    if (!token) {
        spdlog::error("No unit token in label '{}'", options.label);
        return makeUnitError(UnitErrorCode::DataIntegrityError,
                             "Missing unit token for label '" + options.label +
                                 "'");
    }

    auto baseId = catalog->resolve(*token);
    if (!baseId) {
        spdlog::error("Unit token '{}' is not in the units map", *token);
        return makeUnitError(UnitErrorCode::DataIntegrityError,
                             "Unknown unit '" + *token + "'");
    }

    auto available = catalog->compatibleUnits(*baseId);
    if (!available) {
        return type::unexpected<UnitError>(available.error());
    }
    auto units = std::move(*available);
    auto baseIt = std::ranges::find(units, *baseId, &Unit::id);
    const auto base = static_cast<size_t>(baseIt - units.begin());

    QuantityField field(std::move(catalog), std::move(units), base);
    auto display = field.render(
        fromReference(options.initialRefValue, field.baseUnit()));
    if (!display) {
        spdlog::warn("Initial reference value not shown: {}",
                     display.error().message);
    }
    spdlog::debug("Field bound to '{}' with {} units", field.baseUnit().id,
                  field.available_.size());
    return field;
}

void QuantityField::setDisplayText(std::string text) {
    displayText_ = std::move(text);
    value_ = algorithm::parseRational(displayText_);
}

auto QuantityField::render(const ConversionResult& value)
    -> UnitResult<std::string> {
    if (!value) {
        displayText_.clear();
        value_.reset();
        return type::unexpected<UnitError>(value.error());
    }
    value_ = *value;
    displayText_ = algorithm::toDecimalString(*value_);
    return displayText_;
}

auto QuantityField::indexOf(std::string_view unitId) const
    -> std::optional<size_t> {
    auto it = std::ranges::find(available_, unitId, &Unit::id);
    if (it == available_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - available_.begin());
}

auto QuantityField::changeUnit(std::string_view unitId)
    -> UnitResult<std::string> {
    auto target = indexOf(unitId);
    if (!target) {
        spdlog::warn("Unit '{}' is not offered for this quantity kind",
                     unitId);
        return makeUnitError(UnitErrorCode::IncompatibleUnits,
                             "Unsupported unit '" + std::string(unitId) +
                                 "' for this quantity kind");
    }
    const Unit& from = currentUnit();
    const Unit& to = available_[*target];
    if (!areCompatible(from, to)) {
        return makeUnitError(UnitErrorCode::IncompatibleUnits,
                             "Cannot convert between incompatible units '" +
                                 from.id + "' and '" + to.id + "'");
    }

    if (utils::trim(displayText_).empty()) {
        current_ = *target;
        return displayText_;
    }

    if (!value_) {
        spdlog::warn("Clearing unparseable display '{}'", displayText_);
        displayText_.clear();
        current_ = *target;
        return makeUnitError(UnitErrorCode::InvalidNumber,
                             "Display value is not a number");
    }

    auto converted = convert(*value_, from, to);
    if (!converted) {
        return type::unexpected<UnitError>(converted.error());
    }
    current_ = *target;
    return render(converted);
}

auto QuantityField::changeUnitByCode(std::string_view code)
    -> UnitResult<std::string> {
    auto unitId = resolveUnitId(code, availableCodes_);
    if (!unitId) {
        return makeUnitError(UnitErrorCode::IncompatibleUnits,
                             "Unit code '" + std::string(code) +
                                 "' is not available for this field");
    }
    return changeUnit(*unitId);
}

auto QuantityField::referenceValue() const -> ConversionResult {
    if (!value_) {
        return toReference(displayText_, currentUnit());
    }
    return toReference(*value_, currentUnit());
}

auto QuantityField::referenceText() const -> UnitResult<std::string> {
    return formatResult(referenceValue());
}

auto QuantityField::setReferenceValue(const Numeric& value)
    -> UnitResult<std::string> {
    return render(fromReference(value, currentUnit()));
}

auto QuantityField::approximateDisplayValue() const -> std::optional<double> {
    if (!value_) {
        return std::nullopt;
    }
    return algorithm::toApproximateFloat(*value_);
}

}  // namespace quanta::units
