/*
 * quantity_field.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file quantity_field.hpp
 * @brief Display state of a numeric field bound to a family of units
 * @date 2024-4-14
 */

#ifndef QUANTA_UNITS_QUANTITY_FIELD_HPP
#define QUANTA_UNITS_QUANTITY_FIELD_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "quanta/algorithm/rational_parser.hpp"
#include "quanta/units/alias.hpp"
#include "quanta/units/catalog.hpp"
#include "quanta/units/conversion.hpp"
#include "quanta/units/unit_error.hpp"

namespace quanta::units {

struct QuantityFieldOptions {
    /// Free-text label; its trailing unit symbol is used when unitToken is
    /// empty.
    std::string label;
    /// Explicit display code of the base unit.
    std::string unitToken;
    /// Stored value, expressed in the reference unit of the family.
    Numeric initialRefValue = std::string("0");
};

/**
 * @brief A value typed by the user in one unit and persisted in the
 * reference unit.
 *
 * The display text is kept exactly as entered until a unit change or a
 * reference update re-renders it in canonical decimal form. The exact value
 * behind the text is kept beside it, so conversions never start from a
 * rounded rendering.
 */
class QuantityField {
public:
    /**
     * @brief Binds a field to the unit named by @p options.
     *
     * @return DataIntegrityError if no catalog is given, no unit token can be
     * found, or the token matches no unit; UnsupportedUnitKind if the base
     * unit is logarithmic.
     */
    [[nodiscard]] static auto create(
        std::shared_ptr<const UnitCatalog> catalog,
        const QuantityFieldOptions& options) -> UnitResult<QuantityField>;

    /**
     * @brief Replaces the display text with raw user input and parses it once.
     */
    void setDisplayText(std::string text);

    [[nodiscard]] auto displayText() const noexcept -> const std::string& {
        return displayText_;
    }

    [[nodiscard]] auto currentUnit() const -> const Unit& {
        return available_[current_];
    }

    [[nodiscard]] auto baseUnit() const -> const Unit& {
        return available_[base_];
    }

    /**
     * @return The units offered by this field, reference unit first.
     */
    [[nodiscard]] auto availableUnits() const noexcept
        -> const std::vector<Unit>& {
        return available_;
    }

    /**
     * @brief Switches the display unit, converting the displayed value.
     *
     * An empty display only switches the unit. Text that does not parse is
     * cleared; the unit still switches and InvalidNumber is returned.
     *
     * @return The new display text, or IncompatibleUnits if @p unitId is not
     * offered by this field. On IncompatibleUnits the current unit is kept.
     */
    auto changeUnit(std::string_view unitId) -> UnitResult<std::string>;

    /**
     * @brief changeUnit() for a display code such as "uA" or "μA".
     */
    auto changeUnitByCode(std::string_view code) -> UnitResult<std::string>;

    /**
     * @brief The display value expressed in the reference unit.
     *
     * @return InvalidNumber if the display is empty or does not parse.
     */
    [[nodiscard]] auto referenceValue() const -> ConversionResult;

    /**
     * @brief Canonical decimal text of referenceValue(); the persisted form.
     */
    [[nodiscard]] auto referenceText() const -> UnitResult<std::string>;

    /**
     * @brief Re-renders the display from a value in the reference unit.
     *
     * A value that cannot be converted clears the display.
     */
    auto setReferenceValue(const Numeric& value) -> UnitResult<std::string>;

    /**
     * @brief Lossy display value for native numeric widgets.
     */
    [[nodiscard]] auto approximateDisplayValue() const -> std::optional<double>;

private:
    QuantityField(std::shared_ptr<const UnitCatalog> catalog,
                  std::vector<Unit> available, size_t base);

    [[nodiscard]] auto indexOf(std::string_view unitId) const
        -> std::optional<size_t>;

    auto render(const ConversionResult& value) -> UnitResult<std::string>;

    std::shared_ptr<const UnitCatalog> catalog_;
    std::vector<Unit> available_;
    AliasMap availableCodes_;
    size_t base_;
    size_t current_;
    std::string displayText_;
    std::optional<Rational> value_;
};

}  // namespace quanta::units

#endif  // QUANTA_UNITS_QUANTITY_FIELD_HPP
