#ifndef QUANTA_UNITS_CATALOG_HPP
#define QUANTA_UNITS_CATALOG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "quanta/units/alias.hpp"
#include "quanta/units/unit.hpp"
#include "quanta/units/unit_error.hpp"

namespace quanta::units {

/**
 * @brief Immutable set of unit records plus the display-code alias table.
 *
 * The source JSON maps unit identifiers to records of the form
 * `{"ucum": "mA", "m": 0.001, "b": 0, "qk": "...", "ref": "...",
 * "label": "...", "log": false}`. Multipliers and offsets may be JSON
 * numbers or exact literal strings such as "5/9".
 */
class UnitCatalog {
public:
    UnitCatalog() = default;

    /**
     * @brief Builds a catalog from records; the alias table keeps the first
     * identifier seen for each display code, in document order.
     */
    explicit UnitCatalog(std::vector<Unit> units);

    /**
     * @brief Resolves a parsed units map.
     * @return DataIntegrityError if the root is not an object or a record has
     * a missing or malformed multiplier or a malformed offset.
     */
    [[nodiscard]] static auto fromJson(const nlohmann::ordered_json& raw)
        -> UnitResult<UnitCatalog>;

    /**
     * @brief Parses and resolves JSON text.
     */
    [[nodiscard]] static auto fromJsonText(std::string_view text)
        -> UnitResult<UnitCatalog>;

    /**
     * @brief Reads, parses and resolves a JSON file.
     */
    [[nodiscard]] static auto fromFile(const std::filesystem::path& path)
        -> UnitResult<UnitCatalog>;

    /**
     * @return The unit with identifier @p id, or nullptr.
     */
    [[nodiscard]] auto find(std::string_view id) const -> const Unit*;

    /**
     * @return The unit the alias table maps @p code to, or nullptr.
     */
    [[nodiscard]] auto findByCode(std::string_view code) const -> const Unit*;

    /**
     * @brief Resolves a display token through its UCUM candidates.
     */
    [[nodiscard]] auto resolve(std::string_view token) const
        -> std::optional<std::string>;

    /**
     * @brief Units that can be converted to and from @p baseId.
     *
     * Non-logarithmic units sharing reference unit and quantity kind with the
     * base, reference unit first and the rest ordered by display code.
     * @return DataIntegrityError for an unknown base, UnsupportedUnitKind for a
     * logarithmic base.
     */
    [[nodiscard]] auto compatibleUnits(std::string_view baseId) const
        -> UnitResult<std::vector<Unit>>;

    [[nodiscard]] auto units() const noexcept -> const std::vector<Unit>& {
        return units_;
    }

    [[nodiscard]] auto aliases() const noexcept -> const AliasMap& {
        return aliases_;
    }

    [[nodiscard]] auto size() const noexcept -> size_t { return units_.size(); }

    [[nodiscard]] auto empty() const noexcept -> bool { return units_.empty(); }

private:
    std::vector<Unit> units_;
    std::unordered_map<std::string, size_t> indexById_;
    AliasMap aliases_;
};

}  // namespace quanta::units

#endif  // QUANTA_UNITS_CATALOG_HPP
