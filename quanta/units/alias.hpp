#ifndef QUANTA_UNITS_ALIAS_HPP
#define QUANTA_UNITS_ALIAS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quanta::units {

/// Display code (UCUM symbol) to unit identifier.
using AliasMap = std::unordered_map<std::string, std::string>;

inline constexpr std::string_view K_MICRO_SIGN = "µ";
inline constexpr std::string_view K_GREEK_MU = "μ";

/**
 * @brief Guesses a unit symbol from a free-text field label.
 *
 * Tries, in order, a trailing parenthesised group ("Current (mA)"), the token
 * after a trailing slash ("Voltage / V") and the trailing run of symbol
 * characters ("Length cm").
 */
[[nodiscard]] auto parseUnitTokenFromLabel(std::string_view label)
    -> std::optional<std::string>;

/**
 * @brief Trims and rewrites Greek mu to the micro sign.
 */
[[nodiscard]] auto normalizeToken(std::string_view token) -> std::string;

/**
 * @brief Lookup candidates for a token, most ASCII-like first, without
 * duplicates.
 */
[[nodiscard]] auto buildUcumCandidates(std::string_view token)
    -> std::vector<std::string>;

/**
 * @brief First candidate of @p token present in @p codes.
 */
[[nodiscard]] auto resolveUnitId(std::string_view token, const AliasMap& codes)
    -> std::optional<std::string>;

}  // namespace quanta::units

#endif  // QUANTA_UNITS_ALIAS_HPP
