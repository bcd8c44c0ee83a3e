#ifndef QUANTA_UNITS_UNIT_HPP
#define QUANTA_UNITS_UNIT_HPP

#include <optional>
#include <string>

#include "quanta/algorithm/rational.hpp"

namespace quanta::units {

/**
 * @brief A unit related to its family's reference unit by
 * `reference = value * multiplier + offset`.
 *
 * Records are built once by the catalog and never modified afterwards.
 */
struct Unit {
    std::string id;
    algorithm::Rational multiplier{1};
    algorithm::Rational offset;
    std::optional<std::string> referenceId;
    std::optional<std::string> quantityKindId;
    bool isLogarithmic = false;
    std::string displayCode;
    std::string label;
};

/**
 * @brief Two units convert into one another iff they share both the
 * reference unit and the quantity kind. Absent ids compare equal to each
 * other.
 */
[[nodiscard]] inline auto areCompatible(const Unit& a, const Unit& b) -> bool {
    return a.referenceId == b.referenceId &&
           a.quantityKindId == b.quantityKindId;
}

}  // namespace quanta::units

#endif  // QUANTA_UNITS_UNIT_HPP
