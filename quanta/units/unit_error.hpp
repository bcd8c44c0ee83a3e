#ifndef QUANTA_UNITS_UNIT_ERROR_HPP
#define QUANTA_UNITS_UNIT_ERROR_HPP

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "quanta/type/expected.hpp"

namespace quanta::units {

/**
 * @brief Why a unit operation produced no value.
 */
enum class UnitErrorCode {
    InvalidNumber,        ///< Text or float could not be parsed
    DivisionByZero,       ///< A zero denominator or a zero unit multiplier
    IncompatibleUnits,    ///< Different reference unit or quantity kind
    UnsupportedUnitKind,  ///< Logarithmic or otherwise non-affine unit
    DataIntegrityError    ///< Malformed catalog data
};

[[nodiscard]] constexpr auto toString(UnitErrorCode code) noexcept
    -> std::string_view {
    switch (code) {
        case UnitErrorCode::InvalidNumber:
            return "InvalidNumber";
        case UnitErrorCode::DivisionByZero:
            return "DivisionByZero";
        case UnitErrorCode::IncompatibleUnits:
            return "IncompatibleUnits";
        case UnitErrorCode::UnsupportedUnitKind:
            return "UnsupportedUnitKind";
        case UnitErrorCode::DataIntegrityError:
            return "DataIntegrityError";
    }
    return "Unknown";
}

struct UnitError {
    UnitErrorCode code;
    std::string message;

    friend auto operator==(const UnitError& a, const UnitError& b) -> bool {
        return a.code == b.code && a.message == b.message;
    }
};

inline auto operator<<(std::ostream& os, const UnitError& error)
    -> std::ostream& {
    return os << toString(error.code) << ": " << error.message;
}

template <typename T>
using UnitResult = type::expected<T, UnitError>;

[[nodiscard]] inline auto makeUnitError(UnitErrorCode code, std::string message)
    -> type::unexpected<UnitError> {
    return type::unexpected<UnitError>(UnitError{code, std::move(message)});
}

}  // namespace quanta::units

#endif  // QUANTA_UNITS_UNIT_ERROR_HPP
