#include "catalog.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>

#include "quanta/algorithm/rational_parser.hpp"

using json = nlohmann::ordered_json;

namespace quanta::units {

namespace {

auto parseField(const json& value) -> std::optional<algorithm::Rational> {
    if (value.is_number_unsigned()) {
        return algorithm::Rational(value.get<std::uint64_t>());
    }
    if (value.is_number_integer()) {
        return algorithm::Rational(value.get<std::int64_t>());
    }
    if (value.is_number_float()) {
        return algorithm::parseRational(value.get<double>());
    }
    if (value.is_string()) {
        return algorithm::parseRational(
            std::string_view(value.get_ref<const std::string&>()));
    }
    return std::nullopt;
}

auto optionalString(const json& entry, const char* key)
    -> std::optional<std::string> {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

auto integrityError(std::string message) -> type::unexpected<UnitError> {
    spdlog::error("Units map rejected: {}", message);
    return makeUnitError(UnitErrorCode::DataIntegrityError, std::move(message));
}

}  // namespace

UnitCatalog::UnitCatalog(std::vector<Unit> units) : units_(std::move(units)) {
    indexById_.reserve(units_.size());
    for (size_t i = 0; i < units_.size(); ++i) {
        const auto& unit = units_[i];
        indexById_.try_emplace(unit.id, i);
        aliases_.try_emplace(unit.displayCode, unit.id);
    }
}

auto UnitCatalog::fromJson(const json& raw) -> UnitResult<UnitCatalog> {
    if (!raw.is_object()) {
        return integrityError("units map root must be a JSON object");
    }

    std::vector<Unit> units;
    units.reserve(raw.size());
    for (const auto& [id, entry] : raw.items()) {
        if (!id.empty() && id.front() == '_') {
            continue;
        }
        if (!entry.is_object()) {
            spdlog::warn("Skipping unit '{}': record is not an object", id);
            continue;
        }
        auto code = optionalString(entry, "ucum");
        if (!code || code->empty()) {
            spdlog::warn("Skipping unit '{}': no display code", id);
            continue;
        }

        Unit unit;
        unit.id = id;
        unit.displayCode = *code;

        auto multiplier = entry.find("m");
        if (multiplier == entry.end() || multiplier->is_null()) {
            return integrityError("unit '" + id + "' has no multiplier");
        }
        auto parsedMultiplier = parseField(*multiplier);
        if (!parsedMultiplier) {
            return integrityError("unit '" + id + "' has a malformed multiplier " +
                                  multiplier->dump());
        }
        unit.multiplier = std::move(*parsedMultiplier);
        if (unit.multiplier.isZero()) {
            spdlog::warn("Unit '{}' has a zero multiplier", id);
        }

        auto offset = entry.find("b");
        if (offset != entry.end() && !offset->is_null()) {
            auto parsedOffset = parseField(*offset);
            if (!parsedOffset) {
                return integrityError("unit '" + id +
                                      "' has a malformed offset " +
                                      offset->dump());
            }
            unit.offset = std::move(*parsedOffset);
        }

        unit.quantityKindId = optionalString(entry, "qk");
        unit.referenceId = optionalString(entry, "ref");
        unit.label = optionalString(entry, "label").value_or(unit.displayCode);
        auto log = entry.find("log");
        unit.isLogarithmic =
            log != entry.end() && log->is_boolean() && log->get<bool>();

        units.push_back(std::move(unit));
    }

    spdlog::debug("Resolved {} units", units.size());
    return UnitCatalog(std::move(units));
}

auto UnitCatalog::fromJsonText(std::string_view text)
    -> UnitResult<UnitCatalog> {
    try {
        return fromJson(json::parse(text));
    } catch (const json::parse_error& e) {
        return integrityError(std::string("malformed JSON: ") + e.what());
    }
}

auto UnitCatalog::fromFile(const std::filesystem::path& path)
    -> UnitResult<UnitCatalog> {
    std::ifstream input(path);
    if (!input.is_open()) {
        return integrityError("cannot open units map " + path.string());
    }
    try {
        return fromJson(json::parse(input));
    } catch (const json::parse_error& e) {
        return integrityError("malformed JSON in " + path.string() + ": " +
                              e.what());
    }
}

auto UnitCatalog::find(std::string_view id) const -> const Unit* {
    auto it = indexById_.find(std::string(id));
    return it == indexById_.end() ? nullptr : &units_[it->second];
}

auto UnitCatalog::findByCode(std::string_view code) const -> const Unit* {
    auto it = aliases_.find(std::string(code));
    return it == aliases_.end() ? nullptr : find(it->second);
}

auto UnitCatalog::resolve(std::string_view token) const
    -> std::optional<std::string> {
    return resolveUnitId(token, aliases_);
}

auto UnitCatalog::compatibleUnits(std::string_view baseId) const
    -> UnitResult<std::vector<Unit>> {
    const Unit* base = find(baseId);
    if (base == nullptr) {
        return makeUnitError(UnitErrorCode::DataIntegrityError,
                             "Base unit '" + std::string(baseId) +
                                 "' is not available in the units map");
    }
    if (base->isLogarithmic) {
        return makeUnitError(UnitErrorCode::UnsupportedUnitKind,
                             "Logarithmic unit '" + base->id +
                                 "' is not supported");
    }

    std::vector<Unit> result;
    std::ranges::copy_if(units_, std::back_inserter(result),
                         [base](const Unit& unit) {
                             return !unit.isLogarithmic &&
                                    areCompatible(unit, *base);
                         });

    const auto isReference = [base](const Unit& unit) {
        return base->referenceId && unit.id == *base->referenceId;
    };
    std::ranges::stable_sort(result, [&isReference](const Unit& a,
                                                    const Unit& b) {
        const bool aRef = isReference(a);
        const bool bRef = isReference(b);
        if (aRef != bRef) {
            return aRef;
        }
        return a.displayCode < b.displayCode;
    });
    return result;
}

}  // namespace quanta::units
