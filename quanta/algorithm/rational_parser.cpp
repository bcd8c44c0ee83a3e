#include "rational_parser.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <system_error>

#include <spdlog/spdlog.h>

#include "quanta/config.hpp"
#include "quanta/utils/string.hpp"

namespace quanta::algorithm {

namespace {

// Exponents from here on cannot be materialized as a power of ten.
constexpr std::int64_t K_EXPONENT_SATURATION = 1'000'000'000'000LL;

auto isDigit(char c) noexcept -> bool { return c >= '0' && c <= '9'; }

/**
 * Parses `[+-]digits[.digits][(e|E)[+-]digits]` with no surrounding text.
 */
auto parseDecimal(std::string_view text) -> std::optional<Rational> {
    text = utils::trim(text);
    if (text.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '+' || text[pos] == '-') {
        negative = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    digits.reserve(text.size());
    std::int64_t fractionDigits = 0;
    bool seenPoint = false;
    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (isDigit(c)) {
            digits.push_back(c);
            if (seenPoint) {
                ++fractionDigits;
            }
        } else if (c == '.' && !seenPoint) {
            seenPoint = true;
        } else {
            break;
        }
    }
    if (digits.empty()) {
        return std::nullopt;
    }

    std::int64_t exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        bool exponentNegative = false;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            exponentNegative = text[pos] == '-';
            ++pos;
        }
        const size_t exponentStart = pos;
        for (; pos < text.size() && isDigit(text[pos]); ++pos) {
            if (exponent < K_EXPONENT_SATURATION) {
                exponent = exponent * 10 + (text[pos] - '0');
            }
        }
        if (pos == exponentStart) {
            return std::nullopt;
        }
        if (exponentNegative) {
            exponent = -exponent;
        }
    }

    if (pos != text.size()) {
        spdlog::debug("Rejecting numeric literal '{}'", text);
        return std::nullopt;
    }

    if (digits.find_first_not_of('0') == std::string::npos) {
        return Rational();
    }
    if (exponent >= K_EXPONENT_SATURATION ||
        exponent <= -K_EXPONENT_SATURATION) {
        spdlog::warn("Exponent of numeric literal '{}' is out of range", text);
        return std::nullopt;
    }

    const std::int64_t scale = exponent - fractionDigits;
#if QUANTA_MAX_DECIMAL_EXPONENT > 0
    if (scale > QUANTA_MAX_DECIMAL_EXPONENT ||
        scale < -QUANTA_MAX_DECIMAL_EXPONENT) {
        spdlog::warn("Numeric literal '{}' exceeds the supported scale 10^{}",
                     text, QUANTA_MAX_DECIMAL_EXPONENT);
        return std::nullopt;
    }
#endif

    BigInteger mantissa(digits);
    if (negative) {
        mantissa = mantissa.negate();
    }

    if (scale >= 0) {
        return normalize(
            mantissa * BigInteger::pow10(static_cast<std::uint64_t>(scale)),
            BigInteger(1));
    }
    return normalize(std::move(mantissa),
                     BigInteger::pow10(static_cast<std::uint64_t>(-scale)));
}

}  // namespace

auto parseRational(std::string_view input) -> std::optional<Rational> {
    const auto text = utils::trim(input);
    if (text.empty()) {
        return std::nullopt;
    }

    const auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        return parseDecimal(text);
    }
    if (text.find('/', slash + 1) != std::string_view::npos) {
        spdlog::debug("Rejecting '{}': more than one fraction bar", text);
        return std::nullopt;
    }

    auto numerator = parseDecimal(text.substr(0, slash));
    auto denominator = parseDecimal(text.substr(slash + 1));
    if (!numerator || !denominator) {
        return std::nullopt;
    }
    if (denominator->isZero()) {
        spdlog::debug("Rejecting '{}': zero denominator", text);
        return std::nullopt;
    }
    return divide(*numerator, *denominator);
}

auto parseRational(double input) -> std::optional<Rational> {
    if (!std::isfinite(input)) {
        return std::nullopt;
    }
    // The shortest text of -0.0 is "-0", which would parse fine, but zero is
    // pinned to exact 0/1 here rather than relying on the text path.
    if (input == 0.0) {
        return Rational();
    }

    std::array<char, 64> buffer{};
    auto [end, ec] =
        std::to_chars(buffer.data(), buffer.data() + buffer.size(), input);
    if (ec != std::errc()) {
        spdlog::error("Cannot render {} as text: {}", input,
                      std::make_error_code(ec).message());
        return std::nullopt;
    }
    return parseRational(
        std::string_view(buffer.data(), static_cast<size_t>(end - buffer.data())));
}

auto parseNumeric(const Numeric& input) -> std::optional<Rational> {
    if (const auto* rational = std::get_if<Rational>(&input)) {
        return normalize(*rational);
    }
    if (const auto* text = std::get_if<std::string>(&input)) {
        return parseRational(std::string_view(*text));
    }
    if (const auto* number = std::get_if<double>(&input)) {
        return parseRational(*number);
    }
    return std::nullopt;
}

}  // namespace quanta::algorithm
