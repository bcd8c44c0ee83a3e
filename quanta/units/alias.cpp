#include "alias.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "quanta/utils/string.hpp"

namespace quanta::units {

namespace {

constexpr std::string_view K_WHITESPACE = " \n\r\t\f\v";

auto isSpace(char c) noexcept -> bool {
    return K_WHITESPACE.find(c) != std::string_view::npos;
}

auto isAsciiLetter(char c) noexcept -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

auto isSymbolChar(char c) noexcept -> bool {
    return isAsciiLetter(c) || (c >= '0' && c <= '9') || c == '[' ||
           c == ']' || c == '%' || c == '.' || c == '^' || c == '-';
}

auto tokenInParentheses(std::string_view text) -> std::optional<std::string> {
    if (text.size() < 3 || text.back() != ')') {
        return std::nullopt;
    }
    const size_t close = text.size() - 1;
    const size_t previousClose = text.rfind(')', close - 1);
    const size_t searchFrom =
        previousClose == std::string_view::npos ? 0 : previousClose + 1;
    const size_t open = text.find('(', searchFrom);
    if (open == std::string_view::npos || open + 1 >= close) {
        return std::nullopt;
    }
    auto inner = utils::trim(text.substr(open + 1, close - open - 1));
    if (inner.empty()) {
        return std::nullopt;
    }
    return std::string(inner);
}

auto tokenAfterSlash(std::string_view text) -> std::optional<std::string> {
    for (size_t slash = text.find('/'); slash != std::string_view::npos;
         slash = text.find('/', slash + 1)) {
        size_t start = slash + 1;
        while (start < text.size() && isSpace(text[start])) {
            ++start;
        }
        if (start >= text.size()) {
            continue;
        }
        auto rest = text.substr(start);
        if (std::ranges::none_of(rest, isSpace)) {
            return std::string(rest);
        }
    }
    return std::nullopt;
}

auto trailingSymbolRun(std::string_view text) -> std::optional<std::string> {
    size_t start = text.size();
    while (start > 0) {
        const auto byte = static_cast<unsigned char>(text[start - 1]);
        if (isSymbolChar(text[start - 1])) {
            --start;
            continue;
        }
        // U+00B5 is C2 B5 and U+03BC is CE BC in UTF-8.
        if (start >= 2) {
            const auto lead = static_cast<unsigned char>(text[start - 2]);
            if ((lead == 0xC2 && byte == 0xB5) ||
                (lead == 0xCE && byte == 0xBC)) {
                start -= 2;
                continue;
            }
        }
        break;
    }
    if (start == text.size()) {
        return std::nullopt;
    }
    return std::string(text.substr(start));
}

void pushUnique(std::vector<std::string>& candidates, std::string value) {
    if (!value.empty() && std::ranges::find(candidates, value) ==
                              candidates.end()) {
        candidates.push_back(std::move(value));
    }
}

}  // namespace

auto parseUnitTokenFromLabel(std::string_view label)
    -> std::optional<std::string> {
    const auto trimmed = utils::trim(label);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (auto token = tokenInParentheses(trimmed)) {
        return token;
    }
    if (auto token = tokenAfterSlash(trimmed)) {
        return token;
    }
    return trailingSymbolRun(trimmed);
}

auto normalizeToken(std::string_view token) -> std::string {
    return utils::replaceString(utils::trim(token), K_GREEK_MU, K_MICRO_SIGN);
}

auto buildUcumCandidates(std::string_view token) -> std::vector<std::string> {
    const auto normalized = normalizeToken(token);
    if (normalized.empty()) {
        return {};
    }

    std::vector<std::string> candidates;
    const auto asciiMicro = utils::replaceString(normalized, K_MICRO_SIGN, "u");
    pushUnique(candidates, asciiMicro);
    pushUnique(candidates, normalized);

    std::string microFromAscii;
    microFromAscii.reserve(asciiMicro.size() + 4);
    for (size_t i = 0; i < asciiMicro.size(); ++i) {
        if (asciiMicro[i] == 'u' && i + 1 < asciiMicro.size() &&
            isAsciiLetter(asciiMicro[i + 1])) {
            microFromAscii.append(K_MICRO_SIGN);
        } else {
            microFromAscii.push_back(asciiMicro[i]);
        }
    }
    pushUnique(candidates, std::move(microFromAscii));
    return candidates;
}

auto resolveUnitId(std::string_view token, const AliasMap& codes)
    -> std::optional<std::string> {
    for (const auto& candidate : buildUcumCandidates(token)) {
        if (auto it = codes.find(candidate); it != codes.end()) {
            return it->second;
        }
    }
    spdlog::debug("No unit matches token '{}'", token);
    return std::nullopt;
}

}  // namespace quanta::units
