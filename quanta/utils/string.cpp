/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Q. <contact@lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Some useful string functions

**************************************************/

#include "string.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>

namespace quanta::utils {

auto trim(std::string_view line, std::string_view symbols)
    -> std::string_view {
    if (line.empty()) {
        return {};
    }

    const auto isSymbol = [&symbols](char c) {
        return symbols.find(c) != std::string_view::npos;
    };

    auto start = std::ranges::find_if_not(line, isSymbol);
    if (start == line.end()) {
        return {};
    }

    auto rbegin = std::make_reverse_iterator(line.end());
    auto rend = std::make_reverse_iterator(start);
    auto last = std::ranges::find_if_not(std::ranges::subrange(rbegin, rend),
                                         isSymbol);
    auto end = last.base();

    return line.substr(static_cast<size_t>(start - line.begin()),
                       static_cast<size_t>(end - start));
}

auto replaceString(std::string_view text, std::string_view oldStr,
                   std::string_view newStr) -> std::string {
    if (text.empty() || oldStr.empty()) {
        return std::string(text);
    }

    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    size_t lastPos = 0;

    while ((pos = text.find(oldStr, lastPos)) != std::string_view::npos) {
        result.append(text.substr(lastPos, pos - lastPos));
        result.append(newStr);
        lastPos = pos + oldStr.size();
    }

    result.append(text.substr(lastPos));
    return result;
}

}  // namespace quanta::utils
