/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Q. <contact@lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Some useful string functions

**************************************************/

#ifndef QUANTA_UTILS_STRING_HPP
#define QUANTA_UTILS_STRING_HPP

#include <string>
#include <string_view>

namespace quanta::utils {

/**
 * @brief Trims a string_view.
 *
 * @param line The string_view to trim.
 * @param symbols The symbols to trim.
 * @return A view of @p line without leading and trailing symbols.
 */
[[nodiscard("the result of trim is not used")]]
auto trim(std::string_view line, std::string_view symbols = " \n\r\t\f\v")
    -> std::string_view;

/**
 * @brief Replaces every occurrence of a substring.
 *
 * @param text The text in which replacements will be made.
 * @param oldStr The substring to replace.
 * @param newStr The substring to replace with.
 * @return The text with replacements made.
 */
[[nodiscard("the result of replaceString is not used")]]
auto replaceString(std::string_view text, std::string_view oldStr,
                   std::string_view newStr) -> std::string;

}  // namespace quanta::utils

#endif  // QUANTA_UTILS_STRING_HPP
