// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file StringHelpers.h
 * @brief Small ASCII string utilities shared by parsers and policies
 */

#ifndef PULSAR_STRING_HELPERS_H
#define PULSAR_STRING_HELPERS_H

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace Pulsar {

/**
 * @brief Lowercase ASCII letters, leave every other byte untouched
 */
inline std::string to_lower_ascii(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lower;
}

/**
 * @brief Strip leading and trailing whitespace (including '\r')
 */
inline std::string_view trim(std::string_view text) noexcept {
    constexpr std::string_view whitespace{" \t\r\n\f\v"};
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

/**
 * @brief Split on a delimiter, keeping empty fields
 * @note Views point into @p text, which must outlive the result
 */
inline std::vector<std::string_view> split(std::string_view text, char delimiter) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        const auto pos = text.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

/**
 * @brief Case-insensitive (ASCII) substring test
 */
inline bool contains_ignore_case(std::string_view haystack, std::string_view needle) {
    return to_lower_ascii(haystack).find(to_lower_ascii(needle)) != std::string::npos;
}

} // namespace Pulsar

#endif // PULSAR_STRING_HELPERS_H
