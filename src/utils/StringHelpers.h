// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file StringHelpers.h
 * @brief Trimming, normalization and UTF-8 validation for user input
 */

#ifndef SENTINEL_STRING_HELPERS_H
#define SENTINEL_STRING_HELPERS_H

#include <glibmm/ustring.h>
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include "Log.h"

namespace Sentinel {

/// Characters treated as whitespace by trim() and strip_whitespace()
inline constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

/**
 * @brief Remove leading and trailing whitespace
 */
[[nodiscard]] inline std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(WHITESPACE);
    return std::string(text.substr(first, last - first + 1));
}

/**
 * @brief Remove every whitespace character, including interior ones
 */
[[nodiscard]] inline std::string strip_whitespace(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (WHITESPACE.find(c) == std::string_view::npos) {
            result.push_back(c);
        }
    }
    return result;
}

/**
 * @brief ASCII uppercase copy
 */
[[nodiscard]] inline std::string to_upper_ascii(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

/**
 * @brief Check input text for valid UTF-8 before it reaches the store
 *
 * @param text Raw bytes from the command line, a paste or a backup file
 * @param field_name Field name for the warning
 * @return true if valid UTF-8
 */
[[nodiscard]] inline bool is_valid_utf8(const std::string& text, const char* field_name = "field") {
    if (text.empty()) {
        return true;
    }

    const Glib::ustring ustr(text);
    if (!ustr.validate()) {
        Log::warning("Invalid UTF-8 detected in {}", field_name);
        return false;
    }
    return true;
}

} // namespace Sentinel

#endif // SENTINEL_STRING_HELPERS_H
