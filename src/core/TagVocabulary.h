// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef SENTINEL_TAG_VOCABULARY_H
#define SENTINEL_TAG_VOCABULARY_H

#include <algorithm>
#include <array>
#include <string_view>

namespace Sentinel {

// Closed classification vocabulary offered for assignment.
// Imported records may carry other tags; those are kept but never offered.
inline constexpr std::array<std::string_view, 4> TAG_VOCABULARY = {
    "MAIN", "ALT", "FARM", "TRADE"
};

[[nodiscard]] constexpr bool is_known_tag(std::string_view tag) noexcept {
    return std::find(TAG_VOCABULARY.begin(), TAG_VOCABULARY.end(), tag) != TAG_VOCABULARY.end();
}

} // namespace Sentinel

#endif // SENTINEL_TAG_VOCABULARY_H
