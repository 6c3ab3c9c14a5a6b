// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file IdentityTypes.h
 * @brief Constants and plain types shared by the identity store components
 */

#ifndef SENTINEL_IDENTITY_TYPES_H
#define SENTINEL_IDENTITY_TYPES_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "identity.pb.h"

namespace Sentinel {

/// Number of recovery-code slots in every identity's vault
inline constexpr size_t VAULT_SLOT_COUNT = 10;

/// Marker for an unused vault slot (distinct from an empty string)
inline constexpr std::string_view EMPTY_SLOT = "EMPTY_SLOT";

/// Schema version written to the identity store file
inline constexpr uint32_t STORE_SCHEMA_VERSION = 1;

/**
 * @brief User input for creating an identity
 *
 * @c secret is raw input; it is normalized (whitespace stripped,
 * uppercased) and validated before a record is created.
 */
struct IdentityDraft {
    std::string name;
    std::string secret;
    std::string note;
    std::string hidden_description;
    std::vector<std::string> tags;  ///< Pending tags chosen in the creation form
};

/**
 * @brief Reset a record's vault to VAULT_SLOT_COUNT sentinels
 */
inline void fill_empty_vault(sentinel::IdentityRecord& record) {
    record.clear_vault();
    for (size_t i = 0; i < VAULT_SLOT_COUNT; ++i) {
        record.add_vault(std::string(EMPTY_SLOT));
    }
}

/**
 * @brief True if @p value holds a recovery code rather than the sentinel
 */
[[nodiscard]] inline bool is_filled_slot(std::string_view value) noexcept {
    return !value.empty() && value != EMPTY_SLOT;
}

using IdentityList = std::vector<sentinel::IdentityRecord>;

} // namespace Sentinel

#endif // SENTINEL_IDENTITY_TYPES_H
