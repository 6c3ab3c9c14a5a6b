// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file IdentityService.h
 * @brief Validation and field-level operations on identities
 */

#pragma once

#include "../repositories/IIdentityRepository.h"
#include <string>
#include <string_view>

namespace Sentinel {

/**
 * @brief Business rules for identities
 *
 * Implements:
 * - Creation: name/secret validation, secret normalization, id assignment
 *   and an all-sentinel vault
 * - Note and hidden description edits
 * - Tag toggling restricted to the fixed vocabulary
 * - Vault slot writes (single slot and batch)
 *
 * Data access is delegated to the repository, which persists every
 * successful change.
 */
class IdentityService {
public:
    /**
     * @param repository Non-owning pointer to the identity store
     * @throws std::invalid_argument if repository is null
     */
    explicit IdentityService(IIdentityRepository* repository);

    // Non-copyable, non-movable (holds non-owning pointer)
    IdentityService(const IdentityService&) = delete;
    IdentityService& operator=(const IdentityService&) = delete;
    IdentityService(IdentityService&&) = delete;
    IdentityService& operator=(IdentityService&&) = delete;

    /**
     * @brief Create and store an identity from a draft
     * @return The stored record (with its new id)
     *
     * Errors:
     * - RejectedInput: empty name, empty secret, secret failing the base32
     *   pattern after normalization, fields that are not valid UTF-8, or
     *   a draft tag outside the vocabulary
     */
    [[nodiscard]] SentinelResult<sentinel::IdentityRecord>
        create_identity(const IdentityDraft& draft);

    /**
     * @brief Validate a draft without storing anything
     */
    [[nodiscard]] SentinelResult<> validate_draft(const IdentityDraft& draft) const;

    [[nodiscard]] SentinelResult<sentinel::IdentityRecord>
        update_note(std::string_view id, const std::string& note);

    [[nodiscard]] SentinelResult<sentinel::IdentityRecord>
        update_hidden_description(std::string_view id, const std::string& description);

    /**
     * @brief Add @p tag if absent, remove it if present
     *
     * Errors:
     * - RejectedInput: tag is not in TAG_VOCABULARY
     * - NotFound: unknown id
     */
    [[nodiscard]] SentinelResult<sentinel::IdentityRecord>
        toggle_tag(std::string_view id, std::string_view tag);

    /**
     * @brief Write @p value into one vault slot
     *
     * The value is trimmed; an empty result stores EMPTY_SLOT.
     *
     * Errors:
     * - InvalidIndex: index >= VAULT_SLOT_COUNT
     * - NotFound: unknown id
     */
    [[nodiscard]] SentinelResult<sentinel::IdentityRecord>
        set_vault_slot(std::string_view id, size_t index, std::string_view value);

    /**
     * @brief Write consecutive slots starting at @p start in one save
     * @return Indices actually written (values past the last slot are dropped)
     */
    [[nodiscard]] SentinelResult<std::vector<size_t>>
        fill_vault_slots(std::string_view id, size_t start, const std::vector<std::string>& values);

    /**
     * @brief Generate a random RFC 4122 version 4 id
     * @throws std::runtime_error if the CSPRNG fails
     */
    [[nodiscard]] static std::string generate_id();

private:
    IIdentityRepository* m_repository;  ///< Non-owning pointer to repository
};

}  // namespace Sentinel
