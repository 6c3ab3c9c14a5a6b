// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file IIdentityRepository.h
 * @brief Interface for the identity record store
 *
 * Separates ownership of the identity collection from validation and
 * interaction logic.
 */

#pragma once

#include <functional>
#include <optional>
#include <string_view>
#include "../IdentityTypes.h"
#include "../SentinelError.h"

namespace Sentinel {

/**
 * @brief Field-level change applied to one record by update()
 */
using IdentityMutator = std::function<void(sentinel::IdentityRecord&)>;

/**
 * @brief Interface for identity store operations
 *
 * Design Principles:
 * - The repository exclusively owns the collection
 * - Id-based addressing; insertion order is display order
 * - Every successful mutation is written through to persistence as
 *   a full-collection save
 * - std::expected for explicit error handling
 *
 * @note Single writer; all calls must come from the main loop thread
 */
class IIdentityRepository {
public:
    virtual ~IIdentityRepository() = default;

    /**
     * @brief Append a fully formed record
     * @param record Record with id, normalized secret and 10-slot vault
     *
     * Errors:
     * - RejectedInput: empty or duplicate id, or vault not VAULT_SLOT_COUNT long
     */
    [[nodiscard]] virtual SentinelResult<>
        add(const sentinel::IdentityRecord& record) = 0;

    /**
     * @brief Remove the record with @p id
     * @return true if a record was removed, false if none matched
     *
     * Idempotent: an unknown id is not an error.
     */
    [[nodiscard]] virtual SentinelResult<bool>
        remove(std::string_view id) = 0;

    /**
     * @brief Apply @p mutator to the record with @p id
     * @return The updated record
     *
     * The mutator runs on a copy. The copy replaces the stored record
     * only if it still has VAULT_SLOT_COUNT slots and the same id.
     *
     * Errors:
     * - NotFound: no record with this id
     * - RejectedInput: mutator broke the vault length or changed the id
     */
    [[nodiscard]] virtual SentinelResult<sentinel::IdentityRecord>
        update(std::string_view id, const IdentityMutator& mutator) = 0;

    /**
     * @brief Substitute the whole collection (import)
     *
     * No per-record validation; callers sanitize first.
     */
    [[nodiscard]] virtual SentinelResult<>
        replace_all(IdentityList identities) = 0;

    /**
     * @brief Get record by id
     *
     * Errors:
     * - NotFound: no record with this id
     */
    [[nodiscard]] virtual SentinelResult<sentinel::IdentityRecord>
        get_by_id(std::string_view id) const = 0;

    /// Snapshot of the collection in display order
    [[nodiscard]] virtual IdentityList get_all() const = 0;

    [[nodiscard]] virtual size_t count() const noexcept = 0;

    [[nodiscard]] virtual std::optional<size_t>
        find_index_by_id(std::string_view id) const noexcept = 0;
};

}  // namespace Sentinel
