// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file IdentityRepository.h
 * @brief In-memory identity store with write-through persistence
 */

#pragma once

#include "IIdentityRepository.h"
#include "../services/IPersistenceService.h"
#include <sigc++/sigc++.h>

namespace Sentinel {

/**
 * @brief Concrete identity store
 *
 * Owns the collection as a vector of protobuf records. After each
 * successful mutation the entire collection is handed to the
 * persistence service. A failed save is logged and reported through
 * signal_save_failed(); the in-memory collection stays authoritative
 * and the next save rewrites it in full.
 *
 * Thread Safety:
 * - Not thread-safe
 * - All calls must be from the main loop thread
 */
class IdentityRepository : public IIdentityRepository {
public:
    /**
     * @brief Construct repository over a persistence backend
     * @param persistence Non-owning pointer, must outlive the repository
     * @throws std::invalid_argument if persistence is null
     */
    explicit IdentityRepository(IPersistenceService* persistence);

    ~IdentityRepository() override = default;

    // Non-copyable, non-movable (holds non-owning pointer and signals)
    IdentityRepository(const IdentityRepository&) = delete;
    IdentityRepository& operator=(const IdentityRepository&) = delete;
    IdentityRepository(IdentityRepository&&) = delete;
    IdentityRepository& operator=(IdentityRepository&&) = delete;

    /**
     * @brief Populate the collection from persistence
     *
     * Replaces the in-memory collection without saving it back.
     */
    [[nodiscard]] SentinelResult<> load();

    // IIdentityRepository interface implementation
    [[nodiscard]] SentinelResult<>
        add(const sentinel::IdentityRecord& record) override;

    [[nodiscard]] SentinelResult<bool>
        remove(std::string_view id) override;

    [[nodiscard]] SentinelResult<sentinel::IdentityRecord>
        update(std::string_view id, const IdentityMutator& mutator) override;

    [[nodiscard]] SentinelResult<>
        replace_all(IdentityList identities) override;

    [[nodiscard]] SentinelResult<sentinel::IdentityRecord>
        get_by_id(std::string_view id) const override;

    [[nodiscard]] IdentityList get_all() const override;

    [[nodiscard]] size_t count() const noexcept override;

    [[nodiscard]] std::optional<size_t>
        find_index_by_id(std::string_view id) const noexcept override;

    /// Emitted after every successful mutation and after load()
    [[nodiscard]] sigc::signal<void()>& signal_collection_changed() { return m_signal_changed; }

    /// Emitted when persistence rejects a save
    [[nodiscard]] sigc::signal<void(SentinelError)>& signal_save_failed() { return m_signal_save_failed; }

private:
    void persist();

    IPersistenceService* m_persistence;  ///< Non-owning pointer to backend
    IdentityList m_identities;
    sigc::signal<void()> m_signal_changed;
    sigc::signal<void(SentinelError)> m_signal_save_failed;
};

}  // namespace Sentinel
