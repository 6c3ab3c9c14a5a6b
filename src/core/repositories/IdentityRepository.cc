// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file IdentityRepository.cc
 * @brief Implementation of IdentityRepository
 *
 * Error Handling Strategy:
 * - Validates structural invariants (id, vault length) before touching
 *   the collection, so a rejected call leaves it unchanged
 * - Reports unknown ids (NotFound) except in remove(), which is idempotent
 * - Save failures never roll back the in-memory collection
 */

#include "IdentityRepository.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <stdexcept>

namespace Sentinel {

namespace {
    bool has_full_vault(const sentinel::IdentityRecord& record) {
        return static_cast<size_t>(record.vault_size()) == VAULT_SLOT_COUNT;
    }
}

IdentityRepository::IdentityRepository(IPersistenceService* persistence)
    : m_persistence(persistence) {
    if (!m_persistence) {
        throw std::invalid_argument("IdentityRepository: persistence cannot be null");
    }
}

SentinelResult<> IdentityRepository::load() {
    auto result = m_persistence->load();
    if (!result) {
        Log::error("IdentityRepository: load failed: {}", to_string(result.error()));
        return std::unexpected(result.error());
    }

    m_identities = std::move(result.value());
    Log::info("IdentityRepository: loaded {} identities", m_identities.size());
    m_signal_changed.emit();
    return {};
}

SentinelResult<> IdentityRepository::add(const sentinel::IdentityRecord& record) {
    if (record.id().empty()) {
        Log::warning("IdentityRepository: rejected record without id");
        return std::unexpected(SentinelError::RejectedInput);
    }

    if (find_index_by_id(record.id())) {
        Log::warning("IdentityRepository: rejected duplicate id {}", record.id());
        return std::unexpected(SentinelError::RejectedInput);
    }

    if (!has_full_vault(record)) {
        Log::warning("IdentityRepository: rejected record {} with {} vault slots",
                     record.id(), record.vault_size());
        return std::unexpected(SentinelError::RejectedInput);
    }

    m_identities.push_back(record);
    Log::debug("IdentityRepository: added {} ({} total)", record.id(), m_identities.size());

    persist();
    m_signal_changed.emit();
    return {};
}

SentinelResult<bool> IdentityRepository::remove(std::string_view id) {
    const auto index = find_index_by_id(id);
    if (index) {
        m_identities.erase(m_identities.begin() + static_cast<std::ptrdiff_t>(*index));
        Log::debug("IdentityRepository: removed {} ({} left)", id, m_identities.size());
    } else {
        Log::debug("IdentityRepository: remove of unknown id {} ignored", id);
    }

    // Saved either way: removal is defined as "ensure absent, then persist"
    persist();
    if (index) {
        m_signal_changed.emit();
    }
    return index.has_value();
}

SentinelResult<sentinel::IdentityRecord>
IdentityRepository::update(std::string_view id, const IdentityMutator& mutator) {
    const auto index = find_index_by_id(id);
    if (!index) {
        Log::warning("IdentityRepository: update of unknown id {}", id);
        return std::unexpected(SentinelError::NotFound);
    }

    // Work on a copy so a rejected change leaves the store untouched
    sentinel::IdentityRecord updated = m_identities[*index];
    if (mutator) {
        mutator(updated);
    }

    if (updated.id() != m_identities[*index].id()) {
        Log::error("IdentityRepository: mutator changed the id of {}", id);
        return std::unexpected(SentinelError::RejectedInput);
    }

    if (!has_full_vault(updated)) {
        Log::error("IdentityRepository: mutator left {} vault slots on {}",
                   updated.vault_size(), id);
        return std::unexpected(SentinelError::RejectedInput);
    }

    m_identities[*index] = updated;

    persist();
    m_signal_changed.emit();
    return updated;
}

SentinelResult<> IdentityRepository::replace_all(IdentityList identities) {
    m_identities = std::move(identities);
    Log::info("IdentityRepository: collection replaced ({} identities)", m_identities.size());

    persist();
    m_signal_changed.emit();
    return {};
}

SentinelResult<sentinel::IdentityRecord>
IdentityRepository::get_by_id(std::string_view id) const {
    const auto index = find_index_by_id(id);
    if (!index) {
        return std::unexpected(SentinelError::NotFound);
    }
    return m_identities[*index];
}

IdentityList IdentityRepository::get_all() const {
    return m_identities;
}

size_t IdentityRepository::count() const noexcept {
    return m_identities.size();
}

std::optional<size_t>
IdentityRepository::find_index_by_id(std::string_view id) const noexcept {
    if (id.empty()) {
        return std::nullopt;
    }

    const auto it = std::find_if(m_identities.begin(), m_identities.end(),
        [id](const sentinel::IdentityRecord& record) { return record.id() == id; });
    if (it == m_identities.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(m_identities.begin(), it));
}

void IdentityRepository::persist() {
    auto result = m_persistence->save(m_identities);
    if (!result) {
        Log::error("IdentityRepository: save failed: {}", to_string(result.error()));
        m_signal_save_failed.emit(result.error());
    }
}

}  // namespace Sentinel
