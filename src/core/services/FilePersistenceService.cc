// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
// File: src/core/services/FilePersistenceService.cc

#include "FilePersistenceService.h"
#include "IdentityService.h"
#include "../io/FileIO.h"
#include "../../utils/Log.h"
#include <stdexcept>

namespace Sentinel {

FilePersistenceService::FilePersistenceService(std::string path)
    : m_path(std::move(path)) {
    if (m_path.empty()) {
        throw std::invalid_argument("FilePersistenceService: path cannot be empty");
    }
}

SentinelResult<IdentityList> FilePersistenceService::load() {
    m_migrated = 0;

    auto content = FileIO::read_file(m_path, FileIO::MAX_STORE_SIZE);
    if (!content) {
        if (content.error() == SentinelError::FileNotFound) {
            Log::info("FilePersistenceService: no store at {}, starting empty", m_path);
            return IdentityList{};
        }
        return std::unexpected(content.error());
    }

    sentinel::IdentityStore store;
    if (!store.ParseFromString(*content)) {
        Log::error("FilePersistenceService: {} is not a valid identity store", m_path);
        return std::unexpected(SentinelError::DeserializationFailed);
    }

    if (store.schema_version() > STORE_SCHEMA_VERSION) {
        Log::error("FilePersistenceService: store schema {} is newer than {}",
                   store.schema_version(), STORE_SCHEMA_VERSION);
        return std::unexpected(SentinelError::UnsupportedVersion);
    }

    IdentityList identities;
    identities.reserve(static_cast<size_t>(store.identities_size()));
    for (auto& record : *store.mutable_identities()) {
        if (migrate_record(record)) {
            ++m_migrated;
        }
        identities.push_back(std::move(record));
    }

    if (m_migrated > 0) {
        Log::info("FilePersistenceService: migrated {} records", m_migrated);
    }
    Log::debug("FilePersistenceService: loaded {} records from {}", identities.size(), m_path);
    return identities;
}

SentinelResult<> FilePersistenceService::save(const IdentityList& identities) {
    sentinel::IdentityStore store;
    store.set_schema_version(STORE_SCHEMA_VERSION);
    for (const auto& record : identities) {
        *store.add_identities() = record;
    }

    std::string serialized;
    if (!store.SerializeToString(&serialized)) {
        Log::error("FilePersistenceService: failed to serialize {} records", identities.size());
        return std::unexpected(SentinelError::SerializationFailed);
    }

    return FileIO::write_file_atomic(m_path, serialized);
}

bool FilePersistenceService::migrate_record(sentinel::IdentityRecord& record) {
    bool changed = false;

    if (record.id().empty()) {
        record.set_id(IdentityService::generate_id());
        changed = true;
    }

    if (static_cast<size_t>(record.vault_size()) != VAULT_SLOT_COUNT) {
        fill_empty_vault(record);
        changed = true;
    } else {
        for (auto& slot : *record.mutable_vault()) {
            if (slot.empty()) {
                slot = std::string(EMPTY_SLOT);
                changed = true;
            }
        }
    }

    return changed;
}

}  // namespace Sentinel
