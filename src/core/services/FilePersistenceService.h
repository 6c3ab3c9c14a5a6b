// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
// File: src/core/services/FilePersistenceService.h

#ifndef SENTINEL_FILE_PERSISTENCE_SERVICE_H
#define SENTINEL_FILE_PERSISTENCE_SERVICE_H

#include "IPersistenceService.h"
#include <string>

namespace Sentinel {

/**
 * @brief Identity store kept in one protobuf file
 *
 * The file holds a serialized sentinel::IdentityStore. Every save rewrites
 * the whole file atomically with owner-only permissions (see FileIO).
 *
 * Load behavior:
 * - Missing file: empty collection
 * - Unparseable file: DeserializationFailed
 * - schema_version newer than STORE_SCHEMA_VERSION: UnsupportedVersion
 * - Records written by older builds are migrated in memory: a vault that
 *   is not exactly VAULT_SLOT_COUNT long is reset to sentinels, empty slot
 *   strings become EMPTY_SLOT, and a missing id is generated. The migrated
 *   form reaches disk with the next save.
 */
class FilePersistenceService : public IPersistenceService {
public:
    /**
     * @param path Store file location
     * @throws std::invalid_argument if path is empty
     */
    explicit FilePersistenceService(std::string path);

    [[nodiscard]] SentinelResult<IdentityList> load() override;
    [[nodiscard]] SentinelResult<> save(const IdentityList& identities) override;

    [[nodiscard]] const std::string& path() const noexcept { return m_path; }

    /// Number of records adjusted by the last load()
    [[nodiscard]] size_t migrated_count() const noexcept { return m_migrated; }

    /**
     * @brief Bring one stored record up to the current invariants
     * @return true if the record was changed
     */
    static bool migrate_record(sentinel::IdentityRecord& record);

private:
    std::string m_path;
    size_t m_migrated{0};
};

}  // namespace Sentinel

#endif  // SENTINEL_FILE_PERSISTENCE_SERVICE_H
