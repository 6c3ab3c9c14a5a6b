// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file BackupController.h
 * @brief Export and import of the whole system through backup files
 */

#pragma once

#include "../io/BackupCodec.h"
#include "../repositories/IIdentityRepository.h"
#include "../services/IObserverService.h"
#include <string>
#include <string_view>

namespace Sentinel {

/**
 * @brief Outcome of a successful import
 */
struct ImportSummary {
    BackupCodec::BackupFormat format = BackupCodec::BackupFormat::Envelope;
    size_t identities = 0;        ///< Records now in the store
    size_t observer_records = 0;  ///< Records forwarded to the observer service
    size_t skipped_entries = 0;   ///< Identity entries that were not objects
};

/**
 * @brief Moves the whole system in and out of backup text
 *
 * Export reads the identity store and the observer dataset and produces a
 * version 2 envelope. Import is all-or-nothing:
 * 1. Decode (CorruptBackup leaves state untouched)
 * 2. Require the caller's confirmation (ConfirmationRequired otherwise)
 * 3. Replace the store wholesale (persisted by the repository)
 * 4. Forward non-empty observer data to the observer service
 *
 * The confirmation flag comes from the user-facing layer; this class
 * never assumes it.
 */
class BackupController {
public:
    /**
     * @throws std::invalid_argument if either pointer is null
     */
    BackupController(IIdentityRepository* repository, IObserverService* observer);

    // Non-copyable, non-movable (holds non-owning pointers)
    BackupController(const BackupController&) = delete;
    BackupController& operator=(const BackupController&) = delete;
    BackupController(BackupController&&) = delete;
    BackupController& operator=(BackupController&&) = delete;

    /// Backup text for the current state
    [[nodiscard]] SentinelResult<std::string> export_text() const;

    /**
     * @brief Write a backup file
     * @param path Target file, or a directory to place a default-named file in
     * @return Path actually written
     */
    [[nodiscard]] SentinelResult<std::string> export_to_file(const std::string& path) const;

    /**
     * @brief Decode without importing, for showing what would be replaced
     */
    [[nodiscard]] SentinelResult<BackupCodec::DecodedBackup> preview(std::string_view text) const;

    /**
     * @brief Replace the system with the contents of backup text
     * @param confirmed The user agreed to overwrite the current data
     */
    [[nodiscard]] SentinelResult<ImportSummary> import_text(std::string_view text, bool confirmed);

    /**
     * @brief Read a backup file and import it
     *
     * File errors (FileNotFound, FileTooLarge, FileReadFailed) are reported
     * before decoding.
     */
    [[nodiscard]] SentinelResult<ImportSummary> import_file(const std::string& path, bool confirmed);

private:
    IIdentityRepository* m_repository;  ///< Non-owning
    IObserverService* m_observer;       ///< Non-owning
};

}  // namespace Sentinel
