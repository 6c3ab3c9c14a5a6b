// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef SENTINEL_BACKUP_CODEC_H
#define SENTINEL_BACKUP_CODEC_H

#include "../IdentityTypes.h"
#include "../SentinelError.h"
#include "../services/IObserverService.h"
#include <google/protobuf/struct.pb.h>
#include <chrono>
#include <string>
#include <string_view>

/**
 * @brief Backup envelope encoding and decoding
 *
 * Backups are UTF-8 JSON. Two layouts are understood:
 * - Version 1: a bare array of identity objects
 * - Version 2: {"version": 2, "identities": [...], "observerData": [...]}
 *   Older version 2 writers used "sentinel" and "observer" as member names;
 *   both spellings are accepted on import.
 *
 * Detection goes by shape only. An object carrying an identities member
 * is an envelope whatever its "version" says.
 *
 * Export always writes version 2 with the current member names.
 */
namespace Sentinel::BackupCodec {

/// Envelope version written by encode()
inline constexpr int CURRENT_VERSION = 2;

/// Conventional extension for backup files
inline constexpr std::string_view FILE_EXTENSION = ".nexus";

// Envelope member names
inline constexpr std::string_view KEY_VERSION = "version";
inline constexpr std::string_view KEY_IDENTITIES = "identities";
inline constexpr std::string_view KEY_IDENTITIES_LEGACY = "sentinel";
inline constexpr std::string_view KEY_OBSERVER = "observerData";
inline constexpr std::string_view KEY_OBSERVER_LEGACY = "observer";

/**
 * @brief Layout detected by decode()
 */
enum class BackupFormat {
    LegacyList,  ///< Version 1 bare array
    Envelope     ///< Version 2 object
};

/**
 * @brief Result of decoding a backup
 */
struct DecodedBackup {
    BackupFormat format = BackupFormat::Envelope;
    int version = CURRENT_VERSION;
    IdentityList identities;            ///< Sanitized, ready for replace_all()
    ObserverRecordList observer_data;   ///< Passed through untouched
    size_t skipped_entries = 0;         ///< Identity entries that were not objects
};

/**
 * @brief Serialize the whole system into a version 2 envelope
 * @return Indented JSON text
 *
 * Errors: SerializationFailed
 */
[[nodiscard]] SentinelResult<std::string>
encode(const IdentityList& identities, const ObserverRecordList& observer_data);

/**
 * @brief Parse backup text and detect its layout
 *
 * Decoding never touches application state.
 *
 * Errors:
 * - CorruptBackup: not JSON, or JSON that is neither an array nor an
 *   object carrying an identities member
 */
[[nodiscard]] SentinelResult<DecodedBackup> decode(std::string_view text);

/**
 * @brief Turn one imported identity object into a record
 *
 * - vault: kept if it is a 10-element array, else 10 sentinels; elements
 *   that are not non-empty strings become EMPTY_SLOT
 * - tags: string elements of an array (duplicates dropped), else empty
 * - note, hiddenDescription, name, secret: "" if absent or not a string
 * - id: a missing, empty or non-string id gets a fresh one (numbers are
 *   converted to their decimal text)
 * - Any other member is preserved in extra_fields
 */
[[nodiscard]] sentinel::IdentityRecord sanitize(const google::protobuf::Struct& object);

/**
 * @brief JSON object form of a record, including preserved extra fields
 */
[[nodiscard]] google::protobuf::Value to_value(const sentinel::IdentityRecord& record);

/**
 * @brief Default export file name: nexus_global_backup_<unix-millis>.nexus
 */
[[nodiscard]] std::string make_backup_filename(
    std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

} // namespace Sentinel::BackupCodec

#endif // SENTINEL_BACKUP_CODEC_H
