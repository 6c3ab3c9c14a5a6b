// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file FileIO.h
 * @brief Owner-only file reads and atomic writes
 *
 * Used by the identity store, the observer archive and backup export/import.
 */

#ifndef SENTINEL_FILEIO_H
#define SENTINEL_FILEIO_H

#include <cstddef>
#include <string>
#include "../SentinelError.h"

namespace Sentinel {

/**
 * @brief Static helpers for reading and atomically replacing files
 *
 * @section features Features
 * - Atomic writes through a temporary file and rename(2)
 * - Owner-only permissions (0600) on every written file
 * - Directory fsync after rename for durability
 * - Size cap on reads so a stray large file is never loaded
 * - Symlinks refused on read (O_NOFOLLOW)
 *
 * @section limitations Limitations
 * - No file locking. Two processes writing the same store race and the
 *   last rename wins.
 *
 * @section usage Usage Example
 * @code
 * auto text = FileIO::read_file(path, FileIO::MAX_BACKUP_SIZE);
 * if (!text) {
 *     Log::error("Read failed: {}", to_string(text.error()));
 * }
 *
 * auto written = FileIO::write_file_atomic(path, *text);
 * @endcode
 */
class FileIO {
public:
    FileIO() = delete;

    /// Largest backup file accepted for import (100 MiB)
    static constexpr size_t MAX_BACKUP_SIZE = 100 * 1024 * 1024;

    /// Largest store or observer file accepted on load (100 MiB)
    static constexpr size_t MAX_STORE_SIZE = 100 * 1024 * 1024;

    /**
     * @brief Read a whole regular file
     * @param path File to read
     * @param max_size Refuse files larger than this
     * @return File contents
     *
     * Errors:
     * - FileNotFound: path does not exist
     * - FileTooLarge: size exceeds @p max_size
     * - FileReadFailed: not a regular file, symlink, or I/O error
     */
    [[nodiscard]] static SentinelResult<std::string> read_file(const std::string& path, size_t max_size);

    /**
     * @brief Replace @p path with @p data atomically
     *
     * Writes <path>.tmp, renames it over @p path, sets 0600 and syncs the
     * parent directory. Missing parent directories are created (0700).
     *
     * @post On failure the previous file content is unchanged and the
     *       temporary file is removed
     *
     * Errors: FileWriteFailed
     */
    [[nodiscard]] static SentinelResult<> write_file_atomic(const std::string& path, const std::string& data);

    /**
     * @brief Check whether @p path exists (without following symlinks)
     */
    [[nodiscard]] static bool file_exists(const std::string& path) noexcept;
};

} // namespace Sentinel

#endif // SENTINEL_FILEIO_H
