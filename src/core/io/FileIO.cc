// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file FileIO.cc
 * @brief Implementation of owner-only file reads and atomic writes
 */

#include "FileIO.h"
#include "../../utils/Log.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#ifdef __linux__
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#endif

namespace Sentinel {

SentinelResult<std::string> FileIO::read_file(const std::string& path, size_t max_size) {
    namespace fs = std::filesystem;

    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) {
        Log::debug("FileIO: {} does not exist", path);
        return std::unexpected(SentinelError::FileNotFound);
    }

    if (!fs::is_regular_file(status)) {
        Log::error("FileIO: {} is not a regular file", path);
        return std::unexpected(SentinelError::FileReadFailed);
    }

    try {
#ifdef __linux__
        // Size check on the opened descriptor, refusing symlinks
        const int fd = open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
        if (fd < 0) {
            Log::error("FileIO: failed to open {} (errno: {})", path, errno);
            return std::unexpected(SentinelError::FileReadFailed);
        }

        struct stat st;
        const bool stat_ok = (fstat(fd, &st) == 0);
        close(fd);
        if (!stat_ok) {
            Log::error("FileIO: failed to stat {}", path);
            return std::unexpected(SentinelError::FileReadFailed);
        }
        if (static_cast<size_t>(st.st_size) > max_size) {
            Log::error("FileIO: {} is {} bytes, limit is {}", path, st.st_size, max_size);
            return std::unexpected(SentinelError::FileTooLarge);
        }
#else
        if (fs::file_size(path) > max_size) {
            Log::error("FileIO: {} exceeds the {} byte limit", path, max_size);
            return std::unexpected(SentinelError::FileTooLarge);
        }
#endif

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            Log::error("FileIO: failed to open {}", path);
            return std::unexpected(SentinelError::FileReadFailed);
        }

        std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
        if (file.bad()) {
            Log::error("FileIO: error reading {}", path);
            return std::unexpected(SentinelError::FileReadFailed);
        }
        return content;

    } catch (const std::exception& e) {
        Log::error("FileIO: exception reading {}: {}", path, e.what());
        return std::unexpected(SentinelError::FileReadFailed);
    }
}

SentinelResult<> FileIO::write_file_atomic(const std::string& path, const std::string& data) {
    namespace fs = std::filesystem;
    const std::string temp_path = path + ".tmp";

    try {
        const fs::path parent = fs::path(path).parent_path();
        if (!parent.empty() && !fs::exists(parent)) {
            fs::create_directories(parent);
            fs::permissions(parent, fs::perms::owner_all, fs::perm_options::replace);
        }

        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                Log::error("FileIO: failed to create temporary file for {}", path);
                return std::unexpected(SentinelError::FileWriteFailed);
            }

            // Restrict before any content lands on disk
            fs::permissions(temp_path,
                fs::perms::owner_read | fs::perms::owner_write,
                fs::perm_options::replace);

            file.write(data.data(), static_cast<std::streamsize>(data.size()));
            file.flush();
            if (!file.good()) {
                Log::error("FileIO: failed to write {}", temp_path);
                file.close();
                fs::remove(temp_path);
                return std::unexpected(SentinelError::FileWriteFailed);
            }
        }

        fs::rename(temp_path, path);

#ifdef __linux__
        chmod(path.c_str(), S_IRUSR | S_IWUSR);  // 0600

        const std::string dir_path = parent.empty() ? std::string(".") : parent.string();
        const int dir_fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
        if (dir_fd >= 0) {
            fsync(dir_fd);
            close(dir_fd);
        }
#endif

        fs::permissions(path,
            fs::perms::owner_read | fs::perms::owner_write,
            fs::perm_options::replace);

        return {};

    } catch (const std::exception& e) {
        Log::error("FileIO: error writing {}: {}", path, e.what());
        std::error_code ec;
        fs::remove(temp_path, ec);
        if (ec) {
            Log::warning("FileIO: failed to remove temp file during error cleanup: {}", ec.message());
        }
        return std::unexpected(SentinelError::FileWriteFailed);
    }
}

bool FileIO::file_exists(const std::string& path) noexcept {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

} // namespace Sentinel
