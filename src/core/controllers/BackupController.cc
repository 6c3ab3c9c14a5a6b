// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "BackupController.h"
#include "../io/FileIO.h"
#include "../../utils/Log.h"
#include <filesystem>
#include <stdexcept>

namespace Sentinel {

BackupController::BackupController(IIdentityRepository* repository, IObserverService* observer)
    : m_repository(repository),
      m_observer(observer) {
    if (!m_repository) {
        throw std::invalid_argument("BackupController: repository cannot be null");
    }
    if (!m_observer) {
        throw std::invalid_argument("BackupController: observer service cannot be null");
    }
}

SentinelResult<std::string> BackupController::export_text() const {
    return BackupCodec::encode(m_repository->get_all(), m_observer->records());
}

SentinelResult<std::string> BackupController::export_to_file(const std::string& path) const {
    namespace fs = std::filesystem;

    std::string target = path;
    std::error_code ec;
    if (target.empty()) {
        target = BackupCodec::make_backup_filename();
    } else if (fs::is_directory(target, ec)) {
        target = (fs::path(target) / BackupCodec::make_backup_filename()).string();
    }

    auto text = export_text();
    if (!text) {
        return std::unexpected(text.error());
    }

    if (auto written = FileIO::write_file_atomic(target, *text); !written) {
        return std::unexpected(written.error());
    }

    Log::info("BackupController: exported to {}", target);
    return target;
}

SentinelResult<BackupCodec::DecodedBackup> BackupController::preview(std::string_view text) const {
    return BackupCodec::decode(text);
}

SentinelResult<ImportSummary> BackupController::import_text(std::string_view text, bool confirmed) {
    auto decoded = BackupCodec::decode(text);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }

    if (!confirmed) {
        Log::info("BackupController: import not confirmed, nothing changed");
        return std::unexpected(SentinelError::ConfirmationRequired);
    }

    ImportSummary summary;
    summary.format = decoded->format;
    summary.identities = decoded->identities.size();
    summary.observer_records = decoded->observer_data.size();
    summary.skipped_entries = decoded->skipped_entries;

    if (auto replaced = m_repository->replace_all(std::move(decoded->identities)); !replaced) {
        return std::unexpected(replaced.error());
    }

    if (!decoded->observer_data.empty()) {
        m_observer->restore(decoded->observer_data);
    }

    Log::info("BackupController: imported {} identities, {} observer records",
              summary.identities, summary.observer_records);
    return summary;
}

SentinelResult<ImportSummary> BackupController::import_file(const std::string& path, bool confirmed) {
    auto text = FileIO::read_file(path, FileIO::MAX_BACKUP_SIZE);
    if (!text) {
        Log::error("BackupController: cannot read {}: {}", path, to_string(text.error()));
        return std::unexpected(text.error());
    }
    return import_text(*text, confirmed);
}

}  // namespace Sentinel
