// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "ObserverArchive.h"
#include "../IdentityTypes.h"
#include "../io/FileIO.h"
#include "../../utils/Log.h"
#include <stdexcept>

namespace Sentinel {

ObserverArchive::ObserverArchive(std::string path)
    : m_path(std::move(path)) {
    if (m_path.empty()) {
        throw std::invalid_argument("ObserverArchive: path cannot be empty");
    }
}

SentinelResult<> ObserverArchive::load() {
    auto content = FileIO::read_file(m_path, FileIO::MAX_STORE_SIZE);
    if (!content) {
        if (content.error() == SentinelError::FileNotFound) {
            m_records.clear();
            return {};
        }
        return std::unexpected(content.error());
    }

    sentinel::ObserverDataset dataset;
    if (!dataset.ParseFromString(*content)) {
        Log::error("ObserverArchive: {} is not a valid observer dataset", m_path);
        return std::unexpected(SentinelError::DeserializationFailed);
    }

    m_records.assign(dataset.records().begin(), dataset.records().end());
    Log::debug("ObserverArchive: loaded {} records", m_records.size());
    return {};
}

ObserverRecordList ObserverArchive::records() const {
    return m_records;
}

void ObserverArchive::restore(const ObserverRecordList& records) {
    m_records = records;
    Log::info("ObserverArchive: restored {} records", m_records.size());

    if (auto saved = save(); !saved) {
        Log::error("ObserverArchive: save failed: {}", to_string(saved.error()));
        m_signal_save_failed.emit(saved.error());
    }
}

SentinelResult<> ObserverArchive::save() const {
    sentinel::ObserverDataset dataset;
    dataset.set_schema_version(STORE_SCHEMA_VERSION);
    for (const auto& record : m_records) {
        *dataset.add_records() = record;
    }

    std::string serialized;
    if (!dataset.SerializeToString(&serialized)) {
        return std::unexpected(SentinelError::SerializationFailed);
    }
    return FileIO::write_file_atomic(m_path, serialized);
}

}  // namespace Sentinel
