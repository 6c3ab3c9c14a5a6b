// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file ObserverArchive.h
 * @brief File-backed observer dataset
 */

#pragma once

#include "IObserverService.h"
#include "../SentinelError.h"
#include <sigc++/sigc++.h>
#include <string>

namespace Sentinel {

/**
 * @brief Observer dataset stored as a protobuf ObserverDataset file
 *
 * Records are opaque JSON values owned by another part of the system; this
 * archive only keeps them so they can travel inside backups. restore()
 * replaces the dataset and writes it through at once.
 */
class ObserverArchive : public IObserverService {
public:
    /**
     * @throws std::invalid_argument if path is empty
     */
    explicit ObserverArchive(std::string path);

    /**
     * @brief Read the dataset from disk
     *
     * A missing file is an empty dataset.
     */
    [[nodiscard]] SentinelResult<> load();

    [[nodiscard]] ObserverRecordList records() const override;
    void restore(const ObserverRecordList& records) override;

    [[nodiscard]] size_t size() const noexcept { return m_records.size(); }

    /// Emitted when a restore could not be written to disk
    [[nodiscard]] sigc::signal<void(SentinelError)>& signal_save_failed() { return m_signal_save_failed; }

private:
    SentinelResult<> save() const;

    std::string m_path;
    ObserverRecordList m_records;
    sigc::signal<void(SentinelError)> m_signal_save_failed;
};

}  // namespace Sentinel
