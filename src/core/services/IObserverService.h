// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file IObserverService.h
 * @brief Interface for the externally owned observer dataset
 */

#pragma once

#include <google/protobuf/struct.pb.h>
#include <vector>

namespace Sentinel {

/// Opaque record of the observer dataset; kept as arbitrary JSON
using ObserverRecord = google::protobuf::Value;
using ObserverRecordList = std::vector<ObserverRecord>;

/**
 * @brief Observer dataset collaborator
 *
 * The backup codec reads the current dataset for export and hands an
 * imported dataset to restore(). It never owns the data.
 */
class IObserverService {
public:
    virtual ~IObserverService() = default;

    /// Current dataset, in the collaborator's order
    [[nodiscard]] virtual ObserverRecordList records() const = 0;

    /// Replace the dataset with @p records from a backup
    virtual void restore(const ObserverRecordList& records) = 0;
};

}  // namespace Sentinel
