// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file IPersistenceService.h
 * @brief Interface for durable storage of the identity collection
 */

#pragma once

#include "../IdentityTypes.h"
#include "../SentinelError.h"

namespace Sentinel {

/**
 * @brief Full-collection persistence backend
 *
 * The store hands over the entire collection after every mutation;
 * there is no incremental protocol. Implementations decide where and
 * how the collection is kept.
 */
class IPersistenceService {
public:
    virtual ~IPersistenceService() = default;

    /**
     * @brief Load the stored collection
     * @return Identities in display order, or an error
     *
     * A store that does not exist yet loads as an empty collection.
     */
    [[nodiscard]] virtual SentinelResult<IdentityList> load() = 0;

    /**
     * @brief Replace the stored collection with @p identities
     */
    [[nodiscard]] virtual SentinelResult<> save(const IdentityList& identities) = 0;
};

}  // namespace Sentinel
