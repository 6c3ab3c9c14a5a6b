// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file ICodeGenerator.h
 * @brief Interface for one-time code generation
 */

#pragma once

#include <string>
#include <string_view>

namespace Sentinel {

/**
 * @brief Live code source for an identity's secret
 *
 * generate() may block for a while; CodeTicker calls it from worker
 * tasks, so implementations must be safe to call concurrently.
 */
class ICodeGenerator {
public:
    virtual ~ICodeGenerator() = default;

    /// Current code for a base32 @p secret
    [[nodiscard]] virtual std::string generate(std::string_view secret) const = 0;

    /// Whole seconds until the current code window ends
    [[nodiscard]] virtual int remaining() const = 0;
};

}  // namespace Sentinel
