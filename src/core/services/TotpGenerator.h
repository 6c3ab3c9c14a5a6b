// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file TotpGenerator.h
 * @brief RFC 6238 time-based one-time passcodes
 */

#pragma once

#include "ICodeGenerator.h"
#include <cstdint>
#include <ctime>
#include <functional>

namespace Sentinel {

/**
 * @brief Default ICodeGenerator: TOTP over HMAC-SHA1 (OpenSSL)
 *
 * 30-second time step, 6 digits, no window offset. A secret that
 * decodes to zero bytes, or an HMAC failure, produces "000000" and an
 * error log entry instead of an exception.
 *
 * Thread Safety:
 * - generate() and remaining() are const and share no mutable state
 * - The clock function must itself be thread-safe
 */
class TotpGenerator : public ICodeGenerator {
public:
    static constexpr int TIME_STEP_SECONDS = 30;
    static constexpr int DIGITS = 6;

    using Clock = std::function<std::time_t()>;

    /// Uses the system wall clock
    TotpGenerator();

    /// Uses @p clock as the source of Unix time (tests)
    explicit TotpGenerator(Clock clock);

    [[nodiscard]] std::string generate(std::string_view secret) const override;
    [[nodiscard]] int remaining() const override;

    /**
     * @brief Code for an explicit moving-factor counter (RFC 4226 HOTP)
     * @param secret Base32 secret
     * @param counter T = floor(unix_time / TIME_STEP_SECONDS)
     * @param digits Code length
     */
    [[nodiscard]] static std::string generate_for_counter(std::string_view secret,
                                                          uint64_t counter,
                                                          int digits = DIGITS);

private:
    Clock m_clock;
};

}  // namespace Sentinel
