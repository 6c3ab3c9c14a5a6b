// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file Base32.h
 * @brief RFC 4648 base32 handling for TOTP secrets
 */

#ifndef SENTINEL_BASE32_H
#define SENTINEL_BASE32_H

#include <cstdint>
#include <string>
#include <string_view>
#include "../utils/SecureMemory.h"

namespace Sentinel::Base32 {

/**
 * @brief Canonical storage form of a secret
 *
 * Removes all whitespace and uppercases ASCII letters. Does not validate.
 */
[[nodiscard]] std::string normalize(std::string_view secret);

/**
 * @brief Check a normalized secret against ^[A-Z2-7]+=*$
 *
 * Padding is only accepted at the end, and at least one data character
 * is required.
 */
[[nodiscard]] bool is_valid(std::string_view normalized_secret);

/**
 * @brief Decode a secret, skipping characters outside the alphabet
 *
 * Input is uppercased first; '=' padding and stray characters are
 * ignored. Trailing bits that do not fill a byte are dropped. The
 * returned buffer is zeroized when released.
 */
[[nodiscard]] SecureVector<uint8_t> decode_lenient(std::string_view secret);

} // namespace Sentinel::Base32

#endif // SENTINEL_BASE32_H
