// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "Base32.h"
#include "../utils/StringHelpers.h"
#include <regex>

namespace Sentinel::Base32 {

namespace {
    constexpr std::string_view ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
}

std::string normalize(std::string_view secret) {
    return to_upper_ascii(strip_whitespace(secret));
}

bool is_valid(std::string_view normalized_secret) {
    static const std::regex base32_pattern(R"(^[A-Z2-7]+=*$)");
    return std::regex_match(normalized_secret.begin(), normalized_secret.end(), base32_pattern);
}

SecureVector<uint8_t> decode_lenient(std::string_view secret) {
    SecureVector<uint8_t> bytes;
    bytes.reserve(secret.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;

    for (char c : to_upper_ascii(secret)) {
        const auto pos = ALPHABET.find(c);
        if (pos == std::string_view::npos) {
            continue;  // padding, whitespace, stray characters
        }

        buffer = (buffer << 5) | static_cast<uint32_t>(pos);
        bits += 5;

        if (bits >= 8) {
            bytes.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }

    return bytes;
}

} // namespace Sentinel::Base32
