// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "TotpGenerator.h"
#include "../Base32.h"
#include "../../utils/Log.h"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <array>
#include <format>
#include <stdexcept>

namespace Sentinel {

namespace {
    constexpr std::string_view FALLBACK_CODE = "000000";

    constexpr uint32_t pow10(int digits) {
        uint32_t result = 1;
        for (int i = 0; i < digits; ++i) {
            result *= 10;
        }
        return result;
    }
}

TotpGenerator::TotpGenerator()
    : m_clock([]() { return std::time(nullptr); }) {
}

TotpGenerator::TotpGenerator(Clock clock)
    : m_clock(std::move(clock)) {
    if (!m_clock) {
        throw std::invalid_argument("TotpGenerator: clock cannot be empty");
    }
}

std::string TotpGenerator::generate(std::string_view secret) const {
    const auto now = m_clock();
    if (now < 0) {
        Log::error("TotpGenerator: clock returned a negative time");
        return std::string(FALLBACK_CODE);
    }
    const auto counter = static_cast<uint64_t>(now) / TIME_STEP_SECONDS;
    return generate_for_counter(secret, counter, DIGITS);
}

int TotpGenerator::remaining() const {
    const auto now = m_clock();
    return TIME_STEP_SECONDS - static_cast<int>(now % TIME_STEP_SECONDS);
}

std::string TotpGenerator::generate_for_counter(std::string_view secret,
                                                uint64_t counter,
                                                int digits) {
    if (digits < 1 || digits > 9) {
        Log::error("TotpGenerator: unsupported digit count {}", digits);
        return std::string(FALLBACK_CODE);
    }

    const auto key = Base32::decode_lenient(secret);
    if (key.empty()) {
        Log::error("TotpGenerator: secret decodes to an empty key");
        return std::string(FALLBACK_CODE);
    }

    // Counter as 8-byte big-endian message
    std::array<unsigned char, 8> message{};
    for (int i = 7; i >= 0; --i) {
        message[static_cast<size_t>(i)] = static_cast<unsigned char>(counter & 0xFF);
        counter >>= 8;
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
             message.data(), message.size(), digest.data(), &digest_len) == nullptr ||
        digest_len < 20) {
        Log::error("TotpGenerator: HMAC-SHA1 failed");
        return std::string(FALLBACK_CODE);
    }

    // Dynamic truncation (RFC 4226 section 5.3)
    const size_t offset = digest[digest_len - 1] & 0x0F;
    const uint32_t binary =
        (static_cast<uint32_t>(digest[offset] & 0x7F) << 24) |
        (static_cast<uint32_t>(digest[offset + 1]) << 16) |
        (static_cast<uint32_t>(digest[offset + 2]) << 8) |
        static_cast<uint32_t>(digest[offset + 3]);

    const uint32_t otp = binary % pow10(digits);
    return std::format("{:0{}}", otp, digits);
}

}  // namespace Sentinel
