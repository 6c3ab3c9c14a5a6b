// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file test_totp_generator.cc
 * @brief TOTP generation against the RFC 6238 SHA-1 test vectors
 */

#include <gtest/gtest.h>
#include "../src/core/services/TotpGenerator.h"
#include <stdexcept>

using namespace Sentinel;

namespace {
    // Base32 of the ASCII key "12345678901234567890"
    constexpr std::string_view RFC_SECRET = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";
}

// ============================================================================
// RFC 6238 vectors
// ============================================================================

TEST(TotpGeneratorTest, Rfc6238_EightDigitVectors) {
    EXPECT_EQ(TotpGenerator::generate_for_counter(RFC_SECRET, 59 / 30, 8), "94287082");
    EXPECT_EQ(TotpGenerator::generate_for_counter(RFC_SECRET, 1111111109 / 30, 8), "07081804");
    EXPECT_EQ(TotpGenerator::generate_for_counter(RFC_SECRET, 1111111111 / 30, 8), "14050471");
    EXPECT_EQ(TotpGenerator::generate_for_counter(RFC_SECRET, 1234567890 / 30, 8), "89005924");
    EXPECT_EQ(TotpGenerator::generate_for_counter(RFC_SECRET, 2000000000 / 30, 8), "69279037");
}

TEST(TotpGeneratorTest, Generate_SixDigitsFromClock) {
    TotpGenerator generator([]() -> std::time_t { return 59; });
    EXPECT_EQ(generator.generate(RFC_SECRET), "287082");
}

TEST(TotpGeneratorTest, Generate_KeepsLeadingZeros) {
    TotpGenerator generator([]() -> std::time_t { return 1234567890; });
    EXPECT_EQ(generator.generate(RFC_SECRET), "005924");
}

TEST(TotpGeneratorTest, Generate_SameWindowSameCode) {
    std::time_t now = 1111111080;
    TotpGenerator generator([&now]() { return now; });

    const auto first = generator.generate(RFC_SECRET);
    now += 29;
    EXPECT_EQ(generator.generate(RFC_SECRET), first);
    now += 1;
    EXPECT_NE(generator.generate(RFC_SECRET), first);
}

TEST(TotpGeneratorTest, Generate_LowercaseAndSpacedSecretAccepted) {
    TotpGenerator generator([]() -> std::time_t { return 59; });
    EXPECT_EQ(generator.generate("gezd gnbv gy3t qojq gezd gnbv gy3t qojq"), "287082");
}

// ============================================================================
// Failure handling
// ============================================================================

TEST(TotpGeneratorTest, Generate_UndecodableSecret_Fallback) {
    TotpGenerator generator([]() -> std::time_t { return 59; });
    EXPECT_EQ(generator.generate(""), "000000");
    EXPECT_EQ(generator.generate("1890"), "000000");
}

TEST(TotpGeneratorTest, GenerateForCounter_UnsupportedDigits_Fallback) {
    EXPECT_EQ(TotpGenerator::generate_for_counter(RFC_SECRET, 1, 0), "000000");
    EXPECT_EQ(TotpGenerator::generate_for_counter(RFC_SECRET, 1, 10), "000000");
}

TEST(TotpGeneratorTest, Constructor_EmptyClock_Throws) {
    EXPECT_THROW({ TotpGenerator generator{TotpGenerator::Clock{}}; }, std::invalid_argument);
}

// ============================================================================
// Countdown
// ============================================================================

TEST(TotpGeneratorTest, Remaining_CountsDownWithinWindow) {
    std::time_t now = 60;
    TotpGenerator generator([&now]() { return now; });

    EXPECT_EQ(generator.remaining(), 30);
    now = 61;
    EXPECT_EQ(generator.remaining(), 29);
    now = 89;
    EXPECT_EQ(generator.remaining(), 1);
}
