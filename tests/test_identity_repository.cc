// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file test_identity_repository.cc
 * @brief Tests for the write-through identity store
 */

#include <gtest/gtest.h>
#include "../src/core/repositories/IdentityRepository.h"
#include "TestDoubles.h"
#include <stdexcept>

using namespace Sentinel;
using Sentinel::Testing::MemoryPersistence;
using Sentinel::Testing::make_record;

class IdentityRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo = std::make_unique<IdentityRepository>(&persistence);
        repo->signal_collection_changed().connect([this]() { ++changed; });
        repo->signal_save_failed().connect([this](SentinelError error) { save_errors.push_back(error); });
    }

    MemoryPersistence persistence;
    std::unique_ptr<IdentityRepository> repo;
    int changed{0};
    std::vector<SentinelError> save_errors;
};

// ============================================================================
// Construction and loading
// ============================================================================

TEST_F(IdentityRepositoryTest, ConstructorThrowsOnNull) {
    EXPECT_THROW(IdentityRepository(nullptr), std::invalid_argument);
}

TEST_F(IdentityRepositoryTest, Load_TakesPersistedCollection) {
    persistence.stored = {make_record("a", "Alpha"), make_record("b", "Beta")};

    ASSERT_TRUE(repo->load().has_value());

    EXPECT_EQ(repo->count(), 2u);
    EXPECT_EQ(repo->get_all()[1].name(), "Beta");
    EXPECT_EQ(changed, 1);
}

TEST_F(IdentityRepositoryTest, Load_Failure_KeepsCollection) {
    ASSERT_TRUE(repo->add(make_record("a", "Alpha")).has_value());
    persistence.fail_load = true;

    auto result = repo->load();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SentinelError::FileReadFailed);
    EXPECT_EQ(repo->count(), 1u);
}

// ============================================================================
// add
// ============================================================================

TEST_F(IdentityRepositoryTest, Add_AppendsAndPersistsWholeCollection) {
    ASSERT_TRUE(repo->add(make_record("a", "Alpha")).has_value());
    ASSERT_TRUE(repo->add(make_record("b", "Beta")).has_value());

    EXPECT_EQ(persistence.save_calls, 2);
    ASSERT_EQ(persistence.stored.size(), 2u);
    EXPECT_EQ(persistence.stored[0].id(), "a");
    EXPECT_EQ(persistence.stored[1].id(), "b");
    EXPECT_EQ(changed, 2);
}

TEST_F(IdentityRepositoryTest, Add_DuplicateId_Rejected) {
    ASSERT_TRUE(repo->add(make_record("a", "Alpha")).has_value());

    auto result = repo->add(make_record("a", "Other"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SentinelError::RejectedInput);
    EXPECT_EQ(repo->count(), 1u);
    EXPECT_EQ(persistence.save_calls, 1);
}

TEST_F(IdentityRepositoryTest, Add_ShortVault_Rejected) {
    auto record = make_record("a", "Alpha");
    record.mutable_vault()->RemoveLast();

    auto result = repo->add(record);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SentinelError::RejectedInput);
    EXPECT_EQ(repo->count(), 0u);
}

TEST_F(IdentityRepositoryTest, Add_EmptyId_Rejected) {
    auto result = repo->add(make_record("", "Alpha"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SentinelError::RejectedInput);
}

// ============================================================================
// remove
// ============================================================================

TEST_F(IdentityRepositoryTest, Remove_ExistingRecord) {
    ASSERT_TRUE(repo->add(make_record("a", "Alpha")).has_value());
    ASSERT_TRUE(repo->add(make_record("b", "Beta")).has_value());

    auto result = repo->remove("a");

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value());
    ASSERT_EQ(repo->count(), 1u);
    EXPECT_EQ(repo->get_all()[0].id(), "b");
    EXPECT_EQ(persistence.stored.size(), 1u);
}

TEST_F(IdentityRepositoryTest, Remove_UnknownId_IsIdempotentAndPersists) {
    ASSERT_TRUE(repo->add(make_record("a", "Alpha")).has_value());
    const int saves_before = persistence.save_calls;
    const int changes_before = changed;

    auto result = repo->remove("missing");

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result.value());
    EXPECT_EQ(repo->count(), 1u);
    EXPECT_EQ(persistence.save_calls, saves_before + 1);
    EXPECT_EQ(changed, changes_before);
}

// ============================================================================
// update
// ============================================================================

TEST_F(IdentityRepositoryTest, Update_AppliesMutatorAndPersists) {
    ASSERT_TRUE(repo->add(make_record("a", "Alpha")).has_value());

    auto result = repo->update("a", [](sentinel::IdentityRecord& record) {
        record.set_note("player#1");
        record.set_vault(3, "CODE-3");
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->note(), "player#1");
    EXPECT_EQ(persistence.stored[0].note(), "player#1");
    EXPECT_EQ(persistence.stored[0].vault(3), "CODE-3");
    EXPECT_EQ(persistence.stored[0].vault_size(), 10);
}

TEST_F(IdentityRepositoryTest, Update_UnknownId_NotFound) {
    auto result = repo->update("missing", [](sentinel::IdentityRecord& record) {
        record.set_note("x");
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SentinelError::NotFound);
    EXPECT_EQ(persistence.save_calls, 0);
}

TEST_F(IdentityRepositoryTest, Update_BreakingVaultLength_RejectedWithoutChange) {
    ASSERT_TRUE(repo->add(make_record("a", "Alpha")).has_value());
    const int saves_before = persistence.save_calls;

    auto result = repo->update("a", [](sentinel::IdentityRecord& record) {
        record.set_note("changed");
        record.add_vault("ELEVENTH");
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SentinelError::RejectedInput);
    EXPECT_EQ(repo->get_by_id("a")->note(), "");
    EXPECT_EQ(repo->get_by_id("a")->vault_size(), 10);
    EXPECT_EQ(persistence.save_calls, saves_before);
}

TEST_F(IdentityRepositoryTest, Update_ChangingId_Rejected) {
    ASSERT_TRUE(repo->add(make_record("a", "Alpha")).has_value());

    auto result = repo->update("a", [](sentinel::IdentityRecord& record) {
        record.set_id("b");
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(repo->get_by_id("a").has_value());
    EXPECT_FALSE(repo->get_by_id("b").has_value());
}

// ============================================================================
// replace_all and save failures
// ============================================================================

TEST_F(IdentityRepositoryTest, ReplaceAll_SubstitutesAndPersists) {
    ASSERT_TRUE(repo->add(make_record("a", "Alpha")).has_value());

    ASSERT_TRUE(repo->replace_all({make_record("x", "X"), make_record("y", "Y")}).has_value());

    ASSERT_EQ(repo->count(), 2u);
    EXPECT_FALSE(repo->get_by_id("a").has_value());
    EXPECT_EQ(persistence.stored.size(), 2u);
    EXPECT_EQ(persistence.stored[0].id(), "x");
}

TEST_F(IdentityRepositoryTest, SaveFailure_ReportedAndMemoryKept) {
    persistence.fail_save = true;

    auto result = repo->add(make_record("a", "Alpha"));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(repo->count(), 1u);
    ASSERT_EQ(save_errors.size(), 1u);
    EXPECT_EQ(save_errors[0], SentinelError::FileWriteFailed);
}

TEST_F(IdentityRepositoryTest, FindIndexById_EmptyIdNeverMatches) {
    ASSERT_TRUE(repo->add(make_record("a", "Alpha")).has_value());
    EXPECT_FALSE(repo->find_index_by_id("").has_value());
    EXPECT_EQ(repo->find_index_by_id("a"), 0u);
}
