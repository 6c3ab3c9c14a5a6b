// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file test_vault_slot_engine.cc
 * @brief Tests for the vault slot state machine
 *
 * Covers:
 * - Click transitions (edit on empty, reveal toggle on filled)
 * - Commit trimming and collapse to EMPTY_SLOT
 * - Paste distribution and the timed just-pasted revert
 * - Transient state reset and timer cancellation on selection change
 * - Copy guard and hidden-description reveal
 */

#include <gtest/gtest.h>
#include "../src/core/managers/VaultSlotEngine.h"
#include "../src/core/repositories/IdentityRepository.h"
#include "TestDoubles.h"
#include <glibmm/init.h>

using namespace Sentinel;
using namespace std::chrono_literals;
using Sentinel::Testing::MemoryPersistence;
using Sentinel::Testing::make_record;
using Sentinel::Testing::pump_for;
using Sentinel::Testing::pump_until;

class VaultSlotEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Glib::init();

        repo = std::make_unique<IdentityRepository>(&persistence);
        service = std::make_unique<IdentityService>(repo.get());
        engine = std::make_unique<VaultSlotEngine>(repo.get(), service.get());

        auto first = make_record("first", "First");
        first.set_vault(1, "FILLED-1");
        first.set_vault(2, "FILLED-2");
        ASSERT_TRUE(repo->add(first).has_value());
        ASSERT_TRUE(repo->add(make_record("second", "Second")).has_value());
    }

    std::string stored(const std::string& id, int index) {
        return repo->get_by_id(id)->vault(index);
    }

    MemoryPersistence persistence;
    std::unique_ptr<IdentityRepository> repo;
    std::unique_ptr<IdentityService> service;
    std::unique_ptr<VaultSlotEngine> engine;
};

// ============================================================================
// No selection
// ============================================================================

TEST_F(VaultSlotEngineTest, NoSelection_EverythingIsNoOp) {
    auto click = engine->click(0);
    ASSERT_FALSE(click.has_value());
    EXPECT_EQ(click.error(), SentinelError::NoSelection);

    EXPECT_FALSE(engine->begin_edit(0).has_value());
    EXPECT_FALSE(engine->commit("X").has_value());
    EXPECT_FALSE(engine->paste("X").has_value());
    EXPECT_FALSE(engine->copyable_value(1).has_value());
    EXPECT_FALSE(engine->toggle_description_reveal());
    EXPECT_FALSE(engine->editing_slot().has_value());
    EXPECT_EQ(persistence.save_calls, 2);
}

// ============================================================================
// Click transitions
// ============================================================================

TEST_F(VaultSlotEngineTest, ClickEmpty_StartsEditing) {
    engine->select("first");

    auto state = engine->click(0);

    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(*state, SlotState::Editing);
    EXPECT_EQ(engine->editing_slot(), 0u);
}

TEST_F(VaultSlotEngineTest, ClickFilled_TogglesReveal) {
    engine->select("first");
    EXPECT_EQ(engine->state(1), SlotState::IdleFilledMasked);

    EXPECT_EQ(engine->click(1).value(), SlotState::IdleFilledRevealed);
    EXPECT_EQ(engine->click(1).value(), SlotState::IdleFilledMasked);
}

TEST_F(VaultSlotEngineTest, Reveal_AtMostOneSlot) {
    engine->select("first");

    ASSERT_TRUE(engine->click(1).has_value());
    ASSERT_TRUE(engine->click(2).has_value());

    EXPECT_EQ(engine->state(1), SlotState::IdleFilledMasked);
    EXPECT_EQ(engine->state(2), SlotState::IdleFilledRevealed);
    EXPECT_EQ(engine->revealed_slot(), 2u);
}

TEST_F(VaultSlotEngineTest, ClickOutOfRange_InvalidIndex) {
    engine->select("first");
    auto state = engine->click(VAULT_SLOT_COUNT);
    ASSERT_FALSE(state.has_value());
    EXPECT_EQ(state.error(), SentinelError::InvalidIndex);
}

// ============================================================================
// Commit
// ============================================================================

TEST_F(VaultSlotEngineTest, Commit_TrimsAndStores) {
    engine->select("first");
    ASSERT_TRUE(engine->click(0).has_value());

    auto stored_code = engine->commit("   ABCD-EFGH  ");

    ASSERT_TRUE(stored_code.has_value());
    EXPECT_TRUE(*stored_code);
    EXPECT_EQ(stored("first", 0), "ABCD-EFGH");
    EXPECT_EQ(engine->state(0), SlotState::IdleFilledMasked);
    EXPECT_FALSE(engine->editing_slot().has_value());
}

TEST_F(VaultSlotEngineTest, CommitEmpty_CollapsesToSentinel) {
    engine->select("first");
    ASSERT_TRUE(engine->begin_edit(1).has_value());

    auto stored_code = engine->commit("    ");

    ASSERT_TRUE(stored_code.has_value());
    EXPECT_FALSE(*stored_code);
    EXPECT_EQ(stored("first", 1), EMPTY_SLOT);
    EXPECT_NE(stored("first", 1), "");
    EXPECT_EQ(engine->state(1), SlotState::IdleEmpty);
    EXPECT_EQ(persistence.stored[0].vault(1), EMPTY_SLOT);
}

TEST_F(VaultSlotEngineTest, Commit_AlwaysPersists) {
    engine->select("first");
    ASSERT_TRUE(engine->click(5).has_value());
    const int saves_before = persistence.save_calls;

    ASSERT_TRUE(engine->commit("").has_value());

    EXPECT_EQ(persistence.save_calls, saves_before + 1);
}

TEST_F(VaultSlotEngineTest, Commit_WithoutEditing_NotEditing) {
    engine->select("first");
    auto result = engine->commit("X");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SentinelError::NotEditing);
}

// ============================================================================
// Paste
// ============================================================================

TEST_F(VaultSlotEngineTest, Tokenize_SplitsOnNewlineCommaSpaceRuns) {
    EXPECT_EQ(VaultSlotEngine::tokenize("a b,c\nd,, \n e"),
              (std::vector<std::string>{"a", "b", "c", "d", "e"}));
    EXPECT_EQ(VaultSlotEngine::tokenize("  , \n "), std::vector<std::string>{});
    EXPECT_EQ(VaultSlotEngine::tokenize("\tone\t\ntwo\r\n"),
              (std::vector<std::string>{"one", "two"}));
}

TEST_F(VaultSlotEngineTest, PasteFromSlotEight_FillsTwoDropsThirdAndReverts) {
    engine->select("second");
    ASSERT_TRUE(engine->click(8).has_value());
    const int saves_before = persistence.save_calls;

    auto written = engine->paste("code1 code2 code3");

    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, (std::vector<size_t>{8, 9}));
    EXPECT_EQ(stored("second", 8), "code1");
    EXPECT_EQ(stored("second", 9), "code2");
    EXPECT_EQ(repo->get_by_id("second")->vault_size(), 10);
    EXPECT_EQ(persistence.save_calls, saves_before + 1);

    EXPECT_EQ(engine->state(8), SlotState::JustPasted);
    EXPECT_EQ(engine->state(9), SlotState::JustPasted);
    EXPECT_FALSE(engine->editing_slot().has_value());

    // Still highlighted well inside the window
    pump_for(300ms);
    EXPECT_EQ(engine->state(8), SlotState::JustPasted);

    ASSERT_TRUE(pump_until([this]() { return engine->just_pasted().empty(); }, 3000ms));
    EXPECT_EQ(engine->state(8), SlotState::IdleFilledMasked);
    EXPECT_EQ(engine->state(9), SlotState::IdleFilledMasked);
}

TEST_F(VaultSlotEngineTest, Paste_ClearedSlotInsideWindow_ReportsEmpty) {
    engine->select("second");
    ASSERT_TRUE(engine->click(3).has_value());
    ASSERT_TRUE(engine->paste("x1 x2").has_value());
    ASSERT_EQ(engine->state(3), SlotState::JustPasted);

    // Still inside the highlight window
    ASSERT_TRUE(engine->begin_edit(3).has_value());
    ASSERT_TRUE(engine->commit("").has_value());

    EXPECT_EQ(stored("second", 3), EMPTY_SLOT);
    EXPECT_EQ(engine->state(3), SlotState::IdleEmpty);
    EXPECT_EQ(engine->state(4), SlotState::JustPasted);
}

TEST_F(VaultSlotEngineTest, Paste_OverwritesExistingCodes) {
    engine->select("first");
    ASSERT_TRUE(engine->begin_edit(0).has_value());

    auto written = engine->paste("n0\nn1\nn2\n");

    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(written->size(), 3u);
    EXPECT_EQ(stored("first", 1), "n1");
    EXPECT_EQ(stored("first", 2), "n2");
    EXPECT_EQ(stored("first", 3), EMPTY_SLOT);
}

TEST_F(VaultSlotEngineTest, Paste_NoTokens_StaysEditingNoWrite) {
    engine->select("first");
    ASSERT_TRUE(engine->click(4).has_value());
    const int saves_before = persistence.save_calls;

    auto written = engine->paste(" ,\n, ");

    ASSERT_TRUE(written.has_value());
    EXPECT_TRUE(written->empty());
    EXPECT_EQ(engine->state(4), SlotState::Editing);
    EXPECT_EQ(persistence.save_calls, saves_before);
    EXPECT_FALSE(engine->is_revert_pending());
}

// ============================================================================
// Selection change
// ============================================================================

TEST_F(VaultSlotEngineTest, SelectionChange_ResetsTransientState) {
    engine->select("first");
    ASSERT_TRUE(engine->click(1).has_value());       // revealed
    ASSERT_TRUE(engine->click(0).has_value());       // editing
    engine->toggle_description_reveal();

    engine->select("second");

    EXPECT_FALSE(engine->editing_slot().has_value());
    EXPECT_FALSE(engine->revealed_slot().has_value());
    EXPECT_TRUE(engine->just_pasted().empty());
    EXPECT_FALSE(engine->is_description_revealed());
}

TEST_F(VaultSlotEngineTest, SelectionChange_CancelsRevertTimer) {
    engine->select("first");
    ASSERT_TRUE(engine->click(5).has_value());
    ASSERT_TRUE(engine->paste("p1 p2").has_value());
    ASSERT_TRUE(engine->is_revert_pending());

    int slot_signals = 0;
    engine->signal_slots_changed().connect([&slot_signals]() { ++slot_signals; });

    engine->select("second");
    EXPECT_FALSE(engine->is_revert_pending());
    const int after_select = slot_signals;

    // The old timer must not fire into the new selection
    pump_for(std::chrono::milliseconds(VaultSlotEngine::JUST_PASTED_WINDOW_MS + 500));
    EXPECT_EQ(slot_signals, after_select);
    EXPECT_TRUE(engine->just_pasted().empty());
}

TEST_F(VaultSlotEngineTest, SelectionChange_EmitsOnlyWhenIdChanges) {
    std::vector<std::optional<std::string>> selections;
    engine->signal_selection_changed().connect(
        [&selections](const std::optional<std::string>& id) { selections.push_back(id); });

    engine->select("first");
    engine->select("first");
    engine->select(std::nullopt);

    ASSERT_EQ(selections.size(), 2u);
    EXPECT_EQ(selections[0], "first");
    EXPECT_FALSE(selections[1].has_value());
}

// ============================================================================
// Copy guard and hidden description
// ============================================================================

TEST_F(VaultSlotEngineTest, CopyableValue_RefusesEmptySlot) {
    engine->select("first");

    EXPECT_FALSE(engine->copyable_value(0).has_value());
    EXPECT_EQ(engine->copyable_value(1), "FILLED-1");
}

TEST_F(VaultSlotEngineTest, DescriptionReveal_Toggles) {
    engine->select("first");
    EXPECT_FALSE(engine->is_description_revealed());
    EXPECT_TRUE(engine->toggle_description_reveal());
    EXPECT_FALSE(engine->toggle_description_reveal());
}
