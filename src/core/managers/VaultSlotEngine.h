// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// VaultSlotEngine.h - Per-slot interaction state for the selected identity's vault

#pragma once

#include "../repositories/IIdentityRepository.h"
#include "../services/IdentityService.h"
#include <glibmm/main.h>
#include <sigc++/sigc++.h>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace Sentinel {

/**
 * @brief Display state of one vault slot
 */
enum class SlotState {
    IdleEmpty,           ///< Holds EMPTY_SLOT
    IdleFilledMasked,    ///< Holds a code, shown masked
    IdleFilledRevealed,  ///< Holds a code, shown in clear
    Editing,             ///< Input open on this slot
    JustPasted           ///< Written by the last paste, highlighted until the window ends
};

[[nodiscard]] constexpr std::string_view to_string(SlotState state) noexcept {
    switch (state) {
        case SlotState::IdleEmpty:          return "idle-empty";
        case SlotState::IdleFilledMasked:   return "idle-filled-masked";
        case SlotState::IdleFilledRevealed: return "idle-filled-revealed";
        case SlotState::Editing:            return "editing";
        case SlotState::JustPasted:         return "just-pasted";
    }
    return "unknown";
}

/**
 * @brief State machine for the vault slots of the selected identity
 *
 * Responsibilities:
 * - Track the selected identity and the transient per-slot state
 *   (editing slot, revealed slot, just-pasted slots)
 * - Commit single-slot edits and distribute pasted code lists
 * - Revert just-pasted highlighting after JUST_PASTED_WINDOW_MS
 * - Refuse to hand out EMPTY_SLOT for copying
 * - Track the reveal flag of the hidden description
 *
 * Every operation is a no-op returning NoSelection while nothing is
 * selected. Changing the selection clears all transient state and cancels
 * a pending revert timer, so a stale timer never fires into a new selection.
 *
 * Usage Example:
 * @code
 * VaultSlotEngine engine(&repository, &service);
 * engine.select(identity_id);
 * engine.click(8);                          // empty slot -> Editing
 * auto written = engine.paste("c1 c2 c3");  // slots 8, 9; c3 dropped
 * @endcode
 *
 * Thread Safety:
 * - Must be used from the thread running the default GLib main context
 */
class VaultSlotEngine {
public:
    /// Time a pasted slot stays highlighted
    static constexpr unsigned int JUST_PASTED_WINDOW_MS = 1500;

    /**
     * @param repository Non-owning, used to read slot values
     * @param service Non-owning, used to write slot values
     * @throws std::invalid_argument if either pointer is null
     */
    VaultSlotEngine(IIdentityRepository* repository, IdentityService* service);

    /// Cancels a pending revert timer
    ~VaultSlotEngine();

    // Non-copyable, non-movable (timer callback is bound to this)
    VaultSlotEngine(const VaultSlotEngine&) = delete;
    VaultSlotEngine& operator=(const VaultSlotEngine&) = delete;
    VaultSlotEngine(VaultSlotEngine&&) = delete;
    VaultSlotEngine& operator=(VaultSlotEngine&&) = delete;

    /**
     * @brief Select an identity, or clear the selection with std::nullopt
     *
     * Always resets transient state, even when re-selecting the same id.
     * Emits signal_selection_changed() when the id changes.
     */
    void select(std::optional<std::string> id);

    [[nodiscard]] const std::optional<std::string>& selected_id() const noexcept { return m_selected; }

    /**
     * @brief Click a slot
     *
     * - Empty slot: opens it for editing
     * - Filled slot: toggles masked/revealed; revealing closes any other reveal
     * - Editing slot: no change
     *
     * @return State of the slot after the click
     */
    [[nodiscard]] SentinelResult<SlotState> click(size_t index);

    /**
     * @brief Open a slot for editing regardless of its content
     *
     * Used to overwrite or clear a stored code.
     */
    [[nodiscard]] SentinelResult<> begin_edit(size_t index);

    /// Close the editor without writing anything
    void cancel_edit();

    /**
     * @brief Commit the editing slot with input @p text
     *
     * The text is trimmed; an empty result stores EMPTY_SLOT. The record is
     * persisted either way and the slot leaves the Editing state.
     *
     * @return true if a code was stored, false if the slot was emptied
     *
     * Errors: NoSelection, NotEditing, or the repository's error
     */
    [[nodiscard]] SentinelResult<bool> commit(std::string_view text);

    /**
     * @brief Distribute pasted text over consecutive slots from the editing slot
     *
     * Text is split on runs of newline, comma and space. Token k is written to
     * slot (editing + k) while that index is in range; extra tokens are dropped.
     * The batch is persisted once and the written slots are JustPasted until
     * the window expires.
     *
     * With no tokens nothing is written and the slot stays in Editing.
     *
     * @return Indices written, in order (empty if there were no tokens)
     */
    [[nodiscard]] SentinelResult<std::vector<size_t>> paste(std::string_view text);

    /**
     * @brief Current state of one slot of the selected identity
     * @return IdleEmpty for an out-of-range index or no selection
     */
    [[nodiscard]] SlotState state(size_t index) const;

    /// States of all VAULT_SLOT_COUNT slots
    [[nodiscard]] std::vector<SlotState> states() const;

    [[nodiscard]] std::optional<size_t> editing_slot() const noexcept { return m_editing; }
    [[nodiscard]] std::optional<size_t> revealed_slot() const noexcept { return m_revealed; }
    [[nodiscard]] const std::set<size_t>& just_pasted() const noexcept { return m_just_pasted; }
    [[nodiscard]] bool is_revert_pending() const noexcept { return m_revert_connection.connected(); }

    /**
     * @brief Value of a slot suitable for copying
     * @return std::nullopt for EMPTY_SLOT, an empty value, or no selection
     */
    [[nodiscard]] std::optional<std::string> copyable_value(size_t index) const;

    /**
     * @brief Toggle the reveal flag of the selected identity's hidden description
     * @return New flag value (always false with no selection)
     */
    bool toggle_description_reveal();

    [[nodiscard]] bool is_description_revealed() const noexcept { return m_description_revealed; }

    /**
     * @brief Split pasted text into codes
     *
     * Delimiters are newline, comma and space; runs of them count as one.
     * Tokens are trimmed and empty tokens dropped.
     */
    [[nodiscard]] static std::vector<std::string> tokenize(std::string_view text);

    /// Emitted with the new selection (std::nullopt when cleared)
    [[nodiscard]] sigc::signal<void(const std::optional<std::string>&)>& signal_selection_changed() {
        return m_signal_selection_changed;
    }

    /// Emitted whenever any slot state or value of the selected identity changes
    [[nodiscard]] sigc::signal<void()>& signal_slots_changed() { return m_signal_slots_changed; }

private:
    [[nodiscard]] std::optional<std::string> slot_value(size_t index) const;
    void reset_transient_state();
    bool on_revert_timeout();

    IIdentityRepository* m_repository;  ///< Non-owning
    IdentityService* m_service;         ///< Non-owning

    std::optional<std::string> m_selected;
    std::optional<size_t> m_editing;
    std::optional<size_t> m_revealed;
    std::set<size_t> m_just_pasted;
    bool m_description_revealed{false};

    sigc::connection m_revert_connection;  ///< Pending just-pasted revert
    sigc::signal<void(const std::optional<std::string>&)> m_signal_selection_changed;
    sigc::signal<void()> m_signal_slots_changed;
};

}  // namespace Sentinel
