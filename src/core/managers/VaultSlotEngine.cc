// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// VaultSlotEngine.cc - Implementation of the vault slot state machine

#include "VaultSlotEngine.h"
#include "../../utils/Cpp23Compat.h"
#include "../../utils/Log.h"
#include "../../utils/SecureMemory.h"
#include "../../utils/StringHelpers.h"
#include <regex>
#include <stdexcept>

namespace Sentinel {

VaultSlotEngine::VaultSlotEngine(IIdentityRepository* repository, IdentityService* service)
    : m_repository(repository),
      m_service(service) {
    if (!m_repository) {
        throw std::invalid_argument("VaultSlotEngine: repository cannot be null");
    }
    if (!m_service) {
        throw std::invalid_argument("VaultSlotEngine: service cannot be null");
    }
}

VaultSlotEngine::~VaultSlotEngine() {
    if (m_revert_connection.connected()) {
        m_revert_connection.disconnect();
    }
}

void VaultSlotEngine::select(std::optional<std::string> id) {
    const bool changed = (id != m_selected);
    m_selected = std::move(id);
    reset_transient_state();

    if (changed) {
        Log::debug("VaultSlotEngine: selection {}", m_selected.value_or("cleared"));
        m_signal_selection_changed.emit(m_selected);
    }
    m_signal_slots_changed.emit();
}

SentinelResult<SlotState> VaultSlotEngine::click(size_t index) {
    if (!m_selected) {
        return std::unexpected(SentinelError::NoSelection);
    }
    if (index >= VAULT_SLOT_COUNT) {
        return std::unexpected(SentinelError::InvalidIndex);
    }
    if (m_editing == index) {
        return SlotState::Editing;
    }

    const auto value = slot_value(index);
    if (!value) {
        return std::unexpected(SentinelError::NotFound);
    }

    if (!is_filled_slot(*value)) {
        m_editing = index;
        Log::debug("VaultSlotEngine: editing slot {}", index);
    } else if (m_revealed == index) {
        m_revealed.reset();
    } else {
        m_revealed = index;
    }

    m_signal_slots_changed.emit();
    return state(index);
}

SentinelResult<> VaultSlotEngine::begin_edit(size_t index) {
    if (!m_selected) {
        return std::unexpected(SentinelError::NoSelection);
    }
    if (index >= VAULT_SLOT_COUNT) {
        return std::unexpected(SentinelError::InvalidIndex);
    }
    if (!slot_value(index)) {
        return std::unexpected(SentinelError::NotFound);
    }

    m_editing = index;
    if (m_revealed == index) {
        m_revealed.reset();
    }
    m_signal_slots_changed.emit();
    return {};
}

void VaultSlotEngine::cancel_edit() {
    if (m_editing) {
        m_editing.reset();
        m_signal_slots_changed.emit();
    }
}

SentinelResult<bool> VaultSlotEngine::commit(std::string_view text) {
    if (!m_selected) {
        return std::unexpected(SentinelError::NoSelection);
    }
    if (!m_editing) {
        return std::unexpected(SentinelError::NotEditing);
    }

    const size_t index = *m_editing;
    auto result = m_service->set_vault_slot(*m_selected, index, text);
    if (!result) {
        Log::warning("VaultSlotEngine: commit of slot {} failed: {}", index, to_string(result.error()));
        return std::unexpected(result.error());
    }

    m_editing.reset();
    m_just_pasted.erase(index);
    const bool stored = is_filled_slot(result->vault(static_cast<int>(index)));
    if (!stored && m_revealed == index) {
        m_revealed.reset();
    }

    Log::debug("VaultSlotEngine: slot {} committed ({})", index, stored ? "code" : "empty");
    m_signal_slots_changed.emit();
    return stored;
}

SentinelResult<std::vector<size_t>> VaultSlotEngine::paste(std::string_view text) {
    if (!m_selected) {
        return std::unexpected(SentinelError::NoSelection);
    }
    if (!m_editing) {
        return std::unexpected(SentinelError::NotEditing);
    }

    auto tokens = tokenize(text);
    if (tokens.empty()) {
        Log::debug("VaultSlotEngine: paste without codes ignored");
        return std::vector<size_t>{};
    }

    auto written = m_service->fill_vault_slots(*m_selected, *m_editing, tokens);
    for (auto& token : tokens) {
        secure_clear(token);
    }
    if (!written) {
        Log::warning("VaultSlotEngine: paste failed: {}", to_string(written.error()));
        return std::unexpected(written.error());
    }

    m_editing.reset();
    m_just_pasted = std::set<size_t>(written->begin(), written->end());

    // A newer paste restarts the window
    if (m_revert_connection.connected()) {
        m_revert_connection.disconnect();
    }
    m_revert_connection = Glib::signal_timeout().connect(
        sigc::mem_fun(*this, &VaultSlotEngine::on_revert_timeout),
        JUST_PASTED_WINDOW_MS);

    Log::debug("VaultSlotEngine: {} codes pasted", written->size());
    m_signal_slots_changed.emit();
    return written;
}

SlotState VaultSlotEngine::state(size_t index) const {
    if (!m_selected || index >= VAULT_SLOT_COUNT) {
        return SlotState::IdleEmpty;
    }
    if (m_editing == index) {
        return SlotState::Editing;
    }
    if (m_just_pasted.contains(index)) {
        return SlotState::JustPasted;
    }

    const auto value = slot_value(index);
    if (!value || !is_filled_slot(*value)) {
        return SlotState::IdleEmpty;
    }
    return (m_revealed == index) ? SlotState::IdleFilledRevealed : SlotState::IdleFilledMasked;
}

std::vector<SlotState> VaultSlotEngine::states() const {
    std::vector<SlotState> result;
    result.reserve(VAULT_SLOT_COUNT);
    for (size_t i = 0; i < VAULT_SLOT_COUNT; ++i) {
        result.push_back(state(i));
    }
    return result;
}

std::optional<std::string> VaultSlotEngine::copyable_value(size_t index) const {
    if (!m_selected || index >= VAULT_SLOT_COUNT) {
        return std::nullopt;
    }
    auto value = slot_value(index);
    if (!value || !is_filled_slot(*value)) {
        return std::nullopt;
    }
    return value;
}

bool VaultSlotEngine::toggle_description_reveal() {
    if (!m_selected) {
        return false;
    }
    m_description_revealed = !m_description_revealed;
    m_signal_slots_changed.emit();
    return m_description_revealed;
}

std::vector<std::string> VaultSlotEngine::tokenize(std::string_view text) {
    static const std::regex delimiters(R"([\n, ]+)");

    std::vector<std::string> tokens;
    std::regex_token_iterator<std::string_view::const_iterator> it(
        text.begin(), text.end(), delimiters, -1);
    const std::regex_token_iterator<std::string_view::const_iterator> end;

    for (; it != end; ++it) {
        std::string token = trim(it->str());
        if (!token.empty()) {
            tokens.push_back(std::move(token));
        }
    }
    return tokens;
}

std::optional<std::string> VaultSlotEngine::slot_value(size_t index) const {
    if (!m_selected) {
        return std::nullopt;
    }
    auto record = m_repository->get_by_id(*m_selected);
    if (!record || !compat::is_valid_index(index, record->vault_size())) {
        return std::nullopt;
    }
    return record->vault(static_cast<int>(index));
}

void VaultSlotEngine::reset_transient_state() {
    if (m_revert_connection.connected()) {
        m_revert_connection.disconnect();
    }
    m_editing.reset();
    m_revealed.reset();
    m_just_pasted.clear();
    m_description_revealed = false;
}

bool VaultSlotEngine::on_revert_timeout() {
    m_just_pasted.clear();
    Log::debug("VaultSlotEngine: paste highlight expired");
    m_signal_slots_changed.emit();
    return false;  // One-shot
}

}  // namespace Sentinel
