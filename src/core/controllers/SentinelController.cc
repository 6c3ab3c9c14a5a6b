// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "SentinelController.h"
#include "../Base32.h"
#include "../../utils/Log.h"
#include "../../utils/StringHelpers.h"
#include <format>
#include <stdexcept>

namespace Sentinel {

namespace {
    // Notification texts
    constexpr std::string_view MSG_CHANNEL_ESTABLISHED = "Channel Established";
    constexpr std::string_view MSG_CHANNEL_TERMINATED = "Channel Terminated";
    constexpr std::string_view MSG_INVALID_SECRET = "Invalid Secret (Base32 Required)";
    constexpr std::string_view MSG_MISSING_FIELDS = "Name and Secret Required";
    constexpr std::string_view MSG_UNKNOWN_TAG = "Unknown Tag";
    constexpr std::string_view MSG_SLOT_UPDATED = "Vault Slot Updated";
    constexpr std::string_view MSG_CODE_COPIED = "Secure Code Copied";
    constexpr std::string_view MSG_EXPORTED = "Global System Exported (.nexus)";
    constexpr std::string_view MSG_IMPORTED = "System Link Re-established";
    constexpr std::string_view MSG_CORRUPT = "Corrupt Nexus File";
}

SentinelController::SentinelController(IPersistenceService* persistence,
                                       IObserverService* observer,
                                       const ICodeGenerator* generator)
    : m_generator(generator) {
    if (!m_generator) {
        throw std::invalid_argument("SentinelController: generator cannot be null");
    }

    // Each component validates its own collaborators
    m_repository = std::make_unique<IdentityRepository>(persistence);
    m_service = std::make_unique<IdentityService>(m_repository.get());
    m_slots = std::make_unique<VaultSlotEngine>(m_repository.get(), m_service.get());
    m_tags = std::make_unique<TagClassifier>();
    m_backups = std::make_unique<BackupController>(m_repository.get(), observer);
    m_ticker = std::make_unique<CodeTicker>(m_repository.get(), m_generator);

    m_collection_connection = m_repository->signal_collection_changed().connect(
        sigc::mem_fun(*this, &SentinelController::on_collection_changed));
    m_save_failed_connection = m_repository->signal_save_failed().connect(
        sigc::mem_fun(*this, &SentinelController::on_save_failed));
}

SentinelController::~SentinelController() {
    m_collection_connection.disconnect();
    m_save_failed_connection.disconnect();
}

SentinelResult<> SentinelController::load() {
    return m_repository->load();
}

SentinelResult<sentinel::IdentityRecord> SentinelController::add_identity(const IdentityDraft& draft) {
    auto result = m_service->create_identity(draft);
    if (!result) {
        if (result.error() == SentinelError::RejectedInput) {
            // Pick the message matching what the user got wrong
            const bool fields_present = !trim(draft.name).empty() &&
                                        !Base32::normalize(draft.secret).empty();
            const bool secret_invalid = fields_present &&
                                        !Base32::is_valid(Base32::normalize(draft.secret));
            std::string_view message = MSG_MISSING_FIELDS;
            if (secret_invalid) {
                message = MSG_INVALID_SECRET;
            } else if (fields_present) {
                message = to_string(SentinelError::RejectedInput);
            }
            m_notifier.notify(NotificationKind::Reminder, std::string(message));
        } else {
            m_notifier.notify(NotificationKind::Reminder, std::string(to_string(result.error())));
        }
        return result;
    }

    m_notifier.notify(NotificationKind::Success, std::string(MSG_CHANNEL_ESTABLISHED));
    return result;
}

SentinelResult<bool> SentinelController::remove_identity(std::string_view id, bool confirmed) {
    if (!confirmed) {
        return std::unexpected(SentinelError::ConfirmationRequired);
    }

    auto removed = m_repository->remove(id);
    if (!removed) {
        m_notifier.notify(NotificationKind::Reminder, std::string(to_string(removed.error())));
        return removed;
    }

    // The selection is cleared by on_collection_changed()
    if (*removed) {
        m_notifier.notify(NotificationKind::Reminder, std::string(MSG_CHANNEL_TERMINATED));
    }
    return removed;
}

SentinelResult<sentinel::IdentityRecord>
SentinelController::update_note(std::string_view id, const std::string& note) {
    auto result = m_service->update_note(id, note);
    if (!result) {
        m_notifier.notify(NotificationKind::Reminder, std::string(to_string(result.error())));
    }
    return result;
}

SentinelResult<sentinel::IdentityRecord>
SentinelController::update_hidden_description(std::string_view id, const std::string& description) {
    auto result = m_service->update_hidden_description(id, description);
    if (!result) {
        m_notifier.notify(NotificationKind::Reminder, std::string(to_string(result.error())));
    }
    return result;
}

SentinelResult<sentinel::IdentityRecord>
SentinelController::toggle_tag(std::string_view id, std::string_view tag) {
    auto result = m_service->toggle_tag(id, tag);
    if (!result) {
        const auto message = (result.error() == SentinelError::RejectedInput)
            ? std::string(MSG_UNKNOWN_TAG)
            : std::string(to_string(result.error()));
        m_notifier.notify(NotificationKind::Reminder, message);
    }
    return result;
}

SentinelResult<> SentinelController::select(std::optional<std::string> id) {
    if (id && !m_repository->find_index_by_id(*id)) {
        return std::unexpected(SentinelError::NotFound);
    }
    m_slots->select(std::move(id));
    return {};
}

SentinelResult<SlotState> SentinelController::click_slot(size_t index) {
    return m_slots->click(index);
}

SentinelResult<> SentinelController::edit_slot(size_t index) {
    return m_slots->begin_edit(index);
}

SentinelResult<bool> SentinelController::commit_slot(std::string_view text) {
    auto stored = m_slots->commit(text);
    if (!stored) {
        if (stored.error() != SentinelError::NoSelection && stored.error() != SentinelError::NotEditing) {
            m_notifier.notify(NotificationKind::Reminder, std::string(to_string(stored.error())));
        }
        return stored;
    }

    if (*stored) {
        m_notifier.notify(NotificationKind::Success, std::string(MSG_SLOT_UPDATED));
    }
    return stored;
}

SentinelResult<std::vector<size_t>> SentinelController::paste_into_slot(std::string_view text) {
    auto written = m_slots->paste(text);
    if (!written) {
        if (written.error() != SentinelError::NoSelection && written.error() != SentinelError::NotEditing) {
            m_notifier.notify(NotificationKind::Reminder, std::string(to_string(written.error())));
        }
        return written;
    }

    if (!written->empty()) {
        m_notifier.notify(NotificationKind::Success,
                          std::format("{} Codes Securely Pasted", written->size()));
    }
    return written;
}

std::optional<std::string> SentinelController::copy_slot(size_t index) {
    auto value = m_slots->copyable_value(index);
    if (value) {
        m_notifier.notify(NotificationKind::Success, std::string(MSG_CODE_COPIED));
    }
    return value;
}

std::optional<std::string> SentinelController::copy_code(std::string_view id) {
    auto record = m_repository->get_by_id(id);
    if (!record) {
        return std::nullopt;
    }

    const auto& codes = m_ticker->codes();
    const auto it = codes.find(record->id());
    std::string code = (it != codes.end()) ? it->second : m_generator->generate(record->secret());

    m_notifier.notify(NotificationKind::Success, std::string(MSG_CODE_COPIED));
    return code;
}

void SentinelController::set_filter(std::optional<std::string> tag) {
    m_tags->set_filter(std::move(tag));
}

IdentityList SentinelController::visible_identities() const {
    return m_tags->visible(m_repository->get_all());
}

SentinelResult<std::string> SentinelController::export_backup(const std::string& path) {
    auto written = m_backups->export_to_file(path);
    if (!written) {
        m_notifier.notify(NotificationKind::Reminder, std::string(to_string(written.error())));
        return written;
    }
    m_notifier.notify(NotificationKind::Success, std::string(MSG_EXPORTED));
    return written;
}

SentinelResult<ImportSummary>
SentinelController::import_backup_text(std::string_view text, bool confirmed) {
    auto summary = m_backups->import_text(text, confirmed);
    report_import(summary);
    return summary;
}

SentinelResult<ImportSummary>
SentinelController::import_backup_file(const std::string& path, bool confirmed) {
    auto summary = m_backups->import_file(path, confirmed);
    report_import(summary);
    return summary;
}

void SentinelController::on_collection_changed() {
    const auto& selected = m_slots->selected_id();
    if (selected && !m_repository->find_index_by_id(*selected)) {
        Log::debug("SentinelController: selected identity is gone, clearing selection");
        m_slots->select(std::nullopt);
    }
}

void SentinelController::on_save_failed(SentinelError error) {
    m_notifier.notify(NotificationKind::Reminder,
                      std::format("Sync Failed: {}", to_string(error)));
}

void SentinelController::report_import(const SentinelResult<ImportSummary>& summary) {
    if (summary) {
        if (summary->observer_records > 0) {
            m_notifier.notify(NotificationKind::Info,
                              std::format("Observer: {} records restored", summary->observer_records));
        }
        m_notifier.notify(NotificationKind::Success, std::string(MSG_IMPORTED));
        return;
    }

    switch (summary.error()) {
        case SentinelError::ConfirmationRequired:
            // Declined by the user, nothing to report
            break;
        case SentinelError::CorruptBackup:
            m_notifier.notify(NotificationKind::Reminder, std::string(MSG_CORRUPT));
            break;
        default:
            m_notifier.notify(NotificationKind::Reminder, std::string(to_string(summary.error())));
            break;
    }
}

}  // namespace Sentinel
