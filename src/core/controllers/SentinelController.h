// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file SentinelController.h
 * @brief Single entry point tying the identity store components together
 */

#pragma once

#include "BackupController.h"
#include "CodeTicker.h"
#include "Notifier.h"
#include "../managers/TagClassifier.h"
#include "../managers/VaultSlotEngine.h"
#include "../repositories/IdentityRepository.h"
#include "../services/ICodeGenerator.h"
#include "../services/IObserverService.h"
#include "../services/IPersistenceService.h"
#include "../services/IdentityService.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace Sentinel {

/**
 * @brief Coordinates the store, slot engine, tags, backups and ticker
 *
 * Responsibilities:
 * - Owns the repository and everything built on it
 * - Turns every outcome into a notification (success or refusal)
 * - Clears the selection when the selected identity disappears, whether
 *   by removal or by an import replacing the store
 *
 * Front ends call this class only; the components stay reachable through
 * the accessors for display queries.
 *
 * @section usage Usage Example
 * @code
 * FilePersistenceService persistence(settings.store_path);
 * ObserverArchive observer(settings.observer_path);
 * TotpGenerator generator;
 *
 * SentinelController controller(&persistence, &observer, &generator);
 * controller.notifier().signal_notified().connect(&print_notification);
 * controller.load();
 * auto record = controller.add_identity({.name = "Main", .secret = "JBSWY3DPEHPK3PXP"});
 * @endcode
 */
class SentinelController {
public:
    /**
     * @param persistence Non-owning, must outlive the controller
     * @param observer Non-owning, must outlive the controller
     * @param generator Non-owning, must outlive the controller
     * @throws std::invalid_argument if any pointer is null
     */
    SentinelController(IPersistenceService* persistence,
                       IObserverService* observer,
                       const ICodeGenerator* generator);
    ~SentinelController();

    SentinelController(const SentinelController&) = delete;
    SentinelController& operator=(const SentinelController&) = delete;
    SentinelController(SentinelController&&) = delete;
    SentinelController& operator=(SentinelController&&) = delete;

    /// Load the store from the persistence service
    [[nodiscard]] SentinelResult<> load();

    // ========================================================================
    // Identities
    // ========================================================================

    [[nodiscard]] SentinelResult<sentinel::IdentityRecord> add_identity(const IdentityDraft& draft);

    /**
     * @param confirmed The user agreed to the deletion
     * @return true if a record was removed
     */
    [[nodiscard]] SentinelResult<bool> remove_identity(std::string_view id, bool confirmed);

    [[nodiscard]] SentinelResult<sentinel::IdentityRecord> update_note(std::string_view id, const std::string& note);
    [[nodiscard]] SentinelResult<sentinel::IdentityRecord> update_hidden_description(std::string_view id,
                                                                                     const std::string& description);
    [[nodiscard]] SentinelResult<sentinel::IdentityRecord> toggle_tag(std::string_view id, std::string_view tag);

    // ========================================================================
    // Selection and vault slots
    // ========================================================================

    /**
     * @brief Select an identity by id, or clear the selection
     *
     * Errors: NotFound for an unknown id (selection unchanged)
     */
    [[nodiscard]] SentinelResult<> select(std::optional<std::string> id);

    [[nodiscard]] SentinelResult<SlotState> click_slot(size_t index);
    [[nodiscard]] SentinelResult<> edit_slot(size_t index);
    [[nodiscard]] SentinelResult<bool> commit_slot(std::string_view text);
    [[nodiscard]] SentinelResult<std::vector<size_t>> paste_into_slot(std::string_view text);

    /**
     * @brief Value to place on the clipboard for a slot
     * @return std::nullopt for an empty slot (refused silently)
     */
    [[nodiscard]] std::optional<std::string> copy_slot(size_t index);

    /**
     * @brief Current code of an identity for the clipboard
     *
     * Uses the last ticker batch, or generates on demand before the first tick.
     */
    [[nodiscard]] std::optional<std::string> copy_code(std::string_view id);

    // ========================================================================
    // Filtering
    // ========================================================================

    void set_filter(std::optional<std::string> tag);
    [[nodiscard]] IdentityList visible_identities() const;

    // ========================================================================
    // Backups
    // ========================================================================

    /// @return Path written
    [[nodiscard]] SentinelResult<std::string> export_backup(const std::string& path);
    [[nodiscard]] SentinelResult<ImportSummary> import_backup_text(std::string_view text, bool confirmed);
    [[nodiscard]] SentinelResult<ImportSummary> import_backup_file(const std::string& path, bool confirmed);

    // Component access
    [[nodiscard]] IdentityRepository& repository() noexcept { return *m_repository; }
    [[nodiscard]] const IdentityRepository& repository() const noexcept { return *m_repository; }
    [[nodiscard]] VaultSlotEngine& slots() noexcept { return *m_slots; }
    [[nodiscard]] TagClassifier& tags() noexcept { return *m_tags; }
    [[nodiscard]] CodeTicker& ticker() noexcept { return *m_ticker; }
    [[nodiscard]] Notifier& notifier() noexcept { return m_notifier; }

private:
    void on_collection_changed();
    void on_save_failed(SentinelError error);
    void report_import(const SentinelResult<ImportSummary>& summary);

    const ICodeGenerator* m_generator;  ///< Non-owning

    Notifier m_notifier;
    std::unique_ptr<IdentityRepository> m_repository;
    std::unique_ptr<IdentityService> m_service;
    std::unique_ptr<VaultSlotEngine> m_slots;
    std::unique_ptr<TagClassifier> m_tags;
    std::unique_ptr<BackupController> m_backups;
    std::unique_ptr<CodeTicker> m_ticker;

    sigc::connection m_collection_connection;
    sigc::connection m_save_failed_connection;
};

}  // namespace Sentinel
