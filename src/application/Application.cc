// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "Application.h"
#include "config.h"
#include "../core/io/FileIO.h"
#include "../utils/Log.h"
#include "../utils/SecureMemory.h"
#include <format>
#include <iostream>
#include <vector>

namespace Sentinel {

namespace {
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILED = 1;
    constexpr int EXIT_USAGE = 2;

    std::string option_string(const Glib::VariantDict& options, const char* name) {
        Glib::ustring value;
        if (options.lookup_value(name, value)) {
            return value.raw();
        }
        return {};
    }

    // FILENAME options arrive as bytestrings
    std::string option_filename(const Glib::VariantDict& options, const char* name) {
        std::string value;
        if (options.lookup_value(name, value)) {
            return value;
        }
        return {};
    }

    bool option_flag(const Glib::VariantDict& options, const char* name) {
        bool value = false;
        return options.lookup_value(name, value) && value;
    }

    bool option_present(const Glib::VariantDict& options, const char* name) {
        return options.contains(name);
    }

    int report(SentinelError error) {
        std::cerr << std::format("{}: {}\n", PROJECT_NAME, to_string(error));
        return EXIT_FAILED;
    }

    std::string join_tags(const sentinel::IdentityRecord& record) {
        std::string result;
        for (const auto& tag : record.tags()) {
            if (!result.empty()) {
                result += ',';
            }
            result += tag;
        }
        return result.empty() ? std::string("-") : result;
    }

    size_t filled_slots(const sentinel::IdentityRecord& record) {
        size_t count = 0;
        for (const auto& slot : record.vault()) {
            if (is_filled_slot(slot)) {
                ++count;
            }
        }
        return count;
    }
}

Application::Application()
    : Gio::Application(APPLICATION_ID,
                       Gio::Application::Flags::HANDLES_COMMAND_LINE | Gio::Application::Flags::NON_UNIQUE) {
    register_options();
}

Glib::RefPtr<Application> Application::create() {
    return Glib::make_refptr_for_instance<Application>(new Application());
}

void Application::register_options() {
    using Type = Gio::Application::OptionType;

    add_main_option_entry(Type::BOOL, "list", 'l', "List identities");
    add_main_option_entry(Type::STRING, "filter", 'f', "Only list identities carrying TAG", "TAG");
    add_main_option_entry(Type::STRING, "add", 'a', "Create an identity", "NAME");
    add_main_option_entry(Type::STRING, "secret", 's', "Base32 TOTP secret for --add", "SECRET");
    add_main_option_entry(Type::STRING_VECTOR, "tag", 't', "Tag for --add (repeatable)", "TAG");
    add_main_option_entry(Type::STRING, "id", 'i', "Identity to act on", "ID");
    add_main_option_entry(Type::BOOL, "remove", '\0', "Delete the identity (requires --yes)");
    add_main_option_entry(Type::STRING, "note", 'n', "Set the identity token", "TEXT");
    add_main_option_entry(Type::STRING, "hidden", '\0', "Set the hidden description", "TEXT");
    add_main_option_entry(Type::STRING, "toggle-tag", '\0', "Add or remove a tag", "TAG");
    add_main_option_entry(Type::INT, "index", '\0', "Vault slot index (0-9)", "N");
    add_main_option_entry(Type::STRING, "set", '\0', "Store a recovery code in the slot (empty clears it)", "CODE");
    add_main_option_entry(Type::STRING, "paste", '\0', "Fill slots from the index onward with a list of codes", "TEXT");
    add_main_option_entry(Type::BOOL, "copy", '\0', "Print the slot's code (refused for empty slots)");
    add_main_option_entry(Type::BOOL, "show", '\0', "Show the identity and its vault");
    add_main_option_entry(Type::BOOL, "reveal", '\0', "Show vault codes and hidden description in clear");
    add_main_option_entry(Type::BOOL, "codes", 'c', "Print the current code of every identity");
    add_main_option_entry(Type::BOOL, "watch", 'w', "Print codes every second until interrupted");
    add_main_option_entry(Type::BOOL, "export", 'e', "Write a .nexus backup");
    add_main_option_entry(Type::FILENAME, "output", 'o', "Backup file or directory for --export", "PATH");
    add_main_option_entry(Type::FILENAME, "import", '\0', "Replace all data with a backup (requires --yes)", "PATH");
    add_main_option_entry(Type::BOOL, "yes", 'y', "Confirm a destructive action");
    add_main_option_entry(Type::BOOL, "verbose", 'v', "Enable debug logging");
    add_main_option_entry(Type::BOOL, "version", '\0', "Print version and exit");
}

void Application::on_startup() {
    Gio::Application::on_startup();

    m_settings = SettingsValidator::load(SettingsValidator::open_settings());
    if (m_settings.debug_logging) {
        Log::set_level(Log::Level::Debug);
    }
}

int Application::on_command_line(const Glib::RefPtr<Gio::ApplicationCommandLine>& command_line) {
    const auto options = command_line->get_options_dict();
    if (!options) {
        return EXIT_USAGE;
    }

    if (option_flag(*options, "version")) {
        std::cout << std::format("{} {}\n", PROJECT_NAME, VERSION);
        return EXIT_OK;
    }

    if (option_flag(*options, "verbose")) {
        Log::set_level(Log::Level::Debug);
    }

    try {
        m_persistence = std::make_unique<FilePersistenceService>(m_settings.store_path);
        m_observer = std::make_unique<ObserverArchive>(m_settings.observer_path);
        m_generator = std::make_unique<TotpGenerator>();
        m_controller = std::make_unique<SentinelController>(
            m_persistence.get(), m_observer.get(), m_generator.get());
    } catch (const std::invalid_argument& e) {
        Log::error("Application: setup failed: {}", e.what());
        return EXIT_FAILED;
    }

    m_controller->notifier().signal_notified().connect(
        sigc::mem_fun(*this, &Application::on_notification));

    if (auto loaded = m_controller->load(); !loaded) {
        return report(loaded.error());
    }
    if (auto loaded = m_observer->load(); !loaded) {
        return report(loaded.error());
    }

    return run_action(*options);
}

int Application::run_action(const Glib::VariantDict& options) {
    const std::string id = option_string(options, "id");
    const bool confirmed = option_flag(options, "yes");

    if (option_present(options, "add")) {
        return action_add(options);
    }
    if (option_present(options, "import")) {
        return action_import(option_filename(options, "import"), confirmed);
    }
    if (option_flag(options, "export")) {
        return action_export(options);
    }
    if (option_flag(options, "codes")) {
        return action_codes();
    }
    if (option_flag(options, "watch")) {
        return action_watch();
    }

    if (!id.empty()) {
        if (option_flag(options, "remove")) {
            auto removed = m_controller->remove_identity(id, confirmed);
            if (!removed) {
                if (removed.error() == SentinelError::ConfirmationRequired) {
                    std::cerr << "Refusing to delete without --yes\n";
                    return EXIT_USAGE;
                }
                return report(removed.error());
            }
            return EXIT_OK;
        }
        if (option_present(options, "note")) {
            auto updated = m_controller->update_note(id, option_string(options, "note"));
            return updated ? EXIT_OK : EXIT_FAILED;
        }
        if (option_present(options, "hidden")) {
            auto updated = m_controller->update_hidden_description(id, option_string(options, "hidden"));
            return updated ? EXIT_OK : EXIT_FAILED;
        }
        if (option_present(options, "toggle-tag")) {
            auto updated = m_controller->toggle_tag(id, option_string(options, "toggle-tag"));
            return updated ? EXIT_OK : EXIT_FAILED;
        }
        if (option_present(options, "index")) {
            return action_slot(id, options);
        }
        return action_show(id, option_flag(options, "reveal"));
    }

    return action_list(options);
}

int Application::action_list(const Glib::VariantDict& options) {
    if (option_present(options, "filter")) {
        m_controller->set_filter(option_string(options, "filter"));
    }

    m_controller->ticker().tick();
    const auto& codes = m_controller->ticker().codes();

    for (const auto& record : m_controller->visible_identities()) {
        const auto code = codes.find(record.id());
        std::cout << std::format("{}  {:<24}  {}  [{}]  vault {}/{}\n",
            record.id(), record.name(),
            code != codes.end() ? code->second : std::string("------"),
            join_tags(record), filled_slots(record), VAULT_SLOT_COUNT);
    }
    return EXIT_OK;
}

int Application::action_add(const Glib::VariantDict& options) {
    IdentityDraft draft;
    draft.name = option_string(options, "add");
    draft.secret = option_string(options, "secret");
    draft.note = option_string(options, "note");
    draft.hidden_description = option_string(options, "hidden");

    std::vector<Glib::ustring> tags;
    if (options.lookup_value("tag", tags)) {
        for (const auto& tag : tags) {
            TagClassifier::toggle(draft.tags, tag.raw());
        }
    }

    auto record = m_controller->add_identity(draft);
    secure_clear(draft.secret);
    if (!record) {
        return EXIT_FAILED;
    }
    std::cout << record->id() << '\n';
    return EXIT_OK;
}

int Application::action_show(const std::string& id, bool reveal) {
    auto record = m_controller->repository().get_by_id(id);
    if (!record) {
        return report(record.error());
    }

    if (auto selected = m_controller->select(id); !selected) {
        return report(selected.error());
    }
    if (reveal) {
        m_controller->slots().toggle_description_reveal();
    }

    std::cout << std::format("Name:    {}\n", record->name());
    std::cout << std::format("Token:   {}\n", record->note());
    std::string hidden = record->hidden_description();
    if (!m_controller->slots().is_description_revealed() && !hidden.empty()) {
        hidden = "********";
    }
    std::cout << std::format("Hidden:  {}\n", hidden);
    std::cout << std::format("Tags:    {}\n", join_tags(*record));

    for (size_t i = 0; i < VAULT_SLOT_COUNT; ++i) {
        const auto& value = record->vault(static_cast<int>(i));
        std::string shown = "(empty)";
        if (is_filled_slot(value)) {
            shown = reveal ? value : std::string("********");
        }
        std::cout << std::format("  {:02d}  {}\n", i + 1, shown);
    }
    return EXIT_OK;
}

int Application::action_slot(const std::string& id, const Glib::VariantDict& options) {
    int index = -1;
    if (!options.lookup_value("index", index) || index < 0 || static_cast<size_t>(index) >= VAULT_SLOT_COUNT) {
        std::cerr << std::format("Slot index must be 0-{}\n", VAULT_SLOT_COUNT - 1);
        return EXIT_USAGE;
    }
    const auto slot = static_cast<size_t>(index);

    if (auto selected = m_controller->select(id); !selected) {
        return report(selected.error());
    }

    if (option_flag(options, "copy")) {
        auto value = m_controller->copy_slot(slot);
        if (!value) {
            return EXIT_FAILED;
        }
        std::cout << *value << '\n';
        return EXIT_OK;
    }

    if (auto editing = m_controller->edit_slot(slot); !editing) {
        return report(editing.error());
    }

    if (option_present(options, "paste")) {
        auto written = m_controller->paste_into_slot(option_string(options, "paste"));
        if (!written) {
            return report(written.error());
        }
        if (written->empty()) {
            // No codes found: the slot stays as it was
            m_controller->slots().cancel_edit();
            std::cerr << "No codes found in the pasted text\n";
        }
        return EXIT_OK;
    }

    if (option_present(options, "set")) {
        auto committed = m_controller->commit_slot(option_string(options, "set"));
        return committed ? EXIT_OK : report(committed.error());
    }

    m_controller->slots().cancel_edit();
    std::cerr << "Nothing to do for the slot: use --set, --paste or --copy\n";
    return EXIT_USAGE;
}

int Application::action_codes() {
    m_controller->ticker().tick();
    on_codes_updated(m_controller->ticker().codes(), m_controller->ticker().remaining());
    return EXIT_OK;
}

int Application::action_watch() {
    m_watching = true;
    m_controller->ticker().signal_codes_updated().connect(
        sigc::mem_fun(*this, &Application::on_codes_updated));
    m_controller->ticker().start();

    // Keep the main loop running after on_command_line() returns
    hold();
    return EXIT_OK;
}

int Application::action_export(const Glib::VariantDict& options) {
    std::string target = option_filename(options, "output");
    if (target.empty()) {
        target = m_settings.backup_directory;
    }

    auto written = m_controller->export_backup(target);
    if (!written) {
        return EXIT_FAILED;
    }
    std::cout << *written << '\n';
    return EXIT_OK;
}

int Application::action_import(const std::string& path, bool confirmed) {
    if (!confirmed) {
        // Validate first so a broken file is reported even without --yes
        auto text = FileIO::read_file(path, FileIO::MAX_BACKUP_SIZE);
        if (!text) {
            return report(text.error());
        }
        auto imported = m_controller->import_backup_text(*text, false);
        if (!imported && imported.error() == SentinelError::ConfirmationRequired) {
            std::cerr << "This replaces all identities and observer data. Re-run with --yes to confirm.\n";
            return EXIT_USAGE;
        }
        return EXIT_FAILED;
    }

    auto imported = m_controller->import_backup_file(path, true);
    return imported ? EXIT_OK : EXIT_FAILED;
}

void Application::on_notification(const Notification& notification) {
    std::ostream& out = (notification.kind == NotificationKind::Reminder) ? std::cerr : std::cout;
    out << std::format("[{}] {}\n", to_string(notification.kind), notification.message);
}

void Application::on_codes_updated(const CodeTicker::CodeMap& codes, int remaining) {
    if (m_watching) {
        std::cout << '\n';
    }
    for (const auto& record : m_controller->repository().get_all()) {
        const auto code = codes.find(record.id());
        std::cout << std::format("{:<24}  {}\n", record.name(),
            code != codes.end() ? code->second : std::string("------"));
    }
    std::cout << std::format("Next code in {}s\n", remaining);
    std::cout.flush();
}

}  // namespace Sentinel
