// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file Application.h
 * @brief Command-line application class for Sentinel
 */

#ifndef SENTINEL_APPLICATION_H
#define SENTINEL_APPLICATION_H

#include <giomm/application.h>
#include <giomm/applicationcommandline.h>
#include <memory>
#include "../core/controllers/SentinelController.h"
#include "../core/services/FilePersistenceService.h"
#include "../core/services/ObserverArchive.h"
#include "../core/services/TotpGenerator.h"
#include "../utils/SettingsValidator.h"

namespace Sentinel {

/**
 * @brief Sentinel command-line application
 *
 * Runs one action per invocation against the identity store configured in
 * GSettings. Notifications are printed on standard output, errors on
 * standard error.
 *
 * @section actions Actions
 * - `--list [--filter TAG]`
 * - `--add NAME --secret S [--note T] [--hidden T] [--tag TAG]...`
 * - `--id ID --remove --yes`
 * - `--id ID --note T`, `--id ID --hidden T`, `--id ID --toggle-tag TAG`
 * - `--id ID --index N --set T`, `--id ID --index N --paste T`
 * - `--id ID --show [--reveal]`, `--id ID --index N --copy`
 * - `--codes`, `--watch`
 * - `--export [--output PATH]`, `--import PATH --yes`
 */
class Application : public Gio::Application {
public:
    /**
     * @brief Factory method to create Application instance
     */
    static Glib::RefPtr<Application> create();

protected:
    Application();

    /**
     * @brief Opens settings and the store, then registers for notifications
     */
    void on_startup() override;

    int on_command_line(const Glib::RefPtr<Gio::ApplicationCommandLine>& command_line) override;

private:
    void register_options();
    int run_action(const Glib::VariantDict& options);

    int action_list(const Glib::VariantDict& options);
    int action_add(const Glib::VariantDict& options);
    int action_show(const std::string& id, bool reveal);
    int action_slot(const std::string& id, const Glib::VariantDict& options);
    int action_codes();
    int action_watch();
    int action_export(const Glib::VariantDict& options);
    int action_import(const std::string& path, bool confirmed);

    void on_notification(const Notification& notification);
    void on_codes_updated(const CodeTicker::CodeMap& codes, int remaining);

    AppSettings m_settings;
    std::unique_ptr<FilePersistenceService> m_persistence;
    std::unique_ptr<ObserverArchive> m_observer;
    std::unique_ptr<TotpGenerator> m_generator;
    std::unique_ptr<SentinelController> m_controller;
    bool m_watching{false};
};

}  // namespace Sentinel

#endif // SENTINEL_APPLICATION_H
