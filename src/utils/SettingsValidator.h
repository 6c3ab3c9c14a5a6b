// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef SENTINEL_SETTINGS_VALIDATOR_H
#define SENTINEL_SETTINGS_VALIDATOR_H

#include <string>
#include <string_view>
#include <giomm/settings.h>
#include <giomm/settingsschemasource.h>
#include <glibmm/miscutils.h>
#include "Log.h"
#include "StringHelpers.h"

namespace Sentinel {

/**
 * @brief Resolved application settings
 */
struct AppSettings {
    std::string store_path;        ///< Absolute identity store path
    std::string observer_path;     ///< Absolute observer dataset path
    std::string backup_directory;  ///< Export directory ("" = current directory)
    bool debug_logging{false};
};

/**
 * @brief Reads GSettings values and resolves them to usable paths
 *
 * Paths stored in the schema may be empty, relative or start with "~/".
 * Empty selects the default file under the per-user data directory,
 * relative paths are resolved against that directory and "~/" expands to
 * the home directory.
 *
 * @note This is a static utility class and cannot be instantiated.
 */
class SettingsValidator final {
public:
    static inline constexpr std::string_view SCHEMA_ID{"com.sentinel.authenticator"};
    static inline constexpr std::string_view DATA_SUBDIR{"sentinel"};
    static inline constexpr std::string_view DEFAULT_STORE_FILE{"identities.pb"};
    static inline constexpr std::string_view DEFAULT_OBSERVER_FILE{"observer.pb"};

    /**
     * @brief Open the application settings if the schema is installed
     * @return Settings, or an empty RefPtr when the schema is unavailable
     *
     * Gio::Settings::create() aborts on an unknown schema, so the schema is
     * looked up first.
     */
    [[nodiscard]] static Glib::RefPtr<Gio::Settings> open_settings() {
        const auto source = Gio::SettingsSchemaSource::get_default();
        if (!source || !source->lookup(std::string(SCHEMA_ID), true)) {
            Log::warning("GSettings schema {} not installed, using defaults", SCHEMA_ID);
            return {};
        }
        return Gio::Settings::create(std::string(SCHEMA_ID));
    }

    /// $XDG_DATA_HOME/sentinel
    [[nodiscard]] static std::string data_directory() {
        return Glib::build_filename(Glib::get_user_data_dir(), std::string(DATA_SUBDIR));
    }

    /**
     * @brief Resolve a configured path
     * @param configured Raw setting value
     * @param default_name File name used when the value is empty
     */
    [[nodiscard]] static std::string resolve_path(std::string_view configured, std::string_view default_name) {
        const std::string value = trim(configured);
        if (value.empty()) {
            return Glib::build_filename(data_directory(), std::string(default_name));
        }
        if (value == "~") {
            return Glib::get_home_dir();
        }
        if (value.starts_with("~/")) {
            return Glib::build_filename(Glib::get_home_dir(), value.substr(2));
        }
        if (Glib::path_is_absolute(value)) {
            return value;
        }
        return Glib::build_filename(data_directory(), value);
    }

    [[nodiscard]] static std::string get_store_path(const Glib::RefPtr<Gio::Settings>& settings) {
        return resolve_path(settings->get_string("store-path").raw(), DEFAULT_STORE_FILE);
    }

    [[nodiscard]] static std::string get_observer_path(const Glib::RefPtr<Gio::Settings>& settings) {
        return resolve_path(settings->get_string("observer-path").raw(), DEFAULT_OBSERVER_FILE);
    }

    /**
     * @brief Export directory; "" means the current directory
     */
    [[nodiscard]] static std::string get_backup_directory(const Glib::RefPtr<Gio::Settings>& settings) {
        const std::string value = trim(settings->get_string("backup-directory").raw());
        if (value.empty()) {
            return {};
        }
        if (value.starts_with("~/")) {
            return Glib::build_filename(Glib::get_home_dir(), value.substr(2));
        }
        return value;
    }

    [[nodiscard]] static bool is_debug_logging_enabled(const Glib::RefPtr<Gio::Settings>& settings) {
        return settings->get_boolean("debug-logging");
    }

    /**
     * @brief All settings, with built-in defaults when @p settings is empty
     */
    [[nodiscard]] static AppSettings load(const Glib::RefPtr<Gio::Settings>& settings) {
        AppSettings result;
        if (!settings) {
            result.store_path = resolve_path("", DEFAULT_STORE_FILE);
            result.observer_path = resolve_path("", DEFAULT_OBSERVER_FILE);
            return result;
        }

        result.store_path = get_store_path(settings);
        result.observer_path = get_observer_path(settings);
        result.backup_directory = get_backup_directory(settings);
        result.debug_logging = is_debug_logging_enabled(settings);
        return result;
    }

private:
    SettingsValidator() = delete;                                    // No instantiation
    ~SettingsValidator() = delete;                                   // No destruction
    SettingsValidator(const SettingsValidator&) = delete;            // No copy
    SettingsValidator& operator=(const SettingsValidator&) = delete; // No copy assignment
    SettingsValidator(SettingsValidator&&) = delete;                 // No move
    SettingsValidator& operator=(SettingsValidator&&) = delete;      // No move assignment
};

} // namespace Sentinel

#endif // SENTINEL_SETTINGS_VALIDATOR_H
