// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file Log.h
 * @brief Leveled logging with std::format and source locations
 *
 * Every line carries a millisecond timestamp, the level and the file:line
 * of the call site. Messages below the current level are dropped before
 * formatting.
 *
 * @section usage Usage Example
 * @code
 * Sentinel::Log::set_level(Sentinel::Log::Level::Debug);
 *
 * Sentinel::Log::debug("Loading store: {}", store_path);
 * Sentinel::Log::info("Loaded {} identities", count);
 * Sentinel::Log::warning("Backup entry {} is not an object, skipped", index);
 * Sentinel::Log::error("Failed to save store: {}", to_string(err));
 * @endcode
 *
 * @warning Never pass secrets, vault slot contents or hidden descriptions.
 *          Log identity ids, counts and slot indices instead.
 */

#ifndef SENTINEL_LOG_H
#define SENTINEL_LOG_H

#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace Sentinel::Log {

/**
 * @brief Log severity levels, lowest first
 */
enum class Level {
    Debug,
    Info,
    Warning,
    Error
};

/// Minimum level that is printed. Default is Info.
inline Level current_level = Level::Info;

namespace detail {
    inline constexpr std::string_view level_to_string(Level level) noexcept {
        switch (level) {
            case Level::Debug:   return "DEBUG";
            case Level::Info:    return "INFO ";
            case Level::Warning: return "WARN ";
            case Level::Error:   return "ERROR";
        }
        return "UNKNOWN";
    }

    // YYYY-MM-DD HH:MM:SS.mmm in local time
    inline std::string get_timestamp() {
        const auto now = std::chrono::system_clock::now();
        const auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time, &tm);

        return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec, ms.count());
    }

    /**
     * @brief Format string bundled with the caller's source location
     *
     * Implicitly constructed from the literal at the call site, so the
     * default argument captures the caller instead of this header.
     */
    template<typename... Args>
    struct FormatWithLocation {
        std::format_string<Args...> fmt;
        std::source_location loc;

        template<typename T>
        consteval FormatWithLocation(const T& s,
                                     std::source_location l = std::source_location::current())
            : fmt(s), loc(l) {}
    };
}

/**
 * @brief Write one formatted line to std::cerr if @p level is enabled
 *
 * Format: [TIMESTAMP] LEVEL: message (file:line)
 */
template<typename... Args>
void log(Level level,
         detail::FormatWithLocation<std::type_identity_t<Args>...> fmt,
         Args&&... args) {
    if (level < current_level) {
        return;
    }

    const auto message = std::format(fmt.fmt, std::forward<Args>(args)...);
    std::cerr << std::format("[{}] {}: {} ({}:{})\n",
        detail::get_timestamp(), detail::level_to_string(level), message,
        fmt.loc.file_name(), fmt.loc.line());
}

template<typename... Args>
void debug(detail::FormatWithLocation<std::type_identity_t<Args>...> fmt, Args&&... args) {
    log<Args...>(Level::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void info(detail::FormatWithLocation<std::type_identity_t<Args>...> fmt, Args&&... args) {
    log<Args...>(Level::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(detail::FormatWithLocation<std::type_identity_t<Args>...> fmt, Args&&... args) {
    log<Args...>(Level::Warning, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void error(detail::FormatWithLocation<std::type_identity_t<Args>...> fmt, Args&&... args) {
    log<Args...>(Level::Error, fmt, std::forward<Args>(args)...);
}

/**
 * @brief Set minimum log level at runtime
 *
 * Driven by the debug-logging setting and the --verbose flag.
 */
inline void set_level(Level level) {
    current_level = level;
}

} // namespace Sentinel::Log

#endif // SENTINEL_LOG_H
