// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// Notifier.h - Non-blocking user notifications

#pragma once

#include <sigc++/sigc++.h>
#include <optional>
#include <string>
#include <string_view>

namespace Sentinel {

/**
 * @brief Notification category, which decides how it is presented
 */
enum class NotificationKind {
    Success,   ///< An operation completed
    Info,      ///< Secondary information about a completed operation
    Reminder   ///< An operation was refused or failed
};

[[nodiscard]] constexpr std::string_view to_string(NotificationKind kind) noexcept {
    switch (kind) {
        case NotificationKind::Success:  return "success";
        case NotificationKind::Info:     return "info";
        case NotificationKind::Reminder: return "reminder";
    }
    return "unknown";
}

struct Notification {
    NotificationKind kind = NotificationKind::Info;
    std::string message;
};

/**
 * @brief Fan-out point for notifications
 *
 * The controller posts; the front end listens on signal_notified().
 * Never blocks and never requires a listener.
 */
class Notifier {
public:
    void notify(NotificationKind kind, std::string message);

    /// Last notification posted, if any
    [[nodiscard]] const std::optional<Notification>& last() const noexcept { return m_last; }

    [[nodiscard]] size_t count() const noexcept { return m_count; }

    [[nodiscard]] sigc::signal<void(const Notification&)>& signal_notified() { return m_signal_notified; }

private:
    std::optional<Notification> m_last;
    size_t m_count{0};
    sigc::signal<void(const Notification&)> m_signal_notified;
};

}  // namespace Sentinel
