// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "Notifier.h"
#include "../../utils/Log.h"

namespace Sentinel {

void Notifier::notify(NotificationKind kind, std::string message) {
    Log::debug("Notifier: [{}] {}", to_string(kind), message);
    m_last = Notification{kind, std::move(message)};
    ++m_count;
    m_signal_notified.emit(*m_last);
}

}  // namespace Sentinel
