// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file TagClassifier.h
 * @brief Tag assignment and list filtering by tag
 */

#pragma once

#include "../IdentityTypes.h"
#include <optional>
#include <sigc++/sigc++.h>
#include <string>
#include <string_view>
#include <vector>

namespace Sentinel {

/**
 * @brief Classifies identities with tags and filters the list by tag
 *
 * TagClassifier handles:
 * - Toggling a tag on a record's tag list (present -> removed, absent -> appended)
 * - Toggling a tag in the pending set of a creation form
 * - The active list filter (std::nullopt shows every identity)
 * - Computing the visible list in store order
 *
 * The static helpers are pure; the filter is the only state.
 *
 * @section usage Usage Example
 * @code
 * TagClassifier classifier;
 * classifier.set_filter("FARM");
 * auto shown = classifier.visible(repository.get_all());
 *
 * classifier.set_filter(std::nullopt);  // back to "all"
 * @endcode
 */
class TagClassifier {
public:
    TagClassifier() = default;
    ~TagClassifier() = default;

    // Non-copyable (owns a signal)
    TagClassifier(const TagClassifier&) = delete;
    TagClassifier& operator=(const TagClassifier&) = delete;

    /**
     * @brief Toggle @p tag in a plain tag list
     * @return true if the tag is now present
     */
    static bool toggle(std::vector<std::string>& tags, std::string_view tag);

    /**
     * @brief Toggle @p tag on a record
     * @return true if the tag is now present
     */
    static bool toggle(sentinel::IdentityRecord& record, std::string_view tag);

    /**
     * @brief Check whether @p record carries @p tag
     */
    [[nodiscard]] static bool has_tag(const sentinel::IdentityRecord& record, std::string_view tag);

    /**
     * @brief Records matching @p filter, in input order
     * @param filter Tag to keep, or std::nullopt for every record
     */
    [[nodiscard]] static IdentityList filter_records(const IdentityList& records,
                                                     const std::optional<std::string>& filter);

    /**
     * @brief Set the active filter
     *
     * Emits signal_filter_changed() only when the value changes.
     */
    void set_filter(std::optional<std::string> filter);

    [[nodiscard]] const std::optional<std::string>& filter() const noexcept { return m_filter; }

    /// Records visible under the active filter
    [[nodiscard]] IdentityList visible(const IdentityList& records) const;

    [[nodiscard]] sigc::signal<void()>& signal_filter_changed() { return m_signal_filter_changed; }

private:
    std::optional<std::string> m_filter;
    sigc::signal<void()> m_signal_filter_changed;
};

}  // namespace Sentinel
