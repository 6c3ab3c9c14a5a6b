// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "TagClassifier.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <iterator>

namespace Sentinel {

bool TagClassifier::toggle(std::vector<std::string>& tags, std::string_view tag) {
    const auto it = std::find(tags.begin(), tags.end(), tag);
    if (it != tags.end()) {
        tags.erase(it);
        return false;
    }
    tags.emplace_back(tag);
    return true;
}

bool TagClassifier::toggle(sentinel::IdentityRecord& record, std::string_view tag) {
    auto* tags = record.mutable_tags();
    const auto it = std::find(tags->begin(), tags->end(), tag);
    if (it != tags->end()) {
        tags->erase(it);
        return false;
    }
    record.add_tags(std::string(tag));
    return true;
}

bool TagClassifier::has_tag(const sentinel::IdentityRecord& record, std::string_view tag) {
    return std::find(record.tags().begin(), record.tags().end(), tag) != record.tags().end();
}

IdentityList TagClassifier::filter_records(const IdentityList& records,
                                           const std::optional<std::string>& filter) {
    if (!filter) {
        return records;
    }

    IdentityList result;
    std::copy_if(records.begin(), records.end(), std::back_inserter(result),
        [&filter](const sentinel::IdentityRecord& record) {
            return has_tag(record, *filter);
        });
    return result;
}

void TagClassifier::set_filter(std::optional<std::string> filter) {
    if (filter == m_filter) {
        return;
    }

    m_filter = std::move(filter);
    Log::debug("TagClassifier: filter set to {}", m_filter.value_or("ALL"));
    m_signal_filter_changed.emit();
}

IdentityList TagClassifier::visible(const IdentityList& records) const {
    return filter_records(records, m_filter);
}

}  // namespace Sentinel
