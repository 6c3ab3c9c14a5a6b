// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "IdentityService.h"
#include "../Base32.h"
#include "../TagVocabulary.h"
#include "../managers/TagClassifier.h"
#include "../../utils/Log.h"
#include "../../utils/StringHelpers.h"
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <algorithm>
#include <array>
#include <format>
#include <stdexcept>

namespace Sentinel {

IdentityService::IdentityService(IIdentityRepository* repository)
    : m_repository(repository) {
    if (!m_repository) {
        throw std::invalid_argument("IdentityService: repository cannot be null");
    }
}

SentinelResult<> IdentityService::validate_draft(const IdentityDraft& draft) const {
    if (trim(draft.name).empty()) {
        Log::debug("IdentityService: draft rejected, empty name");
        return std::unexpected(SentinelError::RejectedInput);
    }

    const std::string secret = Base32::normalize(draft.secret);
    if (secret.empty()) {
        Log::debug("IdentityService: draft rejected, empty secret");
        return std::unexpected(SentinelError::RejectedInput);
    }

    if (!Base32::is_valid(secret)) {
        Log::debug("IdentityService: draft rejected, secret is not base32");
        return std::unexpected(SentinelError::RejectedInput);
    }

    if (!is_valid_utf8(draft.name, "name") ||
        !is_valid_utf8(draft.note, "note") ||
        !is_valid_utf8(draft.hidden_description, "hidden description")) {
        return std::unexpected(SentinelError::RejectedInput);
    }

    for (const auto& tag : draft.tags) {
        if (!is_known_tag(tag)) {
            Log::debug("IdentityService: draft rejected, unknown tag {}", tag);
            return std::unexpected(SentinelError::RejectedInput);
        }
    }

    return {};
}

SentinelResult<sentinel::IdentityRecord>
IdentityService::create_identity(const IdentityDraft& draft) {
    if (auto valid = validate_draft(draft); !valid) {
        return std::unexpected(valid.error());
    }

    sentinel::IdentityRecord record;
    record.set_id(generate_id());
    record.set_name(draft.name);
    record.set_secret(Base32::normalize(draft.secret));
    fill_empty_vault(record);
    record.set_note(draft.note);
    record.set_hidden_description(draft.hidden_description);

    for (const auto& tag : draft.tags) {
        if (std::find(record.tags().begin(), record.tags().end(), tag) == record.tags().end()) {
            record.add_tags(tag);
        }
    }

    if (auto added = m_repository->add(record); !added) {
        return std::unexpected(added.error());
    }

    Log::info("IdentityService: created identity {}", record.id());
    return record;
}

SentinelResult<sentinel::IdentityRecord>
IdentityService::update_note(std::string_view id, const std::string& note) {
    if (!is_valid_utf8(note, "note")) {
        return std::unexpected(SentinelError::RejectedInput);
    }
    return m_repository->update(id, [&note](sentinel::IdentityRecord& record) {
        record.set_note(note);
    });
}

SentinelResult<sentinel::IdentityRecord>
IdentityService::update_hidden_description(std::string_view id, const std::string& description) {
    if (!is_valid_utf8(description, "hidden description")) {
        return std::unexpected(SentinelError::RejectedInput);
    }
    return m_repository->update(id, [&description](sentinel::IdentityRecord& record) {
        record.set_hidden_description(description);
    });
}

SentinelResult<sentinel::IdentityRecord>
IdentityService::toggle_tag(std::string_view id, std::string_view tag) {
    if (!is_known_tag(tag)) {
        Log::warning("IdentityService: refusing to assign unknown tag {}", tag);
        return std::unexpected(SentinelError::RejectedInput);
    }

    return m_repository->update(id, [tag](sentinel::IdentityRecord& record) {
        TagClassifier::toggle(record, tag);
    });
}

SentinelResult<sentinel::IdentityRecord>
IdentityService::set_vault_slot(std::string_view id, size_t index, std::string_view value) {
    if (index >= VAULT_SLOT_COUNT) {
        return std::unexpected(SentinelError::InvalidIndex);
    }

    std::string stored = trim(value);
    if (stored.empty()) {
        stored = std::string(EMPTY_SLOT);
    }

    return m_repository->update(id, [index, &stored](sentinel::IdentityRecord& record) {
        record.set_vault(static_cast<int>(index), stored);
    });
}

SentinelResult<std::vector<size_t>>
IdentityService::fill_vault_slots(std::string_view id, size_t start,
                                  const std::vector<std::string>& values) {
    if (start >= VAULT_SLOT_COUNT) {
        return std::unexpected(SentinelError::InvalidIndex);
    }

    std::vector<size_t> written;
    for (size_t k = 0; k < values.size() && start + k < VAULT_SLOT_COUNT; ++k) {
        written.push_back(start + k);
    }

    auto result = m_repository->update(id, [start, &values, &written](sentinel::IdentityRecord& record) {
        for (size_t k = 0; k < written.size(); ++k) {
            record.set_vault(static_cast<int>(start + k), values[k]);
        }
    });
    if (!result) {
        return std::unexpected(result.error());
    }

    if (values.size() > written.size()) {
        Log::debug("IdentityService: {} pasted values past slot {} dropped",
                   values.size() - written.size(), VAULT_SLOT_COUNT - 1);
    }
    return written;
}

std::string IdentityService::generate_id() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
        throw std::runtime_error("CSPRNG failure: RAND_bytes() failed");
    }

    // UUID v4 format: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::string id;
    id.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            id.push_back('-');
        }
        id += std::format("{:02x}", bytes[i]);
    }
    return id;
}

}  // namespace Sentinel
