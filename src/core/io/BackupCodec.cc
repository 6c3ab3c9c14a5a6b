// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "BackupCodec.h"
#include "../services/IdentityService.h"
#include "../../utils/Log.h"
#include <google/protobuf/util/json_util.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <set>

namespace Sentinel::BackupCodec {

namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

// Record member names as they appear in backup files
constexpr std::string_view FIELD_ID = "id";
constexpr std::string_view FIELD_NAME = "name";
constexpr std::string_view FIELD_SECRET = "secret";
constexpr std::string_view FIELD_VAULT = "vault";
constexpr std::string_view FIELD_NOTE = "note";
constexpr std::string_view FIELD_HIDDEN_DESCRIPTION = "hiddenDescription";
constexpr std::string_view FIELD_TAGS = "tags";

constexpr std::array<std::string_view, 7> KNOWN_FIELDS = {
    FIELD_ID, FIELD_NAME, FIELD_SECRET, FIELD_VAULT,
    FIELD_NOTE, FIELD_HIDDEN_DESCRIPTION, FIELD_TAGS
};

bool is_known_field(std::string_view key) {
    return std::find(KNOWN_FIELDS.begin(), KNOWN_FIELDS.end(), key) != KNOWN_FIELDS.end();
}

const Value* find_member(const Struct& object, std::string_view key) {
    const auto it = object.fields().find(std::string(key));
    return it == object.fields().end() ? nullptr : &it->second;
}

std::string string_member(const Struct& object, std::string_view key) {
    const Value* value = find_member(object, key);
    if (value && value->kind_case() == Value::kStringValue) {
        return value->string_value();
    }
    return {};
}

// Legacy writers produced numeric ids
std::string id_member(const Struct& object) {
    const Value* value = find_member(object, FIELD_ID);
    if (!value) {
        return {};
    }
    if (value->kind_case() == Value::kStringValue) {
        return value->string_value();
    }
    if (value->kind_case() == Value::kNumberValue) {
        const double number = value->number_value();
        if (std::isfinite(number) && std::trunc(number) == number &&
            std::abs(number) < static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return std::format("{}", static_cast<int64_t>(number));
        }
        return std::format("{}", number);
    }
    return {};
}

Value string_value(std::string_view text) {
    Value value;
    value.set_string_value(std::string(text));
    return value;
}

Value list_of(const google::protobuf::RepeatedPtrField<std::string>& items) {
    Value value;
    ListValue* list = value.mutable_list_value();
    for (const auto& item : items) {
        list->add_values()->set_string_value(item);
    }
    return value;
}

// First present member among the given names
const Value* find_either(const Struct& object, std::string_view key, std::string_view legacy_key) {
    if (const Value* value = find_member(object, key)) {
        return value;
    }
    return find_member(object, legacy_key);
}

} // namespace

SentinelResult<std::string>
encode(const IdentityList& identities, const ObserverRecordList& observer_data) {
    Value root;
    auto& fields = *root.mutable_struct_value()->mutable_fields();

    fields[std::string(KEY_VERSION)].set_number_value(CURRENT_VERSION);

    ListValue* identity_list = fields[std::string(KEY_IDENTITIES)].mutable_list_value();
    for (const auto& record : identities) {
        *identity_list->add_values() = to_value(record);
    }

    ListValue* observer_list = fields[std::string(KEY_OBSERVER)].mutable_list_value();
    for (const auto& entry : observer_data) {
        *observer_list->add_values() = entry;
    }

    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;

    std::string output;
    const auto status = google::protobuf::util::MessageToJsonString(root, &output, options);
    if (!status.ok()) {
        Log::error("BackupCodec: failed to serialize backup: {}", status.ToString());
        return std::unexpected(SentinelError::SerializationFailed);
    }

    Log::info("BackupCodec: encoded {} identities, {} observer records",
              identities.size(), observer_data.size());
    return output;
}

SentinelResult<DecodedBackup> decode(std::string_view text) {
    Value root;
    const auto status = google::protobuf::util::JsonStringToMessage(std::string(text), &root);
    if (!status.ok()) {
        Log::warning("BackupCodec: backup is not valid JSON: {}", status.ToString());
        return std::unexpected(SentinelError::CorruptBackup);
    }

    DecodedBackup decoded;
    const ListValue* identity_list = nullptr;
    const ListValue* observer_list = nullptr;

    if (root.kind_case() == Value::kListValue) {
        decoded.format = BackupFormat::LegacyList;
        decoded.version = 1;
        identity_list = &root.list_value();

    } else if (root.kind_case() == Value::kStructValue) {
        const Struct& envelope = root.struct_value();

        const Value* identities = find_either(envelope, KEY_IDENTITIES, KEY_IDENTITIES_LEGACY);
        if (!identities) {
            Log::warning("BackupCodec: object without an identities member");
            return std::unexpected(SentinelError::CorruptBackup);
        }

        // Detected by shape; the version member is informational
        decoded.format = BackupFormat::Envelope;
        decoded.version = CURRENT_VERSION;
        if (identities->kind_case() == Value::kListValue) {
            identity_list = &identities->list_value();
        }

        const Value* observer = find_either(envelope, KEY_OBSERVER, KEY_OBSERVER_LEGACY);
        if (observer && observer->kind_case() == Value::kListValue) {
            observer_list = &observer->list_value();
        }

    } else {
        Log::warning("BackupCodec: backup root is neither an array nor an object");
        return std::unexpected(SentinelError::CorruptBackup);
    }

    std::set<std::string> seen_ids;
    if (identity_list) {
        decoded.identities.reserve(static_cast<size_t>(identity_list->values_size()));
        for (const auto& entry : identity_list->values()) {
            if (entry.kind_case() != Value::kStructValue) {
                ++decoded.skipped_entries;
                continue;
            }

            auto record = sanitize(entry.struct_value());
            if (!seen_ids.insert(record.id()).second) {
                Log::warning("BackupCodec: duplicate id {} replaced", record.id());
                record.set_id(IdentityService::generate_id());
                seen_ids.insert(record.id());
            }
            decoded.identities.push_back(std::move(record));
        }
    }

    if (observer_list) {
        decoded.observer_data.assign(observer_list->values().begin(), observer_list->values().end());
    }

    if (decoded.skipped_entries > 0) {
        Log::warning("BackupCodec: {} identity entries were not objects and were skipped",
                     decoded.skipped_entries);
    }
    Log::info("BackupCodec: decoded version {} backup, {} identities, {} observer records",
              decoded.version, decoded.identities.size(), decoded.observer_data.size());
    return decoded;
}

sentinel::IdentityRecord sanitize(const Struct& object) {
    sentinel::IdentityRecord record;

    std::string id = id_member(object);
    if (id.empty()) {
        id = IdentityService::generate_id();
    }
    record.set_id(id);
    record.set_name(string_member(object, FIELD_NAME));
    record.set_secret(string_member(object, FIELD_SECRET));
    record.set_note(string_member(object, FIELD_NOTE));
    record.set_hidden_description(string_member(object, FIELD_HIDDEN_DESCRIPTION));

    const Value* vault = find_member(object, FIELD_VAULT);
    if (vault && vault->kind_case() == Value::kListValue &&
        static_cast<size_t>(vault->list_value().values_size()) == VAULT_SLOT_COUNT) {
        for (const auto& slot : vault->list_value().values()) {
            if (slot.kind_case() == Value::kStringValue && !slot.string_value().empty()) {
                record.add_vault(slot.string_value());
            } else {
                record.add_vault(std::string(EMPTY_SLOT));
            }
        }
    } else {
        fill_empty_vault(record);
    }

    const Value* tags = find_member(object, FIELD_TAGS);
    if (tags && tags->kind_case() == Value::kListValue) {
        for (const auto& tag : tags->list_value().values()) {
            if (tag.kind_case() != Value::kStringValue) {
                continue;
            }
            const auto& name = tag.string_value();
            if (std::find(record.tags().begin(), record.tags().end(), name) == record.tags().end()) {
                record.add_tags(name);
            }
        }
    }

    for (const auto& [key, value] : object.fields()) {
        if (!is_known_field(key)) {
            (*record.mutable_extra_fields())[key] = value;
        }
    }

    return record;
}

Value to_value(const sentinel::IdentityRecord& record) {
    Value value;
    auto& fields = *value.mutable_struct_value()->mutable_fields();

    for (const auto& [key, extra] : record.extra_fields()) {
        fields[key] = extra;
    }

    fields[std::string(FIELD_ID)] = string_value(record.id());
    fields[std::string(FIELD_NAME)] = string_value(record.name());
    fields[std::string(FIELD_SECRET)] = string_value(record.secret());
    fields[std::string(FIELD_VAULT)] = list_of(record.vault());
    fields[std::string(FIELD_NOTE)] = string_value(record.note());
    fields[std::string(FIELD_HIDDEN_DESCRIPTION)] = string_value(record.hidden_description());
    fields[std::string(FIELD_TAGS)] = list_of(record.tags());

    return value;
}

std::string make_backup_filename(std::chrono::system_clock::time_point when) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count();
    return std::format("nexus_global_backup_{}{}", millis, FILE_EXTENSION);
}

} // namespace Sentinel::BackupCodec
