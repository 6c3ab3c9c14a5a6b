// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file TestDoubles.h
 * @brief In-memory collaborators shared by the unit tests
 */

#ifndef SENTINEL_TEST_DOUBLES_H
#define SENTINEL_TEST_DOUBLES_H

#include "../src/core/services/ICodeGenerator.h"
#include "../src/core/services/IObserverService.h"
#include "../src/core/services/IPersistenceService.h"
#include <glibmm/main.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <initializer_list>
#include <string>
#include <thread>

namespace Sentinel::Testing {

/**
 * @brief Persistence that keeps the last saved collection in memory
 */
class MemoryPersistence : public IPersistenceService {
public:
    SentinelResult<IdentityList> load() override {
        ++load_calls;
        if (fail_load) {
            return std::unexpected(SentinelError::FileReadFailed);
        }
        return stored;
    }

    SentinelResult<> save(const IdentityList& identities) override {
        ++save_calls;
        if (fail_save) {
            return std::unexpected(SentinelError::FileWriteFailed);
        }
        stored = identities;
        return {};
    }

    IdentityList stored;
    int load_calls{0};
    int save_calls{0};
    bool fail_load{false};
    bool fail_save{false};
};

/**
 * @brief Observer dataset held in memory
 */
class MemoryObserver : public IObserverService {
public:
    ObserverRecordList records() const override { return dataset; }

    void restore(const ObserverRecordList& records) override {
        ++restore_calls;
        dataset = records;
    }

    ObserverRecordList dataset;
    int restore_calls{0};
};

/**
 * @brief Generator returning "<secret-prefix>-<generation>" codes
 *
 * Safe to call from the ticker's worker threads.
 */
class FakeGenerator : public ICodeGenerator {
public:
    std::string generate(std::string_view secret) const override {
        ++calls;
        return std::string(secret.substr(0, 4)) + "-" + std::to_string(generation.load());
    }

    int remaining() const override { return seconds_left; }

    mutable std::atomic<int> calls{0};
    std::atomic<int> generation{1};
    int seconds_left{17};
};

inline sentinel::IdentityRecord make_record(const std::string& id, const std::string& name,
                                            std::initializer_list<std::string> tags = {}) {
    sentinel::IdentityRecord record;
    record.set_id(id);
    record.set_name(name);
    record.set_secret("JBSWY3DPEHPK3PXP");
    fill_empty_vault(record);
    for (const auto& tag : tags) {
        record.add_tags(tag);
    }
    return record;
}

/**
 * @brief Run the default main context until @p done or @p timeout
 * @return Value of done() when the loop stopped
 */
inline bool pump_until(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    auto context = Glib::MainContext::get_default();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        context->iteration(false);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return done();
}

/// Run the default main context for @p duration
inline void pump_for(std::chrono::milliseconds duration) {
    pump_until([]() { return false; }, duration);
}

}  // namespace Sentinel::Testing

#endif  // SENTINEL_TEST_DOUBLES_H
