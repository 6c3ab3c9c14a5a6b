// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// CodeTicker.cc - Implementation of the code ticker

#include "CodeTicker.h"
#include "../../utils/Log.h"
#include <future>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Sentinel {

CodeTicker::CodeTicker(IIdentityRepository* repository, const ICodeGenerator* generator)
    : m_repository(repository),
      m_generator(generator) {
    if (!m_repository) {
        throw std::invalid_argument("CodeTicker: repository cannot be null");
    }
    if (!m_generator) {
        throw std::invalid_argument("CodeTicker: generator cannot be null");
    }
}

CodeTicker::~CodeTicker() {
    stop();
}

void CodeTicker::start() {
    stop();
    tick();
    m_tick_connection = Glib::signal_timeout().connect(
        sigc::mem_fun(*this, &CodeTicker::on_tick),
        TICK_INTERVAL_MS);
    Log::debug("CodeTicker: started");
}

void CodeTicker::stop() {
    if (m_tick_connection.connected()) {
        m_tick_connection.disconnect();
        Log::debug("CodeTicker: stopped");
    }
}

void CodeTicker::tick() {
    const int remaining = m_generator->remaining();
    const auto identities = m_repository->get_all();

    std::vector<std::pair<std::string, std::future<std::string>>> pending;
    pending.reserve(identities.size());
    for (const auto& identity : identities) {
        pending.emplace_back(identity.id(),
            std::async(std::launch::async,
                [generator = m_generator, secret = identity.secret()]() {
                    return generator->generate(secret);
                }));
    }

    CodeMap batch;
    for (auto& [id, future] : pending) {
        try {
            batch[id] = future.get();
        } catch (const std::exception& e) {
            Log::error("CodeTicker: code generation for {} failed: {}", id, e.what());
            batch[id] = "000000";
        }
    }

    // Publish the complete batch in one step
    m_codes = std::move(batch);
    m_remaining = remaining;
    ++m_batches;
    m_signal_codes_updated.emit(m_codes, m_remaining);
}

bool CodeTicker::on_tick() {
    tick();
    return true;  // Keep ticking
}

}  // namespace Sentinel
