// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// CodeTicker.h - Periodic regeneration of every identity's current code

#pragma once

#include "../repositories/IIdentityRepository.h"
#include "../services/ICodeGenerator.h"
#include <glibmm/main.h>
#include <sigc++/sigc++.h>
#include <cstdint>
#include <map>
#include <string>

namespace Sentinel {

/**
 * @brief Regenerates all codes once per second and publishes them as one batch
 *
 * Each tick reads remaining() once, then generates the code of every
 * identity concurrently (one task per identity). Results are published
 * through signal_codes_updated() only after the whole batch is complete,
 * so listeners never see a mix of old and new codes.
 *
 * Usage Example:
 * @code
 * CodeTicker ticker(&repository, &generator);
 * ticker.signal_codes_updated().connect(
 *     [](const CodeTicker::CodeMap& codes, int remaining) {
 *         // redraw
 *     });
 * ticker.start();
 * @endcode
 *
 * Thread Safety:
 * - start(), stop() and tick() run on the main context thread
 * - ICodeGenerator::generate() is called from worker threads and must be
 *   safe to call concurrently
 */
class CodeTicker {
public:
    /// Tick period
    static constexpr unsigned int TICK_INTERVAL_MS = 1000;

    /// Identity id -> current code
    using CodeMap = std::map<std::string, std::string>;

    /**
     * @throws std::invalid_argument if either pointer is null
     */
    CodeTicker(IIdentityRepository* repository, const ICodeGenerator* generator);

    /// Stops the timer
    ~CodeTicker();

    // Non-copyable, non-movable (timer callback is bound to this)
    CodeTicker(const CodeTicker&) = delete;
    CodeTicker& operator=(const CodeTicker&) = delete;
    CodeTicker(CodeTicker&&) = delete;
    CodeTicker& operator=(CodeTicker&&) = delete;

    /**
     * @brief Run one tick immediately, then every TICK_INTERVAL_MS
     *
     * Restarts the schedule if already running.
     */
    void start();

    void stop();

    [[nodiscard]] bool is_running() const noexcept { return m_tick_connection.connected(); }

    /**
     * @brief Generate and publish one batch now
     */
    void tick();

    /// Codes from the last completed batch
    [[nodiscard]] const CodeMap& codes() const noexcept { return m_codes; }

    /// Seconds remaining as of the last completed batch
    [[nodiscard]] int remaining() const noexcept { return m_remaining; }

    /// Number of completed batches
    [[nodiscard]] uint64_t batch_count() const noexcept { return m_batches; }

    /**
     * @brief Signal emitted once per completed batch
     *
     * Signal Signature: void(const CodeMap& codes, int remaining_seconds)
     */
    [[nodiscard]] sigc::signal<void(const CodeMap&, int)>& signal_codes_updated() {
        return m_signal_codes_updated;
    }

private:
    bool on_tick();

    IIdentityRepository* m_repository;   ///< Non-owning
    const ICodeGenerator* m_generator;   ///< Non-owning

    CodeMap m_codes;
    int m_remaining{0};
    uint64_t m_batches{0};

    sigc::connection m_tick_connection;
    sigc::signal<void(const CodeMap&, int)> m_signal_codes_updated;
};

}  // namespace Sentinel
