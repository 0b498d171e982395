/*
 * PhishGuard - Offline Phishing URL Classification Engine
 * Copyright (C) 2026 PhishGuard Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once
/**
 * @file StatsStore.hpp
 * @brief Running decision counters, persisted under the "stats" key.
 *
 * Counters are atomics; recording never takes a lock. Load/Save/Reset go
 * through the key-value store and are expected from a single thread.
 */

#include <atomic>
#include <cstdint>
#include <memory>

#include <nlohmann/json.hpp>

#include "../Core/ErrorCodes.hpp"
#include "KeyValueStore.hpp"

namespace PhishGuard {
namespace Storage {

/**
 * @brief Point-in-time copy of the counters.
 */
struct StatsSnapshot {
    uint64_t totalChecks = 0;
    uint64_t blocked = 0;
    uint64_t warned = 0;
    uint64_t allowed = 0;
    uint64_t cacheHits = 0;
    uint64_t whitelistHits = 0;
    uint64_t errors = 0;
    uint64_t totalLatencyUs = 0;
    uint64_t maxLatencyUs = 0;

    int64_t installDate = 0;    ///< Unix epoch milliseconds
    int64_t lastReset = 0;
    int64_t lastUpdated = 0;

    [[nodiscard]] double AvgLatencyUs() const noexcept;

    /// @brief Share of checks that ended in BLOCK or WARN, in percent
    [[nodiscard]] double DetectionRate() const noexcept;

    /// @brief Share of checks answered from the cache, in percent
    [[nodiscard]] double CacheEfficiency() const noexcept;

    [[nodiscard]] nlohmann::json ToJson() const;
};

class StatsStore {
public:
    /// @param store May be null; then nothing is persisted
    explicit StatsStore(std::shared_ptr<KeyValueStore> store);

    void RecordCheck(uint64_t latencyUs) noexcept;
    void RecordBlocked() noexcept;
    void RecordWarned() noexcept;
    void RecordAllowed() noexcept;
    void RecordCacheHit() noexcept;
    void RecordWhitelistHit() noexcept;
    void RecordError() noexcept;

    [[nodiscard]] StatsSnapshot GetSnapshot() const noexcept;

    /// @brief Restore counters from the store; absent key starts fresh
    [[nodiscard]] bool Load(Core::Error* err = nullptr);

    [[nodiscard]] bool Save(Core::Error* err = nullptr);

    /// @brief Zero all counters (installDate is kept) and persist
    [[nodiscard]] bool Reset(Core::Error* err = nullptr);

    [[nodiscard]] static int64_t NowEpochMs() noexcept;

private:
    std::shared_ptr<KeyValueStore> m_store;

    std::atomic<uint64_t> m_totalChecks{ 0 };
    std::atomic<uint64_t> m_blocked{ 0 };
    std::atomic<uint64_t> m_warned{ 0 };
    std::atomic<uint64_t> m_allowed{ 0 };
    std::atomic<uint64_t> m_cacheHits{ 0 };
    std::atomic<uint64_t> m_whitelistHits{ 0 };
    std::atomic<uint64_t> m_errors{ 0 };
    std::atomic<uint64_t> m_totalLatencyUs{ 0 };
    std::atomic<uint64_t> m_maxLatencyUs{ 0 };

    std::atomic<int64_t> m_installDate{ 0 };
    std::atomic<int64_t> m_lastReset{ 0 };
    std::atomic<int64_t> m_lastUpdated{ 0 };
};

}  // namespace Storage
}  // namespace PhishGuard
