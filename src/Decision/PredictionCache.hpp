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
 * ============================================================================
 * PhishGuard - PREDICTION CACHE
 * ============================================================================
 *
 * @file PredictionCache.hpp
 * @brief Bounded LRU of decisions with an absolute TTL.
 *
 * Keys are URLParser::NormalizeForCache(url): protocol://host + path + ?query.
 * An entry is stale once now - insertedAt > ttl; a stale entry is evicted
 * when touched by Get() or swept by Cleanup(). Entries are replaced, never
 * mutated in place.
 *
 * Time comes from an injectable clock so expiry is testable without sleeping.
 * ============================================================================
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "Decision.hpp"

namespace PhishGuard {
namespace Decision {

inline constexpr size_t DEFAULT_CACHE_SIZE = 1000;
inline constexpr std::chrono::seconds DEFAULT_CACHE_TTL{ 3600 };

struct CacheStats {
    size_t size = 0;
    size_t maxSize = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hitRate = 0.0;              ///< hits / (hits + misses), 0 when idle
    std::chrono::seconds ttl{ 0 };

    [[nodiscard]] nlohmann::json ToJson() const;
};

class PredictionCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit PredictionCache(size_t maxSize = DEFAULT_CACHE_SIZE,
                             std::chrono::seconds ttl = DEFAULT_CACHE_TTL,
                             Clock clock = {});

    PredictionCache(const PredictionCache&) = delete;
    PredictionCache& operator=(const PredictionCache&) = delete;

    /// @brief Stored decision, or std::nullopt when absent or expired
    [[nodiscard]] std::optional<Decision> Get(std::string_view url);

    /// @brief Insert or replace; evicts the least recently used entry when full
    void Set(std::string_view url, const Decision& decision);

    /// @brief Empty the cache and reset hit/miss counters
    void Clear();

    /// @brief Remove expired entries
    /// @return Number of entries removed
    size_t Cleanup();

    [[nodiscard]] CacheStats GetStats() const;

    [[nodiscard]] size_t Size() const;

private:
    struct CacheEntry {
        Decision decision;
        std::chrono::steady_clock::time_point insertedAt;
    };

    using LruList = std::list<std::pair<std::string, CacheEntry>>;

    [[nodiscard]] std::chrono::steady_clock::time_point Now() const;
    [[nodiscard]] bool IsExpired(const CacheEntry& entry, std::chrono::steady_clock::time_point now) const noexcept;

    const size_t m_maxSize;
    const std::chrono::seconds m_ttl;
    Clock m_clock;

    mutable std::mutex m_mutex;
    LruList m_lruList;     ///< Front = most recently used
    std::unordered_map<std::string, LruList::iterator> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
};

}  // namespace Decision
}  // namespace PhishGuard
