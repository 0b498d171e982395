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
#include "PredictionCache.hpp"

#include <utility>

#include "../URL/URLParser.hpp"
#include "../Utils/Logger.hpp"

namespace PhishGuard {
namespace Decision {

nlohmann::json CacheStats::ToJson() const {
    return nlohmann::json{
        { "size", size },
        { "maxSize", maxSize },
        { "hits", hits },
        { "misses", misses },
        { "hitRate", hitRate },
        { "ttlSeconds", ttl.count() }
    };
}

PredictionCache::PredictionCache(size_t maxSize, std::chrono::seconds ttl, Clock clock)
    : m_maxSize(maxSize == 0 ? 1 : maxSize)
    , m_ttl(ttl)
    , m_clock(std::move(clock)) {
}

std::chrono::steady_clock::time_point PredictionCache::Now() const {
    return m_clock ? m_clock() : std::chrono::steady_clock::now();
}

bool PredictionCache::IsExpired(const CacheEntry& entry, std::chrono::steady_clock::time_point now) const noexcept {
    return now - entry.insertedAt > m_ttl;
}

std::optional<Decision> PredictionCache::Get(std::string_view url) {
    const std::string key = URL::URLParser::NormalizeForCache(url);
    const auto now = Now();

    std::lock_guard lock(m_mutex);

    const auto it = m_index.find(key);
    if (it == m_index.end()) {
        ++m_misses;
        return std::nullopt;
    }

    if (IsExpired(it->second->second, now)) {
        m_lruList.erase(it->second);
        m_index.erase(it);
        ++m_misses;
        return std::nullopt;
    }

    // Move to front (LRU)
    m_lruList.splice(m_lruList.begin(), m_lruList, it->second);
    ++m_hits;
    return it->second->second.decision;
}

void PredictionCache::Set(std::string_view url, const Decision& decision) {
    std::string key = URL::URLParser::NormalizeForCache(url);
    const auto now = Now();

    std::lock_guard lock(m_mutex);

    const auto it = m_index.find(key);
    if (it != m_index.end()) {
        it->second->second = CacheEntry{ decision, now };
        m_lruList.splice(m_lruList.begin(), m_lruList, it->second);
        return;
    }

    if (m_index.size() >= m_maxSize && !m_lruList.empty()) {
        m_index.erase(m_lruList.back().first);
        m_lruList.pop_back();
    }

    m_lruList.emplace_front(key, CacheEntry{ decision, now });
    m_index.emplace(std::move(key), m_lruList.begin());
}

void PredictionCache::Clear() {
    std::lock_guard lock(m_mutex);
    m_lruList.clear();
    m_index.clear();
    m_hits = 0;
    m_misses = 0;
}

size_t PredictionCache::Cleanup() {
    const auto now = Now();
    size_t removed = 0;

    std::lock_guard lock(m_mutex);
    for (auto it = m_lruList.begin(); it != m_lruList.end();) {
        if (IsExpired(it->second, now)) {
            m_index.erase(it->first);
            it = m_lruList.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        PG_LOG_DEBUG("Cache", "Removed %zu expired entries", removed);
    }
    return removed;
}

CacheStats PredictionCache::GetStats() const {
    std::lock_guard lock(m_mutex);
    CacheStats stats;
    stats.size = m_index.size();
    stats.maxSize = m_maxSize;
    stats.hits = m_hits;
    stats.misses = m_misses;
    const uint64_t total = m_hits + m_misses;
    stats.hitRate = total ? static_cast<double>(m_hits) / static_cast<double>(total) : 0.0;
    stats.ttl = m_ttl;
    return stats;
}

size_t PredictionCache::Size() const {
    std::lock_guard lock(m_mutex);
    return m_index.size();
}

}  // namespace Decision
}  // namespace PhishGuard
