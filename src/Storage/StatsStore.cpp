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
#include "StatsStore.hpp"

#include <chrono>
#include <utility>

#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

namespace PhishGuard {
namespace Storage {

namespace {

constexpr auto kRelaxed = std::memory_order_relaxed;

void LoadCounter(const nlohmann::json& doc, const char* key, std::atomic<uint64_t>& out) {
    out.store(Utils::JSON::GetOr<uint64_t>(doc, std::string("/") + key, 0), kRelaxed);
}

}  // namespace

// ============================================================================
// StatsSnapshot
// ============================================================================

double StatsSnapshot::AvgLatencyUs() const noexcept {
    return totalChecks ? static_cast<double>(totalLatencyUs) / static_cast<double>(totalChecks) : 0.0;
}

double StatsSnapshot::DetectionRate() const noexcept {
    return totalChecks ? static_cast<double>(blocked + warned) * 100.0 / static_cast<double>(totalChecks) : 0.0;
}

double StatsSnapshot::CacheEfficiency() const noexcept {
    return totalChecks ? static_cast<double>(cacheHits) * 100.0 / static_cast<double>(totalChecks) : 0.0;
}

nlohmann::json StatsSnapshot::ToJson() const {
    return nlohmann::json{
        { "totalChecks", totalChecks },
        { "blocked", blocked },
        { "warned", warned },
        { "allowed", allowed },
        { "cacheHits", cacheHits },
        { "whitelistHits", whitelistHits },
        { "errors", errors },
        { "totalLatencyUs", totalLatencyUs },
        { "avgLatencyUs", AvgLatencyUs() },
        { "maxLatencyUs", maxLatencyUs },
        { "detectionRate", DetectionRate() },
        { "cacheEfficiency", CacheEfficiency() },
        { "installDate", installDate },
        { "lastReset", lastReset },
        { "lastUpdated", lastUpdated }
    };
}

// ============================================================================
// StatsStore
// ============================================================================

StatsStore::StatsStore(std::shared_ptr<KeyValueStore> store)
    : m_store(std::move(store)) {
    const int64_t now = NowEpochMs();
    m_installDate.store(now, kRelaxed);
    m_lastReset.store(now, kRelaxed);
    m_lastUpdated.store(now, kRelaxed);
}

int64_t StatsStore::NowEpochMs() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void StatsStore::RecordCheck(uint64_t latencyUs) noexcept {
    m_totalChecks.fetch_add(1, kRelaxed);
    m_totalLatencyUs.fetch_add(latencyUs, kRelaxed);

    uint64_t currentMax = m_maxLatencyUs.load(kRelaxed);
    while (latencyUs > currentMax &&
           !m_maxLatencyUs.compare_exchange_weak(currentMax, latencyUs, kRelaxed)) {
    }
    m_lastUpdated.store(NowEpochMs(), kRelaxed);
}

void StatsStore::RecordBlocked() noexcept { m_blocked.fetch_add(1, kRelaxed); }
void StatsStore::RecordWarned() noexcept { m_warned.fetch_add(1, kRelaxed); }
void StatsStore::RecordAllowed() noexcept { m_allowed.fetch_add(1, kRelaxed); }
void StatsStore::RecordCacheHit() noexcept { m_cacheHits.fetch_add(1, kRelaxed); }
void StatsStore::RecordWhitelistHit() noexcept { m_whitelistHits.fetch_add(1, kRelaxed); }
void StatsStore::RecordError() noexcept { m_errors.fetch_add(1, kRelaxed); }

StatsSnapshot StatsStore::GetSnapshot() const noexcept {
    StatsSnapshot s;
    s.totalChecks = m_totalChecks.load(kRelaxed);
    s.blocked = m_blocked.load(kRelaxed);
    s.warned = m_warned.load(kRelaxed);
    s.allowed = m_allowed.load(kRelaxed);
    s.cacheHits = m_cacheHits.load(kRelaxed);
    s.whitelistHits = m_whitelistHits.load(kRelaxed);
    s.errors = m_errors.load(kRelaxed);
    s.totalLatencyUs = m_totalLatencyUs.load(kRelaxed);
    s.maxLatencyUs = m_maxLatencyUs.load(kRelaxed);
    s.installDate = m_installDate.load(kRelaxed);
    s.lastReset = m_lastReset.load(kRelaxed);
    s.lastUpdated = m_lastUpdated.load(kRelaxed);
    return s;
}

bool StatsStore::Load(Core::Error* err) {
    if (!m_store) return true;

    const auto doc = m_store->Get(StoreKeys::STATS);
    if (!doc) {
        PG_LOG_DEBUG("Stats", "No persisted statistics, starting fresh");
        return true;
    }
    if (!doc->is_object()) {
        Core::SetError(err, Core::ErrorKind::StorageError, "Persisted statistics are not an object");
        return false;
    }

    LoadCounter(*doc, "totalChecks", m_totalChecks);
    LoadCounter(*doc, "blocked", m_blocked);
    LoadCounter(*doc, "warned", m_warned);
    LoadCounter(*doc, "allowed", m_allowed);
    LoadCounter(*doc, "cacheHits", m_cacheHits);
    LoadCounter(*doc, "whitelistHits", m_whitelistHits);
    LoadCounter(*doc, "errors", m_errors);
    LoadCounter(*doc, "totalLatencyUs", m_totalLatencyUs);
    LoadCounter(*doc, "maxLatencyUs", m_maxLatencyUs);

    const int64_t now = NowEpochMs();
    m_installDate.store(Utils::JSON::GetOr<int64_t>(*doc, "/installDate", now), kRelaxed);
    m_lastReset.store(Utils::JSON::GetOr<int64_t>(*doc, "/lastReset", now), kRelaxed);
    m_lastUpdated.store(Utils::JSON::GetOr<int64_t>(*doc, "/lastUpdated", now), kRelaxed);

    PG_LOG_INFO("Stats", "Loaded statistics: %llu checks",
        static_cast<unsigned long long>(m_totalChecks.load(kRelaxed)));
    return true;
}

bool StatsStore::Save(Core::Error* err) {
    if (!m_store) return true;
    return m_store->Set(StoreKeys::STATS, GetSnapshot().ToJson(), err);
}

bool StatsStore::Reset(Core::Error* err) {
    m_totalChecks.store(0, kRelaxed);
    m_blocked.store(0, kRelaxed);
    m_warned.store(0, kRelaxed);
    m_allowed.store(0, kRelaxed);
    m_cacheHits.store(0, kRelaxed);
    m_whitelistHits.store(0, kRelaxed);
    m_errors.store(0, kRelaxed);
    m_totalLatencyUs.store(0, kRelaxed);
    m_maxLatencyUs.store(0, kRelaxed);

    const int64_t now = NowEpochMs();
    m_lastReset.store(now, kRelaxed);
    m_lastUpdated.store(now, kRelaxed);

    PG_LOG_INFO("Stats", "Statistics reset");
    return Save(err);
}

}  // namespace Storage
}  // namespace PhishGuard
