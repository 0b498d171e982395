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
#include <gtest/gtest.h>

#include "Storage/StatsStore.hpp"

using namespace PhishGuard;
using namespace PhishGuard::Storage;

TEST(StatsStoreTest, CountersAndDerivedRates) {
    StatsStore stats(nullptr);
    stats.RecordCheck(100);
    stats.RecordBlocked();
    stats.RecordCheck(300);
    stats.RecordWarned();
    stats.RecordCheck(200);
    stats.RecordAllowed();
    stats.RecordCheck(0);
    stats.RecordAllowed();
    stats.RecordCacheHit();
    stats.RecordWhitelistHit();
    stats.RecordError();

    const auto s = stats.GetSnapshot();
    EXPECT_EQ(s.totalChecks, 4u);
    EXPECT_EQ(s.blocked, 1u);
    EXPECT_EQ(s.warned, 1u);
    EXPECT_EQ(s.allowed, 2u);
    EXPECT_EQ(s.cacheHits, 1u);
    EXPECT_EQ(s.whitelistHits, 1u);
    EXPECT_EQ(s.errors, 1u);
    EXPECT_EQ(s.totalLatencyUs, 600u);
    EXPECT_EQ(s.maxLatencyUs, 300u);
    EXPECT_DOUBLE_EQ(s.AvgLatencyUs(), 150.0);
    EXPECT_DOUBLE_EQ(s.DetectionRate(), 50.0);
    EXPECT_DOUBLE_EQ(s.CacheEfficiency(), 25.0);
}

TEST(StatsStoreTest, EmptyRatesAreZero) {
    StatsSnapshot s;
    EXPECT_EQ(s.AvgLatencyUs(), 0.0);
    EXPECT_EQ(s.DetectionRate(), 0.0);
    EXPECT_EQ(s.CacheEfficiency(), 0.0);
}

TEST(StatsStoreTest, PersistAndRestore) {
    auto kv = std::make_shared<MemoryKeyValueStore>();
    {
        StatsStore stats(kv);
        ASSERT_TRUE(stats.Load());
        stats.RecordCheck(50);
        stats.RecordBlocked();
        ASSERT_TRUE(stats.Save());
    }

    const auto doc = kv->Get(StoreKeys::STATS);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ((*doc)["totalChecks"], 1);
    EXPECT_EQ((*doc)["blocked"], 1);

    StatsStore restored(kv);
    ASSERT_TRUE(restored.Load());
    const auto s = restored.GetSnapshot();
    EXPECT_EQ(s.totalChecks, 1u);
    EXPECT_EQ(s.blocked, 1u);
    EXPECT_EQ(s.maxLatencyUs, 50u);
    EXPECT_EQ(s.installDate, (*doc)["installDate"].get<int64_t>());
}

TEST(StatsStoreTest, ResetKeepsInstallDate) {
    auto kv = std::make_shared<MemoryKeyValueStore>();
    ASSERT_TRUE(kv->Set(StoreKeys::STATS, nlohmann::json{
        { "totalChecks", 10 }, { "blocked", 4 }, { "installDate", 1234 }, { "lastReset", 1234 } }));

    StatsStore stats(kv);
    ASSERT_TRUE(stats.Load());
    EXPECT_EQ(stats.GetSnapshot().totalChecks, 10u);

    ASSERT_TRUE(stats.Reset());
    const auto s = stats.GetSnapshot();
    EXPECT_EQ(s.totalChecks, 0u);
    EXPECT_EQ(s.blocked, 0u);
    EXPECT_EQ(s.installDate, 1234);
    EXPECT_GT(s.lastReset, 1234);
    EXPECT_EQ((*kv->Get(StoreKeys::STATS))["totalChecks"], 0);
}

TEST(StatsStoreTest, MalformedPersistedStats) {
    auto kv = std::make_shared<MemoryKeyValueStore>();
    ASSERT_TRUE(kv->Set(StoreKeys::STATS, "garbage"));

    StatsStore stats(kv);
    Core::Error err;
    EXPECT_FALSE(stats.Load(&err));
    EXPECT_EQ(err.kind, Core::ErrorKind::StorageError);

    ASSERT_TRUE(kv->Set(StoreKeys::STATS, nlohmann::json{ { "totalChecks", "many" }, { "errors", 2 } }));
    ASSERT_TRUE(stats.Load());
    EXPECT_EQ(stats.GetSnapshot().totalChecks, 0u);
    EXPECT_EQ(stats.GetSnapshot().errors, 2u);
}

TEST(StatsStoreTest, SummaryJsonFields) {
    StatsStore stats(nullptr);
    stats.RecordCheck(10);
    const auto j = stats.GetSnapshot().ToJson();
    for (const char* key : { "totalChecks", "blocked", "warned", "allowed", "cacheHits", "whitelistHits",
                             "errors", "avgLatencyUs", "maxLatencyUs", "detectionRate",
                             "cacheEfficiency", "installDate", "lastReset", "lastUpdated" }) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
}
