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
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

#include "TestHelpers.hpp"
#include "Decision/Whitelist.hpp"

using namespace PhishGuard;
using PhishGuard::Decision::Whitelist;
using Storage::MemoryKeyValueStore;
using Storage::StoreKeys::WHITELIST;

TEST(WhitelistTest, UrlAndDomainFormsAreEquivalent) {
    Whitelist wl(nullptr);
    ASSERT_TRUE(wl.Load());
    ASSERT_TRUE(wl.Add("https://Example.com/some/page?x=1"));

    EXPECT_TRUE(wl.IsWhitelisted("example.com"));
    EXPECT_TRUE(wl.IsWhitelisted("http://example.com/other"));
    ASSERT_EQ(wl.GetAll().size(), 1u);
    EXPECT_EQ(wl.GetAll()[0], "example.com");

    // Adding again does not duplicate
    ASSERT_TRUE(wl.Add("example.com"));
    EXPECT_EQ(wl.GetStats().count, 1u);
}

TEST(WhitelistTest, SubdomainsOfEntryMatch) {
    Whitelist wl(nullptr);
    ASSERT_TRUE(wl.Add("example.com"));

    EXPECT_TRUE(wl.IsWhitelisted("https://mail.example.com/inbox"));
    EXPECT_TRUE(wl.IsWhitelisted("a.b.example.com"));
    EXPECT_FALSE(wl.IsWhitelisted("badexample.com"));
    EXPECT_FALSE(wl.IsWhitelisted("example.com.evil.net"));
    EXPECT_FALSE(wl.IsWhitelisted("example.org"));
}

TEST(WhitelistTest, SubdomainEntryDoesNotCoverParent) {
    Whitelist wl(nullptr);
    ASSERT_TRUE(wl.Add("shop.example.com"));

    EXPECT_TRUE(wl.IsWhitelisted("shop.example.com"));
    EXPECT_FALSE(wl.IsWhitelisted("example.com"));
    EXPECT_FALSE(wl.IsWhitelisted("other.example.com"));
}

TEST(WhitelistTest, InvalidInputIsRejected) {
    Whitelist wl(nullptr);
    Core::Error err;
    EXPECT_FALSE(wl.Add("http://", &err));
    EXPECT_EQ(err.kind, Core::ErrorKind::ParseError);
    EXPECT_FALSE(wl.Add(""));
    EXPECT_FALSE(wl.IsWhitelisted(""));
    EXPECT_TRUE(wl.GetAll().empty());
}

TEST(WhitelistTest, RemoveAndClear) {
    Whitelist wl(nullptr);
    ASSERT_TRUE(wl.Add("a.com"));
    ASSERT_TRUE(wl.Add("b.com"));

    EXPECT_TRUE(wl.Remove("https://a.com/x"));
    EXPECT_FALSE(wl.Remove("a.com"));
    EXPECT_FALSE(wl.IsWhitelisted("a.com"));

    ASSERT_TRUE(wl.Clear());
    EXPECT_FALSE(wl.IsWhitelisted("b.com"));
}

TEST(WhitelistTest, GetAllIsSorted) {
    Whitelist wl(nullptr);
    ASSERT_TRUE(wl.Add("zeta.com"));
    ASSERT_TRUE(wl.Add("alpha.com"));
    ASSERT_TRUE(wl.Add("mid.org"));
    EXPECT_EQ(wl.GetAll(), (std::vector<std::string>{ "alpha.com", "mid.org", "zeta.com" }));
}

TEST(WhitelistTest, PersistsThroughStore) {
    auto kv = std::make_shared<MemoryKeyValueStore>();
    {
        Whitelist wl(kv);
        ASSERT_TRUE(wl.Load());
        ASSERT_TRUE(wl.Add("bank.example"));
        ASSERT_TRUE(wl.Add("intranet.local"));
    }

    const auto stored = kv->Get(WHITELIST);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->size(), 2u);

    Whitelist reloaded(kv);
    EXPECT_FALSE(reloaded.GetStats().loaded);
    ASSERT_TRUE(reloaded.Load());
    EXPECT_TRUE(reloaded.GetStats().loaded);
    EXPECT_TRUE(reloaded.IsWhitelisted("https://bank.example/login"));
}

TEST(WhitelistTest, LoadSkipsInvalidEntries) {
    auto kv = std::make_shared<MemoryKeyValueStore>();
    ASSERT_TRUE(kv->Set(WHITELIST, nlohmann::json::array({ "good.com", 42, "http://", "HTTPS://Upper.com" })));

    Whitelist wl(kv);
    ASSERT_TRUE(wl.Load());
    EXPECT_TRUE(wl.IsWhitelisted("good.com"));
    EXPECT_EQ(wl.GetStats().count, 2u);
}

TEST(WhitelistTest, NonArrayIsStorageError) {
    auto kv = std::make_shared<MemoryKeyValueStore>();
    ASSERT_TRUE(kv->Set(WHITELIST, nlohmann::json{ { "a", 1 } }));

    Whitelist wl(kv);
    Core::Error err;
    EXPECT_FALSE(wl.Load(&err));
    EXPECT_EQ(err.kind, Core::ErrorKind::StorageError);
    EXPECT_TRUE(wl.GetAll().empty());
}

TEST(WhitelistTest, FailedPersistKeepsInMemoryEntry) {
    Testing::TempDir dir;
    {
        std::ofstream out(dir / "blocker");
        out << "x";
    }
    auto kv = std::make_shared<Storage::JsonFileKeyValueStore>(dir.Path() / "blocker" / "state.json");
    ASSERT_TRUE(kv->Open());

    Whitelist wl(kv);
    ASSERT_TRUE(wl.Load());
    Core::Error err;
    EXPECT_FALSE(wl.Add("example.com", &err));
    EXPECT_EQ(err.kind, Core::ErrorKind::StorageError);
    EXPECT_TRUE(wl.IsWhitelisted("example.com"));
}

TEST(WhitelistTest, WritesProjectedHostsToStore) {
    using ::testing::_;
    using ::testing::Return;

    auto kv = std::make_shared<::testing::StrictMock<Testing::MockKeyValueStore>>();
    EXPECT_CALL(*kv, Get(WHITELIST)).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*kv, Set(WHITELIST, nlohmann::json::array({ "example.com" }), _)).WillOnce(Return(true));
    EXPECT_CALL(*kv, Set(WHITELIST, nlohmann::json::array({ "example.com", "mail.test" }), _))
        .WillOnce(Testing::FailWithStorageError("disk full"));

    Whitelist wl(kv);
    ASSERT_TRUE(wl.Load());
    ASSERT_TRUE(wl.Add("https://Example.com/login"));

    Core::Error err;
    EXPECT_FALSE(wl.Add("MAIL.test", &err));
    EXPECT_EQ(err.kind, Core::ErrorKind::StorageError);
    EXPECT_EQ(err.message, "disk full");
}
