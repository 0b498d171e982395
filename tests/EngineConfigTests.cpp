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

#include "TestHelpers.hpp"
#include "Config/EngineConfig.hpp"

using namespace PhishGuard;
using namespace PhishGuard::Config;
using Json = nlohmann::json;

TEST(EngineConfigTest, EmptyDocumentGivesDefaults) {
    const auto cfg = EngineConfig::FromJson(Json::object());
    ASSERT_TRUE(cfg.has_value());
    EXPECT_TRUE(cfg->modelPath.empty());
    EXPECT_TRUE(cfg->storagePath.empty());
    EXPECT_TRUE(cfg->cache.enabled);
    EXPECT_EQ(cfg->cache.maxSize, Defaults::CACHE_MAX_SIZE);
    EXPECT_EQ(cfg->cache.ttlSeconds, Defaults::CACHE_TTL_SECONDS);
    EXPECT_EQ(cfg->thresholds.profile, "balanced");
    EXPECT_DOUBLE_EQ(cfg->thresholds.block, 0.70);
    EXPECT_DOUBLE_EQ(cfg->thresholds.warn, 0.50);
    EXPECT_DOUBLE_EQ(cfg->thresholds.popularDomain, 0.90);
    EXPECT_DOUBLE_EQ(cfg->suspiciousMargin, 0.20);
    EXPECT_TRUE(cfg->popularDomains.empty());
}

TEST(EngineConfigTest, ReadsAllSections) {
    const Json doc = Json::parse(R"({
        "model": { "path": "/m/model.json", "metadataPath": "/m/meta.json", "suspiciousMargin": 0.1 },
        "storage": { "path": "/var/lib/pg/state.json" },
        "cache": { "enabled": false, "maxSize": 10, "ttlSeconds": 60 },
        "thresholds": { "profile": "aggressive", "block": 0.6, "warn": 0.4, "popularDomain": 0.95 },
        "popularDomains": [ " Example.COM ", "corp.local" ],
        "logging": { "level": "error", "console": false, "file": true, "jsonLines": true, "async": false },
        "unknown": 42
    })");

    Core::Error err;
    const auto cfg = EngineConfig::FromJson(doc, &err);
    ASSERT_TRUE(cfg.has_value()) << err.ToString();
    EXPECT_EQ(cfg->modelPath, "/m/model.json");
    EXPECT_EQ(cfg->metadataPath, "/m/meta.json");
    EXPECT_DOUBLE_EQ(cfg->suspiciousMargin, 0.1);
    EXPECT_EQ(cfg->storagePath, "/var/lib/pg/state.json");
    EXPECT_FALSE(cfg->cache.enabled);
    EXPECT_EQ(cfg->cache.maxSize, 10);
    EXPECT_EQ(cfg->cache.ttlSeconds, 60);
    EXPECT_EQ(cfg->thresholds.profile, "aggressive");
    EXPECT_DOUBLE_EQ(cfg->thresholds.block, 0.6);
    ASSERT_EQ(cfg->popularDomains.size(), 2u);
    EXPECT_EQ(cfg->popularDomains[0], "example.com");
    EXPECT_EQ(cfg->logging.minimalLevel, Utils::LogLevel::Error);
    EXPECT_FALSE(cfg->logging.toConsole);
    EXPECT_TRUE(cfg->logging.toFile);
    EXPECT_TRUE(cfg->logging.jsonLines);
    EXPECT_FALSE(cfg->logging.async);
}

TEST(EngineConfigTest, WrongTypesAreInvalidInput) {
    for (const char* text : {
             R"([])",
             R"({"cache": "big"})",
             R"({"cache": {"maxSize": "big"}})",
             R"({"thresholds": {"block": true}})",
             R"({"popularDomains": "google.com"})" }) {
        Core::Error err;
        EXPECT_FALSE(EngineConfig::FromJson(Json::parse(text), &err).has_value()) << text;
        EXPECT_EQ(err.kind, Core::ErrorKind::InvalidInput) << text;
    }
}

TEST(EngineConfigTest, RangeChecks) {
    EngineConfig cfg;
    EXPECT_TRUE(cfg.IsValid());

    cfg.thresholds.block = 1.5;
    EXPECT_FALSE(cfg.IsValid());

    cfg.thresholds.block = 0.5;
    cfg.thresholds.warn = 0.5;
    EXPECT_FALSE(cfg.IsValid());

    cfg.thresholds.warn = 0.3;
    cfg.cache.maxSize = 0;
    Core::Error err;
    EXPECT_FALSE(cfg.IsValid(&err));
    EXPECT_EQ(err.kind, Core::ErrorKind::InvalidInput);

    cfg.cache.maxSize = -5;
    EXPECT_FALSE(cfg.IsValid(&err));
    cfg.cache.maxSize = Defaults::CACHE_MAX_SIZE_LIMIT + 1;
    EXPECT_FALSE(cfg.IsValid(&err));

    cfg.cache.maxSize = 100;
    cfg.cache.ttlSeconds = 0;
    EXPECT_FALSE(cfg.IsValid(&err));
    cfg.cache.ttlSeconds = -1;
    EXPECT_FALSE(cfg.IsValid(&err));
    EXPECT_EQ(err.kind, Core::ErrorKind::InvalidInput);
    cfg.cache.ttlSeconds = Defaults::CACHE_TTL_LIMIT + 1;
    EXPECT_FALSE(cfg.IsValid(&err));

    cfg.cache.ttlSeconds = 60;
    EXPECT_TRUE(cfg.IsValid());

    cfg.cache.maxSize = 0;
    cfg.cache.enabled = false;
    EXPECT_TRUE(cfg.IsValid());
}

TEST(EngineConfigTest, OutOfRangeCacheNumbersAreRejected) {
    for (const char* text : {
             R"({"cache": {"maxSize": -1}})",
             R"({"cache": {"ttlSeconds": -1}})",
             R"({"cache": {"maxSize": 18446744073709551615}})",
             R"({"cache": {"maxSize": 1e30}})",
             R"({"cache": {"ttlSeconds": 4294967296}})",
             R"({"cache": {"maxSize": 2.5}})" }) {
        Core::Error err;
        EXPECT_FALSE(EngineConfig::FromJson(Json::parse(text), &err).has_value()) << text;
        EXPECT_EQ(err.kind, Core::ErrorKind::InvalidInput) << text;
    }
}

TEST(EngineConfigTest, FileRelativePathsResolveAgainstConfigDir) {
    Core::Error err;
    const auto cfg = EngineConfig::LoadFromFile(Testing::DataPath("engine_config.json"), &err);
    ASSERT_TRUE(cfg.has_value()) << err.ToString();

    EXPECT_EQ(cfg->modelPath, Testing::DataPath("test_model.json"));
    EXPECT_EQ(cfg->metadataPath, Testing::DataPath("test_model_metadata.json"));
    EXPECT_EQ(cfg->cache.maxSize, 50);
    EXPECT_EQ(cfg->cache.ttlSeconds, 120);
    EXPECT_EQ(cfg->logging.minimalLevel, Utils::LogLevel::Debug);
}

TEST(EngineConfigTest, MissingFileFails) {
    Core::Error err;
    EXPECT_FALSE(EngineConfig::LoadFromFile(Testing::DataPath("no_such_config.json"), &err).has_value());
    EXPECT_TRUE(err.hasError());
}

TEST(EngineConfigTest, ToJsonReadsBack) {
    EngineConfig cfg;
    cfg.modelPath = "/a/model.json";
    cfg.cache.maxSize = 7;
    cfg.thresholds.profile = "conservative";
    cfg.popularDomains = { "a.com" };

    const auto again = EngineConfig::FromJson(cfg.ToJson());
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->modelPath, cfg.modelPath);
    EXPECT_EQ(again->cache.maxSize, 7);
    EXPECT_EQ(again->thresholds.profile, "conservative");
    EXPECT_EQ(again->popularDomains, cfg.popularDomains);
}
