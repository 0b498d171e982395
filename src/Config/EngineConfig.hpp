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
 * PhishGuard - ENGINE CONFIGURATION
 * ============================================================================
 *
 * @file EngineConfig.hpp
 * @brief Typed startup configuration for the decision engine.
 *
 * Document layout (every key optional):
 * @code
 * {
 *   "model":      { "path": "...", "metadataPath": "...", "suspiciousMargin": 0.2 },
 *   "storage":    { "path": "state.json" },
 *   "cache":      { "enabled": true, "maxSize": 1000, "ttlSeconds": 3600 },
 *   "thresholds": { "profile": "balanced", "block": 0.7, "warn": 0.5, "popularDomain": 0.9 },
 *   "popularDomains": [ "google.com", ... ],
 *   "logging":    { "level": "info", "console": true, "file": false, "jsonLines": false,
 *                   "directory": "logs", "async": true }
 * }
 * @endcode
 *
 * Relative paths in a file are resolved against the file's directory.
 * ============================================================================
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../Core/ErrorCodes.hpp"
#include "../Utils/Logger.hpp"

namespace PhishGuard {
namespace Config {

// ============================================================================
// DEFAULTS
// ============================================================================

namespace Defaults {
    inline constexpr int64_t CACHE_MAX_SIZE = 1000;
    inline constexpr int64_t CACHE_TTL_SECONDS = 3600;
    inline constexpr int64_t CACHE_MAX_SIZE_LIMIT = 10'000'000;
    inline constexpr int64_t CACHE_TTL_LIMIT = 30LL * 24 * 3600;
    inline constexpr double BLOCK_THRESHOLD = 0.70;
    inline constexpr double WARN_THRESHOLD = 0.50;
    inline constexpr double POPULAR_DOMAIN_THRESHOLD = 0.90;
    inline constexpr double SUSPICIOUS_MARGIN = 0.20;
    inline constexpr const char* PROFILE = "balanced";
}  // namespace Defaults

/**
 * @brief Cache settings
 *
 * Signed so that negative values in a document are seen and rejected by
 * IsValid() instead of wrapping.
 */
struct CacheSettings {
    bool enabled = true;
    int64_t maxSize = Defaults::CACHE_MAX_SIZE;
    int64_t ttlSeconds = Defaults::CACHE_TTL_SECONDS;
};

/**
 * @brief Initial threshold settings; persisted thresholds override these
 */
struct ThresholdSettings {
    std::string profile = Defaults::PROFILE;
    double block = Defaults::BLOCK_THRESHOLD;
    double warn = Defaults::WARN_THRESHOLD;
    double popularDomain = Defaults::POPULAR_DOMAIN_THRESHOLD;
};

struct EngineConfig {
    std::filesystem::path modelPath;
    std::filesystem::path metadataPath;
    double suspiciousMargin = Defaults::SUSPICIOUS_MARGIN;

    /// @brief JSON file store; empty selects an in-memory store
    std::filesystem::path storagePath;

    CacheSettings cache;
    ThresholdSettings thresholds;

    /// @brief Replaces the built-in popular-domain list when non-empty
    std::vector<std::string> popularDomains;

    Utils::LoggerConfig logging;

    /**
     * @brief Build from a parsed document. Unknown keys are ignored; keys of
     *        the wrong type are InvalidInput.
     */
    [[nodiscard]] static std::optional<EngineConfig> FromJson(const nlohmann::json& doc,
                                                              Core::Error* err = nullptr);

    [[nodiscard]] static std::optional<EngineConfig> LoadFromFile(const std::filesystem::path& path,
                                                                  Core::Error* err = nullptr);

    [[nodiscard]] nlohmann::json ToJson() const;

    /// @brief Range checks: thresholds in [0, 1], warn < block, cache size and TTL in (0, limit]
    [[nodiscard]] bool IsValid(Core::Error* err = nullptr) const;
};

}  // namespace Config
}  // namespace PhishGuard
