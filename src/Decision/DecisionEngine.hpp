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
 * PhishGuard - DECISION ENGINE
 * ============================================================================
 *
 * @file DecisionEngine.hpp
 * @brief Sole entry point: URL in, verdict out.
 *
 * PIPELINE (strict order):
 * ========================
 * 1. Whitelist          -> ALLOW / SAFE / "whitelisted"
 * 2. Prediction cache   -> stored decision, cached = true
 * 3. Feature extraction -> ParseError on failure
 * 4. Model prediction
 * 5. Popular-domain check ("popular_domain_check" vs "ml_prediction")
 * 6. Threshold policy   -> action; decision cached and returned
 *
 * Any failure, including an escaped exception, yields the fail-open
 * decision ALLOW / UNKNOWN / "error". Decide() never throws and never
 * blocks on error.
 *
 * Initialization errors (model load, model format, feature contract) leave
 * the engine in EngineStatus::Error; Decide() then fails open with
 * NotInitialized.
 * ============================================================================
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../Config/EngineConfig.hpp"
#include "../Core/ErrorCodes.hpp"
#include "../Model/ModelLoader.hpp"
#include "../Model/TreeEnsemble.hpp"
#include "../Storage/KeyValueStore.hpp"
#include "../Storage/StatsStore.hpp"
#include "Decision.hpp"
#include "PredictionCache.hpp"
#include "ThresholdManager.hpp"
#include "Whitelist.hpp"

namespace PhishGuard {
namespace Decision {

class DecisionEngineImpl;

enum class EngineStatus : uint8_t {
    Uninitialized = 0,
    Ready,
    Error
};

[[nodiscard]] std::string_view GetEngineStatusName(EngineStatus status) noexcept;

/**
 * @brief Aggregated engine state for dashboards and the CLI.
 */
struct EngineStatistics {
    EngineStatus status = EngineStatus::Uninitialized;
    CacheStats cache;
    bool cacheEnabled = true;
    WhitelistStats whitelist;
    ThresholdConfig thresholds;
    Storage::StatsSnapshot counters;
    nlohmann::json model;

    [[nodiscard]] nlohmann::json ToJson() const;
};

/// @brief Built-in popular-domain list
[[nodiscard]] const std::vector<std::string>& GetDefaultPopularDomains();

class DecisionEngine final {
public:
    /**
     * @param config Paths, cache and threshold settings
     * @param store  State back end; when null one is created from
     *               config.storagePath (JSON file) or in memory
     * @param clock  Cache clock override
     */
    explicit DecisionEngine(Config::EngineConfig config,
                            std::shared_ptr<Storage::KeyValueStore> store = nullptr,
                            PredictionCache::Clock clock = {});
    ~DecisionEngine();

    DecisionEngine(const DecisionEngine&) = delete;
    DecisionEngine& operator=(const DecisionEngine&) = delete;

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    /**
     * @brief Load model and metadata from the configured paths, validate the
     *        feature contract and restore persisted state.
     */
    [[nodiscard]] bool Initialize(Core::Error* err = nullptr);

    /// @brief Same, with an already loaded model
    [[nodiscard]] bool Initialize(std::shared_ptr<const Model::TreeEnsembleModel> model,
                                  Model::ModelMetadata metadata,
                                  Core::Error* err = nullptr);

    [[nodiscard]] EngineStatus GetStatus() const noexcept;

    [[nodiscard]] bool IsReady() const noexcept;

    // ========================================================================
    // DECISIONS
    // ========================================================================

    [[nodiscard]] Decision Decide(std::string_view url);

    [[nodiscard]] std::vector<Decision> DecideBatch(const std::vector<std::string>& urls);

    /// @brief Host equal to, or a subdomain of, a popular-domain entry
    [[nodiscard]] bool IsPopularDomain(std::string_view url) const;

    // ========================================================================
    // COMPONENTS
    // ========================================================================

    [[nodiscard]] Whitelist& GetWhitelist() noexcept;
    [[nodiscard]] ThresholdManager& GetThresholdManager() noexcept;

    /// @brief nullptr when caching is disabled
    [[nodiscard]] PredictionCache* GetCache() noexcept;

    // ========================================================================
    // MAINTENANCE
    // ========================================================================

    [[nodiscard]] EngineStatistics GetStatistics() const;

    /// @brief Sweep expired cache entries
    size_t Cleanup();

    /// @brief Persist whitelist, thresholds and counters, then flush the store
    [[nodiscard]] bool Save(Core::Error* err = nullptr);

    /// @brief Clear the cache
    void Reset();

    [[nodiscard]] bool ResetStatistics(Core::Error* err = nullptr);

private:
    std::unique_ptr<DecisionEngineImpl> m_impl;
};

}  // namespace Decision
}  // namespace PhishGuard
