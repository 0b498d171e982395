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
 * PhishGuard - THRESHOLD MANAGER
 * ============================================================================
 *
 * @file ThresholdManager.hpp
 * @brief Probability -> action policy with named sensitivity profiles.
 *
 * PROFILES:
 *   conservative  block 0.85  warn 0.65
 *   balanced      block 0.70  warn 0.50   (default)
 *   aggressive    block 0.50  warn 0.30
 *
 * Popular domains must reach popularDomainThreshold (0.90 by default)
 * before any non-ALLOW action is considered.
 *
 * State is persisted under "thresholdConfig" on every change.
 * ============================================================================
 */

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../Core/ErrorCodes.hpp"
#include "../Storage/KeyValueStore.hpp"
#include "Decision.hpp"

namespace PhishGuard {
namespace Decision {

inline constexpr const char* CUSTOM_PROFILE = "custom";

struct ThresholdProfile {
    double block = 0.0;
    double warn = 0.0;
    std::string description;
};

struct ThresholdConfig {
    double blockThreshold = 0.70;
    double warnThreshold = 0.50;
    double popularDomainThreshold = 0.90;
    std::string activeProfile = "balanced";

    [[nodiscard]] nlohmann::json ToJson() const;
};

class ThresholdManager {
public:
    /// @param store May be null; then nothing is persisted
    explicit ThresholdManager(std::shared_ptr<Storage::KeyValueStore> store,
                              ThresholdConfig initial = {});

    ThresholdManager(const ThresholdManager&) = delete;
    ThresholdManager& operator=(const ThresholdManager&) = delete;

    /// @brief Overlay persisted values; invalid persisted values are ignored with StorageError
    [[nodiscard]] bool Load(Core::Error* err = nullptr);

    [[nodiscard]] bool Save(Core::Error* err = nullptr) const;

    /// @brief UnknownProfile leaves state unchanged
    [[nodiscard]] bool SetProfile(std::string_view name, Core::Error* err = nullptr);

    /// @brief Both in [0, 1] and warn < block, else InvalidInput. Profile becomes "custom".
    [[nodiscard]] bool SetCustom(double block, double warn, Core::Error* err = nullptr);

    [[nodiscard]] bool SetPopularDomainThreshold(double value, Core::Error* err = nullptr);

    [[nodiscard]] ThresholdConfig GetThresholds() const;

    [[nodiscard]] static const std::map<std::string, ThresholdProfile>& GetProfiles();

    /**
     * @brief Map a probability to an action.
     *
     * Popular domains below popularDomainThreshold are always ALLOW.
     * Otherwise p >= block is BLOCK, p >= warn is WARN, else ALLOW.
     */
    [[nodiscard]] Action GetAction(double probability, bool isPopularDomain = false) const;

private:
    [[nodiscard]] bool SaveLocked(Core::Error* err) const;

    std::shared_ptr<Storage::KeyValueStore> m_store;

    mutable std::shared_mutex m_mutex;
    ThresholdConfig m_config;
};

}  // namespace Decision
}  // namespace PhishGuard
