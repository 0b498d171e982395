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
#include "ThresholdManager.hpp"

#include <mutex>
#include <utility>

#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

namespace PhishGuard {
namespace Decision {

namespace {

bool InUnitRange(double v) noexcept {
    return v >= 0.0 && v <= 1.0;
}

}  // namespace

nlohmann::json ThresholdConfig::ToJson() const {
    return nlohmann::json{
        { "blockThreshold", blockThreshold },
        { "warnThreshold", warnThreshold },
        { "popularDomainThreshold", popularDomainThreshold },
        { "profile", activeProfile }
    };
}

ThresholdManager::ThresholdManager(std::shared_ptr<Storage::KeyValueStore> store, ThresholdConfig initial)
    : m_store(std::move(store))
    , m_config(std::move(initial)) {
}

const std::map<std::string, ThresholdProfile>& ThresholdManager::GetProfiles() {
    static const std::map<std::string, ThresholdProfile> profiles = {
        { "conservative", { 0.85, 0.65, "Fewer false positives, may miss some phishing" } },
        { "balanced",     { 0.70, 0.50, "Recommended balance of detection and accuracy" } },
        { "aggressive",   { 0.50, 0.30, "Maximum detection, more false positives" } }
    };
    return profiles;
}

bool ThresholdManager::Load(Core::Error* err) {
    if (!m_store) return true;

    const auto doc = m_store->Get(Storage::StoreKeys::THRESHOLD_CONFIG);
    if (!doc) {
        return true;
    }
    if (!doc->is_object()) {
        Core::SetError(err, Core::ErrorKind::StorageError, "Persisted thresholds are not an object");
        return false;
    }

    std::unique_lock lock(m_mutex);
    ThresholdConfig loaded = m_config;
    loaded.blockThreshold = Utils::JSON::GetOr<double>(*doc, "/blockThreshold", loaded.blockThreshold);
    loaded.warnThreshold = Utils::JSON::GetOr<double>(*doc, "/warnThreshold", loaded.warnThreshold);
    loaded.popularDomainThreshold =
        Utils::JSON::GetOr<double>(*doc, "/popularDomainThreshold", loaded.popularDomainThreshold);
    loaded.activeProfile = Utils::JSON::GetOr<std::string>(*doc, "/profile", loaded.activeProfile);

    if (!InUnitRange(loaded.blockThreshold) || !InUnitRange(loaded.warnThreshold) ||
        !InUnitRange(loaded.popularDomainThreshold) || !(loaded.warnThreshold < loaded.blockThreshold)) {
        PG_LOG_ERROR("Thresholds", "Persisted thresholds are invalid, keeping block=%.2f warn=%.2f",
            m_config.blockThreshold, m_config.warnThreshold);
        Core::SetError(err, Core::ErrorKind::StorageError, "Persisted thresholds are invalid");
        return false;
    }

    m_config = std::move(loaded);
    PG_LOG_INFO("Thresholds", "Loaded profile '%s' (block=%.2f warn=%.2f)",
        m_config.activeProfile.c_str(), m_config.blockThreshold, m_config.warnThreshold);
    return true;
}

bool ThresholdManager::Save(Core::Error* err) const {
    std::shared_lock lock(m_mutex);
    return SaveLocked(err);
}

bool ThresholdManager::SaveLocked(Core::Error* err) const {
    if (!m_store) return true;
    return m_store->Set(Storage::StoreKeys::THRESHOLD_CONFIG, m_config.ToJson(), err);
}

bool ThresholdManager::SetProfile(std::string_view name, Core::Error* err) {
    const auto& profiles = GetProfiles();
    const auto it = profiles.find(std::string(name));
    if (it == profiles.end()) {
        PG_LOG_WARN("Thresholds", "Unknown profile: %.*s", static_cast<int>(name.size()), name.data());
        Core::SetError(err, Core::ErrorKind::UnknownProfile, "Unknown profile: " + std::string(name));
        return false;
    }

    std::unique_lock lock(m_mutex);
    m_config.blockThreshold = it->second.block;
    m_config.warnThreshold = it->second.warn;
    m_config.activeProfile = it->first;
    PG_LOG_INFO("Thresholds", "Threshold profile set to: %s", it->first.c_str());
    return SaveLocked(err);
}

bool ThresholdManager::SetCustom(double block, double warn, Core::Error* err) {
    if (!InUnitRange(block) || !InUnitRange(warn)) {
        Core::SetError(err, Core::ErrorKind::InvalidInput, "Thresholds must be within [0, 1]");
        return false;
    }
    if (!(warn < block)) {
        Core::SetError(err, Core::ErrorKind::InvalidInput, "Warn threshold must be below block threshold");
        return false;
    }

    std::unique_lock lock(m_mutex);
    m_config.blockThreshold = block;
    m_config.warnThreshold = warn;
    m_config.activeProfile = CUSTOM_PROFILE;
    PG_LOG_INFO("Thresholds", "Custom thresholds: block=%.2f, warn=%.2f", block, warn);
    return SaveLocked(err);
}

bool ThresholdManager::SetPopularDomainThreshold(double value, Core::Error* err) {
    if (!InUnitRange(value)) {
        Core::SetError(err, Core::ErrorKind::InvalidInput, "Popular-domain threshold must be within [0, 1]");
        return false;
    }

    std::unique_lock lock(m_mutex);
    m_config.popularDomainThreshold = value;
    return SaveLocked(err);
}

ThresholdConfig ThresholdManager::GetThresholds() const {
    std::shared_lock lock(m_mutex);
    return m_config;
}

Action ThresholdManager::GetAction(double probability, bool isPopularDomain) const {
    std::shared_lock lock(m_mutex);

    if (isPopularDomain && probability < m_config.popularDomainThreshold) {
        return Action::Allow;
    }
    if (probability >= m_config.blockThreshold) {
        return Action::Block;
    }
    if (probability >= m_config.warnThreshold) {
        return Action::Warn;
    }
    return Action::Allow;
}

}  // namespace Decision
}  // namespace PhishGuard
