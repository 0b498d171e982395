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
#include "DecisionEngine.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <utility>

#include "../Features/FeatureExtractor.hpp"
#include "../Model/Predictor.hpp"
#include "../URL/URLParser.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace PhishGuard {
namespace Decision {

using SteadyClock = std::chrono::steady_clock;

std::string_view GetEngineStatusName(EngineStatus status) noexcept {
    switch (status) {
        case EngineStatus::Ready:         return "Ready";
        case EngineStatus::Error:         return "Error";
        case EngineStatus::Uninitialized:
        default:                          return "Uninitialized";
    }
}

nlohmann::json EngineStatistics::ToJson() const {
    nlohmann::json j{
        { "status", std::string(GetEngineStatusName(status)) },
        { "cacheEnabled", cacheEnabled },
        { "whitelist", whitelist.ToJson() },
        { "thresholds", thresholds.ToJson() },
        { "counters", counters.ToJson() },
        { "model", model }
    };
    j["cache"] = cacheEnabled ? cache.ToJson() : nlohmann::json(nullptr);
    return j;
}

const std::vector<std::string>& GetDefaultPopularDomains() {
    static const std::vector<std::string> domains = {
        "google.com", "youtube.com", "facebook.com", "twitter.com", "instagram.com",
        "linkedin.com", "reddit.com", "amazon.com", "wikipedia.org", "netflix.com",
        "microsoft.com", "apple.com", "github.com", "stackoverflow.com", "medium.com"
    };
    return domains;
}

// ============================================================================
// IMPLEMENTATION
// ============================================================================

class DecisionEngineImpl {
public:
    DecisionEngineImpl(Config::EngineConfig config, std::shared_ptr<Storage::KeyValueStore> store,
                       PredictionCache::Clock clock)
        : m_config(std::move(config)) {
        if (store) {
            m_store = std::move(store);
        } else if (!m_config.storagePath.empty()) {
            m_fileStore = std::make_shared<Storage::JsonFileKeyValueStore>(m_config.storagePath);
            m_store = m_fileStore;
        } else {
            m_store = std::make_shared<Storage::MemoryKeyValueStore>();
        }

        if (m_config.cache.enabled) {
            m_cache = std::make_unique<PredictionCache>(
                static_cast<size_t>(m_config.cache.maxSize), std::chrono::seconds(m_config.cache.ttlSeconds),
                std::move(clock));
        }

        ThresholdConfig initial;
        initial.blockThreshold = m_config.thresholds.block;
        initial.warnThreshold = m_config.thresholds.warn;
        initial.popularDomainThreshold = m_config.thresholds.popularDomain;
        initial.activeProfile = m_config.thresholds.profile;

        // A named profile owns its block/warn pair; explicit values apply to "custom"
        const auto& profiles = ThresholdManager::GetProfiles();
        if (const auto it = profiles.find(initial.activeProfile); it != profiles.end()) {
            initial.blockThreshold = it->second.block;
            initial.warnThreshold = it->second.warn;
        } else if (initial.activeProfile != CUSTOM_PROFILE) {
            PG_LOG_WARN("Engine", "Unknown threshold profile '%s' in configuration, using custom values",
                initial.activeProfile.c_str());
            initial.activeProfile = CUSTOM_PROFILE;
        }

        m_whitelist = std::make_unique<Whitelist>(m_store);
        m_thresholds = std::make_unique<ThresholdManager>(m_store, initial);
        m_stats = std::make_unique<Storage::StatsStore>(m_store);

        m_popularDomains = m_config.popularDomains.empty() ? GetDefaultPopularDomains() : m_config.popularDomains;
    }

    bool Initialize(Core::Error* err) {
        PG_LOG_SCOPE("Engine");

        Core::Error localErr;
        Core::Error* e = err ? err : &localErr;

        auto model = Model::ModelLoader::LoadModelFromFile(m_config.modelPath, e);
        if (!model) {
            return Fail(*e);
        }
        auto metadata = Model::ModelLoader::LoadMetadataFromFile(m_config.metadataPath, e);
        if (!metadata) {
            return Fail(*e);
        }
        return Initialize(std::move(model), std::move(*metadata), e);
    }

    bool Initialize(std::shared_ptr<const Model::TreeEnsembleModel> model, Model::ModelMetadata metadata,
                    Core::Error* err) {
        Core::Error localErr;
        Core::Error* e = err ? err : &localErr;

        if (!model) {
            Core::SetError(e, Core::ErrorKind::ModelLoadError, "No model supplied");
            return Fail(*e);
        }
        if (!Model::ModelLoader::ValidateFeatureContract(*model, metadata, e)) {
            return Fail(*e);
        }

        LoadPersistentState();

        PG_LOG_INFO("Engine", "Model version '%s': %zu trees, threshold %.2f",
            metadata.version.c_str(), model->GetNumTrees(), metadata.recommendedThreshold);

        m_predictor = std::make_unique<Model::Predictor>(std::move(model), std::move(metadata),
                                                         m_config.suspiciousMargin);
        m_status.store(EngineStatus::Ready, std::memory_order_release);
        PG_LOG_INFO("Engine", "Decision engine initialized");
        return true;
    }

    Decision Decide(std::string_view url) {
        const auto start = SteadyClock::now();

        try {
            if (m_status.load(std::memory_order_acquire) != EngineStatus::Ready) {
                return FailOpen(url, start, Core::Error{ Core::ErrorKind::NotInitialized,
                                                         "Decision engine is not initialized" });
            }

            // 1. Whitelist
            if (m_whitelist->IsWhitelisted(url)) {
                Decision d;
                d.url = std::string(url);
                d.action = Action::Allow;
                d.level = Model::RiskLevel::Safe;
                d.probability = 0.0;
                d.confidence = 1.0;
                d.reason = Reasons::WHITELISTED;
                Finish(d, start);
                m_stats->RecordWhitelistHit();
                Record(d);
                return d;
            }

            // 2. Cache
            if (m_cache) {
                if (auto cached = m_cache->Get(url)) {
                    cached->cached = true;
                    cached->latencyUs = ElapsedUs(start);
                    m_stats->RecordCacheHit();
                    Record(*cached);
                    return std::move(*cached);
                }
            }

            // 3. Features
            Core::Error err;
            auto features = Features::FeatureExtractor::Extract(url, &err);
            if (!features) {
                if (!err.hasError()) {
                    Core::SetError(&err, Core::ErrorKind::ParseError, "Failed to extract features");
                }
                return FailOpen(url, start, err);
            }

            const auto vector = Features::FeatureExtractor::ToArray(*features);

            // 4. Prediction
            const auto prediction = m_predictor->PredictWithConfidence(vector, &err);
            if (!prediction) {
                return FailOpen(url, start, err);
            }

            // 5. Popular domain
            const bool popular = IsPopularDomain(url);

            // 6. Policy
            Decision d;
            d.url = std::string(url);
            d.action = m_thresholds->GetAction(prediction->probability, popular);
            d.level = prediction->level;
            d.probability = prediction->probability;
            d.confidence = prediction->confidence;
            d.reason = popular ? Reasons::POPULAR_DOMAIN : Reasons::ML_PREDICTION;
            d.features = std::move(*features);
            Finish(d, start);

            if (m_cache) {
                m_cache->Set(url, d);
            }
            Record(d);

            PG_LOG_DEBUG("Engine", "%s -> %s (p=%.4f, %s)", d.url.c_str(),
                std::string(GetActionName(d.action)).c_str(), *d.probability, d.reason.c_str());
            return d;
        }
        catch (const std::exception& ex) {
            return FailOpen(url, start, Core::Error{ Core::ErrorKind::Internal, ex.what() });
        }
        catch (...) {
            return FailOpen(url, start, Core::Error{ Core::ErrorKind::Internal, "Unknown exception" });
        }
    }

    bool IsPopularDomain(std::string_view url) const {
        const auto parsed = URL::URLParser::Parse(url);
        if (!parsed) {
            return false;
        }
        const std::string& host = parsed->hostname;
        for (const auto& domain : m_popularDomains) {
            if (host == domain) return true;
            if (host.size() > domain.size() &&
                Utils::StringUtils::EndsWith(host, domain) &&
                host[host.size() - domain.size() - 1] == '.') {
                return true;
            }
        }
        return false;
    }

    EngineStatistics GetStatistics() const {
        EngineStatistics s;
        s.status = m_status.load(std::memory_order_acquire);
        s.cacheEnabled = m_cache != nullptr;
        if (m_cache) {
            s.cache = m_cache->GetStats();
        }
        s.whitelist = m_whitelist->GetStats();
        s.thresholds = m_thresholds->GetThresholds();
        s.counters = m_stats->GetSnapshot();
        s.model = (s.status == EngineStatus::Ready && m_predictor)
            ? m_predictor->GetInfo()
            : nlohmann::json{ { "loaded", false } };
        return s;
    }

    size_t Cleanup() {
        return m_cache ? m_cache->Cleanup() : 0;
    }

    bool Save(Core::Error* err) {
        bool ok = true;
        Core::Error first;
        Core::Error current;

        auto note = [&](bool result) {
            if (!result) {
                ok = false;
                if (!first.hasError()) first = current;
                PG_LOG_ERROR("Engine", "Save failed: %s", current.ToString().c_str());
            }
            current.clear();
        };

        note(m_whitelist->Save(&current));
        note(m_thresholds->Save(&current));
        note(m_stats->Save(&current));
        note(m_store->Flush(&current));

        if (!ok && err) {
            *err = first;
        }
        return ok;
    }

    void Reset() {
        if (m_cache) {
            m_cache->Clear();
        }
        PG_LOG_INFO("Engine", "Decision engine reset");
    }

    bool ResetStatistics(Core::Error* err) {
        return m_stats->Reset(err);
    }

    EngineStatus GetStatus() const noexcept {
        return m_status.load(std::memory_order_acquire);
    }

    Whitelist& GetWhitelist() noexcept { return *m_whitelist; }
    ThresholdManager& GetThresholdManager() noexcept { return *m_thresholds; }
    PredictionCache* GetCache() noexcept { return m_cache.get(); }

private:
    static uint64_t ElapsedUs(SteadyClock::time_point start) {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - start).count());
    }

    static void Finish(Decision& d, SteadyClock::time_point start) {
        d.timestamp = std::chrono::system_clock::now();
        d.latencyUs = ElapsedUs(start);
    }

    bool Fail(const Core::Error& e) {
        m_status.store(EngineStatus::Error, std::memory_order_release);
        PG_LOG_ERROR("Engine", "Initialization failed: %s", e.ToString().c_str());
        return false;
    }

    // Persisted state problems are logged and do not block startup
    void LoadPersistentState() {
        Core::Error e;
        if (m_fileStore && !m_fileStore->Open(&e)) {
            PG_LOG_ERROR("Engine", "State store unavailable, continuing with empty state: %s", e.ToString().c_str());
            e.clear();
        }
        if (!m_whitelist->Load(&e)) {
            PG_LOG_ERROR("Engine", "%s", e.ToString().c_str());
            e.clear();
        }
        if (!m_thresholds->Load(&e)) {
            PG_LOG_ERROR("Engine", "%s", e.ToString().c_str());
            e.clear();
        }
        if (!m_stats->Load(&e)) {
            PG_LOG_ERROR("Engine", "%s", e.ToString().c_str());
        }
    }

    Decision FailOpen(std::string_view url, SteadyClock::time_point start, const Core::Error& e) {
        Decision d;
        d.url = std::string(url);
        d.action = Action::Allow;
        d.level = Model::RiskLevel::Unknown;
        d.probability = std::nullopt;
        d.confidence = 0.0;
        d.reason = Reasons::FAILED;
        d.error = e.hasError() ? e.ToString() : std::string("Unknown error");
        Finish(d, start);

        PG_LOG_WARN("Engine", "Decision failed open for '%s': %s", d.url.c_str(), d.error.c_str());
        m_stats->RecordError();
        Record(d);
        return d;
    }

    void Record(const Decision& d) {
        m_stats->RecordCheck(d.latencyUs);
        switch (d.action) {
            case Action::Block: m_stats->RecordBlocked(); break;
            case Action::Warn:  m_stats->RecordWarned(); break;
            case Action::Allow: m_stats->RecordAllowed(); break;
        }
    }

    Config::EngineConfig m_config;

    std::shared_ptr<Storage::KeyValueStore> m_store;
    std::shared_ptr<Storage::JsonFileKeyValueStore> m_fileStore;

    std::unique_ptr<PredictionCache> m_cache;
    std::unique_ptr<Whitelist> m_whitelist;
    std::unique_ptr<ThresholdManager> m_thresholds;
    std::unique_ptr<Storage::StatsStore> m_stats;
    std::unique_ptr<Model::Predictor> m_predictor;

    std::vector<std::string> m_popularDomains;
    std::atomic<EngineStatus> m_status{ EngineStatus::Uninitialized };
};

// ============================================================================
// PUBLIC INTERFACE
// ============================================================================

DecisionEngine::DecisionEngine(Config::EngineConfig config, std::shared_ptr<Storage::KeyValueStore> store,
                               PredictionCache::Clock clock)
    : m_impl(std::make_unique<DecisionEngineImpl>(std::move(config), std::move(store), std::move(clock))) {
}

DecisionEngine::~DecisionEngine() = default;

bool DecisionEngine::Initialize(Core::Error* err) {
    return m_impl->Initialize(err);
}

bool DecisionEngine::Initialize(std::shared_ptr<const Model::TreeEnsembleModel> model,
                                Model::ModelMetadata metadata, Core::Error* err) {
    return m_impl->Initialize(std::move(model), std::move(metadata), err);
}

EngineStatus DecisionEngine::GetStatus() const noexcept {
    return m_impl->GetStatus();
}

bool DecisionEngine::IsReady() const noexcept {
    return m_impl->GetStatus() == EngineStatus::Ready;
}

Decision DecisionEngine::Decide(std::string_view url) {
    return m_impl->Decide(url);
}

std::vector<Decision> DecisionEngine::DecideBatch(const std::vector<std::string>& urls) {
    std::vector<Decision> out;
    out.reserve(urls.size());
    for (const auto& url : urls) {
        out.push_back(m_impl->Decide(url));
    }
    return out;
}

bool DecisionEngine::IsPopularDomain(std::string_view url) const {
    return m_impl->IsPopularDomain(url);
}

Whitelist& DecisionEngine::GetWhitelist() noexcept {
    return m_impl->GetWhitelist();
}

ThresholdManager& DecisionEngine::GetThresholdManager() noexcept {
    return m_impl->GetThresholdManager();
}

PredictionCache* DecisionEngine::GetCache() noexcept {
    return m_impl->GetCache();
}

EngineStatistics DecisionEngine::GetStatistics() const {
    return m_impl->GetStatistics();
}

size_t DecisionEngine::Cleanup() {
    return m_impl->Cleanup();
}

bool DecisionEngine::Save(Core::Error* err) {
    return m_impl->Save(err);
}

void DecisionEngine::Reset() {
    m_impl->Reset();
}

bool DecisionEngine::ResetStatistics(Core::Error* err) {
    return m_impl->ResetStatistics(err);
}

}  // namespace Decision
}  // namespace PhishGuard
