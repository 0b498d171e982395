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
#include "EngineConfig.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include "../Utils/JSONUtils.hpp"
#include "../Utils/StringUtils.hpp"

namespace PhishGuard {
namespace Config {

using Json = nlohmann::json;

namespace {

// Copy doc[key] into out when present; throws json::type_error on mismatch.
template <typename T>
void ReadIfPresent(const Json& section, const char* key, T& out) {
    const auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        out = it->template get<T>();
    }
}

// Integers only; unsigned values past int64 range are rejected rather than wrapped.
void ReadIntegerIfPresent(const Json& section, const char* key, int64_t& out) {
    const auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    if (!it->is_number_integer()) {
        throw std::invalid_argument(std::string("'") + key + "' must be an integer");
    }
    if (it->is_number_unsigned() &&
        it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw std::invalid_argument(std::string("'") + key + "' is out of range");
    }
    out = it->get<int64_t>();
}

void ReadPathIfPresent(const Json& section, const char* key, std::filesystem::path& out) {
    std::string value;
    ReadIfPresent(section, key, value);
    if (!value.empty()) {
        out = value;
    }
}

const Json& Section(const Json& doc, const char* name) {
    static const Json empty = Json::object();
    const auto it = doc.find(name);
    if (it == doc.end()) return empty;
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("section '") + name + "' must be an object");
    }
    return *it;
}

void Resolve(std::filesystem::path& p, const std::filesystem::path& base) {
    if (!p.empty() && p.is_relative()) {
        p = base / p;
    }
}

}  // namespace

std::optional<EngineConfig> EngineConfig::FromJson(const Json& doc, Core::Error* err) {
    if (!doc.is_object()) {
        Core::SetError(err, Core::ErrorKind::InvalidInput, "Configuration root must be an object");
        return std::nullopt;
    }

    EngineConfig cfg;
    try {
        const Json& model = Section(doc, "model");
        ReadPathIfPresent(model, "path", cfg.modelPath);
        ReadPathIfPresent(model, "metadataPath", cfg.metadataPath);
        ReadIfPresent(model, "suspiciousMargin", cfg.suspiciousMargin);

        const Json& storage = Section(doc, "storage");
        ReadPathIfPresent(storage, "path", cfg.storagePath);

        const Json& cache = Section(doc, "cache");
        ReadIfPresent(cache, "enabled", cfg.cache.enabled);
        ReadIntegerIfPresent(cache, "maxSize", cfg.cache.maxSize);
        ReadIntegerIfPresent(cache, "ttlSeconds", cfg.cache.ttlSeconds);

        const Json& thresholds = Section(doc, "thresholds");
        ReadIfPresent(thresholds, "profile", cfg.thresholds.profile);
        ReadIfPresent(thresholds, "block", cfg.thresholds.block);
        ReadIfPresent(thresholds, "warn", cfg.thresholds.warn);
        ReadIfPresent(thresholds, "popularDomain", cfg.thresholds.popularDomain);

        ReadIfPresent(doc, "popularDomains", cfg.popularDomains);
        for (auto& domain : cfg.popularDomains) {
            domain = Utils::StringUtils::ToLowerAscii(Utils::StringUtils::TrimAscii(domain));
        }

        const Json& logging = Section(doc, "logging");
        std::string level;
        ReadIfPresent(logging, "level", level);
        if (!level.empty()) {
            cfg.logging.minimalLevel = Utils::ParseLogLevel(level);
        }
        ReadIfPresent(logging, "console", cfg.logging.toConsole);
        ReadIfPresent(logging, "file", cfg.logging.toFile);
        ReadIfPresent(logging, "jsonLines", cfg.logging.jsonLines);
        ReadIfPresent(logging, "directory", cfg.logging.logDirectory);
        ReadIfPresent(logging, "async", cfg.logging.async);
    }
    catch (const Json::exception& e) {
        Core::SetError(err, Core::ErrorKind::InvalidInput, std::string("Configuration: ") + e.what());
        return std::nullopt;
    }
    catch (const std::invalid_argument& e) {
        Core::SetError(err, Core::ErrorKind::InvalidInput, std::string("Configuration: ") + e.what());
        return std::nullopt;
    }

    if (!cfg.IsValid(err)) {
        return std::nullopt;
    }
    return cfg;
}

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::filesystem::path& path, Core::Error* err) {
    Utils::JSON::Json doc;
    Utils::JSON::Error jsonErr;
    if (!Utils::JSON::LoadFromFile(path, doc, &jsonErr)) {
        Core::SetError(err, Core::ErrorKind::InvalidInput, path.string() + ": " + jsonErr.message);
        return std::nullopt;
    }

    auto cfg = FromJson(doc, err);
    if (!cfg) {
        return std::nullopt;
    }

    const auto base = path.parent_path();
    Resolve(cfg->modelPath, base);
    Resolve(cfg->metadataPath, base);
    Resolve(cfg->storagePath, base);
    if (!cfg->logging.logDirectory.empty() && std::filesystem::path(cfg->logging.logDirectory).is_relative()) {
        cfg->logging.logDirectory = (base / cfg->logging.logDirectory).string();
    }
    return cfg;
}

Json EngineConfig::ToJson() const {
    return Json{
        { "model", {
            { "path", modelPath.string() },
            { "metadataPath", metadataPath.string() },
            { "suspiciousMargin", suspiciousMargin }
        } },
        { "storage", { { "path", storagePath.string() } } },
        { "cache", {
            { "enabled", cache.enabled },
            { "maxSize", cache.maxSize },
            { "ttlSeconds", cache.ttlSeconds }
        } },
        { "thresholds", {
            { "profile", thresholds.profile },
            { "block", thresholds.block },
            { "warn", thresholds.warn },
            { "popularDomain", thresholds.popularDomain }
        } },
        { "popularDomains", popularDomains },
        { "logging", {
            { "level", Utils::GetLogLevelName(logging.minimalLevel) },
            { "console", logging.toConsole },
            { "file", logging.toFile },
            { "jsonLines", logging.jsonLines },
            { "directory", logging.logDirectory },
            { "async", logging.async }
        } }
    };
}

bool EngineConfig::IsValid(Core::Error* err) const {
    auto inUnit = [](double v) { return v >= 0.0 && v <= 1.0; };

    if (!inUnit(thresholds.block) || !inUnit(thresholds.warn) || !inUnit(thresholds.popularDomain)) {
        Core::SetError(err, Core::ErrorKind::InvalidInput, "Thresholds must be within [0, 1]");
        return false;
    }
    if (!(thresholds.warn < thresholds.block)) {
        Core::SetError(err, Core::ErrorKind::InvalidInput, "Warn threshold must be below block threshold");
        return false;
    }
    if (!inUnit(suspiciousMargin)) {
        Core::SetError(err, Core::ErrorKind::InvalidInput, "Suspicious margin must be within [0, 1]");
        return false;
    }
    if (cache.enabled) {
        if (cache.maxSize <= 0 || cache.maxSize > Defaults::CACHE_MAX_SIZE_LIMIT) {
            Core::SetError(err, Core::ErrorKind::InvalidInput,
                           "Cache size must be within [1, " + std::to_string(Defaults::CACHE_MAX_SIZE_LIMIT) + "]");
            return false;
        }
        if (cache.ttlSeconds <= 0 || cache.ttlSeconds > Defaults::CACHE_TTL_LIMIT) {
            Core::SetError(err, Core::ErrorKind::InvalidInput,
                           "Cache TTL must be within [1, " + std::to_string(Defaults::CACHE_TTL_LIMIT) + "] seconds");
            return false;
        }
    }
    return true;
}

}  // namespace Config
}  // namespace PhishGuard
