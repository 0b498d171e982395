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
#include "Whitelist.hpp"

#include <mutex>
#include <utility>

#include "../URL/URLParser.hpp"
#include "../Utils/Logger.hpp"

namespace PhishGuard {
namespace Decision {

nlohmann::json WhitelistStats::ToJson() const {
    return nlohmann::json{ { "count", count }, { "loaded", loaded } };
}

Whitelist::Whitelist(std::shared_ptr<Storage::KeyValueStore> store)
    : m_store(std::move(store)) {
}

std::optional<std::string> Whitelist::ExtractHost(std::string_view urlOrDomain, Core::Error* err) {
    const auto parsed = URL::URLParser::Parse(urlOrDomain, err);
    if (!parsed) {
        return std::nullopt;
    }
    return parsed->hostname;
}

bool Whitelist::Load(Core::Error* err) {
    std::unique_lock lock(m_mutex);
    m_domains.clear();
    m_loaded = true;

    if (!m_store) return true;

    const auto doc = m_store->Get(Storage::StoreKeys::WHITELIST);
    if (!doc) {
        PG_LOG_DEBUG("Whitelist", "No persisted whitelist");
        return true;
    }
    if (!doc->is_array()) {
        PG_LOG_ERROR("Whitelist", "Persisted whitelist is not an array, starting empty");
        Core::SetError(err, Core::ErrorKind::StorageError, "Persisted whitelist is not an array");
        return false;
    }

    for (const auto& entry : *doc) {
        if (!entry.is_string()) continue;
        const auto host = ExtractHost(entry.get<std::string>());
        if (host) {
            m_domains.insert(*host);
        } else {
            PG_LOG_WARN("Whitelist", "Skipping invalid entry '%s'", entry.get<std::string>().c_str());
        }
    }

    PG_LOG_INFO("Whitelist", "Whitelist loaded: %zu domains", m_domains.size());
    return true;
}

bool Whitelist::Save(Core::Error* err) const {
    std::shared_lock lock(m_mutex);
    return SaveLocked(err);
}

bool Whitelist::SaveLocked(Core::Error* err) const {
    if (!m_store) return true;
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& domain : m_domains) {
        arr.push_back(domain);
    }
    return m_store->Set(Storage::StoreKeys::WHITELIST, std::move(arr), err);
}

bool Whitelist::Add(std::string_view urlOrDomain, Core::Error* err) {
    const auto host = ExtractHost(urlOrDomain, err);
    if (!host) {
        PG_LOG_WARN("Whitelist", "Rejected whitelist entry '%.*s'",
            static_cast<int>(urlOrDomain.size()), urlOrDomain.data());
        return false;
    }

    std::unique_lock lock(m_mutex);
    m_domains.insert(*host);
    PG_LOG_INFO("Whitelist", "Added to whitelist: %s", host->c_str());
    return SaveLocked(err);
}

bool Whitelist::Remove(std::string_view urlOrDomain, Core::Error* err) {
    const auto host = ExtractHost(urlOrDomain, err);
    if (!host) {
        return false;
    }

    std::unique_lock lock(m_mutex);
    if (m_domains.erase(*host) == 0) {
        return false;
    }
    PG_LOG_INFO("Whitelist", "Removed from whitelist: %s", host->c_str());
    return SaveLocked(err);
}

bool Whitelist::IsWhitelisted(std::string_view url) const {
    const auto host = ExtractHost(url);
    if (!host) {
        return false;
    }

    std::shared_lock lock(m_mutex);
    if (m_domains.empty()) {
        return false;
    }

    // Exact host, then each ancestor (a.b.c -> b.c -> c)
    std::string_view candidate = *host;
    for (;;) {
        if (m_domains.count(std::string(candidate)) > 0) {
            return true;
        }
        const size_t dot = candidate.find('.');
        if (dot == std::string_view::npos) {
            return false;
        }
        candidate.remove_prefix(dot + 1);
    }
}

std::vector<std::string> Whitelist::GetAll() const {
    std::shared_lock lock(m_mutex);
    return std::vector<std::string>(m_domains.begin(), m_domains.end());
}

bool Whitelist::Clear(Core::Error* err) {
    std::unique_lock lock(m_mutex);
    m_domains.clear();
    PG_LOG_INFO("Whitelist", "Whitelist cleared");
    return SaveLocked(err);
}

WhitelistStats Whitelist::GetStats() const {
    std::shared_lock lock(m_mutex);
    return WhitelistStats{ m_domains.size(), m_loaded };
}

}  // namespace Decision
}  // namespace PhishGuard
