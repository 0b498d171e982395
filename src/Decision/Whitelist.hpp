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
 * PhishGuard - WHITELIST
 * ============================================================================
 *
 * @file Whitelist.hpp
 * @brief User-trusted domains, persisted under the "whitelist" key.
 *
 * Entries are lowercased hostnames. A URL is whitelisted when its hostname,
 * or any suffix of it obtained by dropping leading labels, is an entry:
 * trusting example.com covers a.example.com, trusting a.example.com does
 * not cover example.com.
 *
 * Mutations persist immediately. A failed write leaves the in-memory change
 * in place and reports StorageError.
 * ============================================================================
 */

#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../Core/ErrorCodes.hpp"
#include "../Storage/KeyValueStore.hpp"

namespace PhishGuard {
namespace Decision {

struct WhitelistStats {
    size_t count = 0;
    bool loaded = false;

    [[nodiscard]] nlohmann::json ToJson() const;
};

class Whitelist {
public:
    /// @param store May be null; then nothing is persisted
    explicit Whitelist(std::shared_ptr<Storage::KeyValueStore> store);

    Whitelist(const Whitelist&) = delete;
    Whitelist& operator=(const Whitelist&) = delete;

    /// @brief Read entries from the store; a missing key yields an empty list
    [[nodiscard]] bool Load(Core::Error* err = nullptr);

    [[nodiscard]] bool Save(Core::Error* err = nullptr) const;

    /**
     * @brief Trust the host of @p urlOrDomain ("https://x.com/a" and "x.com" are equivalent).
     * @return false with ParseError for unparseable input
     */
    [[nodiscard]] bool Add(std::string_view urlOrDomain, Core::Error* err = nullptr);

    /// @brief Returns false when the host was not an entry (no error set)
    [[nodiscard]] bool Remove(std::string_view urlOrDomain, Core::Error* err = nullptr);

    [[nodiscard]] bool IsWhitelisted(std::string_view url) const;

    /// @brief Sorted entries
    [[nodiscard]] std::vector<std::string> GetAll() const;

    [[nodiscard]] bool Clear(Core::Error* err = nullptr);

    [[nodiscard]] WhitelistStats GetStats() const;

    /// @brief Lowercased hostname of a URL or bare domain
    [[nodiscard]] static std::optional<std::string> ExtractHost(std::string_view urlOrDomain,
                                                                Core::Error* err = nullptr);

private:
    [[nodiscard]] bool SaveLocked(Core::Error* err) const;

    std::shared_ptr<Storage::KeyValueStore> m_store;

    mutable std::shared_mutex m_mutex;
    std::set<std::string> m_domains;
    bool m_loaded = false;
};

}  // namespace Decision
}  // namespace PhishGuard
