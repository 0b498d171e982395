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
 * PhishGuard - KEY-VALUE STORE
 * ============================================================================
 *
 * @file KeyValueStore.hpp
 * @brief Persistent state back ends for whitelist, thresholds and counters.
 *
 * Values are JSON documents keyed by string. Known keys:
 *   "whitelist"        JSON array of domains
 *   "thresholdConfig"  threshold object
 *   "stats"            counters + installDate/lastReset/lastUpdated
 *
 * Implementations are thread-safe.
 * ============================================================================
 */

#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "../Core/ErrorCodes.hpp"

namespace PhishGuard {
namespace Storage {

namespace StoreKeys {
    inline constexpr const char* WHITELIST = "whitelist";
    inline constexpr const char* THRESHOLD_CONFIG = "thresholdConfig";
    inline constexpr const char* STATS = "stats";
}  // namespace StoreKeys

class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /// @brief std::nullopt when the key is absent
    [[nodiscard]] virtual std::optional<nlohmann::json> Get(const std::string& key) const = 0;

    [[nodiscard]] virtual bool Set(const std::string& key, nlohmann::json value, Core::Error* err = nullptr) = 0;

    /// @brief Returns false when the key was absent
    virtual bool Remove(const std::string& key, Core::Error* err = nullptr) = 0;

    /// @brief Whole store as one JSON object
    [[nodiscard]] virtual nlohmann::json Snapshot() const = 0;

    [[nodiscard]] virtual bool Clear(Core::Error* err = nullptr) = 0;

    /// @brief Make pending writes durable. No-op for volatile stores.
    [[nodiscard]] virtual bool Flush(Core::Error* err = nullptr) = 0;
};

// ============================================================================
// IN-MEMORY STORE
// ============================================================================

class MemoryKeyValueStore : public KeyValueStore {
public:
    MemoryKeyValueStore() = default;

    [[nodiscard]] std::optional<nlohmann::json> Get(const std::string& key) const override;
    [[nodiscard]] bool Set(const std::string& key, nlohmann::json value, Core::Error* err = nullptr) override;
    bool Remove(const std::string& key, Core::Error* err = nullptr) override;
    [[nodiscard]] nlohmann::json Snapshot() const override;
    [[nodiscard]] bool Clear(Core::Error* err = nullptr) override;
    [[nodiscard]] bool Flush(Core::Error* err = nullptr) override;

protected:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, nlohmann::json> m_values;
};

// ============================================================================
// JSON FILE STORE
// ============================================================================

/**
 * @brief One JSON object on disk. Every mutation rewrites the file through
 *        a temporary file and rename (unless autoFlush is off, in which case
 *        Flush() does it).
 */
class JsonFileKeyValueStore final : public MemoryKeyValueStore {
public:
    explicit JsonFileKeyValueStore(std::filesystem::path path, bool autoFlush = true);

    /**
     * @brief Read the file. A missing file is an empty store, not an error.
     */
    [[nodiscard]] bool Open(Core::Error* err = nullptr);

    [[nodiscard]] bool Set(const std::string& key, nlohmann::json value, Core::Error* err = nullptr) override;
    bool Remove(const std::string& key, Core::Error* err = nullptr) override;
    [[nodiscard]] bool Clear(Core::Error* err = nullptr) override;
    [[nodiscard]] bool Flush(Core::Error* err = nullptr) override;

    /// @brief Write the whole store to another file
    [[nodiscard]] bool ExportTo(const std::filesystem::path& path, Core::Error* err = nullptr) const;

    /// @brief Merge keys from another file, then persist (existing keys are overwritten)
    [[nodiscard]] bool ImportFrom(const std::filesystem::path& path, Core::Error* err = nullptr);

    [[nodiscard]] const std::filesystem::path& GetPath() const noexcept { return m_path; }

private:
    [[nodiscard]] bool SaveLocked(Core::Error* err) const;

    std::filesystem::path m_path;
    bool m_autoFlush;
};

}  // namespace Storage
}  // namespace PhishGuard
