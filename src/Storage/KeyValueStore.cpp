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
#include "KeyValueStore.hpp"

#include <mutex>
#include <utility>

#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

namespace PhishGuard {
namespace Storage {

namespace JSON = Utils::JSON;

// ============================================================================
// MemoryKeyValueStore
// ============================================================================

std::optional<nlohmann::json> MemoryKeyValueStore::Get(const std::string& key) const {
    std::shared_lock lock(m_mutex);
    const auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryKeyValueStore::Set(const std::string& key, nlohmann::json value, Core::Error* err) {
    if (key.empty()) {
        Core::SetError(err, Core::ErrorKind::InvalidInput, "Empty store key");
        return false;
    }
    std::unique_lock lock(m_mutex);
    m_values[key] = std::move(value);
    return true;
}

bool MemoryKeyValueStore::Remove(const std::string& key, Core::Error*) {
    std::unique_lock lock(m_mutex);
    return m_values.erase(key) > 0;
}

nlohmann::json MemoryKeyValueStore::Snapshot() const {
    std::shared_lock lock(m_mutex);
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : m_values) {
        out[key] = value;
    }
    return out;
}

bool MemoryKeyValueStore::Clear(Core::Error*) {
    std::unique_lock lock(m_mutex);
    m_values.clear();
    return true;
}

bool MemoryKeyValueStore::Flush(Core::Error*) {
    return true;
}

// ============================================================================
// JsonFileKeyValueStore
// ============================================================================

JsonFileKeyValueStore::JsonFileKeyValueStore(std::filesystem::path path, bool autoFlush)
    : m_path(std::move(path))
    , m_autoFlush(autoFlush) {
}

bool JsonFileKeyValueStore::Open(Core::Error* err) {
    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) {
        PG_LOG_INFO("Storage", "Store %s does not exist yet, starting empty", m_path.string().c_str());
        std::unique_lock lock(m_mutex);
        m_values.clear();
        return true;
    }

    JSON::Json doc;
    JSON::Error jsonErr;
    if (!JSON::LoadFromFile(m_path, doc, &jsonErr)) {
        PG_LOG_ERROR("Storage", "Cannot read store %s: %s", m_path.string().c_str(), jsonErr.message.c_str());
        Core::SetError(err, Core::ErrorKind::StorageError, m_path.string() + ": " + jsonErr.message);
        return false;
    }
    if (!doc.is_object()) {
        Core::SetError(err, Core::ErrorKind::StorageError, m_path.string() + ": root is not an object");
        return false;
    }

    std::unique_lock lock(m_mutex);
    m_values.clear();
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        m_values[it.key()] = it.value();
    }
    PG_LOG_DEBUG("Storage", "Opened %s with %zu keys", m_path.string().c_str(), m_values.size());
    return true;
}

bool JsonFileKeyValueStore::Set(const std::string& key, nlohmann::json value, Core::Error* err) {
    if (key.empty()) {
        Core::SetError(err, Core::ErrorKind::InvalidInput, "Empty store key");
        return false;
    }
    std::unique_lock lock(m_mutex);
    m_values[key] = std::move(value);
    return !m_autoFlush || SaveLocked(err);
}

bool JsonFileKeyValueStore::Remove(const std::string& key, Core::Error* err) {
    std::unique_lock lock(m_mutex);
    if (m_values.erase(key) == 0) {
        return false;
    }
    return !m_autoFlush || SaveLocked(err);
}

bool JsonFileKeyValueStore::Clear(Core::Error* err) {
    std::unique_lock lock(m_mutex);
    m_values.clear();
    return !m_autoFlush || SaveLocked(err);
}

bool JsonFileKeyValueStore::Flush(Core::Error* err) {
    // Exclusive: writers share one temp file
    std::unique_lock lock(m_mutex);
    return SaveLocked(err);
}

bool JsonFileKeyValueStore::SaveLocked(Core::Error* err) const {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [key, value] : m_values) {
        doc[key] = value;
    }

    JSON::SaveOptions opt;
    opt.pretty = true;
    JSON::Error jsonErr;
    if (!JSON::SaveToFile(m_path, doc, &jsonErr, opt)) {
        PG_LOG_ERROR("Storage", "Cannot write store %s: %s", m_path.string().c_str(), jsonErr.message.c_str());
        Core::SetError(err, Core::ErrorKind::StorageError, m_path.string() + ": " + jsonErr.message);
        return false;
    }
    return true;
}

bool JsonFileKeyValueStore::ExportTo(const std::filesystem::path& path, Core::Error* err) const {
    JSON::SaveOptions opt;
    opt.pretty = true;
    JSON::Error jsonErr;
    if (!JSON::SaveToFile(path, Snapshot(), &jsonErr, opt)) {
        Core::SetError(err, Core::ErrorKind::StorageError, path.string() + ": " + jsonErr.message);
        return false;
    }
    PG_LOG_INFO("Storage", "Exported store to %s", path.string().c_str());
    return true;
}

bool JsonFileKeyValueStore::ImportFrom(const std::filesystem::path& path, Core::Error* err) {
    JSON::Json doc;
    JSON::Error jsonErr;
    if (!JSON::LoadFromFile(path, doc, &jsonErr)) {
        Core::SetError(err, Core::ErrorKind::StorageError, path.string() + ": " + jsonErr.message);
        return false;
    }
    if (!doc.is_object()) {
        Core::SetError(err, Core::ErrorKind::StorageError, path.string() + ": root is not an object");
        return false;
    }

    std::unique_lock lock(m_mutex);
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        m_values[it.key()] = it.value();
    }
    PG_LOG_INFO("Storage", "Imported %zu keys from %s", doc.size(), path.string().c_str());
    return SaveLocked(err);
}

}  // namespace Storage
}  // namespace PhishGuard
