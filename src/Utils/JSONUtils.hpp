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
 * @file JSONUtils.hpp
 * @brief JSON parsing, serialization and file I/O utilities for PhishGuard.
 *
 * Provides:
 * - Safe parsing with depth limits
 * - File I/O with atomic write support
 * - JSON Pointer navigation (read-only)
 * - Required-key validation
 *
 * Implementation uses the nlohmann/json library behind non-throwing wrappers.
 *
 * @note All functions are noexcept and return success/failure status.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace PhishGuard {
	namespace Utils {
		namespace JSON {

			using Json = nlohmann::json;

			/// Maximum nesting depth accepted by Parse
			inline constexpr size_t MAX_JSON_DEPTH = 256;

			/// Default file size limit for LoadFromFile (64MB; model dumps can be large)
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 64ULL * 1024 * 1024;

			/**
			 * @brief Error information for JSON operations.
			 */
			struct Error {
				std::string message;              ///< Human-readable error description
				std::filesystem::path path;       ///< File path (if applicable)
				size_t byteOffset = 0;            ///< Byte offset in JSON text (0 = unknown)

				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
				}
			};

			struct ParseOptions {
				bool allowComments = true;         ///< Allow // and /* */ comments
				size_t maxDepth = MAX_JSON_DEPTH;  ///< Maximum nesting depth
			};

			struct StringifyOptions {
				bool pretty = false;               ///< Enable pretty printing with indentation
				int indentSpaces = 2;              ///< Number of spaces per indent level
				bool ensureAscii = false;          ///< Escape non-ASCII characters
			};

			struct SaveOptions : StringifyOptions {
				bool atomicReplace = true;         ///< Write to a temp file, then rename over the target
			};

			/**
			 * @brief Parse JSON text.
			 * @param jsonText Input JSON text
			 * @param out Output Json object (cleared on failure)
			 * @param err Optional error output
			 * @return true on success, false on parse error
			 */
			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr,
			                         const ParseOptions& opt = {}) noexcept;

			/**
			 * @brief Serialize Json to string. Invalid UTF-8 is replaced, not rejected.
			 */
			[[nodiscard]] bool Stringify(const Json& j, std::string& out,
			                             const StringifyOptions& opt = {}) noexcept;

			/**
			 * @brief Load and parse a JSON file. A UTF-8 BOM is stripped.
			 */
			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr,
			                                const ParseOptions& opt = {},
			                                size_t maxFileSize = DEFAULT_MAX_FILE_SIZE) noexcept;

			/**
			 * @brief Save Json to a file, creating parent directories.
			 */
			[[nodiscard]] bool SaveToFile(const std::filesystem::path& path, const Json& j,
			                              Error* err = nullptr,
			                              const SaveOptions& opt = {}) noexcept;

			/**
			 * @brief Check if a JSON Pointer ("/a/b/0") resolves in @p j.
			 */
			[[nodiscard]] bool Contains(const Json& j, std::string_view pointer) noexcept;

			/**
			 * @brief Get typed value at a JSON Pointer.
			 * @param out Output value (unchanged on failure)
			 * @return true if the pointer resolves and conversion succeeded
			 */
			template <typename T>
			[[nodiscard]] bool Get(const Json& j, std::string_view pointer, T& out) noexcept {
				try {
					if (pointer.empty() || pointer == "/") {
						out = j.template get<T>();
						return true;
					}
					const Json::json_pointer ptr{std::string(pointer)};
					if (!j.contains(ptr)) {
						return false;
					}
					out = j.at(ptr).template get<T>();
					return true;
				}
				catch (const Json::exception&) {
					return false;
				}
			}

			/**
			 * @brief Get typed value or return default.
			 */
			template <typename T>
			[[nodiscard]] T GetOr(const Json& j, std::string_view pointer, T defaultValue) noexcept {
				T val{};
				if (Get<T>(j, pointer, val)) {
					return val;
				}
				return defaultValue;
			}

			/**
			 * @brief Validate that required keys exist in the object at @p objectPointer.
			 */
			[[nodiscard]] bool RequireKeys(const Json& j, std::string_view objectPointer,
			                               const std::vector<std::string>& requiredKeys,
			                               Error* err = nullptr) noexcept;

		}  // namespace JSON
	}  // namespace Utils
}  // namespace PhishGuard
