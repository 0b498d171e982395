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
 * @file StringUtils.hpp
 * @brief ASCII string helpers used by the URL and feature code.
 *
 * All functions operate on bytes; none are locale-aware.
 */

#include <string>
#include <string_view>
#include <vector>

namespace PhishGuard {
	namespace Utils {
		namespace StringUtils {

			[[nodiscard]] std::string ToLowerAscii(std::string_view s);

			/// @brief Strip leading and trailing ASCII whitespace (space, \t, \n, \v, \f, \r)
			[[nodiscard]] std::string_view TrimAscii(std::string_view s) noexcept;

			/// @brief Split on every occurrence of @p sep; empty fields are kept
			[[nodiscard]] std::vector<std::string> Split(std::string_view s, char sep);

			[[nodiscard]] std::string Join(const std::vector<std::string>& parts, std::string_view sep,
			                               size_t first = 0);

			[[nodiscard]] constexpr bool StartsWith(std::string_view s, std::string_view prefix) noexcept {
				return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
			}

			[[nodiscard]] constexpr bool EndsWith(std::string_view s, std::string_view suffix) noexcept {
				return s.size() >= suffix.size() &&
				       s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
			}

			[[nodiscard]] constexpr bool IsAsciiDigit(char c) noexcept {
				return c >= '0' && c <= '9';
			}

			[[nodiscard]] constexpr bool IsAsciiHexDigit(char c) noexcept {
				return IsAsciiDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
			}

			/// @brief Number of bytes equal to @p c
			[[nodiscard]] size_t CountChar(std::string_view s, char c) noexcept;

			/// @brief Number of ASCII digit bytes
			[[nodiscard]] size_t CountDigits(std::string_view s) noexcept;

			/// @brief Non-overlapping occurrences of @p needle (0 for an empty needle)
			[[nodiscard]] size_t CountSubstring(std::string_view s, std::string_view needle) noexcept;

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace PhishGuard
