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
#include "StringUtils.hpp"

namespace PhishGuard {
	namespace Utils {
		namespace StringUtils {

			namespace {
				constexpr bool IsAsciiSpace(char c) noexcept {
					return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
				}
			}

			std::string ToLowerAscii(std::string_view s) {
				std::string out(s);
				for (auto& c : out) {
					if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
				}
				return out;
			}

			std::string_view TrimAscii(std::string_view s) noexcept {
				size_t begin = 0;
				size_t end = s.size();
				while (begin < end && IsAsciiSpace(s[begin])) ++begin;
				while (end > begin && IsAsciiSpace(s[end - 1])) --end;
				return s.substr(begin, end - begin);
			}

			std::vector<std::string> Split(std::string_view s, char sep) {
				std::vector<std::string> parts;
				size_t start = 0;
				for (;;) {
					const size_t pos = s.find(sep, start);
					if (pos == std::string_view::npos) {
						parts.emplace_back(s.substr(start));
						break;
					}
					parts.emplace_back(s.substr(start, pos - start));
					start = pos + 1;
				}
				return parts;
			}

			std::string Join(const std::vector<std::string>& parts, std::string_view sep, size_t first) {
				std::string out;
				for (size_t i = first; i < parts.size(); ++i) {
					if (i > first) out += sep;
					out += parts[i];
				}
				return out;
			}

			size_t CountChar(std::string_view s, char c) noexcept {
				size_t n = 0;
				for (char ch : s) {
					if (ch == c) ++n;
				}
				return n;
			}

			size_t CountDigits(std::string_view s) noexcept {
				size_t n = 0;
				for (char ch : s) {
					if (IsAsciiDigit(ch)) ++n;
				}
				return n;
			}

			size_t CountSubstring(std::string_view s, std::string_view needle) noexcept {
				if (needle.empty()) return 0;
				size_t n = 0;
				size_t pos = s.find(needle);
				while (pos != std::string_view::npos) {
					++n;
					pos = s.find(needle, pos + needle.size());
				}
				return n;
			}

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace PhishGuard
