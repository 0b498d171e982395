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
#include "JSONUtils.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace PhishGuard {
	namespace Utils {
		namespace JSON {

			namespace fs = std::filesystem;

			namespace {

				void Fill(Error* err, std::string message, const fs::path& path = {}, size_t offset = 0) {
					if (!err) return;
					err->message = std::move(message);
					err->path = path;
					err->byteOffset = offset;
				}

			}  // namespace

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				try {
					bool tooDeep = false;
					const size_t maxDepth = opt.maxDepth;
					Json::parser_callback_t cb = [&tooDeep, maxDepth](int depth, Json::parse_event_t, Json&) {
						if (static_cast<size_t>(depth) > maxDepth) {
							tooDeep = true;
							return false;
						}
						return true;
					};

					Json parsed = Json::parse(jsonText.begin(), jsonText.end(), cb, true, opt.allowComments);
					if (tooDeep) {
						out = Json();
						Fill(err, "JSON nesting exceeds maximum depth of " + std::to_string(maxDepth));
						return false;
					}
					out = std::move(parsed);
					return true;
				}
				catch (const Json::parse_error& e) {
					out = Json();
					Fill(err, e.what(), {}, e.byte);
					return false;
				}
				catch (const std::exception& e) {
					out = Json();
					Fill(err, e.what());
					return false;
				}
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					out = j.dump(opt.pretty ? opt.indentSpaces : -1, ' ', opt.ensureAscii,
						Json::error_handler_t::replace);
					return true;
				}
				catch (const std::exception&) {
					out.clear();
					return false;
				}
			}

			bool LoadFromFile(const fs::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxFileSize) noexcept {
				try {
					std::error_code ec;
					if (!fs::is_regular_file(path, ec)) {
						Fill(err, "File not found", path);
						return false;
					}

					const auto size = fs::file_size(path, ec);
					if (ec) {
						Fill(err, "Cannot determine file size: " + ec.message(), path);
						return false;
					}
					if (size > maxFileSize) {
						Fill(err, "File exceeds size limit", path);
						return false;
					}

					std::ifstream in(path, std::ios::binary);
					if (!in) {
						Fill(err, "Cannot open file", path);
						return false;
					}

					std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
					if (text.size() >= 3 &&
						static_cast<unsigned char>(text[0]) == 0xEF &&
						static_cast<unsigned char>(text[1]) == 0xBB &&
						static_cast<unsigned char>(text[2]) == 0xBF) {
						text.erase(0, 3);
					}

					if (!Parse(text, out, err, opt)) {
						if (err) err->path = path;
						return false;
					}
					return true;
				}
				catch (const std::exception& e) {
					Fill(err, e.what(), path);
					return false;
				}
			}

			bool SaveToFile(const fs::path& path, const Json& j, Error* err, const SaveOptions& opt) noexcept {
				try {
					std::string text;
					if (!Stringify(j, text, opt)) {
						Fill(err, "Serialization failed", path);
						return false;
					}

					std::error_code ec;
					if (path.has_parent_path()) {
						fs::create_directories(path.parent_path(), ec);
						if (ec) {
							Fill(err, "Cannot create directory: " + ec.message(), path);
							return false;
						}
					}

					const fs::path target = opt.atomicReplace ? fs::path(path.string() + ".tmp") : path;
					{
						std::ofstream outFile(target, std::ios::binary | std::ios::trunc);
						if (!outFile) {
							Fill(err, "Cannot open file for writing", target);
							return false;
						}
						outFile << text;
						outFile.flush();
						if (!outFile) {
							Fill(err, "Write failed", target);
							return false;
						}
					}

					if (opt.atomicReplace) {
						fs::rename(target, path, ec);
						if (ec) {
							fs::remove(target, ec);
							Fill(err, "Atomic replace failed", path);
							return false;
						}
					}
					return true;
				}
				catch (const std::exception& e) {
					Fill(err, e.what(), path);
					return false;
				}
			}

			bool Contains(const Json& j, std::string_view pointer) noexcept {
				try {
					if (pointer.empty() || pointer == "/") return true;
					return j.contains(Json::json_pointer{std::string(pointer)});
				}
				catch (const Json::exception&) {
					return false;
				}
			}

			bool RequireKeys(const Json& j, std::string_view objectPointer,
			                 const std::vector<std::string>& requiredKeys, Error* err) noexcept {
				try {
					const Json* obj = &j;
					if (!objectPointer.empty() && objectPointer != "/") {
						const Json::json_pointer ptr{std::string(objectPointer)};
						if (!j.contains(ptr)) {
							Fill(err, "Missing object: " + std::string(objectPointer));
							return false;
						}
						obj = &j.at(ptr);
					}
					if (!obj->is_object()) {
						Fill(err, "Not an object: " + std::string(objectPointer));
						return false;
					}
					for (const auto& key : requiredKeys) {
						if (!obj->contains(key)) {
							Fill(err, "Missing required key: " + key);
							return false;
						}
					}
					return true;
				}
				catch (const std::exception& e) {
					Fill(err, e.what());
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace PhishGuard
