/*
 * TraceSweep - Browser Artifact Detection and Removal Engine
 * Copyright (C) 2026 TraceSweep Contributors
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
#include "FileUtils.hpp"

#include <algorithm>
#include <fstream>

namespace TraceSweep {
	namespace Utils {
		namespace JSON {

			namespace {

				void FillPosition(std::string_view text, size_t byteOffset, Error& err) {
					err.byteOffset = byteOffset;
					err.line = 1;
					err.column = 1;
					const size_t limit = std::min(byteOffset, text.size());
					for (size_t i = 0; i < limit; ++i) {
						if (text[i] == '\n') {
							++err.line;
							err.column = 1;
						}
						else {
							++err.column;
						}
					}
				}

				void EscapePointerToken(std::string& token) {
					std::string out;
					out.reserve(token.size());
					for (const char c : token) {
						if (c == '~') out += "~0";
						else if (c == '/') out += "~1";
						else out.push_back(c);
					}
					token = std::move(out);
				}

			}  // namespace

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				if (err) err->clear();

				try {
					bool tooDeep = false;
					const size_t maxDepth = opt.maxDepth;

					nlohmann::json::parser_callback_t cb =
						[&tooDeep, maxDepth](int depth, nlohmann::json::parse_event_t, Json&) {
							if (static_cast<size_t>(depth) > maxDepth) tooDeep = true;
							return true;
						};

					out = Json::parse(jsonText.begin(), jsonText.end(), cb, true, opt.allowComments);

					if (tooDeep) {
						out = Json();
						if (err) err->message = "JSON nesting depth exceeds limit";
						return false;
					}
					return true;
				}
				catch (const nlohmann::json::parse_error& ex) {
					out = Json();
					if (err) {
						err->message = ex.what();
						FillPosition(jsonText, ex.byte, *err);
					}
					return false;
				}
				catch (const nlohmann::json::exception& ex) {
					out = Json();
					if (err) err->message = ex.what();
					return false;
				}
				catch (const std::bad_alloc&) {
					out = Json();
					if (err) err->message = "Out of memory while parsing JSON";
					return false;
				}
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					const int indent = opt.pretty ? opt.indentSpaces : -1;
					out = j.dump(indent, ' ', opt.ensureAscii, nlohmann::json::error_handler_t::replace);
					return true;
				}
				catch (const nlohmann::json::exception&) {
					out.clear();
					return false;
				}
				catch (const std::bad_alloc&) {
					out.clear();
					return false;
				}
			}

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxBytes) noexcept {
				if (err) err->clear();

				try {
					std::error_code ec;
					const auto size = std::filesystem::file_size(path, ec);
					if (ec) {
						if (err) { err->message = "Cannot stat file: " + ec.message(); err->path = path; }
						return false;
					}
					if (size > maxBytes) {
						if (err) { err->message = "File exceeds maximum allowed size"; err->path = path; }
						return false;
					}

					std::string text;
					FileUtils::Error ferr;
					if (!FileUtils::ReadAllText(path, text, &ferr)) {
						if (err) { err->message = ferr.message; err->path = path; }
						return false;
					}

					// UTF-8 BOM
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
				catch (const std::bad_alloc&) {
					if (err) { err->message = "Out of memory while loading JSON"; err->path = path; }
					return false;
				}
			}

			bool SaveToFile(const std::filesystem::path& path, const Json& j, Error* err, const SaveOptions& opt) noexcept {
				if (err) err->clear();

				std::string text;
				if (!Stringify(j, text, opt)) {
					if (err) { err->message = "Failed to serialize JSON"; err->path = path; }
					return false;
				}
				text.push_back('\n');

				FileUtils::Error ferr;
				if (opt.atomicReplace) {
					if (!FileUtils::WriteAllTextAtomic(path, text, &ferr)) {
						if (err) { err->message = ferr.message; err->path = path; }
						return false;
					}
					return true;
				}

				if (path.has_parent_path() && !FileUtils::CreateDirectories(path.parent_path(), &ferr)) {
					if (err) { err->message = ferr.message; err->path = path; }
					return false;
				}

				std::ofstream outFile(path, std::ios::binary | std::ios::trunc);
				outFile.write(text.data(), static_cast<std::streamsize>(text.size()));
				if (!outFile) {
					if (err) { err->message = "Failed to write file"; err->path = path; }
					return false;
				}
				return true;
			}

			std::string ToJsonPointer(std::string_view pathLike) noexcept {
				try {
					if (pathLike.empty()) return "/";
					if (pathLike.front() == '/') return std::string(pathLike);

					std::string out;
					std::string token;

					auto flush = [&]() {
						if (token.empty()) return;
						EscapePointerToken(token);
						out.push_back('/');
						out += token;
						token.clear();
					};

					for (const char c : pathLike) {
						if (c == '.' || c == '[' || c == ']') {
							flush();
						}
						else {
							token.push_back(c);
						}
					}
					flush();

					return out.empty() ? std::string("/") : out;
				}
				catch (const std::bad_alloc&) {
					return "/";
				}
			}

			bool Contains(const Json& j, std::string_view pathLike) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp == "/") return true;
					return j.contains(nlohmann::json::json_pointer(jp));
				}
				catch (const nlohmann::json::exception&) {
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace TraceSweep
