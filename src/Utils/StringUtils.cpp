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
#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>

namespace TraceSweep {
	namespace Utils {
		namespace StringUtils {

			namespace {
				constexpr const char* WHITESPACE = " \t\n\r\f\v";

				inline char FoldAscii(char ch) noexcept {
					return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
				}
			}

			//lower case upper case transformations
			void ToLower(std::string& str) {
				std::transform(str.begin(), str.end(), str.begin(), FoldAscii);
			}

			std::string ToLowerCopy(std::string_view str) {
				std::string result(str);
				ToLower(result);
				return result;
			}

			void ToUpper(std::string& str) {
				std::transform(str.begin(), str.end(), str.begin(),
					[](char ch) { return static_cast<char>(std::toupper(static_cast<unsigned char>(ch))); });
			}

			std::string ToUpperCopy(std::string_view str) {
				std::string result(str);
				ToUpper(result);
				return result;
			}

			//Trimming functions
			void TrimLeft(std::string& str) {
				const size_t pos = str.find_first_not_of(WHITESPACE);
				if (pos == std::string::npos) {
					str.clear();
				}
				else {
					str.erase(0, pos);
				}
			}

			void TrimRight(std::string& str) {
				const size_t pos = str.find_last_not_of(WHITESPACE);
				if (pos == std::string::npos) {
					str.clear();
				}
				else {
					str.erase(pos + 1);
				}
			}

			void Trim(std::string& str) {
				TrimRight(str);
				TrimLeft(str);
			}

			std::string TrimCopy(std::string_view str) {
				std::string s(str);
				Trim(s);
				return s;
			}

			//Comparing
			bool IEquals(std::string_view s1, std::string_view s2) noexcept {
				if (s1.size() != s2.size()) return false;
				for (size_t i = 0; i < s1.size(); ++i) {
					if (FoldAscii(s1[i]) != FoldAscii(s2[i])) return false;
				}
				return true;
			}

			bool StartsWith(std::string_view str, std::string_view prefix) noexcept {
				return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
			}

			bool EndsWith(std::string_view str, std::string_view suffix) noexcept {
				return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
			}

			bool Contains(std::string_view str, std::string_view substr) noexcept {
				return str.find(substr) != std::string_view::npos;
			}

			bool ContainsCaseInsensitive(std::string_view str, std::string_view substr) noexcept {
				if (substr.empty()) return true;
				if (substr.size() > str.size()) return false;

				auto it = std::search(
					str.begin(), str.end(),
					substr.begin(), substr.end(),
					[](char ch1, char ch2) { return FoldAscii(ch1) == FoldAscii(ch2); }
				);
				return it != str.end();
			}

			//splitting and joining
			std::vector<std::string> Split(std::string_view str, std::string_view delimiter) {
				std::vector<std::string> result;
				if (str.empty()) {
					return result;
				}
				if (delimiter.empty()) {
					result.emplace_back(str);
					return result;
				}
				size_t last = 0;
				size_t next = 0;
				while ((next = str.find(delimiter, last)) != std::string_view::npos) {
					result.emplace_back(str.substr(last, next - last));
					last = next + delimiter.length();
				}
				result.emplace_back(str.substr(last));
				return result;
			}

			std::string Join(const std::vector<std::string>& elements, std::string_view delimiter) {
				std::string result;
				if (elements.empty()) {
					return result;
				}
				size_t total_size = (elements.size() - 1) * delimiter.size();
				for (const auto& s : elements) {
					total_size += s.size();
				}
				result.reserve(total_size);
				result += elements[0];
				for (size_t i = 1; i < elements.size(); ++i) {
					result += delimiter;
					result += elements[i];
				}
				return result;
			}

			//Changing
			void ReplaceAll(std::string& str, std::string_view from, std::string_view to) {
				if (from.empty()) {
					return;
				}

				// build into a fresh buffer so 'to' containing 'from' cannot loop
				std::string result;
				result.reserve(str.size());

				size_t last_pos = 0;
				size_t find_pos = 0;
				while ((find_pos = str.find(from, last_pos)) != std::string::npos) {
					result.append(str, last_pos, find_pos - last_pos);
					result.append(to);
					last_pos = find_pos + from.length();
				}
				result.append(str, last_pos, std::string::npos);

				str = std::move(result);
			}

			std::string ReplaceAllCopy(std::string str, std::string_view from, std::string_view to) {
				ReplaceAll(str, from, to);
				return str;
			}

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace TraceSweep
