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
#pragma once
/**
 * @file StringUtils.hpp
 * @brief Narrow-string helpers shared by the scanner and cleaners.
 *
 * All comparisons are ASCII case-folding. Browser file names, process
 * names and tracked-service variants are ASCII.
 */

#include <string>
#include <string_view>
#include <vector>

namespace TraceSweep {
	namespace Utils {
		namespace StringUtils {

			// ============================================================================
			// Case Conversion
			// ============================================================================

			void ToLower(std::string& str);
			[[nodiscard]] std::string ToLowerCopy(std::string_view str);

			void ToUpper(std::string& str);
			[[nodiscard]] std::string ToUpperCopy(std::string_view str);

			// ============================================================================
			// Trimming
			// ============================================================================

			void TrimLeft(std::string& str);
			void TrimRight(std::string& str);
			void Trim(std::string& str);
			[[nodiscard]] std::string TrimCopy(std::string_view str);

			// ============================================================================
			// Comparison
			// ============================================================================

			[[nodiscard]] bool IEquals(std::string_view s1, std::string_view s2) noexcept;
			[[nodiscard]] bool StartsWith(std::string_view str, std::string_view prefix) noexcept;
			[[nodiscard]] bool EndsWith(std::string_view str, std::string_view suffix) noexcept;
			[[nodiscard]] bool Contains(std::string_view str, std::string_view substr) noexcept;

			/**
			 * @brief Case-insensitive substring test.
			 * @return true when substr is empty or occurs in str ignoring ASCII case
			 */
			[[nodiscard]] bool ContainsCaseInsensitive(std::string_view str, std::string_view substr) noexcept;

			// ============================================================================
			// Splitting and Joining
			// ============================================================================

			/**
			 * @brief Split on every occurrence of delimiter. Empty fields are kept.
			 */
			[[nodiscard]] std::vector<std::string> Split(std::string_view str, std::string_view delimiter);

			[[nodiscard]] std::string Join(const std::vector<std::string>& elements, std::string_view delimiter);

			// ============================================================================
			// Replacement
			// ============================================================================

			void ReplaceAll(std::string& str, std::string_view from, std::string_view to);
			[[nodiscard]] std::string ReplaceAllCopy(std::string str, std::string_view from, std::string_view to);

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace TraceSweep
