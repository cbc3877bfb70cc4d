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
 * @file BoundedRegex.hpp
 * @brief Regex search over long lines in fixed-size overlapping windows.
 *
 * std::regex backtracks recursively, one frame per consumed character, so a
 * single search over a minified bundle line can exhaust the stack. Every
 * regex layer of the scanner goes through these helpers, which never hand
 * the engine more than REGEX_WINDOW characters at once.
 */

#include <algorithm>
#include <cstddef>
#include <regex>
#include <string_view>

namespace TraceSweep {
namespace Scanner {

namespace RegexLimits {

    /// Largest span handed to std::regex in one call
    inline constexpr size_t REGEX_WINDOW = 4096;

    /// Characters shared by consecutive windows; matches longer than this may be missed across a seam
    inline constexpr size_t REGEX_WINDOW_OVERLAP = 512;

}  // namespace RegexLimits

/**
 * @brief Calls @p onMatch(position, length) for every non-overlapping match in @p text.
 *
 * Short texts are searched in one pass. Longer ones are searched window by
 * window; a match is reported once, at its absolute position, and matches
 * that begin inside an already reported one are dropped.
 */
template <typename OnMatch>
void ForEachBoundedMatch(std::string_view text, const std::regex& re, OnMatch&& onMatch) {
    using namespace RegexLimits;
    using Iterator = std::regex_iterator<std::string_view::const_iterator>;

    const size_t step = REGEX_WINDOW - REGEX_WINDOW_OVERLAP;
    size_t reportedEnd = 0;

    for (size_t start = 0; start < text.size() || start == 0; start += step) {
        const size_t length = std::min(REGEX_WINDOW, text.size() - start);
        const bool lastWindow = start + length >= text.size();
        const auto first = text.begin() + static_cast<std::ptrdiff_t>(start);

        for (Iterator it(first, first + static_cast<std::ptrdiff_t>(length), re); it != Iterator(); ++it) {
            const size_t relative = static_cast<size_t>(it->position(0));
            if (!lastWindow && relative >= step) break;

            const size_t absolute = start + relative;
            if (absolute < reportedEnd) continue;

            const size_t matchLength = static_cast<size_t>(it->length(0));
            onMatch(absolute, matchLength);
            reportedEnd = absolute + std::max<size_t>(matchLength, 1);
        }

        if (lastWindow) break;
    }
}

/// @brief true when @p re matches anywhere in @p text, searched window by window
inline bool BoundedSearch(std::string_view text, const std::regex& re) {
    using namespace RegexLimits;

    const size_t step = REGEX_WINDOW - REGEX_WINDOW_OVERLAP;
    for (size_t start = 0; start < text.size() || start == 0; start += step) {
        const size_t length = std::min(REGEX_WINDOW, text.size() - start);
        const auto first = text.begin() + static_cast<std::ptrdiff_t>(start);
        if (std::regex_search(first, first + static_cast<std::ptrdiff_t>(length), re)) return true;
        if (start + length >= text.size()) break;
    }
    return false;
}

} // namespace Scanner
} // namespace TraceSweep
