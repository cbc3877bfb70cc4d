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
 * @file TelemetryRisk.hpp
 * @brief Ordered risk tiers shared by the pattern engine and the pattern catalog.
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace TraceSweep {
namespace Scanner {

/**
 * @brief Strength of evidence of data collection. Ordered None < ... < Critical.
 */
enum class TelemetryRisk : uint8_t {
    None = 0,
    Low = 1,
    Medium = 2,
    High = 3,
    Critical = 4
};

[[nodiscard]] constexpr const char* TelemetryRiskToString(TelemetryRisk risk) noexcept {
    switch (risk) {
        case TelemetryRisk::None:     return "None";
        case TelemetryRisk::Low:      return "Low";
        case TelemetryRisk::Medium:   return "Medium";
        case TelemetryRisk::High:     return "High";
        case TelemetryRisk::Critical: return "Critical";
        default:                      return "Unknown";
    }
}

/**
 * @brief Parse a risk name, ignoring ASCII case.
 */
[[nodiscard]] constexpr bool ParseTelemetryRisk(std::string_view text, TelemetryRisk& out) noexcept {
    constexpr std::string_view names[] = { "none", "low", "medium", "high", "critical" };
    for (size_t i = 0; i < 5; ++i) {
        const std::string_view name = names[i];
        if (name.size() != text.size()) continue;
        bool equal = true;
        for (size_t k = 0; k < name.size(); ++k) {
            char c = text[k];
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            if (c != name[k]) { equal = false; break; }
        }
        if (equal) {
            out = static_cast<TelemetryRisk>(i);
            return true;
        }
    }
    return false;
}

} // namespace Scanner
} // namespace TraceSweep
