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
 * @file TelemetryPatterns.hpp
 * @brief Named library of literal telemetry patterns.
 *
 * Each definition carries a risk, a human category, a description and
 * example lines. Patterns are compiled case-insensitively once.
 */

#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "TelemetryRisk.hpp"

namespace TraceSweep {
namespace Scanner {

struct TelemetryPatternDefinition {
    std::string name;
    std::string pattern;
    TelemetryRisk risk = TelemetryRisk::None;
    std::string category;
    std::string description;
    std::vector<std::string> examples;
    std::regex regex;

    [[nodiscard]] std::string ToJson() const;
};

class TelemetryPatternCatalog {
public:
    [[nodiscard]] static const TelemetryPatternCatalog& Instance();

    TelemetryPatternCatalog();

    TelemetryPatternCatalog(const TelemetryPatternCatalog&) = delete;
    TelemetryPatternCatalog& operator=(const TelemetryPatternCatalog&) = delete;

    /// @brief All definitions in declaration order
    [[nodiscard]] const std::vector<TelemetryPatternDefinition>& Patterns() const noexcept { return m_patterns; }

    [[nodiscard]] const TelemetryPatternDefinition* Find(std::string_view name) const noexcept;

    /// @brief Definitions whose regex matches somewhere in @p line, in declaration order
    [[nodiscard]] std::vector<const TelemetryPatternDefinition*> MatchLine(const std::string& line) const;

    [[nodiscard]] std::vector<const TelemetryPatternDefinition*> ByRisk(TelemetryRisk risk) const;

    /// @brief Definitions in @p category, compared ignoring ASCII case
    [[nodiscard]] std::vector<const TelemetryPatternDefinition*> ByCategory(std::string_view category) const;

    [[nodiscard]] static const char* RiskDescription(TelemetryRisk risk) noexcept;

private:
    void add(const char* name, TelemetryRisk risk, const char* category, const char* pattern,
        const char* description, std::vector<std::string> examples);

    std::vector<TelemetryPatternDefinition> m_patterns;
};

} // namespace Scanner
} // namespace TraceSweep
