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
/**
 * ============================================================================
 * TraceSweep - PATTERN ENGINE MODULE
 * ============================================================================
 *
 * @file PatternEngine.hpp
 * @brief Layered telemetry classifier for source and configuration text.
 *
 * ANALYSIS LAYERS (in order):
 * ===========================
 *
 * 1. CONTEXT PATTERNS
 *    - Case-insensitive regexes grouped as function_call, assignment,
 *      import and config_access
 *    - Every non-overlapping occurrence on a line is reported
 *
 * 2. SEMANTIC PATTERNS
 *    - Lower-cased keys matched against the lower-cased line
 *    - A key containing ".*" is an ordered gap wildcard
 *    - At most one match per key per line
 *
 * 3. COMBINATION RULES
 *    - Meta-patterns over co-occurring weaker signals
 *    - Each rule adds at most one synthetic match per content unit
 *
 * 4. EXCLUSION FILTERING
 *    - Drops matches whose context line looks like a comment, a UI
 *      string, a description/title or test code
 *
 * 5. CONFIDENCE SCORING
 *    - Base by risk plus category and specificity boosts, clamped to 1.0
 *
 * @note The tables are built once per engine and never mutated, so one
 *       engine may be shared across threads.
 * ============================================================================
 */

#pragma once

// ============================================================================
// STANDARD LIBRARY INCLUDES
// ============================================================================

#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "TelemetryRisk.hpp"

namespace TraceSweep {
namespace Scanner {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace PatternConstants {

    inline constexpr double CONFIDENCE_CRITICAL = 0.95;
    inline constexpr double CONFIDENCE_HIGH = 0.85;
    inline constexpr double CONFIDENCE_MEDIUM = 0.70;
    inline constexpr double CONFIDENCE_LOW = 0.50;
    inline constexpr double CONFIDENCE_NONE = 0.30;

    inline constexpr double BOOST_FUNCTION_CALL = 0.05;
    inline constexpr double BOOST_COMBINATION = 0.10;
    inline constexpr double BOOST_LONG_MATCH = 0.05;
    inline constexpr size_t LONG_MATCH_THRESHOLD = 20;

    /// Combination matches never score below this
    inline constexpr double COMBINATION_CONFIDENCE_FLOOR = 0.90;

    /// Lines of context kept on each side of a match
    inline constexpr size_t SURROUNDING_RADIUS = 2;

}  // namespace PatternConstants

// ============================================================================
// ENUMERATIONS
// ============================================================================

enum class MatchCategory : uint8_t {
    FunctionCall = 0,
    Assignment,
    Import,
    ConfigAccess,
    Semantic,
    Combination
};

[[nodiscard]] const char* MatchCategoryToString(MatchCategory category) noexcept;

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief One detection instance.
 */
struct PatternMatch {
    /// @brief Source pattern identifier (regex text, semantic key or rule name)
    std::string pattern;

    /// @brief Matched text
    std::string match;

    /// @brief Full line (or rule description for combination matches)
    std::string context;

    TelemetryRisk risk = TelemetryRisk::None;
    MatchCategory category = MatchCategory::Semantic;

    /// @brief 1-based line number (0 for combination matches)
    size_t line = 0;

    /// @brief 0-based byte column of the match within the line
    size_t column = 0;

    /// @brief Confidence in [0, 1]
    double confidence = 0.0;

    /// @brief Up to two lines before and after the match line, inclusive of it
    std::vector<std::string> surrounding;

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Meta-pattern over co-occurring matches.
 */
struct CombinationRule {
    std::string name;
    std::vector<std::string> patterns;     ///< Constituent identifiers (lower-case, ".*" allowed)
    size_t minMatches = 1;                 ///< Distinct qualifying matches needed
    TelemetryRisk risk = TelemetryRisk::None;
    std::string description;
};

/**
 * @brief Pattern counts per layer.
 */
struct PatternStatistics {
    size_t functionCallPatterns = 0;
    size_t assignmentPatterns = 0;
    size_t importPatterns = 0;
    size_t configAccessPatterns = 0;
    size_t semanticPatterns = 0;
    size_t combinationRules = 0;
    size_t exclusionPatterns = 0;

    [[nodiscard]] size_t ContextPatternTotal() const noexcept {
        return functionCallPatterns + assignmentPatterns + importPatterns + configAccessPatterns;
    }

    [[nodiscard]] std::string ToJson() const;
};

// ============================================================================
// MATCHING HELPERS
// ============================================================================

/**
 * @brief Ordered gap-wildcard containment.
 *
 * @p key is split on ".*"; every piece must occur in @p haystack in order.
 * A key without ".*" is a plain substring test. Both arguments are expected
 * lower-cased.
 *
 * @param firstPos Receives the offset of the first piece when found
 */
[[nodiscard]] bool WildcardContains(std::string_view haystack, std::string_view key, size_t* firstPos = nullptr) noexcept;

// ============================================================================
// PATTERN ENGINE
// ============================================================================

class PatternEngine {
public:
    /**
     * @brief Process-wide engine with the built-in tables.
     */
    [[nodiscard]] static const PatternEngine& Instance();

    PatternEngine();

    PatternEngine(const PatternEngine&) = delete;
    PatternEngine& operator=(const PatternEngine&) = delete;

    /**
     * @brief Classify one content unit.
     *
     * Matches are ordered by line, then by pattern declaration order
     * (context categories first, then the semantic table). Combination
     * matches follow in rule order.
     *
     * @param unitId Identifier of the unit, used for logging only
     */
    [[nodiscard]] std::vector<PatternMatch> Analyze(std::string_view content, std::string_view unitId = {}) const;

    [[nodiscard]] PatternStatistics Statistics() const noexcept;

    [[nodiscard]] const std::vector<CombinationRule>& CombinationRules() const noexcept { return m_rules; }

    /**
     * @brief Score one match from its risk, category and matched-text length.
     *
     * Combination matches are held at or above COMBINATION_CONFIDENCE_FLOOR.
     */
    [[nodiscard]] static double ScoreConfidence(TelemetryRisk risk, MatchCategory category, size_t matchLength) noexcept;

    /// @brief Highest risk in @p matches, None when empty
    [[nodiscard]] static TelemetryRisk HighestRisk(const std::vector<PatternMatch>& matches) noexcept;

    /// @brief true when @p line trips any exclusion pattern; long lines are checked window by window
    [[nodiscard]] bool IsExcluded(const std::string& line) const;

private:
    struct ContextPattern {
        std::string source;
        std::regex regex;
        MatchCategory category;
    };

    struct SemanticPattern {
        std::string key;
        TelemetryRisk risk;
    };

    void addContext(MatchCategory category, std::initializer_list<const char*> sources);

    void analyzeLine(const std::vector<std::string>& lines, size_t index, std::vector<PatternMatch>& out) const;
    void applyCombinationRules(const std::vector<PatternMatch>& matches, std::vector<PatternMatch>& out) const;

    static TelemetryRisk contextRisk(MatchCategory category, std::string_view matchText);
    static std::vector<std::string> surroundingLines(const std::vector<std::string>& lines, size_t index);

    std::vector<ContextPattern> m_context;
    std::vector<SemanticPattern> m_semantic;
    std::vector<CombinationRule> m_rules;
    std::vector<std::regex> m_exclusions;
};

} // namespace Scanner
} // namespace TraceSweep
