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
 * TraceSweep - PATTERN ENGINE IMPLEMENTATION
 * ============================================================================
 *
 * @file PatternEngine.cpp
 * @brief Table construction and the five analysis layers.
 * ============================================================================
 */

#include "PatternEngine.hpp"
#include "BoundedRegex.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace TraceSweep {
namespace Scanner {

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

/// Splits on '\n'; a trailing '\r' is dropped from each line.
std::vector<std::string> SplitLines(std::string_view content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        const size_t nl = content.find('\n', start);
        std::string_view piece = content.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
        if (!piece.empty() && piece.back() == '\r') piece.remove_suffix(1);
        lines.emplace_back(piece);
        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }
    return lines;
}

}  // namespace

// ============================================================================
// ENUM / STRUCT HELPERS
// ============================================================================

const char* MatchCategoryToString(MatchCategory category) noexcept {
    switch (category) {
        case MatchCategory::FunctionCall: return "function_call";
        case MatchCategory::Assignment:   return "assignment";
        case MatchCategory::Import:       return "import";
        case MatchCategory::ConfigAccess: return "config_access";
        case MatchCategory::Semantic:     return "semantic";
        case MatchCategory::Combination:  return "combination";
        default:                          return "unknown";
    }
}

std::string PatternMatch::ToJson() const {
    nlohmann::json j;
    j["pattern"] = pattern;
    j["match"] = match;
    j["context"] = context;
    j["risk"] = TelemetryRiskToString(risk);
    j["category"] = MatchCategoryToString(category);
    j["line"] = line;
    j["column"] = column;
    j["confidence"] = confidence;
    j["surrounding"] = surrounding;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string PatternStatistics::ToJson() const {
    nlohmann::json j;
    j["function_call"] = functionCallPatterns;
    j["assignment"] = assignmentPatterns;
    j["import"] = importPatterns;
    j["config_access"] = configAccessPatterns;
    j["semantic_patterns"] = semanticPatterns;
    j["combination_rules"] = combinationRules;
    j["exclusion_patterns"] = exclusionPatterns;
    return j.dump();
}

bool WildcardContains(std::string_view haystack, std::string_view key, size_t* firstPos) noexcept {
    constexpr std::string_view kGap = ".*";

    size_t cursor = 0;
    size_t pieceStart = 0;
    bool first = true;

    while (true) {
        const size_t gap = key.find(kGap, pieceStart);
        const std::string_view piece = key.substr(pieceStart, gap == std::string_view::npos ? std::string_view::npos : gap - pieceStart);

        if (!piece.empty()) {
            const size_t found = haystack.find(piece, cursor);
            if (found == std::string_view::npos) return false;
            if (first) {
                if (firstPos) *firstPos = found;
                first = false;
            }
            cursor = found + piece.size();
        }

        if (gap == std::string_view::npos) break;
        pieceStart = gap + kGap.size();
    }

    if (first && firstPos) *firstPos = 0;
    return true;
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

const PatternEngine& PatternEngine::Instance() {
    static const PatternEngine instance;
    return instance;
}

PatternEngine::PatternEngine() {
    // Layer 1: context patterns, declaration order is reporting order
    addContext(MatchCategory::FunctionCall, {
        R"re(new\s+TelemetryReporter\s*\([^)]*\))re",
        R"re(\.sendTelemetryEvent\s*\([^)]*\))re",
        R"re(\.sendTelemetryException\s*\([^)]*\))re",
        R"re(\.trackEvent\s*\([^)]*\))re",
        R"re(\.trackException\s*\([^)]*\))re",
        R"re(fetch\s*\(\s*['"][^'"]*telemetry[^'"]*['"])re",
        R"re(axios\.\w+\s*\(\s*['"][^'"]*analytics[^'"]*['"])re",
        R"re(http\.request\s*\([^)]*telemetry[^)]*\))re",
    });

    addContext(MatchCategory::Assignment, {
        R"re((?:const|let|var)\s+\w*(?:telemetry|analytics|tracking)\w*\s*=)re",
        R"re(\w*(?:machineId|deviceId|sessionId)\w*\s*=\s*vscode\.env\.\w+)re",
        R"re(\w*hostname\w*\s*=\s*os\.hostname\s*\(\))re",
        R"re(\w*userAgent\w*\s*=\s*navigator\.userAgent)re",
    });

    addContext(MatchCategory::Import, {
        R"re((?:import|require)\s*\([^)]*(?:telemetry|analytics|applicationinsights)[^)]*\))re",
        R"re(from\s+['"][^'"]*(?:telemetry|analytics)[^'"]*['"])re",
        R"re(import\s+.*\s+from\s+['"][^'"]*(?:telemetry|analytics)[^'"]*['"])re",
    });

    addContext(MatchCategory::ConfigAccess, {
        R"re(vscode\.workspace\.getConfiguration\s*\([^)]*(?:telemetry|analytics)[^)]*\))re",
        R"re(context\.globalState\.(?:get|update)\s*\([^)]*(?:telemetry|usage|analytics)[^)]*\))re",
        R"re(context\.workspaceState\.(?:get|update)\s*\([^)]*(?:telemetry|usage)[^)]*\))re",
    });

    // Layer 2: semantic keys
    m_semantic = {
        { "telemetryreporter",        TelemetryRisk::Critical },
        { "sendtelemetryevent",       TelemetryRisk::Critical },
        { "sendtelemetryexception",   TelemetryRisk::Critical },
        { "applicationinsights",      TelemetryRisk::Critical },
        { "trackevent",               TelemetryRisk::Critical },
        { "trackexception",           TelemetryRisk::Critical },

        { "vscode.env.machineid",     TelemetryRisk::High },
        { "vscode.env.sessionid",     TelemetryRisk::High },
        { "os.hostname",              TelemetryRisk::High },
        { "navigator.useragent",      TelemetryRisk::High },
        { "process.env.user",         TelemetryRisk::High },
        { "process.env.username",     TelemetryRisk::High },
        { "process.env.computername", TelemetryRisk::High },
        { "fetch.*telemetry",         TelemetryRisk::High },
        { "axios.*analytics",         TelemetryRisk::High },
        { "http.*telemetry",          TelemetryRisk::High },

        { "globalstate.*telemetry",   TelemetryRisk::Medium },
        { "workspacestate.*usage",    TelemetryRisk::Medium },
        { "localstorage.*analytics",  TelemetryRisk::Medium },
        { "sessionstorage.*tracking", TelemetryRisk::Medium },

        { "performance.now",          TelemetryRisk::Low },
        { "performance.mark",         TelemetryRisk::Low },
        { "performance.measure",      TelemetryRisk::Low },
        { "console.time",             TelemetryRisk::Low },

        { "crashreporter",            TelemetryRisk::Medium },
        { "errorreporter",            TelemetryRisk::Medium },
        { "uncaughtexception",        TelemetryRisk::Medium },
        { "unhandledrejection",       TelemetryRisk::Medium },
    };

    // Layer 3: combination rules
    m_rules = {
        { "Active Telemetry Implementation",
          { "telemetryreporter", "sendtelemetryevent", "machineid" },
          2, TelemetryRisk::Critical,
          "Extension actively implements telemetry with machine identification" },
        { "Network Telemetry",
          { "fetch.*telemetry", "axios.*analytics", "http.*telemetry" },
          1, TelemetryRisk::High,
          "Extension makes network requests to telemetry endpoints" },
        { "User Identification Combo",
          { "machineid", "hostname", "useragent", "username" },
          2, TelemetryRisk::High,
          "Extension collects multiple user/machine identifiers" },
        { "Data Collection and Storage",
          { "globalstate.*telemetry", "localstorage.*analytics", "performance" },
          2, TelemetryRisk::Medium,
          "Extension collects and stores usage/performance data" },
    };

    // Layer 4: exclusions
    for (const char* source : {
        R"re(//.*(?:telemetry|analytics|tracking))re",
        R"re(/\*.*(?:telemetry|analytics|tracking).*\*/)re",
        R"re(\*.*(?:telemetry|analytics|tracking))re",
        R"re(['"].*(?:disable|turn off|opt out).*(?:telemetry|analytics).*['"])re",
        R"re(['"].*(?:telemetry|analytics).*(?:disabled|off|false).*['"])re",
        R"re(description.*['"].*(?:telemetry|analytics).*['"])re",
        R"re(title.*['"].*(?:telemetry|analytics).*['"])re",
        R"re(test.*(?:telemetry|analytics))re",
        R"re(mock.*(?:telemetry|analytics))re",
        R"re(spec.*(?:telemetry|analytics))re",
    }) {
        m_exclusions.emplace_back(source, kRegexFlags);
    }
}

void PatternEngine::addContext(MatchCategory category, std::initializer_list<const char*> sources) {
    for (const char* source : sources) {
        m_context.push_back(ContextPattern{ source, std::regex(source, kRegexFlags), category });
    }
}

// ============================================================================
// ANALYSIS
// ============================================================================

std::vector<PatternMatch> PatternEngine::Analyze(std::string_view content, std::string_view unitId) const {
    std::vector<PatternMatch> raw;
    if (content.empty()) return raw;

    const std::vector<std::string> lines = SplitLines(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        analyzeLine(lines, i, raw);
    }

    applyCombinationRules(raw, raw);

    std::vector<PatternMatch> result;
    result.reserve(raw.size());
    for (auto& m : raw) {
        if (IsExcluded(m.context)) continue;

        const double scored = ScoreConfidence(m.risk, m.category, m.match.size());
        m.confidence = scored;
        result.push_back(std::move(m));
    }

    TS_LOG_DEBUG("Pattern", "Analyzed %.*s: %zu lines, %zu matches",
        static_cast<int>(unitId.size()), unitId.data(), lines.size(), result.size());
    return result;
}

void PatternEngine::analyzeLine(const std::vector<std::string>& lines, size_t index, std::vector<PatternMatch>& out) const {
    const std::string& line = lines[index];
    if (line.empty()) return;

    if (line.size() > RegexLimits::REGEX_WINDOW) {
        TS_LOG_DEBUG("Pattern", "Line %zu is %zu characters, scanning in windows", index + 1, line.size());
    }

    for (const auto& cp : m_context) {
        ForEachBoundedMatch(line, cp.regex, [&](size_t position, size_t length) {
            PatternMatch m;
            m.pattern = cp.source;
            m.match = line.substr(position, length);
            m.context = line;
            m.risk = contextRisk(cp.category, m.match);
            m.category = cp.category;
            m.line = index + 1;
            m.column = position;
            m.surrounding = surroundingLines(lines, index);
            out.push_back(std::move(m));
        });
    }

    const std::string lower = Utils::StringUtils::ToLowerCopy(line);
    for (const auto& sp : m_semantic) {
        size_t pos = 0;
        if (!WildcardContains(lower, sp.key, &pos)) continue;

        PatternMatch m;
        m.pattern = sp.key;
        m.match = sp.key;
        m.context = line;
        m.risk = sp.risk;
        m.category = MatchCategory::Semantic;
        m.line = index + 1;
        m.column = pos;
        m.surrounding = surroundingLines(lines, index);
        out.push_back(std::move(m));
    }
}

void PatternEngine::applyCombinationRules(const std::vector<PatternMatch>& matches, std::vector<PatternMatch>& out) const {
    std::vector<PatternMatch> synthetic;

    for (const auto& rule : m_rules) {
        size_t count = 0;

        for (const auto& m : matches) {
            if (m.category == MatchCategory::Combination) continue;

            const std::string pattern = Utils::StringUtils::ToLowerCopy(m.pattern);
            const std::string text = Utils::StringUtils::ToLowerCopy(m.match);

            for (const auto& constituent : rule.patterns) {
                if (WildcardContains(pattern, constituent) || WildcardContains(text, constituent)) {
                    ++count;
                    break;
                }
            }
        }

        if (count >= rule.minMatches) {
            PatternMatch m;
            m.pattern = rule.name;
            m.match = "Combination rule matched (" + std::to_string(count) + " patterns)";
            m.context = rule.description;
            m.risk = rule.risk;
            m.category = MatchCategory::Combination;
            m.confidence = PatternConstants::COMBINATION_CONFIDENCE_FLOOR;
            synthetic.push_back(std::move(m));
        }
    }

    for (auto& m : synthetic) {
        out.push_back(std::move(m));
    }
}

bool PatternEngine::IsExcluded(const std::string& line) const {
    for (const auto& re : m_exclusions) {
        if (BoundedSearch(line, re)) return true;
    }
    return false;
}

// ============================================================================
// SCORING
// ============================================================================

double PatternEngine::ScoreConfidence(TelemetryRisk risk, MatchCategory category, size_t matchLength) noexcept {
    using namespace PatternConstants;

    double confidence = CONFIDENCE_NONE;
    switch (risk) {
        case TelemetryRisk::Critical: confidence = CONFIDENCE_CRITICAL; break;
        case TelemetryRisk::High:     confidence = CONFIDENCE_HIGH; break;
        case TelemetryRisk::Medium:   confidence = CONFIDENCE_MEDIUM; break;
        case TelemetryRisk::Low:      confidence = CONFIDENCE_LOW; break;
        default:                      confidence = CONFIDENCE_NONE; break;
    }

    if (category == MatchCategory::FunctionCall) confidence += BOOST_FUNCTION_CALL;
    if (category == MatchCategory::Combination) confidence += BOOST_COMBINATION;
    if (matchLength > LONG_MATCH_THRESHOLD) confidence += BOOST_LONG_MATCH;

    confidence = std::min(confidence, 1.0);
    if (category == MatchCategory::Combination) {
        confidence = std::max(confidence, COMBINATION_CONFIDENCE_FLOOR);
    }
    return confidence;
}

TelemetryRisk PatternEngine::HighestRisk(const std::vector<PatternMatch>& matches) noexcept {
    TelemetryRisk highest = TelemetryRisk::None;
    for (const auto& m : matches) {
        if (highest < m.risk) highest = m.risk;
    }
    return highest;
}

TelemetryRisk PatternEngine::contextRisk(MatchCategory category, std::string_view matchText) {
    const std::string lower = Utils::StringUtils::ToLowerCopy(matchText);
    switch (category) {
        case MatchCategory::FunctionCall:
            return lower.find("telemetryreporter") != std::string::npos ? TelemetryRisk::Critical : TelemetryRisk::High;
        case MatchCategory::Assignment:
            return lower.find("machineid") != std::string::npos ? TelemetryRisk::High : TelemetryRisk::Medium;
        case MatchCategory::Import:
            return TelemetryRisk::High;
        case MatchCategory::ConfigAccess:
            return TelemetryRisk::Medium;
        default:
            return TelemetryRisk::Low;
    }
}

std::vector<std::string> PatternEngine::surroundingLines(const std::vector<std::string>& lines, size_t index) {
    const size_t radius = PatternConstants::SURROUNDING_RADIUS;
    const size_t start = index >= radius ? index - radius : 0;
    const size_t end = std::min(index + radius, lines.size() - 1);
    return std::vector<std::string>(lines.begin() + static_cast<std::ptrdiff_t>(start),
        lines.begin() + static_cast<std::ptrdiff_t>(end + 1));
}

// ============================================================================
// STATISTICS
// ============================================================================

PatternStatistics PatternEngine::Statistics() const noexcept {
    PatternStatistics stats;
    for (const auto& cp : m_context) {
        switch (cp.category) {
            case MatchCategory::FunctionCall: ++stats.functionCallPatterns; break;
            case MatchCategory::Assignment:   ++stats.assignmentPatterns; break;
            case MatchCategory::Import:       ++stats.importPatterns; break;
            case MatchCategory::ConfigAccess: ++stats.configAccessPatterns; break;
            default: break;
        }
    }
    stats.semanticPatterns = m_semantic.size();
    stats.combinationRules = m_rules.size();
    stats.exclusionPatterns = m_exclusions.size();
    return stats;
}

} // namespace Scanner
} // namespace TraceSweep
