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
#include <gtest/gtest.h>

#include <algorithm>
#include <regex>
#include <string>
#include <vector>

#include "Scanner/BoundedRegex.hpp"
#include "Scanner/PatternEngine.hpp"

using namespace TraceSweep::Scanner;

namespace {

std::string Repeat(const std::string& piece, size_t minLength) {
    std::string out;
    while (out.size() < minLength) out += piece;
    return out;
}

size_t CountCategory(const std::vector<PatternMatch>& matches, MatchCategory category) {
    return static_cast<size_t>(std::count_if(matches.begin(), matches.end(),
        [category](const PatternMatch& m) { return m.category == category; }));
}

}  // namespace

class PatternEngineTest : public ::testing::Test {
protected:
    const PatternEngine& m_engine = PatternEngine::Instance();
};

TEST_F(PatternEngineTest, EmptyContentHasNoMatches) {
    EXPECT_TRUE(m_engine.Analyze("").empty());
    EXPECT_TRUE(m_engine.Analyze("const x = 1;\nreturn x;\n").empty());
}

TEST_F(PatternEngineTest, CommentMentioningReporterIsExcluded) {
    const auto matches = m_engine.Analyze("// uses telemetryReporter for debug");
    EXPECT_TRUE(matches.empty());
}

TEST_F(PatternEngineTest, ExclusionOverridesContextAndSemanticHits) {
    // The line trips a function-call regex and a Critical semantic key
    const auto matches = m_engine.Analyze("// reporter.trackEvent('telemetry')");
    EXPECT_TRUE(matches.empty());

    EXPECT_TRUE(m_engine.IsExcluded("it('sends telemetry', () => { /* test telemetry */ })"));
    EXPECT_TRUE(m_engine.IsExcluded("description: 'Turn off analytics'"));
    EXPECT_FALSE(m_engine.IsExcluded("reporter.sendTelemetryEvent('activate');"));
}

TEST_F(PatternEngineTest, FunctionCallAndSemanticOnSameLine) {
    const auto matches = m_engine.Analyze("reporter.sendTelemetryEvent('activate', data);");

    ASSERT_GE(matches.size(), 2u);

    const PatternMatch& call = matches[0];
    EXPECT_EQ(call.category, MatchCategory::FunctionCall);
    EXPECT_EQ(call.match, ".sendTelemetryEvent('activate', data)");
    EXPECT_EQ(call.line, 1u);
    EXPECT_EQ(call.column, 8u);
    EXPECT_EQ(call.risk, TelemetryRisk::High);
    EXPECT_NEAR(call.confidence, 0.95, 1e-9);

    const PatternMatch& semantic = matches[1];
    EXPECT_EQ(semantic.category, MatchCategory::Semantic);
    EXPECT_EQ(semantic.pattern, "sendtelemetryevent");
    EXPECT_EQ(semantic.risk, TelemetryRisk::Critical);
    EXPECT_EQ(semantic.column, 9u);

    EXPECT_EQ(PatternEngine::HighestRisk(matches), TelemetryRisk::Critical);
}

TEST_F(PatternEngineTest, ReporterConstructionIsCritical) {
    const auto matches = m_engine.Analyze("const r = new TelemetryReporter(id, version, key);");
    ASSERT_FALSE(matches.empty());
    EXPECT_EQ(matches[0].category, MatchCategory::FunctionCall);
    EXPECT_EQ(matches[0].risk, TelemetryRisk::Critical);
}

TEST_F(PatternEngineTest, CombinationFiresOncePerUnit) {
    const std::string content =
        "const id = vscode.env.machineId;\n"
        "const host = os.hostname();\n"
        "const ua = navigator.userAgent;\n"
        "const user = process.env.USERNAME;\n";

    const auto matches = m_engine.Analyze(content, "identity.js");

    size_t combos = 0;
    for (const auto& m : matches) {
        if (m.category != MatchCategory::Combination) continue;
        ++combos;
        EXPECT_EQ(m.pattern, "User Identification Combo");
        EXPECT_EQ(m.match, "Combination rule matched (4 patterns)");
        EXPECT_EQ(m.risk, TelemetryRisk::High);
        EXPECT_EQ(m.line, 0u);
        EXPECT_GE(m.confidence, PatternConstants::COMBINATION_CONFIDENCE_FLOOR);
    }
    EXPECT_EQ(combos, 1u);

    // Combination matches follow every line match
    EXPECT_EQ(matches.back().category, MatchCategory::Combination);
}

TEST_F(PatternEngineTest, CombinationNeedsThreshold) {
    const auto matches = m_engine.Analyze("const id = vscode.env.machineId;");
    EXPECT_EQ(CountCategory(matches, MatchCategory::Combination), 0u);
    EXPECT_EQ(CountCategory(matches, MatchCategory::Semantic), 1u);
}

TEST_F(PatternEngineTest, NetworkRuleFiresOnSingleQualifyingMatch) {
    const auto matches = m_engine.Analyze("await fetch('https://example.com/telemetry', opts);");

    const auto it = std::find_if(matches.begin(), matches.end(), [](const PatternMatch& m) {
        return m.category == MatchCategory::Combination && m.pattern == "Network Telemetry";
    });
    EXPECT_NE(it, matches.end());
}

TEST_F(PatternEngineTest, SurroundingLinesAreClippedAtEdges) {
    const std::string content =
        "a\n"
        "b\n"
        "x = os.hostname();\n"
        "c\n"
        "d\n"
        "e\n";
    const auto matches = m_engine.Analyze(content);

    ASSERT_FALSE(matches.empty());
    EXPECT_EQ(matches[0].line, 3u);
    EXPECT_EQ(matches[0].surrounding, (std::vector<std::string>{ "a", "b", "x = os.hostname();", "c", "d" }));

    const auto first = m_engine.Analyze("os.hostname()\nnext\n");
    ASSERT_FALSE(first.empty());
    EXPECT_EQ(first[0].surrounding.size(), 3u);
}

TEST_F(PatternEngineTest, CarriageReturnsAreStripped) {
    const auto matches = m_engine.Analyze("first\r\nperformance.now()\r\n");
    ASSERT_FALSE(matches.empty());
    EXPECT_EQ(matches[0].line, 2u);
    EXPECT_EQ(matches[0].context, "performance.now()");
}

TEST_F(PatternEngineTest, MinifiedLineIsScannedWithoutExhaustingStack) {
    const std::string line = "import x from 'y';" + Repeat("var q=performance.now();a=a+1;", 200000);

    const auto matches = m_engine.Analyze(line, "bundle.min.js");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].pattern, "performance.now");
    EXPECT_EQ(matches[0].line, 1u);
}

TEST_F(PatternEngineTest, CallDeepInsideLongLineIsReportedOnceAtItsColumn) {
    const std::string head = Repeat("var q=1;a=a+1;", 100000);
    const std::string line = head + "reporter.sendTelemetryEvent('activate', data);" + Repeat("var q=1;a=a+1;", 100000);

    const auto matches = m_engine.Analyze(line);
    ASSERT_EQ(CountCategory(matches, MatchCategory::FunctionCall), 1u);

    const auto call = std::find_if(matches.begin(), matches.end(),
        [](const PatternMatch& m) { return m.category == MatchCategory::FunctionCall; });
    EXPECT_EQ(call->match, ".sendTelemetryEvent('activate', data)");
    EXPECT_EQ(call->column, head.size() + 8);
}

TEST_F(PatternEngineTest, ExclusionAppliesToLongLines) {
    const std::string line = Repeat("var q=1;a=a+1;", 50000) + "// telemetry reporter.trackEvent('x')";
    EXPECT_TRUE(m_engine.IsExcluded(line));
    EXPECT_TRUE(m_engine.Analyze(line).empty());
}

TEST(BoundedRegexTest, MatchesAcrossWindowSeamsAreReportedOnce) {
    std::string text(20000, 'x');
    const std::vector<size_t> planted = { 0, 3582, 4094, 7166, 19997 };
    for (const size_t p : planted) text.replace(p, 3, "abc");

    const std::regex re("abc");
    std::vector<size_t> found;
    ForEachBoundedMatch(text, re, [&](size_t position, size_t length) {
        EXPECT_EQ(length, 3u);
        found.push_back(position);
    });
    EXPECT_EQ(found, planted);
}

TEST(BoundedRegexTest, SearchCoversTheWholeText) {
    std::string text(200000, 'x');
    const std::regex needle("needle", std::regex::icase);
    EXPECT_FALSE(BoundedSearch(text, needle));

    text.replace(text.size() - 6, 6, "NEEDLE");
    EXPECT_TRUE(BoundedSearch(text, needle));
    EXPECT_FALSE(BoundedSearch("", needle));
}

TEST(PatternScoringTest, ConfidenceFormula) {
    EXPECT_DOUBLE_EQ(PatternEngine::ScoreConfidence(TelemetryRisk::Low, MatchCategory::Semantic, 5), 0.50);
    EXPECT_NEAR(PatternEngine::ScoreConfidence(TelemetryRisk::Medium, MatchCategory::Semantic, 30), 0.75, 1e-9);
    EXPECT_DOUBLE_EQ(PatternEngine::ScoreConfidence(TelemetryRisk::Critical, MatchCategory::FunctionCall, 40), 1.0);
    EXPECT_DOUBLE_EQ(PatternEngine::ScoreConfidence(TelemetryRisk::Medium, MatchCategory::Combination, 5),
        PatternConstants::COMBINATION_CONFIDENCE_FLOOR);
    EXPECT_DOUBLE_EQ(PatternEngine::ScoreConfidence(TelemetryRisk::None, MatchCategory::Semantic, 1), 0.30);
}

TEST(WildcardContainsTest, OrderedGaps) {
    size_t pos = 99;
    EXPECT_TRUE(WildcardContains("await fetch('/telemetry')", "fetch.*telemetry", &pos));
    EXPECT_EQ(pos, 6u);
    EXPECT_FALSE(WildcardContains("telemetry then fetch", "fetch.*telemetry"));
    EXPECT_TRUE(WildcardContains("os.hostname()", "os.hostname"));
    EXPECT_FALSE(WildcardContains("hostname", "os.hostname"));
}

TEST(PatternStatisticsTest, TableSizes) {
    const PatternStatistics stats = PatternEngine::Instance().Statistics();
    EXPECT_EQ(stats.functionCallPatterns, 8u);
    EXPECT_EQ(stats.assignmentPatterns, 4u);
    EXPECT_EQ(stats.importPatterns, 3u);
    EXPECT_EQ(stats.configAccessPatterns, 3u);
    EXPECT_EQ(stats.ContextPatternTotal(), 18u);
    EXPECT_EQ(stats.semanticPatterns, 28u);
    EXPECT_EQ(stats.combinationRules, 4u);
    EXPECT_EQ(stats.exclusionPatterns, 10u);
}

TEST(TelemetryRiskTest, ParseAndOrder) {
    TelemetryRisk risk = TelemetryRisk::None;
    EXPECT_TRUE(ParseTelemetryRisk("HIGH", risk));
    EXPECT_EQ(risk, TelemetryRisk::High);
    EXPECT_FALSE(ParseTelemetryRisk("severe", risk));
    EXPECT_LT(TelemetryRisk::Medium, TelemetryRisk::Critical);
    EXPECT_STREQ(TelemetryRiskToString(TelemetryRisk::Low), "Low");
}
