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

#include "Utils/StringUtils.hpp"

using namespace TraceSweep::Utils::StringUtils;

TEST(StringUtilsTest, CaseConversion) {
    EXPECT_EQ(ToLowerCopy("Augment-Code"), "augment-code");
    EXPECT_EQ(ToUpperCopy("info"), "INFO");

    std::string s = "MiXeD";
    ToLower(s);
    EXPECT_EQ(s, "mixed");
}

TEST(StringUtilsTest, Trimming) {
    EXPECT_EQ(TrimCopy("  \t value \r\n"), "value");
    EXPECT_EQ(TrimCopy("   "), "");

    std::string s = "  Path=abc  ";
    Trim(s);
    EXPECT_EQ(s, "Path=abc");
}

TEST(StringUtilsTest, ContainsCaseInsensitive) {
    EXPECT_TRUE(ContainsCaseInsensitive("Google Chrome Helper", "chrome"));
    EXPECT_TRUE(ContainsCaseInsensitive("AUGMENT_SESSION", "augment_session"));
    EXPECT_TRUE(ContainsCaseInsensitive("anything", ""));
    EXPECT_FALSE(ContainsCaseInsensitive("firefox", "chrome"));
    EXPECT_FALSE(ContainsCaseInsensitive("ch", "chrome"));
}

TEST(StringUtilsTest, PrefixSuffixAndEquality) {
    EXPECT_TRUE(StartsWith("Profile 2", "Profile "));
    EXPECT_FALSE(StartsWith("Default", "Profile "));
    EXPECT_TRUE(EndsWith("000003.ldb", ".ldb"));
    EXPECT_TRUE(IEquals("Firefox", "FIREFOX"));
    EXPECT_FALSE(IEquals("Edge", "Edges"));
}

TEST(StringUtilsTest, SplitKeepsEmptyFields) {
    const auto parts = Split("a,,b", ",");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");

    EXPECT_TRUE(Split("", ",").empty());
}

TEST(StringUtilsTest, JoinAndReplace) {
    EXPECT_EQ(Join({ "chrome", "edge", "firefox" }, ", "), "chrome, edge, firefox");
    EXPECT_EQ(Join({}, ","), "");
    EXPECT_EQ(ReplaceAllCopy("Chrome - Profile 1", " ", "-"), "Chrome---Profile-1");
}
