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

#include <string>

#include "Browser/BrowserTypes.hpp"

using namespace TraceSweep::Browser;

TEST(BrowserTypesTest, FamilyToEngine) {
    EXPECT_EQ(GetEngineForFamily(BrowserFamily::Chrome), BrowserEngine::Chromium);
    EXPECT_EQ(GetEngineForFamily(BrowserFamily::Edge), BrowserEngine::Chromium);
    EXPECT_EQ(GetEngineForFamily(BrowserFamily::Firefox), BrowserEngine::Gecko);
    EXPECT_EQ(GetEngineForFamily(BrowserFamily::Safari), BrowserEngine::WebKit);
}

TEST(BrowserTypesTest, Names) {
    EXPECT_EQ(GetBrowserFamilyName(BrowserFamily::Edge), "Edge");
    EXPECT_EQ(GetBrowserDisplayName(BrowserFamily::Chrome), "Google Chrome");
    EXPECT_EQ(GetBrowserDisplayName(BrowserFamily::Firefox), "Mozilla Firefox");
    EXPECT_EQ(GetBrowserEngineName(BrowserEngine::Gecko), "Gecko");
    EXPECT_EQ(GetFileOutcomeName(FileOutcome::Skipped), "Skipped");
}

TEST(BrowserTypesTest, ParseFamilyIgnoresCase) {
    EXPECT_EQ(ParseBrowserFamily("chrome"), BrowserFamily::Chrome);
    EXPECT_EQ(ParseBrowserFamily("FIREFOX"), BrowserFamily::Firefox);
    EXPECT_EQ(ParseBrowserFamily("Safari"), BrowserFamily::Safari);
    EXPECT_FALSE(ParseBrowserFamily("opera").has_value());
    EXPECT_FALSE(ParseBrowserFamily("").has_value());
}

TEST(BrowserTypesTest, FinalizeSumsResults) {
    RunResult run;

    CleanResult a;
    a.cookiesDeleted = 5;
    a.storageDeleted = 2;
    a.filesDeleted = { "x", "y" };

    CleanResult b;
    b.cacheDeleted = 3;
    b.errors = { "Failed to create backup: disk full" };

    run.results = { a, b };
    run.Finalize();

    EXPECT_EQ(run.totalCookiesDeleted, 5);
    EXPECT_EQ(run.totalStorageDeleted, 2);
    EXPECT_EQ(run.totalCacheDeleted, 3);
    EXPECT_EQ(run.totalFilesDeleted, 2u);
    EXPECT_EQ(run.totalErrors, 1u);
    EXPECT_TRUE(run.HasErrors());
    EXPECT_EQ(a.TotalDeleted(), 7);

    // Finalize recomputes instead of accumulating
    run.Finalize();
    EXPECT_EQ(run.totalCookiesDeleted, 5);
}

TEST(BrowserTypesTest, CleanResultJsonOmitsMissingBackup) {
    CleanResult result;
    result.profile.name = "Chrome - Default";
    result.cookiesDeleted = 4;

    std::string json = result.ToJson();
    EXPECT_EQ(json.find("backup_path"), std::string::npos);
    EXPECT_NE(json.find("\"cookies_deleted\":4"), std::string::npos);

    result.backupPath = fs::path("/tmp/b");
    json = result.ToJson();
    EXPECT_NE(json.find("backup_path"), std::string::npos);
}

TEST(BrowserTypesTest, CountResultJson) {
    CountResult counts;
    ProfileCount entry;
    entry.profile.family = BrowserFamily::Firefox;
    entry.profile.name = "Firefox - dev";
    entry.count = 7;
    counts.profiles.push_back(entry);
    counts.total = 7;

    const std::string json = counts.ToJson();
    EXPECT_NE(json.find("\"total\":7"), std::string::npos);
    EXPECT_NE(json.find("\"family\":\"Firefox\""), std::string::npos);
}
