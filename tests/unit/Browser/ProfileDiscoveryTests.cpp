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

#include "Browser/ProfileDiscovery.hpp"
#include "TestSupport.hpp"

using namespace TraceSweep::Browser;
using TraceSweep::Testing::TempDirectory;
using TraceSweep::Testing::WriteFile;

namespace {

constexpr const char* kProfilesIni =
    "[General]\n"
    "StartWithLastProfile=1\n"
    "\n"
    "[Profile0]\n"
    "Name=default-release\n"
    "IsRelative=1\n"
    "Path=Profiles/abcd.default-release\n"
    "Default=1\n"
    "\n"
    "[Profile1]\n"
    "IsRelative=1\n"
    "Path=Profiles/efgh.unnamed\n"
    "\n"
    "[Profile2]\n"
    "Name=missing\n"
    "IsRelative=1\n"
    "Path=Profiles/gone\n"
    "\n"
    "[Install4F96D1932A9F858E]\n"
    "Default=Profiles/abcd.default-release\n";

}  // namespace

class ProfileDiscoveryTest : public ::testing::Test {
protected:
    ProfileDiscovery MakeDiscovery(OsFlavor os = OsFlavor::Linux) const {
        DiscoveryOptions options;
        options.homeDirectory = m_home.Path();
        options.os = os;
        return ProfileDiscovery(options);
    }

    TempDirectory m_home{ "tracesweep_home" };
};

TEST_F(ProfileDiscoveryTest, EmptyHomeFindsNothing) {
    EXPECT_TRUE(MakeDiscovery().Discover().empty());
}

TEST_F(ProfileDiscoveryTest, ChromiumDefaultFirstThenSortedProfiles) {
    const fs::path base = m_home.Path() / ".config" / "google-chrome";
    fs::create_directories(base / "Profile 2");
    fs::create_directories(base / "Default");
    fs::create_directories(base / "Profile 1");
    fs::create_directories(base / "System Profile");
    fs::create_directories(base / "Crashpad");
    WriteFile(base / "Local State", "{}");

    const auto profiles = MakeDiscovery().Discover(BrowserFamily::Chrome);

    ASSERT_EQ(profiles.size(), 3u);
    EXPECT_EQ(profiles[0].name, "Chrome - Default");
    EXPECT_TRUE(profiles[0].isDefault);
    EXPECT_EQ(profiles[0].path, base / "Default");
    EXPECT_EQ(profiles[0].dataDir, base);
    EXPECT_EQ(profiles[1].name, "Chrome - Profile 1");
    EXPECT_FALSE(profiles[1].isDefault);
    EXPECT_EQ(profiles[2].name, "Chrome - Profile 2");
}

TEST_F(ProfileDiscoveryTest, ChromiumAlternateDataDirectory) {
    fs::create_directories(m_home.Path() / ".config" / "chromium" / "Default");
    fs::create_directories(m_home.Path() / ".config" / "microsoft-edge" / "Default");

    const auto chrome = MakeDiscovery().Discover(BrowserFamily::Chrome);
    ASSERT_EQ(chrome.size(), 1u);
    EXPECT_EQ(chrome[0].dataDir, m_home.Path() / ".config" / "chromium");

    const auto edge = MakeDiscovery().Discover(BrowserFamily::Edge);
    ASSERT_EQ(edge.size(), 1u);
    EXPECT_EQ(edge[0].name, "Edge - Default");
    EXPECT_EQ(edge[0].family, BrowserFamily::Edge);
}

TEST_F(ProfileDiscoveryTest, FirefoxProfilesFromIni) {
    const fs::path base = m_home.Path() / ".mozilla" / "firefox";
    fs::create_directories(base / "Profiles" / "abcd.default-release");
    fs::create_directories(base / "Profiles" / "efgh.unnamed");
    WriteFile(base / "profiles.ini", kProfilesIni);

    const auto profiles = MakeDiscovery().Discover(BrowserFamily::Firefox);

    ASSERT_EQ(profiles.size(), 2u);
    EXPECT_EQ(profiles[0].name, "Firefox - default-release");
    EXPECT_TRUE(profiles[0].isDefault);
    EXPECT_EQ(profiles[0].path, base / "Profiles" / "abcd.default-release");
    EXPECT_EQ(profiles[1].name, "Firefox Profile");
    EXPECT_FALSE(profiles[1].isDefault);
}

TEST_F(ProfileDiscoveryTest, FirefoxWithoutIniFindsNothing) {
    fs::create_directories(m_home.Path() / ".mozilla" / "firefox" / "Profiles" / "x.default");
    EXPECT_TRUE(MakeDiscovery().Discover(BrowserFamily::Firefox).empty());
}

TEST_F(ProfileDiscoveryTest, SafariOnlyOnMacOS) {
    fs::create_directories(m_home.Path() / "Library" / "Safari");

    EXPECT_TRUE(MakeDiscovery(OsFlavor::Linux).Discover(BrowserFamily::Safari).empty());

    const auto profiles = MakeDiscovery(OsFlavor::MacOS).Discover(BrowserFamily::Safari);
    ASSERT_EQ(profiles.size(), 1u);
    EXPECT_EQ(profiles[0].name, "Safari");
    EXPECT_EQ(profiles[0].family, BrowserFamily::Safari);
}

TEST_F(ProfileDiscoveryTest, DiscoverAllKeepsFamilyOrder) {
    fs::create_directories(m_home.Path() / ".config" / "microsoft-edge" / "Default");
    fs::create_directories(m_home.Path() / ".config" / "google-chrome" / "Default");
    const fs::path ff = m_home.Path() / ".mozilla" / "firefox";
    fs::create_directories(ff / "Profiles" / "abcd.default-release");
    WriteFile(ff / "profiles.ini", kProfilesIni);

    const auto profiles = MakeDiscovery().Discover();

    ASSERT_EQ(profiles.size(), 3u);
    EXPECT_EQ(profiles[0].family, BrowserFamily::Chrome);
    EXPECT_EQ(profiles[1].family, BrowserFamily::Edge);
    EXPECT_EQ(profiles[2].family, BrowserFamily::Firefox);
}

TEST(ProfilesIniTest, ParsesProfileSections) {
    const auto entries = ProfileDiscovery::ParseProfilesIni(kProfilesIni);

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "default-release");
    EXPECT_EQ(entries[0].path, "Profiles/abcd.default-release");
    EXPECT_TRUE(entries[0].isRelative);
    EXPECT_TRUE(entries[0].isDefault);
    EXPECT_TRUE(entries[1].name.empty());
    EXPECT_FALSE(entries[1].isDefault);
}

TEST(ProfilesIniTest, HandlesCrlfAbsolutePathsAndMissingPath) {
    const auto entries = ProfileDiscovery::ParseProfilesIni(
        "[Profile0]\r\n"
        "Name=work\r\n"
        "IsRelative=0\r\n"
        "Path=/srv/ff/work\r\n"
        "[Profile1]\r\n"
        "Name=broken\r\n");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "work");
    EXPECT_FALSE(entries[0].isRelative);
    EXPECT_EQ(entries[0].path, "/srv/ff/work");
}

TEST(ProfilesIniTest, BasePathsPerOs) {
    DiscoveryOptions options;
    options.homeDirectory = "/home/u";
    options.os = OsFlavor::Linux;
    const ProfileDiscovery onLinux(options);
    EXPECT_EQ(onLinux.BasePaths(BrowserFamily::Chrome).size(), 2u);
    EXPECT_TRUE(onLinux.BasePaths(BrowserFamily::Safari).empty());

    options.os = OsFlavor::MacOS;
    const ProfileDiscovery mac(options);
    ASSERT_EQ(mac.BasePaths(BrowserFamily::Safari).size(), 1u);
    EXPECT_EQ(mac.BasePaths(BrowserFamily::Safari)[0], fs::path("/home/u") / "Library" / "Safari");
}
