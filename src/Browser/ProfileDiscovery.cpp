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
#include "ProfileDiscovery.hpp"

#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

namespace TraceSweep {
namespace Browser {

namespace {

constexpr const char* LOG_CATEGORY = "Discovery";
constexpr const char* PROFILES_INI = "profiles.ini";

bool DirectoryExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

}  // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

ProfileDiscovery::ProfileDiscovery()
    : ProfileDiscovery(DiscoveryOptions{}) {
}

ProfileDiscovery::ProfileDiscovery(DiscoveryOptions options)
    : m_options(std::move(options)) {
    if (m_options.homeDirectory.empty()) {
        m_options.homeDirectory = Utils::FileUtils::HomeDirectory();
    }
}

// ============================================================================
// PATH TABLES
// ============================================================================

std::vector<fs::path> ProfileDiscovery::BasePaths(BrowserFamily family) const {
    const fs::path& home = m_options.homeDirectory;
    std::vector<fs::path> paths;

    switch (m_options.os) {
        case OsFlavor::Linux:
            switch (family) {
                case BrowserFamily::Chrome:
                    paths.push_back(home / ".config" / "google-chrome");
                    paths.push_back(home / ".config" / "chromium");
                    break;
                case BrowserFamily::Edge:
                    paths.push_back(home / ".config" / "microsoft-edge");
                    break;
                case BrowserFamily::Firefox:
                    paths.push_back(home / ".mozilla" / "firefox");
                    break;
                case BrowserFamily::Safari:
                    break;
            }
            break;

        case OsFlavor::MacOS:
            switch (family) {
                case BrowserFamily::Chrome:
                    paths.push_back(home / "Library" / "Application Support" / "Google" / "Chrome");
                    break;
                case BrowserFamily::Edge:
                    paths.push_back(home / "Library" / "Application Support" / "Microsoft Edge");
                    break;
                case BrowserFamily::Firefox:
                    paths.push_back(home / "Library" / "Application Support" / "Firefox");
                    break;
                case BrowserFamily::Safari:
                    paths.push_back(home / "Library" / "Safari");
                    break;
            }
            break;

        case OsFlavor::Windows:
            switch (family) {
                case BrowserFamily::Chrome:
                    paths.push_back(home / "AppData" / "Local" / "Google" / "Chrome" / "User Data");
                    break;
                case BrowserFamily::Edge:
                    paths.push_back(home / "AppData" / "Local" / "Microsoft" / "Edge" / "User Data");
                    break;
                case BrowserFamily::Firefox:
                    paths.push_back(home / "AppData" / "Roaming" / "Mozilla" / "Firefox");
                    break;
                case BrowserFamily::Safari:
                    break;
            }
            break;
    }

    return paths;
}

// ============================================================================
// DISCOVERY
// ============================================================================

std::vector<BrowserProfile> ProfileDiscovery::Discover() const {
    std::vector<BrowserProfile> profiles;
    for (const auto family : ALL_FAMILIES) {
        auto familyProfiles = Discover(family);
        profiles.insert(profiles.end(),
            std::make_move_iterator(familyProfiles.begin()),
            std::make_move_iterator(familyProfiles.end()));
    }

    TS_LOG_INFO(LOG_CATEGORY, "Discovered %zu browser profile(s) under %s",
        profiles.size(), m_options.homeDirectory.string().c_str());
    return profiles;
}

std::vector<BrowserProfile> ProfileDiscovery::Discover(BrowserFamily family) const {
    std::vector<BrowserProfile> profiles;

    try {
        switch (GetEngineForFamily(family)) {
            case BrowserEngine::Chromium:
                discoverChromium(family, profiles);
                break;
            case BrowserEngine::Gecko:
                discoverFirefox(profiles);
                break;
            case BrowserEngine::WebKit:
                discoverSafari(profiles);
                break;
        }
    } catch (const std::exception& e) {
        TS_LOG_WARN(LOG_CATEGORY, "Probing %s failed: %s",
            std::string(GetBrowserFamilyName(family)).c_str(), e.what());
        profiles.clear();
    }

    return profiles;
}

void ProfileDiscovery::discoverChromium(BrowserFamily family, std::vector<BrowserProfile>& out) const {
    const std::string familyName(GetBrowserFamilyName(family));

    for (const auto& basePath : BasePaths(family)) {
        if (!DirectoryExists(basePath)) continue;

        const fs::path defaultProfile = basePath / "Default";
        if (DirectoryExists(defaultProfile)) {
            BrowserProfile profile;
            profile.family = family;
            profile.name = familyName + " - Default";
            profile.path = defaultProfile;
            profile.dataDir = basePath;
            profile.isDefault = true;
            out.push_back(std::move(profile));
        }

        std::vector<std::string> extra;
        std::error_code ec;
        for (fs::directory_iterator it(basePath, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code typeEc;
            if (!it->is_directory(typeEc)) continue;
            std::string dirName = it->path().filename().string();
            if (Utils::StringUtils::StartsWith(dirName, "Profile ")) {
                extra.push_back(std::move(dirName));
            }
        }
        if (ec) {
            TS_LOG_WARN(LOG_CATEGORY, "Cannot list %s: %s", basePath.string().c_str(), ec.message().c_str());
        }

        std::sort(extra.begin(), extra.end());
        for (const auto& dirName : extra) {
            BrowserProfile profile;
            profile.family = family;
            profile.name = familyName + " - " + dirName;
            profile.path = basePath / dirName;
            profile.dataDir = basePath;
            profile.isDefault = false;
            out.push_back(std::move(profile));
        }
    }
}

void ProfileDiscovery::discoverFirefox(std::vector<BrowserProfile>& out) const {
    for (const auto& basePath : BasePaths(BrowserFamily::Firefox)) {
        if (!DirectoryExists(basePath)) continue;

        const fs::path iniPath = basePath / PROFILES_INI;
        std::string content;
        Utils::FileUtils::Error fileErr;
        if (!Utils::FileUtils::Exists(iniPath) || !Utils::FileUtils::ReadAllText(iniPath, content, &fileErr)) {
            if (fileErr.hasError()) {
                TS_LOG_WARN(LOG_CATEGORY, "Cannot read %s: %s", iniPath.string().c_str(), fileErr.message.c_str());
            }
            continue;
        }

        for (const auto& entry : ParseProfilesIni(content)) {
            fs::path profilePath = entry.isRelative ? basePath / fs::path(entry.path).make_preferred()
                                                    : fs::path(entry.path);
            if (!DirectoryExists(profilePath)) {
                TS_LOG_DEBUG(LOG_CATEGORY, "Skipping missing Firefox profile %s", profilePath.string().c_str());
                continue;
            }

            BrowserProfile profile;
            profile.family = BrowserFamily::Firefox;
            profile.name = entry.name.empty() ? std::string("Firefox Profile") : "Firefox - " + entry.name;
            profile.path = std::move(profilePath);
            profile.dataDir = basePath;
            profile.isDefault = entry.isDefault;
            out.push_back(std::move(profile));
        }
    }
}

void ProfileDiscovery::discoverSafari(std::vector<BrowserProfile>& out) const {
    if (m_options.os != OsFlavor::MacOS) return;

    for (const auto& basePath : BasePaths(BrowserFamily::Safari)) {
        if (!DirectoryExists(basePath)) continue;

        BrowserProfile profile;
        profile.family = BrowserFamily::Safari;
        profile.name = "Safari";
        profile.path = basePath;
        profile.dataDir = basePath;
        profile.isDefault = true;
        out.push_back(std::move(profile));
    }
}

// ============================================================================
// PROFILES.INI
// ============================================================================

std::vector<FirefoxProfileEntry> ProfileDiscovery::ParseProfilesIni(std::string_view content) {
    namespace SU = Utils::StringUtils;

    std::vector<FirefoxProfileEntry> entries;
    FirefoxProfileEntry current;
    bool inProfile = false;
    bool hasPath = false;

    auto flush = [&]() {
        if (inProfile && hasPath) {
            entries.push_back(current);
        }
        current = FirefoxProfileEntry{};
        inProfile = false;
        hasPath = false;
    };

    for (auto line : SU::Split(content, "\n")) {
        SU::Trim(line);
        if (line.empty() || line.front() == ';' || line.front() == '#') continue;

        if (line.front() == '[') {
            flush();
            inProfile = SU::StartsWith(line, "[Profile");
            continue;
        }
        if (!inProfile) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = SU::TrimCopy(std::string_view(line).substr(0, eq));
        std::string value = SU::TrimCopy(std::string_view(line).substr(eq + 1));

        if (key == "Path") {
            current.path = std::move(value);
            hasPath = !current.path.empty();
        } else if (key == "Name") {
            current.name = std::move(value);
        } else if (key == "IsRelative") {
            current.isRelative = (value != "0");
        } else if (key == "Default") {
            current.isDefault = (value == "1");
        }
    }
    flush();

    return entries;
}

}  // namespace Browser
}  // namespace TraceSweep
