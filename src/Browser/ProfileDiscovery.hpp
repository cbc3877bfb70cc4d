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
 * TraceSweep - PROFILE DISCOVERY MODULE
 * ============================================================================
 *
 * @file ProfileDiscovery.hpp
 * @brief Enumerates installed browser profiles by OS convention.
 *
 * Scans the user-data directories of every supported family under the
 * user's home directory:
 *
 *   Chrome   .config/google-chrome, .config/chromium
 *            Library/Application Support/Google/Chrome
 *            AppData/Local/Google/Chrome/User Data
 *   Edge     .config/microsoft-edge
 *            Library/Application Support/Microsoft Edge
 *            AppData/Local/Microsoft/Edge/User Data
 *   Firefox  .mozilla/firefox (profiles.ini)
 *            Library/Application Support/Firefox
 *            AppData/Roaming/Mozilla/Firefox
 *   Safari   Library/Safari (macOS only)
 *
 * Discovery is read-only. A missing base directory contributes nothing; a
 * failure while probing one family is logged and the others still run.
 * ============================================================================
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "BrowserTypes.hpp"

namespace TraceSweep {
namespace Browser {

/**
 * @brief Where and how to look for profiles
 */
struct DiscoveryOptions {
    /// @brief Root of the per-user directories. Empty means the current user's home.
    fs::path homeDirectory;

    OsFlavor os = CurrentOsFlavor();
};

/**
 * @brief One `[Profile*]` section of a Firefox profiles.ini
 */
struct FirefoxProfileEntry {
    std::string name;
    std::string path;
    bool isRelative = true;
    bool isDefault = false;
};

class ProfileDiscovery {
public:
    ProfileDiscovery();
    explicit ProfileDiscovery(DiscoveryOptions options);

    /**
     * @brief All profiles of every family, in family order.
     *
     * Chromium families list Default first, then "Profile N" directories
     * sorted by name.
     */
    [[nodiscard]] std::vector<BrowserProfile> Discover() const;

    /// @brief Profiles of one family only
    [[nodiscard]] std::vector<BrowserProfile> Discover(BrowserFamily family) const;

    /// @brief Candidate user-data directories for @p family on the configured OS
    [[nodiscard]] std::vector<fs::path> BasePaths(BrowserFamily family) const;

    [[nodiscard]] const DiscoveryOptions& Options() const noexcept { return m_options; }

    /**
     * @brief Parse the `[Profile*]` sections of a profiles.ini text.
     *
     * Sections without a Path key are dropped. Other sections
     * ([General], [Install...]) are ignored.
     */
    [[nodiscard]] static std::vector<FirefoxProfileEntry> ParseProfilesIni(std::string_view content);

private:
    void discoverChromium(BrowserFamily family, std::vector<BrowserProfile>& out) const;
    void discoverFirefox(std::vector<BrowserProfile>& out) const;
    void discoverSafari(std::vector<BrowserProfile>& out) const;

    DiscoveryOptions m_options;
};

}  // namespace Browser
}  // namespace TraceSweep
