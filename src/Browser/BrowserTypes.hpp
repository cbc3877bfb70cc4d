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
 * @file BrowserTypes.hpp
 * @brief Shared browser vocabulary: families, engines, profiles and results.
 */

#pragma once

// ============================================================================
// STANDARD LIBRARY INCLUDES
// ============================================================================

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TraceSweep {
namespace Browser {

namespace fs = std::filesystem;

// ============================================================================
// ENUMERATIONS
// ============================================================================

/**
 * @brief Supported browser brands
 */
enum class BrowserFamily : uint8_t {
    Chrome  = 0,
    Edge    = 1,
    Firefox = 2,
    Safari  = 3
};

/// @brief Every family in discovery order
inline constexpr std::array<BrowserFamily, 4> ALL_FAMILIES = {
    BrowserFamily::Chrome, BrowserFamily::Edge, BrowserFamily::Firefox, BrowserFamily::Safari
};

/**
 * @brief Engine lineage. Selects on-disk formats and the cleaning strategy.
 */
enum class BrowserEngine : uint8_t {
    Chromium = 0,
    Gecko    = 1,
    WebKit   = 2
};

/**
 * @brief Host OS layout used to resolve profile and process-name tables
 */
enum class OsFlavor : uint8_t {
    Linux   = 0,
    MacOS   = 1,
    Windows = 2
};

/**
 * @brief Outcome of one file or directory decision
 */
enum class FileOutcome : uint8_t {
    Removed = 0,
    Skipped = 1,
    Failed  = 2
};

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief One browser profile found on disk. Created per scan.
 */
struct BrowserProfile {
    BrowserFamily family = BrowserFamily::Chrome;

    /// @brief Display name, e.g. "Chrome - Default"
    std::string name;

    /// @brief Profile directory
    fs::path path;

    /// @brief Parent user-data directory
    fs::path dataDir;

    bool isDefault = false;

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Per-profile cleaning outcome
 */
struct CleanResult {
    BrowserProfile profile;

    /// @brief Set when a backup was taken
    std::optional<fs::path> backupPath;

    int64_t cookiesDeleted = 0;
    int64_t storageDeleted = 0;
    int64_t cacheDeleted = 0;

    /// @brief Every removed file or directory
    std::vector<std::string> filesDeleted;

    std::vector<std::string> errors;

    [[nodiscard]] bool HasErrors() const noexcept { return !errors.empty(); }
    [[nodiscard]] int64_t TotalDeleted() const noexcept { return cookiesDeleted + storageDeleted + cacheDeleted; }

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Whole-run outcome. Results keep discovery order.
 */
struct RunResult {
    std::vector<CleanResult> results;

    int64_t totalCookiesDeleted = 0;
    int64_t totalStorageDeleted = 0;
    int64_t totalCacheDeleted = 0;
    size_t totalFilesDeleted = 0;
    size_t totalErrors = 0;

    /// @brief Recompute the totals from @c results
    void Finalize() noexcept;

    [[nodiscard]] bool HasErrors() const noexcept { return totalErrors > 0; }

    [[nodiscard]] std::string ToJson(bool pretty = false) const;
};

/**
 * @brief Dry-run count for one profile
 */
struct ProfileCount {
    BrowserProfile profile;
    int64_t count = 0;
};

/**
 * @brief Dry-run outcome
 */
struct CountResult {
    std::vector<ProfileCount> profiles;
    int64_t total = 0;

    [[nodiscard]] std::string ToJson(bool pretty = false) const;
};

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/// @brief Short family name ("Chrome", "Edge", "Firefox", "Safari")
[[nodiscard]] std::string_view GetBrowserFamilyName(BrowserFamily family) noexcept;

/// @brief Product name used in user-facing messages ("Google Chrome", ...)
[[nodiscard]] std::string_view GetBrowserDisplayName(BrowserFamily family) noexcept;

[[nodiscard]] std::string_view GetBrowserEngineName(BrowserEngine engine) noexcept;

[[nodiscard]] BrowserEngine GetEngineForFamily(BrowserFamily family) noexcept;

/// @brief Parse a family name, ignoring case ("chrome", "EDGE", ...)
[[nodiscard]] std::optional<BrowserFamily> ParseBrowserFamily(std::string_view name) noexcept;

[[nodiscard]] std::string_view GetFileOutcomeName(FileOutcome outcome) noexcept;

/// @brief Layout of the build host
[[nodiscard]] OsFlavor CurrentOsFlavor() noexcept;

}  // namespace Browser
}  // namespace TraceSweep
