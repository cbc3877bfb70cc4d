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
 * @file BackupManager.hpp
 * @brief Pre-mutation snapshots of a profile's critical files.
 *
 * Layout:
 *   <backup dir>/browser-data/<sanitized-name>-backup-<unix-ts>[-N]/<basename>...
 *
 * Backups are never removed implicitly. ListBackups() and PruneBackups()
 * are explicit retention operations.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "BrowserTypes.hpp"
#include "../Utils/FileUtils.hpp"

namespace TraceSweep {
namespace Browser {

namespace BackupConstants {

    inline constexpr const char* DEFAULT_BACKUP_DIRECTORY = "backups";
    inline constexpr const char* BROWSER_DATA_SUBDIR = "browser-data";
    inline constexpr const char* BACKUP_MARKER = "-backup-";
    inline constexpr int DEFAULT_MAX_AGE_DAYS = 30;
    inline constexpr int64_t SECONDS_PER_DAY = 86400;

    /// @brief Upper bound on "-N" collision suffixes
    inline constexpr int MAX_NAME_ATTEMPTS = 1000;

}  // namespace BackupConstants

/**
 * @brief One backup directory found on disk
 */
struct BackupRecord {
    fs::path path;
    std::string name;

    /// @brief Sanitized profile name the backup was taken from
    std::string profileSlug;

    /// @brief Unix seconds parsed from the directory name
    int64_t timestamp = 0;

    /// @brief Files inside the backup (basenames)
    std::vector<std::string> files;
};

class BackupManager {
public:
    /// @brief Source of "now" in Unix seconds
    using NowFunction = std::function<int64_t()>;

    explicit BackupManager(fs::path backupDirectory = BackupConstants::DEFAULT_BACKUP_DIRECTORY,
        NowFunction now = {});

    /// @brief `<backup dir>/browser-data`
    [[nodiscard]] fs::path Root() const;

    /**
     * @brief Copy the profile's critical files into a fresh backup directory.
     *
     * Copy failures of individual files are logged and ignored. Failing to
     * create the backup directory fails the whole backup.
     *
     * @param backupPath Receives the new directory
     */
    [[nodiscard]] bool BackupProfile(const BrowserProfile& profile, fs::path& backupPath,
        Utils::FileUtils::Error* err = nullptr) const;

    /// @brief Files snapshotted for @p profile, by engine
    [[nodiscard]] static std::vector<fs::path> CriticalFiles(const BrowserProfile& profile);

    /// @brief Lower-case @p name and map every character outside [a-z0-9._-] to '-'
    [[nodiscard]] static std::string SanitizeName(std::string_view name);

    /**
     * @brief Split a backup directory name into slug and timestamp.
     * @return false if @p dirName is not a backup directory name
     */
    [[nodiscard]] static bool ParseBackupName(std::string_view dirName, std::string& slug, int64_t& timestamp);

    /// @brief Backups under Root(), oldest first. A missing root yields none.
    [[nodiscard]] bool ListBackups(std::vector<BackupRecord>& out, Utils::FileUtils::Error* err = nullptr) const;

    /**
     * @brief Delete backups older than @p maxAgeDays.
     *
     * A non-positive age disables pruning.
     *
     * @param removed Receives the number of deleted backup directories
     */
    [[nodiscard]] bool PruneBackups(int maxAgeDays, size_t& removed, Utils::FileUtils::Error* err = nullptr) const;

    [[nodiscard]] const fs::path& BackupDirectory() const noexcept { return m_backupDirectory; }

private:
    [[nodiscard]] int64_t now() const;

    fs::path m_backupDirectory;
    NowFunction m_now;
};

}  // namespace Browser
}  // namespace TraceSweep
