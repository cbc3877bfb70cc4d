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
 * TraceSweep - CLEANER CONFIGURATION MODULE
 * ============================================================================
 *
 * @file CleanerConfiguration.hpp
 * @brief User configuration persisted as JSON.
 *
 * Default location is $XDG_CONFIG_HOME/tracesweep/config.json, falling back
 * to ~/.config/tracesweep/config.json. Missing keys keep their defaults and
 * unknown keys are ignored.
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "../Utils/JSONUtils.hpp"

namespace TraceSweep {
namespace Config {

namespace fs = std::filesystem;

namespace ConfigConstants {

    inline constexpr const char* APP_DIRECTORY = "tracesweep";
    inline constexpr const char* CONFIG_FILE_NAME = "config.json";

    inline constexpr int DEFAULT_MAX_BACKUP_AGE_DAYS = 30;
    inline constexpr int DEFAULT_DATABASE_TIMEOUT_SECONDS = 30;
    inline constexpr int DEFAULT_FILE_OPERATION_RETRIES = 3;
    inline constexpr int DEFAULT_PROCESS_CLOSE_TIMEOUT_SECONDS = 10;

}  // namespace ConfigConstants

struct CleanerConfiguration {
    bool dryRunMode = true;
    bool createBackups = true;
    std::string logLevel = "INFO";
    std::string backupDirectory = "backups";
    int maxBackupAgeDays = ConfigConstants::DEFAULT_MAX_BACKUP_AGE_DAYS;
    bool requireConfirmation = true;
    int databaseTimeoutSeconds = ConfigConstants::DEFAULT_DATABASE_TIMEOUT_SECONDS;
    int fileOperationRetries = ConfigConstants::DEFAULT_FILE_OPERATION_RETRIES;
    int processCloseTimeoutSeconds = ConfigConstants::DEFAULT_PROCESS_CLOSE_TIMEOUT_SECONDS;
    std::string logDirectory = "logs";
    bool logToFile = false;

    /**
     * @brief Rejects negative retries, non-positive timeouts, an empty
     *        backup directory and unknown log levels.
     * @param reason Receives the first failed check
     */
    [[nodiscard]] bool IsValid(std::string* reason = nullptr) const;

    [[nodiscard]] Utils::JSON::Json ToJson() const;

    /// @brief Overlay keys present in @p j onto the defaults
    [[nodiscard]] static CleanerConfiguration FromJson(const Utils::JSON::Json& j);

    /// @brief Default config path for the current user
    [[nodiscard]] static fs::path DefaultPath();

    /**
     * @brief Load @p path, writing defaults there when the file is missing.
     * @return false on unreadable or malformed files
     */
    [[nodiscard]] static bool Load(const fs::path& path, CleanerConfiguration& out,
        Utils::JSON::Error* err = nullptr);

    [[nodiscard]] bool Save(const fs::path& path, Utils::JSON::Error* err = nullptr) const;
};

}  // namespace Config
}  // namespace TraceSweep
