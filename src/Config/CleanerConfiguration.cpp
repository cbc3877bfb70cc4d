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
#include "CleanerConfiguration.hpp"

#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"

#include <cstdlib>
#include <system_error>

namespace TraceSweep {
namespace Config {

namespace {

constexpr const char* LOG_CATEGORY = "Config";

}  // anonymous namespace

bool CleanerConfiguration::IsValid(std::string* reason) const {
    auto fail = [reason](const char* why) {
        if (reason) *reason = why;
        return false;
    };

    if (fileOperationRetries < 0) {
        return fail("file_operation_retries must not be negative");
    }
    if (databaseTimeoutSeconds <= 0) {
        return fail("database_timeout_seconds must be positive");
    }
    if (processCloseTimeoutSeconds <= 0) {
        return fail("process_close_timeout_seconds must be positive");
    }
    if (backupDirectory.empty()) {
        return fail("backup_directory must not be empty");
    }
    Utils::LogLevel level;
    if (!Utils::ParseLogLevel(logLevel, level)) {
        return fail("log_level is not a known level");
    }
    return true;
}

Utils::JSON::Json CleanerConfiguration::ToJson() const {
    return Utils::JSON::Json{
        { "dry_run_mode", dryRunMode },
        { "create_backups", createBackups },
        { "log_level", logLevel },
        { "backup_directory", backupDirectory },
        { "max_backup_age_days", maxBackupAgeDays },
        { "require_confirmation", requireConfirmation },
        { "database_timeout_seconds", databaseTimeoutSeconds },
        { "file_operation_retries", fileOperationRetries },
        { "process_close_timeout_seconds", processCloseTimeoutSeconds },
        { "log_directory", logDirectory },
        { "log_to_file", logToFile }
    };
}

CleanerConfiguration CleanerConfiguration::FromJson(const Utils::JSON::Json& j) {
    using Utils::JSON::GetOr;

    CleanerConfiguration c;
    c.dryRunMode = GetOr(j, "dry_run_mode", c.dryRunMode);
    c.createBackups = GetOr(j, "create_backups", c.createBackups);
    c.logLevel = GetOr(j, "log_level", c.logLevel);
    c.backupDirectory = GetOr(j, "backup_directory", c.backupDirectory);
    c.maxBackupAgeDays = GetOr(j, "max_backup_age_days", c.maxBackupAgeDays);
    c.requireConfirmation = GetOr(j, "require_confirmation", c.requireConfirmation);
    c.databaseTimeoutSeconds = GetOr(j, "database_timeout_seconds", c.databaseTimeoutSeconds);
    c.fileOperationRetries = GetOr(j, "file_operation_retries", c.fileOperationRetries);
    c.processCloseTimeoutSeconds = GetOr(j, "process_close_timeout_seconds", c.processCloseTimeoutSeconds);
    c.logDirectory = GetOr(j, "log_directory", c.logDirectory);
    c.logToFile = GetOr(j, "log_to_file", c.logToFile);
    return c;
}

fs::path CleanerConfiguration::DefaultPath() {
    fs::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else {
        base = Utils::FileUtils::HomeDirectory() / ".config";
    }
    return base / ConfigConstants::APP_DIRECTORY / ConfigConstants::CONFIG_FILE_NAME;
}

bool CleanerConfiguration::Load(const fs::path& path, CleanerConfiguration& out, Utils::JSON::Error* err) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        out = CleanerConfiguration{};
        TS_LOG_INFO(LOG_CATEGORY, "No configuration at %s, writing defaults", path.string().c_str());
        Utils::JSON::Error saveErr;
        if (!out.Save(path, &saveErr)) {
            TS_LOG_WARN(LOG_CATEGORY, "Could not write default configuration to %s: %s",
                path.string().c_str(), saveErr.message.c_str());
        }
        return true;
    }

    Utils::JSON::Json j;
    if (!Utils::JSON::LoadFromFile(path, j, err)) {
        TS_LOG_ERROR(LOG_CATEGORY, "Failed to load configuration %s", path.string().c_str());
        return false;
    }
    if (!j.is_object()) {
        if (err) {
            err->message = "configuration root must be an object";
            err->path = path;
        }
        return false;
    }

    out = FromJson(j);
    TS_LOG_DEBUG(LOG_CATEGORY, "Loaded configuration from %s", path.string().c_str());
    return true;
}

bool CleanerConfiguration::Save(const fs::path& path, Utils::JSON::Error* err) const {
    Utils::JSON::SaveOptions opts;
    opts.pretty = true;
    return Utils::JSON::SaveToFile(path, ToJson(), err, opts);
}

}  // namespace Config
}  // namespace TraceSweep
