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

#include <cstdlib>
#include <string>

#include "Config/CleanerConfiguration.hpp"
#include "TestSupport.hpp"

using namespace TraceSweep::Config;
using TraceSweep::Testing::ReadFile;
using TraceSweep::Testing::TempDirectory;
using TraceSweep::Testing::WriteFile;
namespace JSON = TraceSweep::Utils::JSON;

class CleanerConfigurationTest : public ::testing::Test {
protected:
    TempDirectory m_dir{ "tracesweep_config" };
};

TEST_F(CleanerConfigurationTest, DefaultsAreSafe) {
    const CleanerConfiguration config;
    EXPECT_TRUE(config.dryRunMode);
    EXPECT_TRUE(config.createBackups);
    EXPECT_TRUE(config.requireConfirmation);
    EXPECT_EQ(config.logLevel, "INFO");
    EXPECT_EQ(config.backupDirectory, "backups");
    EXPECT_EQ(config.maxBackupAgeDays, 30);
    EXPECT_EQ(config.databaseTimeoutSeconds, 30);
    EXPECT_EQ(config.fileOperationRetries, 3);
    EXPECT_EQ(config.processCloseTimeoutSeconds, 10);
    EXPECT_FALSE(config.logToFile);
    EXPECT_TRUE(config.IsValid());
}

TEST_F(CleanerConfigurationTest, ValidationReportsFirstProblem) {
    std::string reason;

    CleanerConfiguration config;
    config.fileOperationRetries = -1;
    EXPECT_FALSE(config.IsValid(&reason));
    EXPECT_EQ(reason, "file_operation_retries must not be negative");

    config = CleanerConfiguration{};
    config.processCloseTimeoutSeconds = 0;
    EXPECT_FALSE(config.IsValid(&reason));
    EXPECT_EQ(reason, "process_close_timeout_seconds must be positive");

    config = CleanerConfiguration{};
    config.backupDirectory.clear();
    EXPECT_FALSE(config.IsValid(&reason));

    config = CleanerConfiguration{};
    config.logLevel = "chatty";
    EXPECT_FALSE(config.IsValid(&reason));
    EXPECT_EQ(reason, "log_level is not a known level");

    config.logLevel = "warning";
    EXPECT_TRUE(config.IsValid());
}

TEST_F(CleanerConfigurationTest, FromJsonOverlaysPresentKeys) {
    const JSON::Json j = {
        { "dry_run_mode", false },
        { "backup_directory", "/var/backups/ts" },
        { "max_backup_age_days", 7 },
        { "file_operation_retries", "many" },
        { "unknown_key", 1 }
    };

    const CleanerConfiguration config = CleanerConfiguration::FromJson(j);
    EXPECT_FALSE(config.dryRunMode);
    EXPECT_EQ(config.backupDirectory, "/var/backups/ts");
    EXPECT_EQ(config.maxBackupAgeDays, 7);
    // Wrong type keeps the default
    EXPECT_EQ(config.fileOperationRetries, 3);
    EXPECT_TRUE(config.createBackups);
}

TEST_F(CleanerConfigurationTest, ToJsonUsesSnakeCaseKeys) {
    CleanerConfiguration config;
    config.processCloseTimeoutSeconds = 25;

    const JSON::Json j = config.ToJson();
    EXPECT_EQ(j.size(), 11u);
    EXPECT_EQ(j.at("process_close_timeout_seconds").get<int>(), 25);
    EXPECT_EQ(j.at("dry_run_mode").get<bool>(), true);
    EXPECT_EQ(j.at("log_level").get<std::string>(), "INFO");
}

TEST_F(CleanerConfigurationTest, LoadMissingWritesDefaults) {
    const fs::path path = m_dir.Path() / "nested" / "config.json";

    CleanerConfiguration config;
    config.dryRunMode = false;
    JSON::Error err;
    ASSERT_TRUE(CleanerConfiguration::Load(path, config, &err)) << err.message;

    EXPECT_TRUE(config.dryRunMode);
    ASSERT_TRUE(fs::exists(path));
    EXPECT_NE(ReadFile(path).find("\"dry_run_mode\": true"), std::string::npos);
}

TEST_F(CleanerConfigurationTest, SaveThenLoad) {
    const fs::path path = m_dir.Path() / "config.json";

    CleanerConfiguration saved;
    saved.dryRunMode = false;
    saved.logLevel = "DEBUG";
    saved.maxBackupAgeDays = 3;
    ASSERT_TRUE(saved.Save(path));

    CleanerConfiguration loaded;
    ASSERT_TRUE(CleanerConfiguration::Load(path, loaded));
    EXPECT_FALSE(loaded.dryRunMode);
    EXPECT_EQ(loaded.logLevel, "DEBUG");
    EXPECT_EQ(loaded.maxBackupAgeDays, 3);
}

TEST_F(CleanerConfigurationTest, LoadRejectsMalformedFiles) {
    const fs::path broken = m_dir.Path() / "broken.json";
    WriteFile(broken, "{ \"dry_run_mode\": ");

    CleanerConfiguration config;
    JSON::Error err;
    EXPECT_FALSE(CleanerConfiguration::Load(broken, config, &err));
    EXPECT_FALSE(err.message.empty());

    const fs::path array = m_dir.Path() / "array.json";
    WriteFile(array, "[1, 2, 3]");
    err.clear();
    EXPECT_FALSE(CleanerConfiguration::Load(array, config, &err));
    EXPECT_EQ(err.message, "configuration root must be an object");
}

TEST_F(CleanerConfigurationTest, DefaultPathEndsWithAppFile) {
    const fs::path path = CleanerConfiguration::DefaultPath();
    EXPECT_EQ(path.filename(), "config.json");
    EXPECT_EQ(path.parent_path().filename(), "tracesweep");
}
