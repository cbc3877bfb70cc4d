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
 * TraceSweep - COMMAND LINE MODULE
 * ============================================================================
 *
 * @file CommandLine.hpp
 * @brief Argument parsing for the tracesweep executable.
 *
 * Flags given on the command line override the loaded configuration.
 * Unset optionals leave the configuration value in place.
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "../Browser/BrowserTypes.hpp"
#include "../Config/CleanerConfiguration.hpp"
#include "../Scanner/TelemetryRisk.hpp"

namespace TraceSweep {
namespace Cli {

namespace fs = std::filesystem;

enum class Command : uint8_t {
    Clean = 0,
    Count,
    Scan,
    Backups,
    Help
};

enum class OutputFormat : uint8_t {
    Text = 0,
    Json
};

[[nodiscard]] const char* CommandToString(Command command) noexcept;

struct CommandLineOptions {
    Command command = Command::Clean;

    std::optional<bool> dryRun;
    std::optional<bool> createBackup;
    bool noConfirm = false;
    std::optional<Browser::BrowserFamily> browser;
    OutputFormat output = OutputFormat::Text;
    std::optional<std::string> logLevel;
    std::optional<fs::path> configPath;
    std::optional<fs::path> backupDirectory;
    std::optional<int> timeoutSeconds;
    bool parallel = false;

    // scan
    std::vector<fs::path> files;
    Scanner::TelemetryRisk minRisk = Scanner::TelemetryRisk::Low;

    // backups
    bool prune = false;
};

/**
 * @brief Parse argv. The first non-flag word names the command (default clean).
 * @param error Receives a one-line reason on failure
 */
[[nodiscard]] bool ParseCommandLine(int argc, const char* const* argv, CommandLineOptions& out,
    std::string* error = nullptr);

/// @brief Fold command-line overrides into @p config
void ApplyOverrides(const CommandLineOptions& options, Config::CleanerConfiguration& config);

[[nodiscard]] std::string UsageText();

/// @brief true for "y" or "yes", ignoring case and surrounding blanks
[[nodiscard]] bool IsAffirmative(std::string_view answer);

}  // namespace Cli
}  // namespace TraceSweep
