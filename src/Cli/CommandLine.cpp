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
#include "CommandLine.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <charconv>
#include <string_view>

namespace TraceSweep {
namespace Cli {

namespace {

bool Fail(std::string* error, std::string message) {
    if (error) *error = std::move(message);
    return false;
}

bool ParseCommandWord(std::string_view word, Command& out) {
    if (word == "clean")   { out = Command::Clean; return true; }
    if (word == "count")   { out = Command::Count; return true; }
    if (word == "scan")    { out = Command::Scan; return true; }
    if (word == "backups") { out = Command::Backups; return true; }
    if (word == "help")    { out = Command::Help; return true; }
    return false;
}

bool ParsePositiveInt(std::string_view text, int& out) {
    int value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || value <= 0) {
        return false;
    }
    out = value;
    return true;
}

}  // anonymous namespace

const char* CommandToString(Command command) noexcept {
    switch (command) {
        case Command::Clean:   return "clean";
        case Command::Count:   return "count";
        case Command::Scan:    return "scan";
        case Command::Backups: return "backups";
        case Command::Help:    return "help";
        default:               return "unknown";
    }
}

bool ParseCommandLine(int argc, const char* const* argv, CommandLineOptions& out, std::string* error) {
    out = CommandLineOptions{};
    bool haveCommand = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        // Flags that take a value accept both "--flag value" and "--flag=value"
        std::string_view name = arg;
        std::optional<std::string_view> inlineValue;
        if (arg.rfind("--", 0) == 0) {
            if (const auto eq = arg.find('='); eq != std::string_view::npos) {
                name = arg.substr(0, eq);
                inlineValue = arg.substr(eq + 1);
            }
        }

        auto takeValue = [&](std::string_view& value) {
            if (inlineValue) {
                value = *inlineValue;
                return true;
            }
            if (i + 1 >= argc) {
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string_view value;

        if (name == "-h" || name == "--help") {
            out.command = Command::Help;
            return true;
        } else if (name == "--dry-run") {
            out.dryRun = true;
        } else if (name == "--no-dry-run") {
            out.dryRun = false;
        } else if (name == "--backup") {
            out.createBackup = true;
        } else if (name == "--no-backup") {
            out.createBackup = false;
        } else if (name == "--no-confirm" || name == "-y") {
            out.noConfirm = true;
        } else if (name == "--parallel") {
            out.parallel = true;
        } else if (name == "--prune") {
            out.prune = true;
        } else if (name == "--browser") {
            if (!takeValue(value)) return Fail(error, "--browser needs a value");
            out.browser = Browser::ParseBrowserFamily(value);
            if (!out.browser) return Fail(error, "unknown browser: " + std::string(value));
        } else if (name == "--output") {
            if (!takeValue(value)) return Fail(error, "--output needs a value");
            if (Utils::StringUtils::IEquals(value, "text")) {
                out.output = OutputFormat::Text;
            } else if (Utils::StringUtils::IEquals(value, "json")) {
                out.output = OutputFormat::Json;
            } else {
                return Fail(error, "unknown output format: " + std::string(value));
            }
        } else if (name == "--log-level") {
            if (!takeValue(value)) return Fail(error, "--log-level needs a value");
            Utils::LogLevel level;
            if (!Utils::ParseLogLevel(value, level)) return Fail(error, "unknown log level: " + std::string(value));
            out.logLevel = std::string(value);
        } else if (name == "--config") {
            if (!takeValue(value)) return Fail(error, "--config needs a value");
            out.configPath = fs::path(std::string(value));
        } else if (name == "--backup-dir") {
            if (!takeValue(value) || value.empty()) return Fail(error, "--backup-dir needs a value");
            out.backupDirectory = fs::path(std::string(value));
        } else if (name == "--timeout") {
            int seconds = 0;
            if (!takeValue(value) || !ParsePositiveInt(value, seconds)) {
                return Fail(error, "--timeout needs a positive number of seconds");
            }
            out.timeoutSeconds = seconds;
        } else if (name == "--min-risk") {
            if (!takeValue(value)) return Fail(error, "--min-risk needs a value");
            if (!Scanner::ParseTelemetryRisk(value, out.minRisk)) {
                return Fail(error, "unknown risk level: " + std::string(value));
            }
        } else if (!arg.empty() && arg[0] == '-') {
            return Fail(error, "unknown option: " + std::string(arg));
        } else if (!haveCommand && ParseCommandWord(arg, out.command)) {
            haveCommand = true;
        } else if (haveCommand && out.command == Command::Scan) {
            out.files.emplace_back(std::string(arg));
        } else {
            return Fail(error, "unexpected argument: " + std::string(arg));
        }
    }

    if (out.command == Command::Scan && out.files.empty()) {
        return Fail(error, "scan needs at least one file");
    }
    return true;
}

void ApplyOverrides(const CommandLineOptions& options, Config::CleanerConfiguration& config) {
    if (options.dryRun) config.dryRunMode = *options.dryRun;
    if (options.createBackup) config.createBackups = *options.createBackup;
    if (options.noConfirm) config.requireConfirmation = false;
    if (options.logLevel) config.logLevel = *options.logLevel;
    if (options.backupDirectory) config.backupDirectory = options.backupDirectory->string();
    if (options.timeoutSeconds) config.processCloseTimeoutSeconds = *options.timeoutSeconds;
}

std::string UsageText() {
    return
        "Usage:\n"
        "  tracesweep clean   [--dry-run|--no-dry-run] [--backup|--no-backup] [--no-confirm]\n"
        "                     [--browser chrome|edge|firefox|safari] [--output text|json]\n"
        "                     [--log-level TRACE|DEBUG|INFO|WARN|ERROR] [--config <file>]\n"
        "                     [--backup-dir <dir>] [--timeout <seconds>] [--parallel]\n"
        "  tracesweep count   [--browser ...] [--output text|json]\n"
        "  tracesweep scan    <file>... [--output text|json] [--min-risk low|medium|high|critical]\n"
        "  tracesweep backups [--prune]\n"
        "\n"
        "Exit status: 0 success, 1 errors recorded or bad usage, 2 fatal initialization error.\n";
}

bool IsAffirmative(std::string_view answer) {
    const std::string trimmed = Utils::StringUtils::ToLowerCopy(Utils::StringUtils::TrimCopy(answer));
    return trimmed == "y" || trimmed == "yes";
}

}  // namespace Cli
}  // namespace TraceSweep
