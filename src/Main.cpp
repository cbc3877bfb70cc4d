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
#include "Browser/BackupManager.hpp"
#include "Browser/BrowserTypes.hpp"
#include "Browser/Orchestrator.hpp"
#include "Browser/ProcessController.hpp"
#include "Browser/ProfileDiscovery.hpp"
#include "Cli/CommandLine.hpp"
#include "Config/CleanerConfiguration.hpp"
#include "Scanner/PatternEngine.hpp"
#include "Scanner/TelemetryPatterns.hpp"
#include "Utils/CancellationToken.hpp"
#include "Utils/FileUtils.hpp"
#include "Utils/JSONUtils.hpp"
#include "Utils/Logger.hpp"
#include "Utils/ProcessUtils.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <Windows.h>
#endif

using namespace TraceSweep;

namespace {

constexpr const char* LOG_CATEGORY = "CLI";

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERRORS = 1;
constexpr int EXIT_FATAL = 2;

// ============================================================================
// INTERRUPT HANDLING
// ============================================================================

Utils::CancellationToken g_cancel;

#ifdef _WIN32
BOOL WINAPI ConsoleCtrlHandler(DWORD ctrlType) {
    if (ctrlType == CTRL_C_EVENT || ctrlType == CTRL_BREAK_EVENT) {
        g_cancel.Cancel();
        return TRUE;
    }
    return FALSE;
}

bool BlockInterruptSignals() {
    return true;
}

void InstallInterruptHandler() {
    SetConsoleCtrlHandler(ConsoleCtrlHandler, TRUE);
}
#else
// Must run before the first thread is created; every later thread inherits
// the blocked mask and the signals reach only the sigwait watcher.
bool BlockInterruptSignals() {
    Utils::ProcessUtils::Error err;
    if (!Utils::ProcessUtils::BlockSignals(Utils::ProcessUtils::TerminationSignals(), &err)) {
        std::fprintf(stderr, "tracesweep: cannot block termination signals: %s\n", err.message.c_str());
        return false;
    }
    return true;
}

// A second signal while a cancel is already pending exits at once.
void InstallInterruptHandler() {
    Utils::ProcessUtils::Error err;
    const bool watching = Utils::ProcessUtils::WatchSignals(Utils::ProcessUtils::TerminationSignals(), [](int sig) {
        if (g_cancel.IsCancelled()) {
            std::fprintf(stderr, "\nSignal %d received again, exiting\n", sig);
            std::_Exit(128 + sig);
        }
        TS_LOG_WARN(LOG_CATEGORY, "Signal %d received, cancelling", sig);
        std::fprintf(stderr, "\nCancelling, press Ctrl+C again to exit immediately\n");
        g_cancel.Cancel();
    }, &err);

    if (!watching) {
        TS_LOG_WARN(LOG_CATEGORY, "Cannot watch termination signals (%s), Ctrl+C will not cancel cleanly",
            err.message.c_str());
    }
}
#endif

// ============================================================================
// SETUP
// ============================================================================

bool InitializeLogging(const Config::CleanerConfiguration& config) {
    Utils::LoggerConfig cfg;
    cfg.toConsole = true;
    cfg.toFile = config.logToFile;
    cfg.logDirectory = config.logDirectory;
    if (!Utils::ParseLogLevel(config.logLevel, cfg.minimalLevel)) {
        cfg.minimalLevel = Utils::LogLevel::Info;
    }

    try {
        Utils::Logger::Instance().Initialize(cfg);
    } catch (const std::system_error& se) {
        std::cerr << "[FATAL] Logger system_error: " << se.what() << " (code: " << se.code() << ")\n";
        return false;
    } catch (const std::exception& ex) {
        std::cerr << "[FATAL] Logger exception: " << ex.what() << "\n";
        return false;
    }
    return Utils::Logger::Instance().IsInitialized();
}

bool Confirm(const std::string& operation) {
    std::printf("Are you sure you want to %s? [y/N]: ", operation.c_str());
    std::fflush(stdout);
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return Cli::IsAffirmative(answer);
}

// ============================================================================
// TEXT OUTPUT
// ============================================================================

void PrintRunText(const Browser::RunResult& run) {
    std::printf("\nResult Details:\n");
    for (const auto& r : run.results) {
        std::printf("  Browser: %s (%s)\n", r.profile.name.c_str(),
            std::string(Browser::GetBrowserFamilyName(r.profile.family)).c_str());
        std::printf("    Cookies Deleted: %lld\n", static_cast<long long>(r.cookiesDeleted));
        std::printf("    Storage Items Deleted: %lld\n", static_cast<long long>(r.storageDeleted));
        std::printf("    Cache Items Deleted: %lld\n", static_cast<long long>(r.cacheDeleted));
        if (r.backupPath) {
            std::printf("    Backup: %s\n", r.backupPath->string().c_str());
        }
        if (r.HasErrors()) {
            std::printf("    Errors: %zu\n", r.errors.size());
            for (const auto& e : r.errors) {
                std::printf("      - %s\n", e.c_str());
            }
        }
    }
    std::printf("  Total Summary:\n");
    std::printf("    Total Cookies Deleted: %lld\n", static_cast<long long>(run.totalCookiesDeleted));
    std::printf("    Total Storage Items Deleted: %lld\n", static_cast<long long>(run.totalStorageDeleted));
    std::printf("    Total Cache Items Deleted: %lld\n", static_cast<long long>(run.totalCacheDeleted));
    if (run.totalErrors > 0) {
        std::printf("    Total Errors: %zu\n", run.totalErrors);
    }
}

void PrintCountText(const Browser::CountResult& counts) {
    for (const auto& entry : counts.profiles) {
        std::printf("  %-40s %lld\n", entry.profile.name.c_str(), static_cast<long long>(entry.count));
    }
    std::printf("DRY RUN: Would clean %lld browser data items\n", static_cast<long long>(counts.total));
}

// ============================================================================
// COMMANDS
// ============================================================================

std::unique_ptr<Browser::Orchestrator> MakeOrchestrator(const Config::CleanerConfiguration& config,
    const Cli::CommandLineOptions& options) {
    auto discovery = std::make_shared<Browser::ProfileDiscovery>();
    auto processes = std::make_shared<Browser::ProcessController>();
    auto backup = std::make_shared<Browser::BackupManager>(config.backupDirectory);

    Browser::CleanerOptions cleanerOptions;
    cleanerOptions.removal.retries = config.fileOperationRetries;
    cleanerOptions.databaseBusyTimeoutMs = config.databaseTimeoutSeconds * 1000;

    Browser::OrchestratorOptions orchestratorOptions;
    orchestratorOptions.createBackup = config.createBackups;
    orchestratorOptions.familyFilter = options.browser;
    orchestratorOptions.closeTimeout = std::chrono::seconds(config.processCloseTimeoutSeconds);
    orchestratorOptions.parallel = options.parallel;

    return std::make_unique<Browser::Orchestrator>(discovery, processes, backup, cleanerOptions, orchestratorOptions);
}

int RunCount(const Config::CleanerConfiguration& config, const Cli::CommandLineOptions& options) {
    auto orchestrator = MakeOrchestrator(config, options);
    const Browser::CountResult counts = orchestrator->CountMatches(g_cancel);

    if (options.output == Cli::OutputFormat::Json) {
        std::printf("%s\n", counts.ToJson(true).c_str());
    } else {
        PrintCountText(counts);
    }
    return EXIT_OK;
}

int RunClean(const Config::CleanerConfiguration& config, const Cli::CommandLineOptions& options) {
    if (options.output == Cli::OutputFormat::Text) {
        std::printf("=== TraceSweep ===\n");
        std::printf("Mode: %s\n", config.dryRunMode ? "DRY RUN (Preview only)" : "LIVE (Making actual changes)");
        std::printf("Backups: %s\n", config.createBackups ? "true" : "false");
        std::printf("==================\n\n");
    }

    if (config.dryRunMode) {
        return RunCount(config, options);
    }

    if (config.requireConfirmation) {
        std::printf("WARNING: running browsers will be closed before cleaning.\n");
        std::printf("This operation will clean:\n");
        std::printf("  - tracked cookies and domains\n");
        std::printf("  - local and session storage containing tracked identifiers\n");
        std::printf("  - cache files with tracked references\n\n");
        if (!Confirm("clean browser data") || g_cancel.IsCancelled()) {
            std::printf("Operation cancelled by user\n");
            return EXIT_OK;
        }
    }

    auto orchestrator = MakeOrchestrator(config, options);
    const Browser::RunResult run = orchestrator->Run(g_cancel);

    for (const auto& r : run.results) {
        for (const auto& e : r.errors) {
            TS_LOG_ERROR(LOG_CATEGORY, "Browser cleaning error: %s: %s", r.profile.name.c_str(), e.c_str());
        }
    }

    if (options.output == Cli::OutputFormat::Json) {
        std::printf("%s\n", run.ToJson(true).c_str());
    } else {
        PrintRunText(run);
    }
    return run.HasErrors() ? EXIT_ERRORS : EXIT_OK;
}

int RunScan(const Cli::CommandLineOptions& options) {
    const auto& engine = Scanner::PatternEngine::Instance();
    const auto& catalog = Scanner::TelemetryPatternCatalog::Instance();

    Utils::JSON::Json report = Utils::JSON::Json::array();
    int status = EXIT_OK;

    for (const auto& file : options.files) {
        std::string content;
        Utils::FileUtils::Error err;
        if (!Utils::FileUtils::ReadAllText(file, content, &err)) {
            std::fprintf(stderr, "Cannot read %s: %s\n", file.string().c_str(), err.message.c_str());
            status = EXIT_ERRORS;
            continue;
        }

        const auto matches = engine.Analyze(content, file.string());
        Utils::JSON::Json fileReport{
            { "file", file.string() },
            { "highest_risk", Scanner::TelemetryRiskToString(Scanner::PatternEngine::HighestRisk(matches)) },
            { "matches", Utils::JSON::Json::array() }
        };

        if (options.output == Cli::OutputFormat::Text) {
            std::printf("%s\n", file.string().c_str());
        }

        for (const auto& m : matches) {
            if (m.risk < options.minRisk) continue;

            std::vector<std::string> known;
            for (const auto* def : catalog.MatchLine(m.context)) {
                known.push_back(def->name);
            }

            if (options.output == Cli::OutputFormat::Json) {
                Utils::JSON::Json j;
                if (Utils::JSON::Parse(m.ToJson(), j)) {
                    j["catalog"] = known;
                    fileReport["matches"].push_back(std::move(j));
                }
                continue;
            }

            std::printf("  %zu:%zu [%s] %s %s (%.2f)\n", m.line, m.column,
                Scanner::TelemetryRiskToString(m.risk), Scanner::MatchCategoryToString(m.category),
                m.match.c_str(), m.confidence);
            for (const auto& name : known) {
                std::printf("      catalog: %s\n", name.c_str());
            }
        }
        report.push_back(std::move(fileReport));
    }

    if (options.output == Cli::OutputFormat::Json) {
        std::string text;
        Utils::JSON::StringifyOptions so;
        so.pretty = true;
        if (Utils::JSON::Stringify(report, text, so)) {
            std::printf("%s\n", text.c_str());
        }
    }
    return status;
}

int RunBackups(const Config::CleanerConfiguration& config, const Cli::CommandLineOptions& options) {
    const Browser::BackupManager backups(config.backupDirectory);
    Utils::FileUtils::Error err;

    if (options.prune) {
        size_t removed = 0;
        if (!backups.PruneBackups(config.maxBackupAgeDays, removed, &err)) {
            std::fprintf(stderr, "Pruning backups failed: %s\n", err.message.c_str());
            return EXIT_ERRORS;
        }
        std::printf("Removed %zu backup(s) older than %d day(s)\n", removed, config.maxBackupAgeDays);
        return EXIT_OK;
    }

    std::vector<Browser::BackupRecord> records;
    if (!backups.ListBackups(records, &err)) {
        std::fprintf(stderr, "Listing backups failed: %s\n", err.message.c_str());
        return EXIT_ERRORS;
    }

    if (options.output == Cli::OutputFormat::Json) {
        Utils::JSON::Json arr = Utils::JSON::Json::array();
        for (const auto& r : records) {
            arr.push_back({ { "name", r.name }, { "path", r.path.string() },
                { "profile", r.profileSlug }, { "timestamp", r.timestamp }, { "files", r.files } });
        }
        std::printf("%s\n", arr.dump(2).c_str());
        return EXIT_OK;
    }

    if (records.empty()) {
        std::printf("No backups under %s\n", backups.Root().string().c_str());
    }
    for (const auto& r : records) {
        std::printf("  %s (%zu file(s))\n", r.path.string().c_str(), r.files.size());
    }
    return EXIT_OK;
}

int Dispatch(const Config::CleanerConfiguration& config, const Cli::CommandLineOptions& options) {
    switch (options.command) {
        case Cli::Command::Clean:   return RunClean(config, options);
        case Cli::Command::Count:   return RunCount(config, options);
        case Cli::Command::Scan:    return RunScan(options);
        case Cli::Command::Backups: return RunBackups(config, options);
        case Cli::Command::Help:
        default:
            std::printf("%s", Cli::UsageText().c_str());
            return EXIT_OK;
    }
}

}  // anonymous namespace

int main(int argc, char** argv) {
    Cli::CommandLineOptions options;
    std::string usageError;
    if (!Cli::ParseCommandLine(argc, argv, options, &usageError)) {
        std::fprintf(stderr, "tracesweep: %s\n\n%s", usageError.c_str(), Cli::UsageText().c_str());
        return EXIT_ERRORS;
    }
    if (options.command == Cli::Command::Help) {
        std::printf("%s", Cli::UsageText().c_str());
        return EXIT_OK;
    }

    const bool signalsBlocked = BlockInterruptSignals();

    const std::filesystem::path configPath = options.configPath ? *options.configPath : Config::CleanerConfiguration::DefaultPath();
    Config::CleanerConfiguration config;
    Utils::JSON::Error configError;
    if (!Config::CleanerConfiguration::Load(configPath, config, &configError)) {
        std::fprintf(stderr, "tracesweep: cannot load %s: %s\n", configPath.string().c_str(), configError.message.c_str());
        return EXIT_FATAL;
    }
    Cli::ApplyOverrides(options, config);

    std::string invalid;
    if (!config.IsValid(&invalid)) {
        std::fprintf(stderr, "tracesweep: invalid configuration: %s\n", invalid.c_str());
        return EXIT_FATAL;
    }

    if (!InitializeLogging(config)) {
        return EXIT_FATAL;
    }
    if (signalsBlocked) {
        InstallInterruptHandler();
    }

    TS_LOG_INFO(LOG_CATEGORY, "Starting %s (config %s)", Cli::CommandToString(options.command), configPath.string().c_str());

    int status = EXIT_OK;
    try {
        status = Dispatch(config, options);
    } catch (const std::exception& ex) {
        TS_LOG_FATAL(LOG_CATEGORY, "Unhandled exception: %s", ex.what());
        status = EXIT_FATAL;
    }

    if (g_cancel.IsCancelled()) {
        std::printf("Operation cancelled\n");
    }

    Utils::Logger::Instance().ShutDown();
    return status;
}
