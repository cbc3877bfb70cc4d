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
#include "Orchestrator.hpp"

#include "../Utils/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <map>
#include <string>
#include <vector>

namespace TraceSweep {
namespace Browser {

namespace {

constexpr const char* LOG_CATEGORY = "Orchestrator";

constexpr const char* CANCELLED_MESSAGE = "Operation cancelled before this profile was processed";

}  // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

Orchestrator::Orchestrator(std::shared_ptr<const ProfileDiscovery> discovery,
    std::shared_ptr<ProcessController> processes,
    CleanerFactory cleanerFactory,
    OrchestratorOptions options)
    : m_discovery(std::move(discovery))
    , m_processes(std::move(processes))
    , m_cleanerFactory(std::move(cleanerFactory))
    , m_options(options) {
}

Orchestrator::Orchestrator(std::shared_ptr<const ProfileDiscovery> discovery,
    std::shared_ptr<ProcessController> processes,
    std::shared_ptr<const BackupManager> backup,
    CleanerOptions cleanerOptions,
    OrchestratorOptions options)
    : Orchestrator(std::move(discovery), std::move(processes),
        [backup = std::move(backup), cleanerOptions](BrowserEngine engine) {
            return CreateArtifactCleaner(engine, backup, cleanerOptions);
        },
        options) {
}

std::vector<BrowserProfile> Orchestrator::discover() const {
    if (!m_discovery) {
        return {};
    }
    return m_options.familyFilter ? m_discovery->Discover(*m_options.familyFilter) : m_discovery->Discover();
}

// ============================================================================
// PER-PROFILE PIPELINE
// ============================================================================

bool Orchestrator::ensureClosed(const BrowserProfile& profile, const Utils::CancellationToken& cancel,
    CleanResult& result) {
    if (!m_processes) {
        return true;
    }

    const std::string display(GetBrowserDisplayName(profile.family));

    bool running = false;
    ProcessControlError err;
    if (!m_processes->IsRunning(profile.family, running, &err)) {
        result.errors.push_back("Failed to check if browser is running: " + err.message);
        return false;
    }
    if (!running) {
        return true;
    }

    TS_LOG_INFO(LOG_CATEGORY, "%s is running, closing it before cleaning %s", display.c_str(), profile.name.c_str());

    err.Clear();
    if (!m_processes->Terminate(profile.family, cancel, &err)) {
        if (err.code == ControlErrorCode::Cancelled) {
            result.errors.push_back("Cancelled while closing " + display + " processes");
        } else {
            result.errors.push_back("Failed to close " + display + " processes: " + err.message);
        }
        return false;
    }

    err.Clear();
    if (!m_processes->AwaitClosed(profile.family, m_options.closeTimeout, cancel, &err)) {
        switch (err.code) {
            case ControlErrorCode::TimeoutExceeded:
                result.errors.push_back(display + " processes did not close in time. Please close manually and try again.");
                break;
            case ControlErrorCode::Cancelled:
                result.errors.push_back("Cancelled while waiting for " + display + " processes to close");
                break;
            default:
                result.errors.push_back("Failed to check if browser is running: " + err.message);
                break;
        }
        return false;
    }
    return true;
}

CleanResult Orchestrator::ProcessProfile(const BrowserProfile& profile, const Utils::CancellationToken& cancel) {
    CleanResult result;
    result.profile = profile;

    if (cancel.ShouldStop()) {
        result.errors.push_back(CANCELLED_MESSAGE);
        return result;
    }

    try {
        if (!ensureClosed(profile, cancel, result)) {
            TS_LOG_WARN(LOG_CATEGORY, "Skipping %s: %s", profile.name.c_str(), result.errors.back().c_str());
            return result;
        }

        auto cleaner = m_cleanerFactory ? m_cleanerFactory(GetEngineForFamily(profile.family)) : nullptr;
        if (!cleaner) {
            result.errors.push_back("No cleaner available for " + std::string(GetBrowserEngineName(GetEngineForFamily(profile.family))));
            return result;
        }

        return cleaner->Clean(profile, m_options.createBackup, cancel);
    } catch (const std::exception& e) {
        TS_LOG_ERROR(LOG_CATEGORY, "Unexpected failure on %s: %s", profile.name.c_str(), e.what());
        result.errors.push_back(std::string("Unexpected failure: ") + e.what());
        return result;
    }
}

// ============================================================================
// RUN
// ============================================================================

RunResult Orchestrator::Run(const Utils::CancellationToken& cancel) {
    return Run(discover(), cancel);
}

RunResult Orchestrator::Run(const std::vector<BrowserProfile>& profiles, const Utils::CancellationToken& cancel) {
    TS_LOG_SCOPE(LOG_CATEGORY);

    RunResult run;
    run.results.resize(profiles.size());

    if (m_options.parallel && profiles.size() > 1) {
        runParallel(profiles, cancel, run.results);
    } else {
        for (size_t i = 0; i < profiles.size(); ++i) {
            run.results[i] = ProcessProfile(profiles[i], cancel);
        }
    }

    run.Finalize();
    TS_LOG_INFO(LOG_CATEGORY, "Run finished: %zu profile(s), %lld cookie(s), %lld storage, %lld cache, %zu error(s)",
        run.results.size(),
        static_cast<long long>(run.totalCookiesDeleted),
        static_cast<long long>(run.totalStorageDeleted),
        static_cast<long long>(run.totalCacheDeleted),
        run.totalErrors);
    return run;
}

void Orchestrator::runParallel(const std::vector<BrowserProfile>& profiles, const Utils::CancellationToken& cancel,
    std::vector<CleanResult>& results) {
    // One work unit per family; indices keep the discovery slots
    std::map<uint8_t, std::vector<size_t>> byFamily;
    for (size_t i = 0; i < profiles.size(); ++i) {
        byFamily[static_cast<uint8_t>(profiles[i].family)].push_back(i);
    }

    std::vector<std::vector<size_t>> units;
    units.reserve(byFamily.size());
    for (auto& entry : byFamily) {
        units.push_back(std::move(entry.second));
    }

    size_t workers = units.size();
    if (m_options.maxWorkers > 0) {
        workers = std::min(workers, m_options.maxWorkers);
    }

    TS_LOG_DEBUG(LOG_CATEGORY, "Parallel run: %zu famil(ies) on %zu worker(s)", units.size(), workers);

    std::atomic<size_t> next{ 0 };
    auto worker = [&]() {
        for (size_t u = next.fetch_add(1); u < units.size(); u = next.fetch_add(1)) {
            for (const size_t index : units[u]) {
                results[index] = ProcessProfile(profiles[index], cancel);
            }
        }
    };

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, worker));
    }
    for (auto& f : futures) {
        f.get();
    }
}

// ============================================================================
// DRY RUN
// ============================================================================

CountResult Orchestrator::CountMatches(const Utils::CancellationToken& cancel) {
    return CountMatches(discover(), cancel);
}

CountResult Orchestrator::CountMatches(const std::vector<BrowserProfile>& profiles,
    const Utils::CancellationToken& cancel) {
    CountResult counts;

    for (const auto& profile : profiles) {
        if (cancel.ShouldStop()) break;

        ProfileCount entry;
        entry.profile = profile;

        try {
            auto cleaner = m_cleanerFactory ? m_cleanerFactory(GetEngineForFamily(profile.family)) : nullptr;
            if (cleaner) {
                entry.count = cleaner->CountMatches(profile, cancel);
            }
        } catch (const std::exception& e) {
            TS_LOG_ERROR(LOG_CATEGORY, "Counting %s failed: %s", profile.name.c_str(), e.what());
        }

        counts.total += entry.count;
        counts.profiles.push_back(std::move(entry));
    }

    TS_LOG_INFO(LOG_CATEGORY, "Dry run: %lld item(s) across %zu profile(s)",
        static_cast<long long>(counts.total), counts.profiles.size());
    return counts;
}

}  // namespace Browser
}  // namespace TraceSweep
