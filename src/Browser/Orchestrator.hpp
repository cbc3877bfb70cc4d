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
 * TraceSweep - ORCHESTRATOR MODULE
 * ============================================================================
 *
 * @file Orchestrator.hpp
 * @brief Drives discovery, quiescing, backup and cleaning across profiles.
 *
 * Per profile:
 *   1. liveness check        (failure: profile skipped)
 *   2. terminate + wait      (timeout or cancel: profile skipped)
 *   3. backup + clean        (ArtifactCleaner strategy for the engine)
 *
 * A failure in one profile never stops the others. Results keep discovery
 * order in both sequential and parallel mode. In parallel mode each family
 * is one unit of work, so profiles of one browser stay serialized.
 * ============================================================================
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "ArtifactCleaner.hpp"
#include "BackupManager.hpp"
#include "BrowserTypes.hpp"
#include "ProcessController.hpp"
#include "ProfileDiscovery.hpp"
#include "../Utils/CancellationToken.hpp"

namespace TraceSweep {
namespace Browser {

struct OrchestratorOptions {
    bool createBackup = true;

    /// @brief Limit the run to one family
    std::optional<BrowserFamily> familyFilter;

    std::chrono::milliseconds closeTimeout = ProcessConstants::DEFAULT_CLOSE_TIMEOUT;

    /// @brief Process families concurrently
    bool parallel = false;

    /// @brief Worker cap in parallel mode (0 = one per family)
    size_t maxWorkers = 0;
};

class Orchestrator {
public:
    using CleanerFactory = std::function<std::unique_ptr<IArtifactCleaner>(BrowserEngine)>;

    Orchestrator(std::shared_ptr<const ProfileDiscovery> discovery,
        std::shared_ptr<ProcessController> processes,
        CleanerFactory cleanerFactory,
        OrchestratorOptions options = OrchestratorOptions{});

    /// @brief Wires the stock strategies over @p backup
    Orchestrator(std::shared_ptr<const ProfileDiscovery> discovery,
        std::shared_ptr<ProcessController> processes,
        std::shared_ptr<const BackupManager> backup,
        CleanerOptions cleanerOptions,
        OrchestratorOptions options = OrchestratorOptions{});

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// @brief Discover and clean every (filtered) profile
    [[nodiscard]] RunResult Run(const Utils::CancellationToken& cancel);

    /// @brief Clean an explicit profile list, in order
    [[nodiscard]] RunResult Run(const std::vector<BrowserProfile>& profiles, const Utils::CancellationToken& cancel);

    /**
     * @brief Dry run: per-profile match counts and their total.
     *
     * Never terminates processes and never writes.
     */
    [[nodiscard]] CountResult CountMatches(const Utils::CancellationToken& cancel);

    [[nodiscard]] CountResult CountMatches(const std::vector<BrowserProfile>& profiles,
        const Utils::CancellationToken& cancel);

    /// @brief Quiesce, back up and clean one profile
    [[nodiscard]] CleanResult ProcessProfile(const BrowserProfile& profile, const Utils::CancellationToken& cancel);

    [[nodiscard]] const OrchestratorOptions& Options() const noexcept { return m_options; }

private:
    [[nodiscard]] std::vector<BrowserProfile> discover() const;
    [[nodiscard]] bool ensureClosed(const BrowserProfile& profile, const Utils::CancellationToken& cancel,
        CleanResult& result);
    void runParallel(const std::vector<BrowserProfile>& profiles, const Utils::CancellationToken& cancel,
        std::vector<CleanResult>& results);

    std::shared_ptr<const ProfileDiscovery> m_discovery;
    std::shared_ptr<ProcessController> m_processes;
    CleanerFactory m_cleanerFactory;
    OrchestratorOptions m_options;
};

}  // namespace Browser
}  // namespace TraceSweep
