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
 * TraceSweep - PROCESS CONTROLLER MODULE
 * ============================================================================
 *
 * @file ProcessController.hpp
 * @brief Browser liveness checks, graceful-then-forced termination and
 *        bounded waits for closure.
 *
 * LIFECYCLE (per family):
 * =======================
 *
 *   Unknown ──IsRunning──► Running ──Terminate──► Terminating
 *                                                     │
 *                                   AwaitClosed ──────┼──────────────┐
 *                                                     ▼              ▼
 *                                                  Closed   TimeoutExceeded
 *                                                             / Cancelled
 *
 * Every wait goes through a caller-supplied CancellationToken, so a cancel
 * or an expired deadline ends it early.
 *
 * The process table sits behind IProcessTable. SystemProcessTable reads the
 * real table through Utils::ProcessUtils.
 * ============================================================================
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "BrowserTypes.hpp"
#include "../Utils/CancellationToken.hpp"
#include "../Utils/ProcessUtils.hpp"

namespace TraceSweep {
namespace Browser {

// ============================================================================
// CONSTANTS
// ============================================================================

namespace ProcessConstants {

    /// @brief Wait between SIGTERM and SIGKILL
    inline constexpr std::chrono::milliseconds DEFAULT_GRACE_PERIOD{ 1000 };

    /// @brief Wait after SIGKILL
    inline constexpr std::chrono::milliseconds DEFAULT_SETTLE_DELAY{ 2000 };

    inline constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{ 500 };

    inline constexpr std::chrono::milliseconds DEFAULT_CLOSE_TIMEOUT{ 10000 };

}  // namespace ProcessConstants

// ============================================================================
// ENUMERATIONS
// ============================================================================

enum class ProcessLifecycleState : uint8_t {
    Unknown         = 0,
    Running         = 1,
    Terminating     = 2,
    Closed          = 3,
    TimeoutExceeded = 4,
    Cancelled       = 5
};

enum class ControlErrorCode : uint8_t {
    None            = 0,
    QueryFailed     = 1,
    TimeoutExceeded = 2,
    Cancelled       = 3
};

[[nodiscard]] std::string_view GetLifecycleStateName(ProcessLifecycleState state) noexcept;

// ============================================================================
// ERROR HANDLING
// ============================================================================

struct ProcessControlError {
    ControlErrorCode code = ControlErrorCode::None;
    std::string message;

    bool HasError() const noexcept { return code != ControlErrorCode::None; }
    void Clear() noexcept { code = ControlErrorCode::None; message.clear(); }
};

// ============================================================================
// PROCESS TABLE
// ============================================================================

/**
 * @brief Source of process liveness and the termination primitive.
 */
class IProcessTable {
public:
    virtual ~IProcessTable() = default;

    /**
     * @brief PIDs whose short name contains any of @p names, ignoring case.
     *
     * The calling process is never returned.
     *
     * @return false if the table could not be read
     */
    [[nodiscard]] virtual bool FindProcesses(const std::vector<std::string>& names,
        std::vector<Utils::ProcessUtils::ProcessId>& out, Utils::ProcessUtils::Error* err) = 0;

    /// @brief Deliver a termination request. A vanished process is success.
    [[nodiscard]] virtual bool Terminate(Utils::ProcessUtils::ProcessId pid, bool force,
        Utils::ProcessUtils::Error* err) = 0;
};

/**
 * @brief IProcessTable over the live OS process table
 */
class SystemProcessTable final : public IProcessTable {
public:
    [[nodiscard]] bool FindProcesses(const std::vector<std::string>& names,
        std::vector<Utils::ProcessUtils::ProcessId>& out, Utils::ProcessUtils::Error* err) override;

    [[nodiscard]] bool Terminate(Utils::ProcessUtils::ProcessId pid, bool force,
        Utils::ProcessUtils::Error* err) override;
};

// ============================================================================
// PROCESS CONTROLLER
// ============================================================================

struct ProcessControllerOptions {
    OsFlavor os = CurrentOsFlavor();
    std::chrono::milliseconds gracePeriod = ProcessConstants::DEFAULT_GRACE_PERIOD;
    std::chrono::milliseconds settleDelay = ProcessConstants::DEFAULT_SETTLE_DELAY;
    std::chrono::milliseconds pollInterval = ProcessConstants::DEFAULT_POLL_INTERVAL;
};

class ProcessController {
public:
    ProcessController();
    explicit ProcessController(std::shared_ptr<IProcessTable> table,
        ProcessControllerOptions options = ProcessControllerOptions{});

    ProcessController(const ProcessController&) = delete;
    ProcessController& operator=(const ProcessController&) = delete;

    /// @brief Process short names owned by @p family on @p os (may be empty)
    [[nodiscard]] static std::vector<std::string> ProcessNames(BrowserFamily family, OsFlavor os);

    /**
     * @brief Query liveness.
     *
     * @param running Receives true if any process of the family is alive
     * @return false (with QueryFailed) if the process table cannot be read
     */
    [[nodiscard]] bool IsRunning(BrowserFamily family, bool& running, ProcessControlError* err = nullptr);

    /**
     * @brief Graceful termination, a grace period, forced termination of
     *        survivors, then a settle delay.
     *
     * Delivery failures to individual processes are logged and ignored.
     *
     * @return false on a query failure or cancellation
     */
    [[nodiscard]] bool Terminate(BrowserFamily family, const Utils::CancellationToken& cancel,
        ProcessControlError* err = nullptr);

    /**
     * @brief Poll until no process of the family is alive.
     *
     * @return true once closed; false with TimeoutExceeded, Cancelled or
     *         QueryFailed otherwise
     */
    [[nodiscard]] bool AwaitClosed(BrowserFamily family, std::chrono::milliseconds timeout,
        const Utils::CancellationToken& cancel, ProcessControlError* err = nullptr);

    [[nodiscard]] ProcessLifecycleState State(BrowserFamily family) const;

    [[nodiscard]] const ProcessControllerOptions& Options() const noexcept { return m_options; }

private:
    bool findFamily(BrowserFamily family, std::vector<Utils::ProcessUtils::ProcessId>& pids,
        ProcessControlError* err);
    void signalAll(BrowserFamily family, const std::vector<Utils::ProcessUtils::ProcessId>& pids, bool force);
    void setState(BrowserFamily family, ProcessLifecycleState state);

    std::shared_ptr<IProcessTable> m_table;
    ProcessControllerOptions m_options;

    mutable std::mutex m_stateMutex;
    std::unordered_map<uint8_t, ProcessLifecycleState> m_states;
};

}  // namespace Browser
}  // namespace TraceSweep
