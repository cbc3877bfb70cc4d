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
#include "ProcessController.hpp"

#include "../Utils/Logger.hpp"

#include <algorithm>

namespace TraceSweep {
namespace Browser {

namespace {

constexpr const char* LOG_CATEGORY = "Process";

using Utils::ProcessUtils::ProcessId;
using Clock = std::chrono::steady_clock;

uint8_t FamilyKey(BrowserFamily family) noexcept {
    return static_cast<uint8_t>(family);
}

const char* FamilyName(BrowserFamily family) noexcept {
    return GetBrowserFamilyName(family).data();
}

}  // anonymous namespace

std::string_view GetLifecycleStateName(ProcessLifecycleState state) noexcept {
    switch (state) {
        case ProcessLifecycleState::Unknown:         return "Unknown";
        case ProcessLifecycleState::Running:         return "Running";
        case ProcessLifecycleState::Terminating:     return "Terminating";
        case ProcessLifecycleState::Closed:          return "Closed";
        case ProcessLifecycleState::TimeoutExceeded: return "TimeoutExceeded";
        case ProcessLifecycleState::Cancelled:       return "Cancelled";
        default:                                     return "Unknown";
    }
}

// ============================================================================
// SYSTEM PROCESS TABLE
// ============================================================================

bool SystemProcessTable::FindProcesses(const std::vector<std::string>& names,
    std::vector<ProcessId>& out, Utils::ProcessUtils::Error* err) {
    return Utils::ProcessUtils::GetProcessIdsByNames(names, out, err);
}

bool SystemProcessTable::Terminate(ProcessId pid, bool force, Utils::ProcessUtils::Error* err) {
    return Utils::ProcessUtils::TerminateProcess(pid, force, err);
}

// ============================================================================
// PROCESS NAME TABLES
// ============================================================================

std::vector<std::string> ProcessController::ProcessNames(BrowserFamily family, OsFlavor os) {
    switch (os) {
        case OsFlavor::Linux:
            switch (family) {
                case BrowserFamily::Chrome:  return { "chrome", "chromium", "google-chrome", "chrome-sandbox" };
                case BrowserFamily::Edge:    return { "microsoft-edge", "msedge" };
                case BrowserFamily::Firefox: return { "firefox", "firefox-bin", "plugin-container" };
                case BrowserFamily::Safari:  return {};
            }
            break;

        case OsFlavor::MacOS:
            switch (family) {
                case BrowserFamily::Chrome:  return { "Google Chrome", "Google Chrome Helper", "chrome" };
                case BrowserFamily::Edge:    return { "Microsoft Edge", "Microsoft Edge Helper" };
                case BrowserFamily::Firefox: return { "Firefox", "firefox", "plugin-container" };
                case BrowserFamily::Safari:  return { "Safari", "com.apple.WebKit.WebContent", "SafariForWebKitDevelopment" };
            }
            break;

        case OsFlavor::Windows:
            switch (family) {
                case BrowserFamily::Chrome:  return { "chrome.exe", "chrome_proxy.exe", "chrome_crashpad_handler.exe" };
                case BrowserFamily::Edge:    return { "msedge.exe", "msedge_proxy.exe", "msedgewebview2.exe" };
                case BrowserFamily::Firefox: return { "firefox.exe", "plugin-container.exe", "crashreporter.exe" };
                case BrowserFamily::Safari:  return {};
            }
            break;
    }
    return {};
}

// ============================================================================
// PROCESS CONTROLLER
// ============================================================================

ProcessController::ProcessController()
    : ProcessController(std::make_shared<SystemProcessTable>()) {
}

ProcessController::ProcessController(std::shared_ptr<IProcessTable> table, ProcessControllerOptions options)
    : m_table(std::move(table))
    , m_options(options) {
}

bool ProcessController::findFamily(BrowserFamily family, std::vector<ProcessId>& pids, ProcessControlError* err) {
    pids.clear();

    const auto names = ProcessNames(family, m_options.os);
    if (names.empty()) {
        return true;
    }

    Utils::ProcessUtils::Error procErr;
    if (!m_table || !m_table->FindProcesses(names, pids, &procErr)) {
        if (err) {
            err->code = ControlErrorCode::QueryFailed;
            err->message = m_table ? procErr.message : std::string("no process table");
        }
        TS_LOG_ERROR(LOG_CATEGORY, "Process query for %s failed: %s",
            FamilyName(family), procErr.message.c_str());
        return false;
    }
    return true;
}

bool ProcessController::IsRunning(BrowserFamily family, bool& running, ProcessControlError* err) {
    running = false;

    std::vector<ProcessId> pids;
    if (!findFamily(family, pids, err)) {
        return false;
    }

    running = !pids.empty();
    if (running) {
        setState(family, ProcessLifecycleState::Running);
        TS_LOG_DEBUG(LOG_CATEGORY, "%s has %zu live process(es)", FamilyName(family), pids.size());
    }
    return true;
}

void ProcessController::signalAll(BrowserFamily family, const std::vector<ProcessId>& pids, bool force) {
    for (const auto pid : pids) {
        Utils::ProcessUtils::Error procErr;
        if (!m_table->Terminate(pid, force, &procErr)) {
            TS_LOG_WARN(LOG_CATEGORY, "%s of %s pid %u failed: %s",
                force ? "SIGKILL" : "SIGTERM", FamilyName(family), pid, procErr.message.c_str());
        }
    }
}

bool ProcessController::Terminate(BrowserFamily family, const Utils::CancellationToken& cancel,
    ProcessControlError* err) {
    setState(family, ProcessLifecycleState::Terminating);

    std::vector<ProcessId> pids;
    if (!findFamily(family, pids, err)) {
        return false;
    }
    if (pids.empty()) {
        return true;
    }

    TS_LOG_INFO(LOG_CATEGORY, "Requesting %zu %s process(es) to exit", pids.size(), FamilyName(family));
    signalAll(family, pids, false);

    if (!cancel.SleepFor(m_options.gracePeriod) && cancel.ShouldStop()) {
        setState(family, ProcessLifecycleState::Cancelled);
        if (err) {
            err->code = ControlErrorCode::Cancelled;
            err->message = "termination cancelled";
        }
        return false;
    }

    if (!findFamily(family, pids, err)) {
        return false;
    }
    if (pids.empty()) {
        return true;
    }

    TS_LOG_WARN(LOG_CATEGORY, "Forcing %zu %s process(es) to exit", pids.size(), FamilyName(family));
    signalAll(family, pids, true);

    if (!cancel.SleepFor(m_options.settleDelay) && cancel.ShouldStop()) {
        setState(family, ProcessLifecycleState::Cancelled);
        if (err) {
            err->code = ControlErrorCode::Cancelled;
            err->message = "termination cancelled";
        }
        return false;
    }
    return true;
}

bool ProcessController::AwaitClosed(BrowserFamily family, std::chrono::milliseconds timeout,
    const Utils::CancellationToken& cancel, ProcessControlError* err) {
    const auto deadline = Clock::now() + timeout;

    for (;;) {
        std::vector<ProcessId> pids;
        if (!findFamily(family, pids, err)) {
            return false;
        }
        if (pids.empty()) {
            setState(family, ProcessLifecycleState::Closed);
            return true;
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            setState(family, ProcessLifecycleState::TimeoutExceeded);
            if (err) {
                err->code = ControlErrorCode::TimeoutExceeded;
                err->message = std::string(GetBrowserDisplayName(family)) + " processes did not close within " +
                    std::to_string(timeout.count()) + " ms";
            }
            TS_LOG_WARN(LOG_CATEGORY, "%s still running after %lld ms",
                FamilyName(family), static_cast<long long>(timeout.count()));
            return false;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (!cancel.SleepFor(std::min(m_options.pollInterval, remaining)) && cancel.ShouldStop()) {
            setState(family, ProcessLifecycleState::Cancelled);
            if (err) {
                err->code = ControlErrorCode::Cancelled;
                err->message = "wait for process exit cancelled";
            }
            return false;
        }
    }
}

ProcessLifecycleState ProcessController::State(BrowserFamily family) const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    const auto it = m_states.find(FamilyKey(family));
    return it == m_states.end() ? ProcessLifecycleState::Unknown : it->second;
}

void ProcessController::setState(BrowserFamily family, ProcessLifecycleState state) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_states[FamilyKey(family)] = state;
}

}  // namespace Browser
}  // namespace TraceSweep
