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
#pragma once
/**
 * @file ProcessUtils.hpp
 * @brief Process enumeration and termination for TraceSweep.
 *
 * Process table sources:
 * - Linux:   /proc/<pid>/comm
 * - macOS:   `ps -axo pid=,comm=` (basename of the executable path)
 * - Windows: Toolhelp32 snapshot
 */

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace TraceSweep {
	namespace Utils {
		namespace ProcessUtils {

			// ============================================================================
			// Type Aliases
			// ============================================================================

			using ProcessId = uint32_t;

			// ============================================================================
			// Error Handling
			// ============================================================================

			struct Error {
				int code = 0;
				std::string message;
				std::string context;

				bool HasError() const noexcept { return code != 0 || !message.empty(); }
				void Clear() noexcept { code = 0; message.clear(); context.clear(); }
			};

			// ============================================================================
			// Process Information Structures
			// ============================================================================

			struct ProcessBasicInfo {
				ProcessId pid = 0;
				std::string name;   ///< Short executable name, as the OS reports it
			};

			// ============================================================================
			// Enumeration
			// ============================================================================

			/**
			 * @brief Snapshot the process table.
			 * @return false only if the table itself cannot be read
			 */
			[[nodiscard]] bool EnumerateProcesses(std::vector<ProcessBasicInfo>& out, Error* err = nullptr);

			/**
			 * @brief PIDs whose short name contains any of @p names, ignoring ASCII case.
			 *
			 * Each PID appears once, in table order. The calling process is never returned.
			 */
			[[nodiscard]] bool GetProcessIdsByNames(const std::vector<std::string>& names, std::vector<ProcessId>& out,
				Error* err = nullptr);

			// ============================================================================
			// Control
			// ============================================================================

			/**
			 * @brief Ask a process to exit.
			 *
			 * @param force false sends SIGTERM, true sends SIGKILL. On Windows both
			 *              map to TerminateProcess.
			 * @return true if delivered or the process was already gone
			 */
			[[nodiscard]] bool TerminateProcess(ProcessId pid, bool force, Error* err = nullptr);

			[[nodiscard]] ProcessId CurrentProcessId() noexcept;

#ifndef _WIN32
			// ============================================================================
			// Signals (POSIX)
			// ============================================================================

			/// SIGINT and SIGTERM
			[[nodiscard]] std::vector<int> TerminationSignals();

			/**
			 * @brief Block @p signals in the calling thread.
			 *
			 * Threads created afterwards inherit the mask, so call this from main
			 * before any thread exists (the logger worker included).
			 */
			[[nodiscard]] bool BlockSignals(const std::vector<int>& signals, Error* err = nullptr);

			/**
			 * @brief Start a detached thread that consumes @p signals with sigwait.
			 *
			 * @p onSignal runs on that thread, never in signal context, once per
			 * delivered signal. The signals must already be blocked everywhere.
			 */
			[[nodiscard]] bool WatchSignals(const std::vector<int>& signals, std::function<void(int)> onSignal,
				Error* err = nullptr);
#endif

		}  // namespace ProcessUtils
	}  // namespace Utils
}  // namespace TraceSweep
