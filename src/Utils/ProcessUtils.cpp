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
#include "ProcessUtils.hpp"
#include "StringUtils.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <thread>

#ifdef _WIN32
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <Windows.h>
#  include <TlHelp32.h>
#else
#  include <csignal>
#  include <pthread.h>
#  include <signal.h>
#  include <sys/types.h>
#  include <unistd.h>
#endif

namespace TraceSweep {
	namespace Utils {
		namespace ProcessUtils {

			namespace {

				inline void SetErr(Error* err, int code, std::string message, std::string context = {}) {
					if (!err) return;
					err->code = code;
					err->message = std::move(message);
					err->context = std::move(context);
				}

#if defined(_WIN32)

				std::string NarrowFromWide(const wchar_t* wide) {
					const int needed = WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr, nullptr);
					if (needed <= 1) return {};
					std::string out(static_cast<size_t>(needed - 1), '\0');
					WideCharToMultiByte(CP_UTF8, 0, wide, -1, out.data(), needed, nullptr, nullptr);
					return out;
				}

				bool EnumerateNative(std::vector<ProcessBasicInfo>& out, Error* err) {
					HANDLE snap = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
					if (snap == INVALID_HANDLE_VALUE) {
						SetErr(err, static_cast<int>(GetLastError()), "CreateToolhelp32Snapshot failed", "EnumerateProcesses");
						return false;
					}

					PROCESSENTRY32W pe{};
					pe.dwSize = sizeof(pe);
					if (Process32FirstW(snap, &pe)) {
						do {
							out.push_back({ static_cast<ProcessId>(pe.th32ProcessID), NarrowFromWide(pe.szExeFile) });
						} while (Process32NextW(snap, &pe));
					}
					CloseHandle(snap);
					return true;
				}

#elif defined(__APPLE__)

				struct PipeCloser {
					void operator()(std::FILE* f) const noexcept { if (f) ::pclose(f); }
				};

				bool EnumerateNative(std::vector<ProcessBasicInfo>& out, Error* err) {
					std::unique_ptr<std::FILE, PipeCloser> pipe(::popen("ps -axo pid=,comm=", "r"));
					if (!pipe) {
						const int e = errno;
						TS_LOG_ERRNO("Process", "popen(ps)");
						SetErr(err, e, "popen(ps) failed", "EnumerateProcesses");
						return false;
					}

					char line[4096];
					while (std::fgets(line, sizeof(line), pipe.get())) {
						std::string text = StringUtils::TrimCopy(line);
						const size_t space = text.find(' ');
						if (space == std::string::npos) continue;

						ProcessBasicInfo info;
						try {
							info.pid = static_cast<ProcessId>(std::stoul(text.substr(0, space)));
						}
						catch (const std::exception&) {
							continue;
						}

						const std::string command = StringUtils::TrimCopy(text.substr(space + 1));
						info.name = std::filesystem::path(command).filename().string();
						if (info.name.empty()) info.name = command;
						out.push_back(std::move(info));
					}
					return true;
				}

#else

				bool EnumerateNative(std::vector<ProcessBasicInfo>& out, Error* err) {
					namespace fs = std::filesystem;

					std::error_code ec;
					fs::directory_iterator it("/proc", ec);
					if (ec) {
						SetErr(err, ec.value(), "cannot open /proc: " + ec.message(), "EnumerateProcesses");
						return false;
					}

					for (const fs::directory_iterator end; it != end; it.increment(ec)) {
						const std::string dirName = it->path().filename().string();
						if (dirName.empty() || dirName.find_first_not_of("0123456789") != std::string::npos) continue;

						// processes may exit between listing and reading
						std::ifstream comm(it->path() / "comm");
						if (!comm) continue;

						ProcessBasicInfo info;
						info.pid = static_cast<ProcessId>(std::stoul(dirName));
						std::getline(comm, info.name);
						StringUtils::Trim(info.name);
						if (!info.name.empty()) out.push_back(std::move(info));
					}
					if (ec) {
						// a partial table would hide running browsers
						SetErr(err, ec.value(), "reading /proc: " + ec.message(), "EnumerateProcesses");
						return false;
					}
					return true;
				}

#endif

			}  // namespace

			bool EnumerateProcesses(std::vector<ProcessBasicInfo>& out, Error* err) {
				out.clear();
				return EnumerateNative(out, err);
			}

			bool GetProcessIdsByNames(const std::vector<std::string>& names, std::vector<ProcessId>& out, Error* err) {
				out.clear();
				if (names.empty()) return true;

				std::vector<ProcessBasicInfo> procs;
				if (!EnumerateProcesses(procs, err)) return false;

				const ProcessId self = CurrentProcessId();
				for (const auto& p : procs) {
					if (p.pid == self) continue;
					for (const auto& name : names) {
						if (!name.empty() && StringUtils::ContainsCaseInsensitive(p.name, name)) {
							out.push_back(p.pid);
							break;
						}
					}
				}
				return true;
			}

			bool TerminateProcess(ProcessId pid, bool force, Error* err) {
#ifdef _WIN32
				(void)force;
				HANDLE h = OpenProcess(PROCESS_TERMINATE, FALSE, static_cast<DWORD>(pid));
				if (!h) {
					const DWORD le = GetLastError();
					if (le == ERROR_INVALID_PARAMETER) return true;  // already gone
					SetErr(err, static_cast<int>(le), "OpenProcess failed", "TerminateProcess");
					return false;
				}
				const BOOL ok = ::TerminateProcess(h, 1);
				const DWORD le = GetLastError();
				CloseHandle(h);
				if (!ok) {
					SetErr(err, static_cast<int>(le), "TerminateProcess failed", "TerminateProcess");
					return false;
				}
				return true;
#else
				if (pid == 0) {
					SetErr(err, EINVAL, "refusing to signal pid 0", "TerminateProcess");
					return false;
				}
				if (::kill(static_cast<pid_t>(pid), force ? SIGKILL : SIGTERM) != 0) {
					const int e = errno;
					if (e == ESRCH) return true;
					TS_LOG_ERRNO("Process", "kill(%u, %s)", pid, force ? "SIGKILL" : "SIGTERM");
					SetErr(err, e, std::strerror(e), "TerminateProcess");
					return false;
				}
				return true;
#endif
			}

			ProcessId CurrentProcessId() noexcept {
#ifdef _WIN32
				return static_cast<ProcessId>(GetCurrentProcessId());
#else
				return static_cast<ProcessId>(::getpid());
#endif
			}

#ifndef _WIN32
			std::vector<int> TerminationSignals() {
				return { SIGINT, SIGTERM };
			}

			namespace {

				bool MakeSignalSet(const std::vector<int>& signals, sigset_t& set, Error* err) {
					sigemptyset(&set);
					for (const int sig : signals) {
						if (sigaddset(&set, sig) != 0) {
							SetErr(err, errno, "invalid signal " + std::to_string(sig), "MakeSignalSet");
							return false;
						}
					}
					return true;
				}

			}  // namespace

			bool BlockSignals(const std::vector<int>& signals, Error* err) {
				sigset_t set;
				if (!MakeSignalSet(signals, set, err)) return false;

				const int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
				if (rc != 0) {
					SetErr(err, rc, std::strerror(rc), "BlockSignals");
					return false;
				}
				return true;
			}

			bool WatchSignals(const std::vector<int>& signals, std::function<void(int)> onSignal, Error* err) {
				sigset_t set;
				if (!MakeSignalSet(signals, set, err)) return false;
				if (!onSignal) {
					SetErr(err, EINVAL, "no signal callback", "WatchSignals");
					return false;
				}

				try {
					std::thread([set, onSignal = std::move(onSignal)]() {
						for (;;) {
							int sig = 0;
							const int rc = sigwait(&set, &sig);
							if (rc != 0) {
								TS_LOG_ERROR("Process", "sigwait failed: %s", std::strerror(rc));
								return;
							}
							onSignal(sig);
						}
					}).detach();
				}
				catch (const std::system_error& e) {
					SetErr(err, e.code().value(), e.what(), "WatchSignals");
					return false;
				}
				return true;
			}
#endif

		}  // namespace ProcessUtils
	}  // namespace Utils
}  // namespace TraceSweep
