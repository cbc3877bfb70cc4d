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

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#ifndef _WIN32
#  include <signal.h>
#  include <sys/wait.h>
#  include <unistd.h>
#endif

#include "Utils/CancellationToken.hpp"
#include "Utils/ProcessUtils.hpp"

using namespace TraceSweep::Utils;
using namespace std::chrono_literals;

namespace {

    std::string OwnProcessName() {
        std::vector<ProcessUtils::ProcessBasicInfo> table;
        if (!ProcessUtils::EnumerateProcesses(table)) return {};
        const ProcessUtils::ProcessId self = ProcessUtils::CurrentProcessId();
        for (const auto& p : table) {
            if (p.pid == self) return p.name;
        }
        return {};
    }

    bool Contains(const std::vector<ProcessUtils::ProcessId>& pids, ProcessUtils::ProcessId pid) {
        return std::find(pids.begin(), pids.end(), pid) != pids.end();
    }

} // namespace

TEST(ProcessUtilsTest, EnumerationIncludesSelf) {
    EXPECT_FALSE(OwnProcessName().empty());
}

TEST(ProcessUtilsTest, LookupNeverReturnsCallingProcess) {
    const std::string self = OwnProcessName();
    ASSERT_FALSE(self.empty());

    std::vector<ProcessUtils::ProcessId> pids;
    ProcessUtils::Error err;
    ASSERT_TRUE(ProcessUtils::GetProcessIdsByNames({ self }, pids, &err)) << err.message;
    EXPECT_FALSE(Contains(pids, ProcessUtils::CurrentProcessId()));
}

TEST(ProcessUtilsTest, EmptyNameListMatchesNothing) {
    std::vector<ProcessUtils::ProcessId> pids{ 42 };
    ASSERT_TRUE(ProcessUtils::GetProcessIdsByNames({}, pids));
    EXPECT_TRUE(pids.empty());

    ASSERT_TRUE(ProcessUtils::GetProcessIdsByNames({ "" }, pids));
    EXPECT_TRUE(pids.empty());
}

#ifndef _WIN32

TEST(ProcessUtilsTest, FindsAndTerminatesChildProcess) {
    const std::string self = OwnProcessName();
    ASSERT_FALSE(self.empty());

    const pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        for (;;) pause();
    }

    std::vector<ProcessUtils::ProcessId> pids;
    ASSERT_TRUE(ProcessUtils::GetProcessIdsByNames({ self }, pids));
    EXPECT_TRUE(Contains(pids, static_cast<ProcessUtils::ProcessId>(child)));
    EXPECT_FALSE(Contains(pids, ProcessUtils::CurrentProcessId()));

    ProcessUtils::Error err;
    EXPECT_TRUE(ProcessUtils::TerminateProcess(static_cast<ProcessUtils::ProcessId>(child), false, &err)) << err.message;

    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGTERM);

    // Already gone counts as delivered.
    EXPECT_TRUE(ProcessUtils::TerminateProcess(static_cast<ProcessUtils::ProcessId>(child), false, &err)) << err.message;
}

TEST(ProcessUtilsTest, TerminationSignalsAreInterruptAndTerm) {
    const std::vector<int> sigs = ProcessUtils::TerminationSignals();
    EXPECT_NE(std::find(sigs.begin(), sigs.end(), SIGINT), sigs.end());
    EXPECT_NE(std::find(sigs.begin(), sigs.end(), SIGTERM), sigs.end());
}

TEST(ProcessUtilsTest, WatcherRejectsEmptyCallback) {
    ProcessUtils::Error err;
    EXPECT_FALSE(ProcessUtils::WatchSignals({ SIGUSR2 }, {}, &err));
    EXPECT_TRUE(err.HasError());
}

TEST(ProcessUtilsTest, WatchedSignalRunsCallbackOffSignalContext) {
    struct State {
        CancellationToken cancel;
        std::atomic<int> received{ 0 };
    };
    auto state = std::make_shared<State>();

    ProcessUtils::Error err;
    ASSERT_TRUE(ProcessUtils::BlockSignals({ SIGUSR2 }, &err)) << err.message;
    ASSERT_TRUE(ProcessUtils::WatchSignals({ SIGUSR2 }, [state](int sig) {
        state->received = sig;
        state->cancel.Cancel();
    }, &err)) << err.message;

    ASSERT_EQ(kill(getpid(), SIGUSR2), 0);

    EXPECT_FALSE(state->cancel.SleepFor(5s));
    EXPECT_EQ(state->received.load(), SIGUSR2);
}

#endif
