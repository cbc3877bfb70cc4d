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
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "Browser/Orchestrator.hpp"
#include "TestSupport.hpp"
#include "mocks/MockProcessTable.hpp"

using namespace TraceSweep::Browser;
using TraceSweep::Testing::FastProcessOptions;
using TraceSweep::Testing::MockProcessTable;
using TraceSweep::Testing::TempDirectory;
using TraceSweep::Utils::CancellationToken;
using TraceSweep::Utils::ProcessUtils::ProcessId;

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

/// Records every profile it is asked to clean
class RecordingCleaner : public IArtifactCleaner {
public:
    struct Log {
        std::mutex mutex;
        std::vector<std::string> cleaned;
    };

    RecordingCleaner(BrowserEngine engine, std::shared_ptr<Log> log, bool throwOnClean = false)
        : m_engine(engine), m_log(std::move(log)), m_throw(throwOnClean) {}

    BrowserEngine Engine() const noexcept override { return m_engine; }

    CleanResult Clean(const BrowserProfile& profile, bool /*createBackup*/, const CancellationToken& /*cancel*/) override {
        if (m_throw) throw std::runtime_error("disk on fire");
        {
            std::lock_guard<std::mutex> lock(m_log->mutex);
            m_log->cleaned.push_back(profile.name);
        }
        CleanResult result;
        result.profile = profile;
        result.cookiesDeleted = 2;
        result.storageDeleted = 1;
        return result;
    }

    int64_t CountMatches(const BrowserProfile& /*profile*/, const CancellationToken& /*cancel*/) override {
        return 3;
    }

private:
    BrowserEngine m_engine;
    std::shared_ptr<Log> m_log;
    bool m_throw;
};

BrowserProfile Profile(BrowserFamily family, const std::string& name) {
    BrowserProfile profile;
    profile.family = family;
    profile.name = name;
    profile.path = fs::path("/nonexistent") / name;
    return profile;
}

bool NamesInclude(const std::vector<std::string>& names, const std::string& needle) {
    return std::find(names.begin(), names.end(), needle) != names.end();
}

}  // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(*m_table, FindProcesses(_, _, _)).WillByDefault(Return(true));
        ON_CALL(*m_table, Terminate(_, _, _)).WillByDefault(Return(true));
    }

    Orchestrator::CleanerFactory RecordingFactory(bool throwOnClean = false) {
        auto log = m_log;
        return [log, throwOnClean](BrowserEngine engine) -> std::unique_ptr<IArtifactCleaner> {
            return std::make_unique<RecordingCleaner>(engine, log, throwOnClean);
        };
    }

    Orchestrator Make(OrchestratorOptions options = OrchestratorOptions{}, bool throwOnClean = false) {
        return Orchestrator(nullptr, m_processes, RecordingFactory(throwOnClean), options);
    }

    std::shared_ptr<NiceMock<MockProcessTable>> m_table = std::make_shared<NiceMock<MockProcessTable>>();
    std::shared_ptr<ProcessController> m_processes = std::make_shared<ProcessController>(m_table, FastProcessOptions());
    std::shared_ptr<RecordingCleaner::Log> m_log = std::make_shared<RecordingCleaner::Log>();
    CancellationToken m_cancel;
};

TEST_F(OrchestratorTest, CleansEveryProfileInOrder) {
    const std::vector<BrowserProfile> profiles = {
        Profile(BrowserFamily::Chrome, "Chrome - Default"),
        Profile(BrowserFamily::Firefox, "Firefox - work"),
        Profile(BrowserFamily::Edge, "Edge - Default"),
    };

    Orchestrator orchestrator = Make();
    const RunResult run = orchestrator.Run(profiles, m_cancel);

    ASSERT_EQ(run.results.size(), 3u);
    for (size_t i = 0; i < profiles.size(); ++i) {
        EXPECT_EQ(run.results[i].profile.name, profiles[i].name);
        EXPECT_TRUE(run.results[i].errors.empty());
    }
    EXPECT_EQ(run.totalCookiesDeleted, 6);
    EXPECT_EQ(run.totalStorageDeleted, 3);
    EXPECT_FALSE(run.HasErrors());
    EXPECT_EQ(m_log->cleaned, (std::vector<std::string>{ "Chrome - Default", "Firefox - work", "Edge - Default" }));
}

TEST_F(OrchestratorTest, BrowserThatNeverClosesIsSkippedOthersProceed) {
    ON_CALL(*m_table, FindProcesses(_, _, _))
        .WillByDefault(Invoke([](const std::vector<std::string>& names, std::vector<ProcessId>& out,
                                 TraceSweep::Utils::ProcessUtils::Error*) {
            out.clear();
            if (NamesInclude(names, "chrome")) out.push_back(4242);
            return true;
        }));
    EXPECT_CALL(*m_table, Terminate(4242u, false, _)).WillOnce(Return(true));
    EXPECT_CALL(*m_table, Terminate(4242u, true, _)).WillOnce(Return(true));

    OrchestratorOptions options;
    options.closeTimeout = std::chrono::milliseconds(50);
    Orchestrator orchestrator = Make(options);

    const RunResult run = orchestrator.Run({
        Profile(BrowserFamily::Chrome, "Chrome - Default"),
        Profile(BrowserFamily::Firefox, "Firefox - work"),
    }, m_cancel);

    ASSERT_EQ(run.results.size(), 2u);
    ASSERT_EQ(run.results[0].errors.size(), 1u);
    EXPECT_EQ(run.results[0].errors[0],
        "Google Chrome processes did not close in time. Please close manually and try again.");
    EXPECT_EQ(run.results[0].TotalDeleted(), 0);

    EXPECT_TRUE(run.results[1].errors.empty());
    EXPECT_EQ(run.results[1].cookiesDeleted, 2);
    EXPECT_EQ(m_log->cleaned, std::vector<std::string>{ "Firefox - work" });
    EXPECT_EQ(m_processes->State(BrowserFamily::Chrome), ProcessLifecycleState::TimeoutExceeded);
}

TEST_F(OrchestratorTest, QueryFailureSkipsProfile) {
    ON_CALL(*m_table, FindProcesses(_, _, _))
        .WillByDefault(Invoke([](const std::vector<std::string>&, std::vector<ProcessId>&,
                                 TraceSweep::Utils::ProcessUtils::Error* err) {
            if (err) err->message = "cannot read /proc";
            return false;
        }));

    Orchestrator orchestrator = Make();
    const CleanResult result = orchestrator.ProcessProfile(Profile(BrowserFamily::Edge, "Edge - Default"), m_cancel);

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Failed to check if browser is running: cannot read /proc");
    EXPECT_TRUE(m_log->cleaned.empty());
}

TEST_F(OrchestratorTest, CancelledRunTouchesNothing) {
    m_cancel.Cancel();
    EXPECT_CALL(*m_table, FindProcesses(_, _, _)).Times(0);

    Orchestrator orchestrator = Make();
    const RunResult run = orchestrator.Run({
        Profile(BrowserFamily::Chrome, "Chrome - Default"),
        Profile(BrowserFamily::Firefox, "Firefox - work"),
    }, m_cancel);

    ASSERT_EQ(run.results.size(), 2u);
    for (const auto& r : run.results) {
        ASSERT_EQ(r.errors.size(), 1u);
        EXPECT_EQ(r.errors[0], "Operation cancelled before this profile was processed");
    }
    EXPECT_EQ(run.totalErrors, 2u);
    EXPECT_TRUE(m_log->cleaned.empty());
}

TEST_F(OrchestratorTest, ParallelRunKeepsDiscoveryOrder) {
    const std::vector<BrowserProfile> profiles = {
        Profile(BrowserFamily::Chrome, "Chrome - Default"),
        Profile(BrowserFamily::Firefox, "Firefox - a"),
        Profile(BrowserFamily::Chrome, "Chrome - Profile 1"),
        Profile(BrowserFamily::Edge, "Edge - Default"),
        Profile(BrowserFamily::Firefox, "Firefox - b"),
    };

    OrchestratorOptions options;
    options.parallel = true;
    options.maxWorkers = 2;
    Orchestrator orchestrator = Make(options);

    const RunResult run = orchestrator.Run(profiles, m_cancel);

    ASSERT_EQ(run.results.size(), profiles.size());
    for (size_t i = 0; i < profiles.size(); ++i) {
        EXPECT_EQ(run.results[i].profile.name, profiles[i].name);
    }
    EXPECT_EQ(run.totalCookiesDeleted, 10);
    EXPECT_EQ(m_log->cleaned.size(), profiles.size());

    // Profiles of one family are cleaned in their own order
    const auto& cleaned = m_log->cleaned;
    const auto pos = [&cleaned](const std::string& name) {
        return std::find(cleaned.begin(), cleaned.end(), name) - cleaned.begin();
    };
    EXPECT_LT(pos("Chrome - Default"), pos("Chrome - Profile 1"));
    EXPECT_LT(pos("Firefox - a"), pos("Firefox - b"));
}

TEST_F(OrchestratorTest, MissingCleanerIsReported) {
    Orchestrator orchestrator(nullptr, m_processes,
        [](BrowserEngine) -> std::unique_ptr<IArtifactCleaner> { return nullptr; });

    const CleanResult result = orchestrator.ProcessProfile(Profile(BrowserFamily::Chrome, "Chrome - Default"), m_cancel);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "No cleaner available for Chromium");
}

TEST_F(OrchestratorTest, CleanerExceptionBecomesError) {
    Orchestrator orchestrator = Make(OrchestratorOptions{}, true);

    const RunResult run = orchestrator.Run({
        Profile(BrowserFamily::Chrome, "Chrome - Default"),
        Profile(BrowserFamily::Edge, "Edge - Default"),
    }, m_cancel);

    ASSERT_EQ(run.results.size(), 2u);
    EXPECT_EQ(run.results[0].errors, std::vector<std::string>{ "Unexpected failure: disk on fire" });
    EXPECT_EQ(run.results[1].errors, std::vector<std::string>{ "Unexpected failure: disk on fire" });
}

TEST_F(OrchestratorTest, CountMatchesNeverTouchesProcesses) {
    EXPECT_CALL(*m_table, FindProcesses(_, _, _)).Times(0);
    EXPECT_CALL(*m_table, Terminate(_, _, _)).Times(0);

    Orchestrator orchestrator = Make();
    const CountResult counts = orchestrator.CountMatches({
        Profile(BrowserFamily::Chrome, "Chrome - Default"),
        Profile(BrowserFamily::Safari, "Safari"),
    }, m_cancel);

    ASSERT_EQ(counts.profiles.size(), 2u);
    EXPECT_EQ(counts.profiles[1].profile.name, "Safari");
    EXPECT_EQ(counts.profiles[1].count, 3);
    EXPECT_EQ(counts.total, 6);
    EXPECT_TRUE(m_log->cleaned.empty());
}

TEST_F(OrchestratorTest, FamilyFilterLimitsDiscovery) {
    TempDirectory home("tracesweep_orch_home");
    fs::create_directories(home.Path() / ".config" / "google-chrome" / "Default");
    fs::create_directories(home.Path() / ".config" / "microsoft-edge" / "Default");

    DiscoveryOptions discoveryOptions;
    discoveryOptions.homeDirectory = home.Path();
    discoveryOptions.os = OsFlavor::Linux;

    OrchestratorOptions options;
    options.familyFilter = BrowserFamily::Edge;

    Orchestrator orchestrator(std::make_shared<ProfileDiscovery>(discoveryOptions), m_processes,
        RecordingFactory(), options);

    const RunResult run = orchestrator.Run(m_cancel);
    ASSERT_EQ(run.results.size(), 1u);
    EXPECT_EQ(run.results[0].profile.name, "Edge - Default");

    const CountResult counts = orchestrator.CountMatches(m_cancel);
    ASSERT_EQ(counts.profiles.size(), 1u);
    EXPECT_EQ(counts.total, 3);
}
