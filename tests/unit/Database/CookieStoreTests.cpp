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

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "TestSupport.hpp"
#include "Browser/ArtifactRules.hpp"
#include "Database/CookieStore.hpp"
#include "Utils/CancellationToken.hpp"

using namespace TraceSweep;
using namespace TraceSweep::Database;
using TraceSweep::Testing::CountRows;
using TraceSweep::Testing::CreateCookieDatabase;
using TraceSweep::Testing::MixedCookieRows;
using TraceSweep::Testing::TempDirectory;
using TraceSweep::Testing::WriteFile;
namespace fs = std::filesystem;

class CookieStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_db = m_dir.Path() / "Cookies";
        CreateCookieDatabase(m_db, "cookies", "host_key", MixedCookieRows());
    }

    StoreConfig Config(bool readOnly = false) const {
        StoreConfig cfg;
        cfg.databasePath = m_db;
        cfg.busyTimeoutMs = 1000;
        cfg.readOnly = readOnly;
        cfg.livenessAttempts = 2;
        cfg.livenessBackoff = std::chrono::milliseconds(1);
        return cfg;
    }

    static CookieTableSpec Table() { return { "cookies", "host_key" }; }

    TempDirectory m_dir{ "cookiestore" };
    fs::path m_db;
    Utils::CancellationToken m_cancel;
};

TEST_F(CookieStoreTest, DeletesOnlyTrackedRows) {
    CookieStore store(Config(), Table());
    DatabaseError err;
    ASSERT_TRUE(store.Open(m_cancel, &err)) << err.message;

    int64_t deleted = 0;
    ASSERT_TRUE(store.DeleteMatching(Browser::CookieLikePatterns(), deleted, &err)) << err.message;
    store.Close();

    EXPECT_EQ(deleted, 5);
    EXPECT_EQ(CountRows(m_db, "cookies"), 3);
}

TEST_F(CookieStoreTest, CountMatchesDeleteWithoutWriting) {
    int64_t counted = 0;
    {
        CookieStore store(Config(true), Table());
        DatabaseError err;
        ASSERT_TRUE(store.Open(m_cancel, &err)) << err.message;
        ASSERT_TRUE(store.CountMatching(Browser::CookieLikePatterns(), counted, &err)) << err.message;
    }
    EXPECT_EQ(counted, 5);
    EXPECT_EQ(CountRows(m_db, "cookies"), 8);

    CookieStore store(Config(), Table());
    ASSERT_TRUE(store.Open(m_cancel));
    int64_t deleted = 0;
    ASSERT_TRUE(store.DeleteMatching(Browser::CookieLikePatterns(), deleted));
    EXPECT_EQ(deleted, counted);
}

TEST_F(CookieStoreTest, ReadOnlyStoreRefusesDeletion) {
    CookieStore store(Config(true), Table());
    ASSERT_TRUE(store.Open(m_cancel));

    int64_t deleted = -1;
    DatabaseError err;
    EXPECT_FALSE(store.DeleteMatching(Browser::CookieLikePatterns(), deleted, &err));
    EXPECT_EQ(deleted, 0);
    EXPECT_EQ(err.sqliteCode, SQLITE_READONLY);
}

TEST_F(CookieStoreTest, FailedStatementRollsBackEarlierDeletes) {
    {
        SQLite::Database db(m_db.string(), SQLite::OPEN_READWRITE);
        db.exec("CREATE TRIGGER guard BEFORE DELETE ON cookies WHEN old.name = 'cart' "
                "BEGIN SELECT RAISE(ABORT, 'protected row'); END");
    }

    CookieStore store(Config(), Table());
    ASSERT_TRUE(store.Open(m_cancel));

    int64_t deleted = -1;
    DatabaseError err;
    EXPECT_FALSE(store.DeleteMatching({ "%augment%", "cart" }, deleted, &err));
    EXPECT_EQ(deleted, 0);
    EXPECT_TRUE(err.HasError());
    store.Close();

    EXPECT_EQ(CountRows(m_db, "cookies"), 8);
}

TEST_F(CookieStoreTest, OpenRemovesSidecarsInReadWriteMode) {
    WriteFile(m_db.string() + "-wal", "");
    WriteFile(m_db.string() + "-shm", "");

    CookieStore store(Config(), Table());
    ASSERT_TRUE(store.Open(m_cancel));
    EXPECT_FALSE(fs::exists(m_db.string() + "-shm"));
}

TEST_F(CookieStoreTest, OpenFailsOnCorruptStore) {
    const fs::path bogus = m_dir.Path() / "bogus.sqlite";
    WriteFile(bogus, std::string(4096, 'Z'));

    StoreConfig cfg = Config();
    cfg.databasePath = bogus;
    CookieStore store(cfg, Table());

    DatabaseError err;
    EXPECT_FALSE(store.Open(m_cancel, &err));
    EXPECT_TRUE(err.HasError());
    EXPECT_FALSE(store.IsOpen());
}

TEST_F(CookieStoreTest, LivenessIsRetriedWithGrowingBackoff) {
    const fs::path bogus = m_dir.Path() / "bogus.sqlite";
    WriteFile(bogus, std::string(4096, 'Z'));

    StoreConfig cfg = Config();
    cfg.databasePath = bogus;
    cfg.livenessAttempts = 3;
    cfg.livenessBackoff = std::chrono::milliseconds(25);
    CookieStore store(cfg, Table());

    // Sleeps of 1x and 2x the backoff separate the three attempts
    const auto started = std::chrono::steady_clock::now();
    DatabaseError err;
    EXPECT_FALSE(store.Open(m_cancel, &err));
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(75));
    EXPECT_EQ(err.message.rfind("Cancelled", 0), std::string::npos);
}

TEST_F(CookieStoreTest, SingleAttemptDoesNotSleep) {
    const fs::path bogus = m_dir.Path() / "bogus.sqlite";
    WriteFile(bogus, std::string(4096, 'Z'));

    StoreConfig cfg = Config();
    cfg.databasePath = bogus;
    cfg.livenessAttempts = 1;
    cfg.livenessBackoff = std::chrono::seconds(10);
    CookieStore store(cfg, Table());

    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(store.Open(m_cancel));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST_F(CookieStoreTest, CancelCutsLivenessBackoffShort) {
    const fs::path bogus = m_dir.Path() / "bogus.sqlite";
    WriteFile(bogus, std::string(4096, 'Z'));

    StoreConfig cfg = Config();
    cfg.databasePath = bogus;
    cfg.livenessAttempts = 3;
    cfg.livenessBackoff = std::chrono::seconds(10);
    CookieStore store(cfg, Table());

    Utils::CancellationToken cancel;
    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.Cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    DatabaseError err;
    const bool opened = store.Open(cancel, &err);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_FALSE(opened);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(err.message.rfind("Cancelled while waiting for store", 0), 0u) << err.message;
}

TEST_F(CookieStoreTest, SecondOpenOnSamePathWaitsForClose) {
    CookieStore first(Config(), Table());
    ASSERT_TRUE(first.Open(m_cancel));

    std::atomic<bool> firstClosed{ false };
    std::atomic<bool> secondOpened{ false };
    std::atomic<bool> openedAfterClose{ false };

    std::thread other([&]() {
        Utils::CancellationToken cancel;
        CookieStore second(Config(), Table());
        if (second.Open(cancel)) {
            openedAfterClose = firstClosed.load();
            secondOpened = true;
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(secondOpened.load());

    firstClosed = true;
    first.Close();
    other.join();

    EXPECT_TRUE(secondOpened.load());
    EXPECT_TRUE(openedAfterClose.load());
}

TEST_F(CookieStoreTest, RejectsUnsafeTableIdentifiers) {
    CookieStore store(Config(), { "cookies; DROP TABLE cookies", "host_key" });
    DatabaseError err;
    EXPECT_FALSE(store.Open(m_cancel, &err));
    EXPECT_EQ(CountRows(m_db, "cookies"), 8);
}

TEST(SqlIdentifierTest, Validation) {
    EXPECT_TRUE(IsValidSqlIdentifier("moz_cookies"));
    EXPECT_TRUE(IsValidSqlIdentifier("_x1"));
    EXPECT_FALSE(IsValidSqlIdentifier(""));
    EXPECT_FALSE(IsValidSqlIdentifier("1abc"));
    EXPECT_FALSE(IsValidSqlIdentifier("host key"));
}

TEST(StoreLockRegistryTest, SamePathSharesOneMutex) {
    TempDirectory dir("locks");
    const auto path = dir.Path() / "Cookies";
    WriteFile(path, "");

    auto a = StoreLockRegistry::Instance().LockFor(path);
    auto b = StoreLockRegistry::Instance().LockFor(dir.Path() / "." / "Cookies");
    EXPECT_EQ(a.get(), b.get());
}
