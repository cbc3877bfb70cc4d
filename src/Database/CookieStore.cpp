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
#include "CookieStore.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/FileUtils.hpp"

namespace TraceSweep {
    namespace Database {

        namespace {

            void setError(DatabaseError* err, int code, std::string message, std::string context = {}) {
                if (!err) return;
                err->sqliteCode = code;
                err->extendedCode = code;
                err->message = std::move(message);
                err->context = std::move(context);
            }

            void setError(DatabaseError* err, const SQLite::Exception& ex, std::string context, std::string query = {}) {
                if (!err) return;
                err->sqliteCode = ex.getErrorCode();
                err->extendedCode = ex.getExtendedErrorCode();
                err->message = ex.what();
                err->context = std::move(context);
                err->query = std::move(query);
                // SQLiteCpp reports some failures with code 0
                if (err->sqliteCode == SQLITE_OK) err->sqliteCode = SQLITE_ERROR;
            }

        } // anonymous namespace

        // ============================================================================
        // STORE LOCK REGISTRY
        // ============================================================================

        StoreLockRegistry& StoreLockRegistry::Instance() {
            static StoreLockRegistry instance;
            return instance;
        }

        std::shared_ptr<std::mutex> StoreLockRegistry::LockFor(const std::filesystem::path& storePath) {
            std::error_code ec;
            std::filesystem::path key = std::filesystem::weakly_canonical(storePath, ec);
            if (ec) key = storePath.lexically_normal();

            std::lock_guard<std::mutex> lock(m_mutex);
            auto& slot = m_locks[key.string()];
            if (!slot) slot = std::make_shared<std::mutex>();
            return slot;
        }

        // ============================================================================
        // CONNECTION POOL IMPLEMENTATION
        // ============================================================================

        ConnectionPool::ConnectionPool(const StoreConfig& config) noexcept
            : m_config(config)
        {
        }

        ConnectionPool::~ConnectionPool() {
            Shutdown();
        }

        void ConnectionPool::Shutdown() {
            bool wasShutdown = m_shutdown.exchange(true, std::memory_order_acq_rel);
            if (wasShutdown) {
                return;
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            m_cv.notify_all();

            for (auto& pooled : m_connections) {
                pooled.connection.reset();
            }

            m_connections.clear();

            TS_LOG_DEBUG("CookieStore", "Connection pool shut down (%s)", m_config.databasePath.string().c_str());
        }

        std::shared_ptr<SQLite::Database> ConnectionPool::Acquire(
            std::chrono::milliseconds timeout,
            DatabaseError* err
        ) {
            std::unique_lock<std::mutex> lock(m_mutex);

            auto deadline = std::chrono::steady_clock::now() + timeout;

            while (true) {
                if (m_shutdown.load(std::memory_order_acquire)) {
                    setError(err, SQLITE_ERROR, "Connection pool is shut down", "Acquire");
                    return nullptr;
                }

                for (auto& pooled : m_connections) {
                    if (!pooled.inUse) {
                        pooled.inUse = true;
                        return pooled.connection;
                    }
                }

                if (m_connections.size() < m_config.maxConnections) {
                    if (!createConnection(err)) {
                        return nullptr;
                    }
                    auto& pooled = m_connections.back();
                    pooled.inUse = true;
                    return pooled.connection;
                }

                if (m_cv.wait_until(lock, deadline) == std::cv_status::timeout) {
                    setError(err, SQLITE_BUSY, "Connection acquisition timeout", "Acquire");
                    TS_LOG_WARN("CookieStore", "Connection acquisition timeout after %lld ms",
                        static_cast<long long>(timeout.count()));
                    return nullptr;
                }
            }
        }

        void ConnectionPool::Release(std::shared_ptr<SQLite::Database> conn) {
            if (!conn) return;

            std::lock_guard<std::mutex> lock(m_mutex);

            for (auto& pooled : m_connections) {
                if (pooled.connection == conn) {
                    pooled.inUse = false;
                    m_cv.notify_one();
                    return;
                }
            }

            TS_LOG_WARN("CookieStore", "Released connection not found in pool");
        }

        /**
         * @note Caller must hold m_mutex lock
         */
        bool ConnectionPool::createConnection(DatabaseError* err) {
            try {
                // never create: a missing store is the caller's concern
                const int flags = m_config.readOnly ? SQLite::OPEN_READONLY : SQLite::OPEN_READWRITE;

                auto connection = std::make_shared<SQLite::Database>(
                    m_config.databasePath.string(),
                    flags,
                    m_config.busyTimeoutMs
                );

                if (!m_config.readOnly && !configureConnection(*connection, err)) {
                    return false;
                }

                PooledConnection pooled;
                pooled.connection = connection;
                pooled.inUse = false;

                m_connections.push_back(std::move(pooled));

                TS_LOG_DEBUG("CookieStore", "Opened %s (%zu total)",
                    m_config.databasePath.string().c_str(), m_connections.size());
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, "createConnection");
                TS_LOG_ERROR("CookieStore", "Failed to open %s: %s", m_config.databasePath.string().c_str(), ex.what());
                return false;
            }
        }

        bool ConnectionPool::configureConnection(SQLite::Database& db, DatabaseError* err) {
            if (!IsValidSqlIdentifier(m_config.journalMode) || !IsValidSqlIdentifier(m_config.synchronousMode)) {
                setError(err, SQLITE_MISUSE, "Invalid PRAGMA value", "configureConnection");
                return false;
            }

            try {
                db.exec("PRAGMA journal_mode = " + m_config.journalMode);
                db.exec("PRAGMA synchronous = " + m_config.synchronousMode);
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, "configureConnection");
                TS_LOG_ERROR("CookieStore", "Failed to configure connection: %s", ex.what());
                return false;
            }
        }

        // ============================================================================
        // TRANSACTION IMPLEMENTATION
        // ============================================================================

        Transaction::Transaction(SQLite::Database& db, Type type, DatabaseError* err)
            : m_db(&db)
        {
            const char* sql = nullptr;
            switch (type) {
            case Type::Deferred:
                sql = "BEGIN DEFERRED TRANSACTION";
                break;
            case Type::Immediate:
                sql = "BEGIN IMMEDIATE TRANSACTION";
                break;
            case Type::Exclusive:
                sql = "BEGIN EXCLUSIVE TRANSACTION";
                break;
            }

            try {
                m_db->exec(sql);
                m_active = true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, "Transaction::Begin", sql);
                TS_LOG_ERROR("CookieStore", "Failed to begin transaction: %s", ex.what());
                m_active = false;
            }
        }

        Transaction::~Transaction() {
            if (m_active && !m_committed && m_db) {
                try {
                    m_db->exec("ROLLBACK");
                    TS_LOG_DEBUG("CookieStore", "Transaction rolled back (destructor)");
                }
                catch (const SQLite::Exception& ex) {
                    TS_LOG_ERROR("CookieStore", "Failed to rollback transaction: %s", ex.what());
                }
            }
        }

        bool Transaction::Commit(DatabaseError* err) {
            if (!m_active || m_committed) {
                setError(err, SQLITE_MISUSE, "Transaction is not active", "Transaction::Commit");
                return false;
            }

            try {
                m_db->exec("COMMIT");
                m_committed = true;
                m_active = false;
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, "Transaction::Commit", "COMMIT");
                TS_LOG_ERROR("CookieStore", "Failed to commit transaction: %s", ex.what());
                return false;
            }
        }

        bool Transaction::Rollback(DatabaseError* err) {
            if (!m_active) {
                return true;
            }

            try {
                m_db->exec("ROLLBACK");
                m_active = false;
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, "Transaction::Rollback", "ROLLBACK");
                TS_LOG_ERROR("CookieStore", "Failed to rollback transaction: %s", ex.what());
                m_active = false;
                return false;
            }
        }

        // ============================================================================
        // COOKIE STORE
        // ============================================================================

        CookieStore::CookieStore(StoreConfig config, CookieTableSpec table)
            : m_config(std::move(config))
            , m_table(std::move(table))
        {
        }

        CookieStore::~CookieStore() {
            Close();
        }

        bool CookieStore::RemoveSidecars(const std::filesystem::path& storePath, DatabaseError* err) {
            bool ok = true;
            for (const char* suffix : { StoreConstants::WAL_SUFFIX, StoreConstants::SHM_SUFFIX }) {
                std::filesystem::path sidecar = storePath;
                sidecar += suffix;

                Utils::FileUtils::Error ferr;
                if (!Utils::FileUtils::RemoveFile(sidecar, &ferr)) {
                    TS_LOG_WARN("CookieStore", "Could not remove %s: %s", sidecar.string().c_str(), ferr.message.c_str());
                    setError(err, SQLITE_IOERR, ferr.message, "RemoveSidecars");
                    ok = false;
                }
            }
            return ok;
        }

        bool CookieStore::Open(const Utils::CancellationToken& cancel, DatabaseError* err) {
            if (m_open) return true;

            if (!validateTable(err)) return false;

            m_pathMutex = StoreLockRegistry::Instance().LockFor(m_config.databasePath);
            m_pathLock = std::unique_lock<std::mutex>(*m_pathMutex);

            if (!m_config.readOnly) {
                // a stale sidecar is not fatal; the open below decides
                DatabaseError sidecarErr;
                (void)RemoveSidecars(m_config.databasePath, &sidecarErr);
            }

            m_config.maxConnections = 1;
            m_pool = std::make_unique<ConnectionPool>(m_config);

            const int attempts = m_config.livenessAttempts > 0 ? m_config.livenessAttempts : 1;
            DatabaseError lastErr;
            for (int attempt = 1; attempt <= attempts; ++attempt) {
                lastErr.Clear();
                if (Ping(&lastErr)) {
                    m_open = true;
                    TS_LOG_DEBUG("CookieStore", "Store %s is live (attempt %d)", m_config.databasePath.string().c_str(), attempt);
                    return true;
                }

                TS_LOG_WARN("CookieStore", "Liveness check %d/%d failed for %s: %s",
                    attempt, attempts, m_config.databasePath.string().c_str(), lastErr.message.c_str());

                if (attempt < attempts && !cancel.SleepFor(m_config.livenessBackoff * attempt)) {
                    lastErr.message = "Cancelled while waiting for store: " + lastErr.message;
                    break;
                }
            }

            if (err) {
                *err = lastErr;
                if (!err->HasError()) err->sqliteCode = SQLITE_CANTOPEN;
                err->context = "CookieStore::Open";
            }
            Close();
            return false;
        }

        bool CookieStore::Ping(DatabaseError* err) {
            if (!m_pool) {
                setError(err, SQLITE_MISUSE, "Store is not open", "Ping");
                return false;
            }

            ConnectionLease conn(*m_pool, m_pool->Acquire(std::chrono::milliseconds(m_config.busyTimeoutMs), err));
            if (!conn) return false;

            try {
                SQLite::Statement query(*conn, "SELECT 1");
                return query.executeStep();
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, "Ping", "SELECT 1");
                return false;
            }
        }

        bool CookieStore::DeleteMatching(const std::vector<std::string>& likePatterns, int64_t& deleted, DatabaseError* err) {
            deleted = 0;

            if (!m_open || !m_pool) {
                setError(err, SQLITE_MISUSE, "Store is not open", "DeleteMatching");
                return false;
            }
            if (m_config.readOnly) {
                setError(err, SQLITE_READONLY, "Store opened read-only", "DeleteMatching");
                return false;
            }
            if (likePatterns.empty()) return true;

            ConnectionLease conn(*m_pool, m_pool->Acquire(std::chrono::milliseconds(m_config.busyTimeoutMs), err));
            if (!conn) return false;

            Transaction txn(*conn, Transaction::Type::Immediate, err);
            if (!txn.IsActive()) return false;

            const std::string sql = "DELETE FROM " + m_table.table + " WHERE " + buildWhereClause(1);

            int64_t total = 0;
            try {
                SQLite::Statement stmt(*conn, sql);
                for (const auto& pattern : likePatterns) {
                    stmt.reset();
                    stmt.clearBindings();
                    stmt.bind(1, pattern);
                    stmt.bind(2, pattern);
                    stmt.bind(3, pattern);
                    total += stmt.exec();
                }
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, "DeleteMatching", sql);
                TS_LOG_ERROR("CookieStore", "Delete failed on %s, rolling back: %s",
                    m_config.databasePath.string().c_str(), ex.what());
                DatabaseError rbErr;
                if (!txn.Rollback(&rbErr)) {
                    TS_LOG_ERROR("CookieStore", "Rollback failed: %s", rbErr.message.c_str());
                }
                return false;
            }

            if (!txn.Commit(err)) {
                return false;
            }

            deleted = total;
            TS_LOG_INFO("CookieStore", "Deleted %lld rows from %s", static_cast<long long>(deleted),
                m_config.databasePath.string().c_str());
            return true;
        }

        bool CookieStore::CountMatching(const std::vector<std::string>& likePatterns, int64_t& count, DatabaseError* err) {
            count = 0;

            if (!m_open || !m_pool) {
                setError(err, SQLITE_MISUSE, "Store is not open", "CountMatching");
                return false;
            }
            if (likePatterns.empty()) return true;

            ConnectionLease conn(*m_pool, m_pool->Acquire(std::chrono::milliseconds(m_config.busyTimeoutMs), err));
            if (!conn) return false;

            const std::string sql = "SELECT COUNT(*) FROM " + m_table.table + " WHERE " + buildWhereClause(likePatterns.size());

            try {
                SQLite::Statement query(*conn, sql);
                int index = 1;
                for (const auto& pattern : likePatterns) {
                    query.bind(index++, pattern);
                    query.bind(index++, pattern);
                    query.bind(index++, pattern);
                }
                if (query.executeStep()) {
                    count = query.getColumn(0).getInt64();
                }
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, "CountMatching", sql);
                return false;
            }
        }

        void CookieStore::Close() {
            if (m_pool) {
                m_pool->Shutdown();
                m_pool.reset();
            }
            if (m_pathLock.owns_lock()) {
                m_pathLock.unlock();
            }
            m_pathLock = std::unique_lock<std::mutex>();
            m_pathMutex.reset();
            m_open = false;
        }

        bool CookieStore::validateTable(DatabaseError* err) const {
            if (!IsValidSqlIdentifier(m_table.table) || !IsValidSqlIdentifier(m_table.hostColumn)) {
                setError(err, SQLITE_MISUSE, "Invalid cookie table specification", "CookieStore");
                return false;
            }
            return true;
        }

        std::string CookieStore::buildWhereClause(size_t patternCount) const {
            std::string where;
            for (size_t i = 0; i < patternCount; ++i) {
                if (i > 0) where += " OR ";
                where += "(" + m_table.hostColumn + " LIKE ? OR name LIKE ? OR value LIKE ?)";
            }
            return where;
        }

    } // namespace Database
} // namespace TraceSweep
