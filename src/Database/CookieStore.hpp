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
 * @file CookieStore.hpp
 * @brief SQLite access layer for browser cookie databases.
 *
 * Architecture:
 * -------------
 *
 *   ┌──────────────────────────────────────────────────────────┐
 *   │                       CookieStore                        │
 *   │     Open(), Ping(), DeleteMatching(), CountMatching()    │
 *   └──────────────────────────────────────────────────────────┘
 *          │                    │                    │
 *          ▼                    ▼                    ▼
 *   ┌──────────────┐   ┌────────────────┐   ┌─────────────────┐
 *   │ StoreLock    │   │ Connection     │   │  Transaction    │
 *   │ Registry     │   │ Pool (max 1)   │   │  (RAII)         │
 *   └──────────────┘   └────────────────┘   └─────────────────┘
 *                               │
 *                               ▼
 *                 SQLite3 connection (via SQLiteCpp)
 *
 * Key Components:
 * ---------------
 *
 * 1. DatabaseError
 *    Structured error information: SQLite code, extended code, the
 *    failing query and the operation context.
 *
 * 2. StoreLockRegistry
 *    Process-wide map from canonical store path to a mutex. A CookieStore
 *    holds its path's lock from Open() until Close(), so one store file is
 *    never touched by two connections of this process at once.
 *
 * 3. ConnectionPool
 *    Connection pool capped at one connection per store file. Connections
 *    are opened lazily and configured with the store PRAGMAs.
 *
 * 4. Transaction
 *    RAII transaction. Rolls back on every exit path unless committed.
 *
 * 5. CookieStore
 *    Removes the WAL/SHM sidecars, verifies liveness with bounded retries,
 *    then deletes or counts rows whose host, name or value match any of
 *    the supplied LIKE patterns. Deletion is all-or-nothing.
 *
 * Thread Safety:
 * --------------
 * - StoreLockRegistry, ConnectionPool: thread-safe
 * - CookieStore, Transaction: single-thread use
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <SQLiteCpp/SQLiteCpp.h>
#include <sqlite3.h>

#include "../Utils/CancellationToken.hpp"

namespace TraceSweep {
    namespace Database {

        // ============================================================================
        // CONSTANTS
        // ============================================================================

        namespace StoreConstants {
            inline constexpr int DEFAULT_BUSY_TIMEOUT_MS = 30000;
            inline constexpr int DEFAULT_LIVENESS_ATTEMPTS = 3;
            inline constexpr std::chrono::milliseconds DEFAULT_LIVENESS_BACKOFF{ 1000 };
            inline constexpr const char* WAL_SUFFIX = "-wal";
            inline constexpr const char* SHM_SUFFIX = "-shm";
        }

        // ============================================================================
        // ERROR HANDLING
        // ============================================================================

        /**
         * @brief Detailed error information for database operations.
         */
        struct DatabaseError {
            int sqliteCode = SQLITE_OK;     ///< Primary SQLite result code
            int extendedCode = 0;           ///< Extended error code for details
            std::string message;            ///< Human-readable error message
            std::string query;              ///< SQL query that caused the error
            std::string context;            ///< Operation context (function name)

            /** @brief Returns true if an error is present */
            bool HasError() const noexcept { return sqliteCode != SQLITE_OK; }

            /** @brief Resets all error fields to default state */
            void Clear() noexcept {
                sqliteCode = SQLITE_OK;
                extendedCode = 0;
                message.clear();
                query.clear();
                context.clear();
            }
        };

        // ============================================================================
        // SQL SECURITY UTILITIES
        // ============================================================================

        /**
         * @brief Validates that a string is a safe SQL identifier (table/column name).
         *
         * Identifiers are spliced into statements, so only [A-Za-z_][A-Za-z0-9_]*
         * is accepted.
         */
        [[nodiscard]] inline bool IsValidSqlIdentifier(std::string_view identifier) noexcept {
            if (identifier.empty() || identifier.size() > 128) {
                return false;
            }

            const char first = identifier.front();
            if (!((first >= 'a' && first <= 'z') || (first >= 'A' && first <= 'Z') || first == '_')) {
                return false;
            }

            for (const char c : identifier) {
                const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_';
                if (!ok) return false;
            }
            return true;
        }

        // ============================================================================
        // CONFIGURATION
        // ============================================================================

        /**
         * @brief Connection settings for one cookie store file.
         */
        struct StoreConfig {
            std::filesystem::path databasePath;
            int busyTimeoutMs = StoreConstants::DEFAULT_BUSY_TIMEOUT_MS;
            std::string journalMode = "DELETE";
            std::string synchronousMode = "NORMAL";
            size_t maxConnections = 1;
            bool readOnly = false;                      ///< Open read-only, keep sidecars, skip PRAGMAs
            int livenessAttempts = StoreConstants::DEFAULT_LIVENESS_ATTEMPTS;
            std::chrono::milliseconds livenessBackoff = StoreConstants::DEFAULT_LIVENESS_BACKOFF;  ///< Sleep before retry N is N * backoff
        };

        /**
         * @brief Where a browser keeps its cookie rows.
         *
         * The name and value columns are called `name` and `value` in every
         * supported engine; only the table and host column differ.
         */
        struct CookieTableSpec {
            std::string table;          ///< e.g. "cookies", "moz_cookies"
            std::string hostColumn;     ///< e.g. "host_key", "host"
        };

        // ============================================================================
        // STORE LOCK REGISTRY
        // ============================================================================

        class StoreLockRegistry {
        public:
            static StoreLockRegistry& Instance();

            /**
             * @brief Mutex guarding @p storePath.
             *
             * Paths are canonicalized when the file exists so that two spellings
             * of the same store share one mutex.
             */
            std::shared_ptr<std::mutex> LockFor(const std::filesystem::path& storePath);

        private:
            StoreLockRegistry() = default;

            mutable std::mutex m_mutex;
            std::unordered_map<std::string, std::shared_ptr<std::mutex>> m_locks;
        };

        // ============================================================================
        // CONNECTION POOL
        // ============================================================================

        class ConnectionPool {
        public:
            explicit ConnectionPool(const StoreConfig& config) noexcept;
            ~ConnectionPool();

            ConnectionPool(const ConnectionPool&) = delete;
            ConnectionPool& operator=(const ConnectionPool&) = delete;

            /** @brief Shuts down pool and closes all connections */
            void Shutdown();

            /**
             * @brief Acquires a connection, opening one lazily if below the cap.
             * @return Connection, nullptr on timeout/error
             */
            std::shared_ptr<SQLite::Database> Acquire(
                std::chrono::milliseconds timeout = std::chrono::seconds(30),
                DatabaseError* err = nullptr
            );

            /** @brief Returns connection to pool */
            void Release(std::shared_ptr<SQLite::Database> conn);

        private:
            struct PooledConnection {
                std::shared_ptr<SQLite::Database> connection;
                bool inUse = false;
            };

            bool createConnection(DatabaseError* err);
            bool configureConnection(SQLite::Database& db, DatabaseError* err);

            StoreConfig m_config;
            mutable std::mutex m_mutex;
            std::condition_variable m_cv;
            std::vector<PooledConnection> m_connections;
            std::atomic<bool> m_shutdown{ false };
        };

        /**
         * @brief Scope guard that returns a connection to its pool.
         */
        class ConnectionLease {
        public:
            ConnectionLease(ConnectionPool& pool, std::shared_ptr<SQLite::Database> conn) noexcept
                : m_pool(&pool), m_conn(std::move(conn)) {}
            ~ConnectionLease() { if (m_pool && m_conn) m_pool->Release(m_conn); }

            ConnectionLease(const ConnectionLease&) = delete;
            ConnectionLease& operator=(const ConnectionLease&) = delete;

            [[nodiscard]] explicit operator bool() const noexcept { return m_conn != nullptr; }
            SQLite::Database& operator*() const noexcept { return *m_conn; }
            SQLite::Database* operator->() const noexcept { return m_conn.get(); }

        private:
            ConnectionPool* m_pool;
            std::shared_ptr<SQLite::Database> m_conn;
        };

        // ============================================================================
        // TRANSACTION (RAII)
        // ============================================================================

        class Transaction {
        public:
            enum class Type {
                Deferred,   ///< Lock acquired on first read/write
                Immediate,  ///< RESERVED lock acquired immediately
                Exclusive   ///< EXCLUSIVE lock acquired immediately
            };

            explicit Transaction(SQLite::Database& db, Type type = Type::Deferred, DatabaseError* err = nullptr);

            /** @brief Destructor - rolls back if not committed */
            ~Transaction();

            Transaction(const Transaction&) = delete;
            Transaction& operator=(const Transaction&) = delete;

            bool Commit(DatabaseError* err = nullptr);
            bool Rollback(DatabaseError* err = nullptr);

            bool IsActive() const noexcept { return m_active; }

        private:
            SQLite::Database* m_db = nullptr;
            bool m_active = false;
            bool m_committed = false;
        };

        // ============================================================================
        // COOKIE STORE
        // ============================================================================

        class CookieStore {
        public:
            CookieStore(StoreConfig config, CookieTableSpec table);
            ~CookieStore();

            CookieStore(const CookieStore&) = delete;
            CookieStore& operator=(const CookieStore&) = delete;

            /**
             * @brief Remove the `-wal` and `-shm` companions of a store.
             *
             * Missing sidecars are not an error.
             */
            static bool RemoveSidecars(const std::filesystem::path& storePath, DatabaseError* err = nullptr);

            /**
             * @brief Take the path lock, drop sidecars (read-write mode) and verify liveness.
             *
             * Liveness is retried up to livenessAttempts times; the sleeps go
             * through @p cancel.
             */
            [[nodiscard]] bool Open(const Utils::CancellationToken& cancel, DatabaseError* err = nullptr);

            /** @brief Run `SELECT 1` on a pooled connection. */
            [[nodiscard]] bool Ping(DatabaseError* err = nullptr);

            /**
             * @brief Delete every row whose host, name or value is LIKE any pattern.
             *
             * All statements run inside one IMMEDIATE transaction. If any fails
             * the transaction is rolled back and @p deleted is 0.
             */
            [[nodiscard]] bool DeleteMatching(const std::vector<std::string>& likePatterns, int64_t& deleted, DatabaseError* err = nullptr);

            /**
             * @brief Count rows DeleteMatching would remove (each row once).
             */
            [[nodiscard]] bool CountMatching(const std::vector<std::string>& likePatterns, int64_t& count, DatabaseError* err = nullptr);

            /** @brief Close connections and release the path lock. */
            void Close();

            bool IsOpen() const noexcept { return m_open; }
            const StoreConfig& Config() const noexcept { return m_config; }

        private:
            bool validateTable(DatabaseError* err) const;
            std::string buildWhereClause(size_t patternCount) const;

            StoreConfig m_config;
            CookieTableSpec m_table;
            std::unique_ptr<ConnectionPool> m_pool;
            std::shared_ptr<std::mutex> m_pathMutex;
            std::unique_lock<std::mutex> m_pathLock;
            bool m_open = false;
        };

    } // namespace Database
} // namespace TraceSweep
