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
 * TraceSweep - ARTIFACT CLEANER MODULE
 * ============================================================================
 *
 * @file ArtifactCleaner.hpp
 * @brief Per-engine strategies that remove tracked artifacts from a profile.
 *
 * STRATEGIES:
 * ===========
 *
 * ChromiumCleaner (Chrome, Edge)
 *   - Cookies                cookies(host_key, name, value)
 *   - Local Storage/leveldb  name + content, sidecars first
 *   - Session Storage        name + content, sidecars first
 *   - Cache                  name + content up to 10 MB, core files kept
 *
 * GeckoCleaner (Firefox)
 *   - cookies.sqlite         moz_cookies(host, name, value)
 *   - storage/default        matching origin directories removed whole
 *   - cache2                 name + content up to 5 MB
 *
 * WebKitCleaner (Safari)
 *   - LocalStorage           name only
 *   - Cookies.binarycookies and Cache.db are reported for manual cleanup
 *
 * Clean() takes the backup first when asked. A failed backup returns at
 * once with a single error and nothing removed. Every other failure is
 * appended to the result and the remaining areas still run.
 * ============================================================================
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "ArtifactRules.hpp"
#include "BackupManager.hpp"
#include "BrowserTypes.hpp"
#include "../Database/CookieStore.hpp"
#include "../Utils/CancellationToken.hpp"

namespace TraceSweep {
namespace Browser {

/**
 * @brief Tunables shared by every strategy
 */
struct CleanerOptions {
    RemovalPolicy removal;

    int databaseBusyTimeoutMs = Database::StoreConstants::DEFAULT_BUSY_TIMEOUT_MS;
    int livenessAttempts = Database::StoreConstants::DEFAULT_LIVENESS_ATTEMPTS;
    std::chrono::milliseconds livenessBackoff = Database::StoreConstants::DEFAULT_LIVENESS_BACKOFF;
};

// ============================================================================
// INTERFACE
// ============================================================================

class IArtifactCleaner {
public:
    virtual ~IArtifactCleaner() = default;

    [[nodiscard]] virtual BrowserEngine Engine() const noexcept = 0;

    /**
     * @brief Back up (optionally) and clean one profile.
     *
     * Always returns a result. Failures are recorded in CleanResult::errors.
     */
    [[nodiscard]] virtual CleanResult Clean(const BrowserProfile& profile, bool createBackup,
        const Utils::CancellationToken& cancel) = 0;

    /**
     * @brief Number of items Clean() would remove, read-only.
     *
     * Cookie rows matching any pattern count once each.
     */
    [[nodiscard]] virtual int64_t CountMatches(const BrowserProfile& profile,
        const Utils::CancellationToken& cancel) = 0;
};

// ============================================================================
// SHARED BASE
// ============================================================================

class ArtifactCleanerBase : public IArtifactCleaner {
public:
    ArtifactCleanerBase(std::shared_ptr<const BackupManager> backup, CleanerOptions options);

    [[nodiscard]] CleanResult Clean(const BrowserProfile& profile, bool createBackup,
        const Utils::CancellationToken& cancel) final;

    [[nodiscard]] const CleanerOptions& Options() const noexcept { return m_options; }

protected:
    /// @brief Engine-specific removal, run after a successful backup
    virtual void cleanProfile(const BrowserProfile& profile, const Utils::CancellationToken& cancel,
        CleanResult& result) = 0;

    /**
     * @brief Delete matching rows from one cookie store.
     *
     * A missing store is a zero count with no error.
     */
    void cleanCookieStore(const fs::path& storePath, const Database::CookieTableSpec& table,
        const Utils::CancellationToken& cancel, CleanResult& result) const;

    /// @brief Read-only row count; failures are logged and count as zero
    [[nodiscard]] int64_t countCookieStore(const fs::path& storePath, const Database::CookieTableSpec& table,
        const Utils::CancellationToken& cancel) const;

    /**
     * @brief Sweep one area and fold its report into @p result.
     *
     * @param label Used in the walk-failure message ("local storage", "cache", ...)
     * @param counter Field of @p result credited with removed items
     */
    void sweepArea(const fs::path& root, const AreaRules& rules, const char* label,
        const Utils::CancellationToken& cancel, int64_t& counter, CleanResult& result) const;

    [[nodiscard]] int64_t countArea(const fs::path& root, const AreaRules& rules,
        const Utils::CancellationToken& cancel) const;

private:
    [[nodiscard]] Database::StoreConfig storeConfig(const fs::path& storePath, bool readOnly) const;

    std::shared_ptr<const BackupManager> m_backup;
    CleanerOptions m_options;
};

// ============================================================================
// STRATEGIES
// ============================================================================

class ChromiumCleaner final : public ArtifactCleanerBase {
public:
    using ArtifactCleanerBase::ArtifactCleanerBase;

    [[nodiscard]] BrowserEngine Engine() const noexcept override { return BrowserEngine::Chromium; }
    [[nodiscard]] int64_t CountMatches(const BrowserProfile& profile, const Utils::CancellationToken& cancel) override;

    [[nodiscard]] static Database::CookieTableSpec CookieTable();
    [[nodiscard]] static AreaRules StorageRules();
    [[nodiscard]] static AreaRules CacheRules();

protected:
    void cleanProfile(const BrowserProfile& profile, const Utils::CancellationToken& cancel,
        CleanResult& result) override;
};

class GeckoCleaner final : public ArtifactCleanerBase {
public:
    using ArtifactCleanerBase::ArtifactCleanerBase;

    [[nodiscard]] BrowserEngine Engine() const noexcept override { return BrowserEngine::Gecko; }
    [[nodiscard]] int64_t CountMatches(const BrowserProfile& profile, const Utils::CancellationToken& cancel) override;

    [[nodiscard]] static Database::CookieTableSpec CookieTable();
    [[nodiscard]] static AreaRules StorageRules();
    [[nodiscard]] static AreaRules CacheRules();

protected:
    void cleanProfile(const BrowserProfile& profile, const Utils::CancellationToken& cancel,
        CleanResult& result) override;
};

class WebKitCleaner final : public ArtifactCleanerBase {
public:
    using ArtifactCleanerBase::ArtifactCleanerBase;

    [[nodiscard]] BrowserEngine Engine() const noexcept override { return BrowserEngine::WebKit; }
    [[nodiscard]] int64_t CountMatches(const BrowserProfile& profile, const Utils::CancellationToken& cancel) override;

    [[nodiscard]] static AreaRules StorageRules();

    static constexpr const char* COOKIES_MANUAL_MESSAGE =
        "Safari cookie cleaning requires manual intervention (binary format)";
    static constexpr const char* CACHE_MANUAL_MESSAGE =
        "Safari cache cleaning requires manual intervention";

protected:
    void cleanProfile(const BrowserProfile& profile, const Utils::CancellationToken& cancel,
        CleanResult& result) override;
};

// ============================================================================
// FACTORY
// ============================================================================

/// @brief Strategy for @p engine
[[nodiscard]] std::unique_ptr<IArtifactCleaner> CreateArtifactCleaner(BrowserEngine engine,
    std::shared_ptr<const BackupManager> backup, CleanerOptions options = CleanerOptions{});

}  // namespace Browser
}  // namespace TraceSweep
