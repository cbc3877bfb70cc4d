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
#include "ArtifactCleaner.hpp"

#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"

#include <system_error>

namespace TraceSweep {
namespace Browser {

namespace {

constexpr const char* LOG_CATEGORY = "Cleaner";

}  // anonymous namespace

// ============================================================================
// SHARED BASE
// ============================================================================

ArtifactCleanerBase::ArtifactCleanerBase(std::shared_ptr<const BackupManager> backup, CleanerOptions options)
    : m_backup(std::move(backup))
    , m_options(options) {
}

CleanResult ArtifactCleanerBase::Clean(const BrowserProfile& profile, bool createBackup,
    const Utils::CancellationToken& cancel) {
    TS_LOG_SCOPE(LOG_CATEGORY);

    CleanResult result;
    result.profile = profile;

    if (createBackup) {
        if (!m_backup) {
            result.errors.push_back("Failed to create backup: no backup location configured");
            return result;
        }

        fs::path backupPath;
        Utils::FileUtils::Error err;
        if (!m_backup->BackupProfile(profile, backupPath, &err)) {
            result.errors.push_back("Failed to create backup: " + err.message);
            TS_LOG_ERROR(LOG_CATEGORY, "Backup of %s failed, profile left untouched", profile.name.c_str());
            return result;
        }
        result.backupPath = backupPath;
    }

    cleanProfile(profile, cancel, result);

    TS_LOG_INFO(LOG_CATEGORY, "%s: %lld cookie(s), %lld storage item(s), %lld cache item(s), %zu error(s)",
        profile.name.c_str(),
        static_cast<long long>(result.cookiesDeleted),
        static_cast<long long>(result.storageDeleted),
        static_cast<long long>(result.cacheDeleted),
        result.errors.size());
    return result;
}

Database::StoreConfig ArtifactCleanerBase::storeConfig(const fs::path& storePath, bool readOnly) const {
    Database::StoreConfig config;
    config.databasePath = storePath;
    config.busyTimeoutMs = m_options.databaseBusyTimeoutMs;
    config.maxConnections = 1;
    config.readOnly = readOnly;
    config.livenessAttempts = m_options.livenessAttempts;
    config.livenessBackoff = m_options.livenessBackoff;
    return config;
}

void ArtifactCleanerBase::cleanCookieStore(const fs::path& storePath, const Database::CookieTableSpec& table,
    const Utils::CancellationToken& cancel, CleanResult& result) const {
    std::error_code ec;
    if (!fs::is_regular_file(storePath, ec)) {
        return;
    }

    Database::CookieStore store(storeConfig(storePath, false), table);
    Database::DatabaseError err;

    if (!store.Open(cancel, &err)) {
        result.errors.push_back("Failed to clean cookies: " + err.message);
        return;
    }

    int64_t deleted = 0;
    if (!store.DeleteMatching(CookieLikePatterns(), deleted, &err)) {
        result.errors.push_back("Failed to clean cookies: " + err.message);
        return;
    }

    result.cookiesDeleted += deleted;
}

int64_t ArtifactCleanerBase::countCookieStore(const fs::path& storePath, const Database::CookieTableSpec& table,
    const Utils::CancellationToken& cancel) const {
    std::error_code ec;
    if (!fs::is_regular_file(storePath, ec)) {
        return 0;
    }

    Database::CookieStore store(storeConfig(storePath, true), table);
    Database::DatabaseError err;
    int64_t count = 0;

    if (!store.Open(cancel, &err) || !store.CountMatching(CookieLikePatterns(), count, &err)) {
        TS_LOG_WARN(LOG_CATEGORY, "Cannot count cookies in %s: %s", storePath.string().c_str(), err.message.c_str());
        return 0;
    }
    return count;
}

void ArtifactCleanerBase::sweepArea(const fs::path& root, const AreaRules& rules, const char* label,
    const Utils::CancellationToken& cancel, int64_t& counter, CleanResult& result) const {
    const ArtifactSweeper sweeper(m_options.removal, cancel);
    AreaReport report = sweeper.Sweep(root, rules);

    if (!report.walkError.empty()) {
        result.errors.push_back(std::string("Failed to clean ") + label + ": " + report.walkError);
    }

    counter += report.removed;
    result.filesDeleted.insert(result.filesDeleted.end(),
        std::make_move_iterator(report.removedPaths.begin()),
        std::make_move_iterator(report.removedPaths.end()));
    result.errors.insert(result.errors.end(),
        std::make_move_iterator(report.errors.begin()),
        std::make_move_iterator(report.errors.end()));
}

int64_t ArtifactCleanerBase::countArea(const fs::path& root, const AreaRules& rules,
    const Utils::CancellationToken& cancel) const {
    const ArtifactSweeper sweeper(m_options.removal, cancel);
    return sweeper.Count(root, rules);
}

// ============================================================================
// FACTORY
// ============================================================================

std::unique_ptr<IArtifactCleaner> CreateArtifactCleaner(BrowserEngine engine,
    std::shared_ptr<const BackupManager> backup, CleanerOptions options) {
    switch (engine) {
        case BrowserEngine::Chromium:
            return std::make_unique<ChromiumCleaner>(std::move(backup), options);
        case BrowserEngine::Gecko:
            return std::make_unique<GeckoCleaner>(std::move(backup), options);
        case BrowserEngine::WebKit:
            return std::make_unique<WebKitCleaner>(std::move(backup), options);
    }
    return nullptr;
}

}  // namespace Browser
}  // namespace TraceSweep
