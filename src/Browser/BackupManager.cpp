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
#include "BackupManager.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <system_error>

namespace TraceSweep {
namespace Browser {

namespace {

constexpr const char* LOG_CATEGORY = "Backup";

bool AllDigits(std::string_view s) noexcept {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // anonymous namespace

BackupManager::BackupManager(fs::path backupDirectory, NowFunction now)
    : m_backupDirectory(std::move(backupDirectory))
    , m_now(std::move(now)) {
}

fs::path BackupManager::Root() const {
    return m_backupDirectory / BackupConstants::BROWSER_DATA_SUBDIR;
}

int64_t BackupManager::now() const {
    if (m_now) return m_now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string BackupManager::SanitizeName(std::string_view name) {
    // One path component: anything outside [a-z0-9._-] becomes '-'
    std::string slug = Utils::StringUtils::ToLowerCopy(name);
    for (char& c : slug) {
        const bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!keep) c = '-';
    }
    return slug;
}

std::vector<fs::path> BackupManager::CriticalFiles(const BrowserProfile& profile) {
    switch (GetEngineForFamily(profile.family)) {
        case BrowserEngine::Chromium:
            return { profile.path / "Cookies", profile.path / "Preferences", profile.path / "Local State" };
        case BrowserEngine::Gecko:
            return { profile.path / "cookies.sqlite", profile.path / "prefs.js", profile.path / "places.sqlite" };
        case BrowserEngine::WebKit:
            return { profile.path / "Cookies" / "Cookies.binarycookies", profile.path / "Preferences.plist" };
    }
    return {};
}

// ============================================================================
// BACKUP
// ============================================================================

bool BackupManager::BackupProfile(const BrowserProfile& profile, fs::path& backupPath,
    Utils::FileUtils::Error* err) const {
    TS_LOG_SCOPE(LOG_CATEGORY);

    const fs::path root = Root();
    Utils::FileUtils::Error dirErr;
    if (!Utils::FileUtils::CreateDirectories(root, &dirErr)) {
        if (err) {
            err->code = dirErr.code;
            err->message = "failed to create backup directory: " + dirErr.message;
        }
        TS_LOG_ERROR(LOG_CATEGORY, "Cannot create %s: %s", root.string().c_str(), dirErr.message.c_str());
        return false;
    }

    const std::string baseName = SanitizeName(profile.name) + BackupConstants::BACKUP_MARKER + std::to_string(now());

    // create_directory returns false for an existing entry; that is the collision test
    fs::path candidate;
    bool created = false;
    std::error_code ec;
    for (int attempt = 0; attempt < BackupConstants::MAX_NAME_ATTEMPTS && !created; ++attempt) {
        candidate = root / (attempt == 0 ? baseName : baseName + "-" + std::to_string(attempt));
        ec.clear();
        created = fs::create_directory(candidate, ec);
        if (ec) break;
    }

    if (!created) {
        if (err) {
            err->code = ec ? ec.value() : EEXIST;
            err->message = "failed to create profile backup directory " + candidate.string() +
                (ec ? ": " + ec.message() : std::string(": name collision"));
        }
        TS_LOG_ERROR(LOG_CATEGORY, "Cannot create backup for %s", profile.name.c_str());
        return false;
    }

    size_t copied = 0;
    for (const auto& file : CriticalFiles(profile)) {
        if (!Utils::FileUtils::Exists(file)) continue;

        Utils::FileUtils::Error copyErr;
        if (!Utils::FileUtils::CopyFile(file, candidate / file.filename(), true, &copyErr)) {
            TS_LOG_WARN(LOG_CATEGORY, "Skipping %s: %s", file.string().c_str(), copyErr.message.c_str());
            continue;
        }
        ++copied;
    }

    TS_LOG_INFO(LOG_CATEGORY, "Backed up %zu file(s) of %s to %s",
        copied, profile.name.c_str(), candidate.string().c_str());

    backupPath = candidate;
    return true;
}

// ============================================================================
// RETENTION
// ============================================================================

bool BackupManager::ParseBackupName(std::string_view dirName, std::string& slug, int64_t& timestamp) {
    const std::string_view marker = BackupConstants::BACKUP_MARKER;
    const size_t pos = dirName.rfind(marker);
    if (pos == std::string_view::npos || pos == 0) return false;

    std::string_view tail = dirName.substr(pos + marker.size());
    const size_t dash = tail.find('-');
    if (dash != std::string_view::npos) {
        if (!AllDigits(tail.substr(dash + 1))) return false;
        tail = tail.substr(0, dash);
    }
    if (!AllDigits(tail) || tail.size() > 18) return false;

    int64_t value = 0;
    for (const char c : tail) {
        value = value * 10 + (c - '0');
    }

    slug.assign(dirName.substr(0, pos));
    timestamp = value;
    return true;
}

bool BackupManager::ListBackups(std::vector<BackupRecord>& out, Utils::FileUtils::Error* err) const {
    out.clear();

    const fs::path root = Root();
    if (!Utils::FileUtils::IsDirectory(root)) {
        return true;
    }

    std::error_code ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (!it->is_directory(typeEc)) continue;

        BackupRecord record;
        record.path = it->path();
        record.name = record.path.filename().string();
        if (!ParseBackupName(record.name, record.profileSlug, record.timestamp)) continue;

        std::error_code innerEc;
        for (fs::directory_iterator f(record.path, innerEc), fend; !innerEc && f != fend; f.increment(innerEc)) {
            record.files.push_back(f->path().filename().string());
        }
        std::sort(record.files.begin(), record.files.end());

        out.push_back(std::move(record));
    }

    if (ec) {
        if (err) {
            err->code = ec.value();
            err->message = "cannot list " + root.string() + ": " + ec.message();
        }
        return false;
    }

    std::sort(out.begin(), out.end(), [](const BackupRecord& a, const BackupRecord& b) {
        if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
        return a.name < b.name;
    });
    return true;
}

bool BackupManager::PruneBackups(int maxAgeDays, size_t& removed, Utils::FileUtils::Error* err) const {
    removed = 0;
    if (maxAgeDays <= 0) {
        return true;
    }

    std::vector<BackupRecord> backups;
    if (!ListBackups(backups, err)) {
        return false;
    }

    const int64_t cutoff = now() - static_cast<int64_t>(maxAgeDays) * BackupConstants::SECONDS_PER_DAY;
    bool ok = true;

    for (const auto& backup : backups) {
        if (backup.timestamp >= cutoff) continue;

        Utils::FileUtils::Error rmErr;
        if (!Utils::FileUtils::RemoveDirectoryRecursive(backup.path, &rmErr)) {
            TS_LOG_WARN(LOG_CATEGORY, "Cannot prune %s: %s", backup.path.string().c_str(), rmErr.message.c_str());
            if (err && !err->hasError()) {
                *err = rmErr;
            }
            ok = false;
            continue;
        }
        ++removed;
    }

    TS_LOG_INFO(LOG_CATEGORY, "Pruned %zu backup(s) older than %d day(s)", removed, maxAgeDays);
    return ok;
}

}  // namespace Browser
}  // namespace TraceSweep
