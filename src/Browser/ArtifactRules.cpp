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
#include "ArtifactRules.hpp"

#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <system_error>

namespace TraceSweep {
namespace Browser {

namespace {

constexpr const char* LOG_CATEGORY = "Cleaner";

constexpr std::string_view SIDECARS[] = { "LOCK", "LOG", "LOG.old" };
constexpr std::string_view CACHE_CORE[] = { "index", "data_0", "data_1", "data_2", "data_3" };
constexpr std::string_view SNIFF_EXTENSIONS[] = { ".ldb", ".log", ".sst", ".manifest" };

bool IsUnder(const fs::path& path, const std::vector<PlannedRemoval>& plan) {
    const std::string p = path.string();
    for (const auto& item : plan) {
        if (!item.isDirectory) continue;
        const std::string dir = item.path.string();
        if (p.size() > dir.size() && p.compare(0, dir.size(), dir) == 0 &&
            (p[dir.size()] == '/' || p[dir.size()] == '\\')) {
            return true;
        }
    }
    return false;
}

}  // anonymous namespace

// ============================================================================
// MATCHING
// ============================================================================

const std::vector<std::string>& TrackedVariants() {
    static const std::vector<std::string> variants = {
        "augment",
        "augmentcode",
        "augment-code",
        "vscode-augment",
        "augment.code",
        "augment_telemetry",
        "augment_session",
        "augment_user",
        "augmentai",
        "augment-ai"
    };
    return variants;
}

std::vector<std::string> CookieLikePatterns() {
    std::vector<std::string> patterns;
    patterns.reserve(TrackedVariants().size());
    for (const auto& v : TrackedVariants()) {
        patterns.push_back("%" + v + "%");
    }
    return patterns;
}

bool ContainsTrackedVariant(std::string_view text) noexcept {
    for (const auto& v : TrackedVariants()) {
        if (Utils::StringUtils::ContainsCaseInsensitive(text, v)) {
            return true;
        }
    }
    return false;
}

bool IsSniffCandidate(std::string_view fileName) noexcept {
    for (const auto ext : SNIFF_EXTENSIONS) {
        if (fileName.size() >= ext.size() &&
            Utils::StringUtils::IEquals(fileName.substr(fileName.size() - ext.size()), ext)) {
            return true;
        }
    }
    return fileName.find('.') == std::string_view::npos;
}

bool IsStorageSidecar(std::string_view fileName) noexcept {
    return std::find(std::begin(SIDECARS), std::end(SIDECARS), fileName) != std::end(SIDECARS);
}

bool IsCacheCoreFile(std::string_view fileName) noexcept {
    return std::find(std::begin(CACHE_CORE), std::end(CACHE_CORE), fileName) != std::end(CACHE_CORE);
}

void AreaReport::Add(const ItemOutcome& item) {
    switch (item.outcome) {
        case FileOutcome::Removed:
            ++removed;
            removedPaths.push_back(item.path.string());
            break;
        case FileOutcome::Skipped:
            ++skipped;
            break;
        case FileOutcome::Failed:
            ++failed;
            errors.push_back("Failed to remove " + item.path.string() + ": " + item.error);
            break;
    }
}

// ============================================================================
// ARTIFACT SWEEPER
// ============================================================================

bool ArtifactSweeper::isArtifactFile(const fs::path& path, const fs::directory_entry& entry,
    const AreaRules& rules) const {
    const std::string name = path.filename().string();

    if (rules.protectCacheCore && IsCacheCoreFile(name)) {
        return false;
    }
    if (ContainsTrackedVariant(name)) {
        return true;
    }
    if (!rules.sniffContent || !IsSniffCandidate(name)) {
        return false;
    }

    std::error_code ec;
    const uint64_t size = entry.file_size(ec);
    if (ec || size > rules.sniffCap) {
        return false;
    }

    std::string head;
    if (!Utils::FileUtils::ReadHead(path, ArtifactConstants::SNIFF_BYTES, head)) {
        return false;
    }
    return ContainsTrackedVariant(head);
}

std::vector<PlannedRemoval> ArtifactSweeper::Plan(const fs::path& root, const AreaRules& rules,
    std::string* walkError) const {
    std::vector<PlannedRemoval> plan;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return plan;
    }

    Utils::FileUtils::WalkOptions opts;
    opts.recursive = true;
    opts.includeDirs = rules.removeMatchingDirectories;
    opts.cancel = &m_cancel;

    Utils::FileUtils::Error err;
    const bool ok = Utils::FileUtils::WalkDirectory(root, opts,
        [&](const fs::path& fullPath, const fs::directory_entry& entry) {
            if (IsUnder(fullPath, plan)) {
                return true;
            }

            std::error_code typeEc;
            const bool isDir = entry.is_directory(typeEc);
            if (typeEc) {
                return true;
            }

            if (isDir) {
                if (rules.removeMatchingDirectories && ContainsTrackedVariant(fullPath.filename().string())) {
                    plan.push_back({ fullPath, true });
                }
                return true;
            }

            if (!entry.is_regular_file(typeEc) || typeEc) {
                return true;
            }
            if (rules.removeSidecars && fullPath.parent_path() == root &&
                IsStorageSidecar(fullPath.filename().string())) {
                return true;
            }
            if (isArtifactFile(fullPath, entry, rules)) {
                plan.push_back({ fullPath, false });
            }
            return true;
        }, &err);

    if (!ok && walkError) {
        *walkError = err.message;
    }
    return plan;
}

int64_t ArtifactSweeper::Count(const fs::path& root, const AreaRules& rules) const {
    return static_cast<int64_t>(Plan(root, rules).size());
}

ItemOutcome ArtifactSweeper::Remove(const PlannedRemoval& item) const {
    ItemOutcome outcome;
    outcome.path = item.path;

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(item.path, ec))) {
        outcome.outcome = FileOutcome::Skipped;
        return outcome;
    }

    const int attempts = std::max(1, m_policy.retries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        Utils::FileUtils::Error err;
        const bool removed = item.isDirectory
            ? Utils::FileUtils::RemoveDirectoryRecursive(item.path, &err)
            : Utils::FileUtils::RemoveFile(item.path, &err);
        if (removed) {
            outcome.outcome = FileOutcome::Removed;
            outcome.error.clear();
            return outcome;
        }

        outcome.error = err.message;
        if (attempt < attempts && !m_cancel.SleepFor(m_policy.retryDelay) && m_cancel.ShouldStop()) {
            break;
        }
    }

    outcome.outcome = FileOutcome::Failed;
    TS_LOG_WARN(LOG_CATEGORY, "Giving up on %s: %s", item.path.string().c_str(), outcome.error.c_str());
    return outcome;
}

AreaReport ArtifactSweeper::Sweep(const fs::path& root, const AreaRules& rules) const {
    AreaReport report;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return report;
    }

    if (rules.removeSidecars) {
        for (const auto sidecar : SIDECARS) {
            Utils::FileUtils::Error err;
            if (!Utils::FileUtils::RemoveFile(root / std::string(sidecar), &err)) {
                TS_LOG_DEBUG(LOG_CATEGORY, "Sidecar left in place: %s", err.message.c_str());
            }
        }
    }

    const auto plan = Plan(root, rules, &report.walkError);

    for (const auto& item : plan) {
        if (m_cancel.ShouldStop()) {
            report.Add({ item.path, FileOutcome::Skipped, {} });
            continue;
        }
        report.Add(Remove(item));
    }

    TS_LOG_DEBUG(LOG_CATEGORY, "%s: %lld removed, %lld skipped, %lld failed", root.string().c_str(),
        static_cast<long long>(report.removed), static_cast<long long>(report.skipped),
        static_cast<long long>(report.failed));
    return report;
}

}  // namespace Browser
}  // namespace TraceSweep
