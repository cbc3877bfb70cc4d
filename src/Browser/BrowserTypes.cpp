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
#include "BrowserTypes.hpp"

#include "../Utils/StringUtils.hpp"

#include <nlohmann/json.hpp>

namespace TraceSweep {
namespace Browser {

namespace {

nlohmann::json ProfileToJsonObject(const BrowserProfile& profile) {
    nlohmann::json j;
    j["family"] = std::string(GetBrowserFamilyName(profile.family));
    j["name"] = profile.name;
    j["path"] = profile.path.string();
    j["data_dir"] = profile.dataDir.string();
    j["is_default"] = profile.isDefault;
    return j;
}

nlohmann::json CleanResultToJsonObject(const CleanResult& result) {
    nlohmann::json j;
    j["profile"] = ProfileToJsonObject(result.profile);
    if (result.backupPath) {
        j["backup_path"] = result.backupPath->string();
    }
    j["cookies_deleted"] = result.cookiesDeleted;
    j["storage_deleted"] = result.storageDeleted;
    j["cache_deleted"] = result.cacheDeleted;
    j["files_deleted"] = result.filesDeleted;
    j["errors"] = result.errors;
    return j;
}

std::string Dump(const nlohmann::json& j, bool pretty) {
    return j.dump(pretty ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // anonymous namespace

// ============================================================================
// JSON SERIALIZATION
// ============================================================================

std::string BrowserProfile::ToJson() const {
    return Dump(ProfileToJsonObject(*this), false);
}

std::string CleanResult::ToJson() const {
    return Dump(CleanResultToJsonObject(*this), false);
}

void RunResult::Finalize() noexcept {
    totalCookiesDeleted = 0;
    totalStorageDeleted = 0;
    totalCacheDeleted = 0;
    totalFilesDeleted = 0;
    totalErrors = 0;

    for (const auto& r : results) {
        totalCookiesDeleted += r.cookiesDeleted;
        totalStorageDeleted += r.storageDeleted;
        totalCacheDeleted += r.cacheDeleted;
        totalFilesDeleted += r.filesDeleted.size();
        totalErrors += r.errors.size();
    }
}

std::string RunResult::ToJson(bool pretty) const {
    nlohmann::json j;
    j["results"] = nlohmann::json::array();
    for (const auto& r : results) {
        j["results"].push_back(CleanResultToJsonObject(r));
    }
    j["totals"] = {
        {"cookies_deleted", totalCookiesDeleted},
        {"storage_deleted", totalStorageDeleted},
        {"cache_deleted", totalCacheDeleted},
        {"files_deleted", totalFilesDeleted},
        {"errors", totalErrors}
    };
    return Dump(j, pretty);
}

std::string CountResult::ToJson(bool pretty) const {
    nlohmann::json j;
    j["profiles"] = nlohmann::json::array();
    for (const auto& p : profiles) {
        j["profiles"].push_back({
            {"profile", ProfileToJsonObject(p.profile)},
            {"count", p.count}
        });
    }
    j["total"] = total;
    return Dump(j, pretty);
}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

std::string_view GetBrowserFamilyName(BrowserFamily family) noexcept {
    switch (family) {
        case BrowserFamily::Chrome:  return "Chrome";
        case BrowserFamily::Edge:    return "Edge";
        case BrowserFamily::Firefox: return "Firefox";
        case BrowserFamily::Safari:  return "Safari";
        default:                     return "Unknown";
    }
}

std::string_view GetBrowserDisplayName(BrowserFamily family) noexcept {
    switch (family) {
        case BrowserFamily::Chrome:  return "Google Chrome";
        case BrowserFamily::Edge:    return "Microsoft Edge";
        case BrowserFamily::Firefox: return "Mozilla Firefox";
        case BrowserFamily::Safari:  return "Safari";
        default:                     return "Unknown";
    }
}

std::string_view GetBrowserEngineName(BrowserEngine engine) noexcept {
    switch (engine) {
        case BrowserEngine::Chromium: return "Chromium";
        case BrowserEngine::Gecko:    return "Gecko";
        case BrowserEngine::WebKit:   return "WebKit";
        default:                      return "Unknown";
    }
}

BrowserEngine GetEngineForFamily(BrowserFamily family) noexcept {
    switch (family) {
        case BrowserFamily::Firefox: return BrowserEngine::Gecko;
        case BrowserFamily::Safari:  return BrowserEngine::WebKit;
        case BrowserFamily::Chrome:
        case BrowserFamily::Edge:
        default:                     return BrowserEngine::Chromium;
    }
}

std::optional<BrowserFamily> ParseBrowserFamily(std::string_view name) noexcept {
    for (const auto family : ALL_FAMILIES) {
        if (Utils::StringUtils::IEquals(name, GetBrowserFamilyName(family))) {
            return family;
        }
    }
    return std::nullopt;
}

std::string_view GetFileOutcomeName(FileOutcome outcome) noexcept {
    switch (outcome) {
        case FileOutcome::Removed: return "Removed";
        case FileOutcome::Skipped: return "Skipped";
        case FileOutcome::Failed:  return "Failed";
        default:                   return "Unknown";
    }
}

OsFlavor CurrentOsFlavor() noexcept {
#if defined(_WIN32)
    return OsFlavor::Windows;
#elif defined(__APPLE__)
    return OsFlavor::MacOS;
#else
    return OsFlavor::Linux;
#endif
}

}  // namespace Browser
}  // namespace TraceSweep
