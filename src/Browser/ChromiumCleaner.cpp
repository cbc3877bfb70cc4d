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

namespace TraceSweep {
namespace Browser {

Database::CookieTableSpec ChromiumCleaner::CookieTable() {
    return { "cookies", "host_key" };
}

AreaRules ChromiumCleaner::StorageRules() {
    AreaRules rules;
    rules.sniffContent = true;
    rules.removeSidecars = true;
    return rules;
}

AreaRules ChromiumCleaner::CacheRules() {
    AreaRules rules;
    rules.sniffContent = true;
    rules.sniffCap = ArtifactConstants::CHROMIUM_CACHE_SNIFF_CAP;
    rules.protectCacheCore = true;
    return rules;
}

void ChromiumCleaner::cleanProfile(const BrowserProfile& profile, const Utils::CancellationToken& cancel,
    CleanResult& result) {
    cleanCookieStore(profile.path / "Cookies", CookieTable(), cancel, result);

    sweepArea(profile.path / "Local Storage" / "leveldb", StorageRules(), "local storage",
        cancel, result.storageDeleted, result);
    sweepArea(profile.path / "Session Storage", StorageRules(), "session storage",
        cancel, result.storageDeleted, result);

    sweepArea(profile.path / "Cache", CacheRules(), "cache", cancel, result.cacheDeleted, result);
}

int64_t ChromiumCleaner::CountMatches(const BrowserProfile& profile, const Utils::CancellationToken& cancel) {
    int64_t count = countCookieStore(profile.path / "Cookies", CookieTable(), cancel);
    count += countArea(profile.path / "Local Storage" / "leveldb", StorageRules(), cancel);
    count += countArea(profile.path / "Session Storage", StorageRules(), cancel);
    count += countArea(profile.path / "Cache", CacheRules(), cancel);
    return count;
}

}  // namespace Browser
}  // namespace TraceSweep
