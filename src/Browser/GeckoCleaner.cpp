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

Database::CookieTableSpec GeckoCleaner::CookieTable() {
    return { "moz_cookies", "host" };
}

AreaRules GeckoCleaner::StorageRules() {
    AreaRules rules;
    rules.sniffContent = true;
    rules.removeMatchingDirectories = true;
    return rules;
}

AreaRules GeckoCleaner::CacheRules() {
    AreaRules rules;
    rules.sniffContent = true;
    rules.sniffCap = ArtifactConstants::GECKO_CACHE_SNIFF_CAP;
    rules.protectCacheCore = true;
    return rules;
}

void GeckoCleaner::cleanProfile(const BrowserProfile& profile, const Utils::CancellationToken& cancel,
    CleanResult& result) {
    cleanCookieStore(profile.path / "cookies.sqlite", CookieTable(), cancel, result);

    sweepArea(profile.path / "storage" / "default", StorageRules(), "storage",
        cancel, result.storageDeleted, result);

    sweepArea(profile.path / "cache2", CacheRules(), "cache", cancel, result.cacheDeleted, result);
}

int64_t GeckoCleaner::CountMatches(const BrowserProfile& profile, const Utils::CancellationToken& cancel) {
    int64_t count = countCookieStore(profile.path / "cookies.sqlite", CookieTable(), cancel);
    count += countArea(profile.path / "storage" / "default", StorageRules(), cancel);
    count += countArea(profile.path / "cache2", CacheRules(), cancel);
    return count;
}

}  // namespace Browser
}  // namespace TraceSweep
