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

namespace TraceSweep {
namespace Browser {

AreaRules WebKitCleaner::StorageRules() {
    AreaRules rules;
    rules.sniffContent = false;
    return rules;
}

void WebKitCleaner::cleanProfile(const BrowserProfile& profile, const Utils::CancellationToken& cancel,
    CleanResult& result) {
    // Binary and proprietary stores are reported, never parsed
    if (Utils::FileUtils::Exists(profile.path / "Cookies" / "Cookies.binarycookies")) {
        result.errors.push_back(COOKIES_MANUAL_MESSAGE);
        TS_LOG_WARN("Cleaner", "%s", COOKIES_MANUAL_MESSAGE);
    }

    sweepArea(profile.path / "LocalStorage", StorageRules(), "storage",
        cancel, result.storageDeleted, result);

    if (Utils::FileUtils::Exists(profile.path / "Cache.db")) {
        result.errors.push_back(CACHE_MANUAL_MESSAGE);
        TS_LOG_WARN("Cleaner", "%s", CACHE_MANUAL_MESSAGE);
    }
}

int64_t WebKitCleaner::CountMatches(const BrowserProfile& profile, const Utils::CancellationToken& cancel) {
    return countArea(profile.path / "LocalStorage", StorageRules(), cancel);
}

}  // namespace Browser
}  // namespace TraceSweep
