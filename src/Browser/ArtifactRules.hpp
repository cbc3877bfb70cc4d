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
 * TraceSweep - ARTIFACT RULES
 * ============================================================================
 *
 * @file ArtifactRules.hpp
 * @brief Tracked-service naming variants and the file/directory rules shared
 *        by every cleaning strategy.
 *
 * A file is an artifact when:
 *   - its lower-cased name contains a tracked variant, or
 *   - content sniffing is enabled for its area, its extension is .ldb, .log,
 *     .sst or .manifest (or it has none), it is not above the area's sniff
 *     cap, and its first 1024 bytes, lower-cased, contain a variant.
 *
 * Cache-store core files (index, data_0 .. data_3) are never artifacts in a
 * cache area. Storage areas drop their LOCK/LOG/LOG.old sidecars first.
 *
 * ArtifactSweeper plans an area (read-only, used for dry-run counts) and
 * then acts on the plan, so a count and a sweep of the same tree agree.
 * ============================================================================
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "BrowserTypes.hpp"
#include "../Utils/CancellationToken.hpp"

namespace TraceSweep {
namespace Browser {

// ============================================================================
// CONSTANTS
// ============================================================================

namespace ArtifactConstants {

    /// @brief Bytes read from the head of a file when sniffing content
    inline constexpr size_t SNIFF_BYTES = 1024;

    inline constexpr int DEFAULT_REMOVE_RETRIES = 3;
    inline constexpr std::chrono::milliseconds DEFAULT_RETRY_DELAY{ 100 };

    inline constexpr uint64_t CHROMIUM_CACHE_SNIFF_CAP = 10ULL * 1024 * 1024;
    inline constexpr uint64_t GECKO_CACHE_SNIFF_CAP = 5ULL * 1024 * 1024;

    inline constexpr uint64_t NO_SNIFF_CAP = std::numeric_limits<uint64_t>::max();

}  // namespace ArtifactConstants

// ============================================================================
// MATCHING
// ============================================================================

/// @brief The tracked-service naming variants, lower-case
[[nodiscard]] const std::vector<std::string>& TrackedVariants();

/// @brief Every variant wrapped as a SQL LIKE pattern ("%variant%")
[[nodiscard]] std::vector<std::string> CookieLikePatterns();

/// @brief true if @p text contains a variant, ignoring ASCII case
[[nodiscard]] bool ContainsTrackedVariant(std::string_view text) noexcept;

/// @brief Extension allows content sniffing (.ldb/.log/.sst/.manifest or none)
[[nodiscard]] bool IsSniffCandidate(std::string_view fileName) noexcept;

/// @brief LOCK, LOG or LOG.old
[[nodiscard]] bool IsStorageSidecar(std::string_view fileName) noexcept;

/// @brief index, data_0, data_1, data_2 or data_3
[[nodiscard]] bool IsCacheCoreFile(std::string_view fileName) noexcept;

// ============================================================================
// AREA RULES
// ============================================================================

/**
 * @brief How one storage or cache area is evaluated
 */
struct AreaRules {
    /// @brief Sniff file heads, not only names
    bool sniffContent = true;

    /// @brief Files larger than this are matched by name only
    uint64_t sniffCap = ArtifactConstants::NO_SNIFF_CAP;

    /// @brief Never touch the cache-store core files
    bool protectCacheCore = false;

    /// @brief Remove directories whose name matches as one item
    bool removeMatchingDirectories = false;

    /// @brief Remove LOCK/LOG/LOG.old in the area root before sweeping
    bool removeSidecars = false;
};

struct RemovalPolicy {
    int retries = ArtifactConstants::DEFAULT_REMOVE_RETRIES;
    std::chrono::milliseconds retryDelay = ArtifactConstants::DEFAULT_RETRY_DELAY;
};

/**
 * @brief One planned file or directory removal
 */
struct PlannedRemoval {
    fs::path path;
    bool isDirectory = false;
};

/**
 * @brief Decision taken for one planned removal
 */
struct ItemOutcome {
    fs::path path;
    FileOutcome outcome = FileOutcome::Skipped;
    std::string error;
};

/**
 * @brief Aggregated outcomes of one area
 */
struct AreaReport {
    int64_t removed = 0;
    int64_t skipped = 0;
    int64_t failed = 0;

    std::vector<std::string> removedPaths;
    std::vector<std::string> errors;

    /// @brief Set when the area root could not be walked
    std::string walkError;

    void Add(const ItemOutcome& item);
};

// ============================================================================
// ARTIFACT SWEEPER
// ============================================================================

class ArtifactSweeper {
public:
    ArtifactSweeper(RemovalPolicy policy, const Utils::CancellationToken& cancel) noexcept
        : m_policy(policy), m_cancel(cancel) {}

    /**
     * @brief Collect every artifact under @p root without touching anything.
     *
     * A missing root yields an empty plan. Entries below a directory that is
     * itself planned are not listed.
     *
     * @param walkError Receives the reason when the root cannot be walked
     */
    [[nodiscard]] std::vector<PlannedRemoval> Plan(const fs::path& root, const AreaRules& rules,
        std::string* walkError = nullptr) const;

    /// @brief Number of items Sweep() would remove
    [[nodiscard]] int64_t Count(const fs::path& root, const AreaRules& rules) const;

    /// @brief Drop sidecars (if configured), plan, then remove every planned item
    [[nodiscard]] AreaReport Sweep(const fs::path& root, const AreaRules& rules) const;

    /// @brief Remove one item with retries. Missing items are Skipped.
    [[nodiscard]] ItemOutcome Remove(const PlannedRemoval& item) const;

private:
    [[nodiscard]] bool isArtifactFile(const fs::path& path, const fs::directory_entry& entry,
        const AreaRules& rules) const;

    RemovalPolicy m_policy;
    const Utils::CancellationToken& m_cancel;
};

}  // namespace Browser
}  // namespace TraceSweep
