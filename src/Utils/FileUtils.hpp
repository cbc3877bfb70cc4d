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
 * @file FileUtils.hpp
 * @brief File system utility functions for TraceSweep.
 *
 * Provides the file operations used by backup and cleaning:
 * - Existence/status queries that never throw
 * - Bounded head reads for content sniffing
 * - Atomic text writes (temp file + rename)
 * - Directory walking with per-entry error tolerance and cancellation
 * - Removal helpers that treat an already-missing target as success
 *
 * @note Built on std::filesystem; errors are reported through Error, never thrown.
 */

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>

#include "CancellationToken.hpp"

namespace TraceSweep {

	namespace Utils {

		namespace FileUtils {

			/// Maximum file size for in-memory text reads (64MB)
			inline constexpr uint64_t MAX_READ_FILE_SIZE = 64ULL * 1024 * 1024;

			/**
			 * @brief Error information structure for file operations.
			 *
			 * Captures the OS error code (errno or std::error_code value) and
			 * a human-readable message including the failing path.
			 */
			struct Error {
				int code = 0;               ///< OS error code
				std::string message;        ///< Human-readable error description

				/// @brief Check if error is set
				[[nodiscard]] bool hasError() const noexcept { return code != 0 || !message.empty(); }

				/// @brief Clear the error state
				void clear() noexcept { code = 0; message.clear(); }
			};

			/**
			 * @brief File statistics and metadata.
			 */
			struct FileStat {
				bool exists = false;            ///< Path exists
				bool isDirectory = false;       ///< Is a directory
				bool isSymlink = false;         ///< Is a symbolic link
				uint64_t size = 0;              ///< File size in bytes (0 for directories)
				std::filesystem::file_time_type lastWrite{};  ///< Last modification timestamp
			};

			/**
			 * @brief Options for directory traversal operations.
			 */
			struct WalkOptions {
				bool recursive = true;              ///< Recurse into subdirectories
				bool followSymlinks = false;        ///< Descend into symlinked directories
				bool includeDirs = false;           ///< Include directories in callback
				size_t maxDepth = SIZE_MAX;         ///< Maximum recursion depth (0 = root only)
				const CancellationToken* cancel = nullptr;  ///< Optional cancellation
			};

			// ============================================================================
			// File Existence and Status
			// ============================================================================

			[[nodiscard]] bool Exists(const std::filesystem::path& path, Error* err = nullptr);
			[[nodiscard]] bool IsDirectory(const std::filesystem::path& path, Error* err = nullptr);

			/**
			 * @brief Get file metadata without following the final symlink.
			 * @return true if stat succeeded (out.exists is false for a missing path)
			 */
			[[nodiscard]] bool Stat(const std::filesystem::path& path, FileStat& out, Error* err = nullptr);

			// ============================================================================
			// File Reading
			// ============================================================================

			/**
			 * @brief Read at most @p maxBytes from the start of a file.
			 * @param out Receives the bytes read (may be shorter than maxBytes)
			 */
			[[nodiscard]] bool ReadHead(const std::filesystem::path& path, size_t maxBytes, std::string& out, Error* err = nullptr);

			/**
			 * @brief Read an entire file as text.
			 *
			 * Files larger than MAX_READ_FILE_SIZE are rejected.
			 */
			[[nodiscard]] bool ReadAllText(const std::filesystem::path& path, std::string& out, Error* err = nullptr);

			// ============================================================================
			// File Writing
			// ============================================================================

			/**
			 * @brief Write text through a sibling temp file and rename it into place.
			 *
			 * Parent directories are created. A reader sees either the old or the
			 * new content, never a partial file.
			 */
			[[nodiscard]] bool WriteAllTextAtomic(const std::filesystem::path& path, std::string_view text, Error* err = nullptr);

			// ============================================================================
			// Directory and File Management
			// ============================================================================

			/// @brief Create directory and all parents. Existing directories succeed.
			[[nodiscard]] bool CreateDirectories(const std::filesystem::path& dir, Error* err = nullptr);

			/// @brief Remove one file. A missing file succeeds.
			[[nodiscard]] bool RemoveFile(const std::filesystem::path& path, Error* err = nullptr);

			/// @brief Remove a directory tree. A missing directory succeeds.
			[[nodiscard]] bool RemoveDirectoryRecursive(const std::filesystem::path& dir, Error* err = nullptr);

			/**
			 * @brief Copy a regular file.
			 * @param overwrite Replace an existing destination
			 */
			[[nodiscard]] bool CopyFile(const std::filesystem::path& src, const std::filesystem::path& dst,
				bool overwrite = true, Error* err = nullptr);

			// ============================================================================
			// Directory Walking
			// ============================================================================

			/**
			 * @brief Callback for directory walking.
			 * @return false to stop walking, true to continue
			 */
			using WalkCallback = std::function<bool(const std::filesystem::path& fullPath, const std::filesystem::directory_entry& entry)>;

			/**
			 * @brief Walk directory tree with callback (pre-order).
			 *
			 * Entries that cannot be inspected are skipped. Only failing to open
			 * the root is reported as an error.
			 *
			 * @return true on success (even if cancelled or stopped by callback)
			 */
			[[nodiscard]] bool WalkDirectory(const std::filesystem::path& root, const WalkOptions& opts,
				const WalkCallback& cb, Error* err = nullptr);

			// ============================================================================
			// Environment
			// ============================================================================

			/**
			 * @brief Current user's home directory.
			 *
			 * $HOME on POSIX (falling back to the passwd entry), %USERPROFILE% on Windows.
			 * @return empty path if it cannot be determined
			 */
			[[nodiscard]] std::filesystem::path HomeDirectory();

		}  // namespace FileUtils
	}  // namespace Utils
}  // namespace TraceSweep
