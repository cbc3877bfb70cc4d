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
#include "FileUtils.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <unordered_set>

#ifndef _WIN32
#  include <pwd.h>
#  include <unistd.h>
#endif

namespace TraceSweep {
	namespace Utils {
		namespace FileUtils {

			namespace fs = std::filesystem;

			namespace {

				inline void SetErr(Error* err, const std::error_code& ec, const std::string& what) {
					if (!err) return;
					err->code = ec.value();
					err->message = what + ": " + ec.message();
				}

				inline void SetErr(Error* err, int code, std::string message) {
					if (!err) return;
					err->code = code;
					err->message = std::move(message);
				}

				// Reopens after a failed read so one bad entry does not hide its siblings.
				constexpr int MAX_DIRECTORY_REOPENS = 3;

				void WalkLevel(const fs::path& dir, size_t depth, const WalkOptions& opts,
					const WalkCallback& cb, bool& stop) {

					std::unordered_set<fs::path::string_type> seen;

					for (int attempt = 0; attempt <= MAX_DIRECTORY_REOPENS; ++attempt) {
						std::error_code ec;
						fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
						if (ec) {
							TS_LOG_DEBUG("FileUtils", "Skipping %s: %s", dir.string().c_str(), ec.message().c_str());
							return;
						}

						for (const fs::directory_iterator end; it != end; it.increment(ec)) {
							if (ec) break;
							if (opts.cancel && opts.cancel->ShouldStop()) { stop = true; return; }

							const fs::directory_entry& entry = *it;
							if (!seen.insert(entry.path().filename().native()).second) continue;

							std::error_code typeEc;
							const bool isLink = entry.is_symlink(typeEc);
							const bool isDir = entry.is_directory(typeEc) && !typeEc;

							if (isDir) {
								if (opts.includeDirs && !cb(entry.path(), entry)) { stop = true; return; }

								const bool mayDescend = !isLink || opts.followSymlinks;
								if (opts.recursive && mayDescend && depth < opts.maxDepth) {
									WalkLevel(entry.path(), depth + 1, opts, cb, stop);
									if (stop) return;
								}
							}
							else {
								if (!cb(entry.path(), entry)) { stop = true; return; }
							}
						}

						if (!ec) return;
						TS_LOG_WARN("FileUtils", "Reading %s failed after %zu entries: %s",
							dir.string().c_str(), seen.size(), ec.message().c_str());
					}
				}

			}  // namespace

			bool Exists(const fs::path& path, Error* err) {
				std::error_code ec;
				const auto st = fs::symlink_status(path, ec);
				if (ec && ec != std::errc::no_such_file_or_directory) {
					SetErr(err, ec, "Exists " + path.string());
					return false;
				}
				return fs::exists(st);
			}

			bool IsDirectory(const fs::path& path, Error* err) {
				std::error_code ec;
				const bool dir = fs::is_directory(path, ec);
				if (ec && ec != std::errc::no_such_file_or_directory) {
					SetErr(err, ec, "IsDirectory " + path.string());
					return false;
				}
				return dir;
			}

			bool Stat(const fs::path& path, FileStat& out, Error* err) {
				out = FileStat{};

				std::error_code ec;
				const auto st = fs::symlink_status(path, ec);
				if (ec) {
					if (ec == std::errc::no_such_file_or_directory) return true;
					SetErr(err, ec, "Stat " + path.string());
					return false;
				}
				if (!fs::exists(st)) return true;

				out.exists = true;
				out.isSymlink = fs::is_symlink(st);
				out.isDirectory = fs::is_directory(path, ec);

				if (fs::is_regular_file(st)) {
					out.size = static_cast<uint64_t>(fs::file_size(path, ec));
					if (ec) out.size = 0;
				}

				out.lastWrite = fs::last_write_time(path, ec);
				return true;
			}

			bool ReadHead(const fs::path& path, size_t maxBytes, std::string& out, Error* err) {
				out.clear();

				std::ifstream in(path, std::ios::binary);
				if (!in) {
					SetErr(err, errno ? errno : EIO, "ReadHead: cannot open " + path.string());
					return false;
				}

				out.resize(maxBytes);
				in.read(out.data(), static_cast<std::streamsize>(maxBytes));
				out.resize(static_cast<size_t>(in.gcount()));

				if (in.bad()) {
					SetErr(err, EIO, "ReadHead: read failed " + path.string());
					return false;
				}
				return true;
			}

			bool ReadAllText(const fs::path& path, std::string& out, Error* err) {
				out.clear();

				std::error_code ec;
				const auto size = fs::file_size(path, ec);
				if (ec) {
					SetErr(err, ec, "ReadAllText " + path.string());
					return false;
				}
				if (size > MAX_READ_FILE_SIZE) {
					SetErr(err, EFBIG, "ReadAllText: file too large " + path.string());
					return false;
				}

				return ReadHead(path, static_cast<size_t>(size), out, err);
			}

			bool WriteAllTextAtomic(const fs::path& path, std::string_view text, Error* err) {
				std::error_code ec;
				if (path.has_parent_path()) {
					fs::create_directories(path.parent_path(), ec);
					if (ec) {
						SetErr(err, ec, "WriteAllTextAtomic: create parent of " + path.string());
						return false;
					}
				}

				fs::path tmp = path;
				tmp += ".tmp";

				{
					std::ofstream outFile(tmp, std::ios::binary | std::ios::trunc);
					if (!outFile) {
						SetErr(err, errno ? errno : EIO, "WriteAllTextAtomic: cannot open " + tmp.string());
						return false;
					}
					outFile.write(text.data(), static_cast<std::streamsize>(text.size()));
					outFile.flush();
					if (!outFile) {
						SetErr(err, EIO, "WriteAllTextAtomic: write failed " + tmp.string());
						outFile.close();
						fs::remove(tmp, ec);
						return false;
					}
				}

				fs::rename(tmp, path, ec);
				if (ec) {
					SetErr(err, ec, "WriteAllTextAtomic: rename to " + path.string());
					std::error_code ignore;
					fs::remove(tmp, ignore);
					return false;
				}
				return true;
			}

			bool CreateDirectories(const fs::path& dir, Error* err) {
				std::error_code ec;
				fs::create_directories(dir, ec);
				if (ec) {
					SetErr(err, ec, "CreateDirectories " + dir.string());
					return false;
				}
				if (!fs::is_directory(dir, ec)) {
					SetErr(err, ENOTDIR, "CreateDirectories: not a directory " + dir.string());
					return false;
				}
				return true;
			}

			bool RemoveFile(const fs::path& path, Error* err) {
				std::error_code ec;
				fs::remove(path, ec);
				if (ec && ec != std::errc::no_such_file_or_directory) {
					SetErr(err, ec, "RemoveFile " + path.string());
					return false;
				}
				return true;
			}

			bool RemoveDirectoryRecursive(const fs::path& dir, Error* err) {
				std::error_code ec;
				fs::remove_all(dir, ec);
				if (ec && ec != std::errc::no_such_file_or_directory) {
					SetErr(err, ec, "RemoveDirectoryRecursive " + dir.string());
					return false;
				}
				return true;
			}

			bool CopyFile(const fs::path& src, const fs::path& dst, bool overwrite, Error* err) {
				std::error_code ec;
				const auto options = overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::skip_existing;
				fs::copy_file(src, dst, options, ec);
				if (ec) {
					SetErr(err, ec, "CopyFile " + src.string() + " -> " + dst.string());
					return false;
				}
				return true;
			}

			bool WalkDirectory(const fs::path& root, const WalkOptions& opts, const WalkCallback& cb, Error* err) {
				if (!cb) {
					SetErr(err, EINVAL, "WalkDirectory: empty callback");
					return false;
				}

				std::error_code ec;
				if (!fs::is_directory(root, ec)) {
					SetErr(err, ec ? ec.value() : ENOTDIR, "WalkDirectory: not a directory " + root.string());
					return false;
				}

				bool stop = false;
				WalkLevel(root, 0, opts, cb, stop);
				return true;
			}

			fs::path HomeDirectory() {
#ifdef _WIN32
				if (const char* profile = std::getenv("USERPROFILE"); profile && *profile) {
					return fs::path(profile);
				}
				return {};
#else
				if (const char* home = std::getenv("HOME"); home && *home) {
					return fs::path(home);
				}
				if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) {
					return fs::path(pw->pw_dir);
				}
				return {};
#endif
			}

		}  // namespace FileUtils
	}  // namespace Utils
}  // namespace TraceSweep
