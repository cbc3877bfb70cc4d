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
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <system_error>
#include <vector>

#include "TestSupport.hpp"
#include "Utils/CancellationToken.hpp"
#include "Utils/FileUtils.hpp"

using namespace TraceSweep::Utils;
using TraceSweep::Testing::TempDirectory;
using TraceSweep::Testing::WriteFile;
namespace fs = std::filesystem;

class FileUtilsTest : public ::testing::Test {
protected:
    TempDirectory m_dir{ "fileutils" };
};

TEST_F(FileUtilsTest, ExistsAndStat) {
    const fs::path file = m_dir.Path() / "a.txt";
    WriteFile(file, "hello");

    EXPECT_TRUE(FileUtils::Exists(file));
    EXPECT_FALSE(FileUtils::Exists(m_dir.Path() / "missing"));
    EXPECT_TRUE(FileUtils::IsDirectory(m_dir.Path()));

    FileUtils::FileStat st;
    ASSERT_TRUE(FileUtils::Stat(file, st));
    EXPECT_TRUE(st.exists);
    EXPECT_FALSE(st.isDirectory);
    EXPECT_EQ(st.size, 5u);

    ASSERT_TRUE(FileUtils::Stat(m_dir.Path() / "missing", st));
    EXPECT_FALSE(st.exists);
}

TEST_F(FileUtilsTest, ReadHeadStopsAtLimit) {
    const fs::path file = m_dir.Path() / "big.bin";
    WriteFile(file, std::string(4096, 'x') + "augment");

    std::string head;
    ASSERT_TRUE(FileUtils::ReadHead(file, 1024, head));
    EXPECT_EQ(head.size(), 1024u);
    EXPECT_EQ(head.find("augment"), std::string::npos);

    std::string all;
    ASSERT_TRUE(FileUtils::ReadAllText(file, all));
    EXPECT_NE(all.find("augment"), std::string::npos);
}

TEST_F(FileUtilsTest, ReadMissingFileReportsError) {
    std::string out;
    FileUtils::Error err;
    EXPECT_FALSE(FileUtils::ReadAllText(m_dir.Path() / "nope", out, &err));
    EXPECT_TRUE(err.hasError());
}

TEST_F(FileUtilsTest, WriteAllTextAtomicCreatesParents) {
    const fs::path file = m_dir.Path() / "nested" / "dir" / "out.json";
    ASSERT_TRUE(FileUtils::WriteAllTextAtomic(file, "{}"));
    EXPECT_EQ(TraceSweep::Testing::ReadFile(file), "{}");
    EXPECT_FALSE(fs::exists(file.string() + ".tmp"));
}

TEST_F(FileUtilsTest, RemovingMissingEntriesSucceeds) {
    FileUtils::Error err;
    EXPECT_TRUE(FileUtils::RemoveFile(m_dir.Path() / "ghost", &err));
    EXPECT_TRUE(FileUtils::RemoveDirectoryRecursive(m_dir.Path() / "ghost-dir", &err));
    EXPECT_FALSE(err.hasError());
}

TEST_F(FileUtilsTest, CreateDirectoriesUnderFileFails) {
    WriteFile(m_dir.Path() / "blocker", "x");
    FileUtils::Error err;
    EXPECT_FALSE(FileUtils::CreateDirectories(m_dir.Path() / "blocker" / "sub", &err));
    EXPECT_TRUE(err.hasError());
}

TEST_F(FileUtilsTest, CopyFileHonoursOverwrite) {
    WriteFile(m_dir.Path() / "src", "new");
    WriteFile(m_dir.Path() / "dst", "old");

    ASSERT_TRUE(FileUtils::CopyFile(m_dir.Path() / "src", m_dir.Path() / "dst", false));
    EXPECT_EQ(TraceSweep::Testing::ReadFile(m_dir.Path() / "dst"), "old");

    ASSERT_TRUE(FileUtils::CopyFile(m_dir.Path() / "src", m_dir.Path() / "dst", true));
    EXPECT_EQ(TraceSweep::Testing::ReadFile(m_dir.Path() / "dst"), "new");
}

TEST_F(FileUtilsTest, WalkDirectoryVisitsFilesAndOptionallyDirs) {
    WriteFile(m_dir.Path() / "a.txt", "1");
    WriteFile(m_dir.Path() / "sub" / "b.txt", "2");
    WriteFile(m_dir.Path() / "sub" / "deeper" / "c.txt", "3");

    std::vector<std::string> names;
    FileUtils::WalkOptions opts;
    ASSERT_TRUE(FileUtils::WalkDirectory(m_dir.Path(), opts, [&](const fs::path& p, const fs::directory_entry&) {
        names.push_back(p.filename().string());
        return true;
    }));
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{ "a.txt", "b.txt", "c.txt" }));

    names.clear();
    opts.includeDirs = true;
    opts.maxDepth = 0;
    ASSERT_TRUE(FileUtils::WalkDirectory(m_dir.Path(), opts, [&](const fs::path& p, const fs::directory_entry&) {
        names.push_back(p.filename().string());
        return true;
    }));
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{ "a.txt", "sub" }));
}

TEST_F(FileUtilsTest, WalkDirectoryStopsOnCancel) {
    WriteFile(m_dir.Path() / "a", "1");
    WriteFile(m_dir.Path() / "b", "2");

    CancellationToken cancel;
    cancel.Cancel();

    size_t visited = 0;
    FileUtils::WalkOptions opts;
    opts.cancel = &cancel;
    ASSERT_TRUE(FileUtils::WalkDirectory(m_dir.Path(), opts, [&](const fs::path&, const fs::directory_entry&) {
        ++visited;
        return true;
    }));
    EXPECT_EQ(visited, 0u);
}

TEST_F(FileUtilsTest, WalkMissingRootFails) {
    FileUtils::Error err;
    EXPECT_FALSE(FileUtils::WalkDirectory(m_dir.Path() / "missing", {}, [](const fs::path&, const fs::directory_entry&) {
        return true;
    }, &err));
    EXPECT_TRUE(err.hasError());
}

TEST_F(FileUtilsTest, WalkContinuesPastDirectoryThatVanishes) {
    WriteFile(m_dir.Path() / "gone" / "inner.txt", "1");
    WriteFile(m_dir.Path() / "keep1" / "x.txt", "2");
    WriteFile(m_dir.Path() / "keep2" / "y.txt", "3");
    WriteFile(m_dir.Path() / "top.txt", "4");

    std::vector<std::string> names;
    FileUtils::WalkOptions opts;
    opts.includeDirs = true;
    ASSERT_TRUE(FileUtils::WalkDirectory(m_dir.Path(), opts, [&](const fs::path& p, const fs::directory_entry&) {
        names.push_back(p.filename().string());
        if (p.filename() == "gone") {
            std::error_code ec;
            fs::remove_all(p, ec);
        }
        return true;
    }));
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{ "gone", "keep1", "keep2", "top.txt", "x.txt", "y.txt" }));
}
