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

#include <cerrno>
#include <cstring>
#include <string>

#include "Utils/Logger.hpp"

using namespace TraceSweep::Utils;

TEST(LoggerTest, ErrnoMacroAppendsSystemMessage) {
    ASSERT_TRUE(Logger::Instance().IsInitialized());

    testing::internal::CaptureStderr();
    errno = ENOENT;
    TS_LOG_ERRNO("Test", "opening %s", "x");
    const std::string out = testing::internal::GetCapturedStderr();

    EXPECT_NE(out.find(std::string("opening x: ") + std::strerror(ENOENT)), std::string::npos) << out;
}

TEST(LoggerTest, ErrnoIsReadBeforeFormatting) {
    testing::internal::CaptureStderr();
    errno = EACCES;
    TS_LOG_ERRNO("Test", "open(%s)", std::to_string(7).c_str());
    const std::string out = testing::internal::GetCapturedStderr();

    EXPECT_NE(out.find(std::string("open(7): ") + std::strerror(EACCES)), std::string::npos) << out;
}

TEST(LoggerTest, MessagesBelowMinimalLevelAreDropped) {
    testing::internal::CaptureStderr();
    TS_LOG_DEBUG("Test", "quiet %d", 1);
    const std::string out = testing::internal::GetCapturedStderr();

    EXPECT_EQ(out.find("quiet 1"), std::string::npos);
}
