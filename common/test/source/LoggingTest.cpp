/*
* If not stated otherwise in this file or this component's LICENSE file the
* following copyright and licenses apply:
*
* Copyright 2024 Sky UK
*
* Licensed under the Apache License, Version 2.0 (the "License");
* you may not use this file except in compliance with the License.
* You may obtain a copy of the License at
*
* http://www.apache.org/licenses/LICENSE-2.0
*
* Unless required by applicable law or agreed to in writing, software
* distributed under the License is distributed on an "AS IS" BASIS,
* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
* See the License for the specific language governing permissions and
* limitations under the License.
*/
/*
 * File:   LoggingTest.cpp
 *
 */

#include <Logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>
#include <cerrno>

using namespace testing;


class LoggingTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mSavedLevel = __quay_log_level;
        QuayCommon::initLogging(
            [this](int level, const char *file, const char *func, int line, const char *message)
            {
                (void)file;
                (void)func;
                (void)line;
                mLevels.push_back(level);
                mMessages.emplace_back(message);
            });
    }

    void TearDown() override
    {
        QuayCommon::termLogging();
        __quay_log_level = mSavedLevel;
    }

protected:
    int mSavedLevel = QUAY_LOG_LEVEL_MILESTONE;
    std::vector<int> mLevels;
    std::vector<std::string> mMessages;
};

TEST_F(LoggingTest, TestMessagesAboveLevelAreDropped)
{
    __quay_log_level = QUAY_LOG_LEVEL_WARNING;

    QUAY_LOG_ERROR("error %d", 1);
    QUAY_LOG_WARN("warning %d", 2);
    QUAY_LOG_MILESTONE("milestone %d", 3);

    ASSERT_EQ(2U, mMessages.size());
    EXPECT_EQ("error 1", mMessages[0]);
    EXPECT_EQ("warning 2", mMessages[1]);
    EXPECT_EQ(QUAY_LOG_LEVEL_ERROR, mLevels[0]);
}

TEST_F(LoggingTest, TestSysErrorAppendsErrnoText)
{
    __quay_log_level = QUAY_LOG_LEVEL_ERROR;

    QUAY_LOG_SYS_ERROR(ENOENT, "failed to open");

    ASSERT_EQ(1U, mMessages.size());
    EXPECT_THAT(mMessages[0], StartsWith("failed to open ("));
    EXPECT_THAT(mMessages[0], HasSubstr("No such file or directory"));
}

TEST_F(LoggingTest, TestSetLogLevelByName)
{
    EXPECT_TRUE(QuayCommon::setLogLevel("info"));
    EXPECT_EQ(QUAY_LOG_LEVEL_INFO, __quay_log_level);

    EXPECT_TRUE(QuayCommon::setLogLevel("ERROR"));
    EXPECT_EQ(QUAY_LOG_LEVEL_ERROR, __quay_log_level);

    EXPECT_FALSE(QuayCommon::setLogLevel("chatty"));
    EXPECT_EQ(QUAY_LOG_LEVEL_ERROR, __quay_log_level);
}
