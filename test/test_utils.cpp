/**
 * @file test_utils.cpp
 * @brief Small helpers: log level names, camera device names, power-off command.
 */

#include <gtest/gtest.h>
#include <string>
#include "utils/camera.hpp"
#include "utils/host.hpp"
#include "utils/logging.hpp"

TEST(LoggingTest, LevelNamesAreCaseInsensitive)
{
    logging::LogLevel level = logging::LogLevel::INFO;

    ASSERT_TRUE(logging::parseLogLevel("DEBUG", level));
    EXPECT_EQ(level, logging::LogLevel::DEBUG);
    ASSERT_TRUE(logging::parseLogLevel("Warn", level));
    EXPECT_EQ(level, logging::LogLevel::WARNING);
}

// Bytes above 0x7f must not reach tolower as negative values
TEST(LoggingTest, NonAsciiLevelIsRejected)
{
    logging::LogLevel level = logging::LogLevel::INFO;

    EXPECT_FALSE(logging::parseLogLevel("d\xC3\xA9" "bug", level));
    EXPECT_FALSE(logging::parseLogLevel("\xFF\xFE", level));
    EXPECT_EQ(level, logging::LogLevel::INFO);
}

TEST(CameraUtilsTest, VideoFileExtensions)
{
    EXPECT_TRUE(camera::isVideoFile("/data/range/end3.MP4"));
    EXPECT_TRUE(camera::isVideoFile("/tmp/cam\xC3\xA9ra.mkv"));
    EXPECT_FALSE(camera::isVideoFile("/dev/video0"));
    EXPECT_FALSE(camera::isVideoFile("/tmp/\xC3\xA9\xFF"));
}

TEST(CameraUtilsTest, DeviceIndexIsDigitsOnly)
{
    EXPECT_TRUE(camera::isDeviceIndex("0"));
    EXPECT_TRUE(camera::isDeviceIndex("12"));
    EXPECT_FALSE(camera::isDeviceIndex(""));
    EXPECT_FALSE(camera::isDeviceIndex("/dev/video0"));
    EXPECT_FALSE(camera::isDeviceIndex("\xD9\xA3"));
    EXPECT_FALSE(camera::isDeviceIndex("99999999999"));
}

TEST(HostTest, PowerOffReportsCommandStatus)
{
    EXPECT_TRUE(host::powerOff("true"));
    EXPECT_FALSE(host::powerOff("false"));
    EXPECT_FALSE(host::powerOff(""));
}
