/**
 * @file test_config.cpp
 * @brief JSON configuration merge and command line overrides.
 */

#include <gtest/gtest.h>
#include <fstream>
#include "test_helpers.hpp"
#include "config/config.hpp"

using namespace test_helpers;

TEST(ConfigTest, DefaultsAreValid)
{
    Config config;
    std::string error;
    EXPECT_TRUE(config::loadFromString("{}", config, error)) << error;
    EXPECT_EQ(config.service.port, 13520);
    EXPECT_EQ(config.session.default_target, "122cm");
    EXPECT_EQ(config.session.frame_queue_capacity, 2u);
}

// Only the keys present are changed
TEST(ConfigTest, PartialFileMerges)
{
    Config config;
    std::string error;
    const char *text = R"({
        "camera": {"device": "/dev/video2", "width": 1280},
        "detection": {"confirmation_window": 7, "min_confirmed_frames": 5},
        "sessions": {"directory": "/tmp/sessions", "default_target": "80cm"},
        "service": {"port": 8080},
        "debug": true
    })";

    ASSERT_TRUE(config::loadFromString(text, config, error)) << error;

    EXPECT_EQ(config.camera.device, "/dev/video2");
    EXPECT_EQ(config.camera.width, 1280);
    EXPECT_EQ(config.camera.height, 1080);
    EXPECT_EQ(config.detection.tracking.confirmation_window, 7);
    EXPECT_EQ(config.detection.tracking.min_confirmed_frames, 5);
    EXPECT_EQ(config.store.directory, "/tmp/sessions");
    EXPECT_EQ(config.session.default_target, "80cm");
    EXPECT_EQ(config.service.port, 8080);
    EXPECT_TRUE(config.debug);
}

TEST(ConfigTest, UnknownKeysAreIgnored)
{
    Config config;
    std::string error;
    EXPECT_TRUE(config::loadFromString(R"({"camera": {"zoom": 3}, "extras": {"a": 1}})", config, error)) << error;
    EXPECT_EQ(config.camera.width, 1920);
}

TEST(ConfigTest, MalformedJsonIsRejected)
{
    Config config;
    std::string error;
    EXPECT_FALSE(config::loadFromString("{\"camera\": ", config, error));
    EXPECT_FALSE(error.empty());
}

TEST(ConfigTest, WrongTypeLeavesConfigUntouched)
{
    Config config;
    std::string error;
    EXPECT_FALSE(config::loadFromString(R"({"camera": {"width": 640, "height": "tall"}})", config, error));
    EXPECT_EQ(config.camera.width, 1920);
}

TEST(ConfigTest, InvalidValuesAreRejected)
{
    Config config;
    std::string error;
    EXPECT_FALSE(config::loadFromString(R"({"sessions": {"default_target": "60cm"}})", config, error));
    EXPECT_FALSE(config::loadFromString(R"({"camera": {"rotation": 45}})", config, error));
    EXPECT_FALSE(config::loadFromString(R"({"detection": {"confirmation_window": 3, "min_confirmed_frames": 4}})", config, error));
    EXPECT_FALSE(config::loadFromString(R"({"logging": {"level": "loud"}})", config, error));
    EXPECT_FALSE(config::loadFromString(R"({"service": {"event_queue_capacity": 0}})", config, error));
    EXPECT_EQ(config.session.default_target, "122cm");
    EXPECT_EQ(config.service.event_queue_capacity, 256);
}

TEST(ConfigTest, EventQueueCapacityIsRead)
{
    Config config;
    std::string error;
    ASSERT_TRUE(config::loadFromString(R"({"service": {"event_queue_capacity": 32}})", config, error)) << error;
    EXPECT_EQ(config.service.event_queue_capacity, 32);
}

TEST(ConfigTest, LoadsFromFile)
{
    TempDir dir;
    std::string path = dir.path("openarchery.json");
    {
        std::ofstream file(path);
        file << R"({"service": {"port": 9000}, "sessions": {"max_sessions": 10}})";
    }

    Config config;
    std::string error;
    ASSERT_TRUE(config::loadFromFile(path, config, error)) << error;
    EXPECT_EQ(config.service.port, 9000);
    EXPECT_EQ(config.store.max_sessions, 10);

    EXPECT_FALSE(config::loadFromFile(dir.path("missing.json"), config, error));
}

TEST(ConfigTest, CommandLineOverridesFile)
{
    Config config;
    std::string error;
    ASSERT_TRUE(config::loadFromString(R"({"service": {"port": 9000}})", config, error));

    const char *args[] = {"openarchery", "--port", "9100", "--target", "80cm", "--camera", "/dev/video1",
                          "--reuse-calibration", "--debug"};
    int argc = sizeof(args) / sizeof(args[0]);

    ASSERT_TRUE(config::applyArgs(argc, const_cast<char **>(args), config, error)) << error;
    EXPECT_EQ(config.service.port, 9100);
    EXPECT_EQ(config.session.default_target, "80cm");
    EXPECT_EQ(config.camera.device, "/dev/video1");
    EXPECT_TRUE(config.session.reuse_calibration);
    EXPECT_TRUE(config.debug);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(ConfigTest, BadNumericArgumentIsRejected)
{
    Config config;
    std::string error;
    const char *args[] = {"openarchery", "--width", "wide"};

    EXPECT_FALSE(config::applyArgs(3, const_cast<char **>(args), config, error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(config.camera.width, 1920);
}
