/**
 * @file test_target_geometry.cpp
 * @brief Pixel <-> target mapping, ring scores and profile validity.
 */

#include <gtest/gtest.h>
#include <limits>
#include "test_helpers.hpp"
#include "detector/target_types.hpp"

using namespace test_helpers;

// Pixel -> cm -> pixel returns the same point
TEST(TargetGeometryTest, PixelRoundTrip)
{
    CalibrationProfile profile = syntheticProfile();

    const cv::Point2d pixels[] = {{640.0, 360.0}, {12.25, 700.5}, {1279.0, 0.0}, {913.137, 211.004}};
    for (const auto &pixel : pixels)
    {
        cv::Point2d cm = target_geometry::pixelToTarget(profile, pixel);
        cv::Point2d back = target_geometry::targetToPixel(profile, cm);
        EXPECT_NEAR(back.x, pixel.x, 1e-6);
        EXPECT_NEAR(back.y, pixel.y, 1e-6);
    }
}

// The fitted center is the origin of target coordinates
TEST(TargetGeometryTest, CenterMapsToOrigin)
{
    CalibrationProfile profile = syntheticProfile();
    cv::Point2d cm = target_geometry::pixelToTarget(profile, profile.center_px);
    EXPECT_DOUBLE_EQ(cm.x, 0.0);
    EXPECT_DOUBLE_EQ(cm.y, 0.0);
    EXPECT_DOUBLE_EQ(target_geometry::radialDistance(cm), 0.0);
}

// Edge of the face is half the diameter away
TEST(TargetGeometryTest, EdgeIsHalfDiameter)
{
    CalibrationProfile profile = syntheticProfile();
    cv::Point2d edge = target_geometry::pixelToTarget(profile, {640.0 + kTargetRadius, 360.0});
    EXPECT_NEAR(target_geometry::radialDistance(edge), 61.0, 1e-9);
    EXPECT_NEAR(target_geometry::angleDegrees(edge), 0.0, 1e-9);
}

TEST(TargetGeometryTest, AngleRunsClockwiseInImageAxes)
{
    EXPECT_NEAR(target_geometry::angleDegrees({0.0, 10.0}), 90.0, 1e-9);
    EXPECT_NEAR(target_geometry::angleDegrees({-10.0, 0.0}), 180.0, 1e-9);
    EXPECT_NEAR(target_geometry::angleDegrees({0.0, -10.0}), 270.0, 1e-9);
}

TEST(TargetGeometryTest, RingScores122)
{
    EXPECT_EQ(target_geometry::ringScore(TargetSize::CM_122, 0.0), 10);
    EXPECT_EQ(target_geometry::ringScore(TargetSize::CM_122, 6.0), 10);
    EXPECT_EQ(target_geometry::ringScore(TargetSize::CM_122, 6.2), 9);
    EXPECT_EQ(target_geometry::ringScore(TargetSize::CM_122, 30.0), 6);
    EXPECT_EQ(target_geometry::ringScore(TargetSize::CM_122, 60.9), 1);
    EXPECT_EQ(target_geometry::ringScore(TargetSize::CM_122, 61.5), 0);

    EXPECT_TRUE(target_geometry::isXRing(TargetSize::CM_122, 3.0));
    EXPECT_FALSE(target_geometry::isXRing(TargetSize::CM_122, 3.1));
}

TEST(TargetGeometryTest, RingScores80)
{
    EXPECT_EQ(target_geometry::ringScore(TargetSize::CM_80, 3.9), 10);
    EXPECT_EQ(target_geometry::ringScore(TargetSize::CM_80, 4.1), 9);
    EXPECT_EQ(target_geometry::ringScore(TargetSize::CM_80, 39.9), 1);
    EXPECT_EQ(target_geometry::ringScore(TargetSize::CM_80, 40.1), 0);

    EXPECT_TRUE(target_geometry::isXRing(TargetSize::CM_80, 2.0));
    EXPECT_FALSE(target_geometry::isXRing(TargetSize::CM_80, 2.1));
}

TEST(TargetGeometryTest, ParsesTargetSizes)
{
    TargetSize size = TargetSize::CM_122;
    EXPECT_TRUE(target_geometry::parseTargetSize("80cm", size));
    EXPECT_EQ(size, TargetSize::CM_80);
    EXPECT_TRUE(target_geometry::parseTargetSize("122", size));
    EXPECT_EQ(size, TargetSize::CM_122);
    EXPECT_FALSE(target_geometry::parseTargetSize("60cm", size));
    EXPECT_EQ(target_geometry::targetSizeName(TargetSize::CM_80), "80cm");
}

TEST(TargetGeometryTest, ProfileValidity)
{
    CalibrationProfile profile = syntheticProfile();
    uint64_t now = profile.timestamp;

    EXPECT_TRUE(target_geometry::isProfileValid(profile, now, 0));
    EXPECT_TRUE(target_geometry::isProfileValid(profile, now + 1000, 5000));
    EXPECT_FALSE(target_geometry::isProfileValid(profile, now + 6000, 5000));

    profile.pixels_per_cm = 0.0;
    EXPECT_FALSE(target_geometry::isProfileValid(profile, now, 0));
    profile.pixels_per_cm = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(target_geometry::isProfileValid(profile, now, 0));
}
