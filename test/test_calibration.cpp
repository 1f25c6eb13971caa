/**
 * @file test_calibration.cpp
 * @brief Target calibration on synthetic frames.
 */

#include <gtest/gtest.h>
#include <cmath>
#include "test_helpers.hpp"
#include "detector/calibration/target_calibration.hpp"

using namespace test_helpers;

// Filled circle of radius 300 px on a 122 cm face -> 300/61 px/cm
TEST(CalibrationTest, CircleGivesExpectedScale)
{
    CalibrationResult result = target_calibration::calibrate(makeFrame(targetFrame()), TargetSize::CM_122);

    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(result.error, ErrorKind::NONE);
    EXPECT_NEAR(result.profile.pixels_per_cm, 300.0 / 61.0, 0.05);
    EXPECT_NEAR(result.profile.center_px.x, kCenter.x, 1.5);
    EXPECT_NEAR(result.profile.center_px.y, kCenter.y, 1.5);
    EXPECT_NEAR(result.profile.axis_ratio, 1.0, 0.02);
    EXPECT_EQ(result.profile.frame_width, kFrameSize.width);
    EXPECT_EQ(result.profile.frame_height, kFrameSize.height);
    EXPECT_DOUBLE_EQ(result.profile.diameter_cm, 122.0);
}

TEST(CalibrationTest, SmallFaceUsesItsDiameter)
{
    CalibrationResult result = target_calibration::calibrate(makeFrame(targetFrame()), TargetSize::CM_80);

    ASSERT_TRUE(result) << result.message;
    EXPECT_NEAR(result.profile.pixels_per_cm, 300.0 / 40.0, 0.08);
    EXPECT_EQ(result.profile.target_size, TargetSize::CM_80);
}

// Scale must always be usable
TEST(CalibrationTest, ScaleIsPositiveAndFinite)
{
    for (int radius : {120, 200, 300, 340})
    {
        CalibrationResult result = target_calibration::calibrate(makeFrame(targetFrame(radius)), TargetSize::CM_122);
        ASSERT_TRUE(result) << "radius " << radius << ": " << result.message;
        EXPECT_GT(result.profile.pixels_per_cm, 0.0);
        EXPECT_TRUE(std::isfinite(result.profile.pixels_per_cm));
    }
}

// Concentric rings belong to the same face
TEST(CalibrationTest, RingsFoldIntoOuterBoundary)
{
    cv::Mat frame = targetFrame();
    cv::circle(frame, kCenter, 200, cv::Scalar(200, 200, 200), cv::FILLED);
    cv::circle(frame, kCenter, 100, cv::Scalar(40, 40, 40), cv::FILLED);

    CalibrationResult result = target_calibration::calibrate(makeFrame(frame), TargetSize::CM_122);

    ASSERT_TRUE(result) << result.message;
    EXPECT_NEAR(result.profile.radius_px, 300.0, 3.0);
}

TEST(CalibrationTest, BlankFrameIsNoTargetFound)
{
    CalibrationResult result = target_calibration::calibrate(makeFrame(blankFrame()), TargetSize::CM_122);

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, ErrorKind::NO_TARGET_FOUND);
}

TEST(CalibrationTest, EmptyFrameIsNoTargetFound)
{
    CalibrationResult result = target_calibration::calibrate(Frame(), TargetSize::CM_122);

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, ErrorKind::NO_TARGET_FOUND);
}

TEST(CalibrationTest, TwoEqualTargetsAreAmbiguous)
{
    cv::Mat frame = blankFrame();
    cv::circle(frame, cv::Point(340, 360), 180, kFace, cv::FILLED);
    cv::circle(frame, cv::Point(940, 360), 180, kFace, cv::FILLED);

    CalibrationResult result = target_calibration::calibrate(makeFrame(frame), TargetSize::CM_122);

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, ErrorKind::AMBIGUOUS_TARGET);
    EXPECT_EQ(result.candidates_found, 2);
}

// A clearly smaller second round object does not block calibration
TEST(CalibrationTest, SmallerSecondObjectIsIgnored)
{
    cv::Mat frame = targetFrame(260, cv::Point(500, 360));
    cv::circle(frame, cv::Point(1060, 360), 110, kFace, cv::FILLED);

    CalibrationResult result = target_calibration::calibrate(makeFrame(frame), TargetSize::CM_122);

    ASSERT_TRUE(result) << result.message;
    EXPECT_NEAR(result.profile.center_px.x, 500.0, 1.5);
}

// Strongly foreshortened target: camera far off perpendicular
TEST(CalibrationTest, ElongatedTargetIsPoorGeometry)
{
    cv::Mat frame = blankFrame();
    cv::ellipse(frame, cv::Point(700, 360), cv::Size(300, 160), 0.0, 0.0, 360.0, kFace, cv::FILLED);

    CalibrationResult result = target_calibration::calibrate(makeFrame(frame), TargetSize::CM_122);

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, ErrorKind::POOR_GEOMETRY);
}

// Mild tilt stays within the perpendicularity limit
TEST(CalibrationTest, SlightTiltIsAccepted)
{
    cv::Mat frame = blankFrame();
    cv::ellipse(frame, kCenter, cv::Size(300, 295), 10.0, 0.0, 360.0, kFace, cv::FILLED);

    CalibrationResult result = target_calibration::calibrate(makeFrame(frame), TargetSize::CM_122);

    ASSERT_TRUE(result) << result.message;
    EXPECT_LT(result.profile.axis_ratio, 1.0);
    EXPECT_NEAR(result.profile.radius_px, 297.5, 3.0);
}

TEST(CalibrationTest, ReportsDarkFaceOnLightWall)
{
    CalibrationResult result = target_calibration::calibrate(makeFrame(targetFrame()), TargetSize::CM_122);

    ASSERT_TRUE(result) << result.message;
    EXPECT_TRUE(result.dark_face);
}

TEST(CalibrationTest, ReportsLightFaceOnDarkWall)
{
    cv::Mat frame(kFrameSize, CV_8UC3, kFace);
    cv::circle(frame, kCenter, kTargetRadius, kPaper, cv::FILLED, cv::LINE_8);

    CalibrationResult result = target_calibration::calibrate(makeFrame(frame), TargetSize::CM_122);

    ASSERT_TRUE(result) << result.message;
    EXPECT_FALSE(result.dark_face);
    EXPECT_NEAR(result.profile.radius_px, 300.0, 3.0);
}
