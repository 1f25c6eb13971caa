/**
 * @file test_candidate_tracking.cpp
 * @brief Temporal confirmation of foreground blobs.
 */

#include <gtest/gtest.h>
#include <vector>
#include "detector/detection/candidate_tracking.hpp"

using candidate_tracking::CandidateTracker;
using candidate_tracking::ConfirmedCandidate;

namespace
{
    std::vector<blob_processing::Blob> blobAt(double x, double y)
    {
        blob_processing::Blob blob;
        blob.centroid = cv::Point2d(x, y);
        blob.area = 300.0;
        blob.box = cv::Rect((int)x - 10, (int)y - 10, 20, 20);
        return {blob};
    }

    const std::vector<blob_processing::Blob> kNothing;
}

TEST(CandidateTrackingTest, SteadyBlobConfirmsWithFullConfidence)
{
    CandidateTracker tracker;

    for (int i = 0; i < 4; i++)
        EXPECT_TRUE(tracker.update(blobAt(400, 300)).empty());

    auto confirmed = tracker.update(blobAt(400, 300));

    ASSERT_EQ(confirmed.size(), 1u);
    EXPECT_DOUBLE_EQ(confirmed[0].confidence, 1.0);
    EXPECT_EQ(confirmed[0].frames_tracked, 5);
    EXPECT_TRUE(tracker.candidates().empty());
}

// A miss costs a frame of waiting, not confidence, once the window is full of hits
TEST(CandidateTrackingTest, LateConfirmationKeepsFullConfidence)
{
    CandidateTracker tracker;

    for (int i = 0; i < 4; i++)
        EXPECT_TRUE(tracker.update(blobAt(400, 300)).empty());
    EXPECT_TRUE(tracker.update(kNothing).empty());

    auto confirmed = tracker.update(blobAt(400, 300));

    ASSERT_EQ(confirmed.size(), 1u);
    EXPECT_DOUBLE_EQ(confirmed[0].confidence, 1.0);
    EXPECT_EQ(confirmed[0].frames_tracked, 6);
}

TEST(CandidateTrackingTest, MissInsideWindowLowersConfidence)
{
    CandidateTracker tracker;

    for (int i = 0; i < 3; i++)
        EXPECT_TRUE(tracker.update(blobAt(400, 300)).empty());
    EXPECT_TRUE(tracker.update(kNothing).empty());

    auto confirmed = tracker.update(blobAt(401, 300));

    ASSERT_EQ(confirmed.size(), 1u);
    EXPECT_DOUBLE_EQ(confirmed[0].confidence, 0.8);
    EXPECT_EQ(confirmed[0].frames_tracked, 5);
}

TEST(CandidateTrackingTest, FlickeringBlobIsDropped)
{
    CandidateTracker tracker;

    EXPECT_TRUE(tracker.update(blobAt(400, 300)).empty());
    EXPECT_TRUE(tracker.update(kNothing).empty());
    EXPECT_TRUE(tracker.update(blobAt(400, 300)).empty());
    EXPECT_TRUE(tracker.update(kNothing).empty());
    EXPECT_TRUE(tracker.update(blobAt(400, 300)).empty());

    EXPECT_TRUE(tracker.candidates().empty());
}

TEST(CandidateTrackingTest, TwoMissesDropCandidate)
{
    CandidateTracker tracker;

    tracker.update(blobAt(400, 300));
    tracker.update(kNothing);
    EXPECT_EQ(tracker.candidates().size(), 1u);

    tracker.update(kNothing);
    EXPECT_TRUE(tracker.candidates().empty());
}

// Movement beyond the stable tolerance restarts the window
TEST(CandidateTrackingTest, MovingBlobRestartsWindow)
{
    CandidateTracker tracker;

    for (int i = 0; i < 4; i++)
        tracker.update(blobAt(400, 300));
    EXPECT_TRUE(tracker.update(blobAt(410, 300)).empty());

    ASSERT_EQ(tracker.candidates().size(), 1u);
    EXPECT_EQ(tracker.candidates()[0].age, 1);

    for (int i = 0; i < 3; i++)
        EXPECT_TRUE(tracker.update(blobAt(410, 300)).empty());

    auto confirmed = tracker.update(blobAt(410, 300));
    ASSERT_EQ(confirmed.size(), 1u);
    EXPECT_EQ(confirmed[0].frames_tracked, 5);
}
