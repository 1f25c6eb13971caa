/**
 * @file test_session_store.cpp
 * @brief Append-only session files: round trip, listing, pruning and interrupted sessions.
 */

#include <gtest/gtest.h>
#include <cmath>
#include <fstream>
#include "test_helpers.hpp"
#include "session/session_store.hpp"

using namespace test_helpers;

namespace
{
    Session makeSession(const std::string &id, uint64_t start)
    {
        Session session;
        session.id = id;
        session.start_time = start;
        session.active = true;
        session.target_size = TargetSize::CM_122;
        session.profile = syntheticProfile();
        return session;
    }

    Impact makeImpact(int sequence, double x_cm, double y_cm, uint64_t timestamp)
    {
        Impact impact;
        impact.sequence = sequence;
        impact.x_cm = x_cm;
        impact.y_cm = y_cm;
        impact.radius_cm = std::sqrt(x_cm * x_cm + y_cm * y_cm);
        impact.angle_deg = target_geometry::angleDegrees({x_cm, y_cm});
        impact.score = target_geometry::ringScore(TargetSize::CM_122, impact.radius_cm);
        impact.x_ring = target_geometry::isXRing(TargetSize::CM_122, impact.radius_cm);
        impact.pixel = target_geometry::targetToPixel(syntheticProfile(), {x_cm, y_cm});
        impact.timestamp = timestamp;
        impact.confidence = 0.8;
        impact.area_px = 314.0;
        return impact;
    }
}

class SessionStoreTest : public ::testing::Test
{
protected:
    SessionStoreTest()
    {
        SessionStoreParams params;
        params.directory = dir.path("sessions");
        params.max_sessions = 2;
        store.reset(new SessionStore(params));
    }

    TempDir dir;
    std::unique_ptr<SessionStore> store;
};

// Stored values come back bit for bit
TEST_F(SessionStoreTest, RoundTripIsLossless)
{
    Session session = makeSession("20261019-101500-000", 1760868900000ULL);
    ASSERT_TRUE(store->begin(session));

    Impact first = makeImpact(1, 1.0 / 3.0, -CV_PI, 1760868901000ULL);
    Impact second = makeImpact(2, 12.345678901234567, 0.1, 1760868902000ULL);
    ASSERT_TRUE(store->appendImpact(session.id, first));
    ASSERT_TRUE(store->appendImpact(session.id, second));

    session.impacts = {first, second};
    session.end_time = 1760868960000ULL;
    session.active = false;
    ASSERT_TRUE(store->finalize(session));

    Session loaded;
    ASSERT_TRUE(store->load(session.id, loaded));

    EXPECT_EQ(loaded.id, session.id);
    EXPECT_EQ(loaded.start_time, session.start_time);
    EXPECT_EQ(loaded.end_time, session.end_time);
    EXPECT_FALSE(loaded.active);
    EXPECT_EQ(loaded.fault, ErrorKind::NONE);
    EXPECT_EQ(loaded.target_size, TargetSize::CM_122);
    EXPECT_EQ(loaded.profile.pixels_per_cm, session.profile.pixels_per_cm);
    EXPECT_EQ(loaded.profile.center_px, session.profile.center_px);

    ASSERT_EQ(loaded.impacts.size(), 2u);
    EXPECT_EQ(loaded.impacts[0].sequence, 1);
    EXPECT_EQ(loaded.impacts[0].x_cm, 1.0 / 3.0);
    EXPECT_EQ(loaded.impacts[0].y_cm, -CV_PI);
    EXPECT_EQ(loaded.impacts[0].radius_cm, first.radius_cm);
    EXPECT_EQ(loaded.impacts[0].timestamp, first.timestamp);
    EXPECT_EQ(loaded.impacts[1].x_cm, second.x_cm);
    EXPECT_EQ(loaded.impacts[1].score, second.score);
    EXPECT_EQ(loaded.impacts[1].x_ring, second.x_ring);
    EXPECT_EQ(loaded.impacts[1].pixel, second.pixel);
}

// Power cut mid-session: the file has no end line
TEST_F(SessionStoreTest, UnfinishedSessionLoadsAsFaulted)
{
    Session session = makeSession("20261019-101500-001", 1000);
    ASSERT_TRUE(store->begin(session));
    ASSERT_TRUE(store->appendImpact(session.id, makeImpact(1, 2.0, 2.0, 1500)));

    Session loaded;
    ASSERT_TRUE(store->load(session.id, loaded));

    EXPECT_EQ(loaded.fault, ErrorKind::DETECTION_FAULT);
    EXPECT_FALSE(loaded.fault_message.empty());
    EXPECT_EQ(loaded.end_time, 1500u);
    EXPECT_EQ(loaded.impacts.size(), 1u);
}

TEST_F(SessionStoreTest, TornLastLineIsSkipped)
{
    Session session = makeSession("20261019-101500-002", 1000);
    ASSERT_TRUE(store->begin(session));
    ASSERT_TRUE(store->appendImpact(session.id, makeImpact(1, 2.0, 2.0, 1500)));
    {
        std::ofstream file(store->pathFor(session.id), std::ios::app);
        file << "{\"record\":\"impact\",\"sequ";
    }

    Session loaded;
    ASSERT_TRUE(store->load(session.id, loaded));
    EXPECT_EQ(loaded.impacts.size(), 1u);
}

TEST_F(SessionStoreTest, FaultIsStored)
{
    Session session = makeSession("20261019-101500-003", 1000);
    ASSERT_TRUE(store->begin(session));
    session.end_time = 2000;
    session.fault = ErrorKind::CAMERA_UNAVAILABLE;
    session.fault_message = "device lost";
    ASSERT_TRUE(store->finalize(session));

    Session loaded;
    ASSERT_TRUE(store->load(session.id, loaded));
    EXPECT_EQ(loaded.fault, ErrorKind::CAMERA_UNAVAILABLE);
    EXPECT_EQ(loaded.fault_message, "device lost");
}

TEST_F(SessionStoreTest, MissingSessionDoesNotLoad)
{
    Session loaded;
    EXPECT_FALSE(store->load("20260101-000000-000", loaded));
}

TEST_F(SessionStoreTest, UnsafeIdsAreRejected)
{
    Session session = makeSession("../escape", 1000);
    EXPECT_FALSE(store->begin(session));
    EXPECT_FALSE(store->appendImpact("a/b", makeImpact(1, 0.0, 0.0, 1)));

    Session loaded;
    EXPECT_FALSE(store->load("../escape", loaded));
}

TEST_F(SessionStoreTest, ListsNewestFirstWithTotals)
{
    Session older = makeSession("20261019-090000-000", 1000);
    ASSERT_TRUE(store->begin(older));
    older.end_time = 1100;
    ASSERT_TRUE(store->finalize(older));

    Session newer = makeSession("20261019-100000-000", 2000);
    ASSERT_TRUE(store->begin(newer));
    Impact ten = makeImpact(1, 0.5, 0.5, 2100);
    ASSERT_TRUE(store->appendImpact(newer.id, ten));
    newer.impacts = {ten};
    newer.end_time = 2200;
    ASSERT_TRUE(store->finalize(newer));

    auto summaries = store->list();

    ASSERT_EQ(summaries.size(), 2u);
    EXPECT_EQ(summaries[0].id, newer.id);
    EXPECT_EQ(summaries[0].arrows, 1);
    EXPECT_EQ(summaries[0].total_score, 10);
    EXPECT_EQ(summaries[1].id, older.id);
    EXPECT_EQ(summaries[1].arrows, 0);
}

TEST_F(SessionStoreTest, PruneKeepsNewest)
{
    for (const char *id : {"20261019-080000-000", "20261019-090000-000", "20261019-100000-000"})
    {
        Session session = makeSession(id, 1000);
        ASSERT_TRUE(store->begin(session));
        session.end_time = 1001;
        ASSERT_TRUE(store->finalize(session));
    }

    EXPECT_EQ(store->prune(), 1);

    auto summaries = store->list();
    ASSERT_EQ(summaries.size(), 2u);
    EXPECT_EQ(summaries[0].id, "20261019-100000-000");
    EXPECT_EQ(summaries[1].id, "20261019-090000-000");
}

TEST(SessionStatisticsTest, ComputesTotalsAndExtremes)
{
    Session session;
    session.target_size = TargetSize::CM_122;
    session.impacts = {makeImpact(1, 0.0, 1.0, 1), makeImpact(2, 20.0, 0.0, 2), makeImpact(3, 0.0, -8.0, 3)};

    SessionStatistics stats = session_state::computeStatistics(session);

    EXPECT_EQ(stats.arrows, 3);
    EXPECT_EQ(stats.total_score, 10 + 7 + 9);
    EXPECT_EQ(stats.x_count, 1);
    EXPECT_NEAR(stats.average_score, 26.0 / 3.0, 1e-9);
    EXPECT_NEAR(stats.average_radius_cm, 29.0 / 3.0, 1e-9);
    EXPECT_EQ(stats.best_sequence, 1);
    EXPECT_EQ(stats.worst_sequence, 2);
}

TEST(SessionStatisticsTest, EmptySession)
{
    SessionStatistics stats = session_state::computeStatistics(Session());
    EXPECT_EQ(stats.arrows, 0);
    EXPECT_EQ(stats.total_score, 0);
    EXPECT_DOUBLE_EQ(stats.average_score, 0.0);
}
