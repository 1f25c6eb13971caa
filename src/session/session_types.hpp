#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "camera/frame_source.hpp"
#include "detector/detector_interface.hpp"
#include "detector/target_types.hpp"
#include "utils/errors.hpp"

using namespace std;

enum class DetectorState
{
    IDLE,
    CALIBRATING,
    ARMED,
    DETECTING,
    ERROR
};

// One shooting session: every impact detected between start and stop
struct Session
{
    string id = "";
    uint64_t start_time = 0;
    uint64_t end_time = 0;            // 0 while active
    bool active = false;
    TargetSize target_size = TargetSize::CM_122;
    CalibrationProfile profile;       // Profile every impact was mapped with
    vector<Impact> impacts;           // Ordered by sequence

    // FAULT: set when the session was ended by an error
    ErrorKind fault = ErrorKind::NONE;
    string fault_message = "";
};

struct SessionStatistics
{
    int arrows = 0;
    int total_score = 0;
    int x_count = 0;
    double average_score = 0.0;
    double average_radius_cm = 0.0;
    int best_sequence = 0;  // Closest to center
    int worst_sequence = 0; // Furthest from center
};

// Light listing entry for stored sessions
struct SessionSummary
{
    string id = "";
    uint64_t start_time = 0;
    uint64_t end_time = 0;
    TargetSize target_size = TargetSize::CM_122;
    int arrows = 0;
    int total_score = 0;
    ErrorKind fault = ErrorKind::NONE;
};

// Reply to every Session Manager command
struct CommandResult
{
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    string message = "";
    DetectorState state = DetectorState::IDLE;

    bool has_profile = false;
    CalibrationProfile profile;
    bool has_session = false;
    Session session;

    // Easy boolean check
    operator bool() const { return success; }
};

// Everything get_status() reports
struct StatusSnapshot
{
    DetectorState state = DetectorState::IDLE;
    bool shutting_down = false;

    bool has_profile = false;
    bool profile_valid = false;
    CalibrationProfile profile;

    bool has_session = false; // Active session, or the last finished one
    Session session;
    SessionStatistics statistics;

    ErrorKind last_error = ErrorKind::NONE;
    string last_error_message = "";

    camera::SourceStats camera;
    DetectorStats detector;
    uint64_t frames_dropped = 0;
    uint64_t uptime_ms = 0;
};

namespace session_state
{
    inline string stateName(DetectorState state)
    {
        switch (state)
        {
        case DetectorState::IDLE:
            return "Idle";
        case DetectorState::CALIBRATING:
            return "Calibrating";
        case DetectorState::ARMED:
            return "Armed";
        case DetectorState::DETECTING:
            return "Detecting";
        case DetectorState::ERROR:
            return "Error";
        default:
            return "Unknown";
        }
    }

    inline SessionStatistics computeStatistics(const Session &session)
    {
        SessionStatistics stats;
        if (session.impacts.empty())
            return stats;

        double radius_sum = 0.0;
        double best_radius = -1.0;
        double worst_radius = -1.0;

        for (const auto &impact : session.impacts)
        {
            stats.arrows++;
            stats.total_score += impact.score;
            if (impact.x_ring)
                stats.x_count++;
            radius_sum += impact.radius_cm;

            if (best_radius < 0.0 || impact.radius_cm < best_radius)
            {
                best_radius = impact.radius_cm;
                stats.best_sequence = impact.sequence;
            }
            if (worst_radius < 0.0 || impact.radius_cm > worst_radius)
            {
                worst_radius = impact.radius_cm;
                stats.worst_sequence = impact.sequence;
            }
        }

        stats.average_score = (double)stats.total_score / stats.arrows;
        stats.average_radius_cm = radius_sum / stats.arrows;
        return stats;
    }
} // namespace session_state
