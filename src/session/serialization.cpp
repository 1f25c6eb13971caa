#include "serialization.hpp"
#include "utils/time.hpp"

using namespace std;

void to_json(json &j, const CalibrationProfile &profile)
{
    j = json{
        {"target_size", target_geometry::targetSizeName(profile.target_size)},
        {"diameter_cm", profile.diameter_cm},
        {"center_x", profile.center_px.x},
        {"center_y", profile.center_px.y},
        {"radius_px", profile.radius_px},
        {"pixels_per_cm", profile.pixels_per_cm},
        {"axis_width", profile.axes_px.width},
        {"axis_height", profile.axes_px.height},
        {"angle_deg", profile.angle_deg},
        {"axis_ratio", profile.axis_ratio},
        {"frame_width", profile.frame_width},
        {"frame_height", profile.frame_height},
        {"timestamp", profile.timestamp}};
}

void from_json(const json &j, CalibrationProfile &profile)
{
    string size_name = j.at("target_size").get<string>();
    if (!target_geometry::parseTargetSize(size_name, profile.target_size))
        throw invalid_argument("Unknown target size: " + size_name);

    profile.diameter_cm = j.value("diameter_cm", target_geometry::diameterCm(profile.target_size));
    profile.center_px.x = j.at("center_x").get<double>();
    profile.center_px.y = j.at("center_y").get<double>();
    profile.radius_px = j.at("radius_px").get<double>();
    profile.pixels_per_cm = j.at("pixels_per_cm").get<double>();
    profile.axes_px.width = j.value("axis_width", profile.radius_px * 2.0);
    profile.axes_px.height = j.value("axis_height", profile.radius_px * 2.0);
    profile.angle_deg = j.value("angle_deg", 0.0);
    profile.axis_ratio = j.value("axis_ratio", 1.0);
    profile.frame_width = j.value("frame_width", 0);
    profile.frame_height = j.value("frame_height", 0);
    profile.timestamp = j.value("timestamp", (uint64_t)0);
}

void to_json(json &j, const Impact &impact)
{
    j = json{
        {"sequence", impact.sequence},
        {"pixel_x", impact.pixel.x},
        {"pixel_y", impact.pixel.y},
        {"x_cm", impact.x_cm},
        {"y_cm", impact.y_cm},
        {"radius_cm", impact.radius_cm},
        {"angle_deg", impact.angle_deg},
        {"score", impact.score},
        {"x_ring", impact.x_ring},
        {"timestamp", impact.timestamp},
        {"confidence", impact.confidence},
        {"area_px", impact.area_px}};
}

void from_json(const json &j, Impact &impact)
{
    impact.sequence = j.at("sequence").get<int>();
    impact.pixel.x = j.at("pixel_x").get<double>();
    impact.pixel.y = j.at("pixel_y").get<double>();
    impact.x_cm = j.at("x_cm").get<double>();
    impact.y_cm = j.at("y_cm").get<double>();
    impact.radius_cm = j.at("radius_cm").get<double>();
    impact.angle_deg = j.at("angle_deg").get<double>();
    impact.score = j.at("score").get<int>();
    impact.x_ring = j.at("x_ring").get<bool>();
    impact.timestamp = j.at("timestamp").get<uint64_t>();
    impact.confidence = j.value("confidence", 0.0);
    impact.area_px = j.value("area_px", 0.0);
}

void to_json(json &j, const SessionStatistics &stats)
{
    j = json{
        {"arrows", stats.arrows},
        {"total_score", stats.total_score},
        {"x_count", stats.x_count},
        {"average_score", stats.average_score},
        {"average_radius_cm", stats.average_radius_cm},
        {"best_sequence", stats.best_sequence},
        {"worst_sequence", stats.worst_sequence}};
}

void to_json(json &j, const SessionSummary &summary)
{
    j = json{
        {"id", summary.id},
        {"start_time", summary.start_time},
        {"end_time", summary.end_time},
        {"target_size", target_geometry::targetSizeName(summary.target_size)},
        {"arrows", summary.arrows},
        {"total_score", summary.total_score},
        {"fault", errors::errorKindName(summary.fault)}};
}

namespace serialization
{
    json sessionHeader(const Session &session)
    {
        json j;
        j["id"] = session.id;
        j["start_time"] = session.start_time;
        j["start_time_iso"] = timeutil::formatIso(session.start_time);
        j["end_time"] = session.end_time;
        j["active"] = session.active;
        j["target_size"] = target_geometry::targetSizeName(session.target_size);
        j["profile"] = session.profile;
        j["fault"] = errors::errorKindName(session.fault);
        j["fault_message"] = session.fault_message;
        return j;
    }

    json sessionToJson(const Session &session)
    {
        json j = sessionHeader(session);
        j["impacts"] = session.impacts;
        j["statistics"] = session_state::computeStatistics(session);
        return j;
    }

    json statusToJson(const StatusSnapshot &status)
    {
        json j;
        j["state"] = session_state::stateName(status.state);
        j["shutting_down"] = status.shutting_down;
        j["calibrated"] = status.has_profile;
        j["profile_valid"] = status.profile_valid;
        j["profile"] = status.has_profile ? json(status.profile) : json(nullptr);

        if (status.has_session)
        {
            j["session"] = sessionHeader(status.session);
            j["session"]["arrows"] = status.session.impacts.size();
        }
        else
        {
            j["session"] = nullptr;
        }
        j["statistics"] = status.statistics;

        j["last_error"] = errors::errorKindName(status.last_error);
        j["last_error_message"] = status.last_error_message;

        j["camera"] = {
            {"frames_captured", status.camera.frames_captured},
            {"timeouts", status.camera.timeouts},
            {"reopen_count", status.camera.reopen_count},
            {"width", status.camera.width},
            {"height", status.camera.height},
            {"fps", status.camera.fps},
            {"backend", status.camera.backend}};

        j["detector"] = {
            {"armed", status.detector.armed},
            {"background_ready", status.detector.background_ready},
            {"frames_processed", status.detector.frames_processed},
            {"disturbed_frames", status.detector.disturbed_frames},
            {"rebaselines", status.detector.rebaselines},
            {"impacts_reported", status.detector.impacts_reported},
            {"duplicates_absorbed", status.detector.duplicates_absorbed},
            {"active_candidates", status.detector.active_candidates},
            {"processing_time_ms", status.detector.processing_time_ms}};

        j["frames_dropped"] = status.frames_dropped;
        j["uptime_ms"] = status.uptime_ms;
        return j;
    }

    json commandToJson(const CommandResult &result)
    {
        json j;
        j["success"] = result.success;
        j["error"] = result.success ? json(nullptr) : json(errors::errorKindName(result.error));
        j["message"] = result.message;
        j["state"] = session_state::stateName(result.state);

        if (result.has_profile)
            j["profile"] = result.profile;
        if (result.has_session)
            j["session"] = sessionToJson(result.session);
        return j;
    }

    json eventToJson(const string &type, const string &session_id, const Impact *impact, const string &state, uint64_t timestamp)
    {
        json j;
        j["type"] = type;
        j["session_id"] = session_id;
        j["timestamp"] = timestamp;
        if (impact)
            j["impact"] = *impact;
        if (!state.empty())
            j["state"] = state;
        return j;
    }
}
