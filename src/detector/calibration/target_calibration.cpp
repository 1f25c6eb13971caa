#include <cmath>
#include <filesystem>

#include "utils.hpp"
#include "utils/visualization.hpp"
#include "target_calibration.hpp"

using namespace cv;
using namespace std;

namespace target_calibration
{
    static CalibrationResult failure(ErrorKind kind, const string &message, int candidates)
    {
        CalibrationResult result;
        result.success = false;
        result.error = kind;
        result.message = message;
        result.candidates_found = candidates;
        log_warning("Calibration failed (" + errors::errorKindName(kind) + "): " + message);
        return result;
    }

    CalibrationResult calibrate(const Frame &frame, TargetSize target_size, bool debug_mode, const CalibrationParams &params)
    {
        log_info("Calibrating for " + target_geometry::targetSizeName(target_size) + " target");

        if (frame.empty())
        {
            return failure(ErrorKind::NO_TARGET_FOUND, "Empty calibration frame", 0);
        }

        // [===STEP 1:===] Candidate contours for the outer boundary of the face
        vector<contour_processing::TargetCandidate> candidates =
            contour_processing::processContours(frame.image, debug_mode, params.contour);

        int found = static_cast<int>(candidates.size());
        if (candidates.empty())
        {
            return failure(ErrorKind::NO_TARGET_FOUND, "No target detected. Ensure the target is visible and well lit.", 0);
        }

        // [===STEP 2:===] A runner-up of similar strength means we cannot tell which one is the target
        if (candidates.size() > 1 &&
            candidates[1].strength >= candidates[0].strength * params.ambiguityRatio)
        {
            return failure(ErrorKind::AMBIGUOUS_TARGET,
                           "Found " + to_string(found) + " similar target candidates, remove other round objects from view",
                           found);
        }

        // [===STEP 3:===] Ellipse fit of the strongest candidate
        const auto &best = candidates[0];
        ellipse_processing::EllipseFit fit = ellipse_processing::processEllipse(best.contour, params.ellipse);

        if (!fit.valid)
        {
            return failure(ErrorKind::NO_TARGET_FOUND, "Target boundary is not elliptical enough for a reliable fit", found);
        }

        // [===STEP 4:===] Perpendicularity check
        if (!fit.perpendicular)
        {
            return failure(ErrorKind::POOR_GEOMETRY,
                           "Camera is " + to_string((int)round(fit.tiltDegrees)) + " deg off perpendicular (max " +
                               to_string((int)params.ellipse.maxTiltDegrees) + " deg)",
                           found);
        }

        // [===STEP 5:===] Scale and origin
        CalibrationProfile profile;
        profile.target_size = target_size;
        profile.diameter_cm = target_geometry::diameterCm(target_size);
        profile.center_px = Point2d(fit.ellipse.center.x, fit.ellipse.center.y);
        profile.radius_px = fit.meanRadius;
        profile.pixels_per_cm = fit.meanRadius / (profile.diameter_cm / 2.0);
        profile.axes_px = Size2d(fit.ellipse.size.width, fit.ellipse.size.height);
        profile.angle_deg = fit.ellipse.angle;
        profile.axis_ratio = fit.axisRatio;
        profile.frame_width = frame.image.cols;
        profile.frame_height = frame.image.rows;
        profile.timestamp = frame.timestamp != 0 ? frame.timestamp : timeutil::nowMs();

        if (!target_geometry::isProfileValid(profile, profile.timestamp, 0))
        {
            return failure(ErrorKind::NO_TARGET_FOUND, "Degenerate scale factor", found);
        }

        if (debug_mode)
        {
            Mat overlay = frame.image.clone();
            visualization::drawTargetOverlay(overlay, profile);
            error_code ec;
            filesystem::create_directories("debug_frames/calibration", ec);
            imwrite("debug_frames/calibration/calibration_result.jpg", overlay);
        }

        log_info("Calibration successful: center=(" + to_string((int)profile.center_px.x) + ", " + to_string((int)profile.center_px.y) +
                 "), radius=" + to_string((int)profile.radius_px) + "px, scale=" + to_string(profile.pixels_per_cm) + "px/cm, " +
                 (best.darkOnLight ? "dark face on light background" : "light face on dark background"));

        CalibrationResult result;
        result.success = true;
        result.message = "Calibration successful";
        result.profile = profile;
        result.candidates_found = found;
        result.dark_face = best.darkOnLight;
        return result;
    }

} // namespace target_calibration
