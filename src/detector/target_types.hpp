#pragma once

#include <opencv2/opencv.hpp>
#include <cmath>
#include <cstdint>
#include <string>

using namespace cv;
using namespace std;

// Supported target faces (World Archery 80 cm and 122 cm)
enum class TargetSize
{
    CM_80,
    CM_122
};

struct CalibrationProfile
{
    // CORE: mapping between pixels and the target face
    TargetSize target_size = TargetSize::CM_122;
    double diameter_cm = 122.0;      // Physical diameter of the face
    Point2d center_px{0.0, 0.0};     // Fitted target center (origin of target coordinates)
    double radius_px = 0.0;          // Mean semi-axis of the fitted outer boundary
    double pixels_per_cm = 0.0;      // radius_px / (diameter_cm / 2)
    uint64_t timestamp = 0;          // Capture time, ms since epoch

    // ELLIPSE: fitted outer boundary, kept for overlays and quality reporting
    Size2d axes_px{0.0, 0.0};        // Full ellipse axes (width, height)
    double angle_deg = 0.0;          // Ellipse rotation
    double axis_ratio = 1.0;         // minor / major, 1.0 = perfectly perpendicular view
    int frame_width = 0;             // Size of the calibration frame
    int frame_height = 0;
};

struct Impact
{
    int sequence = 0;                // 1, 2, 3 ... within a session
    Point2d pixel{-1.0, -1.0};       // Blob centroid in the frame
    double x_cm = 0.0;               // Right of center is positive
    double y_cm = 0.0;               // Below center is positive (image axis)
    double radius_cm = 0.0;          // Euclidean distance from the target center
    double angle_deg = 0.0;          // 0..360, clockwise from the +x axis (image axes)
    int score = 0;                   // Ring value 0..10 (0 = miss)
    bool x_ring = false;             // Inner ten
    uint64_t timestamp = 0;          // Detection time, ms since epoch
    double confidence = 0.0;         // hits / confirmation window
    double area_px = 0.0;            // Blob area at confirmation
};

namespace target_geometry
{
    inline double diameterCm(TargetSize size)
    {
        return size == TargetSize::CM_80 ? 80.0 : 122.0;
    }

    inline string targetSizeName(TargetSize size)
    {
        return size == TargetSize::CM_80 ? "80cm" : "122cm";
    }

    // Accepts "80cm", "80", "122cm", "122"
    inline bool parseTargetSize(const string &name, TargetSize &size)
    {
        if (name == "80cm" || name == "80")
        {
            size = TargetSize::CM_80;
            return true;
        }
        if (name == "122cm" || name == "122")
        {
            size = TargetSize::CM_122;
            return true;
        }
        return false;
    }

    // Scale must be usable for conversions; max_age_ms == 0 disables expiry
    inline bool isProfileValid(const CalibrationProfile &profile, uint64_t now_ms, uint64_t max_age_ms)
    {
        if (!(profile.pixels_per_cm > 0.0) || !std::isfinite(profile.pixels_per_cm))
            return false;
        if (max_age_ms > 0 && now_ms > profile.timestamp && now_ms - profile.timestamp > max_age_ms)
            return false;
        return true;
    }

    // Pixel position -> centimeters relative to the target center
    inline Point2d pixelToTarget(const CalibrationProfile &profile, const Point2d &pixel)
    {
        return Point2d((pixel.x - profile.center_px.x) / profile.pixels_per_cm,
                       (pixel.y - profile.center_px.y) / profile.pixels_per_cm);
    }

    // Centimeters relative to the target center -> pixel position
    inline Point2d targetToPixel(const CalibrationProfile &profile, const Point2d &target_cm)
    {
        return Point2d(profile.center_px.x + target_cm.x * profile.pixels_per_cm,
                       profile.center_px.y + target_cm.y * profile.pixels_per_cm);
    }

    inline double radialDistance(const Point2d &target_cm)
    {
        return std::sqrt(target_cm.x * target_cm.x + target_cm.y * target_cm.y);
    }

    inline double angleDegrees(const Point2d &target_cm)
    {
        double angle = std::atan2(target_cm.y, target_cm.x) * 180.0 / CV_PI;
        return angle < 0.0 ? angle + 360.0 : angle;
    }

    // Ten scoring zones of equal width (diameter / 20), inner ten is the X ring
    inline int ringScore(TargetSize size, double radius_cm)
    {
        double ring_width = diameterCm(size) / 20.0;
        if (radius_cm < 0.0 || radius_cm > diameterCm(size) / 2.0)
            return 0;

        int zone = static_cast<int>(std::ceil(radius_cm / ring_width));
        return std::max(1, std::min(10, 11 - std::max(zone, 1)));
    }

    inline bool isXRing(TargetSize size, double radius_cm)
    {
        return radius_cm <= diameterCm(size) / 40.0;
    }

} // namespace target_geometry
