#pragma once

#include <opencv2/opencv.hpp>
#include <string>

#include "camera/frame_source.hpp"
#include "detector/target_types.hpp"
#include "contour_processing.hpp"
#include "ellipse_processing.hpp"
#include "utils/errors.hpp"

using namespace std;
using namespace cv;

struct CalibrationParams
{
    contour_processing::ContourParams contour;
    ellipse_processing::EllipseParams ellipse;

    double ambiguityRatio = 0.85;     // Runner-up this close to the best candidate = ambiguous
    int calibrationFrames = 5;        // Frames averaged into the calibration image
    int calibrationTimeoutMs = 10000; // Give up waiting for frames after this long
    int maxProfileAgeS = 12 * 3600;   // Profile expiry, 0 = never expires
};

// Result of one calibration run
struct CalibrationResult
{
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    string message = "";
    CalibrationProfile profile;
    int candidates_found = 0;
    bool dark_face = false; // Face darker than its surroundings

    // Easy boolean check
    operator bool() const { return success; }
};

namespace target_calibration
{
    // Locate the target face in an empty-target frame and build the pixel <-> cm mapping
    CalibrationResult calibrate(
        const Frame &frame,
        TargetSize target_size,
        bool debug_mode = false,
        const CalibrationParams &params = CalibrationParams());
}
