#pragma once

#include <string>

// Error kinds shared by the capture layer, the calibrator and the session commands
enum class ErrorKind
{
    NONE,
    CAPTURE_TIMEOUT,    // No frame within the read/calibration timeout
    CAMERA_UNAVAILABLE, // Camera could not be (re)opened, needs operator action
    NO_TARGET_FOUND,    // No contour passed the target shape filter
    AMBIGUOUS_TARGET,   // More than one equally strong target candidate
    POOR_GEOMETRY,      // Target seen too far from perpendicular
    NOT_CALIBRATED,     // Detection requested without a valid profile
    DETECTION_FAULT,    // Detector failed mid-session
    INVALID_STATE,      // Command not legal in the current state
    SHUTTING_DOWN       // Command received after shutdown
};

namespace errors
{
    inline std::string errorKindName(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::NONE:
            return "None";
        case ErrorKind::CAPTURE_TIMEOUT:
            return "CaptureTimeout";
        case ErrorKind::CAMERA_UNAVAILABLE:
            return "CameraUnavailable";
        case ErrorKind::NO_TARGET_FOUND:
            return "NoTargetFound";
        case ErrorKind::AMBIGUOUS_TARGET:
            return "AmbiguousTarget";
        case ErrorKind::POOR_GEOMETRY:
            return "PoorGeometry";
        case ErrorKind::NOT_CALIBRATED:
            return "NotCalibrated";
        case ErrorKind::DETECTION_FAULT:
            return "DetectionFault";
        case ErrorKind::INVALID_STATE:
            return "InvalidState";
        case ErrorKind::SHUTTING_DOWN:
            return "ShuttingDown";
        default:
            return "Unknown";
        }
    }

    inline ErrorKind errorKindFromName(const std::string &name)
    {
        for (int i = static_cast<int>(ErrorKind::NONE); i <= static_cast<int>(ErrorKind::SHUTTING_DOWN); i++)
        {
            ErrorKind kind = static_cast<ErrorKind>(i);
            if (errorKindName(kind) == name)
                return kind;
        }
        return ErrorKind::NONE;
    }

    // Calibration-local failures can be retried in place
    inline bool isCalibrationFailure(ErrorKind kind)
    {
        return kind == ErrorKind::NO_TARGET_FOUND ||
               kind == ErrorKind::AMBIGUOUS_TARGET ||
               kind == ErrorKind::POOR_GEOMETRY;
    }

} // namespace errors
