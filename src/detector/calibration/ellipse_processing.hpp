#pragma once

#include <opencv2/opencv.hpp>
#include <vector>

namespace ellipse_processing
{
    struct EllipseParams
    {
        int minContourPoints = 20;      // Fewer boundary points cannot give a stable fit
        double maxTiltDegrees = 15.0;   // Camera must be within this angle of perpendicular
        double maxFitResidual = 0.08;   // Mean |r/r_ellipse - 1| over the boundary points
    };

    // Outer boundary of the target face
    struct EllipseFit
    {
        cv::RotatedRect ellipse;  // Full axes, as returned by fitEllipse
        double axisRatio = 0.0;   // minor / major
        double tiltDegrees = 90.0;
        double meanRadius = 0.0;  // (major + minor) / 4
        double fitResidual = 1.0; // How well the contour follows the ellipse
        bool valid = false;       // Enough points and a sane residual
        bool perpendicular = false;
    };

    // Fit an ellipse to the target boundary and judge the viewing geometry
    EllipseFit processEllipse(
        const std::vector<cv::Point> &contour,
        const EllipseParams &params = EllipseParams());

} // namespace ellipse_processing
