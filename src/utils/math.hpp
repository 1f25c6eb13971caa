#pragma once

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

using namespace std;
using namespace cv;

namespace math
{
    // Calculates Euclidean distance between two points
    inline double distanceToPoint(const Point2d &p1, const Point2d &p2)
    {
        return std::sqrt(std::pow(p1.x - p2.x, 2) + std::pow(p1.y - p2.y, 2));
    }

    // 4*pi*A / P^2, 1.0 for a perfect circle
    inline double circularity(const vector<Point> &contour)
    {
        double perimeter = arcLength(contour, true);
        if (perimeter <= 0.0)
            return 0.0;
        return 4.0 * CV_PI * contourArea(contour) / (perimeter * perimeter);
    }

    // minor / major axis of a fitted ellipse, 1.0 for a circle
    inline double axisRatio(const RotatedRect &ellipse)
    {
        double major = std::max(ellipse.size.width, ellipse.size.height);
        double minor = std::min(ellipse.size.width, ellipse.size.height);
        if (major <= 0.0)
            return 0.0;
        return minor / major;
    }

    // Viewing angle that turns a circle into an ellipse with this axis ratio
    inline double tiltDegreesFromAxisRatio(double axis_ratio)
    {
        double clamped = std::max(0.0, std::min(1.0, axis_ratio));
        return std::acos(clamped) * 180.0 / CV_PI;
    }

    // Centroid from image moments, (-1,-1) when the area is zero
    inline Point2d centroid(const Moments &m)
    {
        if (m.m00 == 0)
            return Point2d(-1, -1);
        return Point2d(m.m10 / m.m00, m.m01 / m.m00);
    }
}
