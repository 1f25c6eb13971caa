#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "detector/target_types.hpp"

namespace visualization
{
    // Ring colors from the outside in (white, black, blue, red, gold), BGR
    static const cv::Scalar ringColors[5] = {
        cv::Scalar(255, 255, 255),
        cv::Scalar(60, 60, 60),
        cv::Scalar(255, 140, 0),
        cv::Scalar(0, 0, 230),
        cv::Scalar(0, 215, 255)};

    // Outer boundary, the ten scoring rings and the center mark
    inline void drawTargetOverlay(cv::Mat &frame, const CalibrationProfile &profile)
    {
        if (frame.empty() || profile.radius_px <= 0)
        {
            return;
        }

        cv::Point2f center(static_cast<float>(profile.center_px.x), static_cast<float>(profile.center_px.y));

        // Fitted boundary as seen by the camera
        cv::RotatedRect outer(center, cv::Size2f(profile.axes_px), static_cast<float>(profile.angle_deg));
        cv::ellipse(frame, outer, cv::Scalar(0, 255, 0), 2);

        // Scoring rings scaled from the fitted boundary
        for (int ring = 1; ring < 10; ring++)
        {
            float scale = (10 - ring) / 10.0f;
            cv::Size2f axes(outer.size.width * scale, outer.size.height * scale);
            cv::ellipse(frame, cv::RotatedRect(center, axes, outer.angle), ringColors[ring / 2], 1);
        }

        cv::circle(frame, center, 3, cv::Scalar(0, 0, 0), -1);
        cv::circle(frame, center, 5, cv::Scalar(0, 255, 255), 2);

        cv::putText(frame, target_geometry::targetSizeName(profile.target_size) + "  " +
                               std::to_string(profile.pixels_per_cm).substr(0, 5) + " px/cm",
                    cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(0, 255, 0), 2);
    }

    // Impact markers with their sequence numbers, newest highlighted
    inline void drawImpacts(cv::Mat &frame, const std::vector<Impact> &impacts, double scale = 1.0)
    {
        for (size_t i = 0; i < impacts.size(); i++)
        {
            const Impact &impact = impacts[i];
            cv::Point pos(static_cast<int>(impact.pixel.x * scale), static_cast<int>(impact.pixel.y * scale));
            bool newest = (i + 1 == impacts.size());

            cv::circle(frame, pos, 6, cv::Scalar(0, 0, 255), -1);
            if (newest)
                cv::circle(frame, pos, 12, cv::Scalar(255, 0, 255), 2);

            cv::putText(frame, std::to_string(impact.sequence), pos + cv::Point(10, 0),
                        cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 0, 255), 2);
        }
    }

} // namespace visualization
