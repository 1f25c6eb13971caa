#include "foreground_processing.hpp"
#include "utils.hpp"

#include <filesystem>

using namespace cv;
using namespace std;

namespace foreground_processing
{
    Mat preprocessFrame(const Mat &frame, const ForegroundParams &params)
    {
        Mat gray;
        if (frame.channels() == 3)
            cvtColor(frame, gray, COLOR_BGR2GRAY);
        else
            gray = frame;

        Mat gray32;
        gray.convertTo(gray32, CV_32F);

        int k = params.blur_kernel_size | 1;
        GaussianBlur(gray32, gray32, Size(k, k), 0);
        return gray32;
    }

    Mat createTargetMask(const Size &frame_size, const CalibrationProfile &profile, double margin)
    {
        Mat mask = Mat::zeros(frame_size, CV_8UC1);

        Point2f center(static_cast<float>(profile.center_px.x), static_cast<float>(profile.center_px.y));
        Size2f axes(static_cast<float>(profile.axes_px.width * margin), static_cast<float>(profile.axes_px.height * margin));

        // Profiles without a fitted ellipse fall back to the mean radius
        if (axes.width <= 0 || axes.height <= 0)
        {
            float diameter = static_cast<float>(profile.radius_px * 2.0 * margin);
            axes = Size2f(diameter, diameter);
        }

        ellipse(mask, RotatedRect(center, axes, static_cast<float>(profile.angle_deg)), Scalar(255), -1);
        return mask;
    }

    ForegroundResult processForeground(const Mat &gray, const Mat &background, const Mat &target_mask, bool debug_mode, const ForegroundParams &params)
    {
        ForegroundResult result;

        if (gray.empty() || background.empty() || gray.size() != background.size())
        {
            log_warning("Foreground processing skipped: frame and background do not match");
            result.mask = Mat::zeros(gray.size(), CV_8UC1);
            return result;
        }

        // Calculate absolute difference
        Mat diff;
        absdiff(gray, background, diff);

        // Apply threshold
        Mat thresh32, thresh;
        threshold(diff, thresh32, params.diff_threshold, 255, THRESH_BINARY);
        thresh32.convertTo(thresh, CV_8U);

        // Apply morphological operations to reduce noise
        Mat kernel = getStructuringElement(params.morph_type, Size(params.morph_kernel_size, params.morph_kernel_size));
        morphologyEx(thresh, thresh, MORPH_OPEN, kernel, Point(-1, -1), params.morph_iterations);
        morphologyEx(thresh, thresh, MORPH_CLOSE, kernel, Point(-1, -1), params.morph_iterations);

        // Only the target face is of interest
        if (!target_mask.empty())
        {
            bitwise_and(thresh, target_mask, thresh);
            result.target_pixels = countNonZero(target_mask);
        }
        else
        {
            result.target_pixels = thresh.rows * thresh.cols;
        }

        result.changed_pixels = countNonZero(thresh);
        result.change_ratio = result.target_pixels > 0 ? (double)result.changed_pixels / result.target_pixels : 0.0;
        result.disturbed = result.change_ratio > params.max_change_ratio;
        result.mask = thresh;

        if (debug_mode)
        {
            error_code ec;
            filesystem::create_directories("debug_frames/detection", ec);
            Mat diff8;
            diff.convertTo(diff8, CV_8U);
            imwrite("debug_frames/detection/diff.jpg", diff8);
            imwrite("debug_frames/detection/foreground.jpg", thresh);
        }

        return result;
    }

} // namespace foreground_processing
