#pragma once

#include <opencv2/opencv.hpp>
#include "detector/target_types.hpp"

using namespace cv;
using namespace std;

namespace foreground_processing
{
    // Foreground extraction parameters
    struct ForegroundParams
    {
        int blur_kernel_size = 5;        // Gaussian blur against sensor noise (odd)
        double diff_threshold = 25.0;    // Gray level difference that counts as change
        int morph_type = MORPH_ELLIPSE;  // Kernel shape for open/close
        int morph_kernel_size = 3;       // Size of morphological kernel
        int morph_iterations = 1;        // Open removes speckle, close fills gaps
        double target_margin = 1.05;     // Search region = fitted boundary scaled by this
        double max_change_ratio = 0.25;  // More changed target pixels than this = disturbed frame
    };

    struct ForegroundResult
    {
        Mat mask;                 // CV_8U, 255 = foreground inside the target region
        int changed_pixels = 0;   // Foreground pixels after filtering
        int target_pixels = 0;    // Pixels in the target region
        double change_ratio = 0.0;
        bool disturbed = false;   // Archer in front of the target, light switched, ...
    };

    // BGR frame -> blurred CV_32F grayscale
    Mat preprocessFrame(const Mat &frame, const ForegroundParams &params = ForegroundParams());

    // Filled ellipse covering the calibrated face plus margin
    Mat createTargetMask(const Size &frame_size, const CalibrationProfile &profile, double margin);

    // Difference against the background, thresholded and cleaned up
    ForegroundResult processForeground(
        const Mat &gray,
        const Mat &background,
        const Mat &target_mask,
        bool debug_mode = false,
        const ForegroundParams &params = ForegroundParams());

} // namespace foreground_processing
