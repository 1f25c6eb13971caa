#pragma once

#include <opencv2/opencv.hpp>
#include <vector>

namespace contour_processing
{

    // Parameters for target contour detection
    struct ContourParams
    {
        // Preprocessing
        int blurKernelSize = 5; // Gaussian blur before binarisation (odd)

        // Shape filter - guards against locking onto the wrong object
        double minAreaFraction = 0.02; // Candidate area / frame area, lower bound
        double maxAreaFraction = 0.95; // Candidate area / frame area, upper bound
        double minAspectRatio = 0.4;   // Bounding box width / height, lower bound
        double maxAspectRatio = 2.5;   // Bounding box width / height, upper bound
        double minCircularity = 0.6;   // 4*pi*A/P^2, rejects squares and ragged blobs
        int borderMargin = 2;          // Contours this close to the frame edge are background

        // Nesting: ring contours inside a bigger candidate belong to the same face
        double nestingTolerance = 1.05; // dist(centers) + r_inner <= r_outer * tolerance

        // Debug visualization parameters
        cv::Scalar candidateColor = cv::Scalar(0, 255, 255); // Yellow
        cv::Scalar rejectedColor = cv::Scalar(0, 0, 255);    // Red
        int contourThickness = 2;
    };

    // One contour that passed the shape filter
    struct TargetCandidate
    {
        std::vector<cv::Point> contour;
        double area = 0.0;
        double circularity = 0.0;
        double aspectRatio = 0.0;
        cv::Point2f enclosingCenter{0, 0};
        float enclosingRadius = 0.0f;
        bool darkOnLight = false; // Found in the inverted binarisation
        double strength = 0.0;    // area * circularity, used for ranking
    };

    // Main function - frame in, ranked (strongest first) non-nested candidates out
    std::vector<TargetCandidate> processContours(
        const cv::Mat &frame,
        bool debug_mode = false,
        const ContourParams &params = ContourParams());

} // namespace contour_processing
