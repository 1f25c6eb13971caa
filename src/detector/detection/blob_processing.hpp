#pragma once

#include <opencv2/opencv.hpp>
#include <vector>

using namespace cv;
using namespace std;

namespace blob_processing
{
    // Parameters for blob segmentation
    struct BlobParams
    {
        double min_blob_area = 80.0;      // Smaller components are sensor noise
        double max_blob_area = 50000.0;   // Larger components are not a single arrow
        int connectivity = 8;

        // Overlapping arrows: one blob per distance-transform peak
        bool split_overlapping = true;
        double min_peak_separation_px = 12.0; // Closer peaks are treated as one arrow
        double peak_ratio = 0.6;              // Peak must reach this fraction of the component's max thickness
    };

    // One foreground blob in frame coordinates
    struct Blob
    {
        Point2d centroid{-1, -1};
        double area = 0.0;
        Rect box;          // Bounding box in the frame
        Mat mask;          // CV_8U mask of box size, 255 = blob pixel
        int source_label = 0; // Connected component it came from (shared by split parts)
    };

    // Connected components of the foreground, filtered and split
    vector<Blob> processBlobs(
        const Mat &foreground,
        const Mat &target_mask,
        bool debug_mode = false,
        const BlobParams &params = BlobParams());

    // Split one component mask into parts around its thickness peaks, returns the input when there is a single peak
    vector<Blob> splitBlob(const Blob &blob, const BlobParams &params = BlobParams());

} // namespace blob_processing
