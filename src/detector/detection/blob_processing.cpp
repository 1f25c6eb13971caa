#include "blob_processing.hpp"
#include "utils.hpp"

#include <filesystem>

using namespace cv;
using namespace std;

namespace blob_processing
{
    vector<Blob> splitBlob(const Blob &blob, const BlobParams &params)
    {
        if (!params.split_overlapping || blob.mask.empty())
            return {blob};

        // Pad so the bounding box edge counts as background for the distance transform
        Mat padded;
        copyMakeBorder(blob.mask, padded, 1, 1, 1, 1, BORDER_CONSTANT, Scalar(0));

        Mat dist;
        distanceTransform(padded, dist, DIST_L2, DIST_MASK_PRECISE);

        double maxThickness = 0.0;
        minMaxLoc(dist, nullptr, &maxThickness);
        if (maxThickness <= 0.0)
            return {blob};

        // Local maxima of the thickness map
        int radius = max(1, (int)round(params.min_peak_separation_px));
        Mat dilated;
        dilate(dist, dilated, getStructuringElement(MORPH_RECT, Size(2 * radius + 1, 2 * radius + 1)));

        Mat peaks = (dist >= dilated) & (dist >= params.peak_ratio * maxThickness) & (dist > 0);

        Mat peakLabels, peakStats, peakCentroids;
        int peakCount = connectedComponentsWithStats(peaks, peakLabels, peakStats, peakCentroids, 8, CV_32S);
        if (peakCount <= 2)
            return {blob}; // background + one peak

        // Thickest peaks first, drop peaks too close to a kept one
        vector<pair<float, Point2d>> ranked;
        for (int i = 1; i < peakCount; i++)
        {
            Point2d c(peakCentroids.at<double>(i, 0), peakCentroids.at<double>(i, 1));
            Point sample(min(max((int)round(c.x), 0), dist.cols - 1), min(max((int)round(c.y), 0), dist.rows - 1));
            ranked.push_back({dist.at<float>(sample), c - Point2d(1, 1)}); // undo padding
        }
        sort(ranked.begin(), ranked.end(), [](const pair<float, Point2d> &a, const pair<float, Point2d> &b)
             { return a.first > b.first; });

        vector<Point2d> centers;
        for (const auto &peak : ranked)
        {
            bool tooClose = false;
            for (const auto &kept : centers)
            {
                if (math::distanceToPoint(peak.second, kept) < params.min_peak_separation_px)
                {
                    tooClose = true;
                    break;
                }
            }
            if (!tooClose)
                centers.push_back(peak.second);
        }

        if (centers.size() < 2)
            return {blob};

        // Assign every pixel to its nearest peak
        vector<Mat> partMasks(centers.size());
        for (auto &m : partMasks)
            m = Mat::zeros(blob.mask.size(), CV_8UC1);

        for (int y = 0; y < blob.mask.rows; y++)
        {
            const uchar *row = blob.mask.ptr<uchar>(y);
            for (int x = 0; x < blob.mask.cols; x++)
            {
                if (row[x] == 0)
                    continue;

                size_t nearest = 0;
                double best = numeric_limits<double>::max();
                for (size_t c = 0; c < centers.size(); c++)
                {
                    double d = (x - centers[c].x) * (x - centers[c].x) + (y - centers[c].y) * (y - centers[c].y);
                    if (d < best)
                    {
                        best = d;
                        nearest = c;
                    }
                }
                partMasks[nearest].at<uchar>(y, x) = 255;
            }
        }

        vector<Blob> parts;
        for (const auto &partMask : partMasks)
        {
            Moments m = moments(partMask, true);
            if (m.m00 < params.min_blob_area)
                continue;

            Blob part;
            part.area = m.m00;
            Point2d local = math::centroid(m);
            part.centroid = Point2d(blob.box.x + local.x, blob.box.y + local.y);
            part.box = blob.box;
            part.mask = partMask;
            part.source_label = blob.source_label;
            parts.push_back(part);
        }

        if (parts.size() < 2)
            return {blob};

        log_debug("Split overlapping blob at (" + to_string((int)blob.centroid.x) + ", " + to_string((int)blob.centroid.y) + ") into " + log_string(parts.size()) + " parts");
        return parts;
    }

    vector<Blob> processBlobs(const Mat &foreground, const Mat &target_mask, bool debug_mode, const BlobParams &params)
    {
        vector<Blob> blobs;

        if (foreground.empty())
            return blobs;

        Mat labels, stats, centroids;
        int count = connectedComponentsWithStats(foreground, labels, stats, centroids, params.connectivity, CV_32S);

        for (int i = 1; i < count; i++)
        {
            double area = stats.at<int>(i, CC_STAT_AREA);
            if (area < params.min_blob_area || area > params.max_blob_area)
                continue;

            Point2d c(centroids.at<double>(i, 0), centroids.at<double>(i, 1));
            Point sample((int)round(c.x), (int)round(c.y));

            // Reject anything whose center lies off the target face
            if (!target_mask.empty())
            {
                if (sample.x < 0 || sample.y < 0 || sample.x >= target_mask.cols || sample.y >= target_mask.rows ||
                    target_mask.at<uchar>(sample) == 0)
                    continue;
            }

            Blob blob;
            blob.centroid = c;
            blob.area = area;
            blob.box = Rect(stats.at<int>(i, CC_STAT_LEFT), stats.at<int>(i, CC_STAT_TOP),
                            stats.at<int>(i, CC_STAT_WIDTH), stats.at<int>(i, CC_STAT_HEIGHT));
            blob.mask = (labels(blob.box) == i);
            blob.source_label = i;

            vector<Blob> parts = splitBlob(blob, params);
            blobs.insert(blobs.end(), parts.begin(), parts.end());
        }

        if (debug_mode && !blobs.empty())
        {
            Mat debug_img;
            cvtColor(foreground, debug_img, COLOR_GRAY2BGR);
            for (const auto &blob : blobs)
            {
                rectangle(debug_img, blob.box, Scalar(0, 255, 0), 1);
                circle(debug_img, blob.centroid, 4, Scalar(0, 0, 255), -1);
                putText(debug_img, to_string((int)blob.area), blob.centroid + Point2d(8, 0),
                        FONT_HERSHEY_SIMPLEX, 0.5, Scalar(255, 255, 255), 1);
            }

            error_code ec;
            filesystem::create_directories("debug_frames/detection", ec);
            imwrite("debug_frames/detection/blobs.jpg", debug_img);
        }

        return blobs;
    }

} // namespace blob_processing
