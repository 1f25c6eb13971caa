#pragma once

#include <opencv2/opencv.hpp>
#include <mutex>
#include <vector>
#include "detector_interface.hpp"
#include "detection/foreground_processing.hpp"
#include "detection/blob_processing.hpp"
#include "detection/candidate_tracking.hpp"

using namespace cv;
using namespace std;

struct DetectionParams
{
    foreground_processing::ForegroundParams foreground;
    blob_processing::BlobParams blobs;
    candidate_tracking::TrackingParams tracking;

    int background_frames = 5;         // Frames averaged into the initial background
    double background_alpha = 0.05;    // Running average weight for non-foreground pixels
    int rebaseline_frames = 15;        // Consecutive disturbed frames before the background is rebuilt
    double duplicate_distance_cm = 1.0; // Confirmed blob this close to a reported impact is the same arrow
    int absorb_margin_px = 3;          // Dilation of a confirmed blob when copying it into the background
};

// Background differencing + temporal confirmation against a calibrated target
class ImpactDetector : public DetectorInterface
{
public:
    ImpactDetector(bool debug_mode, const DetectionParams &params = DetectionParams());
    virtual ~ImpactDetector() = default;

    virtual void arm(const CalibrationProfile &profile) override;
    virtual void disarm() override;
    virtual bool isArmed() const override { return armed; }
    virtual vector<Impact> feed(const Frame &frame) override;
    virtual void invalidateBackground() override;
    virtual DetectorStats stats() const override;

protected:
    void resetBackground();
    void absorbIntoBackground(const Mat &gray, const blob_processing::Blob &blob);
    Impact createImpact(const candidate_tracking::ConfirmedCandidate &confirmed, uint64_t timestamp);
    bool isDuplicate(const Point2d &target_cm) const;

    bool armed;
    bool debug_mode;
    DetectionParams params;
    CalibrationProfile profile;

    Mat target_mask;
    Mat background;       // CV_32F running average
    Mat background_sum;   // Warmup accumulator
    int background_count; // Warmup frames collected
    int disturbed_run;    // Consecutive disturbed frames

    candidate_tracking::CandidateTracker tracker;
    vector<Point2d> reported; // Target coordinates of impacts reported since arm()
    int next_sequence;

    mutable mutex stats_mutex;
    DetectorStats detector_stats;
};
