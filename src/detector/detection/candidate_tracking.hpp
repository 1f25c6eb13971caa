#pragma once

#include <opencv2/opencv.hpp>
#include <vector>
#include "blob_processing.hpp"

using namespace cv;
using namespace std;

namespace candidate_tracking
{
    // Temporal confirmation parameters
    struct TrackingParams
    {
        double match_distance_px = 15.0;  // Blob within this distance continues a candidate
        double stable_tolerance_px = 4.0; // Movement above this restarts the window (arrow still vibrating)
        int confirmation_window = 5;      // Frames a candidate must exist before it can be confirmed
        int min_confirmed_frames = 4;     // Hits needed inside the window
        int max_missed_frames = 1;        // Consecutive misses before a candidate is dropped
    };

    // A blob seen in consecutive frames that may become an impact
    struct Candidate
    {
        int id = 0;
        Point2d anchor{-1, -1};   // Position when the current window started
        blob_processing::Blob blob; // Latest matching blob
        int age = 0;              // Frames since the window started
        int hits = 0;             // Frames with a matching blob
        int misses = 0;           // Consecutive frames without one
        bool matched = false;     // Matched in the latest update
    };

    struct ConfirmedCandidate
    {
        blob_processing::Blob blob;
        double confidence = 0.0; // hits / confirmation_window, capped at 1
        int frames_tracked = 0;  // Frames since the window started
    };

    class CandidateTracker
    {
    public:
        explicit CandidateTracker(const TrackingParams &params = TrackingParams());

        // Advance all candidates by one frame, returns the ones confirmed by it
        vector<ConfirmedCandidate> update(const vector<blob_processing::Blob> &blobs);

        void clear();

        const vector<Candidate> &candidates() const { return candidates_; }

    private:
        TrackingParams params_;
        vector<Candidate> candidates_;
        int next_id_ = 1;
    };

} // namespace candidate_tracking
