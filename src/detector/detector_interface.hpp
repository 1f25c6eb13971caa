#pragma once
#include <cstdint>
#include <vector>
#include <opencv2/opencv.hpp>

#include "camera/frame_source.hpp"
#include "detector/target_types.hpp"

using namespace cv;
using namespace std;

// Counters for status reporting
struct DetectorStats
{
    bool armed = false;
    bool background_ready = false;
    uint64_t frames_processed = 0;
    uint64_t disturbed_frames = 0;
    uint64_t rebaselines = 0;
    uint64_t impacts_reported = 0;
    uint64_t duplicates_absorbed = 0;
    int active_candidates = 0;
    int processing_time_ms = 0; // Last frame
};

// Abstract interface for any impact detection method
class DetectorInterface
{
public:
    virtual ~DetectorInterface() = default;

    // Start detecting against this profile, sequence numbers restart at 1
    virtual void arm(const CalibrationProfile &profile) = 0;

    // Stop detecting and drop all background/candidate state
    virtual void disarm() = 0;

    virtual bool isArmed() const = 0;

    // Process one frame and return the impacts it confirmed (usually none).
    // Throws std::runtime_error when the frame cannot be processed.
    virtual vector<Impact> feed(const Frame &frame) = 0;

    // Rebuild the background from the next frames (after recalibration)
    virtual void invalidateBackground() = 0;

    virtual DetectorStats stats() const = 0;
};
