#pragma once

#include <opencv2/opencv.hpp>
#include <mutex>
#include <string>
#include "frame_source.hpp"

using namespace cv;
using namespace std;

struct CameraParams
{
    string device = "/dev/video0"; // V4L2 device, camera index or video file
    int width = 1920;              // Requested capture width
    int height = 1080;             // Requested capture height
    int fps = 10;                  // Requested frame rate
    int rotation = 0;              // 0, 90, 180 or 270 degrees clockwise
    bool use_mjpeg = true;         // Ask the driver for MJPEG (less USB bandwidth)

    // Stall handling
    int read_timeout_ms = 2000;       // nextFrame() gives up after this long
    int timeouts_before_reopen = 3;   // Consecutive timeouts before the device is reopened
    int open_retries = 3;             // Attempts per (re)open before CameraUnavailable
    int open_retry_delay_ms = 1000;   // Pause between open attempts
    int warmup_frames = 5;            // Frames discarded after open (auto exposure settling)

    // Replay
    bool loop_video = true;           // Rewind video files at the end instead of stalling
};

// V4L2 camera (or video file replay) behind the FrameSource interface.
// The device is held from open() until close() or destruction.
class CameraFrameSource : public FrameSource
{
public:
    explicit CameraFrameSource(const CameraParams &params);
    ~CameraFrameSource() override;

    CameraFrameSource(const CameraFrameSource &) = delete;
    CameraFrameSource &operator=(const CameraFrameSource &) = delete;

    void open(const Size &resolution, int frame_rate) override;
    Frame nextFrame() override;
    void close() override;
    bool isOpen() const override;
    camera::SourceStats stats() const override;

private:
    bool openDevice();
    void openWithRetries();
    void reopen();
    void handleStall(const string &reason);

    CameraParams params_;
    VideoCapture cap_;
    bool is_video_ = false;
    int consecutive_timeouts_ = 0;
    uint64_t next_sequence_ = 0;

    mutable mutex stats_mutex_;
    camera::SourceStats stats_;
};
