#pragma once

#include <opencv2/opencv.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include "utils/errors.hpp"

// One captured image, never modified after capture
struct Frame
{
    cv::Mat image;          // BGR, 8-bit
    uint64_t sequence = 0;  // Capture index since open()
    uint64_t timestamp = 0; // Capture time, ms since epoch

    bool empty() const { return image.empty(); }
};

namespace camera
{
    // Raised by frame sources; kind is CAPTURE_TIMEOUT or CAMERA_UNAVAILABLE
    class CameraError : public std::runtime_error
    {
    public:
        CameraError(ErrorKind kind, const std::string &message)
            : std::runtime_error(message), kind_(kind) {}

        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    struct SourceStats
    {
        uint64_t frames_captured = 0;
        uint64_t timeouts = 0;
        uint64_t reopen_count = 0;
        int width = 0;
        int height = 0;
        double fps = 0.0;
        std::string backend;
    };
} // namespace camera

// Abstract interface for anything that delivers frames (camera, video file, test script)
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    // Acquire the device; throws camera::CameraError(CAMERA_UNAVAILABLE)
    virtual void open(const cv::Size &resolution, int frame_rate) = 0;

    // Blocks until the next frame; throws camera::CameraError on timeout or fatal failure
    virtual Frame nextFrame() = 0;

    // Release the device; safe to call more than once
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    virtual camera::SourceStats stats() const = 0;
};
