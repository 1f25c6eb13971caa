#include "camera_frame_source.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

using namespace cv;
using namespace std;

CameraFrameSource::CameraFrameSource(const CameraParams &params)
    : params_(params)
{
    is_video_ = camera::isVideoFile(params_.device);
}

CameraFrameSource::~CameraFrameSource()
{
    close();
}

void CameraFrameSource::open(const Size &resolution, int frame_rate)
{
    params_.width = resolution.width;
    params_.height = resolution.height;
    params_.fps = frame_rate;

    if (cap_.isOpened())
    {
        log_warning("Camera " + params_.device + " already open, reopening with new settings");
        close();
    }

    openWithRetries();
}

bool CameraFrameSource::openDevice()
{
    if (is_video_)
    {
        log_debug("Detected video file: " + params_.device);
        cap_.open(params_.device);
    }
    else
    {
        if (camera::isDeviceIndex(params_.device))
            cap_.open(stoi(params_.device), CAP_V4L2);
        else
            cap_.open(params_.device, CAP_V4L2);

        if (cap_.isOpened())
        {
            if (params_.use_mjpeg)
            {
                int fourcc = VideoWriter::fourcc('M', 'J', 'P', 'G');
                cap_.set(CAP_PROP_FOURCC, fourcc);
            }
            cap_.set(CAP_PROP_FRAME_WIDTH, params_.width);
            cap_.set(CAP_PROP_FRAME_HEIGHT, params_.height);
            cap_.set(CAP_PROP_FPS, params_.fps);
            cap_.set(CAP_PROP_BUFFERSIZE, 1);
#if CV_VERSION_MAJOR > 4 || (CV_VERSION_MAJOR == 4 && CV_VERSION_MINOR >= 6)
            cap_.set(CAP_PROP_READ_TIMEOUT_MSEC, params_.read_timeout_ms);
#endif
        }
    }

    if (!cap_.isOpened())
    {
        log_error("Failed to open camera/video " + params_.device);
        return false;
    }

    // Verify camera properties after opening
    double actual_width = cap_.get(CAP_PROP_FRAME_WIDTH);
    double actual_height = cap_.get(CAP_PROP_FRAME_HEIGHT);
    double actual_fps = cap_.get(CAP_PROP_FPS);
    double fourcc = cap_.get(CAP_PROP_FOURCC);

    log_debug("Camera " + params_.device + " verification:");
    log_debug("  Resolution: " + log_string((int)actual_width) + "x" + log_string((int)actual_height) + " (expected: " + log_string(params_.width) + "x" + log_string(params_.height) + ")");
    log_debug("  FPS: " + log_string((int)actual_fps) + " (expected: " + log_string(params_.fps) + ")");
    log_debug("  FOURCC: " + log_string_src(camera::decodeFourCC((int)fourcc)));
    log_debug("  Backend: " + log_string_src(cap_.getBackendName()));

    {
        lock_guard<mutex> lock(stats_mutex_);
        stats_.width = (int)actual_width;
        stats_.height = (int)actual_height;
        stats_.fps = actual_fps;
        stats_.backend = cap_.getBackendName();
    }

    // Let auto exposure / white balance settle
    Mat discard;
    for (int i = 0; i < params_.warmup_frames && !is_video_; i++)
    {
        if (!cap_.read(discard))
            break;
    }

    consecutive_timeouts_ = 0;
    log_info("Camera " + params_.device + " opened at " + log_string((int)actual_width) + "x" + log_string((int)actual_height) + " @ " + log_string((int)actual_fps) + " FPS");
    return true;
}

void CameraFrameSource::openWithRetries()
{
    for (int attempt = 1; attempt <= params_.open_retries; attempt++)
    {
        if (openDevice())
            return;

        cap_.release();
        if (attempt < params_.open_retries)
        {
            log_warning("Open attempt " + log_string(attempt) + "/" + log_string(params_.open_retries) + " failed for " + params_.device + ", retrying");
            this_thread::sleep_for(chrono::milliseconds(params_.open_retry_delay_ms));
        }
    }

    throw camera::CameraError(ErrorKind::CAMERA_UNAVAILABLE,
                              "Camera " + params_.device + " unavailable after " + to_string(params_.open_retries) + " attempts");
}

void CameraFrameSource::reopen()
{
    log_warning("Reconfiguring camera " + params_.device + " after repeated stalls");
    cap_.release();
    {
        lock_guard<mutex> lock(stats_mutex_);
        stats_.reopen_count++;
    }
    openWithRetries();
}

void CameraFrameSource::handleStall(const string &reason)
{
    consecutive_timeouts_++;
    {
        lock_guard<mutex> lock(stats_mutex_);
        stats_.timeouts++;
    }

    if (consecutive_timeouts_ >= params_.timeouts_before_reopen)
    {
        // Throws CameraUnavailable when every attempt fails
        reopen();
    }

    throw camera::CameraError(ErrorKind::CAPTURE_TIMEOUT, reason);
}

Frame CameraFrameSource::nextFrame()
{
    if (!cap_.isOpened())
    {
        throw camera::CameraError(ErrorKind::CAMERA_UNAVAILABLE, "Camera " + params_.device + " is not open");
    }

    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(params_.read_timeout_ms);
    Mat image;

    while (true)
    {
        if (cap_.read(image) && !image.empty())
            break;

        if (is_video_ && params_.loop_video)
        {
            // End of file, start over
            cap_.set(CAP_PROP_POS_FRAMES, 0);
        }

        if (chrono::steady_clock::now() >= deadline)
        {
            handleStall("No frame from " + params_.device + " within " + to_string(params_.read_timeout_ms) + " ms");
        }

        this_thread::sleep_for(chrono::milliseconds(5));
    }

    // Files decode faster than real time, pace them to the configured rate
    if (is_video_ && params_.fps > 0)
    {
        this_thread::sleep_for(chrono::milliseconds(1000 / params_.fps));
    }

    consecutive_timeouts_ = 0;

    Frame frame;
    frame.image = camera::rotateFrame(image, params_.rotation);
    frame.sequence = next_sequence_++;
    frame.timestamp = timeutil::nowMs();

    {
        lock_guard<mutex> lock(stats_mutex_);
        stats_.frames_captured++;
    }

    return frame;
}

void CameraFrameSource::close()
{
    if (cap_.isOpened())
    {
        cap_.release();
        log_info("Camera " + params_.device + " released");
    }
}

bool CameraFrameSource::isOpen() const
{
    return cap_.isOpened();
}

camera::SourceStats CameraFrameSource::stats() const
{
    lock_guard<mutex> lock(stats_mutex_);
    return stats_;
}
