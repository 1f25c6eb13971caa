/**
 * @file test_helpers.hpp
 * @brief Synthetic frames, a scripted frame source and temporary directories for the tests.
 */

#pragma once

#include <opencv2/opencv.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>

#include "camera/frame_source.hpp"
#include "detector/target_types.hpp"
#include "utils/time.hpp"

namespace test_helpers
{
    const cv::Size kFrameSize(1280, 720);
    const cv::Point kCenter(640, 360);
    const int kTargetRadius = 300;
    const cv::Scalar kPaper(235, 235, 235);
    const cv::Scalar kFace(40, 40, 40);
    const cv::Scalar kArrow(255, 255, 255);

    inline cv::Mat blankFrame()
    {
        return cv::Mat(kFrameSize, CV_8UC3, kPaper);
    }

    // Light wall with a dark filled target face
    inline cv::Mat targetFrame(int radius = kTargetRadius, cv::Point center = kCenter)
    {
        cv::Mat frame = blankFrame();
        cv::circle(frame, center, radius, kFace, cv::FILLED, cv::LINE_8);
        return frame;
    }

    // Copy of frame with a bright disc where an arrow went in
    inline cv::Mat withArrow(const cv::Mat &frame, cv::Point position, int radius = 10, cv::Scalar color = kArrow)
    {
        cv::Mat copy = frame.clone();
        cv::circle(copy, position, radius, color, cv::FILLED, cv::LINE_8);
        return copy;
    }

    inline Frame makeFrame(const cv::Mat &image, uint64_t sequence = 0)
    {
        Frame frame;
        frame.image = image;
        frame.sequence = sequence;
        frame.timestamp = timeutil::nowMs();
        return frame;
    }

    // Profile matching targetFrame() on a 122 cm face
    inline CalibrationProfile syntheticProfile(TargetSize size = TargetSize::CM_122)
    {
        CalibrationProfile profile;
        profile.target_size = size;
        profile.diameter_cm = target_geometry::diameterCm(size);
        profile.center_px = cv::Point2d(kCenter.x, kCenter.y);
        profile.radius_px = kTargetRadius;
        profile.pixels_per_cm = kTargetRadius / (profile.diameter_cm / 2.0);
        profile.axes_px = cv::Size2d(2.0 * kTargetRadius, 2.0 * kTargetRadius);
        profile.angle_deg = 0.0;
        profile.axis_ratio = 1.0;
        profile.frame_width = kFrameSize.width;
        profile.frame_height = kFrameSize.height;
        profile.timestamp = timeutil::nowMs();
        return profile;
    }

    // Poll until the condition holds or the timeout expires
    inline bool waitFor(const std::function<bool()> &condition, int timeout_ms = 5000)
    {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (condition())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return condition();
    }

    // Shared between the test and a ScriptedFrameSource owned by the code under test
    struct SourceScript
    {
        std::mutex mutex;
        cv::Mat image = targetFrame();
        std::atomic<int> opens{0};
        std::atomic<int> releases{0}; // close() calls that actually released an open device
        std::atomic<int> frames{0};
        std::atomic<bool> fail_open{false};
        std::atomic<bool> fail_read{false};
        int frame_interval_ms = 5;

        void setImage(const cv::Mat &next)
        {
            std::lock_guard<std::mutex> lock(mutex);
            image = next;
        }
    };

    // FrameSource that plays whatever image the script currently holds
    class ScriptedFrameSource : public FrameSource
    {
    public:
        explicit ScriptedFrameSource(std::shared_ptr<SourceScript> script) : script_(std::move(script)) {}
        ~ScriptedFrameSource() override { close(); }

        void open(const cv::Size &, int) override
        {
            if (script_->fail_open)
                throw camera::CameraError(ErrorKind::CAMERA_UNAVAILABLE, "scripted open failure");
            open_ = true;
            script_->opens++;
        }

        Frame nextFrame() override
        {
            if (!open_)
                throw camera::CameraError(ErrorKind::CAMERA_UNAVAILABLE, "not open");

            std::this_thread::sleep_for(std::chrono::milliseconds(script_->frame_interval_ms));

            if (script_->fail_read)
                throw camera::CameraError(ErrorKind::CAMERA_UNAVAILABLE, "scripted device loss");

            Frame frame;
            {
                std::lock_guard<std::mutex> lock(script_->mutex);
                frame.image = script_->image.clone();
            }
            frame.sequence = sequence_++;
            frame.timestamp = timeutil::nowMs();
            script_->frames++;
            return frame;
        }

        void close() override
        {
            if (open_.exchange(false))
                script_->releases++;
        }

        bool isOpen() const override { return open_; }

        camera::SourceStats stats() const override
        {
            camera::SourceStats stats;
            stats.frames_captured = static_cast<uint64_t>(script_->frames.load());
            stats.width = kFrameSize.width;
            stats.height = kFrameSize.height;
            stats.backend = "scripted";
            return stats;
        }

    private:
        std::shared_ptr<SourceScript> script_;
        std::atomic<bool> open_{false};
        uint64_t sequence_ = 0;
    };

    // Unique directory under the system temp dir, removed on destruction
    class TempDir
    {
    public:
        TempDir()
        {
            std::random_device rd;
            path_ = std::filesystem::temp_directory_path() /
                    ("openarchery_test_" + std::to_string(timeutil::nowMs()) + "_" + std::to_string(rd()));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        std::string path(const std::string &child = "") const
        {
            return child.empty() ? path_.string() : (path_ / child).string();
        }

    private:
        std::filesystem::path path_;
    };

} // namespace test_helpers
