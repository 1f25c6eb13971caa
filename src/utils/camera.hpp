#pragma once

#include <opencv2/opencv.hpp>
#include <vector>
#include <string>
#include <algorithm>
#include <cctype>
#include "logging.hpp"

using namespace cv;
using namespace std;

namespace camera
{
    // Determine if a given path is a video file based on its extension
    inline bool isVideoFile(const string &path)
    {
        string lower_path = path;
        transform(lower_path.begin(), lower_path.end(), lower_path.begin(), [](unsigned char c)
                  { return static_cast<char>(std::tolower(c)); });

        const vector<string> video_extensions = {".mp4", ".avi", ".mkv", ".mov", ".wmv", ".h264"};
        for (const auto &ext : video_extensions)
        {
            if (lower_path.length() >= ext.length() &&
                lower_path.substr(lower_path.length() - ext.length()) == ext)
            {
                return true;
            }
        }
        return false;
    }

    // "0", "2": a V4L2 device index rather than a path
    inline bool isDeviceIndex(const string &device)
    {
        return !device.empty() && device.size() <= 3 &&
               all_of(device.begin(), device.end(), [](unsigned char c)
                      { return std::isdigit(c) != 0; });
    }

    // Simple function to decode fourcc code to a human-readable string
    inline string decodeFourCC(int fourcc)
    {
        char code[5];
        code[0] = (fourcc & 0xFF);
        code[1] = (fourcc >> 8) & 0xFF;
        code[2] = (fourcc >> 16) & 0xFF;
        code[3] = (fourcc >> 24) & 0xFF;
        code[4] = '\0';
        return string(code);
    }

    // Rotate a frame by 0/90/180/270 degrees (clockwise)
    inline Mat rotateFrame(const Mat &frame, int rotation_deg)
    {
        Mat rotated;
        switch (rotation_deg)
        {
        case 90:
            cv::rotate(frame, rotated, ROTATE_90_CLOCKWISE);
            return rotated;
        case 180:
            cv::rotate(frame, rotated, ROTATE_180);
            return rotated;
        case 270:
            cv::rotate(frame, rotated, ROTATE_90_COUNTERCLOCKWISE);
            return rotated;
        default:
            return frame;
        }
    }

    // Average several frames of the same size to reduce sensor noise
    inline Mat averageFrames(const vector<Mat> &frames)
    {
        if (frames.empty())
            return Mat();

        if (frames.size() == 1)
            return frames[0].clone();

        Mat averaged;
        frames[0].convertTo(averaged, CV_32F);

        int used = 1;
        for (size_t i = 1; i < frames.size(); i++)
        {
            if (frames[i].size() != frames[0].size() || frames[i].type() != frames[0].type())
            {
                log_warning("Skipping frame " + log_string(i) + " with mismatched size while averaging");
                continue;
            }

            Mat temp;
            frames[i].convertTo(temp, CV_32F);
            averaged += temp;
            used++;
        }

        averaged /= static_cast<float>(used);

        Mat result;
        averaged.convertTo(result, frames[0].type());
        return result;
    }

} // namespace camera
