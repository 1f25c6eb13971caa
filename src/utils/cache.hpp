#pragma once

#include <opencv2/opencv.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include "utils.hpp"
#include "session/serialization.hpp"

using namespace cv;
using namespace std;

namespace cache
{
    namespace calibration
    {
        static const int VERSION = 1;

        // Make sure the directory of a cache file exists
        inline bool ensureParent(const string &filename)
        {
            filesystem::path parent = filesystem::path(filename).parent_path();
            if (parent.empty())
                return true;

            error_code ec;
            filesystem::create_directories(parent, ec);
            if (ec)
            {
                log_error("Failed to create cache directory " + parent.string() + ": " + ec.message());
                return false;
            }
            return true;
        }

        // Load the last calibration profile, false when missing or unreadable
        inline bool load(const string &filename, CalibrationProfile &profile)
        {
            try
            {
                ifstream file(filename);
                if (!file)
                {
                    log_debug("No calibration file found: " + filename);
                    return false;
                }

                nlohmann::json j = nlohmann::json::parse(file);

                if (j.value("version", 0) != VERSION)
                {
                    log_warning("Incompatible calibration file version: " + to_string(j.value("version", 0)) + ". Expected " + to_string(VERSION));
                    return false;
                }

                profile = j.at("profile").get<CalibrationProfile>();
                log_info("Loaded calibration from cache (" + target_geometry::targetSizeName(profile.target_size) + ", " +
                         log_string(profile.pixels_per_cm) + " px/cm)");
                return true;
            }
            catch (const exception &e)
            {
                log_error("Error loading calibration: " + string(e.what()));
                return false;
            }
        }

        // Save a calibration profile
        inline bool save(const string &filename, const CalibrationProfile &profile)
        {
            if (!ensureParent(filename))
                return false;

            try
            {
                ofstream file(filename, ios::trunc);
                if (!file)
                {
                    log_error("Failed to open file for writing: " + filename);
                    return false;
                }

                nlohmann::json j;
                j["version"] = VERSION;
                j["saved_at"] = timeutil::formatIso(timeutil::nowMs());
                j["profile"] = profile;
                file << j.dump(2) << '\n';

                if (!file.good())
                {
                    log_error("Failed to write calibration data");
                    return false;
                }

                log_info("Saved calibration to " + filename);
                return true;
            }
            catch (const exception &e)
            {
                log_error("Error saving calibration: " + string(e.what()));
                return false;
            }
        }

        // Keep the frame the profile was computed from, for later inspection
        inline bool saveFrame(const string &filename, const Mat &frame)
        {
            if (frame.empty() || !ensureParent(filename))
                return false;

            try
            {
                if (!imwrite(filename, frame))
                {
                    log_error("Failed to save calibration frame " + filename);
                    return false;
                }
                return true;
            }
            catch (const cv::Exception &e)
            {
                log_error("Error saving calibration frame: " + string(e.what()));
                return false;
            }
        }
    }
}
