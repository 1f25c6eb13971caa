#pragma once

#include <string>
#include "camera/camera_frame_source.hpp"
#include "detector/calibration/target_calibration.hpp"
#include "detector/impact_detector.hpp"
#include "session/session_store.hpp"

using namespace std;

struct SessionManagerParams
{
    size_t frame_queue_capacity = 2;                         // Acquisition -> detection, oldest frame dropped when full
    int frame_wait_ms = 200;                                 // Detection worker poll interval
    string default_target = "122cm";                         // Used when calibrate() gets no size
    bool reuse_calibration = false;                          // Restore the cached profile at start-up
    string calibration_cache = "cache/calibration.json";     // Last successful profile
    bool save_calibration_frame = true;                      // Keep the calibration image next to the cache
};

struct ServiceParams
{
    string host = "0.0.0.0";
    int port = 13520;
    int preview_width = 960;   // Preview JPEG is scaled down to this width
    int preview_quality = 80;  // JPEG quality 0..100
    int event_keepalive_s = 15; // Comment line sent to idle event streams
    int event_queue_capacity = 256; // Oldest events are dropped beyond this
};

struct LoggingParams
{
    string level = "info";                  // error, warning, info, debug
    bool to_file = true;
    string file = "logs/openarchery.log";
    int max_file_kb = 10 * 1024;            // Rotate above this size
    int backup_count = 3;
};

struct HostParams
{
    bool poweroff_on_shutdown = false;          // Power the device down after a shutdown command
    string poweroff_command = "sudo shutdown -h now";
};

// Every tunable of the application, defaults are in the parameter structs
struct Config
{
    CameraParams camera;
    CalibrationParams calibration;
    DetectionParams detection;
    SessionStoreParams store;
    SessionManagerParams session;
    ServiceParams service;
    LoggingParams logging;
    HostParams host;
    bool debug = false;
};

namespace config
{
    // Merge a JSON file into config; unknown keys are ignored.
    // Returns false (with error set) when the file cannot be read or parsed.
    bool loadFromFile(const string &path, Config &config, string &error);

    // Merge JSON text into config, same rules as loadFromFile
    bool loadFromString(const string &text, Config &config, string &error);

    // Command line flags override file values
    bool applyArgs(int argc, char *argv[], Config &config, string &error);

    // Effective configuration, for logging and the status surface
    string dump(const Config &config);
}
