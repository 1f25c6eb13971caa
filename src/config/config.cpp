#include "config.hpp"
#include "utils.hpp"
#include "utils/args.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

namespace
{
    // Overwrite target only when the key is present
    template <typename T>
    void read(const json &section, const char *key, T &target)
    {
        auto it = section.find(key);
        if (it != section.end() && !it->is_null())
            target = it->get<T>();
    }

    const json &section(const json &root, const char *name)
    {
        static const json empty = json::object();
        auto it = root.find(name);
        if (it == root.end() || !it->is_object())
            return empty;
        return *it;
    }

    void readCamera(const json &j, CameraParams &camera)
    {
        read(j, "device", camera.device);
        read(j, "width", camera.width);
        read(j, "height", camera.height);
        read(j, "fps", camera.fps);
        read(j, "rotation", camera.rotation);
        read(j, "use_mjpeg", camera.use_mjpeg);
        read(j, "read_timeout_ms", camera.read_timeout_ms);
        read(j, "timeouts_before_reopen", camera.timeouts_before_reopen);
        read(j, "open_retries", camera.open_retries);
        read(j, "open_retry_delay_ms", camera.open_retry_delay_ms);
        read(j, "warmup_frames", camera.warmup_frames);
        read(j, "loop_video", camera.loop_video);
    }

    void readCalibration(const json &j, CalibrationParams &calibration)
    {
        read(j, "blur_kernel_size", calibration.contour.blurKernelSize);
        read(j, "min_area_fraction", calibration.contour.minAreaFraction);
        read(j, "max_area_fraction", calibration.contour.maxAreaFraction);
        read(j, "min_aspect_ratio", calibration.contour.minAspectRatio);
        read(j, "max_aspect_ratio", calibration.contour.maxAspectRatio);
        read(j, "min_circularity", calibration.contour.minCircularity);
        read(j, "max_tilt_degrees", calibration.ellipse.maxTiltDegrees);
        read(j, "max_fit_residual", calibration.ellipse.maxFitResidual);
        read(j, "ambiguity_ratio", calibration.ambiguityRatio);
        read(j, "calibration_frames", calibration.calibrationFrames);
        read(j, "calibration_timeout_ms", calibration.calibrationTimeoutMs);
        read(j, "max_profile_age_s", calibration.maxProfileAgeS);
    }

    void readDetection(const json &j, DetectionParams &detection)
    {
        read(j, "blur_kernel_size", detection.foreground.blur_kernel_size);
        read(j, "diff_threshold", detection.foreground.diff_threshold);
        read(j, "morph_kernel_size", detection.foreground.morph_kernel_size);
        read(j, "target_margin", detection.foreground.target_margin);
        read(j, "max_change_ratio", detection.foreground.max_change_ratio);

        read(j, "min_blob_area", detection.blobs.min_blob_area);
        read(j, "max_blob_area", detection.blobs.max_blob_area);
        read(j, "split_overlapping", detection.blobs.split_overlapping);
        read(j, "min_peak_separation_px", detection.blobs.min_peak_separation_px);
        read(j, "peak_ratio", detection.blobs.peak_ratio);

        read(j, "match_distance_px", detection.tracking.match_distance_px);
        read(j, "stable_tolerance_px", detection.tracking.stable_tolerance_px);
        read(j, "confirmation_window", detection.tracking.confirmation_window);
        read(j, "min_confirmed_frames", detection.tracking.min_confirmed_frames);
        read(j, "max_missed_frames", detection.tracking.max_missed_frames);

        read(j, "background_frames", detection.background_frames);
        read(j, "background_alpha", detection.background_alpha);
        read(j, "rebaseline_frames", detection.rebaseline_frames);
        read(j, "duplicate_distance_cm", detection.duplicate_distance_cm);
        read(j, "absorb_margin_px", detection.absorb_margin_px);
    }

    bool validate(const Config &config, string &error)
    {
        if (config.camera.width <= 0 || config.camera.height <= 0 || config.camera.fps <= 0)
        {
            error = "camera width, height and fps must be positive";
            return false;
        }
        if (config.camera.rotation % 90 != 0)
        {
            error = "camera rotation must be 0, 90, 180 or 270";
            return false;
        }
        TargetSize size;
        if (!target_geometry::parseTargetSize(config.session.default_target, size))
        {
            error = "unknown target size '" + config.session.default_target + "' (80cm or 122cm)";
            return false;
        }
        if (config.session.frame_queue_capacity < 1)
        {
            error = "frame queue capacity must be at least 1";
            return false;
        }
        if (config.detection.tracking.min_confirmed_frames > config.detection.tracking.confirmation_window)
        {
            error = "min_confirmed_frames cannot exceed confirmation_window";
            return false;
        }
        if (config.service.port <= 0 || config.service.port > 65535)
        {
            error = "port out of range";
            return false;
        }
        if (config.service.event_queue_capacity < 1)
        {
            error = "event queue capacity must be at least 1";
            return false;
        }
        logging::LogLevel level;
        if (!logging::parseLogLevel(config.logging.level, level))
        {
            error = "unknown log level '" + config.logging.level + "'";
            return false;
        }
        return true;
    }
}

namespace config
{
    bool loadFromString(const string &text, Config &config, string &error)
    {
        json root;
        try
        {
            root = json::parse(text);
        }
        catch (const json::parse_error &e)
        {
            error = "invalid JSON: " + string(e.what());
            return false;
        }

        if (!root.is_object())
        {
            error = "configuration must be a JSON object";
            return false;
        }

        Config updated = config;
        try
        {
            readCamera(section(root, "camera"), updated.camera);
            readCalibration(section(root, "calibration"), updated.calibration);
            readDetection(section(root, "detection"), updated.detection);

            const json &sessions = section(root, "sessions");
            read(sessions, "directory", updated.store.directory);
            read(sessions, "max_sessions", updated.store.max_sessions);
            read(sessions, "frame_queue_capacity", updated.session.frame_queue_capacity);
            read(sessions, "frame_wait_ms", updated.session.frame_wait_ms);
            read(sessions, "default_target", updated.session.default_target);
            read(sessions, "reuse_calibration", updated.session.reuse_calibration);
            read(sessions, "calibration_cache", updated.session.calibration_cache);
            read(sessions, "save_calibration_frame", updated.session.save_calibration_frame);

            const json &service = section(root, "service");
            read(service, "host", updated.service.host);
            read(service, "port", updated.service.port);
            read(service, "preview_width", updated.service.preview_width);
            read(service, "preview_quality", updated.service.preview_quality);
            read(service, "event_keepalive_s", updated.service.event_keepalive_s);
            read(service, "event_queue_capacity", updated.service.event_queue_capacity);

            const json &log = section(root, "logging");
            read(log, "level", updated.logging.level);
            read(log, "to_file", updated.logging.to_file);
            read(log, "file", updated.logging.file);
            read(log, "max_file_kb", updated.logging.max_file_kb);
            read(log, "backup_count", updated.logging.backup_count);

            const json &host = section(root, "host");
            read(host, "poweroff_on_shutdown", updated.host.poweroff_on_shutdown);
            read(host, "poweroff_command", updated.host.poweroff_command);

            read(root, "debug", updated.debug);
        }
        catch (const json::exception &e)
        {
            error = "wrong value type: " + string(e.what());
            return false;
        }

        if (!validate(updated, error))
            return false;

        config = updated;
        return true;
    }

    bool loadFromFile(const string &path, Config &config, string &error)
    {
        ifstream file(path);
        if (!file)
        {
            error = "cannot open " + path;
            return false;
        }

        stringstream buffer;
        buffer << file.rdbuf();
        if (!loadFromString(buffer.str(), config, error))
        {
            error = path + ": " + error;
            return false;
        }

        log_info("Loaded configuration from " + log_string_src(path));
        return true;
    }

    bool applyArgs(int argc, char *argv[], Config &config, string &error)
    {
        Config updated = config;

        try
        {
            updated.camera.device = getArg(argc, argv, "--camera", updated.camera.device);
            updated.camera.width = getArg(argc, argv, "--width", updated.camera.width);
            updated.camera.height = getArg(argc, argv, "--height", updated.camera.height);
            updated.camera.fps = getArg(argc, argv, "--fps", updated.camera.fps);
            updated.camera.rotation = getArg(argc, argv, "--rotation", updated.camera.rotation);
            updated.service.port = getArg(argc, argv, "--port", updated.service.port);
        }
        catch (const exception &e)
        {
            error = "invalid numeric argument (" + string(e.what()) + ")";
            return false;
        }
        updated.store.directory = getArg(argc, argv, "--sessions", updated.store.directory);
        updated.session.default_target = getArg(argc, argv, "--target", updated.session.default_target);

        if (hasFlag(argc, argv, "--reuse-calibration"))
            updated.session.reuse_calibration = true;
        if (hasFlag(argc, argv, "--poweroff"))
            updated.host.poweroff_on_shutdown = true;
        if (hasFlag(argc, argv, "--debug") || hasFlag(argc, argv, "-d"))
        {
            updated.debug = true;
            updated.logging.level = "debug";
        }
        if (hasFlag(argc, argv, "--quiet") || hasFlag(argc, argv, "-q"))
            updated.logging.level = "error";

        if (!validate(updated, error))
            return false;

        config = updated;
        return true;
    }

    string dump(const Config &config)
    {
        json j;
        j["camera"] = {
            {"device", config.camera.device},
            {"width", config.camera.width},
            {"height", config.camera.height},
            {"fps", config.camera.fps},
            {"rotation", config.camera.rotation}};
        j["sessions"] = {
            {"directory", config.store.directory},
            {"max_sessions", config.store.max_sessions},
            {"default_target", config.session.default_target},
            {"reuse_calibration", config.session.reuse_calibration}};
        j["service"] = {
            {"host", config.service.host},
            {"port", config.service.port}};
        j["logging"] = {
            {"level", config.logging.level},
            {"file", config.logging.to_file ? config.logging.file : ""}};
        j["debug"] = config.debug;
        return j.dump(2);
    }
}
