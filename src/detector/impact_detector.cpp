#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>

#include "impact_detector.hpp"
#include "utils.hpp"
#include "utils/visualization.hpp"

using namespace cv;
using namespace std;

ImpactDetector::ImpactDetector(bool debug_mode, const DetectionParams &params)
    : armed(false), debug_mode(debug_mode), params(params), background_count(0), disturbed_run(0),
      tracker(params.tracking), next_sequence(1)
{
}

void ImpactDetector::arm(const CalibrationProfile &new_profile)
{
    if (!(new_profile.pixels_per_cm > 0.0))
    {
        throw runtime_error("Cannot arm detector with an invalid calibration profile");
    }

    profile = new_profile;
    target_mask.release();
    resetBackground();
    reported.clear();
    next_sequence = 1;
    armed = true;

    lock_guard<mutex> lock(stats_mutex);
    detector_stats = DetectorStats();
    detector_stats.armed = true;

    log_info("Detector armed for " + target_geometry::targetSizeName(profile.target_size) + " target at " +
             log_string(profile.pixels_per_cm) + " px/cm");
}

void ImpactDetector::disarm()
{
    if (armed)
    {
        log_info("Detector disarmed after " + to_string(next_sequence - 1) + " impacts");
    }

    armed = false;
    target_mask.release();
    resetBackground();
    reported.clear();

    lock_guard<mutex> lock(stats_mutex);
    detector_stats.armed = false;
    detector_stats.background_ready = false;
    detector_stats.active_candidates = 0;
}

void ImpactDetector::invalidateBackground()
{
    resetBackground();

    lock_guard<mutex> lock(stats_mutex);
    detector_stats.background_ready = false;
    detector_stats.active_candidates = 0;
}

void ImpactDetector::resetBackground()
{
    background.release();
    background_sum.release();
    background_count = 0;
    disturbed_run = 0;
    tracker.clear();
}

DetectorStats ImpactDetector::stats() const
{
    lock_guard<mutex> lock(stats_mutex);
    return detector_stats;
}

bool ImpactDetector::isDuplicate(const Point2d &target_cm) const
{
    for (const auto &previous : reported)
    {
        if (math::distanceToPoint(previous, target_cm) < params.duplicate_distance_cm)
            return true;
    }
    return false;
}

void ImpactDetector::absorbIntoBackground(const Mat &gray, const blob_processing::Blob &blob)
{
    int margin = max(0, params.absorb_margin_px);
    Rect frame_rect(0, 0, gray.cols, gray.rows);
    Rect grown = Rect(blob.box.x - margin, blob.box.y - margin, blob.box.width + 2 * margin, blob.box.height + 2 * margin) & frame_rect;
    Rect inner = blob.box & frame_rect;
    if (grown.area() == 0 || inner.area() == 0)
        return;

    // Blob mask placed inside the grown box, then dilated by the margin
    Mat local = Mat::zeros(grown.size(), CV_8UC1);
    Rect mask_rect(inner.x - blob.box.x, inner.y - blob.box.y, inner.width, inner.height);
    blob.mask(mask_rect).copyTo(local(Rect(inner.x - grown.x, inner.y - grown.y, inner.width, inner.height)));

    if (margin > 0)
    {
        Mat kernel = getStructuringElement(MORPH_ELLIPSE, Size(2 * margin + 1, 2 * margin + 1));
        dilate(local, local, kernel);
    }

    Mat roi = background(grown);
    gray(grown).copyTo(roi, local);
}

Impact ImpactDetector::createImpact(const candidate_tracking::ConfirmedCandidate &confirmed, uint64_t timestamp)
{
    Impact impact;
    impact.sequence = next_sequence++;
    impact.pixel = confirmed.blob.centroid;

    Point2d target_cm = target_geometry::pixelToTarget(profile, impact.pixel);
    impact.x_cm = target_cm.x;
    impact.y_cm = target_cm.y;
    impact.radius_cm = target_geometry::radialDistance(target_cm);
    impact.angle_deg = target_geometry::angleDegrees(target_cm);
    impact.score = target_geometry::ringScore(profile.target_size, impact.radius_cm);
    impact.x_ring = target_geometry::isXRing(profile.target_size, impact.radius_cm);
    impact.timestamp = timestamp;
    impact.confidence = confirmed.confidence;
    impact.area_px = confirmed.blob.area;
    return impact;
}

vector<Impact> ImpactDetector::feed(const Frame &frame)
{
    vector<Impact> impacts;

    if (!armed || frame.empty())
    {
        return impacts;
    }

    // Start a timer to measure processing time
    auto start_time = chrono::steady_clock::now();

    if (profile.frame_width > 0 && profile.frame_height > 0 &&
        (frame.image.cols != profile.frame_width || frame.image.rows != profile.frame_height))
    {
        throw runtime_error("Frame size " + to_string(frame.image.cols) + "x" + to_string(frame.image.rows) +
                            " does not match calibration " + to_string(profile.frame_width) + "x" + to_string(profile.frame_height));
    }

    Mat gray = foreground_processing::preprocessFrame(frame.image, params.foreground);

    if (target_mask.empty() || target_mask.size() != gray.size())
    {
        target_mask = foreground_processing::createTargetMask(gray.size(), profile, params.foreground.target_margin);
    }

    // [===STEP 1: BACKGROUND WARMUP===]
    if (background.empty())
    {
        if (background_sum.empty())
            background_sum = Mat::zeros(gray.size(), CV_32F);

        background_sum += gray;
        background_count++;

        if (background_count >= max(1, params.background_frames))
        {
            background = background_sum / background_count;
            background_sum.release();
            log_debug("Background ready from " + to_string(background_count) + " frames");

            lock_guard<mutex> lock(stats_mutex);
            detector_stats.background_ready = true;
        }

        lock_guard<mutex> lock(stats_mutex);
        detector_stats.frames_processed++;
        return impacts;
    }

    // [===STEP 2: FOREGROUND===]
    foreground_processing::ForegroundResult foreground =
        foreground_processing::processForeground(gray, background, target_mask, debug_mode, params.foreground);

    // [===STEP 3: DISTURBED FRAMES===]
    if (foreground.disturbed)
    {
        disturbed_run++;
        bool rebaselined = false;

        if (disturbed_run >= params.rebaseline_frames)
        {
            log_info("Scene changed for " + to_string(disturbed_run) + " frames (" +
                     log_string(foreground.change_ratio * 100.0) + "% of target), rebuilding background");
            background = gray.clone();
            tracker.clear();
            disturbed_run = 0;
            rebaselined = true;
        }

        lock_guard<mutex> lock(stats_mutex);
        detector_stats.frames_processed++;
        detector_stats.disturbed_frames++;
        if (rebaselined)
            detector_stats.rebaselines++;
        detector_stats.active_candidates = static_cast<int>(tracker.candidates().size());
        return impacts;
    }
    disturbed_run = 0;

    // [===STEP 4: BLOBS===]
    vector<blob_processing::Blob> blobs = blob_processing::processBlobs(foreground.mask, target_mask, debug_mode, params.blobs);

    // [===STEP 5: TEMPORAL CONFIRMATION===]
    vector<candidate_tracking::ConfirmedCandidate> confirmed = tracker.update(blobs);

    // [===STEP 6: IMPACTS===]
    uint64_t timestamp = frame.timestamp > 0 ? frame.timestamp : timeutil::nowMs();
    uint64_t duplicates = 0;

    for (const auto &candidate : confirmed)
    {
        Point2d target_cm = target_geometry::pixelToTarget(profile, candidate.blob.centroid);

        // [===STEP 7: ABSORB INTO BACKGROUND===]
        absorbIntoBackground(gray, candidate.blob);

        if (isDuplicate(target_cm))
        {
            log_debug("Absorbed blob at " + to_string(target_cm.x) + ", " + to_string(target_cm.y) + " cm, too close to a reported impact");
            duplicates++;
            continue;
        }

        Impact impact = createImpact(candidate, timestamp);
        log_debug("Confirmed after " + to_string(candidate.frames_tracked) + " frames, confidence " + to_string(candidate.confidence).substr(0, 4));
        reported.push_back(target_cm);
        impacts.push_back(impact);

        log_info("Impact #" + to_string(impact.sequence) + " at (" + to_string(impact.x_cm).substr(0, 6) + ", " +
                 to_string(impact.y_cm).substr(0, 6) + ") cm, score " + log_string(impact.score) +
                 (impact.x_ring ? " (X)" : ""));
    }

    // Slow drift (lighting) is followed on pixels that did not change
    Mat update_mask;
    bitwise_not(foreground.mask, update_mask);
    accumulateWeighted(gray, background, params.background_alpha, update_mask);

    if (debug_mode && !impacts.empty())
    {
        Mat debug_img = frame.image.clone();
        visualization::drawTargetOverlay(debug_img, profile);
        visualization::drawImpacts(debug_img, impacts);
        error_code ec;
        filesystem::create_directories("debug_frames/detection", ec);
        imwrite("debug_frames/detection/impact_" + to_string(impacts.back().sequence) + ".jpg", debug_img);
    }

    auto end_time = chrono::steady_clock::now();
    auto processing_time = chrono::duration_cast<chrono::milliseconds>(end_time - start_time).count();

    lock_guard<mutex> lock(stats_mutex);
    detector_stats.frames_processed++;
    detector_stats.impacts_reported += impacts.size();
    detector_stats.duplicates_absorbed += duplicates;
    detector_stats.active_candidates = static_cast<int>(tracker.candidates().size());
    detector_stats.processing_time_ms = static_cast<int>(processing_time);
    return impacts;
}
