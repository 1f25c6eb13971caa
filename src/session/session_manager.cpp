#include "session_manager.hpp"
#include "detector/impact_detector.hpp"
#include "detector/calibration/target_calibration.hpp"
#include "utils.hpp"
#include "utils/cache.hpp"
#include "utils/visualization.hpp"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <sstream>

using namespace std;
using namespace cv;

SessionManager::SessionManager(const Config &config, unique_ptr<FrameSource> source, shared_ptr<SessionStore> store,
                               shared_ptr<ImpactQueue> events, unique_ptr<DetectorInterface> detector)
    : config_(config), source_(std::move(source)), store_(std::move(store)), events_(std::move(events)),
      detector_(std::move(detector)), frames_(config.session.frame_queue_capacity)
{
  if (!source_)
  {
    throw invalid_argument("SessionManager needs a frame source");
  }

  if (!store_)
  {
    store_ = make_shared<SessionStore>(config_.store);
  }

  // Default detector
  if (!detector_)
  {
    detector_ = make_unique<ImpactDetector>(config_.debug, config_.detection);
  }
}

SessionManager::~SessionManager()
{
  shutdown();
}

bool SessionManager::start()
{
  if (started_.exchange(true))
    return !source_failed_;

  started_at_ = timeutil::nowMs();
  store_->prune();

  try
  {
    lock_guard<mutex> lock(source_mutex_);
    source_->open(Size(config_.camera.width, config_.camera.height), config_.camera.fps);
    source_failed_ = false;
  }
  catch (const camera::CameraError &e)
  {
    source_failed_ = true;
    log_error("Camera unavailable at start-up: " + string(e.what()));

    lock_guard<mutex> lock(state_mutex_);
    state_ = DetectorState::ERROR;
    last_error_ = e.kind();
    last_error_message_ = e.what();
  }

  acquisition_thread_ = thread(&SessionManager::acquisitionLoop, this);
  detection_thread_ = thread(&SessionManager::detectionLoop, this);

  log_info("Session manager running (" + session_state::stateName(state()) + ")");
  return !source_failed_;
}

bool SessionManager::restoreCalibration(const CalibrationProfile &profile)
{
  uint64_t max_age_ms = static_cast<uint64_t>(max(0, config_.calibration.maxProfileAgeS)) * 1000;
  if (!target_geometry::isProfileValid(profile, timeutil::nowMs(), max_age_ms))
  {
    log_warning("Cached calibration is invalid or expired, calibrate again");
    return false;
  }

  if (profile.frame_width > 0 && profile.frame_height > 0 &&
      (profile.frame_width != config_.camera.width || profile.frame_height != config_.camera.height))
  {
    // A rotated camera delivers swapped dimensions
    bool rotated = (config_.camera.rotation == 90 || config_.camera.rotation == 270) &&
                   profile.frame_width == config_.camera.height && profile.frame_height == config_.camera.width;
    if (!rotated)
    {
      log_warning("Cached calibration was made at " + to_string(profile.frame_width) + "x" + to_string(profile.frame_height) +
                  ", camera is configured for " + to_string(config_.camera.width) + "x" + to_string(config_.camera.height));
      return false;
    }
  }

  lock_guard<mutex> lock(state_mutex_);
  if (state_ != DetectorState::IDLE)
    return false;

  profile_ = profile;
  has_profile_ = true;
  state_ = DetectorState::ARMED;
  log_info("Restored " + target_geometry::targetSizeName(profile.target_size) + " calibration from cache");
  return true;
}

DetectorState SessionManager::state() const
{
  lock_guard<mutex> lock(state_mutex_);
  return state_;
}

CommandResult SessionManager::resultLocked(bool success, ErrorKind error, const string &message) const
{
  CommandResult result;
  result.success = success;
  result.error = error;
  result.message = message;
  result.state = state_;
  result.has_profile = has_profile_;
  result.profile = profile_;
  result.has_session = has_session_;
  result.session = session_;
  return result;
}

Session SessionManager::createSessionLocked(uint64_t now)
{
  stringstream id;
  id << timeutil::formatCompact(now) << "-" << setfill('0') << setw(3) << (now % 1000);

  string session_id = id.str();
  if (session_id == last_session_id_ || (has_session_ && session_id == session_.id))
  {
    session_id += "-" + to_string(arm_generation_ + 1);
  }

  Session session;
  session.id = session_id;
  session.start_time = now;
  session.active = true;
  session.target_size = profile_.target_size;
  session.profile = profile_;

  last_session_id_ = session_id;
  return session;
}

void SessionManager::finalizeSessionLocked(uint64_t now, ErrorKind fault, const string &message)
{
  if (!has_session_ || !session_.active)
    return;

  session_.active = false;
  session_.end_time = max(now, session_.start_time);
  session_.fault = fault;
  session_.fault_message = message;

  if (!store_->finalize(session_))
  {
    log_error("Session " + session_.id + " could not be finalized on disk");
  }

  SessionStatistics stats = session_state::computeStatistics(session_);
  log_info("Session " + session_.id + " ended: " + log_string(stats.arrows) + " arrows, " + log_string(stats.total_score) + " points" +
           (fault != ErrorKind::NONE ? " (" + errors::errorKindName(fault) + ")" : ""));

  publish("session_ended", session_.id);
}

void SessionManager::publish(const string &type, const string &session_id, const Impact *impact)
{
  if (!events_)
    return;

  SessionEvent event;
  event.type = type;
  event.session_id = session_id;
  event.timestamp = timeutil::nowMs();
  if (impact)
    event.impact = *impact;
  event.state = session_state::stateName(state_);
  events_->push(event);
}

CommandResult SessionManager::calibrate(const string &target_name)
{
  string name = target_name.empty() ? config_.session.default_target : target_name;

  TargetSize size;
  if (!target_geometry::parseTargetSize(name, size))
  {
    lock_guard<mutex> lock(state_mutex_);
    return resultLocked(false, ErrorKind::INVALID_STATE, "Unknown target size '" + name + "', use 80cm or 122cm");
  }
  return calibrate(size);
}

CommandResult SessionManager::calibrate(TargetSize target_size)
{
  bool from_error = false;
  {
    lock_guard<mutex> lock(state_mutex_);
    if (shutting_down_)
      return resultLocked(false, ErrorKind::SHUTTING_DOWN, "Shutting down");
    if (state_ == DetectorState::DETECTING)
      return resultLocked(false, ErrorKind::INVALID_STATE, "Stop detection before recalibrating");
    if (state_ == DetectorState::CALIBRATING)
      return resultLocked(false, ErrorKind::INVALID_STATE, "Calibration already in progress");

    from_error = state_ == DetectorState::ERROR;
    state_ = DetectorState::CALIBRATING;
    publish("state", session_.id);
  }

  log_info("Calibrating for " + target_geometry::targetSizeName(target_size) + " target...");

  // [===STEP 1: RECOVER THE CAMERA===]
  if (from_error || source_failed_)
  {
    string error;
    if (!reopenSource(error))
    {
      lock_guard<mutex> lock(state_mutex_);
      state_ = DetectorState::ERROR;
      last_error_ = ErrorKind::CAMERA_UNAVAILABLE;
      last_error_message_ = error;
      return resultLocked(false, ErrorKind::CAMERA_UNAVAILABLE, error);
    }
  }

  // [===STEP 2: COLLECT FRAMES===]
  frames_.clear();
  vector<Mat> images;
  Frame last_frame;
  auto deadline = chrono::steady_clock::now() + chrono::milliseconds(config_.calibration.calibrationTimeoutMs);
  int wanted = max(1, config_.calibration.calibrationFrames);

  while ((int)images.size() < wanted && !stop_requested_ && !frames_.isClosed())
  {
    auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
    if (remaining <= 0)
      break;

    Frame frame;
    if (frames_.pop(frame, static_cast<int>(min<long long>(remaining, 200))))
    {
      images.push_back(frame.image);
      last_frame = frame;
    }
  }

  if (images.empty())
  {
    lock_guard<mutex> lock(state_mutex_);
    if (shutting_down_)
      return resultLocked(false, ErrorKind::SHUTTING_DOWN, "Shutting down");

    string message = "No frames received within " + to_string(config_.calibration.calibrationTimeoutMs) + " ms";
    log_error("Calibration failed: " + message);
    has_profile_ = false;
    state_ = source_failed_ ? DetectorState::ERROR : DetectorState::IDLE;
    last_error_ = ErrorKind::CAPTURE_TIMEOUT;
    last_error_message_ = message;
    publish("state", session_.id);
    return resultLocked(false, ErrorKind::CAPTURE_TIMEOUT, message);
  }

  // [===STEP 3: FIT THE TARGET===]
  Frame averaged;
  averaged.image = camera::averageFrames(images);
  averaged.sequence = last_frame.sequence;
  averaged.timestamp = last_frame.timestamp;

  CalibrationResult result;
  try
  {
    result = target_calibration::calibrate(averaged, target_size, config_.debug, config_.calibration);
  }
  catch (const cv::Exception &e)
  {
    result.success = false;
    result.error = ErrorKind::NO_TARGET_FOUND;
    result.message = "Calibration image could not be processed: " + string(e.what());
  }

  // Background from before the calibration no longer matches the scene
  {
    lock_guard<mutex> lock(detector_mutex_);
    detector_->invalidateBackground();
  }

  lock_guard<mutex> lock(state_mutex_);
  if (shutting_down_)
    return resultLocked(false, ErrorKind::SHUTTING_DOWN, "Shutting down");

  if (state_ != DetectorState::CALIBRATING)
  {
    // Camera failed while we were collecting frames
    return resultLocked(false, last_error_, "Calibration interrupted: " + last_error_message_);
  }

  if (!result)
  {
    log_warning("Calibration failed (" + errors::errorKindName(result.error) + "): " + result.message);
    has_profile_ = false;
    state_ = DetectorState::IDLE;
    last_error_ = result.error;
    last_error_message_ = result.message;
    publish("state", session_.id);
    return resultLocked(false, result.error, result.message);
  }

  profile_ = result.profile;
  has_profile_ = true;
  state_ = DetectorState::ARMED;
  last_error_ = ErrorKind::NONE;
  last_error_message_ = "";

  if (!cache::calibration::save(config_.session.calibration_cache, profile_))
  {
    log_warning("Calibration works but could not be cached");
  }
  if (config_.session.save_calibration_frame)
  {
    string frame_path = (filesystem::path(config_.session.calibration_cache).parent_path() / "calibration.jpg").string();
    cache::calibration::saveFrame(frame_path, averaged.image);
  }

  publish("state", session_.id);
  return resultLocked(true, ErrorKind::NONE, result.message);
}

CommandResult SessionManager::startDetection()
{
  lock_guard<mutex> lock(state_mutex_);

  if (shutting_down_)
    return resultLocked(false, ErrorKind::SHUTTING_DOWN, "Shutting down");

  if (state_ == DetectorState::DETECTING && has_session_ && session_.active)
    return resultLocked(true, ErrorKind::NONE, "Session already active");

  if (state_ == DetectorState::CALIBRATING)
    return resultLocked(false, ErrorKind::INVALID_STATE, "Calibration in progress");

  uint64_t now = timeutil::nowMs();
  uint64_t max_age_ms = static_cast<uint64_t>(max(0, config_.calibration.maxProfileAgeS)) * 1000;

  if (!has_profile_)
    return resultLocked(false, ErrorKind::NOT_CALIBRATED, "Calibrate before starting detection");

  if (!target_geometry::isProfileValid(profile_, now, max_age_ms))
    return resultLocked(false, ErrorKind::NOT_CALIBRATED, "Calibration has expired, calibrate again");

  if (state_ == DetectorState::ERROR)
    return resultLocked(false, ErrorKind::INVALID_STATE, "Recover with a new calibration first (" + errors::errorKindName(last_error_) + ")");

  Session session = createSessionLocked(now);

  try
  {
    lock_guard<mutex> detector_lock(detector_mutex_);
    detector_->arm(profile_);
    arm_generation_++;
  }
  catch (const exception &e)
  {
    log_error("Detector could not be armed: " + string(e.what()));
    return resultLocked(false, ErrorKind::NOT_CALIBRATED, e.what());
  }

  session_ = session;
  has_session_ = true;
  state_ = DetectorState::DETECTING;

  if (!store_->begin(session_))
  {
    log_error("Session " + session_.id + " will not be persisted");
  }

  log_info("Session " + session_.id + " started");
  publish("session_started", session_.id);
  return resultLocked(true, ErrorKind::NONE, "Session started");
}

CommandResult SessionManager::stopDetection()
{
  lock_guard<mutex> lock(state_mutex_);

  if (state_ == DetectorState::DETECTING && has_session_ && session_.active)
  {
    finalizeSessionLocked(timeutil::nowMs(), ErrorKind::NONE, "");

    {
      lock_guard<mutex> detector_lock(detector_mutex_);
      detector_->disarm();
    }

    state_ = DetectorState::ARMED;
    publish("state", session_.id);
    return resultLocked(true, ErrorKind::NONE, "Session stopped");
  }

  // Stopping twice returns the session that was already finalized
  if (has_session_)
    return resultLocked(true, ErrorKind::NONE, "Session already stopped");

  return resultLocked(false, ErrorKind::INVALID_STATE, "No session has been started");
}

CommandResult SessionManager::resetSession()
{
  lock_guard<mutex> lock(state_mutex_);

  if (shutting_down_)
    return resultLocked(false, ErrorKind::SHUTTING_DOWN, "Shutting down");

  if (state_ != DetectorState::DETECTING || !has_session_ || !session_.active)
    return resultLocked(false, ErrorKind::INVALID_STATE, "No active session to reset");

  uint64_t now = timeutil::nowMs();
  finalizeSessionLocked(now, ErrorKind::NONE, "");

  Session session = createSessionLocked(now);

  try
  {
    // Re-arming restarts sequence numbers and takes the arrows already in the target into the background
    lock_guard<mutex> detector_lock(detector_mutex_);
    detector_->disarm();
    detector_->arm(profile_);
    arm_generation_++;
  }
  catch (const exception &e)
  {
    log_error("Detector could not be re-armed: " + string(e.what()));
    state_ = DetectorState::ARMED;
    return resultLocked(false, ErrorKind::NOT_CALIBRATED, e.what());
  }

  session_ = session;
  if (!store_->begin(session_))
  {
    log_error("Session " + session_.id + " will not be persisted");
  }

  log_info("Session reset, new session " + session_.id);
  publish("session_started", session_.id);
  return resultLocked(true, ErrorKind::NONE, "New session started");
}

CommandResult SessionManager::shutdown()
{
  if (shutting_down_.exchange(true))
  {
    waitForShutdown(-1);
    lock_guard<mutex> lock(state_mutex_);
    return resultLocked(true, ErrorKind::NONE, "Already shut down");
  }

  log_info("Shutting down...");

  // [===STEP 1: FINALIZE THE ACTIVE SESSION===]
  try
  {
    lock_guard<mutex> lock(state_mutex_);
    finalizeSessionLocked(timeutil::nowMs(), ErrorKind::NONE, "");
    if (state_ == DetectorState::DETECTING)
      state_ = DetectorState::ARMED;
  }
  catch (const exception &e)
  {
    log_error("Failed to finalize session during shutdown: " + string(e.what()));
  }

  // [===STEP 2: DISARM===]
  try
  {
    lock_guard<mutex> lock(detector_mutex_);
    detector_->disarm();
  }
  catch (const exception &e)
  {
    log_error("Failed to disarm detector during shutdown: " + string(e.what()));
  }

  // [===STEP 3: STOP WORKERS===]
  stop_requested_ = true;
  frames_.close();
  try
  {
    if (acquisition_thread_.joinable())
      acquisition_thread_.join();
    if (detection_thread_.joinable())
      detection_thread_.join();
  }
  catch (const system_error &e)
  {
    log_error("Failed to join worker: " + string(e.what()));
  }

  // [===STEP 4: RELEASE THE CAMERA===]
  try
  {
    lock_guard<mutex> lock(source_mutex_);
    source_->close();
  }
  catch (const exception &e)
  {
    log_error("Failed to release frame source: " + string(e.what()));
  }

  // [===STEP 5: RELEASE WAITERS===]
  {
    lock_guard<mutex> lock(shutdown_mutex_);
    shutdown_complete_ = true;
  }
  shutdown_cv_.notify_all();

  log_info("Shutdown complete");

  lock_guard<mutex> lock(state_mutex_);
  return resultLocked(true, ErrorKind::NONE, "Shut down");
}

bool SessionManager::waitForShutdown(int timeout_ms)
{
  unique_lock<mutex> lock(shutdown_mutex_);
  if (timeout_ms < 0)
  {
    shutdown_cv_.wait(lock, [this]
                      { return shutdown_complete_; });
    return true;
  }
  return shutdown_cv_.wait_for(lock, chrono::milliseconds(timeout_ms), [this]
                               { return shutdown_complete_; });
}

StatusSnapshot SessionManager::status() const
{
  StatusSnapshot snapshot;
  {
    lock_guard<mutex> lock(state_mutex_);
    snapshot.state = state_;
    snapshot.has_profile = has_profile_;
    snapshot.profile = profile_;
    uint64_t max_age_ms = static_cast<uint64_t>(max(0, config_.calibration.maxProfileAgeS)) * 1000;
    snapshot.profile_valid = has_profile_ && target_geometry::isProfileValid(profile_, timeutil::nowMs(), max_age_ms);
    snapshot.has_session = has_session_;
    snapshot.session = session_;
    snapshot.statistics = session_state::computeStatistics(session_);
    snapshot.last_error = last_error_;
    snapshot.last_error_message = last_error_message_;
  }

  snapshot.shutting_down = shutting_down_;
  snapshot.camera = source_->stats();
  snapshot.detector = detector_->stats();
  snapshot.frames_dropped = frames_.dropped();
  snapshot.uptime_ms = started_at_ > 0 ? timeutil::nowMs() - started_at_ : 0;
  return snapshot;
}

vector<Impact> SessionManager::impactsSince(int sequence, string &session_id) const
{
  lock_guard<mutex> lock(state_mutex_);

  vector<Impact> impacts;
  session_id = has_session_ ? session_.id : "";
  for (const auto &impact : session_.impacts)
  {
    if (impact.sequence > sequence)
      impacts.push_back(impact);
  }
  return impacts;
}

bool SessionManager::previewFrame(Mat &frame) const
{
  {
    lock_guard<mutex> lock(preview_mutex_);
    if (latest_frame_.empty())
      return false;
    frame = latest_frame_.clone();
  }

  lock_guard<mutex> lock(state_mutex_);
  if (has_profile_)
    visualization::drawTargetOverlay(frame, profile_);
  if (has_session_)
    visualization::drawImpacts(frame, session_.impacts);
  return true;
}

bool SessionManager::reopenSource(string &error)
{
  lock_guard<mutex> lock(source_mutex_);
  try
  {
    log_info("Reopening frame source...");
    source_->close();
    source_->open(Size(config_.camera.width, config_.camera.height), config_.camera.fps);
    source_failed_ = false;
    return true;
  }
  catch (const camera::CameraError &e)
  {
    source_failed_ = true;
    error = e.what();
    log_error("Frame source could not be reopened: " + error);
    return false;
  }
}

void SessionManager::enterError(ErrorKind kind, const string &message)
{
  log_error(errors::errorKindName(kind) + ": " + message);

  {
    lock_guard<mutex> lock(state_mutex_);
    finalizeSessionLocked(timeutil::nowMs(), kind, message);
    last_error_ = kind;
    last_error_message_ = message;
    if (!shutting_down_)
      state_ = DetectorState::ERROR;

    lock_guard<mutex> detector_lock(detector_mutex_);
    detector_->disarm();

    publish("state", session_.id);
  }
}

void SessionManager::acquisitionLoop()
{
  log_debug("Acquisition worker started");

  while (!stop_requested_)
  {
    // Idle until an operator calibration reopens the camera
    if (source_failed_)
    {
      this_thread::sleep_for(chrono::milliseconds(50));
      continue;
    }

    try
    {
      Frame frame;
      {
        lock_guard<mutex> lock(source_mutex_);
        if (!source_->isOpen())
        {
          throw camera::CameraError(ErrorKind::CAMERA_UNAVAILABLE, "Frame source is not open");
        }
        frame = source_->nextFrame();
      }

      // Drops are counted by the queue, never reported
      frames_.push(std::move(frame));
    }
    catch (const camera::CameraError &e)
    {
      if (e.kind() == ErrorKind::CAPTURE_TIMEOUT)
      {
        log_warning("Frame read timed out: " + string(e.what()));
        continue;
      }

      source_failed_ = true;
      if (!stop_requested_)
        enterError(e.kind(), e.what());
    }
    catch (const cv::Exception &e)
    {
      source_failed_ = true;
      if (!stop_requested_)
        enterError(ErrorKind::CAMERA_UNAVAILABLE, "Capture failed: " + string(e.what()));
    }
  }

  log_debug("Acquisition worker stopped");
}

void SessionManager::detectionLoop()
{
  log_debug("Detection worker started");

  while (!stop_requested_)
  {
    // Calibration takes the frames itself
    if (state() == DetectorState::CALIBRATING)
    {
      this_thread::sleep_for(chrono::milliseconds(10));
      continue;
    }

    Frame frame;
    if (!frames_.pop(frame, config_.session.frame_wait_ms))
      continue;

    {
      lock_guard<mutex> lock(preview_mutex_);
      latest_frame_ = frame.image;
    }

    processFrame(frame);
  }

  log_debug("Detection worker stopped");
}

void SessionManager::processFrame(const Frame &frame)
{
  if (state() != DetectorState::DETECTING)
    return;

  vector<Impact> impacts;
  uint64_t generation = 0;

  try
  {
    lock_guard<mutex> lock(detector_mutex_);
    if (!detector_->isArmed())
      return;
    impacts = detector_->feed(frame);
    generation = arm_generation_;
  }
  catch (const exception &e)
  {
    enterError(ErrorKind::DETECTION_FAULT, "Detector failed: " + string(e.what()));
    return;
  }

  if (!impacts.empty())
    recordImpacts(impacts, generation);
}

void SessionManager::recordImpacts(const vector<Impact> &impacts, uint64_t generation)
{
  lock_guard<mutex> lock(state_mutex_);

  // Session was stopped or reset while the frame was processed
  if (state_ != DetectorState::DETECTING || !has_session_ || !session_.active || generation != arm_generation_)
  {
    log_debug("Discarding " + to_string(impacts.size()) + " impacts from a finished arming");
    return;
  }

  for (const auto &detected : impacts)
  {
    Impact impact = detected;
    int expected = static_cast<int>(session_.impacts.size()) + 1;
    if (impact.sequence != expected)
    {
      log_warning("Impact sequence " + to_string(impact.sequence) + " renumbered to " + to_string(expected));
      impact.sequence = expected;
    }

    session_.impacts.push_back(impact);

    if (!store_->appendImpact(session_.id, impact))
    {
      log_error("Impact #" + to_string(impact.sequence) + " of session " + session_.id + " was not persisted");
    }

    publish("impact", session_.id, &impact);
  }
}
