#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <opencv2/opencv.hpp>

#include "camera/frame_source.hpp"
#include "communication/frame_queue.hpp"
#include "communication/impact_queue.hpp"
#include "config/config.hpp"
#include "detector/detector_interface.hpp"
#include "session_store.hpp"
#include "session_types.hpp"

using namespace std;

// Owns calibration state, the detector and the active session.
// Runs the acquisition and detection workers; every command is safe to call from any thread.
class SessionManager
{
public:
  SessionManager(const Config &config,
                 unique_ptr<FrameSource> source,
                 shared_ptr<SessionStore> store,
                 shared_ptr<ImpactQueue> events,
                 unique_ptr<DetectorInterface> detector = nullptr);
  ~SessionManager();

  SessionManager(const SessionManager &) = delete;
  SessionManager &operator=(const SessionManager &) = delete;

  // Open the frame source and launch the workers. False when the camera is unavailable
  // (the manager then sits in Error until a calibrate() reopens it).
  bool start();

  // Use a previously stored profile, state becomes Armed
  bool restoreCalibration(const CalibrationProfile &profile);

  // Commands
  CommandResult calibrate(TargetSize target_size);
  CommandResult calibrate(const string &target_name); // Empty name = configured default
  CommandResult startDetection();
  CommandResult stopDetection();
  CommandResult resetSession();
  CommandResult shutdown();

  // Queries
  StatusSnapshot status() const;
  DetectorState state() const;
  vector<Impact> impactsSince(int sequence, string &session_id) const;
  bool previewFrame(cv::Mat &frame) const; // Latest frame with target and impact overlay

  // True once shutdown() has completed, waits up to timeout_ms
  bool waitForShutdown(int timeout_ms);
  bool isShuttingDown() const { return shutting_down_; }

private:
  void acquisitionLoop();
  void detectionLoop();
  void processFrame(const Frame &frame);
  void recordImpacts(const vector<Impact> &impacts, uint64_t generation);
  void enterError(ErrorKind kind, const string &message);
  bool reopenSource(string &error);

  // Require state_mutex_
  Session createSessionLocked(uint64_t now);
  void finalizeSessionLocked(uint64_t now, ErrorKind fault, const string &message);
  CommandResult resultLocked(bool success, ErrorKind error, const string &message) const;
  void publish(const string &type, const string &session_id, const Impact *impact = nullptr);

  Config config_;
  unique_ptr<FrameSource> source_;
  shared_ptr<SessionStore> store_;
  shared_ptr<ImpactQueue> events_;
  unique_ptr<DetectorInterface> detector_;
  FrameQueue frames_;

  // Session / state machine
  mutable mutex state_mutex_;
  DetectorState state_ = DetectorState::IDLE;
  bool has_profile_ = false;
  CalibrationProfile profile_;
  bool has_session_ = false;
  Session session_; // Active session, or the last finished one
  string last_session_id_ = "";
  ErrorKind last_error_ = ErrorKind::NONE;
  string last_error_message_ = "";
  uint64_t arm_generation_ = 0;

  // Detector access, never held while waiting on state_mutex_
  mutable mutex detector_mutex_;

  // Frame source access (reads vs. reopen/close)
  mutex source_mutex_;
  atomic<bool> source_failed_{false};

  mutable mutex preview_mutex_;
  cv::Mat latest_frame_;

  // Workers
  thread acquisition_thread_;
  thread detection_thread_;
  atomic<bool> started_{false};
  atomic<bool> stop_requested_{false};
  atomic<bool> shutting_down_{false};
  uint64_t started_at_ = 0;

  mutex shutdown_mutex_;
  condition_variable shutdown_cv_;
  bool shutdown_complete_ = false;
};
