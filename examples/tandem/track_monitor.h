/*
 *  (c) 2025, wilddolphin2022
 *  For WebRTCsays.ai project
 *  https://github.com/wilddolphin2022
 *
 *  Use of this source code is governed by a BSD-style license
 *  that can be found in the LICENSE file in the root of the source
 *  tree. An additional intellectual property rights grant can be found
 *  in the file PATENTS.  All contributing project authors may
 *  be found in the AUTHORS file in the root of the source tree.
 */

#ifndef WEBRTC_TANDEM_TRACK_MONITOR_H_
#define WEBRTC_TANDEM_TRACK_MONITOR_H_

#include <atomic>
#include <cstdint>

#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "api/units/time_delta.h"
#include "rtc_base/task_utils/repeating_task.h"
#include "system_wrappers/include/clock.h"

#include "capture_source.h"
#include "negotiation_controller.h"
#include "option.h"

// Periodic watchdog over video frame delivery.
//
// In local capture mode it restarts a capture source that stopped producing
// frames (or whose track ended) and then asks the controller for a restart
// offer, deferring the request while a negotiation is under way. It also
// re-enables a track that was disabled behind the user's back.
//
// In remote watch mode it only reports when remote frames freeze.
//
// Runs on `queue`; OnFrameCaptured() may be called from any thread.
class TANDEM_API TrackMonitor : public FrameObserver {
 public:
  enum class Mode { kLocalCapture, kRemoteWatch };

  struct Config {
    Mode mode = Mode::kLocalCapture;
    webrtc::TimeDelta health_check_interval = webrtc::TimeDelta::Seconds(5);
    webrtc::TimeDelta stall_threshold = webrtc::TimeDelta::Seconds(6);
    webrtc::TimeDelta restart_delay = webrtc::TimeDelta::Seconds(1);
    webrtc::TimeDelta remote_freeze_threshold = webrtc::TimeDelta::Seconds(3);
    bool log_frames = false;
  };

  static Config ConfigFromOptions(const Options& opts);

  // `capture` and `target` are only used in local capture mode.
  TrackMonitor(const Config& config,
               webrtc::TaskQueueBase* queue,
               webrtc::Clock* clock,
               CaptureSourceInterface* capture,
               RenegotiationTarget* target);
  ~TrackMonitor() override;

  // Starts the periodic check. Queue only.
  void Start();
  void Stop();

  // One health check. Queue only.
  void RunHealthCheck();

  // The user turned the camera off (or back on); a disabled track is left
  // alone while this is set.
  void SetUserDisabled(bool disabled);

  // FrameObserver
  void OnFrameCaptured(int64_t timestamp_us) override;

  int64_t frames_seen() const { return frames_seen_.load(); }
  int capture_restarts() const { return capture_restarts_; }
  int renegotiation_requests() const { return renegotiation_requests_; }
  int freezes_reported() const { return freezes_reported_; }
  bool renegotiation_pending() const { return renegotiation_pending_; }
  bool restarting() const { return restarting_; }

 private:
  void CheckLocalCapture(int64_t now_ms);
  void CheckRemoteFrames(int64_t now_ms);
  void RestartCapture(const char* reason);
  void FinishCaptureRestart();
  void TryRenegotiate();

  const Config config_;
  webrtc::TaskQueueBase* const queue_;
  webrtc::Clock* const clock_;
  CaptureSourceInterface* const capture_;
  RenegotiationTarget* const target_;

  webrtc::RepeatingTaskHandle health_check_;
  std::atomic<int64_t> last_frame_ms_{-1};
  std::atomic<int64_t> frames_seen_{0};
  int64_t frames_at_last_check_ = 0;
  // Start of the current capture run, the reference before its first frame.
  int64_t capture_started_ms_ = 0;

  bool user_disabled_ = false;
  bool restarting_ = false;
  bool renegotiation_pending_ = false;
  bool frozen_ = false;

  int capture_restarts_ = 0;
  int renegotiation_requests_ = 0;
  int freezes_reported_ = 0;

  webrtc::ScopedTaskSafetyDetached safety_;
};

#endif  // WEBRTC_TANDEM_TRACK_MONITOR_H_
