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

#include "rtc_base/checks.h"
#include "rtc_base/logging.h"

#include "track_monitor.h"

// static
TrackMonitor::Config TrackMonitor::ConfigFromOptions(const Options& opts) {
  Config config;
  config.mode = PeerRoleFromOptions(opts) == PeerRole::kInitiator ? Mode::kLocalCapture
                                                                  : Mode::kRemoteWatch;
  config.health_check_interval = webrtc::TimeDelta::Millis(opts.health_check_interval_ms);
  config.stall_threshold = webrtc::TimeDelta::Millis(opts.stall_threshold_ms);
  config.restart_delay = webrtc::TimeDelta::Millis(opts.capture_restart_delay_ms);
  config.remote_freeze_threshold =
      webrtc::TimeDelta::Millis(opts.remote_freeze_threshold_ms);
  config.log_frames = opts.debug.frames;
  return config;
}

TrackMonitor::TrackMonitor(const Config& config,
                           webrtc::TaskQueueBase* queue,
                           webrtc::Clock* clock,
                           CaptureSourceInterface* capture,
                           RenegotiationTarget* target)
    : config_(config), queue_(queue), clock_(clock), capture_(capture), target_(target) {
  RTC_DCHECK(queue_);
  RTC_DCHECK(clock_);
  RTC_DCHECK(config_.mode == Mode::kRemoteWatch || (capture_ && target_));
}

TrackMonitor::~TrackMonitor() {
  Stop();
}

void TrackMonitor::Start() {
  RTC_DCHECK(queue_->IsCurrent());
  capture_started_ms_ = clock_->TimeInMilliseconds();
  if (capture_) {
    capture_->SetFrameObserver(this);
  }
  if (health_check_.Running()) {
    return;
  }
  RTC_LOG(LS_INFO) << "Track monitor checking every " << config_.health_check_interval.ms()
                   << " ms";
  health_check_ = webrtc::RepeatingTaskHandle::DelayedStart(
      queue_, config_.health_check_interval, [this]() {
        RunHealthCheck();
        return config_.health_check_interval;
      });
}

void TrackMonitor::Stop() {
  if (health_check_.Running()) {
    health_check_.Stop();
  }
  if (capture_) {
    capture_->SetFrameObserver(nullptr);
  }
}

void TrackMonitor::SetUserDisabled(bool disabled) {
  RTC_DCHECK(queue_->IsCurrent());
  user_disabled_ = disabled;
  if (capture_) {
    capture_->SetEnabled(!disabled);
  }
}

void TrackMonitor::OnFrameCaptured(int64_t timestamp_us) {
  last_frame_ms_ = clock_->TimeInMilliseconds();
  ++frames_seen_;
}

void TrackMonitor::RunHealthCheck() {
  RTC_DCHECK(queue_->IsCurrent());
  const int64_t now_ms = clock_->TimeInMilliseconds();
  if (config_.log_frames) {
    const int64_t frames = frames_seen_.load();
    RTC_LOG(LS_INFO) << "Frames in last check interval: " << frames - frames_at_last_check_;
    frames_at_last_check_ = frames;
  }
  if (config_.mode == Mode::kLocalCapture) {
    CheckLocalCapture(now_ms);
  } else {
    CheckRemoteFrames(now_ms);
  }
}

void TrackMonitor::CheckLocalCapture(int64_t now_ms) {
  if (restarting_) {
    return;
  }

  if (!user_disabled_ && !capture_->IsEnabled()) {
    RTC_LOG(LS_WARNING) << "Video track disabled unexpectedly, re-enabling";
    capture_->SetEnabled(true);
  }

  if (renegotiation_pending_) {
    TryRenegotiate();
  }

  if (user_disabled_) {
    return;
  }

  const int64_t last_frame_ms = last_frame_ms_.load();
  const int64_t reference_ms =
      last_frame_ms > capture_started_ms_ ? last_frame_ms : capture_started_ms_;
  const bool stalled = now_ms - reference_ms > config_.stall_threshold.ms();
  const bool ended = capture_->ReadyState() == TrackReadyState::kEnded;
  if (!stalled && !ended) {
    return;
  }

  const NegotiationState state = target_->state();
  if (renegotiation_pending_ || (state != NegotiationState::kIdle &&
                                 state != NegotiationState::kStable &&
                                 state != NegotiationState::kFailed)) {
    RTC_LOG(LS_INFO) << "Capture stalled while renegotiation is pending, waiting";
    return;
  }

  if (ended) {
    RestartCapture("track ended");
  } else {
    RTC_LOG(LS_WARNING) << "No frames for " << (now_ms - reference_ms) << " ms";
    RestartCapture("frame stall");
  }
}

void TrackMonitor::RestartCapture(const char* reason) {
  RTC_LOG(LS_WARNING) << "Restarting capture (" << reason << ")";
  restarting_ = true;
  ++capture_restarts_;
  capture_->Stop();
  queue_->PostDelayedTask(webrtc::SafeTask(safety_.flag(), [this]() { FinishCaptureRestart(); }),
                          config_.restart_delay);
}

void TrackMonitor::FinishCaptureRestart() {
  restarting_ = false;
  capture_started_ms_ = clock_->TimeInMilliseconds();
  last_frame_ms_ = -1;
  if (!capture_->Start()) {
    RTC_LOG(LS_ERROR) << "Capture failed to restart, retrying on next check";
    return;
  }
  if (!user_disabled_) {
    capture_->SetEnabled(true);
  }
  renegotiation_pending_ = true;
  TryRenegotiate();
}

void TrackMonitor::TryRenegotiate() {
  const NegotiationState state = target_->state();
  if (state != NegotiationState::kIdle && state != NegotiationState::kStable) {
    RTC_LOG(LS_INFO) << "Deferring renegotiation, controller is " << ToString(state);
    return;
  }
  if (!target_->RequestRenegotiation()) {
    RTC_LOG(LS_INFO) << "Renegotiation refused, retrying on next check";
    return;
  }
  ++renegotiation_requests_;
  renegotiation_pending_ = false;
  RTC_LOG(LS_INFO) << "Renegotiation requested after capture restart";
}

void TrackMonitor::CheckRemoteFrames(int64_t now_ms) {
  const int64_t last_frame_ms = last_frame_ms_.load();
  if (last_frame_ms < 0) {
    return;
  }
  const int64_t silence_ms = now_ms - last_frame_ms;
  if (silence_ms > config_.remote_freeze_threshold.ms()) {
    if (!frozen_) {
      frozen_ = true;
      ++freezes_reported_;
      RTC_LOG(LS_WARNING) << "Remote video frozen, no frames for " << silence_ms << " ms";
    }
  } else if (frozen_) {
    frozen_ = false;
    RTC_LOG(LS_INFO) << "Remote video resumed";
  }
}
