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

#ifndef WEBRTC_TANDEM_VIDEO_H_
#define WEBRTC_TANDEM_VIDEO_H_

#include <atomic>
#include <cstdint>

#include "api/video/video_frame.h"
#include "api/video/video_sink_interface.h"
#include "media/base/video_broadcaster.h"
#include "api/scoped_refptr.h"
#include "pc/video_track_source.h"
#include "rtc_base/checks.h"
#include "rtc_base/logging.h"
#include "rtc_base/thread.h"

#include "capture_source.h"

namespace webrtc {

// Track source fed by a capture module. Frames are passed through to the
// encoder and counted by the FrameObserver on the way.
//
// Frames arrive on the capture thread; the source state only ever changes
// on `signaling_thread`, where the track observes it. is_live() and
// is_ended() may be read from any thread.
class FrameTapVideoSource : public webrtc::VideoTrackSource,
                            public rtc::VideoSinkInterface<webrtc::VideoFrame> {
 public:
  explicit FrameTapVideoSource(rtc::Thread* signaling_thread)
      : webrtc::VideoTrackSource(/*remote=*/false),
        signaling_thread_(signaling_thread) {
    RTC_DCHECK(signaling_thread_);
  }

  void SetFrameObserver(FrameObserver* observer) { observer_ = observer; }

  // Capture was stopped. The source stays ended until the next frame.
  void MarkEnded() {
    live_ = false;
    if (!ended_.exchange(true)) {
      PostState(webrtc::MediaSourceInterface::kEnded);
    }
  }

  bool is_live() const { return live_.load(); }
  bool is_ended() const { return ended_.load(); }

  // rtc::VideoSinkInterface implementation, called on the capture thread.
  void OnFrame(const webrtc::VideoFrame& frame) override {
    if (!live_.exchange(true)) {
      ended_ = false;
      PostState(webrtc::MediaSourceInterface::kLive);
    }
    broadcaster_.OnFrame(frame);
    FrameObserver* observer = observer_.load();
    if (observer) {
      observer->OnFrameCaptured(frame.timestamp_us());
    }
  }
  void OnDiscardedFrame() override {}

  rtc::VideoSinkWants wants() const { return broadcaster_.wants(); }

 protected:
  rtc::VideoSourceInterface<webrtc::VideoFrame>* source() override {
    return &broadcaster_;
  }

 private:
  void PostState(webrtc::MediaSourceInterface::SourceState state) {
    signaling_thread_->PostTask(
        [self = rtc::scoped_refptr<FrameTapVideoSource>(this), state]() {
          self->SetState(state);
        });
  }

  rtc::Thread* const signaling_thread_;
  rtc::VideoBroadcaster broadcaster_;
  std::atomic<FrameObserver*> observer_{nullptr};
  std::atomic<bool> live_{false};
  std::atomic<bool> ended_{false};
};

// Sink attached to the remote video track. Nothing is rendered; frames are
// counted and reported to the FrameObserver.
class FrameCountingSink : public rtc::VideoSinkInterface<webrtc::VideoFrame> {
 public:
  explicit FrameCountingSink(bool log_frames = false) : log_frames_(log_frames) {}

  void SetFrameObserver(FrameObserver* observer) { observer_ = observer; }

  void OnFrame(const webrtc::VideoFrame& frame) override {
    int64_t count = ++frames_;
    if (frame.width() != width_ || frame.height() != height_) {
      width_ = frame.width();
      height_ = frame.height();
      RTC_LOG(LS_INFO) << "Remote video " << width_ << "x" << height_;
    }
    if (log_frames_ && count % 100 == 0) {
      RTC_LOG(LS_INFO) << "Received " << count << " remote frames";
    }
    FrameObserver* observer = observer_.load();
    if (observer) {
      observer->OnFrameCaptured(frame.timestamp_us());
    }
  }

  int64_t frames() const { return frames_.load(); }

 private:
  const bool log_frames_;
  std::atomic<int64_t> frames_{0};
  int width_ = 0;
  int height_ = 0;
  std::atomic<FrameObserver*> observer_{nullptr};
};

}  // namespace webrtc

#endif  // WEBRTC_TANDEM_VIDEO_H_
