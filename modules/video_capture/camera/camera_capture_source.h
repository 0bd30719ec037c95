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

#ifndef VIDEO_CAPTURE_CAMERA_CAPTURE_SOURCE_H_
#define VIDEO_CAPTURE_CAMERA_CAPTURE_SOURCE_H_

#include <atomic>
#include <string>
#include <vector>

#include "api/media_stream_interface.h"
#include "api/scoped_refptr.h"
#include "modules/video_capture/video_capture.h"
#include "rtc_base/thread.h"

#include "examples/tandem/capture_source.h"
#include "examples/tandem/video.h"

namespace webrtc {

// Camera capture through the platform VideoCaptureModule. Frames are pushed
// into a FrameTapVideoSource that the published video track is created from.
//
// Stop() releases the device so that a restart reopens it from scratch, and
// leaves the source ended until the first frame after Start().
class CameraCaptureSource : public CaptureSourceInterface {
 public:
  // `device` is a device name or unique id; empty picks the first camera.
  // The track source reports its state on `signaling_thread`.
  CameraCaptureSource(rtc::Thread* signaling_thread,
                      const std::string& device,
                      int width,
                      int height,
                      int fps);
  ~CameraCaptureSource() override;

  // Lists "name (unique id)" for every camera, for diagnostics.
  static std::vector<std::string> ListDevices();

  rtc::scoped_refptr<FrameTapVideoSource> video_source() const { return source_; }

  // The track created from video_source(); enabled and ready state are read
  // from it once set.
  void SetTrack(rtc::scoped_refptr<VideoTrackInterface> track);

  // CaptureSourceInterface
  bool Start() override;
  void Stop() override;
  bool IsRunning() const override { return running_.load(); }
  bool IsEnabled() const override;
  void SetEnabled(bool enabled) override;
  TrackReadyState ReadyState() const override;
  void SetFrameObserver(FrameObserver* observer) override;

 private:
  // Unique id of the configured camera, empty when none matches.
  std::string FindDevice() const;

  const std::string device_;
  const int width_;
  const int height_;
  const int fps_;

  rtc::scoped_refptr<FrameTapVideoSource> source_;
  rtc::scoped_refptr<VideoCaptureModule> module_;
  rtc::scoped_refptr<VideoTrackInterface> track_;
  std::atomic<bool> running_{false};
  std::atomic<bool> enabled_{true};
};

}  // namespace webrtc

#endif  // VIDEO_CAPTURE_CAMERA_CAPTURE_SOURCE_H_
