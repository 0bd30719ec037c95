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

#ifndef WEBRTC_TANDEM_CAPTURE_SOURCE_H_
#define WEBRTC_TANDEM_CAPTURE_SOURCE_H_

#include <cstdint>

#include "types.h"

// Notified for every frame delivered, on the capture thread.
class FrameObserver {
 public:
  virtual void OnFrameCaptured(int64_t timestamp_us) = 0;

 protected:
  virtual ~FrameObserver() = default;
};

// A local video source the track monitor can restart.
class CaptureSourceInterface {
 public:
  virtual ~CaptureSourceInterface() = default;

  virtual bool Start() = 0;
  virtual void Stop() = 0;
  virtual bool IsRunning() const = 0;

  // Enabled flag of the published track.
  virtual bool IsEnabled() const = 0;
  virtual void SetEnabled(bool enabled) = 0;

  virtual TrackReadyState ReadyState() const = 0;

  virtual void SetFrameObserver(FrameObserver* observer) = 0;
};

#endif  // WEBRTC_TANDEM_CAPTURE_SOURCE_H_
