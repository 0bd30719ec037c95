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

#include "modules/video_capture/camera/camera_capture_source.h"

#include <memory>
#include <vector>

#include "modules/video_capture/video_capture_factory.h"
#include "rtc_base/logging.h"

namespace webrtc {

namespace {

constexpr uint32_t kNameSize = 256;

}  // namespace

CameraCaptureSource::CameraCaptureSource(rtc::Thread* signaling_thread,
                                         const std::string& device,
                                         int width,
                                         int height,
                                         int fps)
    : device_(device),
      width_(width),
      height_(height),
      fps_(fps),
      source_(rtc::make_ref_counted<FrameTapVideoSource>(signaling_thread)) {}

CameraCaptureSource::~CameraCaptureSource() {
  Stop();
  source_->SetFrameObserver(nullptr);
}

// static
std::vector<std::string> CameraCaptureSource::ListDevices() {
  std::vector<std::string> devices;
  std::unique_ptr<VideoCaptureModule::DeviceInfo> info(
      VideoCaptureFactory::CreateDeviceInfo());
  if (!info) {
    return devices;
  }
  for (uint32_t i = 0; i < info->NumberOfDevices(); ++i) {
    char name[kNameSize] = {0};
    char unique_id[kNameSize] = {0};
    if (info->GetDeviceName(i, name, kNameSize, unique_id, kNameSize) == 0) {
      devices.push_back(std::string(name) + " (" + unique_id + ")");
    }
  }
  return devices;
}

std::string CameraCaptureSource::FindDevice() const {
  std::unique_ptr<VideoCaptureModule::DeviceInfo> info(
      VideoCaptureFactory::CreateDeviceInfo());
  if (!info) {
    RTC_LOG(LS_ERROR) << "No video capture device info";
    return "";
  }
  for (uint32_t i = 0; i < info->NumberOfDevices(); ++i) {
    char name[kNameSize] = {0};
    char unique_id[kNameSize] = {0};
    if (info->GetDeviceName(i, name, kNameSize, unique_id, kNameSize) != 0) {
      continue;
    }
    if (device_.empty() || device_ == name || device_ == unique_id) {
      RTC_LOG(LS_INFO) << "Using camera '" << name << "'";
      return unique_id;
    }
  }
  RTC_LOG(LS_ERROR) << "Camera '" << device_ << "' not found";
  return "";
}

bool CameraCaptureSource::Start() {
  if (running_) {
    return true;
  }

  const std::string unique_id = FindDevice();
  if (unique_id.empty()) {
    return false;
  }
  module_ = VideoCaptureFactory::Create(unique_id.c_str());
  if (!module_) {
    RTC_LOG(LS_ERROR) << "Failed to open camera " << unique_id;
    return false;
  }

  VideoCaptureCapability requested;
  requested.width = width_;
  requested.height = height_;
  requested.maxFPS = fps_;
  requested.videoType = VideoType::kI420;

  VideoCaptureCapability capability = requested;
  std::unique_ptr<VideoCaptureModule::DeviceInfo> info(
      VideoCaptureFactory::CreateDeviceInfo());
  if (info && info->GetBestMatchedCapability(unique_id.c_str(), requested, capability) < 0) {
    capability = requested;
  }

  module_->RegisterCaptureDataCallback(source_.get());
  if (module_->StartCapture(capability) != 0) {
    RTC_LOG(LS_ERROR) << "Failed to start capture at " << capability.width << "x"
                      << capability.height << "@" << capability.maxFPS;
    module_->DeRegisterCaptureDataCallback();
    module_ = nullptr;
    return false;
  }

  RTC_LOG(LS_INFO) << "Capturing " << capability.width << "x" << capability.height << "@"
                   << capability.maxFPS;
  running_ = true;
  return true;
}

void CameraCaptureSource::Stop() {
  if (!module_) {
    running_ = false;
    return;
  }
  module_->StopCapture();
  module_->DeRegisterCaptureDataCallback();
  module_ = nullptr;
  running_ = false;
  source_->MarkEnded();
  RTC_LOG(LS_INFO) << "Camera capture stopped";
}

void CameraCaptureSource::SetTrack(rtc::scoped_refptr<VideoTrackInterface> track) {
  track_ = track;
  if (track_) {
    track_->set_enabled(enabled_.load());
  }
}

bool CameraCaptureSource::IsEnabled() const {
  return track_ ? track_->enabled() : enabled_.load();
}

void CameraCaptureSource::SetEnabled(bool enabled) {
  enabled_ = enabled;
  if (track_) {
    track_->set_enabled(enabled);
  }
}

TrackReadyState CameraCaptureSource::ReadyState() const {
  if (track_ && track_->state() == MediaStreamTrackInterface::kEnded) {
    return TrackReadyState::kEnded;
  }
  if (source_->is_ended()) {
    return TrackReadyState::kEnded;
  }
  return TrackReadyState::kLive;
}

void CameraCaptureSource::SetFrameObserver(FrameObserver* observer) {
  source_->SetFrameObserver(observer);
}

}  // namespace webrtc
