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

#include "tandem.h"

#include <utility>

#include <api/audio_codecs/builtin_audio_decoder_factory.h>
#include <api/audio_codecs/builtin_audio_encoder_factory.h>
#include <api/create_peerconnection_factory.h>
#include <api/task_queue/default_task_queue_factory.h>
#include <api/video_codecs/video_decoder_factory_template.h>
#include <api/video_codecs/video_decoder_factory_template_dav1d_adapter.h>
#include <api/video_codecs/video_decoder_factory_template_libvpx_vp8_adapter.h>
#include <api/video_codecs/video_decoder_factory_template_libvpx_vp9_adapter.h>
#include <api/video_codecs/video_decoder_factory_template_open_h264_adapter.h>
#include <api/video_codecs/video_encoder_factory_template.h>
#include <api/video_codecs/video_encoder_factory_template_libaom_av1_adapter.h>
#include <api/video_codecs/video_encoder_factory_template_libvpx_vp8_adapter.h>
#include <api/video_codecs/video_encoder_factory_template_libvpx_vp9_adapter.h>
#include <api/video_codecs/video_encoder_factory_template_open_h264_adapter.h>
#include <rtc_base/event.h>
#include <rtc_base/logging.h>
#include <rtc_base/ssl_adapter.h>
#include <system_wrappers/include/clock.h>

namespace {

constexpr webrtc::TimeDelta kLiveCheckInterval = webrtc::TimeDelta::Millis(100);

void TandemThreadSetName(rtc::Thread* thread, const char* name) {
  if (thread) {
    thread->SetName(name, nullptr);
  }
}

}  // namespace

void TandemApplication::rtcInitialize() {
  rtc::InitializeSSL();
}

void TandemApplication::rtcCleanup() {
  rtc::CleanupSSL();
}

TandemApplication::TandemApplication(Options opts) : opts_(std::move(opts)) {}

TandemApplication::~TandemApplication() {
  Shutdown();
}

bool TandemApplication::Initialize() {
  pss_ = std::make_unique<rtc::PhysicalSocketServer>();
  network_thread_ = std::make_unique<rtc::Thread>(pss_.get());
  network_thread_->socketserver()->SetMessageQueue(network_thread_.get());
  worker_thread_ = rtc::Thread::Create();
  signaling_thread_ = rtc::Thread::Create();
  session_thread_ = rtc::Thread::Create();
  TandemThreadSetName(network_thread_.get(), "Network");
  TandemThreadSetName(worker_thread_.get(), "Worker");
  TandemThreadSetName(signaling_thread_.get(), "Signaling");
  TandemThreadSetName(session_thread_.get(), "Session");

  if (!network_thread_->Start() || !worker_thread_->Start() ||
      !signaling_thread_->Start() || !session_thread_->Start()) {
    RTC_LOG(LS_ERROR) << "Failed to start threads";
    return false;
  }

  if (!CreatePeerConnectionFactory()) {
    return false;
  }

  if (is_initiator()) {
    if (!CreateCamera()) {
      return false;
    }
  } else {
    remote_sink_ = std::make_unique<webrtc::FrameCountingSink>(opts_.debug.frames);
  }

  session_factory_ = std::make_unique<WebRtcMediaSessionFactory>(
      opts_, signaling_thread_.get(), peer_connection_factory_,
      camera_ ? camera_->video_source() : nullptr, video_track_, remote_sink_.get());

  channel_ = std::make_unique<TcpSignalChannel>(opts_, network_thread_.get(), pss_.get());

  controller_ = std::make_unique<NegotiationController>(
      NegotiationController::ConfigFromOptions(opts_), session_thread_.get(), channel_.get(),
      session_factory_.get(), this);

  monitor_ = std::make_unique<TrackMonitor>(
      TrackMonitor::ConfigFromOptions(opts_), session_thread_.get(),
      webrtc::Clock::GetRealTimeClock(), camera_.get(), controller_.get());
  if (remote_sink_) {
    remote_sink_->SetFrameObserver(monitor_.get());
  }

  RTC_LOG(LS_INFO) << "Initialized as " << opts_.mode;
  return true;
}

bool TandemApplication::CreatePeerConnectionFactory() {
  task_queue_factory_ = webrtc::CreateDefaultTaskQueueFactory();
  webrtc::TaskQueueFactory* task_queue_factory = task_queue_factory_.get();

  // The audio device module lives on the worker thread. Video is the only
  // media sent, so a missing sound card falls back to the dummy layer.
  rtc::Event adm_created;
  worker_thread_->PostTask([this, task_queue_factory, &adm_created]() {
    audio_device_module_ = webrtc::AudioDeviceModule::Create(
        webrtc::AudioDeviceModule::kPlatformDefaultAudio, task_queue_factory);
    if (!audio_device_module_ || audio_device_module_->Init() != 0) {
      RTC_LOG(LS_WARNING) << "Platform audio unavailable, switching to DummyAudio layer";
      audio_device_module_ = webrtc::AudioDeviceModule::Create(
          webrtc::AudioDeviceModule::kDummyAudio, task_queue_factory);
      if (audio_device_module_) {
        audio_device_module_->Init();
      }
    }
    adm_created.Set();
  });
  adm_created.Wait(webrtc::TimeDelta::Seconds(1));
  if (!audio_device_module_) {
    RTC_LOG(LS_ERROR) << "Audio device module creation failed";
    return false;
  }

  peer_connection_factory_ = webrtc::CreatePeerConnectionFactory(
      network_thread_.get(),
      worker_thread_.get(),
      signaling_thread_.get(),
      audio_device_module_,
      webrtc::CreateBuiltinAudioEncoderFactory(),
      webrtc::CreateBuiltinAudioDecoderFactory(),
      std::make_unique<webrtc::VideoEncoderFactoryTemplate<
          webrtc::LibvpxVp8EncoderTemplateAdapter,
          webrtc::LibvpxVp9EncoderTemplateAdapter,
          webrtc::OpenH264EncoderTemplateAdapter,
          webrtc::LibaomAv1EncoderTemplateAdapter>>(),
      std::make_unique<webrtc::VideoDecoderFactoryTemplate<
          webrtc::LibvpxVp8DecoderTemplateAdapter,
          webrtc::LibvpxVp9DecoderTemplateAdapter,
          webrtc::OpenH264DecoderTemplateAdapter,
          webrtc::Dav1dDecoderTemplateAdapter>>(),
      nullptr,  // audio_mixer
      nullptr   // audio_processing
  );
  if (!peer_connection_factory_) {
    RTC_LOG(LS_ERROR) << "Failed to create PeerConnectionFactory";
    return false;
  }
  return true;
}

bool TandemApplication::CreateCamera() {
  auto devices = webrtc::CameraCaptureSource::ListDevices();
  if (devices.empty()) {
    RTC_LOG(LS_ERROR) << "No camera found";
    return false;
  }
  for (const auto& device : devices) {
    RTC_LOG(LS_INFO) << "Camera: " << device;
  }

  camera_ = std::make_unique<webrtc::CameraCaptureSource>(
      signaling_thread_.get(), opts_.camera, opts_.width, opts_.height, opts_.fps);
  video_track_ = peer_connection_factory_->CreateVideoTrack(camera_->video_source(), "video");
  if (!video_track_) {
    RTC_LOG(LS_ERROR) << "Failed to create video track";
    return false;
  }
  camera_->SetTrack(video_track_);
  return true;
}

bool TandemApplication::Start() {
  if (started_) {
    return true;
  }

  bool ok = session_thread_->BlockingCall([this]() {
    controller_->Start();
    if (camera_ && !camera_->Start()) {
      return false;
    }
    monitor_->Start();
    if (camera_) {
      OfferWhenCameraIsLive();
    }
    return true;
  });
  if (!ok) {
    RTC_LOG(LS_ERROR) << "Failed to start camera";
    return false;
  }

  channel_->SetObserver(controller_.get());
  if (!channel_->Start(DiscoveryRoleFromOptions(opts_))) {
    RTC_LOG(LS_ERROR) << "Failed to start signaling channel";
    return false;
  }

  started_ = true;
  RTC_LOG(LS_INFO) << "Started, discovery " << ToString(DiscoveryRoleFromOptions(opts_));
  return true;
}

void TandemApplication::OfferWhenCameraIsLive() {
  offer_when_live_ = webrtc::RepeatingTaskHandle::Start(session_thread_.get(), [this]() {
    if (camera_->video_source()->is_live()) {
      RTC_LOG(LS_INFO) << "Camera is live, offering";
      controller_->CreateOffer();
      offer_when_live_.Stop();
    }
    return kLiveCheckInterval;
  });
}

void TandemApplication::Shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  RTC_LOG(LS_INFO) << "Shutting down";

  if (session_thread_ && controller_) {
    session_thread_->BlockingCall([this]() {
      offer_when_live_.Stop();
      monitor_->Stop();
      controller_->Shutdown();
      if (camera_) {
        camera_->Stop();
      }
    });
  }

  if (network_thread_ && channel_) {
    channel_->Stop();
    network_thread_->BlockingCall([this]() { channel_.reset(); });
  }

  if (session_thread_) {
    session_thread_->BlockingCall([this]() {
      monitor_.reset();
      controller_.reset();
    });
  }

  session_factory_.reset();
  video_track_ = nullptr;
  camera_.reset();
  remote_sink_.reset();
  peer_connection_factory_ = nullptr;

  if (worker_thread_ && audio_device_module_) {
    worker_thread_->BlockingCall([this]() {
      audio_device_module_->Terminate();
      audio_device_module_ = nullptr;
    });
  }

  if (session_thread_) session_thread_->Stop();
  if (signaling_thread_) signaling_thread_->Stop();
  if (worker_thread_) worker_thread_->Stop();
  if (network_thread_) network_thread_->Stop();
  RTC_LOG(LS_INFO) << "Shutdown complete";
}

NegotiationState TandemApplication::state() {
  if (!session_thread_ || !controller_) {
    return NegotiationState::kIdle;
  }
  return session_thread_->BlockingCall([this]() { return controller_->state(); });
}

void TandemApplication::OnNegotiationStateChanged(NegotiationState state) {
  if (state == NegotiationState::kStable) {
    RTC_LOG(LS_INFO) << "Session negotiated";
  } else if (state == NegotiationState::kFailed) {
    RTC_LOG(LS_WARNING) << "Session failed"
                        << (is_initiator() ? ", ICE restart pending" : ", waiting for offer");
  }
}

void TandemApplication::OnProtocolError(const std::string& reason) {
  ++protocol_errors_;
}
