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

#ifndef WEBRTC_TANDEM_TANDEM_H_
#define WEBRTC_TANDEM_TANDEM_H_

#include <atomic>
#include <memory>
#include <string>

#include <api/media_stream_interface.h>
#include <api/peer_connection_interface.h>
#include <api/scoped_refptr.h>
#include <api/task_queue/task_queue_factory.h>
#include <modules/audio_device/include/audio_device.h>
#include <rtc_base/physical_socket_server.h>
#include <rtc_base/task_utils/repeating_task.h>
#include <rtc_base/thread.h>

#include "modules/video_capture/camera/camera_capture_source.h"

#include "negotiation_controller.h"
#include "option.h"
#include "tcp_signal_channel.h"
#include "track_monitor.h"
#include "video.h"
#include "webrtc_media_session.h"

// One peer of a tandem session: the camera side (initiator) or the viewer
// (responder).
//
// Owns the threads and every collaborator. Negotiation and the track monitor
// live on the session thread, sockets on the network thread, and the
// PeerConnections on libwebrtc's signaling and worker threads.
class TANDEM_API TandemApplication : public NegotiationObserver {
 public:
  explicit TandemApplication(Options opts);
  ~TandemApplication() override;

  static void TANDEM_API rtcInitialize();
  static void TANDEM_API rtcCleanup();

  // Starts the threads and builds the PeerConnectionFactory, the camera, the
  // channel, the controller and the monitor.
  bool Initialize();

  // Starts capture, discovery and negotiation.
  bool Start();

  // Tears everything down in reverse order. Safe to call twice.
  void Shutdown();

  // NegotiationObserver, on the session thread.
  void OnNegotiationStateChanged(NegotiationState state) override;
  void OnProtocolError(const std::string& reason) override;

  NegotiationState state();
  int protocol_errors() const { return protocol_errors_.load(); }

 private:
  bool is_initiator() const { return PeerRoleFromOptions(opts_) == PeerRole::kInitiator; }

  bool CreatePeerConnectionFactory();
  bool CreateCamera();
  // Offers once the camera has delivered its first frame.
  void OfferWhenCameraIsLive();

  Options opts_;

  std::unique_ptr<rtc::PhysicalSocketServer> pss_;
  std::unique_ptr<rtc::Thread> network_thread_;
  std::unique_ptr<rtc::Thread> worker_thread_;
  std::unique_ptr<rtc::Thread> signaling_thread_;
  std::unique_ptr<rtc::Thread> session_thread_;

  std::unique_ptr<webrtc::TaskQueueFactory> task_queue_factory_;
  rtc::scoped_refptr<webrtc::AudioDeviceModule> audio_device_module_;
  rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> peer_connection_factory_;

  std::unique_ptr<webrtc::CameraCaptureSource> camera_;
  rtc::scoped_refptr<webrtc::VideoTrackInterface> video_track_;
  std::unique_ptr<webrtc::FrameCountingSink> remote_sink_;

  std::unique_ptr<WebRtcMediaSessionFactory> session_factory_;
  std::unique_ptr<TcpSignalChannel> channel_;
  std::unique_ptr<NegotiationController> controller_;
  std::unique_ptr<TrackMonitor> monitor_;

  webrtc::RepeatingTaskHandle offer_when_live_;
  std::atomic<int> protocol_errors_{0};
  bool started_ = false;
  bool shut_down_ = false;
};

#endif  // WEBRTC_TANDEM_TANDEM_H_
