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

#ifndef WEBRTC_TANDEM_WEBRTC_MEDIA_SESSION_H_
#define WEBRTC_TANDEM_WEBRTC_MEDIA_SESSION_H_

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <absl/memory/memory.h>
#include <api/jsep.h>
#include <api/media_stream_interface.h>
#include <api/peer_connection_interface.h>
#include <api/rtc_error.h>
#include <api/rtp_transceiver_interface.h>
#include <api/scoped_refptr.h>
#include <api/set_local_description_observer_interface.h>
#include <api/set_remote_description_observer_interface.h>
#include <api/task_queue/pending_task_safety_flag.h>
#include <rtc_base/thread.h>

#include "media_session.h"
#include "option.h"
#include "stats_logger.h"
#include "video.h"

class LambdaCreateSessionDescriptionObserver
    : public webrtc::CreateSessionDescriptionObserver {
 public:
  LambdaCreateSessionDescriptionObserver(
      std::function<void(std::unique_ptr<webrtc::SessionDescriptionInterface>
                             desc)> on_success,
      std::function<void(webrtc::RTCError)> on_failure)
      : on_success_(on_success), on_failure_(on_failure) {}
  void OnSuccess(webrtc::SessionDescriptionInterface* desc) override {
    // Takes ownership of answer, according to CreateSessionDescriptionObserver
    // convention.
    on_success_(absl::WrapUnique(desc));
  }
  void OnFailure(webrtc::RTCError error) override {
    on_failure_(std::move(error));
  }

 private:
  std::function<void(std::unique_ptr<webrtc::SessionDescriptionInterface> desc)>
      on_success_;
  std::function<void(webrtc::RTCError)> on_failure_;
};

class LambdaSetLocalDescriptionObserver
    : public webrtc::SetLocalDescriptionObserverInterface {
 public:
  explicit LambdaSetLocalDescriptionObserver(
      std::function<void(webrtc::RTCError)> on_complete)
      : on_complete_(on_complete) {}
  void OnSetLocalDescriptionComplete(webrtc::RTCError error) override {
    on_complete_(error);
  }

 private:
  std::function<void(webrtc::RTCError)> on_complete_;
};

class LambdaSetRemoteDescriptionObserver
    : public webrtc::SetRemoteDescriptionObserverInterface {
 public:
  explicit LambdaSetRemoteDescriptionObserver(
      std::function<void(webrtc::RTCError)> on_complete)
      : on_complete_(on_complete) {}
  void OnSetRemoteDescriptionComplete(webrtc::RTCError error) override {
    on_complete_(error);
  }

 private:
  std::function<void(webrtc::RTCError)> on_complete_;
};

// A PeerConnection for one negotiation epoch. Every call is forwarded to the
// signaling thread; PeerConnectionObserver events arrive there too and are
// passed on to the MediaSessionObserver until Close().
class TANDEM_API WebRtcMediaSession : public MediaSessionInterface,
                                      public webrtc::PeerConnectionObserver {
 public:
  struct Params {
    bool initiator = true;
    std::vector<std::string> stun_servers;
    bool stats = false;
    webrtc::TimeDelta stats_interval = webrtc::TimeDelta::Seconds(2);
    bool dump_stats = false;
    bool log_ice = false;
  };

  WebRtcMediaSession(const Params& params,
                     rtc::Thread* signaling_thread,
                     rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> factory,
                     rtc::scoped_refptr<webrtc::FrameTapVideoSource> local_source,
                     rtc::scoped_refptr<webrtc::VideoTrackInterface> local_track,
                     webrtc::FrameCountingSink* remote_sink,
                     MediaSessionObserver* observer);
  ~WebRtcMediaSession() override;

  // Creates the PeerConnection and attaches the local track. Signaling
  // thread only.
  bool Initialize();

  // MediaSessionInterface
  void CreateOffer(bool ice_restart, DescriptionCallback callback) override;
  void CreateAnswer(DescriptionCallback callback) override;
  void SetLocalDescription(webrtc::SdpType type,
                           const std::string& sdp,
                           CompletionCallback callback) override;
  void SetRemoteDescription(webrtc::SdpType type,
                            const std::string& sdp,
                            CompletionCallback callback) override;
  void AddIceCandidate(const IceCandidateInfo& candidate,
                       CompletionCallback callback) override;
  bool HasReadyTrack() const override;
  void Close() override;

  // PeerConnectionObserver
  void OnSignalingChange(
      webrtc::PeerConnectionInterface::SignalingState new_state) override;
  void OnDataChannel(
      rtc::scoped_refptr<webrtc::DataChannelInterface> channel) override {}
  void OnNegotiationNeededEvent(uint32_t event_id) override;
  void OnIceConnectionChange(
      webrtc::PeerConnectionInterface::IceConnectionState new_state) override;
  void OnConnectionChange(
      webrtc::PeerConnectionInterface::PeerConnectionState new_state) override;
  void OnIceGatheringChange(
      webrtc::PeerConnectionInterface::IceGatheringState new_state) override;
  void OnIceCandidate(const webrtc::IceCandidateInterface* candidate) override;
  void OnTrack(
      rtc::scoped_refptr<webrtc::RtpTransceiverInterface> transceiver) override;

 private:
  // Runs `task` on the signaling thread while the session is open, or fails
  // `on_closed` right away.
  void Post(std::function<void()> task, std::function<void(webrtc::RTCError)> on_closed);
  void CloseOnSignaling();

  const Params params_;
  rtc::Thread* const signaling_thread_;
  rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> factory_;
  rtc::scoped_refptr<webrtc::FrameTapVideoSource> local_source_;
  rtc::scoped_refptr<webrtc::VideoTrackInterface> local_track_;
  webrtc::FrameCountingSink* const remote_sink_;
  MediaSessionObserver* const observer_;

  rtc::scoped_refptr<webrtc::PeerConnectionInterface> peer_connection_;
  rtc::scoped_refptr<webrtc::VideoTrackInterface> remote_track_;
  std::unique_ptr<StatsLogger> stats_logger_;
  std::atomic<bool> closed_{false};
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
};

// Builds one WebRtcMediaSession per epoch on a shared PeerConnectionFactory.
class TANDEM_API WebRtcMediaSessionFactory : public MediaSessionFactory {
 public:
  WebRtcMediaSessionFactory(const Options& opts,
                            rtc::Thread* signaling_thread,
                            rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> factory,
                            rtc::scoped_refptr<webrtc::FrameTapVideoSource> local_source,
                            rtc::scoped_refptr<webrtc::VideoTrackInterface> local_track,
                            webrtc::FrameCountingSink* remote_sink);

  std::unique_ptr<MediaSessionInterface> CreateSession(
      MediaSessionObserver* observer) override;

 private:
  WebRtcMediaSession::Params params_;
  rtc::Thread* const signaling_thread_;
  rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> factory_;
  rtc::scoped_refptr<webrtc::FrameTapVideoSource> local_source_;
  rtc::scoped_refptr<webrtc::VideoTrackInterface> local_track_;
  webrtc::FrameCountingSink* const remote_sink_;
};

#endif  // WEBRTC_TANDEM_WEBRTC_MEDIA_SESSION_H_
