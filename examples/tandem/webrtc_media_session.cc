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

#include "webrtc_media_session.h"

#include <utility>

#include <api/jsep.h>
#include <rtc_base/checks.h>
#include <rtc_base/logging.h>

namespace {

MediaConnectionState FromPeerConnectionState(
    webrtc::PeerConnectionInterface::PeerConnectionState state) {
  using State = webrtc::PeerConnectionInterface::PeerConnectionState;
  switch (state) {
    case State::kNew:
      return MediaConnectionState::kNew;
    case State::kConnecting:
      return MediaConnectionState::kChecking;
    case State::kConnected:
      return MediaConnectionState::kConnected;
    case State::kDisconnected:
      return MediaConnectionState::kDisconnected;
    case State::kFailed:
      return MediaConnectionState::kFailed;
    case State::kClosed:
      return MediaConnectionState::kClosed;
  }
  return MediaConnectionState::kNew;
}

webrtc::RTCError SessionClosedError() {
  return webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "media session closed");
}

}  // namespace

WebRtcMediaSession::WebRtcMediaSession(
    const Params& params,
    rtc::Thread* signaling_thread,
    rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> factory,
    rtc::scoped_refptr<webrtc::FrameTapVideoSource> local_source,
    rtc::scoped_refptr<webrtc::VideoTrackInterface> local_track,
    webrtc::FrameCountingSink* remote_sink,
    MediaSessionObserver* observer)
    : params_(params),
      signaling_thread_(signaling_thread),
      factory_(factory),
      local_source_(local_source),
      local_track_(local_track),
      remote_sink_(remote_sink),
      observer_(observer),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {
  RTC_DCHECK(signaling_thread_);
  RTC_DCHECK(observer_);
}

WebRtcMediaSession::~WebRtcMediaSession() {
  Close();
}

bool WebRtcMediaSession::Initialize() {
  RTC_DCHECK_RUN_ON(signaling_thread_);

  webrtc::PeerConnectionInterface::RTCConfiguration config;
  config.sdp_semantics = webrtc::SdpSemantics::kUnifiedPlan;
  config.bundle_policy = webrtc::PeerConnectionInterface::kBundlePolicyMaxBundle;
  config.rtcp_mux_policy = webrtc::PeerConnectionInterface::kRtcpMuxPolicyRequire;
  config.continual_gathering_policy =
      webrtc::PeerConnectionInterface::ContinualGatheringPolicy::GATHER_CONTINUALLY;

  for (const auto& uri : params_.stun_servers) {
    webrtc::PeerConnectionInterface::IceServer server;
    server.uri = uri;
    config.servers.push_back(server);
  }

  webrtc::PeerConnectionDependencies dependencies(this);
  auto result = factory_->CreatePeerConnectionOrError(config, std::move(dependencies));
  if (!result.ok()) {
    RTC_LOG(LS_ERROR) << "Failed to create PeerConnection: " << result.error().message();
    return false;
  }
  peer_connection_ = result.MoveValue();
  RTC_LOG(LS_INFO) << "PeerConnection created (" << config.servers.size()
                   << " STUN servers)";

  if (params_.initiator && local_track_) {
    auto sender = peer_connection_->AddTrack(local_track_, {"stream"});
    if (!sender.ok()) {
      RTC_LOG(LS_ERROR) << "Failed to add video track: " << sender.error().message();
      return false;
    }
    RTC_LOG(LS_INFO) << "Video track " << local_track_->id() << " added";
  }

  if (params_.stats) {
    stats_logger_ = std::make_unique<StatsLogger>(signaling_thread_, peer_connection_,
                                                  params_.initiator, params_.stats_interval,
                                                  params_.dump_stats);
    stats_logger_->Start();
  }
  return true;
}

void WebRtcMediaSession::Post(std::function<void()> task,
                              std::function<void(webrtc::RTCError)> on_closed) {
  if (closed_) {
    on_closed(SessionClosedError());
    return;
  }
  signaling_thread_->PostTask(webrtc::SafeTask(safety_, [this, task, on_closed]() {
    if (!peer_connection_) {
      on_closed(SessionClosedError());
      return;
    }
    task();
  }));
}

void WebRtcMediaSession::CreateOffer(bool ice_restart, DescriptionCallback callback) {
  auto fail = [callback](webrtc::RTCError error) { callback(std::move(error)); };
  Post(
      [this, ice_restart, callback, fail]() {
        webrtc::PeerConnectionInterface::RTCOfferAnswerOptions options;
        options.ice_restart = ice_restart;
        peer_connection_->CreateOffer(
            rtc::make_ref_counted<LambdaCreateSessionDescriptionObserver>(
                [callback](std::unique_ptr<webrtc::SessionDescriptionInterface> desc) {
                  std::string sdp;
                  desc->ToString(&sdp);
                  callback(std::move(sdp));
                },
                fail)
                .get(),
            options);
      },
      fail);
}

void WebRtcMediaSession::CreateAnswer(DescriptionCallback callback) {
  auto fail = [callback](webrtc::RTCError error) { callback(std::move(error)); };
  Post(
      [this, callback, fail]() {
        peer_connection_->CreateAnswer(
            rtc::make_ref_counted<LambdaCreateSessionDescriptionObserver>(
                [callback](std::unique_ptr<webrtc::SessionDescriptionInterface> desc) {
                  std::string sdp;
                  desc->ToString(&sdp);
                  callback(std::move(sdp));
                },
                fail)
                .get(),
            webrtc::PeerConnectionInterface::RTCOfferAnswerOptions{});
      },
      fail);
}

void WebRtcMediaSession::SetLocalDescription(webrtc::SdpType type,
                                             const std::string& sdp,
                                             CompletionCallback callback) {
  Post(
      [this, type, sdp, callback]() {
        webrtc::SdpParseError error;
        std::unique_ptr<webrtc::SessionDescriptionInterface> desc =
            webrtc::CreateSessionDescription(type, sdp, &error);
        if (!desc) {
          callback(webrtc::RTCError(webrtc::RTCErrorType::SYNTAX_ERROR,
                                    "bad local SDP: " + error.description));
          return;
        }
        peer_connection_->SetLocalDescription(
            std::move(desc), rtc::make_ref_counted<LambdaSetLocalDescriptionObserver>(callback));
      },
      callback);
}

void WebRtcMediaSession::SetRemoteDescription(webrtc::SdpType type,
                                              const std::string& sdp,
                                              CompletionCallback callback) {
  Post(
      [this, type, sdp, callback]() {
        webrtc::SdpParseError error;
        std::unique_ptr<webrtc::SessionDescriptionInterface> desc =
            webrtc::CreateSessionDescription(type, sdp, &error);
        if (!desc) {
          callback(webrtc::RTCError(webrtc::RTCErrorType::SYNTAX_ERROR,
                                    "bad remote SDP: " + error.description));
          return;
        }
        peer_connection_->SetRemoteDescription(
            std::move(desc), rtc::make_ref_counted<LambdaSetRemoteDescriptionObserver>(callback));
      },
      callback);
}

void WebRtcMediaSession::AddIceCandidate(const IceCandidateInfo& candidate,
                                         CompletionCallback callback) {
  Post(
      [this, candidate, callback]() {
        webrtc::SdpParseError error;
        std::unique_ptr<webrtc::IceCandidateInterface> ice(webrtc::CreateIceCandidate(
            candidate.sdp_mid.value_or(""), candidate.sdp_mline_index, candidate.sdp, &error));
        if (!ice) {
          callback(webrtc::RTCError(webrtc::RTCErrorType::SYNTAX_ERROR,
                                    "bad candidate: " + error.description));
          return;
        }
        peer_connection_->AddIceCandidate(std::move(ice), callback);
      },
      callback);
}

bool WebRtcMediaSession::HasReadyTrack() const {
  if (!params_.initiator) {
    return true;
  }
  if (!local_track_ || !local_source_) {
    return false;
  }
  return local_track_->state() == webrtc::MediaStreamTrackInterface::kLive &&
         local_source_->is_live();
}

void WebRtcMediaSession::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  if (signaling_thread_->IsCurrent()) {
    CloseOnSignaling();
  } else {
    signaling_thread_->BlockingCall([this]() { CloseOnSignaling(); });
  }
}

void WebRtcMediaSession::CloseOnSignaling() {
  RTC_DCHECK_RUN_ON(signaling_thread_);
  safety_->SetNotAlive();
  stats_logger_.reset();
  if (remote_track_ && remote_sink_) {
    RTC_LOG(LS_INFO) << "Removing video sink from remote track";
    remote_track_->RemoveSink(remote_sink_);
  }
  remote_track_ = nullptr;
  if (peer_connection_) {
    peer_connection_->Close();
    peer_connection_ = nullptr;
    RTC_LOG(LS_INFO) << "PeerConnection closed";
  }
}

void WebRtcMediaSession::OnSignalingChange(
    webrtc::PeerConnectionInterface::SignalingState new_state) {
  RTC_LOG(LS_INFO) << "Signaling state: "
                   << webrtc::PeerConnectionInterface::AsString(new_state);
}

void WebRtcMediaSession::OnNegotiationNeededEvent(uint32_t event_id) {
  if (closed_ || !peer_connection_ ||
      !peer_connection_->ShouldFireNegotiationNeededEvent(event_id)) {
    return;
  }
  observer_->OnRenegotiationNeeded();
}

void WebRtcMediaSession::OnIceConnectionChange(
    webrtc::PeerConnectionInterface::IceConnectionState new_state) {
  RTC_LOG(LS_INFO) << "ICE connection state: "
                   << webrtc::PeerConnectionInterface::AsString(new_state);
}

void WebRtcMediaSession::OnConnectionChange(
    webrtc::PeerConnectionInterface::PeerConnectionState new_state) {
  RTC_LOG(LS_INFO) << "Peer connection state: "
                   << webrtc::PeerConnectionInterface::AsString(new_state);
  if (closed_) {
    return;
  }
  observer_->OnConnectionStateChanged(FromPeerConnectionState(new_state));
}

void WebRtcMediaSession::OnIceGatheringChange(
    webrtc::PeerConnectionInterface::IceGatheringState new_state) {
  if (params_.log_ice) {
    RTC_LOG(LS_INFO) << "ICE gathering state: "
                     << webrtc::PeerConnectionInterface::AsString(new_state);
  }
}

void WebRtcMediaSession::OnIceCandidate(const webrtc::IceCandidateInterface* candidate) {
  if (closed_) {
    return;
  }
  IceCandidateInfo info;
  if (!candidate->ToString(&info.sdp)) {
    RTC_LOG(LS_ERROR) << "Failed to serialize candidate";
    return;
  }
  info.sdp_mid = candidate->sdp_mid();
  info.sdp_mline_index = candidate->sdp_mline_index();
  if (params_.log_ice) {
    RTC_LOG(LS_INFO) << "New ICE candidate: " << info.sdp << " mid: " << candidate->sdp_mid()
                     << " mlineindex: " << info.sdp_mline_index;
  }
  observer_->OnIceCandidateGenerated(info);
}

void WebRtcMediaSession::OnTrack(
    rtc::scoped_refptr<webrtc::RtpTransceiverInterface> transceiver) {
  rtc::scoped_refptr<webrtc::MediaStreamTrackInterface> track =
      transceiver->receiver()->track();
  if (!track || track->kind() != webrtc::MediaStreamTrackInterface::kVideoKind) {
    return;
  }
  if (params_.initiator) {
    RTC_LOG(LS_VERBOSE) << "Ignoring remote video track on the sending side";
    return;
  }

  auto* video = static_cast<webrtc::VideoTrackInterface*>(track.get());
  if (!video->enabled()) {
    RTC_LOG(LS_WARNING) << "Remote video track arrived disabled, enabling it";
    video->set_enabled(true);
  }
  if (remote_track_ && remote_sink_) {
    remote_track_->RemoveSink(remote_sink_);
  }
  remote_track_ = rtc::scoped_refptr<webrtc::VideoTrackInterface>(video);
  if (remote_sink_) {
    remote_track_->AddOrUpdateSink(remote_sink_, rtc::VideoSinkWants());
  }
  RTC_LOG(LS_INFO) << "Remote video track " << remote_track_->id() << " attached";
}

WebRtcMediaSessionFactory::WebRtcMediaSessionFactory(
    const Options& opts,
    rtc::Thread* signaling_thread,
    rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> factory,
    rtc::scoped_refptr<webrtc::FrameTapVideoSource> local_source,
    rtc::scoped_refptr<webrtc::VideoTrackInterface> local_track,
    webrtc::FrameCountingSink* remote_sink)
    : signaling_thread_(signaling_thread),
      factory_(factory),
      local_source_(local_source),
      local_track_(local_track),
      remote_sink_(remote_sink) {
  params_.initiator = PeerRoleFromOptions(opts) == PeerRole::kInitiator;
  params_.stun_servers = opts.stun_servers;
  params_.stats = opts.stats;
  params_.stats_interval = webrtc::TimeDelta::Millis(opts.stats_interval_ms);
  params_.dump_stats = opts.debug.stats;
  params_.log_ice = opts.debug.ice;
}

std::unique_ptr<MediaSessionInterface> WebRtcMediaSessionFactory::CreateSession(
    MediaSessionObserver* observer) {
  auto session = std::make_unique<WebRtcMediaSession>(params_, signaling_thread_, factory_,
                                                      local_source_, local_track_,
                                                      remote_sink_, observer);
  bool ok = signaling_thread_->BlockingCall([&session]() { return session->Initialize(); });
  if (!ok) {
    RTC_LOG(LS_ERROR) << "Media session initialization failed";
    return nullptr;
  }
  return session;
}
