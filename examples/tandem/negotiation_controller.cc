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

#include <utility>

#include "rtc_base/checks.h"

#include "negotiation_controller.h"

// Forwards media session events of one epoch to the controller's queue.
class NegotiationController::MediaEvents : public MediaSessionObserver {
 public:
  MediaEvents(NegotiationController* controller, uint64_t epoch)
      : controller_(controller), epoch_(epoch), flag_(controller->safety_.flag()) {}

  void OnIceCandidateGenerated(const IceCandidateInfo& candidate) override {
    Post([candidate](NegotiationController* self) { self->HandleLocalCandidate(candidate); });
  }

  void OnConnectionStateChanged(MediaConnectionState state) override {
    Post([state](NegotiationController* self) { self->HandleConnectionState(state); });
  }

  void OnRenegotiationNeeded() override {
    Post([](NegotiationController* self) { self->HandleRenegotiationNeeded(); });
  }

 private:
  template <typename Fn>
  void Post(Fn fn) {
    controller_->session_queue_->PostTask(webrtc::SafeTask(
        flag_, [controller = controller_, epoch = epoch_, fn = std::move(fn)]() mutable {
          if (epoch != controller->epoch_) {
            ++controller->stale_callbacks_;
            return;
          }
          fn(controller);
        }));
  }

  NegotiationController* const controller_;
  const uint64_t epoch_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> flag_;
};

// static
NegotiationController::Config NegotiationController::ConfigFromOptions(const Options& opts) {
  Config config;
  config.role = PeerRoleFromOptions(opts);
  config.required_media = opts.required_media;
  config.ice_restart_cooldown = webrtc::TimeDelta::Millis(opts.ice_restart_cooldown_ms);
  config.log_ice = opts.debug.ice;
  return config;
}

NegotiationController::NegotiationController(const Config& config,
                                             webrtc::TaskQueueBase* session_queue,
                                             SignalChannel* channel,
                                             MediaSessionFactory* factory,
                                             NegotiationObserver* observer)
    : config_(config),
      session_queue_(session_queue),
      channel_(channel),
      factory_(factory),
      observer_(observer) {
  RTC_DCHECK(session_queue_);
  RTC_DCHECK(channel_);
  RTC_DCHECK(factory_);
}

NegotiationController::~NegotiationController() {
  RTC_DCHECK(session_queue_->IsCurrent());
  CloseSession();
}

void NegotiationController::RunOnQueue(absl::AnyInvocable<void() &&> task) {
  if (session_queue_->IsCurrent()) {
    std::move(task)();
    return;
  }
  session_queue_->PostTask(webrtc::SafeTask(safety_.flag(), std::move(task)));
}

void NegotiationController::Start() {
  RTC_DCHECK(session_queue_->IsCurrent());
  RTC_LOG(LS_INFO) << "Negotiation controller starting as " << ToString(config_.role);
  shut_down_ = false;
  if (!session_) {
    CreateSession();
  }
}

void NegotiationController::Shutdown() {
  RTC_DCHECK(session_queue_->IsCurrent());
  shut_down_ = true;
  ++epoch_;
  ++op_seq_;
  pending_candidates_.Clear();
  in_flight_ = false;
  restart_scheduled_ = false;
  CloseSession();
}

void NegotiationController::CreateOffer() {
  RunOnQueue([this]() { StartOffer(/*ice_restart=*/false, /*internal=*/false); });
}

NegotiationState NegotiationController::state() const {
  RTC_DCHECK(session_queue_->IsCurrent());
  return state_;
}

void NegotiationController::OnPeerStateChanged(const PeerId& peer, PeerState state) {
  RunOnQueue([this, peer, state]() { HandlePeerState(peer, state); });
}

void NegotiationController::OnMessageReceived(const PeerId& peer,
                                              const std::string& payload) {
  RunOnQueue([this, peer, payload]() { HandleMessage(peer, payload); });
}

void NegotiationController::CreateSession() {
  events_ = std::make_unique<MediaEvents>(this, epoch_);
  session_ = factory_->CreateSession(events_.get());
  if (!session_) {
    RTC_LOG(LS_ERROR) << "Failed to create media session for epoch " << epoch_;
  }
}

void NegotiationController::CloseSession() {
  if (session_) {
    session_->Close();
    session_.reset();
  }
  events_.reset();
}

void NegotiationController::TearDown() {
  RTC_DCHECK(session_queue_->IsCurrent());
  RTC_LOG(LS_INFO) << "Tearing down negotiation epoch " << epoch_ << " ("
                   << pending_candidates_.size() << " pending candidates dropped)";
  ++epoch_;
  ++op_seq_;
  pending_candidates_.Clear();
  in_flight_ = false;
  remote_description_set_ = false;
  reached_stable_ = false;
  restart_scheduled_ = false;
  // Anything this epoch left in the outbox must not reach the next peer.
  channel_->ClearOutbox();
  CloseSession();
  SetState(NegotiationState::kIdle);
  if (!shut_down_) {
    CreateSession();
  }
}

void NegotiationController::SetState(NegotiationState state) {
  if (state == state_) {
    return;
  }
  RTC_LOG(LS_INFO) << "Negotiation " << ToString(state_) << " -> " << ToString(state);
  state_ = state;
  if (observer_) {
    observer_->OnNegotiationStateChanged(state);
  }
}

void NegotiationController::Send(const SignalMessage& message) {
  if (canonical_peer_) {
    channel_->SendTo(*canonical_peer_, EncodeSignalMessage(message));
    return;
  }
  channel_->Send(EncodeSignalMessage(message));
}

void NegotiationController::ProtocolError(const std::string& reason) {
  ++protocol_errors_;
  RTC_LOG(LS_WARNING) << "Dropping message: " << reason;
  if (observer_) {
    observer_->OnProtocolError(reason);
  }
}

void NegotiationController::MediaError(const char* operation, const webrtc::RTCError& error) {
  RTC_LOG(LS_ERROR) << operation << " failed: " << error.message();
  in_flight_ = false;
  if (reached_stable_) {
    SetState(NegotiationState::kStable);
  } else {
    EnterFailed();
  }
}

void NegotiationController::EnterFailed() {
  if (in_flight_) {
    // Whatever was in flight belongs to the failed attempt.
    ++op_seq_;
    in_flight_ = false;
  }
  SetState(NegotiationState::kFailed);
  ScheduleRestart();
}

void NegotiationController::ScheduleRestart() {
  if (config_.role != PeerRole::kInitiator || restart_scheduled_) {
    return;
  }
  restart_scheduled_ = true;
  RTC_LOG(LS_INFO) << "ICE restart in " << config_.ice_restart_cooldown.ms() << " ms";
  const uint64_t epoch = epoch_;
  session_queue_->PostDelayedTask(
      webrtc::SafeTask(safety_.flag(),
                       [this, epoch]() {
                         if (epoch != epoch_) {
                           return;
                         }
                         restart_scheduled_ = false;
                         if (state_ != NegotiationState::kFailed) {
                           RTC_LOG(LS_INFO) << "Recovered before ICE restart";
                           return;
                         }
                         StartOffer(/*ice_restart=*/true, /*internal=*/true);
                       }),
      config_.ice_restart_cooldown);
}

bool NegotiationController::RequestRenegotiation() {
  RTC_DCHECK(session_queue_->IsCurrent());
  if (config_.role != PeerRole::kInitiator) {
    return false;
  }
  if (in_flight_ ||
      (state_ != NegotiationState::kIdle && state_ != NegotiationState::kStable)) {
    RTC_LOG(LS_INFO) << "Renegotiation refused in " << ToString(state_);
    return false;
  }
  if (!session_ || !session_->HasReadyTrack()) {
    RTC_LOG(LS_INFO) << "Renegotiation refused, no ready track";
    return false;
  }
  const bool ice_restart = state_ == NegotiationState::kStable;
  SetState(NegotiationState::kRenegotiating);
  return StartOffer(ice_restart, /*internal=*/true);
}

bool NegotiationController::StartOffer(bool ice_restart, bool internal) {
  if (config_.role != PeerRole::kInitiator) {
    RTC_LOG(LS_WARNING) << "Responder does not create offers";
    return false;
  }
  if (in_flight_) {
    RTC_LOG(LS_VERBOSE) << "Offer refused, another operation is in flight";
    return false;
  }
  const bool allowed =
      state_ == NegotiationState::kIdle || state_ == NegotiationState::kStable ||
      (internal && (state_ == NegotiationState::kRenegotiating ||
                    state_ == NegotiationState::kFailed));
  if (!allowed) {
    RTC_LOG(LS_VERBOSE) << "Offer refused in " << ToString(state_);
    return false;
  }
  if (!session_ || !session_->HasReadyTrack()) {
    RTC_LOG(LS_VERBOSE) << "No ready track, not offering yet";
    return false;
  }

  in_flight_ = true;
  SetState(NegotiationState::kLocalOfferPending);
  session_->CreateOffer(
      ice_restart,
      Bind<webrtc::RTCErrorOr<std::string>>(
          "CreateOffer", [this, ice_restart](webrtc::RTCErrorOr<std::string> result) {
            OnOfferCreated(ice_restart, std::move(result));
          }));
  return true;
}

void NegotiationController::OnOfferCreated(bool ice_restart,
                                           webrtc::RTCErrorOr<std::string> result) {
  if (!result.ok()) {
    MediaError("CreateOffer", result.error());
    return;
  }
  std::string sdp = result.MoveValue();
  session_->SetLocalDescription(
      webrtc::SdpType::kOffer, sdp,
      Bind<webrtc::RTCError>("SetLocalDescription(offer)",
                             [this, ice_restart, sdp](webrtc::RTCError error) {
                               OnLocalOfferApplied(ice_restart, sdp, std::move(error));
                             }));
}

void NegotiationController::OnLocalOfferApplied(bool ice_restart,
                                                const std::string& sdp,
                                                webrtc::RTCError error) {
  if (!error.ok()) {
    MediaError("SetLocalDescription(offer)", error);
    return;
  }
  in_flight_ = false;
  SetState(NegotiationState::kAwaitingAnswer);
  Send(SignalMessage::Offer(sdp));
  ++offers_sent_;
  if (ice_restart) {
    ++restart_offers_sent_;
  }
  RTC_LOG(LS_INFO) << (ice_restart ? "Restart offer" : "Offer") << " sent ("
                   << sdp.size() << " bytes)";
}

void NegotiationController::HandleAnswer(const std::string& sdp) {
  if (state_ != NegotiationState::kAwaitingAnswer || in_flight_) {
    ProtocolError(std::string("answer received in ") + ToString(state_));
    return;
  }
  in_flight_ = true;
  session_->SetRemoteDescription(
      webrtc::SdpType::kAnswer, sdp,
      Bind<webrtc::RTCError>("SetRemoteDescription(answer)", [this](webrtc::RTCError error) {
        OnRemoteAnswerApplied(std::move(error));
      }));
}

void NegotiationController::OnRemoteAnswerApplied(webrtc::RTCError error) {
  if (!error.ok()) {
    MediaError("SetRemoteDescription(answer)", error);
    return;
  }
  remote_description_set_ = true;
  DrainPendingCandidates();
  in_flight_ = false;
  reached_stable_ = true;
  SetState(NegotiationState::kStable);
}

void NegotiationController::HandleOffer(const std::string& sdp) {
  if (config_.role != PeerRole::kResponder) {
    ProtocolError("initiator does not answer offers");
    return;
  }
  if (sdp.find(config_.required_media) == std::string::npos) {
    ProtocolError("offer without " + config_.required_media);
    return;
  }
  const bool accepting = state_ == NegotiationState::kIdle ||
                         state_ == NegotiationState::kStable ||
                         state_ == NegotiationState::kFailed;
  if (in_flight_ || !accepting) {
    ProtocolError(std::string("offer received in ") + ToString(state_));
    return;
  }

  // A re-offer keeps the previous remote description, so candidates are
  // still applied directly until TearDown().
  in_flight_ = true;
  SetState(NegotiationState::kRemoteOfferReceived);
  session_->SetRemoteDescription(
      webrtc::SdpType::kOffer, sdp,
      Bind<webrtc::RTCError>("SetRemoteDescription(offer)", [this](webrtc::RTCError error) {
        OnRemoteOfferApplied(std::move(error));
      }));
}

void NegotiationController::OnRemoteOfferApplied(webrtc::RTCError error) {
  if (!error.ok()) {
    MediaError("SetRemoteDescription(offer)", error);
    return;
  }
  remote_description_set_ = true;
  DrainPendingCandidates();
  SetState(NegotiationState::kLocalAnswerPending);
  session_->CreateAnswer(Bind<webrtc::RTCErrorOr<std::string>>(
      "CreateAnswer", [this](webrtc::RTCErrorOr<std::string> result) {
        OnAnswerCreated(std::move(result));
      }));
}

void NegotiationController::OnAnswerCreated(webrtc::RTCErrorOr<std::string> result) {
  if (!result.ok()) {
    MediaError("CreateAnswer", result.error());
    return;
  }
  std::string sdp = result.MoveValue();
  session_->SetLocalDescription(
      webrtc::SdpType::kAnswer, sdp,
      Bind<webrtc::RTCError>("SetLocalDescription(answer)",
                             [this, sdp](webrtc::RTCError error) {
                               OnLocalAnswerApplied(sdp, std::move(error));
                             }));
}

void NegotiationController::OnLocalAnswerApplied(const std::string& sdp,
                                                 webrtc::RTCError error) {
  if (!error.ok()) {
    MediaError("SetLocalDescription(answer)", error);
    return;
  }
  Send(SignalMessage::Answer(sdp));
  ++answers_sent_;
  in_flight_ = false;
  reached_stable_ = true;
  SetState(NegotiationState::kStable);
  RTC_LOG(LS_INFO) << "Answer sent (" << sdp.size() << " bytes)";
}

void NegotiationController::HandleCandidate(const IceCandidateInfo& candidate) {
  if (!remote_description_set_) {
    pending_candidates_.Enqueue(candidate);
    if (config_.log_ice) {
      RTC_LOG(LS_INFO) << "Buffering remote candidate (" << pending_candidates_.size()
                       << " pending)";
    }
    return;
  }
  ApplyCandidate(candidate);
}

void NegotiationController::ApplyCandidate(const IceCandidateInfo& candidate) {
  if (!session_) {
    return;
  }
  if (config_.log_ice) {
    RTC_LOG(LS_INFO) << "Applying remote candidate " << candidate.sdp;
  }
  session_->AddIceCandidate(candidate, [](webrtc::RTCError error) {
    if (!error.ok()) {
      RTC_LOG(LS_WARNING) << "Failed to add ICE candidate: " << error.message();
    }
  });
}

void NegotiationController::DrainPendingCandidates() {
  size_t drained = pending_candidates_.Drain(
      [this](IceCandidateInfo candidate) { ApplyCandidate(candidate); });
  if (drained > 0) {
    RTC_LOG(LS_INFO) << "Applied " << drained << " buffered remote candidates";
  }
}

void NegotiationController::HandlePeerState(const PeerId& peer, PeerState state) {
  if (state == PeerState::kConnected) {
    if (!canonical_peer_) {
      canonical_peer_ = peer;
      RTC_LOG(LS_INFO) << "Negotiating with " << peer;
      if (config_.role == PeerRole::kInitiator && state_ == NegotiationState::kIdle) {
        StartOffer(/*ice_restart=*/false, /*internal=*/false);
      }
    } else if (*canonical_peer_ != peer) {
      RTC_LOG(LS_WARNING) << "Ignoring second peer " << peer << ", already negotiating with "
                          << *canonical_peer_;
    }
    return;
  }

  if (state == PeerState::kNotConnected && canonical_peer_ == peer) {
    RTC_LOG(LS_INFO) << "Peer " << peer << " went away";
    canonical_peer_.reset();
    TearDown();
  }
}

void NegotiationController::HandleMessage(const PeerId& peer, const std::string& payload) {
  if (!canonical_peer_ || *canonical_peer_ != peer) {
    ProtocolError("message from non-canonical peer " + peer);
    return;
  }
  std::string error;
  std::optional<SignalMessage> message = DecodeSignalMessage(payload, &error);
  if (!message) {
    ProtocolError("malformed message: " + error);
    return;
  }
  if (!session_) {
    ProtocolError("no media session");
    return;
  }

  switch (message->type) {
    case SignalMessage::Type::kOffer:
      HandleOffer(message->sdp);
      break;
    case SignalMessage::Type::kAnswer:
      HandleAnswer(message->sdp);
      break;
    case SignalMessage::Type::kCandidate:
      HandleCandidate(message->ToCandidate());
      break;
  }
}

void NegotiationController::HandleLocalCandidate(const IceCandidateInfo& candidate) {
  if (config_.log_ice) {
    RTC_LOG(LS_INFO) << "Local candidate " << candidate.sdp;
  }
  Send(SignalMessage::Candidate(candidate));
}

void NegotiationController::HandleConnectionState(MediaConnectionState state) {
  RTC_LOG(LS_INFO) << "Media connection " << ToString(state);
  switch (state) {
    case MediaConnectionState::kFailed:
      if (state_ == NegotiationState::kFailed) {
        // A restart is already scheduled, or this side waits for one.
        return;
      }
      EnterFailed();
      break;
    case MediaConnectionState::kConnected:
      if (state_ == NegotiationState::kFailed && reached_stable_) {
        SetState(NegotiationState::kStable);
      }
      break;
    default:
      break;
  }
}

void NegotiationController::HandleRenegotiationNeeded() {
  if (state_ != NegotiationState::kStable) {
    RTC_LOG(LS_VERBOSE) << "Renegotiation needed ignored in " << ToString(state_);
    return;
  }
  StartOffer(/*ice_restart=*/false, /*internal=*/false);
}
