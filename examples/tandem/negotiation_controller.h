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

#ifndef WEBRTC_TANDEM_NEGOTIATION_CONTROLLER_H_
#define WEBRTC_TANDEM_NEGOTIATION_CONTROLLER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "absl/functional/any_invocable.h"
#include "api/rtc_error.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "api/units/time_delta.h"
#include "rtc_base/logging.h"

#include "media_session.h"
#include "option.h"
#include "ordered_queue.h"
#include "signal_channel.h"
#include "signal_message.h"
#include "types.h"

class NegotiationObserver {
 public:
  virtual void OnNegotiationStateChanged(NegotiationState state) = 0;
  // A message was dropped. `reason` is human readable.
  virtual void OnProtocolError(const std::string& reason) = 0;

 protected:
  virtual ~NegotiationObserver() = default;
};

// The part of the controller the track monitor drives. Session queue only.
class RenegotiationTarget {
 public:
  virtual NegotiationState state() const = 0;
  // Starts a restart offer. Returns false when the controller is busy, has
  // no ready track or never offers.
  virtual bool RequestRenegotiation() = 0;

 protected:
  virtual ~RenegotiationTarget() = default;
};

// Offer/answer/candidate state machine for one side of a two peer session.
//
// Every state change happens on `session_queue`. Transport events are posted
// there when they arrive on another thread, and every media callback is
// re-posted with the epoch and operation it was issued under; results for a
// torn down epoch or a superseded operation are discarded.
//
// The Initiator offers as soon as it has both a peer and a ready track, and
// restarts ICE once per failure after a cooldown. The Responder only answers.
//
// Construct anywhere; Start(), queries and destruction on `session_queue`.
class TANDEM_API NegotiationController : public SignalChannelObserver,
                                         public RenegotiationTarget {
 public:
  struct Config {
    PeerRole role = PeerRole::kInitiator;
    // Offers whose SDP lacks this marker are ignored.
    std::string required_media = "m=video";
    webrtc::TimeDelta ice_restart_cooldown = webrtc::TimeDelta::Seconds(2);
    bool log_ice = false;
  };

  static Config ConfigFromOptions(const Options& opts);

  NegotiationController(const Config& config,
                        webrtc::TaskQueueBase* session_queue,
                        SignalChannel* channel,
                        MediaSessionFactory* factory,
                        NegotiationObserver* observer = nullptr);
  ~NegotiationController() override;

  NegotiationController(const NegotiationController&) = delete;
  NegotiationController& operator=(const NegotiationController&) = delete;

  // Creates the media session for the first epoch.
  void Start();
  // Closes the media session. Nothing is negotiated afterwards.
  void Shutdown();

  // Offers from Idle or Stable. A no-op anywhere else, on the Responder, or
  // without a ready track. Any thread.
  void CreateOffer();

  // Ends the current epoch: pending candidates and in-flight operations are
  // dropped and a fresh media session replaces the old one.
  void TearDown();

  // RenegotiationTarget
  NegotiationState state() const override;
  bool RequestRenegotiation() override;

  // SignalChannelObserver. Any thread.
  void OnPeerStateChanged(const PeerId& peer, PeerState state) override;
  void OnMessageReceived(const PeerId& peer, const std::string& payload) override;

  // Session queue only.
  PeerRole role() const { return config_.role; }
  uint64_t epoch() const { return epoch_; }
  size_t pending_candidates() const { return pending_candidates_.size(); }
  const std::optional<PeerId>& canonical_peer() const { return canonical_peer_; }
  bool restart_scheduled() const { return restart_scheduled_; }
  MediaSessionInterface* session() const { return session_.get(); }

  int offers_sent() const { return offers_sent_; }
  int restart_offers_sent() const { return restart_offers_sent_; }
  int answers_sent() const { return answers_sent_; }
  int protocol_errors() const { return protocol_errors_; }
  int stale_callbacks() const { return stale_callbacks_; }

 private:
  class MediaEvents;

  void RunOnQueue(absl::AnyInvocable<void() &&> task);

  // Wraps a media callback so that `fn` runs on the session queue, and only
  // while the epoch and operation it was issued under are current.
  template <typename Result, typename Fn>
  std::function<void(Result)> Bind(const char* what, Fn fn) {
    const uint64_t epoch = epoch_;
    const uint64_t op = op_seq_;
    // Only the posted task touches `this`, after the safety flag is checked.
    return [queue = session_queue_, flag = safety_.flag(), this, epoch, op, what,
            fn](Result result) {
      queue->PostTask(webrtc::SafeTask(
          flag, [this, epoch, op, what, fn, result = std::move(result)]() mutable {
            if (epoch != epoch_ || op != op_seq_) {
              RTC_LOG(LS_INFO) << "Discarding stale " << what << " result (epoch "
                               << epoch << ", now " << epoch_ << ")";
              ++stale_callbacks_;
              return;
            }
            fn(std::move(result));
          }));
    };
  }

  void SetState(NegotiationState state);
  void Send(const SignalMessage& message);
  void ProtocolError(const std::string& reason);
  void MediaError(const char* operation, const webrtc::RTCError& error);
  void EnterFailed();
  void ScheduleRestart();
  void CreateSession();
  void CloseSession();

  // Offer side.
  bool StartOffer(bool ice_restart, bool internal);
  void OnOfferCreated(bool ice_restart, webrtc::RTCErrorOr<std::string> result);
  void OnLocalOfferApplied(bool ice_restart, const std::string& sdp, webrtc::RTCError error);
  void HandleAnswer(const std::string& sdp);
  void OnRemoteAnswerApplied(webrtc::RTCError error);

  // Answer side.
  void HandleOffer(const std::string& sdp);
  void OnRemoteOfferApplied(webrtc::RTCError error);
  void OnAnswerCreated(webrtc::RTCErrorOr<std::string> result);
  void OnLocalAnswerApplied(const std::string& sdp, webrtc::RTCError error);

  void HandleCandidate(const IceCandidateInfo& candidate);
  void ApplyCandidate(const IceCandidateInfo& candidate);
  void DrainPendingCandidates();

  void HandlePeerState(const PeerId& peer, PeerState state);
  void HandleMessage(const PeerId& peer, const std::string& payload);

  // Media session events, already on the queue and in the current epoch.
  void HandleLocalCandidate(const IceCandidateInfo& candidate);
  void HandleConnectionState(MediaConnectionState state);
  void HandleRenegotiationNeeded();

  const Config config_;
  webrtc::TaskQueueBase* const session_queue_;
  SignalChannel* const channel_;
  MediaSessionFactory* const factory_;
  NegotiationObserver* const observer_;

  NegotiationState state_ = NegotiationState::kIdle;
  uint64_t epoch_ = 0;
  uint64_t op_seq_ = 0;
  bool in_flight_ = false;
  bool remote_description_set_ = false;
  bool reached_stable_ = false;
  bool restart_scheduled_ = false;
  bool shut_down_ = false;
  std::optional<PeerId> canonical_peer_;
  OrderedQueue<IceCandidateInfo> pending_candidates_;

  std::unique_ptr<MediaEvents> events_;
  std::unique_ptr<MediaSessionInterface> session_;

  int offers_sent_ = 0;
  int restart_offers_sent_ = 0;
  int answers_sent_ = 0;
  int protocol_errors_ = 0;
  int stale_callbacks_ = 0;

  webrtc::ScopedTaskSafetyDetached safety_;
};

#endif  // WEBRTC_TANDEM_NEGOTIATION_CONTROLLER_H_
