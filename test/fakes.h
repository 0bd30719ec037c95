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

#ifndef WEBRTC_TANDEM_TEST_FAKES_H_
#define WEBRTC_TANDEM_TEST_FAKES_H_

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "api/rtc_error.h"
#include "rtc_base/thread.h"

#include "capture_source.h"
#include "media_session.h"
#include "negotiation_controller.h"
#include "signal_channel.h"
#include "signal_message.h"
#include "types.h"

namespace tandem_test {

constexpr char kVideoOffer[] =
    "v=0\r\no=- 1 2 IN IP4 127.0.0.1\r\ns=-\r\nm=video 9 UDP/TLS/RTP/SAVPF 96\r\n";
constexpr char kAudioOnlyOffer[] =
    "v=0\r\no=- 1 2 IN IP4 127.0.0.1\r\ns=-\r\nm=audio 9 UDP/TLS/RTP/SAVPF 111\r\n";
constexpr char kVideoAnswer[] =
    "v=0\r\no=- 3 2 IN IP4 127.0.0.1\r\ns=-\r\nm=video 9 UDP/TLS/RTP/SAVPF 96\r\n";

// Runs an empty task on `thread`, so everything posted before it has run.
inline void Flush(rtc::Thread* thread) {
  thread->BlockingCall([]() {});
}

// Polls `condition` on `thread` until it holds or `timeout_ms` passes.
template <typename Condition>
bool WaitFor(rtc::Thread* thread, Condition condition, int timeout_ms = 5000) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (thread->BlockingCall([&condition]() { return condition(); })) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return thread->BlockingCall([&condition]() { return condition(); });
}

inline IceCandidateInfo MakeCandidate(int n) {
  IceCandidateInfo candidate;
  candidate.sdp = "candidate:" + std::to_string(n) +
                  " 1 udp 2122260223 192.168.1.10 5000" + std::to_string(n) + " typ host";
  candidate.sdp_mid = "0";
  candidate.sdp_mline_index = 0;
  return candidate;
}

class FakeMediaSessionFactory;

// Media session that answers every call synchronously from the factory's
// script and records what it was asked to do. Session queue only.
class FakeMediaSession : public MediaSessionInterface {
 public:
  FakeMediaSession(FakeMediaSessionFactory* factory, MediaSessionObserver* observer)
      : factory_(factory), observer_(observer) {}

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
  void Close() override { closed_ = true; }

  // Media engine events, as the real session would raise them.
  void EmitCandidate(const IceCandidateInfo& candidate) {
    observer_->OnIceCandidateGenerated(candidate);
  }
  void EmitConnectionState(MediaConnectionState state) {
    observer_->OnConnectionStateChanged(state);
  }
  void EmitRenegotiationNeeded() { observer_->OnRenegotiationNeeded(); }

  bool closed() const { return closed_; }

 private:
  FakeMediaSessionFactory* const factory_;
  MediaSessionObserver* const observer_;
  bool closed_ = false;
};

class FakeMediaSessionFactory : public MediaSessionFactory {
 public:
  std::unique_ptr<MediaSessionInterface> CreateSession(
      MediaSessionObserver* observer) override {
    auto session = std::make_unique<FakeMediaSession>(this, observer);
    last_session = session.get();
    ++sessions_created;
    return session;
  }

  // Script.
  bool ready_track = true;
  bool defer_create_offer = false;
  bool fail_create_offer = false;
  bool fail_set_remote = false;
  std::string offer_sdp = kVideoOffer;
  std::string answer_sdp = kVideoAnswer;

  // Record. Every call, in order, e.g. "CreateOffer(restart)",
  // "SetRemoteDescription(offer)", "AddIceCandidate(<line>)".
  std::vector<std::string> calls;
  std::vector<MediaSessionInterface::DescriptionCallback> deferred_offers;
  FakeMediaSession* last_session = nullptr;
  int sessions_created = 0;

  int CountCalls(const std::string& prefix) const {
    int count = 0;
    for (const auto& call : calls) {
      if (call.compare(0, prefix.size(), prefix) == 0) {
        ++count;
      }
    }
    return count;
  }

  int IndexOf(const std::string& call) const {
    for (size_t i = 0; i < calls.size(); ++i) {
      if (calls[i] == call) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }
};

inline const char* SdpTypeName(webrtc::SdpType type) {
  switch (type) {
    case webrtc::SdpType::kOffer:
      return "offer";
    case webrtc::SdpType::kAnswer:
      return "answer";
    default:
      return "other";
  }
}

inline void FakeMediaSession::CreateOffer(bool ice_restart, DescriptionCallback callback) {
  factory_->calls.push_back(ice_restart ? "CreateOffer(restart)" : "CreateOffer");
  if (factory_->fail_create_offer) {
    callback(webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR, "scripted failure"));
    return;
  }
  if (factory_->defer_create_offer) {
    factory_->deferred_offers.push_back(std::move(callback));
    return;
  }
  callback(factory_->offer_sdp);
}

inline void FakeMediaSession::CreateAnswer(DescriptionCallback callback) {
  factory_->calls.push_back("CreateAnswer");
  callback(factory_->answer_sdp);
}

inline void FakeMediaSession::SetLocalDescription(webrtc::SdpType type,
                                                  const std::string& sdp,
                                                  CompletionCallback callback) {
  factory_->calls.push_back(std::string("SetLocalDescription(") + SdpTypeName(type) + ")");
  callback(webrtc::RTCError::OK());
}

inline void FakeMediaSession::SetRemoteDescription(webrtc::SdpType type,
                                                   const std::string& sdp,
                                                   CompletionCallback callback) {
  factory_->calls.push_back(std::string("SetRemoteDescription(") + SdpTypeName(type) + ")");
  if (factory_->fail_set_remote) {
    callback(webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER, "scripted failure"));
    return;
  }
  callback(webrtc::RTCError::OK());
}

inline void FakeMediaSession::AddIceCandidate(const IceCandidateInfo& candidate,
                                              CompletionCallback callback) {
  factory_->calls.push_back("AddIceCandidate(" + candidate.sdp + ")");
  callback(webrtc::RTCError::OK());
}

inline bool FakeMediaSession::HasReadyTrack() const {
  return factory_->ready_track;
}

// In-memory SignalChannel. Writes are recorded and, when linked to a partner,
// delivered to it as coming from `id_at_partner`. Peer events are injected
// by the test.
class FakeSignalChannel : public SignalChannel {
 public:
  explicit FakeSignalChannel(rtc::Thread* network)
      : SignalChannel(network), network_(network) {}

  void Link(FakeSignalChannel* partner, const PeerId& id_at_partner) {
    partner_ = partner;
    id_at_partner_ = id_at_partner;
  }

  bool Start(DiscoveryRole role) override {
    started_ = true;
    return true;
  }
  void Stop() override {
    network_->BlockingCall([this]() { DiscardOutbox(); });
  }

  void ConnectPeer(const PeerId& peer) {
    network_->BlockingCall([this, &peer]() { NotifyPeerState(peer, PeerState::kConnected); });
  }
  void DisconnectPeer(const PeerId& peer) {
    network_->BlockingCall(
        [this, &peer]() { NotifyPeerState(peer, PeerState::kNotConnected); });
  }
  void Deliver(const PeerId& from, const std::string& payload) {
    network_->BlockingCall([this, &from, &payload]() { NotifyMessage(from, payload); });
  }
  void Deliver(const PeerId& from, const SignalMessage& message) {
    Deliver(from, EncodeSignalMessage(message));
  }

  void set_fail_writes(bool fail) {
    network_->BlockingCall([this, fail]() { fail_writes_ = fail; });
  }

  // Every write attempt as (peer, payload).
  std::vector<std::pair<PeerId, std::string>> written() {
    return network_->BlockingCall([this]() { return written_; });
  }

  // Decoded messages of one type, written to any peer.
  std::vector<SignalMessage> WrittenOfType(SignalMessage::Type type) {
    std::vector<SignalMessage> messages;
    for (const auto& entry : written()) {
      std::optional<SignalMessage> message = DecodeSignalMessage(entry.second);
      if (message && message->type == type) {
        messages.push_back(*message);
      }
    }
    return messages;
  }

  size_t QueuedCount() {
    return network_->BlockingCall([this]() { return outbox_size(); });
  }
  std::optional<PeerId> Canonical() {
    return network_->BlockingCall([this]() { return canonical_peer(); });
  }

  bool started() const { return started_; }

 protected:
  bool WriteToPeer(const PeerId& peer, const std::string& payload) override {
    written_.push_back({peer, payload});
    if (fail_writes_) {
      return false;
    }
    if (partner_) {
      FakeSignalChannel* partner = partner_;
      PeerId from = id_at_partner_;
      partner->network_->PostTask(
          [partner, from, payload]() { partner->NotifyMessage(from, payload); });
    }
    return true;
  }

 private:
  rtc::Thread* const network_;
  FakeSignalChannel* partner_ = nullptr;
  PeerId id_at_partner_;
  bool started_ = false;
  bool fail_writes_ = false;
  std::vector<std::pair<PeerId, std::string>> written_;
};

class FakeCaptureSource : public CaptureSourceInterface {
 public:
  bool Start() override {
    ++starts;
    if (fail_start) {
      return false;
    }
    running = true;
    ready_state = TrackReadyState::kLive;
    return true;
  }
  void Stop() override {
    ++stops;
    running = false;
  }
  bool IsRunning() const override { return running; }
  bool IsEnabled() const override { return enabled; }
  void SetEnabled(bool value) override { enabled = value; }
  TrackReadyState ReadyState() const override { return ready_state; }
  void SetFrameObserver(FrameObserver* value) override { observer = value; }

  bool running = true;
  bool enabled = true;
  bool fail_start = false;
  TrackReadyState ready_state = TrackReadyState::kLive;
  FrameObserver* observer = nullptr;
  int starts = 0;
  int stops = 0;
};

class FakeRenegotiationTarget : public RenegotiationTarget {
 public:
  NegotiationState state() const override { return current; }
  bool RequestRenegotiation() override {
    ++requests;
    if (!accept) {
      return false;
    }
    current = NegotiationState::kLocalOfferPending;
    return true;
  }

  NegotiationState current = NegotiationState::kStable;
  bool accept = true;
  int requests = 0;
};

class RecordingNegotiationObserver : public NegotiationObserver {
 public:
  void OnNegotiationStateChanged(NegotiationState state) override {
    states.push_back(state);
  }
  void OnProtocolError(const std::string& reason) override { errors.push_back(reason); }

  std::vector<NegotiationState> states;
  std::vector<std::string> errors;
};

class RecordingChannelObserver : public SignalChannelObserver {
 public:
  void OnPeerStateChanged(const PeerId& peer, PeerState state) override {
    events.push_back(peer + ":" + ToString(state));
    if (on_peer_state) {
      on_peer_state(peer, state);
    }
  }
  void OnMessageReceived(const PeerId& peer, const std::string& payload) override {
    messages.push_back({peer, payload});
  }

  std::function<void(const PeerId&, PeerState)> on_peer_state;
  std::vector<std::string> events;
  std::vector<std::pair<PeerId, std::string>> messages;
};

}  // namespace tandem_test

#endif  // WEBRTC_TANDEM_TEST_FAKES_H_
