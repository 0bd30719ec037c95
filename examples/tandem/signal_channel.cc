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
#include "rtc_base/logging.h"

#include "signal_channel.h"

SignalChannel::SignalChannel(webrtc::TaskQueueBase* network_queue)
    : network_queue_(network_queue) {
  RTC_DCHECK(network_queue_);
}

SignalChannel::~SignalChannel() = default;

void SignalChannel::Send(std::string payload) {
  network_queue_->PostTask(webrtc::SafeTask(
      safety_.flag(), [this, payload = std::move(payload)]() mutable {
        SendOnQueue(std::move(payload));
      }));
}

void SignalChannel::SendTo(const PeerId& peer, std::string payload) {
  network_queue_->PostTask(webrtc::SafeTask(
      safety_.flag(), [this, peer, payload = std::move(payload)]() {
        SendToOnQueue(peer, payload);
      }));
}

void SignalChannel::ClearOutbox() {
  network_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [this]() {
    if (!outbox_.empty()) {
      RTC_LOG(LS_INFO) << "Dropping " << outbox_.size() << " queued messages";
    }
    outbox_.Clear();
  }));
}

size_t SignalChannel::outbox_size() const {
  RTC_DCHECK(network_queue_->IsCurrent());
  return outbox_.size();
}

std::optional<PeerId> SignalChannel::canonical_peer() const {
  RTC_DCHECK(network_queue_->IsCurrent());
  return canonical_peer_;
}

void SignalChannel::SendOnQueue(std::string payload) {
  if (!canonical_peer_) {
    RTC_LOG(LS_VERBOSE) << "No peer yet, queuing message (" << outbox_.size() + 1
                        << " waiting)";
    outbox_.Enqueue(std::move(payload));
    return;
  }
  Write(*canonical_peer_, payload);
}

void SignalChannel::SendToOnQueue(const PeerId& peer, const std::string& payload) {
  if (canonical_peer_ != peer) {
    RTC_LOG(LS_INFO) << "Dropping " << payload.size() << " bytes for departed peer "
                     << peer;
    return;
  }
  Write(peer, payload);
}

void SignalChannel::Write(const PeerId& peer, const std::string& payload) {
  if (!WriteToPeer(peer, payload)) {
    // A dropped message is not retried; the next offer supersedes it.
    ++send_failures_;
    RTC_LOG(LS_WARNING) << "Failed to send " << payload.size() << " bytes to " << peer
                        << " (" << send_failures_.load() << " failures so far)";
    return;
  }
  ++messages_sent_;
}

void SignalChannel::NotifyPeerState(const PeerId& peer, PeerState state) {
  RTC_DCHECK(network_queue_->IsCurrent());
  RTC_LOG(LS_INFO) << "Signaling peer " << peer << " is " << ToString(state);

  if (state == PeerState::kConnected && !canonical_peer_) {
    canonical_peer_ = peer;
    connected_ = true;
    size_t flushed = outbox_.Drain(
        [this, &peer](std::string payload) { Write(peer, payload); });
    if (flushed > 0) {
      RTC_LOG(LS_INFO) << "Flushed " << flushed << " queued messages to " << peer;
    }
  } else if (state == PeerState::kConnected) {
    RTC_LOG(LS_WARNING) << "Peer " << peer << " connected while " << *canonical_peer_
                        << " is active, it will not receive messages";
  } else if (state == PeerState::kNotConnected && canonical_peer_ == peer) {
    canonical_peer_.reset();
    connected_ = false;
  }

  if (observer_) {
    observer_->OnPeerStateChanged(peer, state);
  }
}

void SignalChannel::NotifyMessage(const PeerId& peer, const std::string& payload) {
  RTC_DCHECK(network_queue_->IsCurrent());
  if (observer_) {
    observer_->OnMessageReceived(peer, payload);
  }
}

void SignalChannel::DiscardOutbox() {
  RTC_DCHECK(network_queue_->IsCurrent());
  if (!outbox_.empty()) {
    RTC_LOG(LS_INFO) << "Discarding " << outbox_.size() << " queued messages";
  }
  outbox_.Clear();
  canonical_peer_.reset();
  connected_ = false;
}
