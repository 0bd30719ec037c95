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

#ifndef WEBRTC_TANDEM_SIGNAL_CHANNEL_H_
#define WEBRTC_TANDEM_SIGNAL_CHANNEL_H_

#include <atomic>
#include <optional>
#include <string>

#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"

#include "ordered_queue.h"
#include "types.h"

// Receives transport events. Called on the channel's network queue.
class SignalChannelObserver {
 public:
  virtual void OnPeerStateChanged(const PeerId& peer, PeerState state) = 0;
  virtual void OnMessageReceived(const PeerId& peer, const std::string& payload) = 0;

 protected:
  virtual ~SignalChannelObserver() = default;
};

// Ordered, reliable messaging with one canonical peer and a send-time outbox.
//
// Send() may be called from any thread and never blocks: the payload is
// posted to the network queue, where it is either written to the canonical
// peer or appended to the outbox. When the first peer connects the outbox is
// flushed to it in enqueue order before the observer hears about the
// connection, so nothing sent afterwards can overtake buffered payloads.
//
// Further peers are accepted and reported to the observer but never receive
// sends. When the canonical peer goes away the next peer to connect takes
// its place. SendTo() names the peer a payload belongs to, so it is dropped
// instead of reaching whoever replaced that peer.
class TANDEM_API SignalChannel {
 public:
  explicit SignalChannel(webrtc::TaskQueueBase* network_queue);
  virtual ~SignalChannel();

  // Must be set before Start().
  void SetObserver(SignalChannelObserver* observer) { observer_ = observer; }

  virtual bool Start(DiscoveryRole role) = 0;
  // Closes every connection and discards the outbox.
  virtual void Stop() = 0;

  void Send(std::string payload);
  // Writes only while `peer` is the canonical peer; never queued.
  void SendTo(const PeerId& peer, std::string payload);
  // Drops queued payloads once every earlier Send() has been handled. The
  // canonical peer is kept.
  void ClearOutbox();

  bool IsConnected() const { return connected_.load(); }
  int send_failures() const { return send_failures_.load(); }
  int messages_sent() const { return messages_sent_.load(); }

  // Network queue only.
  size_t outbox_size() const;
  std::optional<PeerId> canonical_peer() const;

 protected:
  // Called by implementations on the network queue.
  void NotifyPeerState(const PeerId& peer, PeerState state);
  void NotifyMessage(const PeerId& peer, const std::string& payload);
  void DiscardOutbox();

  // Writes one framed payload to `peer`. Returns false when the write failed.
  virtual bool WriteToPeer(const PeerId& peer, const std::string& payload) = 0;

  webrtc::TaskQueueBase* network_queue() const { return network_queue_; }
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_flag() {
    return safety_.flag();
  }

 private:
  void SendOnQueue(std::string payload);
  void SendToOnQueue(const PeerId& peer, const std::string& payload);
  void Write(const PeerId& peer, const std::string& payload);

  webrtc::TaskQueueBase* const network_queue_;
  SignalChannelObserver* observer_ = nullptr;
  OrderedQueue<std::string> outbox_;
  std::optional<PeerId> canonical_peer_;
  std::atomic<bool> connected_{false};
  std::atomic<int> send_failures_{0};
  std::atomic<int> messages_sent_{0};
  webrtc::ScopedTaskSafetyDetached safety_;
};

#endif  // WEBRTC_TANDEM_SIGNAL_CHANNEL_H_
