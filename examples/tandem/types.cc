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

#include "types.h"

const char* ToString(PeerRole role) {
  switch (role) {
    case PeerRole::kInitiator:
      return "initiator";
    case PeerRole::kResponder:
      return "responder";
  }
  return "unknown";
}

const char* ToString(DiscoveryRole role) {
  switch (role) {
    case DiscoveryRole::kAnnounce:
      return "announce";
    case DiscoveryRole::kScan:
      return "scan";
  }
  return "unknown";
}

const char* ToString(NegotiationState state) {
  switch (state) {
    case NegotiationState::kIdle:
      return "Idle";
    case NegotiationState::kLocalOfferPending:
      return "LocalOfferPending";
    case NegotiationState::kAwaitingAnswer:
      return "AwaitingAnswer";
    case NegotiationState::kRemoteOfferReceived:
      return "RemoteOfferReceived";
    case NegotiationState::kLocalAnswerPending:
      return "LocalAnswerPending";
    case NegotiationState::kStable:
      return "Stable";
    case NegotiationState::kRenegotiating:
      return "Renegotiating";
    case NegotiationState::kFailed:
      return "Failed";
  }
  return "Unknown";
}

const char* ToString(MediaConnectionState state) {
  switch (state) {
    case MediaConnectionState::kNew:
      return "New";
    case MediaConnectionState::kChecking:
      return "Checking";
    case MediaConnectionState::kConnected:
      return "Connected";
    case MediaConnectionState::kDisconnected:
      return "Disconnected";
    case MediaConnectionState::kFailed:
      return "Failed";
    case MediaConnectionState::kClosed:
      return "Closed";
  }
  return "Unknown";
}

const char* ToString(PeerState state) {
  switch (state) {
    case PeerState::kNotConnected:
      return "NotConnected";
    case PeerState::kConnecting:
      return "Connecting";
    case PeerState::kConnected:
      return "Connected";
  }
  return "Unknown";
}

PeerRole PeerRoleFromOptions(const Options& opts) {
  return opts.mode == "responder" ? PeerRole::kResponder : PeerRole::kInitiator;
}

DiscoveryRole DiscoveryRoleFromOptions(const Options& opts) {
  if (opts.discovery == "announce") {
    return DiscoveryRole::kAnnounce;
  }
  if (opts.discovery == "scan") {
    return DiscoveryRole::kScan;
  }
  return PeerRoleFromOptions(opts) == PeerRole::kInitiator ? DiscoveryRole::kAnnounce
                                                           : DiscoveryRole::kScan;
}
