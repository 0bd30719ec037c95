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

#ifndef WEBRTC_TANDEM_TYPES_H_
#define WEBRTC_TANDEM_TYPES_H_

#include <optional>
#include <string>

#include "option.h"

// Initiator always originates offers; Responder only answers.
enum class PeerRole { kInitiator, kResponder };

// Announce advertises and accepts, Scan browses and connects.
enum class DiscoveryRole { kAnnounce, kScan };

enum class NegotiationState {
  kIdle,
  kLocalOfferPending,
  kAwaitingAnswer,
  kRemoteOfferReceived,
  kLocalAnswerPending,
  kStable,
  kRenegotiating,
  kFailed,
};

// Connection state of the media session, as reported by the media engine.
enum class MediaConnectionState {
  kNew,
  kChecking,
  kConnected,
  kDisconnected,
  kFailed,
  kClosed,
};

// Connection state of one signaling peer.
enum class PeerState { kNotConnected, kConnecting, kConnected };

enum class TrackReadyState { kLive, kEnded };

using PeerId = std::string;

struct IceCandidateInfo {
  std::string sdp;
  std::optional<std::string> sdp_mid;
  int sdp_mline_index = 0;
};

TANDEM_API const char* ToString(PeerRole role);
TANDEM_API const char* ToString(DiscoveryRole role);
TANDEM_API const char* ToString(NegotiationState state);
TANDEM_API const char* ToString(MediaConnectionState state);
TANDEM_API const char* ToString(PeerState state);

TANDEM_API PeerRole PeerRoleFromOptions(const Options& opts);
// "auto" maps Initiator to Announce and Responder to Scan.
TANDEM_API DiscoveryRole DiscoveryRoleFromOptions(const Options& opts);

#endif  // WEBRTC_TANDEM_TYPES_H_
