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

#ifndef WEBRTC_TANDEM_SIGNAL_MESSAGE_H_
#define WEBRTC_TANDEM_SIGNAL_MESSAGE_H_

#include <optional>
#include <string>

#include "types.h"

// One signaling message. Offers and answers only use `sdp`; candidates also
// carry the media section they belong to.
struct SignalMessage {
  enum class Type { kOffer, kAnswer, kCandidate };

  Type type = Type::kOffer;
  std::string sdp;
  std::optional<std::string> sdp_mid;
  int sdp_mline_index = 0;

  static SignalMessage Offer(std::string sdp);
  static SignalMessage Answer(std::string sdp);
  static SignalMessage Candidate(const IceCandidateInfo& candidate);

  IceCandidateInfo ToCandidate() const;
};

TANDEM_API const char* ToString(SignalMessage::Type type);

// Serializes to a compact JSON object:
//   {"type":"offer","sdp":"..."}
//   {"type":"candidate","sdp":"...","sdpMid":"0","sdpMLineIndex":0}
TANDEM_API std::string EncodeSignalMessage(const SignalMessage& message);

// Parses a payload produced by EncodeSignalMessage. Returns nullopt and fills
// `error` (when given) for anything that is not a well formed message.
TANDEM_API std::optional<SignalMessage> DecodeSignalMessage(const std::string& payload,
                                                            std::string* error = nullptr);

#endif  // WEBRTC_TANDEM_SIGNAL_MESSAGE_H_
