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

#include <json/json.h>

#include <memory>
#include <utility>

#include "signal_message.h"
#include "status.h"

namespace {

bool fail(std::string* error, const std::string& reason) {
  if (error) {
    *error = reason;
  }
  return false;
}

bool readSdp(const Json::Value& root, const char* key, std::string& out) {
  if (!root.isMember(key) || !root[key].isString()) {
    return false;
  }
  out = root[key].asString();
  return !out.empty();
}

}  // namespace

SignalMessage SignalMessage::Offer(std::string sdp) {
  SignalMessage message;
  message.type = Type::kOffer;
  message.sdp = std::move(sdp);
  return message;
}

SignalMessage SignalMessage::Answer(std::string sdp) {
  SignalMessage message;
  message.type = Type::kAnswer;
  message.sdp = std::move(sdp);
  return message;
}

SignalMessage SignalMessage::Candidate(const IceCandidateInfo& candidate) {
  SignalMessage message;
  message.type = Type::kCandidate;
  message.sdp = candidate.sdp;
  message.sdp_mid = candidate.sdp_mid;
  message.sdp_mline_index = candidate.sdp_mline_index;
  return message;
}

IceCandidateInfo SignalMessage::ToCandidate() const {
  IceCandidateInfo candidate;
  candidate.sdp = sdp;
  candidate.sdp_mid = sdp_mid;
  candidate.sdp_mline_index = sdp_mline_index;
  return candidate;
}

const char* ToString(SignalMessage::Type type) {
  switch (type) {
    case SignalMessage::Type::kOffer:
      return Msg::kOffer;
    case SignalMessage::Type::kAnswer:
      return Msg::kAnswer;
    case SignalMessage::Type::kCandidate:
      return Msg::kCandidate;
  }
  return "unknown";
}

std::string EncodeSignalMessage(const SignalMessage& message) {
  Json::Value root(Json::objectValue);
  root[Msg::kType] = ToString(message.type);
  root[Msg::kSdp] = message.sdp;
  if (message.type == SignalMessage::Type::kCandidate) {
    root[Msg::kSdpMid] = message.sdp_mid ? Json::Value(*message.sdp_mid)
                                         : Json::Value(Json::nullValue);
    root[Msg::kSdpMLineIndex] = message.sdp_mline_index;
  }

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  return Json::writeString(writer, root);
}

std::optional<SignalMessage> DecodeSignalMessage(const std::string& payload,
                                                 std::string* error) {
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errs;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  if (!reader->parse(payload.data(), payload.data() + payload.size(), &root, &errs)) {
    fail(error, "malformed JSON: " + errs);
    return std::nullopt;
  }
  if (!root.isObject()) {
    fail(error, "payload is not a JSON object");
    return std::nullopt;
  }
  if (!root.isMember(Msg::kType) || !root[Msg::kType].isString()) {
    fail(error, "missing message type");
    return std::nullopt;
  }

  const std::string type = root[Msg::kType].asString();
  SignalMessage message;
  if (type == Msg::kOffer || type == Msg::kAnswer) {
    message.type = type == Msg::kOffer ? SignalMessage::Type::kOffer
                                       : SignalMessage::Type::kAnswer;
    if (!readSdp(root, Msg::kSdp, message.sdp)) {
      fail(error, type + " without sdp");
      return std::nullopt;
    }
    return message;
  }

  if (type != Msg::kCandidate) {
    fail(error, "unknown message type '" + type + "'");
    return std::nullopt;
  }

  message.type = SignalMessage::Type::kCandidate;
  if (!readSdp(root, Msg::kSdp, message.sdp) &&
      !readSdp(root, Msg::kLegacyCandidate, message.sdp)) {
    fail(error, "candidate without candidate line");
    return std::nullopt;
  }
  if (!root.isMember(Msg::kSdpMLineIndex) || !root[Msg::kSdpMLineIndex].isInt()) {
    fail(error, "candidate without sdpMLineIndex");
    return std::nullopt;
  }
  message.sdp_mline_index = root[Msg::kSdpMLineIndex].asInt();
  if (message.sdp_mline_index < 0) {
    fail(error, "negative sdpMLineIndex");
    return std::nullopt;
  }
  if (root.isMember(Msg::kSdpMid)) {
    const Json::Value& mid = root[Msg::kSdpMid];
    if (mid.isString()) {
      message.sdp_mid = mid.asString();
    } else if (!mid.isNull()) {
      fail(error, "sdpMid is neither string nor null");
      return std::nullopt;
    }
  }
  return message;
}
