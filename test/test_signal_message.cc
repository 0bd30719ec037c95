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

#include <memory>
#include <optional>
#include <string>

#include <gtest/gtest.h>
#include <json/json.h>

#include "signal_message.h"

namespace {

Json::Value Parse(const std::string& payload) {
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errs;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  EXPECT_TRUE(reader->parse(payload.data(), payload.data() + payload.size(), &root, &errs))
      << errs;
  return root;
}

}  // namespace

TEST(SignalMessageTest, OfferIsEncodedAsTypedObject) {
  Json::Value root = Parse(EncodeSignalMessage(SignalMessage::Offer("v=0\r\n")));
  EXPECT_EQ(root["type"].asString(), "offer");
  EXPECT_EQ(root["sdp"].asString(), "v=0\r\n");
  EXPECT_FALSE(root.isMember("sdpMid"));
}

TEST(SignalMessageTest, CandidateCarriesMidAndLineIndex) {
  IceCandidateInfo candidate;
  candidate.sdp = "candidate:1 1 udp 1 10.0.0.1 5000 typ host";
  candidate.sdp_mid = "0";
  candidate.sdp_mline_index = 1;

  std::string payload = EncodeSignalMessage(SignalMessage::Candidate(candidate));
  Json::Value root = Parse(payload);
  EXPECT_EQ(root["type"].asString(), "candidate");
  EXPECT_EQ(root["sdpMid"].asString(), "0");
  EXPECT_EQ(root["sdpMLineIndex"].asInt(), 1);

  std::optional<SignalMessage> decoded = DecodeSignalMessage(payload);
  ASSERT_TRUE(decoded);
  EXPECT_EQ(decoded->type, SignalMessage::Type::kCandidate);
  EXPECT_EQ(decoded->sdp, candidate.sdp);
  EXPECT_EQ(decoded->sdp_mid, std::optional<std::string>("0"));
  EXPECT_EQ(decoded->sdp_mline_index, 1);
}

TEST(SignalMessageTest, CandidateWithoutMidEncodesNull) {
  IceCandidateInfo candidate;
  candidate.sdp = "candidate:2 1 udp 1 10.0.0.2 5001 typ host";

  std::string payload = EncodeSignalMessage(SignalMessage::Candidate(candidate));
  EXPECT_TRUE(Parse(payload)["sdpMid"].isNull());

  std::optional<SignalMessage> decoded = DecodeSignalMessage(payload);
  ASSERT_TRUE(decoded);
  EXPECT_FALSE(decoded->sdp_mid.has_value());
}

TEST(SignalMessageTest, AcceptsLegacyCandidateKey) {
  std::optional<SignalMessage> decoded = DecodeSignalMessage(
      R"({"type":"candidate","candidate":"candidate:3 1 udp 1 10.0.0.3 5002 typ host",)"
      R"("sdpMid":"video","sdpMLineIndex":0})");
  ASSERT_TRUE(decoded);
  EXPECT_EQ(decoded->sdp, "candidate:3 1 udp 1 10.0.0.3 5002 typ host");
  EXPECT_EQ(decoded->sdp_mid, std::optional<std::string>("video"));
}

TEST(SignalMessageTest, RejectsMalformedJson) {
  std::string error;
  EXPECT_FALSE(DecodeSignalMessage("{\"type\":\"offer\",", &error));
  EXPECT_NE(error.find("malformed"), std::string::npos);
}

TEST(SignalMessageTest, RejectsNonObjectPayload) {
  std::string error;
  EXPECT_FALSE(DecodeSignalMessage("[1,2,3]", &error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(DecodeSignalMessage("\"offer\""));
}

TEST(SignalMessageTest, RejectsUnknownType) {
  std::string error;
  EXPECT_FALSE(DecodeSignalMessage(R"({"type":"bye"})", &error));
  EXPECT_NE(error.find("bye"), std::string::npos);
}

TEST(SignalMessageTest, RejectsMissingFields) {
  EXPECT_FALSE(DecodeSignalMessage(R"({"sdp":"v=0"})"));
  EXPECT_FALSE(DecodeSignalMessage(R"({"type":"answer"})"));
  EXPECT_FALSE(DecodeSignalMessage(R"({"type":"offer","sdp":""})"));
  EXPECT_FALSE(DecodeSignalMessage(R"({"type":"candidate","sdpMLineIndex":0})"));
  EXPECT_FALSE(DecodeSignalMessage(R"({"type":"candidate","sdp":"candidate:1"})"));
  EXPECT_FALSE(
      DecodeSignalMessage(R"({"type":"candidate","sdp":"candidate:1","sdpMLineIndex":-1})"));
  EXPECT_FALSE(DecodeSignalMessage(
      R"({"type":"candidate","sdp":"candidate:1","sdpMLineIndex":0,"sdpMid":5})"));
}
