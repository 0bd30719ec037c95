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

#include "api/stats/rtcstats_objects.h"
#include "rtc_base/logging.h"
#include "rtc_base/time_utils.h"

#include "stats_logger.h"

StatsAssessment StatsTracker::Update(const VideoStreamSample& sample) {
  StatsAssessment assessment;
  if (last_progress_ms_ < 0) {
    last_progress_ms_ = sample.timestamp_ms;
  }

  if (previous_) {
    if (sample.bytes >= previous_->bytes) {
      assessment.bytes_delta = sample.bytes - previous_->bytes;
    }
    if (sample.packets >= previous_->packets) {
      assessment.packets_delta = sample.packets - previous_->packets;
    }
    const int64_t elapsed_ms = sample.timestamp_ms - previous_->timestamp_ms;
    if (elapsed_ms > 0) {
      assessment.bitrate_kbps = assessment.bytes_delta * 8.0 / elapsed_ms;
    }
    if (sample.packets_lost > previous_->packets_lost) {
      assessment.new_packets_lost = sample.packets_lost - previous_->packets_lost;
    }
    if (assessment.bytes_delta > 0) {
      last_progress_ms_ = sample.timestamp_ms;
    }
    assessment.low_fps = sample.fps < kLowFps;
  }
  assessment.frozen = sample.timestamp_ms - last_progress_ms_ > kFrozenAfterMs;

  previous_ = sample;
  return assessment;
}

StatsLogger::StatsLogger(rtc::Thread* signaling_thread,
                         rtc::scoped_refptr<webrtc::PeerConnectionInterface> peer_connection,
                         bool sending,
                         webrtc::TimeDelta interval,
                         bool dump_reports)
    : signaling_thread_(signaling_thread),
      peer_connection_(peer_connection),
      sending_(sending),
      interval_(interval),
      dump_reports_(dump_reports) {}

StatsLogger::~StatsLogger() {
  Stop();
}

void StatsLogger::Start() {
  RTC_DCHECK_RUN_ON(signaling_thread_);
  if (task_.Running()) {
    return;
  }
  safety_ = webrtc::PendingTaskSafetyFlag::Create();
  task_ = webrtc::RepeatingTaskHandle::DelayedStart(signaling_thread_, interval_, [this]() {
    Poll();
    return interval_;
  });
}

void StatsLogger::Stop() {
  if (safety_) {
    safety_->SetNotAlive();
  }
  if (task_.Running()) {
    task_.Stop();
  }
}

void StatsLogger::Poll() {
  if (!peer_connection_) {
    return;
  }
  auto flag = safety_;
  peer_connection_->GetStats(rtc::make_ref_counted<StatsCallback>(
      [this, flag](const rtc::scoped_refptr<const webrtc::RTCStatsReport>& report) {
        if (flag->alive()) {
          OnReport(report);
        }
      }).get());
}

std::optional<VideoStreamSample> StatsLogger::ExtractSample(
    const webrtc::RTCStatsReport& report) const {
  VideoStreamSample sample;
  sample.timestamp_ms = rtc::TimeMillis();
  bool found = false;

  if (sending_) {
    for (const auto* outbound : report.GetStatsOfType<webrtc::RTCOutboundRtpStreamStats>()) {
      if (!outbound->kind.has_value() || *outbound->kind != "video") {
        continue;
      }
      found = true;
      if (outbound->bytes_sent.has_value()) sample.bytes += *outbound->bytes_sent;
      if (outbound->packets_sent.has_value()) sample.packets += *outbound->packets_sent;
      if (outbound->frame_width.has_value()) sample.width = *outbound->frame_width;
      if (outbound->frame_height.has_value()) sample.height = *outbound->frame_height;
      if (outbound->frames_per_second.has_value()) sample.fps = *outbound->frames_per_second;
    }
    for (const auto* remote :
         report.GetStatsOfType<webrtc::RTCRemoteInboundRtpStreamStats>()) {
      if (remote->kind.has_value() && *remote->kind == "video" &&
          remote->packets_lost.has_value()) {
        sample.packets_lost += *remote->packets_lost;
      }
    }
  } else {
    for (const auto* inbound : report.GetStatsOfType<webrtc::RTCInboundRtpStreamStats>()) {
      if (!inbound->kind.has_value() || *inbound->kind != "video") {
        continue;
      }
      found = true;
      if (inbound->bytes_received.has_value()) sample.bytes += *inbound->bytes_received;
      if (inbound->packets_received.has_value()) sample.packets += *inbound->packets_received;
      if (inbound->packets_lost.has_value()) sample.packets_lost += *inbound->packets_lost;
      if (inbound->frame_width.has_value()) sample.width = *inbound->frame_width;
      if (inbound->frame_height.has_value()) sample.height = *inbound->frame_height;
      if (inbound->frames_per_second.has_value()) sample.fps = *inbound->frames_per_second;
    }
  }

  for (const auto* pair : report.GetStatsOfType<webrtc::RTCIceCandidatePairStats>()) {
    if (pair->nominated.has_value() && *pair->nominated &&
        pair->current_round_trip_time.has_value()) {
      sample.rtt_ms = *pair->current_round_trip_time * 1000.0;
    }
  }

  if (!found) {
    return std::nullopt;
  }
  return sample;
}

void StatsLogger::OnReport(const rtc::scoped_refptr<const webrtc::RTCStatsReport>& report) {
  if (dump_reports_) {
    RTC_LOG(LS_INFO) << "Stats report:\n" << report->ToJson();
  }

  std::optional<VideoStreamSample> sample = ExtractSample(*report);
  if (!sample) {
    RTC_LOG(LS_INFO) << "Stats: no video " << (sending_ ? "outbound" : "inbound")
                     << " stream yet";
    return;
  }

  StatsAssessment assessment = tracker_.Update(*sample);
  RTC_LOG(LS_INFO) << "Stats " << (sending_ ? "sent " : "received ") << sample->bytes
                   << " bytes (+" << assessment.bytes_delta << "), " << sample->packets
                   << " packets (+" << assessment.packets_delta << "), "
                   << static_cast<int>(assessment.bitrate_kbps) << " kbps, "
                   << sample->width << "x" << sample->height << "@" << sample->fps
                   << "fps, rtt "
                   << (sample->rtt_ms ? std::to_string(static_cast<int>(*sample->rtt_ms)) : "-")
                   << " ms";

  if (assessment.frozen) {
    RTC_LOG(LS_WARNING) << "Video stream frozen, no bytes for over "
                        << StatsTracker::kFrozenAfterMs << " ms";
  } else if (assessment.low_fps) {
    RTC_LOG(LS_WARNING) << "Low frame rate: " << sample->fps << " fps";
  }
  if (assessment.new_packets_lost > 0) {
    RTC_LOG(LS_WARNING) << "Packet loss: " << assessment.new_packets_lost
                        << " packets since last report (" << sample->packets_lost
                        << " total)";
  }
}
