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

#ifndef WEBRTC_TANDEM_STATS_LOGGER_H_
#define WEBRTC_TANDEM_STATS_LOGGER_H_

#include <cstdint>
#include <functional>
#include <optional>

#include "api/peer_connection_interface.h"
#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/stats/rtc_stats_collector_callback.h"
#include "api/stats/rtc_stats_report.h"
#include "api/units/time_delta.h"
#include "rtc_base/task_utils/repeating_task.h"
#include "rtc_base/thread.h"

#include "option.h"

// One reading of the video RTP stream in one direction.
struct VideoStreamSample {
  int64_t timestamp_ms = 0;
  uint64_t bytes = 0;
  uint64_t packets = 0;
  int64_t packets_lost = 0;
  uint32_t width = 0;
  uint32_t height = 0;
  double fps = 0;
  std::optional<double> rtt_ms;
};

struct StatsAssessment {
  uint64_t bytes_delta = 0;
  uint64_t packets_delta = 0;
  double bitrate_kbps = 0;
  int64_t new_packets_lost = 0;
  bool low_fps = false;
  bool frozen = false;
};

// Turns successive samples into deltas and health warnings.
class TANDEM_API StatsTracker {
 public:
  static constexpr double kLowFps = 5.0;
  static constexpr int64_t kFrozenAfterMs = 3000;

  StatsAssessment Update(const VideoStreamSample& sample);

 private:
  std::optional<VideoStreamSample> previous_;
  int64_t last_progress_ms_ = -1;
};

class StatsCallback : public webrtc::RTCStatsCollectorCallback {
 public:
  explicit StatsCallback(
      std::function<void(const rtc::scoped_refptr<const webrtc::RTCStatsReport>&)> callback)
      : callback_(callback) {}

  void OnStatsDelivered(
      const rtc::scoped_refptr<const webrtc::RTCStatsReport>& report) override {
    callback_(report);
  }

 private:
  std::function<void(const rtc::scoped_refptr<const webrtc::RTCStatsReport>&)> callback_;
};

// Periodically summarizes the video stream of a peer connection into the log.
// Runs on the signaling thread.
class TANDEM_API StatsLogger {
 public:
  StatsLogger(rtc::Thread* signaling_thread,
              rtc::scoped_refptr<webrtc::PeerConnectionInterface> peer_connection,
              bool sending,
              webrtc::TimeDelta interval,
              bool dump_reports);
  ~StatsLogger();

  void Start();
  void Stop();

 private:
  void Poll();
  void OnReport(const rtc::scoped_refptr<const webrtc::RTCStatsReport>& report);
  std::optional<VideoStreamSample> ExtractSample(const webrtc::RTCStatsReport& report) const;

  rtc::Thread* const signaling_thread_;
  rtc::scoped_refptr<webrtc::PeerConnectionInterface> peer_connection_;
  const bool sending_;
  const webrtc::TimeDelta interval_;
  const bool dump_reports_;
  StatsTracker tracker_;
  webrtc::RepeatingTaskHandle task_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
};

#endif  // WEBRTC_TANDEM_STATS_LOGGER_H_
