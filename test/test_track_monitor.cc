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

#include <gtest/gtest.h>

#include "api/units/time_delta.h"
#include "rtc_base/thread.h"
#include "system_wrappers/include/clock.h"

#include "fakes.h"
#include "track_monitor.h"

using tandem_test::FakeCaptureSource;
using tandem_test::FakeRenegotiationTarget;
using tandem_test::WaitFor;

namespace {

class TrackMonitorTest : public ::testing::Test {
 protected:
  TrackMonitorTest() : clock_(1000000) {}

  void SetUp() override {
    queue_ = rtc::Thread::Create();
    queue_->Start();
  }

  void TearDown() override {
    queue_->BlockingCall([this]() { monitor_.reset(); });
    queue_->Stop();
  }

  void CreateMonitor(TrackMonitor::Mode mode) {
    TrackMonitor::Config config;
    config.mode = mode;
    // Checks are driven by hand.
    config.health_check_interval = webrtc::TimeDelta::Seconds(3600);
    config.stall_threshold = webrtc::TimeDelta::Seconds(6);
    config.restart_delay = webrtc::TimeDelta::Millis(1);
    config.remote_freeze_threshold = webrtc::TimeDelta::Seconds(3);
    const bool local = mode == TrackMonitor::Mode::kLocalCapture;
    queue_->BlockingCall([this, config, local]() {
      monitor_ = std::make_unique<TrackMonitor>(config, queue_.get(), &clock_,
                                                local ? &capture_ : nullptr,
                                                local ? &target_ : nullptr);
      monitor_->Start();
    });
  }

  void Check() {
    queue_->BlockingCall([this]() { monitor_->RunHealthCheck(); });
  }

  bool WaitForRestartToFinish() {
    return WaitFor(queue_.get(), [this]() { return !monitor_->restarting(); });
  }

  webrtc::SimulatedClock clock_;
  std::unique_ptr<rtc::Thread> queue_;
  FakeCaptureSource capture_;
  FakeRenegotiationTarget target_;
  std::unique_ptr<TrackMonitor> monitor_;
};

}  // namespace

TEST_F(TrackMonitorTest, StartObservesCaptureFrames) {
  CreateMonitor(TrackMonitor::Mode::kLocalCapture);
  EXPECT_EQ(capture_.observer, monitor_.get());

  capture_.observer->OnFrameCaptured(1);
  capture_.observer->OnFrameCaptured(2);
  EXPECT_EQ(monitor_->frames_seen(), 2);
}

TEST_F(TrackMonitorTest, HealthyCaptureIsLeftAlone) {
  CreateMonitor(TrackMonitor::Mode::kLocalCapture);
  clock_.AdvanceTimeMilliseconds(4000);
  monitor_->OnFrameCaptured(clock_.TimeInMicroseconds());
  clock_.AdvanceTimeMilliseconds(4000);
  Check();

  queue_->BlockingCall([this]() {
    EXPECT_EQ(monitor_->capture_restarts(), 0);
    EXPECT_EQ(capture_.stops, 0);
    EXPECT_EQ(target_.requests, 0);
  });
}

TEST_F(TrackMonitorTest, StalledCaptureIsRestartedAndRenegotiated) {
  CreateMonitor(TrackMonitor::Mode::kLocalCapture);
  clock_.AdvanceTimeMilliseconds(7000);
  Check();

  ASSERT_TRUE(WaitFor(queue_.get(), [this]() { return monitor_->renegotiation_requests() == 1; }));
  queue_->BlockingCall([this]() {
    EXPECT_EQ(monitor_->capture_restarts(), 1);
    EXPECT_EQ(capture_.stops, 1);
    EXPECT_EQ(capture_.starts, 1);
    EXPECT_TRUE(capture_.running);
    EXPECT_EQ(target_.requests, 1);
    EXPECT_FALSE(monitor_->renegotiation_pending());
  });
}

TEST_F(TrackMonitorTest, StallDuringRenegotiationWaits) {
  CreateMonitor(TrackMonitor::Mode::kLocalCapture);
  clock_.AdvanceTimeMilliseconds(7000);
  Check();
  ASSERT_TRUE(WaitFor(queue_.get(), [this]() { return monitor_->renegotiation_requests() == 1; }));
  // The accepted request left the target in LocalOfferPending.

  clock_.AdvanceTimeMilliseconds(7000);
  Check();
  ASSERT_TRUE(WaitForRestartToFinish());

  queue_->BlockingCall([this]() {
    EXPECT_EQ(monitor_->capture_restarts(), 1);
    EXPECT_EQ(monitor_->renegotiation_requests(), 1);
    EXPECT_EQ(target_.requests, 1);
  });
}

TEST_F(TrackMonitorTest, RenegotiationIsDeferredUntilControllerIsStable) {
  queue_->BlockingCall([this]() { target_.current = NegotiationState::kFailed; });
  CreateMonitor(TrackMonitor::Mode::kLocalCapture);
  clock_.AdvanceTimeMilliseconds(7000);
  Check();
  ASSERT_TRUE(WaitFor(queue_.get(), [this]() {
    return !monitor_->restarting() && monitor_->renegotiation_pending();
  }));

  queue_->BlockingCall([this]() {
    EXPECT_EQ(monitor_->capture_restarts(), 1);
    EXPECT_EQ(target_.requests, 0);
    target_.current = NegotiationState::kAwaitingAnswer;
  });
  Check();
  queue_->BlockingCall([this]() { EXPECT_EQ(target_.requests, 0); });

  queue_->BlockingCall([this]() { target_.current = NegotiationState::kStable; });
  Check();
  queue_->BlockingCall([this]() {
    EXPECT_EQ(target_.requests, 1);
    EXPECT_EQ(monitor_->renegotiation_requests(), 1);
    EXPECT_FALSE(monitor_->renegotiation_pending());
    EXPECT_EQ(monitor_->capture_restarts(), 1);
  });
}

TEST_F(TrackMonitorTest, RefusedRenegotiationIsRetried) {
  queue_->BlockingCall([this]() { target_.accept = false; });
  CreateMonitor(TrackMonitor::Mode::kLocalCapture);
  clock_.AdvanceTimeMilliseconds(7000);
  Check();
  ASSERT_TRUE(WaitFor(queue_.get(), [this]() { return target_.requests == 1; }));

  queue_->BlockingCall([this]() {
    EXPECT_TRUE(monitor_->renegotiation_pending());
    target_.accept = true;
  });
  Check();
  queue_->BlockingCall([this]() {
    EXPECT_EQ(target_.requests, 2);
    EXPECT_EQ(monitor_->renegotiation_requests(), 1);
  });
}

TEST_F(TrackMonitorTest, EndedTrackIsRestarted) {
  CreateMonitor(TrackMonitor::Mode::kLocalCapture);
  queue_->BlockingCall([this]() { capture_.ready_state = TrackReadyState::kEnded; });
  Check();

  ASSERT_TRUE(WaitFor(queue_.get(), [this]() { return monitor_->renegotiation_requests() == 1; }));
  queue_->BlockingCall([this]() {
    EXPECT_EQ(monitor_->capture_restarts(), 1);
    EXPECT_EQ(capture_.ready_state, TrackReadyState::kLive);
  });
}

TEST_F(TrackMonitorTest, FailedCaptureStartIsRetriedOnNextCheck) {
  CreateMonitor(TrackMonitor::Mode::kLocalCapture);
  queue_->BlockingCall([this]() { capture_.fail_start = true; });
  clock_.AdvanceTimeMilliseconds(7000);
  Check();
  ASSERT_TRUE(WaitFor(queue_.get(), [this]() { return capture_.starts == 1; }));
  ASSERT_TRUE(WaitForRestartToFinish());

  queue_->BlockingCall([this]() {
    EXPECT_EQ(target_.requests, 0);
    EXPECT_FALSE(monitor_->renegotiation_pending());
    capture_.fail_start = false;
  });

  clock_.AdvanceTimeMilliseconds(7000);
  Check();
  ASSERT_TRUE(WaitFor(queue_.get(), [this]() { return monitor_->renegotiation_requests() == 1; }));
  queue_->BlockingCall([this]() { EXPECT_EQ(monitor_->capture_restarts(), 2); });
}

TEST_F(TrackMonitorTest, UnexpectedlyDisabledTrackIsReenabled) {
  CreateMonitor(TrackMonitor::Mode::kLocalCapture);
  queue_->BlockingCall([this]() { capture_.enabled = false; });
  Check();

  queue_->BlockingCall([this]() {
    EXPECT_TRUE(capture_.enabled);
    EXPECT_EQ(monitor_->capture_restarts(), 0);
  });
}

TEST_F(TrackMonitorTest, UserDisabledTrackIsLeftAlone) {
  CreateMonitor(TrackMonitor::Mode::kLocalCapture);
  queue_->BlockingCall([this]() { monitor_->SetUserDisabled(true); });
  clock_.AdvanceTimeMilliseconds(7000);
  Check();

  queue_->BlockingCall([this]() {
    EXPECT_FALSE(capture_.enabled);
    EXPECT_EQ(monitor_->capture_restarts(), 0);
    monitor_->SetUserDisabled(false);
    EXPECT_TRUE(capture_.enabled);
  });
}

TEST_F(TrackMonitorTest, RemoteFreezeIsReportedOncePerEpisode) {
  CreateMonitor(TrackMonitor::Mode::kRemoteWatch);
  Check();
  queue_->BlockingCall([this]() { EXPECT_EQ(monitor_->freezes_reported(), 0); });

  monitor_->OnFrameCaptured(clock_.TimeInMicroseconds());
  clock_.AdvanceTimeMilliseconds(4000);
  Check();
  Check();
  queue_->BlockingCall([this]() { EXPECT_EQ(monitor_->freezes_reported(), 1); });

  monitor_->OnFrameCaptured(clock_.TimeInMicroseconds());
  Check();
  clock_.AdvanceTimeMilliseconds(4000);
  Check();
  queue_->BlockingCall([this]() { EXPECT_EQ(monitor_->freezes_reported(), 2); });
}

TEST(TrackMonitorConfigTest, FollowsOptions) {
  Options opts;
  opts.mode = "responder";
  opts.stall_threshold_ms = 9000;
  opts.capture_restart_delay_ms = 0;
  TrackMonitor::Config config = TrackMonitor::ConfigFromOptions(opts);
  EXPECT_EQ(config.mode, TrackMonitor::Mode::kRemoteWatch);
  EXPECT_EQ(config.stall_threshold.ms(), 9000);
  EXPECT_EQ(config.restart_delay.ms(), 0);
  EXPECT_EQ(config.health_check_interval.ms(), 5000);
}
