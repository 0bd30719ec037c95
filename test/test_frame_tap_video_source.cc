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

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "api/media_stream_interface.h"
#include "api/scoped_refptr.h"
#include "api/video/i420_buffer.h"
#include "api/video/video_frame.h"
#include "rtc_base/thread.h"

#include "fakes.h"
#include "video.h"

using tandem_test::Flush;
using tandem_test::WaitFor;

namespace {

webrtc::VideoFrame MakeFrame(int64_t timestamp_us) {
  return webrtc::VideoFrame::Builder()
      .set_video_frame_buffer(webrtc::I420Buffer::Create(16, 16))
      .set_timestamp_us(timestamp_us)
      .set_rotation(webrtc::kVideoRotation_0)
      .build();
}

class CountingFrameObserver : public FrameObserver {
 public:
  void OnFrameCaptured(int64_t timestamp_us) override {
    ++frames;
    last_timestamp_us = timestamp_us;
  }

  std::atomic<int> frames{0};
  std::atomic<int64_t> last_timestamp_us{0};
};

// Records every state the source reports and whether it was reported on the
// signaling thread.
class StateRecorder : public webrtc::ObserverInterface {
 public:
  StateRecorder(rtc::Thread* signaling, webrtc::MediaSourceInterface* source)
      : signaling_(signaling), source_(source) {}

  void OnChanged() override {
    on_signaling_thread = on_signaling_thread && signaling_->IsCurrent();
    states.push_back(source_->state());
  }

  bool on_signaling_thread = true;
  std::vector<webrtc::MediaSourceInterface::SourceState> states;

 private:
  rtc::Thread* const signaling_;
  webrtc::MediaSourceInterface* const source_;
};

class FrameTapVideoSourceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    signaling_ = rtc::Thread::Create();
    signaling_->SetName("signaling", nullptr);
    signaling_->Start();
    capture_ = rtc::Thread::Create();
    capture_->SetName("capture", nullptr);
    capture_->Start();

    source_ = rtc::make_ref_counted<webrtc::FrameTapVideoSource>(signaling_.get());
    source_->SetFrameObserver(&frames_);
    recorder_ = std::make_unique<StateRecorder>(signaling_.get(), source_.get());
    signaling_->BlockingCall([this]() { source_->RegisterObserver(recorder_.get()); });
  }

  void TearDown() override {
    Flush(capture_.get());
    signaling_->BlockingCall([this]() { source_->UnregisterObserver(recorder_.get()); });
    source_->SetFrameObserver(nullptr);
    source_ = nullptr;
    capture_->Stop();
    signaling_->Stop();
  }

  // Delivers a frame from the capture thread, as the capture module does.
  void CaptureFrame(int64_t timestamp_us) {
    webrtc::FrameTapVideoSource* source = source_.get();
    capture_->BlockingCall([source, timestamp_us]() { source->OnFrame(MakeFrame(timestamp_us)); });
  }

  webrtc::MediaSourceInterface::SourceState StateOnSignaling() {
    return signaling_->BlockingCall([this]() { return source_->state(); });
  }

  std::unique_ptr<rtc::Thread> signaling_;
  std::unique_ptr<rtc::Thread> capture_;
  rtc::scoped_refptr<webrtc::FrameTapVideoSource> source_;
  CountingFrameObserver frames_;
  std::unique_ptr<StateRecorder> recorder_;
};

}  // namespace

TEST_F(FrameTapVideoSourceTest, StartsInitializing) {
  EXPECT_FALSE(source_->is_live());
  EXPECT_FALSE(source_->is_ended());
  EXPECT_EQ(StateOnSignaling(), webrtc::MediaSourceInterface::kInitializing);
}

TEST_F(FrameTapVideoSourceTest, FirstFrameMakesSourceLiveOnSignalingThread) {
  CaptureFrame(1000);
  EXPECT_TRUE(source_->is_live());
  EXPECT_EQ(frames_.frames.load(), 1);
  EXPECT_EQ(frames_.last_timestamp_us.load(), 1000);

  ASSERT_TRUE(WaitFor(signaling_.get(), [this]() {
    return source_->state() == webrtc::MediaSourceInterface::kLive;
  }));
  signaling_->BlockingCall([this]() {
    EXPECT_TRUE(recorder_->on_signaling_thread);
    EXPECT_EQ(recorder_->states,
              (std::vector<webrtc::MediaSourceInterface::SourceState>{
                  webrtc::MediaSourceInterface::kLive}));
  });
}

TEST_F(FrameTapVideoSourceTest, LaterFramesDoNotRepostState) {
  CaptureFrame(1000);
  CaptureFrame(2000);
  CaptureFrame(3000);
  Flush(signaling_.get());

  EXPECT_EQ(frames_.frames.load(), 3);
  signaling_->BlockingCall([this]() { EXPECT_EQ(recorder_->states.size(), 1u); });
}

TEST_F(FrameTapVideoSourceTest, EndedUntilTheNextFrame) {
  CaptureFrame(1000);
  source_->MarkEnded();
  EXPECT_FALSE(source_->is_live());
  EXPECT_TRUE(source_->is_ended());
  Flush(signaling_.get());
  EXPECT_EQ(StateOnSignaling(), webrtc::MediaSourceInterface::kEnded);

  // Ending twice reports once.
  source_->MarkEnded();
  CaptureFrame(2000);
  EXPECT_TRUE(source_->is_live());
  EXPECT_FALSE(source_->is_ended());
  Flush(signaling_.get());

  signaling_->BlockingCall([this]() {
    EXPECT_TRUE(recorder_->on_signaling_thread);
    EXPECT_EQ(recorder_->states,
              (std::vector<webrtc::MediaSourceInterface::SourceState>{
                  webrtc::MediaSourceInterface::kLive, webrtc::MediaSourceInterface::kEnded,
                  webrtc::MediaSourceInterface::kLive}));
  });
}
