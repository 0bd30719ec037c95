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
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "fakes.h"

using tandem_test::FakeSignalChannel;
using tandem_test::Flush;
using tandem_test::RecordingChannelObserver;

namespace {

using Written = std::vector<std::pair<PeerId, std::string>>;

class SignalChannelTest : public ::testing::Test {
 protected:
  void SetUp() override {
    network_ = rtc::Thread::Create();
    network_->Start();
    channel_ = std::make_unique<FakeSignalChannel>(network_.get());
    channel_->SetObserver(&observer_);
    channel_->Start(DiscoveryRole::kAnnounce);
  }

  void TearDown() override {
    network_->BlockingCall([this]() { channel_.reset(); });
    network_->Stop();
  }

  std::unique_ptr<rtc::Thread> network_;
  std::unique_ptr<FakeSignalChannel> channel_;
  RecordingChannelObserver observer_;
};

}  // namespace

TEST_F(SignalChannelTest, SendsBeforeConnectAreQueued) {
  channel_->Send("one");
  channel_->Send("two");
  Flush(network_.get());

  EXPECT_FALSE(channel_->IsConnected());
  EXPECT_EQ(channel_->QueuedCount(), 2u);
  EXPECT_TRUE(channel_->written().empty());
}

TEST_F(SignalChannelTest, QueueIsFlushedInOrderOnConnectAndLaterSendsFollow) {
  channel_->Send("1");
  channel_->Send("2");
  channel_->Send("3");
  channel_->ConnectPeer("peer");
  channel_->Send("4");
  Flush(network_.get());

  EXPECT_EQ(channel_->written(),
            (Written{{"peer", "1"}, {"peer", "2"}, {"peer", "3"}, {"peer", "4"}}));
  EXPECT_EQ(channel_->QueuedCount(), 0u);
  EXPECT_EQ(channel_->messages_sent(), 4);
  EXPECT_TRUE(channel_->IsConnected());
}

TEST_F(SignalChannelTest, ObserverHearsAboutConnectionAfterTheFlush) {
  size_t queued_at_notification = 99;
  observer_.on_peer_state = [this, &queued_at_notification](const PeerId&,
                                                            PeerState state) {
    // Runs on the network thread.
    if (state == PeerState::kConnected) {
      queued_at_notification = channel_->outbox_size();
    }
  };
  channel_->Send("a");
  channel_->Send("b");
  channel_->ConnectPeer("peer");

  EXPECT_EQ(queued_at_notification, 0u);
  EXPECT_EQ(channel_->written(), (Written{{"peer", "a"}, {"peer", "b"}}));
  EXPECT_EQ(observer_.events, (std::vector<std::string>{"peer:Connected"}));
}

TEST_F(SignalChannelTest, OnlyTheCanonicalPeerReceivesSends) {
  channel_->ConnectPeer("first");
  channel_->ConnectPeer("second");
  channel_->Send("hello");
  Flush(network_.get());

  EXPECT_EQ(channel_->written(), (Written{{"first", "hello"}}));
  EXPECT_EQ(channel_->Canonical(), std::optional<PeerId>("first"));
  EXPECT_EQ(observer_.events,
            (std::vector<std::string>{"first:Connected", "second:Connected"}));
}

TEST_F(SignalChannelTest, NextPeerBecomesCanonicalAfterDisconnect) {
  channel_->ConnectPeer("first");
  channel_->DisconnectPeer("first");
  EXPECT_FALSE(channel_->IsConnected());

  channel_->Send("queued");
  Flush(network_.get());
  EXPECT_EQ(channel_->QueuedCount(), 1u);

  channel_->ConnectPeer("third");
  EXPECT_EQ(channel_->written(), (Written{{"third", "queued"}}));
  EXPECT_EQ(channel_->Canonical(), std::optional<PeerId>("third"));
}

TEST_F(SignalChannelTest, SendToDepartedPeerIsNotDeliveredToItsSuccessor) {
  channel_->ConnectPeer("first");
  channel_->DisconnectPeer("first");
  channel_->ConnectPeer("second");

  channel_->SendTo("first", "late");
  channel_->SendTo("second", "fresh");
  Flush(network_.get());

  EXPECT_EQ(channel_->written(), (Written{{"second", "fresh"}}));
  EXPECT_EQ(channel_->QueuedCount(), 0u);
  EXPECT_EQ(channel_->send_failures(), 0);
}

TEST_F(SignalChannelTest, SendToWithoutPeerIsNotQueued) {
  channel_->SendTo("first", "early");
  Flush(network_.get());
  EXPECT_EQ(channel_->QueuedCount(), 0u);

  channel_->ConnectPeer("first");
  EXPECT_TRUE(channel_->written().empty());
}

TEST_F(SignalChannelTest, ClearOutboxDropsEarlierSendsOnly) {
  channel_->ConnectPeer("first");
  channel_->DisconnectPeer("first");
  channel_->Send("old");
  channel_->ClearOutbox();
  channel_->Send("new");
  Flush(network_.get());
  EXPECT_EQ(channel_->QueuedCount(), 1u);

  channel_->ConnectPeer("second");
  EXPECT_EQ(channel_->written(), (Written{{"second", "new"}}));
}

TEST_F(SignalChannelTest, ClearOutboxKeepsCanonicalPeer) {
  channel_->ConnectPeer("peer");
  channel_->ClearOutbox();
  channel_->Send("after");
  Flush(network_.get());

  EXPECT_TRUE(channel_->IsConnected());
  EXPECT_EQ(channel_->Canonical(), std::optional<PeerId>("peer"));
  EXPECT_EQ(channel_->written(), (Written{{"peer", "after"}}));
}

TEST_F(SignalChannelTest, DisconnectOfSecondaryPeerKeepsCanonical) {
  channel_->ConnectPeer("first");
  channel_->ConnectPeer("second");
  channel_->DisconnectPeer("second");

  EXPECT_TRUE(channel_->IsConnected());
  EXPECT_EQ(channel_->Canonical(), std::optional<PeerId>("first"));
}

TEST_F(SignalChannelTest, FailedWritesAreCountedNotRetried) {
  channel_->ConnectPeer("peer");
  channel_->set_fail_writes(true);
  channel_->Send("lost");
  channel_->Send("lost too");
  Flush(network_.get());

  EXPECT_EQ(channel_->send_failures(), 2);
  EXPECT_EQ(channel_->messages_sent(), 0);
  EXPECT_EQ(channel_->written().size(), 2u);
  EXPECT_EQ(channel_->QueuedCount(), 0u);
}

TEST_F(SignalChannelTest, MessagesReachObserverInOrder) {
  channel_->ConnectPeer("peer");
  channel_->Deliver("peer", std::string("x"));
  channel_->Deliver("peer", std::string("y"));

  ASSERT_EQ(observer_.messages.size(), 2u);
  EXPECT_EQ(observer_.messages[0].second, "x");
  EXPECT_EQ(observer_.messages[1].second, "y");
}

TEST_F(SignalChannelTest, StopDiscardsOutbox) {
  channel_->Send("never");
  Flush(network_.get());
  channel_->Stop();

  EXPECT_EQ(channel_->QueuedCount(), 0u);
  channel_->ConnectPeer("peer");
  EXPECT_TRUE(channel_->written().empty());
}
