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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "ordered_queue.h"

TEST(OrderedQueueTest, DrainsInEnqueueOrder) {
  OrderedQueue<std::string> queue;
  queue.Enqueue("a");
  queue.Enqueue("b");
  queue.Enqueue("c");
  EXPECT_EQ(queue.size(), 3u);

  std::vector<std::string> out;
  size_t drained = queue.Drain([&out](std::string item) { out.push_back(item); });

  EXPECT_EQ(drained, 3u);
  EXPECT_EQ(out, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(queue.empty());
}

TEST(OrderedQueueTest, EachItemIsDeliveredOnce) {
  OrderedQueue<int> queue;
  queue.Enqueue(1);
  queue.Enqueue(2);

  int calls = 0;
  queue.Drain([&calls](int) { ++calls; });
  queue.Drain([&calls](int) { ++calls; });
  EXPECT_EQ(calls, 2);
}

TEST(OrderedQueueTest, ItemsEnqueuedWhileDrainingWaitForNextDrain) {
  OrderedQueue<int> queue;
  queue.Enqueue(1);
  queue.Enqueue(2);

  std::vector<int> first;
  queue.Drain([&](int item) {
    first.push_back(item);
    queue.Enqueue(item * 10);
  });
  EXPECT_EQ(first, (std::vector<int>{1, 2}));
  EXPECT_EQ(queue.size(), 2u);

  std::vector<int> second;
  queue.Drain([&second](int item) { second.push_back(item); });
  EXPECT_EQ(second, (std::vector<int>{10, 20}));
}

TEST(OrderedQueueTest, ClearDropsWithoutDelivery) {
  OrderedQueue<int> queue;
  queue.Enqueue(1);
  queue.Clear();
  EXPECT_TRUE(queue.empty());

  int calls = 0;
  EXPECT_EQ(queue.Drain([&calls](int) { ++calls; }), 0u);
  EXPECT_EQ(calls, 0);
}
