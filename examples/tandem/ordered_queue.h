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

#ifndef WEBRTC_TANDEM_ORDERED_QUEUE_H_
#define WEBRTC_TANDEM_ORDERED_QUEUE_H_

#include <cstddef>
#include <deque>
#include <utility>

// FIFO buffer with a single drain point. Not thread safe: the owner keeps it
// on one sequence (the signaling outbox on the network thread, the pending
// candidate buffer on the session queue).
template <typename T>
class OrderedQueue {
 public:
  void Enqueue(T item) { items_.push_back(std::move(item)); }

  // Hands every queued item to `fn` in enqueue order and leaves the queue
  // empty. Items enqueued from inside `fn` are kept for the next drain.
  // Returns the number of items handed out.
  template <typename Fn>
  size_t Drain(Fn&& fn) {
    std::deque<T> batch;
    batch.swap(items_);
    for (auto& item : batch) {
      fn(std::move(item));
    }
    return batch.size();
  }

  // Drops everything without delivering it.
  void Clear() { items_.clear(); }

  size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }

 private:
  std::deque<T> items_;
};

#endif  // WEBRTC_TANDEM_ORDERED_QUEUE_H_
