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

#ifndef WEBRTC_TANDEM_MEDIA_SESSION_H_
#define WEBRTC_TANDEM_MEDIA_SESSION_H_

#include <functional>
#include <memory>
#include <string>

#include "api/jsep.h"
#include "api/rtc_error.h"

#include "types.h"

// Events raised by a media session. May arrive on any thread.
class MediaSessionObserver {
 public:
  virtual void OnIceCandidateGenerated(const IceCandidateInfo& candidate) = 0;
  virtual void OnConnectionStateChanged(MediaConnectionState state) = 0;
  virtual void OnRenegotiationNeeded() = 0;

 protected:
  virtual ~MediaSessionObserver() = default;
};

// The media engine side of one negotiation epoch. All operations complete
// asynchronously through their callback, on any thread.
class MediaSessionInterface {
 public:
  using DescriptionCallback = std::function<void(webrtc::RTCErrorOr<std::string>)>;
  using CompletionCallback = std::function<void(webrtc::RTCError)>;

  virtual ~MediaSessionInterface() = default;

  virtual void CreateOffer(bool ice_restart, DescriptionCallback callback) = 0;
  virtual void CreateAnswer(DescriptionCallback callback) = 0;
  virtual void SetLocalDescription(webrtc::SdpType type,
                                   const std::string& sdp,
                                   CompletionCallback callback) = 0;
  virtual void SetRemoteDescription(webrtc::SdpType type,
                                    const std::string& sdp,
                                    CompletionCallback callback) = 0;
  virtual void AddIceCandidate(const IceCandidateInfo& candidate,
                               CompletionCallback callback) = 0;

  // True when a live local track is attached, or for a receive-only session.
  virtual bool HasReadyTrack() const = 0;

  // Releases the underlying connection. No observer calls follow.
  virtual void Close() = 0;
};

// Creates one session per negotiation epoch.
class MediaSessionFactory {
 public:
  virtual ~MediaSessionFactory() = default;
  virtual std::unique_ptr<MediaSessionInterface> CreateSession(
      MediaSessionObserver* observer) = 0;
};

#endif  // WEBRTC_TANDEM_MEDIA_SESSION_H_
