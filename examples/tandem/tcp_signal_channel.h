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

#ifndef WEBRTC_TANDEM_TCP_SIGNAL_CHANNEL_H_
#define WEBRTC_TANDEM_TCP_SIGNAL_CHANNEL_H_

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "rtc_base/async_tcp_socket.h"
#include "rtc_base/physical_socket_server.h"
#include "rtc_base/socket.h"
#include "rtc_base/socket_address.h"
#include "rtc_base/ssl_identity.h"
#include "rtc_base/third_party/sigslot/sigslot.h"
#include "rtc_base/thread.h"

#include "bonjour.h"
#include "option.h"
#include "signal_channel.h"

// SignalChannel over TCP, optionally wrapped in TLS, with Bonjour discovery.
//
// The announcing side listens and advertises `_<service_type>._tcp`; the
// scanning side browses (or uses the configured address) and connects with
// exponential back-off until it gets through. Each payload is one
// length-prefixed AsyncTCPSocket packet.
//
// Everything runs on `network_thread`. The channel must be destroyed there.
class TANDEM_API TcpSignalChannel : public SignalChannel,
                                    public sigslot::has_slots<> {
 public:
  TcpSignalChannel(const Options& opts,
                   rtc::Thread* network_thread,
                   rtc::PhysicalSocketServer* pss);
  ~TcpSignalChannel() override;

  bool Start(DiscoveryRole role) override;
  void Stop() override;

  // Port the announcing side listens on, 0 before Start().
  int local_port() const { return local_port_.load(); }

 protected:
  bool WriteToPeer(const PeerId& peer, const std::string& payload) override;

 private:
  struct Handshake {
    PeerId peer;
    std::unique_ptr<rtc::Socket> socket;
  };

  bool StartOnNetwork(DiscoveryRole role);
  void StopOnNetwork();

  // Announce side.
  bool StartListening();
  void OnAcceptEvent(rtc::Socket* listener);
  void OnHandshakeDone(rtc::Socket* socket);
  void OnHandshakeClosed(rtc::Socket* socket, int err);

  // Scan side.
  bool StartScanning();
  void StartBrowsing();
  void OnServiceResolved(const std::string& name, const std::string& host, int port);
  void ConnectToTarget();
  void ScheduleReconnect();
  void OnOutgoingConnected(rtc::Socket* socket);
  void OnOutgoingClosed(rtc::Socket* socket, int err);

  // Wraps `socket` in an SSLAdapter and starts the handshake. Takes ownership
  // of `socket`; returns nullptr when TLS could not be started.
  rtc::Socket* WrapTls(rtc::Socket* socket, bool server, const std::string& host);

  // Takes ownership of a connected (and, with TLS, handshaken) socket.
  void AdoptConnection(const PeerId& peer, rtc::Socket* socket);
  void OnPeerClosed(const PeerId& peer, int err);

  // Destroys `socket` outside of the signal that is currently running.
  template <typename T>
  void DeleteSoon(std::unique_ptr<T> socket) {
    network_thread_->PostTask([socket = std::move(socket)]() {});
  }

  const Options opts_;
  rtc::Thread* const network_thread_;
  rtc::PhysicalSocketServer* const pss_;

  DiscoveryRole role_ = DiscoveryRole::kAnnounce;
  bool running_ = false;
  std::atomic<int> local_port_{0};

  std::unique_ptr<rtc::SSLIdentity> identity_;
  std::unique_ptr<BonjourService> bonjour_;

  std::unique_ptr<rtc::Socket> listen_socket_;
  int listen_attempt_ = 0;
  std::map<rtc::Socket*, Handshake> handshakes_;

  std::optional<rtc::SocketAddress> target_;
  std::unique_ptr<rtc::Socket> connecting_;
  int connect_attempt_ = 0;
  bool reconnect_scheduled_ = false;

  std::map<PeerId, std::unique_ptr<rtc::AsyncTCPSocket>> peers_;
};

#endif  // WEBRTC_TANDEM_TCP_SIGNAL_CHANNEL_H_
