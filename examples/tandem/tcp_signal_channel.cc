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

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <utility>

#include "api/units/time_delta.h"
#include "rtc_base/logging.h"
#include "rtc_base/network/received_packet.h"
#include "rtc_base/ssl_adapter.h"
#include "rtc_base/ssl_stream_adapter.h"

#include "tcp_signal_channel.h"

namespace {

constexpr int kInitialBackoffMs = 100;
constexpr int kMaxBackoffMs = 4000;
// AsyncTCPSocket frames packets with a 16 bit length.
constexpr size_t kMaxPayloadSize = 0xFFFF;

int BackoffDelayMs(int attempt) {
  return std::min(kInitialBackoffMs * (1 << std::min(attempt, 6)), kMaxBackoffMs);
}

}  // namespace

TcpSignalChannel::TcpSignalChannel(const Options& opts,
                                   rtc::Thread* network_thread,
                                   rtc::PhysicalSocketServer* pss)
    : SignalChannel(network_thread),
      opts_(opts),
      network_thread_(network_thread),
      pss_(pss) {}

TcpSignalChannel::~TcpSignalChannel() {
  RTC_DCHECK(network_thread_->IsCurrent());
  StopOnNetwork();
}

bool TcpSignalChannel::Start(DiscoveryRole role) {
  // If already on network thread, run directly to avoid BlockingCall DCHECK
  if (network_thread_->IsCurrent()) {
    return StartOnNetwork(role);
  }
  return network_thread_->BlockingCall([this, role]() { return StartOnNetwork(role); });
}

void TcpSignalChannel::Stop() {
  if (network_thread_->IsCurrent()) {
    StopOnNetwork();
    return;
  }
  network_thread_->BlockingCall([this]() { StopOnNetwork(); });
}

bool TcpSignalChannel::StartOnNetwork(DiscoveryRole role) {
  if (running_) {
    RTC_LOG(LS_WARNING) << "Signal channel already started";
    return false;
  }
  role_ = role;
  running_ = true;

  if (opts_.encryption && !identity_) {
    identity_ = rtc::SSLIdentity::Create("tandem", rtc::KeyParams::ECDSA());
    if (!identity_) {
      RTC_LOG(LS_ERROR) << "Failed to generate TLS identity";
      running_ = false;
      return false;
    }
  }

  RTC_LOG(LS_INFO) << "Starting signal channel as " << ToString(role)
                   << (opts_.encryption ? " with" : " without") << " encryption";

  bool ok = role == DiscoveryRole::kAnnounce ? StartListening() : StartScanning();
  if (!ok) {
    StopOnNetwork();
  }
  return ok;
}

void TcpSignalChannel::StopOnNetwork() {
  if (!running_) {
    return;
  }
  running_ = false;
  RTC_LOG(LS_INFO) << "Stopping signal channel";

  if (bonjour_) {
    bonjour_->Stop();
    bonjour_.reset();
  }
  if (listen_socket_) {
    listen_socket_->SignalReadEvent.disconnect(this);
    listen_socket_->Close();
    listen_socket_.reset();
  }
  handshakes_.clear();
  connecting_.reset();
  target_.reset();
  reconnect_scheduled_ = false;
  for (auto& peer : peers_) {
    peer.second->UnsubscribeCloseEvent(this);
    peer.second->Close();
  }
  peers_.clear();
  local_port_ = 0;
  DiscardOutbox();
}

bool TcpSignalChannel::StartListening() {
  std::string ip;
  int port = 0;
  if (!opts_.address.empty() && !ParseIpAndPort(opts_.address, ip, port)) {
    RTC_LOG(LS_WARNING) << "Ignoring address '" << opts_.address
                        << "', listening on an ephemeral port";
    port = 0;
  }

  int raw_socket = ::socket(AF_INET, SOCK_STREAM, 0);
  if (raw_socket < 0) {
    RTC_LOG(LS_ERROR) << "Failed to create socket, errno: " << strerror(errno);
    return false;
  }

  int reuse = 1;
  if (::setsockopt(raw_socket, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    RTC_LOG(LS_WARNING) << "Failed to set SO_REUSEADDR, errno: " << strerror(errno);
  }

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = INADDR_ANY;

  if (::bind(raw_socket, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
    int bind_errno = errno;
    ::close(raw_socket);
    if (bind_errno != EADDRINUSE) {
      RTC_LOG(LS_ERROR) << "Non-recoverable bind error: " << strerror(bind_errno);
      return false;
    }
    int delay_ms = BackoffDelayMs(listen_attempt_++);
    RTC_LOG(LS_WARNING) << "Port " << port << " in use, retrying bind in " << delay_ms
                        << " ms";
    network_thread_->PostDelayedTask(webrtc::SafeTask(safety_flag(),
                                                      [this]() {
                                                        if (running_ && !listen_socket_ &&
                                                            !StartListening()) {
                                                          RTC_LOG(LS_ERROR)
                                                              << "Giving up on listening";
                                                        }
                                                      }),
                                     webrtc::TimeDelta::Millis(delay_ms));
    return true;
  }
  listen_attempt_ = 0;

  // Retrieve the actual port assigned by the OS if port was 0
  socklen_t addrlen = sizeof(addr);
  if (getsockname(raw_socket, (struct sockaddr*)&addr, &addrlen) == 0) {
    port = ntohs(addr.sin_port);
  }

  if (::listen(raw_socket, 5) < 0) {
    RTC_LOG(LS_ERROR) << "Failed to listen, errno: " << strerror(errno);
    ::close(raw_socket);
    return false;
  }

  rtc::Socket* wrapped_socket = pss_->WrapSocket(raw_socket);
  if (!wrapped_socket) {
    RTC_LOG(LS_ERROR) << "Failed to wrap socket";
    ::close(raw_socket);
    return false;
  }
  listen_socket_.reset(wrapped_socket);
  listen_socket_->SignalReadEvent.connect(this, &TcpSignalChannel::OnAcceptEvent);
  local_port_ = port;
  RTC_LOG(LS_INFO) << "Signal channel listening on port " << port;

  if (opts_.bonjour) {
    bonjour_ = std::make_unique<BonjourService>(network_thread_, opts_.service_type);
    if (!bonjour_->Register(opts_.display_name, port)) {
      // Still reachable by address.
      RTC_LOG(LS_WARNING) << "Bonjour advertisement failed for '" << opts_.display_name
                          << "'";
      bonjour_.reset();
    }
  }
  return true;
}

void TcpSignalChannel::OnAcceptEvent(rtc::Socket* listener) {
  rtc::SocketAddress remote;
  rtc::Socket* socket = listener->Accept(&remote);
  if (!socket) {
    RTC_LOG(LS_WARNING) << "Accept failed, error " << listener->GetError();
    return;
  }

  const PeerId peer = remote.ToString();
  RTC_LOG(LS_INFO) << "Connection accepted from " << peer;

  if (!opts_.encryption) {
    AdoptConnection(peer, socket);
    return;
  }

  rtc::Socket* tls = WrapTls(socket, /*server=*/true, "");
  if (!tls) {
    return;
  }
  tls->SignalConnectEvent.connect(this, &TcpSignalChannel::OnHandshakeDone);
  tls->SignalCloseEvent.connect(this, &TcpSignalChannel::OnHandshakeClosed);
  handshakes_[tls] = Handshake{peer, std::unique_ptr<rtc::Socket>(tls)};
  NotifyPeerState(peer, PeerState::kConnecting);
}

void TcpSignalChannel::OnHandshakeDone(rtc::Socket* socket) {
  auto it = handshakes_.find(socket);
  if (it == handshakes_.end()) {
    return;
  }
  Handshake handshake = std::move(it->second);
  handshakes_.erase(it);
  socket->SignalConnectEvent.disconnect(this);
  socket->SignalCloseEvent.disconnect(this);
  RTC_LOG(LS_INFO) << "TLS handshake with " << handshake.peer << " complete";
  AdoptConnection(handshake.peer, handshake.socket.release());
}

void TcpSignalChannel::OnHandshakeClosed(rtc::Socket* socket, int err) {
  auto it = handshakes_.find(socket);
  if (it == handshakes_.end()) {
    return;
  }
  Handshake handshake = std::move(it->second);
  handshakes_.erase(it);
  socket->SignalConnectEvent.disconnect(this);
  socket->SignalCloseEvent.disconnect(this);
  RTC_LOG(LS_WARNING) << "TLS handshake with " << handshake.peer << " failed, err=" << err;
  DeleteSoon(std::move(handshake.socket));
  NotifyPeerState(handshake.peer, PeerState::kNotConnected);
}

bool TcpSignalChannel::StartScanning() {
  if (opts_.bonjour) {
    StartBrowsing();
    if (bonjour_) {
      return true;
    }
    RTC_LOG(LS_WARNING) << "Bonjour unavailable, falling back to address";
  }

  std::string ip;
  int port = 0;
  if (!ParseIpAndPort(opts_.address, ip, port) || ip.empty() || port == 0) {
    RTC_LOG(LS_ERROR) << "Scanning without Bonjour needs --address=<ip:port>";
    return false;
  }
  target_ = rtc::SocketAddress(ip, port);
  ConnectToTarget();
  return true;
}

void TcpSignalChannel::StartBrowsing() {
  bonjour_ = std::make_unique<BonjourService>(network_thread_, opts_.service_type);
  if (!bonjour_->Browse([this](const std::string& name, const std::string& host, int port) {
        OnServiceResolved(name, host, port);
      })) {
    bonjour_.reset();
  }
}

void TcpSignalChannel::OnServiceResolved(const std::string& name,
                                         const std::string& host,
                                         int port) {
  if (!running_) {
    return;
  }
  if (!peers_.empty() || connecting_) {
    if (opts_.debug.network) {
      RTC_LOG(LS_VERBOSE) << "Ignoring '" << name << "', already connected or connecting";
    }
    return;
  }
  RTC_LOG(LS_INFO) << "Connecting to discovered service '" << name << "' at " << host
                   << ":" << port;
  target_ = rtc::SocketAddress(host, port);
  connect_attempt_ = 0;
  ConnectToTarget();
}

void TcpSignalChannel::ConnectToTarget() {
  reconnect_scheduled_ = false;
  if (!running_ || !target_ || connecting_ || !peers_.empty()) {
    return;
  }

  const PeerId peer = target_->ToString();
  rtc::Socket* socket = pss_->CreateSocket(AF_INET, SOCK_STREAM);
  if (!socket) {
    RTC_LOG(LS_ERROR) << "Failed to create socket for " << peer;
    ScheduleReconnect();
    return;
  }
  if (opts_.encryption) {
    socket = WrapTls(socket, /*server=*/false, target_->HostAsURIString());
    if (!socket) {
      ScheduleReconnect();
      return;
    }
  }

  connecting_.reset(socket);
  socket->SignalConnectEvent.connect(this, &TcpSignalChannel::OnOutgoingConnected);
  socket->SignalCloseEvent.connect(this, &TcpSignalChannel::OnOutgoingClosed);

  if (opts_.debug.network) {
    RTC_LOG(LS_VERBOSE) << "Connect attempt " << (connect_attempt_ + 1) << " to " << peer;
  }
  NotifyPeerState(peer, PeerState::kConnecting);

  if (socket->Connect(*target_) != 0 && !rtc::IsBlockingError(socket->GetError())) {
    RTC_LOG(LS_WARNING) << "Connect to " << peer << " failed, error "
                        << socket->GetError();
    socket->SignalConnectEvent.disconnect(this);
    socket->SignalCloseEvent.disconnect(this);
    connecting_.reset();
    NotifyPeerState(peer, PeerState::kNotConnected);
    ScheduleReconnect();
  }
}

void TcpSignalChannel::ScheduleReconnect() {
  if (!running_ || reconnect_scheduled_) {
    return;
  }
  reconnect_scheduled_ = true;
  int delay_ms = BackoffDelayMs(connect_attempt_++);
  RTC_LOG(LS_INFO) << "Retrying connect in " << delay_ms << " ms";
  network_thread_->PostDelayedTask(
      webrtc::SafeTask(safety_flag(), [this]() { ConnectToTarget(); }),
      webrtc::TimeDelta::Millis(delay_ms));
}

void TcpSignalChannel::OnOutgoingConnected(rtc::Socket* socket) {
  if (socket != connecting_.get()) {
    return;
  }
  socket->SignalConnectEvent.disconnect(this);
  socket->SignalCloseEvent.disconnect(this);
  connect_attempt_ = 0;
  RTC_LOG(LS_INFO) << "Connected to " << target_->ToString();
  AdoptConnection(target_->ToString(), connecting_.release());
}

void TcpSignalChannel::OnOutgoingClosed(rtc::Socket* socket, int err) {
  if (socket != connecting_.get()) {
    return;
  }
  socket->SignalConnectEvent.disconnect(this);
  socket->SignalCloseEvent.disconnect(this);
  RTC_LOG(LS_WARNING) << "Connect to " << target_->ToString() << " failed ("
                      << strerror(err) << ")";
  DeleteSoon(std::move(connecting_));
  NotifyPeerState(target_->ToString(), PeerState::kNotConnected);
  ScheduleReconnect();
}

rtc::Socket* TcpSignalChannel::WrapTls(rtc::Socket* socket,
                                       bool server,
                                       const std::string& host) {
  rtc::SSLAdapter* adapter = rtc::SSLAdapter::Create(socket);
  if (!adapter) {
    RTC_LOG(LS_ERROR) << "Failed to create SSL adapter";
    delete socket;
    return nullptr;
  }
  // The channel is encrypted but peers are not authenticated.
  adapter->SetIgnoreBadCert(true);
  if (server) {
    adapter->SetIdentity(identity_->Clone());
    adapter->SetRole(rtc::SSL_SERVER);
  } else {
    adapter->SetRole(rtc::SSL_CLIENT);
  }
  if (adapter->StartSSL(host.c_str()) != 0) {
    RTC_LOG(LS_ERROR) << "Failed to start TLS";
    delete adapter;
    return nullptr;
  }
  return adapter;
}

void TcpSignalChannel::AdoptConnection(const PeerId& peer, rtc::Socket* socket) {
  auto tcp_socket = std::make_unique<rtc::AsyncTCPSocket>(socket);
  tcp_socket->RegisterReceivedPacketCallback(
      [this, peer](rtc::AsyncPacketSocket* socket, const rtc::ReceivedPacket& packet) {
        std::string payload(reinterpret_cast<const char*>(packet.payload().data()),
                            packet.payload().size());
        if (opts_.debug.network) {
          RTC_LOG(LS_VERBOSE) << "Received " << payload.size() << " bytes from " << peer;
        }
        NotifyMessage(peer, payload);
      });
  tcp_socket->SubscribeCloseEvent(
      this, [this, peer](rtc::AsyncPacketSocket* socket, int err) {
        OnPeerClosed(peer, err);
      });
  peers_[peer] = std::move(tcp_socket);
  NotifyPeerState(peer, PeerState::kConnected);
}

void TcpSignalChannel::OnPeerClosed(const PeerId& peer, int err) {
  auto it = peers_.find(peer);
  if (it == peers_.end()) {
    return;
  }
  RTC_LOG(LS_INFO) << "Signaling connection to " << peer << " closed, err=" << err;
  std::unique_ptr<rtc::AsyncTCPSocket> socket = std::move(it->second);
  peers_.erase(it);
  socket->UnsubscribeCloseEvent(this);
  DeleteSoon(std::move(socket));
  NotifyPeerState(peer, PeerState::kNotConnected);

  if (role_ != DiscoveryRole::kScan || !running_ || !peers_.empty()) {
    return;
  }
  // Back to discovery: browse afresh and keep trying the last known address.
  if (opts_.bonjour && bonjour_) {
    bonjour_->Stop();
    StartBrowsing();
  }
  connect_attempt_ = 0;
  ScheduleReconnect();
}

bool TcpSignalChannel::WriteToPeer(const PeerId& peer, const std::string& payload) {
  auto it = peers_.find(peer);
  if (it == peers_.end()) {
    RTC_LOG(LS_WARNING) << "No connection to " << peer;
    return false;
  }
  if (payload.size() > kMaxPayloadSize) {
    RTC_LOG(LS_ERROR) << "Payload of " << payload.size() << " bytes exceeds frame size";
    return false;
  }
  int sent = it->second->Send(payload.data(), payload.size(), rtc::PacketOptions());
  if (sent < 0) {
    RTC_LOG(LS_ERROR) << "Failed to send message, error: " << it->second->GetError();
    return false;
  }
  if (opts_.debug.network) {
    RTC_LOG(LS_VERBOSE) << "Sent " << payload.size() << " bytes to " << peer;
  }
  return true;
}
