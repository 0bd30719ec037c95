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

#ifndef WEBRTC_TANDEM_BONJOUR_H_
#define WEBRTC_TANDEM_BONJOUR_H_

#include <dns_sd.h>

#include <functional>
#include <list>
#include <string>

#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"

#include "option.h"

// Advertises or browses one DNS-SD service type on the local network.
//
// All DNS-SD references are polled from `queue`, so every callback runs there.
// A service type such as "webrtc-signal" is registered as
// "_webrtc-signal._tcp" in the default domain.
class TANDEM_API BonjourService {
 public:
  // Called for every instance that resolves to a host and port.
  using ResolvedCallback = std::function<
      void(const std::string& name, const std::string& host, int port)>;

  BonjourService(webrtc::TaskQueueBase* queue, const std::string& service_type);
  ~BonjourService();

  BonjourService(const BonjourService&) = delete;
  BonjourService& operator=(const BonjourService&) = delete;

  // Announces `name` on `port`. An empty name lets the daemon pick one.
  bool Register(const std::string& name, int port);

  // Starts browsing; `on_resolved` fires once per resolved instance.
  bool Browse(ResolvedCallback on_resolved);

  // Withdraws the advertisement and cancels browsing.
  void Stop();

  bool active() const { return register_ref_ || browse_ref_; }
  const std::string& registered_name() const { return registered_name_; }
  std::string regtype() const;

 private:
  struct PendingResolve {
    DNSServiceRef ref = nullptr;
    std::string name;
    bool done = false;
  };

  static void DNSSD_API OnRegisterReply(DNSServiceRef ref,
                                        DNSServiceFlags flags,
                                        DNSServiceErrorType error,
                                        const char* name,
                                        const char* regtype,
                                        const char* domain,
                                        void* context);
  static void DNSSD_API OnBrowseReply(DNSServiceRef ref,
                                      DNSServiceFlags flags,
                                      uint32_t interface_index,
                                      DNSServiceErrorType error,
                                      const char* name,
                                      const char* regtype,
                                      const char* domain,
                                      void* context);
  static void DNSSD_API OnResolveReply(DNSServiceRef ref,
                                       DNSServiceFlags flags,
                                       uint32_t interface_index,
                                       DNSServiceErrorType error,
                                       const char* fullname,
                                       const char* host,
                                       uint16_t port,
                                       uint16_t txt_len,
                                       const unsigned char* txt,
                                       void* context);

  void StartResolve(uint32_t interface_index,
                    const char* name,
                    const char* regtype,
                    const char* domain);
  void SchedulePoll();
  void Poll();
  // Processes pending replies on `ref`. Returns false when the reference
  // reported an error and should be dropped.
  bool Process(DNSServiceRef ref);

  webrtc::TaskQueueBase* const queue_;
  const std::string service_type_;
  DNSServiceRef register_ref_ = nullptr;
  DNSServiceRef browse_ref_ = nullptr;
  std::list<PendingResolve> resolves_;
  std::string registered_name_;
  ResolvedCallback on_resolved_;
  bool polling_ = false;
  webrtc::ScopedTaskSafety safety_;
};

#endif  // WEBRTC_TANDEM_BONJOUR_H_
