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
#include <sys/select.h>

#include "api/units/time_delta.h"
#include "rtc_base/checks.h"
#include "rtc_base/logging.h"

#include "bonjour.h"
#include "status.h"

namespace {

constexpr webrtc::TimeDelta kPollInterval = webrtc::TimeDelta::Millis(100);

// True when `fd` has data waiting, without blocking.
bool Readable(int fd) {
  if (fd < 0) {
    return false;
  }
  fd_set fds;
  FD_ZERO(&fds);
  FD_SET(fd, &fds);
  struct timeval tv = {0, 0};
  return ::select(fd + 1, &fds, nullptr, nullptr, &tv) > 0;
}

}  // namespace

BonjourService::BonjourService(webrtc::TaskQueueBase* queue,
                               const std::string& service_type)
    : queue_(queue), service_type_(service_type) {
  RTC_DCHECK(queue_);
}

BonjourService::~BonjourService() {
  Stop();
}

std::string BonjourService::regtype() const {
  return "_" + service_type_ + "." + Discovery::kProtocol;
}

bool BonjourService::Register(const std::string& name, int port) {
  RTC_DCHECK(queue_->IsCurrent());
  if (register_ref_) {
    RTC_LOG(LS_WARNING) << "Bonjour service already registered";
    return false;
  }

  const std::string type = regtype();
  DNSServiceErrorType err = DNSServiceRegister(
      &register_ref_, 0, kDNSServiceInterfaceIndexAny,
      name.empty() ? nullptr : name.c_str(), type.c_str(), nullptr, nullptr,
      htons(static_cast<uint16_t>(port)), 0, nullptr, &BonjourService::OnRegisterReply,
      this);
  if (err != kDNSServiceErr_NoError) {
    RTC_LOG(LS_ERROR) << "DNSServiceRegister failed for " << type << ", error " << err;
    register_ref_ = nullptr;
    return false;
  }

  RTC_LOG(LS_INFO) << "Advertising " << type << " as '" << name << "' on port " << port;
  SchedulePoll();
  return true;
}

bool BonjourService::Browse(ResolvedCallback on_resolved) {
  RTC_DCHECK(queue_->IsCurrent());
  if (browse_ref_) {
    RTC_LOG(LS_WARNING) << "Bonjour browse already running";
    return false;
  }

  on_resolved_ = std::move(on_resolved);
  const std::string type = regtype();
  DNSServiceErrorType err =
      DNSServiceBrowse(&browse_ref_, 0, kDNSServiceInterfaceIndexAny, type.c_str(),
                       nullptr, &BonjourService::OnBrowseReply, this);
  if (err != kDNSServiceErr_NoError) {
    RTC_LOG(LS_ERROR) << "DNSServiceBrowse failed for " << type << ", error " << err;
    browse_ref_ = nullptr;
    return false;
  }

  RTC_LOG(LS_INFO) << "Browsing for " << type;
  SchedulePoll();
  return true;
}

void BonjourService::Stop() {
  for (auto& resolve : resolves_) {
    if (resolve.ref) {
      DNSServiceRefDeallocate(resolve.ref);
    }
  }
  resolves_.clear();
  if (browse_ref_) {
    DNSServiceRefDeallocate(browse_ref_);
    browse_ref_ = nullptr;
  }
  if (register_ref_) {
    DNSServiceRefDeallocate(register_ref_);
    register_ref_ = nullptr;
    RTC_LOG(LS_INFO) << "Withdrew Bonjour advertisement '" << registered_name_ << "'";
  }
  on_resolved_ = nullptr;
}

void BonjourService::SchedulePoll() {
  if (polling_) {
    return;
  }
  polling_ = true;
  queue_->PostDelayedTask(webrtc::SafeTask(safety_.flag(), [this]() { Poll(); }),
                          kPollInterval);
}

void BonjourService::Poll() {
  polling_ = false;
  if (register_ref_ && !Process(register_ref_)) {
    DNSServiceRefDeallocate(register_ref_);
    register_ref_ = nullptr;
  }
  if (browse_ref_ && !Process(browse_ref_)) {
    DNSServiceRefDeallocate(browse_ref_);
    browse_ref_ = nullptr;
  }
  for (auto it = resolves_.begin(); it != resolves_.end();) {
    if (!it->done && !Process(it->ref)) {
      it->done = true;
    }
    if (it->done) {
      DNSServiceRefDeallocate(it->ref);
      it = resolves_.erase(it);
    } else {
      ++it;
    }
  }

  if (register_ref_ || browse_ref_ || !resolves_.empty()) {
    SchedulePoll();
  }
}

bool BonjourService::Process(DNSServiceRef ref) {
  if (!Readable(DNSServiceRefSockFD(ref))) {
    return true;
  }
  DNSServiceErrorType err = DNSServiceProcessResult(ref);
  if (err != kDNSServiceErr_NoError) {
    RTC_LOG(LS_WARNING) << "DNSServiceProcessResult error " << err;
    return false;
  }
  return true;
}

void BonjourService::StartResolve(uint32_t interface_index,
                                  const char* name,
                                  const char* regtype,
                                  const char* domain) {
  PendingResolve resolve;
  resolve.name = name;
  resolves_.push_back(resolve);
  PendingResolve& pending = resolves_.back();

  DNSServiceErrorType err =
      DNSServiceResolve(&pending.ref, 0, interface_index, name, regtype, domain,
                        &BonjourService::OnResolveReply, this);
  if (err != kDNSServiceErr_NoError) {
    RTC_LOG(LS_WARNING) << "DNSServiceResolve failed for '" << name << "', error " << err;
    resolves_.pop_back();
    return;
  }
  SchedulePoll();
}

// static
void DNSSD_API BonjourService::OnRegisterReply(DNSServiceRef ref,
                                               DNSServiceFlags flags,
                                               DNSServiceErrorType error,
                                               const char* name,
                                               const char* regtype,
                                               const char* domain,
                                               void* context) {
  auto* self = static_cast<BonjourService*>(context);
  if (error != kDNSServiceErr_NoError) {
    RTC_LOG(LS_ERROR) << "Bonjour registration failed, error " << error;
    return;
  }
  self->registered_name_ = name ? name : "";
  RTC_LOG(LS_INFO) << "Bonjour registered '" << self->registered_name_ << "' "
                   << regtype << domain;
}

// static
void DNSSD_API BonjourService::OnBrowseReply(DNSServiceRef ref,
                                             DNSServiceFlags flags,
                                             uint32_t interface_index,
                                             DNSServiceErrorType error,
                                             const char* name,
                                             const char* regtype,
                                             const char* domain,
                                             void* context) {
  auto* self = static_cast<BonjourService*>(context);
  if (error != kDNSServiceErr_NoError) {
    RTC_LOG(LS_WARNING) << "Bonjour browse error " << error;
    return;
  }
  if (!(flags & kDNSServiceFlagsAdd)) {
    RTC_LOG(LS_INFO) << "Bonjour service '" << name << "' went away";
    return;
  }
  RTC_LOG(LS_INFO) << "Bonjour found '" << name << "', resolving";
  self->StartResolve(interface_index, name, regtype, domain);
}

// static
void DNSSD_API BonjourService::OnResolveReply(DNSServiceRef ref,
                                              DNSServiceFlags flags,
                                              uint32_t interface_index,
                                              DNSServiceErrorType error,
                                              const char* fullname,
                                              const char* host,
                                              uint16_t port,
                                              uint16_t txt_len,
                                              const unsigned char* txt,
                                              void* context) {
  auto* self = static_cast<BonjourService*>(context);
  for (auto& resolve : self->resolves_) {
    if (resolve.ref != ref) {
      continue;
    }
    // Deallocated on the next poll, outside of this callback.
    resolve.done = true;
    if (error != kDNSServiceErr_NoError) {
      RTC_LOG(LS_WARNING) << "Bonjour resolve failed for '" << resolve.name
                          << "', error " << error;
      return;
    }
    int host_port = ntohs(port);
    RTC_LOG(LS_INFO) << "Bonjour resolved '" << resolve.name << "' to " << host << ":"
                     << host_port;
    if (self->on_resolved_) {
      self->on_resolved_(resolve.name, host, host_port);
    }
    return;
  }
}
