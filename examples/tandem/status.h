#ifndef EXAMPLES_TANDEM_STATUS_H_
#define EXAMPLES_TANDEM_STATUS_H_

// -----------------------------------------------------------------------------
// Signaling wire constants. Every payload on the signaling link is one JSON
// object carrying a "type" discriminator.
// -----------------------------------------------------------------------------
namespace Msg {

// Discriminator key and values
inline constexpr const char kType[]      = "type";
inline constexpr const char kOffer[]     = "offer";
inline constexpr const char kAnswer[]    = "answer";
inline constexpr const char kCandidate[] = "candidate";

// Payload keys
inline constexpr const char kSdp[]           = "sdp";
inline constexpr const char kSdpMid[]        = "sdpMid";
inline constexpr const char kSdpMLineIndex[] = "sdpMLineIndex";
// Older peers put the candidate line under "candidate" instead of "sdp".
inline constexpr const char kLegacyCandidate[] = "candidate";

} // namespace Msg

namespace Discovery {

inline constexpr const char kDefaultServiceType[] = "webrtc-signal";
inline constexpr const char kProtocol[]           = "_tcp";

} // namespace Discovery

#endif // EXAMPLES_TANDEM_STATUS_H_
