// Repository: PeerLink
// Component: StreamRole
// Purpose: Identifies the direction and media kind of one pump.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_PUMP_STREAM_ROLE_HPP_
#define PEERLINK_PUMP_STREAM_ROLE_HPP_

#include <cstddef>
#include <optional>
#include <string>

namespace peerlink::pump {

// Egress: local backend -> transport. Ingress: transport -> local backend.
enum class StreamRole {
  kAudioEgress = 0,
  kVideoEgress,
  kInputEgress,
  kAudioIngress,
  kVideoIngress,
  kInputIngress,
  kLatencyIngress,
};

inline constexpr size_t kStreamRoleCount = 7;

// "audio-egress", "video-ingress", ...
const char* ToString(StreamRole role);

std::optional<StreamRole> ParseStreamRole(const std::string& name);

bool IsEgress(StreamRole role);

}  // namespace peerlink::pump

#endif  // PEERLINK_PUMP_STREAM_ROLE_HPP_
