// Repository: PeerLink
// Component: StreamRole
// Purpose: Role names used in logs, task names and tuning overrides.
// Copyright (c) 2026 PeerLink

#include "peerlink/pump/StreamRole.hpp"

namespace peerlink::pump {

namespace {

constexpr StreamRole kAllRoles[kStreamRoleCount] = {
    StreamRole::kAudioEgress,  StreamRole::kVideoEgress,  StreamRole::kInputEgress,
    StreamRole::kAudioIngress, StreamRole::kVideoIngress, StreamRole::kInputIngress,
    StreamRole::kLatencyIngress,
};

}  // namespace

const char* ToString(StreamRole role) {
  switch (role) {
    case StreamRole::kAudioEgress:
      return "audio-egress";
    case StreamRole::kVideoEgress:
      return "video-egress";
    case StreamRole::kInputEgress:
      return "input-egress";
    case StreamRole::kAudioIngress:
      return "audio-ingress";
    case StreamRole::kVideoIngress:
      return "video-ingress";
    case StreamRole::kInputIngress:
      return "input-ingress";
    case StreamRole::kLatencyIngress:
      return "latency-ingress";
  }
  return "unknown";
}

std::optional<StreamRole> ParseStreamRole(const std::string& name) {
  for (StreamRole role : kAllRoles) {
    if (name == ToString(role)) {
      return role;
    }
  }
  return std::nullopt;
}

bool IsEgress(StreamRole role) {
  return role == StreamRole::kAudioEgress || role == StreamRole::kVideoEgress ||
         role == StreamRole::kInputEgress;
}

}  // namespace peerlink::pump
