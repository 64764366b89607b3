// Repository: PeerLink
// Component: TrackId
// Purpose: Track naming and wire mapping.
// Copyright (c) 2026 PeerLink

#include "peerlink/transport/ITransport.hpp"

namespace peerlink::transport {

const char* ToString(TrackId track) {
  switch (track) {
    case TrackId::kControl:
      return "control";
    case TrackId::kAudio:
      return "audio";
    case TrackId::kVideo:
      return "video";
    case TrackId::kInput:
      return "input";
    case TrackId::kLatency:
      return "latency";
  }
  return "unknown";
}

std::string ChannelLabel(TrackId track) {
  switch (track) {
    case TrackId::kInput:
      return "input";
    case TrackId::kLatency:
      return "latency";
    default:
      return std::string();
  }
}

std::optional<TrackId> TrackFromWire(uint8_t id) {
  if (id >= kTrackCount) return std::nullopt;
  return static_cast<TrackId>(id);
}

}  // namespace peerlink::transport
