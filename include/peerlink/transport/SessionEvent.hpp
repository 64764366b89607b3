// Repository: PeerLink
// Component: SessionEvent
// Purpose: Connection lifecycle events delivered from a transport to the
//          session's single event loop.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_TRANSPORT_SESSION_EVENT_HPP_
#define PEERLINK_TRANSPORT_SESSION_EVENT_HPP_

#include <string>
#include <variant>

#include "peerlink/pump/StreamRole.hpp"

namespace peerlink::transport {

// Transport is ready for egress.
struct Connected {};

// Transport gave up (handshake or peer timeout, socket error).
struct Failed {
  std::string reason;
};

// A remote media track started delivering; `role` is the local ingress role.
struct TrackOpened {
  pump::StreamRole role;
};

// A remote data channel ("input", "latency") started delivering.
struct ChannelOpened {
  std::string label;
};

// Peer closed the session on purpose.
struct Closed {
  std::string reason;
};

using SessionEvent = std::variant<Connected, Failed, TrackOpened, ChannelOpened, Closed>;

std::string Describe(const SessionEvent& event);

}  // namespace peerlink::transport

#endif  // PEERLINK_TRANSPORT_SESSION_EVENT_HPP_
