// Repository: PeerLink
// Component: SessionEvent
// Purpose: Log rendering of session events.
// Copyright (c) 2026 PeerLink

#include "peerlink/transport/SessionEvent.hpp"

#include <type_traits>

namespace peerlink::transport {

std::string Describe(const SessionEvent& event) {
  return std::visit(
      [](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Connected>) {
          return "CONNECTED";
        } else if constexpr (std::is_same_v<T, Failed>) {
          return "FAILED reason=" + e.reason;
        } else if constexpr (std::is_same_v<T, TrackOpened>) {
          return std::string("TRACK_OPENED role=") + pump::ToString(e.role);
        } else if constexpr (std::is_same_v<T, ChannelOpened>) {
          return "CHANNEL_OPENED label=" + e.label;
        } else {
          return "CLOSED reason=" + e.reason;
        }
      },
      event);
}

}  // namespace peerlink::transport
