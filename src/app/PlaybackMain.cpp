// Repository: PeerLink
// Component: Playback Main
// Purpose: peerlink_playback entry point.
// Copyright (c) 2026 PeerLink

#include "peerlink/app/SessionApp.hpp"

int main(int argc, char* argv[]) {
  return peerlink::app::RunSessionApp(peerlink::config::PeerRole::kPlayback, argc, argv);
}
