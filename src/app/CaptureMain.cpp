// Repository: PeerLink
// Component: Capture Main
// Purpose: peerlink_capture entry point.
// Copyright (c) 2026 PeerLink

#include "peerlink/app/SessionApp.hpp"

int main(int argc, char* argv[]) {
  return peerlink::app::RunSessionApp(peerlink::config::PeerRole::kCapture, argc, argv);
}
