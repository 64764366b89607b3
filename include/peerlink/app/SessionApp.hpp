// Repository: PeerLink
// Component: SessionApp
// Purpose: Shared entry point of the capture and playback executables.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_APP_SESSION_APP_HPP_
#define PEERLINK_APP_SESSION_APP_HPP_

#include "peerlink/config/SessionConfig.hpp"
#include "peerlink/session/SessionOrchestrator.hpp"
#include "peerlink/transport/UdpTransport.hpp"

namespace peerlink::app {

// Exit codes.
inline constexpr int kExitOk = 0;
inline constexpr int kExitSessionFailed = 1;
inline constexpr int kExitUsage = 2;

transport::UdpTransportConfig MakeTransportConfig(const config::SessionConfig& config);

int ExitCodeFor(const session::SessionResult& result);

// Parses argv, installs SIGINT/SIGTERM handlers, runs one session of `role`
// and maps its outcome to an exit code.
int RunSessionApp(config::PeerRole role, int argc, char* argv[]);

}  // namespace peerlink::app

#endif  // PEERLINK_APP_SESSION_APP_HPP_
