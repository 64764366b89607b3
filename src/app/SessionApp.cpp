// Repository: PeerLink
// Component: SessionApp
// Purpose: CLI, signal handling and control server around one session.
// Copyright (c) 2026 PeerLink

#include "peerlink/app/SessionApp.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "peerlink/control/SessionControlService.hpp"
#include "peerlink/core/ShutdownCoordinator.hpp"
#include "peerlink/session/CaptureSession.hpp"
#include "peerlink/session/PlaybackSession.hpp"
#include "peerlink/util/Logger.hpp"

namespace peerlink::app {

using util::Logger;

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

std::unique_ptr<session::SessionOrchestrator> MakeSession(
    const config::SessionConfig& config, core::ShutdownCoordinator stop,
    std::shared_ptr<transport::ITransport> transport) {
  if (config.role == config::PeerRole::kCapture) {
    return std::make_unique<session::CaptureSession>(config, std::move(stop),
                                                     std::move(transport));
  }
  return std::make_unique<session::PlaybackSession>(config, std::move(stop),
                                                    std::move(transport));
}

}  // namespace

transport::UdpTransportConfig MakeTransportConfig(const config::SessionConfig& config) {
  transport::UdpTransportConfig out;
  out.bind_host = config.bind_host;
  out.bind_port = config.bind_port;
  out.peer_host = config.peer_host;
  out.peer_port = config.peer_port;
  out.peer_timeout = config.peer_timeout;
  out.connect_timeout = config.connect_timeout;
  return out;
}

int ExitCodeFor(const session::SessionResult& result) {
  switch (result.outcome) {
    case session::SessionOutcome::kStopped:
    case session::SessionOutcome::kInterrupted:
      return kExitOk;
    case session::SessionOutcome::kFailed:
      return kExitSessionFailed;
  }
  return kExitSessionFailed;
}

int RunSessionApp(config::PeerRole role, int argc, char* argv[]) {
  const std::vector<std::string> raw(argv + 1, argv + argc);
  const config::CliArgs args = config::ParseSessionArgs(role, raw);

  if (args.help) {
    std::cout << config::UsageText(role, argv[0]);
    return kExitOk;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n" << config::UsageText(role, argv[0]);
    return kExitUsage;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  core::ShutdownCoordinator stop;
  auto transport =
      std::make_shared<transport::UdpTransport>(MakeTransportConfig(args.config), stop);
  std::string error;
  if (!transport->Bind(&error)) {
    Logger::Error("[App] BIND_FAILED " + error);
    return kExitSessionFailed;
  }
  Logger::Info(std::string("[App] ") + config::ToString(role) +
               " local_port=" + std::to_string(transport->LocalPort()));

  auto session = MakeSession(args.config, stop, transport);

  control::ControlServer control(*session);
  if (!args.config.control_address.empty() &&
      !control.Start(args.config.control_address, &error)) {
    Logger::Error("[App] CONTROL_FAILED " + error);
    return kExitSessionFailed;
  }

  const session::SessionResult result = session->Run(g_termination_requested);
  control.Stop();
  return ExitCodeFor(result);
}

}  // namespace peerlink::app
