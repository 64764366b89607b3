// Repository: PeerLink
// Component: SessionOrchestrator
// Purpose: Owns one peer session: the coordinator, the startup barrier, the
//          transport and every pump. Runs the single-owner event loop and
//          performs ordered teardown.
// Copyright (c) 2026 PeerLink
//
// Run() lifecycle:
//
//   Setup()                 role-specific captures + gated egress pumps
//   transport.Open(events)  connection attempts begin
//   event loop              until stop, error or interrupt
//     Connected             control plane joins the barrier (releases egress)
//     TrackOpened(role)     role-specific ingress pump
//     ChannelOpened(label)  role-specific ingress pump
//     Failed(reason)        NotifyError(fatal)
//     Closed(reason)        Shutdown
//   teardown                Shutdown, join pumps, Teardown(), close transport
//
// Any setup failure is reported through NotifyError(true, ...) so the
// teardown path is the same for every outcome.

#ifndef PEERLINK_SESSION_SESSION_ORCHESTRATOR_HPP_
#define PEERLINK_SESSION_SESSION_ORCHESTRATOR_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "peerlink/config/SessionConfig.hpp"
#include "peerlink/core/ShutdownCoordinator.hpp"
#include "peerlink/core/StartupBarrier.hpp"
#include "peerlink/pump/FramePorts.hpp"
#include "peerlink/pump/StreamPump.hpp"
#include "peerlink/transport/ITransport.hpp"
#include "peerlink/transport/SessionEvent.hpp"

namespace peerlink::session {

enum class SessionOutcome {
  kStopped,      // Graceful shutdown (peer BYE, StopSession, ...)
  kFailed,       // An error was the first terminal transition
  kInterrupted,  // SIGINT/SIGTERM
};

const char* ToString(SessionOutcome outcome);

struct SessionResult {
  SessionOutcome outcome = SessionOutcome::kStopped;
  std::string reason;
};

struct PumpStatus {
  pump::StreamRole role;
  pump::PumpExit exit;
  pump::PumpStats stats;
};

class SessionOrchestrator {
 public:
  SessionOrchestrator(config::SessionConfig config, core::ShutdownCoordinator stop,
                      std::shared_ptr<transport::ITransport> transport);
  virtual ~SessionOrchestrator();

  SessionOrchestrator(const SessionOrchestrator&) = delete;
  SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

  // Blocks until the session stops. `interrupt` is polled between events.
  // Call once.
  SessionResult Run(const std::atomic<bool>& interrupt);

  // Thread-safe; used by the control service while Run() is active.
  std::vector<PumpStatus> PumpStatuses() const;

  core::ShutdownCoordinator coordinator() const { return stop_; }
  const config::SessionConfig& config() const { return config_; }
  bool connected() const { return connected_.load(std::memory_order_acquire); }

 protected:
  // Creates captures and gated egress pumps. Returns false with *error set
  // when a backend cannot start.
  virtual bool Setup(std::string* error) = 0;

  // Event hooks, called on the event loop thread.
  virtual void OnConnected() {}
  virtual void OnTrackOpened(pump::StreamRole role) { (void)role; }
  virtual void OnChannelOpened(const std::string& label) { (void)label; }

  // Joins role-specific threads. Called after every pump has been joined.
  virtual void Teardown() {}

  // Creates and starts a pump with the configured tuning for `role`. Gated
  // pumps wait on the startup barrier. Returns nullptr (after reporting a
  // setup failure) when the pump cannot be built.
  pump::StreamPump* SpawnPump(pump::StreamRole role, std::unique_ptr<pump::IFrameSource> source,
                              std::unique_ptr<pump::IFrameSink> sink, bool gated);

  void ReportSetupFailure(const std::string& reason);

  core::ShutdownCoordinator& stop() { return stop_; }
  transport::ITransport& transport() { return *transport_; }

 private:
  void HandleEvent(const transport::SessionEvent& event);
  void ReleaseBarrier();
  void StopPumps();

  const config::SessionConfig config_;
  core::ShutdownCoordinator stop_;
  std::shared_ptr<transport::ITransport> transport_;
  std::shared_ptr<core::StartupBarrier> barrier_;

  mutable std::mutex pumps_mutex_;
  std::vector<std::unique_ptr<pump::StreamPump>> pumps_;
  size_t gated_pumps_ = 0;  // Event loop thread only

  std::atomic<bool> connected_{false};
  bool ran_ = false;
};

}  // namespace peerlink::session

#endif  // PEERLINK_SESSION_SESSION_ORCHESTRATOR_HPP_
