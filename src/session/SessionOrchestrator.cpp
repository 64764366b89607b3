// Repository: PeerLink
// Component: SessionOrchestrator
// Purpose: Session event loop, pump registry and ordered teardown.
// Copyright (c) 2026 PeerLink

#include "peerlink/session/SessionOrchestrator.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>
#include <variant>

#include "peerlink/core/Channel.hpp"
#include "peerlink/util/Logger.hpp"

namespace peerlink::session {

using util::Logger;

namespace {

constexpr auto kEventPollInterval = std::chrono::milliseconds(100);

}  // namespace

const char* ToString(SessionOutcome outcome) {
  switch (outcome) {
    case SessionOutcome::kStopped:
      return "stopped";
    case SessionOutcome::kFailed:
      return "failed";
    case SessionOutcome::kInterrupted:
      return "interrupted";
  }
  return "unknown";
}

SessionOrchestrator::SessionOrchestrator(config::SessionConfig config,
                                         core::ShutdownCoordinator stop,
                                         std::shared_ptr<transport::ITransport> transport)
    : config_(std::move(config)),
      stop_(std::move(stop)),
      transport_(std::move(transport)),
      barrier_(std::make_shared<core::StartupBarrier>(
          config_.barrier_parties > 0 ? config_.barrier_parties
                                      : config::RequiredBarrierParties(config_),
          stop_)) {
  if (!transport_) {
    throw std::invalid_argument("SessionOrchestrator requires a transport");
  }
}

SessionOrchestrator::~SessionOrchestrator() = default;

SessionResult SessionOrchestrator::Run(const std::atomic<bool>& interrupt) {
  if (ran_) {
    throw std::logic_error("SessionOrchestrator::Run called twice");
  }
  ran_ = true;

  stop_.RegisterTask("control-plane");
  Logger::Info(std::string("[Session] START role=") + config::ToString(config_.role) +
               " barrier_parties=" + std::to_string(barrier_->parties()) +
               " channel_capacity=" + std::to_string(config_.channel_capacity));

  auto [events_tx, events_rx] =
      core::MakeChannel<transport::SessionEvent>(config_.event_capacity, stop_);

  std::string error;
  bool setup_ok = false;
  try {
    setup_ok = Setup(&error);
  } catch (const std::exception& e) {
    error = e.what();
  }
  if (!setup_ok) {
    ReportSetupFailure(error);
  } else if (gated_pumps_ + 1 != barrier_->parties()) {
    ReportSetupFailure("startup barrier expects " + std::to_string(barrier_->parties()) +
                       " parties but the session gates " + std::to_string(gated_pumps_) +
                       " pumps");
  } else if (!transport_->Open(std::move(events_tx), &error)) {
    ReportSetupFailure("transport open failed: " + error);
  }

  bool interrupted = false;
  while (!stop_.IsStopRequested()) {
    if (interrupt.load(std::memory_order_acquire)) {
      interrupted = true;
      stop_.Shutdown("interrupted");
      break;
    }
    transport::SessionEvent event;
    const auto status = events_rx.ReceiveFor(event, kEventPollInterval);
    if (status == core::ReceiveStatus::kOk) {
      try {
        HandleEvent(event);
      } catch (const std::exception& e) {
        ReportSetupFailure(transport::Describe(event) + " handling failed: " + e.what());
      }
    } else if (status == core::ReceiveStatus::kClosed) {
      stop_.Shutdown("transport event stream closed");
    }
  }

  SessionResult result;
  const core::ShutdownSnapshot snapshot = stop_.Snapshot();
  if (snapshot.first_cause == core::StopCause::kError) {
    result.outcome = SessionOutcome::kFailed;
    result.reason = snapshot.error_reason;
  } else {
    result.outcome = interrupted ? SessionOutcome::kInterrupted : SessionOutcome::kStopped;
    result.reason = snapshot.shutdown_reason;
  }

  // ===== Teardown =====
  stop_.Shutdown("session ending");
  StopPumps();
  Teardown();
  transport_->Close();

  for (const auto& status : PumpStatuses()) {
    Logger::Info(std::string("[Session] PUMP_EXIT role=") + pump::ToString(status.role) +
                 " exit=" + pump::ToString(status.exit) +
                 " delivered=" + std::to_string(status.stats.frames_delivered) +
                 " source_failures=" + std::to_string(status.stats.source_failures) +
                 " sink_failures=" + std::to_string(status.stats.sink_failures));
  }
  Logger::Info(std::string("[Session] END outcome=") + ToString(result.outcome) +
               " reason=\"" + result.reason + "\"");
  return result;
}

std::vector<PumpStatus> SessionOrchestrator::PumpStatuses() const {
  std::lock_guard<std::mutex> lock(pumps_mutex_);
  std::vector<PumpStatus> out;
  out.reserve(pumps_.size());
  for (const auto& p : pumps_) {
    out.push_back(PumpStatus{p->role(), p->exit_reason(), p->stats()});
  }
  return out;
}

pump::StreamPump* SessionOrchestrator::SpawnPump(pump::StreamRole role,
                                                 std::unique_ptr<pump::IFrameSource> source,
                                                 std::unique_ptr<pump::IFrameSink> sink,
                                                 bool gated) {
  std::unique_ptr<pump::StreamPump> p;
  try {
    p = std::make_unique<pump::StreamPump>(role, config_.tuning.Get(role), std::move(source),
                                           std::move(sink), stop_,
                                           gated ? barrier_ : nullptr);
    p->Start();
  } catch (const std::exception& e) {
    ReportSetupFailure(std::string(pump::ToString(role)) + " pump: " + e.what());
    return nullptr;
  }
  if (gated) ++gated_pumps_;

  Logger::Debug(std::string("[Session] PUMP_SPAWNED role=") + pump::ToString(role) +
                " gated=" + (gated ? "true" : "false"));
  pump::StreamPump* raw = p.get();
  std::lock_guard<std::mutex> lock(pumps_mutex_);
  pumps_.push_back(std::move(p));
  return raw;
}

void SessionOrchestrator::ReportSetupFailure(const std::string& reason) {
  Logger::Error("[Session] SETUP_FAILED reason=\"" + reason + "\"");
  stop_.NotifyError(true, reason);
}

void SessionOrchestrator::HandleEvent(const transport::SessionEvent& event) {
  Logger::Debug("[Session] EVENT " + transport::Describe(event));

  if (std::holds_alternative<transport::Connected>(event)) {
    if (connected_.exchange(true, std::memory_order_acq_rel)) return;
    Logger::Info("[Session] CONNECTED");
    ReleaseBarrier();
    OnConnected();
  } else if (const auto* failed = std::get_if<transport::Failed>(&event)) {
    stop_.NotifyError(true, "transport failed: " + failed->reason);
  } else if (const auto* track = std::get_if<transport::TrackOpened>(&event)) {
    OnTrackOpened(track->role);
  } else if (const auto* channel = std::get_if<transport::ChannelOpened>(&event)) {
    OnChannelOpened(channel->label);
  } else if (const auto* closed = std::get_if<transport::Closed>(&event)) {
    stop_.Shutdown("peer closed: " + closed->reason);
  }
}

void SessionOrchestrator::ReleaseBarrier() {
  // Egress pumps were started in Setup(), so they are at the barrier or
  // about to be; this wait is short and is cancelled by any stop.
  const core::BarrierResult result = barrier_->Wait();
  Logger::Info(std::string("[Session] BARRIER ") + core::ToString(result));
}

void SessionOrchestrator::StopPumps() {
  std::vector<pump::StreamPump*> pumps;
  {
    std::lock_guard<std::mutex> lock(pumps_mutex_);
    for (const auto& p : pumps_) pumps.push_back(p.get());
  }
  for (auto* p : pumps) p->Join();
}

}  // namespace peerlink::session
