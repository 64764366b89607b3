// Repository: PeerLink
// Component: SessionControl gRPC Service Implementation
// Purpose: Status and stop RPCs over a running SessionOrchestrator.
// Copyright (c) 2026 PeerLink

#include "peerlink/control/SessionControlService.hpp"

#include <chrono>

#include "peerlink/util/Logger.hpp"

namespace peerlink::control {

using util::Logger;

SessionControlImpl::SessionControlImpl(const session::SessionOrchestrator& session)
    : session_(session) {}

SessionControlImpl::~SessionControlImpl() = default;

grpc::Status SessionControlImpl::GetVersion(grpc::ServerContext* /*context*/,
                                            const ApiVersionRequest* /*request*/,
                                            ApiVersion* response) {
  response->set_version(kApiVersion);
  Logger::Debug(std::string("[SessionControl] GetVersion version=") + kApiVersion);
  return grpc::Status::OK;
}

grpc::Status SessionControlImpl::GetSessionStatus(grpc::ServerContext* /*context*/,
                                                  const SessionStatusRequest* /*request*/,
                                                  SessionStatus* response) {
  const core::ShutdownSnapshot snapshot = session_.coordinator().Snapshot();

  response->set_peer_role(config::ToString(session_.config().role));
  if (snapshot.error_flag) {
    response->set_state(SESSION_STATE_ERROR);
  } else if (snapshot.shutting_down) {
    response->set_state(SESSION_STATE_SHUTTING_DOWN);
  } else {
    response->set_state(SESSION_STATE_RUNNING);
  }
  response->set_connected(session_.connected());
  response->set_error_is_fatal(snapshot.error_is_fatal);
  response->set_error_reason(snapshot.error_reason);
  response->set_shutdown_reason(snapshot.shutdown_reason);
  response->set_active_task_count(snapshot.active_task_count);
  for (const auto& name : snapshot.task_names) {
    response->add_task_names(name);
  }

  for (const auto& status : session_.PumpStatuses()) {
    PumpStatus* entry = response->add_pumps();
    entry->set_role(pump::ToString(status.role));
    entry->set_exit(pump::ToString(status.exit));
    entry->set_frames_delivered(status.stats.frames_delivered);
    entry->set_source_failures(status.stats.source_failures);
    entry->set_sink_failures(status.stats.sink_failures);
    entry->set_escalated(status.stats.escalated);
  }
  return grpc::Status::OK;
}

grpc::Status SessionControlImpl::StopSession(grpc::ServerContext* /*context*/,
                                             const StopSessionRequest* request,
                                             StopSessionResponse* response) {
  const std::string reason =
      request->reason().empty() ? "stop requested over control API" : request->reason();
  Logger::Info("[SessionControl] StopSession reason=\"" + reason + "\"");

  core::ShutdownCoordinator stop = session_.coordinator();
  const bool already_stopping = stop.IsStopRequested();
  stop.Shutdown(reason);

  response->set_success(true);
  response->set_message(already_stopping ? "session already stopping" : "shutdown requested");
  return grpc::Status::OK;
}

// ===== ControlServer =====

ControlServer::ControlServer(const session::SessionOrchestrator& session)
    : service_(session) {}

ControlServer::~ControlServer() {
  Stop();
}

bool ControlServer::Start(const std::string& address, std::string* error) {
  int selected_port = 0;
  grpc::ServerBuilder builder;
  builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &selected_port);
  builder.RegisterService(&service_);
  server_ = builder.BuildAndStart();
  if (!server_ || selected_port == 0) {
    server_.reset();
    *error = "cannot listen on " + address;
    return false;
  }
  port_ = selected_port;
  Logger::Info("[SessionControl] LISTENING address=" + address +
               " port=" + std::to_string(selected_port));
  return true;
}

void ControlServer::Stop() {
  if (!server_) return;
  server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
  server_->Wait();
  server_.reset();
  port_ = 0;
  Logger::Info("[SessionControl] STOPPED");
}

}  // namespace peerlink::control
