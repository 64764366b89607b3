// Repository: PeerLink
// Component: SessionControl gRPC Service Implementation
// Purpose: Status and stop RPCs over a running SessionOrchestrator.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_CONTROL_SESSION_CONTROL_SERVICE_HPP_
#define PEERLINK_CONTROL_SESSION_CONTROL_SERVICE_HPP_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "session_control.grpc.pb.h"
#include "session_control.pb.h"
#include "peerlink/session/SessionOrchestrator.hpp"

namespace peerlink::control {

inline constexpr const char* kApiVersion = "1.0.0";

// SessionControlImpl is a thin adapter: reads come from the coordinator
// snapshot and the pump registry, StopSession maps to Shutdown().
class SessionControlImpl final : public SessionControl::Service {
 public:
  explicit SessionControlImpl(const session::SessionOrchestrator& session);
  ~SessionControlImpl() override;

  SessionControlImpl(const SessionControlImpl&) = delete;
  SessionControlImpl& operator=(const SessionControlImpl&) = delete;

  grpc::Status GetVersion(grpc::ServerContext* context, const ApiVersionRequest* request,
                          ApiVersion* response) override;

  grpc::Status GetSessionStatus(grpc::ServerContext* context,
                                const SessionStatusRequest* request,
                                SessionStatus* response) override;

  grpc::Status StopSession(grpc::ServerContext* context, const StopSessionRequest* request,
                           StopSessionResponse* response) override;

 private:
  const session::SessionOrchestrator& session_;
};

// Owns the grpc::Server hosting SessionControlImpl.
class ControlServer {
 public:
  explicit ControlServer(const session::SessionOrchestrator& session);
  ~ControlServer();

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  // Binds `address` ("host:port"). Returns false with *error set on failure.
  bool Start(const std::string& address, std::string* error);

  // Idempotent.
  void Stop();

  // Port actually bound (resolves ":0"); 0 when not listening.
  int port() const { return port_; }

 private:
  SessionControlImpl service_;
  std::unique_ptr<grpc::Server> server_;
  int port_ = 0;
};

}  // namespace peerlink::control

#endif  // PEERLINK_CONTROL_SESSION_CONTROL_SERVICE_HPP_
