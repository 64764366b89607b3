// Repository: PeerLink
// Component: SessionControl Tests
// Purpose: Status reporting and stop requests through the gRPC service.
// Copyright (c) 2026 PeerLink

#include "peerlink/control/SessionControlService.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "fixtures/LoopbackTransport.hpp"
#include "fixtures/TestPorts.hpp"
#include "peerlink/pump/StreamPump.hpp"

namespace peerlink::control::testing {
namespace {

using peerlink::testing::LoopbackTransport;
using peerlink::testing::RecordingSink;
using peerlink::testing::ScriptedSource;

// Playback session without input: nothing gated, one ungated pump.
class StubSession : public session::SessionOrchestrator {
 public:
  explicit StubSession(core::ShutdownCoordinator stop)
      : SessionOrchestrator(MakeConfig(), stop, std::make_shared<LoopbackTransport>()) {}

  // Exposes a pump the status report can list.
  void AddFinishedPump() {
    pump::StreamPump* p = SpawnPump(pump::StreamRole::kLatencyIngress,
                                    std::make_unique<ScriptedSource>(ScriptedSource::Frames(4)),
                                    std::make_unique<RecordingSink>(), /*gated=*/false);
    ASSERT_NE(p, nullptr);
    p->Join();
  }

 protected:
  bool Setup(std::string* /*error*/) override { return true; }

 private:
  static config::SessionConfig MakeConfig() {
    config::SessionConfig config;
    config.role = config::PeerRole::kPlayback;
    config.input_enabled = false;
    return config;
  }
};

class SessionControlServiceTest : public ::testing::Test {
 protected:
  core::ShutdownCoordinator stop_;
  StubSession session_{stop_};
  SessionControlImpl service_{session_};
  grpc::ServerContext context_;
};

TEST_F(SessionControlServiceTest, ReportsVersion) {
  ApiVersionRequest request;
  ApiVersion response;
  ASSERT_TRUE(service_.GetVersion(&context_, &request, &response).ok());
  EXPECT_EQ(response.version(), kApiVersion);
}

TEST_F(SessionControlServiceTest, StatusOfARunningSession) {
  stop_.RegisterTask("control-plane");
  session_.AddFinishedPump();

  SessionStatusRequest request;
  SessionStatus response;
  ASSERT_TRUE(service_.GetSessionStatus(&context_, &request, &response).ok());
  EXPECT_EQ(response.peer_role(), "playback");
  EXPECT_EQ(response.state(), SESSION_STATE_RUNNING);
  EXPECT_FALSE(response.connected());
  EXPECT_EQ(response.active_task_count(), 2u);
  ASSERT_EQ(response.task_names_size(), 2);
  EXPECT_EQ(response.task_names(0), "control-plane");

  ASSERT_EQ(response.pumps_size(), 1);
  const PumpStatus& entry = response.pumps(0);
  EXPECT_EQ(entry.role(), "latency-ingress");
  EXPECT_EQ(entry.exit(), pump::ToString(pump::PumpExit::kSourceClosed));
  EXPECT_EQ(entry.frames_delivered(), 4u);
  EXPECT_FALSE(entry.escalated());
}

TEST_F(SessionControlServiceTest, ErrorStateWinsOverShutdown) {
  stop_.NotifyError(false, "video-ingress source failure");
  stop_.Shutdown("session ending");

  SessionStatusRequest request;
  SessionStatus response;
  ASSERT_TRUE(service_.GetSessionStatus(&context_, &request, &response).ok());
  EXPECT_EQ(response.state(), SESSION_STATE_ERROR);
  EXPECT_FALSE(response.error_is_fatal());
  EXPECT_EQ(response.error_reason(), "video-ingress source failure");
}

TEST_F(SessionControlServiceTest, StopSessionRequestsShutdownOnce) {
  StopSessionRequest request;
  StopSessionResponse response;
  ASSERT_TRUE(service_.StopSession(&context_, &request, &response).ok());
  EXPECT_TRUE(response.success());
  EXPECT_EQ(response.message(), "shutdown requested");
  EXPECT_TRUE(stop_.IsStopRequested());
  EXPECT_EQ(stop_.Snapshot().shutdown_reason, "stop requested over control API");

  request.set_reason("second");
  ASSERT_TRUE(service_.StopSession(&context_, &request, &response).ok());
  EXPECT_EQ(response.message(), "session already stopping");
  EXPECT_EQ(stop_.Snapshot().shutdown_reason, "stop requested over control API");

  SessionStatusRequest status_request;
  SessionStatus status;
  ASSERT_TRUE(service_.GetSessionStatus(&context_, &status_request, &status).ok());
  EXPECT_EQ(status.state(), SESSION_STATE_SHUTTING_DOWN);
}

TEST(ControlServerTest, ServesOverLoopback) {
  core::ShutdownCoordinator stop;
  StubSession session(stop);
  ControlServer server(session);

  std::string error;
  ASSERT_TRUE(server.Start("127.0.0.1:0", &error)) << error;
  ASSERT_GT(server.port(), 0);

  auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(server.port()),
                                     grpc::InsecureChannelCredentials());
  auto stub = SessionControl::NewStub(channel);

  grpc::ClientContext version_context;
  ApiVersionRequest version_request;
  ApiVersion version;
  ASSERT_TRUE(stub->GetVersion(&version_context, version_request, &version).ok());
  EXPECT_EQ(version.version(), kApiVersion);

  grpc::ClientContext stop_context;
  StopSessionRequest stop_request;
  stop_request.set_reason("operator");
  StopSessionResponse stop_response;
  ASSERT_TRUE(stub->StopSession(&stop_context, stop_request, &stop_response).ok());
  EXPECT_TRUE(stop.IsStopRequested());
  EXPECT_EQ(stop.Snapshot().shutdown_reason, "operator");

  server.Stop();
  EXPECT_EQ(server.port(), 0);
  server.Stop();
}

}  // namespace
}  // namespace peerlink::control::testing
