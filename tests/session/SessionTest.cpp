// Repository: PeerLink
// Component: Session Tests
// Purpose: Capture and playback sessions end to end over a loopback transport.
// Copyright (c) 2026 PeerLink

#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fixtures/LoopbackTransport.hpp"
#include "fixtures/TestPorts.hpp"
#include "peerlink/media/AudioCodec.hpp"
#include "peerlink/session/CaptureSession.hpp"
#include "peerlink/session/PlaybackSession.hpp"
#include "peerlink/video/VideoPacket.hpp"

namespace peerlink::session::testing {
namespace {

using namespace std::chrono_literals;
using peerlink::testing::FakeTimeSource;
using peerlink::testing::LoopbackTransport;
using peerlink::testing::WaitUntil;
using transport::TrackId;

// ===== Backends =====

class TickEncoder : public media::IAudioEncoder {
 public:
  bool Encode(const std::vector<int16_t>& interleaved, std::vector<core::Frame>* packets,
              std::string* /*error*/) override {
    packets->push_back(core::Frame::FromString("opus:" + std::to_string(interleaved.size())));
    return true;
  }
};

// "N" decodes to N samples; anything else fails.
class CountDecoder : public media::IAudioDecoder {
 public:
  bool Decode(const core::Frame& packet, std::vector<int16_t>* samples,
              std::string* error) override {
    try {
      samples->assign(static_cast<size_t>(std::stoi(packet.AsString())), 1);
    } catch (const std::exception&) {
      *error = "not a count";
      return false;
    }
    return true;
  }
};

class RecordingInjector : public input::IInputInjector {
 public:
  bool Inject(const input::InputEvent& event, std::string* /*error*/) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(input::Encode(event));
    return true;
  }

  std::vector<std::string> events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> events_;
};

config::SessionConfig SmallConfig(config::PeerRole role) {
  config::SessionConfig config;
  config.role = role;
  config.media.video_width = 32;
  config.media.video_height = 8;
  config.latency_interval = 20ms;
  config.input_enabled = role == config::PeerRole::kPlayback;
  return config;
}

CaptureBackends TestCaptureBackends(std::shared_ptr<RecordingInjector> injector,
                                    std::shared_ptr<FakeTimeSource> clock) {
  CaptureBackends backends;
  backends.encoder_factory = [](const config::MediaConfig&, std::string*) {
    return std::make_unique<TickEncoder>();
  };
  backends.injector = std::move(injector);
  backends.clock = std::move(clock);
  return backends;
}

PlaybackBackends TestPlaybackBackends(int input_fd, std::shared_ptr<FakeTimeSource> clock) {
  PlaybackBackends backends;
  backends.decoder_factory = [](const config::MediaConfig&, std::string*) {
    return std::make_unique<CountDecoder>();
  };
  backends.input_fd = input_fd;
  backends.clock = std::move(clock);
  return backends;
}

uint64_t Delivered(const SessionOrchestrator& session, pump::StreamRole role) {
  for (const auto& status : session.PumpStatuses()) {
    if (status.role == role) return status.stats.frames_delivered;
  }
  return 0;
}

// Runs a session on its own thread so the test can play the remote peer.
class SessionRunner {
 public:
  explicit SessionRunner(SessionOrchestrator* session)
      : thread_([this, session] { result_ = session->Run(interrupt_); }) {}

  ~SessionRunner() {
    interrupt_.store(true);
    if (thread_.joinable()) thread_.join();
  }

  SessionResult Finish() {
    thread_.join();
    return result_;
  }

 private:
  std::atomic<bool> interrupt_{false};
  SessionResult result_;
  std::thread thread_;
};

// ===== Capture =====

class CaptureSessionTest : public ::testing::Test {
 protected:
  std::shared_ptr<LoopbackTransport> transport_ = std::make_shared<LoopbackTransport>();
  std::shared_ptr<RecordingInjector> injector_ = std::make_shared<RecordingInjector>();
  std::shared_ptr<FakeTimeSource> clock_ = std::make_shared<FakeTimeSource>(5000);
  core::ShutdownCoordinator stop_;
};

TEST_F(CaptureSessionTest, EgressWaitsForConnectedThenStreams) {
  CaptureSession session(SmallConfig(config::PeerRole::kCapture), stop_, transport_,
                         TestCaptureBackends(injector_, clock_));
  SessionRunner runner(&session);

  ASSERT_TRUE(WaitUntil([&] { return transport_->opened(); }, 2000ms));
  std::this_thread::sleep_for(100ms);
  EXPECT_TRUE(transport_->Sent(TrackId::kAudio).empty());
  EXPECT_TRUE(transport_->Sent(TrackId::kVideo).empty());

  ASSERT_TRUE(transport_->Emit(transport::Connected{}));
  ASSERT_TRUE(transport_->WaitForSent(TrackId::kAudio, 3, 2000ms));
  ASSERT_TRUE(transport_->WaitForSent(TrackId::kVideo, 1, 2000ms));
  ASSERT_TRUE(transport_->WaitForSent(TrackId::kLatency, 1, 2000ms));
  EXPECT_EQ(transport_->Sent(TrackId::kAudio).front(), "opus:1920");
  EXPECT_EQ(transport_->Sent(TrackId::kLatency).front(), "5000");
  EXPECT_TRUE(session.connected());

  transport_->Deliver(TrackId::kInput, core::Frame::FromString("kp 65"));
  transport_->Deliver(TrackId::kInput, core::Frame::FromString("mm 2 3"));
  ASSERT_TRUE(transport_->Emit(transport::ChannelOpened{"input"}));
  ASSERT_TRUE(WaitUntil([&] { return injector_->events().size() == 2; }, 2000ms));
  EXPECT_EQ(injector_->events(), (std::vector<std::string>{"kp 65", "mm 2 3"}));

  ASSERT_TRUE(transport_->Emit(transport::Closed{"bye"}));
  const SessionResult result = runner.Finish();
  EXPECT_EQ(result.outcome, SessionOutcome::kStopped);
  EXPECT_EQ(result.reason, "peer closed: bye");
  EXPECT_TRUE(transport_->closed());

  for (const auto& status : session.PumpStatuses()) {
    EXPECT_NE(status.exit, pump::PumpExit::kRunning) << pump::ToString(status.role);
    EXPECT_FALSE(status.stats.escalated);
  }
}

TEST_F(CaptureSessionTest, EncoderFailureFailsSetup) {
  CaptureBackends backends = TestCaptureBackends(injector_, clock_);
  backends.encoder_factory = [](const config::MediaConfig&, std::string* error) {
    *error = "no opus";
    return std::unique_ptr<media::IAudioEncoder>();
  };
  CaptureSession session(SmallConfig(config::PeerRole::kCapture), stop_, transport_,
                         std::move(backends));

  std::atomic<bool> interrupt{false};
  const SessionResult result = session.Run(interrupt);
  EXPECT_EQ(result.outcome, SessionOutcome::kFailed);
  EXPECT_EQ(result.reason, "audio encoder: no opus");
  EXPECT_TRUE(stop_.Snapshot().error_is_fatal);
  EXPECT_FALSE(transport_->opened());
}

TEST_F(CaptureSessionTest, TransportOpenFailureCancelsGatedPumps) {
  transport_->FailOpen("port in use");
  CaptureSession session(SmallConfig(config::PeerRole::kCapture), stop_, transport_,
                         TestCaptureBackends(injector_, clock_));

  std::atomic<bool> interrupt{false};
  const SessionResult result = session.Run(interrupt);
  EXPECT_EQ(result.outcome, SessionOutcome::kFailed);
  EXPECT_EQ(result.reason, "transport open failed: port in use");

  const auto statuses = session.PumpStatuses();
  ASSERT_EQ(statuses.size(), 2u);
  for (const auto& status : statuses) {
    EXPECT_EQ(status.exit, pump::PumpExit::kStopped);
    EXPECT_EQ(status.stats.frames_delivered, 0u);
  }
}

TEST_F(CaptureSessionTest, InterruptStopsTheSession) {
  CaptureSession session(SmallConfig(config::PeerRole::kCapture), stop_, transport_,
                         TestCaptureBackends(injector_, clock_));
  std::atomic<bool> interrupt{true};
  const SessionResult result = session.Run(interrupt);
  EXPECT_EQ(result.outcome, SessionOutcome::kInterrupted);
  EXPECT_EQ(result.reason, "interrupted");
  EXPECT_THROW(session.Run(interrupt), std::logic_error);
}

TEST_F(CaptureSessionTest, TransportFailureIsFatal) {
  CaptureSession session(SmallConfig(config::PeerRole::kCapture), stop_, transport_,
                         TestCaptureBackends(injector_, clock_));
  SessionRunner runner(&session);
  ASSERT_TRUE(WaitUntil([&] { return transport_->opened(); }, 2000ms));

  ASSERT_TRUE(transport_->Emit(transport::Failed{"ice failed"}));
  const SessionResult result = runner.Finish();
  EXPECT_EQ(result.outcome, SessionOutcome::kFailed);
  EXPECT_EQ(result.reason, "transport failed: ice failed");
  EXPECT_TRUE(stop_.Snapshot().error_is_fatal);
}

TEST_F(CaptureSessionTest, PersistentWriteFailuresEscalate) {
  config::SessionConfig config = SmallConfig(config::PeerRole::kCapture);
  config.tuning.Set(pump::StreamRole::kAudioEgress, config::PumpTuning{3, 10});
  transport_->FailWrites(TrackId::kAudio, true);
  CaptureSession session(config, stop_, transport_, TestCaptureBackends(injector_, clock_));
  SessionRunner runner(&session);
  ASSERT_TRUE(WaitUntil([&] { return transport_->opened(); }, 2000ms));

  ASSERT_TRUE(transport_->Emit(transport::Connected{}));
  const SessionResult result = runner.Finish();
  EXPECT_EQ(result.outcome, SessionOutcome::kFailed);
  EXPECT_EQ(result.reason, "audio-egress sink failure");
  EXPECT_FALSE(stop_.Snapshot().error_is_fatal);

  bool escalated = false;
  for (const auto& status : session.PumpStatuses()) {
    if (status.role == pump::StreamRole::kAudioEgress) {
      escalated = status.stats.escalated;
      EXPECT_EQ(status.exit, pump::PumpExit::kFatal);
      EXPECT_EQ(status.stats.sink_failures, 3u);
    } else {
      EXPECT_FALSE(status.stats.escalated);
    }
  }
  EXPECT_TRUE(escalated);
}

// ===== Playback =====

class PlaybackSessionTest : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_EQ(::pipe(fds_), 0); }

  void TearDown() override {
    for (int fd : fds_) {
      if (fd >= 0) ::close(fd);
    }
  }

  void WriteInput(const std::string& text) {
    ASSERT_EQ(::write(fds_[1], text.data(), text.size()),
              static_cast<ssize_t>(text.size()));
  }

  std::shared_ptr<LoopbackTransport> transport_ = std::make_shared<LoopbackTransport>();
  std::shared_ptr<FakeTimeSource> clock_ = std::make_shared<FakeTimeSource>(1000);
  core::ShutdownCoordinator stop_;
  int fds_[2] = {-1, -1};
};

TEST_F(PlaybackSessionTest, ForwardsInputAndConsumesEveryIngressStream) {
  const config::SessionConfig config = SmallConfig(config::PeerRole::kPlayback);
  PlaybackSession session(config, stop_, transport_, TestPlaybackBackends(fds_[0], clock_));
  SessionRunner runner(&session);
  ASSERT_TRUE(WaitUntil([&] { return transport_->opened(); }, 2000ms));

  // Typed before the peer answered: held until the barrier releases.
  WriteInput("kp 13\nbogus\nkr 13\n");
  std::this_thread::sleep_for(100ms);
  EXPECT_TRUE(transport_->Sent(TrackId::kInput).empty());

  ASSERT_TRUE(transport_->Emit(transport::Connected{}));
  ASSERT_TRUE(transport_->WaitForSent(TrackId::kInput, 2, 2000ms));
  EXPECT_EQ(transport_->Sent(TrackId::kInput), (std::vector<std::string>{"kp 13", "kr 13"}));

  transport_->Deliver(TrackId::kAudio, core::Frame::FromString("960"));
  transport_->Deliver(TrackId::kAudio, core::Frame::FromString("960"));
  ASSERT_TRUE(transport_->Emit(transport::TrackOpened{pump::StreamRole::kAudioIngress}));
  ASSERT_TRUE(WaitUntil(
      [&] { return Delivered(session, pump::StreamRole::kAudioIngress) == 2; }, 2000ms));
  // The worker was created before its pump was published.
  ASSERT_NE(session.audio_worker(), nullptr);
  ASSERT_TRUE(WaitUntil([&] { return session.audio_worker()->frames_consumed() == 2; }, 2000ms));

  const auto packets = video::Packetize(
      0, std::vector<uint8_t>(static_cast<size_t>(config.media.video_width) *
                                  config.media.video_height,
                              16),
      transport::kMaxPayloadBytes);
  for (const auto& packet : packets) transport_->Deliver(TrackId::kVideo, packet);
  ASSERT_TRUE(transport_->Emit(transport::TrackOpened{pump::StreamRole::kVideoIngress}));
  ASSERT_TRUE(WaitUntil(
      [&] { return Delivered(session, pump::StreamRole::kVideoIngress) == packets.size(); },
      2000ms));
  ASSERT_TRUE(WaitUntil(
      [&] { return session.video_worker()->frames_consumed() == packets.size(); }, 2000ms));

  transport_->Deliver(TrackId::kLatency, core::Frame::FromString("900"));
  ASSERT_TRUE(transport_->Emit(transport::ChannelOpened{"latency"}));
  ASSERT_TRUE(WaitUntil(
      [&] { return Delivered(session, pump::StreamRole::kLatencyIngress) == 1; }, 2000ms));

  ASSERT_TRUE(transport_->Emit(transport::Closed{"done"}));
  const SessionResult result = runner.Finish();
  EXPECT_EQ(result.outcome, SessionOutcome::kStopped);
  EXPECT_EQ(result.reason, "peer closed: done");

  ASSERT_NE(session.latency_sink(), nullptr);
  EXPECT_EQ(session.latency_sink()->stats().last_ms, 100);
  ASSERT_NE(session.input_capture(), nullptr);
  EXPECT_EQ(session.input_capture()->lines_rejected(), 1u);
  ASSERT_NE(session.audio_worker(), nullptr);
  EXPECT_EQ(session.audio_worker()->frames_consumed(), 2u);
  ASSERT_NE(session.video_worker(), nullptr);
  EXPECT_EQ(session.video_worker()->frames_consumed(), packets.size());
}

TEST_F(PlaybackSessionTest, NoInputReleasesOnConnectAlone) {
  config::SessionConfig config = SmallConfig(config::PeerRole::kPlayback);
  config.input_enabled = false;
  PlaybackSession session(config, stop_, transport_, TestPlaybackBackends(fds_[0], clock_));
  SessionRunner runner(&session);
  ASSERT_TRUE(WaitUntil([&] { return transport_->opened(); }, 2000ms));

  ASSERT_TRUE(transport_->Emit(transport::Connected{}));
  ASSERT_TRUE(WaitUntil([&] { return session.connected(); }, 2000ms));
  EXPECT_TRUE(session.PumpStatuses().empty());

  stop_.Shutdown("operator request");
  const SessionResult result = runner.Finish();
  EXPECT_EQ(result.outcome, SessionOutcome::kStopped);
  EXPECT_EQ(result.reason, "operator request");
}

TEST_F(PlaybackSessionTest, UndecodableAudioIsCountedNotFatalBelowThreshold) {
  config::SessionConfig config = SmallConfig(config::PeerRole::kPlayback);
  config.input_enabled = false;
  PlaybackSession session(config, stop_, transport_, TestPlaybackBackends(fds_[0], clock_));
  SessionRunner runner(&session);
  ASSERT_TRUE(WaitUntil([&] { return transport_->opened(); }, 2000ms));

  transport_->Deliver(TrackId::kAudio, core::Frame::FromString("garbage"));
  transport_->Deliver(TrackId::kAudio, core::Frame::FromString("480"));
  ASSERT_TRUE(transport_->Emit(transport::Connected{}));
  ASSERT_TRUE(transport_->Emit(transport::TrackOpened{pump::StreamRole::kAudioIngress}));
  ASSERT_TRUE(WaitUntil(
      [&] { return Delivered(session, pump::StreamRole::kAudioIngress) == 1; }, 2000ms));
  EXPECT_FALSE(stop_.IsStopRequested());

  stop_.Shutdown("test done");
  const SessionResult result = runner.Finish();
  EXPECT_EQ(result.outcome, SessionOutcome::kStopped);
  for (const auto& status : session.PumpStatuses()) {
    if (status.role == pump::StreamRole::kAudioIngress) {
      EXPECT_EQ(status.stats.sink_failures, 1u);
    }
  }
}

TEST_F(PlaybackSessionTest, UnwritableAudioOutputFailsSetup) {
  config::SessionConfig config = SmallConfig(config::PeerRole::kPlayback);
  config.audio_output_path = "/nonexistent-dir/out.wav";
  PlaybackSession session(config, stop_, transport_, TestPlaybackBackends(fds_[0], clock_));

  std::atomic<bool> interrupt{false};
  const SessionResult result = session.Run(interrupt);
  EXPECT_EQ(result.outcome, SessionOutcome::kFailed);
  EXPECT_EQ(result.reason.rfind("audio output: ", 0), 0u) << result.reason;
  EXPECT_FALSE(transport_->opened());
}

TEST_F(PlaybackSessionTest, BarrierPartiesMustMatchGatedPumps) {
  config::SessionConfig config = SmallConfig(config::PeerRole::kPlayback);
  config.input_enabled = false;
  config.barrier_parties = 2;
  PlaybackSession session(config, stop_, transport_, TestPlaybackBackends(fds_[0], clock_));

  std::atomic<bool> interrupt{false};
  const SessionResult result = session.Run(interrupt);
  EXPECT_EQ(result.outcome, SessionOutcome::kFailed);
  EXPECT_EQ(result.reason.find("startup barrier expects 2 parties"), 0u) << result.reason;
}

TEST(SessionOrchestratorTest, RequiresATransport) {
  core::ShutdownCoordinator stop;
  EXPECT_THROW(CaptureSession(SmallConfig(config::PeerRole::kCapture), stop, nullptr),
               std::invalid_argument);
}

}  // namespace
}  // namespace peerlink::session::testing
