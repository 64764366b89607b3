// Repository: PeerLink
// Component: StreamPump Tests
// Purpose: Escalation point, ordering, stop precedence, gating, end of stream.
// Copyright (c) 2026 PeerLink

#include "peerlink/pump/StreamPump.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "fixtures/TestPorts.hpp"
#include "peerlink/core/Channel.hpp"
#include "peerlink/pump/ChannelPorts.hpp"

namespace peerlink::pump::testing {
namespace {

using namespace std::chrono_literals;
using peerlink::testing::RecordingSink;
using peerlink::testing::ScriptedSource;
using peerlink::testing::WaitUntil;

std::vector<std::string> Numbers(int n) {
  std::vector<std::string> out;
  for (int i = 0; i < n; ++i) out.push_back(std::to_string(i));
  return out;
}

TEST(StreamPumpTest, RejectsMissingPortsAndBadTuning) {
  core::ShutdownCoordinator stop;
  EXPECT_THROW(StreamPump(StreamRole::kAudioEgress, {900, 1000}, nullptr,
                          std::make_unique<RecordingSink>(), stop),
               std::invalid_argument);
  EXPECT_THROW(StreamPump(StreamRole::kAudioEgress, {0, 1000},
                          std::make_unique<ScriptedSource>(ScriptedSource::Frames(1)),
                          std::make_unique<RecordingSink>(), stop),
               std::invalid_argument);
}

TEST(StreamPumpTest, DeliversInOrderThenEndsQuietlyWhenSourceCloses) {
  core::ShutdownCoordinator stop;
  auto sink = std::make_unique<RecordingSink>();
  RecordingSink* recorded = sink.get();

  StreamPump pump(StreamRole::kVideoEgress, {9000, 10000},
                  std::make_unique<ScriptedSource>(ScriptedSource::Frames(500)), std::move(sink),
                  stop);
  pump.Run();

  EXPECT_EQ(pump.exit_reason(), PumpExit::kSourceClosed);
  EXPECT_EQ(recorded->Payloads(), Numbers(500));
  EXPECT_EQ(pump.stats().frames_delivered, 500u);
  EXPECT_FALSE(stop.IsStopRequested());
}

TEST(StreamPumpTest, EscalatesExactlyOnceOnTheNineHundredthFailure) {
  core::ShutdownCoordinator stop;
  int wakes = 0;
  stop.AddWaker([&wakes] { ++wakes; });

  // 901 failing attempts followed by frames that must never be taken.
  auto script = ScriptedSource::Errors(901);
  auto frames = ScriptedSource::Frames(99);
  script.insert(script.end(), frames.begin(), frames.end());
  auto source = std::make_unique<ScriptedSource>(std::move(script));
  ScriptedSource* scripted = source.get();

  StreamPump pump(StreamRole::kAudioIngress, {900, 1000}, std::move(source),
                  std::make_unique<RecordingSink>(), stop);
  pump.Run();

  EXPECT_EQ(pump.exit_reason(), PumpExit::kFatal);
  EXPECT_EQ(scripted->calls(), 900u);
  EXPECT_EQ(pump.stats().source_failures, 900u);
  EXPECT_TRUE(pump.stats().escalated);
  EXPECT_EQ(wakes, 1);

  const auto snap = stop.Snapshot();
  EXPECT_TRUE(snap.error_flag);
  EXPECT_FALSE(snap.error_is_fatal);
  EXPECT_EQ(snap.error_reason, "audio-ingress source failure");
}

TEST(StreamPumpTest, SinkFailuresCountLikeSourceFailures) {
  core::ShutdownCoordinator stop;
  // Every other put fails: tracker 3/10 trips on the third failure.
  auto sink = std::make_unique<RecordingSink>([](uint64_t i) { return i % 2 == 1; });
  RecordingSink* recorded = sink.get();

  StreamPump pump(StreamRole::kInputIngress, {3, 10},
                  std::make_unique<ScriptedSource>(ScriptedSource::Frames(20)), std::move(sink),
                  stop);
  pump.Run();

  EXPECT_EQ(pump.exit_reason(), PumpExit::kFatal);
  EXPECT_EQ(pump.stats().sink_failures, 3u);
  // Failed frames are dropped, never retried.
  EXPECT_EQ(recorded->Payloads(), (std::vector<std::string>{"0", "2", "4"}));
  EXPECT_EQ(stop.Snapshot().error_reason, "input-ingress sink failure");
}

TEST(StreamPumpTest, TransientFailuresBelowThresholdDoNotStopTheStream) {
  core::ShutdownCoordinator stop;
  std::vector<TakeResult> script;
  for (int i = 0; i < 50; ++i) {
    script.push_back(TakeResult::Error("glitch"));
    script.push_back(TakeResult::Ok(core::Frame::FromString(std::to_string(i))));
  }
  auto sink = std::make_unique<RecordingSink>();
  RecordingSink* recorded = sink.get();

  StreamPump pump(StreamRole::kAudioEgress, {900, 1000},
                  std::make_unique<ScriptedSource>(std::move(script)), std::move(sink), stop);
  pump.Run();

  EXPECT_EQ(pump.exit_reason(), PumpExit::kSourceClosed);
  EXPECT_EQ(recorded->Payloads(), Numbers(50));
  EXPECT_FALSE(stop.IsStopRequested());
}

TEST(StreamPumpTest, StopWinsOverAReadyFrame) {
  core::ShutdownCoordinator stop;
  stop.Shutdown();
  auto sink = std::make_unique<RecordingSink>();
  RecordingSink* recorded = sink.get();

  StreamPump pump(StreamRole::kAudioEgress, {900, 1000},
                  std::make_unique<ScriptedSource>(ScriptedSource::Frames(10)), std::move(sink),
                  stop);
  pump.Run();

  EXPECT_EQ(pump.exit_reason(), PumpExit::kStopped);
  EXPECT_TRUE(recorded->Payloads().empty());
}

TEST(StreamPumpTest, AnotherPumpsErrorStopsThisOneWithoutEscalating) {
  core::ShutdownCoordinator stop;
  StreamPump pump(StreamRole::kVideoIngress, {900, 1000},
                  std::make_unique<ScriptedSource>(std::vector<TakeResult>{},
                                                   TakeResult::WouldBlock()),
                  std::make_unique<RecordingSink>(), stop);
  pump.Start();
  ASSERT_TRUE(WaitUntil([&] { return pump.stats().idle_polls > 0; }, 2000ms));

  stop.NotifyError(false, "audio-egress sink failure");
  pump.Join();
  EXPECT_EQ(pump.exit_reason(), PumpExit::kStopped);
  EXPECT_FALSE(pump.stats().escalated);
  EXPECT_EQ(stop.Snapshot().error_reason, "audio-egress sink failure");
}

TEST(StreamPumpTest, IdleSourceBacksOffBetweenPolls) {
  core::ShutdownCoordinator stop;
  StreamPump pump(StreamRole::kAudioIngress, {900, 1000},
                  std::make_unique<ScriptedSource>(std::vector<TakeResult>{},
                                                   TakeResult::WouldBlock()),
                  std::make_unique<RecordingSink>(), stop);
  pump.Start();
  std::this_thread::sleep_for(100ms);
  stop.Shutdown("test done");
  pump.Join();

  // 5 ms between polls: about 20 in 100 ms, far below a spinning loop.
  const uint64_t polls = pump.stats().idle_polls;
  EXPECT_GT(polls, 0u);
  EXPECT_LT(polls, 200u);
  EXPECT_EQ(pump.exit_reason(), PumpExit::kStopped);
}

TEST(StreamPumpTest, GatedPumpWaitsForTheBarrier) {
  core::ShutdownCoordinator stop;
  auto barrier = std::make_shared<core::StartupBarrier>(2, stop);
  auto sink = std::make_unique<RecordingSink>();
  RecordingSink* recorded = sink.get();

  StreamPump pump(StreamRole::kAudioEgress, {900, 1000},
                  std::make_unique<ScriptedSource>(ScriptedSource::Frames(3)), std::move(sink),
                  stop, barrier);
  pump.Start();

  ASSERT_TRUE(WaitUntil([&] { return barrier->arrived() == 1; }, 2000ms));
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(recorded->puts(), 0u);
  EXPECT_EQ(pump.exit_reason(), PumpExit::kRunning);

  EXPECT_EQ(barrier->Wait(), core::BarrierResult::kReleased);
  pump.Join();
  EXPECT_EQ(recorded->Payloads(), Numbers(3));
}

TEST(StreamPumpTest, StopBeforeReleaseCancelsGatedPump) {
  core::ShutdownCoordinator stop;
  auto barrier = std::make_shared<core::StartupBarrier>(2, stop);
  auto sink = std::make_unique<RecordingSink>();
  RecordingSink* recorded = sink.get();

  StreamPump pump(StreamRole::kVideoEgress, {900, 1000},
                  std::make_unique<ScriptedSource>(ScriptedSource::Frames(3)), std::move(sink),
                  stop, barrier);
  pump.Start();
  ASSERT_TRUE(WaitUntil([&] { return barrier->arrived() == 1; }, 2000ms));

  stop.Shutdown("peer closed");
  pump.Join();
  EXPECT_EQ(pump.exit_reason(), PumpExit::kStopped);
  EXPECT_EQ(recorded->puts(), 0u);
}

TEST(StreamPumpTest, ChannelRoundTripPreservesOrder) {
  core::ShutdownCoordinator stop;
  auto [tx, rx] = core::MakeChannel<core::Frame>(8, stop);
  auto sink = std::make_unique<RecordingSink>();
  RecordingSink* recorded = sink.get();

  StreamPump pump(StreamRole::kInputEgress, {500, 1000},
                  std::make_unique<ChannelSource>(std::move(rx)), std::move(sink), stop);
  pump.Start();
  for (int i = 0; i < 200; ++i) {
    ASSERT_EQ(tx.Send(core::Frame::FromString(std::to_string(i))), core::SendStatus::kOk);
  }
  tx.Close();
  pump.Join();

  EXPECT_EQ(pump.exit_reason(), PumpExit::kSourceClosed);
  EXPECT_EQ(recorded->Payloads(), Numbers(200));
}

}  // namespace
}  // namespace peerlink::pump::testing
