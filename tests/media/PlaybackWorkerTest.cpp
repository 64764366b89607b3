// Repository: PeerLink
// Component: PlaybackWorker Tests
// Purpose: Drain to a consumer, end of input, and output failure reporting.
// Copyright (c) 2026 PeerLink

#include "peerlink/media/PlaybackWorker.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "fixtures/TestPorts.hpp"

namespace peerlink::media::testing {
namespace {

using namespace std::chrono_literals;
using peerlink::testing::WaitUntil;

class FailingConsumer : public IFrameConsumer {
 public:
  explicit FailingConsumer(std::atomic<bool>* finished) : finished_(finished) {}

  bool Consume(const core::Frame& /*frame*/, std::string* error) override {
    *error = "device unplugged";
    return false;
  }
  void Finish() override { finished_->store(true); }

 private:
  std::atomic<bool>* finished_;
};

TEST(PlaybackWorkerTest, RequiresAConsumer) {
  core::ShutdownCoordinator stop;
  auto [tx, rx] = core::MakeChannel<core::Frame>(1, stop);
  EXPECT_THROW(PlaybackWorker("audio-playback", std::move(rx), nullptr, stop),
               std::invalid_argument);
}

TEST(PlaybackWorkerTest, ConsumesUntilInputCloses) {
  core::ShutdownCoordinator stop;
  auto [tx, rx] = core::MakeChannel<core::Frame>(8, stop);
  auto consumer = std::make_unique<DiscardConsumer>();
  DiscardConsumer* discard = consumer.get();

  PlaybackWorker worker("audio-playback", std::move(rx), std::move(consumer), stop);
  worker.Start();
  for (int i = 0; i < 5; ++i) {
    ASSERT_EQ(tx.Send(core::Frame::FromString("abcd")), core::SendStatus::kOk);
  }
  tx.Close();
  worker.Join();

  EXPECT_EQ(worker.frames_consumed(), 5u);
  EXPECT_EQ(discard->frames(), 5u);
  EXPECT_EQ(discard->bytes(), 20u);
  EXPECT_FALSE(stop.IsStopRequested());
}

TEST(PlaybackWorkerTest, OutputFailureReportsASessionError) {
  core::ShutdownCoordinator stop;
  auto [tx, rx] = core::MakeChannel<core::Frame>(8, stop);
  std::atomic<bool> finished{false};

  PlaybackWorker worker("video-playback", std::move(rx),
                        std::make_unique<FailingConsumer>(&finished), stop);
  worker.Start();
  ASSERT_EQ(tx.Send(core::Frame::FromString("x")), core::SendStatus::kOk);
  worker.Join();

  EXPECT_TRUE(finished.load());
  const auto snap = stop.Snapshot();
  EXPECT_TRUE(snap.error_flag);
  EXPECT_FALSE(snap.error_is_fatal);
  EXPECT_EQ(snap.error_reason, "video-playback output failure");
  // The worker released its end; producers see the channel closed.
  EXPECT_NE(tx.Send(core::Frame::FromString("y")), core::SendStatus::kOk);
}

TEST(PlaybackWorkerTest, StopEndsAnIdleWorker) {
  core::ShutdownCoordinator stop;
  auto [tx, rx] = core::MakeChannel<core::Frame>(8, stop);
  PlaybackWorker worker("audio-playback", std::move(rx), std::make_unique<DiscardConsumer>(),
                        stop);
  worker.Start();
  ASSERT_TRUE(WaitUntil([&] { return stop.Snapshot().active_task_count == 1; }, 2000ms));
  stop.Shutdown("test done");
  worker.Join();
  EXPECT_EQ(worker.frames_consumed(), 0u);
}

}  // namespace
}  // namespace peerlink::media::testing
