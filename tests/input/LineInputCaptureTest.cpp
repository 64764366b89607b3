// Repository: PeerLink
// Component: LineInputCapture Tests
// Purpose: Line splitting, rejection and end of input over a pipe.
// Copyright (c) 2026 PeerLink

#include "peerlink/input/LineInputCapture.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <vector>

#include "peerlink/core/Channel.hpp"

namespace peerlink::input::testing {
namespace {

using namespace std::chrono_literals;

class LineInputCaptureTest : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_EQ(::pipe(fds_), 0); }

  void TearDown() override {
    CloseWriteEnd();
    if (fds_[0] >= 0) ::close(fds_[0]);
  }

  void Write(const std::string& text) {
    ASSERT_EQ(::write(fds_[1], text.data(), text.size()),
              static_cast<ssize_t>(text.size()));
  }

  void CloseWriteEnd() {
    if (fds_[1] >= 0) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

  // Drains `rx` until the channel closes.
  static std::vector<std::string> Drain(core::ChannelReceiver<core::Frame>& rx) {
    std::vector<std::string> out;
    core::Frame frame;
    while (rx.Receive(frame) == core::ReceiveStatus::kOk) out.push_back(frame.AsString());
    return out;
  }

  int fds_[2] = {-1, -1};
};

TEST_F(LineInputCaptureTest, ForwardsValidLinesAndSkipsTheRest) {
  core::ShutdownCoordinator stop;
  auto [tx, rx] = core::MakeChannel<core::Frame>(16, stop);
  LineInputCapture capture(fds_[0], std::move(tx), stop, 10ms);
  capture.Start();

  Write("kp 65\nnot an event\n\nmm 0 0\nmm 3 -");
  Write("2\nkr 65");
  CloseWriteEnd();

  // The last line has no newline; end of input flushes it.
  EXPECT_EQ(Drain(rx), (std::vector<std::string>{"kp 65", "mm 3 -2", "kr 65"}));
  capture.Join();
  EXPECT_EQ(capture.events_sent(), 3u);
  EXPECT_EQ(capture.lines_rejected(), 1u);
  EXPECT_FALSE(stop.IsStopRequested());
}

TEST_F(LineInputCaptureTest, OverlongLinesAreRejectedWithoutBuffering) {
  core::ShutdownCoordinator stop;
  auto [tx, rx] = core::MakeChannel<core::Frame>(4, stop);
  LineInputCapture capture(fds_[0], std::move(tx), stop, 10ms);
  capture.Start();

  Write(std::string(LineInputCapture::kMaxLineBytes + 44, 'y') + "\n");
  // Far longer than one read, with no newline until the end.
  Write(std::string(8 * LineInputCapture::kMaxLineBytes, 'x'));
  Write("\nkp 1\n");
  CloseWriteEnd();

  EXPECT_EQ(Drain(rx), (std::vector<std::string>{"kp 1"}));
  capture.Join();
  EXPECT_EQ(capture.lines_rejected(), 2u);
  EXPECT_EQ(capture.events_sent(), 1u);
}

TEST_F(LineInputCaptureTest, StopEndsCaptureWithoutInput) {
  core::ShutdownCoordinator stop;
  auto [tx, rx] = core::MakeChannel<core::Frame>(4, stop);
  LineInputCapture capture(fds_[0], std::move(tx), stop, 10ms);
  capture.Start();

  stop.Shutdown();
  capture.Join();
  EXPECT_EQ(capture.events_sent(), 0u);
}

}  // namespace
}  // namespace peerlink::input::testing
