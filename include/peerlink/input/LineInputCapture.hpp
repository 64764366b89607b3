// Repository: PeerLink
// Component: LineInputCapture
// Purpose: Input capture backend reading text events from a file
//          descriptor (stdin on the playback peer).
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_INPUT_LINE_INPUT_CAPTURE_HPP_
#define PEERLINK_INPUT_LINE_INPUT_CAPTURE_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>

#include "peerlink/core/Channel.hpp"
#include "peerlink/core/Frame.hpp"
#include "peerlink/core/ShutdownCoordinator.hpp"

namespace peerlink::input {

// Reads newline-terminated events, polling so that session stop is noticed
// within `poll_interval`. Each valid event is re-encoded and sent (blocking,
// input is never dropped). Invalid lines are logged and skipped; zero mouse
// moves are skipped. A line longer than kMaxLineBytes is rejected as a
// whole; bytes up to its newline are discarded. End of input closes the
// channel.
//
// Does not own `fd`.
class LineInputCapture {
 public:
  static constexpr size_t kMaxLineBytes = 256;

  LineInputCapture(int fd, core::ChannelSender<core::Frame> out, core::ShutdownCoordinator stop,
                   std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
  ~LineInputCapture();

  LineInputCapture(const LineInputCapture&) = delete;
  LineInputCapture& operator=(const LineInputCapture&) = delete;

  void Start();
  void Join();

  uint64_t events_sent() const { return events_sent_.load(std::memory_order_relaxed); }
  uint64_t lines_rejected() const { return lines_rejected_.load(std::memory_order_relaxed); }

 private:
  void Run();
  // False when the channel refused the event (closed or stopped).
  bool HandleLine(const std::string& line);
  void RejectOverlong(size_t length);

  int fd_;
  core::ChannelSender<core::Frame> out_;
  core::ShutdownCoordinator stop_;
  std::chrono::milliseconds poll_interval_;
  std::thread thread_;
  std::atomic<uint64_t> events_sent_{0};
  std::atomic<uint64_t> lines_rejected_{0};
};

}  // namespace peerlink::input

#endif  // PEERLINK_INPUT_LINE_INPUT_CAPTURE_HPP_
