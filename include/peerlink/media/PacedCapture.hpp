// Repository: PeerLink
// Component: PacedCapture
// Purpose: Real-time paced capture thread feeding a frame channel.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_MEDIA_PACED_CAPTURE_HPP_
#define PEERLINK_MEDIA_PACED_CAPTURE_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "peerlink/core/Channel.hpp"
#include "peerlink/core/Frame.hpp"
#include "peerlink/core/ShutdownCoordinator.hpp"

namespace peerlink::media {

// PacedCapture runs Produce() once per `period` on its own thread and pushes
// whatever it yields into the pump's source channel without blocking. A full
// channel drops the frame (stale media is worthless). A Produce() failure is
// logged and the tick skipped; it never stops the thread. The thread exits
// on session stop or when the channel's receiver is gone, closing the
// channel behind it.
//
// Derived classes must call Join() in their destructor so the thread never
// calls Produce() on a partly destroyed object.
class PacedCapture {
 public:
  PacedCapture(std::string name, std::chrono::microseconds period,
               core::ChannelSender<core::Frame> out, core::ShutdownCoordinator stop);
  virtual ~PacedCapture();

  PacedCapture(const PacedCapture&) = delete;
  PacedCapture& operator=(const PacedCapture&) = delete;

  void Start();
  void Join();

  uint64_t frames_sent() const { return frames_sent_.load(std::memory_order_relaxed); }
  uint64_t frames_dropped() const { return frames_dropped_.load(std::memory_order_relaxed); }
  uint64_t produce_failures() const { return produce_failures_.load(std::memory_order_relaxed); }

 protected:
  // One tick of capture. Appends zero or more frames to *out.
  virtual bool Produce(std::vector<core::Frame>* out, std::string* error) = 0;

  const std::string& name() const { return name_; }

 private:
  void Run();

  const std::string name_;
  const std::chrono::microseconds period_;
  core::ChannelSender<core::Frame> out_;
  core::ShutdownCoordinator stop_;
  std::thread thread_;

  std::atomic<uint64_t> frames_sent_{0};
  std::atomic<uint64_t> frames_dropped_{0};
  std::atomic<uint64_t> produce_failures_{0};
};

}  // namespace peerlink::media

#endif  // PEERLINK_MEDIA_PACED_CAPTURE_HPP_
