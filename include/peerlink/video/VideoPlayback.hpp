// Repository: PeerLink
// Component: VideoPlayback
// Purpose: Video playback output: reassembles pictures and optionally
//          appends them to a raw file.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_VIDEO_VIDEO_PLAYBACK_HPP_
#define PEERLINK_VIDEO_VIDEO_PLAYBACK_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <string>

#include "peerlink/media/PlaybackWorker.hpp"
#include "peerlink/video/VideoPacket.hpp"

namespace peerlink::video {

// Malformed packets are logged and skipped; only a file write failure is an
// output failure.
class VideoPlayback : public media::IFrameConsumer {
 public:
  // Empty path: reassemble and count only.
  explicit VideoPlayback(std::string output_path = std::string());

  bool Open(std::string* error);

  bool Consume(const core::Frame& packet, std::string* error) override;
  void Finish() override;

  uint64_t frames_completed() const { return completed_.load(std::memory_order_relaxed); }
  uint64_t frames_dropped() const { return dropped_.load(std::memory_order_relaxed); }

 private:
  std::string output_path_;
  std::ofstream file_;
  FrameAssembler assembler_;
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> dropped_{0};
  std::chrono::steady_clock::time_point last_warn_{};
};

}  // namespace peerlink::video

#endif  // PEERLINK_VIDEO_VIDEO_PLAYBACK_HPP_
