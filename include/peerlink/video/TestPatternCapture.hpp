// Repository: PeerLink
// Component: TestPatternCapture
// Purpose: Video capture backend producing a moving luma test pattern,
//          packetized for the video track.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_VIDEO_TEST_PATTERN_CAPTURE_HPP_
#define PEERLINK_VIDEO_TEST_PATTERN_CAPTURE_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "peerlink/config/SessionConfig.hpp"
#include "peerlink/media/PacedCapture.hpp"

namespace peerlink::video {

// 8-bit luma plane: vertical bars scrolling one column per frame.
std::vector<uint8_t> RenderTestPattern(int width, int height, uint32_t frame_index);

// Packets one test pattern picture occupies. `max_packet_bytes` includes the
// packet header.
size_t PacketsPerFrame(const config::MediaConfig& media, size_t max_packet_bytes);

class TestPatternCapture : public media::PacedCapture {
 public:
  TestPatternCapture(const config::MediaConfig& media, size_t max_packet_bytes,
                     core::ChannelSender<core::Frame> out, core::ShutdownCoordinator stop);
  ~TestPatternCapture() override;

  // Packets one picture occupies.
  size_t packets_per_frame() const { return packets_per_frame_; }

 protected:
  bool Produce(std::vector<core::Frame>* out, std::string* error) override;

 private:
  config::MediaConfig media_;
  size_t max_packet_bytes_;
  size_t packets_per_frame_;
  uint32_t frame_index_ = 0;
};

}  // namespace peerlink::video

#endif  // PEERLINK_VIDEO_TEST_PATTERN_CAPTURE_HPP_
