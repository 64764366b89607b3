// Repository: PeerLink
// Component: TestPatternCapture
// Purpose: Video capture backend producing a moving luma test pattern.
// Copyright (c) 2026 PeerLink

#include "peerlink/video/TestPatternCapture.hpp"

#include <utility>

#include "peerlink/video/VideoPacket.hpp"

namespace peerlink::video {

namespace {

constexpr int kBarWidth = 16;

}  // namespace

std::vector<uint8_t> RenderTestPattern(int width, int height, uint32_t frame_index) {
  std::vector<uint8_t> luma(static_cast<size_t>(width) * height);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      const uint32_t column = static_cast<uint32_t>(x) + frame_index;
      const bool bright = (column / kBarWidth) % 2 == 0;
      luma[static_cast<size_t>(y) * width + x] = bright ? 235 : 16;
    }
  }
  return luma;
}

size_t PacketsPerFrame(const config::MediaConfig& media, size_t max_packet_bytes) {
  const size_t picture = static_cast<size_t>(media.video_width) * media.video_height;
  const size_t chunk = max_packet_bytes - kPacketHeaderBytes;
  return (picture + chunk - 1) / chunk;
}

TestPatternCapture::TestPatternCapture(const config::MediaConfig& media,
                                       size_t max_packet_bytes,
                                       core::ChannelSender<core::Frame> out,
                                       core::ShutdownCoordinator stop)
    : media::PacedCapture("video-capture",
                          std::chrono::microseconds(1000000 / media.video_fps),
                          std::move(out), std::move(stop)),
      media_(media),
      max_packet_bytes_(max_packet_bytes),
      packets_per_frame_(PacketsPerFrame(media, max_packet_bytes)) {}

TestPatternCapture::~TestPatternCapture() {
  Join();
}

bool TestPatternCapture::Produce(std::vector<core::Frame>* out, std::string* /*error*/) {
  auto packets = Packetize(frame_index_,
                           RenderTestPattern(media_.video_width, media_.video_height,
                                             frame_index_),
                           max_packet_bytes_);
  ++frame_index_;
  for (auto& packet : packets) {
    out->push_back(std::move(packet));
  }
  return true;
}

}  // namespace peerlink::video
