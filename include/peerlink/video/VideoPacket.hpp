// Repository: PeerLink
// Component: VideoPacket
// Purpose: Split pictures into transport-sized packets and reassemble them.
// Copyright (c) 2026 PeerLink
//
// Packet layout (big-endian header, 8 bytes):
//   [frame_id : u32][index : u16][count : u16][payload ...]
// index < count; every packet of a frame carries the same frame_id/count.

#ifndef PEERLINK_VIDEO_VIDEO_PACKET_HPP_
#define PEERLINK_VIDEO_VIDEO_PACKET_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "peerlink/core/Frame.hpp"

namespace peerlink::video {

inline constexpr size_t kPacketHeaderBytes = 8;

struct PacketHeader {
  uint32_t frame_id = 0;
  uint16_t index = 0;
  uint16_t count = 0;
};

// Throws std::invalid_argument when max_packet_bytes leaves no room for
// payload or the picture needs more than 65535 packets.
std::vector<core::Frame> Packetize(uint32_t frame_id, const std::vector<uint8_t>& picture,
                                   size_t max_packet_bytes);

// Returns nullopt (with *error set) for a short or inconsistent header.
std::optional<PacketHeader> ParseHeader(const core::Frame& packet, std::string* error);

// FrameAssembler rebuilds pictures from packets arriving in any order.
// Only one frame is in flight: a packet of a newer frame discards the
// incomplete current one. Packets of older frames are ignored.
class FrameAssembler {
 public:
  // Returns the picture when `packet` completes it. Returns nullopt otherwise;
  // *error is set only when the packet is malformed.
  std::optional<std::vector<uint8_t>> Push(const core::Frame& packet, std::string* error);

  uint64_t frames_completed() const { return frames_completed_; }
  uint64_t frames_dropped() const { return frames_dropped_; }
  uint64_t stale_packets() const { return stale_packets_; }

 private:
  void Reset(const PacketHeader& header);

  bool active_ = false;
  uint32_t frame_id_ = 0;
  uint16_t count_ = 0;
  uint16_t received_ = 0;
  std::vector<std::vector<uint8_t>> parts_;
  std::vector<bool> have_;
  std::optional<uint32_t> last_completed_;

  uint64_t frames_completed_ = 0;
  uint64_t frames_dropped_ = 0;
  uint64_t stale_packets_ = 0;
};

}  // namespace peerlink::video

#endif  // PEERLINK_VIDEO_VIDEO_PACKET_HPP_
