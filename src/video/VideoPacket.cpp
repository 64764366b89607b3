// Repository: PeerLink
// Component: VideoPacket
// Purpose: Split pictures into transport-sized packets and reassemble them.
// Copyright (c) 2026 PeerLink

#include "peerlink/video/VideoPacket.hpp"

#include <algorithm>
#include <stdexcept>

namespace peerlink::video {

namespace {

// Serial-number comparison so frame ids may wrap.
bool IsNewer(uint32_t a, uint32_t b) {
  return a != b && static_cast<int32_t>(a - b) > 0;
}

void PutU32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v >> 24));
  out.push_back(static_cast<uint8_t>(v >> 16));
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v));
}

void PutU16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v));
}

}  // namespace

std::vector<core::Frame> Packetize(uint32_t frame_id, const std::vector<uint8_t>& picture,
                                   size_t max_packet_bytes) {
  if (max_packet_bytes <= kPacketHeaderBytes) {
    throw std::invalid_argument("video packet size leaves no room for payload");
  }
  const size_t chunk = max_packet_bytes - kPacketHeaderBytes;
  const size_t count = picture.empty() ? 1 : (picture.size() + chunk - 1) / chunk;
  if (count > 0xFFFF) {
    throw std::invalid_argument("picture needs more than 65535 packets");
  }

  std::vector<core::Frame> packets;
  packets.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    const size_t begin = i * chunk;
    const size_t end = std::min(picture.size(), begin + chunk);
    std::vector<uint8_t> bytes;
    bytes.reserve(kPacketHeaderBytes + (end - begin));
    PutU32(bytes, frame_id);
    PutU16(bytes, static_cast<uint16_t>(i));
    PutU16(bytes, static_cast<uint16_t>(count));
    bytes.insert(bytes.end(), picture.begin() + begin, picture.begin() + end);
    packets.emplace_back(std::move(bytes));
  }
  return packets;
}

std::optional<PacketHeader> ParseHeader(const core::Frame& packet, std::string* error) {
  if (packet.size() < kPacketHeaderBytes) {
    *error = "video packet shorter than header (" + std::to_string(packet.size()) + " bytes)";
    return std::nullopt;
  }
  const auto& d = packet.data;
  PacketHeader h;
  h.frame_id = (static_cast<uint32_t>(d[0]) << 24) | (static_cast<uint32_t>(d[1]) << 16) |
               (static_cast<uint32_t>(d[2]) << 8) | static_cast<uint32_t>(d[3]);
  h.index = static_cast<uint16_t>((d[4] << 8) | d[5]);
  h.count = static_cast<uint16_t>((d[6] << 8) | d[7]);
  if (h.count == 0 || h.index >= h.count) {
    *error = "video packet index " + std::to_string(h.index) + " outside count " +
             std::to_string(h.count);
    return std::nullopt;
  }
  return h;
}

void FrameAssembler::Reset(const PacketHeader& header) {
  active_ = true;
  frame_id_ = header.frame_id;
  count_ = header.count;
  received_ = 0;
  parts_.assign(header.count, std::vector<uint8_t>());
  have_.assign(header.count, false);
}

std::optional<std::vector<uint8_t>> FrameAssembler::Push(const core::Frame& packet,
                                                         std::string* error) {
  const auto header = ParseHeader(packet, error);
  if (!header) return std::nullopt;

  if (last_completed_ && !IsNewer(header->frame_id, *last_completed_)) {
    ++stale_packets_;
    return std::nullopt;
  }
  if (!active_) {
    Reset(*header);
  } else if (header->frame_id != frame_id_) {
    if (!IsNewer(header->frame_id, frame_id_)) {
      ++stale_packets_;
      return std::nullopt;
    }
    ++frames_dropped_;
    Reset(*header);
  } else if (header->count != count_) {
    *error = "video packet count changed within frame " + std::to_string(frame_id_);
    return std::nullopt;
  }

  if (have_[header->index]) {
    return std::nullopt;  // Duplicate
  }
  have_[header->index] = true;
  parts_[header->index].assign(packet.data.begin() + kPacketHeaderBytes, packet.data.end());
  ++received_;
  if (received_ < count_) {
    return std::nullopt;
  }

  std::vector<uint8_t> picture;
  for (auto& part : parts_) {
    picture.insert(picture.end(), part.begin(), part.end());
  }
  last_completed_ = frame_id_;
  active_ = false;
  parts_.clear();
  have_.clear();
  ++frames_completed_;
  return picture;
}

}  // namespace peerlink::video
