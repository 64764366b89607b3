// Repository: PeerLink
// Component: Frame
// Purpose: Opaque unit of media or control data moved between pipeline stages.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_CORE_FRAME_HPP_
#define PEERLINK_CORE_FRAME_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace peerlink::core {

// Frame owns its bytes. It is moved, never shared, from producer to consumer.
struct Frame {
  std::vector<uint8_t> data;

  Frame() = default;
  explicit Frame(std::vector<uint8_t> bytes) : data(std::move(bytes)) {}

  static Frame FromString(const std::string& text) {
    return Frame(std::vector<uint8_t>(text.begin(), text.end()));
  }

  std::string AsString() const { return std::string(data.begin(), data.end()); }

  size_t size() const { return data.size(); }
  bool empty() const { return data.empty(); }
};

}  // namespace peerlink::core

#endif  // PEERLINK_CORE_FRAME_HPP_
