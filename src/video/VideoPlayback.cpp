// Repository: PeerLink
// Component: VideoPlayback
// Purpose: Reassemble pictures and optionally append them to a raw file.
// Copyright (c) 2026 PeerLink

#include "peerlink/video/VideoPlayback.hpp"

#include <utility>

#include "peerlink/util/Logger.hpp"

namespace peerlink::video {

using util::Logger;

VideoPlayback::VideoPlayback(std::string output_path) : output_path_(std::move(output_path)) {}

bool VideoPlayback::Open(std::string* error) {
  if (output_path_.empty()) return true;
  file_.open(output_path_, std::ios::binary | std::ios::trunc);
  if (!file_.is_open()) {
    *error = "cannot open video output '" + output_path_ + "'";
    return false;
  }
  Logger::Info("[VideoPlayback] OPEN path=" + output_path_);
  return true;
}

bool VideoPlayback::Consume(const core::Frame& packet, std::string* error) {
  std::string packet_error;
  auto picture = assembler_.Push(packet, &packet_error);
  dropped_.store(assembler_.frames_dropped(), std::memory_order_relaxed);
  if (!packet_error.empty()) {
    const auto now = std::chrono::steady_clock::now();
    if (now - last_warn_ >= std::chrono::seconds(1)) {
      Logger::Warn("[VideoPlayback] BAD_PACKET error=" + packet_error);
      last_warn_ = now;
    }
    return true;
  }
  if (!picture) return true;

  completed_.fetch_add(1, std::memory_order_relaxed);
  if (file_.is_open()) {
    file_.write(reinterpret_cast<const char*>(picture->data()),
                static_cast<std::streamsize>(picture->size()));
    if (!file_) {
      *error = "write to '" + output_path_ + "' failed";
      return false;
    }
  }
  return true;
}

void VideoPlayback::Finish() {
  if (file_.is_open()) {
    file_.close();
  }
  Logger::Info("[VideoPlayback] DONE completed=" + std::to_string(completed_.load()) +
               " dropped=" + std::to_string(dropped_.load()) +
               " stale_packets=" + std::to_string(assembler_.stale_packets()));
}

}  // namespace peerlink::video
