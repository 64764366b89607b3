// Repository: PeerLink
// Component: ErrorTracker
// Purpose: Windowed circuit breaker for pump read/write loops.
// Copyright (c) 2026 PeerLink

#include "peerlink/core/ErrorTracker.hpp"

#include <stdexcept>
#include <string>

namespace peerlink::core {

ErrorTracker::ErrorTracker(uint32_t threshold, uint32_t limit)
    : threshold_(threshold), limit_(limit) {
  if (threshold_ == 0 || threshold_ > limit_) {
    throw std::invalid_argument(
        "ErrorTracker requires 0 < threshold <= limit (threshold=" +
        std::to_string(threshold_) + ", limit=" + std::to_string(limit_) + ")");
  }
}

void ErrorTracker::RecordSuccess() {
  if (tripped_) return;
  ++attempts_;
  if (attempts_ >= limit_) {
    ResetWindow();
  }
}

bool ErrorTracker::RecordFailure() {
  if (tripped_) return true;
  ++errors_;
  ++attempts_;
  if (errors_ >= threshold_) {
    tripped_ = true;
    return true;
  }
  if (attempts_ >= limit_) {
    ResetWindow();
  }
  return false;
}

void ErrorTracker::ResetWindow() {
  attempts_ = 0;
  errors_ = 0;
}

}  // namespace peerlink::core
