// Repository: PeerLink
// Component: ErrorTracker
// Purpose: Windowed circuit breaker that classifies per-attempt faults as
//          transient or fatal for one read/write loop.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_CORE_ERROR_TRACKER_HPP_
#define PEERLINK_CORE_ERROR_TRACKER_HPP_

#include <cstdint>

namespace peerlink::core {

// ErrorTracker counts attempts and failures inside a window of `limit`
// attempts. The window rolls over (both counters reset) whenever `limit`
// attempts elapse without the breaker tripping. The breaker trips on the
// failure that brings the in-window failure count to `threshold`.
//
// Invariants:
//   0 <= errors <= attempts <= limit   (except right before a reset)
//   errors reaches threshold only on a RecordFailure() call that returns true.
//
// Once RecordFailure() has returned true the owner must treat its stream as
// broken; further calls keep returning true and never reset the window.
//
// Thread safety: none. One tracker per pump, used only by the pump thread.
class ErrorTracker {
 public:
  // Throws std::invalid_argument unless 0 < threshold <= limit.
  ErrorTracker(uint32_t threshold, uint32_t limit);

  void RecordSuccess();

  // Returns true when the stream must be considered fatally broken.
  [[nodiscard]] bool RecordFailure();

  uint32_t threshold() const { return threshold_; }
  uint32_t limit() const { return limit_; }
  uint32_t attempts() const { return attempts_; }
  uint32_t errors() const { return errors_; }
  bool tripped() const { return tripped_; }

 private:
  void ResetWindow();

  uint32_t threshold_;
  uint32_t limit_;
  uint32_t attempts_ = 0;
  uint32_t errors_ = 0;
  bool tripped_ = false;
};

}  // namespace peerlink::core

#endif  // PEERLINK_CORE_ERROR_TRACKER_HPP_
