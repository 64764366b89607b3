// Repository: PeerLink
// Component: Frame Ports
// Purpose: Source/sink seams a StreamPump moves frames between.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_PUMP_FRAME_PORTS_HPP_
#define PEERLINK_PUMP_FRAME_PORTS_HPP_

#include <string>
#include <utility>

#include "peerlink/core/Frame.hpp"

namespace peerlink::pump {

enum class TakeStatus {
  kFrame,       // `frame` is valid
  kWouldBlock,  // Nothing ready within the source's poll interval; not an attempt
  kClosed,      // Source exhausted; no more frames will ever arrive
  kError,       // One failed read; counts as one failure
  kStopped,     // Source observed the session stop
};

struct TakeResult {
  TakeStatus status = TakeStatus::kWouldBlock;
  core::Frame frame;
  std::string error;

  static TakeResult Ok(core::Frame f) {
    TakeResult r;
    r.status = TakeStatus::kFrame;
    r.frame = std::move(f);
    return r;
  }
  static TakeResult WouldBlock() { return TakeResult{}; }
  static TakeResult Closed() {
    TakeResult r;
    r.status = TakeStatus::kClosed;
    return r;
  }
  static TakeResult Stopped() {
    TakeResult r;
    r.status = TakeStatus::kStopped;
    return r;
  }
  static TakeResult Error(std::string message) {
    TakeResult r;
    r.status = TakeStatus::kError;
    r.error = std::move(message);
    return r;
  }
};

struct PutResult {
  bool ok = true;
  std::string error;

  static PutResult Ok() { return PutResult{}; }
  static PutResult Fail(std::string message) { return PutResult{false, std::move(message)}; }
};

// Sources may block, but only in a way that returns on session stop (a
// stop-aware channel) or within a bounded poll interval (kWouldBlock).
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;
  virtual TakeResult TryTake() = 0;
};

// A failed put drops the frame; the pump never retries it.
class IFrameSink {
 public:
  virtual ~IFrameSink() = default;
  virtual PutResult TryPut(core::Frame&& frame) = 0;
};

}  // namespace peerlink::pump

#endif  // PEERLINK_PUMP_FRAME_PORTS_HPP_
