// Repository: PeerLink
// Component: Track Ports
// Purpose: Adapt transport tracks to the pump's source/sink seams.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_PUMP_TRACK_PORTS_HPP_
#define PEERLINK_PUMP_TRACK_PORTS_HPP_

#include <chrono>
#include <memory>

#include "peerlink/pump/FramePorts.hpp"
#include "peerlink/transport/ITransport.hpp"

namespace peerlink::pump {

// Ingress source. Each TryTake() waits at most `poll_interval` so the pump
// re-checks the stop flags between reads.
class TrackSource : public IFrameSource {
 public:
  explicit TrackSource(std::shared_ptr<transport::ITrackReader> reader,
                       std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

  TakeResult TryTake() override;

 private:
  std::shared_ptr<transport::ITrackReader> reader_;
  std::chrono::milliseconds poll_interval_;
};

// Egress sink.
class TrackSink : public IFrameSink {
 public:
  explicit TrackSink(std::shared_ptr<transport::ITrackWriter> writer);

  PutResult TryPut(core::Frame&& frame) override;

 private:
  std::shared_ptr<transport::ITrackWriter> writer_;
};

}  // namespace peerlink::pump

#endif  // PEERLINK_PUMP_TRACK_PORTS_HPP_
