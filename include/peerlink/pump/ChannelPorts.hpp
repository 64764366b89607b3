// Repository: PeerLink
// Component: Channel Ports
// Purpose: Adapt channel ends to the pump's source/sink seams.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_PUMP_CHANNEL_PORTS_HPP_
#define PEERLINK_PUMP_CHANNEL_PORTS_HPP_

#include "peerlink/core/Channel.hpp"
#include "peerlink/core/Frame.hpp"
#include "peerlink/pump/FramePorts.hpp"

namespace peerlink::pump {

// Drains the receiving end of a capture backend's channel. Owns the receiver.
class ChannelSource : public IFrameSource {
 public:
  explicit ChannelSource(core::ChannelReceiver<core::Frame> receiver);

  TakeResult TryTake() override;

 private:
  core::ChannelReceiver<core::Frame> receiver_;
};

// Feeds a playback backend's channel. Blocks while the channel is full.
class ChannelSink : public IFrameSink {
 public:
  explicit ChannelSink(core::ChannelSender<core::Frame> sender);

  PutResult TryPut(core::Frame&& frame) override;

 private:
  core::ChannelSender<core::Frame> sender_;
};

}  // namespace peerlink::pump

#endif  // PEERLINK_PUMP_CHANNEL_PORTS_HPP_
