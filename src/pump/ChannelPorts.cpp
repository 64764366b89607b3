// Repository: PeerLink
// Component: Channel Ports
// Purpose: Adapt channel ends to the pump's source/sink seams.
// Copyright (c) 2026 PeerLink

#include "peerlink/pump/ChannelPorts.hpp"

#include <utility>

namespace peerlink::pump {

ChannelSource::ChannelSource(core::ChannelReceiver<core::Frame> receiver)
    : receiver_(std::move(receiver)) {}

TakeResult ChannelSource::TryTake() {
  core::Frame frame;
  switch (receiver_.Receive(frame)) {
    case core::ReceiveStatus::kOk:
      return TakeResult::Ok(std::move(frame));
    case core::ReceiveStatus::kStopped:
      return TakeResult::Stopped();
    case core::ReceiveStatus::kEmpty:
      return TakeResult::WouldBlock();
    case core::ReceiveStatus::kClosed:
      break;
  }
  return TakeResult::Closed();
}

ChannelSink::ChannelSink(core::ChannelSender<core::Frame> sender)
    : sender_(std::move(sender)) {}

PutResult ChannelSink::TryPut(core::Frame&& frame) {
  switch (sender_.Send(std::move(frame))) {
    case core::SendStatus::kOk:
      return PutResult::Ok();
    case core::SendStatus::kStopped:
      return PutResult::Fail("stopped");
    case core::SendStatus::kFull:
      return PutResult::Fail("channel full");
    case core::SendStatus::kClosed:
      break;
  }
  return PutResult::Fail("playback channel closed");
}

}  // namespace peerlink::pump
