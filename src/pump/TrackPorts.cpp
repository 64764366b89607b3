// Repository: PeerLink
// Component: Track Ports
// Purpose: Adapt transport tracks to the pump's source/sink seams.
// Copyright (c) 2026 PeerLink

#include "peerlink/pump/TrackPorts.hpp"

#include <stdexcept>
#include <utility>

namespace peerlink::pump {

TrackSource::TrackSource(std::shared_ptr<transport::ITrackReader> reader,
                         std::chrono::milliseconds poll_interval)
    : reader_(std::move(reader)), poll_interval_(poll_interval) {
  if (!reader_) {
    throw std::invalid_argument("TrackSource requires a reader");
  }
}

TakeResult TrackSource::TryTake() {
  transport::ReadResult read = reader_->Read(poll_interval_);
  switch (read.status) {
    case transport::ReadStatus::kOk:
      return TakeResult::Ok(std::move(read.frame));
    case transport::ReadStatus::kTimeout:
      return TakeResult::WouldBlock();
    case transport::ReadStatus::kClosed:
      return TakeResult::Closed();
    case transport::ReadStatus::kError:
      break;
  }
  return TakeResult::Error(read.error);
}

TrackSink::TrackSink(std::shared_ptr<transport::ITrackWriter> writer)
    : writer_(std::move(writer)) {
  if (!writer_) {
    throw std::invalid_argument("TrackSink requires a writer");
  }
}

PutResult TrackSink::TryPut(core::Frame&& frame) {
  transport::WriteResult written = writer_->Write(frame);
  if (written.ok) {
    return PutResult::Ok();
  }
  return PutResult::Fail(written.error);
}

}  // namespace peerlink::pump
