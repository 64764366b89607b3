// Repository: PeerLink
// Component: DecodingSink
// Purpose: Audio ingress sink: decode then forward PCM.
// Copyright (c) 2026 PeerLink

#include "peerlink/media/DecodingSink.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace peerlink::media {

DecodingSink::DecodingSink(std::unique_ptr<IAudioDecoder> decoder,
                           core::ChannelSender<core::Frame> pcm_out)
    : decoder_(std::move(decoder)), pcm_out_(std::move(pcm_out)) {
  if (!decoder_) {
    throw std::invalid_argument("DecodingSink requires a decoder");
  }
}

pump::PutResult DecodingSink::TryPut(core::Frame&& frame) {
  scratch_.clear();
  std::string error;
  if (!decoder_->Decode(frame, &scratch_, &error)) {
    return pump::PutResult::Fail("decode: " + error);
  }
  if (scratch_.empty()) {
    return pump::PutResult::Ok();
  }
  switch (pcm_out_.Send(PackS16(scratch_))) {
    case core::SendStatus::kOk:
      return pump::PutResult::Ok();
    case core::SendStatus::kStopped:
      return pump::PutResult::Fail("stopped");
    case core::SendStatus::kFull:
    case core::SendStatus::kClosed:
      break;
  }
  return pump::PutResult::Fail("audio playback channel closed");
}

}  // namespace peerlink::media
