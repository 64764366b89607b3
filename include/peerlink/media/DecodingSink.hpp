// Repository: PeerLink
// Component: DecodingSink
// Purpose: Audio ingress sink: decodes each packet and forwards the PCM to
//          the playback channel.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_MEDIA_DECODING_SINK_HPP_
#define PEERLINK_MEDIA_DECODING_SINK_HPP_

#include <cstdint>
#include <memory>
#include <vector>

#include "peerlink/core/Channel.hpp"
#include "peerlink/media/AudioCodec.hpp"
#include "peerlink/pump/FramePorts.hpp"

namespace peerlink::media {

// A decode failure is one pump failure. Packets that decode to no samples
// (codec delay) succeed without forwarding anything.
class DecodingSink : public pump::IFrameSink {
 public:
  DecodingSink(std::unique_ptr<IAudioDecoder> decoder, core::ChannelSender<core::Frame> pcm_out);

  pump::PutResult TryPut(core::Frame&& frame) override;

 private:
  std::unique_ptr<IAudioDecoder> decoder_;
  core::ChannelSender<core::Frame> pcm_out_;
  std::vector<int16_t> scratch_;
};

}  // namespace peerlink::media

#endif  // PEERLINK_MEDIA_DECODING_SINK_HPP_
