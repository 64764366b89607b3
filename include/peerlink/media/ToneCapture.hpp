// Repository: PeerLink
// Component: ToneCapture
// Purpose: Audio capture backend producing an Opus-encoded test tone.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_MEDIA_TONE_CAPTURE_HPP_
#define PEERLINK_MEDIA_TONE_CAPTURE_HPP_

#include <cstdint>
#include <memory>
#include <vector>

#include "peerlink/config/SessionConfig.hpp"
#include "peerlink/media/AudioCodec.hpp"
#include "peerlink/media/PacedCapture.hpp"

namespace peerlink::media {

// Continuous sine tone, same signal on every channel, phase-continuous
// across calls.
class ToneGenerator {
 public:
  ToneGenerator(double frequency_hz, int sample_rate, int channels, int16_t amplitude = 8000);

  // Interleaved S16, `frames` samples per channel.
  std::vector<int16_t> Next(int frames);

 private:
  double phase_ = 0.0;
  double step_;
  int channels_;
  int16_t amplitude_;
};

// One Opus frame (frame_samples per channel) per tick, paced in real time.
class ToneCapture : public PacedCapture {
 public:
  ToneCapture(const config::MediaConfig& media, std::unique_ptr<IAudioEncoder> encoder,
              core::ChannelSender<core::Frame> out, core::ShutdownCoordinator stop);
  ~ToneCapture() override;

 protected:
  bool Produce(std::vector<core::Frame>* out, std::string* error) override;

 private:
  config::MediaConfig media_;
  ToneGenerator generator_;
  std::unique_ptr<IAudioEncoder> encoder_;
};

}  // namespace peerlink::media

#endif  // PEERLINK_MEDIA_TONE_CAPTURE_HPP_
