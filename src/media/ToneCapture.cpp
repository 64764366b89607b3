// Repository: PeerLink
// Component: ToneCapture
// Purpose: Audio capture backend producing an Opus-encoded test tone.
// Copyright (c) 2026 PeerLink

#include "peerlink/media/ToneCapture.hpp"

#include <cmath>
#include <utility>

namespace peerlink::media {

namespace {

constexpr double kTwoPi = 6.283185307179586;

std::chrono::microseconds FramePeriod(const config::MediaConfig& media) {
  return std::chrono::microseconds(static_cast<int64_t>(media.frame_samples) * 1000000 /
                                   media.sample_rate);
}

}  // namespace

ToneGenerator::ToneGenerator(double frequency_hz, int sample_rate, int channels,
                             int16_t amplitude)
    : step_(kTwoPi * frequency_hz / sample_rate), channels_(channels), amplitude_(amplitude) {}

std::vector<int16_t> ToneGenerator::Next(int frames) {
  std::vector<int16_t> samples(static_cast<size_t>(frames) * channels_);
  for (int i = 0; i < frames; ++i) {
    const auto value = static_cast<int16_t>(amplitude_ * std::sin(phase_));
    for (int c = 0; c < channels_; ++c) {
      samples[static_cast<size_t>(i) * channels_ + c] = value;
    }
    phase_ += step_;
    if (phase_ >= kTwoPi) phase_ -= kTwoPi;
  }
  return samples;
}

ToneCapture::ToneCapture(const config::MediaConfig& media,
                         std::unique_ptr<IAudioEncoder> encoder,
                         core::ChannelSender<core::Frame> out, core::ShutdownCoordinator stop)
    : PacedCapture("audio-capture", FramePeriod(media), std::move(out), std::move(stop)),
      media_(media),
      generator_(media.tone_hz, media.sample_rate, media.channels),
      encoder_(std::move(encoder)) {}

ToneCapture::~ToneCapture() {
  Join();
}

bool ToneCapture::Produce(std::vector<core::Frame>* out, std::string* error) {
  return encoder_->Encode(generator_.Next(media_.frame_samples), out, error);
}

}  // namespace peerlink::media
