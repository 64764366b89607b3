// Repository: PeerLink
// Component: CaptureSession
// Purpose: Wires the capture backends to gated egress pumps and the input
//          channel to the injector.
// Copyright (c) 2026 PeerLink

#include "peerlink/session/CaptureSession.hpp"

#include <algorithm>
#include <utility>

#include "peerlink/core/Channel.hpp"
#include "peerlink/pump/ChannelPorts.hpp"
#include "peerlink/pump/TrackPorts.hpp"
#include "peerlink/time/SystemTimeSource.hpp"
#include "peerlink/util/Logger.hpp"

namespace peerlink::session {

using util::Logger;

std::unique_ptr<media::IAudioEncoder> MakeOpusEncoder(const config::MediaConfig& media,
                                                      std::string* error) {
  auto encoder = std::make_unique<media::OpusEncoder>(media);
  if (!encoder->Open(error)) return nullptr;
  return encoder;
}

CaptureSession::CaptureSession(config::SessionConfig config, core::ShutdownCoordinator stop,
                               std::shared_ptr<transport::ITransport> transport,
                               CaptureBackends backends)
    : SessionOrchestrator(std::move(config), std::move(stop), std::move(transport)),
      backends_(std::move(backends)) {
  if (!backends_.encoder_factory) backends_.encoder_factory = MakeOpusEncoder;
  if (!backends_.injector) backends_.injector = std::make_shared<input::LoggingInputInjector>();
  if (!backends_.clock) backends_.clock = std::make_shared<time::SystemTimeSource>();
}

CaptureSession::~CaptureSession() {
  Teardown();
}

bool CaptureSession::Setup(std::string* error) {
  const config::MediaConfig& media = config().media;

  // Audio: tone -> Opus -> channel -> pump -> audio track.
  auto encoder = backends_.encoder_factory(media, error);
  if (!encoder) {
    *error = "audio encoder: " + *error;
    return false;
  }
  auto [audio_tx, audio_rx] = core::MakeChannel<core::Frame>(config().channel_capacity, stop());
  tone_ = std::make_unique<media::ToneCapture>(media, std::move(encoder), std::move(audio_tx),
                                               stop());
  if (!SpawnPump(pump::StreamRole::kAudioEgress,
                 std::make_unique<pump::ChannelSource>(std::move(audio_rx)),
                 std::make_unique<pump::TrackSink>(transport().Writer(transport::TrackId::kAudio)),
                 /*gated=*/true)) {
    *error = "audio egress pump did not start";
    return false;
  }

  // Video: one picture spans many packets, so the channel holds a few
  // pictures' worth regardless of the configured depth.
  const size_t per_frame = video::PacketsPerFrame(media, transport::kMaxPayloadBytes);
  const size_t video_capacity = std::max(config().channel_capacity, per_frame * 4);
  auto [video_tx, video_rx] = core::MakeChannel<core::Frame>(video_capacity, stop());
  pattern_ = std::make_unique<video::TestPatternCapture>(media, transport::kMaxPayloadBytes,
                                                         std::move(video_tx), stop());
  if (!SpawnPump(pump::StreamRole::kVideoEgress,
                 std::make_unique<pump::ChannelSource>(std::move(video_rx)),
                 std::make_unique<pump::TrackSink>(transport().Writer(transport::TrackId::kVideo)),
                 /*gated=*/true)) {
    *error = "video egress pump did not start";
    return false;
  }

  tone_->Start();
  pattern_->Start();
  Logger::Info("[CaptureSession] SETUP tone_hz=" + std::to_string(media.tone_hz) +
               " video=" + std::to_string(media.video_width) + "x" +
               std::to_string(media.video_height) + "@" + std::to_string(media.video_fps) +
               " packets_per_frame=" + std::to_string(per_frame));
  return true;
}

void CaptureSession::OnConnected() {
  if (latency_) return;
  latency_ = std::make_unique<latency::LatencySender>(
      transport().Writer(transport::TrackId::kLatency), backends_.clock,
      config().latency_interval, stop());
  latency_->Start();
}

void CaptureSession::OnChannelOpened(const std::string& label) {
  if (label != transport::ChannelLabel(transport::TrackId::kInput)) {
    Logger::Debug("[CaptureSession] IGNORED channel=" + label);
    return;
  }
  if (input_ingress_started_) return;
  input_ingress_started_ = true;
  SpawnPump(pump::StreamRole::kInputIngress,
            std::make_unique<pump::TrackSource>(transport().Reader(transport::TrackId::kInput)),
            std::make_unique<input::InjectingSink>(backends_.injector),
            /*gated=*/false);
}

void CaptureSession::Teardown() {
  if (tone_) tone_->Join();
  if (pattern_) pattern_->Join();
  if (latency_) latency_->Join();
}

}  // namespace peerlink::session
