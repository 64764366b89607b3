// Repository: PeerLink
// Component: PlaybackSession
// Purpose: Wires remote tracks to decoders and outputs, stdin to the input
//          channel.
// Copyright (c) 2026 PeerLink

#include "peerlink/session/PlaybackSession.hpp"

#include <algorithm>
#include <utility>

#include "peerlink/core/Channel.hpp"
#include "peerlink/media/DecodingSink.hpp"
#include "peerlink/media/WavFileWriter.hpp"
#include "peerlink/pump/ChannelPorts.hpp"
#include "peerlink/pump/TrackPorts.hpp"
#include "peerlink/time/SystemTimeSource.hpp"
#include "peerlink/util/Logger.hpp"
#include "peerlink/video/TestPatternCapture.hpp"
#include "peerlink/video/VideoPlayback.hpp"

namespace peerlink::session {

using util::Logger;

std::unique_ptr<media::IAudioDecoder> MakeOpusDecoder(const config::MediaConfig& media,
                                                      std::string* error) {
  auto decoder = std::make_unique<media::OpusDecoder>(media);
  if (!decoder->Open(error)) return nullptr;
  return decoder;
}

PlaybackSession::PlaybackSession(config::SessionConfig config, core::ShutdownCoordinator stop,
                                 std::shared_ptr<transport::ITransport> transport,
                                 PlaybackBackends backends)
    : SessionOrchestrator(std::move(config), std::move(stop), std::move(transport)),
      backends_(std::move(backends)) {
  if (!backends_.decoder_factory) backends_.decoder_factory = MakeOpusDecoder;
  if (!backends_.clock) backends_.clock = std::make_shared<time::SystemTimeSource>();
}

PlaybackSession::~PlaybackSession() {
  Teardown();
}

bool PlaybackSession::Setup(std::string* error) {
  const config::MediaConfig& media = config().media;

  decoder_ = backends_.decoder_factory(media, error);
  if (!decoder_) {
    *error = "audio decoder: " + *error;
    return false;
  }

  if (config().audio_output_path.empty()) {
    audio_output_ = std::make_unique<media::DiscardConsumer>();
  } else {
    auto wav = std::make_unique<media::WavFileWriter>(config().audio_output_path, media);
    if (!wav->Open(error)) {
      *error = "audio output: " + *error;
      return false;
    }
    audio_output_ = std::move(wav);
  }

  auto video = std::make_unique<video::VideoPlayback>(config().video_output_path);
  if (!video->Open(error)) {
    *error = "video output: " + *error;
    return false;
  }
  video_output_ = std::move(video);

  if (config().input_enabled) {
    auto [input_tx, input_rx] =
        core::MakeChannel<core::Frame>(config().channel_capacity, stop());
    input_capture_ = std::make_unique<input::LineInputCapture>(backends_.input_fd,
                                                               std::move(input_tx), stop());
    if (!SpawnPump(pump::StreamRole::kInputEgress,
                   std::make_unique<pump::ChannelSource>(std::move(input_rx)),
                   std::make_unique<pump::TrackSink>(
                       transport().Writer(transport::TrackId::kInput)),
                   /*gated=*/true)) {
      *error = "input egress pump did not start";
      return false;
    }
    input_capture_->Start();
  }

  Logger::Info(std::string("[PlaybackSession] SETUP audio_out=") +
               (config().audio_output_path.empty() ? "discard" : config().audio_output_path) +
               " video_out=" +
               (config().video_output_path.empty() ? "discard" : config().video_output_path) +
               " input=" + (config().input_enabled ? "stdin" : "off"));
  return true;
}

void PlaybackSession::OnTrackOpened(pump::StreamRole role) {
  switch (role) {
    case pump::StreamRole::kAudioIngress:
      StartAudioIngress();
      break;
    case pump::StreamRole::kVideoIngress:
      StartVideoIngress();
      break;
    default:
      Logger::Warn(std::string("[PlaybackSession] UNEXPECTED_TRACK role=") +
                   pump::ToString(role));
      break;
  }
}

void PlaybackSession::OnChannelOpened(const std::string& label) {
  if (label == transport::ChannelLabel(transport::TrackId::kLatency)) {
    StartLatencyIngress();
  } else {
    Logger::Debug("[PlaybackSession] IGNORED channel=" + label);
  }
}

void PlaybackSession::StartAudioIngress() {
  if (audio_worker_ || !decoder_ || !audio_output_) return;

  auto [pcm_tx, pcm_rx] = core::MakeChannel<core::Frame>(config().channel_capacity, stop());
  audio_worker_ = std::make_unique<media::PlaybackWorker>("audio-playback", std::move(pcm_rx),
                                                          std::move(audio_output_), stop());
  audio_worker_->Start();
  SpawnPump(pump::StreamRole::kAudioIngress,
            std::make_unique<pump::TrackSource>(transport().Reader(transport::TrackId::kAudio)),
            std::make_unique<media::DecodingSink>(std::move(decoder_), std::move(pcm_tx)),
            /*gated=*/false);
}

void PlaybackSession::StartVideoIngress() {
  if (video_worker_ || !video_output_) return;

  const size_t per_frame = video::PacketsPerFrame(config().media, transport::kMaxPayloadBytes);
  const size_t capacity = std::max(config().channel_capacity, per_frame * 4);
  auto [packet_tx, packet_rx] = core::MakeChannel<core::Frame>(capacity, stop());
  video_worker_ = std::make_unique<media::PlaybackWorker>("video-playback", std::move(packet_rx),
                                                          std::move(video_output_), stop());
  video_worker_->Start();
  SpawnPump(pump::StreamRole::kVideoIngress,
            std::make_unique<pump::TrackSource>(transport().Reader(transport::TrackId::kVideo)),
            std::make_unique<pump::ChannelSink>(std::move(packet_tx)),
            /*gated=*/false);
}

void PlaybackSession::StartLatencyIngress() {
  if (latency_sink_) return;

  auto sink = std::make_unique<latency::LatencySink>(backends_.clock);
  latency::LatencySink* raw = sink.get();
  if (SpawnPump(pump::StreamRole::kLatencyIngress,
                std::make_unique<pump::TrackSource>(
                    transport().Reader(transport::TrackId::kLatency)),
                std::move(sink), /*gated=*/false)) {
    latency_sink_ = raw;
  }
}

void PlaybackSession::Teardown() {
  if (input_capture_) input_capture_->Join();
  if (audio_worker_) audio_worker_->Join();
  if (video_worker_) video_worker_->Join();
}

}  // namespace peerlink::session
