// Repository: PeerLink
// Component: PlaybackSession
// Purpose: Playback peer: audio/video/latency ingress as the remote tracks
//          appear, stdin input events as gated egress.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_SESSION_PLAYBACK_SESSION_HPP_
#define PEERLINK_SESSION_PLAYBACK_SESSION_HPP_

#include <functional>
#include <memory>
#include <string>

#include "peerlink/input/LineInputCapture.hpp"
#include "peerlink/latency/Latency.hpp"
#include "peerlink/media/AudioCodec.hpp"
#include "peerlink/media/PlaybackWorker.hpp"
#include "peerlink/session/SessionOrchestrator.hpp"
#include "peerlink/time/ITimeSource.hpp"

namespace peerlink::session {

using AudioDecoderFactory = std::function<std::unique_ptr<media::IAudioDecoder>(
    const config::MediaConfig& media, std::string* error)>;

std::unique_ptr<media::IAudioDecoder> MakeOpusDecoder(const config::MediaConfig& media,
                                                      std::string* error);

struct PlaybackBackends {
  AudioDecoderFactory decoder_factory;            // Default: MakeOpusDecoder
  int input_fd = 0;                               // Line-oriented input events
  std::shared_ptr<const time::ITimeSource> clock; // Default: SystemTimeSource
};

class PlaybackSession : public SessionOrchestrator {
 public:
  PlaybackSession(config::SessionConfig config, core::ShutdownCoordinator stop,
                  std::shared_ptr<transport::ITransport> transport,
                  PlaybackBackends backends = PlaybackBackends());
  ~PlaybackSession() override;

  // Null until the corresponding stream opened.
  const media::PlaybackWorker* audio_worker() const { return audio_worker_.get(); }
  const media::PlaybackWorker* video_worker() const { return video_worker_.get(); }
  const latency::LatencySink* latency_sink() const { return latency_sink_; }
  const input::LineInputCapture* input_capture() const { return input_capture_.get(); }

 protected:
  bool Setup(std::string* error) override;
  void OnTrackOpened(pump::StreamRole role) override;
  void OnChannelOpened(const std::string& label) override;
  void Teardown() override;

 private:
  void StartAudioIngress();
  void StartVideoIngress();
  void StartLatencyIngress();

  PlaybackBackends backends_;

  // Opened in Setup() so a bad output path fails before connecting; handed
  // to the worker when the stream opens.
  std::unique_ptr<media::IAudioDecoder> decoder_;
  std::unique_ptr<media::IFrameConsumer> audio_output_;
  std::unique_ptr<media::IFrameConsumer> video_output_;

  std::unique_ptr<input::LineInputCapture> input_capture_;
  std::unique_ptr<media::PlaybackWorker> audio_worker_;
  std::unique_ptr<media::PlaybackWorker> video_worker_;
  latency::LatencySink* latency_sink_ = nullptr;  // Owned by its pump
};

}  // namespace peerlink::session

#endif  // PEERLINK_SESSION_PLAYBACK_SESSION_HPP_
