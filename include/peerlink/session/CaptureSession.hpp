// Repository: PeerLink
// Component: CaptureSession
// Purpose: Capture peer: tone + test pattern egress, remote input ingress,
//          latency probes.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_SESSION_CAPTURE_SESSION_HPP_
#define PEERLINK_SESSION_CAPTURE_SESSION_HPP_

#include <functional>
#include <memory>
#include <string>

#include "peerlink/input/InputInjector.hpp"
#include "peerlink/latency/Latency.hpp"
#include "peerlink/media/AudioCodec.hpp"
#include "peerlink/media/ToneCapture.hpp"
#include "peerlink/session/SessionOrchestrator.hpp"
#include "peerlink/time/ITimeSource.hpp"
#include "peerlink/video/TestPatternCapture.hpp"

namespace peerlink::session {

using AudioEncoderFactory = std::function<std::unique_ptr<media::IAudioEncoder>(
    const config::MediaConfig& media, std::string* error)>;

// Opens an OpusEncoder; nullptr with *error set when no codec is usable.
std::unique_ptr<media::IAudioEncoder> MakeOpusEncoder(const config::MediaConfig& media,
                                                      std::string* error);

// Replaceable backends. Unset members get the production defaults.
struct CaptureBackends {
  AudioEncoderFactory encoder_factory;
  std::shared_ptr<input::IInputInjector> injector;
  std::shared_ptr<const time::ITimeSource> clock;
};

class CaptureSession : public SessionOrchestrator {
 public:
  CaptureSession(config::SessionConfig config, core::ShutdownCoordinator stop,
                 std::shared_ptr<transport::ITransport> transport,
                 CaptureBackends backends = CaptureBackends());
  ~CaptureSession() override;

  const media::ToneCapture* tone_capture() const { return tone_.get(); }
  const video::TestPatternCapture* pattern_capture() const { return pattern_.get(); }
  const latency::LatencySender* latency_sender() const { return latency_.get(); }

 protected:
  bool Setup(std::string* error) override;
  void OnConnected() override;
  void OnChannelOpened(const std::string& label) override;
  void Teardown() override;

 private:
  CaptureBackends backends_;
  std::unique_ptr<media::ToneCapture> tone_;
  std::unique_ptr<video::TestPatternCapture> pattern_;
  std::unique_ptr<latency::LatencySender> latency_;
  bool input_ingress_started_ = false;
};

}  // namespace peerlink::session

#endif  // PEERLINK_SESSION_CAPTURE_SESSION_HPP_
