// Repository: PeerLink
// Component: SessionConfig
// Purpose: Configuration for one capture or playback session and the
//          command-line parser that fills it.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_CONFIG_SESSION_CONFIG_HPP_
#define PEERLINK_CONFIG_SESSION_CONFIG_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "peerlink/config/PumpTuning.hpp"

namespace peerlink::config {

enum class PeerRole {
  kCapture,   // Sends audio/video, receives input
  kPlayback,  // Receives audio/video, sends input
};

const char* ToString(PeerRole role);

struct MediaConfig {
  // Audio: Opus at 48 kHz stereo, 20 ms frames.
  int sample_rate = 48000;
  int channels = 2;
  int frame_samples = 960;
  int opus_bitrate = 64000;
  double tone_hz = 440.0;

  // Video test pattern.
  int video_width = 320;
  int video_height = 180;
  int video_fps = 30;
};

struct SessionConfig {
  PeerRole role = PeerRole::kCapture;

  // Transport endpoints. Empty peer_host: wait for the peer to say HELLO.
  std::string bind_host = "0.0.0.0";
  uint16_t bind_port = 0;
  std::string peer_host;
  uint16_t peer_port = 0;
  std::chrono::milliseconds peer_timeout{10000};
  std::chrono::milliseconds connect_timeout{0};

  // Depth of every frame channel between a backend and its pump.
  size_t channel_capacity = 64;
  size_t event_capacity = 64;

  PumpTuningTable tuning;

  // Parties on the startup barrier: gated egress pumps + the control plane.
  size_t barrier_parties = 0;

  // "host:port" for the SessionControl gRPC service; empty disables it.
  std::string control_address;

  MediaConfig media;

  // Playback outputs; empty discards.
  std::string audio_output_path;
  std::string video_output_path;

  // Playback reads input events from stdin when enabled.
  bool input_enabled = true;

  std::chrono::milliseconds latency_interval{1000};
};

// Barrier parties a session of `role` requires with `config`'s stream set.
size_t RequiredBarrierParties(const SessionConfig& config);

struct CliArgs {
  SessionConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

// Parses argv-style arguments (program name excluded).
CliArgs ParseSessionArgs(PeerRole role, const std::vector<std::string>& args);

std::string UsageText(PeerRole role, const std::string& program_name);

// Splits "host:port". Returns false on a missing or out-of-range port.
bool ParseHostPort(const std::string& text, std::string* host, uint16_t* port);

}  // namespace peerlink::config

#endif  // PEERLINK_CONFIG_SESSION_CONFIG_HPP_
