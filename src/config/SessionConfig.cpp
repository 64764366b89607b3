// Repository: PeerLink
// Component: SessionConfig
// Purpose: Command-line parsing and validation for session executables.
// Copyright (c) 2026 PeerLink

#include "peerlink/config/SessionConfig.hpp"

#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace peerlink::config {

namespace {

bool ParseUnsigned(const std::string& text, uint64_t max, uint64_t* out) {
  if (text.empty() || text[0] == '-' || text[0] == '+') return false;
  char* end = nullptr;
  errno = 0;
  const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || value > max) return false;
  *out = value;
  return true;
}

bool ParsePositiveInt(const std::string& text, int* out) {
  uint64_t value = 0;
  if (!ParseUnsigned(text, 1000000000ULL, &value) || value == 0) return false;
  *out = static_cast<int>(value);
  return true;
}

bool ParseMillis(const std::string& text, std::chrono::milliseconds* out) {
  uint64_t value = 0;
  if (!ParseUnsigned(text, 86400000ULL, &value)) return false;
  *out = std::chrono::milliseconds(value);
  return true;
}

}  // namespace

const char* ToString(PeerRole role) {
  return role == PeerRole::kCapture ? "capture" : "playback";
}

size_t RequiredBarrierParties(const SessionConfig& config) {
  // Control plane always takes part.
  size_t parties = 1;
  if (config.role == PeerRole::kCapture) {
    parties += 2;  // audio + video egress
  } else if (config.input_enabled) {
    parties += 1;  // input egress
  }
  return parties;
}

bool ParseHostPort(const std::string& text, std::string* host, uint16_t* port) {
  const auto colon = text.rfind(':');
  if (colon == std::string::npos) return false;
  uint64_t value = 0;
  if (!ParseUnsigned(text.substr(colon + 1), 65535, &value)) return false;
  *host = text.substr(0, colon);
  if (host->empty()) *host = "0.0.0.0";
  *port = static_cast<uint16_t>(value);
  return true;
}

CliArgs ParseSessionArgs(PeerRole role, const std::vector<std::string>& args) {
  CliArgs out;
  SessionConfig& cfg = out.config;
  cfg.role = role;
  bool parties_given = false;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    const bool has_value = i + 1 < args.size();

    if (arg == "--help" || arg == "-h") {
      out.help = true;
      out.valid = true;
      return out;
    } else if (arg == "--bind" && has_value) {
      if (!ParseHostPort(args[++i], &cfg.bind_host, &cfg.bind_port)) {
        out.error = "--bind expects HOST:PORT, got '" + args[i] + "'";
        return out;
      }
    } else if (arg == "--peer" && has_value) {
      if (!ParseHostPort(args[++i], &cfg.peer_host, &cfg.peer_port) || cfg.peer_port == 0) {
        out.error = "--peer expects HOST:PORT with a non-zero port, got '" + args[i] + "'";
        return out;
      }
    } else if (arg == "--control-address" && has_value) {
      cfg.control_address = args[++i];
    } else if (arg == "--channel-capacity" && has_value) {
      uint64_t value = 0;
      if (!ParseUnsigned(args[++i], 1u << 20, &value) || value == 0) {
        out.error = "--channel-capacity must be a positive integer";
        return out;
      }
      cfg.channel_capacity = static_cast<size_t>(value);
    } else if (arg == "--barrier-parties" && has_value) {
      uint64_t value = 0;
      if (!ParseUnsigned(args[++i], 64, &value) || value == 0) {
        out.error = "--barrier-parties must be a positive integer";
        return out;
      }
      cfg.barrier_parties = static_cast<size_t>(value);
      parties_given = true;
    } else if (arg == "--tune" && has_value) {
      std::string error;
      if (!cfg.tuning.ApplyOverride(args[++i], &error)) {
        out.error = "--tune: " + error;
        return out;
      }
    } else if (arg == "--latency-interval-ms" && has_value) {
      if (!ParseMillis(args[++i], &cfg.latency_interval) ||
          cfg.latency_interval.count() == 0) {
        out.error = "--latency-interval-ms must be a positive integer";
        return out;
      }
    } else if (arg == "--peer-timeout-ms" && has_value) {
      if (!ParseMillis(args[++i], &cfg.peer_timeout) || cfg.peer_timeout.count() == 0) {
        out.error = "--peer-timeout-ms must be a positive integer";
        return out;
      }
    } else if (arg == "--connect-timeout-ms" && has_value) {
      if (!ParseMillis(args[++i], &cfg.connect_timeout)) {
        out.error = "--connect-timeout-ms must be a non-negative integer";
        return out;
      }
    } else if (arg == "--bitrate" && has_value) {
      if (!ParsePositiveInt(args[++i], &cfg.media.opus_bitrate)) {
        out.error = "--bitrate must be a positive integer";
        return out;
      }
    } else if (role == PeerRole::kCapture && arg == "--tone-hz" && has_value) {
      char* end = nullptr;
      const std::string& text = args[++i];
      cfg.media.tone_hz = std::strtod(text.c_str(), &end);
      if (text.empty() || *end != '\0' || cfg.media.tone_hz <= 0.0 ||
          cfg.media.tone_hz >= cfg.media.sample_rate / 2.0) {
        out.error = "--tone-hz must be between 0 and the Nyquist frequency";
        return out;
      }
    } else if (role == PeerRole::kCapture && arg == "--fps" && has_value) {
      if (!ParsePositiveInt(args[++i], &cfg.media.video_fps) || cfg.media.video_fps > 240) {
        out.error = "--fps must be between 1 and 240";
        return out;
      }
    } else if (role == PeerRole::kCapture && arg == "--video-size" && has_value) {
      const std::string& text = args[++i];
      const auto x = text.find('x');
      if (x == std::string::npos ||
          !ParsePositiveInt(text.substr(0, x), &cfg.media.video_width) ||
          !ParsePositiveInt(text.substr(x + 1), &cfg.media.video_height) ||
          cfg.media.video_width > 7680 || cfg.media.video_height > 4320) {
        out.error = "--video-size expects WIDTHxHEIGHT, got '" + text + "'";
        return out;
      }
    } else if (role == PeerRole::kPlayback && arg == "--audio-out" && has_value) {
      cfg.audio_output_path = args[++i];
    } else if (role == PeerRole::kPlayback && arg == "--video-out" && has_value) {
      cfg.video_output_path = args[++i];
    } else if (role == PeerRole::kPlayback && arg == "--no-input") {
      cfg.input_enabled = false;
    } else {
      out.error = "Unknown argument: " + arg;
      return out;
    }
  }

  if (role == PeerRole::kPlayback && cfg.peer_host.empty()) {
    out.error = "playback requires --peer HOST:PORT";
    return out;
  }
  if (role == PeerRole::kCapture && cfg.peer_host.empty() && cfg.bind_port == 0) {
    out.error = "capture without --peer must --bind a fixed port";
    return out;
  }

  const size_t required = RequiredBarrierParties(cfg);
  if (parties_given && cfg.barrier_parties != required) {
    out.error = "--barrier-parties " + std::to_string(cfg.barrier_parties) +
                " does not match the " + std::to_string(required) +
                " gated tasks of a " + ToString(role) + " session";
    return out;
  }
  cfg.barrier_parties = required;

  out.valid = true;
  return out;
}

std::string UsageText(PeerRole role, const std::string& program_name) {
  std::ostringstream os;
  os << "Usage: " << program_name << " [OPTIONS]\n"
     << "\n";
  if (role == PeerRole::kCapture) {
    os << "Capture peer: streams a test tone and test pattern, injects remote input.\n";
  } else {
    os << "Playback peer: receives audio/video, forwards stdin input events.\n";
  }
  os << "\n"
     << "TRANSPORT:\n"
     << "  --bind HOST:PORT             Local UDP endpoint (default 0.0.0.0:0)\n"
     << "  --peer HOST:PORT             Remote peer"
     << (role == PeerRole::kPlayback ? " (required)\n" : " (default: learn from first HELLO)\n")
     << "  --peer-timeout-ms N          Fail after N ms of peer silence (default 10000)\n"
     << "  --connect-timeout-ms N       Fail if the peer never answers (default 0 = wait)\n"
     << "\n"
     << "PIPELINE:\n"
     << "  --channel-capacity N         Frames buffered per stream (default 64)\n"
     << "  --tune ROLE=T:L              Error window for a stream role, e.g.\n"
     << "                               audio-ingress=900:1000\n"
     << "  --barrier-parties N          Startup barrier size (validated)\n"
     << "  --latency-interval-ms N      Latency probe period (default 1000)\n"
     << "  --bitrate N                  Opus bitrate in bit/s (default 64000)\n"
     << "\n";
  if (role == PeerRole::kCapture) {
    os << "CAPTURE:\n"
       << "  --tone-hz F                  Test tone frequency (default 440)\n"
       << "  --fps N                      Test pattern frame rate (default 30)\n"
       << "  --video-size WxH             Test pattern size (default 320x180)\n"
       << "\n";
  } else {
    os << "PLAYBACK:\n"
       << "  --audio-out PATH             Write decoded audio as WAV (default: discard)\n"
       << "  --video-out PATH             Write reassembled frames (default: discard)\n"
       << "  --no-input                   Do not forward stdin input events\n"
       << "\n";
  }
  os << "CONTROL:\n"
     << "  --control-address HOST:PORT  Serve SessionControl over gRPC\n"
     << "  --help                       Show this help message\n"
     << "\n"
     << "Set PEERLINK_DEBUG=1 for debug logging.\n";
  return os.str();
}

}  // namespace peerlink::config
