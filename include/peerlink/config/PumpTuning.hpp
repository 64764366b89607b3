// Repository: PeerLink
// Component: PumpTuning
// Purpose: Canonical per-role error-tracker settings.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_CONFIG_PUMP_TUNING_HPP_
#define PEERLINK_CONFIG_PUMP_TUNING_HPP_

#include <array>
#include <cstdint>
#include <string>

#include "peerlink/pump/StreamRole.hpp"

namespace peerlink::config {

// Error-tracker window for one pump: fatal after `threshold` failures within
// `limit` attempts.
struct PumpTuning {
  uint32_t threshold = 900;
  uint32_t limit = 1000;
};

// Sender-side loops write to the transport far more often than receivers
// read, so egress windows are ten times wider.
inline constexpr PumpTuning kEgressMediaTuning{9000, 10000};
inline constexpr PumpTuning kIngressMediaTuning{900, 1000};
inline constexpr PumpTuning kInputTuning{500, 1000};

// PumpTuningTable is the single place pump windows are defined. Every
// StreamPump is constructed from Get(role).
class PumpTuningTable {
 public:
  // Table with the defaults above.
  PumpTuningTable();

  const PumpTuning& Get(pump::StreamRole role) const;

  // Throws std::invalid_argument unless 0 < threshold <= limit.
  void Set(pump::StreamRole role, PumpTuning tuning);

  // Parses "<role>=<threshold>:<limit>" (e.g. "audio-ingress=50:100") and
  // applies it. Returns false with *error set on malformed input.
  bool ApplyOverride(const std::string& text, std::string* error);

 private:
  std::array<PumpTuning, pump::kStreamRoleCount> entries_;
};

}  // namespace peerlink::config

#endif  // PEERLINK_CONFIG_PUMP_TUNING_HPP_
