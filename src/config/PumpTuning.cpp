// Repository: PeerLink
// Component: PumpTuning
// Purpose: Canonical per-role error-tracker settings.
// Copyright (c) 2026 PeerLink

#include "peerlink/config/PumpTuning.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace peerlink::config {

namespace {

bool ParseU32(const std::string& text, uint32_t* out) {
  if (text.empty()) return false;
  char* end = nullptr;
  errno = 0;
  unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0' || text[0] == '-' ||
      value > std::numeric_limits<uint32_t>::max()) {
    return false;
  }
  *out = static_cast<uint32_t>(value);
  return true;
}

size_t Index(pump::StreamRole role) {
  return static_cast<size_t>(role);
}

}  // namespace

PumpTuningTable::PumpTuningTable() {
  using pump::StreamRole;
  entries_[Index(StreamRole::kAudioEgress)] = kEgressMediaTuning;
  entries_[Index(StreamRole::kVideoEgress)] = kEgressMediaTuning;
  entries_[Index(StreamRole::kInputEgress)] = kInputTuning;
  entries_[Index(StreamRole::kAudioIngress)] = kIngressMediaTuning;
  entries_[Index(StreamRole::kVideoIngress)] = kIngressMediaTuning;
  entries_[Index(StreamRole::kInputIngress)] = kInputTuning;
  entries_[Index(StreamRole::kLatencyIngress)] = kIngressMediaTuning;
}

const PumpTuning& PumpTuningTable::Get(pump::StreamRole role) const {
  return entries_[Index(role)];
}

void PumpTuningTable::Set(pump::StreamRole role, PumpTuning tuning) {
  if (tuning.threshold == 0 || tuning.threshold > tuning.limit) {
    throw std::invalid_argument(std::string("invalid tuning for ") +
                                pump::ToString(role) + ": need 0 < threshold <= limit");
  }
  entries_[Index(role)] = tuning;
}

bool PumpTuningTable::ApplyOverride(const std::string& text, std::string* error) {
  const auto eq = text.find('=');
  const auto colon = text.find(':', eq == std::string::npos ? 0 : eq);
  if (eq == std::string::npos || colon == std::string::npos) {
    *error = "expected <role>=<threshold>:<limit>, got '" + text + "'";
    return false;
  }
  const auto role = pump::ParseStreamRole(text.substr(0, eq));
  if (!role) {
    *error = "unknown stream role '" + text.substr(0, eq) + "'";
    return false;
  }
  PumpTuning tuning;
  if (!ParseU32(text.substr(eq + 1, colon - eq - 1), &tuning.threshold) ||
      !ParseU32(text.substr(colon + 1), &tuning.limit)) {
    *error = "threshold and limit must be unsigned integers in '" + text + "'";
    return false;
  }
  if (tuning.threshold == 0 || tuning.threshold > tuning.limit) {
    *error = "need 0 < threshold <= limit in '" + text + "'";
    return false;
  }
  entries_[Index(*role)] = tuning;
  return true;
}

}  // namespace peerlink::config
