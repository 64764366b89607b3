// Repository: PeerLink
// Component: ITimeSource
// Purpose: Wall-clock seam for latency measurement.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_TIME_ITIME_SOURCE_HPP_
#define PEERLINK_TIME_ITIME_SOURCE_HPP_

#include <cstdint>

namespace peerlink::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace peerlink::time

#endif  // PEERLINK_TIME_ITIME_SOURCE_HPP_
