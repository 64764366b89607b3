// Repository: PeerLink
// Component: SystemTimeSource
// Purpose: ITimeSource backed by the system clock.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_TIME_SYSTEM_TIME_SOURCE_HPP_
#define PEERLINK_TIME_SYSTEM_TIME_SOURCE_HPP_

#include <chrono>

#include "peerlink/time/ITimeSource.hpp"

namespace peerlink::time {

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace peerlink::time

#endif  // PEERLINK_TIME_SYSTEM_TIME_SOURCE_HPP_
