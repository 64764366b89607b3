// Repository: PeerLink
// Component: StartupBarrier
// Purpose: Single-use N-party rendezvous that holds egress pumps until the
//          control plane has seen the transport connect.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_CORE_STARTUP_BARRIER_HPP_
#define PEERLINK_CORE_STARTUP_BARRIER_HPP_

#include <cstddef>
#include <memory>
#include <optional>

#include "peerlink/core/ShutdownCoordinator.hpp"

namespace peerlink::core {

enum class BarrierResult {
  kReleased,         // All parties arrived
  kCancelled,        // Session stopped before the rendezvous completed
  kAlreadyReleased,  // Barrier was used up; caller arrived too late
};

const char* ToString(BarrierResult result);

// StartupBarrier releases every waiter together once exactly `parties` calls
// to Wait() have been made. A barrier bound to a ShutdownCoordinator also
// releases waiters with kCancelled when the session stops first, so a pump
// whose peer never connects does not hang.
//
// Single use. Wait() after the release returns kAlreadyReleased immediately.
class StartupBarrier {
 public:
  // Throws std::invalid_argument when parties == 0.
  explicit StartupBarrier(size_t parties);
  StartupBarrier(size_t parties, ShutdownCoordinator stop);
  ~StartupBarrier();

  StartupBarrier(const StartupBarrier&) = delete;
  StartupBarrier& operator=(const StartupBarrier&) = delete;

  BarrierResult Wait();

  size_t parties() const;
  size_t arrived() const;
  bool released() const;

 private:
  struct State;

  std::shared_ptr<State> state_;
  std::optional<ShutdownCoordinator> stop_;
  ShutdownCoordinator::WakerId waker_id_ = 0;
};

}  // namespace peerlink::core

#endif  // PEERLINK_CORE_STARTUP_BARRIER_HPP_
