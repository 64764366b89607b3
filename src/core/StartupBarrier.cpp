// Repository: PeerLink
// Component: StartupBarrier
// Purpose: Single-use N-party rendezvous with stop-aware cancellation.
// Copyright (c) 2026 PeerLink

#include "peerlink/core/StartupBarrier.hpp"

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>

#include "peerlink/util/Logger.hpp"

namespace peerlink::core {

using util::Logger;

struct StartupBarrier::State {
  explicit State(size_t n) : parties(n) {}

  bool StopRequested() const { return stop && stop->IsStopRequested(); }

  void Wake() {
    { std::lock_guard<std::mutex> lock(mutex); }
    cv.notify_all();
  }

  mutable std::mutex mutex;
  std::condition_variable cv;
  const size_t parties;
  size_t arrived = 0;
  bool released = false;
  std::optional<ShutdownCoordinator> stop;
};

const char* ToString(BarrierResult result) {
  switch (result) {
    case BarrierResult::kReleased:
      return "released";
    case BarrierResult::kCancelled:
      return "cancelled";
    case BarrierResult::kAlreadyReleased:
      return "already_released";
  }
  return "unknown";
}

StartupBarrier::StartupBarrier(size_t parties) {
  if (parties == 0) {
    throw std::invalid_argument("StartupBarrier requires at least one party");
  }
  state_ = std::make_shared<State>(parties);
}

StartupBarrier::StartupBarrier(size_t parties, ShutdownCoordinator stop)
    : StartupBarrier(parties) {
  state_->stop = stop;
  stop_ = stop;
  std::weak_ptr<State> weak = state_;
  waker_id_ = stop_->AddWaker([weak] {
    if (auto s = weak.lock()) s->Wake();
  });
}

StartupBarrier::~StartupBarrier() {
  if (stop_) {
    stop_->RemoveWaker(waker_id_);
  }
}

BarrierResult StartupBarrier::Wait() {
  auto& s = *state_;
  std::unique_lock<std::mutex> lock(s.mutex);
  if (s.released) {
    Logger::Warn("[StartupBarrier] WAIT_AFTER_RELEASE parties=" +
                 std::to_string(s.parties));
    return BarrierResult::kAlreadyReleased;
  }
  if (s.StopRequested()) {
    return BarrierResult::kCancelled;
  }

  ++s.arrived;
  if (s.arrived == s.parties) {
    s.released = true;
    lock.unlock();
    s.cv.notify_all();
    Logger::Info("[StartupBarrier] RELEASED parties=" + std::to_string(s.parties));
    return BarrierResult::kReleased;
  }

  Logger::Debug("[StartupBarrier] ARRIVED " + std::to_string(s.arrived) + "/" +
                std::to_string(s.parties));
  s.cv.wait(lock, [&s] { return s.released || s.StopRequested(); });
  if (s.released) {
    return BarrierResult::kReleased;
  }
  --s.arrived;
  return BarrierResult::kCancelled;
}

size_t StartupBarrier::parties() const {
  return state_->parties;
}

size_t StartupBarrier::arrived() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->arrived;
}

bool StartupBarrier::released() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->released;
}

}  // namespace peerlink::core
