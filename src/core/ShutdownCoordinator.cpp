// Repository: PeerLink
// Component: ShutdownCoordinator
// Purpose: Session-wide cooperative cancellation and error broadcast.
// Copyright (c) 2026 PeerLink

#include "peerlink/core/ShutdownCoordinator.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>

#include "peerlink/util/Logger.hpp"

namespace peerlink::core {

using util::Logger;

struct ShutdownCoordinator::State {
  mutable std::mutex mutex;
  mutable std::condition_variable cv;

  // Published under `mutex`, readable lock-free by IsStopRequested().
  std::atomic<bool> error_flag{false};
  std::atomic<bool> shutting_down{false};

  bool error_is_fatal = false;
  std::string error_reason;
  std::string shutdown_reason;
  StopCause first_cause = StopCause::kNone;

  uint32_t active_task_count = 0;
  std::vector<std::string> task_names;

  WakerId next_waker_id = 1;
  std::map<WakerId, std::function<void()>> wakers;

  bool StoppedLocked() const {
    return error_flag.load(std::memory_order_relaxed) ||
           shutting_down.load(std::memory_order_relaxed);
  }

  std::vector<std::function<void()>> CollectWakersLocked() const {
    std::vector<std::function<void()>> out;
    out.reserve(wakers.size());
    for (const auto& entry : wakers) {
      out.push_back(entry.second);
    }
    return out;
  }
};

const char* ToString(StopCause cause) {
  switch (cause) {
    case StopCause::kNone:
      return "none";
    case StopCause::kError:
      return "error";
    case StopCause::kShutdown:
      return "shutdown";
  }
  return "unknown";
}

ShutdownCoordinator::ShutdownCoordinator() : state_(std::make_shared<State>()) {}

void ShutdownCoordinator::RegisterTask(const std::string& name) {
  uint32_t count = 0;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->active_task_count;
    state_->task_names.push_back(name);
    count = state_->active_task_count;
  }
  Logger::Debug("[Shutdown] TASK_REGISTERED name=" + name +
                " active=" + std::to_string(count));
}

void ShutdownCoordinator::NotifyError(bool fatal, const std::string& reason) {
  std::vector<std::function<void()>> wakers;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->error_flag.load(std::memory_order_relaxed)) {
      Logger::Debug("[Shutdown] ERROR_IGNORED reason=" + reason +
                    " first_reason=" + state_->error_reason);
      return;
    }
    state_->error_is_fatal = fatal;
    state_->error_reason = reason;
    state_->error_flag.store(true, std::memory_order_release);
    if (state_->first_cause == StopCause::kNone) {
      state_->first_cause = StopCause::kError;
    }
    wakers = state_->CollectWakersLocked();
  }
  Logger::Error(std::string("[Shutdown] ERROR_NOTIFIED fatal=") +
                (fatal ? "true" : "false") + " reason=" + reason);
  WakeAll(std::move(wakers));
}

void ShutdownCoordinator::Shutdown(const std::string& reason) {
  std::vector<std::function<void()>> wakers;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->shutting_down.load(std::memory_order_relaxed)) {
      return;
    }
    state_->shutdown_reason = reason;
    state_->shutting_down.store(true, std::memory_order_release);
    if (state_->first_cause == StopCause::kNone) {
      state_->first_cause = StopCause::kShutdown;
    }
    wakers = state_->CollectWakersLocked();
  }
  Logger::Info("[Shutdown] SHUTDOWN_REQUESTED reason=" + reason);
  WakeAll(std::move(wakers));
}

void ShutdownCoordinator::WakeAll(std::vector<std::function<void()>> wakers) {
  state_->cv.notify_all();
  for (auto& waker : wakers) {
    if (waker) waker();
  }
}

StopCause ShutdownCoordinator::WaitForStop() const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->cv.wait(lock, [this] { return state_->StoppedLocked(); });
  return state_->first_cause;
}

StopCause ShutdownCoordinator::WaitForError() const {
  return WaitForStop();
}

StopCause ShutdownCoordinator::WaitForShutdown() const {
  return WaitForStop();
}

StopCause ShutdownCoordinator::WaitForStopFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  if (!state_->cv.wait_for(lock, timeout, [this] { return state_->StoppedLocked(); })) {
    return StopCause::kNone;
  }
  return state_->first_cause;
}

bool ShutdownCoordinator::CheckForError() const {
  return state_->error_flag.load(std::memory_order_acquire);
}

bool ShutdownCoordinator::IsStopRequested() const {
  return state_->error_flag.load(std::memory_order_acquire) ||
         state_->shutting_down.load(std::memory_order_acquire);
}

StopCause ShutdownCoordinator::Cause() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->first_cause;
}

ShutdownSnapshot ShutdownCoordinator::Snapshot() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  ShutdownSnapshot snap;
  snap.error_flag = state_->error_flag.load(std::memory_order_relaxed);
  snap.error_is_fatal = state_->error_is_fatal;
  snap.error_reason = state_->error_reason;
  snap.shutting_down = state_->shutting_down.load(std::memory_order_relaxed);
  snap.shutdown_reason = state_->shutdown_reason;
  snap.first_cause = state_->first_cause;
  snap.active_task_count = state_->active_task_count;
  snap.task_names = state_->task_names;
  return snap;
}

ShutdownCoordinator::WakerId ShutdownCoordinator::AddWaker(std::function<void()> waker) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  const WakerId id = state_->next_waker_id++;
  state_->wakers.emplace(id, std::move(waker));
  return id;
}

void ShutdownCoordinator::RemoveWaker(WakerId id) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->wakers.erase(id);
}

}  // namespace peerlink::core
