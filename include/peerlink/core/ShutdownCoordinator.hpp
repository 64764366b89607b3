// Repository: PeerLink
// Component: ShutdownCoordinator
// Purpose: Session-wide cooperative cancellation and first-writer-wins error
//          broadcast shared by every pump, backend and control-plane task.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_CORE_SHUTDOWN_COORDINATOR_HPP_
#define PEERLINK_CORE_SHUTDOWN_COORDINATOR_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace peerlink::core {

// Why a session left the Running state.
enum class StopCause {
  kNone,      // Still running
  kError,     // NotifyError() was the first terminal transition
  kShutdown,  // Shutdown() was the first terminal transition
};

const char* ToString(StopCause cause);

// Point-in-time copy of the shared state (diagnostics, control service).
struct ShutdownSnapshot {
  bool error_flag = false;
  bool error_is_fatal = false;
  std::string error_reason;
  bool shutting_down = false;
  std::string shutdown_reason;
  StopCause first_cause = StopCause::kNone;
  uint32_t active_task_count = 0;
  std::vector<std::string> task_names;
};

// ShutdownCoordinator is a cheap, copyable handle. Every copy refers to the
// same underlying session state; the orchestrator creates one per session
// and hands a copy to each task when it spawns it.
//
// State machine:
//   Running ──NotifyError()──► ErrorNotified   (error path)
//   Running ──Shutdown()─────► ShuttingDown    (graceful path)
// Each flag flips at most once. The first NotifyError() call wins: its
// `fatal` and `reason` are what every observer sees, later calls are no-ops.
// Both terminal states release WaitForError() and WaitForShutdown(); tasks
// treat either one as "stop now".
//
// Wakers let blocking primitives that own their own mutex (Channel,
// StartupBarrier) join the stop race: a waker is invoked after the stop flags
// are published, outside the coordinator mutex.
//
// Thread safety: all methods may be called concurrently from any thread.
class ShutdownCoordinator {
 public:
  using WakerId = uint64_t;

  ShutdownCoordinator();

  // Records a spawned task (count + name). Called once by each task at start.
  void RegisterTask(const std::string& name);

  // First call sets the error flag and records fatal/reason; idempotent after.
  void NotifyError(bool fatal, const std::string& reason);

  // Graceful stop request. Idempotent.
  void Shutdown(const std::string& reason = "shutdown requested");

  // Block until the session left Running. Returns the first stop cause.
  StopCause WaitForError() const;
  StopCause WaitForShutdown() const;

  // Bounded wait; returns StopCause::kNone on timeout.
  StopCause WaitForStopFor(std::chrono::milliseconds timeout) const;

  // Non-blocking poll of the error flag only.
  [[nodiscard]] bool CheckForError() const;

  // Non-blocking poll of either terminal state. Lock-free.
  [[nodiscard]] bool IsStopRequested() const;

  StopCause Cause() const;
  ShutdownSnapshot Snapshot() const;

  WakerId AddWaker(std::function<void()> waker);
  void RemoveWaker(WakerId id);

 private:
  struct State;

  StopCause WaitForStop() const;
  void WakeAll(std::vector<std::function<void()>> wakers);

  std::shared_ptr<State> state_;
};

}  // namespace peerlink::core

#endif  // PEERLINK_CORE_SHUTDOWN_COORDINATOR_HPP_
