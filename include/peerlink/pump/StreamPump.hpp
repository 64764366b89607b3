// Repository: PeerLink
// Component: StreamPump
// Purpose: Generic source -> sink retry loop shared by every audio, video,
//          input and latency stream. Bounded by an ErrorTracker, cancelled
//          by the session ShutdownCoordinator.
// Copyright (c) 2026 PeerLink
//
// Loop (one iteration per source attempt):
//
//   stop requested?            -> exit kStopped
//   source.TryTake()
//     kWouldBlock              -> poll again (not an attempt)
//     kStopped / stop raced in -> exit kStopped (stop wins ties)
//     kClosed                  -> exit kSourceClosed (stream ended)
//     kError                   -> tracker failure; fatal => NotifyError, exit kFatal
//     kFrame                   -> sink.TryPut(frame)
//                                   ok   -> tracker success
//                                   fail -> tracker failure; fatal => NotifyError, exit kFatal
//   CheckForError()            -> exit kStopped
//
// A frame is never retried. Transient failures are logged at most once a
// second per pump.

#ifndef PEERLINK_PUMP_STREAM_PUMP_HPP_
#define PEERLINK_PUMP_STREAM_PUMP_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "peerlink/config/PumpTuning.hpp"
#include "peerlink/core/ErrorTracker.hpp"
#include "peerlink/core/ShutdownCoordinator.hpp"
#include "peerlink/core/StartupBarrier.hpp"
#include "peerlink/pump/FramePorts.hpp"
#include "peerlink/pump/StreamRole.hpp"

namespace peerlink::pump {

enum class PumpExit {
  kRunning,       // Loop not finished yet
  kStopped,       // Session stop observed (not this pump's fault)
  kFatal,         // Tracker tripped; this pump escalated
  kSourceClosed,  // Source ran dry
};

const char* ToString(PumpExit exit);

struct PumpStats {
  uint64_t frames_delivered = 0;
  uint64_t source_failures = 0;
  uint64_t sink_failures = 0;
  uint64_t idle_polls = 0;
  bool escalated = false;
};

class StreamPump {
 public:
  // Throws std::invalid_argument for an invalid tuning or missing ports.
  // When `barrier` is set the loop starts only after the barrier releases.
  StreamPump(StreamRole role, config::PumpTuning tuning,
             std::unique_ptr<IFrameSource> source, std::unique_ptr<IFrameSink> sink,
             core::ShutdownCoordinator stop,
             std::shared_ptr<core::StartupBarrier> barrier = nullptr);

  // Joins the worker thread if Start() was called.
  ~StreamPump();

  StreamPump(const StreamPump&) = delete;
  StreamPump& operator=(const StreamPump&) = delete;

  // Runs the loop on a new thread.
  void Start();

  // Runs the loop on the calling thread. Returns when the loop exits.
  void Run();

  void Join();

  StreamRole role() const { return role_; }
  PumpExit exit_reason() const { return exit_.load(std::memory_order_acquire); }
  PumpStats stats() const;

 private:
  void Escalate(const char* what, const std::string& detail);
  void LogTransient(const char* what, const std::string& detail);

  const StreamRole role_;
  const std::string name_;
  core::ErrorTracker tracker_;  // Pump thread only
  std::unique_ptr<IFrameSource> source_;
  std::unique_ptr<IFrameSink> sink_;
  core::ShutdownCoordinator stop_;
  std::shared_ptr<core::StartupBarrier> barrier_;

  std::thread thread_;
  std::atomic<PumpExit> exit_{PumpExit::kRunning};

  std::atomic<uint64_t> frames_delivered_{0};
  std::atomic<uint64_t> source_failures_{0};
  std::atomic<uint64_t> sink_failures_{0};
  std::atomic<uint64_t> idle_polls_{0};
  std::atomic<bool> escalated_{false};

  // Warn rate limiting (pump thread only).
  std::chrono::steady_clock::time_point last_warn_{};
  uint64_t suppressed_warnings_ = 0;
};

}  // namespace peerlink::pump

#endif  // PEERLINK_PUMP_STREAM_PUMP_HPP_
