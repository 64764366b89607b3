// Repository: PeerLink
// Component: StreamPump
// Purpose: Generic source -> sink retry loop.
// Copyright (c) 2026 PeerLink

#include "peerlink/pump/StreamPump.hpp"

#include <stdexcept>
#include <utility>

#include "peerlink/util/Logger.hpp"

namespace peerlink::pump {

using util::Logger;

namespace {

constexpr auto kWarnInterval = std::chrono::seconds(1);
constexpr auto kIdleBackoff = std::chrono::milliseconds(5);

}  // namespace

const char* ToString(PumpExit exit) {
  switch (exit) {
    case PumpExit::kRunning:
      return "running";
    case PumpExit::kStopped:
      return "stopped";
    case PumpExit::kFatal:
      return "fatal";
    case PumpExit::kSourceClosed:
      return "source_closed";
  }
  return "unknown";
}

StreamPump::StreamPump(StreamRole role, config::PumpTuning tuning,
                       std::unique_ptr<IFrameSource> source,
                       std::unique_ptr<IFrameSink> sink,
                       core::ShutdownCoordinator stop,
                       std::shared_ptr<core::StartupBarrier> barrier)
    : role_(role),
      name_(ToString(role)),
      tracker_(tuning.threshold, tuning.limit),
      source_(std::move(source)),
      sink_(std::move(sink)),
      stop_(std::move(stop)),
      barrier_(std::move(barrier)) {
  if (!source_ || !sink_) {
    throw std::invalid_argument("StreamPump " + name_ + " requires a source and a sink");
  }
}

StreamPump::~StreamPump() {
  Join();
}

void StreamPump::Start() {
  thread_ = std::thread(&StreamPump::Run, this);
}

void StreamPump::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

PumpStats StreamPump::stats() const {
  PumpStats s;
  s.frames_delivered = frames_delivered_.load(std::memory_order_relaxed);
  s.source_failures = source_failures_.load(std::memory_order_relaxed);
  s.sink_failures = sink_failures_.load(std::memory_order_relaxed);
  s.idle_polls = idle_polls_.load(std::memory_order_relaxed);
  s.escalated = escalated_.load(std::memory_order_acquire);
  return s;
}

void StreamPump::Run() {
  stop_.RegisterTask(name_);

  if (barrier_) {
    Logger::Debug("[StreamPump] BARRIER_WAIT role=" + name_);
    if (barrier_->Wait() == core::BarrierResult::kCancelled) {
      Logger::Info("[StreamPump] EXIT role=" + name_ + " reason=cancelled_before_start");
      exit_.store(PumpExit::kStopped, std::memory_order_release);
      return;
    }
  }

  Logger::Info("[StreamPump] START role=" + name_ +
               " threshold=" + std::to_string(tracker_.threshold()) +
               " limit=" + std::to_string(tracker_.limit()));

  PumpExit result = PumpExit::kStopped;
  while (true) {
    if (stop_.IsStopRequested()) {
      result = PumpExit::kStopped;
      break;
    }

    TakeResult taken = source_->TryTake();
    if (taken.status == TakeStatus::kStopped || stop_.IsStopRequested()) {
      result = PumpExit::kStopped;
      break;
    }

    if (taken.status == TakeStatus::kWouldBlock) {
      idle_polls_.fetch_add(1, std::memory_order_relaxed);
      if (stop_.WaitForStopFor(kIdleBackoff) != core::StopCause::kNone) {
        result = PumpExit::kStopped;
        break;
      }
      continue;
    }

    if (taken.status == TakeStatus::kClosed) {
      result = PumpExit::kSourceClosed;
      break;
    }

    if (taken.status == TakeStatus::kError) {
      source_failures_.fetch_add(1, std::memory_order_relaxed);
      if (tracker_.RecordFailure()) {
        Escalate("source failure", taken.error);
        result = PumpExit::kFatal;
        break;
      }
      LogTransient("source", taken.error);
      continue;
    }

    PutResult put = sink_->TryPut(std::move(taken.frame));
    if (put.ok) {
      tracker_.RecordSuccess();
      frames_delivered_.fetch_add(1, std::memory_order_relaxed);
    } else if (stop_.IsStopRequested()) {
      result = PumpExit::kStopped;
      break;
    } else {
      sink_failures_.fetch_add(1, std::memory_order_relaxed);
      if (tracker_.RecordFailure()) {
        Escalate("sink failure", put.error);
        result = PumpExit::kFatal;
        break;
      }
      LogTransient("sink", put.error);
    }

    if (stop_.CheckForError()) {
      result = PumpExit::kStopped;
      break;
    }
  }

  exit_.store(result, std::memory_order_release);
  Logger::Info("[StreamPump] EXIT role=" + name_ + " reason=" + ToString(result) +
               " delivered=" + std::to_string(frames_delivered_.load()) +
               " source_failures=" + std::to_string(source_failures_.load()) +
               " sink_failures=" + std::to_string(sink_failures_.load()));
}

void StreamPump::Escalate(const char* what, const std::string& detail) {
  escalated_.store(true, std::memory_order_release);
  Logger::Error("[StreamPump] FATAL role=" + name_ + " cause=" + what +
                " errors=" + std::to_string(tracker_.errors()) +
                " attempts=" + std::to_string(tracker_.attempts()) +
                " last_error=" + detail);
  stop_.NotifyError(false, name_ + " " + what);
}

void StreamPump::LogTransient(const char* what, const std::string& detail) {
  const auto now = std::chrono::steady_clock::now();
  if (now - last_warn_ < kWarnInterval) {
    ++suppressed_warnings_;
    return;
  }
  Logger::Warn("[StreamPump] TRANSIENT role=" + name_ + " side=" + what +
               " error=" + detail + " errors=" + std::to_string(tracker_.errors()) +
               "/" + std::to_string(tracker_.threshold()) +
               " suppressed=" + std::to_string(suppressed_warnings_));
  last_warn_ = now;
  suppressed_warnings_ = 0;
}

}  // namespace peerlink::pump
