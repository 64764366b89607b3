// Repository: PeerLink
// Component: PacedCapture
// Purpose: Real-time paced capture thread feeding a frame channel.
// Copyright (c) 2026 PeerLink

#include "peerlink/media/PacedCapture.hpp"

#include <utility>

#include "peerlink/util/Logger.hpp"

namespace peerlink::media {

using util::Logger;

PacedCapture::PacedCapture(std::string name, std::chrono::microseconds period,
                           core::ChannelSender<core::Frame> out,
                           core::ShutdownCoordinator stop)
    : name_(std::move(name)), period_(period), out_(std::move(out)), stop_(std::move(stop)) {}

PacedCapture::~PacedCapture() {
  Join();
}

void PacedCapture::Start() {
  thread_ = std::thread(&PacedCapture::Run, this);
}

void PacedCapture::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void PacedCapture::Run() {
  stop_.RegisterTask(name_);
  Logger::Info("[PacedCapture] START name=" + name_ +
               " period_us=" + std::to_string(period_.count()));

  using Clock = std::chrono::steady_clock;
  auto next_tick = Clock::now();
  std::vector<core::Frame> frames;
  bool running = true;

  while (running && !stop_.IsStopRequested()) {
    frames.clear();
    std::string error;
    if (!Produce(&frames, &error)) {
      const uint64_t failures = produce_failures_.fetch_add(1, std::memory_order_relaxed) + 1;
      if (failures == 1 || failures % 100 == 0) {
        Logger::Warn("[PacedCapture] PRODUCE_FAILED name=" + name_ + " error=" + error +
                     " failures=" + std::to_string(failures));
      }
    }

    for (auto& frame : frames) {
      const core::SendStatus status = out_.TrySend(std::move(frame));
      if (status == core::SendStatus::kOk) {
        frames_sent_.fetch_add(1, std::memory_order_relaxed);
      } else if (status == core::SendStatus::kFull) {
        frames_dropped_.fetch_add(1, std::memory_order_relaxed);
      } else {
        running = false;
        break;
      }
    }

    next_tick += period_;
    const auto now = Clock::now();
    if (next_tick <= now) {
      // Fell behind; resynchronize instead of bursting.
      next_tick = now;
      continue;
    }
    const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_tick - now);
    if (stop_.WaitForStopFor(wait) != core::StopCause::kNone) {
      break;
    }
  }

  out_.Close();
  Logger::Info("[PacedCapture] EXIT name=" + name_ +
               " sent=" + std::to_string(frames_sent_.load()) +
               " dropped=" + std::to_string(frames_dropped_.load()) +
               " failures=" + std::to_string(produce_failures_.load()));
}

}  // namespace peerlink::media
