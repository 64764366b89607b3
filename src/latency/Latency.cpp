// Repository: PeerLink
// Component: Latency
// Purpose: One-way latency probe sender and measuring sink.
// Copyright (c) 2026 PeerLink

#include "peerlink/latency/Latency.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

#include "peerlink/util/Logger.hpp"

namespace peerlink::latency {

using util::Logger;

std::string EncodeTimestamp(int64_t utc_ms) {
  return std::to_string(utc_ms);
}

std::optional<int64_t> DecodeTimestamp(const std::string& text) {
  if (text.empty() || text.size() > 19) return std::nullopt;
  int64_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    value = value * 10 + (c - '0');
  }
  return value;
}

// =============================================================================
// LatencySender
// =============================================================================

LatencySender::LatencySender(std::shared_ptr<transport::ITrackWriter> writer,
                             std::shared_ptr<const time::ITimeSource> clock,
                             std::chrono::milliseconds interval, core::ShutdownCoordinator stop)
    : writer_(std::move(writer)),
      clock_(std::move(clock)),
      interval_(interval),
      stop_(std::move(stop)) {
  if (!writer_ || !clock_) {
    throw std::invalid_argument("LatencySender requires a writer and a clock");
  }
}

LatencySender::~LatencySender() {
  Join();
}

void LatencySender::Start() {
  thread_ = std::thread(&LatencySender::Run, this);
}

void LatencySender::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void LatencySender::Run() {
  stop_.RegisterTask("latency-sender");
  Logger::Info("[Latency] SENDER_START interval_ms=" + std::to_string(interval_.count()));

  while (stop_.WaitForStopFor(interval_) == core::StopCause::kNone) {
    const transport::WriteResult written =
        writer_->Write(core::Frame::FromString(EncodeTimestamp(clock_->NowUtcMs())));
    if (written.ok) {
      probes_sent_.fetch_add(1, std::memory_order_relaxed);
    } else {
      const uint64_t failures = send_failures_.fetch_add(1, std::memory_order_relaxed) + 1;
      Logger::Warn("[Latency] SEND_FAILED error=" + written.error +
                   " failures=" + std::to_string(failures));
    }
  }

  Logger::Info("[Latency] SENDER_EXIT sent=" + std::to_string(probes_sent_.load()));
}

// =============================================================================
// LatencySink
// =============================================================================

LatencySink::LatencySink(std::shared_ptr<const time::ITimeSource> clock)
    : clock_(std::move(clock)) {
  if (!clock_) {
    throw std::invalid_argument("LatencySink requires a clock");
  }
}

pump::PutResult LatencySink::TryPut(core::Frame&& frame) {
  const std::string text = frame.AsString();
  const auto sent_ms = DecodeTimestamp(text);
  if (!sent_ms) {
    return pump::PutResult::Fail("malformed latency probe '" + text + "'");
  }
  const int64_t diff = clock_->NowUtcMs() - *sent_ms;
  if (diff < 0) {
    skewed_.fetch_add(1, std::memory_order_relaxed);
    Logger::Warn("[Latency] CLOCK_SKEW one_way_ms=" + std::to_string(diff) +
                 " skewed=" + std::to_string(skewed_.load(std::memory_order_relaxed)));
    return pump::PutResult::Ok();
  }

  // Single writer (the pump thread); atomics only publish to readers.
  samples_.fetch_add(1, std::memory_order_relaxed);
  last_ms_.store(diff, std::memory_order_relaxed);
  if (diff < min_ms_.load(std::memory_order_relaxed)) min_ms_.store(diff);
  if (diff > max_ms_.load(std::memory_order_relaxed)) max_ms_.store(diff);
  total_ms_.fetch_add(diff, std::memory_order_relaxed);

  Logger::Info("[Latency] SAMPLE one_way_ms=" + std::to_string(diff));
  return pump::PutResult::Ok();
}

LatencyStats LatencySink::stats() const {
  LatencyStats s;
  s.samples = samples_.load(std::memory_order_relaxed);
  s.skewed = skewed_.load(std::memory_order_relaxed);
  if (s.samples == 0) return s;
  s.last_ms = last_ms_.load(std::memory_order_relaxed);
  s.min_ms = min_ms_.load(std::memory_order_relaxed);
  s.max_ms = max_ms_.load(std::memory_order_relaxed);
  s.mean_ms = static_cast<double>(total_ms_.load(std::memory_order_relaxed)) /
              static_cast<double>(s.samples);
  return s;
}

}  // namespace peerlink::latency
