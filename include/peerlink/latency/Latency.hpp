// Repository: PeerLink
// Component: Latency
// Purpose: One-way latency probe: the capture peer periodically sends its
//          wall-clock time, the playback peer measures the difference.
// Copyright (c) 2026 PeerLink
//
// Message: decimal milliseconds since the Unix epoch, ASCII, no terminator.
// The measurement is only as good as the two clocks' agreement.

#ifndef PEERLINK_LATENCY_LATENCY_HPP_
#define PEERLINK_LATENCY_LATENCY_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "peerlink/core/ShutdownCoordinator.hpp"
#include "peerlink/pump/FramePorts.hpp"
#include "peerlink/time/ITimeSource.hpp"
#include "peerlink/transport/ITransport.hpp"

namespace peerlink::latency {

std::string EncodeTimestamp(int64_t utc_ms);
std::optional<int64_t> DecodeTimestamp(const std::string& text);

// Periodic task on the capture peer. Started once the transport connected.
// Send failures are logged; the probe is diagnostic and never fails the
// session.
class LatencySender {
 public:
  LatencySender(std::shared_ptr<transport::ITrackWriter> writer,
                std::shared_ptr<const time::ITimeSource> clock,
                std::chrono::milliseconds interval, core::ShutdownCoordinator stop);
  ~LatencySender();

  LatencySender(const LatencySender&) = delete;
  LatencySender& operator=(const LatencySender&) = delete;

  void Start();
  void Join();

  uint64_t probes_sent() const { return probes_sent_.load(std::memory_order_relaxed); }
  uint64_t send_failures() const { return send_failures_.load(std::memory_order_relaxed); }

 private:
  void Run();

  std::shared_ptr<transport::ITrackWriter> writer_;
  std::shared_ptr<const time::ITimeSource> clock_;
  std::chrono::milliseconds interval_;
  core::ShutdownCoordinator stop_;
  std::thread thread_;
  std::atomic<uint64_t> probes_sent_{0};
  std::atomic<uint64_t> send_failures_{0};
};

// Running statistics of observed one-way latency.
struct LatencyStats {
  uint64_t samples = 0;
  uint64_t skewed = 0;  // probes stamped ahead of the local clock
  int64_t last_ms = 0;
  int64_t min_ms = 0;
  int64_t max_ms = 0;
  double mean_ms = 0.0;
};

// Latency ingress sink. A message that is not a timestamp is one pump
// failure. A timestamp ahead of the local clock means the peers' clocks
// disagree: it is counted as skewed and logged, never a failure.
class LatencySink : public pump::IFrameSink {
 public:
  explicit LatencySink(std::shared_ptr<const time::ITimeSource> clock);

  pump::PutResult TryPut(core::Frame&& frame) override;

  LatencyStats stats() const;

 private:
  std::shared_ptr<const time::ITimeSource> clock_;
  std::atomic<uint64_t> samples_{0};
  std::atomic<uint64_t> skewed_{0};
  std::atomic<int64_t> last_ms_{0};
  std::atomic<int64_t> min_ms_{std::numeric_limits<int64_t>::max()};
  std::atomic<int64_t> max_ms_{0};
  std::atomic<int64_t> total_ms_{0};
};

}  // namespace peerlink::latency

#endif  // PEERLINK_LATENCY_LATENCY_HPP_
