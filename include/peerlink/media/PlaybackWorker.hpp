// Repository: PeerLink
// Component: PlaybackWorker
// Purpose: Playback backend thread draining a frame channel into a consumer.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_MEDIA_PLAYBACK_WORKER_HPP_
#define PEERLINK_MEDIA_PLAYBACK_WORKER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "peerlink/core/Channel.hpp"
#include "peerlink/core/Frame.hpp"
#include "peerlink/core/ShutdownCoordinator.hpp"

namespace peerlink::media {

// Final destination of an ingress stream (speaker, file, screen).
class IFrameConsumer {
 public:
  virtual ~IFrameConsumer() = default;

  // Returns false with *error set when the output is unusable; the worker
  // then reports a session error and stops.
  virtual bool Consume(const core::Frame& frame, std::string* error) = 0;

  // Called once on the worker thread after the last Consume().
  virtual void Finish() {}
};

// Counts and drops everything.
class DiscardConsumer : public IFrameConsumer {
 public:
  bool Consume(const core::Frame& frame, std::string* error) override;

  uint64_t frames() const { return frames_.load(std::memory_order_relaxed); }
  uint64_t bytes() const { return bytes_.load(std::memory_order_relaxed); }

 private:
  std::atomic<uint64_t> frames_{0};
  std::atomic<uint64_t> bytes_{0};
};

// PlaybackWorker owns the receiving end of an ingress channel. It exits on
// session stop, when the pump side closes the channel, or on a consumer
// failure (reported through NotifyError).
class PlaybackWorker {
 public:
  PlaybackWorker(std::string name, core::ChannelReceiver<core::Frame> in,
                 std::unique_ptr<IFrameConsumer> consumer, core::ShutdownCoordinator stop);
  ~PlaybackWorker();

  PlaybackWorker(const PlaybackWorker&) = delete;
  PlaybackWorker& operator=(const PlaybackWorker&) = delete;

  void Start();
  void Run();
  void Join();

  uint64_t frames_consumed() const { return frames_consumed_.load(std::memory_order_relaxed); }

 private:
  const std::string name_;
  core::ChannelReceiver<core::Frame> in_;
  std::unique_ptr<IFrameConsumer> consumer_;
  core::ShutdownCoordinator stop_;
  std::thread thread_;
  std::atomic<uint64_t> frames_consumed_{0};
};

}  // namespace peerlink::media

#endif  // PEERLINK_MEDIA_PLAYBACK_WORKER_HPP_
