// Repository: PeerLink
// Component: PlaybackWorker
// Purpose: Playback backend thread draining a frame channel into a consumer.
// Copyright (c) 2026 PeerLink

#include "peerlink/media/PlaybackWorker.hpp"

#include <stdexcept>
#include <utility>

#include "peerlink/util/Logger.hpp"

namespace peerlink::media {

using util::Logger;

bool DiscardConsumer::Consume(const core::Frame& frame, std::string* /*error*/) {
  frames_.fetch_add(1, std::memory_order_relaxed);
  bytes_.fetch_add(frame.size(), std::memory_order_relaxed);
  return true;
}

PlaybackWorker::PlaybackWorker(std::string name, core::ChannelReceiver<core::Frame> in,
                               std::unique_ptr<IFrameConsumer> consumer,
                               core::ShutdownCoordinator stop)
    : name_(std::move(name)),
      in_(std::move(in)),
      consumer_(std::move(consumer)),
      stop_(std::move(stop)) {
  if (!consumer_) {
    throw std::invalid_argument("PlaybackWorker " + name_ + " requires a consumer");
  }
}

PlaybackWorker::~PlaybackWorker() {
  Join();
}

void PlaybackWorker::Start() {
  thread_ = std::thread(&PlaybackWorker::Run, this);
}

void PlaybackWorker::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void PlaybackWorker::Run() {
  stop_.RegisterTask(name_);
  Logger::Info("[PlaybackWorker] START name=" + name_);

  const char* reason = "stopped";
  core::Frame frame;
  while (true) {
    const core::ReceiveStatus status = in_.Receive(frame);
    if (status == core::ReceiveStatus::kStopped) break;
    if (status == core::ReceiveStatus::kClosed) {
      reason = "input_closed";
      break;
    }
    if (status != core::ReceiveStatus::kOk) continue;

    std::string error;
    if (!consumer_->Consume(frame, &error)) {
      Logger::Error("[PlaybackWorker] OUTPUT_FAILED name=" + name_ + " error=" + error);
      stop_.NotifyError(false, name_ + " output failure");
      reason = "output_failed";
      break;
    }
    frames_consumed_.fetch_add(1, std::memory_order_relaxed);
  }

  in_.Close();
  consumer_->Finish();
  Logger::Info("[PlaybackWorker] EXIT name=" + name_ + " reason=" + reason +
               " consumed=" + std::to_string(frames_consumed_.load()));
}

}  // namespace peerlink::media
