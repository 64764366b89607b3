// Repository: PeerLink
// Component: Channel
// Purpose: Bounded single-producer/single-consumer queue whose blocking
//          operations also return when the session is told to stop.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_CORE_CHANNEL_HPP_
#define PEERLINK_CORE_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "peerlink/core/ShutdownCoordinator.hpp"

namespace peerlink::core {

enum class SendStatus {
  kOk,
  kFull,     // TrySend only
  kClosed,   // Receiver gone or sender already closed
  kStopped,  // Session stop observed
};

enum class ReceiveStatus {
  kOk,
  kEmpty,    // TryReceive only
  kClosed,   // Sender closed and every queued item drained
  kStopped,  // Session stop observed
};

namespace detail {

template <typename T>
struct ChannelState {
  ChannelState(size_t cap, ShutdownCoordinator coordinator)
      : capacity(cap), stop(std::move(coordinator)) {}

  ~ChannelState() { stop.RemoveWaker(waker_id); }

  // Invoked by the coordinator after the stop flags are published. Taking the
  // mutex orders the wake after any waiter that already evaluated its
  // predicate, so the notification cannot be lost.
  void Wake() {
    { std::lock_guard<std::mutex> lock(mutex); }
    not_empty.notify_all();
    not_full.notify_all();
  }

  std::mutex mutex;
  std::condition_variable not_empty;
  std::condition_variable not_full;
  std::deque<T> items;
  const size_t capacity;
  bool sender_closed = false;
  bool receiver_closed = false;
  ShutdownCoordinator stop;
  ShutdownCoordinator::WakerId waker_id = 0;
};

}  // namespace detail

template <typename T>
class ChannelReceiver;

// Producer end. Move-only; destroying it closes the channel.
template <typename T>
class ChannelSender {
 public:
  ChannelSender() = default;
  explicit ChannelSender(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {}

  ~ChannelSender() { Close(); }

  ChannelSender(const ChannelSender&) = delete;
  ChannelSender& operator=(const ChannelSender&) = delete;

  ChannelSender(ChannelSender&& other) noexcept : state_(std::move(other.state_)) {}
  ChannelSender& operator=(ChannelSender&& other) noexcept {
    if (this != &other) {
      Close();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  // Blocks while the channel is full. Stop wins over free space.
  SendStatus Send(T value) {
    if (!state_) return SendStatus::kClosed;
    auto& s = *state_;
    std::unique_lock<std::mutex> lock(s.mutex);
    s.not_full.wait(lock, [&s] {
      return s.stop.IsStopRequested() || s.sender_closed || s.receiver_closed ||
             s.items.size() < s.capacity;
    });
    if (s.stop.IsStopRequested()) return SendStatus::kStopped;
    if (s.sender_closed || s.receiver_closed) return SendStatus::kClosed;
    s.items.push_back(std::move(value));
    s.not_empty.notify_one();
    return SendStatus::kOk;
  }

  // Never blocks. On any status other than kOk the value is discarded.
  SendStatus TrySend(T value) {
    if (!state_) return SendStatus::kClosed;
    auto& s = *state_;
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.stop.IsStopRequested()) return SendStatus::kStopped;
    if (s.sender_closed || s.receiver_closed) return SendStatus::kClosed;
    if (s.items.size() >= s.capacity) return SendStatus::kFull;
    s.items.push_back(std::move(value));
    s.not_empty.notify_one();
    return SendStatus::kOk;
  }

  void Close() {
    if (!state_) return;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->sender_closed = true;
    }
    state_->not_empty.notify_all();
    state_->not_full.notify_all();
  }

  bool valid() const { return state_ != nullptr; }

 private:
  std::shared_ptr<detail::ChannelState<T>> state_;
};

// Consumer end. Move-only: exactly one task owns it at a time.
template <typename T>
class ChannelReceiver {
 public:
  ChannelReceiver() = default;
  explicit ChannelReceiver(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {}

  ~ChannelReceiver() { Close(); }

  ChannelReceiver(const ChannelReceiver&) = delete;
  ChannelReceiver& operator=(const ChannelReceiver&) = delete;

  ChannelReceiver(ChannelReceiver&& other) noexcept : state_(std::move(other.state_)) {}
  ChannelReceiver& operator=(ChannelReceiver&& other) noexcept {
    if (this != &other) {
      Close();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  // Blocks until an item arrives, the sender closes (after draining), or the
  // session stops. Stop wins over a ready item.
  ReceiveStatus Receive(T& out) {
    if (!state_) return ReceiveStatus::kClosed;
    auto& s = *state_;
    std::unique_lock<std::mutex> lock(s.mutex);
    s.not_empty.wait(lock, [&s] {
      return s.stop.IsStopRequested() || !s.items.empty() || s.sender_closed;
    });
    if (s.stop.IsStopRequested()) return ReceiveStatus::kStopped;
    if (s.items.empty()) return ReceiveStatus::kClosed;
    out = std::move(s.items.front());
    s.items.pop_front();
    s.not_full.notify_one();
    return ReceiveStatus::kOk;
  }

  // Receive() bounded by `timeout`; kEmpty when it elapses.
  template <typename Rep, typename Period>
  ReceiveStatus ReceiveFor(T& out, std::chrono::duration<Rep, Period> timeout) {
    if (!state_) return ReceiveStatus::kClosed;
    auto& s = *state_;
    std::unique_lock<std::mutex> lock(s.mutex);
    const bool ready = s.not_empty.wait_for(lock, timeout, [&s] {
      return s.stop.IsStopRequested() || !s.items.empty() || s.sender_closed;
    });
    if (s.stop.IsStopRequested()) return ReceiveStatus::kStopped;
    if (!ready) return ReceiveStatus::kEmpty;
    if (s.items.empty()) return ReceiveStatus::kClosed;
    out = std::move(s.items.front());
    s.items.pop_front();
    s.not_full.notify_one();
    return ReceiveStatus::kOk;
  }

  ReceiveStatus TryReceive(T& out) {
    if (!state_) return ReceiveStatus::kClosed;
    auto& s = *state_;
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.stop.IsStopRequested()) return ReceiveStatus::kStopped;
    if (s.items.empty()) {
      return s.sender_closed ? ReceiveStatus::kClosed : ReceiveStatus::kEmpty;
    }
    out = std::move(s.items.front());
    s.items.pop_front();
    s.not_full.notify_one();
    return ReceiveStatus::kOk;
  }

  // Discards the consumer side; a blocked sender returns kClosed.
  void Close() {
    if (!state_) return;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->receiver_closed = true;
      state_->items.clear();
    }
    state_->not_full.notify_all();
  }

  size_t size() const {
    if (!state_) return 0;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->items.size();
  }

  bool valid() const { return state_ != nullptr; }

 private:
  std::shared_ptr<detail::ChannelState<T>> state_;
};

// Creates a bounded channel bound to `stop`. Throws std::invalid_argument for
// a zero capacity.
template <typename T>
std::pair<ChannelSender<T>, ChannelReceiver<T>> MakeChannel(size_t capacity,
                                                            ShutdownCoordinator stop) {
  if (capacity == 0) {
    throw std::invalid_argument("channel capacity must be > 0");
  }
  auto state = std::make_shared<detail::ChannelState<T>>(capacity, stop);
  std::weak_ptr<detail::ChannelState<T>> weak = state;
  state->waker_id = state->stop.AddWaker([weak] {
    if (auto s = weak.lock()) s->Wake();
  });
  return {ChannelSender<T>(state), ChannelReceiver<T>(state)};
}

}  // namespace peerlink::core

#endif  // PEERLINK_CORE_CHANNEL_HPP_
