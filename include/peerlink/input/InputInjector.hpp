// Repository: PeerLink
// Component: InputInjector
// Purpose: Applies remote input on the capture peer, and the ingress sink
//          that feeds it.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_INPUT_INPUT_INJECTOR_HPP_
#define PEERLINK_INPUT_INPUT_INJECTOR_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "peerlink/input/InputEvent.hpp"
#include "peerlink/pump/FramePorts.hpp"

namespace peerlink::input {

class IInputInjector {
 public:
  virtual ~IInputInjector() = default;
  virtual bool Inject(const InputEvent& event, std::string* error) = 0;
};

// Logs every event; stands in for OS-level injection.
class LoggingInputInjector : public IInputInjector {
 public:
  bool Inject(const InputEvent& event, std::string* error) override;

  uint64_t injected() const { return injected_.load(std::memory_order_relaxed); }

 private:
  std::atomic<uint64_t> injected_{0};
};

// Input ingress sink: a frame that does not decode to an event, or an
// injection failure, is one pump failure. Zero mouse moves are dropped.
class InjectingSink : public pump::IFrameSink {
 public:
  explicit InjectingSink(std::shared_ptr<IInputInjector> injector);

  pump::PutResult TryPut(core::Frame&& frame) override;

 private:
  std::shared_ptr<IInputInjector> injector_;
};

}  // namespace peerlink::input

#endif  // PEERLINK_INPUT_INPUT_INJECTOR_HPP_
