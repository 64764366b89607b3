// Repository: PeerLink
// Component: InputInjector
// Purpose: Applies remote input on the capture peer.
// Copyright (c) 2026 PeerLink

#include "peerlink/input/InputInjector.hpp"

#include <stdexcept>
#include <utility>

#include "peerlink/util/Logger.hpp"

namespace peerlink::input {

using util::Logger;

bool LoggingInputInjector::Inject(const InputEvent& event, std::string* /*error*/) {
  injected_.fetch_add(1, std::memory_order_relaxed);
  Logger::Info("[InputInjector] INJECT event='" + Encode(event) + "'");
  return true;
}

InjectingSink::InjectingSink(std::shared_ptr<IInputInjector> injector)
    : injector_(std::move(injector)) {
  if (!injector_) {
    throw std::invalid_argument("InjectingSink requires an injector");
  }
}

pump::PutResult InjectingSink::TryPut(core::Frame&& frame) {
  std::string error;
  const auto event = Decode(frame.AsString(), &error);
  if (!event) {
    return pump::PutResult::Fail(error);
  }
  if (event->IsNoOp()) {
    return pump::PutResult::Ok();
  }
  if (!injector_->Inject(*event, &error)) {
    return pump::PutResult::Fail("inject: " + error);
  }
  return pump::PutResult::Ok();
}

}  // namespace peerlink::input
