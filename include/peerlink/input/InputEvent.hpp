// Repository: PeerLink
// Component: InputEvent
// Purpose: Remote input events and their text wire format.
// Copyright (c) 2026 PeerLink
//
// Wire/console format, one event per message or line:
//   kp <key>      key press        kr <key>      key release
//   mp <button>   mouse press      mr <button>   mouse release
//   mm <dx> <dy>  relative mouse move
// Buttons: 0 left, 1 right, 2 middle, 3 X1, 4 X2.

#ifndef PEERLINK_INPUT_INPUT_EVENT_HPP_
#define PEERLINK_INPUT_INPUT_EVENT_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace peerlink::input {

enum class InputKind {
  kKeyPress,
  kKeyRelease,
  kMousePress,
  kMouseRelease,
  kMouseMove,
};

struct InputEvent {
  InputKind kind = InputKind::kKeyPress;
  int32_t code = 0;  // Key code or mouse button
  int32_t dx = 0;
  int32_t dy = 0;

  bool IsNoOp() const { return kind == InputKind::kMouseMove && dx == 0 && dy == 0; }
};

inline constexpr int32_t kMaxMouseButton = 4;
inline constexpr int32_t kMaxKeyCode = 255;

std::string Encode(const InputEvent& event);

// Returns nullopt with *error set for anything that is not exactly one
// well-formed event (surrounding whitespace is ignored).
std::optional<InputEvent> Decode(const std::string& text, std::string* error);

}  // namespace peerlink::input

#endif  // PEERLINK_INPUT_INPUT_EVENT_HPP_
