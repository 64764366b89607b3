// Repository: PeerLink
// Component: InputEvent
// Purpose: Remote input events and their text wire format.
// Copyright (c) 2026 PeerLink

#include "peerlink/input/InputEvent.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace peerlink::input {

namespace {

bool ParseInt(const std::string& text, int32_t min, int32_t max, int32_t* out) {
  if (text.empty()) return false;
  size_t pos = 0;
  long value = 0;
  try {
    value = std::stol(text, &pos, 10);
  } catch (const std::exception&) {
    return false;
  }
  if (pos != text.size() || value < min || value > max) return false;
  *out = static_cast<int32_t>(value);
  return true;
}

const char* Verb(InputKind kind) {
  switch (kind) {
    case InputKind::kKeyPress:
      return "kp";
    case InputKind::kKeyRelease:
      return "kr";
    case InputKind::kMousePress:
      return "mp";
    case InputKind::kMouseRelease:
      return "mr";
    case InputKind::kMouseMove:
      return "mm";
  }
  return "??";
}

}  // namespace

std::string Encode(const InputEvent& event) {
  std::string out = Verb(event.kind);
  if (event.kind == InputKind::kMouseMove) {
    out += " " + std::to_string(event.dx) + " " + std::to_string(event.dy);
  } else {
    out += " " + std::to_string(event.code);
  }
  return out;
}

std::optional<InputEvent> Decode(const std::string& text, std::string* error) {
  std::istringstream is(text);
  std::vector<std::string> tokens;
  std::string token;
  while (is >> token) tokens.push_back(token);

  if (tokens.empty()) {
    *error = "empty input event";
    return std::nullopt;
  }

  InputEvent event;
  const std::string& verb = tokens[0];
  if (verb == "mm") {
    event.kind = InputKind::kMouseMove;
    constexpr int32_t kMaxDelta = 100000;
    if (tokens.size() != 3 || !ParseInt(tokens[1], -kMaxDelta, kMaxDelta, &event.dx) ||
        !ParseInt(tokens[2], -kMaxDelta, kMaxDelta, &event.dy)) {
      *error = "mouse move expects 'mm <dx> <dy>', got '" + text + "'";
      return std::nullopt;
    }
    return event;
  }

  int32_t max = 0;
  if (verb == "kp" || verb == "kr") {
    event.kind = verb == "kp" ? InputKind::kKeyPress : InputKind::kKeyRelease;
    max = kMaxKeyCode;
  } else if (verb == "mp" || verb == "mr") {
    event.kind = verb == "mp" ? InputKind::kMousePress : InputKind::kMouseRelease;
    max = kMaxMouseButton;
  } else {
    *error = "unknown input verb '" + verb + "'";
    return std::nullopt;
  }
  if (tokens.size() != 2 || !ParseInt(tokens[1], 0, max, &event.code)) {
    *error = "'" + verb + "' expects one code in [0, " + std::to_string(max) + "], got '" +
             text + "'";
    return std::nullopt;
  }
  return event;
}

}  // namespace peerlink::input
