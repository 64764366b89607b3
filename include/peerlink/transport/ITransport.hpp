// Repository: PeerLink
// Component: ITransport
// Purpose: Narrow seam between sessions and a concrete peer transport.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_TRANSPORT_ITRANSPORT_HPP_
#define PEERLINK_TRANSPORT_ITRANSPORT_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "peerlink/core/Channel.hpp"
#include "peerlink/core/Frame.hpp"
#include "peerlink/transport/SessionEvent.hpp"

namespace peerlink::transport {

// Logical tracks multiplexed over one transport. Values are wire ids.
enum class TrackId : uint8_t {
  kControl = 0,
  kAudio = 1,
  kVideo = 2,
  kInput = 3,
  kLatency = 4,
};

inline constexpr size_t kTrackCount = 5;

// Largest payload one Write() accepts.
inline constexpr size_t kMaxPayloadBytes = 1200;

const char* ToString(TrackId track);

// Data-channel label for kInput/kLatency; empty for media tracks.
std::string ChannelLabel(TrackId track);

std::optional<TrackId> TrackFromWire(uint8_t id);

enum class ReadStatus {
  kOk,
  kTimeout,  // Nothing arrived within the timeout
  kClosed,   // Transport closed; no more data
  kError,
};

struct ReadResult {
  ReadStatus status = ReadStatus::kTimeout;
  core::Frame frame;
  std::string error;
};

struct WriteResult {
  bool ok = true;
  std::string error;
};

class ITrackWriter {
 public:
  virtual ~ITrackWriter() = default;
  virtual WriteResult Write(const core::Frame& frame) = 0;
};

class ITrackReader {
 public:
  virtual ~ITrackReader() = default;
  virtual ReadResult Read(std::chrono::milliseconds timeout) = 0;
};

// A transport delivers lifecycle events to exactly one consumer (the session
// event loop) and exposes one writer and one reader per track.
class ITransport {
 public:
  virtual ~ITransport() = default;

  // Starts the transport. Returns false with *error set when it cannot be
  // brought up; that is a session setup failure.
  virtual bool Open(core::ChannelSender<SessionEvent> events, std::string* error) = 0;

  // Idempotent. Pending Read() calls return kClosed.
  virtual void Close() = 0;

  virtual std::shared_ptr<ITrackWriter> Writer(TrackId track) = 0;
  virtual std::shared_ptr<ITrackReader> Reader(TrackId track) = 0;
};

}  // namespace peerlink::transport

#endif  // PEERLINK_TRANSPORT_ITRANSPORT_HPP_
