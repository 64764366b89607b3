// Repository: PeerLink
// Component: UdpTransport
// Purpose: Datagram transport multiplexing the session's tracks over one
//          UDP socket, with a HELLO handshake, keep-alives and BYE.
// Copyright (c) 2026 PeerLink
//
// Wire format: every datagram is [track id : 1 byte][payload : <= 1200 bytes].
// Control track payload is one message byte (HELLO, HELLO_ACK, KEEPALIVE, BYE).
//
// Lifecycle:
//   Bind()    -> socket bound (port 0 picks an ephemeral port)
//   Open()    -> reader thread started; HELLO repeated until the peer answers
//   Connected -> first HELLO/HELLO_ACK or data datagram from the peer
//   Failed    -> no peer traffic within connect_timeout / peer_timeout
//   Closed    -> BYE received
//   Close()   -> BYE sent, reader joined, socket closed
//
// Without a configured peer the transport listens and adopts the sender of
// the first HELLO as its peer.

#ifndef PEERLINK_TRANSPORT_UDP_TRANSPORT_HPP_
#define PEERLINK_TRANSPORT_UDP_TRANSPORT_HPP_

#include <netinet/in.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>

#include "peerlink/core/ShutdownCoordinator.hpp"
#include "peerlink/transport/ITransport.hpp"

namespace peerlink::transport {

struct UdpTransportConfig {
  std::string bind_host = "0.0.0.0";
  uint16_t bind_port = 0;

  // Empty peer_host: learn the peer from the first HELLO.
  std::string peer_host;
  uint16_t peer_port = 0;

  std::chrono::milliseconds hello_interval{250};
  std::chrono::milliseconds keepalive_interval{1000};
  std::chrono::milliseconds peer_timeout{10000};
  // Zero waits for the peer forever.
  std::chrono::milliseconds connect_timeout{0};
  std::chrono::milliseconds poll_interval{100};

  // Per-track ingress queue depth; datagrams beyond it are dropped.
  size_t ingress_queue_capacity = 256;
};

class UdpTransport : public ITransport {
 public:
  UdpTransport(UdpTransportConfig config, core::ShutdownCoordinator stop);
  ~UdpTransport() override;

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  // Creates and binds the socket. Called by Open() when not done already.
  bool Bind(std::string* error);

  // Bound port (after Bind()), 0 before.
  uint16_t LocalPort() const;

  // ITransport
  bool Open(core::ChannelSender<SessionEvent> events, std::string* error) override;
  void Close() override;
  // kControl is reserved for the handshake; Writer/Reader return nullptr for it.
  // Writers refer back to this transport and must not outlive it.
  std::shared_ptr<ITrackWriter> Writer(TrackId track) override;
  std::shared_ptr<ITrackReader> Reader(TrackId track) override;

  bool connected() const { return connected_.load(std::memory_order_acquire); }
  uint64_t dropped_datagrams() const { return dropped_.load(std::memory_order_relaxed); }

 private:
  class TrackQueue;
  class UdpTrackWriter;
  class UdpTrackReader;

  enum class ControlMessage : uint8_t {
    kHello = 1,
    kHelloAck = 2,
    kKeepAlive = 3,
    kBye = 4,
  };

  void ReaderLoop();
  // Returns false when the loop must end.
  bool HandleDatagram(const uint8_t* data, size_t len, const sockaddr_in& from);
  bool HandleControl(ControlMessage msg);
  void MarkConnected();
  void Emit(SessionEvent event);

  bool SendDatagram(TrackId track, const uint8_t* payload, size_t len, std::string* error);
  void SendControl(ControlMessage msg);

  bool HasPeer() const;

  UdpTransportConfig config_;
  core::ShutdownCoordinator stop_;

  // Writers hold the shared side while sending; Close() takes it exclusively.
  mutable std::shared_mutex fd_mutex_;
  int fd_ = -1;
  uint16_t local_port_ = 0;

  mutable std::mutex peer_mutex_;
  bool has_peer_ = false;
  sockaddr_in peer_addr_{};

  core::ChannelSender<SessionEvent> events_;  // Reader thread only after Open()
  std::thread reader_thread_;
  std::atomic<bool> opened_{false};
  std::atomic<bool> closing_{false};
  std::atomic<bool> connected_{false};
  std::atomic<uint64_t> dropped_{0};

  std::array<std::shared_ptr<TrackQueue>, kTrackCount> queues_;
  // Reader thread only.
  std::array<bool, kTrackCount> track_seen_{};
  std::chrono::steady_clock::time_point last_peer_rx_{};
};

}  // namespace peerlink::transport

#endif  // PEERLINK_TRANSPORT_UDP_TRANSPORT_HPP_
