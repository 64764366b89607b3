// Repository: PeerLink
// Component: UdpTransport
// Purpose: Datagram transport multiplexing session tracks over one socket.
// Copyright (c) 2026 PeerLink

#include "peerlink/transport/UdpTransport.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <vector>

#include "peerlink/util/Logger.hpp"

namespace peerlink::transport {

using util::Logger;

namespace {

std::string ErrnoText(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

bool ResolveIpv4(const std::string& host, uint16_t port, sockaddr_in* out, std::string* error) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;
  addrinfo* result = nullptr;
  const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
  if (rc != 0 || result == nullptr) {
    *error = "cannot resolve '" + host + "': " + ::gai_strerror(rc);
    return false;
  }
  *out = *reinterpret_cast<const sockaddr_in*>(result->ai_addr);
  out->sin_port = htons(port);
  ::freeaddrinfo(result);
  return true;
}

std::string FormatAddr(const sockaddr_in& addr) {
  char text[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text));
  return std::string(text) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // namespace

// =============================================================================
// TrackQueue: bounded ingress queue for one track
// =============================================================================

class UdpTransport::TrackQueue {
 public:
  explicit TrackQueue(size_t capacity) : capacity_(capacity) {}

  // False when full or closed; the datagram is dropped.
  bool Push(core::Frame frame) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_ || items_.size() >= capacity_) return false;
      items_.push_back(std::move(frame));
    }
    cv_.notify_one();
    return true;
  }

  ReadResult Pop(std::chrono::milliseconds timeout) {
    ReadResult result;
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); })) {
      result.status = ReadStatus::kTimeout;
      return result;
    }
    if (!items_.empty()) {
      result.status = ReadStatus::kOk;
      result.frame = std::move(items_.front());
      items_.pop_front();
      return result;
    }
    result.status = ReadStatus::kClosed;
    return result;
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<core::Frame> items_;
  const size_t capacity_;
  bool closed_ = false;
};

class UdpTransport::UdpTrackWriter : public ITrackWriter {
 public:
  UdpTrackWriter(UdpTransport* owner, TrackId track) : owner_(owner), track_(track) {}

  WriteResult Write(const core::Frame& frame) override {
    WriteResult result;
    if (owner_->closing_.load(std::memory_order_acquire)) {
      result.ok = false;
      result.error = "transport closed";
      return result;
    }
    if (frame.size() > kMaxPayloadBytes) {
      result.ok = false;
      result.error = "payload too large (" + std::to_string(frame.size()) + " > " +
                     std::to_string(kMaxPayloadBytes) + ")";
      return result;
    }
    std::string error;
    if (!owner_->SendDatagram(track_, frame.data.data(), frame.size(), &error)) {
      result.ok = false;
      result.error = error;
    }
    return result;
  }

 private:
  UdpTransport* owner_;
  TrackId track_;
};

class UdpTransport::UdpTrackReader : public ITrackReader {
 public:
  explicit UdpTrackReader(std::shared_ptr<TrackQueue> queue) : queue_(std::move(queue)) {}

  ReadResult Read(std::chrono::milliseconds timeout) override { return queue_->Pop(timeout); }

 private:
  std::shared_ptr<TrackQueue> queue_;
};

// =============================================================================
// UdpTransport
// =============================================================================

UdpTransport::UdpTransport(UdpTransportConfig config, core::ShutdownCoordinator stop)
    : config_(std::move(config)), stop_(std::move(stop)) {
  for (auto& queue : queues_) {
    queue = std::make_shared<TrackQueue>(config_.ingress_queue_capacity);
  }
}

UdpTransport::~UdpTransport() {
  Close();
}

bool UdpTransport::Bind(std::string* error) {
  if (fd_ >= 0) return true;

  int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    *error = ErrnoText("socket");
    return false;
  }
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    *error = ErrnoText("fcntl(O_NONBLOCK)");
    ::close(fd);
    return false;
  }

  sockaddr_in local{};
  if (!ResolveIpv4(config_.bind_host, config_.bind_port, &local, error)) {
    ::close(fd);
    return false;
  }
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) < 0) {
    *error = ErrnoText("bind");
    ::close(fd);
    return false;
  }
  socklen_t len = sizeof(local);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) < 0) {
    *error = ErrnoText("getsockname");
    ::close(fd);
    return false;
  }

  if (!config_.peer_host.empty()) {
    sockaddr_in peer{};
    if (!ResolveIpv4(config_.peer_host, config_.peer_port, &peer, error)) {
      ::close(fd);
      return false;
    }
    std::lock_guard<std::mutex> lock(peer_mutex_);
    peer_addr_ = peer;
    has_peer_ = true;
  }

  {
    std::unique_lock<std::shared_mutex> lock(fd_mutex_);
    fd_ = fd;
  }
  local_port_ = ntohs(local.sin_port);
  Logger::Info("[UdpTransport] BOUND addr=" + FormatAddr(local));
  return true;
}

uint16_t UdpTransport::LocalPort() const {
  return local_port_;
}

bool UdpTransport::Open(core::ChannelSender<SessionEvent> events, std::string* error) {
  if (opened_.load(std::memory_order_acquire)) {
    *error = "transport already opened";
    return false;
  }
  if (closing_.load(std::memory_order_acquire)) {
    *error = "transport closed";
    return false;
  }
  if (!Bind(error)) {
    return false;
  }
  events_ = std::move(events);
  opened_.store(true, std::memory_order_release);
  reader_thread_ = std::thread(&UdpTransport::ReaderLoop, this);
  return true;
}

void UdpTransport::Close() {
  bool expected = false;
  if (!closing_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }
  if (connected_.load(std::memory_order_acquire)) {
    SendControl(ControlMessage::kBye);
  }
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
  {
    std::unique_lock<std::shared_mutex> lock(fd_mutex_);
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }
  for (auto& queue : queues_) {
    queue->Close();
  }
  events_.Close();
  if (opened_.load(std::memory_order_acquire)) {
    Logger::Info("[UdpTransport] CLOSED dropped=" + std::to_string(dropped_.load()));
  }
}

std::shared_ptr<ITrackWriter> UdpTransport::Writer(TrackId track) {
  if (track == TrackId::kControl) return nullptr;
  return std::make_shared<UdpTrackWriter>(this, track);
}

std::shared_ptr<ITrackReader> UdpTransport::Reader(TrackId track) {
  if (track == TrackId::kControl) return nullptr;
  return std::make_shared<UdpTrackReader>(queues_[static_cast<size_t>(track)]);
}

bool UdpTransport::HasPeer() const {
  std::lock_guard<std::mutex> lock(peer_mutex_);
  return has_peer_;
}

bool UdpTransport::SendDatagram(TrackId track, const uint8_t* payload, size_t len,
                                std::string* error) {
  sockaddr_in peer{};
  {
    std::lock_guard<std::mutex> lock(peer_mutex_);
    if (!has_peer_) {
      *error = "no peer";
      return false;
    }
    peer = peer_addr_;
  }

  std::vector<uint8_t> datagram(len + 1);
  datagram[0] = static_cast<uint8_t>(track);
  if (len > 0) {
    std::memcpy(datagram.data() + 1, payload, len);
  }

  std::shared_lock<std::shared_mutex> lock(fd_mutex_);
  if (fd_ < 0) {
    *error = "socket closed";
    return false;
  }
  const ssize_t sent = ::sendto(fd_, datagram.data(), datagram.size(), 0,
                                reinterpret_cast<const sockaddr*>(&peer), sizeof(peer));
  if (sent < 0) {
    *error = (errno == EAGAIN || errno == EWOULDBLOCK) ? "send would block"
                                                       : ErrnoText("sendto");
    return false;
  }
  return true;
}

void UdpTransport::SendControl(ControlMessage msg) {
  const uint8_t byte = static_cast<uint8_t>(msg);
  std::string error;
  if (!SendDatagram(TrackId::kControl, &byte, 1, &error)) {
    Logger::Debug("[UdpTransport] CONTROL_SEND_FAILED msg=" + std::to_string(byte) +
                  " error=" + error);
  }
}

void UdpTransport::Emit(SessionEvent event) {
  const std::string text = Describe(event);
  const core::SendStatus status = events_.Send(std::move(event));
  if (status != core::SendStatus::kOk) {
    Logger::Debug("[UdpTransport] EVENT_DROPPED event=" + text);
  }
}

void UdpTransport::MarkConnected() {
  if (!connected_.exchange(true, std::memory_order_acq_rel)) {
    Logger::Info("[UdpTransport] CONNECTED");
    Emit(Connected{});
  }
}

bool UdpTransport::HandleControl(ControlMessage msg) {
  switch (msg) {
    case ControlMessage::kHello:
      SendControl(ControlMessage::kHelloAck);
      MarkConnected();
      return true;
    case ControlMessage::kHelloAck:
      MarkConnected();
      return true;
    case ControlMessage::kKeepAlive:
      return true;
    case ControlMessage::kBye:
      Logger::Info("[UdpTransport] PEER_BYE");
      Emit(Closed{"peer closed the session"});
      return false;
  }
  Logger::Debug("[UdpTransport] UNKNOWN_CONTROL msg=" +
                std::to_string(static_cast<int>(msg)));
  return true;
}

bool UdpTransport::HandleDatagram(const uint8_t* data, size_t len, const sockaddr_in& from) {
  if (len < 1) return true;
  const auto track = TrackFromWire(data[0]);
  if (!track) {
    Logger::Debug("[UdpTransport] UNKNOWN_TRACK id=" + std::to_string(data[0]));
    return true;
  }

  {
    std::lock_guard<std::mutex> lock(peer_mutex_);
    if (!has_peer_) {
      const bool hello = *track == TrackId::kControl && len >= 2 &&
                         data[1] == static_cast<uint8_t>(ControlMessage::kHello);
      if (!hello) return true;
      peer_addr_ = from;
      has_peer_ = true;
      Logger::Info("[UdpTransport] PEER_LEARNED addr=" + FormatAddr(from));
    } else if (from.sin_addr.s_addr != peer_addr_.sin_addr.s_addr ||
               from.sin_port != peer_addr_.sin_port) {
      return true;
    }
  }
  last_peer_rx_ = std::chrono::steady_clock::now();

  if (*track == TrackId::kControl) {
    if (len < 2) return true;
    return HandleControl(static_cast<ControlMessage>(data[1]));
  }

  // Media before the handshake completed still proves the peer is there.
  MarkConnected();

  const size_t index = static_cast<size_t>(*track);
  if (!track_seen_[index]) {
    track_seen_[index] = true;
    if (*track == TrackId::kAudio) {
      Emit(TrackOpened{pump::StreamRole::kAudioIngress});
    } else if (*track == TrackId::kVideo) {
      Emit(TrackOpened{pump::StreamRole::kVideoIngress});
    } else {
      Emit(ChannelOpened{ChannelLabel(*track)});
    }
  }

  if (!queues_[index]->Push(core::Frame(std::vector<uint8_t>(data + 1, data + len)))) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
  }
  return true;
}

void UdpTransport::ReaderLoop() {
  stop_.RegisterTask("udp-reader");
  Logger::Info("[UdpTransport] READER_START port=" + std::to_string(local_port_));

  using Clock = std::chrono::steady_clock;
  const auto opened_at = Clock::now();
  auto last_hello = Clock::time_point{};
  auto last_keepalive = opened_at;
  last_peer_rx_ = opened_at;

  std::vector<uint8_t> buffer(1 + kMaxPayloadBytes + 64);
  bool running = true;

  while (running && !closing_.load(std::memory_order_acquire) && !stop_.IsStopRequested()) {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, static_cast<int>(config_.poll_interval.count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      Emit(Failed{ErrnoText("poll")});
      break;
    }

    if (rc > 0 && (pfd.revents & POLLIN)) {
      while (running) {
        sockaddr_in from{};
        socklen_t from_len = sizeof(from);
        const ssize_t n = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                     reinterpret_cast<sockaddr*>(&from), &from_len);
        if (n < 0) {
          if (errno != EAGAIN && errno != EWOULDBLOCK && errno != ECONNREFUSED) {
            Logger::Warn("[UdpTransport] RECV_ERROR " + ErrnoText("recvfrom"));
          }
          break;
        }
        running = HandleDatagram(buffer.data(), static_cast<size_t>(n), from);
      }
    }
    if (!running) break;

    const auto now = Clock::now();
    if (!connected_.load(std::memory_order_acquire)) {
      if (HasPeer() && now - last_hello >= config_.hello_interval) {
        SendControl(ControlMessage::kHello);
        last_hello = now;
      }
      if (config_.connect_timeout.count() > 0 && now - opened_at >= config_.connect_timeout) {
        Logger::Warn("[UdpTransport] CONNECT_TIMEOUT");
        Emit(Failed{"peer did not answer within connect timeout"});
        break;
      }
    } else {
      if (now - last_keepalive >= config_.keepalive_interval) {
        SendControl(ControlMessage::kKeepAlive);
        last_keepalive = now;
      }
      if (now - last_peer_rx_ >= config_.peer_timeout) {
        Logger::Warn("[UdpTransport] PEER_TIMEOUT");
        Emit(Failed{"peer timed out"});
        break;
      }
    }
  }

  for (auto& queue : queues_) {
    queue->Close();
  }
  Logger::Info("[UdpTransport] READER_EXIT");
}

}  // namespace peerlink::transport
