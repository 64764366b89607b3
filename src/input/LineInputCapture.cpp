// Repository: PeerLink
// Component: LineInputCapture
// Purpose: Input capture backend reading text events from a descriptor.
// Copyright (c) 2026 PeerLink

#include "peerlink/input/LineInputCapture.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "peerlink/input/InputEvent.hpp"
#include "peerlink/util/Logger.hpp"

namespace peerlink::input {

using util::Logger;

LineInputCapture::LineInputCapture(int fd, core::ChannelSender<core::Frame> out,
                                   core::ShutdownCoordinator stop,
                                   std::chrono::milliseconds poll_interval)
    : fd_(fd), out_(std::move(out)), stop_(std::move(stop)), poll_interval_(poll_interval) {}

LineInputCapture::~LineInputCapture() {
  Join();
}

void LineInputCapture::Start() {
  thread_ = std::thread(&LineInputCapture::Run, this);
}

void LineInputCapture::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void LineInputCapture::RejectOverlong(size_t length) {
  lines_rejected_.fetch_add(1, std::memory_order_relaxed);
  Logger::Warn("[LineInputCapture] REJECTED length=" + std::to_string(length) +
               " error=line longer than " + std::to_string(kMaxLineBytes) + " bytes");
}

bool LineInputCapture::HandleLine(const std::string& line) {
  if (line.size() > kMaxLineBytes) {
    RejectOverlong(line.size());
    return true;
  }
  if (line.find_first_not_of(" \t\r") == std::string::npos) return true;

  std::string error;
  const auto event = Decode(line, &error);
  if (!event) {
    lines_rejected_.fetch_add(1, std::memory_order_relaxed);
    Logger::Warn("[LineInputCapture] REJECTED line='" + line + "' error=" + error);
    return true;
  }
  if (event->IsNoOp()) return true;

  if (out_.Send(core::Frame::FromString(Encode(*event))) != core::SendStatus::kOk) {
    return false;
  }
  events_sent_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

void LineInputCapture::Run() {
  stop_.RegisterTask("input-capture");
  Logger::Info("[LineInputCapture] START fd=" + std::to_string(fd_));

  const char* reason = "stopped";
  std::string pending;
  bool discarding = false;  // inside an over-long line, waiting for its newline
  char buffer[512];

  while (!stop_.IsStopRequested()) {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, static_cast<int>(poll_interval_.count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      Logger::Warn(std::string("[LineInputCapture] POLL_FAILED error=") + std::strerror(errno));
      reason = "poll_failed";
      break;
    }
    if (rc == 0) continue;

    const ssize_t n = ::read(fd_, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      Logger::Warn(std::string("[LineInputCapture] READ_FAILED error=") + std::strerror(errno));
      reason = "read_failed";
      break;
    }
    if (n == 0) {
      const bool open = discarding || pending.empty() || HandleLine(pending);
      reason = open ? "end_of_input" : "channel_closed";
      break;
    }

    pending.append(buffer, static_cast<size_t>(n));
    size_t newline = 0;
    bool open = true;
    while (open && (newline = pending.find('\n')) != std::string::npos) {
      if (discarding) {
        discarding = false;
      } else {
        open = HandleLine(pending.substr(0, newline));
      }
      pending.erase(0, newline + 1);
    }
    if (discarding) {
      pending.clear();
    } else if (pending.size() > kMaxLineBytes) {
      RejectOverlong(pending.size());
      pending.clear();
      discarding = true;
    }
    if (!open) {
      reason = "channel_closed";
      break;
    }
  }

  out_.Close();
  Logger::Info(std::string("[LineInputCapture] EXIT reason=") + reason +
               " sent=" + std::to_string(events_sent_.load()) +
               " rejected=" + std::to_string(lines_rejected_.load()));
}

}  // namespace peerlink::input
