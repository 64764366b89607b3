// Repository: PeerLink
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by every pump and backend thread.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_UTIL_LOGGER_HPP_
#define PEERLINK_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace peerlink::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from concurrent pumps, capture threads, the transport
// reader and gRPC handlers never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when PEERLINK_DEBUG env is set
// Warn  → stderr (transient faults, degraded but recoverable)
// Error → stderr (fatal verdicts, setup failures)
//
// Test-only: SetErrorSink / SetInfoSink install a callback invoked for every
// Error() / Info() line (in addition to the stream). Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static bool DebugEnabled();

  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace peerlink::util

#endif  // PEERLINK_UTIL_LOGGER_HPP_
