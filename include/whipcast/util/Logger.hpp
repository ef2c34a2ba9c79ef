// Repository: Whipcast
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the event loop, capture
//          threads, the I/O worker and gRPC handlers.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_UTIL_LOGGER_HPP_
#define WHIPCAST_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace whipcast::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the event loop, capture threads and libdatachannel
// callbacks never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when WHIPCAST_DEBUG env is set (verbose investigation)
// Warn  → stderr (degraded but recoverable: device fallback, ICE restart)
// Error → stderr (hard faults: retry exhaustion, rejected requests)
//
// Test-only: the sinks receive every line of their level in addition to the
// stream. Contract tests use them to assert on warnings and failures.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Call with nullptr to clear.
  static void SetErrorSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetInfoSink(Sink sink);

  static bool DebugEnabled();

 private:
  static std::mutex mutex_;
  static Sink error_sink_;
  static Sink warn_sink_;
  static Sink info_sink_;
};

}  // namespace whipcast::util

#endif  // WHIPCAST_UTIL_LOGGER_HPP_
