// Repository: VidSync
// Component: Thread-Safe Logger
// Purpose: Mutex-protected, timestamped log emission shared by all threads.
// Copyright (c) 2026 VidSync

#ifndef VIDSYNC_UTIL_LOGGER_HPP_
#define VIDSYNC_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace vidsync::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the multicast listener, transfer worker and decoder
// watcher never interleave.
//
// Every line is prefixed with "<UTC timestamp> [LEVEL] ".
//
// Info  -> stdout (normal operational logs)
// Debug -> stdout only when enabled (--verbose or VIDSYNC_DEBUG env)
// Warn  -> stderr (rejected commands, degraded but recoverable conditions)
// Error -> stderr (I/O failures, decoder faults)
//
// Test-only: SetErrorSink / SetWarnSink install callbacks invoked with the
// unprefixed message for every Error() / Warn() line.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetDebugEnabled(bool enabled);
  static bool DebugEnabled();

  // Call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);

 private:
  static std::string Prefix(const char* level);

  static std::mutex mutex_;
  static bool debug_enabled_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
};

}  // namespace vidsync::util

#endif  // VIDSYNC_UTIL_LOGGER_HPP_
