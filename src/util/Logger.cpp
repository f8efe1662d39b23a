// Repository: VidSync
// Component: Thread-Safe Logger
// Purpose: Mutex-protected, timestamped log emission shared by all threads.
// Copyright (c) 2026 VidSync

#include "vidsync/util/Logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace vidsync::util {

std::mutex Logger::mutex_;
bool Logger::debug_enabled_ = std::getenv("VIDSYNC_DEBUG") != nullptr;
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;

std::string Logger::Prefix(const char* level) {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count();
  time_t s = static_cast<time_t>(ms / 1000);
  int frac_ms = static_cast<int>(ms % 1000);
  struct tm tm;
  if (gmtime_r(&s, &tm) == nullptr) {
    return std::string("[") + level + "] ";
  }
  char buf[64];
  int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ [%s] ",
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                   tm.tm_min, tm.tm_sec, frac_ms, level);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) {
    return std::string("[") + level + "] ";
  }
  return std::string(buf, static_cast<size_t>(n));
}

void Logger::SetDebugEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  debug_enabled_ = enabled;
}

bool Logger::DebugEnabled() {
  std::lock_guard<std::mutex> lock(mutex_);
  return debug_enabled_;
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) {
  const std::string prefix = Prefix("INFO");
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << prefix << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  const std::string prefix = Prefix("DEBUG");
  std::lock_guard<std::mutex> lock(mutex_);
  if (!debug_enabled_) return;
  std::cout << prefix << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  const std::string prefix = Prefix("WARNING");
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  std::cerr << prefix << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  const std::string prefix = Prefix("ERROR");
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << prefix << line << '\n';
  std::cerr.flush();
}

}  // namespace vidsync::util
