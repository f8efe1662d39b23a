// Repository: VidSync
// Component: Player Service
// Purpose: Main entry point for the synchronized video player.
// Copyright (c) 2026 VidSync

#include <sys/stat.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#include "vidsync/config/PlayerConfig.h"
#include "vidsync/runtime/PlayerCoordinator.h"
#include "vidsync/util/Logger.hpp"

namespace {

using vidsync::util::Logger;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// mkdir -p for the directory part of path.
bool EnsureParentDirectory(const std::string& path) {
  const auto slash = path.find_last_of('/');
  if (slash == std::string::npos || slash == 0) {
    return true;
  }
  const std::string dir = path.substr(0, slash);
  for (size_t pos = 1; pos <= dir.size(); ++pos) {
    if (pos != dir.size() && dir[pos] != '/') continue;
    const std::string prefix = dir.substr(0, pos);
    if (mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) {
      Logger::Error("Cannot create directory " + prefix + ": " + std::strerror(errno));
      return false;
    }
  }
  return true;
}

int RunPlayer(const vidsync::config::PlayerConfig& config) {
  if (!EnsureParentDirectory(config.video_path) ||
      !EnsureParentDirectory(config.EffectiveTempPath())) {
    return 1;
  }

  vidsync::runtime::PlayerCoordinator coordinator(config);
  if (!coordinator.Start()) {
    Logger::Error("Failed to start player; see errors above");
    return 1;
  }

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  Logger::Info("Shutdown requested");
  coordinator.Stop();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  const auto parsed = vidsync::config::ParsePlayerArgs(argc, argv);
  if (parsed.help) {
    vidsync::config::PrintUsage(argv[0]);
    return 0;
  }
  if (!parsed.valid) {
    std::cerr << "Error: " << parsed.error << "\n\n";
    vidsync::config::PrintUsage(argv[0]);
    return 2;
  }

  Logger::SetDebugEnabled(parsed.config.verbose || Logger::DebugEnabled());

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  // Writes to the decoder FIFO or a vanished transfer client report EPIPE.
  std::signal(SIGPIPE, SIG_IGN);

  try {
    return RunPlayer(parsed.config);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
