// Repository: VidSync
// Component: Multicast Command Listener
// Purpose: Receives PLAY/STOP/LOAD/GO trigger datagrams on a multicast group.
// Copyright (c) 2026 VidSync

#ifndef VIDSYNC_NETWORK_MULTICAST_COMMAND_LISTENER_H_
#define VIDSYNC_NETWORK_MULTICAST_COMMAND_LISTENER_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

#include "vidsync/runtime/Command.h"

namespace vidsync::network {

// Receives connectionless trigger datagrams. One datagram is one command.
// Malformed payloads are logged and dropped; nothing is ever sent back.
//
// The receive thread wakes at least once per kReceiveTimeout so Stop()
// returns promptly.
class MulticastCommandListener {
 public:
  using CommandHandler = std::function<void(runtime::Command command)>;

  static constexpr size_t kMaxDatagramBytes = 1024;
  static constexpr int kReceiveTimeoutMs = 1000;
  // Unknown payloads warn on the first discard and every Nth after it; the
  // rest go to debug.
  static constexpr uint64_t kDiscardWarnInterval = 100;

  MulticastCommandListener(std::string group, uint16_t port, CommandHandler handler);
  ~MulticastCommandListener();

  MulticastCommandListener(const MulticastCommandListener&) = delete;
  MulticastCommandListener& operator=(const MulticastCommandListener&) = delete;

  // Binds, joins the group and starts the receive thread.
  // Returns false (logged) if the socket cannot be set up.
  bool Start();

  // Idempotent.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Bound UDP port (valid after Start(); differs from the configured port
  // only when that was 0).
  uint16_t port() const { return bound_port_.load(std::memory_order_acquire); }

  // errno from the last failed IP_ADD_MEMBERSHIP, 0 if the last Start() got
  // past the group join or failed before it.
  int membership_errno() const { return membership_errno_.load(std::memory_order_acquire); }

  // Parses one payload and dispatches it. Called by the receive thread;
  // public so the parsing path can be driven without a socket.
  void HandleDatagram(const char* data, size_t len, const std::string& sender);

  uint64_t datagrams_received() const { return datagrams_received_.load(std::memory_order_relaxed); }
  uint64_t datagrams_discarded() const { return datagrams_discarded_.load(std::memory_order_relaxed); }
  uint64_t commands_dispatched() const { return commands_dispatched_.load(std::memory_order_relaxed); }

 private:
  void ReceiveLoop();

  const std::string group_;
  const uint16_t port_;
  CommandHandler handler_;

  int fd_ = -1;
  std::atomic<uint16_t> bound_port_{0};
  std::atomic<int> membership_errno_{0};
  std::thread receive_thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};

  std::atomic<uint64_t> datagrams_received_{0};
  std::atomic<uint64_t> datagrams_discarded_{0};
  std::atomic<uint64_t> commands_dispatched_{0};
};

}  // namespace vidsync::network

#endif  // VIDSYNC_NETWORK_MULTICAST_COMMAND_LISTENER_H_
