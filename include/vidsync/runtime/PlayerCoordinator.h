// Repository: VidSync
// Component: Player Coordinator
// Purpose: Owns the shared state machine and wires decoder, multicast
//          listener and file transfer server together.
// Copyright (c) 2026 VidSync

#ifndef VIDSYNC_RUNTIME_PLAYER_COORDINATOR_H_
#define VIDSYNC_RUNTIME_PLAYER_COORDINATOR_H_

#include <memory>

#include "vidsync/config/PlayerConfig.h"
#include "vidsync/decoder/IDecoderProcess.h"
#include "vidsync/runtime/PlaybackStateMachine.h"

namespace vidsync::network {
class FileTransferServer;
class MulticastCommandListener;
}  // namespace vidsync::network

namespace vidsync::runtime {

// PlayerCoordinator is the only object holding both listeners. Construction
// builds everything; Start() opens the sockets; Stop() stops playback and
// both listeners. Destruction implies Stop().
class PlayerCoordinator {
 public:
  // Uses a ProcessSupervisor built from config.
  explicit PlayerCoordinator(const config::PlayerConfig& config);

  // Injects the decoder (tests substitute a fake).
  PlayerCoordinator(const config::PlayerConfig& config,
                    std::unique_ptr<decoder::IDecoderProcess> decoder);

  ~PlayerCoordinator();

  PlayerCoordinator(const PlayerCoordinator&) = delete;
  PlayerCoordinator& operator=(const PlayerCoordinator&) = delete;

  // Returns false (logged) if either listener cannot start; nothing is left
  // running in that case.
  bool Start();
  void Stop();

  PlaybackStateMachine& state_machine() { return *state_machine_; }
  network::MulticastCommandListener& command_listener() { return *command_listener_; }
  network::FileTransferServer& transfer_server() { return *transfer_server_; }

 private:
  const config::PlayerConfig config_;
  std::unique_ptr<decoder::IDecoderProcess> decoder_;
  std::unique_ptr<PlaybackStateMachine> state_machine_;
  std::unique_ptr<network::MulticastCommandListener> command_listener_;
  std::unique_ptr<network::FileTransferServer> transfer_server_;
  bool started_ = false;
};

}  // namespace vidsync::runtime

#endif  // VIDSYNC_RUNTIME_PLAYER_COORDINATOR_H_
