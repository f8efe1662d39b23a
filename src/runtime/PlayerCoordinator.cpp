// Repository: VidSync
// Component: Player Coordinator
// Purpose: Owns the shared state machine and wires decoder, multicast
//          listener and file transfer server together.
// Copyright (c) 2026 VidSync

#include "vidsync/runtime/PlayerCoordinator.h"

#include <sys/stat.h>

#include "vidsync/decoder/ProcessSupervisor.h"
#include "vidsync/media/MediaProbe.h"
#include "vidsync/network/FileTransferServer.h"
#include "vidsync/network/MulticastCommandListener.h"
#include "vidsync/util/Logger.hpp"

namespace vidsync::runtime {

using util::Logger;

PlayerCoordinator::PlayerCoordinator(const config::PlayerConfig& config)
    : PlayerCoordinator(config, std::make_unique<decoder::ProcessSupervisor>(config)) {}

PlayerCoordinator::PlayerCoordinator(const config::PlayerConfig& config,
                                     std::unique_ptr<decoder::IDecoderProcess> decoder)
    : config_(config), decoder_(std::move(decoder)) {
  PlaybackStateMachine::Options sm_options;
  sm_options.video_path = config_.video_path;
  sm_options.load_settle_delay = config_.load_settle_delay;
  state_machine_ = std::make_unique<PlaybackStateMachine>(*decoder_, sm_options);

  command_listener_ = std::make_unique<network::MulticastCommandListener>(
      config_.multicast_group, config_.multicast_port,
      [this](Command command) { state_machine_->HandleCommand(command); });

  network::FileTransferServer::Options transfer_options;
  transfer_options.port = config_.transfer_port;
  transfer_options.video_path = config_.video_path;
  transfer_options.temp_path = config_.EffectiveTempPath();
  transfer_options.max_transfer_bytes = config_.max_transfer_bytes;
  transfer_options.io_timeout = config_.transfer_timeout;
  transfer_options.verify_media = config_.verify_media;
  transfer_server_ =
      std::make_unique<network::FileTransferServer>(transfer_options, *state_machine_);
}

PlayerCoordinator::~PlayerCoordinator() {
  Stop();
}

bool PlayerCoordinator::Start() {
  if (started_) {
    return false;
  }

  Logger::Info("[PlayerCoordinator] Starting video player");
  Logger::Info("[PlayerCoordinator] Video file: " + config_.video_path);
  Logger::Info("[PlayerCoordinator] Multicast: " + config_.multicast_group + ":" +
               std::to_string(config_.multicast_port));
  Logger::Info("[PlayerCoordinator] File transfer port: " +
               std::to_string(config_.transfer_port));

  struct stat st;
  if (stat(config_.video_path.c_str(), &st) == 0) {
    if (auto info = media::MediaProbe::Probe(config_.video_path)) {
      Logger::Info("[PlayerCoordinator] Current video: " + info->ToString());
    }
  } else {
    Logger::Warn("[PlayerCoordinator] No video at " + config_.video_path +
                 " yet; PLAY/LOAD are rejected until one is transferred");
  }

  if (!transfer_server_->Start()) {
    return false;
  }
  if (!command_listener_->Start()) {
    transfer_server_->Stop();
    return false;
  }
  started_ = true;
  return true;
}

void PlayerCoordinator::Stop() {
  if (started_) {
    Logger::Info("[PlayerCoordinator] Shutting down");
  }
  // Stop the listeners first so no new command or transfer races shutdown.
  command_listener_->Stop();
  transfer_server_->Stop();
  state_machine_->HandleCommand(Command::kStop);
  // Stop is ignored when Idle; this still reaps a watcher left behind by an
  // unexpected exit before the state machine goes away.
  decoder_->Terminate();
  started_ = false;
}

}  // namespace vidsync::runtime
