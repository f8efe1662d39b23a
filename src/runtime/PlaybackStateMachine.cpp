// Repository: VidSync
// Component: Playback State Machine
// Purpose: Single authority over playback state and transfer admission.
// Copyright (c) 2026 VidSync

#include "vidsync/runtime/PlaybackStateMachine.h"

#include <sys/stat.h>

#include <thread>

#include "vidsync/util/Logger.hpp"

namespace vidsync::runtime {

using util::Logger;

const char* StateToString(PlaybackStateMachine::State state) {
  switch (state) {
    case PlaybackStateMachine::State::kIdle:
      return "IDLE";
    case PlaybackStateMachine::State::kLoaded:
      return "LOADED";
    case PlaybackStateMachine::State::kPlaying:
      return "PLAYING";
  }
  return "UNKNOWN";
}

const char* CommandResultToString(PlaybackStateMachine::CommandResult result) {
  switch (result) {
    case PlaybackStateMachine::CommandResult::kApplied:
      return "applied";
    case PlaybackStateMachine::CommandResult::kIgnored:
      return "ignored";
    case PlaybackStateMachine::CommandResult::kRejected:
      return "rejected";
  }
  return "unknown";
}

PlaybackStateMachine::PlaybackStateMachine(decoder::IDecoderProcess& decoder,
                                           Options options)
    : decoder_(decoder), options_(std::move(options)) {
  decoder_.SetExitCallback([this](uint64_t session_id, int exit_status) {
    OnDecoderExited(session_id, exit_status);
  });
}

PlaybackStateMachine::~PlaybackStateMachine() {
  decoder_.SetExitCallback(nullptr);
}

bool PlaybackStateMachine::VideoAvailable() const {
  struct stat st;
  return stat(options_.video_path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

void PlaybackStateMachine::TransitionLocked(State to, const char* cause) {
  if (state_ == to) {
    return;
  }
  ++transitions_[{state_, to}];
  Logger::Info(std::string("[PlaybackStateMachine] ") + StateToString(state_) +
               " -> " + StateToString(to) + " (" + cause + ")");
  state_ = to;
}

PlaybackStateMachine::CommandResult PlaybackStateMachine::HandleCommand(
    Command command) {
  SideEffect effect;
  uint64_t ticket = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* name = CommandToString(command);

    switch (command) {
      case Command::kStop:
        if (state_ == State::kIdle) {
          ++commands_ignored_total_;
          Logger::Debug("[PlaybackStateMachine] STOP while idle: nothing to do");
          return CommandResult::kIgnored;
        }
        effect.terminate = true;
        TransitionLocked(State::kIdle, name);
        break;

      case Command::kGo:
        if (state_ != State::kLoaded) {
          ++commands_ignored_total_;
          Logger::Warn(std::string("[PlaybackStateMachine] GO ignored in state ") +
                       StateToString(state_));
          return CommandResult::kIgnored;
        }
        effect.resume = true;
        effect.session_id = session_id_;
        TransitionLocked(State::kPlaying, name);
        break;

      case Command::kPlay:
      case Command::kLoad:
        if (transfer_active_) {
          ++commands_rejected_total_;
          Logger::Warn(std::string("[PlaybackStateMachine] ") + name +
                       " rejected: file transfer in progress");
          return CommandResult::kRejected;
        }
        if (!VideoAvailable()) {
          ++commands_rejected_total_;
          Logger::Error(std::string("[PlaybackStateMachine] ") + name +
                        " rejected: video file not found: " + options_.video_path);
          return CommandResult::kRejected;
        }
        if (state_ != State::kIdle) {
          // Restart: tear down the current decoder first.
          effect.terminate = true;
          TransitionLocked(State::kIdle, "restart");
        }
        effect.launch = true;
        effect.pause_after_launch = (command == Command::kLoad);
        effect.session_id = ++session_id_;
        TransitionLocked(command == Command::kLoad ? State::kLoaded : State::kPlaying,
                         name);
        break;
    }

    ++commands_applied_total_;
    ticket = next_ticket_++;
  }

  RunInOrder(ticket, effect);
  return CommandResult::kApplied;
}

void PlaybackStateMachine::RunInOrder(uint64_t ticket, const SideEffect& effect) {
  std::unique_lock<std::mutex> lock(effect_mutex_);
  effect_cv_.wait(lock, [this, ticket] { return serving_ticket_ == ticket; });

  // The next ticket is served even when the effect throws.
  struct TicketAdvance {
    PlaybackStateMachine* machine;
    std::unique_lock<std::mutex>& lock;
    ~TicketAdvance() {
      ++machine->serving_ticket_;
      lock.unlock();
      machine->effect_cv_.notify_all();
    }
  } advance{this, lock};

  Execute(effect);
}

void PlaybackStateMachine::Execute(const SideEffect& effect) {
  if (effect.terminate) {
    decoder_.Terminate();
  }

  if (effect.launch) {
    if (!decoder_.Start(options_.video_path, effect.session_id)) {
      std::lock_guard<std::mutex> lock(mutex_);
      ++launch_failure_total_;
      if (session_id_ == effect.session_id && state_ != State::kIdle) {
        TransitionLocked(State::kIdle, "decoder launch failed");
      }
      return;
    }
    if (effect.pause_after_launch) {
      if (options_.load_settle_delay.count() > 0) {
        std::this_thread::sleep_for(options_.load_settle_delay);
      }
      if (decoder_.Pause()) {
        Logger::Info("[PlaybackStateMachine] Video loaded and paused");
      } else {
        std::lock_guard<std::mutex> lock(mutex_);
        ++control_failure_total_;
      }
    }
  }

  if (effect.resume) {
    if (decoder_.Resume()) {
      Logger::Info("[PlaybackStateMachine] Playback started");
    } else {
      std::lock_guard<std::mutex> lock(mutex_);
      ++control_failure_total_;
    }
  }
}

void PlaybackStateMachine::OnDecoderExited(uint64_t session_id, int exit_status) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (session_id != session_id_ || state_ == State::kIdle) {
    Logger::Debug("[PlaybackStateMachine] Ignoring exit of stale decoder session " +
                  std::to_string(session_id));
    return;
  }
  ++unexpected_exit_total_;
  Logger::Warn("[PlaybackStateMachine] Decoder session " + std::to_string(session_id) +
               " exited unexpectedly (status " + std::to_string(exit_status) +
               "); returning to idle");
  TransitionLocked(State::kIdle, "decoder exited");
}

bool PlaybackStateMachine::CanAcceptTransfer() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == State::kIdle && !transfer_active_;
}

bool PlaybackStateMachine::TryBeginTransfer() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::kIdle || transfer_active_) {
    ++transfers_refused_total_;
    return false;
  }
  transfer_active_ = true;
  ++transfers_admitted_total_;
  return true;
}

void PlaybackStateMachine::EndTransfer() {
  std::lock_guard<std::mutex> lock(mutex_);
  transfer_active_ = false;
}

PlaybackStateMachine::State PlaybackStateMachine::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

PlaybackStateMachine::MetricsSnapshot PlaybackStateMachine::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  MetricsSnapshot snapshot;
  snapshot.transitions = transitions_;
  snapshot.commands_applied_total = commands_applied_total_;
  snapshot.commands_ignored_total = commands_ignored_total_;
  snapshot.commands_rejected_total = commands_rejected_total_;
  snapshot.launch_failure_total = launch_failure_total_;
  snapshot.control_failure_total = control_failure_total_;
  snapshot.unexpected_exit_total = unexpected_exit_total_;
  snapshot.transfers_admitted_total = transfers_admitted_total_;
  snapshot.transfers_refused_total = transfers_refused_total_;
  snapshot.decoder_session_id = session_id_;
  snapshot.transfer_active = transfer_active_;
  snapshot.state = state_;
  return snapshot;
}

}  // namespace vidsync::runtime
