// Repository: VidSync
// Component: Playback State Machine
// Purpose: Single authority over playback state and transfer admission.
// Copyright (c) 2026 VidSync

#ifndef VIDSYNC_RUNTIME_PLAYBACK_STATE_MACHINE_H_
#define VIDSYNC_RUNTIME_PLAYBACK_STATE_MACHINE_H_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "vidsync/decoder/IDecoderProcess.h"
#include "vidsync/runtime/Command.h"

namespace vidsync::runtime {

// PlaybackStateMachine owns the Idle/Loaded/Playing state.
//
// Every command, the transfer admission query/reservation and decoder exit
// notifications are serialized by one mutex that is held only for the
// in-memory check/update. Decoder side effects (launch, pause, resume,
// terminate) run afterwards on the calling thread, outside that mutex, in
// the order the commands acquired it. HandleCommand() returns once its own
// side effect has completed.
//
// Each decoder launch gets a new session id. Exit reports for any other
// session are stale and ignored.
//
// Transfers: the file transfer server reserves admission with
// TryBeginTransfer() and releases it with EndTransfer(). While reserved,
// Play and Load are rejected so a replacement can never race a launch.
class PlaybackStateMachine {
 public:
  enum class State {
    kIdle = 0,
    kLoaded = 1,
    kPlaying = 2,
  };

  enum class CommandResult {
    kApplied = 0,   // State changed or side effect issued.
    kIgnored = 1,   // Not meaningful in the current state (Go when not Loaded, Stop when Idle).
    kRejected = 2,  // Refused: transfer in progress or no video to play.
  };

  struct Options {
    std::string video_path;
    // Delay between launching the decoder for Load and sending pause.
    std::chrono::milliseconds load_settle_delay{0};
  };

  struct MetricsSnapshot {
    std::map<std::pair<State, State>, uint64_t> transitions;
    uint64_t commands_applied_total = 0;
    uint64_t commands_ignored_total = 0;
    uint64_t commands_rejected_total = 0;
    uint64_t launch_failure_total = 0;
    uint64_t control_failure_total = 0;
    uint64_t unexpected_exit_total = 0;
    uint64_t transfers_admitted_total = 0;
    uint64_t transfers_refused_total = 0;
    uint64_t decoder_session_id = 0;
    bool transfer_active = false;
    State state = State::kIdle;
  };

  PlaybackStateMachine(decoder::IDecoderProcess& decoder, Options options);
  ~PlaybackStateMachine();

  PlaybackStateMachine(const PlaybackStateMachine&) = delete;
  PlaybackStateMachine& operator=(const PlaybackStateMachine&) = delete;

  CommandResult HandleCommand(Command command);

  // True only when Idle and no transfer holds the reservation. A read with
  // no reservation, for diagnostics and tests; admission goes through
  // TryBeginTransfer().
  [[nodiscard]] bool CanAcceptTransfer() const;
  [[nodiscard]] bool TryBeginTransfer();
  void EndTransfer();

  // Unexpected decoder exit (watcher thread).
  void OnDecoderExited(uint64_t session_id, int exit_status);

  [[nodiscard]] State state() const;
  [[nodiscard]] MetricsSnapshot Snapshot() const;

 private:
  struct SideEffect {
    bool terminate = false;
    bool launch = false;
    bool pause_after_launch = false;
    bool resume = false;
    uint64_t session_id = 0;
  };

  void TransitionLocked(State to, const char* cause);
  bool VideoAvailable() const;
  void RunInOrder(uint64_t ticket, const SideEffect& effect);
  void Execute(const SideEffect& effect);

  decoder::IDecoderProcess& decoder_;
  const Options options_;

  mutable std::mutex mutex_;
  State state_ = State::kIdle;
  bool transfer_active_ = false;
  uint64_t session_id_ = 0;
  uint64_t next_ticket_ = 0;
  std::map<std::pair<State, State>, uint64_t> transitions_;
  uint64_t commands_applied_total_ = 0;
  uint64_t commands_ignored_total_ = 0;
  uint64_t commands_rejected_total_ = 0;
  uint64_t launch_failure_total_ = 0;
  uint64_t control_failure_total_ = 0;
  uint64_t unexpected_exit_total_ = 0;
  uint64_t transfers_admitted_total_ = 0;
  uint64_t transfers_refused_total_ = 0;

  // Side-effect ordering. Lock order is effect_mutex_ then mutex_.
  std::mutex effect_mutex_;
  std::condition_variable effect_cv_;
  uint64_t serving_ticket_ = 0;
};

const char* StateToString(PlaybackStateMachine::State state);
const char* CommandResultToString(PlaybackStateMachine::CommandResult result);

}  // namespace vidsync::runtime

#endif  // VIDSYNC_RUNTIME_PLAYBACK_STATE_MACHINE_H_
