// Repository: VidSync
// Component: Decoder Process Supervisor
// Purpose: Launches, watches and terminates the external decoder process.
// Copyright (c) 2026 VidSync

#ifndef VIDSYNC_DECODER_PROCESS_SUPERVISOR_H_
#define VIDSYNC_DECODER_PROCESS_SUPERVISOR_H_

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "vidsync/config/PlayerConfig.h"
#include "vidsync/decoder/FifoControlChannel.h"
#include "vidsync/decoder/IDecoderProcess.h"

namespace vidsync::decoder {

// ProcessSupervisor runs one decoder at a time.
//
// Start() recreates the control FIFO, forks, and execs the configured
// decoder command in a new session with stdin bound to the FIFO and
// stdout/stderr on /dev/null. An exec failure is detected synchronously
// through a close-on-exec pipe and reported as a failed Start().
//
// A watcher thread blocks in waitpid() for each launched process. When the
// process exits without Terminate() having asked it to, the exit callback
// fires with the launch's session id.
//
// Terminate() sends quit over the FIFO, waits up to the grace period, then
// SIGKILLs the whole process group and waits for the reap.
class ProcessSupervisor : public IDecoderProcess {
 public:
  static constexpr std::chrono::milliseconds kReapTimeout{5000};

  explicit ProcessSupervisor(const config::PlayerConfig& config);
  ~ProcessSupervisor() override;

  ProcessSupervisor(const ProcessSupervisor&) = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

  bool Start(const std::string& video_path, uint64_t session_id) override;
  bool Pause() override;
  bool Resume() override;
  void Terminate() override;

  bool IsRunning() const override;

  void SetExitCallback(ExitCallback callback) override;

  // pid of the running decoder, or -1.
  pid_t pid() const;

 private:
  void WatchLoop(pid_t pid, uint64_t session_id);
  void JoinWatcher();

  const config::PlayerConfig config_;
  FifoControlChannel channel_;

  mutable std::mutex mutex_;
  std::condition_variable exited_cv_;
  pid_t pid_ = -1;
  bool running_ = false;
  bool terminate_requested_ = false;
  uint64_t session_id_ = 0;
  ExitCallback exit_callback_;

  std::mutex watcher_mutex_;
  std::thread watcher_;
};

}  // namespace vidsync::decoder

#endif  // VIDSYNC_DECODER_PROCESS_SUPERVISOR_H_
