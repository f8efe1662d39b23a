// Repository: VidSync
// Component: Decoder Process Interface
// Purpose: Capability surface of the external decoder (start/pause/resume/
//          terminate/exit notification), substitutable by test doubles.
// Copyright (c) 2026 VidSync

#ifndef VIDSYNC_DECODER_I_DECODER_PROCESS_H_
#define VIDSYNC_DECODER_I_DECODER_PROCESS_H_

#include <cstdint>
#include <functional>
#include <string>

namespace vidsync::decoder {

// Invoked from the supervisor's watcher thread when a decoder exits without
// Terminate() having been requested. session_id is the value passed to the
// Start() call that launched it; exit_status is the raw waitpid status.
// The callback must not call back into the IDecoderProcess.
using ExitCallback = std::function<void(uint64_t session_id, int exit_status)>;

// IDecoderProcess owns at most one running decoder (the DecoderHandle).
//
// Start() while a decoder is still running fails; callers Terminate() first.
// Pause()/Resume() are fire-and-forget and return false when the
// instruction could not be delivered. Terminate() is bounded: quit, grace
// period, forced kill.
class IDecoderProcess {
 public:
  virtual ~IDecoderProcess() = default;

  virtual bool Start(const std::string& video_path, uint64_t session_id) = 0;
  virtual bool Pause() = 0;
  virtual bool Resume() = 0;
  virtual void Terminate() = 0;

  virtual bool IsRunning() const = 0;

  virtual void SetExitCallback(ExitCallback callback) = 0;
};

}  // namespace vidsync::decoder

#endif  // VIDSYNC_DECODER_I_DECODER_PROCESS_H_
