// Repository: VidSync
// Component: FIFO Control Channel
// Purpose: Named-pipe command channel feeding single-byte instructions to the
//          decoder's stdin (omxplayer keyboard protocol).
// Copyright (c) 2026 VidSync

#ifndef VIDSYNC_DECODER_FIFO_CONTROL_CHANNEL_H_
#define VIDSYNC_DECODER_FIFO_CONTROL_CHANNEL_H_

#include <chrono>
#include <mutex>
#include <string>

namespace vidsync::decoder {

// FifoControlChannel owns a named FIFO and two descriptors on it:
//
//   reader fd: O_RDWR, blocking. Handed to the decoder as stdin. The parent
//              keeps it open too, so the pipe always has a reader and writes
//              never raise SIGPIPE after the decoder exits.
//   writer fd: O_WRONLY | O_NONBLOCK. Used by Send*().
//
// Sends retry with exponential backoff while the writer is not open yet or
// the pipe is full, then give up and log. Pause and resume are the same
// toggle byte ('p'); quit is 'q'.
//
// Fire-and-forget: nothing is read back from the decoder. A false return
// means the instruction was not delivered and has already been logged.
class FifoControlChannel {
 public:
  static constexpr char kPauseToggle = 'p';
  static constexpr char kQuit = 'q';
  static constexpr int kMaxSendAttempts = 5;
  static constexpr std::chrono::milliseconds kInitialBackoff{10};

  explicit FifoControlChannel(std::string fifo_path);
  ~FifoControlChannel();

  FifoControlChannel(const FifoControlChannel&) = delete;
  FifoControlChannel& operator=(const FifoControlChannel&) = delete;

  // Recreates the FIFO (removing any stale node) and opens both ends.
  // Returns false and logs on failure; the channel is then closed.
  bool Open();

  // Closes both descriptors and unlinks the FIFO. Idempotent.
  void Close();

  // Descriptor to install as the decoder's stdin, or -1 when closed.
  int ReaderFd() const;

  bool SendPause();
  bool SendResume();
  bool SendQuit();

  bool IsOpen() const;

  const std::string& path() const { return fifo_path_; }

 private:
  bool SendByte(char byte, const char* what);
  bool OpenWriterLocked();
  void CloseLocked();

  std::string fifo_path_;

  mutable std::mutex mutex_;
  int reader_fd_ = -1;
  int writer_fd_ = -1;
};

}  // namespace vidsync::decoder

#endif  // VIDSYNC_DECODER_FIFO_CONTROL_CHANNEL_H_
