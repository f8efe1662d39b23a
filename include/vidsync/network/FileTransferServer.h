// Repository: VidSync
// Component: File Transfer Server
// Purpose: Accepts replacement videos over TCP and atomically swaps them in.
// Copyright (c) 2026 VidSync

#ifndef VIDSYNC_NETWORK_FILE_TRANSFER_SERVER_H_
#define VIDSYNC_NETWORK_FILE_TRANSFER_SERVER_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace vidsync::runtime {
class PlaybackStateMachine;
}

namespace vidsync::network {

// Wire responses. Each is one line, newline-terminated.
inline constexpr char kReplyReady[] = "READY\n";
inline constexpr char kReplyBusy[] = "BUSY\n";
inline constexpr char kReplyOk[] = "OK\n";
inline constexpr char kReplyError[] = "ERROR\n";

// Length prefix: unsigned 64-bit, big-endian.
inline constexpr size_t kLengthHeaderBytes = 8;

uint64_t DecodeLengthHeader(const uint8_t (&header)[kLengthHeaderBytes]);

// One upload attempt; lives for one connection.
struct TransferSession {
  std::string peer;
  std::string temp_path;
  uint64_t expected_bytes = 0;
  uint64_t received_bytes = 0;
};

// FileTransferServer protocol, per connection:
//
//   server: READY\n | BUSY\n
//   client: u64 big-endian length N, then N bytes
//   server: OK\n | ERROR\n, close
//
// Admission goes through PlaybackStateMachine::TryBeginTransfer(). The
// accept thread answers BUSY inline; an admitted connection is served on a
// worker thread so later connections are still answered (BUSY) while it
// runs. Content is written to the temp path and renamed over the video path
// only after all N bytes arrived; on any failure the temp file is removed
// and the video is untouched.
class FileTransferServer {
 public:
  struct Options {
    uint16_t port = 5001;  // 0 picks an ephemeral port; see port().
    std::string video_path;
    std::string temp_path;
    uint64_t max_transfer_bytes = 8ULL * 1024 * 1024 * 1024;
    std::chrono::seconds io_timeout{30};
    bool verify_media = false;
  };

  struct Stats {
    uint64_t connections_total = 0;
    uint64_t busy_total = 0;
    uint64_t completed_total = 0;
    uint64_t failed_total = 0;
    uint64_t bytes_received_total = 0;
  };

  static constexpr size_t kChunkBytes = 64 * 1024;
  static constexpr int kAcceptPollMs = 200;
  static constexpr int kListenBacklog = 4;

  FileTransferServer(Options options, runtime::PlaybackStateMachine& state_machine);
  ~FileTransferServer();

  FileTransferServer(const FileTransferServer&) = delete;
  FileTransferServer& operator=(const FileTransferServer&) = delete;

  // Binds and starts the accept thread. Returns false (logged) on failure.
  bool Start();

  // Stops accepting, aborts an in-flight transfer and joins all threads.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Bound port (valid after Start()).
  uint16_t port() const { return bound_port_.load(std::memory_order_acquire); }

  Stats GetStats() const;

 private:
  void AcceptLoop();
  void ServeTransfer(int fd, std::string peer);

  // Reads the header and body into session.temp_path. Returns false with
  // reason filled on any failure; the temp file may be left behind.
  bool ReceiveFile(int fd, TransferSession& session, std::string& reason);
  bool CommitFile(const TransferSession& session, std::string& reason);
  void JoinWorker();

  const Options options_;
  runtime::PlaybackStateMachine& state_machine_;

  int listen_fd_ = -1;
  std::atomic<uint16_t> bound_port_{0};
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::thread accept_thread_;

  std::mutex worker_mutex_;
  std::thread worker_thread_;

  // Connection being served; Stop() shuts it down to unblock the worker.
  std::mutex active_mutex_;
  int active_fd_ = -1;

  mutable std::mutex stats_mutex_;
  Stats stats_;
};

}  // namespace vidsync::network

#endif  // VIDSYNC_NETWORK_FILE_TRANSFER_SERVER_H_
