// Repository: VidSync
// Component: File Transfer Server
// Purpose: Accepts replacement videos over TCP and atomically swaps them in.
// Copyright (c) 2026 VidSync

#include "vidsync/network/FileTransferServer.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <optional>
#include <vector>

#include "vidsync/media/MediaProbe.h"
#include "vidsync/runtime/PlaybackStateMachine.h"
#include "vidsync/util/Logger.hpp"

namespace vidsync::network {

using util::Logger;

namespace {

bool SendAll(int fd, const char* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

bool SendReply(int fd, const char* reply) {
  return SendAll(fd, reply, std::strlen(reply));
}

// Reads exactly len bytes. got reports how many arrived before a failure.
bool RecvExact(int fd, uint8_t* buf, size_t len, size_t& got, std::string& reason) {
  got = 0;
  while (got < len) {
    ssize_t n = recv(fd, buf + got, len - got, 0);
    if (n == 0) {
      reason = "connection closed by peer";
      return false;
    }
    if (n < 0) {
      if (errno == EINTR) continue;
      reason = (errno == EAGAIN || errno == EWOULDBLOCK) ? "receive timed out"
                                                         : std::strerror(errno);
      return false;
    }
    got += static_cast<size_t>(n);
  }
  return true;
}

bool WriteAll(int fd, const uint8_t* data, size_t len) {
  size_t written = 0;
  while (written < len) {
    ssize_t n = write(fd, data + written, len - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

std::string PeerName(const struct sockaddr_in& addr) {
  char host[INET_ADDRSTRLEN] = "?";
  inet_ntop(AF_INET, &addr.sin_addr, host, sizeof(host));
  return std::string(host) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // namespace

uint64_t DecodeLengthHeader(const uint8_t (&header)[kLengthHeaderBytes]) {
  uint64_t value = 0;
  for (size_t i = 0; i < kLengthHeaderBytes; ++i) {
    value = (value << 8) | header[i];
  }
  return value;
}

FileTransferServer::FileTransferServer(Options options,
                                       runtime::PlaybackStateMachine& state_machine)
    : options_(std::move(options)), state_machine_(state_machine) {}

FileTransferServer::~FileTransferServer() {
  Stop();
}

bool FileTransferServer::Start() {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) {
    Logger::Error(std::string("[FileTransferServer] socket() failed: ") +
                  std::strerror(errno));
    return false;
  }

  int opt = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(options_.port);

  if (bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    Logger::Error("[FileTransferServer] bind(" + std::to_string(options_.port) +
                  ") failed: " + std::strerror(errno));
    close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }
  if (listen(listen_fd_, kListenBacklog) < 0) {
    Logger::Error(std::string("[FileTransferServer] listen() failed: ") +
                  std::strerror(errno));
    close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  socklen_t addr_len = sizeof(addr);
  if (getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) == 0) {
    bound_port_.store(ntohs(addr.sin_port), std::memory_order_release);
  }

  // Non-blocking so a connection reset between poll() and accept() cannot
  // wedge the accept thread.
  int flags = fcntl(listen_fd_, F_GETFL, 0);
  fcntl(listen_fd_, F_SETFL, flags | O_NONBLOCK);

  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  accept_thread_ = std::thread(&FileTransferServer::AcceptLoop, this);

  Logger::Info("[FileTransferServer] File receiver listening on port " +
               std::to_string(port()));
  return true;
}

void FileTransferServer::Stop() {
  stop_requested_.store(true, std::memory_order_release);
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  {
    std::lock_guard<std::mutex> lock(active_mutex_);
    if (active_fd_ >= 0) {
      ::shutdown(active_fd_, SHUT_RDWR);
    }
  }
  JoinWorker();
  if (listen_fd_ >= 0) {
    close(listen_fd_);
    listen_fd_ = -1;
  }
  running_.store(false, std::memory_order_release);
}

void FileTransferServer::JoinWorker() {
  std::lock_guard<std::mutex> lock(worker_mutex_);
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }
}

FileTransferServer::Stats FileTransferServer::GetStats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void FileTransferServer::AcceptLoop() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    struct pollfd pfd;
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready = poll(&pfd, 1, kAcceptPollMs);
    if (ready < 0) {
      if (errno == EINTR) continue;
      Logger::Error(std::string("[FileTransferServer] poll() failed: ") +
                    std::strerror(errno));
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      continue;
    }
    if (ready == 0) {
      continue;
    }

    struct sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int fd = accept4(listen_fd_, reinterpret_cast<struct sockaddr*>(&client_addr),
                     &client_len, SOCK_CLOEXEC);
    if (fd < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR &&
          errno != ECONNABORTED) {
        Logger::Error(std::string("[FileTransferServer] accept() failed: ") +
                      std::strerror(errno));
      }
      continue;
    }

    const std::string peer = PeerName(client_addr);
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.connections_total;
    }

    if (!state_machine_.TryBeginTransfer()) {
      Logger::Warn("[FileTransferServer] Rejecting file transfer from " + peer +
                   " - playback or another transfer in progress");
      if (!SendReply(fd, kReplyBusy)) {
        Logger::Debug("[FileTransferServer] BUSY reply to " + peer + " not delivered");
      }
      close(fd);
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.busy_total;
      continue;
    }

    Logger::Info("[FileTransferServer] Accepting file transfer from " + peer);
    if (!SendReply(fd, kReplyReady)) {
      Logger::Error("[FileTransferServer] Could not send READY to " + peer + ": " +
                    std::strerror(errno));
      state_machine_.EndTransfer();
      close(fd);
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.failed_total;
      continue;
    }

    // The reservation guarantees the previous worker has finished its
    // transfer; this only reaps the thread.
    JoinWorker();
    {
      std::lock_guard<std::mutex> lock(active_mutex_);
      active_fd_ = fd;
    }
    std::lock_guard<std::mutex> lock(worker_mutex_);
    worker_thread_ = std::thread(&FileTransferServer::ServeTransfer, this, fd, peer);
  }
}

void FileTransferServer::ServeTransfer(int fd, std::string peer) {
  TransferSession session;
  session.peer = std::move(peer);
  session.temp_path = options_.temp_path;

  std::string reason;
  const bool ok = ReceiveFile(fd, session, reason) && CommitFile(session, reason);

  if (!ok) {
    if (unlink(session.temp_path.c_str()) != 0 && errno != ENOENT) {
      Logger::Warn("[FileTransferServer] Could not remove " + session.temp_path + ": " +
                   std::strerror(errno));
    }
    Logger::Error("[FileTransferServer] Transfer from " + session.peer + " failed: " +
                  reason + " (" + std::to_string(session.received_bytes) + "/" +
                  std::to_string(session.expected_bytes) + " bytes)");
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.bytes_received_total += session.received_bytes;
    if (ok) {
      ++stats_.completed_total;
    } else {
      ++stats_.failed_total;
    }
  }

  // Release admission before replying so a client that saw OK/ERROR can
  // immediately start the next transfer.
  state_machine_.EndTransfer();

  if (!SendReply(fd, ok ? kReplyOk : kReplyError)) {
    Logger::Warn("[FileTransferServer] Final reply to " + session.peer +
                 " not delivered: " + std::strerror(errno));
  }

  std::lock_guard<std::mutex> lock(active_mutex_);
  active_fd_ = -1;
  close(fd);
}

bool FileTransferServer::ReceiveFile(int fd, TransferSession& session,
                                     std::string& reason) {
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(options_.io_timeout.count());
  tv.tv_usec = 0;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  uint8_t header[kLengthHeaderBytes];
  size_t got = 0;
  if (!RecvExact(fd, header, sizeof(header), got, reason)) {
    reason = "failed to receive size header (" + std::to_string(got) + "/8 bytes, " +
             reason + ")";
    return false;
  }

  session.expected_bytes = DecodeLengthHeader(header);
  if (session.expected_bytes > options_.max_transfer_bytes) {
    reason = "declared length " + std::to_string(session.expected_bytes) +
             " exceeds limit " + std::to_string(options_.max_transfer_bytes);
    return false;
  }

  Logger::Info("[FileTransferServer] Receiving file of " +
               std::to_string(session.expected_bytes) + " bytes from " + session.peer);

  int out = open(session.temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (out < 0) {
    reason = "cannot open " + session.temp_path + ": " + std::strerror(errno);
    return false;
  }

  std::vector<uint8_t> buf(kChunkBytes);
  bool ok = true;
  while (session.received_bytes < session.expected_bytes) {
    const size_t want = static_cast<size_t>(
        std::min<uint64_t>(kChunkBytes, session.expected_bytes - session.received_bytes));
    ssize_t n = recv(fd, buf.data(), want, 0);
    if (n == 0) {
      reason = "connection closed before all bytes arrived";
      ok = false;
      break;
    }
    if (n < 0) {
      if (errno == EINTR) continue;
      reason = (errno == EAGAIN || errno == EWOULDBLOCK) ? "receive timed out"
                                                         : std::strerror(errno);
      ok = false;
      break;
    }
    if (!WriteAll(out, buf.data(), static_cast<size_t>(n))) {
      reason = "write to " + session.temp_path + " failed: " + std::strerror(errno);
      ok = false;
      break;
    }
    session.received_bytes += static_cast<uint64_t>(n);
  }

  if (ok && fsync(out) != 0) {
    reason = "fsync " + session.temp_path + " failed: " + std::strerror(errno);
    ok = false;
  }
  if (close(out) != 0 && ok) {
    reason = "close " + session.temp_path + " failed: " + std::strerror(errno);
    ok = false;
  }
  return ok;
}

bool FileTransferServer::CommitFile(const TransferSession& session, std::string& reason) {
  std::optional<media::MediaInfo> info;
  if (options_.verify_media) {
    info = media::MediaProbe::Probe(session.temp_path);
    if (!info) {
      reason = "received file is not a playable video";
      return false;
    }
  }

  if (rename(session.temp_path.c_str(), options_.video_path.c_str()) != 0) {
    reason = "rename to " + options_.video_path + " failed: " + std::strerror(errno);
    return false;
  }

  Logger::Info("[FileTransferServer] File received successfully: " + options_.video_path +
               " (" + std::to_string(session.received_bytes) + " bytes)");

  if (!info) {
    info = media::MediaProbe::Probe(options_.video_path);
  }
  if (info) {
    Logger::Info("[FileTransferServer] New video: " + info->ToString());
  }
  return true;
}

}  // namespace vidsync::network
