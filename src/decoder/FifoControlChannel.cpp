// Repository: VidSync
// Component: FIFO Control Channel
// Purpose: Named-pipe command channel feeding single-byte instructions to the
//          decoder's stdin (omxplayer keyboard protocol).
// Copyright (c) 2026 VidSync

#include "vidsync/decoder/FifoControlChannel.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "vidsync/util/Logger.hpp"

namespace vidsync::decoder {

using util::Logger;

FifoControlChannel::FifoControlChannel(std::string fifo_path)
    : fifo_path_(std::move(fifo_path)) {}

FifoControlChannel::~FifoControlChannel() {
  Close();
}

bool FifoControlChannel::Open() {
  std::lock_guard<std::mutex> lock(mutex_);
  CloseLocked();

  if (unlink(fifo_path_.c_str()) != 0 && errno != ENOENT) {
    Logger::Error("[FifoControlChannel] Cannot remove stale " + fifo_path_ +
                  ": " + std::strerror(errno));
    return false;
  }
  if (mkfifo(fifo_path_.c_str(), 0600) != 0) {
    Logger::Error("[FifoControlChannel] mkfifo " + fifo_path_ +
                  " failed: " + std::strerror(errno));
    return false;
  }

  // O_RDWR on a FIFO never blocks on Linux and leaves a reader attached.
  reader_fd_ = open(fifo_path_.c_str(), O_RDWR | O_CLOEXEC);
  if (reader_fd_ < 0) {
    Logger::Error("[FifoControlChannel] open(O_RDWR) " + fifo_path_ +
                  " failed: " + std::strerror(errno));
    CloseLocked();
    return false;
  }

  if (!OpenWriterLocked()) {
    Logger::Error("[FifoControlChannel] open(O_WRONLY) " + fifo_path_ +
                  " failed: " + std::strerror(errno));
    CloseLocked();
    return false;
  }

  Logger::Debug("[FifoControlChannel] Opened " + fifo_path_);
  return true;
}

bool FifoControlChannel::OpenWriterLocked() {
  if (writer_fd_ >= 0) {
    return true;
  }
  writer_fd_ = open(fifo_path_.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
  return writer_fd_ >= 0;
}

void FifoControlChannel::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  CloseLocked();
}

void FifoControlChannel::CloseLocked() {
  const bool was_open = reader_fd_ >= 0 || writer_fd_ >= 0;
  if (writer_fd_ >= 0) {
    close(writer_fd_);
    writer_fd_ = -1;
  }
  if (reader_fd_ >= 0) {
    close(reader_fd_);
    reader_fd_ = -1;
  }
  if (was_open) {
    (void)unlink(fifo_path_.c_str());
  }
}

int FifoControlChannel::ReaderFd() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reader_fd_;
}

bool FifoControlChannel::IsOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return writer_fd_ >= 0;
}

bool FifoControlChannel::SendPause() {
  return SendByte(kPauseToggle, "pause");
}

bool FifoControlChannel::SendResume() {
  return SendByte(kPauseToggle, "resume");
}

bool FifoControlChannel::SendQuit() {
  return SendByte(kQuit, "quit");
}

bool FifoControlChannel::SendByte(char byte, const char* what) {
  auto backoff = kInitialBackoff;
  int last_errno = 0;

  for (int attempt = 1; attempt <= kMaxSendAttempts; ++attempt) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (reader_fd_ < 0) {
        // Closed, not merely starting: nothing to wait for.
        Logger::Warn(std::string("[FifoControlChannel] Dropping ") + what +
                     ": channel closed");
        return false;
      }
      if (OpenWriterLocked()) {
        ssize_t n = write(writer_fd_, &byte, 1);
        if (n == 1) {
          Logger::Debug(std::string("[FifoControlChannel] Sent ") + what);
          return true;
        }
        last_errno = (n < 0) ? errno : EAGAIN;
        if (last_errno != EAGAIN && last_errno != EWOULDBLOCK && last_errno != EINTR) {
          break;
        }
      } else {
        last_errno = errno;
      }
    }
    if (attempt < kMaxSendAttempts) {
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }

  Logger::Error(std::string("[FifoControlChannel] Failed to send ") + what +
                " to " + fifo_path_ + ": " + std::strerror(last_errno));
  return false;
}

}  // namespace vidsync::decoder
