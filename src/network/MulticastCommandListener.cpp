// Repository: VidSync
// Component: Multicast Command Listener
// Purpose: Receives PLAY/STOP/LOAD/GO trigger datagrams on a multicast group.
// Copyright (c) 2026 VidSync

#include "vidsync/network/MulticastCommandListener.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>

#include "vidsync/util/Logger.hpp"

namespace vidsync::network {

using util::Logger;

namespace {

// Printable rendition of an arbitrary payload for log lines.
std::string Printable(const char* data, size_t len) {
  constexpr size_t kMaxShown = 32;
  std::string out;
  for (size_t i = 0; i < len && i < kMaxShown; ++i) {
    const unsigned char c = static_cast<unsigned char>(data[i]);
    if (c >= 0x20 && c < 0x7f) {
      out.push_back(static_cast<char>(c));
    } else {
      char hex[5];
      snprintf(hex, sizeof(hex), "\\x%02x", c);
      out += hex;
    }
  }
  if (len > kMaxShown) out += "...";
  return out;
}

}  // namespace

MulticastCommandListener::MulticastCommandListener(std::string group, uint16_t port,
                                                   CommandHandler handler)
    : group_(std::move(group)), port_(port), handler_(std::move(handler)) {}

MulticastCommandListener::~MulticastCommandListener() {
  Stop();
}

bool MulticastCommandListener::Start() {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  fd_ = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
  if (fd_ < 0) {
    Logger::Error(std::string("[MulticastCommandListener] socket() failed: ") +
                  std::strerror(errno));
    return false;
  }

  membership_errno_.store(0, std::memory_order_release);

  int opt = 1;
  setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port_);
  if (bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    Logger::Error("[MulticastCommandListener] bind(" + std::to_string(port_) +
                  ") failed: " + std::strerror(errno));
    close(fd_);
    fd_ = -1;
    return false;
  }

  socklen_t addr_len = sizeof(addr);
  if (getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) == 0) {
    bound_port_.store(ntohs(addr.sin_port), std::memory_order_release);
  }

  struct ip_mreq mreq;
  std::memset(&mreq, 0, sizeof(mreq));
  if (inet_pton(AF_INET, group_.c_str(), &mreq.imr_multiaddr) != 1) {
    Logger::Error("[MulticastCommandListener] Invalid multicast group: " + group_);
    close(fd_);
    fd_ = -1;
    return false;
  }
  mreq.imr_interface.s_addr = htonl(INADDR_ANY);
  if (setsockopt(fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
    membership_errno_.store(errno, std::memory_order_release);
    Logger::Error("[MulticastCommandListener] IP_ADD_MEMBERSHIP " + group_ +
                  " failed: " + std::strerror(errno));
    close(fd_);
    fd_ = -1;
    return false;
  }

  struct timeval tv;
  tv.tv_sec = kReceiveTimeoutMs / 1000;
  tv.tv_usec = (kReceiveTimeoutMs % 1000) * 1000;
  setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  receive_thread_ = std::thread(&MulticastCommandListener::ReceiveLoop, this);

  Logger::Info("[MulticastCommandListener] Listening for multicast on " + group_ +
               ":" + std::to_string(port()));
  return true;
}

void MulticastCommandListener::Stop() {
  stop_requested_.store(true, std::memory_order_release);
  if (receive_thread_.joinable()) {
    receive_thread_.join();
  }
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
  running_.store(false, std::memory_order_release);
}

void MulticastCommandListener::ReceiveLoop() {
  char buf[kMaxDatagramBytes];

  while (!stop_requested_.load(std::memory_order_acquire)) {
    struct sockaddr_in sender;
    socklen_t sender_len = sizeof(sender);
    ssize_t n = recvfrom(fd_, buf, sizeof(buf), 0,
                         reinterpret_cast<struct sockaddr*>(&sender), &sender_len);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        continue;
      }
      if (!stop_requested_.load(std::memory_order_acquire)) {
        Logger::Error(std::string("[MulticastCommandListener] Receive error: ") +
                      std::strerror(errno));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
      continue;
    }

    char host[INET_ADDRSTRLEN] = "?";
    inet_ntop(AF_INET, &sender.sin_addr, host, sizeof(host));
    HandleDatagram(buf, static_cast<size_t>(n),
                   std::string(host) + ":" + std::to_string(ntohs(sender.sin_port)));
  }
}

void MulticastCommandListener::HandleDatagram(const char* data, size_t len,
                                              const std::string& sender) {
  datagrams_received_.fetch_add(1, std::memory_order_relaxed);

  const auto command = runtime::ParseCommand(data, len);
  if (!command) {
    const uint64_t discarded = datagrams_discarded_.fetch_add(1, std::memory_order_relaxed);
    const std::string line = "[MulticastCommandListener] Unknown command from " + sender +
                             ": '" + Printable(data, len) + "'";
    if (discarded % kDiscardWarnInterval == 0) {
      Logger::Warn(line + " (" + std::to_string(discarded + 1) + " discarded so far)");
    } else {
      Logger::Debug(line);
    }
    return;
  }

  Logger::Info(std::string("[MulticastCommandListener] ") +
               runtime::CommandToString(*command) + " from " + sender);
  commands_dispatched_.fetch_add(1, std::memory_order_relaxed);
  if (handler_) {
    handler_(*command);
  }
}

}  // namespace vidsync::network
