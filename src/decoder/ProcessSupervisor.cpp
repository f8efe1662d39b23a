// Repository: VidSync
// Component: Decoder Process Supervisor
// Purpose: Launches, watches and terminates the external decoder process.
// Copyright (c) 2026 VidSync

#include "vidsync/decoder/ProcessSupervisor.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <system_error>
#include <vector>

#include "vidsync/util/Logger.hpp"

namespace vidsync::decoder {

using util::Logger;

namespace {

std::string JoinArgs(const std::vector<std::string>& args) {
  std::ostringstream oss;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0) oss << ' ';
    oss << args[i];
  }
  return oss.str();
}

std::string DescribeStatus(int status) {
  if (WIFEXITED(status)) {
    return "exit code " + std::to_string(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return "signal " + std::to_string(WTERMSIG(status));
  }
  return "status " + std::to_string(status);
}

}  // namespace

ProcessSupervisor::ProcessSupervisor(const config::PlayerConfig& config)
    : config_(config), channel_(config.fifo_path) {}

ProcessSupervisor::~ProcessSupervisor() {
  Terminate();
  JoinWatcher();
}

void ProcessSupervisor::SetExitCallback(ExitCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  exit_callback_ = std::move(callback);
}

bool ProcessSupervisor::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

pid_t ProcessSupervisor::pid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pid_;
}

void ProcessSupervisor::JoinWatcher() {
  std::lock_guard<std::mutex> lock(watcher_mutex_);
  if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id()) {
    watcher_.join();
  }
}

bool ProcessSupervisor::Start(const std::string& video_path, uint64_t session_id) {
  if (IsRunning()) {
    Logger::Warn("[ProcessSupervisor] Start refused: decoder already running");
    return false;
  }
  // A previous decoder may have exited on its own; reap its watcher.
  JoinWatcher();

  if (!channel_.Open()) {
    return false;
  }

  // Everything the child touches is prepared before fork().
  const std::vector<std::string> args = config_.BuildDecoderCommand(video_path);
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const int stdin_fd = channel_.ReaderFd();
  const int devnull = open("/dev/null", O_RDWR | O_CLOEXEC);
  if (devnull < 0) {
    Logger::Error(std::string("[ProcessSupervisor] open(/dev/null) failed: ") +
                  std::strerror(errno));
    channel_.Close();
    return false;
  }
  int exec_pipe[2];
  if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
    Logger::Error(std::string("[ProcessSupervisor] pipe2 failed: ") +
                  std::strerror(errno));
    close(devnull);
    channel_.Close();
    return false;
  }

  const pid_t child = fork();
  if (child == 0) {
    // Child: async-signal-safe calls only.
    setsid();
    dup2(stdin_fd, STDIN_FILENO);
    dup2(devnull, STDOUT_FILENO);
    dup2(devnull, STDERR_FILENO);
    execvp(argv[0], argv.data());
    int err = errno;
    ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  close(exec_pipe[1]);
  close(devnull);

  if (child < 0) {
    Logger::Error(std::string("[ProcessSupervisor] fork failed: ") + std::strerror(errno));
    close(exec_pipe[0]);
    channel_.Close();
    return false;
  }

  // EOF means exec succeeded (the pipe closed on exec); an int means it failed.
  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
    }
    Logger::Error("[ProcessSupervisor] Failed to launch '" + JoinArgs(args) +
                  "': " + std::strerror(exec_errno));
    channel_.Close();
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = child;
    running_ = true;
    terminate_requested_ = false;
    session_id_ = session_id;
  }
  try {
    std::lock_guard<std::mutex> lock(watcher_mutex_);
    watcher_ = std::thread(&ProcessSupervisor::WatchLoop, this, child, session_id);
  } catch (const std::system_error& e) {
    // Nothing would reap the decoder, so it does not outlive this call.
    Logger::Error(std::string("[ProcessSupervisor] Cannot start watcher thread: ") +
                  e.what());
    kill(-child, SIGKILL);
    int status = 0;
    while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pid_ = -1;
      running_ = false;
    }
    channel_.Close();
    return false;
  }

  Logger::Info("[ProcessSupervisor] Started decoder pid=" + std::to_string(child) +
               " session=" + std::to_string(session_id) + ": " + JoinArgs(args));
  return true;
}

void ProcessSupervisor::WatchLoop(pid_t pid, uint64_t session_id) {
  int status = 0;
  pid_t waited;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);

  if (waited < 0) {
    Logger::Error("[ProcessSupervisor] waitpid(" + std::to_string(pid) +
                  ") failed: " + std::strerror(errno));
  }

  bool requested = false;
  ExitCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    pid_ = -1;
    requested = terminate_requested_;
    callback = exit_callback_;
  }
  exited_cv_.notify_all();

  if (requested) {
    Logger::Info("[ProcessSupervisor] Decoder pid=" + std::to_string(pid) +
                 " stopped (" + DescribeStatus(status) + ")");
    return;
  }

  channel_.Close();
  Logger::Warn("[ProcessSupervisor] Decoder pid=" + std::to_string(pid) +
               " session=" + std::to_string(session_id) + " exited unexpectedly (" +
               DescribeStatus(status) + ")");
  if (callback) {
    callback(session_id, status);
  }
}

bool ProcessSupervisor::Pause() {
  if (!IsRunning()) {
    Logger::Warn("[ProcessSupervisor] Pause ignored: no decoder running");
    return false;
  }
  return channel_.SendPause();
}

bool ProcessSupervisor::Resume() {
  if (!IsRunning()) {
    Logger::Warn("[ProcessSupervisor] Resume ignored: no decoder running");
    return false;
  }
  return channel_.SendResume();
}

void ProcessSupervisor::Terminate() {
  pid_t pid = -1;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      terminate_requested_ = true;
      pid = pid_;
    }
  }

  if (pid > 0) {
    // Failure here just means we go straight to the forced kill.
    (void)channel_.SendQuit();

    std::unique_lock<std::mutex> lock(mutex_);
    if (!exited_cv_.wait_for(lock, config_.stop_grace_period,
                             [this] { return !running_; })) {
      Logger::Warn("[ProcessSupervisor] Decoder pid=" + std::to_string(pid) +
                   " ignored quit; sending SIGKILL");
      // setsid() made the decoder a group leader; take its children too.
      if (kill(-pid, SIGKILL) != 0) {
        kill(pid, SIGKILL);
      }
      if (!exited_cv_.wait_for(lock, kReapTimeout, [this] { return !running_; })) {
        Logger::Error("[ProcessSupervisor] Decoder pid=" + std::to_string(pid) +
                      " not reaped after SIGKILL");
        return;
      }
    }
  }

  JoinWatcher();
  channel_.Close();
}

}  // namespace vidsync::decoder
