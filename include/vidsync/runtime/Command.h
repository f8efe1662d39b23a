// Repository: VidSync
// Component: Trigger Commands
// Purpose: Command vocabulary carried by multicast trigger datagrams.
// Copyright (c) 2026 VidSync

#ifndef VIDSYNC_RUNTIME_COMMAND_H_
#define VIDSYNC_RUNTIME_COMMAND_H_

#include <cstddef>
#include <optional>
#include <string>

namespace vidsync::runtime {

enum class Command {
  kPlay = 0,
  kStop = 1,
  kLoad = 2,
  kGo = 3,
};

const char* CommandToString(Command command);

// Parses one datagram payload. Surrounding ASCII whitespace is ignored and
// the keyword match is case-insensitive. Returns nullopt for anything else,
// including embedded NULs or trailing garbage.
std::optional<Command> ParseCommand(const char* data, std::size_t len);
std::optional<Command> ParseCommand(const std::string& text);

}  // namespace vidsync::runtime

#endif  // VIDSYNC_RUNTIME_COMMAND_H_
