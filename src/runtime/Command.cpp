// Repository: VidSync
// Component: Trigger Commands
// Purpose: Command vocabulary carried by multicast trigger datagrams.
// Copyright (c) 2026 VidSync

#include "vidsync/runtime/Command.h"

namespace vidsync::runtime {

namespace {

// Longest keyword is 4 bytes; anything longer after trimming is rejected
// before any copy.
constexpr std::size_t kMaxKeywordLength = 4;

bool IsAsciiSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

char ToUpperAscii(char c) {
  return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

}  // namespace

const char* CommandToString(Command command) {
  switch (command) {
    case Command::kPlay:
      return "PLAY";
    case Command::kStop:
      return "STOP";
    case Command::kLoad:
      return "LOAD";
    case Command::kGo:
      return "GO";
  }
  return "UNKNOWN";
}

std::optional<Command> ParseCommand(const char* data, std::size_t len) {
  if (data == nullptr) {
    return std::nullopt;
  }
  std::size_t begin = 0;
  std::size_t end = len;
  while (begin < end && IsAsciiSpace(data[begin])) ++begin;
  while (end > begin && IsAsciiSpace(data[end - 1])) --end;

  const std::size_t n = end - begin;
  if (n == 0 || n > kMaxKeywordLength) {
    return std::nullopt;
  }

  std::string keyword;
  keyword.reserve(n);
  for (std::size_t i = begin; i < end; ++i) {
    keyword.push_back(ToUpperAscii(data[i]));
  }

  if (keyword == "PLAY") return Command::kPlay;
  if (keyword == "STOP") return Command::kStop;
  if (keyword == "LOAD") return Command::kLoad;
  if (keyword == "GO") return Command::kGo;
  return std::nullopt;
}

std::optional<Command> ParseCommand(const std::string& text) {
  return ParseCommand(text.data(), text.size());
}

}  // namespace vidsync::runtime
