// Repository: VidSync
// Component: Player Configuration
// Purpose: Runtime settings for the player service and their CLI parsing.
// Copyright (c) 2026 VidSync

#ifndef VIDSYNC_CONFIG_PLAYER_CONFIG_H_
#define VIDSYNC_CONFIG_PLAYER_CONFIG_H_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace vidsync::config {

// Audio routing passed to the decoder (omxplayer -o).
enum class AudioOutput {
  kHdmi = 0,
  kLocal = 1,
  kBoth = 2,
};

const char* AudioOutputToString(AudioOutput output);
bool ParseAudioOutput(const std::string& text, AudioOutput& out);

struct PlayerConfig {
  static constexpr const char* kDefaultVideoPath = "/home/pi/video/current_video.mp4";
  static constexpr const char* kDefaultMulticastGroup = "239.255.42.1";
  static constexpr uint16_t kDefaultMulticastPort = 5000;
  static constexpr uint16_t kDefaultTransferPort = 5001;
  static constexpr const char* kDefaultDecoder = "omxplayer";
  static constexpr const char* kDefaultFifoPath = "/tmp/vidsync_decoder.fifo";

  // CurrentVideo and the staging file that transfers are written to.
  std::string video_path = kDefaultVideoPath;
  std::string temp_video_path;  // Empty means video_path + ".tmp".

  std::string multicast_group = kDefaultMulticastGroup;
  uint16_t multicast_port = kDefaultMulticastPort;
  // Port 0 binds an ephemeral port (tests).
  uint16_t transfer_port = kDefaultTransferPort;

  // Decoder launch. When decoder_args is empty the omxplayer argument set
  // is used; otherwise "{video}" in decoder_args is replaced by the path.
  std::string decoder_binary = kDefaultDecoder;
  std::vector<std::string> decoder_args;
  AudioOutput audio_output = AudioOutput::kHdmi;
  std::string fifo_path = kDefaultFifoPath;

  std::chrono::milliseconds load_settle_delay{500};
  std::chrono::milliseconds stop_grace_period{2000};

  std::chrono::seconds transfer_timeout{30};
  uint64_t max_transfer_bytes = 8ULL * 1024 * 1024 * 1024;
  bool verify_media = false;

  bool verbose = false;

  std::string EffectiveTempPath() const;

  // Full argv (argv[0] included) for launching the decoder on video_path.
  std::vector<std::string> BuildDecoderCommand(const std::string& video_path) const;
};

struct ParseResult {
  PlayerConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

// Parses command-line flags over the defaults. Never throws; invalid input
// is reported through ParseResult::error.
ParseResult ParsePlayerArgs(int argc, const char* const argv[]);

void PrintUsage(const char* program_name);

}  // namespace vidsync::config

#endif  // VIDSYNC_CONFIG_PLAYER_CONFIG_H_
