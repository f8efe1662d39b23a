// Repository: VidSync
// Component: Player Configuration
// Purpose: Runtime settings for the player service and their CLI parsing.
// Copyright (c) 2026 VidSync

#include "vidsync/config/PlayerConfig.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <iostream>
#include <limits>

namespace vidsync::config {

namespace {

constexpr const char* kVideoToken = "{video}";

bool ParseUnsigned(const std::string& text, uint64_t max_value, uint64_t& out) {
  if (text.empty() || text[0] == '-' || text[0] == '+') {
    return false;
  }
  size_t consumed = 0;
  unsigned long long value = 0;
  try {
    value = std::stoull(text, &consumed, 10);
  } catch (const std::exception&) {
    return false;
  }
  if (consumed != text.size() || value > max_value) {
    return false;
  }
  out = static_cast<uint64_t>(value);
  return true;
}

bool IsMulticastAddress(const std::string& text) {
  in_addr addr{};
  if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
    return false;
  }
  return IN_MULTICAST(ntohl(addr.s_addr));
}

}  // namespace

const char* AudioOutputToString(AudioOutput output) {
  switch (output) {
    case AudioOutput::kHdmi:
      return "hdmi";
    case AudioOutput::kLocal:
      return "local";
    case AudioOutput::kBoth:
      return "both";
  }
  return "hdmi";
}

bool ParseAudioOutput(const std::string& text, AudioOutput& out) {
  if (text == "hdmi") {
    out = AudioOutput::kHdmi;
  } else if (text == "local") {
    out = AudioOutput::kLocal;
  } else if (text == "both") {
    out = AudioOutput::kBoth;
  } else {
    return false;
  }
  return true;
}

std::string PlayerConfig::EffectiveTempPath() const {
  if (!temp_video_path.empty()) {
    return temp_video_path;
  }
  return video_path + ".tmp";
}

std::vector<std::string> PlayerConfig::BuildDecoderCommand(
    const std::string& path) const {
  std::vector<std::string> argv;
  argv.push_back(decoder_binary);

  if (decoder_args.empty()) {
    argv.push_back("-o");
    argv.push_back(AudioOutputToString(audio_output));
    argv.push_back("--no-osd");
    argv.push_back("--aspect-mode");
    argv.push_back("letterbox");
    argv.push_back(path);
    return argv;
  }

  bool substituted = false;
  for (const auto& arg : decoder_args) {
    if (arg == kVideoToken) {
      argv.push_back(path);
      substituted = true;
    } else {
      argv.push_back(arg);
    }
  }
  if (!substituted) {
    argv.push_back(path);
  }
  return argv;
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Synchronized video player: plays on multicast PLAY/LOAD/GO/STOP,\n"
            << "accepts replacement videos over TCP while idle.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --video PATH             Video file (default: " << PlayerConfig::kDefaultVideoPath << ")\n"
            << "  --temp PATH              Transfer staging file (default: <video>.tmp)\n"
            << "  --multicast-group ADDR   Multicast group (default: " << PlayerConfig::kDefaultMulticastGroup << ")\n"
            << "  --multicast-port N       Multicast port (default: " << PlayerConfig::kDefaultMulticastPort << ")\n"
            << "  --transfer-port N        File transfer port (default: " << PlayerConfig::kDefaultTransferPort << ")\n"
            << "  --audio hdmi|local|both  Audio output (default: hdmi)\n"
            << "  --decoder PATH           Decoder binary (default: " << PlayerConfig::kDefaultDecoder << ")\n"
            << "  --fifo PATH              Decoder control FIFO (default: " << PlayerConfig::kDefaultFifoPath << ")\n"
            << "  --load-settle-ms N       Delay between LOAD launch and pause (default: 500)\n"
            << "  --stop-grace-ms N        Wait for decoder quit before SIGKILL (default: 2000)\n"
            << "  --transfer-timeout-s N   Per-read transfer timeout (default: 30)\n"
            << "  --max-transfer-mb N      Largest accepted upload (default: 8192)\n"
            << "  --verify-media           Reject uploads FFmpeg cannot open\n"
            << "  -v, --verbose            Debug logging\n"
            << "  -h, --help               Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --video /home/pi/video/show.mp4 --audio local\n"
            << "\n";
}

ParseResult ParsePlayerArgs(int argc, const char* const argv[]) {
  ParseResult result;
  PlayerConfig& config = result.config;

  auto fail = [&result](const std::string& message) {
    result.valid = false;
    result.error = message;
    return result;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    if (arg == "--help" || arg == "-h") {
      result.help = true;
      result.valid = true;
      return result;
    } else if (arg == "--verbose" || arg == "-v") {
      config.verbose = true;
    } else if (arg == "--verify-media") {
      config.verify_media = true;
    } else if (!has_value) {
      return fail("Unknown option or missing value: " + arg);
    } else if (arg == "--video") {
      config.video_path = argv[++i];
    } else if (arg == "--temp") {
      config.temp_video_path = argv[++i];
    } else if (arg == "--multicast-group") {
      config.multicast_group = argv[++i];
    } else if (arg == "--decoder") {
      config.decoder_binary = argv[++i];
    } else if (arg == "--fifo") {
      config.fifo_path = argv[++i];
    } else if (arg == "--audio") {
      if (!ParseAudioOutput(argv[++i], config.audio_output)) {
        return fail(std::string("Invalid --audio value: ") + argv[i]);
      }
    } else if (arg == "--multicast-port" || arg == "--transfer-port") {
      uint64_t port = 0;
      if (!ParseUnsigned(argv[++i], std::numeric_limits<uint16_t>::max(), port)) {
        return fail("Invalid " + arg + " value: " + argv[i]);
      }
      if (arg == "--multicast-port") {
        config.multicast_port = static_cast<uint16_t>(port);
      } else {
        config.transfer_port = static_cast<uint16_t>(port);
      }
    } else if (arg == "--load-settle-ms" || arg == "--stop-grace-ms") {
      uint64_t ms = 0;
      if (!ParseUnsigned(argv[++i], 600'000, ms)) {
        return fail("Invalid " + arg + " value: " + argv[i]);
      }
      if (arg == "--load-settle-ms") {
        config.load_settle_delay = std::chrono::milliseconds(ms);
      } else {
        config.stop_grace_period = std::chrono::milliseconds(ms);
      }
    } else if (arg == "--transfer-timeout-s") {
      uint64_t s = 0;
      if (!ParseUnsigned(argv[++i], 86'400, s) || s == 0) {
        return fail("Invalid --transfer-timeout-s value: " + std::string(argv[i]));
      }
      config.transfer_timeout = std::chrono::seconds(s);
    } else if (arg == "--max-transfer-mb") {
      uint64_t mb = 0;
      if (!ParseUnsigned(argv[++i], 1ULL << 30, mb) || mb == 0) {
        return fail("Invalid --max-transfer-mb value: " + std::string(argv[i]));
      }
      config.max_transfer_bytes = mb * 1024 * 1024;
    } else {
      return fail("Unknown option: " + arg);
    }
  }

  if (config.video_path.empty()) {
    return fail("--video must not be empty");
  }
  if (config.EffectiveTempPath() == config.video_path) {
    return fail("--temp must differ from --video");
  }
  if (!IsMulticastAddress(config.multicast_group)) {
    return fail("Not an IPv4 multicast address: " + config.multicast_group);
  }
  if (config.multicast_port == 0) {
    return fail("--multicast-port must be non-zero");
  }

  result.valid = true;
  return result;
}

}  // namespace vidsync::config
