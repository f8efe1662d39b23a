// Repository: VidSync
// Component: Player configuration parsing unit tests

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "vidsync/config/PlayerConfig.h"

namespace vidsync::config {
namespace {

ParseResult Parse(std::vector<std::string> args) {
  args.insert(args.begin(), "vidsync_player");
  std::vector<const char*> argv;
  for (const auto& a : args) argv.push_back(a.c_str());
  return ParsePlayerArgs(static_cast<int>(argv.size()), argv.data());
}

TEST(PlayerConfigTest, DefaultsWithNoArguments) {
  ParseResult r = Parse({});
  ASSERT_TRUE(r.valid) << r.error;
  EXPECT_FALSE(r.help);
  EXPECT_EQ(r.config.video_path, "/home/pi/video/current_video.mp4");
  EXPECT_EQ(r.config.EffectiveTempPath(), "/home/pi/video/current_video.mp4.tmp");
  EXPECT_EQ(r.config.multicast_group, "239.255.42.1");
  EXPECT_EQ(r.config.multicast_port, 5000);
  EXPECT_EQ(r.config.transfer_port, 5001);
  EXPECT_EQ(r.config.audio_output, AudioOutput::kHdmi);
  EXPECT_EQ(r.config.load_settle_delay.count(), 500);
  EXPECT_EQ(r.config.stop_grace_period.count(), 2000);
  EXPECT_EQ(r.config.transfer_timeout.count(), 30);
  EXPECT_FALSE(r.config.verify_media);
  EXPECT_FALSE(r.config.verbose);
}

TEST(PlayerConfigTest, ParsesEveryFlag) {
  ParseResult r = Parse({"--video", "/data/v.mp4", "--temp", "/data/v.part",
                         "--multicast-group", "239.1.2.3", "--multicast-port", "6000",
                         "--transfer-port", "6001", "--audio", "both", "--decoder",
                         "/usr/bin/omxplayer.bin", "--fifo", "/run/vs.fifo",
                         "--load-settle-ms", "250", "--stop-grace-ms", "1000",
                         "--transfer-timeout-s", "10", "--max-transfer-mb", "64",
                         "--verify-media", "-v"});
  ASSERT_TRUE(r.valid) << r.error;
  const PlayerConfig& c = r.config;
  EXPECT_EQ(c.video_path, "/data/v.mp4");
  EXPECT_EQ(c.EffectiveTempPath(), "/data/v.part");
  EXPECT_EQ(c.multicast_group, "239.1.2.3");
  EXPECT_EQ(c.multicast_port, 6000);
  EXPECT_EQ(c.transfer_port, 6001);
  EXPECT_EQ(c.audio_output, AudioOutput::kBoth);
  EXPECT_EQ(c.decoder_binary, "/usr/bin/omxplayer.bin");
  EXPECT_EQ(c.fifo_path, "/run/vs.fifo");
  EXPECT_EQ(c.load_settle_delay.count(), 250);
  EXPECT_EQ(c.stop_grace_period.count(), 1000);
  EXPECT_EQ(c.transfer_timeout.count(), 10);
  EXPECT_EQ(c.max_transfer_bytes, 64ULL * 1024 * 1024);
  EXPECT_TRUE(c.verify_media);
  EXPECT_TRUE(c.verbose);
}

TEST(PlayerConfigTest, HelpShortCircuits) {
  ParseResult r = Parse({"--bogus", "-h"});
  EXPECT_FALSE(r.valid);

  r = Parse({"-h", "--bogus"});
  EXPECT_TRUE(r.valid);
  EXPECT_TRUE(r.help);
}

TEST(PlayerConfigTest, RejectsInvalidValues) {
  EXPECT_FALSE(Parse({"--multicast-port", "70000"}).valid);
  EXPECT_FALSE(Parse({"--multicast-port", "0"}).valid);
  EXPECT_FALSE(Parse({"--transfer-port", "-1"}).valid);
  EXPECT_FALSE(Parse({"--transfer-port", "12ab"}).valid);
  EXPECT_FALSE(Parse({"--audio", "spdif"}).valid);
  EXPECT_FALSE(Parse({"--multicast-group", "10.0.0.1"}).valid);
  EXPECT_FALSE(Parse({"--multicast-group", "not-an-ip"}).valid);
  EXPECT_FALSE(Parse({"--transfer-timeout-s", "0"}).valid);
  EXPECT_FALSE(Parse({"--max-transfer-mb", "0"}).valid);
  EXPECT_FALSE(Parse({"--video", "/a.mp4", "--temp", "/a.mp4"}).valid);
  EXPECT_FALSE(Parse({"--video"}).valid);
  EXPECT_FALSE(Parse({"--unknown", "x"}).valid);
}

TEST(PlayerConfigTest, ErrorNamesTheOffendingValue) {
  ParseResult r = Parse({"--audio", "spdif"});
  ASSERT_FALSE(r.valid);
  EXPECT_NE(r.error.find("spdif"), std::string::npos);
}

TEST(PlayerConfigTest, DefaultDecoderCommandIsOmxplayer) {
  PlayerConfig c;
  c.audio_output = AudioOutput::kLocal;
  const std::vector<std::string> expected = {"omxplayer", "-o", "local", "--no-osd",
                                             "--aspect-mode", "letterbox", "/v.mp4"};
  EXPECT_EQ(c.BuildDecoderCommand("/v.mp4"), expected);
}

TEST(PlayerConfigTest, CustomDecoderArgsSubstituteVideoToken) {
  PlayerConfig c;
  c.decoder_binary = "/bin/sh";
  c.decoder_args = {"-c", "exec cat", "sh", "{video}"};
  const std::vector<std::string> expected = {"/bin/sh", "-c", "exec cat", "sh", "/v.mp4"};
  EXPECT_EQ(c.BuildDecoderCommand("/v.mp4"), expected);
}

TEST(PlayerConfigTest, CustomDecoderArgsWithoutTokenAppendPath) {
  PlayerConfig c;
  c.decoder_binary = "mpv";
  c.decoder_args = {"--fs"};
  const std::vector<std::string> expected = {"mpv", "--fs", "/v.mp4"};
  EXPECT_EQ(c.BuildDecoderCommand("/v.mp4"), expected);
}

TEST(PlayerConfigTest, AudioOutputNamesParseBack) {
  for (AudioOutput a : {AudioOutput::kHdmi, AudioOutput::kLocal, AudioOutput::kBoth}) {
    AudioOutput parsed = AudioOutput::kHdmi;
    ASSERT_TRUE(ParseAudioOutput(AudioOutputToString(a), parsed));
    EXPECT_EQ(parsed, a);
  }
}

}  // namespace
}  // namespace vidsync::config
