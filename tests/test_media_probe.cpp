// Repository: VidSync
// Component: Media probe unit tests

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "support/TempDir.h"
#include "support/VideoClip.h"
#include "vidsync/media/MediaProbe.h"
#include "vidsync/util/Logger.hpp"

namespace vidsync::media {
namespace {

using tests::support::TempDir;
using tests::support::MakeY4mClip;
using tests::support::WriteFile;

TEST(MediaProbeTest, MissingFileYieldsNothing) {
  TempDir dir;
  EXPECT_FALSE(MediaProbe::Probe(dir.File("absent.mp4")).has_value());
}

TEST(MediaProbeTest, NonMediaFileYieldsNothing) {
  TempDir dir;
  const std::string path = dir.File("notes.mp4");
  WriteFile(path, "AAAAAAAAAA");
  EXPECT_FALSE(MediaProbe::Probe(path).has_value());
}

TEST(MediaProbeTest, EmptyFileYieldsNothing) {
  TempDir dir;
  const std::string path = dir.File("empty.mp4");
  WriteFile(path, "");
  EXPECT_FALSE(MediaProbe::Probe(path).has_value());
}

TEST(MediaProbeTest, RawVideoClipIsDescribed) {
  TempDir dir;
  const std::string path = dir.File("clip.y4m");
  WriteFile(path, MakeY4mClip(32, 16, 5));

  std::vector<std::string> warnings;
  util::Logger::SetWarnSink([&warnings](const std::string& line) { warnings.push_back(line); });
  const auto info = MediaProbe::Probe(path);
  util::Logger::SetWarnSink(nullptr);

  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(warnings.empty());
  EXPECT_EQ(info->video_streams, 1);
  EXPECT_EQ(info->audio_streams, 0);
  EXPECT_EQ(info->width, 32);
  EXPECT_EQ(info->height, 16);
  EXPECT_EQ(info->video_codec, "rawvideo");
  EXPECT_FALSE(info->container.empty());
}

TEST(MediaProbeTest, ContentDecidesNotExtension) {
  TempDir dir;
  const std::string path = dir.File("current_video.mp4.tmp");
  WriteFile(path, MakeY4mClip(16, 16, 2));

  const auto info = MediaProbe::Probe(path);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->video_streams, 1);
}

TEST(MediaProbeTest, ToStringDescribesStreams) {
  MediaInfo info;
  info.container = "mov,mp4,m4a,3gp,3g2,mj2";
  info.duration_seconds = 12.5;
  info.video_streams = 1;
  info.audio_streams = 1;
  info.width = 1920;
  info.height = 1080;
  info.video_codec = "h264";

  const std::string text = info.ToString();
  EXPECT_NE(text.find("1920x1080"), std::string::npos) << text;
  EXPECT_NE(text.find("h264"), std::string::npos) << text;
}

}  // namespace
}  // namespace vidsync::media
