// Repository: VidSync
// Component: Media Probe
// Purpose: Inspects a video file with libavformat (container, duration,
//          streams) without decoding it.
// Copyright (c) 2026 VidSync

#ifndef VIDSYNC_MEDIA_MEDIA_PROBE_H_
#define VIDSYNC_MEDIA_MEDIA_PROBE_H_

#include <cstdint>
#include <optional>
#include <string>

namespace vidsync::media {

struct MediaInfo {
  std::string container;     // e.g. "mov,mp4,m4a,3gp,3g2,mj2"
  double duration_seconds = 0.0;  // 0 when the container does not say.
  int video_streams = 0;
  int audio_streams = 0;
  int width = 0;
  int height = 0;
  std::string video_codec;

  std::string ToString() const;
};

class MediaProbe {
 public:
  // Returns nullopt (and logs the FFmpeg error) when the file cannot be
  // opened as media or has no video stream.
  static std::optional<MediaInfo> Probe(const std::string& path);
};

}  // namespace vidsync::media

#endif  // VIDSYNC_MEDIA_MEDIA_PROBE_H_
