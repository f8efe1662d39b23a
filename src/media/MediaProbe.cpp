// Repository: VidSync
// Component: Media Probe
// Purpose: Inspects a video file with libavformat (container, duration,
//          streams) without decoding it.
// Copyright (c) 2026 VidSync

#include "vidsync/media/MediaProbe.h"

#include <iomanip>
#include <sstream>

#include "vidsync/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

namespace vidsync::media {

using util::Logger;

namespace {

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

// Closes the input on every return path.
struct FormatContextCloser {
  AVFormatContext* ctx = nullptr;
  ~FormatContextCloser() {
    if (ctx != nullptr) {
      avformat_close_input(&ctx);
    }
  }
};

}  // namespace

std::string MediaInfo::ToString() const {
  std::ostringstream oss;
  oss << "container=" << container << " duration=" << std::fixed
      << std::setprecision(2) << duration_seconds << "s video_streams="
      << video_streams << " audio_streams=" << audio_streams;
  if (video_streams > 0) {
    oss << " video=" << video_codec << " " << width << "x" << height;
  }
  return oss.str();
}

std::optional<MediaInfo> MediaProbe::Probe(const std::string& path) {
  av_log_set_level(AV_LOG_ERROR);

  FormatContextCloser input;
  int ret = avformat_open_input(&input.ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    Logger::Warn("[MediaProbe] avformat_open_input failed path=" + path +
                 ": " + AvErrorString(ret));
    return std::nullopt;
  }

  ret = avformat_find_stream_info(input.ctx, nullptr);
  if (ret < 0) {
    Logger::Warn("[MediaProbe] avformat_find_stream_info failed path=" + path +
                 ": " + AvErrorString(ret));
    return std::nullopt;
  }

  MediaInfo info;
  if (input.ctx->iformat != nullptr && input.ctx->iformat->name != nullptr) {
    info.container = input.ctx->iformat->name;
  }
  if (input.ctx->duration != AV_NOPTS_VALUE && input.ctx->duration > 0) {
    info.duration_seconds = static_cast<double>(input.ctx->duration) / AV_TIME_BASE;
  }

  for (unsigned int i = 0; i < input.ctx->nb_streams; ++i) {
    const AVCodecParameters* par = input.ctx->streams[i]->codecpar;
    if (par->codec_type == AVMEDIA_TYPE_VIDEO) {
      if (info.video_streams == 0) {
        info.width = par->width;
        info.height = par->height;
        info.video_codec = avcodec_get_name(par->codec_id);
      }
      ++info.video_streams;
    } else if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
      ++info.audio_streams;
    }
  }

  if (info.video_streams == 0) {
    Logger::Warn("[MediaProbe] No video stream in " + path);
    return std::nullopt;
  }
  return info;
}

}  // namespace vidsync::media
