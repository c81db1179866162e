// Repository: ReelSync
// Component: Media Probe Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/media/MediaProbe.hpp"

#include <sstream>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include "reelsync/util/Logger.hpp"

namespace reelsync::media {

std::optional<double> ProbeDurationSeconds(const std::filesystem::path& path) {
  const std::string uri = path.string();
  AVFormatContext* fmt_ctx = nullptr;
  if (avformat_open_input(&fmt_ctx, uri.c_str(), nullptr, nullptr) < 0) {
    util::Logger::Warn("[MediaProbe] Failed to open: " + uri);
    return std::nullopt;
  }
  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    avformat_close_input(&fmt_ctx);
    util::Logger::Warn("[MediaProbe] Failed to find stream info: " + uri);
    return std::nullopt;
  }

  double seconds = -1.0;
  if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0) {
    seconds = static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
  } else {
    for (unsigned int i = 0; i < fmt_ctx->nb_streams; ++i) {
      const AVStream* stream = fmt_ctx->streams[i];
      if (stream->duration == AV_NOPTS_VALUE || stream->duration <= 0) continue;
      const double stream_s = stream->duration * av_q2d(stream->time_base);
      if (stream_s > seconds) seconds = stream_s;
    }
  }
  avformat_close_input(&fmt_ctx);

  if (seconds <= 0.0) {
    util::Logger::Warn("[MediaProbe] No duration reported: " + uri);
    return std::nullopt;
  }

  std::ostringstream msg;
  msg << "[MediaProbe] Probed: " << uri << " (" << seconds << "s)";
  util::Logger::Debug(msg.str());
  return seconds;
}

}  // namespace reelsync::media
