/**
 * @file media_probe.cpp
 * @brief libavformat container inspection implementation
 */

#include "media_convert/media_probe.hpp"

extern "C" {
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

#include "media_convert/logging.hpp"

namespace media_convert {

MediaProbe::~MediaProbe() {
  /// avformat_close_input frees the context and nulls the pointer
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
}

bool MediaProbe::open(const std::string &path) {
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);

  int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(ret, errbuf, sizeof(errbuf));
    LOG_WARN("avformat_open_input failed for {}: {}", path, errbuf);
    /// On failure libavformat frees the context and nulls the pointer
    fmt_ctx = nullptr;
    return false;
  }

  /// Reads some packets to determine streams and duration
  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    LOG_WARN("avformat_find_stream_info failed for {}", path);
    return false;
  }

  return true;
}

double MediaProbe::get_duration() const {
  if (!fmt_ctx)
    return 0.0;
  return (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0)
             ? fmt_ctx->duration / static_cast<double>(AV_TIME_BASE)
             : 0.0;
}

std::string MediaProbe::get_format_name() const {
  if (!fmt_ctx || !fmt_ctx->iformat || !fmt_ctx->iformat->name)
    return {};
  return fmt_ctx->iformat->name;
}

int MediaProbe::count_streams(AVMediaType type) const {
  if (!fmt_ctx)
    return 0;
  int count = 0;
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (fmt_ctx->streams[i]->codecpar->codec_type == type)
      ++count;
  }
  return count;
}

} // namespace media_convert
