/**
 * @file command_planner.cpp
 * @brief Engine argument planning implementation
 */

#include "media_convert/command_planner.hpp"

#include <array>
#include <cmath>

#include <fmt/core.h>

#include "media_convert/config.hpp"
#include "media_convert/logging.hpp"
#include "media_convert/quality_mapper.hpp"
#include "media_convert/system.hpp"

namespace media_convert {

namespace {

constexpr std::array<const char *, 5> kVideoExtensions = {"mp4", "mov", "mkv",
                                                          "avi", "webm"};

/// Append codec arguments for an audio target
void append_audio_args(std::vector<std::string> &args, MediaFormat format,
                       const QualityProfile &profile) {
  args.push_back("-c:a");
  args.push_back(audio_codec_for(format));

  switch (profile.kind) {
  case ProfileKind::AudioBitrate:
    args.push_back("-b:a");
    args.push_back(profile.bitrate);
    break;
  case ProfileKind::LosslessLevel:
    args.push_back("-compression_level");
    args.push_back(std::to_string(profile.compression_level));
    break;
  case ProfileKind::Uncompressed:
  case ProfileKind::VideoRateFactor:
    break;
  }
}

} // anonymous namespace

MediaKind classify_input(const std::string &input_path) {
  std::string ext = extension_of(input_path);
  for (const char *video_ext : kVideoExtensions) {
    if (ext == video_ext)
      return MediaKind::Video;
  }
  return MediaKind::Audio;
}

ErrorCode validate_clip(const ConversionRequest &request) {
  if (!request.clip)
    return ErrorCode::None;

  const ClipWindow &clip = *request.clip;
  if (!std::isfinite(clip.start) || !std::isfinite(clip.end))
    return ErrorCode::InvalidClipWindow;
  if (clip.start < 0 || clip.end < 0 || clip.end <= clip.start)
    return ErrorCode::InvalidClipWindow;
  if (clip.end > kMaxClipSeconds)
    return ErrorCode::InvalidClipWindow;
  return ErrorCode::None;
}

ErrorCode plan(const ConversionRequest &request, EncodePlan &plan) {
  if (ErrorCode clip_err = validate_clip(request); clip_err != ErrorCode::None) {
    LOG_ERROR("Rejected clip window [{}, {}]", request.clip->start,
              request.clip->end);
    return clip_err;
  }

  MediaFormat format;
  if (!parse_media_format(request.format, format)) {
    LOG_ERROR("Unsupported format: {}", request.format);
    return ErrorCode::UnsupportedFormat;
  }

  MediaKind input_kind = classify_input(request.input_path);
  bool target_is_video = is_video_format(format);

  if (input_kind == MediaKind::Audio && target_is_video) {
    LOG_ERROR("Unsupported conversion from audio input {} to {}",
              request.input_path, to_string(format));
    return ErrorCode::UnsupportedConversion;
  }

  QualityProfile profile = resolve_profile(format, request.quality);

  std::vector<std::string> args;
  args.reserve(20);

  /// Global options: overwrite output, quiet banner
  args.push_back("-y");
  args.push_back("-hide_banner");

  args.push_back("-i");
  args.push_back(request.input_path);

  /// Output-side seek: placed after -i so the cut is frame accurate
  if (request.clip) {
    args.push_back("-ss");
    args.push_back(fmt::format("{:.3f}", request.clip->start));
    args.push_back("-t");
    args.push_back(fmt::format("{:.3f}", request.clip->end - request.clip->start));
  }

  if (target_is_video) {
    /// video -> video
    args.push_back("-c:v");
    args.push_back(kVideoCodec);
    args.push_back("-crf");
    args.push_back(std::to_string(profile.crf));
    args.push_back("-preset");
    args.push_back(Config::video_preset());
    args.push_back("-c:a");
    args.push_back(kVideoAudioCodec);
  } else if (input_kind == MediaKind::Video) {
    /// video -> audio: drop the picture
    args.push_back("-vn");
    append_audio_args(args, format, profile);
  } else {
    /// audio -> audio
    append_audio_args(args, format, profile);
  }

  args.push_back(request.output_path);

  plan.args = std::move(args);
  return ErrorCode::None;
}

std::string describe_plan(const EncodePlan &plan) {
  std::string line;
  line.reserve(256);
  for (const auto &arg : plan.args) {
    if (!line.empty())
      line += ' ';
    if (arg.find_first_of(" \t'\"") != std::string::npos) {
      line += fmt::format("\"{}\"", arg);
    } else {
      line += arg;
    }
  }
  return line;
}

} // namespace media_convert
