/**
 * @file quality_mapper.cpp
 * @brief Quality tier to encode parameter mapping
 */

#include "media_convert/quality_mapper.hpp"

#include "media_convert/system.hpp"

namespace media_convert {

namespace {

/// Constant rate factor per tier (lower = higher quality)
int crf_for(QualityTier tier) {
  switch (tier) {
  case QualityTier::Low:
    return 35;
  case QualityTier::High:
    return 20;
  case QualityTier::Medium:
    break;
  }
  return 28;
}

const char *bitrate_for(QualityTier tier) {
  switch (tier) {
  case QualityTier::Low:
    return "96k";
  case QualityTier::High:
    return "320k";
  case QualityTier::Medium:
    break;
  }
  return "192k";
}

} // anonymous namespace

QualityTier parse_quality_tier(const std::string &tier) {
  std::string t = to_lower(trim(tier));
  if (t == "low")
    return QualityTier::Low;
  if (t == "high")
    return QualityTier::High;
  return QualityTier::Medium;
}

bool parse_media_format(const std::string &text, MediaFormat &format) {
  std::string t = to_lower(trim(text));
  if (!t.empty() && t[0] == '.')
    t.erase(0, 1);

  if (t == "mp4")
    format = MediaFormat::Mp4;
  else if (t == "mov")
    format = MediaFormat::Mov;
  else if (t == "mp3")
    format = MediaFormat::Mp3;
  else if (t == "wav")
    format = MediaFormat::Wav;
  else if (t == "aac")
    format = MediaFormat::Aac;
  else if (t == "flac")
    format = MediaFormat::Flac;
  else
    return false;
  return true;
}

bool is_video_format(MediaFormat format) {
  return format == MediaFormat::Mp4 || format == MediaFormat::Mov;
}

QualityProfile resolve_profile(MediaFormat format, QualityTier tier) {
  QualityProfile profile;
  switch (format) {
  case MediaFormat::Mp4:
  case MediaFormat::Mov:
    profile.kind = ProfileKind::VideoRateFactor;
    profile.crf = crf_for(tier);
    break;
  case MediaFormat::Mp3:
  case MediaFormat::Aac:
    profile.kind = ProfileKind::AudioBitrate;
    profile.bitrate = bitrate_for(tier);
    break;
  case MediaFormat::Flac:
    profile.kind = ProfileKind::LosslessLevel;
    profile.compression_level = kFlacCompressionLevel;
    break;
  case MediaFormat::Wav:
    profile.kind = ProfileKind::Uncompressed;
    break;
  }
  return profile;
}

QualityProfile resolve_profile(MediaFormat format, const std::string &tier) {
  return resolve_profile(format, parse_quality_tier(tier));
}

const char *audio_codec_for(MediaFormat format) {
  switch (format) {
  case MediaFormat::Mp3:
    return "libmp3lame";
  case MediaFormat::Flac:
    return "flac";
  case MediaFormat::Wav:
    return "pcm_s16le";
  case MediaFormat::Aac:
  case MediaFormat::Mp4:
  case MediaFormat::Mov:
    break;
  }
  return kVideoAudioCodec;
}

} // namespace media_convert
