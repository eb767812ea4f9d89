/**
 * @file test_quality_mapper.cpp
 * @brief Quality tier and format mapping tests
 */

#include <gtest/gtest.h>

#include "media_convert/quality_mapper.hpp"

using namespace media_convert;

// ---------------------------------------------------------------------------
// Tier parsing
// ---------------------------------------------------------------------------

TEST(QualityMapperTest, ParsesTiersCaseInsensitively) {
  EXPECT_EQ(parse_quality_tier("low"), QualityTier::Low);
  EXPECT_EQ(parse_quality_tier("HIGH"), QualityTier::High);
  EXPECT_EQ(parse_quality_tier("  Medium "), QualityTier::Medium);
}

TEST(QualityMapperTest, UnknownTierFallsBackToMedium) {
  EXPECT_EQ(parse_quality_tier(""), QualityTier::Medium);
  EXPECT_EQ(parse_quality_tier("ultra"), QualityTier::Medium);
  EXPECT_EQ(parse_quality_tier("lowest"), QualityTier::Medium);
}

// ---------------------------------------------------------------------------
// Format parsing
// ---------------------------------------------------------------------------

TEST(QualityMapperTest, ParsesSupportedFormats) {
  MediaFormat format = MediaFormat::Mp4;
  ASSERT_TRUE(parse_media_format("MP3", format));
  EXPECT_EQ(format, MediaFormat::Mp3);
  ASSERT_TRUE(parse_media_format(".flac", format));
  EXPECT_EQ(format, MediaFormat::Flac);
  ASSERT_TRUE(parse_media_format("mov", format));
  EXPECT_EQ(format, MediaFormat::Mov);
}

TEST(QualityMapperTest, RejectsUnknownFormats) {
  MediaFormat format = MediaFormat::Mp4;
  EXPECT_FALSE(parse_media_format("ogg", format));
  EXPECT_FALSE(parse_media_format("mkv", format));
  EXPECT_FALSE(parse_media_format("", format));
}

// ---------------------------------------------------------------------------
// Profiles
// ---------------------------------------------------------------------------

TEST(QualityMapperTest, ProfileIsTotalAndDeterministic) {
  const MediaFormat formats[] = {MediaFormat::Mp4, MediaFormat::Mov,
                                 MediaFormat::Mp3, MediaFormat::Wav,
                                 MediaFormat::Aac, MediaFormat::Flac};
  const QualityTier tiers[] = {QualityTier::Low, QualityTier::Medium,
                               QualityTier::High};

  for (MediaFormat format : formats) {
    for (QualityTier tier : tiers) {
      QualityProfile a = resolve_profile(format, tier);
      QualityProfile b = resolve_profile(format, tier);
      EXPECT_EQ(a.kind, b.kind) << to_string(format) << "/" << to_string(tier);
      EXPECT_EQ(a.crf, b.crf);
      EXPECT_EQ(a.bitrate, b.bitrate);
      EXPECT_EQ(a.compression_level, b.compression_level);
    }
  }
}

TEST(QualityMapperTest, VideoRateFactors) {
  EXPECT_EQ(resolve_profile(MediaFormat::Mp4, QualityTier::Low).crf, 35);
  EXPECT_EQ(resolve_profile(MediaFormat::Mp4, QualityTier::Medium).crf, 28);
  EXPECT_EQ(resolve_profile(MediaFormat::Mov, QualityTier::High).crf, 20);
  EXPECT_EQ(resolve_profile(MediaFormat::Mov, QualityTier::High).kind,
            ProfileKind::VideoRateFactor);
}

TEST(QualityMapperTest, LossyAudioBitrates) {
  EXPECT_EQ(resolve_profile(MediaFormat::Mp3, QualityTier::Low).bitrate, "96k");
  EXPECT_EQ(resolve_profile(MediaFormat::Aac, QualityTier::Medium).bitrate,
            "192k");
  EXPECT_EQ(resolve_profile(MediaFormat::Mp3, QualityTier::High).bitrate,
            "320k");
}

TEST(QualityMapperTest, FlacIgnoresTier) {
  for (const char *tier : {"low", "medium", "high", "bogus"}) {
    QualityProfile profile = resolve_profile(MediaFormat::Flac, tier);
    EXPECT_EQ(profile.kind, ProfileKind::LosslessLevel);
    EXPECT_EQ(profile.compression_level, kFlacCompressionLevel);
  }
}

TEST(QualityMapperTest, WavHasNoQualityParameters) {
  QualityProfile profile = resolve_profile(MediaFormat::Wav, QualityTier::High);
  EXPECT_EQ(profile.kind, ProfileKind::Uncompressed);
  EXPECT_TRUE(profile.bitrate.empty());
}

TEST(QualityMapperTest, UnknownTierStringYieldsMediumProfile) {
  QualityProfile unknown = resolve_profile(MediaFormat::Mp3, "extreme");
  QualityProfile medium = resolve_profile(MediaFormat::Mp3, QualityTier::Medium);
  EXPECT_EQ(unknown.bitrate, medium.bitrate);

  EXPECT_EQ(resolve_profile(MediaFormat::Mp4, "").crf, 28);
}

TEST(QualityMapperTest, AudioCodecs) {
  EXPECT_STREQ(audio_codec_for(MediaFormat::Mp3), "libmp3lame");
  EXPECT_STREQ(audio_codec_for(MediaFormat::Aac), "aac");
  EXPECT_STREQ(audio_codec_for(MediaFormat::Flac), "flac");
  EXPECT_STREQ(audio_codec_for(MediaFormat::Wav), "pcm_s16le");
}
