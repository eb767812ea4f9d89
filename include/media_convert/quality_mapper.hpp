/**
 * @file quality_mapper.hpp
 * @brief Maps (format, quality tier) to engine encode parameters
 *
 * @details Pure, total lookups:
 *
 *          - Video targets use an inverse rate-factor scale
 *            (low = coarse/high value, high = fine/low value)
 *
 *          - Lossy audio targets use bitrate tiers (low < medium < high)
 *
 *          - flac ignores the tier and always uses a fixed compression level
 *
 *          - wav carries no quality parameters at all
 *
 * @note Unknown tier strings resolve to medium. Format validity is checked
 *       by the planner, not here.
 */

#ifndef MEDIA_CONVERT_QUALITY_MAPPER_HPP
#define MEDIA_CONVERT_QUALITY_MAPPER_HPP

#include <string>

#include "types.hpp"

namespace media_convert {

/// Compression level used for every flac encode
constexpr int kFlacCompressionLevel = 5;

/// Video encoder and its companion audio encoder
constexpr const char *kVideoCodec = "libx264";
constexpr const char *kVideoAudioCodec = "aac";

/**
 * @brief Parse a user-facing tier string.
 * @note Case-insensitive and whitespace-tolerant. Anything that is not
 *       low/medium/high yields QualityTier::Medium.
 */
QualityTier parse_quality_tier(const std::string &tier);

/**
 * @brief Parse a user-facing format string.
 * @param text Format name, case-insensitive (a leading dot is accepted)
 * @param format Output: parsed format
 * @return true if text names one of the six supported formats
 */
bool parse_media_format(const std::string &text, MediaFormat &format);

/// True for mp4 and mov
bool is_video_format(MediaFormat format);

/**
 * @brief Resolve the encode parameters for a format and tier.
 * @note Total and deterministic for every (format, tier) pair.
 */
QualityProfile resolve_profile(MediaFormat format, QualityTier tier);

/// Convenience overload taking the raw tier string
QualityProfile resolve_profile(MediaFormat format, const std::string &tier);

/**
 * @brief Engine audio encoder name for an audio target.
 * @note Video targets return the companion audio encoder (aac).
 */
const char *audio_codec_for(MediaFormat format);

} // namespace media_convert

#endif // MEDIA_CONVERT_QUALITY_MAPPER_HPP
