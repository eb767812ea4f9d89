/**
 * @file duration_resolver.hpp
 * @brief Resolves the progress denominator for a job
 *
 * @details
 *          - Clip requests: end - start, always known, no probe
 *
 *          - Full conversions: probe the input and parse its duration
 *
 * @note Any probe problem yields "unknown" (std::nullopt). The job still runs,
 *       it just reports no progress.
 */

#ifndef MEDIA_CONVERT_DURATION_RESOLVER_HPP
#define MEDIA_CONVERT_DURATION_RESOLVER_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "media_engine.hpp"
#include "types.hpp"

namespace media_convert {

/**
 * @brief Parse a textual duration in seconds into milliseconds.
 * @note Accepts plain seconds ("12.5") and clock form ("00:01:02.50").
 *       Empty, garbage, negative, zero or non-finite values yield nullopt.
 */
std::optional<int64_t> parse_duration_field(const std::string &text);

/**
 * @brief Resolve the progress denominator in milliseconds.
 * @param request The (validated) request
 * @param engine Engine used for probing full-file conversions
 * @return Duration in ms, or nullopt when unknown
 */
std::optional<int64_t> resolve_duration(const ConversionRequest &request,
                                        MediaEngine &engine);

} // namespace media_convert

#endif // MEDIA_CONVERT_DURATION_RESOLVER_HPP
