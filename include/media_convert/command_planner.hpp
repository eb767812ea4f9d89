/**
 * @file command_planner.hpp
 * @brief Builds the engine argument plan for a conversion or clip request
 *
 * @details Planning steps:
 *
 *          1. Classify the input as video or audio from its extension
 *
 *          2. Pick a branch: audio->audio, video->audio (drop the picture),
 *             or video->video (re-encode picture and sound)
 *
 *          3. For clips, insert -ss/-t AFTER -i (frame-accurate, slower seek)
 *
 *          4. Always pass -y so an existing output is overwritten
 *
 * @note Plans are deterministic: the same request always yields the same
 *       tokens. Nothing here touches the engine or the file system.
 */

#ifndef MEDIA_CONVERT_COMMAND_PLANNER_HPP
#define MEDIA_CONVERT_COMMAND_PLANNER_HPP

#include <string>

#include "types.hpp"

namespace media_convert {

/**
 * @brief Classify a locator by its container extension.
 * @note mp4, mov, mkv, avi and webm are video. Everything else is audio.
 */
MediaKind classify_input(const std::string &input_path);

/**
 * @brief Check the clip window of a request.
 * @return ErrorCode::InvalidClipWindow if the window is negative, not
 *         finite, ends past kMaxClipSeconds, or has end <= start.
 *         ErrorCode::None otherwise (including
 *         requests without a clip).
 */
ErrorCode validate_clip(const ConversionRequest &request);

/**
 * @brief Build the argument plan for a request.
 *
 * @param request The conversion request
 * @param plan Output: the argument plan (left untouched on error)
 * @return ErrorCode::None on success, otherwise UnsupportedFormat,
 *         UnsupportedConversion or InvalidClipWindow
 */
ErrorCode plan(const ConversionRequest &request, EncodePlan &plan);

/// Render a plan as a single shell-like line (for logs only)
std::string describe_plan(const EncodePlan &plan);

} // namespace media_convert

#endif // MEDIA_CONVERT_COMMAND_PLANNER_HPP
