/**
 * @file types.hpp
 * @brief Core data types and constants for Media Convert
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Target formats, media kinds and quality tiers
 *
 *          - ConversionRequest and ClipWindow
 *
 *          - EncodePlan and QualityProfile
 *
 *          - JobStatus, ErrorCode and Outcome
 */

#ifndef MEDIA_CONVERT_TYPES_HPP
#define MEDIA_CONVERT_TYPES_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace media_convert {

// **----- CONSTANTS -----**

/// Handle value returned by an engine that failed to start a process
using ProcessHandle = int64_t;
constexpr ProcessHandle kInvalidProcess = -1;

/// Exit code the engine reports for a successful run
constexpr int kEngineSuccess = 0;

/// Largest clip bound in seconds (its millisecond value fits in int64_t)
constexpr double kMaxClipSeconds = 9.0e15;

// **----- ENUMERATIONS -----**

enum class MediaFormat { Mp4, Mov, Mp3, Wav, Aac, Flac };

/// Kind of media a container carries (decides the planning branch)
enum class MediaKind { Video, Audio };

enum class QualityTier { Low, Medium, High };

/**
 * @brief Lifecycle of a single job.
 * @note Cancelling is a transient sub-state of Running.
 *       Completed, Failed and Cancelled are terminal.
 */
enum class JobStatus {
  Idle,
  Probing,
  Running,
  Cancelling,
  Completed,
  Failed,
  Cancelled
};

enum class ErrorCode {
  None,
  UnsupportedFormat,     //< Target format not recognised
  UnsupportedConversion, //< Source kind cannot produce target kind
  InvalidClipWindow,     //< Clip window negative or empty
  SpawnFailure,          //< Engine could not start a process
  EngineFailure,         //< Engine reported a non-success status
  Cancelled              //< Caller requested cancellation
};

// **----- DATA STRUCTURES -----**

/**
 * @struct ClipWindow
 * @brief Represents a time range [start, end) in seconds.
 */
struct ClipWindow {
  double start; //< Start time in seconds
  double end;   //< End time in seconds
};

/**
 * @struct ConversionRequest
 * @brief A single conversion or clip request. Treated as immutable once
 *        handed to the controller.
 */
struct ConversionRequest {
  std::string input_path;         //< Source media locator
  std::string output_path;        //< Destination (overwritten if present)
  std::string format;             //< mp4, mov, mp3, wav, aac or flac
  std::string quality = "medium"; //< low, medium or high
  std::optional<ClipWindow> clip; //< Present for clip requests
};

/**
 * @struct EncodePlan
 * @brief Ordered engine argument tokens (without the engine binary).
 */
struct EncodePlan {
  std::vector<std::string> args;
};

enum class ProfileKind {
  VideoRateFactor, //< Constant rate factor, lower = finer
  AudioBitrate,    //< Lossy audio bitrate
  LosslessLevel,   //< Fixed compression level, tier ignored
  Uncompressed     //< No quality parameters at all
};

/**
 * @struct QualityProfile
 * @brief Engine parameters for one (format, tier) pair.
 * @note Only the field matching `kind` is meaningful.
 */
struct QualityProfile {
  ProfileKind kind = ProfileKind::Uncompressed;
  int crf = 0;               //< VideoRateFactor
  std::string bitrate;       //< AudioBitrate, e.g. "192k"
  int compression_level = 0; //< LosslessLevel
};

/**
 * @struct MediaMetadata
 * @brief What the engine's inspection capability reports about an input.
 */
struct MediaMetadata {
  std::string duration; //< Seconds as text, empty when unknown
  std::string format_name;
  int video_streams = 0;
  int audio_streams = 0;
};

/**
 * @struct Outcome
 * @brief Terminal result of one job.
 * @note `diagnostic` is advisory text for operators. Never branch on it.
 */
struct Outcome {
  bool succeeded = false;
  std::optional<std::string> diagnostic;
  ErrorCode error = ErrorCode::None;
  int exit_status = -1; //< Raw engine status (-1 = engine never ran)
};

/// Receives normalised progress in [0, 1]
using ProgressCallback = std::function<void(double)>;

// **----- NAMES -----**

const char *to_string(MediaFormat format);
const char *to_string(QualityTier tier);
const char *to_string(JobStatus status);
const char *to_string(ErrorCode error);

} // namespace media_convert

#endif // MEDIA_CONVERT_TYPES_HPP
