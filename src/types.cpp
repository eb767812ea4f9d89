/**
 * @file types.cpp
 * @brief Display names for core enumerations
 */

#include "media_convert/types.hpp"

namespace media_convert {

const char *to_string(MediaFormat format) {
  switch (format) {
  case MediaFormat::Mp4:
    return "mp4";
  case MediaFormat::Mov:
    return "mov";
  case MediaFormat::Mp3:
    return "mp3";
  case MediaFormat::Wav:
    return "wav";
  case MediaFormat::Aac:
    return "aac";
  case MediaFormat::Flac:
    return "flac";
  }
  return "unknown";
}

const char *to_string(QualityTier tier) {
  switch (tier) {
  case QualityTier::Low:
    return "low";
  case QualityTier::Medium:
    return "medium";
  case QualityTier::High:
    return "high";
  }
  return "unknown";
}

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Idle:
    return "Idle";
  case JobStatus::Probing:
    return "Probing";
  case JobStatus::Running:
    return "Running";
  case JobStatus::Cancelling:
    return "Cancelling";
  case JobStatus::Completed:
    return "Completed";
  case JobStatus::Failed:
    return "Failed";
  case JobStatus::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

const char *to_string(ErrorCode error) {
  switch (error) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::UnsupportedFormat:
    return "unsupported format";
  case ErrorCode::UnsupportedConversion:
    return "unsupported conversion";
  case ErrorCode::InvalidClipWindow:
    return "invalid clip window";
  case ErrorCode::SpawnFailure:
    return "engine spawn failure";
  case ErrorCode::EngineFailure:
    return "engine failure";
  case ErrorCode::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

} // namespace media_convert
