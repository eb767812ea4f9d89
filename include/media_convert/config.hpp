/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *
 *          - FFMPEG_BINARY: engine executable (PATH lookup when bare)
 *
 *          - CANCEL_TIMEOUT_MS: wait for engine exit after a cancel
 *
 *          - LOG_TAIL_LINES: engine log lines kept for diagnostics
 *
 *          - VIDEO_PRESET: x264 speed preset for video targets
 *
 */

#ifndef MEDIA_CONVERT_CONFIG_HPP
#define MEDIA_CONVERT_CONFIG_HPP

#include <cerrno>
#include <cstdlib>
#include <string>

#include "logging.hpp"

namespace media_convert {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or not a number
 * @return Parsed integer value or default
 */
inline long get_env_long(const char *name, long default_val) {
  const char *val = std::getenv(name);
  if (!val || *val == '\0')
    return default_val;

  char *end = nullptr;
  errno = 0;
  long parsed = std::strtol(val, &end, 10);
  if (errno != 0 || end == val || *end != '\0') {
    LOG_WARN("Ignoring {}='{}' (not an integer), using {}", name, val,
             default_val);
    return default_val;
  }
  return parsed;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val != '\0') ? std::string(val) : std::string(default_val);
}

/// Encoding engine executable
inline const std::string &ffmpeg_binary() {
  static std::string val = get_env_string("FFMPEG_BINARY", "ffmpeg");
  return val;
}

/**
 * @brief Milliseconds to wait for the engine to exit after a cancel request
 * @note After this the job is reported as cancelled regardless and the
 *       process is reaped in the background.
 */
inline long cancel_timeout_ms() {
  static long val = [] {
    long v = get_env_long("CANCEL_TIMEOUT_MS", 5000);
    return v > 0 ? v : 5000;
  }();
  return val;
}

/// Engine log lines kept as failure diagnostic
inline long log_tail_lines() {
  static long val = [] {
    long v = get_env_long("LOG_TAIL_LINES", 40);
    return v > 0 ? v : 40;
  }();
  return val;
}

/// x264 preset for video targets
inline const std::string &video_preset() {
  static std::string val = get_env_string("VIDEO_PRESET", "ultrafast");
  return val;
}

} // namespace Config
} // namespace media_convert

#endif // MEDIA_CONVERT_CONFIG_HPP
