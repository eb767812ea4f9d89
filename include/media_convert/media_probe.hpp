/**
 * @file media_probe.hpp
 * @brief Container inspection through libavformat
 *
 * @details Opens a file with libavformat and reads enough packets to fill
 *          in stream information. Used to answer metadata probes without
 *          spawning a process.
 *
 * @attention MANAGEMENT:
 *
 *            - Destructor handles partial initialization failures
 *
 *            - One instance per probe; libavformat contexts are not shared
 */

#ifndef MEDIA_CONVERT_MEDIA_PROBE_HPP
#define MEDIA_CONVERT_MEDIA_PROBE_HPP

extern "C" {
#include <libavformat/avformat.h>
}

#include <string>

namespace media_convert {

/**
 * @class MediaProbe
 * @brief RAII wrapper around an opened AVFormatContext.
 */
class MediaProbe {
  AVFormatContext *fmt_ctx = nullptr;

public:
  MediaProbe() = default;
  ~MediaProbe();

  /// Disable copy
  MediaProbe(const MediaProbe &) = delete;
  MediaProbe &operator=(const MediaProbe &) = delete;

  /**
   * @brief Open the file and read stream information.
   * @param path File to inspect
   * @return false if the file could not be opened or parsed
   */
  bool open(const std::string &path);

  /**
   * @brief Container duration in seconds.
   * @return Duration, or 0.0 when the container does not report one
   */
  double get_duration() const;

  /// Short demuxer name ("mov,mp4,m4a,3gp,3g2,mj2", "mp3", ...)
  std::string get_format_name() const;

  /// Number of streams of the given type
  int count_streams(AVMediaType type) const;
};

} // namespace media_convert

#endif // MEDIA_CONVERT_MEDIA_PROBE_HPP
