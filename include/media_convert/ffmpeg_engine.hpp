/**
 * @file ffmpeg_engine.hpp
 * @brief MediaEngine backed by the ffmpeg command-line tool
 *
 * @details Runs one ffmpeg process per plan:
 *
 *          - Spawned with posix_spawnp, stdin from /dev/null, in its own
 *            process group
 *
 *          - `-progress pipe:1` telemetry read from stdout
 *
 *          - Log output read from stderr (kept as failure diagnostic)
 *
 *          - One reader thread per process delivers listener callbacks
 *
 *          Metadata probes go through libavformat (see MediaProbe) instead
 *          of a second process.
 *
 * @attention PROCESS LIFETIME:
 *
 *   - terminate() sends SIGTERM (ffmpeg finishes the container and exits)
 *
 *   - release() of a process that is still alive sends SIGKILL and parks it;
 *     parked processes are reaped later and in the destructor
 *
 *   - A pid is never signalled after it has been reaped
 */

#ifndef MEDIA_CONVERT_FFMPEG_ENGINE_HPP
#define MEDIA_CONVERT_FFMPEG_ENGINE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "media_engine.hpp"

namespace media_convert {

/**
 * @brief Parse one `-progress` line into elapsed milliseconds.
 * @note Understands out_time_us, out_time_ms (also microseconds) and
 *       out_time=HH:MM:SS.ffffff. Other keys, N/A and negative values
 *       yield nullopt.
 */
std::optional<int64_t> parse_progress_line(const std::string &line);

/**
 * @brief Full argv for a plan (binary and telemetry options first).
 */
std::vector<std::string> build_ffmpeg_argv(const std::string &binary,
                                           const EncodePlan &plan);

/**
 * @class FfmpegEngine
 * @brief Subprocess implementation of MediaEngine.
 */
class FfmpegEngine : public MediaEngine {
public:
  /**
   * @param binary ffmpeg executable (bare name is looked up on PATH)
   */
  explicit FfmpegEngine(std::string binary);
  ~FfmpegEngine() override;

  FfmpegEngine(const FfmpegEngine &) = delete;
  FfmpegEngine &operator=(const FfmpegEngine &) = delete;

  /// True if the binary can be found
  bool available() const;

  bool probe(const std::string &input_path, MediaMetadata &meta) override;
  ProcessHandle execute(const EncodePlan &plan,
                        EngineListener &listener) override;
  void terminate(ProcessHandle handle) override;
  void release(ProcessHandle handle) override;

  /// Processes started and not yet released
  size_t active_count() const;

private:
  struct Process;

  /// Pump stdout/stderr of one process until both close, then reap it
  static void reader_loop(Process &proc);

  /// Join parked processes whose reader has finished (mutex_ held)
  void reap_parked_locked();

  std::string binary_;

  mutable std::mutex mutex_;
  std::map<ProcessHandle, std::unique_ptr<Process>> processes_;
  std::vector<std::unique_ptr<Process>> parked_;
  ProcessHandle next_handle_ = 1;
};

} // namespace media_convert

#endif // MEDIA_CONVERT_FFMPEG_ENGINE_HPP
