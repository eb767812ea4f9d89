/**
 * @file media_engine.hpp
 * @brief Boundary to the external encoding engine
 *
 * @details The controller only ever talks to the engine through this
 *          interface:
 *
 *          - probe(): metadata inspection (duration is optional)
 *
 *          - execute(): start one process for a plan, push telemetry to a
 *            listener
 *
 *          - terminate(): ask a running process to stop
 *
 *          - release(): give the handle back; the engine reaps the process
 *
 * @attention THREAD MODEL:
 *
 *            - Listener callbacks arrive on engine-owned threads at any
 *              cadence (poll-based and push-based engines look the same)
 *
 *            - on_exit() is the last callback for a handle
 *
 *            - No callback is made after release() returns
 */

#ifndef MEDIA_CONVERT_MEDIA_ENGINE_HPP
#define MEDIA_CONVERT_MEDIA_ENGINE_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace media_convert {

/**
 * @class EngineListener
 * @brief Receives telemetry for one running process.
 */
class EngineListener {
public:
  virtual ~EngineListener() = default;

  /// Elapsed encoded media time in milliseconds (may repeat or go back)
  virtual void on_progress_sample(int64_t elapsed_ms) = 0;

  /// One line of engine log output
  virtual void on_log_line(const std::string &line) = 0;

  /// Terminal status (kEngineSuccess on success)
  virtual void on_exit(int status) = 0;
};

/**
 * @class MediaEngine
 * @brief Abstract encoding engine.
 */
class MediaEngine {
public:
  virtual ~MediaEngine() = default;

  /**
   * @brief Inspect a media file.
   * @param input_path Locator to inspect
   * @param meta Output: metadata (duration may be empty)
   * @return false if inspection failed
   */
  virtual bool probe(const std::string &input_path, MediaMetadata &meta) = 0;

  /**
   * @brief Start a process for the plan.
   * @param plan Argument tokens
   * @param listener Telemetry sink, must outlive release() of the handle
   * @return Process handle, or kInvalidProcess if nothing was started
   */
  virtual ProcessHandle execute(const EncodePlan &plan,
                                EngineListener &listener) = 0;

  /// Request termination (non-blocking, idempotent)
  virtual void terminate(ProcessHandle handle) = 0;

  /**
   * @brief Hand a handle back to the engine.
   * @note Never blocks on a live process: a process that has not exited is
   *       force-stopped and reaped later.
   */
  virtual void release(ProcessHandle handle) = 0;
};

} // namespace media_convert

#endif // MEDIA_CONVERT_MEDIA_ENGINE_HPP
