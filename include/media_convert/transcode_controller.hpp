/**
 * @file transcode_controller.hpp
 * @brief Runs one conversion or clip job end to end
 *
 * @details The TranscodeController drives a single job:
 *
 *          1. Validate and plan the request (fail fast, engine untouched)
 *
 *          2. Resolve the progress denominator (probe or clip length)
 *
 *          3. Start the engine and pump its events on the calling thread
 *
 *          4. Normalise telemetry into monotonic progress
 *
 *          5. Classify the terminal status into an Outcome
 *
 * @note Jobs are independent. One controller may run several jobs from
 *       different threads; nothing is shared between them but the engine.
 */

#ifndef MEDIA_CONVERT_TRANSCODE_CONTROLLER_HPP
#define MEDIA_CONVERT_TRANSCODE_CONTROLLER_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

#include "media_engine.hpp"
#include "types.hpp"

namespace media_convert {

struct JobContext;

/**
 * @struct ControllerOptions
 * @brief Per-controller tunables.
 */
struct ControllerOptions {
  long cancel_timeout_ms = 5000; //< Max wait for engine exit after cancel
  size_t log_tail_lines = 40;    //< Engine log lines kept as diagnostic

  /// Options from CANCEL_TIMEOUT_MS / LOG_TAIL_LINES
  static ControllerOptions from_env();
};

/**
 * @class CancelHandle
 * @brief Lets another thread cancel a job started with convert().
 *
 * @note A cancel reaches the job currently bound to the handle. With no
 *       live job bound (before the first convert(), or after the last one
 *       ended) the request is held and applied when the next convert()
 *       binds. A handle may be reused; a cancel of one job never carries
 *       over to the next.
 */
class CancelHandle {
public:
  CancelHandle() = default;
  CancelHandle(const CancelHandle &) = delete;
  CancelHandle &operator=(const CancelHandle &) = delete;

  /// Request cancellation (thread-safe, idempotent)
  void cancel();

  /// A cancel is pending, or the bound job was cancelled
  bool cancel_requested() const;

  /// Status of the bound job (Idle when none is bound). Stays readable
  /// after convert() has returned.
  JobStatus status() const;

private:
  friend class TranscodeController;
  void bind(const std::shared_ptr<JobContext> &job);

  mutable std::mutex mutex_;
  bool pending_ = false; //< Cancel waiting for the next bind
  std::shared_ptr<JobContext> job_;
};

/**
 * @class TranscodeController
 * @brief Public entry point: convert() and cancel().
 */
class TranscodeController {
public:
  /**
   * @param engine Encoding engine (must outlive the controller)
   * @param options Timeouts and diagnostic sizing
   */
  explicit TranscodeController(
      MediaEngine &engine,
      ControllerOptions options = ControllerOptions::from_env());

  /**
   * @brief Run a conversion or clip job to completion.
   *
   * @param request The request
   * @param on_progress Optional progress sink, called on this thread with
   *        non-decreasing values in [0, 1]; 1.0 last on success
   * @param cancel_handle Optional handle another thread may cancel through
   * @return The terminal Outcome. Never throws for engine-side failures.
   */
  Outcome convert(const ConversionRequest &request,
                  const ProgressCallback &on_progress = nullptr,
                  CancelHandle *cancel_handle = nullptr);

  /**
   * @brief Best-effort cancellation of an in-flight job.
   * @note Equivalent to handle.cancel().
   */
  void cancel(CancelHandle &handle);

  const ControllerOptions &options() const { return options_; }

private:
  /**
   * @brief Pump engine events until the job ends.
   * @return Exit status, or nullopt if the cancel timeout elapsed first
   */
  std::optional<int> run_event_loop(JobContext &job,
                                    const ProgressCallback &on_progress);

  MediaEngine &engine_;
  ControllerOptions options_;
  std::atomic<int> next_job_id_{1};
};

} // namespace media_convert

#endif // MEDIA_CONVERT_TRANSCODE_CONTROLLER_HPP
