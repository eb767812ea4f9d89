/**
 * @file job_session.hpp
 * @brief State of one transcode job
 *
 * @details A JobSession owns:
 *
 *          - The lifecycle status (Idle -> Probing -> Running -> terminal)
 *
 *          - The engine process handle once one is obtained
 *
 *          - The progress denominator and the last emitted progress value
 *
 *          - A bounded tail of engine log lines for diagnostics
 *
 * @attention THREAD MODEL:
 *
 *            - Status changes are single compare-and-set operations, so a
 *              cancel racing an engine exit has exactly one winner
 *
 *            - request_cancel() may be called from any thread
 *
 *            - Progress and log methods belong to the controller thread
 */

#ifndef MEDIA_CONVERT_JOB_SESSION_HPP
#define MEDIA_CONVERT_JOB_SESSION_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include "types.hpp"

namespace media_convert {

/// What a cancel request changed
enum class CancelEffect {
  None,                 //< Already cancelling or finished, request dropped
  CancelledBeforeStart, //< No process yet, session is now Cancelled
  TerminateProcess      //< Session is now Cancelling, process must be stopped
};

/**
 * @class JobSession
 * @brief Lifecycle state machine plus progress normalisation for one job.
 * @note Not reusable: once a terminal status is reached it stays there.
 */
class JobSession {
public:
  /**
   * @param job_id Identifier used in log prefixes
   * @param log_tail_lines Number of engine log lines kept
   */
  JobSession(int job_id, size_t log_tail_lines);

  JobSession(const JobSession &) = delete;
  JobSession &operator=(const JobSession &) = delete;

  int id() const { return job_id_; }

  JobStatus status() const { return status_.load(); }

  /**
   * @brief Atomically move from one status to another.
   * @return true if the session was in `from` and is now in `to`
   */
  bool transition(JobStatus from, JobStatus to);

  /// Idle -> Probing
  bool begin_probing();

  /**
   * @brief Record the process handle and move Probing -> Running.
   * @return false if the session was cancelled meanwhile
   */
  bool start_running(ProcessHandle handle);

  /**
   * @brief Caller asked to cancel.
   * @note Probing/Idle go straight to Cancelled, Running goes to
   *       Cancelling. Anything else is left alone.
   */
  CancelEffect request_cancel();

  /**
   * @brief Apply the engine's exit status.
   * @return The status the session ended in. A cancel that got in first
   *         wins and yields Cancelled.
   */
  JobStatus finish(int exit_status);

  /**
   * @brief Force Cancelling -> Cancelled (engine did not acknowledge).
   */
  bool force_cancelled();

  /// True while a cancel is in flight or has completed
  bool cancel_requested() const;

  bool is_running() const;
  bool is_terminal() const;

  ProcessHandle process() const { return process_.load(); }

  // **---- Progress ----**

  void set_denominator(std::optional<int64_t> duration_ms);
  std::optional<int64_t> denominator() const { return denominator_ms_; }

  /**
   * @brief Normalise a raw elapsed-time sample.
   * @return clamp(sample / denominator, 0, 1) if it is strictly greater
   *         than the last emitted value and the job is running; nullopt
   *         otherwise (also when the denominator is unknown)
   */
  std::optional<double> on_progress_sample(int64_t elapsed_ms);

  /**
   * @brief The forced final emission after success.
   * @return 1.0 when a denominator is known and 1.0 was not emitted yet,
   *         nullopt otherwise
   */
  std::optional<double> final_progress();

  double last_emitted_progress() const { return last_emitted_; }

  // **---- Diagnostics ----**

  void append_log(const std::string &line);

  /// Kept log lines joined by '\n'
  std::string log_tail() const;

private:
  int job_id_;
  size_t log_tail_lines_;

  std::atomic<JobStatus> status_{JobStatus::Idle};
  std::atomic<ProcessHandle> process_{kInvalidProcess};

  std::optional<int64_t> denominator_ms_;
  double last_emitted_ = -1.0; //< -1 = nothing emitted yet

  std::deque<std::string> log_lines_;
};

} // namespace media_convert

#endif // MEDIA_CONVERT_JOB_SESSION_HPP
