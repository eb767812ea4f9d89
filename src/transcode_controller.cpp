/**
 * @file transcode_controller.cpp
 * @brief Transcode job orchestration implementation
 *
 * @details Orchestrates one job:
 *
 *          1. Plan the request (rejects before the engine is touched)
 *
 *          2. Probe for the progress denominator
 *
 *          3. Start the engine and pump its events on the calling thread
 *
 *          4. Classify the terminal status
 *
 * @note Engine callbacks only enqueue events. Job state is advanced solely
 *       by the thread inside convert(), which is also the thread that calls
 *       the progress sink, so progress always precedes the outcome.
 */

#include "media_convert/transcode_controller.hpp"

#include <chrono>
#include <utility>

#include <fmt/core.h>

#include "media_convert/command_planner.hpp"
#include "media_convert/config.hpp"
#include "media_convert/duration_resolver.hpp"
#include "media_convert/engine_event_queue.hpp"
#include "media_convert/job_session.hpp"
#include "media_convert/logging.hpp"
#include "media_convert/outcome_classifier.hpp"
#include "media_convert/system.hpp"

namespace media_convert {

// **---- Job Context ----**

/**
 * @struct JobContext
 * @brief Everything a cancel request needs to reach a running job.
 */
struct JobContext {
  JobContext(int job_id, size_t log_tail_lines, MediaEngine &eng)
      : session(job_id, log_tail_lines), engine(eng) {}

  JobSession session;
  EngineEventQueue events;
  MediaEngine &engine;

  void cancel() {
    switch (session.request_cancel()) {
    case CancelEffect::TerminateProcess:
      LOG_INFO("[Job {}] Cancel requested, stopping engine", session.id());
      engine.terminate(session.process());
      events.push({EngineEvent::Kind::CancelRequested, 0, 0, {}});
      break;
    case CancelEffect::CancelledBeforeStart:
      LOG_INFO("[Job {}] Cancelled before the engine started", session.id());
      break;
    case CancelEffect::None:
      break;
    }
  }
};

namespace {

/// Forwards engine callbacks into the job's event queue
class QueueListener : public EngineListener {
public:
  explicit QueueListener(EngineEventQueue &events) : events_(events) {}

  void on_progress_sample(int64_t elapsed_ms) override {
    events_.push({EngineEvent::Kind::Progress, elapsed_ms, 0, {}});
  }

  void on_log_line(const std::string &line) override {
    events_.push({EngineEvent::Kind::Log, 0, 0, line});
  }

  void on_exit(int status) override {
    events_.push({EngineEvent::Kind::Exit, 0, status, {}});
  }

private:
  EngineEventQueue &events_;
};

/**
 * @brief Releases an engine handle when the job scope ends.
 * @note release() never blocks on a live process.
 */
class ProcessLease {
public:
  ProcessLease(MediaEngine &engine, ProcessHandle handle)
      : engine_(engine), handle_(handle) {}
  ~ProcessLease() {
    if (handle_ != kInvalidProcess)
      engine_.release(handle_);
  }

  ProcessLease(const ProcessLease &) = delete;
  ProcessLease &operator=(const ProcessLease &) = delete;

private:
  MediaEngine &engine_;
  ProcessHandle handle_;
};

} // anonymous namespace

// **---- ControllerOptions ----**

ControllerOptions ControllerOptions::from_env() {
  ControllerOptions options;
  options.cancel_timeout_ms = Config::cancel_timeout_ms();
  options.log_tail_lines = static_cast<size_t>(Config::log_tail_lines());
  return options;
}

// **---- CancelHandle ----**

void CancelHandle::cancel() {
  std::shared_ptr<JobContext> job;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (job_ && !job_->session.is_terminal()) {
      job = job_;
    } else {
      /// No live job: hold the request for the next bind
      pending_ = true;
    }
  }
  if (job)
    job->cancel();
}

bool CancelHandle::cancel_requested() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_ || (job_ && job_->session.cancel_requested());
}

JobStatus CancelHandle::status() const {
  std::shared_ptr<JobContext> job;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    job = job_;
  }
  return job ? job->session.status() : JobStatus::Idle;
}

void CancelHandle::bind(const std::shared_ptr<JobContext> &job) {
  bool pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    job_ = job;
    pending = pending_;
    pending_ = false;
  }
  if (pending)
    job->cancel();
}

// **---- TranscodeController ----**

TranscodeController::TranscodeController(MediaEngine &engine,
                                         ControllerOptions options)
    : engine_(engine), options_(options) {}

void TranscodeController::cancel(CancelHandle &handle) { handle.cancel(); }

Outcome TranscodeController::convert(const ConversionRequest &request,
                                     const ProgressCallback &on_progress,
                                     CancelHandle *cancel_handle) {
  const int job_id = next_job_id_++;

  LOG_PHASE("[Job {}] {} -> {} ({}, quality {})", job_id, request.input_path,
            request.output_path, request.format, request.quality);

  // **----- PLANNING -----**

  EncodePlan encode_plan;
  if (ErrorCode err = plan(request, encode_plan); err != ErrorCode::None) {
    LOG_ERROR("[Job {}] Request rejected: {}", job_id, to_string(err));
    return rejected(err, fmt::format("{}: {} -> {} ({})", to_string(err),
                                     request.input_path, request.output_path,
                                     request.format));
  }
  LOG_INFO("[Job {}] Plan: {}", job_id, describe_plan(encode_plan));

  auto job =
      std::make_shared<JobContext>(job_id, options_.log_tail_lines, engine_);
  JobSession &session = job->session;

  if (cancel_handle)
    cancel_handle->bind(job);

  if (!session.begin_probing()) {
    /// A pending cancel was applied on bind
    return classify(std::nullopt, true, session.log_tail());
  }

  // **----- PROBING -----**

  {
    TIMER_START(probe);
    session.set_denominator(resolve_duration(request, engine_));
    TIMER_END(probe);
  }

  if (auto den = session.denominator()) {
    LOG_INFO("[Job {}] Progress denominator: {} ({} ms)", job_id,
             format_time(*den / 1000.0), *den);
  } else {
    LOG_WARN("[Job {}] Duration unknown, no progress will be reported",
             job_id);
  }

  if (session.status() == JobStatus::Cancelled) {
    LOG_WARN("[Job {}] Cancelled while probing", job_id);
    return classify(std::nullopt, true, session.log_tail());
  }

  // **----- ENCODING -----**

  TIMER_START(encode);

  QueueListener listener(job->events);
  ProcessHandle handle = engine_.execute(encode_plan, listener);
  if (handle == kInvalidProcess) {
    if (session.transition(JobStatus::Probing, JobStatus::Failed)) {
      LOG_ERROR("[Job {}] Engine failed to start", job_id);
      return rejected(ErrorCode::SpawnFailure,
                      "engine could not start a process for the plan");
    }
    return classify(std::nullopt, true, session.log_tail());
  }

  ProcessLease lease(engine_, handle);

  if (!session.start_running(handle)) {
    /// Cancel arrived between probe and spawn
    LOG_WARN("[Job {}] Cancelled before encoding started", job_id);
    engine_.terminate(handle);
    return classify(std::nullopt, true, session.log_tail());
  }

  std::optional<int> exit_status = run_event_loop(*job, on_progress);

  TIMER_END(encode);

  Outcome outcome =
      classify(exit_status, session.cancel_requested(), session.log_tail());

  if (outcome.succeeded) {
    if (auto final_value = session.final_progress(); final_value && on_progress)
      on_progress(*final_value);
    LOG_SUCCESS("[Job {}] Output saved to: {}", job_id, request.output_path);
  } else if (outcome.error == ErrorCode::Cancelled) {
    LOG_WARN("[Job {}] Cancelled", job_id);
  } else {
    LOG_ERROR("[Job {}] Engine exited with status {}", job_id,
              outcome.exit_status);
    if (outcome.diagnostic)
      LOG_ERROR("[Job {}] Engine output:\n{}", job_id, *outcome.diagnostic);
  }

  return outcome;
}

std::optional<int>
TranscodeController::run_event_loop(JobContext &job,
                                    const ProgressCallback &on_progress) {
  JobSession &session = job.session;
  const auto timeout = std::chrono::milliseconds(options_.cancel_timeout_ms);

  bool deadline_armed = false;
  EngineEventQueue::Clock::time_point deadline;

  while (true) {
    EngineEvent event;

    if (session.status() == JobStatus::Cancelling) {
      if (!deadline_armed) {
        deadline = EngineEventQueue::Clock::now() + timeout;
        deadline_armed = true;
      }
      if (!job.events.pop_until(event, deadline)) {
        LOG_WARN("[Job {}] Engine did not stop within {} ms, giving up on it",
                 session.id(), options_.cancel_timeout_ms);
        session.force_cancelled();
        return std::nullopt;
      }
    } else {
      job.events.pop(event);
    }

    switch (event.kind) {
    case EngineEvent::Kind::Progress:
      if (auto value = session.on_progress_sample(event.elapsed_ms);
          value && on_progress) {
        on_progress(*value);
      }
      break;
    case EngineEvent::Kind::Log:
      session.append_log(event.text);
      break;
    case EngineEvent::Kind::CancelRequested:
      /// Deadline is armed on the next iteration
      break;
    case EngineEvent::Kind::Exit:
      session.finish(event.status);
      return event.status;
    }
  }
}

} // namespace media_convert
